#include "krep/commands/shell_command.hpp"

#include <cstdlib>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace krep::commands {

std::string ShellQuote(const std::string& arg) {
  if (!arg.empty() && arg.find_first_not_of("abcdefghijklmnopqrstuvwxyz"
                                            "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                            "0123456789@%+=:,./_-") == std::string::npos) {
    return arg;
  }

  std::string quoted = "'";
  for (const char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string JoinShellCommand(const std::vector<std::string>& args) {
  std::string command_line;
  for (const auto& arg : args) {
    if (!command_line.empty()) {
      command_line.push_back(' ');
    }
    command_line += ShellQuote(arg);
  }
  return command_line;
}

bool RunShellCommandNoCapture(const std::string& command, int& exit_code, std::string& error) {
  error.clear();
  exit_code = -1;
  const int raw_status = std::system(command.c_str());
  if (raw_status == -1) {
    error = "failed to execute shell command";
    return false;
  }

#if defined(_WIN32)
  exit_code = raw_status;
#else
  if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif
  return true;
}

} // namespace krep::commands
