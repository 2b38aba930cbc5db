#pragma once

#include <string>
#include <vector>

namespace krep::commands {

// POSIX single-quote escaping: ' becomes '\''. Plain words are left as is.
std::string ShellQuote(const std::string& arg);

// Quotes every element and joins them with single spaces.
std::string JoinShellCommand(const std::vector<std::string>& args);

// Runs `command` through the shell with inherited stdio. `exit_code` gets the
// program's exit status; false only when the shell itself could not start.
bool RunShellCommandNoCapture(const std::string& command, int& exit_code, std::string& error);

} // namespace krep::commands
