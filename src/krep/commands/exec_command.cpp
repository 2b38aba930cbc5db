#include "krep/commands/builtin_commands.hpp"

#include "core/logging/logger.hpp"
#include "krep/cli/parser_builder.hpp"
#include "krep/commands/hooks.hpp"
#include "krep/commands/shell_command.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>

namespace krep::commands {

namespace {

constexpr std::string_view kIgnoreStatusOption = "ignore_status";
// `--extra-option env:NAME=VALUE` exports NAME to the program.
constexpr std::string_view kEnvGroup = "env";
constexpr std::string_view kPreExecHook = "pre-exec";
constexpr std::string_view kPostExecHook = "post-exec";

bool IsEnvironmentName(std::string_view name) {
  if (name.empty() || (name.front() >= '0' && name.front() <= '9')) {
    return false;
  }
  for (const char c : name) {
    const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    if (!alnum && c != '_') {
      return false;
    }
  }
  return true;
}

// "NAME='value' " for every env token; the shell scopes the assignments to
// the one program.
bool BuildEnvironmentPrefix(const options::OptionList& extra, std::string& prefix,
                            std::string& error) {
  prefix.clear();
  for (const auto& token : options::Values::Extra(extra, kEnvGroup)) {
    const std::size_t equals = token.find('=');
    const std::string name = token.substr(0, equals);
    if (equals == std::string::npos || !IsEnvironmentName(name)) {
      error = "invalid environment assignment '" + token + "' (expected env:NAME=VALUE)";
      return false;
    }
    prefix += name + "=" + ShellQuote(token.substr(equals + 1)) + " ";
  }
  return true;
}

// A hook that ran and failed stops the command.
bool RunExecHook(std::string_view name, const options::Values& options,
                 const std::vector<std::string>& args, std::string& error) {
  HookRun run;
  if (!RunHook(name, options, args, {}, run, error)) {
    return false;
  }
  if (run.status == HookRun::Status::kRan && run.exit_code != 0) {
    error = "hook " + std::string(name) + " exited with status " + std::to_string(run.exit_code);
    return false;
  }
  return true;
}

class ExecCommand final : public ICommand {
public:
  std::string Name() const override {
    return "exec";
  }

  std::string Summary() const override {
    return "Run a program inside the working directory; flags after PROGRAM are its own";
  }

  std::string Usage() const override {
    return "krep exec [options] [--extra-option=env:NAME=VALUE]... PROGRAM [ARG]...";
  }

  bool SupportInject() const override {
    return true;
  }

  bool SupportExtra() const override {
    return true;
  }

  bool InterspersedArgs() const override {
    return false;
  }

  void DeclareOptions(options::OptionParser& parser) const override {
    parser.AddOption(options::OptionSpec{.flags = {"--ignore-status"},
                                         .dest = std::string(kIgnoreStatusOption),
                                         .kind = options::OptionKind::kFlag,
                                         .default_value = false,
                                         .metavar = {},
                                         .help = "do not fail on a non-zero exit status"});
  }

  CommandResult Execute(const options::Values& options, const std::vector<std::string>& args,
                        CommandContext& context) const override {
    (void)context;
    if (args.empty()) {
      return CommandResult::DomainError("no program given to exec");
    }

    std::string env_prefix;
    std::string error;
    if (!BuildEnvironmentPrefix(options.GetList(cli::kExtraOption), env_prefix, error)) {
      return CommandResult::DomainError(error);
    }
    const std::string command_line = env_prefix + JoinShellCommand(args);

    std::error_code ec;
    const std::filesystem::path cwd = std::filesystem::current_path(ec);
    const bool tryrun = options.GetBool(cli::kTryrunOption);
    const auto& logger = core::logging::GetLogger(DisplayName(options));

    if (!RunExecHook(kPreExecHook, options, args, error)) {
      return CommandResult::DomainError(error);
    }

    logger.Info(tryrun ? "would run" : "running",
                {{"cwd", cwd.string()}, {"command", command_line}});
    if (!tryrun) {
      int exit_code = -1;
      if (!RunShellCommandNoCapture(command_line, exit_code, error)) {
        return CommandResult::DomainError(error + ": " + command_line);
      }
      if (exit_code != 0 && !options.GetBool(kIgnoreStatusOption)) {
        return CommandResult::DomainError("command exited with status " +
                                          std::to_string(exit_code) + ": " + command_line);
      }
      if (exit_code != 0) {
        logger.Warn("ignored non-zero exit status",
                    {{"command", command_line}, {"exit_code", std::to_string(exit_code)}});
      }
    }

    if (!RunExecHook(kPostExecHook, options, args, error)) {
      return CommandResult::DomainError(error);
    }
    return CommandResult::Ok();
  }
};

} // namespace

std::unique_ptr<ICommand> MakeExecCommand() {
  return std::make_unique<ExecCommand>();
}

} // namespace krep::commands
