#include "krep/commands/hooks.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "krep/cli/parser_builder.hpp"
#include "krep/commands/shell_command.hpp"

#include <cstdlib>
#include <optional>
#include <system_error>

namespace krep::commands {

std::filesystem::path ResolveHookPath(std::string_view name, const options::Values& options) {
  std::filesystem::path dir;
  const std::optional<std::string> hook_dir = options.GetString(cli::kHookDirOption);
  if (hook_dir.has_value() && !hook_dir->empty()) {
    dir = *hook_dir;
  } else if (const char* env = std::getenv(kHookPathEnvVar); env != nullptr && *env != '\0') {
    dir = env;
  } else {
    return {};
  }
  return dir / std::filesystem::path(name);
}

bool RunHook(std::string_view name, const options::Values& options,
             const std::vector<std::string>& args, const std::filesystem::path& cwd, HookRun& run,
             std::string& error) {
  error.clear();
  run = HookRun{};
  const auto& logger = core::logging::GetLogger("hook");
  const std::string hook_name(name);

  const std::filesystem::path configured = ResolveHookPath(name, options);
  if (configured.empty()) {
    logger.Debug("no hook directory configured", {{"hook", hook_name}});
    return true;
  }

  std::error_code ec;
  run.path = std::filesystem::absolute(configured, ec);
  if (ec) {
    error = "failed to resolve hook path '" + configured.string() + "': " + ec.message();
    return false;
  }
  if (!std::filesystem::exists(run.path, ec)) {
    run.status = HookRun::Status::kMissing;
    logger.Debug("hook not found", {{"hook", hook_name}, {"path", run.path.string()}});
    return true;
  }

  std::vector<std::string> argv{run.path.string()};
  argv.insert(argv.end(), args.begin(), args.end());
  const std::string command_line = JoinShellCommand(argv);

  if (options.GetBool(cli::kTryrunOption)) {
    run.status = HookRun::Status::kTryrun;
    logger.Info("would run hook", {{"hook", hook_name}, {"command", command_line}});
    return true;
  }

  core::ScopedWorkingDirectory scoped_dir;
  if (!cwd.empty() && !scoped_dir.Enter(cwd, error)) {
    return false;
  }

  logger.Info("running hook", {{"hook", hook_name}, {"command", command_line}});
  if (!RunShellCommandNoCapture(command_line, run.exit_code, error)) {
    error += ": " + command_line;
    return false;
  }
  run.status = HookRun::Status::kRan;
  return true;
}

} // namespace krep::commands
