#include "krep/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "krep/cli/dispatcher.hpp"
#include "krep/commands/registry.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace krep::cli {

namespace {

// The default configuration may set the starting verbosity either as a `-v`
// count (`verbose = 2`) or as a level name (`log-level = debug`). The count
// wins when both are present. A command-line `-v` still overrides later.
void SeedLogLevel(const options::Values& defaults) {
  const auto& logger = core::logging::GetLogger();

  if (const std::optional<std::string> verbose = defaults.GetString("verbose")) {
    int count = 0;
    const char* begin = verbose->data();
    const char* end = begin + verbose->size();
    const auto [ptr, ec] = std::from_chars(begin, end, count);
    if (ec == std::errc() && ptr == end) {
      core::logging::SetGlobalLevel(core::logging::LevelFromVerbosity(count));
      return;
    }
    logger.Warn("ignored invalid verbose setting", {{"value", *verbose}});
  }

  if (const std::optional<std::string> raw = defaults.GetString("log_level")) {
    core::logging::LogLevel level = core::logging::LogLevel::kWarn;
    std::string error;
    if (!core::logging::ParseLogLevel(*raw, level, error)) {
      logger.Warn("ignored invalid log-level setting", {{"value", *raw}, {"error", error}});
      return;
    }
    core::logging::SetGlobalLevel(level);
  }
}

} // namespace

int Dispatch(int argc, char** argv) {
  config::DefaultConfigLoader loader(config::StandardDefaultConfigPaths());
  return Dispatch(argc, argv, loader);
}

int Dispatch(int argc, char** argv, config::DefaultConfigLoader& loader) {
  const options::Values& defaults = loader.Load();
  SeedLogLevel(defaults);

  commands::CommandRegistry registry;
  std::string error;
  if (!commands::RegisterBuiltinCommands(registry, error)) {
    core::logging::GetLogger().Error("failed to register built-in commands", {{"error", error}});
    return core::errors::ToInt(core::errors::ExitCode::kFailure);
  }

  std::vector<std::string> args;
  if (argc > 1) {
    args.assign(argv + 1, argv + argc);
  }

  Dispatcher dispatcher(registry, defaults);
  return dispatcher.Run(std::move(args));
}

} // namespace krep::cli
