#pragma once

#include "krep/options/values.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace krep::commands {

// Fallback hook directory when `--hook-dir` is not given.
inline constexpr const char* kHookPathEnvVar = "KREP_HOOK_PATH";

struct HookRun {
  enum class Status {
    kNotConfigured, // neither --hook-dir nor $KREP_HOOK_PATH
    kMissing,       // configured, but no file with the hook's name
    kTryrun,        // found; only logged because of --tryrun
    kRan,
  };

  Status status = Status::kNotConfigured;
  std::filesystem::path path;
  int exit_code = 0;
};

// `<hook_dir>/<name>` from the `hook_dir` option, otherwise
// `$KREP_HOOK_PATH/<name>`. Empty when neither is set.
std::filesystem::path ResolveHookPath(std::string_view name, const options::Values& options);

// Runs hook `name` with `args` inside `cwd` (the current directory when
// `cwd` is empty). A relative hook directory is taken against the current
// directory before `cwd` is entered. An unconfigured or missing hook is not
// an error; `run.status` tells the caller which case applied. A hook's
// non-zero exit status is reported through `run.exit_code`, false is
// returned only when the hook could not be started.
bool RunHook(std::string_view name, const options::Values& options,
             const std::vector<std::string>& args, const std::filesystem::path& cwd, HookRun& run,
             std::string& error);

} // namespace krep::commands
