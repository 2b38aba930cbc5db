#pragma once

namespace krep::core::errors {

// Process-exit contract for the krep CLI.
//
// - 0 success, including a run whose subcommand reported a domain error (the
//   error is logged and the tool still exits normally)
// - 1 unknown sub-command, option-parse failure, or an unexpected error that
//   reached the top-level dispatch
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace krep::core::errors
