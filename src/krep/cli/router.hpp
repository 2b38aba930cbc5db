#pragma once

#include "krep/config/default_config.hpp"

namespace krep::cli {

// Process entry for `krep`. Loads the default configuration from the standard
// locations, registers the built-in commands and hands argv to the
// dispatcher. Exit codes:
//   0 => success (including a command that reported a domain error)
//   1 => unknown sub-command, invalid arguments or an unexpected error
int Dispatch(int argc, char** argv);

// Same as above with a caller-owned loader, so embedders and tests can point
// the default layer at their own files.
int Dispatch(int argc, char** argv, config::DefaultConfigLoader& loader);

} // namespace krep::cli
