#pragma once

#include "krep/commands/command.hpp"
#include "krep/options/option_parser.hpp"

#include <string_view>

namespace krep::cli {

// Destinations of the global flags.
inline constexpr std::string_view kWorkingDirOption = "working_dir";
inline constexpr std::string_view kRelativeDirOption = "relative_dir";
inline constexpr std::string_view kTryrunOption = "tryrun";
inline constexpr std::string_view kVerboseOption = "verbose";
inline constexpr std::string_view kForceOption = "force";
inline constexpr std::string_view kInjectOption = "inject_option";
inline constexpr std::string_view kExtraOption = "extra_option";
inline constexpr std::string_view kHookDirOption = "hook_dir";
inline constexpr std::string_view kHelpOption = "help";

// Default of the verbosity counter; anything else means `-v` was given.
inline constexpr int kVerbositySentinel = -1;

// Global flags, then `--inject-option` when no command is known yet or the
// command supports injection, `--extra-option` when the command supports
// extra options, then the command's own flags.
options::OptionParser BuildOptionParser(const commands::ICommand* command);

} // namespace krep::cli
