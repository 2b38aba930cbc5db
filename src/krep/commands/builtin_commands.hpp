#pragma once

#include "krep/commands/command.hpp"

#include <memory>
#include <string_view>

namespace krep::commands {

inline constexpr std::string_view kVersion = "0.1.0";

std::unique_ptr<ICommand> MakeHelpCommand();
std::unique_ptr<ICommand> MakeVersionCommand();
std::unique_ptr<ICommand> MakeBatchCommand();
std::unique_ptr<ICommand> MakeExecCommand();

} // namespace krep::commands
