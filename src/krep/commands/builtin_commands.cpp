#include "krep/commands/builtin_commands.hpp"

#include "krep/commands/registry.hpp"

#include <utility>
#include <vector>

namespace krep::commands {

bool RegisterBuiltinCommands(CommandRegistry& registry, std::string& error) {
  std::vector<std::unique_ptr<ICommand>> builtins;
  builtins.push_back(MakeHelpCommand());
  builtins.push_back(MakeVersionCommand());
  builtins.push_back(MakeBatchCommand());
  builtins.push_back(MakeExecCommand());

  for (auto& command : builtins) {
    if (!registry.Register(std::move(command), error)) {
      return false;
    }
  }
  return true;
}

} // namespace krep::commands
