#pragma once

#include "krep/commands/command.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace krep::commands {

// Name => descriptor table, filled once at start-up and read-only afterwards.
class CommandRegistry {
public:
  CommandRegistry() = default;

  CommandRegistry(const CommandRegistry&) = delete;
  CommandRegistry& operator=(const CommandRegistry&) = delete;

  // Rejects null commands, duplicate names and commands whose flags clash
  // with the global flags or with each other.
  bool Register(std::unique_ptr<ICommand> command, std::string& error);

  // nullptr when `name` is not registered.
  const ICommand* Find(std::string_view name) const;

  std::vector<std::string> Names() const;

  std::size_t size() const {
    return commands_.size();
  }

private:
  std::map<std::string, std::unique_ptr<ICommand>, std::less<>> commands_;
};

// Registers help, version, batch and exec.
bool RegisterBuiltinCommands(CommandRegistry& registry, std::string& error);

} // namespace krep::commands
