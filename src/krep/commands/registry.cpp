#include "krep/commands/registry.hpp"

#include "krep/cli/parser_builder.hpp"

#include <utility>

namespace krep::commands {

bool CommandRegistry::Register(std::unique_ptr<ICommand> command, std::string& error) {
  error.clear();
  if (command == nullptr) {
    error = "cannot register a null command";
    return false;
  }

  const std::string name = command->Name();
  if (name.empty() || name.front() == '-') {
    error = "invalid sub-command name '" + name + "'";
    return false;
  }
  if (commands_.find(name) != commands_.end()) {
    error = "sub-command '" + name + "' is already registered";
    return false;
  }

  const options::OptionParser parser = cli::BuildOptionParser(command.get());
  std::string declaration_error;
  if (parser.DeclarationError(declaration_error)) {
    error = "sub-command '" + name + "' declares invalid options: " + declaration_error;
    return false;
  }

  commands_.emplace(name, std::move(command));
  return true;
}

const ICommand* CommandRegistry::Find(std::string_view name) const {
  const auto it = commands_.find(name);
  if (it == commands_.end()) {
    return nullptr;
  }
  return it->second.get();
}

std::vector<std::string> CommandRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(commands_.size());
  for (const auto& [name, command] : commands_) {
    names.push_back(name);
  }
  return names;
}

} // namespace krep::commands
