#include "krep/commands/builtin_commands.hpp"

#include <iostream>
#include <string>

namespace krep::commands {

namespace {

class VersionCommand final : public ICommand {
public:
  std::string Name() const override {
    return "version";
  }

  std::string Summary() const override {
    return "Print the krep version";
  }

  std::string Usage() const override {
    return "krep version";
  }

  CommandResult Execute(const options::Values& options, const std::vector<std::string>& args,
                        CommandContext& context) const override {
    (void)options;
    (void)context;
    if (!args.empty()) {
      return CommandResult::DomainError("version does not take arguments");
    }
    std::cout << "krep " << kVersion << '\n';
    return CommandResult::Ok();
  }
};

} // namespace

std::unique_ptr<ICommand> MakeVersionCommand() {
  return std::make_unique<VersionCommand>();
}

} // namespace krep::commands
