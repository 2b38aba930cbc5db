#include "krep/commands/builtin_commands.hpp"

#include "krep/cli/parser_builder.hpp"

#include <algorithm>
#include <iostream>
#include <string>

namespace krep::commands {

namespace {

class HelpCommand final : public ICommand {
public:
  std::string Name() const override {
    return "help";
  }

  std::string Summary() const override {
    return "Display the help of krep or of one command";
  }

  std::string Usage() const override {
    return "krep help [command]";
  }

  CommandResult Execute(const options::Values& options, const std::vector<std::string>& args,
                        CommandContext& context) const override {
    (void)options;
    if (args.size() > 1) {
      return CommandResult::DomainError("help takes at most one command name");
    }
    if (args.empty()) {
      PrintOverview(context);
      return CommandResult::Ok();
    }

    const ICommand* command = context.Lookup(args.front());
    options::OptionParser parser;
    std::string error;
    if (command == nullptr || !context.BuildParser(args.front(), parser, error)) {
      return CommandResult::DomainError("unknown sub-command: " + args.front());
    }

    std::cout << command->Name() << ": " << command->Summary() << "\n\n" << parser.FormatHelp();
    return CommandResult::Ok();
  }

private:
  static void PrintOverview(const CommandContext& context) {
    const std::vector<std::string> names = context.CommandNames();
    std::size_t width = 0;
    for (const auto& name : names) {
      width = std::max(width, name.size());
    }

    std::cout << cli::BuildOptionParser(nullptr).FormatHelp() << "\nCommands:\n";
    for (const auto& name : names) {
      const ICommand* command = context.Lookup(name);
      if (command == nullptr) {
        continue;
      }
      std::cout << "  " << name << std::string(width - name.size() + 2, ' ')
                << command->Summary() << '\n';
    }
    std::cout << "\nSee 'krep help <command>' for the options of one command.\n";
  }
};

} // namespace

std::unique_ptr<ICommand> MakeHelpCommand() {
  return std::make_unique<HelpCommand>();
}

} // namespace krep::commands
