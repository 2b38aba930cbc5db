#include "krep/cli/parser_builder.hpp"

#include <string>

namespace krep::cli {

options::OptionParser BuildOptionParser(const commands::ICommand* command) {
  using options::OptionKind;
  using options::OptionSpec;

  options::OptionParser parser(command != nullptr
                                   ? command->Usage()
                                   : "krep [global options] <command> [options] [args]");

  parser.AddGroup("Global options");
  parser.AddOption(OptionSpec{.flags = {"-h", "--help"},
                              .dest = std::string(kHelpOption),
                              .kind = OptionKind::kFlag,
                              .default_value = false,
                              .metavar = {},
                              .help = "show this help message and exit"});
  parser.AddOption(OptionSpec{.flags = {"-w", "--working-dir"},
                              .dest = std::string(kWorkingDirOption),
                              .kind = OptionKind::kString,
                              .default_value = std::string("."),
                              .metavar = "DIR",
                              .help = "set the working directory"});
  parser.AddOption(OptionSpec{.flags = {"--relative-dir"},
                              .dest = std::string(kRelativeDirOption),
                              .kind = OptionKind::kString,
                              .default_value = {},
                              .metavar = "DIR",
                              .help = "set the directory relative to the working directory"});
  parser.AddOption(OptionSpec{.flags = {"-n", "--tryrun"},
                              .dest = std::string(kTryrunOption),
                              .kind = OptionKind::kFlag,
                              .default_value = false,
                              .metavar = {},
                              .help = "try running the command without changing anything"});
  parser.AddOption(OptionSpec{.flags = {"-v", "--verbose"},
                              .dest = std::string(kVerboseOption),
                              .kind = OptionKind::kCount,
                              .default_value = kVerbositySentinel,
                              .metavar = {},
                              .help = "increase logging verbosity, repeatable"});
  parser.AddOption(OptionSpec{.flags = {"--force"},
                              .dest = std::string(kForceOption),
                              .kind = OptionKind::kFlag,
                              .default_value = false,
                              .metavar = {},
                              .help = "force the operation"});
  parser.AddOption(OptionSpec{.flags = {"--hook-dir"},
                              .dest = std::string(kHookDirOption),
                              .kind = OptionKind::kString,
                              .default_value = {},
                              .metavar = "DIR",
                              .help = "directory with the preinstalled hooks (default: "
                                      "$KREP_HOOK_PATH)"});

  if (command == nullptr || command->SupportInject()) {
    parser.AddOption(OptionSpec{.flags = {"--inject-option"},
                                .dest = std::string(kInjectOption),
                                .kind = OptionKind::kAppend,
                                .default_value = {},
                                .metavar = "GROUP:OPTION[=VALUE]",
                                .help = "inject an option for the named command (or every "
                                        "command without a group)"});
  }

  if (command != nullptr && command->SupportExtra()) {
    parser.AddOption(OptionSpec{.flags = {"--extra-option"},
                                .dest = std::string(kExtraOption),
                                .kind = OptionKind::kAppend,
                                .default_value = {},
                                .metavar = "GROUP:OPTION[=VALUE]",
                                .help = "extra option for an internal group of the command, "
                                        "in the --inject-option format"});
  }

  if (command != nullptr && !command->InterspersedArgs()) {
    parser.DisableInterspersedArgs();
  }

  if (command != nullptr) {
    parser.AddGroup(command->Name() + " options");
    command->DeclareOptions(parser);
  }
  return parser;
}

} // namespace krep::cli
