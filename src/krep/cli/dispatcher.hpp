#pragma once

#include "krep/commands/command.hpp"
#include "krep/commands/registry.hpp"
#include "krep/options/option_parser.hpp"
#include "krep/options/values.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace krep::cli {

inline constexpr std::string_view kHelpCommandName = "help";

// Removes and returns the first token that does not start with '-'.
std::optional<std::string> ExtractCommandName(std::vector<std::string>& args);

// Working directory for a run: `working_dir` joined with `relative_dir`,
// absolute, existence not required.
bool ResolveWorkingDirectory(const options::Values& options, std::string& resolved,
                             std::string& error);

// Resolves a subcommand, layers its options and runs it inside its working
// directory.
//
// Layering order for one run (highest precedence first):
//   1. injected options (`--inject-option`), merged with override
//   2. command-line flags
//   3. caller-provided options (recursive Dispatch only)
//   4. the default configuration, only filling slots nothing else set
//
// One dispatch is in flight per process: the working directory is process
// state and is changed around every execution.
class Dispatcher : public commands::CommandContext {
public:
  Dispatcher(const commands::CommandRegistry& registry, const options::Values& defaults)
      : registry_(registry), defaults_(defaults) {}

  // Top-level entry. `args` excludes the program name. Returns the process
  // exit code. `-h`/`--help` with a command name prints that command's help
  // and returns 0, even when the remaining flags do not parse.
  int Run(std::vector<std::string> args);

  commands::CommandResult Dispatch(const std::string& name, const options::Values& options,
                                   const std::vector<std::string>& args,
                                   bool ignore_except) override;
  const commands::ICommand* Lookup(std::string_view name) const override;
  bool BuildParser(std::string_view name, options::OptionParser& parser,
                   std::string& error) const override;
  std::vector<std::string> CommandNames() const override;

private:
  commands::CommandResult Execute(const commands::ICommand& command,
                                  const options::OptionParser& parser, options::Values options,
                                  const std::vector<std::string>& positionals);
  void ApplyInjectedOptions(const commands::ICommand& command,
                            const options::OptionParser& parser, options::Values& options) const;

  const commands::CommandRegistry& registry_;
  const options::Values& defaults_;
};

} // namespace krep::cli
