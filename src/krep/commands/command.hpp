#pragma once

#include "krep/options/option_parser.hpp"
#include "krep/options/values.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace krep::commands {

// Outcome of one subcommand execution.
//
// - kOk: completed normally.
// - kDomainError: the command could not do its job; the dispatcher logs the
//   message and still returns normally.
// - kUnexpectedError: anything the command did not classify (including a
//   std::exception escaping Execute). Propagates unless the caller asked for
//   errors to be ignored.
struct CommandResult {
  enum class Kind {
    kOk,
    kDomainError,
    kUnexpectedError,
  };

  Kind kind = Kind::kOk;
  std::string message;

  bool ok() const {
    return kind == Kind::kOk;
  }

  static CommandResult Ok() {
    return CommandResult{};
  }
  static CommandResult DomainError(std::string message) {
    return CommandResult{.kind = Kind::kDomainError, .message = std::move(message)};
  }
  static CommandResult UnexpectedError(std::string message) {
    return CommandResult{.kind = Kind::kUnexpectedError, .message = std::move(message)};
  }
};

inline const char* ToString(CommandResult::Kind kind) {
  switch (kind) {
  case CommandResult::Kind::kOk:
    return "ok";
  case CommandResult::Kind::kDomainError:
    return "domain_error";
  case CommandResult::Kind::kUnexpectedError:
    return "unexpected_error";
  }

  return "unexpected_error";
}

class ICommand;

// Back-references a running command gets from the dispatcher so composite
// commands can delegate to other registered commands.
class CommandContext {
public:
  virtual ~CommandContext() = default;

  // Runs `name` with `options` layered under the parsed `args` and over the
  // default configuration. With `ignore_except`, an unknown command or an
  // unexpected error is logged and reported as a domain error instead of
  // propagating.
  virtual CommandResult Dispatch(const std::string& name, const options::Values& options,
                                 const std::vector<std::string>& args, bool ignore_except) = 0;

  // Registry lookup; nullptr when `name` is not registered.
  virtual const ICommand* Lookup(std::string_view name) const = 0;

  // Builds the full grammar (global flags + command flags) for `name`.
  virtual bool BuildParser(std::string_view name, options::OptionParser& parser,
                           std::string& error) const = 0;

  // Registered command names in sorted order.
  virtual std::vector<std::string> CommandNames() const = 0;
};

// Subcommand descriptor. Implementations are stateless; one instance lives in
// the registry for the whole process.
class ICommand {
public:
  virtual ~ICommand() = default;

  virtual std::string Name() const = 0;

  // One-line description for `krep help`.
  virtual std::string Summary() const = 0;

  virtual std::string Usage() const {
    return "krep " + Name() + " [options] ...";
  }

  // Whether the command accepts `--inject-option`.
  virtual bool SupportInject() const {
    return false;
  }

  // Whether the command accepts `--extra-option` tokens for its internal
  // groups. The tokens reach Execute() unparsed under `extra_option`.
  virtual bool SupportExtra() const {
    return false;
  }

  // False stops flag parsing at the first positional argument, so a wrapped
  // program keeps its own flags.
  virtual bool InterspersedArgs() const {
    return true;
  }

  // Adds the command's own flags on top of the global ones.
  virtual void DeclareOptions(options::OptionParser& parser) const {
    (void)parser;
  }

  // Logger name for this run.
  virtual std::string DisplayName(const options::Values& options) const {
    (void)options;
    return Name();
  }

  virtual CommandResult Execute(const options::Values& options,
                                const std::vector<std::string>& args,
                                CommandContext& context) const = 0;
};

} // namespace krep::commands
