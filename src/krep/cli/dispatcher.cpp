#include "krep/cli/dispatcher.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "krep/cli/parser_builder.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

namespace krep::cli {

namespace {

using commands::CommandResult;

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);

// The counter is popped so it never reaches the command; a value other than
// the sentinel replaces the process-wide level right away.
void ApplyVerbosity(options::Values& options) {
  const std::optional<options::OptionValue> verbose = options.Pop(kVerboseOption);
  if (!verbose.has_value()) {
    return;
  }
  const int* count = std::get_if<int>(&*verbose);
  if (count == nullptr || *count == kVerbositySentinel) {
    return;
  }
  core::logging::SetGlobalLevel(core::logging::LevelFromVerbosity(*count));
}

// Whether "-h" or "--help" appears before the end of option processing. Used
// when the parse fails, so a help request still wins over a malformed flag.
bool HelpRequested(const std::vector<std::string>& args) {
  for (const auto& arg : args) {
    if (arg == "--") {
      return false;
    }
    if (arg == "-h" || arg == "--help") {
      return true;
    }
  }
  return false;
}

bool PopHelp(options::Values& options) {
  const std::optional<options::OptionValue> help = options.Pop(kHelpOption);
  if (!help.has_value()) {
    return false;
  }
  const bool* requested = std::get_if<bool>(&*help);
  return requested != nullptr && *requested;
}

} // namespace

std::optional<std::string> ExtractCommandName(std::vector<std::string>& args) {
  for (auto it = args.begin(); it != args.end(); ++it) {
    if (it->empty() || it->front() != '-') {
      std::string name = std::move(*it);
      args.erase(it);
      return name;
    }
  }
  return std::nullopt;
}

bool ResolveWorkingDirectory(const options::Values& options, std::string& resolved,
                             std::string& error) {
  const std::string working_dir = options.GetString(kWorkingDirOption).value_or(".");
  const std::string relative_dir = options.GetString(kRelativeDirOption).value_or("");

  std::filesystem::path path;
  if (!core::ResolveAbsolutePath(working_dir, relative_dir, path, error)) {
    return false;
  }
  resolved = path.string();
  return true;
}

int Dispatcher::Run(std::vector<std::string> args) {
  const auto& logger = core::logging::GetLogger();

  std::optional<std::string> name = ExtractCommandName(args);
  const bool named = name.has_value();
  if (!named) {
    logger.Debug("no sub-command given, showing help");
    name = std::string(kHelpCommandName);
  }

  const commands::ICommand* command = registry_.Find(*name);
  if (command == nullptr) {
    logger.Error("unknown sub-command", {{"command", *name}});
    return kExitFailure;
  }

  const options::OptionParser parser = BuildOptionParser(command);
  options::Values options = parser.SeedDefaults();
  std::vector<std::string> positionals;
  std::string error;
  const bool parsed = parser.Parse(args, options, positionals, error);
  const bool help_requested = parsed ? PopHelp(options) : HelpRequested(args);
  // `krep -h` falls through to the help command, which lists every command.
  if (help_requested && named) {
    std::cout << parser.FormatHelp();
    return kExitSuccess;
  }
  if (!parsed) {
    logger.Error("invalid arguments", {{"command", *name}, {"error", error}});
    std::cerr << "usage: " << parser.usage() << '\n';
    return kExitFailure;
  }

  ApplyVerbosity(options);

  const CommandResult result = Execute(*command, parser, std::move(options), positionals);
  if (result.kind == CommandResult::Kind::kUnexpectedError) {
    logger.Error("sub-command failed", {{"command", *name}, {"error", result.message}});
    return kExitFailure;
  }
  return kExitSuccess;
}

CommandResult Dispatcher::Dispatch(const std::string& name, const options::Values& options,
                                   const std::vector<std::string>& args, bool ignore_except) {
  const auto& logger = core::logging::GetLogger();

  const commands::ICommand* command = Lookup(name);
  if (command == nullptr) {
    if (ignore_except) {
      logger.Error("ignoring unknown sub-command", {{"command", name}});
      return CommandResult::DomainError("unknown sub-command: " + name);
    }
    return CommandResult::UnexpectedError("unknown sub-command: " + name);
  }

  const options::OptionParser parser = BuildOptionParser(command);
  options::Values working = parser.SeedDefaults();
  std::vector<std::string> positionals;
  std::string error;
  if (!parser.Parse(args, working, positionals, error)) {
    const std::string message = "invalid arguments for " + name + ": " + error;
    if (ignore_except) {
      logger.Error("ignoring invalid arguments", {{"command", name}, {"error", error}});
      return CommandResult::DomainError(message);
    }
    return CommandResult::UnexpectedError(message);
  }

  if (PopHelp(working)) {
    std::cout << parser.FormatHelp();
    return CommandResult::Ok();
  }

  if (!working.Join(options, &parser, /*override=*/false, error)) {
    logger.Warn("ignored caller option", {{"command", name}, {"error", error}});
  }
  ApplyVerbosity(working);

  CommandResult result = Execute(*command, parser, std::move(working), positionals);
  if (result.kind == CommandResult::Kind::kUnexpectedError && ignore_except) {
    logger.Error("ignoring sub-command failure", {{"command", name}, {"error", result.message}});
    result.kind = CommandResult::Kind::kDomainError;
  }
  return result;
}

const commands::ICommand* Dispatcher::Lookup(std::string_view name) const {
  return registry_.Find(name);
}

bool Dispatcher::BuildParser(std::string_view name, options::OptionParser& parser,
                             std::string& error) const {
  const commands::ICommand* command = registry_.Find(name);
  if (command == nullptr) {
    error = "unknown sub-command: " + std::string(name);
    return false;
  }
  parser = BuildOptionParser(command);
  return true;
}

std::vector<std::string> Dispatcher::CommandNames() const {
  return registry_.Names();
}

CommandResult Dispatcher::Execute(const commands::ICommand& command,
                                  const options::OptionParser& parser, options::Values options,
                                  const std::vector<std::string>& positionals) {
  const auto& logger = core::logging::GetLogger();

  if (command.SupportInject()) {
    ApplyInjectedOptions(command, parser, options);
  }

  std::string error;
  if (!options.Join(defaults_, &parser, /*override=*/false, error)) {
    logger.Warn("ignored default option", {{"command", command.Name()}, {"error", error}});
  }

  std::string working_dir;
  if (!ResolveWorkingDirectory(options, working_dir, error)) {
    return CommandResult::UnexpectedError(error);
  }

  core::ScopedWorkingDirectory scoped_dir(/*remove_on_exit=*/false);
  if (!scoped_dir.Enter(working_dir, error)) {
    return CommandResult::UnexpectedError(error);
  }

  const auto& command_logger = core::logging::GetLogger(command.DisplayName(options));
  command_logger.Debug("running sub-command",
                       {{"command", command.Name()}, {"working_dir", working_dir}});

  CommandResult result;
  try {
    result = command.Execute(options, positionals, *this);
  } catch (const std::exception& ex) {
    result = CommandResult::UnexpectedError(ex.what());
  }

  command_logger.Debug("sub-command finished",
                       {{"command", command.Name()}, {"result", commands::ToString(result.kind)}});
  if (result.kind == CommandResult::Kind::kDomainError) {
    command_logger.Error(result.message, {{"command", command.Name()}});
  }
  return result;
}

void Dispatcher::ApplyInjectedOptions(const commands::ICommand& command,
                                      const options::OptionParser& parser,
                                      options::Values& options) const {
  const auto& logger = core::logging::GetLogger();

  const options::OptionList injected = options.GetList(kInjectOption);
  if (injected.empty()) {
    return;
  }

  std::vector<std::string> tokens = options::Values::Extra(injected, command.Name());
  const std::vector<std::string> global_tokens = options::Values::Extra(injected);
  tokens.insert(tokens.end(), global_tokens.begin(), global_tokens.end());

  for (std::string token : tokens) {
    if (token.empty()) {
      continue;
    }
    if (token.front() != '-') {
      token = "--" + token;
    }

    std::string dest;
    options::OptionValue value;
    std::string error;
    if (!parser.ParseInjected(token, dest, value, error)) {
      logger.Debug("dropped injected option", {{"option", token}, {"error", error}});
      continue;
    }

    options::Values single;
    single.Set(dest, std::move(value));
    if (!options.Join(single, &parser, /*override=*/true, error)) {
      logger.Debug("dropped injected option", {{"option", token}, {"error", error}});
      continue;
    }
    logger.Debug("applied injected option", {{"command", command.Name()}, {"option", token}});
  }
}

} // namespace krep::cli
