#include "krep/commands/batch_command.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "krep/cli/parser_builder.hpp"
#include "krep/commands/builtin_commands.hpp"
#include "krep/config/config_file.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <map>
#include <system_error>
#include <utility>

namespace krep::commands {

namespace {

constexpr std::string_view kBatchFileOption = "batch_file";
constexpr std::string_view kGroupOption = "group";
constexpr std::string_view kListOption = "list";
constexpr std::string_view kIgnoreErrorsOption = "ignore_errors";
constexpr std::string_view kArgOption = "arg";

constexpr std::string_view kProjectSection = "project";
constexpr std::string_view kSchemaKey = "schema";

std::string_view TrimBlank(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())) != 0) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())) != 0) {
    sv.remove_suffix(1);
  }
  return sv;
}

bool Contains(const std::vector<std::string>& items, std::string_view item) {
  return std::find(items.begin(), items.end(), item) != items.end();
}

// One `[project "<name>"]` section resolved against its schema command.
struct BatchProject {
  std::string name;
  std::string schema;
  options::Values options;
};

class BatchCommand final : public ICommand {
public:
  std::string Name() const override {
    return "batch";
  }

  std::string Summary() const override {
    return "Load and execute projects from batch files";
  }

  std::string Usage() const override {
    return "krep batch [options] [FILE]...";
  }

  bool SupportInject() const override {
    return true;
  }

  void DeclareOptions(options::OptionParser& parser) const override {
    using options::OptionKind;
    using options::OptionSpec;

    parser.AddGroup("File options");
    parser.AddOption(OptionSpec{.flags = {"-f", "--file", "--batch-file"},
                                .dest = std::string(kBatchFileOption),
                                .kind = OptionKind::kAppend,
                                .default_value = {},
                                .metavar = "FILE",
                                .help = "add a batch file, repeatable"});
    parser.AddOption(OptionSpec{.flags = {"-u", "--group"},
                                .dest = std::string(kGroupOption),
                                .kind = OptionKind::kString,
                                .default_value = {},
                                .metavar = "GROUP1,GROUP2,...",
                                .help = "select projects by group"});
    parser.AddOption(OptionSpec{.flags = {"--list"},
                                .dest = std::string(kListOption),
                                .kind = OptionKind::kFlag,
                                .default_value = false,
                                .metavar = {},
                                .help = "list the selected projects only"});
    parser.AddOption(OptionSpec{.flags = {"--arg"},
                                .dest = std::string(kArgOption),
                                .kind = OptionKind::kAppend,
                                .default_value = {},
                                .metavar = "ARG",
                                .help = "pass an argument to every project, repeatable"});

    parser.AddGroup("Error handling options");
    parser.AddOption(OptionSpec{.flags = {"--ierror", "--ignore-errors"},
                                .dest = std::string(kIgnoreErrorsOption),
                                .kind = OptionKind::kFlag,
                                .default_value = false,
                                .metavar = {},
                                .help = "continue with the next project after an error"});
  }

  CommandResult Execute(const options::Values& options, const std::vector<std::string>& args,
                        CommandContext& context) const override {
    const auto& logger = core::logging::GetLogger(DisplayName(options));

    std::vector<std::string> files = options.GetList(kBatchFileOption);
    files.insert(files.end(), args.begin(), args.end());
    if (files.empty()) {
      return CommandResult::DomainError("batch file (--batch-file) is not set");
    }

    const bool ignore_errors = options.GetBool(kIgnoreErrorsOption);
    std::size_t failures = 0;
    for (const auto& file : files) {
      std::error_code ec;
      if (!std::filesystem::exists(file, ec)) {
        logger.Error("cannot open batch file", {{"file", file}});
        ++failures;
      } else {
        CommandResult result = RunBatchFile(file, options, context, failures);
        if (result.kind == CommandResult::Kind::kUnexpectedError) {
          return result;
        }
      }

      if (failures > 0 && !ignore_errors) {
        break;
      }
    }

    if (failures > 0) {
      return CommandResult::DomainError("batch finished with " + std::to_string(failures) +
                                        " failure(s)");
    }
    return CommandResult::Ok();
  }

private:
  // Options the batch run hands down to every project, minus the batch's own
  // flags and the directory settings it has already applied.
  static options::Values InheritedOptions(const options::Values& options) {
    options::Values inherited;
    inherited.Join(options, /*override=*/true);
    for (const std::string_view name :
         {kBatchFileOption, kGroupOption, kListOption, kIgnoreErrorsOption, kArgOption,
          cli::kWorkingDirOption, cli::kRelativeDirOption}) {
      inherited.Pop(name);
    }
    return inherited;
  }

  CommandResult LoadProjects(const config::ConfigFile& config, const options::Values& options,
                             CommandContext& context, std::vector<BatchProject>& projects) const {
    const auto& logger = core::logging::GetLogger(DisplayName(options));
    const std::vector<std::string> limits =
        SplitGroupList(options.GetString(kGroupOption).value_or("default"));
    const options::Values inherited = InheritedOptions(options);

    std::error_code ec;
    const std::filesystem::path current_dir = std::filesystem::current_path(ec);
    if (ec) {
      return CommandResult::UnexpectedError("failed to read current directory: " + ec.message());
    }

    for (const auto& section : config.SectionNames(kProjectSection)) {
      const std::string name = config::ConfigFile::SubsectionPart(section);
      for (options::Values raw : config.Sections(section)) {
        std::vector<std::string> groups =
            SplitGroupList(raw.GetString(kGroupOption).value_or(""));
        raw.Pop(kGroupOption);
        groups.push_back(name);
        groups.push_back(std::filesystem::path(name).filename().string());
        if (!InGroups(limits, groups)) {
          logger.Debug("project not selected", {{"project", name}});
          continue;
        }

        const std::string schema = raw.GetString(kSchemaKey).value_or("");
        options::OptionParser parser;
        std::string error;
        if (schema.empty() || !context.BuildParser(schema, parser, error)) {
          return CommandResult::UnexpectedError("schema is not recognized or undefined in " +
                                                section);
        }

        BatchProject project{.name = name, .schema = schema, .options = {}};
        if (!project.options.Join(raw, &parser, /*override=*/true, error)) {
          logger.Warn("ignored project option", {{"project", name}, {"error", error}});
        }
        if (!project.options.Join(inherited, &parser, /*override=*/false, error)) {
          logger.Warn("ignored batch option", {{"project", name}, {"error", error}});
        }

        // Project directories are relative to the batch file's run directory;
        // pin them down before the nested dispatch changes directory.
        const std::string working_dir =
            project.options.GetString(cli::kWorkingDirOption).value_or("");
        std::filesystem::path resolved;
        if (!core::ResolveAbsolutePath(current_dir.string(), working_dir, resolved, error)) {
          return CommandResult::UnexpectedError(error);
        }
        project.options.Set(cli::kWorkingDirOption, resolved.string());

        projects.push_back(std::move(project));
      }
    }
    return CommandResult::Ok();
  }

  static void PrintProjects(const std::string& file, const std::vector<BatchProject>& projects) {
    std::map<std::string, int> counts;
    for (const auto& project : projects) {
      ++counts["[" + project.schema + "] " + project.name];
    }

    std::cout << "\nFile: " << file << '\n';
    std::cout << "==================================\n";
    int index = 0;
    for (const auto& [label, count] : counts) {
      ++index;
      std::cout << "  " << (index < 10 ? " " : "") << index << ". " << label;
      if (count > 1) {
        std::cout << " (" << count << ")";
      }
      std::cout << '\n';
    }
    std::cout << '\n';
  }

  CommandResult RunBatchFile(const std::string& file, const options::Values& options,
                             CommandContext& context, std::size_t& failures) const {
    const auto& logger = core::logging::GetLogger(DisplayName(options));

    config::ConfigFile config;
    std::string error;
    if (!config::ReadConfigFile(file, config, error)) {
      logger.Error("cannot parse batch file", {{"file", file}, {"error", error}});
      ++failures;
      return CommandResult::Ok();
    }

    std::vector<BatchProject> projects;
    CommandResult loaded = LoadProjects(config, options, context, projects);
    if (!loaded.ok()) {
      return loaded;
    }

    if (options.GetBool(kListOption)) {
      PrintProjects(file, projects);
      return CommandResult::Ok();
    }

    const bool ignore_errors = options.GetBool(kIgnoreErrorsOption);
    const std::vector<std::string> project_args = options.GetList(kArgOption);
    for (const auto& project : projects) {
      logger.Info("running project", {{"project", project.name}, {"schema", project.schema}});
      const CommandResult result =
          context.Dispatch(project.schema, project.options, project_args, ignore_errors);
      if (result.kind == CommandResult::Kind::kUnexpectedError) {
        return result;
      }
      if (!result.ok()) {
        ++failures;
      }
    }
    return CommandResult::Ok();
  }
};

} // namespace

std::vector<std::string> SplitGroupList(std::string_view text) {
  std::vector<std::string> items;
  std::size_t start = 0;
  while (true) {
    const std::size_t comma = text.find(',', start);
    const std::string_view item =
        text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
    items.emplace_back(TrimBlank(item));
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  return items;
}

bool InGroups(const std::vector<std::string>& limits, const std::vector<std::string>& groups) {
  bool all_exclusions = true;
  for (const auto& limit : limits) {
    std::string_view group = limit;
    bool exclude = false;
    if (!group.empty() && group.front() == '-') {
      group.remove_prefix(1);
      exclude = true;
    } else {
      all_exclusions = false;
    }

    if (Contains(groups, group)) {
      return !exclude;
    }
  }

  return (all_exclusions || Contains(limits, "default")) && !Contains(groups, "notdefault") &&
         !Contains(groups, "-default");
}

std::unique_ptr<ICommand> MakeBatchCommand() {
  return std::make_unique<BatchCommand>();
}

} // namespace krep::commands
