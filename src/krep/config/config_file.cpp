#include "krep/config/config_file.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <optional>

namespace krep::config {

namespace {

std::string_view Trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())) != 0) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())) != 0) {
    sv.remove_suffix(1);
  }
  return sv;
}

bool IsSectionName(std::string_view name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '-';
  });
}

// Subsections usually carry project paths, so '/', '.' and '_' are allowed
// on top of the section alphabet.
bool IsSubsectionName(std::string_view name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '/';
  });
}

bool IsOptionName(std::string_view name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '-' || c == '_';
  });
}

// "[section]" or "[section "subsection"]" => "section" / "section.subsection".
std::optional<std::string> ParseSectionHeader(std::string_view line) {
  if (line.size() < 2 || line.front() != '[' || line.back() != ']') {
    return std::nullopt;
  }
  const std::string_view inner = Trim(line.substr(1, line.size() - 2));

  const std::size_t space = inner.find_first_of(" \t");
  if (space == std::string_view::npos) {
    if (!IsSectionName(inner)) {
      return std::nullopt;
    }
    return std::string(inner);
  }

  const std::string_view section = inner.substr(0, space);
  const std::string_view quoted = Trim(inner.substr(space));
  if (!IsSectionName(section) || quoted.size() < 2 || quoted.front() != '"' ||
      quoted.back() != '"') {
    return std::nullopt;
  }
  const std::string_view subsection = quoted.substr(1, quoted.size() - 2);
  if (!IsSubsectionName(subsection)) {
    return std::nullopt;
  }
  return std::string(section) + "." + std::string(subsection);
}

void AppendValue(options::Values& values, std::string_view name, std::string value) {
  if (!values.IsExplicit(name)) {
    values.Set(name, std::move(value));
    return;
  }
  options::OptionList items = values.GetList(name);
  items.push_back(std::move(value));
  values.Set(name, std::move(items));
}

} // namespace

bool ConfigFile::Parse(std::string_view text, ConfigFile& config, std::string& error) {
  config = ConfigFile{};
  error.clear();

  std::optional<std::size_t> current_section;
  std::size_t line_number = 0;
  std::size_t line_start = 0;
  while (line_start <= text.size()) {
    std::size_t line_end = text.find('\n', line_start);
    if (line_end == std::string_view::npos) {
      line_end = text.size();
    }
    const std::string_view line = Trim(text.substr(line_start, line_end - line_start));
    line_start = line_end + 1;
    ++line_number;

    if (line.empty() || line.front() == '#' || line.front() == ';') {
      continue;
    }

    if (line.front() == '[') {
      const std::optional<std::string> name = ParseSectionHeader(line);
      if (!name.has_value()) {
        error = "invalid section header at line " + std::to_string(line_number) + ": " +
                std::string(line);
        return false;
      }
      config.sections_.emplace_back(*name, options::Values{});
      current_section = config.sections_.size() - 1;
      continue;
    }

    const std::size_t equals = line.find('=');
    const std::string_view name =
        equals == std::string_view::npos ? std::string_view{} : Trim(line.substr(0, equals));
    if (!IsOptionName(name)) {
      error = "unmatched line " + std::to_string(line_number) + ": " + std::string(line);
      return false;
    }

    std::string value(Trim(line.substr(equals + 1)));
    options::Values& target =
        current_section.has_value() ? config.sections_[*current_section].second : config.defaults_;
    AppendValue(target, name, std::move(value));
  }

  return true;
}

std::vector<std::string> ConfigFile::SectionNames(std::string_view section) const {
  std::vector<std::string> names;
  for (const auto& [name, values] : sections_) {
    if (!section.empty() && SectionPart(name) != section) {
      continue;
    }
    if (std::find(names.begin(), names.end(), name) == names.end()) {
      names.push_back(name);
    }
  }
  return names;
}

std::vector<options::Values> ConfigFile::Sections(std::string_view name) const {
  std::vector<options::Values> matched;
  for (const auto& [section_name, values] : sections_) {
    if (section_name == name) {
      matched.push_back(values);
    }
  }
  return matched;
}

std::string ConfigFile::SectionPart(std::string_view name) {
  return std::string(name.substr(0, name.find('.')));
}

std::string ConfigFile::SubsectionPart(std::string_view name) {
  const std::size_t dot = name.find('.');
  if (dot == std::string_view::npos) {
    return "";
  }
  return std::string(name.substr(dot + 1));
}

bool ReadConfigFile(const std::filesystem::path& path, ConfigFile& config, std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read config file: " + path.string();
    return false;
  }

  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (!ConfigFile::Parse(contents, config, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

} // namespace krep::config
