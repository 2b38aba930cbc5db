#pragma once

#include "krep/options/values.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace krep::config {

// Key-grouped configuration file:
//
//   # comment / ; comment
//   key = value                 global key, part of Defaults()
//   [section]
//   key = value
//   [section "subsection"]      stored under the name "section.subsection"
//   key = value
//
// Repeating a key inside one section turns it into a list. Repeating a
// section header starts a new, separate Values for the same name.
class ConfigFile {
public:
  static bool Parse(std::string_view text, ConfigFile& config, std::string& error);

  // Global keys that appear before any section header.
  const options::Values& Defaults() const {
    return defaults_;
  }

  // Section names whose section part equals `section` ("project" matches
  // "project" and "project.foo"), in first-appearance order. An empty
  // `section` lists every section name.
  std::vector<std::string> SectionNames(std::string_view section = {}) const;

  // Every Values block stored under exactly `name`, in file order.
  std::vector<options::Values> Sections(std::string_view name) const;

  static std::string SectionPart(std::string_view name);
  static std::string SubsectionPart(std::string_view name);

private:
  options::Values defaults_;
  std::vector<std::pair<std::string, options::Values>> sections_;
};

// Reads and parses `path`. Errors carry the file name and line number.
bool ReadConfigFile(const std::filesystem::path& path, ConfigFile& config, std::string& error);

} // namespace krep::config
