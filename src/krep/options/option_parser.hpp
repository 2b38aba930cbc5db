#pragma once

#include "krep/options/values.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace krep::options {

enum class OptionKind {
  kFlag,   // boolean, set to true when present
  kString, // takes one value
  kInt,    // takes one integer value
  kAppend, // takes one value per occurrence, collected into a list
  kCount,  // counts occurrences
};

struct OptionSpec {
  // Flag spellings, e.g. {"-w", "--working-dir"}.
  std::vector<std::string> flags;
  // Key in the resulting Values; normalized on declaration.
  std::string dest;
  OptionKind kind = OptionKind::kFlag;
  OptionValue default_value;
  std::string metavar;
  std::string help;
};

// Parses "true/yes/on/1" and "false/no/off/0" (case-insensitive).
bool ParseBoolText(std::string_view text, bool& value);

// Declared flag grammar for one dispatch: the global flags plus the flags of
// at most one command.
//
// Declaration problems (a flag spelled twice, a flag without a leading '-')
// do not abort AddOption(); they are collected and reported by
// DeclarationError() so registration can reject the command up front.
class OptionParser {
public:
  explicit OptionParser(std::string usage = {}) : usage_(std::move(usage)) {}

  const std::string& usage() const {
    return usage_;
  }

  // After this call the first positional argument ends option processing,
  // as a bare "--" does.
  void DisableInterspersedArgs() {
    interspersed_ = false;
  }

  // Options added after this call are listed under `title` in help output.
  OptionParser& AddGroup(std::string title);
  OptionParser& AddOption(OptionSpec spec);

  // True when a declaration problem was recorded; `error` gets the first one.
  bool DeclarationError(std::string& error) const;

  const OptionSpec* FindByFlag(std::string_view flag) const;
  const OptionSpec* FindByDest(std::string_view dest) const;
  bool Declares(std::string_view dest) const {
    return FindByDest(dest) != nullptr;
  }

  // Values holding every declared option at its declared default.
  Values SeedDefaults() const;

  // Command-line parse. Recognized options are stored explicitly into
  // `values` (normally the result of SeedDefaults()); everything else is
  // appended to `positionals`. A bare "--" ends option processing, and so
  // does the first positional when interspersed arguments are disabled.
  bool Parse(const std::vector<std::string>& args, Values& values,
             std::vector<std::string>& positionals, std::string& error) const;

  // Injection parse of exactly one `--option[=value]` token. Unlike the
  // command-line mode, flags and counters accept an inline value
  // (`--force=false`, `--verbose=2`) and value options require one.
  bool ParseInjected(std::string_view token, std::string& dest, OptionValue& value,
                     std::string& error) const;

  // Converts `raw` to the representation `spec` declares. Strings are parsed,
  // lists are narrowed to their last element for scalar kinds.
  static bool CoerceValue(const OptionSpec& spec, const OptionValue& raw, OptionValue& value,
                          std::string& error);

  std::string FormatHelp() const;

private:
  struct Group {
    std::string title;
    std::vector<std::size_t> members;
  };

  bool ApplyOccurrence(const OptionSpec& spec, std::string_view flag, const std::string* raw,
                       Values& values, std::string& error) const;

  std::string usage_;
  std::vector<OptionSpec> specs_;
  std::vector<Group> groups_;
  std::vector<std::string> declaration_errors_;
  bool interspersed_ = true;
};

} // namespace krep::options
