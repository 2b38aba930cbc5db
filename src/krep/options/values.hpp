#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace krep::options {

class OptionParser;

using OptionList = std::vector<std::string>;

// One resolved option value. std::monostate stands for "unset" (no declared
// default and nothing supplied).
using OptionValue = std::variant<std::monostate, bool, int, std::string, OptionList>;

// Folds an option name to its canonical key: lower case, '-' becomes '_'.
std::string NormalizeName(std::string_view name);

bool IsUnset(const OptionValue& value);

// Human-readable rendering used by logs and `batch --list`.
std::string FormatValue(const OptionValue& value);

// Ordered option set with layered-merge semantics.
//
// Every slot carries an "explicit" mark. Slots seeded from a parser's declared
// defaults are not explicit; anything supplied by a parse, Set() or copied by
// Join() from an explicit source slot is. Join(..., override = false) only
// fills slots that are not explicit, which is what lets lower-precedence
// layers be applied after higher ones.
class Values {
public:
  Values() = default;

  bool Has(std::string_view name) const;
  bool IsExplicit(std::string_view name) const;
  bool empty() const {
    return entries_.empty();
  }
  std::size_t size() const {
    return entries_.size();
  }

  // Returns nullptr when the option is absent.
  const OptionValue* Find(std::string_view name) const;

  std::optional<std::string> GetString(std::string_view name) const;
  std::optional<int> GetInt(std::string_view name) const;
  bool GetBool(std::string_view name, bool fallback = false) const;

  // A single string is returned as a one-element list; absent or unset
  // options give an empty list.
  OptionList GetList(std::string_view name) const;

  // Stores an explicitly set value.
  void Set(std::string_view name, OptionValue value);

  // Stores a declared default (slot is not explicit).
  void SetDefault(std::string_view name, OptionValue value);

  // Merges `source` into this set.
  //
  // - parser != nullptr: options the parser does not declare are skipped and
  //   string values are coerced to the declared type.
  // - override == true: every participating option is copied.
  // - override == false: only slots that are not explicit are filled.
  //
  // A value that cannot be coerced is skipped and reported through `error`
  // (false return); every other option is still merged.
  bool Join(const Values& source, const OptionParser* parser, bool override, std::string& error);

  // Join without a parser. Never fails.
  void Join(const Values& source, bool override = true);

  // Removes an option and returns its value, or std::nullopt when absent.
  std::optional<OptionValue> Pop(std::string_view name);

  std::vector<std::string> Names() const;

  // Selects `group:option[=value]` tokens addressed to `group` and strips the
  // qualifier. With no group, returns the tokens that carry no qualifier.
  // Order is preserved; the input is not modified.
  static std::vector<std::string> Extra(const std::vector<std::string>& tokens,
                                        std::optional<std::string_view> group = std::nullopt);

private:
  struct Entry {
    OptionValue value;
    bool explicit_set = false;
  };

  std::map<std::string, Entry, std::less<>> entries_;
};

} // namespace krep::options
