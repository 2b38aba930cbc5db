#include "krep/options/values.hpp"

#include "krep/options/option_parser.hpp"

#include <cctype>
#include <utility>

namespace krep::options {

namespace {

// Splits `group:option=value` into its group and the remainder. A ':' that
// appears only after '=' belongs to the value, not to a group qualifier.
bool SplitGroup(std::string_view token, std::string_view& group, std::string_view& rest) {
  const std::size_t colon = token.find(':');
  if (colon == std::string_view::npos) {
    return false;
  }
  const std::size_t equals = token.find('=');
  if (equals != std::string_view::npos && equals < colon) {
    return false;
  }

  group = token.substr(0, colon);
  rest = token.substr(colon + 1);
  return true;
}

} // namespace

std::string NormalizeName(std::string_view name) {
  std::string normalized;
  normalized.reserve(name.size());
  for (const char c : name) {
    if (c == '-') {
      normalized.push_back('_');
      continue;
    }
    normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return normalized;
}

bool IsUnset(const OptionValue& value) {
  return std::holds_alternative<std::monostate>(value);
}

std::string FormatValue(const OptionValue& value) {
  if (const auto* flag = std::get_if<bool>(&value)) {
    return *flag ? "true" : "false";
  }
  if (const auto* number = std::get_if<int>(&value)) {
    return std::to_string(*number);
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  if (const auto* list = std::get_if<OptionList>(&value)) {
    std::string joined;
    for (const auto& item : *list) {
      if (!joined.empty()) {
        joined += ',';
      }
      joined += item;
    }
    return joined;
  }
  return "";
}

bool Values::Has(std::string_view name) const {
  return entries_.find(NormalizeName(name)) != entries_.end();
}

bool Values::IsExplicit(std::string_view name) const {
  const auto it = entries_.find(NormalizeName(name));
  return it != entries_.end() && it->second.explicit_set;
}

const OptionValue* Values::Find(std::string_view name) const {
  const auto it = entries_.find(NormalizeName(name));
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second.value;
}

std::optional<std::string> Values::GetString(std::string_view name) const {
  const OptionValue* value = Find(name);
  if (value == nullptr || IsUnset(*value)) {
    return std::nullopt;
  }
  if (const auto* list = std::get_if<OptionList>(value)) {
    if (list->empty()) {
      return std::nullopt;
    }
    return list->back();
  }
  return FormatValue(*value);
}

std::optional<int> Values::GetInt(std::string_view name) const {
  const OptionValue* value = Find(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (const auto* number = std::get_if<int>(value)) {
    return *number;
  }
  if (const auto* flag = std::get_if<bool>(value)) {
    return *flag ? 1 : 0;
  }
  return std::nullopt;
}

bool Values::GetBool(std::string_view name, bool fallback) const {
  const OptionValue* value = Find(name);
  if (value == nullptr || IsUnset(*value)) {
    return fallback;
  }
  if (const auto* flag = std::get_if<bool>(value)) {
    return *flag;
  }
  if (const auto* number = std::get_if<int>(value)) {
    return *number != 0;
  }
  if (const auto* text = std::get_if<std::string>(value)) {
    bool parsed = fallback;
    return ParseBoolText(*text, parsed) ? parsed : fallback;
  }
  return !std::get<OptionList>(*value).empty();
}

OptionList Values::GetList(std::string_view name) const {
  const OptionValue* value = Find(name);
  if (value == nullptr || IsUnset(*value)) {
    return {};
  }
  if (const auto* list = std::get_if<OptionList>(value)) {
    return *list;
  }
  return {FormatValue(*value)};
}

void Values::Set(std::string_view name, OptionValue value) {
  Entry& entry = entries_[NormalizeName(name)];
  entry.value = std::move(value);
  entry.explicit_set = true;
}

void Values::SetDefault(std::string_view name, OptionValue value) {
  Entry& entry = entries_[NormalizeName(name)];
  entry.value = std::move(value);
  entry.explicit_set = false;
}

bool Values::Join(const Values& source, const OptionParser* parser, bool override,
                  std::string& error) {
  error.clear();

  for (const auto& [key, source_entry] : source.entries_) {
    const OptionSpec* spec = nullptr;
    if (parser != nullptr) {
      spec = parser->FindByDest(key);
      if (spec == nullptr) {
        continue;
      }
    }

    const auto target = entries_.find(key);
    if (!override && target != entries_.end() && target->second.explicit_set) {
      continue;
    }

    OptionValue value = source_entry.value;
    if (spec != nullptr) {
      std::string coerce_error;
      if (!OptionParser::CoerceValue(*spec, source_entry.value, value, coerce_error)) {
        if (error.empty()) {
          error = coerce_error;
        }
        continue;
      }
    }

    Entry& entry = entries_[key];
    entry.value = std::move(value);
    entry.explicit_set = source_entry.explicit_set;
  }

  return error.empty();
}

void Values::Join(const Values& source, bool override) {
  std::string ignored;
  Join(source, nullptr, override, ignored);
}

std::optional<OptionValue> Values::Pop(std::string_view name) {
  const auto it = entries_.find(NormalizeName(name));
  if (it == entries_.end()) {
    return std::nullopt;
  }
  OptionValue value = std::move(it->second.value);
  entries_.erase(it);
  return value;
}

std::vector<std::string> Values::Names() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) {
    names.push_back(key);
  }
  return names;
}

std::vector<std::string> Values::Extra(const std::vector<std::string>& tokens,
                                       std::optional<std::string_view> group) {
  std::vector<std::string> selected;
  for (const auto& token : tokens) {
    std::string_view token_group;
    std::string_view rest;
    const bool grouped = SplitGroup(token, token_group, rest);

    if (!group.has_value()) {
      if (!grouped) {
        selected.push_back(token);
      }
      continue;
    }
    if (grouped && token_group == *group) {
      selected.emplace_back(rest);
    }
  }
  return selected;
}

} // namespace krep::options
