#include "krep/options/option_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>

namespace krep::options {

namespace {

constexpr std::size_t kHelpColumnLimit = 30;

bool TakesValue(OptionKind kind) {
  return kind == OptionKind::kString || kind == OptionKind::kInt || kind == OptionKind::kAppend;
}

bool ParseIntText(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  if (*begin == '+') {
    ++begin;
  }
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

std::string DeriveDest(const std::vector<std::string>& flags) {
  for (const auto& flag : flags) {
    if (flag.rfind("--", 0) == 0 && flag.size() > 2) {
      return NormalizeName(std::string_view(flag).substr(2));
    }
  }
  for (const auto& flag : flags) {
    if (flag.size() > 1 && flag[0] == '-') {
      return NormalizeName(std::string_view(flag).substr(1));
    }
  }
  return "";
}

// "-w DIR, --working-dir=DIR"
std::string FormatFlagColumn(const OptionSpec& spec) {
  std::string metavar = spec.metavar;
  if (metavar.empty() && TakesValue(spec.kind)) {
    metavar = spec.dest;
    std::transform(metavar.begin(), metavar.end(), metavar.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
  }

  std::string column;
  for (const auto& flag : spec.flags) {
    if (!column.empty()) {
      column += ", ";
    }
    column += flag;
    if (!metavar.empty()) {
      column += flag.rfind("--", 0) == 0 ? "=" : " ";
      column += metavar;
    }
  }
  return column;
}

} // namespace

bool ParseBoolText(std::string_view text, bool& value) {
  std::string normalized(text);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "true" || normalized == "yes" || normalized == "on" || normalized == "1") {
    value = true;
    return true;
  }
  if (normalized == "false" || normalized == "no" || normalized == "off" || normalized == "0") {
    value = false;
    return true;
  }
  return false;
}

OptionParser& OptionParser::AddGroup(std::string title) {
  groups_.push_back(Group{.title = std::move(title), .members = {}});
  return *this;
}

OptionParser& OptionParser::AddOption(OptionSpec spec) {
  if (spec.flags.empty()) {
    declaration_errors_.push_back("option declared without any flag (dest '" + spec.dest + "')");
    return *this;
  }

  for (const auto& flag : spec.flags) {
    if (flag.size() < 2 || flag[0] != '-' || flag == "--") {
      declaration_errors_.push_back("invalid option string: '" + flag + "'");
      return *this;
    }
    if (FindByFlag(flag) != nullptr) {
      declaration_errors_.push_back("conflicting option string: " + flag);
      return *this;
    }
  }

  spec.dest = spec.dest.empty() ? DeriveDest(spec.flags) : NormalizeName(spec.dest);
  if (spec.kind == OptionKind::kAppend && IsUnset(spec.default_value)) {
    spec.default_value = OptionList{};
  }

  if (groups_.empty()) {
    groups_.push_back(Group{.title = "options", .members = {}});
  }
  groups_.back().members.push_back(specs_.size());
  specs_.push_back(std::move(spec));
  return *this;
}

bool OptionParser::DeclarationError(std::string& error) const {
  if (declaration_errors_.empty()) {
    return false;
  }
  error = declaration_errors_.front();
  return true;
}

const OptionSpec* OptionParser::FindByFlag(std::string_view flag) const {
  for (const auto& spec : specs_) {
    if (std::find(spec.flags.begin(), spec.flags.end(), flag) != spec.flags.end()) {
      return &spec;
    }
  }
  return nullptr;
}

const OptionSpec* OptionParser::FindByDest(std::string_view dest) const {
  const std::string normalized = NormalizeName(dest);
  for (const auto& spec : specs_) {
    if (spec.dest == normalized) {
      return &spec;
    }
  }
  return nullptr;
}

Values OptionParser::SeedDefaults() const {
  Values values;
  for (const auto& spec : specs_) {
    // Several flags may share one dest; the first declaration owns the default.
    if (!values.Has(spec.dest)) {
      values.SetDefault(spec.dest, spec.default_value);
    }
  }
  return values;
}

bool OptionParser::ApplyOccurrence(const OptionSpec& spec, std::string_view flag,
                                   const std::string* raw, Values& values,
                                   std::string& error) const {
  switch (spec.kind) {
  case OptionKind::kFlag:
    values.Set(spec.dest, true);
    return true;
  case OptionKind::kCount: {
    int count = 0;
    if (values.IsExplicit(spec.dest)) {
      count = std::max(0, values.GetInt(spec.dest).value_or(0));
    }
    values.Set(spec.dest, count + 1);
    return true;
  }
  case OptionKind::kString:
    values.Set(spec.dest, *raw);
    return true;
  case OptionKind::kInt: {
    int number = 0;
    if (!ParseIntText(*raw, number)) {
      error = "option " + std::string(flag) + ": invalid integer value: '" + *raw + "'";
      return false;
    }
    values.Set(spec.dest, number);
    return true;
  }
  case OptionKind::kAppend: {
    OptionList items;
    if (values.IsExplicit(spec.dest)) {
      items = values.GetList(spec.dest);
    }
    items.push_back(*raw);
    values.Set(spec.dest, std::move(items));
    return true;
  }
  }

  error = "option " + std::string(flag) + ": unsupported option kind";
  return false;
}

bool OptionParser::Parse(const std::vector<std::string>& args, Values& values,
                         std::vector<std::string>& positionals, std::string& error) const {
  error.clear();
  bool options_done = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if (options_done || token.size() < 2 || token[0] != '-') {
      positionals.push_back(token);
      options_done = options_done || !interspersed_;
      continue;
    }
    if (token == "--") {
      options_done = true;
      continue;
    }

    if (token[1] == '-') {
      const std::size_t equals = token.find('=');
      const std::string flag = token.substr(0, equals);
      const OptionSpec* spec = FindByFlag(flag);
      if (spec == nullptr) {
        error = "no such option: " + flag;
        return false;
      }

      if (!TakesValue(spec->kind)) {
        if (equals != std::string::npos) {
          error = "option " + flag + " does not take a value";
          return false;
        }
        if (!ApplyOccurrence(*spec, flag, nullptr, values, error)) {
          return false;
        }
        continue;
      }

      std::string raw;
      if (equals != std::string::npos) {
        raw = token.substr(equals + 1);
      } else if (i + 1 < args.size()) {
        raw = args[++i];
      } else {
        error = "option " + flag + " requires an argument";
        return false;
      }
      if (!ApplyOccurrence(*spec, flag, &raw, values, error)) {
        return false;
      }
      continue;
    }

    // Clustered short options: "-nv", "-wDIR", "-w DIR".
    for (std::size_t pos = 1; pos < token.size(); ++pos) {
      const std::string flag = std::string("-") + token[pos];
      const OptionSpec* spec = FindByFlag(flag);
      if (spec == nullptr) {
        error = "no such option: " + flag;
        return false;
      }

      if (!TakesValue(spec->kind)) {
        if (!ApplyOccurrence(*spec, flag, nullptr, values, error)) {
          return false;
        }
        continue;
      }

      std::string raw;
      if (pos + 1 < token.size()) {
        raw = token.substr(pos + 1);
      } else if (i + 1 < args.size()) {
        raw = args[++i];
      } else {
        error = "option " + flag + " requires an argument";
        return false;
      }
      if (!ApplyOccurrence(*spec, flag, &raw, values, error)) {
        return false;
      }
      break;
    }
  }

  return true;
}

bool OptionParser::ParseInjected(std::string_view token, std::string& dest, OptionValue& value,
                                 std::string& error) const {
  error.clear();
  if (token.size() < 2 || token[0] != '-') {
    error = "injected option must start with '-': '" + std::string(token) + "'";
    return false;
  }

  std::string flag;
  std::optional<std::string> raw;
  if (token[1] == '-') {
    const std::size_t equals = token.find('=');
    flag = std::string(token.substr(0, equals));
    if (equals != std::string_view::npos) {
      raw = std::string(token.substr(equals + 1));
    }
  } else {
    flag = std::string(token.substr(0, 2));
    if (token.size() > 2) {
      std::string_view rest = token.substr(2);
      if (rest.front() == '=') {
        rest.remove_prefix(1);
      }
      raw = std::string(rest);
    }
  }

  const OptionSpec* spec = FindByFlag(flag);
  if (spec == nullptr) {
    error = "no such option: " + flag;
    return false;
  }

  switch (spec->kind) {
  case OptionKind::kFlag: {
    bool flag_value = true;
    if (raw.has_value() && !ParseBoolText(*raw, flag_value)) {
      error = "option " + flag + ": invalid boolean value: '" + *raw + "'";
      return false;
    }
    value = flag_value;
    break;
  }
  case OptionKind::kCount:
  case OptionKind::kInt: {
    if (!raw.has_value()) {
      if (spec->kind == OptionKind::kInt) {
        error = "option " + flag + " requires an argument";
        return false;
      }
      value = 1;
      break;
    }
    int number = 0;
    if (!ParseIntText(*raw, number)) {
      error = "option " + flag + ": invalid integer value: '" + *raw + "'";
      return false;
    }
    value = number;
    break;
  }
  case OptionKind::kString:
  case OptionKind::kAppend:
    if (!raw.has_value()) {
      error = "option " + flag + " requires an argument";
      return false;
    }
    if (spec->kind == OptionKind::kAppend) {
      value = OptionList{*raw};
    } else {
      value = *raw;
    }
    break;
  }

  dest = spec->dest;
  return true;
}

bool OptionParser::CoerceValue(const OptionSpec& spec, const OptionValue& raw, OptionValue& value,
                               std::string& error) {
  if (IsUnset(raw)) {
    value = raw;
    return true;
  }

  if (const auto* list = std::get_if<OptionList>(&raw)) {
    if (spec.kind == OptionKind::kAppend) {
      value = raw;
      return true;
    }
    if (list->empty()) {
      value = std::monostate{};
      return true;
    }
    return CoerceValue(spec, OptionValue(list->back()), value, error);
  }

  switch (spec.kind) {
  case OptionKind::kFlag: {
    if (std::holds_alternative<bool>(raw)) {
      value = raw;
      return true;
    }
    if (const auto* number = std::get_if<int>(&raw)) {
      value = *number != 0;
      return true;
    }
    bool parsed = false;
    const std::string& text = std::get<std::string>(raw);
    if (!ParseBoolText(text, parsed)) {
      error = "option '" + spec.dest + "': invalid boolean value: '" + text + "'";
      return false;
    }
    value = parsed;
    return true;
  }
  case OptionKind::kCount:
  case OptionKind::kInt: {
    if (std::holds_alternative<int>(raw)) {
      value = raw;
      return true;
    }
    if (const auto* flag = std::get_if<bool>(&raw)) {
      value = *flag ? 1 : 0;
      return true;
    }
    int parsed = 0;
    const std::string& text = std::get<std::string>(raw);
    if (!ParseIntText(text, parsed)) {
      error = "option '" + spec.dest + "': invalid integer value: '" + text + "'";
      return false;
    }
    value = parsed;
    return true;
  }
  case OptionKind::kString:
    value = FormatValue(raw);
    return true;
  case OptionKind::kAppend:
    value = OptionList{FormatValue(raw)};
    return true;
  }

  error = "option '" + spec.dest + "': unsupported option kind";
  return false;
}

std::string OptionParser::FormatHelp() const {
  std::ostringstream out;
  if (!usage_.empty()) {
    out << "usage: " << usage_ << '\n';
  }

  std::size_t width = 0;
  for (const auto& spec : specs_) {
    width = std::max(width, FormatFlagColumn(spec).size());
  }
  width = std::min(width, kHelpColumnLimit);

  for (const auto& group : groups_) {
    if (group.members.empty()) {
      continue;
    }
    out << '\n' << group.title << ":\n";
    for (const std::size_t index : group.members) {
      const OptionSpec& spec = specs_[index];
      const std::string column = FormatFlagColumn(spec);
      out << "  " << column;
      if (column.size() > width) {
        out << '\n' << std::string(width + 2, ' ');
      } else {
        out << std::string(width - column.size(), ' ');
      }
      out << "  " << spec.help << '\n';
    }
  }
  return out.str();
}

} // namespace krep::options
