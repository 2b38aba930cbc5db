#include "core/logging/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>

namespace krep::core::logging {

namespace {

std::atomic<int> g_global_level{static_cast<int>(LogLevel::kWarn)};

// Guards the output stream pointer and serializes whole records so lines from
// different loggers never interleave.
std::mutex& StreamMutex() {
  static std::mutex mu;
  return mu;
}

std::ostream*& StreamPointer() {
  static std::ostream* out = &std::cerr;
  return out;
}

std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

std::string EscapeForQuoted(std::string_view raw) {
  std::string escaped;
  escaped.reserve(raw.size());

  for (const char c : raw) {
    switch (c) {
    case '\\':
      escaped += "\\\\";
      break;
    case '"':
      escaped += "\\\"";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      escaped.push_back(c);
      break;
    }
  }

  return escaped;
}

std::string Quote(std::string_view raw) {
  return std::string("\"") + EscapeForQuoted(raw) + "\"";
}

} // namespace

const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid log-level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() + ")";
  return false;
}

LogLevel LevelFromVerbosity(int verbosity) {
  if (verbosity >= 2) {
    return LogLevel::kDebug;
  }
  if (verbosity == 1) {
    return LogLevel::kInfo;
  }
  return LogLevel::kWarn;
}

void SetGlobalLevel(LogLevel level) {
  g_global_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel GlobalLevel() {
  return static_cast<LogLevel>(g_global_level.load(std::memory_order_relaxed));
}

void SetLogStream(std::ostream& out) {
  std::lock_guard<std::mutex> lock(StreamMutex());
  StreamPointer() = &out;
}

void ResetLogStream() {
  std::lock_guard<std::mutex> lock(StreamMutex());
  StreamPointer() = &std::cerr;
}

void Logger::Log(LogLevel level, std::string_view message,
                 std::initializer_list<LogFieldView> fields) const {
  if (!ShouldLog(level)) {
    return;
  }

  std::ostringstream line;
  line << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
       << " level=" << ToString(level) << " logger=" << Quote(name_) << " msg=" << Quote(message);
  for (const auto& field : fields) {
    line << ' ' << field.key << '=' << Quote(field.value);
  }
  line << '\n';

  std::lock_guard<std::mutex> lock(StreamMutex());
  std::ostream& out = *StreamPointer();
  out << line.str();
  out.flush();
}

Logger& GetLogger(std::string_view name) {
  static std::mutex registry_mu;
  static std::map<std::string, std::unique_ptr<Logger>, std::less<>> registry;

  std::lock_guard<std::mutex> lock(registry_mu);
  const auto it = registry.find(name);
  if (it != registry.end()) {
    return *it->second;
  }

  auto inserted = registry.emplace(std::string(name), std::make_unique<Logger>(std::string(name)));
  return *inserted.first->second;
}

Logger& GetLogger(std::string_view name, int verbosity) {
  Logger& logger = GetLogger(name);
  if (verbosity < 0) {
    logger.ClearLevel();
  } else {
    logger.SetLevel(LevelFromVerbosity(verbosity));
  }
  return logger;
}

} // namespace krep::core::logging
