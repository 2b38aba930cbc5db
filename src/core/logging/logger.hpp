#pragma once

#include <atomic>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace krep::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

// Name used by the dispatcher itself. Subcommands log under their display name.
inline constexpr std::string_view kDefaultLoggerName = "krep";

const char* ToString(LogLevel level);

std::string ExpectedLogLevelList();

bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error);

// Maps a `-v` occurrence count to a level:
//   0 => WARN, 1 => INFO, 2 or more => DEBUG
// Negative counts are treated as 0.
LogLevel LevelFromVerbosity(int verbosity);

// Process-wide minimum level shared by every named logger.
void SetGlobalLevel(LogLevel level);
LogLevel GlobalLevel();

// Redirects all logger output. The stream must outlive every later log call;
// ResetLogStream() goes back to std::cerr.
void SetLogStream(std::ostream& out);
void ResetLogStream();

// Emits one `key=value` line per record:
//   ts_utc=... level=INFO logger="batch" msg="..." key="value"
class Logger {
public:
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& Name() const {
    return name_;
  }

  // A logger with its own level ignores the process-wide one.
  void SetLevel(LogLevel level) {
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
  }
  void ClearLevel() {
    level_.store(kFollowGlobal, std::memory_order_relaxed);
  }
  std::optional<LogLevel> OwnLevel() const {
    const int level = level_.load(std::memory_order_relaxed);
    if (level == kFollowGlobal) {
      return std::nullopt;
    }
    return static_cast<LogLevel>(level);
  }

  bool ShouldLog(LogLevel level) const {
    const LogLevel threshold = OwnLevel().value_or(GlobalLevel());
    return static_cast<int>(level) >= static_cast<int>(threshold);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) const;

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kError, message, fields);
  }

private:
  static constexpr int kFollowGlobal = -1;

  std::string name_;
  std::atomic<int> level_{kFollowGlobal};
};

// Returns the process-lifetime logger registered under `name`, creating it on
// first use. References stay valid until process exit.
Logger& GetLogger(std::string_view name = kDefaultLoggerName);

// Same logger, with its own level set from a `-v` style count first
// (see LevelFromVerbosity). A negative count clears the logger's level so it
// follows the process-wide one again.
Logger& GetLogger(std::string_view name, int verbosity);

} // namespace krep::core::logging
