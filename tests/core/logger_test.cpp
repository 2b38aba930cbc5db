#include "common/log_capture.hpp"
#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using krep::core::logging::LogLevel;

TEST_CASE("ParseLogLevel accepts level names case-insensitively", "[core][logging]") {
  LogLevel level = LogLevel::kError;
  std::string error;

  REQUIRE(krep::core::logging::ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(krep::core::logging::ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);

  REQUIRE_FALSE(krep::core::logging::ParseLogLevel("loud", level, error));
  REQUIRE(error.find("debug|info|warn|error") != std::string::npos);
}

TEST_CASE("Verbosity count maps to a log level", "[core][logging]") {
  REQUIRE(krep::core::logging::LevelFromVerbosity(-1) == LogLevel::kWarn);
  REQUIRE(krep::core::logging::LevelFromVerbosity(0) == LogLevel::kWarn);
  REQUIRE(krep::core::logging::LevelFromVerbosity(1) == LogLevel::kInfo);
  REQUIRE(krep::core::logging::LevelFromVerbosity(2) == LogLevel::kDebug);
  REQUIRE(krep::core::logging::LevelFromVerbosity(7) == LogLevel::kDebug);
}

TEST_CASE("Logger writes key=value records above the global level", "[core][logging]") {
  krep::tests::common::ScopedLogCapture capture(LogLevel::kInfo);
  const auto& logger = krep::core::logging::GetLogger("logger-test");

  logger.Debug("hidden record");
  logger.Info("visible \"record\"", {{"command", "batch"}});

  const std::string text = capture.text();
  REQUIRE(text.find("hidden record") == std::string::npos);
  REQUIRE(text.find("level=INFO") != std::string::npos);
  REQUIRE(text.find("logger=\"logger-test\"") != std::string::npos);
  REQUIRE(text.find("msg=\"visible \\\"record\\\"\"") != std::string::npos);
  REQUIRE(text.find("command=\"batch\"") != std::string::npos);
  REQUIRE(text.rfind("ts_utc=", 0) == 0);
}

TEST_CASE("GetLogger returns one instance per name", "[core][logging]") {
  auto& first = krep::core::logging::GetLogger("same-name");
  auto& second = krep::core::logging::GetLogger("same-name");
  auto& other = krep::core::logging::GetLogger("other-name");

  REQUIRE(&first == &second);
  REQUIRE(&first != &other);
  REQUIRE(other.Name() == "other-name");
}

TEST_CASE("A named logger can carry its own verbosity", "[core][logging]") {
  krep::tests::common::ScopedLogCapture capture(LogLevel::kWarn);
  const auto& chatty = krep::core::logging::GetLogger("chatty-logger", 2);
  const auto& quiet = krep::core::logging::GetLogger("quiet-logger");

  chatty.Debug("chatty debug");
  quiet.Info("quiet info");
  REQUIRE(chatty.OwnLevel() == LogLevel::kDebug);
  REQUIRE_FALSE(quiet.OwnLevel().has_value());

  auto& reset = krep::core::logging::GetLogger("chatty-logger", -1);
  REQUIRE(&reset == &chatty);
  reset.Info("chatty info after reset");

  const std::string text = capture.text();
  REQUIRE(text.find("chatty debug") != std::string::npos);
  REQUIRE(text.find("quiet info") == std::string::npos);
  REQUIRE(text.find("chatty info after reset") == std::string::npos);
}
