#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace mpos {

enum class LogLevel : uint8_t {
  kOff,
  kError,
  kWarn,
  kInfo,
  kDebug,
  kTrace,
};

auto ParseLogLevel(std::string_view name) -> std::optional<LogLevel>;
auto LogLevelName(LogLevel level) -> const char*;

// Central logger shared by the navigator, the UI thread and the app manager.
// Every line carries a component tag:
//   [mpos][12:00:01][warning] [navigator] no activity handles action 'SEND'
// Output goes to stderr unless a sink is supplied (tests capture with an
// ostream sink). Safe to call from worker threads.
class Logger {
 public:
  explicit Logger(LogLevel level = LogLevel::kInfo);
  Logger(LogLevel level, spdlog::sink_ptr sink);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  [[nodiscard]] auto Enabled(LogLevel required) const -> bool {
    LogLevel current = level_.load(std::memory_order_relaxed);
    return current != LogLevel::kOff && current >= required;
  }

  void SetLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }

  [[nodiscard]] auto level() const -> LogLevel {
    return level_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  void Error(
      std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
    Log(LogLevel::kError, tag, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Warn(
      std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
    Log(LogLevel::kWarn, tag, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Info(
      std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
    Log(LogLevel::kInfo, tag, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Debug(
      std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
    Log(LogLevel::kDebug, tag, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Trace(
      std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
    Log(LogLevel::kTrace, tag, format, std::forward<Args>(args)...);
  }

  void Flush();

 private:
  template <typename... Args>
  void Log(
      LogLevel level, std::string_view tag, fmt::format_string<Args...> format,
      Args&&... args) {
    if (!Enabled(level)) return;
    Write(level, tag, fmt::format(format, std::forward<Args>(args)...));
  }

  void Write(LogLevel level, std::string_view tag, const std::string& message);

  std::atomic<LogLevel> level_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace mpos
