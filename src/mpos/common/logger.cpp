#include "mpos/common/logger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace mpos {

namespace {

constexpr std::string_view kPattern = "[mpos][%H:%M:%S][%l] %v";

auto ToSpdlogLevel(LogLevel level) -> spdlog::level::level_enum {
  switch (level) {
    case LogLevel::kOff:
      return spdlog::level::off;
    case LogLevel::kError:
      return spdlog::level::err;
    case LogLevel::kWarn:
      return spdlog::level::warn;
    case LogLevel::kInfo:
      return spdlog::level::info;
    case LogLevel::kDebug:
      return spdlog::level::debug;
    case LogLevel::kTrace:
      return spdlog::level::trace;
  }
  return spdlog::level::info;
}

auto MakeLogger(spdlog::sink_ptr sink) -> std::shared_ptr<spdlog::logger> {
  auto logger = std::make_shared<spdlog::logger>("mpos", std::move(sink));
  logger->set_pattern(std::string(kPattern));
  // Filtering happens in Logger::Enabled; spdlog passes everything through.
  logger->set_level(spdlog::level::trace);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

}  // namespace

auto ParseLogLevel(std::string_view name) -> std::optional<LogLevel> {
  if (name == "off") return LogLevel::kOff;
  if (name == "error") return LogLevel::kError;
  if (name == "warn" || name == "warning") return LogLevel::kWarn;
  if (name == "info") return LogLevel::kInfo;
  if (name == "debug") return LogLevel::kDebug;
  if (name == "trace") return LogLevel::kTrace;
  return std::nullopt;
}

auto LogLevelName(LogLevel level) -> const char* {
  switch (level) {
    case LogLevel::kOff:
      return "off";
    case LogLevel::kError:
      return "error";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kTrace:
      return "trace";
  }
  return "info";
}

Logger::Logger(LogLevel level)
    : Logger(level, std::make_shared<spdlog::sinks::stderr_sink_mt>()) {
}

Logger::Logger(LogLevel level, spdlog::sink_ptr sink)
    : level_(level), logger_(MakeLogger(std::move(sink))) {
}

void Logger::Write(
    LogLevel level, std::string_view tag, const std::string& message) {
  logger_->log(ToSpdlogLevel(level), "[{}] {}", tag, message);
}

void Logger::Flush() {
  logger_->flush();
}

}  // namespace mpos
