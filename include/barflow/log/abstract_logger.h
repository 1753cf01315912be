#pragma once

#include <optional>
#include <string_view>

namespace barflow
{

enum class LogLevel
{
  Debug,
  Info,
  Warn,
  Error
};

struct ILogger
{
  virtual ~ILogger() = default;

  virtual void log(LogLevel level, std::string_view msg) = 0;

  void debug(std::string_view msg) { log(LogLevel::Debug, msg); }
  void info(std::string_view msg) { log(LogLevel::Info, msg); }
  void warn(std::string_view msg) { log(LogLevel::Warn, msg); }
  void error(std::string_view msg) { log(LogLevel::Error, msg); }
};

std::string_view toString(LogLevel level) noexcept;
std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

}  // namespace barflow
