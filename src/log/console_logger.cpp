#include "barflow/log/console_logger.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace barflow
{

std::string_view toString(LogLevel level) noexcept
{
  switch (level)
  {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept
{
  if (name == "debug")
  {
    return LogLevel::Debug;
  }
  if (name == "info")
  {
    return LogLevel::Info;
  }
  if (name == "warn" || name == "warning")
  {
    return LogLevel::Warn;
  }
  if (name == "error")
  {
    return LogLevel::Error;
  }
  return std::nullopt;
}

ConsoleLogger::ConsoleLogger(LogLevel minLevel) : _minLevel(minLevel) {}

void ConsoleLogger::log(LogLevel level, std::string_view msg)
{
  if (level < minLevel())
  {
    return;
  }

  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
  localtime_r(&t, &tm);

  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

  std::FILE* out = level >= LogLevel::Warn ? stderr : stdout;
  const auto levelName = toString(level);

  std::lock_guard<std::mutex> lock(_writeMutex);
  std::fprintf(out, "%s.%03d [%.*s] %.*s\n", ts, static_cast<int>(ms),
               static_cast<int>(levelName.size()), levelName.data(), static_cast<int>(msg.size()),
               msg.data());
  std::fflush(out);
}

}  // namespace barflow
