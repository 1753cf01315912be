#include "barflow/log/log_stream.h"
#include "barflow/log/console_logger.h"

#include <atomic>

namespace barflow
{

namespace
{

ConsoleLogger& getConsoleLogger()
{
  static ConsoleLogger logger(LogLevel::Debug);
  return logger;
}

std::atomic<ILogger*> g_logger{nullptr};
std::atomic<LogLevel> g_level{LogLevel::Info};

}  // namespace

void setLogger(ILogger* logger) noexcept { g_logger.store(logger, std::memory_order_release); }

ILogger& logger() noexcept
{
  ILogger* current = g_logger.load(std::memory_order_acquire);
  return current ? *current : getConsoleLogger();
}

void setLogLevel(LogLevel level) noexcept { g_level.store(level, std::memory_order_relaxed); }

LogLevel logLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

LogStream::LogStream(LogLevel level) : _level(level) {}

LogStream::~LogStream()
{
  logger().log(_level, _stream.str());
}

}  // namespace barflow
