#pragma once

#include <atomic>
#include <mutex>
#include <string_view>

#include "barflow/log/abstract_logger.h"

namespace barflow
{

class ConsoleLogger final : public ILogger
{
 public:
  explicit ConsoleLogger(LogLevel minLevel = LogLevel::Info);

  void log(LogLevel level, std::string_view msg) override;

  void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
  LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }

 private:
  std::atomic<LogLevel> _minLevel;
  std::mutex _writeMutex;
};

}  // namespace barflow
