#pragma once

#include <sstream>

#include "barflow/log/abstract_logger.h"

namespace barflow
{

class LogStream
{
 public:
  explicit LogStream(LogLevel level = LogLevel::Info);
  ~LogStream();

  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;

  template <typename T>
  LogStream& operator<<(const T& val)
  {
    _stream << val;
    return *this;
  }

 private:
  LogLevel _level;
  std::ostringstream _stream;
};

// Process-wide sink used by LogStream and the BARFLOW_LOG_* macros.
// Passing nullptr restores the console logger. The caller keeps ownership.
void setLogger(ILogger* logger) noexcept;
ILogger& logger() noexcept;

void setLogLevel(LogLevel level) noexcept;
LogLevel logLevel() noexcept;

}  // namespace barflow
