#pragma once

#include "barflow/log/log_stream.h"

#define BARFLOW_LOG_AT(level, expr)           \
  do                                          \
  {                                           \
    if ((level) >= ::barflow::logLevel())     \
    {                                         \
      ::barflow::LogStream(level) << expr;    \
    }                                         \
  } while (0)

#define BARFLOW_LOG_DEBUG(expr) BARFLOW_LOG_AT(::barflow::LogLevel::Debug, expr)
#define BARFLOW_LOG_INFO(expr) BARFLOW_LOG_AT(::barflow::LogLevel::Info, expr)
#define BARFLOW_LOG_WARN(expr) BARFLOW_LOG_AT(::barflow::LogLevel::Warn, expr)
#define BARFLOW_LOG_ERROR(expr) BARFLOW_LOG_AT(::barflow::LogLevel::Error, expr)
