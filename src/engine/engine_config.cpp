/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/engine/engine_config.h"
#include "barflow/log/abstract_logger.h"

#include <cmath>
#include <stdexcept>

namespace barflow
{

void EngineConfig::validate() const
{
  if (ingestShards == 0)
  {
    throw std::invalid_argument("EngineConfig: ingestShards must be at least 1");
  }
  if (shardQueueCapacity == 0)
  {
    throw std::invalid_argument("EngineConfig: shardQueueCapacity must be at least 1");
  }
  if (minHistoryBars == 0)
  {
    throw std::invalid_argument("EngineConfig: minHistoryBars must be at least 1");
  }
  if (historyCapacity != 0 && historyCapacity < minHistoryBars)
  {
    throw std::invalid_argument("EngineConfig: historyCapacity is smaller than minHistoryBars");
  }
  if (backfillLookback.count() < 0)
  {
    throw std::invalid_argument("EngineConfig: backfillLookback must not be negative");
  }
  if (!std::isfinite(defaultOrderQuantity) || defaultOrderQuantity <= 0.0)
  {
    throw std::invalid_argument("EngineConfig: defaultOrderQuantity must be positive");
  }
  if (orderQueueCapacity == 0)
  {
    throw std::invalid_argument("EngineConfig: orderQueueCapacity must be at least 1");
  }
  if (!parseLogLevel(logLevel))
  {
    throw std::invalid_argument("EngineConfig: unknown logLevel '" + logLevel + "'");
  }
}

}  // namespace barflow
