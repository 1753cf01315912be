/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/aggregator/candle.h"
#include "barflow/strategy/signal.h"
#include "barflow/strategy/strategy_params.h"

#include <span>

namespace barflow
{

/// Stateless decision function over closed candles. history is ordered oldest
/// first and never contains the forming candle. Implementations may throw
/// (bad parameters, not enough history); the dispatcher isolates the failure
/// to the one evaluation. evaluate() can run concurrently for different series.
class ICandleStrategy
{
 public:
  virtual ~ICandleStrategy() = default;

  virtual SignalSide evaluate(std::span<const Candle> history,
                              const StrategyParams& params) const = 0;
};

}  // namespace barflow
