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
#include "barflow/aggregator/timeframe.h"
#include "barflow/common.h"

#include <vector>

namespace barflow
{

/// Source of backfill candles for a series, called once per registration.
/// Implementations signal failure by throwing; the caller falls back to an
/// empty history.
class IHistoricalDataProvider
{
 public:
  virtual ~IHistoricalDataProvider() = default;

  /// Candles with startTime in [from, to], oldest first.
  virtual std::vector<Candle> fetch(SymbolId symbol, TimeframeId tf, TimePoint from,
                                    TimePoint to) = 0;
};

}  // namespace barflow
