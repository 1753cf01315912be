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

#include <memory>
#include <span>
#include <vector>

namespace barflow
{

/// Published when a tick opens a new candle in a series.
/// history holds the closed candles only, never the one still forming; its
/// last element is the candle that was just closed (if any).
struct CandleClosedEvent
{
  SymbolId symbol{};
  TimeframeId timeframe{};
  std::shared_ptr<const std::vector<Candle>> history;

  std::span<const Candle> candles() const noexcept
  {
    return history ? std::span<const Candle>(*history) : std::span<const Candle>{};
  }

  const Candle* closed() const noexcept
  {
    return history && !history->empty() ? &history->back() : nullptr;
  }
};

class ICandleListener
{
 public:
  virtual ~ICandleListener() = default;

  virtual void onCandleClosed(const CandleClosedEvent& ev) = 0;
};

}  // namespace barflow
