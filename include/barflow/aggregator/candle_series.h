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
#include "barflow/market/tick.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace barflow
{

/// Closed candles plus at most one forming candle for one (symbol, timeframe).
/// Not thread-safe; CandleAggregator serializes access per series.
class CandleSeries
{
 public:
  enum class State : uint8_t
  {
    Warming,  // waiting for the historical seed, ticks are buffered
    Live
  };

  enum class ApplyResult : uint8_t
  {
    Opened,      // first candle of the series
    Updated,     // tick landed in the forming candle
    RolledOver,  // forming candle closed, new one opened
    Late,        // tick older than the forming candle, ignored
    Queued,      // buffered until seed()
    Dropped      // warm-up buffer full
  };

  struct Options
  {
    size_t historyCapacity = 512;  // 0 keeps every closed candle
    size_t pendingCapacity = 4096;
    std::chrono::nanoseconds bucketOffset{0};
  };

  CandleSeries(TimeframeId tf, Options options, State initial = State::Live);

  ApplyResult apply(const Tick& tick);

  /// Installs backfilled candles and switches the series to Live. The newest
  /// seeded candle becomes the forming one since providers include the
  /// current bucket. Candles are snapped onto this series' bucket grid, and
  /// those landing in the same bucket are merged. Returns the ticks buffered
  /// while warming, in arrival order; the caller must apply them. No-op on a
  /// live series.
  std::vector<Tick> seed(std::vector<Candle> candles);

  const std::vector<Candle>& history() const noexcept { return _closed; }
  const std::optional<Candle>& openCandle() const noexcept { return _open; }

  TimeframeId timeframe() const noexcept { return _timeframe; }
  State state() const noexcept { return _state; }
  bool isLive() const noexcept { return _state == State::Live; }
  size_t pendingTicks() const noexcept { return _pending.size(); }

 private:
  void openAt(TimePoint bucket, Price price);
  void closeOpen();

  TimeframeId _timeframe;
  Options _options;
  State _state;

  std::vector<Candle> _closed;
  std::optional<Candle> _open;
  std::vector<Tick> _pending;
};

}  // namespace barflow
