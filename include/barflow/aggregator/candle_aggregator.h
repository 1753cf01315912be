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
#include "barflow/aggregator/candle_series.h"
#include "barflow/aggregator/events/candle_event.h"
#include "barflow/aggregator/timeframe.h"
#include "barflow/common.h"
#include "barflow/market/tick.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace barflow
{

struct AggregatorStats
{
  uint64_t ticksIngested{0};
  uint64_t unroutedTicks{0};
  uint64_t lateTicks{0};
  uint64_t warmupQueuedTicks{0};
  uint64_t warmupDroppedTicks{0};
  uint64_t candlesClosed{0};
};

/// Owns every candle series and routes ticks to them.
///
/// Each series is its own unit of mutual exclusion: ticks for different
/// (symbol, timeframe) keys never wait on each other, while a rollover and a
/// concurrent removal of the same key are serialized. The listener runs under
/// the lock of the series that produced the event, so events of one key are
/// delivered in order. The listener must not call back into the aggregator
/// for the same key.
class CandleAggregator
{
 public:
  enum class SeriesStart : uint8_t
  {
    AwaitSeed,  // buffer ticks until seed() is called
    Live
  };

  explicit CandleAggregator(CandleSeries::Options options = {}, ICandleListener* listener = nullptr);

  CandleAggregator(const CandleAggregator&) = delete;
  CandleAggregator& operator=(const CandleAggregator&) = delete;

  void setListener(ICandleListener* listener) noexcept
  {
    _listener.store(listener, std::memory_order_release);
  }

  /// Idempotent. Returns true when a new series was created.
  /// Throws std::invalid_argument for an invalid timeframe.
  bool registerSeries(SymbolId symbol, TimeframeId tf, SeriesStart start = SeriesStart::Live);

  /// Seeds a warming series and replays the ticks it buffered. Candle
  /// events caused by the replay reach the listener like live ones.
  /// Returns the number of replayed ticks.
  size_t seed(SymbolId symbol, TimeframeId tf, std::vector<Candle> candles);

  bool unregisterSeries(SymbolId symbol, TimeframeId tf);
  void clear();

  void ingest(const Tick& tick);

  bool hasSeries(SymbolId symbol, TimeframeId tf) const;
  size_t seriesCount() const;
  std::vector<TimeframeId> timeframes(SymbolId symbol) const;

  std::vector<Candle> history(SymbolId symbol, TimeframeId tf) const;
  std::optional<Candle> openCandle(SymbolId symbol, TimeframeId tf) const;

  AggregatorStats stats() const noexcept;

 private:
  struct SeriesSlot
  {
    SeriesSlot(SymbolId sym, TimeframeId tf, CandleSeries::Options options,
               CandleSeries::State state)
        : symbol(sym), series(tf, options, state)
    {
    }

    const SymbolId symbol;
    mutable std::mutex mutex;
    CandleSeries series;
    bool removed{false};
  };

  using SlotPtr = std::shared_ptr<SeriesSlot>;
  using SlotList = std::vector<SlotPtr>;

  std::shared_ptr<const SlotList> slotsFor(SymbolId symbol) const;
  SlotPtr findSlot(SymbolId symbol, TimeframeId tf) const;

  // Caller holds slot.mutex.
  void applyLocked(SeriesSlot& slot, const Tick& tick);
  void publish(SeriesSlot& slot);

  CandleSeries::Options _options;
  std::atomic<ICandleListener*> _listener;

  mutable std::shared_mutex _tableMutex;
  // Copy-on-write per symbol so ingest only holds the table lock for a lookup.
  std::unordered_map<SymbolId, std::shared_ptr<const SlotList>> _table;

  std::atomic<uint64_t> _ticksIngested{0};
  std::atomic<uint64_t> _unroutedTicks{0};
  std::atomic<uint64_t> _lateTicks{0};
  std::atomic<uint64_t> _warmupQueuedTicks{0};
  std::atomic<uint64_t> _warmupDroppedTicks{0};
  std::atomic<uint64_t> _candlesClosed{0};
};

}  // namespace barflow
