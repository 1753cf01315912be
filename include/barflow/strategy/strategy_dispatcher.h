/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/aggregator/candle_aggregator.h"
#include "barflow/aggregator/events/candle_event.h"
#include "barflow/aggregator/series_key.h"
#include "barflow/engine/abstract_clock.h"
#include "barflow/market/abstract_historical_data_provider.h"
#include "barflow/strategy/abstract_signal_handler.h"
#include "barflow/strategy/strategy_catalog.h"
#include "barflow/strategy/strategy_registration.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace barflow
{

struct DispatcherStats
{
  uint64_t dispatched{0};
  uint64_t signalsEmitted{0};
  uint64_t neutralSignals{0};
  uint64_t noRegistration{0};
  uint64_t insufficientHistory{0};
  uint64_t unknownStrategy{0};
  uint64_t strategyFailures{0};
  uint64_t backfillFailures{0};
};

/// Binds strategies to candle series and evaluates them when a candle closes.
///
/// add/remove/removeAll are serialized among themselves and may run
/// concurrently with tick processing. Dispatch reads the registration table
/// through a shared lock and works on an immutable snapshot of the
/// registration, so it observes either the state before or after a mutation.
class StrategyDispatcher : public ICandleListener
{
 public:
  struct Options
  {
    size_t minHistoryBars = 1;
    std::chrono::nanoseconds backfillLookback = std::chrono::hours(48);
    bool retainHistoryOnRemove = false;
  };

  StrategyDispatcher(CandleAggregator& aggregator, const StrategyCatalog& catalog,
                     const IClock& clock, Options options);

  StrategyDispatcher(CandleAggregator& aggregator, const StrategyCatalog& catalog,
                     const IClock& clock)
      : StrategyDispatcher(aggregator, catalog, clock, Options{})
  {
  }

  void setHistoricalDataProvider(IHistoricalDataProvider* provider) noexcept { _history = provider; }
  void setSignalHandler(ISignalHandler* handler) noexcept { _signalHandler = handler; }

  /// Upserts the registration for (symbol, tf). A new series is backfilled
  /// before it accepts live ticks; ticks arriving meanwhile are buffered and
  /// replayed. Throws std::invalid_argument for an invalid timeframe or an
  /// empty strategy id. The strategy id itself is resolved at dispatch time.
  void add(SymbolId symbol, TimeframeId tf, std::string strategyId, StrategyParams params);

  /// Returns false when nothing was registered for the key.
  bool remove(SymbolId symbol, TimeframeId tf);

  /// Drops the registration, if any, and the series itself regardless of
  /// retainHistoryOnRemove. Returns false when neither existed.
  bool removeSeries(SymbolId symbol, TimeframeId tf);
  void removeAll();

  void onCandleClosed(const CandleClosedEvent& ev) override;

  std::shared_ptr<const StrategyRegistration> registration(SymbolId symbol, TimeframeId tf) const;
  size_t registrationCount() const;

  DispatcherStats stats() const noexcept;

 private:
  std::vector<Candle> fetchBackfill(SymbolId symbol, TimeframeId tf);
  void forward(const StrategyRegistration& reg, SignalSide side, const CandleClosedEvent& ev);

  CandleAggregator& _aggregator;
  const StrategyCatalog& _catalog;
  const IClock& _clock;
  Options _options;

  IHistoricalDataProvider* _history{nullptr};
  ISignalHandler* _signalHandler{nullptr};

  std::mutex _controlMutex;
  mutable std::shared_mutex _tableMutex;
  std::unordered_map<SeriesKey, std::shared_ptr<const StrategyRegistration>> _registrations;

  std::atomic<uint64_t> _dispatched{0};
  std::atomic<uint64_t> _signalsEmitted{0};
  std::atomic<uint64_t> _neutralSignals{0};
  std::atomic<uint64_t> _noRegistration{0};
  std::atomic<uint64_t> _insufficientHistory{0};
  std::atomic<uint64_t> _unknownStrategy{0};
  std::atomic<uint64_t> _strategyFailures{0};
  std::atomic<uint64_t> _backfillFailures{0};
};

}  // namespace barflow
