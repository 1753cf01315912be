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
#include "barflow/engine/abstract_clock.h"
#include "barflow/engine/abstract_subsystem.h"
#include "barflow/engine/engine_config.h"
#include "barflow/engine/symbol_registry.h"
#include "barflow/engine/tick_ingestor.h"
#include "barflow/execution/abstract_executor.h"
#include "barflow/execution/order_signal_sink.h"
#include "barflow/market/abstract_historical_data_provider.h"
#include "barflow/market/abstract_market_data_source.h"
#include "barflow/strategy/strategy_catalog.h"
#include "barflow/strategy/strategy_dispatcher.h"

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace barflow
{

/// Wires aggregation, strategy dispatch, order placement and the ingest
/// pool together. Collaborators passed by pointer or reference must outlive
/// the engine; a null clock selects the system clock.
class CandleEngine : public ISubsystem
{
 public:
  /// Throws std::invalid_argument when the config does not validate.
  CandleEngine(EngineConfig config, IOrderExecutor& executor,
               IHistoricalDataProvider* history = nullptr, const IClock* clock = nullptr);
  ~CandleEngine() override;

  CandleEngine(const CandleEngine&) = delete;
  CandleEngine& operator=(const CandleEngine&) = delete;

  StrategyCatalog& strategies() noexcept { return _catalog; }
  SymbolRegistry& symbols() noexcept { return _symbols; }

  /// Plain aggregation without a strategy; the series goes live immediately.
  bool registerSeries(SymbolId symbol, TimeframeId tf);
  bool unregisterSeries(SymbolId symbol, TimeframeId tf);

  void addStrategy(SymbolId symbol, TimeframeId tf, std::string strategyId,
                   StrategyParams params = {});

  /// Accepts timeframe names such as "5m" or "1h".
  /// Throws std::invalid_argument("Unsupported timeframe: ...") otherwise.
  void addStrategy(SymbolId symbol, std::string_view timeframe, std::string strategyId,
                   StrategyParams params = {});

  bool removeStrategy(SymbolId symbol, TimeframeId tf);
  bool removeStrategy(SymbolId symbol, std::string_view timeframe);
  void removeAllStrategies();

  /// Processes the tick on the calling thread.
  void ingest(const Tick& tick);

  /// Hands the tick to the ingest pool. Blocks while its shard is full.
  bool submit(const Tick& tick);

  /// Routes the source's ticks to submit(). The source is started and
  /// stopped together with the engine.
  void connect(IMarketDataSource& source);

  void start() override;
  void stop() override;

  const EngineConfig& config() const noexcept { return _config; }
  CandleAggregator& aggregator() noexcept { return _aggregator; }
  StrategyDispatcher& dispatcher() noexcept { return _dispatcher; }
  OrderSignalSink& signalSink() noexcept { return _sink; }
  TickIngestor& ingestor() noexcept { return _ingestor; }

 private:
  static TimeframeId requireTimeframe(std::string_view timeframe);

  EngineConfig _config;
  SystemClock _systemClock;
  const IClock& _clock;

  IOrderExecutor& _executor;

  StrategyCatalog _catalog;
  SymbolRegistry _symbols;
  CandleAggregator _aggregator;
  OrderSignalSink _sink;
  StrategyDispatcher _dispatcher;
  TickIngestor _ingestor;

  std::mutex _sourcesMutex;
  std::vector<IMarketDataSource*> _sources;
  bool _started{false};
};

}  // namespace barflow
