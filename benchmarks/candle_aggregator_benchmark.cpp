/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/aggregator/bucketing.h"
#include "barflow/aggregator/candle_aggregator.h"
#include "barflow/common.h"
#include "barflow/engine/simulated_clock.h"
#include "barflow/engine/tick_ingestor.h"
#include "barflow/strategy/strategy_dispatcher.h"

#include <benchmark/benchmark.h>
#include <random>

using namespace barflow;

namespace
{

const TimeframeId TIMEFRAMES[] = {timeframe::M1, timeframe::M3, timeframe::M5,
                                  timeframe::M15, timeframe::M30, timeframe::H1};

class CountingListener : public ICandleListener
{
 public:
  void onCandleClosed(const CandleClosedEvent& ev) override
  {
    benchmark::DoNotOptimize(ev.closed());
  }
};

class LastCloseStrategy : public ICandleStrategy
{
 public:
  SignalSide evaluate(std::span<const Candle> history, const StrategyParams&) const override
  {
    if (history.size() < 2)
    {
      return SignalSide::Neutral;
    }
    return history.back().close > history[history.size() - 2].close ? SignalSide::Buy
                                                                    : SignalSide::Sell;
  }
};

}  // namespace

// =============================================================================
// Bucketing
// =============================================================================

static void BM_BucketStart(benchmark::State& state)
{
  UnixNanos ns = 1'700'000'000'000'000'000LL;
  for (auto _ : state)
  {
    benchmark::DoNotOptimize(bucketStart(fromUnixNs(ns), timeframe::M15));
    ns += 250'000'000;
  }
}

BENCHMARK(BM_BucketStart);

// =============================================================================
// CandleAggregator
// =============================================================================

static void BM_CandleAggregator_SingleSeries(benchmark::State& state)
{
  constexpr SymbolId SYMBOL = 42;

  CountingListener listener;
  CandleAggregator aggregator({}, &listener);
  aggregator.registerSeries(SYMBOL, timeframe::M1);

  std::mt19937 rng(42);
  std::uniform_real_distribution<> priceDist(100.0, 110.0);

  UnixNanos ns = 0;
  for (auto _ : state)
  {
    aggregator.ingest(Tick{.symbol = SYMBOL,
                           .price = Price::fromDouble(priceDist(rng)),
                           .exchangeTs = fromUnixNs(ns)});
    ns += 100'000'000;
  }
}

BENCHMARK(BM_CandleAggregator_SingleSeries);

static void BM_CandleAggregator_FanOut(benchmark::State& state)
{
  const auto symbols = static_cast<SymbolId>(state.range(0));

  CountingListener listener;
  CandleAggregator aggregator({}, &listener);
  for (SymbolId s = 0; s < symbols; ++s)
  {
    for (auto tf : TIMEFRAMES)
    {
      aggregator.registerSeries(s, tf);
    }
  }

  std::mt19937 rng(42);
  std::uniform_real_distribution<> priceDist(100.0, 110.0);

  UnixNanos ns = 0;
  SymbolId symbol = 0;
  for (auto _ : state)
  {
    aggregator.ingest(Tick{.symbol = symbol,
                           .price = Price::fromDouble(priceDist(rng)),
                           .exchangeTs = fromUnixNs(ns)});
    symbol = (symbol + 1) % symbols;
    ns += 10'000'000;
  }

  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_CandleAggregator_FanOut)->Arg(1)->Arg(10)->Arg(100);

// =============================================================================
// Dispatch
// =============================================================================

static void BM_StrategyDispatch_History(benchmark::State& state)
{
  constexpr SymbolId SYMBOL = 7;

  CandleAggregator aggregator({.historyCapacity = static_cast<size_t>(state.range(0))});
  StrategyCatalog catalog;
  catalog.emplace<LastCloseStrategy>("last_close");
  SimulatedClock clock;
  StrategyDispatcher dispatcher(aggregator, catalog, clock);
  aggregator.setListener(&dispatcher);
  dispatcher.add(SYMBOL, timeframe::M1, "last_close", {});

  std::mt19937 rng(42);
  std::uniform_real_distribution<> priceDist(100.0, 110.0);

  // Every tick rolls the candle over, so each iteration pays one snapshot and evaluation.
  UnixNanos ns = 0;
  for (auto _ : state)
  {
    aggregator.ingest(Tick{.symbol = SYMBOL,
                           .price = Price::fromDouble(priceDist(rng)),
                           .exchangeTs = fromUnixNs(ns)});
    ns += 60'000'000'000LL;
  }

  aggregator.setListener(nullptr);
}

BENCHMARK(BM_StrategyDispatch_History)->Arg(64)->Arg(512)->Arg(4096);

// =============================================================================
// TickIngestor
// =============================================================================

static void BM_TickIngestor_Submit(benchmark::State& state)
{
  constexpr SymbolId SYMBOLS = 64;

  CandleAggregator aggregator;
  for (SymbolId s = 0; s < SYMBOLS; ++s)
  {
    aggregator.registerSeries(s, timeframe::M1);
  }

  TickIngestor ingestor(aggregator, {.shards = static_cast<size_t>(state.range(0)),
                                     .queueCapacity = 8192,
                                     .drainOnStop = true});
  ingestor.start();

  UnixNanos ns = 0;
  SymbolId symbol = 0;
  for (auto _ : state)
  {
    ingestor.submit(
        Tick{.symbol = symbol, .price = Price::fromInt(100), .exchangeTs = fromUnixNs(ns)});
    symbol = (symbol + 1) % SYMBOLS;
    ns += 1'000'000;
  }

  ingestor.stop();
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TickIngestor_Submit)->Arg(1)->Arg(4)->UseRealTime();

BENCHMARK_MAIN();
