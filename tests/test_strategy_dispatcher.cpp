/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/aggregator/candle_aggregator.h"
#include "barflow/engine/simulated_clock.h"
#include "barflow/strategy/strategy_dispatcher.h"

#include <gtest/gtest.h>

#include <cmath>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace barflow;
using namespace std::chrono_literals;

namespace
{

constexpr SymbolId SYMBOL = 3045;
constexpr SymbolId OTHER = 1594;

TimePoint ts(int64_t seconds) { return TimePoint(std::chrono::seconds(seconds)); }

Tick makeTick(SymbolId symbol, double price, int64_t sec)
{
  return Tick{.symbol = symbol, .price = Price::fromDouble(price), .exchangeTs = ts(sec)};
}

Candle makeCandle(int64_t startSec, double close)
{
  Candle c(ts(startSec), ts(startSec + 60), Price::fromDouble(close));
  return c;
}

class FixedStrategy : public ICandleStrategy
{
 public:
  explicit FixedStrategy(SignalSide side) : _side(side) {}

  SignalSide evaluate(std::span<const Candle> history, const StrategyParams&) const override
  {
    std::lock_guard lock(_mutex);
    _seen.emplace_back(history.begin(), history.end());
    return _side;
  }

  std::vector<std::vector<Candle>> seen() const
  {
    std::lock_guard lock(_mutex);
    return _seen;
  }

 private:
  SignalSide _side;
  mutable std::mutex _mutex;
  mutable std::vector<std::vector<Candle>> _seen;
};

class ThrowingStrategy : public ICandleStrategy
{
 public:
  SignalSide evaluate(std::span<const Candle>, const StrategyParams& params) const override
  {
    params.require("length");
    return SignalSide::Buy;
  }
};

class RecordingHandler : public ISignalHandler
{
 public:
  void onSignal(const Signal& signal) override
  {
    std::lock_guard lock(_mutex);
    signals.push_back(signal);
  }

  std::vector<Signal> signals;

 private:
  std::mutex _mutex;
};

class FakeHistoryProvider : public IHistoricalDataProvider
{
 public:
  std::vector<Candle> fetch(SymbolId symbol, TimeframeId tf, TimePoint from, TimePoint to) override
  {
    ++calls;
    lastSymbol = symbol;
    lastTimeframe = tf;
    lastFrom = from;
    lastTo = to;
    if (onFetch)
    {
      onFetch();
    }
    if (fail)
    {
      throw std::runtime_error("history service unavailable");
    }
    return candles;
  }

  std::vector<Candle> candles;
  bool fail{false};
  std::function<void()> onFetch;

  int calls{0};
  SymbolId lastSymbol{};
  TimeframeId lastTimeframe{};
  TimePoint lastFrom{};
  TimePoint lastTo{};
};

class StrategyDispatcherTest : public ::testing::Test
{
 protected:
  void SetUp() override
  {
    buy = std::make_shared<FixedStrategy>(SignalSide::Buy);
    sell = std::make_shared<FixedStrategy>(SignalSide::Sell);
    neutral = std::make_shared<FixedStrategy>(SignalSide::Neutral);
    catalog.add("buy", buy);
    catalog.add("sell", sell);
    catalog.add("neutral", neutral);
    catalog.add("throwing", std::make_shared<ThrowingStrategy>());
    makeDispatcher({});
  }

  void makeDispatcher(StrategyDispatcher::Options options)
  {
    aggregator.setListener(nullptr);
    dispatcher = std::make_unique<StrategyDispatcher>(aggregator, catalog, clock, options);
    dispatcher->setHistoricalDataProvider(&provider);
    dispatcher->setSignalHandler(&handler);
    aggregator.setListener(dispatcher.get());
  }

  void TearDown() override { aggregator.setListener(nullptr); }

  CandleAggregator aggregator;
  StrategyCatalog catalog;
  SimulatedClock clock{toUnixNs(ts(1'000'000))};
  FakeHistoryProvider provider;
  RecordingHandler handler;
  std::unique_ptr<StrategyDispatcher> dispatcher;

  std::shared_ptr<FixedStrategy> buy;
  std::shared_ptr<FixedStrategy> sell;
  std::shared_ptr<FixedStrategy> neutral;
};

}  // namespace

// ============================================================================
// Registration
// ============================================================================

TEST_F(StrategyDispatcherTest, AddBackfillsOverLookbackWindow)
{
  provider.candles = {makeCandle(0, 10), makeCandle(60, 11), makeCandle(120, 12)};

  dispatcher->add(SYMBOL, timeframe::M1, "buy", {{"length", 10}});

  EXPECT_EQ(provider.calls, 1);
  EXPECT_EQ(provider.lastSymbol, SYMBOL);
  EXPECT_EQ(provider.lastTimeframe, timeframe::M1);
  EXPECT_EQ(provider.lastTo, ts(1'000'000));
  EXPECT_EQ(provider.lastFrom, ts(1'000'000) - 48h);

  EXPECT_TRUE(aggregator.hasSeries(SYMBOL, timeframe::M1));
  EXPECT_EQ(aggregator.history(SYMBOL, timeframe::M1).size(), 2u);
  EXPECT_EQ(aggregator.openCandle(SYMBOL, timeframe::M1)->startTime, ts(120));

  auto reg = dispatcher->registration(SYMBOL, timeframe::M1);
  ASSERT_TRUE(reg);
  EXPECT_EQ(reg->strategyId, "buy");
  EXPECT_EQ(reg->params.get("length"), 10.0);
}

TEST_F(StrategyDispatcherTest, AddRejectsInvalidArguments)
{
  EXPECT_THROW(dispatcher->add(SYMBOL, TimeframeId{}, "buy", {}), std::invalid_argument);
  EXPECT_THROW(dispatcher->add(SYMBOL, timeframe::M1, "", {}), std::invalid_argument);
  EXPECT_EQ(dispatcher->registrationCount(), 0u);
  EXPECT_EQ(aggregator.seriesCount(), 0u);
}

TEST_F(StrategyDispatcherTest, AddExistingKeyReplacesStrategyWithoutRefetch)
{
  dispatcher->add(SYMBOL, timeframe::M1, "buy", {});
  aggregator.ingest(makeTick(SYMBOL, 100.0, 0));

  dispatcher->add(SYMBOL, timeframe::M1, "sell", {});
  aggregator.ingest(makeTick(SYMBOL, 101.0, 60));

  EXPECT_EQ(provider.calls, 1);
  EXPECT_EQ(dispatcher->registrationCount(), 1u);
  ASSERT_EQ(handler.signals.size(), 1u);
  EXPECT_EQ(handler.signals[0].side, SignalSide::Sell);
  EXPECT_TRUE(buy->seen().empty());
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(StrategyDispatcherTest, EmitsSignalWhenCandleCloses)
{
  dispatcher->add(SYMBOL, timeframe::M1, "buy", {{"quantity", 5}});

  aggregator.ingest(makeTick(SYMBOL, 100.0, 0));
  aggregator.ingest(makeTick(SYMBOL, 104.5, 30));
  EXPECT_TRUE(handler.signals.empty());

  aggregator.ingest(makeTick(SYMBOL, 103.0, 60));

  ASSERT_EQ(handler.signals.size(), 1u);
  const auto& signal = handler.signals[0];
  EXPECT_EQ(signal.symbol, SYMBOL);
  EXPECT_EQ(signal.timeframe, timeframe::M1);
  EXPECT_EQ(signal.side, SignalSide::Buy);
  EXPECT_EQ(signal.price, Price::fromDouble(104.5));
  EXPECT_EQ(signal.candleTime, ts(0));
  EXPECT_EQ(signal.quantity, Quantity::fromDouble(5));
  EXPECT_EQ(signal.strategyId, "buy");

  auto stats = dispatcher->stats();
  EXPECT_EQ(stats.dispatched, 1u);
  EXPECT_EQ(stats.signalsEmitted, 1u);
  EXPECT_EQ(stats.insufficientHistory, 1u);
}

TEST_F(StrategyDispatcherTest, StrategySeesClosedCandlesOnly)
{
  provider.candles = {makeCandle(0, 10), makeCandle(60, 11)};
  dispatcher->add(SYMBOL, timeframe::M1, "sell", {});

  aggregator.ingest(makeTick(SYMBOL, 12.0, 70));
  aggregator.ingest(makeTick(SYMBOL, 13.0, 130));
  aggregator.ingest(makeTick(SYMBOL, 14.0, 190));

  auto seen = sell->seen();
  ASSERT_EQ(seen.size(), 2u);
  ASSERT_EQ(seen[0].size(), 2u);
  EXPECT_EQ(seen[0].back().startTime, ts(60));
  EXPECT_EQ(seen[0].back().close, Price::fromDouble(12.0));
  EXPECT_EQ(seen[0].front().origin, CandleOrigin::Warmup);
  ASSERT_EQ(seen[1].size(), 3u);
  EXPECT_EQ(seen[1].back().startTime, ts(120));

  for (const auto& history : seen)
  {
    for (const auto& candle : history)
    {
      EXPECT_LT(candle.startTime, ts(180));
    }
  }
}

TEST_F(StrategyDispatcherTest, NeutralIsNotForwarded)
{
  dispatcher->add(SYMBOL, timeframe::M1, "neutral", {});

  aggregator.ingest(makeTick(SYMBOL, 100.0, 0));
  aggregator.ingest(makeTick(SYMBOL, 101.0, 60));

  EXPECT_TRUE(handler.signals.empty());
  EXPECT_EQ(dispatcher->stats().neutralSignals, 1u);
  EXPECT_EQ(neutral->seen().size(), 1u);
}

TEST_F(StrategyDispatcherTest, UnknownStrategyFailsPerDispatch)
{
  EXPECT_NO_THROW(dispatcher->add(SYMBOL, timeframe::M1, "does_not_exist", {}));

  aggregator.ingest(makeTick(SYMBOL, 100.0, 0));
  aggregator.ingest(makeTick(SYMBOL, 101.0, 60));
  aggregator.ingest(makeTick(SYMBOL, 102.0, 120));

  EXPECT_TRUE(handler.signals.empty());
  EXPECT_EQ(dispatcher->stats().unknownStrategy, 2u);
  EXPECT_EQ(aggregator.history(SYMBOL, timeframe::M1).size(), 2u);

  // Registering the implementation later makes the same registration work.
  catalog.emplace<FixedStrategy>("does_not_exist", SignalSide::Buy);
  aggregator.ingest(makeTick(SYMBOL, 103.0, 180));
  EXPECT_EQ(handler.signals.size(), 1u);
}

TEST_F(StrategyDispatcherTest, StrategyFailureIsIsolated)
{
  dispatcher->add(SYMBOL, timeframe::M1, "throwing", {});
  dispatcher->add(OTHER, timeframe::M1, "buy", {});

  for (SymbolId symbol : {SYMBOL, OTHER})
  {
    aggregator.ingest(makeTick(symbol, 100.0, 0));
    aggregator.ingest(makeTick(symbol, 101.0, 60));
    aggregator.ingest(makeTick(symbol, 102.0, 120));
  }

  EXPECT_EQ(dispatcher->stats().strategyFailures, 2u);
  ASSERT_EQ(handler.signals.size(), 2u);
  EXPECT_EQ(handler.signals[0].symbol, OTHER);
  EXPECT_EQ(aggregator.history(SYMBOL, timeframe::M1).size(), 2u);
}

TEST_F(StrategyDispatcherTest, InvalidQuantityDropsSignal)
{
  dispatcher->add(SYMBOL, timeframe::M1, "buy", {{"quantity", -3}});
  dispatcher->add(OTHER, timeframe::M1, "sell", {{"quantity", std::nan("")}});

  for (SymbolId symbol : {SYMBOL, OTHER})
  {
    aggregator.ingest(makeTick(symbol, 100.0, 0));
    aggregator.ingest(makeTick(symbol, 101.0, 60));
  }

  EXPECT_TRUE(handler.signals.empty());
  auto stats = dispatcher->stats();
  EXPECT_EQ(stats.strategyFailures, 2u);
  EXPECT_EQ(stats.signalsEmitted, 0u);
  EXPECT_EQ(stats.dispatched, 2u);
}

TEST_F(StrategyDispatcherTest, BackfillFailureContinuesWithEmptyHistory)
{
  provider.fail = true;

  EXPECT_NO_THROW(dispatcher->add(SYMBOL, timeframe::M1, "buy", {}));

  EXPECT_EQ(dispatcher->stats().backfillFailures, 1u);
  EXPECT_TRUE(dispatcher->registration(SYMBOL, timeframe::M1));
  EXPECT_TRUE(aggregator.history(SYMBOL, timeframe::M1).empty());

  aggregator.ingest(makeTick(SYMBOL, 100.0, 0));
  aggregator.ingest(makeTick(SYMBOL, 101.0, 60));
  EXPECT_EQ(handler.signals.size(), 1u);
}

TEST_F(StrategyDispatcherTest, MinHistoryBarsDefersEvaluation)
{
  makeDispatcher({.minHistoryBars = 3});
  dispatcher->add(SYMBOL, timeframe::M1, "buy", {});

  for (int i = 0; i <= 4; ++i)
  {
    aggregator.ingest(makeTick(SYMBOL, 100.0 + i, i * 60));
  }

  // Closed counts at each rollover: 1, 2, 3, 4.
  EXPECT_EQ(buy->seen().size(), 2u);
  EXPECT_EQ(handler.signals.size(), 2u);
  EXPECT_EQ(dispatcher->stats().insufficientHistory, 3u);
}

TEST_F(StrategyDispatcherTest, TicksDuringBackfillAreReplayed)
{
  provider.candles = {makeCandle(0, 10), makeCandle(60, 11)};
  provider.onFetch = [this]
  {
    aggregator.ingest(makeTick(SYMBOL, 50.0, 90));
    aggregator.ingest(makeTick(SYMBOL, 51.0, 125));
  };

  dispatcher->add(SYMBOL, timeframe::M1, "buy", {});

  EXPECT_EQ(aggregator.stats().warmupQueuedTicks, 2u);
  ASSERT_EQ(handler.signals.size(), 1u);
  EXPECT_EQ(handler.signals[0].candleTime, ts(60));
  EXPECT_EQ(handler.signals[0].price, Price::fromDouble(50.0));
  EXPECT_EQ(aggregator.openCandle(SYMBOL, timeframe::M1)->startTime, ts(120));
}

// ============================================================================
// Removal
// ============================================================================

TEST_F(StrategyDispatcherTest, RemoveStopsDispatchAndDropsSeries)
{
  dispatcher->add(SYMBOL, timeframe::M1, "buy", {});
  aggregator.ingest(makeTick(SYMBOL, 100.0, 0));

  EXPECT_TRUE(dispatcher->remove(SYMBOL, timeframe::M1));
  EXPECT_FALSE(dispatcher->remove(SYMBOL, timeframe::M1));

  aggregator.ingest(makeTick(SYMBOL, 101.0, 60));

  EXPECT_TRUE(handler.signals.empty());
  EXPECT_FALSE(aggregator.hasSeries(SYMBOL, timeframe::M1));
  EXPECT_EQ(dispatcher->registrationCount(), 0u);
}

TEST_F(StrategyDispatcherTest, ReAddStartsWithFreshHistory)
{
  provider.candles = {makeCandle(0, 10), makeCandle(60, 11)};
  dispatcher->add(SYMBOL, timeframe::M1, "buy", {});
  for (int i = 2; i < 6; ++i)
  {
    aggregator.ingest(makeTick(SYMBOL, 100.0, i * 60));
  }
  ASSERT_EQ(aggregator.history(SYMBOL, timeframe::M1).size(), 5u);

  dispatcher->remove(SYMBOL, timeframe::M1);
  dispatcher->add(SYMBOL, timeframe::M1, "buy", {});

  EXPECT_EQ(provider.calls, 2);
  EXPECT_EQ(aggregator.history(SYMBOL, timeframe::M1).size(), 1u);
}

TEST_F(StrategyDispatcherTest, RetainHistoryOnRemoveKeepsSeries)
{
  makeDispatcher({.retainHistoryOnRemove = true});
  dispatcher->add(SYMBOL, timeframe::M1, "buy", {});
  aggregator.ingest(makeTick(SYMBOL, 100.0, 0));
  aggregator.ingest(makeTick(SYMBOL, 101.0, 60));
  ASSERT_EQ(handler.signals.size(), 1u);

  dispatcher->remove(SYMBOL, timeframe::M1);
  aggregator.ingest(makeTick(SYMBOL, 102.0, 120));

  EXPECT_EQ(handler.signals.size(), 1u);
  EXPECT_EQ(dispatcher->stats().noRegistration, 1u);
  EXPECT_EQ(aggregator.history(SYMBOL, timeframe::M1).size(), 2u);

  // The retained series is already live, so no new backfill happens.
  dispatcher->add(SYMBOL, timeframe::M1, "sell", {});
  EXPECT_EQ(provider.calls, 1);
  aggregator.ingest(makeTick(SYMBOL, 103.0, 180));
  ASSERT_EQ(handler.signals.size(), 2u);
  EXPECT_EQ(handler.signals[1].side, SignalSide::Sell);
}

TEST_F(StrategyDispatcherTest, RemoveSeriesDropsStrategyAndSeries)
{
  makeDispatcher({.retainHistoryOnRemove = true});
  dispatcher->add(SYMBOL, timeframe::M1, "buy", {});
  aggregator.registerSeries(OTHER, timeframe::M1);

  EXPECT_TRUE(dispatcher->removeSeries(SYMBOL, timeframe::M1));
  EXPECT_FALSE(aggregator.hasSeries(SYMBOL, timeframe::M1));
  EXPECT_EQ(dispatcher->registrationCount(), 0u);

  EXPECT_TRUE(dispatcher->removeSeries(OTHER, timeframe::M1));
  EXPECT_FALSE(aggregator.hasSeries(OTHER, timeframe::M1));
  EXPECT_FALSE(dispatcher->removeSeries(OTHER, timeframe::M1));
}

TEST_F(StrategyDispatcherTest, RegistrationNeverOutlivesItsSeries)
{
  for (int round = 0; round < 200; ++round)
  {
    aggregator.registerSeries(OTHER, timeframe::M1);

    std::thread adder([&] { dispatcher->add(OTHER, timeframe::M1, "buy", {}); });
    std::thread remover([&] { dispatcher->removeSeries(OTHER, timeframe::M1); });
    adder.join();
    remover.join();

    if (dispatcher->registration(OTHER, timeframe::M1))
    {
      ASSERT_TRUE(aggregator.hasSeries(OTHER, timeframe::M1)) << "round " << round;
    }
    dispatcher->removeSeries(OTHER, timeframe::M1);
  }
}

TEST_F(StrategyDispatcherTest, RemoveAllLeavesPlainSeries)
{
  aggregator.registerSeries(OTHER, timeframe::M5);
  dispatcher->add(SYMBOL, timeframe::M1, "buy", {});
  dispatcher->add(SYMBOL, timeframe::M5, "sell", {});

  dispatcher->removeAll();

  EXPECT_EQ(dispatcher->registrationCount(), 0u);
  EXPECT_FALSE(aggregator.hasSeries(SYMBOL, timeframe::M1));
  EXPECT_FALSE(aggregator.hasSeries(SYMBOL, timeframe::M5));
  EXPECT_TRUE(aggregator.hasSeries(OTHER, timeframe::M5));

  aggregator.ingest(makeTick(SYMBOL, 100.0, 0));
  aggregator.ingest(makeTick(SYMBOL, 101.0, 600));
  EXPECT_TRUE(handler.signals.empty());
}

TEST_F(StrategyDispatcherTest, PlainSeriesEventsAreNotDispatched)
{
  aggregator.registerSeries(OTHER, timeframe::M1);

  aggregator.ingest(makeTick(OTHER, 100.0, 0));
  aggregator.ingest(makeTick(OTHER, 101.0, 60));

  EXPECT_EQ(dispatcher->stats().noRegistration, 2u);
  EXPECT_EQ(dispatcher->stats().dispatched, 0u);
}
