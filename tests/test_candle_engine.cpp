/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/engine/candle_engine.h"
#include "barflow/engine/simulated_clock.h"
#include "barflow/log/log_stream.h"

#include <gtest/gtest.h>

#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>
#include <stdexcept>
#include <vector>

using namespace barflow;
using namespace std::chrono_literals;

namespace
{

TimePoint ts(int64_t seconds) { return TimePoint(std::chrono::seconds(seconds)); }

Tick makeTick(SymbolId symbol, double price, int64_t sec)
{
  return Tick{.symbol = symbol, .price = Price::fromDouble(price), .exchangeTs = ts(sec)};
}

// Buys when the last close is above the previous close, sells when below.
class MomentumStrategy : public ICandleStrategy
{
 public:
  SignalSide evaluate(std::span<const Candle> history, const StrategyParams&) const override
  {
    if (history.size() < 2)
    {
      return SignalSide::Neutral;
    }
    const auto& last = history[history.size() - 1];
    const auto& prev = history[history.size() - 2];
    if (last.close > prev.close)
    {
      return SignalSide::Buy;
    }
    if (last.close < prev.close)
    {
      return SignalSide::Sell;
    }
    return SignalSide::Neutral;
  }
};

class RecordingExecutor : public IOrderExecutor
{
 public:
  void start() override { started = true; }
  void stop() override { stopped = true; }

  OrderAck placeOrder(const OrderRequest& request) override
  {
    std::lock_guard lock(_mutex);
    orders.push_back(request);
    return OrderAck::accept(orders.size());
  }

  std::vector<OrderRequest> snapshot() const
  {
    std::lock_guard lock(_mutex);
    return orders;
  }

  bool started{false};
  bool stopped{false};

 private:
  mutable std::mutex _mutex;
  std::vector<OrderRequest> orders;
};

// Holds every placeOrder() call until release(), like a broker that stalls.
class GatedExecutor : public IOrderExecutor
{
 public:
  OrderAck placeOrder(const OrderRequest&) override
  {
    std::unique_lock lock(_mutex);
    ++_entered;
    _cv.notify_all();
    _cv.wait(lock, [this] { return _released; });
    return OrderAck::accept(_entered);
  }

  bool waitEntered(std::chrono::milliseconds timeout)
  {
    std::unique_lock lock(_mutex);
    return _cv.wait_for(lock, timeout, [this] { return _entered > 0; });
  }

  void release()
  {
    {
      std::lock_guard lock(_mutex);
      _released = true;
    }
    _cv.notify_all();
  }

 private:
  std::mutex _mutex;
  std::condition_variable _cv;
  OrderId _entered{0};
  bool _released{false};
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2000ms)
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred())
  {
    if (std::chrono::steady_clock::now() > deadline)
    {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

class StaticHistory : public IHistoricalDataProvider
{
 public:
  std::vector<Candle> fetch(SymbolId, TimeframeId tf, TimePoint, TimePoint) override
  {
    ++calls;
    std::vector<Candle> out;
    for (int i = 0; i < 5; ++i)
    {
      const TimePoint start = ts(0) + tf.interval() * i;
      out.emplace_back(start, start + tf.interval(), Price::fromInt(100 + i));
    }
    return out;
  }

  int calls{0};
};

class ManualSource : public IMarketDataSource
{
 public:
  void start() override { running = true; }
  void stop() override { running = false; }

  bool subscribe(SymbolId symbol) override
  {
    subscribed.insert(symbol);
    return true;
  }

  void unsubscribe(SymbolId symbol) override { subscribed.erase(symbol); }

  void push(const Tick& tick) { emitTick(tick); }

  bool running{false};
  std::set<SymbolId> subscribed;
};

EngineConfig testConfig()
{
  EngineConfig config;
  config.ingestShards = 2;
  config.shardQueueCapacity = 64;
  config.defaultOrderQuantity = 2.0;
  config.logLevel = "warn";
  return config;
}

class CandleEngineTest : public ::testing::Test
{
 protected:
  void SetUp() override { _savedLevel = logLevel(); }
  void TearDown() override { setLogLevel(_savedLevel); }

  RecordingExecutor executor;
  StaticHistory history;
  SimulatedClock clock{toUnixNs(ts(600))};

 private:
  LogLevel _savedLevel{LogLevel::Info};
};

}  // namespace

// ============================================================================
// Configuration
// ============================================================================

TEST(EngineConfigTest, DefaultsAreValid)
{
  EngineConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.historyCapacity, config::DEFAULT_HISTORY_CAPACITY);
  EXPECT_EQ(config.minHistoryBars, 1u);
  EXPECT_EQ(config.backfillLookback, std::chrono::hours(48));
  EXPECT_FALSE(config.retainHistoryOnRemove);
}

TEST(EngineConfigTest, RejectsNonsense)
{
  auto expectInvalid = [](auto mutate)
  {
    EngineConfig config;
    mutate(config);
    EXPECT_THROW(config.validate(), std::invalid_argument);
  };

  expectInvalid([](EngineConfig& c) { c.ingestShards = 0; });
  expectInvalid([](EngineConfig& c) { c.shardQueueCapacity = 0; });
  expectInvalid([](EngineConfig& c) { c.minHistoryBars = 0; });
  expectInvalid(
      [](EngineConfig& c)
      {
        c.historyCapacity = 2;
        c.minHistoryBars = 3;
      });
  expectInvalid([](EngineConfig& c) { c.backfillLookback = -1s; });
  expectInvalid([](EngineConfig& c) { c.defaultOrderQuantity = 0.0; });
  expectInvalid([](EngineConfig& c) { c.orderQueueCapacity = 0; });
  expectInvalid([](EngineConfig& c) { c.logLevel = "verbose"; });
}

TEST_F(CandleEngineTest, ConstructorValidatesConfig)
{
  EngineConfig config = testConfig();
  config.ingestShards = 0;
  EXPECT_THROW({ CandleEngine engine(config, executor); }, std::invalid_argument);
}

TEST_F(CandleEngineTest, AppliesConfiguredLogLevel)
{
  CandleEngine engine(testConfig(), executor);
  EXPECT_EQ(logLevel(), LogLevel::Warn);
}

// ============================================================================
// Strategy lifecycle
// ============================================================================

TEST_F(CandleEngineTest, StrategySignalBecomesOrder)
{
  CandleEngine engine(testConfig(), executor, &history, &clock);
  engine.strategies().emplace<MomentumStrategy>("momentum");

  engine.addStrategy(7, "1m", "momentum", {{"quantity", 4}});
  engine.start();

  // Backfill closes 100..103, 104 is forming. A rally closes it higher.
  engine.ingest(makeTick(7, 110.0, 250));
  engine.ingest(makeTick(7, 111.0, 300));
  engine.stop();

  auto orders = executor.snapshot();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].symbol, 7u);
  EXPECT_EQ(orders[0].side, Side::BUY);
  EXPECT_EQ(orders[0].quantity, Quantity::fromDouble(4));
  EXPECT_EQ(orders[0].price, Price::fromDouble(110.0));
  EXPECT_EQ(orders[0].tag, "momentum");
  EXPECT_EQ(history.calls, 1);
}

TEST_F(CandleEngineTest, DefaultQuantityApplies)
{
  CandleEngine engine(testConfig(), executor, &history, &clock);
  engine.strategies().emplace<MomentumStrategy>("momentum");
  engine.addStrategy(7, timeframe::M1, "momentum");
  engine.start();

  engine.ingest(makeTick(7, 90.0, 250));
  engine.ingest(makeTick(7, 91.0, 300));
  engine.stop();

  auto orders = executor.snapshot();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].side, Side::SELL);
  EXPECT_EQ(orders[0].quantity, Quantity::fromDouble(2.0));
}

TEST_F(CandleEngineTest, UnsupportedTimeframeThrows)
{
  CandleEngine engine(testConfig(), executor, &history, &clock);

  try
  {
    engine.addStrategy(7, "2w", "momentum");
    FAIL() << "expected std::invalid_argument";
  }
  catch (const std::invalid_argument& ex)
  {
    EXPECT_STREQ(ex.what(), "Unsupported timeframe: 2w");
  }
  EXPECT_THROW(engine.removeStrategy(7, "abc"), std::invalid_argument);
  EXPECT_EQ(engine.dispatcher().registrationCount(), 0u);
}

TEST_F(CandleEngineTest, RemoveStrategiesAndSeries)
{
  CandleEngine engine(testConfig(), executor, &history, &clock);
  engine.strategies().emplace<MomentumStrategy>("momentum");

  engine.addStrategy(1, "1m", "momentum");
  engine.addStrategy(1, "5m", "momentum");
  engine.addStrategy(2, "15m", "momentum");
  engine.registerSeries(3, timeframe::M1);
  EXPECT_EQ(engine.aggregator().seriesCount(), 4u);

  EXPECT_TRUE(engine.removeStrategy(1, "5m"));
  EXPECT_FALSE(engine.removeStrategy(1, "5m"));
  EXPECT_EQ(engine.aggregator().seriesCount(), 3u);

  EXPECT_TRUE(engine.unregisterSeries(2, timeframe::M15));
  EXPECT_EQ(engine.dispatcher().registrationCount(), 1u);

  engine.removeAllStrategies();
  EXPECT_EQ(engine.dispatcher().registrationCount(), 0u);
  EXPECT_EQ(engine.aggregator().seriesCount(), 1u);
  EXPECT_TRUE(engine.aggregator().hasSeries(3, timeframe::M1));

  EXPECT_TRUE(engine.unregisterSeries(3, timeframe::M1));
  EXPECT_FALSE(engine.unregisterSeries(3, timeframe::M1));
}

// ============================================================================
// Threaded ingest
// ============================================================================

TEST_F(CandleEngineTest, SubmitRoutesThroughIngestor)
{
  CandleEngine engine(testConfig(), executor, &history, &clock);
  engine.strategies().emplace<MomentumStrategy>("momentum");
  engine.addStrategy(7, "1m", "momentum");

  EXPECT_FALSE(engine.submit(makeTick(7, 110.0, 250)));

  engine.start();
  EXPECT_TRUE(executor.started);
  EXPECT_TRUE(engine.submit(makeTick(7, 110.0, 250)));
  EXPECT_TRUE(engine.submit(makeTick(7, 111.0, 300)));
  engine.stop();

  EXPECT_TRUE(executor.stopped);
  EXPECT_EQ(engine.ingestor().stats().processed, 2u);
  EXPECT_EQ(executor.snapshot().size(), 1u);
  EXPECT_EQ(engine.signalSink().stats().ordersPlaced, 1u);
}

TEST_F(CandleEngineTest, StalledExecutorDoesNotBlockIngest)
{
  GatedExecutor gated;
  EngineConfig config = testConfig();
  config.ingestShards = 1;
  CandleEngine engine(config, gated, &history, &clock);
  engine.strategies().emplace<MomentumStrategy>("momentum");
  engine.addStrategy(1, "1m", "momentum");
  engine.registerSeries(2, timeframe::M1);
  engine.start();

  // Rollover on instrument 1 emits a buy whose placement stalls.
  ASSERT_TRUE(engine.submit(makeTick(1, 110.0, 250)));
  ASSERT_TRUE(engine.submit(makeTick(1, 111.0, 300)));
  ASSERT_TRUE(gated.waitEntered(2000ms));

  // Same worker, other instrument: must still be aggregated.
  ASSERT_TRUE(engine.submit(makeTick(2, 50.0, 310)));
  EXPECT_TRUE(eventually([&] { return engine.ingestor().stats().processed == 3; }));
  EXPECT_TRUE(engine.aggregator().openCandle(2, timeframe::M1).has_value());

  gated.release();
  engine.stop();
  EXPECT_EQ(engine.signalSink().stats().ordersPlaced, 1u);
}

TEST_F(CandleEngineTest, ConnectedSourceFeedsEngine)
{
  ManualSource source;
  CandleEngine engine(testConfig(), executor, &history, &clock);
  engine.strategies().emplace<MomentumStrategy>("momentum");
  engine.addStrategy(7, "1m", "momentum");

  engine.connect(source);
  EXPECT_FALSE(source.running);

  engine.start();
  EXPECT_TRUE(source.running);

  source.push(makeTick(7, 90.0, 250));
  source.push(makeTick(7, 80.0, 300));
  source.push(makeTick(8, 80.0, 300));
  engine.stop();

  EXPECT_FALSE(source.running);
  auto orders = executor.snapshot();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].side, Side::SELL);
  EXPECT_EQ(engine.aggregator().stats().unroutedTicks, 1u);
}
