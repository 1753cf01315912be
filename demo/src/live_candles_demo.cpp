/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

// Live candles demo
//
// Feeds a simulated tick stream for one NSE instrument into the engine, runs a
// SuperTrend breakout strategy on 1m candles and routes its signals to a
// logging executor. Mid-run every strategy is stopped, the strategy is added
// again (fresh backfill) and finally removed, while ticks keep flowing.
// One simulated second passes per millisecond of wall time.

#include "barflow/aggregator/bucketing.h"
#include "barflow/engine/candle_engine.h"
#include "barflow/engine/simulated_clock.h"
#include "barflow/log/log.h"
#include "demo/supertrend_strategy.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <mutex>
#include <random>
#include <set>
#include <thread>

using namespace barflow;

namespace
{

// 2025-01-06 09:15 IST
constexpr UnixNanos SESSION_OPEN_NS = 1'736'135'100'000'000'000LL;
constexpr UnixNanos SECOND_NS = 1'000'000'000LL;

class SimulatedFeed : public IMarketDataSource
{
 public:
  explicit SimulatedFeed(SimulatedClock& clock) : _clock(clock) {}

  bool subscribe(SymbolId symbol) override
  {
    std::lock_guard lock(_mutex);
    return _symbols.insert(symbol).second;
  }

  void unsubscribe(SymbolId symbol) override
  {
    std::lock_guard lock(_mutex);
    _symbols.erase(symbol);
  }

  void start() override
  {
    _thread = std::jthread([this](std::stop_token st) { run(st); });
  }

  void stop() override
  {
    _thread.request_stop();
    if (_thread.joinable())
    {
      _thread.join();
    }
  }

 private:
  void run(std::stop_token st)
  {
    std::mt19937 rng(7);
    std::normal_distribution<> step(0.0, 0.35);
    double price = 2850.0;

    while (!st.stop_requested())
    {
      const UnixNanos now = _clock.nowNs() + SECOND_NS;
      _clock.advanceTo(now);
      price = std::max(1.0, price + step(rng));

      {
        std::lock_guard lock(_mutex);
        for (SymbolId symbol : _symbols)
        {
          emitTick(Tick{.symbol = symbol,
                        .price = Price::fromDouble(price).roundToTick(),
                        .exchangeTs = fromUnixNs(now)});
        }
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  SimulatedClock& _clock;
  std::mutex _mutex;
  std::set<SymbolId> _symbols;
  std::jthread _thread;
};

// Random-walk candles, one per bucket, up to and including the bucket of `to`.
class InMemoryHistory : public IHistoricalDataProvider
{
 public:
  std::vector<Candle> fetch(SymbolId symbol, TimeframeId tf, TimePoint from, TimePoint to) override
  {
    std::mt19937 rng(symbol);
    std::normal_distribution<> step(0.0, 1.5);
    double price = 2850.0;

    std::vector<Candle> out;
    for (TimePoint t = bucketStart(from, tf); t <= to; t += tf.interval())
    {
      const double open = price;
      const double close = std::max(1.0, open + step(rng));
      Candle c(t, bucketEnd(t, tf), Price::fromDouble(open));
      c.close = Price::fromDouble(close);
      c.high = Price::fromDouble(std::max(open, close) + std::abs(step(rng)) / 2);
      c.low = Price::fromDouble(std::min(open, close) - std::abs(step(rng)) / 2);
      c.origin = CandleOrigin::Warmup;
      out.push_back(c);
      price = close;
    }
    return out;
  }
};

class LoggingExecutor : public IOrderExecutor
{
 public:
  OrderAck placeOrder(const OrderRequest& req) override
  {
    const OrderId id = ++_nextId;
    BARFLOW_LOG_INFO("[Executor] #" << id << " " << (req.side == Side::BUY ? "BUY" : "SELL") << " "
                                    << req.quantity << " @ ~" << req.price << " symbol="
                                    << req.symbol << " tag=" << req.tag);
    return OrderAck::accept(id);
  }

 private:
  std::atomic<OrderId> _nextId{0};
};

void waitSimulated(const SimulatedClock& clock, std::chrono::seconds span)
{
  const UnixNanos target = clock.nowNs() + span.count() * SECOND_NS;
  while (clock.nowNs() < target)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

}  // namespace

int main()
{
  std::cout << "=== Live Candles Demo ===" << std::endl;

  SimulatedClock clock(SESSION_OPEN_NS);
  SimulatedFeed feed(clock);
  InMemoryHistory history;
  LoggingExecutor executor;

  EngineConfig config;
  config.ingestShards = 2;
  config.bucketOffset = std::chrono::minutes(15);
  config.defaultOrderQuantity = 1.0;
  config.logLevel = "info";

  CandleEngine engine(config, executor, &history, &clock);
  engine.strategies().emplace<demo::SuperTrendStrategy>("SuperTrend");

  const SymbolId instrument = engine.symbols().registerSymbol("NSE", "3045");
  feed.subscribe(instrument);
  engine.connect(feed);
  engine.start();

  const StrategyParams params{{"atr_length", 14}, {"atr_multiplier", 3}, {"length", 10}};

  engine.addStrategy(instrument, "1m", "SuperTrend", params);
  engine.registerSeries(instrument, timeframe::H1);
  waitSimulated(clock, std::chrono::minutes(60));

  engine.removeAllStrategies();
  waitSimulated(clock, std::chrono::minutes(2));

  engine.addStrategy(instrument, "1m", "SuperTrend", params);
  waitSimulated(clock, std::chrono::minutes(10));

  engine.removeStrategy(instrument, "1m");
  waitSimulated(clock, std::chrono::minutes(1));

  engine.stop();

  const auto agg = engine.aggregator().stats();
  const auto disp = engine.dispatcher().stats();
  const auto sink = engine.signalSink().stats();

  std::cout << "\n=== Summary for " << engine.symbols().describe(instrument) << " ===" << std::endl;
  std::cout << "Ticks ingested:   " << agg.ticksIngested << std::endl;
  std::cout << "Candles closed:   " << agg.candlesClosed << std::endl;
  std::cout << "Late ticks:       " << agg.lateTicks << std::endl;
  std::cout << "Evaluations:      " << disp.dispatched << std::endl;
  std::cout << "Signals:          " << disp.signalsEmitted << std::endl;
  std::cout << "Orders placed:    " << sink.ordersPlaced << std::endl;
  std::cout << "Hourly candles:   "
            << engine.aggregator().history(instrument, timeframe::H1).size() << std::endl;

  return 0;
}
