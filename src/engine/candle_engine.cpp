/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/engine/candle_engine.h"
#include "barflow/log/log.h"

#include <stdexcept>
#include <utility>

namespace barflow
{

namespace
{

EngineConfig validated(EngineConfig config)
{
  config.validate();
  return config;
}

}  // namespace

CandleEngine::CandleEngine(EngineConfig config, IOrderExecutor& executor,
                           IHistoricalDataProvider* history, const IClock* clock)
    : _config(validated(std::move(config))),
      _clock(clock ? *clock : _systemClock),
      _executor(executor),
      _aggregator(CandleSeries::Options{
          .historyCapacity = _config.historyCapacity,
          .pendingCapacity = _config.pendingCapacity,
          .bucketOffset = _config.bucketOffset,
      }),
      _sink(executor, Quantity::fromDouble(_config.defaultOrderQuantity),
            _config.orderQueueCapacity),
      _dispatcher(_aggregator, _catalog, _clock,
                  StrategyDispatcher::Options{
                      .minHistoryBars = _config.minHistoryBars,
                      .backfillLookback = _config.backfillLookback,
                      .retainHistoryOnRemove = _config.retainHistoryOnRemove,
                  }),
      _ingestor(_aggregator, TickIngestor::Options{
                                 .shards = _config.ingestShards,
                                 .queueCapacity = _config.shardQueueCapacity,
                                 .drainOnStop = _config.drainOnStop,
                             })
{
  if (auto level = parseLogLevel(_config.logLevel))
  {
    setLogLevel(*level);
  }

  _dispatcher.setHistoricalDataProvider(history);
  _dispatcher.setSignalHandler(&_sink);
  _aggregator.setListener(&_dispatcher);
}

CandleEngine::~CandleEngine()
{
  stop();
  _aggregator.setListener(nullptr);
}

TimeframeId CandleEngine::requireTimeframe(std::string_view timeframe)
{
  auto tf = parseTimeframe(timeframe);
  if (!tf)
  {
    throw std::invalid_argument("Unsupported timeframe: " + std::string(timeframe));
  }
  return *tf;
}

bool CandleEngine::registerSeries(SymbolId symbol, TimeframeId tf)
{
  return _aggregator.registerSeries(symbol, tf, CandleAggregator::SeriesStart::Live);
}

bool CandleEngine::unregisterSeries(SymbolId symbol, TimeframeId tf)
{
  // A strategy bound to the series goes with it.
  return _dispatcher.removeSeries(symbol, tf);
}

void CandleEngine::addStrategy(SymbolId symbol, TimeframeId tf, std::string strategyId,
                               StrategyParams params)
{
  _dispatcher.add(symbol, tf, std::move(strategyId), std::move(params));
}

void CandleEngine::addStrategy(SymbolId symbol, std::string_view timeframe,
                               std::string strategyId, StrategyParams params)
{
  addStrategy(symbol, requireTimeframe(timeframe), std::move(strategyId), std::move(params));
}

bool CandleEngine::removeStrategy(SymbolId symbol, TimeframeId tf)
{
  return _dispatcher.remove(symbol, tf);
}

bool CandleEngine::removeStrategy(SymbolId symbol, std::string_view timeframe)
{
  return removeStrategy(symbol, requireTimeframe(timeframe));
}

void CandleEngine::removeAllStrategies()
{
  _dispatcher.removeAll();
}

void CandleEngine::ingest(const Tick& tick)
{
  _aggregator.ingest(tick);
}

bool CandleEngine::submit(const Tick& tick)
{
  return _ingestor.submit(tick);
}

void CandleEngine::connect(IMarketDataSource& source)
{
  source.setTickCallback([this](const Tick& tick) { submit(tick); });

  std::lock_guard lock(_sourcesMutex);
  _sources.push_back(&source);
  if (_started)
  {
    source.start();
  }
}

void CandleEngine::start()
{
  std::lock_guard lock(_sourcesMutex);
  if (_started)
  {
    return;
  }

  _executor.start();
  _sink.start();
  _ingestor.start();
  for (auto* source : _sources)
  {
    source->start();
  }
  _started = true;

  BARFLOW_LOG_INFO("[CandleEngine] Started with " << _config.ingestShards << " ingest shard(s), "
                                                  << _sources.size() << " source(s)");
}

void CandleEngine::stop()
{
  std::lock_guard lock(_sourcesMutex);
  if (!_started)
  {
    return;
  }

  for (auto* source : _sources)
  {
    source->stop();
  }
  _ingestor.stop();
  _sink.stop();
  _executor.stop();
  _started = false;

  const auto agg = _aggregator.stats();
  const auto disp = _dispatcher.stats();
  BARFLOW_LOG_INFO("[CandleEngine] Stopped: ticks=" << agg.ticksIngested
                                                    << " candles=" << agg.candlesClosed
                                                    << " signals=" << disp.signalsEmitted);
}

}  // namespace barflow
