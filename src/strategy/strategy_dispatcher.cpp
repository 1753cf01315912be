/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/strategy/strategy_dispatcher.h"
#include "barflow/log/log.h"

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace barflow
{

StrategyDispatcher::StrategyDispatcher(CandleAggregator& aggregator, const StrategyCatalog& catalog,
                                       const IClock& clock, Options options)
    : _aggregator(aggregator), _catalog(catalog), _clock(clock), _options(options)
{
}

void StrategyDispatcher::add(SymbolId symbol, TimeframeId tf, std::string strategyId,
                             StrategyParams params)
{
  if (!tf.isValid())
  {
    throw std::invalid_argument("StrategyDispatcher: invalid timeframe for symbol " +
                                std::to_string(symbol));
  }
  if (strategyId.empty())
  {
    throw std::invalid_argument("StrategyDispatcher: empty strategy id for symbol " +
                                std::to_string(symbol));
  }

  std::lock_guard control(_controlMutex);

  const bool created =
      _aggregator.registerSeries(symbol, tf, CandleAggregator::SeriesStart::AwaitSeed);

  // Fetched outside every lock that tick processing touches.
  std::vector<Candle> backfill;
  if (created)
  {
    backfill = fetchBackfill(symbol, tf);
  }

  auto reg = std::make_shared<const StrategyRegistration>(
      StrategyRegistration{symbol, tf, std::move(strategyId), std::move(params)});

  BARFLOW_LOG_INFO("[StrategyDispatcher] Strategy '" << reg->strategyId << "' added for symbol="
                                                     << symbol << " tf=" << toString(tf) << " {"
                                                     << reg->params.toString() << "}");

  {
    std::unique_lock lock(_tableMutex);
    _registrations.insert_or_assign(SeriesKey{symbol, tf}, std::move(reg));
  }

  if (created)
  {
    _aggregator.seed(symbol, tf, std::move(backfill));
  }
}

bool StrategyDispatcher::remove(SymbolId symbol, TimeframeId tf)
{
  std::lock_guard control(_controlMutex);

  size_t erased = 0;
  {
    std::unique_lock lock(_tableMutex);
    erased = _registrations.erase(SeriesKey{symbol, tf});
  }

  if (erased == 0)
  {
    BARFLOW_LOG_INFO("[StrategyDispatcher] No strategy found for symbol=" << symbol
                                                                          << " tf=" << toString(tf));
    return false;
  }

  // The table lock is released first: dispatch holds the series lock while
  // reading the table, and unregistering takes the series lock.
  if (!_options.retainHistoryOnRemove)
  {
    _aggregator.unregisterSeries(symbol, tf);
  }

  BARFLOW_LOG_INFO("[StrategyDispatcher] Stopped strategy for symbol=" << symbol
                                                                       << " tf=" << toString(tf));
  return true;
}

bool StrategyDispatcher::removeSeries(SymbolId symbol, TimeframeId tf)
{
  std::lock_guard control(_controlMutex);

  size_t erased = 0;
  {
    std::unique_lock lock(_tableMutex);
    erased = _registrations.erase(SeriesKey{symbol, tf});
  }

  const bool hadSeries = _aggregator.unregisterSeries(symbol, tf);
  if (erased > 0)
  {
    BARFLOW_LOG_INFO("[StrategyDispatcher] Stopped strategy and dropped series for symbol="
                     << symbol << " tf=" << toString(tf));
  }
  return erased > 0 || hadSeries;
}

void StrategyDispatcher::removeAll()
{
  std::lock_guard control(_controlMutex);

  decltype(_registrations) removed;
  {
    std::unique_lock lock(_tableMutex);
    removed.swap(_registrations);
  }

  if (!_options.retainHistoryOnRemove)
  {
    for (const auto& [key, reg] : removed)
    {
      _aggregator.unregisterSeries(key.symbol, key.timeframe);
    }
  }

  BARFLOW_LOG_INFO("[StrategyDispatcher] Stopped all strategies (" << removed.size() << ")");
}

void StrategyDispatcher::onCandleClosed(const CandleClosedEvent& ev)
{
  auto reg = registration(ev.symbol, ev.timeframe);
  if (!reg)
  {
    // Series outlived its registration.
    _noRegistration.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  const auto history = ev.candles();
  if (history.size() < _options.minHistoryBars || history.empty())
  {
    _insufficientHistory.fetch_add(1, std::memory_order_relaxed);
    // An empty history only means the series just opened its first candle.
    BARFLOW_LOG_AT(history.empty() ? LogLevel::Debug : LogLevel::Warn,
                   "[StrategyDispatcher] Skipping '" << reg->strategyId << "' for symbol="
                                                     << ev.symbol << " tf=" << toString(ev.timeframe)
                                                     << ": " << history.size() << " of "
                                                     << _options.minHistoryBars
                                                     << " closed candles");
    return;
  }

  auto strategy = _catalog.find(reg->strategyId);
  if (!strategy)
  {
    _unknownStrategy.fetch_add(1, std::memory_order_relaxed);
    BARFLOW_LOG_ERROR("[StrategyDispatcher] Strategy '" << reg->strategyId
                                                        << "' not found for symbol=" << ev.symbol
                                                        << " tf=" << toString(ev.timeframe));
    return;
  }

  _dispatched.fetch_add(1, std::memory_order_relaxed);

  SignalSide side = SignalSide::Neutral;
  try
  {
    side = strategy->evaluate(history, reg->params);
  }
  catch (const std::exception& ex)
  {
    _strategyFailures.fetch_add(1, std::memory_order_relaxed);
    BARFLOW_LOG_ERROR("[StrategyDispatcher] Strategy '" << reg->strategyId << "' failed for symbol="
                                                        << ev.symbol << " tf="
                                                        << toString(ev.timeframe) << ": "
                                                        << ex.what());
    return;
  }

  BARFLOW_LOG_DEBUG("[StrategyDispatcher] '" << reg->strategyId << "' on symbol=" << ev.symbol
                                             << " tf=" << toString(ev.timeframe) << " -> "
                                             << toString(side));

  if (side == SignalSide::Neutral)
  {
    _neutralSignals.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  forward(*reg, side, ev);
}

void StrategyDispatcher::forward(const StrategyRegistration& reg, SignalSide side,
                                 const CandleClosedEvent& ev)
{
  if (!_signalHandler)
  {
    return;
  }

  const Candle* last = ev.closed();

  Signal signal;
  signal.symbol = reg.symbol;
  signal.timeframe = reg.timeframe;
  signal.side = side;
  signal.price = last->close;
  signal.candleTime = last->startTime;
  signal.strategyId = reg.strategyId;
  if (auto qty = reg.params.get("quantity"))
  {
    if (!std::isfinite(*qty) || *qty <= 0.0)
    {
      _strategyFailures.fetch_add(1, std::memory_order_relaxed);
      BARFLOW_LOG_ERROR("[StrategyDispatcher] Strategy '" << reg.strategyId
                                                          << "' has invalid quantity=" << *qty
                                                          << " for symbol=" << reg.symbol
                                                          << ", signal dropped");
      return;
    }
    signal.quantity = Quantity::fromDouble(*qty);
  }

  _signalsEmitted.fetch_add(1, std::memory_order_relaxed);

  try
  {
    _signalHandler->onSignal(signal);
  }
  catch (const std::exception& ex)
  {
    BARFLOW_LOG_ERROR("[StrategyDispatcher] Signal handler failed for symbol="
                      << reg.symbol << ": " << ex.what());
  }
}

std::vector<Candle> StrategyDispatcher::fetchBackfill(SymbolId symbol, TimeframeId tf)
{
  if (!_history)
  {
    return {};
  }

  const TimePoint to = _clock.now();
  const TimePoint from = to - _options.backfillLookback;

  try
  {
    auto candles = _history->fetch(symbol, tf, from, to);
    BARFLOW_LOG_INFO("[StrategyDispatcher] Backfilled " << candles.size() << " candles for symbol="
                                                        << symbol << " tf=" << toString(tf));
    return candles;
  }
  catch (const std::exception& ex)
  {
    _backfillFailures.fetch_add(1, std::memory_order_relaxed);
    BARFLOW_LOG_WARN("[StrategyDispatcher] Error fetching historical data for symbol="
                     << symbol << " tf=" << toString(tf) << ": " << ex.what()
                     << "; continuing with empty history");
    return {};
  }
}

std::shared_ptr<const StrategyRegistration> StrategyDispatcher::registration(SymbolId symbol,
                                                                             TimeframeId tf) const
{
  std::shared_lock lock(_tableMutex);
  auto it = _registrations.find(SeriesKey{symbol, tf});
  return it != _registrations.end() ? it->second : nullptr;
}

size_t StrategyDispatcher::registrationCount() const
{
  std::shared_lock lock(_tableMutex);
  return _registrations.size();
}

DispatcherStats StrategyDispatcher::stats() const noexcept
{
  return DispatcherStats{
      .dispatched = _dispatched.load(std::memory_order_relaxed),
      .signalsEmitted = _signalsEmitted.load(std::memory_order_relaxed),
      .neutralSignals = _neutralSignals.load(std::memory_order_relaxed),
      .noRegistration = _noRegistration.load(std::memory_order_relaxed),
      .insufficientHistory = _insufficientHistory.load(std::memory_order_relaxed),
      .unknownStrategy = _unknownStrategy.load(std::memory_order_relaxed),
      .strategyFailures = _strategyFailures.load(std::memory_order_relaxed),
      .backfillFailures = _backfillFailures.load(std::memory_order_relaxed),
  };
}

}  // namespace barflow
