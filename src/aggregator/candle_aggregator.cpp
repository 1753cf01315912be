/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/aggregator/candle_aggregator.h"
#include "barflow/aggregator/bucketing.h"
#include "barflow/log/log.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace barflow
{

namespace
{

// Logs the 1st, 2nd, 4th, 8th... occurrence so a misbehaving feed cannot flood the log.
bool shouldLogOccurrence(uint64_t n) noexcept { return (n & (n - 1)) == 0; }

}  // namespace

CandleAggregator::CandleAggregator(CandleSeries::Options options, ICandleListener* listener)
    : _options(options), _listener(listener)
{
}

bool CandleAggregator::registerSeries(SymbolId symbol, TimeframeId tf, SeriesStart start)
{
  if (!tf.isValid())
  {
    throw std::invalid_argument("CandleAggregator: invalid timeframe for symbol " +
                                std::to_string(symbol));
  }

  std::unique_lock lock(_tableMutex);

  auto& entry = _table[symbol];
  if (entry)
  {
    for (const auto& slot : *entry)
    {
      if (slot->series.timeframe() == tf)
      {
        return false;
      }
    }
  }

  auto next = entry ? std::make_shared<SlotList>(*entry) : std::make_shared<SlotList>();
  const auto state =
      start == SeriesStart::AwaitSeed ? CandleSeries::State::Warming : CandleSeries::State::Live;
  next->push_back(std::make_shared<SeriesSlot>(symbol, tf, _options, state));
  entry = std::move(next);

  BARFLOW_LOG_DEBUG("[CandleAggregator] Registered series symbol=" << symbol
                                                                   << " tf=" << toString(tf));
  return true;
}

size_t CandleAggregator::seed(SymbolId symbol, TimeframeId tf, std::vector<Candle> candles)
{
  auto slot = findSlot(symbol, tf);
  if (!slot)
  {
    BARFLOW_LOG_WARN("[CandleAggregator] seed for unknown series symbol="
                     << symbol << " tf=" << toString(tf));
    return 0;
  }

  std::lock_guard lock(slot->mutex);
  if (slot->removed || slot->series.isLive())
  {
    return 0;
  }

  const size_t seeded = candles.size();
  auto pending = slot->series.seed(std::move(candles));
  for (const auto& tick : pending)
  {
    applyLocked(*slot, tick);
  }

  BARFLOW_LOG_INFO("[CandleAggregator] Seeded symbol=" << symbol << " tf=" << toString(tf)
                                                       << " candles=" << seeded
                                                       << " replayed=" << pending.size());
  return pending.size();
}

bool CandleAggregator::unregisterSeries(SymbolId symbol, TimeframeId tf)
{
  SlotPtr removed;
  {
    std::unique_lock lock(_tableMutex);

    auto it = _table.find(symbol);
    if (it == _table.end() || !it->second)
    {
      return false;
    }

    auto next = std::make_shared<SlotList>(*it->second);
    auto pos = std::find_if(next->begin(), next->end(),
                            [tf](const SlotPtr& s) { return s->series.timeframe() == tf; });
    if (pos == next->end())
    {
      return false;
    }

    removed = *pos;
    next->erase(pos);
    if (next->empty())
    {
      _table.erase(it);
    }
    else
    {
      it->second = std::move(next);
    }
  }

  // Waits for an in-flight tick on this series; nothing is applied afterwards.
  std::lock_guard slotLock(removed->mutex);
  removed->removed = true;
  return true;
}

void CandleAggregator::clear()
{
  decltype(_table) old;
  {
    std::unique_lock lock(_tableMutex);
    old.swap(_table);
  }

  for (auto& [symbol, slots] : old)
  {
    for (const auto& slot : *slots)
    {
      std::lock_guard slotLock(slot->mutex);
      slot->removed = true;
    }
  }
}

void CandleAggregator::ingest(const Tick& tick)
{
  _ticksIngested.fetch_add(1, std::memory_order_relaxed);

  auto slots = slotsFor(tick.symbol);
  if (!slots || slots->empty())
  {
    _unroutedTicks.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  for (const auto& slot : *slots)
  {
    std::lock_guard lock(slot->mutex);
    if (slot->removed) [[unlikely]]
    {
      continue;
    }
    applyLocked(*slot, tick);
  }
}

void CandleAggregator::applyLocked(SeriesSlot& slot, const Tick& tick)
{
  using Result = CandleSeries::ApplyResult;

  switch (slot.series.apply(tick))
  {
    case Result::Updated:
      break;

    case Result::Opened:
      publish(slot);
      break;

    case Result::RolledOver:
      _candlesClosed.fetch_add(1, std::memory_order_relaxed);
      publish(slot);
      break;

    case Result::Late:
    {
      const auto n = _lateTicks.fetch_add(1, std::memory_order_relaxed) + 1;
      if (shouldLogOccurrence(n))
      {
        const auto& open = slot.series.openCandle();
        BARFLOW_LOG_WARN("[CandleAggregator] Dropped out-of-order tick symbol="
                         << tick.symbol << " tf=" << toString(slot.series.timeframe())
                         << " tickNs=" << toUnixNs(tick.exchangeTs)
                         << " openBucketNs=" << (open ? toUnixNs(open->startTime) : 0)
                         << " (late ticks so far: " << n << ")");
      }
      break;
    }

    case Result::Queued:
      _warmupQueuedTicks.fetch_add(1, std::memory_order_relaxed);
      break;

    case Result::Dropped:
    {
      const auto n = _warmupDroppedTicks.fetch_add(1, std::memory_order_relaxed) + 1;
      if (shouldLogOccurrence(n))
      {
        BARFLOW_LOG_WARN("[CandleAggregator] Warm-up buffer full, dropped tick symbol="
                         << tick.symbol << " tf=" << toString(slot.series.timeframe())
                         << " (dropped so far: " << n << ")");
      }
      break;
    }
  }
}

void CandleAggregator::publish(SeriesSlot& slot)
{
  ICandleListener* listener = _listener.load(std::memory_order_acquire);
  if (!listener)
  {
    return;
  }

  CandleClosedEvent ev{.symbol = slot.symbol,
                       .timeframe = slot.series.timeframe(),
                       .history = std::make_shared<const std::vector<Candle>>(slot.series.history())};

  try
  {
    listener->onCandleClosed(ev);
  }
  catch (const std::exception& ex)
  {
    BARFLOW_LOG_ERROR("[CandleAggregator] Listener failed for symbol="
                      << slot.symbol << " tf=" << toString(ev.timeframe) << ": " << ex.what());
  }
}

std::shared_ptr<const CandleAggregator::SlotList> CandleAggregator::slotsFor(SymbolId symbol) const
{
  std::shared_lock lock(_tableMutex);
  auto it = _table.find(symbol);
  return it != _table.end() ? it->second : nullptr;
}

CandleAggregator::SlotPtr CandleAggregator::findSlot(SymbolId symbol, TimeframeId tf) const
{
  auto slots = slotsFor(symbol);
  if (!slots)
  {
    return nullptr;
  }
  for (const auto& slot : *slots)
  {
    if (slot->series.timeframe() == tf)
    {
      return slot;
    }
  }
  return nullptr;
}

bool CandleAggregator::hasSeries(SymbolId symbol, TimeframeId tf) const
{
  return findSlot(symbol, tf) != nullptr;
}

size_t CandleAggregator::seriesCount() const
{
  std::shared_lock lock(_tableMutex);
  size_t count = 0;
  for (const auto& [symbol, slots] : _table)
  {
    count += slots->size();
  }
  return count;
}

std::vector<TimeframeId> CandleAggregator::timeframes(SymbolId symbol) const
{
  std::vector<TimeframeId> result;
  if (auto slots = slotsFor(symbol))
  {
    result.reserve(slots->size());
    for (const auto& slot : *slots)
    {
      result.push_back(slot->series.timeframe());
    }
  }
  return result;
}

std::vector<Candle> CandleAggregator::history(SymbolId symbol, TimeframeId tf) const
{
  auto slot = findSlot(symbol, tf);
  if (!slot)
  {
    return {};
  }
  std::lock_guard lock(slot->mutex);
  return slot->series.history();
}

std::optional<Candle> CandleAggregator::openCandle(SymbolId symbol, TimeframeId tf) const
{
  auto slot = findSlot(symbol, tf);
  if (!slot)
  {
    return std::nullopt;
  }
  std::lock_guard lock(slot->mutex);
  return slot->series.openCandle();
}

AggregatorStats CandleAggregator::stats() const noexcept
{
  return AggregatorStats{
      .ticksIngested = _ticksIngested.load(std::memory_order_relaxed),
      .unroutedTicks = _unroutedTicks.load(std::memory_order_relaxed),
      .lateTicks = _lateTicks.load(std::memory_order_relaxed),
      .warmupQueuedTicks = _warmupQueuedTicks.load(std::memory_order_relaxed),
      .warmupDroppedTicks = _warmupDroppedTicks.load(std::memory_order_relaxed),
      .candlesClosed = _candlesClosed.load(std::memory_order_relaxed),
  };
}

}  // namespace barflow
