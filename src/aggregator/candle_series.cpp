/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/aggregator/candle_series.h"
#include "barflow/aggregator/bucketing.h"

#include <algorithm>
#include <utility>

namespace barflow
{

CandleSeries::CandleSeries(TimeframeId tf, Options options, State initial)
    : _timeframe(tf), _options(options), _state(initial)
{
}

CandleSeries::ApplyResult CandleSeries::apply(const Tick& tick)
{
  if (_state == State::Warming)
  {
    if (_pending.size() >= _options.pendingCapacity)
    {
      return ApplyResult::Dropped;
    }
    _pending.push_back(tick);
    return ApplyResult::Queued;
  }

  const TimePoint bucket = bucketStart(tick.exchangeTs, _timeframe, _options.bucketOffset);

  if (!_open) [[unlikely]]
  {
    openAt(bucket, tick.price);
    return ApplyResult::Opened;
  }

  if (bucket == _open->startTime) [[likely]]
  {
    _open->high = std::max(_open->high, tick.price);
    _open->low = std::min(_open->low, tick.price);
    _open->close = tick.price;
    ++_open->tickCount;
    return ApplyResult::Updated;
  }

  if (bucket < _open->startTime)
  {
    return ApplyResult::Late;
  }

  // Only the bucket that held the forming candle closes. Empty buckets in
  // between are never materialized.
  closeOpen();
  openAt(bucket, tick.price);
  return ApplyResult::RolledOver;
}

std::vector<Tick> CandleSeries::seed(std::vector<Candle> candles)
{
  if (_state == State::Live)
  {
    return {};
  }

  std::stable_sort(candles.begin(), candles.end(),
                   [](const Candle& a, const Candle& b)
                   { return a.startTime < b.startTime; });

  // Keep the last occurrence of a duplicated provider bucket.
  std::vector<Candle> unique;
  unique.reserve(candles.size());
  for (auto& c : candles)
  {
    if (!unique.empty() && unique.back().startTime == c.startTime)
    {
      unique.back() = c;
    }
    else
    {
      unique.push_back(c);
    }
  }

  // Providers may run on another grid (e.g. session-aligned hours). Snap every
  // candle onto ours and merge those that share a bucket.
  std::vector<Candle> aligned;
  aligned.reserve(unique.size());
  for (auto& c : unique)
  {
    c.startTime = bucketStart(c.startTime, _timeframe, _options.bucketOffset);
    c.endTime = bucketEnd(c.startTime, _timeframe);
    c.origin = CandleOrigin::Warmup;

    if (!aligned.empty() && aligned.back().startTime == c.startTime)
    {
      Candle& merged = aligned.back();
      merged.high = std::max(merged.high, c.high);
      merged.low = std::min(merged.low, c.low);
      merged.close = c.close;
      merged.tickCount += c.tickCount;
    }
    else
    {
      aligned.push_back(c);
    }
  }

  if (!aligned.empty())
  {
    _open = aligned.back();
    aligned.pop_back();
  }

  _closed = std::move(aligned);
  if (_options.historyCapacity > 0 && _closed.size() > _options.historyCapacity)
  {
    _closed.erase(_closed.begin(),
                  _closed.begin() + static_cast<std::ptrdiff_t>(_closed.size() - _options.historyCapacity));
  }

  _state = State::Live;
  return std::exchange(_pending, {});
}

void CandleSeries::openAt(TimePoint bucket, Price price)
{
  _open.emplace(bucket, bucketEnd(bucket, _timeframe), price);
}

void CandleSeries::closeOpen()
{
  _closed.push_back(*_open);
  _open.reset();

  if (_options.historyCapacity > 0 && _closed.size() > _options.historyCapacity)
  {
    _closed.erase(_closed.begin());
  }
}

}  // namespace barflow
