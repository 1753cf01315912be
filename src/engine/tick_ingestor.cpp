/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/engine/tick_ingestor.h"
#include "barflow/log/log.h"

#include <exception>

namespace barflow
{

TickIngestor::TickIngestor(CandleAggregator& aggregator, Options options)
    : _aggregator(aggregator), _options(options)
{
  const size_t shards = _options.shards == 0 ? 1 : _options.shards;
  _shards.reserve(shards);
  for (size_t i = 0; i < shards; ++i)
  {
    _shards.push_back(std::make_unique<Shard>(_options.queueCapacity));
  }
}

TickIngestor::~TickIngestor()
{
  stop();
}

size_t TickIngestor::shardFor(SymbolId symbol) const noexcept
{
  // Sequential ids would otherwise cluster on neighbouring shards.
  uint64_t h = symbol;
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  return static_cast<size_t>(h % _shards.size());
}

void TickIngestor::start()
{
  std::lock_guard lock(_lifecycleMutex);
  if (_running.load(std::memory_order_acquire))
  {
    return;
  }

  for (auto& shard : _shards)
  {
    shard->queue.reopen();
    Shard* s = shard.get();
    shard->worker = std::jthread([this, s] { run(*s); });
  }

  _running.store(true, std::memory_order_release);
  BARFLOW_LOG_INFO("[TickIngestor] Started " << _shards.size() << " shard(s)");
}

void TickIngestor::stop()
{
  std::lock_guard lock(_lifecycleMutex);
  if (!_running.exchange(false, std::memory_order_acq_rel))
  {
    return;
  }

  for (auto& shard : _shards)
  {
    if (!_options.drainOnStop)
    {
      _discarded.fetch_add(shard->queue.clear(), std::memory_order_relaxed);
    }
    shard->queue.close();
  }

  for (auto& shard : _shards)
  {
    if (shard->worker.joinable())
    {
      shard->worker.join();
    }
  }

  BARFLOW_LOG_INFO("[TickIngestor] Stopped, processed=" << _processed.load()
                                                        << " discarded=" << _discarded.load());
}

bool TickIngestor::submit(const Tick& tick)
{
  if (!_running.load(std::memory_order_acquire)) [[unlikely]]
  {
    _rejected.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  if (!_shards[shardFor(tick.symbol)]->queue.push(tick))
  {
    _rejected.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  _submitted.fetch_add(1, std::memory_order_relaxed);
  return true;
}

bool TickIngestor::trySubmit(const Tick& tick)
{
  if (!_running.load(std::memory_order_acquire) ||
      !_shards[shardFor(tick.symbol)]->queue.tryPush(tick)) [[unlikely]]
  {
    _rejected.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  _submitted.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void TickIngestor::run(Shard& shard)
{
  Tick tick;
  while (shard.queue.pop(tick))
  {
    try
    {
      _aggregator.ingest(tick);
    }
    catch (const std::exception& ex)
    {
      BARFLOW_LOG_ERROR("[TickIngestor] Failed to ingest tick for symbol=" << tick.symbol << ": "
                                                                           << ex.what());
    }
    _processed.fetch_add(1, std::memory_order_relaxed);
  }
}

IngestorStats TickIngestor::stats() const noexcept
{
  return IngestorStats{
      .submitted = _submitted.load(std::memory_order_relaxed),
      .processed = _processed.load(std::memory_order_relaxed),
      .rejected = _rejected.load(std::memory_order_relaxed),
      .discarded = _discarded.load(std::memory_order_relaxed),
  };
}

}  // namespace barflow
