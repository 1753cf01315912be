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
#include "barflow/engine/abstract_subsystem.h"
#include "barflow/market/tick.h"
#include "barflow/util/concurrency/bounded_queue.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace barflow
{

struct IngestorStats
{
  uint64_t submitted{0};
  uint64_t processed{0};
  uint64_t rejected{0};   // trySubmit on a full shard, or submit while stopped
  uint64_t discarded{0};  // dropped by stop() without drain
};

/// Fixed pool of workers feeding the aggregator. Ticks are sharded by symbol,
/// so all series of one instrument are owned by a single worker and see ticks
/// in submission order, while different instruments proceed in parallel.
class TickIngestor : public ISubsystem
{
 public:
  struct Options
  {
    size_t shards = 4;
    size_t queueCapacity = 8192;
    bool drainOnStop = true;
  };

  TickIngestor(CandleAggregator& aggregator, Options options);
  ~TickIngestor() override;

  TickIngestor(const TickIngestor&) = delete;
  TickIngestor& operator=(const TickIngestor&) = delete;

  void start() override;
  void stop() override;

  /// Blocks while the target shard is full. Returns false when stopped.
  bool submit(const Tick& tick);

  /// Never blocks. Returns false when the shard is full or stopped.
  bool trySubmit(const Tick& tick);

  bool running() const noexcept { return _running.load(std::memory_order_acquire); }
  size_t shardCount() const noexcept { return _shards.size(); }
  size_t shardFor(SymbolId symbol) const noexcept;

  IngestorStats stats() const noexcept;

 private:
  struct Shard
  {
    explicit Shard(size_t capacity) : queue(capacity) {}

    BoundedQueue<Tick> queue;
    std::jthread worker;
  };

  void run(Shard& shard);

  CandleAggregator& _aggregator;
  Options _options;
  std::vector<std::unique_ptr<Shard>> _shards;

  std::mutex _lifecycleMutex;
  std::atomic<bool> _running{false};

  std::atomic<uint64_t> _submitted{0};
  std::atomic<uint64_t> _processed{0};
  std::atomic<uint64_t> _rejected{0};
  std::atomic<uint64_t> _discarded{0};
};

}  // namespace barflow
