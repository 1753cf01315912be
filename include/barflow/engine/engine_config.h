/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace barflow
{

#ifndef BARFLOW_DEFAULT_INGEST_SHARDS
#define BARFLOW_DEFAULT_INGEST_SHARDS 4
#endif

#ifndef BARFLOW_DEFAULT_SHARD_QUEUE_CAPACITY
#define BARFLOW_DEFAULT_SHARD_QUEUE_CAPACITY 8192
#endif

#ifndef BARFLOW_DEFAULT_HISTORY_CAPACITY
#define BARFLOW_DEFAULT_HISTORY_CAPACITY 512
#endif

#ifndef BARFLOW_DEFAULT_ORDER_QUEUE_CAPACITY
#define BARFLOW_DEFAULT_ORDER_QUEUE_CAPACITY 1024
#endif

// Ticks buffered per series while its backfill is in flight.
#ifndef BARFLOW_DEFAULT_PENDING_CAPACITY
#define BARFLOW_DEFAULT_PENDING_CAPACITY 4096
#endif

namespace config
{

inline constexpr size_t DEFAULT_INGEST_SHARDS = BARFLOW_DEFAULT_INGEST_SHARDS;
inline constexpr size_t DEFAULT_SHARD_QUEUE_CAPACITY = BARFLOW_DEFAULT_SHARD_QUEUE_CAPACITY;
inline constexpr size_t DEFAULT_HISTORY_CAPACITY = BARFLOW_DEFAULT_HISTORY_CAPACITY;
inline constexpr size_t DEFAULT_PENDING_CAPACITY = BARFLOW_DEFAULT_PENDING_CAPACITY;
inline constexpr size_t DEFAULT_ORDER_QUEUE_CAPACITY = BARFLOW_DEFAULT_ORDER_QUEUE_CAPACITY;

}  // namespace config

struct EngineConfig
{
  size_t ingestShards = config::DEFAULT_INGEST_SHARDS;
  size_t shardQueueCapacity = config::DEFAULT_SHARD_QUEUE_CAPACITY;
  bool drainOnStop = true;  ///< Process queued ticks on stop() instead of discarding them

  size_t historyCapacity = config::DEFAULT_HISTORY_CAPACITY;  ///< 0 keeps every closed candle
  size_t pendingCapacity = config::DEFAULT_PENDING_CAPACITY;

  /// Shifts the bucket grid, e.g. to align hourly candles with a 09:15 session open.
  std::chrono::nanoseconds bucketOffset{0};

  size_t minHistoryBars = 1;  ///< Closed candles required before a strategy is evaluated
  std::chrono::nanoseconds backfillLookback = std::chrono::hours(48);
  bool retainHistoryOnRemove = false;

  double defaultOrderQuantity = 1.0;
  size_t orderQueueCapacity = config::DEFAULT_ORDER_QUEUE_CAPACITY;  ///< Signals awaiting the executor

  std::string logLevel = "info";

  /// Throws std::invalid_argument describing the first bad field.
  void validate() const;
};

}  // namespace barflow
