/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/engine/abstract_subsystem.h"
#include "barflow/execution/abstract_executor.h"
#include "barflow/strategy/abstract_signal_handler.h"
#include "barflow/util/concurrency/bounded_queue.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>

namespace barflow
{

struct SignalSinkStats
{
  uint64_t ordersPlaced{0};
  uint64_t ordersRejected{0};
  uint64_t ordersDropped{0};  // order queue full
  uint64_t ignoredNeutral{0};
};

/// Turns buy/sell signals into market orders. onSignal() only enqueues; a
/// dedicated worker talks to the executor so broker latency never stalls
/// aggregation. Placement failures are logged and counted here and never
/// reach the dispatcher.
class OrderSignalSink final : public ISignalHandler, public ISubsystem
{
 public:
  static constexpr size_t DEFAULT_QUEUE_CAPACITY = 1024;

  OrderSignalSink(IOrderExecutor& executor, Quantity defaultQuantity,
                  size_t queueCapacity = DEFAULT_QUEUE_CAPACITY);
  ~OrderSignalSink() override;

  OrderSignalSink(const OrderSignalSink&) = delete;
  OrderSignalSink& operator=(const OrderSignalSink&) = delete;

  /// Orders queued before start() are placed once the worker runs.
  void start() override;

  /// Places every queued order, then joins the worker.
  void stop() override;

  void onSignal(const Signal& signal) override;

  bool running() const noexcept { return _running.load(std::memory_order_acquire); }
  size_t queuedOrders() const { return _queue.size(); }

  SignalSinkStats stats() const noexcept;

 private:
  void run();
  void place(const OrderRequest& request);

  IOrderExecutor& _executor;
  Quantity _defaultQuantity;

  BoundedQueue<OrderRequest> _queue;
  std::jthread _worker;
  std::mutex _lifecycleMutex;
  std::atomic<bool> _running{false};

  std::atomic<uint64_t> _ordersPlaced{0};
  std::atomic<uint64_t> _ordersRejected{0};
  std::atomic<uint64_t> _ordersDropped{0};
  std::atomic<uint64_t> _ignoredNeutral{0};
};

}  // namespace barflow
