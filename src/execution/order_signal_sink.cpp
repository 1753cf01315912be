/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/execution/order_signal_sink.h"
#include "barflow/log/log.h"

#include <stdexcept>
#include <utility>

namespace barflow
{

namespace
{

const char* sideName(Side side) { return side == Side::BUY ? "buy" : "sell"; }

}  // namespace

OrderSignalSink::OrderSignalSink(IOrderExecutor& executor, Quantity defaultQuantity,
                                 size_t queueCapacity)
    : _executor(executor), _defaultQuantity(defaultQuantity), _queue(queueCapacity)
{
}

OrderSignalSink::~OrderSignalSink()
{
  stop();
}

void OrderSignalSink::start()
{
  std::lock_guard lock(_lifecycleMutex);
  if (_running.load(std::memory_order_acquire))
  {
    return;
  }

  _queue.reopen();
  _worker = std::jthread([this] { run(); });
  _running.store(true, std::memory_order_release);
}

void OrderSignalSink::stop()
{
  std::lock_guard lock(_lifecycleMutex);
  if (!_running.exchange(false, std::memory_order_acq_rel))
  {
    return;
  }

  _queue.close();
  if (_worker.joinable())
  {
    _worker.join();
  }
}

void OrderSignalSink::onSignal(const Signal& signal)
{
  const auto side = signal.orderSide();
  if (!side)
  {
    _ignoredNeutral.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  OrderRequest request;
  request.symbol = signal.symbol;
  request.side = *side;
  request.type = OrderType::MARKET;
  request.quantity = signal.quantity.isZero() ? _defaultQuantity : signal.quantity;
  request.price = signal.price;
  request.tag = signal.strategyId;

  if (!_queue.tryPush(std::move(request)))
  {
    _ordersDropped.fetch_add(1, std::memory_order_relaxed);
    BARFLOW_LOG_ERROR("[OrderSignalSink] Order queue full, dropped " << toString(signal.side)
                                                                     << " for symbol="
                                                                     << signal.symbol << " from '"
                                                                     << signal.strategyId << "'");
  }
}

void OrderSignalSink::run()
{
  OrderRequest request;
  while (_queue.pop(request))
  {
    place(request);
  }
}

void OrderSignalSink::place(const OrderRequest& request)
{
  OrderAck ack;
  try
  {
    ack = _executor.placeOrder(request);
  }
  catch (const std::exception& ex)
  {
    ack = OrderAck::reject(ex.what());
  }

  if (!ack.accepted)
  {
    _ordersRejected.fetch_add(1, std::memory_order_relaxed);
    BARFLOW_LOG_ERROR("[OrderSignalSink] Order for symbol=" << request.symbol << " side="
                                                            << sideName(request.side)
                                                            << " failed: " << ack.reason);
    return;
  }

  _ordersPlaced.fetch_add(1, std::memory_order_relaxed);
  BARFLOW_LOG_INFO("[OrderSignalSink] Placed " << sideName(request.side) << " order id="
                                               << ack.orderId << " symbol=" << request.symbol
                                               << " qty=" << request.quantity << " from '"
                                               << request.tag << "'");
}

SignalSinkStats OrderSignalSink::stats() const noexcept
{
  return SignalSinkStats{
      .ordersPlaced = _ordersPlaced.load(std::memory_order_relaxed),
      .ordersRejected = _ordersRejected.load(std::memory_order_relaxed),
      .ordersDropped = _ordersDropped.load(std::memory_order_relaxed),
      .ignoredNeutral = _ignoredNeutral.load(std::memory_order_relaxed),
  };
}

}  // namespace barflow
