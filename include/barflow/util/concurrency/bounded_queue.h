/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace barflow
{

/// Multi-producer, multi-consumer FIFO with a fixed capacity. push() blocks
/// while the queue is full, which gives producers backpressure. close()
/// wakes everyone; pop() keeps returning queued items until the queue is empty.
template <typename T>
class BoundedQueue
{
 public:
  explicit BoundedQueue(size_t capacity) : _capacity(capacity == 0 ? 1 : capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  /// Returns false if the queue was closed before space became available.
  bool push(T item)
  {
    std::unique_lock lock(_mutex);
    _notFull.wait(lock, [this] { return _closed || _items.size() < _capacity; });
    if (_closed)
    {
      return false;
    }
    _items.push_back(std::move(item));
    lock.unlock();
    _notEmpty.notify_one();
    return true;
  }

  bool tryPush(T item)
  {
    {
      std::lock_guard lock(_mutex);
      if (_closed || _items.size() >= _capacity)
      {
        return false;
      }
      _items.push_back(std::move(item));
    }
    _notEmpty.notify_one();
    return true;
  }

  /// Returns false once the queue is closed and drained.
  bool pop(T& out)
  {
    std::unique_lock lock(_mutex);
    _notEmpty.wait(lock, [this] { return _closed || !_items.empty(); });
    if (_items.empty())
    {
      return false;
    }
    out = std::move(_items.front());
    _items.pop_front();
    lock.unlock();
    _notFull.notify_one();
    return true;
  }

  void close()
  {
    {
      std::lock_guard lock(_mutex);
      _closed = true;
    }
    _notEmpty.notify_all();
    _notFull.notify_all();
  }

  void reopen()
  {
    std::lock_guard lock(_mutex);
    _closed = false;
  }

  /// Discards queued items and returns how many were dropped.
  size_t clear()
  {
    size_t dropped = 0;
    {
      std::lock_guard lock(_mutex);
      dropped = _items.size();
      _items.clear();
    }
    _notFull.notify_all();
    return dropped;
  }

  size_t size() const
  {
    std::lock_guard lock(_mutex);
    return _items.size();
  }

  size_t capacity() const noexcept { return _capacity; }

 private:
  const size_t _capacity;
  mutable std::mutex _mutex;
  std::condition_variable _notEmpty;
  std::condition_variable _notFull;
  std::deque<T> _items;
  bool _closed{false};
};

}  // namespace barflow
