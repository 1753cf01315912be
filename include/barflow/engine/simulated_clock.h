/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/engine/abstract_clock.h"

#include <atomic>

namespace barflow
{

class SimulatedClock : public IClock
{
 public:
  SimulatedClock() = default;
  explicit SimulatedClock(UnixNanos initial) : _currentNs(initial) {}

  UnixNanos nowNs() const override { return _currentNs.load(std::memory_order_acquire); }

  void advanceTo(UnixNanos ns)
  {
    UnixNanos current = _currentNs.load(std::memory_order_relaxed);
    while (ns > current &&
           !_currentNs.compare_exchange_weak(current, ns, std::memory_order_acq_rel))
    {
    }
  }

  void reset(UnixNanos ns = 0) { _currentNs.store(ns, std::memory_order_release); }

 private:
  std::atomic<UnixNanos> _currentNs{0};
};

}  // namespace barflow
