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
#include <cstdint>

namespace barflow
{

using UnixNanos = int64_t;

// Nanoseconds since the Unix epoch. Exchange timestamps are wall-clock based,
// so the system clock is the reference.
using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

inline constexpr TimePoint fromUnixNs(UnixNanos ns) noexcept
{
  return TimePoint(std::chrono::nanoseconds(ns));
}

inline constexpr UnixNanos toUnixNs(TimePoint tp) noexcept
{
  return tp.time_since_epoch().count();
}

inline UnixNanos nowNsWallclock() noexcept
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline UnixNanos nowNsMonotonic() noexcept
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

}  // namespace barflow
