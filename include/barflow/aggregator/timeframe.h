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
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace barflow
{

/// Identifies a candle series resolution. Only time-based grids are supported.
struct TimeframeId
{
  uint64_t intervalNs;

  constexpr TimeframeId() : intervalNs(0) {}

  explicit constexpr TimeframeId(uint64_t ns) : intervalNs(ns) {}

  template <typename Rep, typename Period>
  static constexpr TimeframeId fromDuration(std::chrono::duration<Rep, Period> d)
  {
    return TimeframeId(
        static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(d).count()));
  }

  static constexpr TimeframeId time(std::chrono::seconds s)
  {
    return TimeframeId(static_cast<uint64_t>(s.count()) * 1'000'000'000ULL);
  }

  constexpr std::chrono::nanoseconds interval() const noexcept
  {
    return std::chrono::nanoseconds(static_cast<int64_t>(intervalNs));
  }

  constexpr bool isValid() const noexcept
  {
    return intervalNs > 0 && intervalNs <= static_cast<uint64_t>(INT64_MAX);
  }

  constexpr auto operator<=>(const TimeframeId&) const noexcept = default;
};

namespace timeframe
{

using namespace std::chrono_literals;

inline constexpr TimeframeId S1 = TimeframeId::time(1s);
inline constexpr TimeframeId S5 = TimeframeId::time(5s);
inline constexpr TimeframeId S15 = TimeframeId::time(15s);
inline constexpr TimeframeId S30 = TimeframeId::time(30s);

inline constexpr TimeframeId M1 = TimeframeId::time(60s);
inline constexpr TimeframeId M3 = TimeframeId::time(180s);
inline constexpr TimeframeId M5 = TimeframeId::time(300s);
inline constexpr TimeframeId M15 = TimeframeId::time(900s);
inline constexpr TimeframeId M30 = TimeframeId::time(1800s);

inline constexpr TimeframeId H1 = TimeframeId::time(3600s);
inline constexpr TimeframeId H4 = TimeframeId::time(14400s);

inline constexpr TimeframeId D1 = TimeframeId::time(86400s);

}  // namespace timeframe

/// Parses "1m", "3m", "15m", "1h", "30s", "1d" style names.
/// Returns nullopt for anything else, including zero-length intervals.
std::optional<TimeframeId> parseTimeframe(std::string_view name) noexcept;

/// Inverse of parseTimeframe, picking the largest unit that divides the interval.
std::string toString(TimeframeId tf);

}  // namespace barflow

template <>
struct std::hash<barflow::TimeframeId>
{
  std::size_t operator()(const barflow::TimeframeId& tf) const noexcept
  {
    return std::hash<uint64_t>{}(tf.intervalNs);
  }
};
