/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/aggregator/timeframe.h"

#include <charconv>

namespace barflow
{

namespace
{

constexpr uint64_t kSecondNs = 1'000'000'000ULL;
constexpr uint64_t kMinuteNs = 60 * kSecondNs;
constexpr uint64_t kHourNs = 60 * kMinuteNs;
constexpr uint64_t kDayNs = 24 * kHourNs;

}  // namespace

std::optional<TimeframeId> parseTimeframe(std::string_view name) noexcept
{
  if (name.size() < 2)
  {
    return std::nullopt;
  }

  uint64_t unitNs = 0;
  switch (name.back())
  {
    case 's':
      unitNs = kSecondNs;
      break;
    case 'm':
      unitNs = kMinuteNs;
      break;
    case 'h':
      unitNs = kHourNs;
      break;
    case 'd':
      unitNs = kDayNs;
      break;
    default:
      return std::nullopt;
  }

  const auto digits = name.substr(0, name.size() - 1);
  uint64_t count = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), count);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() || count == 0)
  {
    return std::nullopt;
  }

  if (count > static_cast<uint64_t>(INT64_MAX) / unitNs)
  {
    return std::nullopt;
  }

  return TimeframeId(count * unitNs);
}

std::string toString(TimeframeId tf)
{
  const uint64_t ns = tf.intervalNs;
  if (ns == 0)
  {
    return "0s";
  }
  if (ns % kDayNs == 0)
  {
    return std::to_string(ns / kDayNs) + "d";
  }
  if (ns % kHourNs == 0)
  {
    return std::to_string(ns / kHourNs) + "h";
  }
  if (ns % kMinuteNs == 0)
  {
    return std::to_string(ns / kMinuteNs) + "m";
  }
  if (ns % kSecondNs == 0)
  {
    return std::to_string(ns / kSecondNs) + "s";
  }
  return std::to_string(ns) + "ns";
}

}  // namespace barflow
