/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/aggregator/timeframe.h"
#include "barflow/util/base/time.h"

#include <chrono>
#include <cstdint>

namespace barflow
{

/// Start of the bucket containing ts on the grid of tf, shifted by offset.
/// Floors toward negative infinity, so pre-epoch timestamps land in the
/// bucket that contains them. Requires tf.isValid().
inline constexpr TimePoint bucketStart(TimePoint ts, TimeframeId tf,
                                       std::chrono::nanoseconds offset = {}) noexcept
{
  const int64_t interval = static_cast<int64_t>(tf.intervalNs);
  if (interval <= 0) [[unlikely]]
  {
    return ts;
  }

  const int64_t shifted = toUnixNs(ts) - offset.count();
  int64_t q = shifted / interval;
  if (shifted % interval != 0 && shifted < 0)
  {
    --q;
  }
  return fromUnixNs(q * interval + offset.count());
}

inline constexpr TimePoint bucketEnd(TimePoint start, TimeframeId tf) noexcept
{
  return start + tf.interval();
}

}  // namespace barflow
