/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/common.h"

#include <cstdint>

namespace barflow
{

enum class CandleOrigin : uint8_t
{
  Live,    // Built from ticks
  Warmup   // Seeded from the historical data provider
};

struct Candle
{
  TimePoint startTime{};
  TimePoint endTime{};
  Price open{};
  Price high{};
  Price low{};
  Price close{};
  uint32_t tickCount{0};
  CandleOrigin origin{CandleOrigin::Live};

  Candle() = default;

  Candle(TimePoint start, TimePoint end, Price price)
      : startTime(start),
        endTime(end),
        open(price),
        high(price),
        low(price),
        close(price),
        tickCount(1)
  {
  }

  bool operator==(const Candle&) const = default;
};

}  // namespace barflow
