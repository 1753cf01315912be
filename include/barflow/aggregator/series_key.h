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
#include "barflow/common.h"

#include <functional>

namespace barflow
{

struct SeriesKey
{
  SymbolId symbol{};
  TimeframeId timeframe{};

  bool operator==(const SeriesKey&) const = default;
};

}  // namespace barflow

template <>
struct std::hash<barflow::SeriesKey>
{
  std::size_t operator()(const barflow::SeriesKey& key) const noexcept
  {
    std::size_t h1 = std::hash<barflow::SymbolId>{}(key.symbol);
    std::size_t h2 = std::hash<barflow::TimeframeId>{}(key.timeframe);
    return h1 ^ (h2 << 1);
  }
};
