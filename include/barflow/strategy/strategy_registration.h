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
#include "barflow/strategy/strategy_params.h"

#include <string>

namespace barflow
{

struct StrategyRegistration
{
  SymbolId symbol{};
  TimeframeId timeframe{};
  std::string strategyId;
  StrategyParams params;
};

}  // namespace barflow
