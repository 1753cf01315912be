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

namespace barflow
{

struct Tick
{
  SymbolId symbol{};
  Price price{};
  TimePoint exchangeTs{};
};

}  // namespace barflow
