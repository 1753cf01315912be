/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/util/base/decimal.h"
#include "barflow/util/base/time.h"

#include <cstdint>

namespace barflow
{

enum class OrderType : uint8_t
{
  LIMIT = 0,
  MARKET = 1,
};

enum class Side
{
  BUY,
  SELL
};

using SymbolId = uint32_t;
using OrderId = uint64_t;

static constexpr SymbolId InvalidSymbolId = 0xFFFFFFFF;

struct PriceTag
{
};
struct QuantityTag
{
};

// tick = 0.00000001 (8 decimals)
using Price = Decimal<PriceTag, 100'000'000, 1>;
using Quantity = Decimal<QuantityTag, 100'000'000, 1>;

}  // namespace barflow
