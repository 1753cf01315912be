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

#include <string>
#include <utility>

namespace barflow
{

struct OrderRequest
{
  SymbolId symbol{};
  Side side{};
  OrderType type{OrderType::MARKET};
  Quantity quantity{};
  Price price{};  // reference price for MARKET, limit for LIMIT
  std::string tag;  // originating strategy id
};

struct OrderAck
{
  bool accepted{false};
  OrderId orderId{};
  std::string reason;  // set on rejection

  static OrderAck accept(OrderId id) { return OrderAck{true, id, {}}; }
  static OrderAck reject(std::string why) { return OrderAck{false, 0, std::move(why)}; }
};

}  // namespace barflow
