/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/engine/abstract_subsystem.h"
#include "barflow/execution/order.h"

namespace barflow
{

/// Order placement collaborator. A rejection is reported through OrderAck;
/// transport failures may also surface as exceptions.
class IOrderExecutor : public ISubsystem
{
 public:
  virtual ~IOrderExecutor() = default;

  virtual OrderAck placeOrder(const OrderRequest& request) = 0;
};

}  // namespace barflow
