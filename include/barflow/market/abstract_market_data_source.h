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
#include "barflow/engine/abstract_subsystem.h"
#include "barflow/market/tick.h"

#include <functional>
#include <utility>

namespace barflow
{

/// Live feed of ticks, typically one per upstream connection. Ticks may be
/// delivered from any thread.
class IMarketDataSource : public ISubsystem
{
 public:
  using TickCallback = std::function<void(const Tick&)>;

  virtual ~IMarketDataSource() = default;

  virtual void setTickCallback(TickCallback onTick) { _onTick = std::move(onTick); }

  virtual bool subscribe(SymbolId symbol) = 0;
  virtual void unsubscribe(SymbolId symbol) = 0;

 protected:
  void emitTick(const Tick& tick)
  {
    if (_onTick)
    {
      _onTick(tick);
    }
  }

 private:
  TickCallback _onTick;
};

}  // namespace barflow
