/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/util/base/time.h"

namespace barflow
{

class IClock
{
 public:
  virtual ~IClock() = default;

  virtual UnixNanos nowNs() const = 0;

  TimePoint now() const { return fromUnixNs(nowNs()); }
};

class SystemClock final : public IClock
{
 public:
  UnixNanos nowNs() const override { return nowNsWallclock(); }
};

}  // namespace barflow
