/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/strategy/strategy_params.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace barflow
{

double StrategyParams::require(std::string_view name) const
{
  auto value = get(name);
  if (!value)
  {
    throw std::invalid_argument("missing strategy parameter '" + std::string(name) + "'");
  }
  return *value;
}

int64_t StrategyParams::requireInt(std::string_view name) const
{
  const double value = require(name);
  if (!std::isfinite(value) || std::trunc(value) != value ||
      std::fabs(value) > static_cast<double>(std::numeric_limits<int64_t>::max() / 2))
  {
    throw std::invalid_argument("strategy parameter '" + std::string(name) +
                                "' must be an integer");
  }
  return static_cast<int64_t>(value);
}

std::string StrategyParams::toString() const
{
  std::ostringstream out;
  bool first = true;
  for (const auto& [name, value] : _values)
  {
    if (!first)
    {
      out << ", ";
    }
    out << name << '=' << value;
    first = false;
  }
  return out.str();
}

}  // namespace barflow
