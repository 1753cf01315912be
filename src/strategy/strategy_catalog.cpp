/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/strategy/strategy_catalog.h"

#include <mutex>
#include <stdexcept>

namespace barflow
{

void StrategyCatalog::add(std::string id, std::shared_ptr<const ICandleStrategy> strategy)
{
  if (id.empty())
  {
    throw std::invalid_argument("StrategyCatalog: strategy id must not be empty");
  }
  if (!strategy)
  {
    throw std::invalid_argument("StrategyCatalog: null strategy for id '" + id + "'");
  }

  std::unique_lock lock(_mutex);
  _strategies.insert_or_assign(std::move(id), std::move(strategy));
}

bool StrategyCatalog::remove(std::string_view id)
{
  std::unique_lock lock(_mutex);
  auto it = _strategies.find(id);
  if (it == _strategies.end())
  {
    return false;
  }
  _strategies.erase(it);
  return true;
}

std::shared_ptr<const ICandleStrategy> StrategyCatalog::find(std::string_view id) const
{
  std::shared_lock lock(_mutex);
  auto it = _strategies.find(id);
  return it != _strategies.end() ? it->second : nullptr;
}

std::vector<std::string> StrategyCatalog::ids() const
{
  std::shared_lock lock(_mutex);
  std::vector<std::string> result;
  result.reserve(_strategies.size());
  for (const auto& [id, _] : _strategies)
  {
    result.push_back(id);
  }
  return result;
}

size_t StrategyCatalog::size() const
{
  std::shared_lock lock(_mutex);
  return _strategies.size();
}

}  // namespace barflow
