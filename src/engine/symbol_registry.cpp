/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "barflow/engine/symbol_registry.h"

namespace barflow
{

std::string SymbolRegistry::makeKey(std::string_view exchange, std::string_view token)
{
  std::string key;
  key.reserve(exchange.size() + token.size() + 1);
  key.append(exchange);
  key.push_back(':');
  key.append(token);
  return key;
}

SymbolId SymbolRegistry::registerSymbol(std::string_view exchange, std::string_view token)
{
  std::lock_guard lock(_mutex);
  std::string key = makeKey(exchange, token);

  auto it = _map.find(key);
  if (it != _map.end())
  {
    return it->second;
  }

  SymbolId id = static_cast<SymbolId>(_reverse.size());
  _map.emplace(std::move(key), id);
  _reverse.emplace_back(std::string(exchange), std::string(token));
  return id;
}

std::optional<SymbolId> SymbolRegistry::getSymbolId(std::string_view exchange,
                                                    std::string_view token) const
{
  std::lock_guard lock(_mutex);
  auto it = _map.find(makeKey(exchange, token));
  if (it == _map.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::pair<std::string, std::string>> SymbolRegistry::getSymbolName(SymbolId id) const
{
  std::lock_guard lock(_mutex);
  if (id >= _reverse.size())
  {
    return std::nullopt;
  }
  return _reverse[id];
}

std::string SymbolRegistry::describe(SymbolId id) const
{
  if (auto name = getSymbolName(id))
  {
    return name->first + ":" + name->second;
  }
  return "#" + std::to_string(id);
}

size_t SymbolRegistry::size() const
{
  std::lock_guard lock(_mutex);
  return _reverse.size();
}

void SymbolRegistry::clear()
{
  std::lock_guard lock(_mutex);
  _map.clear();
  _reverse.clear();
}

}  // namespace barflow
