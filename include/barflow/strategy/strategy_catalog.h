/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/strategy/abstract_candle_strategy.h"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace barflow
{

/// Maps strategy identifiers to implementations. Populated at startup;
/// lookups are resolved per dispatch, so an unknown identifier only fails the
/// evaluation that asked for it.
class StrategyCatalog
{
 public:
  /// Replaces an existing entry with the same id.
  /// Throws std::invalid_argument for an empty id or a null strategy.
  void add(std::string id, std::shared_ptr<const ICandleStrategy> strategy);

  template <typename T, typename... Args>
  void emplace(std::string id, Args&&... args)
  {
    add(std::move(id), std::make_shared<const T>(std::forward<Args>(args)...));
  }

  bool remove(std::string_view id);

  std::shared_ptr<const ICandleStrategy> find(std::string_view id) const;
  bool contains(std::string_view id) const { return find(id) != nullptr; }

  std::vector<std::string> ids() const;
  size_t size() const;

 private:
  mutable std::shared_mutex _mutex;
  std::map<std::string, std::shared_ptr<const ICandleStrategy>, std::less<>> _strategies;
};

}  // namespace barflow
