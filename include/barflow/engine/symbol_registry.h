/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "barflow/common.h"

namespace barflow
{

/// Assigns dense SymbolIds to (exchange, token) pairs such as ("NSE", "3045").
class SymbolRegistry
{
 public:
  /// Idempotent: the same pair always yields the same id.
  SymbolId registerSymbol(std::string_view exchange, std::string_view token);

  std::optional<SymbolId> getSymbolId(std::string_view exchange, std::string_view token) const;
  std::optional<std::pair<std::string, std::string>> getSymbolName(SymbolId id) const;

  /// "NSE:3045", or "#<id>" for an unknown id.
  std::string describe(SymbolId id) const;

  size_t size() const;
  void clear();

 private:
  static std::string makeKey(std::string_view exchange, std::string_view token);

  mutable std::mutex _mutex;
  std::unordered_map<std::string, SymbolId> _map;
  std::vector<std::pair<std::string, std::string>> _reverse;
};

}  // namespace barflow
