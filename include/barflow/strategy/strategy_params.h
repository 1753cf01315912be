/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace barflow
{

/// Named numeric strategy parameters, e.g. {"atr_length", 14}.
class StrategyParams
{
 public:
  using Storage = std::map<std::string, double, std::less<>>;

  StrategyParams() = default;
  StrategyParams(std::initializer_list<std::pair<const std::string, double>> values)
      : _values(values)
  {
  }

  void set(std::string name, double value) { _values.insert_or_assign(std::move(name), value); }

  bool contains(std::string_view name) const { return _values.find(name) != _values.end(); }

  std::optional<double> get(std::string_view name) const
  {
    auto it = _values.find(name);
    return it != _values.end() ? std::optional<double>(it->second) : std::nullopt;
  }

  double getOr(std::string_view name, double fallback) const { return get(name).value_or(fallback); }

  /// Throws std::invalid_argument when the parameter is missing.
  double require(std::string_view name) const;

  /// Throws std::invalid_argument when the parameter is missing or not integral.
  int64_t requireInt(std::string_view name) const;

  size_t size() const noexcept { return _values.size(); }
  bool empty() const noexcept { return _values.empty(); }

  Storage::const_iterator begin() const noexcept { return _values.begin(); }
  Storage::const_iterator end() const noexcept { return _values.end(); }

  bool operator==(const StrategyParams&) const = default;

  /// "atr_length=14, length=10"
  std::string toString() const;

 private:
  Storage _values;
};

}  // namespace barflow
