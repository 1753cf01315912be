/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <cmath>
#include <compare>
#include <cstdint>
#include <ostream>

namespace barflow
{

/// Fixed-point decimal with a compile-time scale.
/// Tag keeps prices, quantities and volumes from mixing by accident.
template <typename Tag, int64_t ScaleV, int64_t TickV = 1>
class Decimal
{
 public:
  static constexpr int64_t Scale = ScaleV;
  static constexpr int64_t Tick = TickV;

  constexpr Decimal() = default;

  static constexpr Decimal fromRaw(int64_t raw) noexcept
  {
    Decimal d;
    d._raw = raw;
    return d;
  }

  static Decimal fromDouble(double value) noexcept
  {
    return fromRaw(static_cast<int64_t>(std::llround(value * static_cast<double>(Scale))));
  }

  static constexpr Decimal fromInt(int64_t value) noexcept { return fromRaw(value * Scale); }

  constexpr int64_t raw() const noexcept { return _raw; }
  double toDouble() const noexcept { return static_cast<double>(_raw) / static_cast<double>(Scale); }

  constexpr bool isZero() const noexcept { return _raw == 0; }

  /// Rounds down to the nearest multiple of the tick.
  constexpr Decimal roundToTick() const noexcept { return fromRaw((_raw / Tick) * Tick); }

  constexpr auto operator<=>(const Decimal&) const noexcept = default;

  constexpr Decimal operator+(Decimal other) const noexcept { return fromRaw(_raw + other._raw); }
  constexpr Decimal operator-(Decimal other) const noexcept { return fromRaw(_raw - other._raw); }
  constexpr Decimal operator-() const noexcept { return fromRaw(-_raw); }

  constexpr Decimal& operator+=(Decimal other) noexcept
  {
    _raw += other._raw;
    return *this;
  }

  constexpr Decimal& operator-=(Decimal other) noexcept
  {
    _raw -= other._raw;
    return *this;
  }

  constexpr Decimal operator*(int64_t factor) const noexcept { return fromRaw(_raw * factor); }
  constexpr Decimal operator/(int64_t divisor) const noexcept { return fromRaw(_raw / divisor); }

  friend std::ostream& operator<<(std::ostream& os, Decimal d) { return os << d.toDouble(); }

 private:
  int64_t _raw{0};
};

}  // namespace barflow
