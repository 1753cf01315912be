/*
 * BarFlow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "barflow/aggregator/timeframe.h"
#include "barflow/common.h"

#include <optional>
#include <string>
#include <string_view>

namespace barflow
{

enum class SignalSide : uint8_t
{
  Neutral,
  Buy,
  Sell
};

inline constexpr std::string_view toString(SignalSide side) noexcept
{
  switch (side)
  {
    case SignalSide::Buy:
      return "buy";
    case SignalSide::Sell:
      return "sell";
    case SignalSide::Neutral:
      return "neutral";
  }
  return "neutral";
}

inline constexpr std::optional<SignalSide> parseSignalSide(std::string_view s) noexcept
{
  if (s == "buy")
  {
    return SignalSide::Buy;
  }
  if (s == "sell")
  {
    return SignalSide::Sell;
  }
  if (s == "neutral")
  {
    return SignalSide::Neutral;
  }
  return std::nullopt;
}

struct Signal
{
  SymbolId symbol{};
  TimeframeId timeframe{};
  SignalSide side{SignalSide::Neutral};
  Price price{};          // close of the candle that triggered the evaluation
  TimePoint candleTime{};  // start of that candle
  Quantity quantity{};    // zero lets the sink pick its default
  std::string strategyId;

  std::optional<Side> orderSide() const noexcept
  {
    switch (side)
    {
      case SignalSide::Buy:
        return Side::BUY;
      case SignalSide::Sell:
        return Side::SELL;
      case SignalSide::Neutral:
        break;
    }
    return std::nullopt;
  }
};

}  // namespace barflow
