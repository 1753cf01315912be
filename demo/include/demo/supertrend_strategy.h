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

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace demo
{

using namespace barflow;

// SuperTrend direction filtered by a close breakout.
// Params: atr_length, atr_multiplier, length.
//   buy:  trend is up and the close exceeds the highest close of the previous `length` candles
//   sell: trend is down and the close is below the lowest close of the previous `length` candles
class SuperTrendStrategy : public ICandleStrategy
{
 public:
  SignalSide evaluate(std::span<const Candle> history, const StrategyParams& params) const override
  {
    const int64_t atrLength = params.requireInt("atr_length");
    const double multiplier = params.require("atr_multiplier");
    const int64_t length = params.requireInt("length");
    if (atrLength <= 0 || length <= 0 || multiplier <= 0.0)
    {
      throw std::invalid_argument("SuperTrend parameters must be positive");
    }

    const size_t needed = std::max(static_cast<size_t>(atrLength), static_cast<size_t>(length)) + 1;
    if (history.size() < needed)
    {
      return SignalSide::Neutral;
    }

    const int direction = trendDirection(history, static_cast<size_t>(atrLength), multiplier);

    const double close = history.back().close.toDouble();
    double highest = -std::numeric_limits<double>::infinity();
    double lowest = std::numeric_limits<double>::infinity();
    for (size_t i = history.size() - 1 - static_cast<size_t>(length); i < history.size() - 1; ++i)
    {
      highest = std::max(highest, history[i].close.toDouble());
      lowest = std::min(lowest, history[i].close.toDouble());
    }

    if (direction > 0 && close > highest)
    {
      return SignalSide::Buy;
    }
    if (direction < 0 && close < lowest)
    {
      return SignalSide::Sell;
    }
    return SignalSide::Neutral;
  }

 private:
  // Wilder ATR seeded with a simple average, then the usual band ratchet.
  static int trendDirection(std::span<const Candle> c, size_t atrLength, double multiplier)
  {
    std::vector<double> tr(c.size(), 0.0);
    for (size_t i = 1; i < c.size(); ++i)
    {
      const double h = c[i].high.toDouble();
      const double l = c[i].low.toDouble();
      const double pc = c[i - 1].close.toDouble();
      tr[i] = std::max({h - l, std::fabs(h - pc), std::fabs(l - pc)});
    }

    double atr = 0.0;
    for (size_t i = 1; i <= atrLength; ++i)
    {
      atr += tr[i];
    }
    atr /= static_cast<double>(atrLength);

    double upper = 0.0;
    double lower = 0.0;
    int direction = 1;

    for (size_t i = atrLength; i < c.size(); ++i)
    {
      if (i > atrLength)
      {
        atr = (atr * static_cast<double>(atrLength - 1) + tr[i]) / static_cast<double>(atrLength);
      }

      const double mid = (c[i].high.toDouble() + c[i].low.toDouble()) / 2.0;
      const double basicUpper = mid + multiplier * atr;
      const double basicLower = mid - multiplier * atr;
      const double close = c[i].close.toDouble();

      if (i == atrLength)
      {
        upper = basicUpper;
        lower = basicLower;
        continue;
      }

      const double prevClose = c[i - 1].close.toDouble();
      const double prevUpper = upper;
      const double prevLower = lower;
      upper = (basicUpper < prevUpper || prevClose > prevUpper) ? basicUpper : prevUpper;
      lower = (basicLower > prevLower || prevClose < prevLower) ? basicLower : prevLower;

      if (close > prevUpper)
      {
        direction = 1;
      }
      else if (close < prevLower)
      {
        direction = -1;
      }
    }

    return direction;
  }
};

}  // namespace demo
