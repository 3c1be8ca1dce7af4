/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/aggregator/timeframe.h"
#include "capflow/common.h"

#include <cstdint>
#include <string>

namespace capflow
{

/// OHLC are market cap in USD, not price.
struct Candle
{
  TimestampMs startMs{0};
  UsdValue open{};
  UsdValue high{};
  UsdValue low{};
  UsdValue close{};
  UsdValue volume{};
  uint32_t trades{0};
  bool closed{false};

  Candle() = default;

  Candle(TimestampMs start, UsdValue marketCap, UsdValue vol)
      : startMs(start),
        open(marketCap),
        high(marketCap),
        low(marketCap),
        close(marketCap),
        volume(vol),
        trades(1)
  {
  }

  static Candle flat(TimestampMs start, UsdValue level)
  {
    Candle c(start, level, 0.0);
    c.trades = 0;
    c.closed = true;
    return c;
  }

  int64_t timeSec() const noexcept { return startMs / 1000; }

  bool operator==(const Candle&) const = default;
};

struct CandleUpdate
{
  std::string token;
  Timeframe timeframe;
  Candle candle;
  bool isClosed{false};
};

struct SupplyChange
{
  std::string token;
  Supply oldSupply{0};
  Supply newSupply{0};
  UsdValue oldMarketCap{0.0};
  UsdValue newMarketCap{0.0};
  TimestampMs timestampMs{0};
};

/// Row sent to chart collaborators.
struct ChartCandle
{
  int64_t time{0};
  UsdValue open{};
  UsdValue high{};
  UsdValue low{};
  UsdValue close{};
  UsdValue volume{};
};

}  // namespace capflow
