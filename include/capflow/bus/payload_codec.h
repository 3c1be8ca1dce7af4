/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/aggregator/candle.h"
#include "capflow/market/swap_event.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace capflow::codec
{

// {"token":..,"timeframe":"1m","time":..,"open":..,"high":..,"low":..,"close":..,
//  "volume":..,"trades":..,"is_closed":..}
std::string encodeCandleUpdate(const CandleUpdate& update);
std::optional<CandleUpdate> decodeCandleUpdate(std::string_view payload);

std::string encodeSupplyChange(const SupplyChange& change);

// {"signature":..,"timestamp":..,"source":"raydium","side":"buy","token":..,
//  "amount_token":..,"amount_base":..,"price_usd":..,"market_cap_usd":..,"trader":..}
std::string encodeSwapEvent(const SwapEvent& swap);

/// nullopt when a required field is missing or the source/side is unknown.
std::optional<SwapEvent> decodeSwapEvent(std::string_view payload);

// [{"time":..,"open":..,"high":..,"low":..,"close":..,"volume":..}, ...]
std::string encodeChartCandles(const std::vector<ChartCandle>& candles);

}  // namespace capflow::codec
