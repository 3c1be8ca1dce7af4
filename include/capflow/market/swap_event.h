/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/common.h"

#include <array>
#include <string>
#include <string_view>

namespace capflow
{

enum class SwapSource : uint8_t
{
  PumpFun,
  Raydium,
  Jupiter,
  Meteora,
  Orca,
  Unknown
};

inline constexpr std::array<SwapSource, 5> kKnownSwapSources = {
    SwapSource::PumpFun, SwapSource::Raydium, SwapSource::Jupiter, SwapSource::Meteora,
    SwapSource::Orca};

std::string_view toString(SwapSource source) noexcept;

/// Resolves a venue tag ("pump_fun", "raydium", ...). Throws std::invalid_argument
/// for names outside the closed set.
SwapSource swapSourceFromString(std::string_view name);

std::string_view toString(Side side) noexcept;

struct SwapEvent
{
  std::string signature;
  TimestampMs timestampMs{0};
  SwapSource source{SwapSource::Unknown};
  Side side{Side::BUY};
  std::string tokenAddress;
  double amountToken{0.0};
  double amountBase{0.0};
  UsdValue priceUsd{0.0};
  UsdValue marketCapUsd{0.0};  // 0 = not provided
  std::string trader;

  UsdValue volumeUsd() const noexcept { return amountToken * priceUsd; }
};

}  // namespace capflow
