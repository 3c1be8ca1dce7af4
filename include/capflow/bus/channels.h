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

#include <cstdint>
#include <string>
#include <string_view>

namespace capflow::channels
{

enum class ChannelKind : uint8_t
{
  Candle,
  SupplyChange,
  Swap,
  Other
};

inline std::string candles(std::string_view token, const Timeframe& tf)
{
  return "candles:" + std::string(token) + ":" + tf.label();
}

inline std::string supplyChange(std::string_view token)
{
  return "supply_change:" + std::string(token);
}

inline std::string swaps(std::string_view token)
{
  return "swaps:" + std::string(token);
}

inline std::string quoteKey(std::string_view inputMint, std::string_view outputMint, uint64_t amount)
{
  return "quote:" + std::string(inputMint) + ":" + std::string(outputMint) + ":" +
         std::to_string(amount);
}

inline std::string tokenInfoKey(std::string_view token)
{
  return "token_info:" + std::string(token);
}

inline ChannelKind classify(std::string_view channel)
{
  if (channel.starts_with("candles:"))
  {
    return ChannelKind::Candle;
  }
  if (channel.starts_with("supply_change:"))
  {
    return ChannelKind::SupplyChange;
  }
  if (channel.starts_with("swaps:"))
  {
    return ChannelKind::Swap;
  }
  return ChannelKind::Other;
}

/// Token segment of "candles:{token}:{tf}" / "swaps:{token}" / "supply_change:{token}".
inline std::string_view tokenOf(std::string_view channel)
{
  auto first = channel.find(':');
  if (first == std::string_view::npos)
  {
    return {};
  }
  auto rest = channel.substr(first + 1);
  auto second = rest.find(':');
  return second == std::string_view::npos ? rest : rest.substr(0, second);
}

}  // namespace capflow::channels
