/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/market/swap_event.h"

#include <stdexcept>

namespace capflow
{

std::string_view toString(SwapSource source) noexcept
{
  switch (source)
  {
    case SwapSource::PumpFun:
      return "pump_fun";
    case SwapSource::Raydium:
      return "raydium";
    case SwapSource::Jupiter:
      return "jupiter";
    case SwapSource::Meteora:
      return "meteora";
    case SwapSource::Orca:
      return "orca";
    case SwapSource::Unknown:
      break;
  }
  return "unknown";
}

SwapSource swapSourceFromString(std::string_view name)
{
  for (auto source : kKnownSwapSources)
  {
    if (toString(source) == name)
    {
      return source;
    }
  }
  throw std::invalid_argument("Unknown swap source: " + std::string(name));
}

std::string_view toString(Side side) noexcept
{
  return side == Side::BUY ? "buy" : "sell";
}

}  // namespace capflow
