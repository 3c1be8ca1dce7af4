/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace capflow
{

enum class MessagePriority : uint8_t
{
  LOW = 1,       // trades, general updates
  NORMAL = 2,    // open candle updates
  HIGH = 3,      // supply changes, important notifications
  CRITICAL = 4   // closed candles
};

inline std::string_view toString(MessagePriority p) noexcept
{
  switch (p)
  {
    case MessagePriority::LOW:
      return "LOW";
    case MessagePriority::NORMAL:
      return "NORMAL";
    case MessagePriority::HIGH:
      return "HIGH";
    case MessagePriority::CRITICAL:
      return "CRITICAL";
  }
  return "?";
}

}  // namespace capflow
