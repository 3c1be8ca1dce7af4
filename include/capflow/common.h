/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace capflow
{

enum class Side : uint8_t
{
  BUY,
  SELL
};

using TimestampMs = int64_t;
using Supply = uint64_t;
using ConnectionId = uint64_t;

static constexpr ConnectionId InvalidConnectionId = 0;

// Market cap, price and volume are carried as USD doubles.
using UsdValue = double;

inline TimestampMs nowMs()
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace capflow
