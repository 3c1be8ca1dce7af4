/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/aggregator/timeframe.h"

#include <charconv>
#include <limits>
#include <stdexcept>

namespace capflow
{

std::string Timeframe::label() const
{
  // largest unit that divides exactly, so distinct durations never share a label
  if (ms > 0 && ms % 86'400'000 == 0)
  {
    return std::to_string(ms / 86'400'000) + "d";
  }
  if (ms > 0 && ms % 3'600'000 == 0)
  {
    return std::to_string(ms / 3'600'000) + "h";
  }
  if (ms > 0 && ms % 60'000 == 0)
  {
    return std::to_string(ms / 60'000) + "m";
  }
  if (ms > 0 && ms % 1'000 == 0)
  {
    return std::to_string(ms / 1'000) + "s";
  }
  return std::to_string(ms) + "ms";
}

Timeframe Timeframe::parse(std::string_view label)
{
  if (label.size() < 2)
  {
    throw std::invalid_argument("Malformed timeframe: " + std::string(label));
  }

  const bool millis = label.size() > 2 && label.ends_with("ms");
  const char unit = millis ? '\0' : label.back();
  const auto digits = label.substr(0, label.size() - (millis ? 2 : 1));

  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() || value <= 0)
  {
    throw std::invalid_argument("Malformed timeframe: " + std::string(label));
  }

  int64_t multiplier = 0;
  switch (unit)
  {
    case '\0':
      multiplier = 1;
      break;
    case 's':
    case 'S':
      multiplier = 1'000;
      break;
    case 'm':
      multiplier = 60'000;
      break;
    case 'h':
    case 'H':
      multiplier = 3'600'000;
      break;
    case 'd':
    case 'D':
      multiplier = 86'400'000;
      break;
    case 'w':
    case 'W':
      multiplier = 604'800'000;
      break;
    default:
      throw std::invalid_argument("Unknown timeframe unit: " + std::string(label));
  }

  if (value > std::numeric_limits<int64_t>::max() / multiplier)
  {
    throw std::invalid_argument("Timeframe out of range: " + std::string(label));
  }
  return Timeframe(value * multiplier);
}

}  // namespace capflow
