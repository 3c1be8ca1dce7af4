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
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace capflow
{

struct Timeframe
{
  int64_t ms{0};

  constexpr Timeframe() = default;
  explicit constexpr Timeframe(int64_t durationMs) : ms(durationMs) {}

  template <typename Rep, typename Period>
  static constexpr Timeframe of(std::chrono::duration<Rep, Period> d)
  {
    return Timeframe(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
  }

  constexpr int64_t bucketStart(int64_t timestampMs) const noexcept
  {
    // floor division so pre-epoch timestamps still align downwards
    const int64_t q = timestampMs / ms;
    const int64_t r = timestampMs % ms;
    return (r < 0 ? q - 1 : q) * ms;
  }

  /// Chart label in the largest unit that divides exactly: "1m", "90s", "4h", "1d",
  /// "1500ms". parse(label()) gives the same timeframe back.
  std::string label() const;

  /// Parses "<n><unit>" with unit in ms, s, m, h, d, w. Throws std::invalid_argument,
  /// also when the duration does not fit in int64 milliseconds.
  static Timeframe parse(std::string_view label);

  constexpr bool operator==(const Timeframe& other) const noexcept { return ms == other.ms; }
  constexpr bool operator!=(const Timeframe& other) const noexcept { return ms != other.ms; }
  constexpr bool operator<(const Timeframe& other) const noexcept { return ms < other.ms; }
};

namespace timeframe
{

using namespace std::chrono_literals;

inline constexpr Timeframe S30 = Timeframe::of(30s);
inline constexpr Timeframe M1 = Timeframe::of(60s);
inline constexpr Timeframe M5 = Timeframe::of(300s);
inline constexpr Timeframe M15 = Timeframe::of(900s);
inline constexpr Timeframe M30 = Timeframe::of(1800s);
inline constexpr Timeframe H1 = Timeframe::of(3600s);
inline constexpr Timeframe H4 = Timeframe::of(14400s);
inline constexpr Timeframe D1 = Timeframe::of(86400s);

inline std::vector<Timeframe> defaults()
{
  return {M1, M5, M15, H1};
}

}  // namespace timeframe

}  // namespace capflow

template <>
struct std::hash<capflow::Timeframe>
{
  std::size_t operator()(const capflow::Timeframe& tf) const noexcept
  {
    return std::hash<int64_t>{}(tf.ms);
  }
};
