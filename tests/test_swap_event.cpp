/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/market/swap_event.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace capflow;

TEST(SwapEventTest, KnownSourcesRoundTripThroughNames)
{
  for (auto source : kKnownSwapSources)
  {
    EXPECT_EQ(swapSourceFromString(toString(source)), source);
  }
  EXPECT_EQ(toString(SwapSource::PumpFun), "pump_fun");
  EXPECT_EQ(toString(SwapSource::Unknown), "unknown");
}

TEST(SwapEventTest, UnknownSourceNameThrows)
{
  EXPECT_THROW(swapSourceFromString("uniswap"), std::invalid_argument);
  EXPECT_THROW(swapSourceFromString("unknown"), std::invalid_argument);
  EXPECT_THROW(swapSourceFromString(""), std::invalid_argument);
}

TEST(SwapEventTest, VolumeIsTokenAmountTimesPrice)
{
  SwapEvent swap;
  swap.amountToken = 2'000.0;
  swap.priceUsd = 0.005;
  EXPECT_DOUBLE_EQ(swap.volumeUsd(), 10.0);
}

TEST(SwapEventTest, SideNames)
{
  EXPECT_EQ(toString(Side::BUY), "buy");
  EXPECT_EQ(toString(Side::SELL), "sell");
}
