/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/aggregator/aggregator_registry.h"
#include "capflow/bus/channels.h"
#include "capflow/bus/message_bus.h"

#include <gtest/gtest.h>

#include <thread>

using namespace capflow;

namespace
{

SwapEvent makeSwap(const std::string& token, double price, TimestampMs ts)
{
  SwapEvent swap;
  swap.signature = token + "-" + std::to_string(ts);
  swap.timestampMs = ts;
  swap.source = SwapSource::PumpFun;
  swap.side = Side::SELL;
  swap.tokenAddress = token;
  swap.amountToken = 10.0;
  swap.priceUsd = price;
  return swap;
}

class CountingListener : public IChannelListener
{
 public:
  void onMessage(std::string_view, std::string_view) override { ++count; }
  int count = 0;
};

EngineConfig testConfig()
{
  EngineConfig cfg;
  cfg.defaultSupply = 1'000'000'000;
  cfg.historySize = 50;
  return cfg;
}

}  // namespace

TEST(AggregatorRegistryTest, GetOrCreateIsIdempotent)
{
  AggregatorRegistry registry(testConfig());

  auto a = registry.getOrCreate("T", timeframe::M1, 1'000'000);
  a->processSwap(makeSwap("T", 0.01, 1000));

  auto b = registry.getOrCreate("T", timeframe::M1, 5'000'000);
  EXPECT_EQ(a.get(), b.get());
  EXPECT_EQ(b->supply(), 1'000'000u);
  ASSERT_TRUE(b->currentCandle().has_value());
  EXPECT_DOUBLE_EQ(b->currentCandle()->close, 10000.0);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(AggregatorRegistryTest, NewAggregatorsUseDefaultSupply)
{
  AggregatorRegistry registry(testConfig());

  auto agg = registry.getOrCreate("T", timeframe::M5);
  EXPECT_EQ(agg->supply(), 1'000'000'000u);
  EXPECT_EQ(agg->timeframe(), timeframe::M5);
  EXPECT_EQ(agg->token(), "T");
}

TEST(AggregatorRegistryTest, HintRefreshesCacheForLaterAggregators)
{
  AggregatorRegistry registry(testConfig());

  registry.getOrCreate("T", timeframe::M1, 42'000);
  ASSERT_TRUE(registry.cachedSupply("T").has_value());
  EXPECT_EQ(*registry.cachedSupply("T"), 42'000u);

  auto other = registry.getOrCreate("T", timeframe::H1);
  EXPECT_EQ(other->supply(), 42'000u);
}

TEST(AggregatorRegistryTest, StaleCachedSupplyIsIgnored)
{
  auto cfg = testConfig();
  cfg.supplyTtl = std::chrono::seconds(0);
  AggregatorRegistry registry(cfg);

  registry.getOrCreate("T", timeframe::M1, 42'000);
  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  EXPECT_FALSE(registry.cachedSupply("T").has_value());
  EXPECT_EQ(registry.getOrCreate("U", timeframe::M5)->supply(), 1'000'000'000u);
}

TEST(AggregatorRegistryTest, StaleCacheSeedsFromRunningSibling)
{
  auto cfg = testConfig();
  cfg.supplyTtl = std::chrono::seconds(0);
  AggregatorRegistry registry(cfg);

  auto m1 = registry.getOrCreate("T", timeframe::M1, 42'000);
  m1->processSwap(makeSwap("T", 0.5, 1000));
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  ASSERT_FALSE(registry.cachedSupply("T").has_value());

  auto h1 = registry.getOrCreate("T", timeframe::H1);
  EXPECT_EQ(h1->supply(), 42'000u);

  h1->processSwap(makeSwap("T", 0.5, 2000));
  EXPECT_DOUBLE_EQ(h1->lastMarketCap(), m1->lastMarketCap());
}

TEST(AggregatorRegistryTest, DuplicateTimeframesCountSwapOnce)
{
  auto cfg = testConfig();
  cfg.timeframes = {timeframe::M1, timeframe::M1, timeframe::M5};
  AggregatorRegistry registry(cfg);

  ASSERT_EQ(registry.timeframes().size(), 2u);

  auto updates = registry.processSwap(makeSwap("T", 0.01, 1000));
  EXPECT_EQ(updates.size(), 2u);

  auto candle = registry.find("T", timeframe::M1)->currentCandle();
  ASSERT_TRUE(candle.has_value());
  EXPECT_EQ(candle->trades, 1u);
  EXPECT_DOUBLE_EQ(candle->volume, 0.1);

  auto explicitUpdates =
      registry.processSwap(makeSwap("T", 0.01, 2000), {timeframe::M1, timeframe::M1});
  EXPECT_EQ(explicitUpdates.size(), 1u);
  EXPECT_EQ(registry.find("T", timeframe::M1)->currentCandle()->trades, 2u);
}

TEST(AggregatorRegistryTest, ProcessSwapFansOutToDefaultTimeframes)
{
  MessageBus bus;
  bus.connect();
  CountingListener m1, m5, m15, h1;
  bus.subscribe(channels::candles("T", timeframe::M1), &m1);
  bus.subscribe(channels::candles("T", timeframe::M5), &m5);
  bus.subscribe(channels::candles("T", timeframe::M15), &m15);
  bus.subscribe(channels::candles("T", timeframe::H1), &h1);

  AggregatorRegistry registry(testConfig(), &bus);
  auto updates = registry.processSwap(makeSwap("T", 0.001, 1000));

  ASSERT_EQ(updates.size(), 4u);
  EXPECT_EQ(updates[0].timeframe, timeframe::M1);
  EXPECT_EQ(updates[3].timeframe, timeframe::H1);
  EXPECT_EQ(registry.size(), 4u);
  EXPECT_EQ(m1.count, 1);
  EXPECT_EQ(m5.count, 1);
  EXPECT_EQ(m15.count, 1);
  EXPECT_EQ(h1.count, 1);
}

TEST(AggregatorRegistryTest, ProcessSwapWithExplicitTimeframes)
{
  AggregatorRegistry registry(testConfig());
  auto updates = registry.processSwap(makeSwap("T", 0.001, 1000), {timeframe::S30});

  ASSERT_EQ(updates.size(), 1u);
  EXPECT_EQ(updates[0].timeframe, timeframe::S30);
  EXPECT_NE(registry.find("T", timeframe::S30), nullptr);
  EXPECT_EQ(registry.find("T", timeframe::M1), nullptr);
}

TEST(AggregatorRegistryTest, InvalidSwapCreatesNothing)
{
  AggregatorRegistry registry(testConfig());
  EXPECT_TRUE(registry.processSwap(makeSwap("T", 0.0, 1000)).empty());
  EXPECT_EQ(registry.size(), 0u);
}

TEST(AggregatorRegistryTest, RemoveTokenDropsAggregatorsAndSupply)
{
  AggregatorRegistry registry(testConfig());
  registry.getOrCreate("A", timeframe::M1, 10);
  registry.processSwap(makeSwap("A", 0.1, 1000));
  registry.processSwap(makeSwap("B", 0.1, 1000));

  registry.removeToken("A");

  EXPECT_EQ(registry.size(), 4u);
  EXPECT_FALSE(registry.cachedSupply("A").has_value());
  EXPECT_EQ(registry.tokens(), std::vector<std::string>{"B"});
  EXPECT_TRUE(registry.candles("A", timeframe::M1).empty());
  EXPECT_EQ(registry.candles("B", timeframe::M1).size(), 1u);
}

TEST(AggregatorRegistryTest, SupplyChangeReachesEveryTimeframe)
{
  AggregatorRegistry registry(testConfig());
  registry.getOrCreate("T", timeframe::M1, 1'000'000);
  registry.processSwap(makeSwap("T", 0.01, 1000));

  registry.onSupplyChange("T", 3'000'000);

  for (const auto& tf : timeframe::defaults())
  {
    auto agg = registry.find("T", tf);
    ASSERT_NE(agg, nullptr);
    EXPECT_EQ(agg->supply(), 3'000'000u);
    EXPECT_DOUBLE_EQ(agg->currentCandle()->close, 30000.0);
  }
  EXPECT_EQ(*registry.cachedSupply("T"), 3'000'000u);
}

TEST(AggregatorRegistryTest, MintAndBurnAdjustCachedSupply)
{
  AggregatorRegistry registry(testConfig());
  registry.getOrCreate("T", timeframe::M1, 1'000);

  registry.applyMint("T", 500);
  EXPECT_EQ(registry.find("T", timeframe::M1)->supply(), 1'500u);

  registry.applyBurn("T", 200);
  EXPECT_EQ(registry.find("T", timeframe::M1)->supply(), 1'300u);

  registry.applyBurn("T", 10'000);
  EXPECT_EQ(registry.find("T", timeframe::M1)->supply(), 0u);
}

TEST(AggregatorRegistryTest, MintOnUnknownTokenStartsFromDefault)
{
  AggregatorRegistry registry(testConfig());
  registry.applyMint("X", 1);
  EXPECT_EQ(*registry.cachedSupply("X"), 1'000'000'001u);
}

TEST(AggregatorRegistryTest, ConcurrentTokensAreIndependent)
{
  AggregatorRegistry registry(testConfig());

  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t)
  {
    workers.emplace_back(
        [&registry, t]
        {
          const std::string token = "T" + std::to_string(t);
          for (int i = 0; i < 500; ++i)
          {
            registry.processSwap(makeSwap(token, 0.01, 1000 + i));
          }
        });
  }
  for (auto& w : workers)
  {
    w.join();
  }

  EXPECT_EQ(registry.size(), 16u);
  EXPECT_EQ(registry.tokens().size(), 4u);
  for (int t = 0; t < 4; ++t)
  {
    auto agg = registry.find("T" + std::to_string(t), timeframe::M1);
    ASSERT_NE(agg, nullptr);
    EXPECT_EQ(agg->currentCandle()->trades, 500u);
  }
}
