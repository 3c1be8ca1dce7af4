/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/aggregator/aggregator_registry.h"
#include "capflow/aggregator/market_cap_aggregator.h"
#include "capflow/bus/message_bus.h"
#include "capflow/bus/payload_codec.h"

#include <benchmark/benchmark.h>
#include <random>

using namespace capflow;

namespace
{

SwapEvent makeSwap(const std::string& token, TimestampMs ts, double price)
{
  SwapEvent s;
  s.tokenAddress = token;
  s.timestampMs = ts;
  s.source = SwapSource::PumpFun;
  s.amountToken = 1000.0;
  s.priceUsd = price;
  return s;
}

}  // namespace

// =============================================================================
// MarketCapAggregator benchmarks
// =============================================================================

static void BM_MarketCapAggregator_ProcessSwap(benchmark::State& state)
{
  MarketCapAggregator aggregator("Mint", timeframe::M1, 1'000'000'000);

  std::mt19937 rng(42);
  std::uniform_real_distribution<> priceDist(0.00001, 0.00002);

  TimestampMs ts = 0;
  for (auto _ : state)
  {
    ts += 250;  // rolls a bucket every 240 swaps
    auto update = aggregator.processSwap(makeSwap("Mint", ts, priceDist(rng)));
    benchmark::DoNotOptimize(update);
  }
}
BENCHMARK(BM_MarketCapAggregator_ProcessSwap);

static void BM_MarketCapAggregator_ProcessSwapWithBus(benchmark::State& state)
{
  MessageBus bus;
  bus.connect();
  MarketCapAggregator aggregator("Mint", timeframe::M1, 1'000'000'000, &bus);

  std::mt19937 rng(42);
  std::uniform_real_distribution<> priceDist(0.00001, 0.00002);

  TimestampMs ts = 0;
  for (auto _ : state)
  {
    ts += 250;
    auto update = aggregator.processSwap(makeSwap("Mint", ts, priceDist(rng)));
    benchmark::DoNotOptimize(update);
  }
  bus.disconnect();
}
BENCHMARK(BM_MarketCapAggregator_ProcessSwapWithBus);

static void BM_MarketCapAggregator_ChartCandles(benchmark::State& state)
{
  const auto history = static_cast<size_t>(state.range(0));
  MarketCapAggregator aggregator("Mint", timeframe::M1, 1'000'000'000, nullptr, history);

  for (size_t i = 0; i < history + 1; ++i)
  {
    aggregator.processSwap(makeSwap("Mint", static_cast<TimestampMs>(i) * 60'000, 0.00001));
  }

  for (auto _ : state)
  {
    auto rows = aggregator.chartCandles();
    benchmark::DoNotOptimize(rows);
  }
}
BENCHMARK(BM_MarketCapAggregator_ChartCandles)->Arg(100)->Arg(500);

// =============================================================================
// AggregatorRegistry benchmarks
// =============================================================================

static void BM_AggregatorRegistry_ProcessSwap_ManyTokens(benchmark::State& state)
{
  const auto tokenCount = static_cast<size_t>(state.range(0));

  EngineConfig config;
  AggregatorRegistry registry(config);

  std::vector<std::string> tokens;
  for (size_t i = 0; i < tokenCount; ++i)
  {
    tokens.push_back("Mint" + std::to_string(i));
  }

  std::mt19937 rng(42);
  std::uniform_real_distribution<> priceDist(0.00001, 0.00002);
  std::uniform_int_distribution<size_t> tokenDist(0, tokenCount - 1);

  TimestampMs ts = 0;
  for (auto _ : state)
  {
    ts += 100;
    auto updates = registry.processSwap(makeSwap(tokens[tokenDist(rng)], ts, priceDist(rng)));
    benchmark::DoNotOptimize(updates);
  }
}
BENCHMARK(BM_AggregatorRegistry_ProcessSwap_ManyTokens)->Arg(1)->Arg(100)->Arg(1000);

// =============================================================================
// Codec benchmarks
// =============================================================================

static void BM_Codec_EncodeCandleUpdate(benchmark::State& state)
{
  CandleUpdate update;
  update.token = "So11111111111111111111111111111111111111112";
  update.timeframe = timeframe::M5;
  update.candle = Candle(300'000, 10000.0, 25.0);
  update.candle.high = 12000.5;
  update.candle.low = 9000.25;

  for (auto _ : state)
  {
    auto text = codec::encodeCandleUpdate(update);
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_Codec_EncodeCandleUpdate);

static void BM_Codec_DecodeSwapEvent(benchmark::State& state)
{
  const std::string line = codec::encodeSwapEvent(makeSwap("Mint", 1'700'000'000'000, 0.0000123));

  for (auto _ : state)
  {
    auto swap = codec::decodeSwapEvent(line);
    benchmark::DoNotOptimize(swap);
  }
}
BENCHMARK(BM_Codec_DecodeSwapEvent);

BENCHMARK_MAIN();
