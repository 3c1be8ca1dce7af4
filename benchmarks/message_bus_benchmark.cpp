/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/bus/channel_listener.h"
#include "capflow/bus/channels.h"
#include "capflow/bus/message_bus.h"

#include <benchmark/benchmark.h>

#include <memory>
#include <vector>

using namespace capflow;

namespace
{

class CountingListener : public IChannelListener
{
 public:
  void onMessage(std::string_view, std::string_view payload) override { bytes += payload.size(); }
  size_t bytes = 0;
};

}  // namespace

static void BM_MessageBus_PublishInProcess(benchmark::State& state)
{
  const auto listenerCount = static_cast<size_t>(state.range(0));

  MessageBus bus;
  bus.connect();

  const auto channel = channels::candles("Mint", timeframe::M1);
  std::vector<std::unique_ptr<CountingListener>> listeners;
  for (size_t i = 0; i < listenerCount; ++i)
  {
    listeners.push_back(std::make_unique<CountingListener>());
    bus.subscribe(channel, listeners.back().get());
  }

  const std::string payload(180, 'p');
  for (auto _ : state)
  {
    bus.publish(channel, payload);
  }

  bus.disconnect();
}
BENCHMARK(BM_MessageBus_PublishInProcess)->Arg(1)->Arg(8)->Arg(64);

static void BM_MessageBus_PublishCandle(benchmark::State& state)
{
  MessageBus bus;
  bus.connect();

  CountingListener listener;
  bus.subscribe(channels::candles("Mint", timeframe::M1), &listener);

  CandleUpdate update;
  update.token = "Mint";
  update.timeframe = timeframe::M1;
  update.candle = Candle(60'000, 10000.0, 5.0);

  for (auto _ : state)
  {
    bus.publishCandle(update);
  }

  bus.disconnect();
}
BENCHMARK(BM_MessageBus_PublishCandle);

static void BM_MessageBus_CacheRoundTrip(benchmark::State& state)
{
  MessageBus bus;
  bus.connect();

  for (auto _ : state)
  {
    bus.cacheQuote("So111", "Mint", 1'000'000, R"({"outAmount":"42"})");
    auto quote = bus.cachedQuote("So111", "Mint", 1'000'000);
    benchmark::DoNotOptimize(quote);
  }

  bus.disconnect();
}
BENCHMARK(BM_MessageBus_CacheRoundTrip);

BENCHMARK_MAIN();
