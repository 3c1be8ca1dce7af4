/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/backpressure/backpressure_controller.h"
#include "capflow/backpressure/client_queue.h"

#include <benchmark/benchmark.h>

#include <atomic>
#include <string>

using namespace capflow;

// =============================================================================
// ClientQueue benchmarks
// =============================================================================

static void BM_ClientQueue_PushPop(benchmark::State& state)
{
  ClientQueue queue(1024, 10 * 1024 * 1024, 0.8);
  const std::string payload(256, 'x');

  for (auto _ : state)
  {
    queue.push(payload, MessagePriority::NORMAL, "candle");
    auto msg = queue.tryPop();
    benchmark::DoNotOptimize(msg);
  }
}
BENCHMARK(BM_ClientQueue_PushPop);

// Queue held at its limit: every critical push has to evict.
static void BM_ClientQueue_PushUnderPressure(benchmark::State& state)
{
  ClientQueue queue(100, 10 * 1024 * 1024, 0.8);
  const std::string payload(256, 'x');

  for (int i = 0; i < 100; ++i)
  {
    queue.push(payload, i % 2 ? MessagePriority::LOW : MessagePriority::NORMAL, "swap");
  }

  for (auto _ : state)
  {
    queue.push(payload, MessagePriority::CRITICAL, "candle");
    queue.push(payload, MessagePriority::LOW, "swap");
  }
  state.counters["evicted"] = static_cast<double>(queue.totalEvicted());
  state.counters["dropped"] = static_cast<double>(queue.totalDropped());
}
BENCHMARK(BM_ClientQueue_PushUnderPressure);

// =============================================================================
// BackpressureController benchmarks
// =============================================================================

namespace
{

class NullConnection : public IClientConnection
{
 public:
  explicit NullConnection(ConnectionId id) : _id(id) {}

  ConnectionId id() const override { return _id; }
  bool send(std::string_view payload) override
  {
    bytes.fetch_add(payload.size(), std::memory_order_relaxed);
    return true;
  }

  std::atomic<size_t> bytes{0};

 private:
  ConnectionId _id;
};

}  // namespace

static void BM_BackpressureController_Enqueue(benchmark::State& state)
{
  const auto clients = static_cast<ConnectionId>(state.range(0));

  BackpressureConfig config;
  config.minSendInterval = std::chrono::milliseconds(0);
  BackpressureController controller(config);
  for (ConnectionId id = 1; id <= clients; ++id)
  {
    controller.registerClient(std::make_shared<NullConnection>(id));
  }

  const std::string payload(200, 'c');
  ConnectionId next = 0;
  for (auto _ : state)
  {
    next = next % clients + 1;
    benchmark::DoNotOptimize(controller.enqueue(next, payload, MessagePriority::NORMAL, "candle"));
  }

  controller.stop();
}
BENCHMARK(BM_BackpressureController_Enqueue)->Arg(1)->Arg(16)->Arg(128);

BENCHMARK_MAIN();
