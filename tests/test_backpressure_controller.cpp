/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/backpressure/backpressure_controller.h"

#include <gtest/gtest.h>

#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace capflow;
using namespace std::chrono_literals;

namespace
{

class FakeConnection : public IClientConnection
{
 public:
  explicit FakeConnection(ConnectionId id) : _id(id) {}

  ConnectionId id() const override { return _id; }

  bool send(std::string_view payload) override
  {
    std::unique_lock lock(_mutex);
    _cv.wait(lock, [this] { return _open; });
    if (throwOnSend)
    {
      throw std::runtime_error("socket reset");
    }
    if (!healthy)
    {
      return false;
    }
    _sent.emplace_back(payload);
    _times.push_back(std::chrono::steady_clock::now());
    _cv.notify_all();
    return true;
  }

  void closeGate()
  {
    std::lock_guard lock(_mutex);
    _open = false;
  }

  void openGate()
  {
    {
      std::lock_guard lock(_mutex);
      _open = true;
    }
    _cv.notify_all();
  }

  bool waitForSent(size_t count, std::chrono::milliseconds timeout = 2s)
  {
    std::unique_lock lock(_mutex);
    return _cv.wait_for(lock, timeout, [&] { return _sent.size() >= count; });
  }

  std::vector<std::string> sent()
  {
    std::lock_guard lock(_mutex);
    return _sent;
  }

  std::vector<std::chrono::steady_clock::time_point> times()
  {
    std::lock_guard lock(_mutex);
    return _times;
  }

  std::atomic<bool> healthy{true};
  std::atomic<bool> throwOnSend{false};

 private:
  ConnectionId _id;
  std::mutex _mutex;
  std::condition_variable _cv;
  bool _open = true;
  std::vector<std::string> _sent;
  std::vector<std::chrono::steady_clock::time_point> _times;
};

BackpressureConfig fastConfig()
{
  BackpressureConfig cfg;
  cfg.minSendInterval = 1ms;
  return cfg;
}

}  // namespace

TEST(BackpressureControllerTest, UnknownConnectionIsRejected)
{
  BackpressureController controller(fastConfig());
  EXPECT_FALSE(controller.enqueue(99, "x", MessagePriority::CRITICAL));
  EXPECT_FALSE(controller.stats(99).has_value());
}

TEST(BackpressureControllerTest, RegisterValidatesIds)
{
  BackpressureController controller(fastConfig());
  EXPECT_FALSE(controller.registerClient(nullptr));
  EXPECT_FALSE(controller.registerClient(std::make_shared<FakeConnection>(InvalidConnectionId)));

  EXPECT_TRUE(controller.registerClient(std::make_shared<FakeConnection>(1)));
  EXPECT_FALSE(controller.registerClient(std::make_shared<FakeConnection>(1)));
  EXPECT_EQ(controller.clientCount(), 1u);
}

TEST(BackpressureControllerTest, DeliversHighestPriorityFirst)
{
  BackpressureController controller(fastConfig());
  auto conn = std::make_shared<FakeConnection>(1);
  ASSERT_TRUE(controller.registerClient(conn));

  conn->closeGate();
  ASSERT_TRUE(controller.enqueue(1, "warmup", MessagePriority::LOW));
  // the loop is now parked inside send("warmup")
  while (controller.stats(1)->queueSize != 0)
  {
    std::this_thread::sleep_for(1ms);
  }

  ASSERT_TRUE(controller.enqueue(1, "trade", MessagePriority::LOW, "swap"));
  ASSERT_TRUE(controller.enqueue(1, "open", MessagePriority::NORMAL, "candle"));
  ASSERT_TRUE(controller.enqueue(1, "supply", MessagePriority::HIGH, "supply_change"));
  ASSERT_TRUE(controller.enqueue(1, "closed", MessagePriority::CRITICAL, "candle"));
  conn->openGate();

  ASSERT_TRUE(conn->waitForSent(5));
  EXPECT_EQ(conn->sent(),
            (std::vector<std::string>{"warmup", "closed", "supply", "open", "trade"}));
}

TEST(BackpressureControllerTest, EnforcesMinimumSendInterval)
{
  BackpressureConfig cfg;
  cfg.minSendInterval = 20ms;
  BackpressureController controller(cfg);
  auto conn = std::make_shared<FakeConnection>(1);
  ASSERT_TRUE(controller.registerClient(conn));

  for (int i = 0; i < 5; ++i)
  {
    ASSERT_TRUE(controller.enqueue(1, std::to_string(i)));
  }
  ASSERT_TRUE(conn->waitForSent(5));

  auto times = conn->times();
  for (size_t i = 1; i < times.size(); ++i)
  {
    EXPECT_GE(times[i] - times[i - 1], 19ms);
  }
}

TEST(BackpressureControllerTest, FailingConnectionBecomesUnhealthy)
{
  BackpressureController controller(fastConfig());
  auto conn = std::make_shared<FakeConnection>(7);
  conn->healthy = false;

  std::promise<ConnectionId> unhealthy;
  controller.onUnhealthy([&](ConnectionId id) { unhealthy.set_value(id); });
  ASSERT_TRUE(controller.registerClient(conn));

  for (int i = 0; i < 30; ++i)
  {
    controller.enqueue(7, "m" + std::to_string(i));
  }

  auto future = unhealthy.get_future();
  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(future.get(), 7u);

  auto stats = controller.stats(7);
  ASSERT_TRUE(stats.has_value());
  EXPECT_LT(stats->healthScore, 0.1);
  EXPECT_GE(stats->totalFailed, 9u);
  EXPECT_EQ(stats->totalSent, 0u);

  // delivery stopped: remaining messages stay queued
  const auto left = stats->queueSize;
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(controller.stats(7)->queueSize, left);
}

TEST(BackpressureControllerTest, ThrowingSendCountsAsFailure)
{
  BackpressureController controller(fastConfig());
  auto conn = std::make_shared<FakeConnection>(3);
  conn->throwOnSend = true;
  ASSERT_TRUE(controller.registerClient(conn));

  ASSERT_TRUE(controller.enqueue(3, "x"));
  for (int i = 0; i < 200 && controller.stats(3)->totalFailed == 0; ++i)
  {
    std::this_thread::sleep_for(1ms);
  }

  auto stats = controller.stats(3);
  EXPECT_EQ(stats->totalFailed, 1u);
  EXPECT_NEAR(stats->healthScore, 0.9, 1e-9);
}

TEST(BackpressureControllerTest, UnregisterFromUnhealthyCallback)
{
  BackpressureController controller(fastConfig());
  auto conn = std::make_shared<FakeConnection>(5);
  conn->healthy = false;

  std::promise<void> done;
  controller.onUnhealthy(
      [&](ConnectionId id)
      {
        controller.unregisterClient(id);
        done.set_value();
      });
  ASSERT_TRUE(controller.registerClient(conn));
  for (int i = 0; i < 20; ++i)
  {
    controller.enqueue(5, "m");
  }

  ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready);
  EXPECT_EQ(controller.clientCount(), 0u);
  EXPECT_FALSE(controller.enqueue(5, "after"));
}

TEST(BackpressureControllerTest, UnregisterDiscardsQueue)
{
  BackpressureController controller(fastConfig());
  auto conn = std::make_shared<FakeConnection>(2);
  ASSERT_TRUE(controller.registerClient(conn));

  conn->closeGate();
  for (int i = 0; i < 10; ++i)
  {
    controller.enqueue(2, "pending");
  }

  std::thread opener(
      [conn]
      {
        std::this_thread::sleep_for(20ms);
        conn->openGate();
      });
  controller.unregisterClient(2);
  opener.join();

  EXPECT_FALSE(controller.stats(2).has_value());
  EXPECT_LE(conn->sent().size(), 1u);
  EXPECT_EQ(controller.clientCount(), 0u);
}

TEST(BackpressureControllerTest, StatsReportLimitsAndRates)
{
  BackpressureConfig cfg = fastConfig();
  cfg.maxQueueSize = 10;
  cfg.maxQueueBytes = 1000;
  BackpressureController controller(cfg);
  auto conn = std::make_shared<FakeConnection>(4);
  ASSERT_TRUE(controller.registerClient(conn));

  for (int i = 0; i < 3; ++i)
  {
    ASSERT_TRUE(controller.enqueue(4, "payload"));
  }
  ASSERT_TRUE(conn->waitForSent(3));

  auto stats = controller.stats(4);
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->maxQueueSize, 10u);
  EXPECT_EQ(stats->maxQueueBytes, 1000u);
  EXPECT_EQ(stats->totalSent, 3u);
  EXPECT_GT(stats->sendRate, 0.0);
  EXPECT_DOUBLE_EQ(stats->healthScore, 1.0);
  EXPECT_EQ(stats->consecutiveDrops, 0u);
}

TEST(BackpressureControllerTest, PressureDropsAreCounted)
{
  BackpressureConfig cfg = fastConfig();
  cfg.maxQueueSize = 10;
  BackpressureController controller(cfg);
  auto conn = std::make_shared<FakeConnection>(6);
  ASSERT_TRUE(controller.registerClient(conn));

  conn->closeGate();
  ASSERT_TRUE(controller.enqueue(6, "parked"));
  while (controller.stats(6)->queueSize != 0)
  {
    std::this_thread::sleep_for(1ms);
  }

  for (int i = 0; i < 8; ++i)
  {
    ASSERT_TRUE(controller.enqueue(6, "n"));
  }
  EXPECT_FALSE(controller.enqueue(6, "n"));
  EXPECT_FALSE(controller.enqueue(6, "n"));
  EXPECT_EQ(controller.stats(6)->queueSize, 8u);
  EXPECT_EQ(controller.stats(6)->consecutiveDrops, 2u);
  EXPECT_EQ(controller.stats(6)->totalDropped, 2u);

  EXPECT_TRUE(controller.enqueue(6, "closed", MessagePriority::CRITICAL));
  EXPECT_LE(controller.stats(6)->queueSize, 10u);
  conn->openGate();
}

TEST(BackpressureControllerTest, SlowClientDoesNotBlockOthers)
{
  BackpressureController controller(fastConfig());
  auto slow = std::make_shared<FakeConnection>(1);
  auto fast = std::make_shared<FakeConnection>(2);
  ASSERT_TRUE(controller.registerClient(slow));
  ASSERT_TRUE(controller.registerClient(fast));

  slow->closeGate();
  for (int i = 0; i < 20; ++i)
  {
    controller.enqueue(1, "s");
    controller.enqueue(2, "f");
  }

  EXPECT_TRUE(fast->waitForSent(20));
  EXPECT_TRUE(slow->sent().empty());
  slow->openGate();
}
