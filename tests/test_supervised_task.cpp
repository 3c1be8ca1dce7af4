/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/util/concurrency/supervised_task.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace capflow;
using namespace std::chrono_literals;

TEST(SupervisedTaskTest, StopInterruptsWaitingBody)
{
  SupervisedTask task;
  std::atomic<int> iterations{0};

  ASSERT_TRUE(task.start("ticker",
                         [&](StopSignal& signal)
                         {
                           while (!signal.waitFor(1ms))
                           {
                             ++iterations;
                           }
                         }));
  EXPECT_EQ(task.name(), "ticker");

  while (iterations.load() < 3)
  {
    std::this_thread::sleep_for(1ms);
  }
  EXPECT_TRUE(task.running());

  const auto begin = std::chrono::steady_clock::now();
  task.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
  EXPECT_FALSE(task.running());
}

TEST(SupervisedTaskTest, SecondStartIsRejectedWhileRunning)
{
  SupervisedTask task;
  ASSERT_TRUE(task.start("a", [](StopSignal& s) { s.waitFor(10s); }));
  EXPECT_FALSE(task.start("b", [](StopSignal&) {}));
  task.stop();

  // restartable after a full stop
  EXPECT_TRUE(task.start("c", [](StopSignal&) {}));
  task.stop();
}

TEST(SupervisedTaskTest, StopHookUnblocksForeignWait)
{
  std::mutex m;
  std::condition_variable cv;
  bool released = false;

  SupervisedTask task;
  task.start(
      "blocked",
      [&](StopSignal&)
      {
        std::unique_lock lock(m);
        cv.wait(lock, [&] { return released; });
      },
      [&]
      {
        {
          std::lock_guard lock(m);
          released = true;
        }
        cv.notify_all();
      });

  task.stop();
  EXPECT_FALSE(task.running());
}

TEST(SupervisedTaskTest, FinishedBodyReportsNotRunning)
{
  SupervisedTask task;
  std::atomic<bool> done{false};
  task.start("oneshot", [&](StopSignal&) { done = true; });

  while (!done.load())
  {
    std::this_thread::sleep_for(1ms);
  }
  for (int i = 0; i < 1000 && task.running(); ++i)
  {
    std::this_thread::sleep_for(1ms);
  }
  EXPECT_FALSE(task.running());
  task.stop();
}

TEST(SupervisedTaskTest, StopFromOwnThreadDoesNotDeadlock)
{
  auto task = std::make_shared<SupervisedTask>();
  std::atomic<bool> returned{false};

  task->start("self-stop",
              [task, &returned](StopSignal&)
              {
                task->stop();
                returned = true;
              });

  for (int i = 0; i < 1000 && !returned.load(); ++i)
  {
    std::this_thread::sleep_for(1ms);
  }
  EXPECT_TRUE(returned.load());
}

TEST(SupervisedTaskTest, StopWithoutStartIsHarmless)
{
  SupervisedTask task;
  task.stop();
  EXPECT_FALSE(task.running());
}
