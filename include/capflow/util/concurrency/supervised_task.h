/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace capflow
{

/// Cancellation flag shared between a SupervisedTask and its body.
class StopSignal
{
 public:
  bool stopRequested() const noexcept { return _stop.load(std::memory_order_acquire); }

  /// Interruptible sleep. Returns true if stop was requested before the deadline.
  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> d)
  {
    std::unique_lock lock(_mutex);
    return _cv.wait_for(lock, d, [this] { return stopRequested(); });
  }

  void request()
  {
    {
      std::lock_guard lock(_mutex);
      _stop.store(true, std::memory_order_release);
    }
    _cv.notify_all();
  }

 private:
  std::atomic<bool> _stop{false};
  std::mutex _mutex;
  std::condition_variable _cv;
};

/**
 * Owns one background thread with an explicit lifecycle: start, requestStop,
 * join. The body receives the StopSignal and must return once it is raised.
 * An optional stop hook runs on requestStop() to unblock a body that waits on
 * something other than the signal (an io_context, a queue condition variable).
 */
class SupervisedTask
{
 public:
  using Body = std::function<void(StopSignal&)>;
  using StopHook = std::function<void()>;

  SupervisedTask() = default;
  ~SupervisedTask() { stop(); }

  SupervisedTask(const SupervisedTask&) = delete;
  SupervisedTask& operator=(const SupervisedTask&) = delete;

  bool start(std::string name, Body body, StopHook onStop = {})
  {
    std::lock_guard lock(_mutex);
    if (_thread.joinable())
    {
      return false;
    }

    _name = std::move(name);
    _signal = std::make_shared<StopSignal>();
    _finished = std::make_shared<std::atomic<bool>>(false);
    _onStop = std::move(onStop);

    _thread = std::thread(
        [signal = _signal, finished = _finished, body = std::move(body)]() mutable
        {
          body(*signal);
          finished->store(true, std::memory_order_release);
        });
    return true;
  }

  void requestStop()
  {
    StopHook hook;
    {
      std::lock_guard lock(_mutex);
      if (!_signal)
      {
        return;
      }
      _signal->request();
      hook = _onStop;
    }
    if (hook)
    {
      hook();
    }
  }

  /// Joins the thread. When called from the task's own thread the thread is
  /// detached instead; the body keeps its shared state alive until it returns.
  void join()
  {
    std::thread t;
    {
      std::lock_guard lock(_mutex);
      t = std::move(_thread);
    }
    if (!t.joinable())
    {
      return;
    }
    if (t.get_id() == std::this_thread::get_id())
    {
      t.detach();
      return;
    }
    t.join();
  }

  void stop()
  {
    requestStop();
    join();
  }

  bool running() const
  {
    std::lock_guard lock(_mutex);
    return _thread.joinable() && _finished && !_finished->load(std::memory_order_acquire);
  }

  const std::string& name() const { return _name; }

 private:
  mutable std::mutex _mutex;
  std::thread _thread;
  std::string _name;
  std::shared_ptr<StopSignal> _signal;
  std::shared_ptr<std::atomic<bool>> _finished;
  StopHook _onStop;
};

}  // namespace capflow
