/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/backpressure/message_priority.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace capflow
{

struct QueuedMessage
{
  std::string payload;
  MessagePriority priority{MessagePriority::NORMAL};
  std::chrono::steady_clock::time_point enqueuedAt{};
  std::string kind;
  uint64_t seq{0};
};

/**
 * Bounded outbound queue for one connection, ordered by priority (highest
 * first) and FIFO within a priority. Length and byte limits are enforced
 * before insertion, so they hold at all times.
 *
 * Safe for concurrent producers; popped by a single delivery loop.
 */
class ClientQueue
{
 public:
  ClientQueue(size_t maxSize, size_t maxBytes, double dropThreshold);

  /// Applies the drop/evict rules. Returns false when the message was dropped.
  bool push(std::string payload, MessagePriority priority, std::string kind);

  /// Blocks up to `timeout` for the highest-priority message. nullopt on
  /// timeout or after close().
  std::optional<QueuedMessage> waitPop(std::chrono::milliseconds timeout);
  std::optional<QueuedMessage> tryPop();

  /// Wakes blocked waitPop() callers; later pushes are dropped.
  void close();

  size_t size() const;
  size_t bytes() const;
  uint64_t consecutiveDrops() const;
  uint64_t totalDropped() const;
  uint64_t totalEvicted() const;

  size_t maxSize() const noexcept { return _maxSize; }
  size_t maxBytes() const noexcept { return _maxBytes; }

 private:
  bool evictLowestBelow(MessagePriority priority);
  void evictLowest();
  void eraseAt(std::deque<QueuedMessage>::iterator it);
  bool dropLocked(const std::string& kind, MessagePriority priority, const char* reason);
  QueuedMessage popFrontLocked();

  const size_t _maxSize;
  const size_t _maxBytes;
  const double _dropThreshold;

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<QueuedMessage> _items;
  size_t _bytes{0};
  uint64_t _seq{0};
  uint64_t _consecutiveDrops{0};
  uint64_t _totalDropped{0};
  uint64_t _totalEvicted{0};
  bool _closed{false};
};

}  // namespace capflow
