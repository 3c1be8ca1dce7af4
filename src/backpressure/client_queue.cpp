/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/backpressure/client_queue.h"
#include "capflow/log/log.h"

#include <algorithm>

namespace capflow
{

ClientQueue::ClientQueue(size_t maxSize, size_t maxBytes, double dropThreshold)
    : _maxSize(maxSize > 0 ? maxSize : 1), _maxBytes(maxBytes), _dropThreshold(dropThreshold)
{
}

bool ClientQueue::dropLocked(const std::string& kind, MessagePriority priority,
                             const char* reason)
{
  ++_consecutiveDrops;
  ++_totalDropped;
  CAPFLOW_LOG_DEBUG("[ClientQueue] dropping " << kind << " (" << toString(priority) << "): "
                                              << reason << ", queue " << _items.size() << "/"
                                              << _maxSize);
  return false;
}

void ClientQueue::eraseAt(std::deque<QueuedMessage>::iterator it)
{
  _bytes -= it->payload.size();
  _items.erase(it);
  ++_totalEvicted;
}

bool ClientQueue::evictLowestBelow(MessagePriority priority)
{
  if (_items.empty() || _items.back().priority >= priority)
  {
    return false;
  }
  evictLowest();
  return true;
}

// Lowest-priority entries sit at the tail; the oldest of them goes first.
void ClientQueue::evictLowest()
{
  const auto lowest = _items.back().priority;
  auto it = std::find_if(_items.begin(), _items.end(),
                         [lowest](const QueuedMessage& m) { return m.priority == lowest; });
  eraseAt(it);
}

bool ClientQueue::push(std::string payload, MessagePriority priority, std::string kind)
{
  const size_t size = payload.size();

  {
    std::lock_guard lock(_mutex);
    if (_closed)
    {
      return false;
    }

    const double occupancy = static_cast<double>(_items.size()) / static_cast<double>(_maxSize);
    if (occupancy >= _dropThreshold)
    {
      if (priority < MessagePriority::HIGH)
      {
        return dropLocked(kind, priority, "queue under pressure");
      }

      const double half = static_cast<double>(_maxSize) * 0.5;
      while (static_cast<double>(_items.size()) >= half && evictLowestBelow(priority))
      {
      }
    }

    if (size > _maxBytes)
    {
      return dropLocked(kind, priority, "larger than the byte budget");
    }

    if (_bytes + size > _maxBytes)
    {
      if (priority < MessagePriority::CRITICAL)
      {
        return dropLocked(kind, priority, "byte budget exceeded");
      }
      while (!_items.empty() && _bytes + size > _maxBytes)
      {
        evictLowest();
      }
    }

    if (_items.size() >= _maxSize || _bytes + size > _maxBytes)
    {
      return dropLocked(kind, priority, "no room after eviction");
    }

    auto pos = std::find_if(_items.begin(), _items.end(),
                            [priority](const QueuedMessage& m) { return m.priority < priority; });
    _items.insert(pos, QueuedMessage{std::move(payload), priority,
                                     std::chrono::steady_clock::now(), std::move(kind), ++_seq});
    _bytes += size;
    _consecutiveDrops = 0;
  }

  _cv.notify_one();
  return true;
}

QueuedMessage ClientQueue::popFrontLocked()
{
  QueuedMessage msg = std::move(_items.front());
  _items.pop_front();
  _bytes -= msg.payload.size();
  return msg;
}

std::optional<QueuedMessage> ClientQueue::waitPop(std::chrono::milliseconds timeout)
{
  std::unique_lock lock(_mutex);
  if (!_cv.wait_for(lock, timeout, [this] { return _closed || !_items.empty(); }) || _closed)
  {
    return std::nullopt;
  }
  return popFrontLocked();
}

std::optional<QueuedMessage> ClientQueue::tryPop()
{
  std::lock_guard lock(_mutex);
  if (_items.empty())
  {
    return std::nullopt;
  }
  return popFrontLocked();
}

void ClientQueue::close()
{
  {
    std::lock_guard lock(_mutex);
    _closed = true;
  }
  _cv.notify_all();
}

size_t ClientQueue::size() const
{
  std::lock_guard lock(_mutex);
  return _items.size();
}

size_t ClientQueue::bytes() const
{
  std::lock_guard lock(_mutex);
  return _bytes;
}

uint64_t ClientQueue::consecutiveDrops() const
{
  std::lock_guard lock(_mutex);
  return _consecutiveDrops;
}

uint64_t ClientQueue::totalDropped() const
{
  std::lock_guard lock(_mutex);
  return _totalDropped;
}

uint64_t ClientQueue::totalEvicted() const
{
  std::lock_guard lock(_mutex);
  return _totalEvicted;
}

}  // namespace capflow
