/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/bus/in_process_backend.h"

namespace capflow
{

bool InProcessBackend::connect()
{
  _connected.store(true, std::memory_order_release);
  return true;
}

void InProcessBackend::disconnect()
{
  _connected.store(false, std::memory_order_release);
  {
    std::lock_guard lock(_handlerMutex);
    _handler = nullptr;
  }
  std::lock_guard lock(_cacheMutex);
  _cache.clear();
}

void InProcessBackend::setMessageHandler(MessageHandler handler)
{
  std::lock_guard lock(_handlerMutex);
  _handler = std::move(handler);
}

void InProcessBackend::publish(const std::string& channel, const std::string& payload)
{
  if (!isConnected())
  {
    return;
  }

  MessageHandler handler;
  {
    std::lock_guard lock(_handlerMutex);
    handler = _handler;
  }
  if (handler)
  {
    handler(channel, payload);
  }
}

void InProcessBackend::set(const std::string& key, const std::string& value,
                           std::chrono::milliseconds ttl)
{
  std::lock_guard lock(_cacheMutex);
  _cache[key] = CacheEntry{value, Clock::now() + ttl};
}

std::optional<std::string> InProcessBackend::get(const std::string& key)
{
  std::lock_guard lock(_cacheMutex);
  auto it = _cache.find(key);
  if (it == _cache.end())
  {
    return std::nullopt;
  }
  if (Clock::now() >= it->second.expiresAt)
  {
    _cache.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

size_t InProcessBackend::cacheSize() const
{
  std::lock_guard lock(_cacheMutex);
  return _cache.size();
}

}  // namespace capflow
