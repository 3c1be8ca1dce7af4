/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/bus/pubsub_backend.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <unordered_map>

namespace capflow
{

/// Loopback backend: publish() hands the payload straight to the message
/// handler on the caller's thread. Cache entries expire lazily on read.
class InProcessBackend final : public IPubSubBackend
{
 public:
  using Clock = std::chrono::steady_clock;

  std::string_view name() const override { return "in-process"; }

  bool connect() override;
  void disconnect() override;
  bool isConnected() const override { return _connected.load(std::memory_order_acquire); }

  void setMessageHandler(MessageHandler handler) override;

  void publish(const std::string& channel, const std::string& payload) override;
  void subscribe(const std::string&) override {}
  void unsubscribe(const std::string&) override {}

  void set(const std::string& key, const std::string& value,
           std::chrono::milliseconds ttl) override;
  std::optional<std::string> get(const std::string& key) override;

  size_t cacheSize() const;

 private:
  struct CacheEntry
  {
    std::string value;
    Clock::time_point expiresAt;
  };

  std::atomic<bool> _connected{false};

  std::mutex _handlerMutex;
  MessageHandler _handler;

  mutable std::mutex _cacheMutex;
  std::unordered_map<std::string, CacheEntry> _cache;
};

}  // namespace capflow
