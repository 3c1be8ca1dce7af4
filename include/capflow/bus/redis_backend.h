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
#include "capflow/engine/engine_config.h"

#include <chrono>
#include <memory>

namespace capflow
{

/**
 * Durable broker backend speaking RESP to a Redis-compatible server.
 *
 * Two TCP connections: a command connection used synchronously (with a
 * deadline) for PUBLISH/SET/GET, and a subscriber connection created on the
 * first subscribe() and served by a supervised listener thread that
 * dispatches pushed messages to the message handler.
 *
 * A dropped subscriber connection is re-established with backoff and every
 * channel subscribed at that moment is subscribed again; isConnected()
 * reports false until that has happened.
 */
class RedisBackend final : public IPubSubBackend
{
 public:
  RedisBackend(BrokerEndpoint endpoint, std::chrono::milliseconds timeout);
  ~RedisBackend() override;

  RedisBackend(const RedisBackend&) = delete;
  RedisBackend& operator=(const RedisBackend&) = delete;

  std::string_view name() const override { return "redis"; }

  bool connect() override;
  void disconnect() override;
  bool isConnected() const override;
  std::string lastError() const override;

  void setMessageHandler(MessageHandler handler) override;

  void publish(const std::string& channel, const std::string& payload) override;
  void subscribe(const std::string& channel) override;
  void unsubscribe(const std::string& channel) override;

  void set(const std::string& key, const std::string& value,
           std::chrono::milliseconds ttl) override;
  std::optional<std::string> get(const std::string& key) override;

 private:
  struct Impl;  // hides Boost.Asio from dependents
  std::unique_ptr<Impl> _impl;
};

}  // namespace capflow
