/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace capflow
{

/**
 * Transport behind the MessageBus. A backend moves payloads between
 * publishers and the bus-local listener registry; it knows nothing about
 * listeners itself. Messages for subscribed channels are handed to the
 * handler installed with setMessageHandler(), possibly from a backend thread.
 *
 * Operations other than connect() may throw on transient failures; the bus
 * catches and logs them.
 */
class IPubSubBackend
{
 public:
  using MessageHandler = std::function<void(std::string_view channel, std::string_view payload)>;

  virtual ~IPubSubBackend() = default;

  virtual std::string_view name() const = 0;

  /// Returns false if the backend is unreachable. Must not throw.
  virtual bool connect() = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  /// Reason of the last failed connect(), for the caller's log line.
  virtual std::string lastError() const { return {}; }

  virtual void setMessageHandler(MessageHandler handler) = 0;

  virtual void publish(const std::string& channel, const std::string& payload) = 0;
  virtual void subscribe(const std::string& channel) = 0;
  virtual void unsubscribe(const std::string& channel) = 0;

  virtual void set(const std::string& key, const std::string& value,
                   std::chrono::milliseconds ttl) = 0;
  virtual std::optional<std::string> get(const std::string& key) = 0;
};

}  // namespace capflow
