/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/aggregator/candle.h"
#include "capflow/bus/channel_listener.h"
#include "capflow/bus/in_process_backend.h"
#include "capflow/bus/pubsub_backend.h"
#include "capflow/market/swap_event.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace capflow
{

/**
 * Channel-addressed publish/subscribe plus a short-TTL key/value cache.
 *
 * With a broker backend that answers connect(), traffic goes through the
 * broker. Otherwise the bus falls back to an in-process loopback with the
 * same observable behavior. Listeners are registered per channel and are not
 * owned by the bus. Once unsubscribe() or disconnect() returns, no callback
 * into the removed listener is running or will start on another thread, so
 * the listener may be destroyed.
 */
class MessageBus
{
 public:
  explicit MessageBus(std::unique_ptr<IPubSubBackend> broker = nullptr);
  ~MessageBus();

  MessageBus(const MessageBus&) = delete;
  MessageBus& operator=(const MessageBus&) = delete;

  /// Never throws. Returns true when the broker is in use.
  bool connect();
  void disconnect();

  bool isConnected() const;
  bool isFallback() const { return _fallback.load(std::memory_order_acquire); }
  std::string_view backendName() const;

  void publish(const std::string& channel, const std::string& payload);

  void subscribe(const std::string& channel, IChannelListener* listener);
  void unsubscribe(const std::string& channel, IChannelListener* listener);
  void unsubscribe(const std::string& channel);
  void unsubscribeAll(IChannelListener* listener);

  size_t listenerCount(const std::string& channel) const;

  void cacheSet(const std::string& key, const std::string& value, std::chrono::milliseconds ttl);
  std::optional<std::string> cacheGet(const std::string& key);

  void publishCandle(const CandleUpdate& update);
  void publishSupplyChange(const SupplyChange& change);
  void publishRaw(const SwapEvent& swap);

  void cacheQuote(const std::string& inputMint, const std::string& outputMint, uint64_t amount,
                  const std::string& quote);
  std::optional<std::string> cachedQuote(const std::string& inputMint,
                                         const std::string& outputMint, uint64_t amount);

  void cacheTokenInfo(const std::string& token, const std::string& info);
  std::optional<std::string> cachedTokenInfo(const std::string& token);

  /// Tokens with at least one candles: or swaps: subscription, sorted.
  std::vector<std::string> activeTokens() const;

 private:
  void dispatch(std::string_view channel, std::string_view payload);
  // Blocks until no other thread is inside a callback of listener (any when null).
  void waitForDeliveries(std::unique_lock<std::mutex>& lock, IChannelListener* listener);
  IPubSubBackend* active() const { return _active.load(std::memory_order_acquire); }

  std::unique_ptr<IPubSubBackend> _broker;
  InProcessBackend _local;
  std::atomic<IPubSubBackend*> _active{nullptr};
  std::atomic<bool> _fallback{false};
  bool _fallbackLogged = false;

  mutable std::mutex _mutex;
  std::map<std::string, std::vector<IChannelListener*>> _listeners;
  std::multimap<IChannelListener*, std::thread::id> _inFlight;
  std::condition_variable _deliveryDone;
};

}  // namespace capflow
