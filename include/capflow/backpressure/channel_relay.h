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
#include "capflow/bus/channel_listener.h"
#include "capflow/common.h"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace capflow
{

class BackpressureController;
class MessageBus;

/**
 * Bridges bus channels to client queues. One relay listens on every channel
 * any attached connection asked for and enqueues each message to those
 * connections with a priority derived from the channel kind.
 */
class ChannelRelay : public IChannelListener
{
 public:
  ChannelRelay(MessageBus& bus, BackpressureController& controller);
  ~ChannelRelay() override;

  ChannelRelay(const ChannelRelay&) = delete;
  ChannelRelay& operator=(const ChannelRelay&) = delete;

  void attach(ConnectionId id, const std::string& channel);
  void detach(ConnectionId id, const std::string& channel);
  /// Removes the connection from every channel it was attached to.
  void detach(ConnectionId id);
  void detachAll();

  std::vector<std::string> channelsOf(ConnectionId id) const;

  void onMessage(std::string_view channel, std::string_view payload) override;

  /// Closed candles CRITICAL, open candles NORMAL, supply changes HIGH,
  /// everything else LOW.
  static MessagePriority priorityFor(std::string_view channel, std::string_view payload);
  static std::string_view kindFor(std::string_view channel);

 private:
  void detachLocked(ConnectionId id, const std::string& channel);

  MessageBus& _bus;
  BackpressureController& _controller;

  std::mutex _membershipMutex;  // attach/detach including the bus call
  mutable std::mutex _mutex;    // _routes
  std::map<std::string, std::set<ConnectionId>, std::less<>> _routes;
};

}  // namespace capflow
