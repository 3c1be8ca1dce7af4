/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/backpressure/channel_relay.h"
#include "capflow/backpressure/backpressure_controller.h"
#include "capflow/bus/channels.h"
#include "capflow/bus/message_bus.h"
#include "capflow/log/log.h"
#include "capflow/util/base/json_fields.h"

namespace capflow
{

ChannelRelay::ChannelRelay(MessageBus& bus, BackpressureController& controller)
    : _bus(bus), _controller(controller)
{
}

ChannelRelay::~ChannelRelay() { detachAll(); }

void ChannelRelay::attach(ConnectionId id, const std::string& channel)
{
  std::lock_guard membership(_membershipMutex);
  {
    std::lock_guard lock(_mutex);
    _routes[channel].insert(id);
  }
  _bus.subscribe(channel, this);
}

void ChannelRelay::detach(ConnectionId id, const std::string& channel)
{
  std::lock_guard membership(_membershipMutex);
  detachLocked(id, channel);
}

void ChannelRelay::detach(ConnectionId id)
{
  std::lock_guard membership(_membershipMutex);
  for (const auto& channel : channelsOf(id))
  {
    detachLocked(id, channel);
  }
}

void ChannelRelay::detachAll()
{
  std::lock_guard membership(_membershipMutex);
  {
    std::lock_guard lock(_mutex);
    _routes.clear();
  }
  _bus.unsubscribeAll(this);
}

// Caller holds _membershipMutex, so no attach can slip in between the route
// change and the bus call.
void ChannelRelay::detachLocked(ConnectionId id, const std::string& channel)
{
  bool drained = false;
  {
    std::lock_guard lock(_mutex);
    auto it = _routes.find(channel);
    if (it == _routes.end())
    {
      return;
    }
    it->second.erase(id);
    if (it->second.empty())
    {
      _routes.erase(it);
      drained = true;
    }
  }
  if (drained)
  {
    _bus.unsubscribe(channel, this);
  }
}

std::vector<std::string> ChannelRelay::channelsOf(ConnectionId id) const
{
  std::vector<std::string> out;
  std::lock_guard lock(_mutex);
  for (const auto& [channel, ids] : _routes)
  {
    if (ids.count(id))
    {
      out.push_back(channel);
    }
  }
  return out;
}

MessagePriority ChannelRelay::priorityFor(std::string_view channel, std::string_view payload)
{
  switch (channels::classify(channel))
  {
    case channels::ChannelKind::Candle:
      return json::extractBool(payload, "is_closed").value_or(false) ? MessagePriority::CRITICAL
                                                                     : MessagePriority::NORMAL;
    case channels::ChannelKind::SupplyChange:
      return MessagePriority::HIGH;
    case channels::ChannelKind::Swap:
    case channels::ChannelKind::Other:
      break;
  }
  return MessagePriority::LOW;
}

std::string_view ChannelRelay::kindFor(std::string_view channel)
{
  switch (channels::classify(channel))
  {
    case channels::ChannelKind::Candle:
      return "candle";
    case channels::ChannelKind::SupplyChange:
      return "supply_change";
    case channels::ChannelKind::Swap:
      return "swap";
    case channels::ChannelKind::Other:
      break;
  }
  return "raw";
}

void ChannelRelay::onMessage(std::string_view channel, std::string_view payload)
{
  std::vector<ConnectionId> targets;
  {
    std::lock_guard lock(_mutex);
    auto it = _routes.find(channel);
    if (it == _routes.end())
    {
      return;
    }
    targets.assign(it->second.begin(), it->second.end());
  }

  const auto priority = priorityFor(channel, payload);
  const auto kind = kindFor(channel);
  for (auto id : targets)
  {
    if (!_controller.enqueue(id, std::string(payload), priority, kind))
    {
      CAPFLOW_LOG_DEBUG("[ChannelRelay] " << kind << " on " << channel << " dropped for client "
                                          << id);
    }
  }
}

}  // namespace capflow
