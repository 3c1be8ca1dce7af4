/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/bus/message_bus.h"
#include "capflow/bus/channels.h"
#include "capflow/bus/payload_codec.h"
#include "capflow/engine/engine_config.h"
#include "capflow/log/log.h"

#include <algorithm>
#include <set>

namespace capflow
{

namespace
{

// Backend failures on the data path are logged and swallowed; the caller
// sees a no-op.
template <typename Fn>
void guarded(const char* op, const std::string& target, Fn&& fn)
{
  try
  {
    fn();
  }
  catch (const std::exception& e)
  {
    CAPFLOW_LOG_ERROR("[MessageBus] " << op << " '" << target << "' failed: " << e.what());
  }
}

}  // namespace

MessageBus::MessageBus(std::unique_ptr<IPubSubBackend> broker) : _broker(std::move(broker)) {}

MessageBus::~MessageBus() { disconnect(); }

bool MessageBus::connect()
{
  if (active())
  {
    return !isFallback();
  }

  auto handler = [this](std::string_view channel, std::string_view payload)
  { dispatch(channel, payload); };

  IPubSubBackend* chosen = nullptr;
  if (_broker)
  {
    _broker->setMessageHandler(handler);
    if (_broker->connect())
    {
      chosen = _broker.get();
    }
    else if (!_fallbackLogged)
    {
      _fallbackLogged = true;
      CAPFLOW_LOG_WARN("[MessageBus] broker '" << _broker->name() << "' unavailable ("
                                               << _broker->lastError()
                                               << "), using in-process fallback");
    }
  }

  if (!chosen)
  {
    _local.setMessageHandler(handler);
    _local.connect();
    chosen = &_local;
    _fallback.store(true, std::memory_order_release);
  }
  else
  {
    _fallback.store(false, std::memory_order_release);
  }
  _active.store(chosen, std::memory_order_release);

  // channels registered before connect()
  std::vector<std::string> channels;
  {
    std::scoped_lock lock(_mutex);
    for (const auto& [channel, _] : _listeners)
    {
      channels.push_back(channel);
    }
  }
  for (const auto& channel : channels)
  {
    guarded("subscribe", channel, [&] { chosen->subscribe(channel); });
  }

  CAPFLOW_LOG_INFO("[MessageBus] connected via " << chosen->name());
  return !isFallback();
}

void MessageBus::disconnect()
{
  auto* backend = _active.exchange(nullptr, std::memory_order_acq_rel);
  if (!backend)
  {
    return;
  }

  guarded("disconnect", std::string(backend->name()), [&] { backend->disconnect(); });
  backend->setMessageHandler({});

  std::unique_lock lock(_mutex);
  _listeners.clear();
  waitForDeliveries(lock, nullptr);
}

bool MessageBus::isConnected() const
{
  auto* backend = active();
  return backend && backend->isConnected();
}

std::string_view MessageBus::backendName() const
{
  auto* backend = active();
  return backend ? backend->name() : std::string_view{"none"};
}

void MessageBus::publish(const std::string& channel, const std::string& payload)
{
  auto* backend = active();
  if (!backend)
  {
    CAPFLOW_LOG_DEBUG("[MessageBus] publish on '" << channel << "' before connect, dropped");
    return;
  }
  guarded("publish", channel, [&] { backend->publish(channel, payload); });
}

void MessageBus::subscribe(const std::string& channel, IChannelListener* listener)
{
  if (!listener)
  {
    return;
  }

  bool firstOnChannel = false;
  {
    std::scoped_lock lock(_mutex);
    auto& list = _listeners[channel];
    if (std::find(list.begin(), list.end(), listener) != list.end())
    {
      return;
    }
    firstOnChannel = list.empty();
    list.push_back(listener);
  }

  auto* backend = active();
  if (firstOnChannel && backend)
  {
    guarded("subscribe", channel, [&] { backend->subscribe(channel); });
  }
}

void MessageBus::unsubscribe(const std::string& channel, IChannelListener* listener)
{
  bool lastOnChannel = false;
  {
    std::unique_lock lock(_mutex);
    auto it = _listeners.find(channel);
    if (it == _listeners.end())
    {
      return;
    }
    auto& list = it->second;
    list.erase(std::remove(list.begin(), list.end(), listener), list.end());
    if (list.empty())
    {
      _listeners.erase(it);
      lastOnChannel = true;
    }
    waitForDeliveries(lock, listener);
  }

  auto* backend = active();
  if (lastOnChannel && backend)
  {
    guarded("unsubscribe", channel, [&] { backend->unsubscribe(channel); });
  }
}

void MessageBus::unsubscribe(const std::string& channel)
{
  {
    std::unique_lock lock(_mutex);
    auto it = _listeners.find(channel);
    if (it == _listeners.end())
    {
      return;
    }
    const auto removed = std::move(it->second);
    _listeners.erase(it);
    for (auto* listener : removed)
    {
      waitForDeliveries(lock, listener);
    }
  }

  auto* backend = active();
  if (backend)
  {
    guarded("unsubscribe", channel, [&] { backend->unsubscribe(channel); });
  }
}

void MessageBus::unsubscribeAll(IChannelListener* listener)
{
  std::vector<std::string> channels;
  {
    std::scoped_lock lock(_mutex);
    for (const auto& [channel, list] : _listeners)
    {
      if (std::find(list.begin(), list.end(), listener) != list.end())
      {
        channels.push_back(channel);
      }
    }
  }
  for (const auto& channel : channels)
  {
    unsubscribe(channel, listener);
  }
}

size_t MessageBus::listenerCount(const std::string& channel) const
{
  std::scoped_lock lock(_mutex);
  auto it = _listeners.find(channel);
  return it == _listeners.end() ? 0 : it->second.size();
}

void MessageBus::dispatch(std::string_view channel, std::string_view payload)
{
  std::vector<IChannelListener*> targets;
  {
    std::scoped_lock lock(_mutex);
    auto it = _listeners.find(std::string(channel));
    if (it == _listeners.end())
    {
      return;
    }
    targets = it->second;
  }

  const auto self = std::this_thread::get_id();
  for (auto* listener : targets)
  {
    {
      // skip listeners unsubscribed since the snapshot; mark the rest in flight
      std::scoped_lock lock(_mutex);
      auto it = _listeners.find(std::string(channel));
      if (it == _listeners.end() ||
          std::find(it->second.begin(), it->second.end(), listener) == it->second.end())
      {
        continue;
      }
      _inFlight.emplace(listener, self);
    }

    try
    {
      listener->onMessage(channel, payload);
    }
    catch (const std::exception& e)
    {
      CAPFLOW_LOG_ERROR("[MessageBus] listener on '" << channel << "' threw: " << e.what());
    }

    {
      std::scoped_lock lock(_mutex);
      auto range = _inFlight.equal_range(listener);
      for (auto it = range.first; it != range.second; ++it)
      {
        if (it->second == self)
        {
          _inFlight.erase(it);
          break;
        }
      }
    }
    _deliveryDone.notify_all();
  }
}

void MessageBus::waitForDeliveries(std::unique_lock<std::mutex>& lock, IChannelListener* listener)
{
  const auto self = std::this_thread::get_id();
  _deliveryDone.wait(lock,
                     [&]
                     {
                       // a listener unsubscribing from inside its own callback must not wait on itself
                       for (const auto& [l, thread] : _inFlight)
                       {
                         if ((listener == nullptr || l == listener) && thread != self)
                         {
                           return false;
                         }
                       }
                       return true;
                     });
}

void MessageBus::cacheSet(const std::string& key, const std::string& value,
                          std::chrono::milliseconds ttl)
{
  auto* backend = active();
  if (!backend)
  {
    return;
  }
  guarded("cache set", key, [&] { backend->set(key, value, ttl); });
}

std::optional<std::string> MessageBus::cacheGet(const std::string& key)
{
  auto* backend = active();
  if (!backend)
  {
    return std::nullopt;
  }

  std::optional<std::string> value;
  guarded("cache get", key, [&] { value = backend->get(key); });
  return value;
}

void MessageBus::publishCandle(const CandleUpdate& update)
{
  publish(channels::candles(update.token, update.timeframe), codec::encodeCandleUpdate(update));
}

void MessageBus::publishSupplyChange(const SupplyChange& change)
{
  publish(channels::supplyChange(change.token), codec::encodeSupplyChange(change));
}

void MessageBus::publishRaw(const SwapEvent& swap)
{
  publish(channels::swaps(swap.tokenAddress), codec::encodeSwapEvent(swap));
}

void MessageBus::cacheQuote(const std::string& inputMint, const std::string& outputMint,
                            uint64_t amount, const std::string& quote)
{
  cacheSet(channels::quoteKey(inputMint, outputMint, amount), quote, config::QUOTE_CACHE_TTL);
}

std::optional<std::string> MessageBus::cachedQuote(const std::string& inputMint,
                                                   const std::string& outputMint, uint64_t amount)
{
  return cacheGet(channels::quoteKey(inputMint, outputMint, amount));
}

void MessageBus::cacheTokenInfo(const std::string& token, const std::string& info)
{
  cacheSet(channels::tokenInfoKey(token), info, config::TOKEN_INFO_CACHE_TTL);
}

std::optional<std::string> MessageBus::cachedTokenInfo(const std::string& token)
{
  return cacheGet(channels::tokenInfoKey(token));
}

std::vector<std::string> MessageBus::activeTokens() const
{
  std::set<std::string> tokens;
  {
    std::scoped_lock lock(_mutex);
    for (const auto& [channel, _] : _listeners)
    {
      auto kind = channels::classify(channel);
      if (kind == channels::ChannelKind::Candle || kind == channels::ChannelKind::Swap)
      {
        tokens.emplace(channels::tokenOf(channel));
      }
    }
  }
  return {tokens.begin(), tokens.end()};
}

}  // namespace capflow
