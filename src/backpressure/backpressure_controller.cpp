/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/backpressure/backpressure_controller.h"
#include "capflow/log/log.h"
#include "capflow/util/concurrency/supervised_task.h"

#include <algorithm>
#include <atomic>

namespace capflow
{

namespace
{

constexpr double HEALTH_STEP_UP = 0.01;
constexpr double HEALTH_STEP_DOWN = 0.1;
constexpr auto IDLE_WAIT = std::chrono::milliseconds(50);

}  // namespace

struct BackpressureController::Client
{
  using Clock = std::chrono::steady_clock;

  Client(std::shared_ptr<IClientConnection> conn, const BackpressureConfig& cfg)
      : connection(std::move(conn)),
        queue(cfg.maxQueueSize, cfg.maxQueueBytes, cfg.dropThreshold),
        lastSend(Clock::now())
  {
  }

  std::shared_ptr<IClientConnection> connection;
  ClientQueue queue;

  std::atomic<double> health{1.0};
  std::atomic<double> sendRate{0.0};
  std::atomic<uint64_t> sent{0};
  std::atomic<uint64_t> failed{0};
  Clock::time_point lastSend;  // delivery thread only

  SupervisedTask task;  // last: stopped before the queue goes away
};

BackpressureController::BackpressureController(BackpressureConfig config) : _config(config) {}

BackpressureController::~BackpressureController() { stop(); }

void BackpressureController::stop()
{
  std::unordered_map<ConnectionId, std::shared_ptr<Client>> clients;
  {
    std::lock_guard lock(_mutex);
    clients.swap(_clients);
  }
  for (auto& [id, client] : clients)
  {
    client->task.stop();
  }
}

bool BackpressureController::registerClient(std::shared_ptr<IClientConnection> connection)
{
  if (!connection || connection->id() == InvalidConnectionId)
  {
    return false;
  }

  const ConnectionId id = connection->id();
  auto client = std::make_shared<Client>(std::move(connection), _config);
  {
    std::lock_guard lock(_mutex);
    if (!_clients.emplace(id, client).second)
    {
      CAPFLOW_LOG_WARN("[Backpressure] client " << id << " already registered");
      return false;
    }
  }

  // the body holds a reference so an unregister from inside the loop cannot
  // free the state under it
  client->task.start(
      "delivery-" + std::to_string(id),
      [this, client](StopSignal& signal) { deliveryLoop(*client, signal); },
      [raw = client.get()] { raw->queue.close(); });

  CAPFLOW_LOG_DEBUG("[Backpressure] registered client " << id);
  return true;
}

void BackpressureController::unregisterClient(ConnectionId id)
{
  std::shared_ptr<Client> client;
  {
    std::lock_guard lock(_mutex);
    auto it = _clients.find(id);
    if (it == _clients.end())
    {
      return;
    }
    client = std::move(it->second);
    _clients.erase(it);
  }

  client->task.stop();
  CAPFLOW_LOG_DEBUG("[Backpressure] unregistered client " << id);
}

std::shared_ptr<BackpressureController::Client> BackpressureController::findClient(
    ConnectionId id) const
{
  std::lock_guard lock(_mutex);
  auto it = _clients.find(id);
  return it == _clients.end() ? nullptr : it->second;
}

bool BackpressureController::enqueue(ConnectionId id, std::string payload,
                                     MessagePriority priority, std::string_view kind)
{
  auto client = findClient(id);
  if (!client)
  {
    return false;
  }
  return client->queue.push(std::move(payload), priority, std::string(kind));
}

void BackpressureController::deliveryLoop(Client& client, StopSignal& signal)
{
  const ConnectionId id = client.connection->id();

  while (!signal.stopRequested())
  {
    auto msg = client.queue.waitPop(IDLE_WAIT);
    if (!msg)
    {
      continue;
    }

    const auto sinceLast = Client::Clock::now() - client.lastSend;
    if (sinceLast < _config.minSendInterval)
    {
      if (signal.waitFor(_config.minSendInterval - sinceLast))
      {
        break;  // popped message is abandoned
      }
    }

    bool ok = false;
    try
    {
      ok = client.connection->send(msg->payload);
    }
    catch (const std::exception& e)
    {
      CAPFLOW_LOG_ERROR("[Backpressure] send to client " << id << " threw: " << e.what());
    }

    if (ok)
    {
      const auto now = Client::Clock::now();
      const double elapsed = std::chrono::duration<double>(now - client.lastSend).count();
      if (elapsed > 0.0)
      {
        client.sendRate.store(1.0 / elapsed, std::memory_order_relaxed);
      }
      client.lastSend = now;
      client.sent.fetch_add(1, std::memory_order_relaxed);
      client.health.store(std::min(1.0, client.health.load() + HEALTH_STEP_UP));
      continue;
    }

    client.failed.fetch_add(1, std::memory_order_relaxed);
    const double health = std::max(0.0, client.health.load() - HEALTH_STEP_DOWN);
    client.health.store(health);

    if (health < _config.healthFloor)
    {
      CAPFLOW_LOG_WARN("[Backpressure] client " << id << " health " << health
                                                << " below floor, stopping delivery");
      UnhealthyCallback cb;
      {
        std::lock_guard lock(_callbackMutex);
        cb = _onUnhealthy;
      }
      if (cb)
      {
        try
        {
          cb(id);
        }
        catch (const std::exception& e)
        {
          CAPFLOW_LOG_ERROR("[Backpressure] unhealthy callback threw: " << e.what());
        }
      }
      break;
    }
  }
}

std::optional<ClientStats> BackpressureController::stats(ConnectionId id) const
{
  auto client = findClient(id);
  if (!client)
  {
    return std::nullopt;
  }

  ClientStats s;
  s.queueSize = client->queue.size();
  s.queueBytes = client->queue.bytes();
  s.maxQueueSize = client->queue.maxSize();
  s.maxQueueBytes = client->queue.maxBytes();
  s.healthScore = client->health.load();
  s.sendRate = client->sendRate.load(std::memory_order_relaxed);
  s.consecutiveDrops = client->queue.consecutiveDrops();
  s.totalSent = client->sent.load(std::memory_order_relaxed);
  s.totalDropped = client->queue.totalDropped() + client->queue.totalEvicted();
  s.totalFailed = client->failed.load(std::memory_order_relaxed);
  return s;
}

size_t BackpressureController::clientCount() const
{
  std::lock_guard lock(_mutex);
  return _clients.size();
}

void BackpressureController::onUnhealthy(UnhealthyCallback callback)
{
  std::lock_guard lock(_callbackMutex);
  _onUnhealthy = std::move(callback);
}

}  // namespace capflow
