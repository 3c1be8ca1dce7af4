/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/backpressure/client_queue.h"
#include "capflow/backpressure/message_priority.h"
#include "capflow/engine/abstract_subsystem.h"
#include "capflow/engine/engine_config.h"
#include "capflow/net/abstract_client_connection.h"
#include "capflow/util/concurrency/supervised_task.h"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace capflow
{

struct ClientStats
{
  size_t queueSize{0};
  size_t queueBytes{0};
  size_t maxQueueSize{0};
  size_t maxQueueBytes{0};
  double healthScore{1.0};
  double sendRate{0.0};  ///< messages per second, from the last inter-send gap
  uint64_t consecutiveDrops{0};
  uint64_t totalSent{0};
  uint64_t totalDropped{0};
  uint64_t totalFailed{0};
};

/**
 * Per-connection bounded queues with one delivery task each. A slow or
 * failing connection only ever costs its own queue and thread.
 */
class BackpressureController : public ISubsystem
{
 public:
  using UnhealthyCallback = std::function<void(ConnectionId)>;

  explicit BackpressureController(BackpressureConfig config = {});
  ~BackpressureController() override;

  BackpressureController(const BackpressureController&) = delete;
  BackpressureController& operator=(const BackpressureController&) = delete;

  void start() override {}
  /// Unregisters every client.
  void stop() override;

  /// False when the id is invalid or already registered.
  bool registerClient(std::shared_ptr<IClientConnection> connection);
  void unregisterClient(ConnectionId id);

  bool enqueue(ConnectionId id, std::string payload,
               MessagePriority priority = MessagePriority::NORMAL,
               std::string_view kind = "unknown");

  std::optional<ClientStats> stats(ConnectionId id) const;
  size_t clientCount() const;

  /// Fired from the client's delivery thread once its health falls below the
  /// floor and delivery stops. Unregistering from inside the callback is fine.
  void onUnhealthy(UnhealthyCallback callback);

  const BackpressureConfig& config() const noexcept { return _config; }

 private:
  struct Client;

  std::shared_ptr<Client> findClient(ConnectionId id) const;
  void deliveryLoop(Client& client, StopSignal& signal);

  const BackpressureConfig _config;

  mutable std::mutex _mutex;
  std::unordered_map<ConnectionId, std::shared_ptr<Client>> _clients;

  std::mutex _callbackMutex;
  UnhealthyCallback _onUnhealthy;
};

}  // namespace capflow
