/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/aggregator/aggregator_registry.h"
#include "capflow/backpressure/backpressure_controller.h"
#include "capflow/backpressure/channel_relay.h"
#include "capflow/bus/message_bus.h"
#include "capflow/engine/abstract_subsystem.h"
#include "capflow/engine/engine_config.h"

#include <memory>
#include <string>
#include <vector>

namespace capflow
{

/**
 * Owns and wires the engine: swaps go through the registry, candles and
 * supply notices are published on the bus, and the relay feeds attached
 * client connections through the backpressure controller.
 */
class Pipeline : public ISubsystem
{
 public:
  /// Builds a Redis backend when config.brokerUrl is set and parses.
  explicit Pipeline(EngineConfig config);
  Pipeline(EngineConfig config, std::unique_ptr<IPubSubBackend> broker);
  ~Pipeline() override;

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  /// Connects the bus; falls back to in-process delivery when the broker is down.
  void start() override;
  void stop() override;

  /// Publishes the raw swap on swaps:{token} and aggregates it.
  std::vector<CandleUpdate> ingest(const SwapEvent& swap);

  bool addClient(std::shared_ptr<IClientConnection> connection,
                 const std::vector<std::string>& channels);
  void removeClient(ConnectionId id);

  MessageBus& bus() noexcept { return _bus; }
  AggregatorRegistry& registry() noexcept { return _registry; }
  BackpressureController& backpressure() noexcept { return _backpressure; }
  ChannelRelay& relay() noexcept { return _relay; }
  const EngineConfig& config() const noexcept { return _config; }

 private:
  const EngineConfig _config;
  MessageBus _bus;
  AggregatorRegistry _registry;
  BackpressureController _backpressure;
  ChannelRelay _relay;
};

}  // namespace capflow
