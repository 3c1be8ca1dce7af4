/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/engine/pipeline.h"
#include "capflow/bus/redis_backend.h"
#include "capflow/log/log.h"

namespace capflow
{

namespace
{

std::unique_ptr<IPubSubBackend> makeBroker(const EngineConfig& config)
{
  if (!config.brokerUrl)
  {
    return nullptr;
  }

  auto endpoint = parseBrokerUrl(*config.brokerUrl);
  if (!endpoint)
  {
    CAPFLOW_LOG_WARN("[Pipeline] cannot parse broker url '" << *config.brokerUrl << "'");
    return nullptr;
  }
  return std::make_unique<RedisBackend>(*endpoint, config.brokerTimeout);
}

}  // namespace

Pipeline::Pipeline(EngineConfig config) : Pipeline(config, makeBroker(config)) {}

Pipeline::Pipeline(EngineConfig config, std::unique_ptr<IPubSubBackend> broker)
    : _config(std::move(config)),
      _bus(std::move(broker)),
      _registry(_config, &_bus),
      _backpressure(_config.backpressure),
      _relay(_bus, _backpressure)
{
  _backpressure.onUnhealthy([this](ConnectionId id) { removeClient(id); });
}

Pipeline::~Pipeline() { stop(); }

void Pipeline::start()
{
  setLogLevel(logLevelFromString(_config.logLevel));
  _backpressure.start();
  _bus.connect();
}

void Pipeline::stop()
{
  _relay.detachAll();
  _backpressure.stop();
  _bus.disconnect();
}

std::vector<CandleUpdate> Pipeline::ingest(const SwapEvent& swap)
{
  if (!(swap.priceUsd > 0.0))
  {
    return {};
  }
  _bus.publishRaw(swap);
  return _registry.processSwap(swap);
}

bool Pipeline::addClient(std::shared_ptr<IClientConnection> connection,
                         const std::vector<std::string>& channels)
{
  if (!connection)
  {
    return false;
  }
  const ConnectionId id = connection->id();
  if (!_backpressure.registerClient(std::move(connection)))
  {
    return false;
  }
  for (const auto& channel : channels)
  {
    _relay.attach(id, channel);
  }
  return true;
}

void Pipeline::removeClient(ConnectionId id)
{
  _relay.detach(id);
  _backpressure.unregisterClient(id);
}

}  // namespace capflow
