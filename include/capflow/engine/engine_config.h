/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/aggregator/timeframe.h"
#include "capflow/common.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifndef CAPFLOW_DEFAULT_HISTORY_SIZE
#define CAPFLOW_DEFAULT_HISTORY_SIZE 500
#endif

#ifndef CAPFLOW_DEFAULT_TOKEN_SUPPLY
#define CAPFLOW_DEFAULT_TOKEN_SUPPLY 1000000000ULL
#endif

#ifndef CAPFLOW_DEFAULT_MAX_QUEUE_SIZE
#define CAPFLOW_DEFAULT_MAX_QUEUE_SIZE 100
#endif

#ifndef CAPFLOW_DEFAULT_MAX_QUEUE_BYTES
#define CAPFLOW_DEFAULT_MAX_QUEUE_BYTES (10u * 1024u * 1024u)
#endif

namespace capflow
{

namespace config
{

inline constexpr size_t DEFAULT_HISTORY_SIZE = CAPFLOW_DEFAULT_HISTORY_SIZE;
inline constexpr Supply DEFAULT_TOKEN_SUPPLY = CAPFLOW_DEFAULT_TOKEN_SUPPLY;
inline constexpr size_t DEFAULT_MAX_QUEUE_SIZE = CAPFLOW_DEFAULT_MAX_QUEUE_SIZE;
inline constexpr size_t DEFAULT_MAX_QUEUE_BYTES = CAPFLOW_DEFAULT_MAX_QUEUE_BYTES;
inline constexpr double DEFAULT_DROP_THRESHOLD = 0.8;
inline constexpr double DEFAULT_HEALTH_FLOOR = 0.1;
inline constexpr std::chrono::milliseconds DEFAULT_MIN_SEND_INTERVAL{10};
inline constexpr std::chrono::seconds DEFAULT_SUPPLY_TTL{300};
inline constexpr std::chrono::milliseconds DEFAULT_BROKER_TIMEOUT{2000};

inline constexpr std::chrono::seconds QUOTE_CACHE_TTL{1};
inline constexpr std::chrono::seconds TOKEN_INFO_CACHE_TTL{60};

}  // namespace config

struct BackpressureConfig
{
  size_t maxQueueSize = config::DEFAULT_MAX_QUEUE_SIZE;
  size_t maxQueueBytes = config::DEFAULT_MAX_QUEUE_BYTES;
  double dropThreshold = config::DEFAULT_DROP_THRESHOLD;  ///< occupancy fraction where dropping starts
  std::chrono::milliseconds minSendInterval = config::DEFAULT_MIN_SEND_INTERVAL;
  double healthFloor = config::DEFAULT_HEALTH_FLOOR;  ///< delivery stops below this health
};

struct BrokerEndpoint
{
  std::string host;
  uint16_t port = 6379;
};

/// Accepts "redis://host:port", "redis://host", "host:port". Returns nullopt on garbage.
std::optional<BrokerEndpoint> parseBrokerUrl(std::string_view url);

struct EngineConfig
{
  std::vector<Timeframe> timeframes = timeframe::defaults();
  size_t historySize = config::DEFAULT_HISTORY_SIZE;
  Supply defaultSupply = config::DEFAULT_TOKEN_SUPPLY;
  std::chrono::seconds supplyTtl = config::DEFAULT_SUPPLY_TTL;

  BackpressureConfig backpressure;

  std::optional<std::string> brokerUrl;  ///< absent = in-process bus
  std::chrono::milliseconds brokerTimeout = config::DEFAULT_BROKER_TIMEOUT;

  std::string logLevel = "info";

  /// Reads a flat JSON document. Missing keys keep their defaults; a missing or
  /// unreadable file yields nullopt. Malformed timeframe labels throw
  /// std::invalid_argument.
  static std::optional<EngineConfig> load(const std::filesystem::path& path);
  static EngineConfig parse(std::string_view content);
};

}  // namespace capflow
