/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/engine/engine_config.h"
#include "capflow/util/base/json_fields.h"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

namespace capflow
{

namespace
{

// "timeframes": ["1m", "5m"] -> labels
std::vector<std::string> extractStringArray(std::string_view content, std::string_view key)
{
  std::vector<std::string> out;

  std::string quoted = "\"" + std::string(key) + "\"";
  auto keyPos = content.find(quoted);
  if (keyPos == std::string_view::npos)
  {
    return out;
  }
  auto open = content.find('[', keyPos);
  auto close = content.find(']', keyPos);
  if (open == std::string_view::npos || close == std::string_view::npos || close < open)
  {
    return out;
  }

  auto body = content.substr(open + 1, close - open - 1);
  size_t pos = 0;
  while (true)
  {
    auto first = body.find('"', pos);
    if (first == std::string_view::npos)
    {
      break;
    }
    auto second = body.find('"', first + 1);
    if (second == std::string_view::npos)
    {
      break;
    }
    out.emplace_back(body.substr(first + 1, second - first - 1));
    pos = second + 1;
  }
  return out;
}

}  // namespace

std::optional<BrokerEndpoint> parseBrokerUrl(std::string_view url)
{
  constexpr std::string_view kScheme = "redis://";
  if (url.substr(0, kScheme.size()) == kScheme)
  {
    url.remove_prefix(kScheme.size());
  }

  // strip credentials and database path
  if (auto at = url.rfind('@'); at != std::string_view::npos)
  {
    url.remove_prefix(at + 1);
  }
  if (auto slash = url.find('/'); slash != std::string_view::npos)
  {
    url = url.substr(0, slash);
  }

  if (url.empty())
  {
    return std::nullopt;
  }

  BrokerEndpoint endpoint;
  auto colon = url.rfind(':');
  if (colon == std::string_view::npos)
  {
    endpoint.host = std::string(url);
    return endpoint;
  }

  endpoint.host = std::string(url.substr(0, colon));
  auto portStr = url.substr(colon + 1);
  uint16_t port = 0;
  auto [ptr, ec] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
  if (endpoint.host.empty() || ec != std::errc{} || ptr != portStr.data() + portStr.size() ||
      port == 0)
  {
    return std::nullopt;
  }
  endpoint.port = port;
  return endpoint;
}

EngineConfig EngineConfig::parse(std::string_view content)
{
  EngineConfig cfg;

  auto labels = extractStringArray(content, "timeframes");
  if (!labels.empty())
  {
    cfg.timeframes.clear();
    for (const auto& label : labels)
    {
      const auto tf = Timeframe::parse(label);
      if (std::find(cfg.timeframes.begin(), cfg.timeframes.end(), tf) == cfg.timeframes.end())
      {
        cfg.timeframes.push_back(tf);
      }
    }
  }

  if (auto v = json::extractInt(content, "history_size"); v && *v > 0)
  {
    cfg.historySize = static_cast<size_t>(*v);
  }
  if (auto v = json::extractInt(content, "default_supply"); v && *v > 0)
  {
    cfg.defaultSupply = static_cast<Supply>(*v);
  }
  if (auto v = json::extractInt(content, "supply_ttl_s"); v && *v >= 0)
  {
    cfg.supplyTtl = std::chrono::seconds(*v);
  }

  auto& bp = cfg.backpressure;
  if (auto v = json::extractInt(content, "max_queue_size"); v && *v > 0)
  {
    bp.maxQueueSize = static_cast<size_t>(*v);
  }
  if (auto v = json::extractInt(content, "max_queue_bytes"); v && *v > 0)
  {
    bp.maxQueueBytes = static_cast<size_t>(*v);
  }
  if (auto v = json::extractDouble(content, "drop_threshold"); v && *v > 0.0 && *v <= 1.0)
  {
    bp.dropThreshold = *v;
  }
  if (auto v = json::extractInt(content, "min_send_interval_ms"); v && *v >= 0)
  {
    bp.minSendInterval = std::chrono::milliseconds(*v);
  }
  if (auto v = json::extractDouble(content, "health_floor"); v && *v >= 0.0 && *v <= 1.0)
  {
    bp.healthFloor = *v;
  }

  if (auto v = json::extractString(content, "broker_url"); v && !v->empty())
  {
    cfg.brokerUrl = *v;
  }
  if (auto v = json::extractInt(content, "broker_timeout_ms"); v && *v > 0)
  {
    cfg.brokerTimeout = std::chrono::milliseconds(*v);
  }
  if (auto v = json::extractString(content, "log_level"); v && !v->empty())
  {
    cfg.logLevel = *v;
  }

  return cfg;
}

std::optional<EngineConfig> EngineConfig::load(const std::filesystem::path& path)
{
  std::ifstream file(path);
  if (!file)
  {
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

}  // namespace capflow
