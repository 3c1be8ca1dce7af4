/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/common.h"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace capflow
{

/// Token -> circulating supply, stamped with the time it was last refreshed.
class SupplyCache
{
 public:
  using Clock = std::chrono::steady_clock;

  explicit SupplyCache(std::chrono::seconds ttl) : _ttl(ttl) {}

  void put(const std::string& token, Supply supply, Clock::time_point now = Clock::now())
  {
    std::lock_guard lock(_mutex);
    _records[token] = Record{supply, now};
  }

  /// Value refreshed within the TTL, or nullopt.
  std::optional<Supply> fresh(const std::string& token, Clock::time_point now = Clock::now()) const
  {
    std::lock_guard lock(_mutex);
    auto it = _records.find(token);
    if (it == _records.end() || now - it->second.refreshedAt > _ttl)
    {
      return std::nullopt;
    }
    return it->second.supply;
  }

  /// Last known value regardless of age.
  std::optional<Supply> latest(const std::string& token) const
  {
    std::lock_guard lock(_mutex);
    auto it = _records.find(token);
    if (it == _records.end())
    {
      return std::nullopt;
    }
    return it->second.supply;
  }

  void erase(const std::string& token)
  {
    std::lock_guard lock(_mutex);
    _records.erase(token);
  }

  size_t size() const
  {
    std::lock_guard lock(_mutex);
    return _records.size();
  }

  std::chrono::seconds ttl() const noexcept { return _ttl; }

 private:
  struct Record
  {
    Supply supply;
    Clock::time_point refreshedAt;
  };

  const std::chrono::seconds _ttl;
  mutable std::mutex _mutex;
  std::unordered_map<std::string, Record> _records;
};

}  // namespace capflow
