/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/aggregator/market_cap_aggregator.h"
#include "capflow/aggregator/supply_cache.h"
#include "capflow/engine/engine_config.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace capflow
{

class MessageBus;

/**
 * Owns one MarketCapAggregator per (token, timeframe), created lazily on the
 * first swap, and the supply cache that seeds them.
 */
class AggregatorRegistry
{
 public:
  explicit AggregatorRegistry(const EngineConfig& config, MessageBus* bus = nullptr);

  /// Idempotent per key. A hint seeds new aggregators and refreshes the
  /// supply cache but never resets a running aggregator.
  std::shared_ptr<MarketCapAggregator> getOrCreate(const std::string& token,
                                                   const Timeframe& timeframe,
                                                   std::optional<Supply> supplyHint = std::nullopt);

  /// Fans the swap out to every configured timeframe. Returns the updates
  /// that were produced (rejected swaps produce none).
  std::vector<CandleUpdate> processSwap(const SwapEvent& swap);
  std::vector<CandleUpdate> processSwap(const SwapEvent& swap,
                                        const std::vector<Timeframe>& timeframes);

  void removeToken(const std::string& token);

  void onSupplyChange(const std::string& token, Supply newSupply);
  void applyMint(const std::string& token, Supply amount);
  void applyBurn(const std::string& token, Supply amount);

  std::shared_ptr<MarketCapAggregator> find(const std::string& token,
                                            const Timeframe& timeframe) const;
  /// History plus open candle; empty when the key does not exist.
  std::vector<Candle> candles(const std::string& token, const Timeframe& timeframe) const;
  std::vector<std::string> tokens() const;
  size_t size() const;

  std::optional<Supply> cachedSupply(const std::string& token) const;

  /// Applied to aggregators created after the call.
  void setCloseHandler(ICandleCloseHandler* handler);

  const std::vector<Timeframe>& timeframes() const noexcept { return _timeframes; }

 private:
  using Key = std::pair<std::string, Timeframe>;

  std::vector<std::shared_ptr<MarketCapAggregator>> aggregatorsOf(const std::string& token) const;
  Supply currentSupply(const std::string& token) const;

  const std::vector<Timeframe> _timeframes;
  const size_t _historySize;
  const Supply _defaultSupply;
  MessageBus* _bus;

  SupplyCache _supplies;

  mutable std::mutex _mutex;
  std::map<Key, std::shared_ptr<MarketCapAggregator>> _aggregators;
  ICandleCloseHandler* _closeHandler = nullptr;
};

}  // namespace capflow
