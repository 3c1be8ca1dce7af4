/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/aggregator/aggregator_registry.h"
#include "capflow/log/log.h"

#include <algorithm>
#include <set>

namespace capflow
{

namespace
{

// Keeps the first occurrence of each timeframe, preserving order.
std::vector<Timeframe> withoutDuplicates(const std::vector<Timeframe>& timeframes)
{
  std::vector<Timeframe> out;
  out.reserve(timeframes.size());
  for (const auto& tf : timeframes)
  {
    if (std::find(out.begin(), out.end(), tf) == out.end())
    {
      out.push_back(tf);
    }
  }
  return out;
}

}  // namespace

AggregatorRegistry::AggregatorRegistry(const EngineConfig& config, MessageBus* bus)
    : _timeframes(withoutDuplicates(config.timeframes)),
      _historySize(config.historySize),
      _defaultSupply(config.defaultSupply),
      _bus(bus),
      _supplies(config.supplyTtl)
{
}

std::shared_ptr<MarketCapAggregator> AggregatorRegistry::getOrCreate(
    const std::string& token, const Timeframe& timeframe, std::optional<Supply> supplyHint)
{
  if (supplyHint)
  {
    _supplies.put(token, *supplyHint);
  }

  std::lock_guard lock(_mutex);
  Key key{token, timeframe};
  auto it = _aggregators.find(key);
  if (it != _aggregators.end())
  {
    return it->second;
  }

  std::optional<Supply> supply = supplyHint ? supplyHint : _supplies.fresh(token);
  if (!supply)
  {
    // a running sibling carries the token's live supply after the cache went stale
    for (const auto& [other, sibling] : _aggregators)
    {
      if (other.first == token)
      {
        supply = sibling->supply();
        break;
      }
    }
  }

  auto aggregator =
      std::make_shared<MarketCapAggregator>(token, timeframe, supply.value_or(_defaultSupply), _bus,
                                           _historySize);
  aggregator->setCloseHandler(_closeHandler);
  _aggregators.emplace(std::move(key), aggregator);

  CAPFLOW_LOG_DEBUG("[AggregatorRegistry] created " << token << " " << timeframe.label()
                                                    << " supply=" << aggregator->supply());
  return aggregator;
}

std::vector<CandleUpdate> AggregatorRegistry::processSwap(const SwapEvent& swap)
{
  return processSwap(swap, _timeframes);
}

std::vector<CandleUpdate> AggregatorRegistry::processSwap(const SwapEvent& swap,
                                                          const std::vector<Timeframe>& timeframes)
{
  std::vector<CandleUpdate> updates;
  if (!(swap.priceUsd > 0.0))
  {
    return updates;
  }

  updates.reserve(timeframes.size());
  for (auto it = timeframes.begin(); it != timeframes.end(); ++it)
  {
    const auto& tf = *it;
    if (std::find(timeframes.begin(), it, tf) != it)
    {
      continue;  // a repeated timeframe must not count the swap twice
    }
    if (auto update = getOrCreate(swap.tokenAddress, tf)->processSwap(swap))
    {
      updates.push_back(std::move(*update));
    }
  }
  return updates;
}

void AggregatorRegistry::removeToken(const std::string& token)
{
  size_t removed = 0;
  {
    std::lock_guard lock(_mutex);
    for (auto it = _aggregators.begin(); it != _aggregators.end();)
    {
      if (it->first.first == token)
      {
        it = _aggregators.erase(it);
        ++removed;
      }
      else
      {
        ++it;
      }
    }
  }
  _supplies.erase(token);

  if (removed > 0)
  {
    CAPFLOW_LOG_INFO("[AggregatorRegistry] removed " << removed << " aggregators for " << token);
  }
}

std::vector<std::shared_ptr<MarketCapAggregator>> AggregatorRegistry::aggregatorsOf(
    const std::string& token) const
{
  std::vector<std::shared_ptr<MarketCapAggregator>> out;
  std::lock_guard lock(_mutex);
  for (const auto& [key, aggregator] : _aggregators)
  {
    if (key.first == token)
    {
      out.push_back(aggregator);
    }
  }
  return out;
}

Supply AggregatorRegistry::currentSupply(const std::string& token) const
{
  if (auto cached = _supplies.latest(token))
  {
    return *cached;
  }
  auto running = aggregatorsOf(token);
  return running.empty() ? _defaultSupply : running.front()->supply();
}

void AggregatorRegistry::onSupplyChange(const std::string& token, Supply newSupply)
{
  _supplies.put(token, newSupply);
  for (const auto& aggregator : aggregatorsOf(token))
  {
    aggregator->setSupply(newSupply);
  }
}

void AggregatorRegistry::applyMint(const std::string& token, Supply amount)
{
  onSupplyChange(token, currentSupply(token) + amount);
}

void AggregatorRegistry::applyBurn(const std::string& token, Supply amount)
{
  const Supply base = currentSupply(token);
  onSupplyChange(token, amount >= base ? 0 : base - amount);
}

std::shared_ptr<MarketCapAggregator> AggregatorRegistry::find(const std::string& token,
                                                              const Timeframe& timeframe) const
{
  std::lock_guard lock(_mutex);
  auto it = _aggregators.find(Key{token, timeframe});
  return it == _aggregators.end() ? nullptr : it->second;
}

std::vector<Candle> AggregatorRegistry::candles(const std::string& token,
                                                const Timeframe& timeframe) const
{
  auto aggregator = find(token, timeframe);
  return aggregator ? aggregator->allCandles() : std::vector<Candle>{};
}

std::vector<std::string> AggregatorRegistry::tokens() const
{
  std::set<std::string> out;
  std::lock_guard lock(_mutex);
  for (const auto& [key, _] : _aggregators)
  {
    out.insert(key.first);
  }
  return {out.begin(), out.end()};
}

size_t AggregatorRegistry::size() const
{
  std::lock_guard lock(_mutex);
  return _aggregators.size();
}

std::optional<Supply> AggregatorRegistry::cachedSupply(const std::string& token) const
{
  return _supplies.fresh(token);
}

void AggregatorRegistry::setCloseHandler(ICandleCloseHandler* handler)
{
  std::lock_guard lock(_mutex);
  _closeHandler = handler;
}

}  // namespace capflow
