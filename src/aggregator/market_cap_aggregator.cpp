/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/aggregator/market_cap_aggregator.h"
#include "capflow/bus/message_bus.h"
#include "capflow/log/log.h"

#include <algorithm>
#include <stdexcept>

namespace capflow
{

MarketCapAggregator::MarketCapAggregator(std::string token, Timeframe timeframe, Supply supply,
                                         MessageBus* bus, size_t historySize)
    : _token(std::move(token)),
      _timeframe(timeframe),
      _bus(bus),
      _history(historySize),
      _supply(supply)
{
  if (_timeframe.ms <= 0)
  {
    throw std::invalid_argument("MarketCapAggregator: timeframe must be positive");
  }
}

CandleUpdate MarketCapAggregator::makeUpdate(const Candle& candle, bool isClosed) const
{
  return CandleUpdate{_token, _timeframe, candle, isClosed};
}

std::optional<CandleUpdate> MarketCapAggregator::processSwap(const SwapEvent& swap)
{
  if (!(swap.priceUsd > 0.0))
  {
    return std::nullopt;
  }

  std::lock_guard emitLock(_emitMutex);

  std::vector<CandleUpdate> closed;
  CandleUpdate result;
  {
    std::lock_guard lock(_mutex);

    const UsdValue marketCap =
        swap.marketCapUsd > 0.0 ? swap.marketCapUsd : swap.priceUsd * static_cast<double>(_supply);
    const TimestampMs bucket = _timeframe.bucketStart(swap.timestampMs);
    const UsdValue volume = swap.volumeUsd();

    if (!_current)
    {
      _current.emplace(bucket, marketCap, volume);
    }
    else if (bucket < _current->startMs)
    {
      if (++_lateRejected == 1)
      {
        CAPFLOW_LOG_WARN("[MarketCapAggregator] " << _token << " " << _timeframe.label()
                                                  << ": late swap " << swap.signature
                                                  << " at " << swap.timestampMs
                                                  << " before open bucket " << _current->startMs
                                                  << " rejected");
      }
      return std::nullopt;
    }
    else if (bucket > _current->startMs)
    {
      _current->closed = true;
      _history.push(*_current);
      closed.push_back(makeUpdate(*_current, true));

      const UsdValue level = _current->close;
      TimestampMs gapStart = _current->startMs + _timeframe.ms;

      // buckets that would be evicted straight away are not materialized
      const int64_t gaps = (bucket - gapStart) / _timeframe.ms;
      const int64_t keep = static_cast<int64_t>(_history.capacity());
      if (gaps > keep)
      {
        gapStart += (gaps - keep) * _timeframe.ms;
      }

      for (TimestampMs t = gapStart; t < bucket; t += _timeframe.ms)
      {
        auto gap = Candle::flat(t, level);
        _history.push(gap);
        closed.push_back(makeUpdate(gap, true));
      }

      _current.emplace(bucket, marketCap, volume);
    }
    else
    {
      _current->high = std::max(_current->high, marketCap);
      _current->low = std::min(_current->low, marketCap);
      _current->close = marketCap;
      _current->volume += volume;
      ++_current->trades;
    }

    _lastPrice = swap.priceUsd;
    _lastMarketCap = marketCap;
    result = makeUpdate(*_current, false);
  }

  for (size_t i = 0; i < closed.size(); ++i)
  {
    emit(closed[i], i == 0);
  }
  emit(result, false);

  return result;
}

void MarketCapAggregator::emit(const CandleUpdate& update, bool realClose)
{
  if (_bus)
  {
    _bus->publishCandle(update);
  }

  for (const auto& cb : _updateCallbacks)
  {
    try
    {
      cb(update);
    }
    catch (const std::exception& e)
    {
      CAPFLOW_LOG_ERROR("[MarketCapAggregator] candle update callback threw: " << e.what());
    }
  }

  if (!realClose)
  {
    return;
  }

  for (const auto& cb : _closeCallbacks)
  {
    try
    {
      cb(update);
    }
    catch (const std::exception& e)
    {
      CAPFLOW_LOG_ERROR("[MarketCapAggregator] candle close callback threw: " << e.what());
    }
  }

  if (_closeHandler)
  {
    try
    {
      _closeHandler->onCandleClosed(*this, update);
    }
    catch (const std::exception& e)
    {
      CAPFLOW_LOG_ERROR("[MarketCapAggregator] close handler failed for " << _token << " "
                                                                          << _timeframe.label()
                                                                          << ": " << e.what());
    }
  }
}

void MarketCapAggregator::setSupply(Supply newSupply)
{
  std::lock_guard emitLock(_emitMutex);

  std::optional<SupplyChange> change;
  {
    std::lock_guard lock(_mutex);
    if (newSupply == _supply)
    {
      return;
    }

    const Supply oldSupply = _supply;
    _supply = newSupply;

    if (!_current || _lastPrice <= 0.0)
    {
      return;
    }

    const double ratio =
        oldSupply > 0 ? static_cast<double>(newSupply) / static_cast<double>(oldSupply) : 1.0;
    const UsdValue newMarketCap = _lastPrice * static_cast<double>(newSupply);

    _current->open *= ratio;
    _current->high = std::max(_current->high * ratio, newMarketCap);
    _current->low = std::min(_current->low * ratio, newMarketCap);
    _current->close = newMarketCap;
    _lastMarketCap = newMarketCap;

    change = SupplyChange{_token,
                          oldSupply,
                          newSupply,
                          _lastPrice * static_cast<double>(oldSupply),
                          newMarketCap,
                          nowMs()};

    CAPFLOW_LOG_INFO("[MarketCapAggregator] " << _token << " " << _timeframe.label()
                                              << " supply " << oldSupply << " -> " << newSupply
                                              << " (ratio " << ratio << ")");
  }

  if (_bus)
  {
    _bus->publishSupplyChange(*change);
  }
}

void MarketCapAggregator::onCandleUpdate(UpdateCallback callback)
{
  _updateCallbacks.push_back(std::move(callback));
}

void MarketCapAggregator::onCandleClose(UpdateCallback callback)
{
  _closeCallbacks.push_back(std::move(callback));
}

std::optional<Candle> MarketCapAggregator::currentCandle() const
{
  std::lock_guard lock(_mutex);
  return _current;
}

std::vector<Candle> MarketCapAggregator::completedCandles() const
{
  std::lock_guard lock(_mutex);
  return _history.toVector();
}

std::vector<Candle> MarketCapAggregator::allCandles() const
{
  std::lock_guard lock(_mutex);
  auto out = _history.toVector();
  if (_current)
  {
    out.push_back(*_current);
  }
  return out;
}

std::vector<ChartCandle> MarketCapAggregator::chartCandles() const
{
  std::vector<ChartCandle> rows;
  for (const auto& c : allCandles())
  {
    rows.push_back(ChartCandle{c.timeSec(), c.open, c.high, c.low, c.close, c.volume});
  }
  return rows;
}

UsdValue MarketCapAggregator::lastPriceUsd() const
{
  std::lock_guard lock(_mutex);
  return _lastPrice;
}

UsdValue MarketCapAggregator::lastMarketCap() const
{
  std::lock_guard lock(_mutex);
  return _lastMarketCap;
}

Supply MarketCapAggregator::supply() const
{
  std::lock_guard lock(_mutex);
  return _supply;
}

uint64_t MarketCapAggregator::lateEventsRejected() const
{
  std::lock_guard lock(_mutex);
  return _lateRejected;
}

void MarketCapAggregator::reset()
{
  std::lock_guard emitLock(_emitMutex);
  std::lock_guard lock(_mutex);
  _current.reset();
  _history.clear();
  _lastPrice = 0.0;
  _lastMarketCap = 0.0;
  _lateRejected = 0;
}

}  // namespace capflow
