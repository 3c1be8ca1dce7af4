/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/aggregator/candle.h"
#include "capflow/aggregator/candle_close_handler.h"
#include "capflow/aggregator/candle_history.h"
#include "capflow/aggregator/timeframe.h"
#include "capflow/engine/engine_config.h"
#include "capflow/market/swap_event.h"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace capflow
{

class MessageBus;

/**
 * Builds market-cap OHLCV candles for one (token, timeframe) pair.
 *
 * Closed candles go into a bounded history; every processed swap publishes
 * the resulting candle on candles:{token}:{label}. Calls for the same
 * aggregator are serialized, so updates leave in processing order.
 *
 * Callbacks and the close handler must be registered before the first
 * processSwap(). They run on the processing thread, outside the state lock.
 */
class MarketCapAggregator
{
 public:
  using UpdateCallback = std::function<void(const CandleUpdate&)>;

  /// Throws std::invalid_argument for a non-positive timeframe.
  MarketCapAggregator(std::string token, Timeframe timeframe, Supply supply,
                      MessageBus* bus = nullptr,
                      size_t historySize = CAPFLOW_DEFAULT_HISTORY_SIZE);

  MarketCapAggregator(const MarketCapAggregator&) = delete;
  MarketCapAggregator& operator=(const MarketCapAggregator&) = delete;

  /// Returns the open candle after applying the swap, or nullopt when the
  /// swap is rejected (non-positive price, bucket older than the open one).
  std::optional<CandleUpdate> processSwap(const SwapEvent& swap);

  /// Rescales the open candle to the new supply. History is left as is.
  void setSupply(Supply newSupply);

  void onCandleUpdate(UpdateCallback callback);
  void onCandleClose(UpdateCallback callback);
  void setCloseHandler(ICandleCloseHandler* handler) { _closeHandler = handler; }

  const std::string& token() const noexcept { return _token; }
  const Timeframe& timeframe() const noexcept { return _timeframe; }

  std::optional<Candle> currentCandle() const;
  std::vector<Candle> completedCandles() const;
  std::vector<Candle> allCandles() const;
  std::vector<ChartCandle> chartCandles() const;

  UsdValue lastPriceUsd() const;
  UsdValue lastMarketCap() const;
  Supply supply() const;
  uint64_t lateEventsRejected() const;

  /// Drops the open candle, history and last prices. Supply is kept.
  void reset();

 private:
  CandleUpdate makeUpdate(const Candle& candle, bool isClosed) const;
  void emit(const CandleUpdate& update, bool realClose);

  const std::string _token;
  const Timeframe _timeframe;
  MessageBus* _bus;

  // Held across a whole processSwap()/setSupply() including publication;
  // always taken before _mutex.
  std::mutex _emitMutex;

  mutable std::mutex _mutex;
  std::optional<Candle> _current;
  CandleHistory _history;
  UsdValue _lastPrice{0.0};
  UsdValue _lastMarketCap{0.0};
  Supply _supply;
  uint64_t _lateRejected{0};

  std::vector<UpdateCallback> _updateCallbacks;
  std::vector<UpdateCallback> _closeCallbacks;
  ICandleCloseHandler* _closeHandler = nullptr;
};

}  // namespace capflow
