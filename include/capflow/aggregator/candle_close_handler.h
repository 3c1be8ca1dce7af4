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

namespace capflow
{

class MarketCapAggregator;

/// Collaborator notified when an aggregator closes a candle that carried
/// trades (gap candles are not reported). Typical use: precomputing
/// indicators over the closed history.
class ICandleCloseHandler
{
 public:
  virtual ~ICandleCloseHandler() = default;

  virtual void onCandleClosed(const MarketCapAggregator& source, const CandleUpdate& closed) = 0;
};

}  // namespace capflow
