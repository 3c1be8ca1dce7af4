/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/bus/payload_codec.h"
#include "capflow/util/base/json_fields.h"

#include <sstream>
#include <stdexcept>

namespace capflow::codec
{

std::string encodeCandleUpdate(const CandleUpdate& update)
{
  const auto& c = update.candle;

  std::ostringstream os;
  os << "{"
     << "\"token\":\"" << json::escape(update.token) << "\","
     << "\"timeframe\":\"" << update.timeframe.label() << "\","
     << "\"time\":" << c.timeSec() << ","
     << "\"open\":" << json::number(c.open) << ","
     << "\"high\":" << json::number(c.high) << ","
     << "\"low\":" << json::number(c.low) << ","
     << "\"close\":" << json::number(c.close) << ","
     << "\"volume\":" << json::number(c.volume) << ","
     << "\"trades\":" << c.trades << ","
     << "\"is_closed\":" << (update.isClosed ? "true" : "false") << "}";
  return os.str();
}

std::optional<CandleUpdate> decodeCandleUpdate(std::string_view payload)
{
  auto time = json::extractInt(payload, "time");
  auto open = json::extractDouble(payload, "open");
  auto high = json::extractDouble(payload, "high");
  auto low = json::extractDouble(payload, "low");
  auto close = json::extractDouble(payload, "close");
  if (!time || !open || !high || !low || !close)
  {
    return std::nullopt;
  }

  CandleUpdate update;
  update.token = json::extractString(payload, "token").value_or("");
  if (auto tf = json::extractString(payload, "timeframe"))
  {
    try
    {
      update.timeframe = Timeframe::parse(*tf);
    }
    catch (const std::invalid_argument&)
    {
      return std::nullopt;
    }
  }

  auto& c = update.candle;
  c.startMs = *time * 1000;
  c.open = *open;
  c.high = *high;
  c.low = *low;
  c.close = *close;
  c.volume = json::extractDouble(payload, "volume").value_or(0.0);
  c.trades = static_cast<uint32_t>(json::extractInt(payload, "trades").value_or(0));
  update.isClosed = json::extractBool(payload, "is_closed").value_or(false);
  c.closed = update.isClosed;
  return update;
}

std::string encodeSupplyChange(const SupplyChange& change)
{
  std::ostringstream os;
  os << "{"
     << "\"token\":\"" << json::escape(change.token) << "\","
     << "\"old_supply\":" << change.oldSupply << ","
     << "\"new_supply\":" << change.newSupply << ","
     << "\"old_market_cap\":" << json::number(change.oldMarketCap) << ","
     << "\"new_market_cap\":" << json::number(change.newMarketCap) << ","
     << "\"timestamp\":" << change.timestampMs << "}";
  return os.str();
}

std::string encodeSwapEvent(const SwapEvent& swap)
{
  std::ostringstream os;
  os << "{"
     << "\"signature\":\"" << json::escape(swap.signature) << "\","
     << "\"timestamp\":" << swap.timestampMs << ","
     << "\"source\":\"" << toString(swap.source) << "\","
     << "\"side\":\"" << toString(swap.side) << "\","
     << "\"token\":\"" << json::escape(swap.tokenAddress) << "\","
     << "\"amount_token\":" << json::number(swap.amountToken) << ","
     << "\"amount_base\":" << json::number(swap.amountBase) << ","
     << "\"price_usd\":" << json::number(swap.priceUsd) << ","
     << "\"market_cap_usd\":" << json::number(swap.marketCapUsd) << ","
     << "\"trader\":\"" << json::escape(swap.trader) << "\"}";
  return os.str();
}

std::optional<SwapEvent> decodeSwapEvent(std::string_view payload)
{
  auto token = json::extractString(payload, "token");
  auto timestamp = json::extractInt(payload, "timestamp");
  auto price = json::extractDouble(payload, "price_usd");
  if (!token || !timestamp || !price)
  {
    return std::nullopt;
  }

  SwapEvent swap;
  swap.tokenAddress = *token;
  swap.timestampMs = *timestamp;
  swap.priceUsd = *price;
  swap.signature = json::extractString(payload, "signature").value_or("");
  swap.trader = json::extractString(payload, "trader").value_or("");
  swap.amountToken = json::extractDouble(payload, "amount_token").value_or(0.0);
  swap.amountBase = json::extractDouble(payload, "amount_base").value_or(0.0);
  swap.marketCapUsd = json::extractDouble(payload, "market_cap_usd").value_or(0.0);

  auto side = json::extractString(payload, "side").value_or("buy");
  if (side == "buy")
  {
    swap.side = Side::BUY;
  }
  else if (side == "sell")
  {
    swap.side = Side::SELL;
  }
  else
  {
    return std::nullopt;
  }

  auto source = json::extractString(payload, "source");
  if (source && *source != toString(SwapSource::Unknown))
  {
    try
    {
      swap.source = swapSourceFromString(*source);
    }
    catch (const std::invalid_argument&)
    {
      return std::nullopt;
    }
  }
  return swap;
}

std::string encodeChartCandles(const std::vector<ChartCandle>& candles)
{
  std::ostringstream os;
  os << "[";
  bool first = true;
  for (const auto& c : candles)
  {
    if (!first)
    {
      os << ",";
    }
    first = false;
    os << "{"
       << "\"time\":" << c.time << ","
       << "\"open\":" << json::number(c.open) << ","
       << "\"high\":" << json::number(c.high) << ","
       << "\"low\":" << json::number(c.low) << ","
       << "\"close\":" << json::number(c.close) << ","
       << "\"volume\":" << json::number(c.volume) << "}";
  }
  os << "]";
  return os.str();
}

}  // namespace capflow::codec
