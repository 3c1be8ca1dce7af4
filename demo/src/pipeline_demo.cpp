/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

// Pipeline Demo
//
// Feeds a synthetic random walk of swaps for a few tokens through the full
// engine and prints what an attached client sees. Pass a JSON config path to
// try a Redis broker ("broker_url"); without one the in-process bus is used.

#include "capflow/bus/channels.h"
#include "capflow/engine/pipeline.h"
#include "capflow/log/log.h"
#include "capflow/util/base/json_fields.h"

#include <chrono>
#include <iostream>
#include <mutex>
#include <random>
#include <thread>

using namespace capflow;

class PrintingConnection : public IClientConnection
{
 public:
  explicit PrintingConnection(ConnectionId id) : _id(id) {}

  ConnectionId id() const override { return _id; }

  bool send(std::string_view payload) override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (json::extractBool(payload, "is_closed") == true)
    {
      std::cout << "[CLOSED] " << payload << std::endl;
      ++_closed;
    }
    else if (payload.find("\"new_supply\"") != std::string_view::npos)
    {
      std::cout << "[SUPPLY] " << payload << std::endl;
    }
    ++_received;
    return true;
  }

  void printStats() const
  {
    std::cout << "\n=== Client Stats ===" << std::endl;
    std::cout << "Messages received: " << _received << std::endl;
    std::cout << "Closed candles:    " << _closed << std::endl;
  }

 private:
  ConnectionId _id;
  std::mutex _mutex;
  int _received = 0;
  int _closed = 0;
};

int main(int argc, char** argv)
{
  std::cout << "=== Market Cap Pipeline Demo ===" << std::endl;

  EngineConfig config;
  if (argc > 1)
  {
    try
    {
      auto loaded = EngineConfig::load(argv[1]);
      if (!loaded)
      {
        std::cerr << "cannot read config " << argv[1] << std::endl;
        return 1;
      }
      config = *loaded;
    }
    catch (const std::exception& e)
    {
      std::cerr << "invalid config: " << e.what() << std::endl;
      return 1;
    }
  }
  config.timeframes = {timeframe::M1, timeframe::M5};

  Pipeline pipeline(config);
  pipeline.start();
  std::cout << "Bus backend: " << pipeline.bus().backendName() << std::endl;

  const std::vector<std::string> tokens = {"DemoMintA", "DemoMintB"};

  auto client = std::make_shared<PrintingConnection>(1);
  std::vector<std::string> subscriptions;
  for (const auto& token : tokens)
  {
    subscriptions.push_back(channels::candles(token, timeframe::M1));
    subscriptions.push_back(channels::supplyChange(token));
  }
  pipeline.addClient(client, subscriptions);

  std::mt19937 rng(7);
  std::normal_distribution<> step(0.0, 0.02);
  std::uniform_real_distribution<> amount(1'000.0, 50'000.0);
  std::vector<double> prices = {0.00001, 0.00004};

  // ten simulated minutes, one swap every five seconds per token
  constexpr TimestampMs START = 1'700'000'000'000;
  for (TimestampMs ts = START; ts < START + 10 * 60'000; ts += 5'000)
  {
    for (size_t i = 0; i < tokens.size(); ++i)
    {
      prices[i] *= (1.0 + step(rng));

      SwapEvent swap;
      swap.signature = tokens[i] + "-" + std::to_string(ts);
      swap.timestampMs = ts;
      swap.source = SwapSource::PumpFun;
      swap.side = step(rng) > 0 ? Side::BUY : Side::SELL;
      swap.tokenAddress = tokens[i];
      swap.amountToken = amount(rng);
      swap.priceUsd = prices[i];
      pipeline.ingest(swap);
    }

    if (ts == START + 5 * 60'000)
    {
      // a burn halfway through rescales the open candles
      pipeline.registry().applyBurn(tokens[0], 100'000'000);
    }
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  for (const auto& token : tokens)
  {
    auto aggregator = pipeline.registry().find(token, timeframe::M5);
    if (!aggregator)
    {
      continue;
    }
    std::cout << "\n" << token << " 5m candles:" << std::endl;
    for (const auto& c : aggregator->chartCandles())
    {
      std::cout << "  t=" << c.time << " o=" << c.open << " h=" << c.high << " l=" << c.low
                << " c=" << c.close << " v=" << c.volume << std::endl;
    }
  }

  client->printStats();
  pipeline.stop();
  return 0;
}
