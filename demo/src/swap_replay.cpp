/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

// Swap Replay
//
// Replays a JSON-lines file of swap events through the aggregator registry and
// prints the resulting chart candles for every token and timeframe.
//
//   swap_replay swaps.jsonl [config.json]

#include "capflow/aggregator/aggregator_registry.h"
#include "capflow/bus/payload_codec.h"
#include "capflow/engine/engine_config.h"
#include "capflow/log/log.h"

#include <fstream>
#include <iostream>
#include <string>

using namespace capflow;

int main(int argc, char** argv)
{
  if (argc < 2)
  {
    std::cerr << "usage: " << argv[0] << " <swaps.jsonl> [config.json]" << std::endl;
    return 1;
  }

  EngineConfig config;
  if (argc > 2)
  {
    try
    {
      auto loaded = EngineConfig::load(argv[2]);
      if (!loaded)
      {
        std::cerr << "cannot read config " << argv[2] << std::endl;
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
  setLogLevel(logLevelFromString(config.logLevel));

  std::ifstream input(argv[1]);
  if (!input)
  {
    std::cerr << "cannot open " << argv[1] << std::endl;
    return 1;
  }

  AggregatorRegistry registry(config);

  size_t lineNo = 0;
  size_t accepted = 0;
  size_t skipped = 0;
  std::string line;
  while (std::getline(input, line))
  {
    ++lineNo;
    if (line.empty())
    {
      continue;
    }

    auto swap = codec::decodeSwapEvent(line);
    if (!swap)
    {
      CAPFLOW_LOG_WARN("[swap_replay] line " << lineNo << ": unreadable swap, skipped");
      ++skipped;
      continue;
    }
    if (registry.processSwap(*swap).empty())
    {
      ++skipped;
      continue;
    }
    ++accepted;
  }

  std::cout << "Replayed " << accepted << " swaps (" << skipped << " skipped) across "
            << registry.tokens().size() << " tokens" << std::endl;

  for (const auto& token : registry.tokens())
  {
    for (const auto& tf : registry.timeframes())
    {
      auto aggregator = registry.find(token, tf);
      if (!aggregator)
      {
        continue;
      }
      std::cout << token << " " << tf.label() << " "
                << codec::encodeChartCandles(aggregator->chartCandles()) << std::endl;
    }
  }
  return 0;
}
