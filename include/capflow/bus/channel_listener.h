/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <string_view>

namespace capflow
{

class IChannelListener
{
 public:
  virtual ~IChannelListener() = default;

  /// Called once per message published on a subscribed channel, in publish order.
  virtual void onMessage(std::string_view channel, std::string_view payload) = 0;
};

}  // namespace capflow
