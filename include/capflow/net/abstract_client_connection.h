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

#include <string_view>

namespace capflow
{

/// Downstream push connection (a WebSocket session, a test sink, ...).
class IClientConnection
{
 public:
  virtual ~IClientConnection() = default;

  virtual ConnectionId id() const = 0;

  /// Writes one message. Returns false (or throws) when the write failed.
  virtual bool send(std::string_view payload) = 0;
};

}  // namespace capflow
