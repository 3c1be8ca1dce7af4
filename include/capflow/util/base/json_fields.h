/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace capflow::json
{

// Minimal flat-JSON helpers: enough for the engine's own payloads and config
// files, not a general parser. Nested objects are searched textually.

std::string escape(std::string_view s);
std::string unescape(std::string_view s);
std::string trim(std::string_view s);

/// Compact rendering of a double: integral values without a fraction ("10000"),
/// others with 15 significant digits ("0.012").
std::string number(double value);

std::optional<std::string> extractString(std::string_view content, std::string_view key);
std::optional<int64_t> extractInt(std::string_view content, std::string_view key);
std::optional<double> extractDouble(std::string_view content, std::string_view key);
std::optional<bool> extractBool(std::string_view content, std::string_view key);

}  // namespace capflow::json
