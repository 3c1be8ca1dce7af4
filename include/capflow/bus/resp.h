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
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace capflow::resp
{

class ProtocolError : public std::runtime_error
{
 public:
  using std::runtime_error::runtime_error;
};

struct Value
{
  enum class Type : uint8_t
  {
    SimpleString,
    Error,
    Integer,
    BulkString,
    Null,
    Array
  };

  Type type{Type::Null};
  std::string str;
  int64_t integer{0};
  std::vector<Value> elements;

  bool isError() const noexcept { return type == Type::Error; }
  bool isNull() const noexcept { return type == Type::Null; }
};

/// Encodes a command as an array of bulk strings.
std::string encodeCommand(std::initializer_list<std::string_view> parts);
std::string encodeCommand(const std::vector<std::string>& parts);

/// Incremental reply parser. feed() bytes as they arrive, then drain next()
/// until it returns nullopt. Malformed input throws ProtocolError.
class Parser
{
 public:
  void feed(std::string_view bytes);
  std::optional<Value> next();

  size_t buffered() const noexcept { return _buffer.size() - _offset; }
  void reset() noexcept
  {
    _buffer.clear();
    _offset = 0;
  }

 private:
  // Returns false when more bytes are needed; pos is advanced on success only.
  bool parseValue(size_t& pos, Value& out);
  bool readLine(size_t& pos, std::string_view& line);

  std::string _buffer;
  size_t _offset = 0;
};

}  // namespace capflow::resp
