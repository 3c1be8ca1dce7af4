/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/bus/resp.h"

#include <charconv>

namespace capflow::resp
{

namespace
{

constexpr size_t kMaxBulkLength = 512u * 1024u * 1024u;
constexpr int64_t kMaxArrayLength = 1024 * 1024;

template <typename Range>
std::string encodeParts(const Range& parts, size_t count)
{
  std::string out;
  out += '*';
  out += std::to_string(count);
  out += "\r\n";
  for (const auto& part : parts)
  {
    std::string_view p(part);
    out += '$';
    out += std::to_string(p.size());
    out += "\r\n";
    out.append(p.data(), p.size());
    out += "\r\n";
  }
  return out;
}

int64_t parseInteger(std::string_view text)
{
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size())
  {
    throw ProtocolError("RESP: bad integer '" + std::string(text) + "'");
  }
  return value;
}

}  // namespace

std::string encodeCommand(std::initializer_list<std::string_view> parts)
{
  return encodeParts(parts, parts.size());
}

std::string encodeCommand(const std::vector<std::string>& parts)
{
  return encodeParts(parts, parts.size());
}

void Parser::feed(std::string_view bytes)
{
  // compact consumed prefix before growing
  if (_offset > 0 && _offset >= _buffer.size() / 2)
  {
    _buffer.erase(0, _offset);
    _offset = 0;
  }
  _buffer.append(bytes.data(), bytes.size());
}

std::optional<Value> Parser::next()
{
  size_t pos = _offset;
  Value value;
  if (!parseValue(pos, value))
  {
    return std::nullopt;
  }
  _offset = pos;
  return value;
}

bool Parser::readLine(size_t& pos, std::string_view& line)
{
  auto end = _buffer.find("\r\n", pos);
  if (end == std::string::npos)
  {
    return false;
  }
  line = std::string_view(_buffer).substr(pos, end - pos);
  pos = end + 2;
  return true;
}

bool Parser::parseValue(size_t& pos, Value& out)
{
  if (pos >= _buffer.size())
  {
    return false;
  }

  size_t cursor = pos;
  const char marker = _buffer[cursor++];
  std::string_view line;
  if (!readLine(cursor, line))
  {
    return false;
  }

  switch (marker)
  {
    case '+':
      out.type = Value::Type::SimpleString;
      out.str = std::string(line);
      break;

    case '-':
      out.type = Value::Type::Error;
      out.str = std::string(line);
      break;

    case ':':
      out.type = Value::Type::Integer;
      out.integer = parseInteger(line);
      break;

    case '$':
    {
      const int64_t len = parseInteger(line);
      if (len < 0)
      {
        out.type = Value::Type::Null;
        break;
      }
      if (static_cast<size_t>(len) > kMaxBulkLength)
      {
        throw ProtocolError("RESP: bulk string too large");
      }
      if (_buffer.size() < cursor + static_cast<size_t>(len) + 2)
      {
        return false;
      }
      out.type = Value::Type::BulkString;
      out.str = _buffer.substr(cursor, static_cast<size_t>(len));
      cursor += static_cast<size_t>(len);
      if (_buffer.compare(cursor, 2, "\r\n") != 0)
      {
        throw ProtocolError("RESP: bulk string missing terminator");
      }
      cursor += 2;
      break;
    }

    case '*':
    {
      const int64_t count = parseInteger(line);
      if (count < 0)
      {
        out.type = Value::Type::Null;
        break;
      }
      if (count > kMaxArrayLength)
      {
        throw ProtocolError("RESP: array too large");
      }
      out.type = Value::Type::Array;
      out.elements.clear();
      out.elements.reserve(static_cast<size_t>(count));
      for (int64_t i = 0; i < count; ++i)
      {
        Value element;
        if (!parseValue(cursor, element))
        {
          return false;
        }
        out.elements.push_back(std::move(element));
      }
      break;
    }

    default:
      throw ProtocolError(std::string("RESP: unexpected type marker '") + marker + "'");
  }

  pos = cursor;
  return true;
}

}  // namespace capflow::resp
