/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/util/base/json_fields.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace capflow::json
{

namespace
{

// Position just past the ':' that follows "key", or npos.
size_t valuePos(std::string_view content, std::string_view key)
{
  std::string quoted;
  quoted.reserve(key.size() + 2);
  quoted += '"';
  quoted += key;
  quoted += '"';

  size_t keyPos = content.find(quoted);
  while (keyPos != std::string_view::npos)
  {
    size_t i = keyPos + quoted.size();
    while (i < content.size() && (content[i] == ' ' || content[i] == '\t' || content[i] == '\n' ||
                                  content[i] == '\r'))
    {
      ++i;
    }
    if (i < content.size() && content[i] == ':')
    {
      return i + 1;
    }
    keyPos = content.find(quoted, keyPos + 1);
  }
  return std::string_view::npos;
}

std::string_view scalarToken(std::string_view content, size_t pos)
{
  while (pos < content.size() && (content[pos] == ' ' || content[pos] == '\t' ||
                                  content[pos] == '\n' || content[pos] == '\r'))
  {
    ++pos;
  }
  size_t end = pos;
  while (end < content.size() && content[end] != ',' && content[end] != '}' &&
         content[end] != ']' && content[end] != '\n' && content[end] != '\r' &&
         content[end] != ' ')
  {
    ++end;
  }
  return content.substr(pos, end - pos);
}

// Four hex digits of a \u escape.
std::optional<uint32_t> hexCodePoint(std::string_view digits)
{
  if (digits.size() < 4)
  {
    return std::nullopt;
  }
  uint32_t cp = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + 4, cp, 16);
  if (ec != std::errc{} || ptr != digits.data() + 4)
  {
    return std::nullopt;
  }
  return cp;
}

void appendUtf8(std::string& out, uint32_t cp)
{
  if (cp < 0x80)
  {
    out += static_cast<char>(cp);
  }
  else if (cp < 0x800)
  {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  else
  {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

}  // namespace

std::string escape(std::string_view s)
{
  std::string result;
  result.reserve(s.size() + 8);
  for (char c : s)
  {
    switch (c)
    {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20)
        {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          result += buf;
        }
        else
        {
          result += c;
        }
    }
  }
  return result;
}

std::string unescape(std::string_view s)
{
  std::string result;
  result.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i)
  {
    if (s[i] == '\\' && i + 1 < s.size())
    {
      switch (s[i + 1])
      {
        case '"':
          result += '"';
          break;
        case '\\':
          result += '\\';
          break;
        case 'n':
          result += '\n';
          break;
        case 'r':
          result += '\r';
          break;
        case 't':
          result += '\t';
          break;
        case 'u':
          if (auto cp = hexCodePoint(s.substr(i + 2)))
          {
            appendUtf8(result, *cp);
            i += 4;
          }
          else
          {
            result += 'u';
          }
          break;
        default:
          result += s[i + 1];
      }
      ++i;
    }
    else
    {
      result += s[i];
    }
  }
  return result;
}

std::string trim(std::string_view s)
{
  size_t start = s.find_first_not_of(" \t\n\r");
  if (start == std::string_view::npos)
  {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\n\r");
  return std::string(s.substr(start, end - start + 1));
}

std::string number(double value)
{
  if (!std::isfinite(value))
  {
    return "0";
  }
  if (value == std::floor(value) && std::fabs(value) < 9.0e15)
  {
    return std::to_string(static_cast<int64_t>(value));
  }

  // shortest form that parses back to the same double
  char buf[32];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  if (ec != std::errc{})
  {
    return "0";
  }
  return std::string(buf, end);
}

std::optional<std::string> extractString(std::string_view content, std::string_view key)
{
  auto pos = valuePos(content, key);
  if (pos == std::string_view::npos)
  {
    return std::nullopt;
  }

  auto firstQuote = content.find('"', pos);
  if (firstQuote == std::string_view::npos)
  {
    return std::nullopt;
  }
  for (size_t i = pos; i < firstQuote; ++i)
  {
    if (content[i] != ' ' && content[i] != '\t' && content[i] != '\n' && content[i] != '\r')
    {
      return std::nullopt;  // not a string value
    }
  }

  auto secondQuote = firstQuote + 1;
  while (secondQuote < content.size())
  {
    if (content[secondQuote] == '\\')
    {
      secondQuote += 2;
      continue;
    }
    if (content[secondQuote] == '"')
    {
      break;
    }
    ++secondQuote;
  }

  if (secondQuote >= content.size())
  {
    return std::nullopt;
  }

  return unescape(content.substr(firstQuote + 1, secondQuote - firstQuote - 1));
}

std::optional<int64_t> extractInt(std::string_view content, std::string_view key)
{
  auto pos = valuePos(content, key);
  if (pos == std::string_view::npos)
  {
    return std::nullopt;
  }

  auto token = scalarToken(content, pos);
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
  if (ec != std::errc{} || ptr != token.data() + token.size())
  {
    return std::nullopt;
  }
  return value;
}

std::optional<double> extractDouble(std::string_view content, std::string_view key)
{
  auto pos = valuePos(content, key);
  if (pos == std::string_view::npos)
  {
    return std::nullopt;
  }

  std::string token(scalarToken(content, pos));
  if (token.empty())
  {
    return std::nullopt;
  }

  char* end = nullptr;
  const double value = std::strtod(token.c_str(), &end);
  if (end != token.c_str() + token.size())
  {
    return std::nullopt;
  }
  return value;
}

std::optional<bool> extractBool(std::string_view content, std::string_view key)
{
  auto pos = valuePos(content, key);
  if (pos == std::string_view::npos)
  {
    return std::nullopt;
  }

  auto token = scalarToken(content, pos);
  if (token == "true")
  {
    return true;
  }
  if (token == "false")
  {
    return false;
  }
  return std::nullopt;
}

}  // namespace capflow::json
