/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "capflow/util/base/json_fields.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace capflow;

TEST(JsonFieldsTest, EscapeRoundTripsControlCharacters)
{
  const std::string raw = "a\"b\\c\nd\te";
  EXPECT_EQ(json::escape(raw), "a\\\"b\\\\c\\nd\\te");
  EXPECT_EQ(json::unescape(json::escape(raw)), raw);
}

TEST(JsonFieldsTest, EscapesRemainingControlCharactersAsUnicode)
{
  const std::string raw = std::string("bell\x07") + '\0' + "\x1f|\x7f";
  const auto escaped = json::escape(raw);

  EXPECT_EQ(escaped, "bell\\u0007\\u0000\\u001f|\x7f");
  for (char c : escaped)
  {
    EXPECT_GE(static_cast<unsigned char>(c), 0x20);
  }
  EXPECT_EQ(json::unescape(escaped), raw);
  EXPECT_EQ(json::unescape("caf\\u00e9"), "caf\xc3\xa9");
}

TEST(JsonFieldsTest, NumberFormatting)
{
  EXPECT_EQ(json::number(10000.0), "10000");
  EXPECT_EQ(json::number(-3.0), "-3");
  EXPECT_EQ(json::number(0.012), "0.012");
  EXPECT_EQ(json::number(std::numeric_limits<double>::quiet_NaN()), "0");
  EXPECT_EQ(json::number(std::numeric_limits<double>::infinity()), "0");
}

TEST(JsonFieldsTest, NumberKeepsFullPrecision)
{
  for (double v : {0.1 + 0.2, 1.0 / 3.0, 123456.78901234567, 2.5e-9, -7.000000000000001})
  {
    const std::string doc = R"({"v":)" + json::number(v) + "}";
    auto parsed = json::extractDouble(doc, "v");
    ASSERT_TRUE(parsed.has_value()) << doc;
    EXPECT_EQ(*parsed, v) << doc;
  }
  EXPECT_EQ(json::number(0.1 + 0.2), "0.30000000000000004");
}

TEST(JsonFieldsTest, ExtractsTypedFields)
{
  const std::string doc =
      R"({"token": "So1\"x", "time": 120, "open": 1.5e3, "is_closed": true, "neg": -7})";

  EXPECT_EQ(json::extractString(doc, "token"), "So1\"x");
  EXPECT_EQ(json::extractInt(doc, "time"), 120);
  EXPECT_EQ(json::extractInt(doc, "neg"), -7);
  EXPECT_DOUBLE_EQ(*json::extractDouble(doc, "open"), 1500.0);
  EXPECT_EQ(json::extractBool(doc, "is_closed"), true);
}

TEST(JsonFieldsTest, MissingOrMistypedFieldsAreEmpty)
{
  const std::string doc = R"({"a": "text", "b": 12.5, "c": 3})";

  EXPECT_FALSE(json::extractString(doc, "missing").has_value());
  EXPECT_FALSE(json::extractString(doc, "c").has_value());
  EXPECT_FALSE(json::extractInt(doc, "b").has_value());
  EXPECT_FALSE(json::extractDouble(doc, "a").has_value());
  EXPECT_FALSE(json::extractBool(doc, "c").has_value());
}

TEST(JsonFieldsTest, KeyMustMatchExactly)
{
  const std::string doc = R"({"old_supply": 1, "supply": 2})";
  EXPECT_EQ(json::extractInt(doc, "supply"), 2);
  EXPECT_EQ(json::extractInt(doc, "old_supply"), 1);
}

TEST(JsonFieldsTest, TrimStripsWhitespace)
{
  EXPECT_EQ(json::trim("  x y \n"), "x y");
  EXPECT_EQ(json::trim(" \t "), "");
}
