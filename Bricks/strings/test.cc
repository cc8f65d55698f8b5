/*******************************************************************************
The MIT License (MIT)

Copyright (c) 2026 The Weblog Authors

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*******************************************************************************/

#include <cstdint>
#include <string>
#include <vector>

#include "printf.h"
#include "split.h"
#include "util.h"

#include <gtest/gtest.h>

using weblog::strings::ByWhitespace;
using weblog::strings::Printf;
using weblog::strings::Split;
using weblog::strings::ToString;
using weblog::strings::Trim;
using weblog::strings::TryFromString;

TEST(StringPrintf, SmokeTest) {
  EXPECT_EQ("Test: 42, 'Hello', 0000ABBA", Printf("Test: %d, '%s', %08X", 42, "Hello", 0xabba));
  EXPECT_EQ("2015 06 01 00 10", Printf("%04d %02d %02d %02d %02d", 2015, 6, 1, 0, 10));
  EXPECT_EQ("", Printf("%s", ""));
  EXPECT_EQ(100000u, Printf("%s", std::string(100000, 'A').c_str()).length());
}

TEST(Util, Trim) {
  EXPECT_EQ("one", Trim(" one "));
  EXPECT_EQ("2015 06 01 00 10", Trim("\t2015 06 01 00 10\r"));
  EXPECT_EQ("3 \t\r\n 4", Trim("   \t\n\t\n\t\r\n   3 \t\r\n 4   \t\n\t\n\t\r\n   "));
  EXPECT_EQ("", Trim(""));
  EXPECT_EQ("", Trim(" \t\r\n "));
}

TEST(Util, ToString) {
  EXPECT_EQ("42", ToString(42));
  EXPECT_EQ("100", ToString(100u));
  EXPECT_EQ("4000000000", ToString(static_cast<uint64_t>(4000000000ull)));
}

TEST(Util, TryFromString) {
  {
    int x = 42;
    EXPECT_TRUE(TryFromString("06", x));
    EXPECT_EQ(6, x);
    EXPECT_TRUE(TryFromString("-1", x));
    EXPECT_EQ(-1, x);
    EXPECT_FALSE(TryFromString("", x));
    EXPECT_FALSE(TryFromString(" 1", x));
    EXPECT_FALSE(TryFromString("1 ", x));
    EXPECT_FALSE(TryFromString("1.5", x));
    EXPECT_FALSE(TryFromString("June", x));
    EXPECT_FALSE(TryFromString("99999999999", x));
    EXPECT_EQ(-1, x);
  }
  {
    uint32_t x = 7u;
    EXPECT_FALSE(TryFromString("-1", x));
    EXPECT_EQ(7u, x);
    EXPECT_TRUE(TryFromString("4000000000", x));
    EXPECT_EQ(4000000000u, x);
  }
  {
    bool b = false;
    EXPECT_TRUE(TryFromString("true", b));
    EXPECT_TRUE(b);
    EXPECT_TRUE(TryFromString("False", b));
    EXPECT_FALSE(b);
    EXPECT_TRUE(TryFromString("1", b));
    EXPECT_TRUE(b);
    EXPECT_FALSE(TryFromString("uncertain", b));
    EXPECT_FALSE(TryFromString("", b));
    EXPECT_TRUE(b);
  }
}

TEST(Split, ByWhitespace) {
  EXPECT_EQ(std::vector<std::string>({"2015", "06", "01", "00", "10"}),
            Split<ByWhitespace>("  2015 06\t01\r\n00   10 "));
  EXPECT_EQ(std::vector<std::string>({"one"}), Split<ByWhitespace>("one"));
  EXPECT_TRUE(Split<ByWhitespace>("").empty());
  EXPECT_TRUE(Split<ByWhitespace>(" \t ").empty());
}

TEST(Split, Processor) {
  size_t total_length = 0u;
  const size_t n =
      Split("aa  bbb c", ByWhitespace::UseIsSpace, [&total_length](std::string&& s) { total_length += s.length(); });
  EXPECT_EQ(3u, n);
  EXPECT_EQ(6u, total_length);
}
