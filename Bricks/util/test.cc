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

#include <memory>
#include <string>

#include "optionally_owned.h"
#include "singleton.h"

#include "../exception.h"
#include "../strings/printf.h"

#include <gtest/gtest.h>

TEST(Util, BasicException) {
  int line = 0;
  try {
    line = __LINE__ + 1;
    WEBLOG_THROW(weblog::Exception("Foo"));
    ASSERT_TRUE(false);
  } catch (const weblog::Exception& e) {
    // `__FILE__` may come with a path prefix, compare the tail only.
    const std::string actual = e.what();
    const std::string golden = weblog::strings::Printf("test.cc:%d\tweblog::Exception(\"Foo\")\tFoo", line);
    ASSERT_GE(actual.length(), golden.length());
    EXPECT_EQ(golden, actual.substr(actual.length() - golden.length()));
    EXPECT_EQ("Foo", e.OriginalDescription());
    EXPECT_EQ(line, e.Line());
  }
}

struct TestException : weblog::Exception {
  TestException(const std::string& a, const std::string& b) : weblog::Exception(a + "&" + b) {}
};

TEST(Util, CustomException) {
  try {
    WEBLOG_THROW(TestException("Bar", "Baz"));
    ASSERT_TRUE(false);
  } catch (const weblog::Exception& e) {
    EXPECT_EQ("Bar&Baz", e.OriginalDescription());
    EXPECT_EQ("TestException(\"Bar\", \"Baz\")", e.Caller());
    const std::string actual = e.what();
    const std::string suffix = "\tTestException(\"Bar\", \"Baz\")\tBar&Baz";
    ASSERT_GE(actual.length(), suffix.length());
    EXPECT_EQ(suffix, actual.substr(actual.length() - suffix.length()));
  }
  // Not thrown through `WEBLOG_THROW`, `what()` is the bare message.
  EXPECT_EQ(std::string("Bar&Baz"), TestException("Bar", "Baz").what());
}

TEST(Util, Singleton) {
  struct Foo {
    size_t bar = 0u;
    void baz() { ++bar; }
  };
  EXPECT_EQ(0u, weblog::Singleton<Foo>().bar);
  weblog::Singleton<Foo>().baz();
  EXPECT_EQ(1u, weblog::Singleton<Foo>().bar);
  const auto lambda = []() { weblog::Singleton<Foo>().baz(); };
  lambda();
  EXPECT_EQ(2u, weblog::Singleton<Foo>().bar);
}

namespace {

struct Tracked {
  std::string& story;
  explicit Tracked(std::string& story) : story(story) { story += "+"; }
  ~Tracked() { story += "-"; }
  void Use() { story += "U"; }
};

}  // namespace

TEST(OptionallyOwned, BorrowsByReference) {
  std::string s;
  {
    Tracked bar(s);
    {
      weblog::OptionallyOwned<Tracked> holder(bar);
      holder->Use();
      EXPECT_EQ(&bar, &holder.Ref());
    }
    EXPECT_EQ("+U", s);  // Not destroyed along with the holder.
  }
  EXPECT_EQ("+U-", s);
}

TEST(OptionallyOwned, OwnsByUniquePointer) {
  std::string s;
  {
    weblog::OptionallyOwned<Tracked> holder(std::make_unique<Tracked>(s));
    holder.Ref().Use();
    EXPECT_EQ("+U", s);
  }
  EXPECT_EQ("+U-", s);
}

TEST(OptionallyOwned, MoveTransfersOwnership) {
  std::string s;
  {
    weblog::OptionallyOwned<Tracked> first(std::make_unique<Tracked>(s));
    {
      weblog::OptionallyOwned<Tracked> second(std::move(first));
      second->Use();
      EXPECT_THROW(first.Ref(), weblog::InvalidOptionallyOwnedException);
      EXPECT_THROW(weblog::OptionallyOwned<Tracked> third(std::move(first)),
                   weblog::InvalidOptionallyOwnedException);
    }
    EXPECT_EQ("+U-", s);
  }
  EXPECT_EQ("+U-", s);

  std::unique_ptr<Tracked> null_ptr;
  EXPECT_THROW(weblog::OptionallyOwned<Tracked> invalid(std::move(null_ptr)), weblog::InvalidOptionallyOwnedException);
}
