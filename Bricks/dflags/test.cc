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

#include "dflags.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

TEST(DFlags, DefinesAFlag) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  DEFINE_uint32(foo, 42u, "");
  DEFINE_uint64(bar, 42u, "");
  static_assert(std::is_same<decltype(FLAGS_foo), uint32_t>::value, "");
  static_assert(std::is_same<decltype(FLAGS_bar), uint64_t>::value, "");
  EXPECT_EQ(42u, FLAGS_foo);
  EXPECT_EQ(42u, FLAGS_bar);
  FLAGS_foo = 100u;
  EXPECT_EQ(100u, FLAGS_foo);
}

TEST(DFlags, ParsesAFlagUsingSingleDash) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  DEFINE_uint32(foo, 1u, "");
  EXPECT_EQ(1u, FLAGS_foo);
  int argc = 3;
  char p1[] = "./ParsesAFlagUsingSingleDash";
  char p2[] = "-foo";
  char p3[] = "2";
  char* pp[] = {p1, p2, p3};
  char** argv = pp;
  ParseDFlags(&argc, &argv);
  EXPECT_EQ(2u, FLAGS_foo);
  ASSERT_EQ(1, argc);
  EXPECT_EQ("./ParsesAFlagUsingSingleDash", std::string(argv[0]));
}

TEST(DFlags, ParsesAFlagUsingDoubleDashEquals) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  DEFINE_uint32(meh, 1, "");
  EXPECT_EQ(1u, FLAGS_meh);
  int argc = 2;
  char p1[] = "./ParsesAFlagUsingDoubleDashEquals";
  char p2[] = "--meh=2";
  char* pp[] = {p1, p2};
  char** argv = pp;
  ParseDFlags(&argc, &argv);
  EXPECT_EQ(2u, FLAGS_meh);
  ASSERT_EQ(1, argc);
  EXPECT_EQ("./ParsesAFlagUsingDoubleDashEquals", std::string(argv[0]));
}

TEST(DFlags, MultipleCallsToParseDFlagsDeathTest) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  int argc = 1;
  char p1[] = "./MultipleCallsToParseDFlagsDeathTest";
  char* pp[] = {p1};
  char** argv = pp;
  ParseDFlags(&argc, &argv);
  ASSERT_DEATH(ParseDFlags(&argc, &argv), "ParseDFlags\\(\\) is called more than once\\.");
}

TEST(DFlags, ParsesMultipleFlags) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  DEFINE_string(log, "demo.log", "");
  DEFINE_bool(single_pass, false, "");
  DEFINE_bool(print_counts, true, "");
  DEFINE_uint32(simulated_entries, 100u, "");
  DEFINE_uint64(seed, 0u, "");
  static_assert(std::is_same<decltype(FLAGS_log), std::string>::value, "");
  static_assert(std::is_same<decltype(FLAGS_single_pass), bool>::value, "");
  static_assert(std::is_same<decltype(FLAGS_simulated_entries), uint32_t>::value, "");
  static_assert(std::is_same<decltype(FLAGS_seed), uint64_t>::value, "");
  EXPECT_EQ("demo.log", FLAGS_log);
  EXPECT_FALSE(FLAGS_single_pass);
  EXPECT_TRUE(FLAGS_print_counts);
  int argc = 9;
  char p1[] = "./ParsesMultipleFlags";
  char p2[] = "-log";
  char p3[] = "weblog access.log";
  char p4[] = "-single_pass=true";
  char p5[] = "-print_counts=false";
  char p6[] = "--simulated_entries";
  char p7[] = "1000";
  char p8[] = "--seed=4000000000000000000";
  char p9[] = "remaining_parameter";
  char* pp[] = {p1, p2, p3, p4, p5, p6, p7, p8, p9};
  char** argv = pp;
  ParseDFlags(&argc, &argv);
  EXPECT_EQ("weblog access.log", FLAGS_log);
  EXPECT_TRUE(FLAGS_single_pass);
  EXPECT_FALSE(FLAGS_print_counts);
  EXPECT_EQ(1000u, FLAGS_simulated_entries);
  EXPECT_EQ(static_cast<uint64_t>(4e18), FLAGS_seed);
  ASSERT_EQ(2, argc);
  EXPECT_EQ("./ParsesMultipleFlags", std::string(argv[0]));
  EXPECT_EQ("remaining_parameter", std::string(argv[1]));
}

TEST(DFlags, ParsesEmptyStringUsingEquals) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  DEFINE_string(empty_string, "not yet", "");
  int argc = 2;
  char p1[] = "./ParsesEmptyStringUsingEquals";
  char p2[] = "--empty_string=";
  char* pp[] = {p1, p2};
  char** argv = pp;
  ParseDFlags(&argc, &argv);
  EXPECT_EQ("", FLAGS_empty_string);
}

TEST(DFlags, BooleanFlags) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  DEFINE_bool(verbose, false, "");
  DEFINE_bool(print_data, true, "");
  DEFINE_string(report, "all", "");
  int argc = 6;
  char p1[] = "./BooleanFlags";
  char p2[] = "--verbose";
  char p3[] = "--print_data";
  char p4[] = "false";
  char p5[] = "--report";
  char p6[] = "hourly";
  char* pp[] = {p1, p2, p3, p4, p5, p6};
  char** argv = pp;
  ParseDFlags(&argc, &argv);
  EXPECT_TRUE(FLAGS_verbose);
  EXPECT_FALSE(FLAGS_print_data);
  EXPECT_EQ("hourly", FLAGS_report);
  EXPECT_EQ(1, argc);  // Double-check the `false` from `p4` has been parsed.
}

TEST(DFlags, PrintsHelpDeathTest) {
  struct MockCerrHelpPrinter : ::weblog::dflags::FlagsManager::DefaultRegisterer {
    std::ostream& HelpPrinterOStream() const override { return std::cerr; }
    int HelpPrinterReturnCode() const override { return -1; }
  };
  MockCerrHelpPrinter local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  DEFINE_bool(bar, true, "Bar.");
  DEFINE_string(foo, "demo.log", "Foo.");
  DEFINE_uint32(meh, 42u, "Meh.");
  int argc = 2;
  char p1[] = "./PrintsHelpDeathTest";
  char p2[] = "--help";
  char* pp[] = {p1, p2};
  char** argv = pp;
  EXPECT_DEATH(ParseDFlags(&argc, &argv),
               "3 flags registered.\n"
               "\t--bar , bool\n"
               "\t\tBar\\.\n"
               "\t\tDefault value\\: True\n"
               "\t--foo , std\\:\\:string\n"
               "\t\tFoo\\.\n"
               "\t\tDefault value: 'demo\\.log'\n"
               "\t--meh , uint32_t\n"
               "\t\tMeh\\.\n"
               "\t\tDefault value: 42\n");
}

TEST(DFlags, UndefinedFlagDeathTest) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  int argc = 2;
  char p1[] = "./UndefinedFlagDeathTest";
  char p2[] = "--undefined_flag=5000";
  char* pp[] = {p1, p2};
  char** argv = pp;
  EXPECT_DEATH(ParseDFlags(&argc, &argv), "Undefined flag: 'undefined_flag'\\.");
}

TEST(DFlags, TooManyDashesDeathTest) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  int argc = 2;
  char p1[] = "./TooManyDashesDeathTest";
  char p2[] = "---whatever42";
  char* pp[] = {p1, p2};
  char** argv = pp;
  EXPECT_DEATH(ParseDFlags(&argc, &argv), "Parameter: '---whatever42' has too many dashes in front\\.");
}

TEST(DFlags, NoValueDeathTest) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  DEFINE_string(random_string, "", "");
  int argc = 2;
  char p1[] = "./NoValueDeathTest";
  char p2[] = "--random_string";
  char* pp[] = {p1, p2};
  char** argv = pp;
  EXPECT_DEATH(ParseDFlags(&argc, &argv), "Flag: 'random_string' is not provided with the value\\.");
}

TEST(DFlags, UnparsableValueDeathTest) {
  ::weblog::dflags::FlagsManager::DefaultRegisterer local_registerer;
  auto local_registerer_scope = ::weblog::dflags::FlagsManager::ScopedSingletonInjector(local_registerer);
  DEFINE_bool(flag_bool, false, "");
  DEFINE_uint32(flag_uint32, 0, "");
  {
    int argc = 2;
    char p1[] = "./UnparsableValueDeathTest";
    char p2[] = "--flag_bool=uncertain";
    char* pp[] = {p1, p2};
    char** argv = pp;
    EXPECT_DEATH(ParseDFlags(&argc, &argv), "Can not parse 'uncertain' for flag 'flag_bool'\\.");
  }
  {
    int argc = 2;
    char p1[] = "./UnparsableValueDeathTest";
    char p2[] = "--flag_uint32=-1";
    char* pp[] = {p1, p2};
    char** argv = pp;
    EXPECT_DEATH(ParseDFlags(&argc, &argv), "Can not parse '-1' for flag 'flag_uint32'\\.");
  }
  {
    int argc = 2;
    char p1[] = "./UnparsableValueDeathTest";
    char p2[] = "--flag_uint32=";
    char* pp[] = {p1, p2};
    char** argv = pp;
    EXPECT_DEATH(ParseDFlags(&argc, &argv), "Can not parse '' for flag 'flag_uint32'\\.");
  }
}
