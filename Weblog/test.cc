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

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "analyzer.h"
#include "creator.h"
#include "exceptions.h"
#include "logger.h"
#include "record.h"
#include "record_source.h"
#include "report.h"

#include "../Bricks/file/file.h"

#include <gtest/gtest.h>

using weblog::AccessRecord;
using weblog::CannotReadLogfileException;
using weblog::FileSystem;
using weblog::InMemoryRecordSource;
using weblog::LogAnalyzer;
using weblog::LogfileCreator;
using weblog::LogfileReader;
using weblog::MalformedLinePolicy;
using weblog::MalformedLogLineException;
using weblog::NoMoreRecordsException;
using weblog::ParseAccessRecord;
using weblog::RecordSource;
using weblog::RecordSourceOptions;
using weblog::ReportSelection;
using weblog::UnknownReportException;

namespace {

std::vector<AccessRecord> RecordsAtHours(const std::vector<int>& hours) {
  std::vector<AccessRecord> records;
  for (int hour : hours) {
    records.emplace_back(2015, 6, 1, hour, 0);
  }
  return records;
}

std::vector<AccessRecord> Drain(RecordSource& source) {
  std::vector<AccessRecord> records;
  source.Reset();
  while (source.HasNext()) {
    records.push_back(source.Next());
  }
  return records;
}

std::vector<AccessRecord> RecordsInMonths(const std::vector<int>& months) {
  std::vector<AccessRecord> records;
  for (int month : months) {
    records.emplace_back(2015, month, 1, 12, 0);
  }
  return records;
}

// Replays the same records on every traversal, and counts the traversals.
struct CountingRecordSource : InMemoryRecordSource {
  explicit CountingRecordSource(std::vector<AccessRecord> records) : InMemoryRecordSource(std::move(records)) {}
  void Reset() override {
    ++resets;
    InMemoryRecordSource::Reset();
  }
  size_t resets = 0u;
};

struct BrokenRecordSource : RecordSource {
  struct SourceFailure : weblog::Exception {
    SourceFailure() : weblog::Exception("The disk is on fire.") {}
  };
  void Reset() override {}
  bool HasNext() const override { return true; }
  AccessRecord Next() override { WEBLOG_THROW(SourceFailure()); }
};

}  // namespace

TEST(AccessRecord, Parse) {
  const AccessRecord record = ParseAccessRecord("2015 06 01 00 10");
  EXPECT_EQ(2015, record.year);
  EXPECT_EQ(6, record.month);
  EXPECT_EQ(1, record.day);
  EXPECT_EQ(0, record.hour);
  EXPECT_EQ(10, record.minute);

  EXPECT_EQ(AccessRecord(2015, 12, 31, 23, 59), ParseAccessRecord("  2015\t12 31   23 59  \r"));
  EXPECT_EQ(AccessRecord(2016, 1, 2, 3, 4), ParseAccessRecord("2016 1 2 3 4 GET /index.html 200"));
}

TEST(AccessRecord, ParseErrors) {
  EXPECT_THROW(ParseAccessRecord(""), MalformedLogLineException);
  EXPECT_THROW(ParseAccessRecord("2015 06 01 00"), MalformedLogLineException);
  EXPECT_THROW(ParseAccessRecord("2015 June 01 00 10"), MalformedLogLineException);
  EXPECT_THROW(ParseAccessRecord("2015 06 01 1.5 10"), MalformedLogLineException);
  EXPECT_THROW(ParseAccessRecord("2015 00 01 00 10"), MalformedLogLineException);
  EXPECT_THROW(ParseAccessRecord("2015 13 01 00 10"), MalformedLogLineException);
  EXPECT_THROW(ParseAccessRecord("2015 06 00 00 10"), MalformedLogLineException);
  EXPECT_THROW(ParseAccessRecord("2015 06 01 24 10"), MalformedLogLineException);
  EXPECT_THROW(ParseAccessRecord("2015 06 01 -1 10"), MalformedLogLineException);
  EXPECT_THROW(ParseAccessRecord("2015 06 01 00 60"), MalformedLogLineException);

  try {
    ParseAccessRecord("2015 06 01 25 10");
    ASSERT_TRUE(false);
  } catch (const MalformedLogLineException& e) {
    EXPECT_EQ("Malformed log line '2015 06 01 25 10': hour 25 is out of range [0, 23].", e.OriginalDescription());
  }
  try {
    ParseAccessRecord("2015 06 01");
    ASSERT_TRUE(false);
  } catch (const MalformedLogLineException& e) {
    EXPECT_EQ("Malformed log line '2015 06 01': expected 5 fields, got 3.", e.OriginalDescription());
  }
}

TEST(AccessRecord, ToStringAndOrder) {
  EXPECT_EQ("2015 06 01 00 10", AccessRecord(2015, 6, 1, 0, 10).ToString());
  EXPECT_EQ("2022 12 31 23 59", AccessRecord(2022, 12, 31, 23, 59).ToString());
  EXPECT_EQ(AccessRecord(2015, 6, 1, 0, 10), ParseAccessRecord(AccessRecord(2015, 6, 1, 0, 10).ToString()));

  EXPECT_TRUE(AccessRecord(2015, 6, 1, 0, 10) < AccessRecord(2015, 6, 1, 0, 11));
  EXPECT_TRUE(AccessRecord(2015, 6, 1, 23, 59) < AccessRecord(2015, 6, 2, 0, 0));
  EXPECT_TRUE(AccessRecord(2015, 12, 31, 23, 59) < AccessRecord(2016, 1, 1, 0, 0));
  EXPECT_FALSE(AccessRecord(2015, 6, 1, 0, 10) < AccessRecord(2015, 6, 1, 0, 10));
  EXPECT_NE(AccessRecord(2015, 6, 1, 0, 10), AccessRecord(2015, 7, 1, 0, 10));
}

TEST(RecordSource, InMemoryReplays) {
  InMemoryRecordSource source(RecordsAtHours({5, 1, 3}));
  EXPECT_EQ(3u, source.NumberOfEntries());
  for (int traversal = 0; traversal < 2; ++traversal) {
    source.Reset();
    std::vector<int> hours;
    while (source.HasNext()) {
      hours.push_back(source.Next().hour);
    }
    EXPECT_EQ(std::vector<int>({5, 1, 3}), hours);
    EXPECT_THROW(source.Next(), NoMoreRecordsException);
  }
}

TEST(RecordSource, InMemoryEmpty) {
  InMemoryRecordSource source;
  source.Reset();
  EXPECT_FALSE(source.HasNext());
  EXPECT_THROW(source.Next(), NoMoreRecordsException);
}

TEST(RecordSource, LogfileReader) {
  const std::string fn = FileSystem::GenTmpFileName();
  const auto file_remover = FileSystem::ScopedRmFile(fn);
  FileSystem::WriteStringToFile(
      "2015 06 01 23 10\n"
      "\n"
      "2015 05 31 22 00\n"
      "   \n"
      "2015 06 01 01 30\n",
      fn.c_str());

  LogfileReader reader(fn);
  EXPECT_EQ(fn, reader.FileName());
  EXPECT_EQ(3u, reader.NumberOfEntries());
  EXPECT_EQ(0u, reader.SkippedLines());

  // Replayed in chronological order.
  reader.Reset();
  ASSERT_TRUE(reader.HasNext());
  EXPECT_EQ("2015 05 31 22 00", reader.Next().ToString());
  ASSERT_TRUE(reader.HasNext());
  EXPECT_EQ("2015 06 01 01 30", reader.Next().ToString());
  ASSERT_TRUE(reader.HasNext());
  EXPECT_EQ("2015 06 01 23 10", reader.Next().ToString());
  EXPECT_FALSE(reader.HasNext());
}

TEST(RecordSource, LogfileReaderMissingFile) {
  const std::string fn = FileSystem::GenTmpFileName();
  const auto file_remover = FileSystem::ScopedRmFile(fn);
  EXPECT_THROW(LogfileReader reader(fn), CannotReadLogfileException);
  try {
    LogfileReader reader(fn);
    ASSERT_TRUE(false);
  } catch (const CannotReadLogfileException& e) {
    EXPECT_EQ("Can not read the log file '" + fn + "'.", e.OriginalDescription());
  }
}

TEST(RecordSource, LogfileReaderMalformedLines) {
  const std::string fn = FileSystem::GenTmpFileName();
  const auto file_remover = FileSystem::ScopedRmFile(fn);
  FileSystem::WriteStringToFile(
      "2015 06 01 00 10\n"
      "\n"
      "bad line\n"
      "2015 06 01 99 10\n"
      "2015 06 02 00 10\n",
      fn.c_str());

  try {
    LogfileReader reader(fn);
    ASSERT_TRUE(false);
  } catch (const MalformedLogLineException& e) {
    EXPECT_EQ(fn + ":3: Malformed log line 'bad line': expected 5 fields, got 2.", e.OriginalDescription());
  }

  std::ostringstream log;
  {
    const weblog::ScopedLogToOStream log_scope(log);
    LogfileReader reader(fn, MalformedLinePolicy::Skip);
    EXPECT_EQ(2u, reader.NumberOfEntries());
    EXPECT_EQ(2u, reader.SkippedLines());
  }
  EXPECT_NE(std::string::npos, log.str().find(fn + ":3: skipped"));
  EXPECT_NE(std::string::npos, log.str().find(fn + ":4: skipped"));
  EXPECT_NE(std::string::npos, log.str().find(fn + ": 2 records loaded, 2 lines skipped."));
}

TEST(LogfileCreator, RandomEntriesAreValid) {
  LogfileCreator creator(42u);
  for (const AccessRecord& record : creator.CreateEntries(1000u)) {
    EXPECT_GE(record.year, LogfileCreator::kFirstYear);
    EXPECT_LE(record.year, LogfileCreator::kLastYear);
    EXPECT_GE(record.month, 1);
    EXPECT_LE(record.month, 12);
    EXPECT_GE(record.day, 1);
    EXPECT_LE(record.day, 28);
    EXPECT_GE(record.hour, 0);
    EXPECT_LE(record.hour, 23);
    EXPECT_GE(record.minute, 0);
    EXPECT_LE(record.minute, 59);
  }
}

TEST(LogfileCreator, FixedSeedIsRepeatable) {
  const std::vector<AccessRecord> first = LogfileCreator(12345u).CreateEntries(50u);
  const std::vector<AccessRecord> second = LogfileCreator(12345u).CreateEntries(50u);
  EXPECT_EQ(first, second);
}

TEST(LogfileCreator, ZeroSeedIsTimeBasedAfterSeededCreator) {
  LogfileCreator(42u).CreateEntries(10u);
  const std::vector<AccessRecord> a = LogfileCreator(0u).CreateEntries(20u);
  LogfileCreator(42u).CreateEntries(10u);
  const std::vector<AccessRecord> b = LogfileCreator(0u).CreateEntries(20u);
  EXPECT_NE(a, b);
  const std::vector<AccessRecord> c = LogfileCreator().CreateEntries(20u);
  EXPECT_NE(a, c);
  EXPECT_NE(b, c);
}

TEST(LogfileCreator, InterleavedCreatorsStayRepeatable) {
  const std::vector<AccessRecord> golden = LogfileCreator(5u).CreateEntries(30u);
  LogfileCreator first(5u);
  std::vector<AccessRecord> interleaved;
  for (size_t i = 0; i < 30u; ++i) {
    LogfileCreator(77u).CreateEntries(3u);
    LogfileCreator(0u).CreateEntry();
    interleaved.push_back(first.CreateEntry());
  }
  EXPECT_EQ(golden, interleaved);
}

TEST(LogfileCreator, CreateFileIsReadable) {
  const std::string fn = FileSystem::GenTmpFileName();
  const auto file_remover = FileSystem::ScopedRmFile(fn);
  LogfileCreator(7u).CreateFile(fn, 250u);
  LogfileReader reader(fn);
  EXPECT_EQ(250u, reader.NumberOfEntries());

  LogAnalyzer analyzer(reader);
  analyzer.AnalyzeHourlyData();
  analyzer.AnalyzeMonthlyData();
  EXPECT_EQ(250u, analyzer.NumberOfAccesses());
  EXPECT_EQ(250u / 12u, analyzer.AverageAccessesPerMonth());
}

TEST(LogAnalyzer, DefaultsBeforeAnyPass) {
  InMemoryRecordSource source(RecordsAtHours({1, 2, 3}));
  const LogAnalyzer analyzer(source);
  EXPECT_EQ(0u, analyzer.NumberOfAccesses());
  EXPECT_EQ(0, analyzer.BusiestHour());
  EXPECT_EQ(-1, analyzer.QuietestHour());
  EXPECT_EQ(weblog::kNoQuietestHour, analyzer.QuietestHour());
  EXPECT_EQ(0, analyzer.BusiestTwoHour());
  EXPECT_EQ(1, analyzer.BusiestMonth());
  EXPECT_EQ(0, analyzer.QuietestMonth());
  EXPECT_EQ(weblog::kNoQuietestMonth, analyzer.QuietestMonth());
  EXPECT_EQ(0u, analyzer.AverageAccessesPerMonth());
}

TEST(LogAnalyzer, EmptySource) {
  InMemoryRecordSource source;
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeHourlyData();
  analyzer.AnalyzeMonthlyData();
  EXPECT_EQ(0u, analyzer.NumberOfAccesses());
  EXPECT_EQ(0, analyzer.BusiestHour());
  EXPECT_EQ(-1, analyzer.QuietestHour());
  EXPECT_EQ(0, analyzer.BusiestTwoHour());
  EXPECT_EQ(1, analyzer.BusiestMonth());
  EXPECT_EQ(0, analyzer.QuietestMonth());
  EXPECT_EQ(0u, analyzer.AverageAccessesPerMonth());
}

TEST(LogAnalyzer, HourlyEndToEnd) {
  InMemoryRecordSource source(RecordsAtHours({0, 0, 1, 23, 23, 23}));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeHourlyData();

  LogAnalyzer::HourCounts expected;
  expected.fill(0u);
  expected[0] = 2u;
  expected[1] = 1u;
  expected[23] = 3u;
  EXPECT_EQ(expected, analyzer.HourlyCounts());

  EXPECT_EQ(6u, analyzer.NumberOfAccesses());
  EXPECT_EQ(23, analyzer.BusiestHour());
  EXPECT_EQ(1, analyzer.QuietestHour());
  EXPECT_EQ(23, analyzer.BusiestTwoHour());
}

TEST(LogAnalyzer, TotalEqualsSumOfHourlyCounts) {
  InMemoryRecordSource source(LogfileCreator(2024u).CreateEntries(777u));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeHourlyData();
  size_t sum = 0u;
  for (size_t count : analyzer.HourlyCounts()) {
    sum += count;
  }
  EXPECT_EQ(777u, sum);
  EXPECT_EQ(sum, analyzer.NumberOfAccesses());

  analyzer.AnalyzeMonthlyData();
  size_t monthly_sum = 0u;
  for (size_t count : analyzer.MonthlyCounts()) {
    monthly_sum += count;
  }
  EXPECT_EQ(sum, monthly_sum);
}

TEST(LogAnalyzer, BusiestHourTieGoesToLowestHour) {
  InMemoryRecordSource source(RecordsAtHours({7, 7, 3, 3, 12}));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeHourlyData();
  EXPECT_EQ(3, analyzer.BusiestHour());
}

TEST(LogAnalyzer, QuietestHourSkipsZeroBuckets) {
  InMemoryRecordSource source(RecordsAtHours({10, 10, 4, 4, 4, 20, 20}));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeHourlyData();
  // Hours 10 and 20 both have two accesses, the lower one wins. Hour 0 has none and does not count.
  EXPECT_EQ(10, analyzer.QuietestHour());
  EXPECT_EQ(4, analyzer.BusiestHour());
}

TEST(LogAnalyzer, BusiestTwoHourWrapsAroundMidnight) {
  std::vector<int> hours;
  for (int i = 0; i < 5; ++i) {
    hours.push_back(0);
    hours.push_back(23);
  }
  InMemoryRecordSource source(RecordsAtHours(hours));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeHourlyData();
  EXPECT_EQ(5u, analyzer.HourlyCounts()[0]);
  EXPECT_EQ(5u, analyzer.HourlyCounts()[23]);
  EXPECT_EQ(23, analyzer.BusiestTwoHour());
  EXPECT_EQ(0, analyzer.BusiestHour());
}

TEST(LogAnalyzer, BusiestTwoHourTieGoesToLowestStart) {
  InMemoryRecordSource source(RecordsAtHours({1, 2, 13, 14}));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeHourlyData();
  EXPECT_EQ(1, analyzer.BusiestTwoHour());
}

TEST(LogAnalyzer, BusiestTwoHourReturnsStartNotSum) {
  InMemoryRecordSource source(RecordsAtHours({8, 9, 9, 9, 15, 15, 15}));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeHourlyData();
  // (8, 9) sums to 4, (14, 15) and (15, 16) to 3.
  EXPECT_EQ(8, analyzer.BusiestTwoHour());
}

TEST(LogAnalyzer, Monthly) {
  InMemoryRecordSource source(RecordsInMonths({1, 1, 3, 12, 12, 12}));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeMonthlyData();

  LogAnalyzer::MonthCounts expected;
  expected.fill(0u);
  expected[0] = 2u;
  expected[2] = 1u;
  expected[11] = 3u;
  EXPECT_EQ(expected, analyzer.MonthlyCounts());

  EXPECT_EQ(12, analyzer.BusiestMonth());
  EXPECT_EQ(3, analyzer.QuietestMonth());
  EXPECT_EQ(0u, analyzer.AverageAccessesPerMonth());
}

TEST(LogAnalyzer, MonthlyTiesGoToLowestMonth) {
  InMemoryRecordSource source(RecordsInMonths({5, 9, 5, 9, 2}));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeMonthlyData();
  EXPECT_EQ(5, analyzer.BusiestMonth());
  EXPECT_EQ(2, analyzer.QuietestMonth());

  InMemoryRecordSource another_source(RecordsInMonths({11, 4}));
  LogAnalyzer another_analyzer(another_source);
  another_analyzer.AnalyzeMonthlyData();
  EXPECT_EQ(4, another_analyzer.BusiestMonth());
  EXPECT_EQ(4, another_analyzer.QuietestMonth());
}

TEST(LogAnalyzer, AverageAccessesPerMonthTruncates) {
  std::vector<int> months;
  for (int i = 0; i < 25; ++i) {
    months.push_back(1 + i % 12);
  }
  InMemoryRecordSource source(RecordsInMonths(months));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeMonthlyData();
  EXPECT_EQ(2u, analyzer.AverageAccessesPerMonth());
}

TEST(LogAnalyzer, PassesAreIndependent) {
  InMemoryRecordSource source(RecordsAtHours(std::vector<int>(36, 6)));
  LogAnalyzer analyzer(source);

  analyzer.AnalyzeHourlyData();
  EXPECT_EQ(36u, analyzer.NumberOfAccesses());
  EXPECT_EQ(0u, analyzer.AverageAccessesPerMonth());

  LogAnalyzer monthly_only(source);
  monthly_only.AnalyzeMonthlyData();
  EXPECT_EQ(0u, monthly_only.NumberOfAccesses());
  EXPECT_EQ(3u, monthly_only.AverageAccessesPerMonth());
}

TEST(LogAnalyzer, RepeatedPassesAreIdempotent) {
  CountingRecordSource source(RecordsAtHours({0, 0, 1, 23, 23, 23}));
  LogAnalyzer analyzer(source);

  analyzer.AnalyzeHourlyData();
  const LogAnalyzer::HourCounts first = analyzer.HourlyCounts();
  analyzer.AnalyzeHourlyData();
  EXPECT_EQ(first, analyzer.HourlyCounts());
  EXPECT_EQ(6u, analyzer.NumberOfAccesses());

  analyzer.AnalyzeMonthlyData();
  const LogAnalyzer::MonthCounts first_monthly = analyzer.MonthlyCounts();
  analyzer.AnalyzeMonthlyData();
  EXPECT_EQ(first_monthly, analyzer.MonthlyCounts());
  EXPECT_EQ(6u, analyzer.MonthlyCounts()[5]);

  EXPECT_EQ(4u, source.resets);
}

TEST(LogAnalyzer, SinglePassMatchesTwoPasses) {
  CountingRecordSource source(LogfileCreator(99u).CreateEntries(500u));

  LogAnalyzer two_passes(source);
  two_passes.AnalyzeHourlyData();
  two_passes.AnalyzeMonthlyData();
  EXPECT_EQ(2u, source.resets);

  LogAnalyzer single_pass(source);
  single_pass.AnalyzeAllData();
  EXPECT_EQ(3u, source.resets);

  EXPECT_EQ(two_passes.HourlyCounts(), single_pass.HourlyCounts());
  EXPECT_EQ(two_passes.MonthlyCounts(), single_pass.MonthlyCounts());
  EXPECT_EQ(two_passes.BusiestTwoHour(), single_pass.BusiestTwoHour());
  EXPECT_EQ(two_passes.QuietestMonth(), single_pass.QuietestMonth());
}

TEST(LogAnalyzer, OwnsOrBorrowsTheSource) {
  LogAnalyzer owning(std::make_unique<InMemoryRecordSource>(RecordsAtHours({4, 4, 5})));
  owning.AnalyzeHourlyData();
  EXPECT_EQ(3u, owning.NumberOfAccesses());
  EXPECT_EQ(4, owning.BusiestHour());

  LogAnalyzer moved(std::move(owning));
  moved.AnalyzeHourlyData();
  EXPECT_EQ(3u, moved.NumberOfAccesses());
}

TEST(LogAnalyzer, ReadsLogfile) {
  const std::string fn = FileSystem::GenTmpFileName();
  const auto file_remover = FileSystem::ScopedRmFile(fn);
  FileSystem::WriteStringToFile(
      "2015 06 01 00 10\n"
      "2015 06 01 00 20\n"
      "2015 07 02 01 30\n"
      "2015 12 03 23 00\n"
      "2015 12 04 23 10\n"
      "2015 12 05 23 20\n",
      fn.c_str());
  LogAnalyzer analyzer(fn);
  analyzer.AnalyzeHourlyData();
  analyzer.AnalyzeMonthlyData();
  EXPECT_EQ(6u, analyzer.NumberOfAccesses());
  EXPECT_EQ(23, analyzer.BusiestHour());
  EXPECT_EQ(1, analyzer.QuietestHour());
  EXPECT_EQ(23, analyzer.BusiestTwoHour());
  EXPECT_EQ(12, analyzer.BusiestMonth());
  EXPECT_EQ(7, analyzer.QuietestMonth());
  EXPECT_EQ(0u, analyzer.AverageAccessesPerMonth());

  EXPECT_THROW(LogAnalyzer(fn + ".does_not_exist"), CannotReadLogfileException);
}

TEST(LogAnalyzer, SourceFailuresPropagate) {
  BrokenRecordSource source;
  LogAnalyzer analyzer(source);
  EXPECT_THROW(analyzer.AnalyzeHourlyData(), BrokenRecordSource::SourceFailure);
  EXPECT_THROW(analyzer.AnalyzeMonthlyData(), BrokenRecordSource::SourceFailure);
  EXPECT_THROW(analyzer.AnalyzeAllData(), BrokenRecordSource::SourceFailure);
}

TEST(LogAnalyzer, PrintHourlyCounts) {
  InMemoryRecordSource source(RecordsAtHours({0, 0, 1, 23, 23, 23}));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeHourlyData();
  std::ostringstream os;
  analyzer.PrintHourlyCounts(os);
  std::string expected = "Hr: Count\n0: 2\n1: 1\n";
  for (int hour = 2; hour < 23; ++hour) {
    expected += std::to_string(hour) + ": 0\n";
  }
  expected += "23: 3\n";
  EXPECT_EQ(expected, os.str());
}

TEST(LogAnalyzer, PrintMonthlyCounts) {
  InMemoryRecordSource source(RecordsInMonths({1, 12, 12}));
  LogAnalyzer analyzer(source);
  std::ostringstream before;
  analyzer.PrintMonthlyCounts(before);
  EXPECT_EQ("Month: Count\n1: 0\n2: 0\n3: 0\n4: 0\n5: 0\n6: 0\n7: 0\n8: 0\n9: 0\n10: 0\n11: 0\n12: 0\n",
            before.str());

  analyzer.AnalyzeMonthlyData();
  std::ostringstream after;
  analyzer.PrintMonthlyCounts(after);
  EXPECT_EQ("Month: Count\n1: 1\n2: 0\n3: 0\n4: 0\n5: 0\n6: 0\n7: 0\n8: 0\n9: 0\n10: 0\n11: 0\n12: 2\n",
            after.str());
}

TEST(LogAnalyzer, PrintData) {
  InMemoryRecordSource source({AccessRecord(2015, 6, 1, 0, 10), AccessRecord(2016, 12, 31, 23, 5)});
  LogAnalyzer analyzer(source);
  std::ostringstream os;
  analyzer.PrintData(os);
  EXPECT_EQ("2015 06 01 00 10\n2016 12 31 23 05\n", os.str());
  EXPECT_EQ(0u, analyzer.NumberOfAccesses());
}

TEST(LogAnalyzer, LogsPasses) {
  InMemoryRecordSource source(RecordsAtHours({0, 0, 1, 23, 23, 23}));
  LogAnalyzer analyzer(source);
  std::ostringstream log;
  {
    const weblog::ScopedLogToOStream log_scope(log);
    analyzer.AnalyzeHourlyData();
    analyzer.AnalyzeMonthlyData();
    analyzer.AnalyzeAllData();
  }
  analyzer.AnalyzeHourlyData();
  const std::string logged = log.str();
  EXPECT_EQ(0u, logged.find("Hourly pass: 6 records in "));
  EXPECT_NE(std::string::npos, logged.find("\nMonthly pass: 6 records in "));
  EXPECT_NE(std::string::npos, logged.find("\nSingle pass: 6 records in "));
  EXPECT_EQ(1u, static_cast<size_t>(std::count(logged.begin(), logged.end(), 'H')));
}

TEST(Report, ParseReportSelection) {
  const ReportSelection all = weblog::ParseReportSelection("all");
  EXPECT_TRUE(all.hourly);
  EXPECT_TRUE(all.monthly);
  const ReportSelection hourly = weblog::ParseReportSelection("hourly");
  EXPECT_TRUE(hourly.hourly);
  EXPECT_FALSE(hourly.monthly);
  const ReportSelection monthly = weblog::ParseReportSelection("monthly");
  EXPECT_FALSE(monthly.hourly);
  EXPECT_TRUE(monthly.monthly);

  EXPECT_THROW(weblog::ParseReportSelection(""), UnknownReportException);
  EXPECT_THROW(weblog::ParseReportSelection("Hourly"), UnknownReportException);
  try {
    weblog::ParseReportSelection("weekly");
    ASSERT_TRUE(false);
  } catch (const UnknownReportException& e) {
    EXPECT_EQ("Unknown report 'weekly', expected `all`, `hourly`, or `monthly`.", e.OriginalDescription());
  }
}

TEST(Report, OpenRecordSourceReadsTheLog) {
  const std::string fn = FileSystem::GenTmpFileName();
  const auto file_remover = FileSystem::ScopedRmFile(fn);
  FileSystem::WriteStringToFile("2015 06 01 23 10\nnot a record\n2015 05 31 22 00\n", fn.c_str());

  RecordSourceOptions options;
  options.file_name = fn;
  options.simulate_if_missing = true;
  EXPECT_THROW(weblog::OpenRecordSource(options), MalformedLogLineException);

  options.policy = MalformedLinePolicy::Skip;
  std::unique_ptr<RecordSource> source = weblog::OpenRecordSource(options);
  const std::vector<AccessRecord> records = Drain(*source);
  ASSERT_EQ(2u, records.size());
  EXPECT_EQ("2015 05 31 22 00", records[0].ToString());
  EXPECT_EQ("2015 06 01 23 10", records[1].ToString());
}

TEST(Report, OpenRecordSourceMissingLog) {
  const std::string fn = FileSystem::GenTmpFileName();
  const auto file_remover = FileSystem::ScopedRmFile(fn);

  RecordSourceOptions options;
  options.file_name = fn;
  options.simulated_entries = 25u;
  options.seed = 31337u;
  EXPECT_THROW(weblog::OpenRecordSource(options), CannotReadLogfileException);

  options.simulate_if_missing = true;
  std::ostringstream log;
  std::unique_ptr<RecordSource> source;
  {
    const weblog::ScopedLogToOStream log_scope(log);
    source = weblog::OpenRecordSource(options);
  }
  EXPECT_EQ("Can not read the log file '" + fn + "'. Using simulated data instead.\n", log.str());
  EXPECT_EQ(LogfileCreator(31337u).CreateEntries(25u), Drain(*source));
}

TEST(Report, AnalyzeSelected) {
  CountingRecordSource source(RecordsAtHours({1, 2, 2}));
  LogAnalyzer analyzer(source);

  weblog::AnalyzeSelected(analyzer, weblog::ParseReportSelection("hourly"), false);
  EXPECT_EQ(1u, source.resets);
  EXPECT_EQ(3u, analyzer.NumberOfAccesses());

  weblog::AnalyzeSelected(analyzer, weblog::ParseReportSelection("all"), false);
  EXPECT_EQ(3u, source.resets);

  weblog::AnalyzeSelected(analyzer, weblog::ParseReportSelection("all"), true);
  EXPECT_EQ(4u, source.resets);
  EXPECT_EQ(6, analyzer.BusiestMonth());
}

TEST(Report, PrintReport) {
  InMemoryRecordSource source(RecordsAtHours({1, 2, 2}));
  LogAnalyzer analyzer(source);
  analyzer.AnalyzeAllData();

  std::ostringstream hourly;
  weblog::PrintReport(analyzer, weblog::ParseReportSelection("hourly"), false, hourly);
  EXPECT_EQ(
      "Number of accesses: 3\n"
      "Busiest hour: 2\n"
      "Quietest hour: 1\n"
      "Busiest two hours start at: 1\n",
      hourly.str());

  std::ostringstream monthly;
  weblog::PrintReport(analyzer, weblog::ParseReportSelection("monthly"), false, monthly);
  EXPECT_EQ(
      "Busiest month: 6\n"
      "Quietest month: 6\n"
      "Average accesses per month: 0\n",
      monthly.str());

  std::ostringstream all;
  weblog::PrintReport(analyzer, weblog::ParseReportSelection("all"), true, all);
  EXPECT_EQ(0u, all.str().find("Hr: Count\n0: 0\n1: 1\n2: 2\n"));
  EXPECT_NE(std::string::npos, all.str().find("Month: Count\n"));
  EXPECT_NE(std::string::npos, all.str().find("\nAverage accesses per month: 0\n"));
}
