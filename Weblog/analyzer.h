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

#ifndef WEBLOG_ANALYZER_H
#define WEBLOG_ANALYZER_H

#include <array>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "logger.h"
#include "record_source.h"

#include "../Bricks/util/optionally_owned.h"

namespace weblog {

constexpr size_t kHoursPerDay = 24u;
constexpr size_t kMonthsPerYear = 12u;

// The log file a default-constructed `LogAnalyzer` reads.
constexpr const char* kDefaultLogfileName = "demo.log";

// Returned by `QuietestHour()` when every hourly bucket is zero.
constexpr int kNoQuietestHour = -1;
// Returned by `QuietestMonth()` when every monthly bucket is zero. The "no data" index is shifted to one-based
// along with the real ones, hence zero and not `-1`.
constexpr int kNoQuietestMonth = kNoQuietestHour + 1;

// Hourly and monthly access counts over a restartable record source.
//
// The two dimensions are populated by two independent passes, `AnalyzeHourlyData()` and `AnalyzeMonthlyData()`,
// each rewinding the source and overwriting its own counters. `AnalyzeAllData()` fills both in a single pass.
// All the statistics are plain reads of the counters, and are valid, returning their defaults, before any pass.
class LogAnalyzer final {
 public:
  using HourCounts = std::array<size_t, kHoursPerDay>;
  using MonthCounts = std::array<size_t, kMonthsPerYear>;

  // Analyzes `kDefaultLogfileName`.
  LogAnalyzer() : LogAnalyzer(std::string(kDefaultLogfileName)) {}

  explicit LogAnalyzer(const std::string& logfile_name, MalformedLinePolicy policy = MalformedLinePolicy::Throw)
      : LogAnalyzer(std::unique_ptr<RecordSource>(std::make_unique<LogfileReader>(logfile_name, policy))) {}

  // Borrows the source, which must outlive the analyzer.
  explicit LogAnalyzer(RecordSource& source) : source_(source) { ResetCounts(); }

  explicit LogAnalyzer(std::unique_ptr<RecordSource> source) : source_(std::move(source)) { ResetCounts(); }

  void AnalyzeHourlyData() {
    PassStats stats("Hourly pass");
    source_->Reset();
    hour_counts_.fill(0u);
    while (source_->HasNext()) {
      ++hour_counts_[source_->Next().hour];
      stats.JournalRecord();
    }
  }

  void AnalyzeMonthlyData() {
    PassStats stats("Monthly pass");
    source_->Reset();
    month_counts_.fill(0u);
    while (source_->HasNext()) {
      // Months are 1 .. 12, buckets are 0 .. 11.
      ++month_counts_[source_->Next().month - 1];
      stats.JournalRecord();
    }
  }

  // Populates both the hourly and the monthly counters from one traversal of the source.
  void AnalyzeAllData() {
    PassStats stats("Single pass");
    source_->Reset();
    hour_counts_.fill(0u);
    month_counts_.fill(0u);
    while (source_->HasNext()) {
      const AccessRecord record = source_->Next();
      ++hour_counts_[record.hour];
      ++month_counts_[record.month - 1];
      stats.JournalRecord();
    }
  }

  // The total over the hourly counters; the monthly ones are not consulted.
  size_t NumberOfAccesses() const {
    size_t total = 0u;
    for (size_t count : hour_counts_) {
      total += count;
    }
    return total;
  }

  int BusiestHour() const { return static_cast<int>(IndexOfMax(hour_counts_)); }

  int QuietestHour() const { return IndexOfMinNonZero(hour_counts_); }

  // The first hour of the busiest two consecutive hours. The window wraps, 23 pairs with 0.
  int BusiestTwoHour() const {
    size_t busiest_start = 0u;
    size_t busiest_accesses = 0u;
    for (size_t i = 0; i < kHoursPerDay; ++i) {
      const size_t accesses = hour_counts_[i] + hour_counts_[(i + 1) % kHoursPerDay];
      if (accesses > busiest_accesses) {
        busiest_start = i;
        busiest_accesses = accesses;
      }
    }
    return static_cast<int>(busiest_start);
  }

  int BusiestMonth() const { return static_cast<int>(IndexOfMax(month_counts_)) + 1; }

  // One-based, or `kNoQuietestMonth`.
  int QuietestMonth() const { return IndexOfMinNonZero(month_counts_) + 1; }

  // Truncating integer division of the monthly total by twelve.
  size_t AverageAccessesPerMonth() const {
    size_t total = 0u;
    for (size_t count : month_counts_) {
      total += count;
    }
    return total / kMonthsPerYear;
  }

  const HourCounts& HourlyCounts() const { return hour_counts_; }
  const MonthCounts& MonthlyCounts() const { return month_counts_; }

  void PrintHourlyCounts(std::ostream& os = std::cout) const {
    os << "Hr: Count" << std::endl;
    for (size_t hour = 0; hour < kHoursPerDay; ++hour) {
      os << hour << ": " << hour_counts_[hour] << std::endl;
    }
  }

  void PrintMonthlyCounts(std::ostream& os = std::cout) const {
    os << "Month: Count" << std::endl;
    for (size_t month = 0; month < kMonthsPerYear; ++month) {
      os << (month + 1) << ": " << month_counts_[month] << std::endl;
    }
  }

  // Replays the source and prints every record. Does not touch the counters.
  void PrintData(std::ostream& os = std::cout) {
    source_->Reset();
    while (source_->HasNext()) {
      os << source_->Next().ToString() << std::endl;
    }
  }

 private:
  void ResetCounts() {
    hour_counts_.fill(0u);
    month_counts_.fill(0u);
  }

  // Ties go to the lowest index. All zeroes yield zero.
  template <size_t N>
  static size_t IndexOfMax(const std::array<size_t, N>& counts) {
    size_t best_index = 0u;
    size_t best_count = 0u;
    for (size_t i = 0; i < N; ++i) {
      if (counts[i] > best_count) {
        best_index = i;
        best_count = counts[i];
      }
    }
    return best_index;
  }

  // Zero buckets do not compete. Ties go to the lowest index. All zeroes yield `kNoQuietestHour`.
  template <size_t N>
  static int IndexOfMinNonZero(const std::array<size_t, N>& counts) {
    int best_index = kNoQuietestHour;
    size_t best_count = std::numeric_limits<size_t>::max();
    for (size_t i = 0; i < N; ++i) {
      if (counts[i] != 0u && counts[i] < best_count) {
        best_index = static_cast<int>(i);
        best_count = counts[i];
      }
    }
    return best_index;
  }

  OptionallyOwned<RecordSource> source_;
  HourCounts hour_counts_;
  MonthCounts month_counts_;
};

}  // namespace weblog

#endif  // WEBLOG_ANALYZER_H
