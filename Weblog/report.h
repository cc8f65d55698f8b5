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

#ifndef WEBLOG_REPORT_H
#define WEBLOG_REPORT_H

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "analyzer.h"
#include "creator.h"
#include "exceptions.h"
#include "logger.h"
#include "record_source.h"

namespace weblog {

struct ReportSelection final {
  bool hourly = true;
  bool monthly = true;
};

// Accepts `all`, `hourly`, or `monthly`.
inline ReportSelection ParseReportSelection(const std::string& report) {
  ReportSelection selection;
  if (report == "hourly") {
    selection.monthly = false;
  } else if (report == "monthly") {
    selection.hourly = false;
  } else if (report != "all") {
    WEBLOG_THROW(UnknownReportException(report));
  }
  return selection;
}

struct RecordSourceOptions final {
  std::string file_name = kDefaultLogfileName;
  MalformedLinePolicy policy = MalformedLinePolicy::Throw;
  bool simulate_if_missing = false;
  size_t simulated_entries = 100u;
  uint64_t seed = 0u;
};

// Reads `options.file_name`. If it can not be read and `simulate_if_missing` is set,
// falls back to simulated records, otherwise rethrows.
inline std::unique_ptr<RecordSource> OpenRecordSource(const RecordSourceOptions& options) {
  try {
    return std::make_unique<LogfileReader>(options.file_name, options.policy);
  } catch (const CannotReadLogfileException& e) {
    if (!options.simulate_if_missing) {
      throw;
    }
    Logger().Log(e.OriginalDescription() + " Using simulated data instead.");
    return std::make_unique<InMemoryRecordSource>(
        LogfileCreator(options.seed).CreateEntries(options.simulated_entries));
  }
}

// Runs the passes the selection needs, one traversal for both if `single_pass` is set.
inline void AnalyzeSelected(LogAnalyzer& analyzer, ReportSelection selection, bool single_pass) {
  if (single_pass) {
    analyzer.AnalyzeAllData();
    return;
  }
  if (selection.hourly) {
    analyzer.AnalyzeHourlyData();
  }
  if (selection.monthly) {
    analyzer.AnalyzeMonthlyData();
  }
}

inline void PrintReport(const LogAnalyzer& analyzer,
                        ReportSelection selection,
                        bool print_counts,
                        std::ostream& os = std::cout) {
  if (selection.hourly) {
    if (print_counts) {
      analyzer.PrintHourlyCounts(os);
    }
    os << "Number of accesses: " << analyzer.NumberOfAccesses() << '\n';
    os << "Busiest hour: " << analyzer.BusiestHour() << '\n';
    os << "Quietest hour: " << analyzer.QuietestHour() << '\n';
    os << "Busiest two hours start at: " << analyzer.BusiestTwoHour() << '\n';
  }
  if (selection.monthly) {
    if (print_counts) {
      analyzer.PrintMonthlyCounts(os);
    }
    os << "Busiest month: " << analyzer.BusiestMonth() << '\n';
    os << "Quietest month: " << analyzer.QuietestMonth() << '\n';
    os << "Average accesses per month: " << analyzer.AverageAccessesPerMonth() << '\n';
  }
  os.flush();
}

}  // namespace weblog

#endif  // WEBLOG_REPORT_H
