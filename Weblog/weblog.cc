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

// Prints hourly and monthly access statistics of a web server log.
//
//   ./weblog --log access.log
//   ./weblog --log demo.log --generate 1000 --seed 42
//   ./weblog --log missing.log --simulate_if_missing --report hourly

#include <iostream>

#include "analyzer.h"
#include "creator.h"
#include "logger.h"
#include "report.h"

#include "../Bricks/dflags/dflags.h"

DEFINE_string(log, weblog::kDefaultLogfileName, "The access log to analyze, one `year month day hour minute` per line.");
DEFINE_string(report, "all", "Which statistics to report: `all`, `hourly`, or `monthly`.");
DEFINE_bool(single_pass, false, "Set to populate the hourly and the monthly counters in one pass over the log.");
DEFINE_bool(print_counts, true, "Set to false to not print the per-hour and per-month count tables.");
DEFINE_bool(print_data, false, "Set to print every record of the log, in chronological order.");
DEFINE_bool(skip_malformed_lines, false, "Set to skip, rather than fail on, lines that can not be parsed.");
DEFINE_bool(simulate_if_missing, false, "Set to analyze simulated data if the log can not be read.");
DEFINE_uint32(simulated_entries, 100u, "The number of records to simulate with `--simulate_if_missing`.");
DEFINE_uint32(generate, 0u, "If nonzero, write this many simulated records into `--log` and exit.");
DEFINE_uint64(seed, 0u, "The random seed for simulated data, zero for time-based.");
DEFINE_bool(verbose, false, "Set to log progress to stderr.");

int main(int argc, char** argv) {
  ParseDFlags(&argc, &argv);

  if (FLAGS_verbose) {
    weblog::Logger().LogToStderr();
  }

  try {
    const weblog::ReportSelection selection = weblog::ParseReportSelection(FLAGS_report);

    if (FLAGS_generate) {
      weblog::LogfileCreator(FLAGS_seed).CreateFile(FLAGS_log, FLAGS_generate);
      return 0;
    }

    weblog::RecordSourceOptions options;
    options.file_name = FLAGS_log;
    options.policy =
        FLAGS_skip_malformed_lines ? weblog::MalformedLinePolicy::Skip : weblog::MalformedLinePolicy::Throw;
    options.simulate_if_missing = FLAGS_simulate_if_missing;
    options.simulated_entries = FLAGS_simulated_entries;
    options.seed = FLAGS_seed;

    weblog::LogAnalyzer analyzer(weblog::OpenRecordSource(options));

    if (FLAGS_print_data) {
      analyzer.PrintData();
    }

    weblog::AnalyzeSelected(analyzer, selection, FLAGS_single_pass);
    weblog::PrintReport(analyzer, selection, FLAGS_print_counts);
  } catch (const weblog::Exception& e) {
    std::cerr << e.what() << std::endl;
    return -1;
  }

  return 0;
}
