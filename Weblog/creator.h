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

#ifndef WEBLOG_CREATOR_H
#define WEBLOG_CREATOR_H

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "logger.h"
#include "record.h"

#include "../Bricks/file/file.h"
#include "../Bricks/strings/printf.h"
#include "../Bricks/time/chrono.h"

namespace weblog {

// Simulated access log data, for demos and for when no real log is at hand.
// Each creator draws from its own generator, so creators never disturb one another.
class LogfileCreator final {
 public:
  static constexpr int kFirstYear = 2015;
  static constexpr int kLastYear = 2022;

  // Zero seed means time-based. `time::Now()` never repeats, so neither do two time-based creators.
  explicit LogfileCreator(uint64_t seed = 0u)
      : engine_(seed ? seed : static_cast<uint64_t>(time::Now().count())) {}

  AccessRecord CreateEntry() {
    AccessRecord record;
    record.year = Uniform(kFirstYear, kLastYear);
    record.month = Uniform(1, 12);
    // Any month has at least 28 days.
    record.day = Uniform(1, 28);
    record.hour = Uniform(0, 23);
    record.minute = Uniform(0, 59);
    return record;
  }

  std::vector<AccessRecord> CreateEntries(size_t number_of_entries) {
    std::vector<AccessRecord> records;
    records.reserve(number_of_entries);
    for (size_t i = 0; i < number_of_entries; ++i) {
      records.push_back(CreateEntry());
    }
    return records;
  }

  // Writes `number_of_entries` random lines to `file_name`, overwriting it.
  void CreateFile(const std::string& file_name, size_t number_of_entries) {
    std::string contents;
    for (const AccessRecord& record : CreateEntries(number_of_entries)) {
      contents += record.ToString();
      contents += '\n';
    }
    FileSystem::WriteStringToFile(contents, file_name.c_str());
    Logger().Log(strings::Printf("%s: %d simulated records written.",
                                 file_name.c_str(),
                                 static_cast<int>(number_of_entries)));
  }

 private:
  int Uniform(int a, int b) { return std::uniform_int_distribution<int>(a, b)(engine_); }

  std::mt19937_64 engine_;
};

}  // namespace weblog

#endif  // WEBLOG_CREATOR_H
