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

#ifndef WEBLOG_RECORD_H
#define WEBLOG_RECORD_H

#include <string>
#include <tuple>
#include <vector>

#include "exceptions.h"

#include "../Bricks/strings/printf.h"
#include "../Bricks/strings/split.h"
#include "../Bricks/strings/util.h"

namespace weblog {

// One line of the access log: the moment a request was served, down to the minute.
// A log line is `year month day hour minute`, whitespace-separated, e.g. `2015 06 01 00 10`.
// Fields past the fifth are ignored.
struct AccessRecord final {
  int year = 0;
  int month = 1;  // 1 .. 12.
  int day = 1;    // 1 .. 31.
  int hour = 0;   // 0 .. 23.
  int minute = 0;

  AccessRecord() = default;
  AccessRecord(int year, int month, int day, int hour, int minute)
      : year(year), month(month), day(day), hour(hour), minute(minute) {}

  std::string ToString() const { return strings::Printf("%04d %02d %02d %02d %02d", year, month, day, hour, minute); }

  bool operator==(const AccessRecord& rhs) const { return AsTuple() == rhs.AsTuple(); }
  bool operator!=(const AccessRecord& rhs) const { return !operator==(rhs); }
  bool operator<(const AccessRecord& rhs) const { return AsTuple() < rhs.AsTuple(); }

 private:
  std::tuple<int, int, int, int, int> AsTuple() const { return std::make_tuple(year, month, day, hour, minute); }
};

namespace impl {

inline int ParseField(const std::string& line, const std::vector<std::string>& fields, size_t index, int min, int max) {
  static const char* const kFieldNames[] = {"year", "month", "day", "hour", "minute"};
  int value;
  if (!strings::TryFromString(fields[index], value)) {
    WEBLOG_THROW(MalformedLogLineException(line, std::string(kFieldNames[index]) + " is not an integer"));
  }
  if (value < min || value > max) {
    WEBLOG_THROW(MalformedLogLineException(
        line, strings::Printf("%s %d is out of range [%d, %d]", kFieldNames[index], value, min, max)));
  }
  return value;
}

}  // namespace weblog::impl

inline AccessRecord ParseAccessRecord(const std::string& line) {
  const std::vector<std::string> fields = strings::Split<strings::ByWhitespace>(line);
  if (fields.size() < 5u) {
    WEBLOG_THROW(MalformedLogLineException(line, strings::Printf("expected 5 fields, got %d",
                                                                  static_cast<int>(fields.size()))));
  }
  AccessRecord record;
  record.year = impl::ParseField(line, fields, 0, 0, 9999);
  record.month = impl::ParseField(line, fields, 1, 1, 12);
  record.day = impl::ParseField(line, fields, 2, 1, 31);
  record.hour = impl::ParseField(line, fields, 3, 0, 23);
  record.minute = impl::ParseField(line, fields, 4, 0, 59);
  return record;
}

}  // namespace weblog

#endif  // WEBLOG_RECORD_H
