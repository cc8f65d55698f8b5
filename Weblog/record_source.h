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

#ifndef WEBLOG_RECORD_SOURCE_H
#define WEBLOG_RECORD_SOURCE_H

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "exceptions.h"
#include "logger.h"
#include "record.h"

#include "../Bricks/file/file.h"
#include "../Bricks/strings/util.h"

namespace weblog {

// A finite, restartable, pull-based sequence of access records.
// Every full traversal after `Reset()` yields the same records in the same order.
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  virtual void Reset() = 0;
  virtual bool HasNext() const = 0;
  virtual AccessRecord Next() = 0;
};

class InMemoryRecordSource : public RecordSource {
 public:
  InMemoryRecordSource() = default;
  explicit InMemoryRecordSource(std::vector<AccessRecord> records) : records_(std::move(records)) {}

  void Reset() override { cursor_ = 0u; }
  bool HasNext() const override { return cursor_ < records_.size(); }
  AccessRecord Next() override {
    if (!HasNext()) {
      WEBLOG_THROW(NoMoreRecordsException());
    }
    return records_[cursor_++];
  }

  const std::vector<AccessRecord>& Records() const { return records_; }
  size_t NumberOfEntries() const { return records_.size(); }

 protected:
  std::vector<AccessRecord> records_;
  size_t cursor_ = 0u;
};

// Throw: A malformed line aborts loading with `MalformedLogLineException`.
// Skip:  A malformed line is logged, counted, and dropped.
enum class MalformedLinePolicy { Throw, Skip };

// Loads the whole log file up front, one record per non-blank line, and replays it in chronological order.
class LogfileReader final : public InMemoryRecordSource {
 public:
  explicit LogfileReader(const std::string& file_name, MalformedLinePolicy policy = MalformedLinePolicy::Throw)
      : file_name_(file_name) {
    size_t line_number = 0u;
    try {
      FileSystem::ReadFileByLines(file_name_, [this, policy, &line_number](std::string&& line) {
        ++line_number;
        if (strings::Trim(line).empty()) {
          return;
        }
        try {
          records_.push_back(ParseAccessRecord(line));
        } catch (const MalformedLogLineException& e) {
          if (policy == MalformedLinePolicy::Throw) {
            WEBLOG_THROW(MalformedLogLineException(file_name_, line_number, e.OriginalDescription()));
          }
          ++skipped_lines_;
          Logger().Log(strings::Printf("%s:%d: skipped, %s",
                                       file_name_.c_str(),
                                       static_cast<int>(line_number),
                                       e.OriginalDescription().c_str()));
        }
      });
    } catch (const CannotReadFileException&) {
      WEBLOG_THROW(CannotReadLogfileException(file_name_));
    }
    std::stable_sort(records_.begin(), records_.end());
    Logger().Log(strings::Printf("%s: %d records loaded, %d lines skipped.",
                                 file_name_.c_str(),
                                 static_cast<int>(records_.size()),
                                 static_cast<int>(skipped_lines_)));
  }

  const std::string& FileName() const { return file_name_; }
  size_t SkippedLines() const { return skipped_lines_; }

 private:
  const std::string file_name_;
  size_t skipped_lines_ = 0u;
};

}  // namespace weblog

#endif  // WEBLOG_RECORD_SOURCE_H
