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

#ifndef WEBLOG_EXCEPTIONS_H
#define WEBLOG_EXCEPTIONS_H

#include "../Bricks/exception.h"
#include "../Bricks/strings/printf.h"

namespace weblog {

struct WeblogException : Exception {
  using Exception::Exception;
};

struct CannotReadLogfileException : WeblogException {
  explicit CannotReadLogfileException(const std::string& file_name)
      : WeblogException("Can not read the log file '" + file_name + "'.") {}
};

struct MalformedLogLineException : WeblogException {
  MalformedLogLineException(const std::string& line, const std::string& reason)
      : WeblogException("Malformed log line '" + line + "': " + reason + '.') {}
  MalformedLogLineException(const std::string& file_name, size_t line_number, const std::string& details)
      : WeblogException(strings::Printf("%s:%d: ", file_name.c_str(), static_cast<int>(line_number)) + details) {}
};

struct NoMoreRecordsException : WeblogException {
  NoMoreRecordsException() : WeblogException("`Next()` called with no more records in the source.") {}
};

struct UnknownReportException : WeblogException {
  explicit UnknownReportException(const std::string& report)
      : WeblogException("Unknown report '" + report + "', expected `all`, `hourly`, or `monthly`.") {}
};

}  // namespace weblog

#endif  // WEBLOG_EXCEPTIONS_H
