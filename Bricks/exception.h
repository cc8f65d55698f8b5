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

#ifndef BRICKS_EXCEPTION_H
#define BRICKS_EXCEPTION_H

#include <exception>
#include <string>

#include "strings/printf.h"

namespace weblog {

// The base of every exception this project throws.
//
// `what()` reads `file:line<TAB>throw expression<TAB>message` once thrown through `WEBLOG_THROW`,
// and just `message` otherwise. Tests compare `OriginalDescription()` and `Line()`, since `__FILE__` may be relative.
class Exception : public std::exception {
 public:
  Exception() = default;
  Exception(const std::string& message) : message_(message), what_(message) {}
  virtual ~Exception() = default;

  const std::string& OriginalDescription() const noexcept { return message_; }
  const char* what() const noexcept override { return what_.c_str(); }

  const char* File() const noexcept { return file_; }
  int Line() const noexcept { return line_; }
  const std::string& Caller() const noexcept { return caller_; }

  // Invoked by `WEBLOG_THROW`.
  void SetThrowSite(const char* caller, const char* file, int line) {
    caller_ = caller;
    file_ = file;
    line_ = line;
    what_ = strings::Printf("%s:%d\t%s\t%s", file, line, caller, message_.c_str());
  }

 private:
  std::string message_;
  std::string what_;
  std::string caller_;
  const char* file_ = nullptr;
  int line_ = 0;
};

// The double parentheses keep the declaration of the local copy from parsing as a function declaration.
#define WEBLOG_THROW(E)                                              \
  do {                                                               \
    auto weblog_thrown_exception_((E));                              \
    weblog_thrown_exception_.SetThrowSite(#E, __FILE__, __LINE__);   \
    throw weblog_thrown_exception_;                                  \
  } while (false)

}  // namespace weblog

#endif  // BRICKS_EXCEPTION_H
