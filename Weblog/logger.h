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

#ifndef WEBLOG_LOGGER_H
#define WEBLOG_LOGGER_H

#include "../port.h"

#include <iostream>
#include <sstream>

#include "../Bricks/time/chrono.h"
#include "../Bricks/util/singleton.h"

namespace weblog {
namespace impl {

class WeblogLoggerImpl final {
 public:
  struct Impl {
    virtual ~Impl() = default;
    virtual void Log(const std::string&) const {}
  };

  struct OStreamLogger : Impl {
    std::ostream& os_;
    explicit OStreamLogger(std::ostream& os) : os_(os) {}
    void Log(const std::string& message) const override { os_ << message << std::endl; }
  };

  void Log(const std::string& message) const { impl_->Log(message); }

  void DisableLogging() { impl_ = std::make_unique<Impl>(); }
  void LogToStderr() { impl_ = std::make_unique<OStreamLogger>(std::cerr); }
  void LogToOStream(std::ostream& os) { impl_ = std::make_unique<OStreamLogger>(os); }

 private:
  std::unique_ptr<Impl> impl_{std::make_unique<Impl>()};
};

}  // namespace weblog::impl

inline impl::WeblogLoggerImpl& Logger() { return Singleton<impl::WeblogLoggerImpl>(); }

struct ScopedLogToStderr final {
  ScopedLogToStderr() { Logger().LogToStderr(); }
  ~ScopedLogToStderr() { Logger().DisableLogging(); }
};

struct ScopedLogToOStream final {
  explicit ScopedLogToOStream(std::ostream& os) { Logger().LogToOStream(os); }
  ~ScopedLogToOStream() { Logger().DisableLogging(); }
};

// Logs the number of records consumed by a pass over the record source, and how long it took.
class PassStats final {
 public:
  explicit PassStats(const std::string& name) : name_(name), begin_timestamp_(weblog::time::Now()) {}
  PassStats() = delete;

  ~PassStats() {
    std::ostringstream os;
    os << name_ << ": " << n_records_ << " records in " << (weblog::time::Now() - begin_timestamp_).count()
       << " us.";
    Logger().Log(os.str());
  }

  void JournalRecord() { ++n_records_; }
  size_t Records() const { return n_records_; }

 private:
  const std::string name_;
  const std::chrono::microseconds begin_timestamp_;
  size_t n_records_ = 0;
};

}  // namespace weblog

#endif  // WEBLOG_LOGGER_H
