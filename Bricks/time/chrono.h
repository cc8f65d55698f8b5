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

// Not named `time.h`, which would shadow the C standard header.

#ifndef BRICKS_TIME_CHRONO_H
#define BRICKS_TIME_CHRONO_H

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>

#include "../util/singleton.h"

namespace weblog {
namespace time {

// Microseconds since the Epoch, never returning the same value twice.
// The wall clock may stand still or step back; this one then advances by a microsecond per call.
class MonotonicEpochClock final {
 public:
  std::chrono::microseconds Now() {
    int64_t last = last_us_.load();
    int64_t next;
    do {
      next = std::max(WallClockMicroseconds(), last + 1);
    } while (!last_us_.compare_exchange_weak(last, next));
    return std::chrono::microseconds(next);
  }

 private:
  static int64_t WallClockMicroseconds() {
    using std::chrono::duration_cast;
    return duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
  }

  std::atomic<int64_t> last_us_{0};
};

inline std::chrono::microseconds Now() { return Singleton<MonotonicEpochClock>().Now(); }

}  // namespace weblog::time
}  // namespace weblog

#endif  // BRICKS_TIME_CHRONO_H
