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

#ifndef BRICKS_UTIL_OPTIONALLY_OWNED_H
#define BRICKS_UTIL_OPTIONALLY_OWNED_H

#include <memory>

#include "../exception.h"

namespace weblog {

struct InvalidOptionallyOwnedException : Exception {
  using Exception::Exception;
};

// Either borrows a `T&`, which must outlive it, or owns a `std::unique_ptr<T>`. Both read the same through
// `Ref()` and `->`, so a class can accept an injected dependency or build its own without caring which.
// Move-only; a moved-from holder throws on access.
template <typename T>
class OptionallyOwned {
 public:
  explicit OptionallyOwned(T& ref) : instance_(&ref), unique_ptr_(nullptr) {}

  explicit OptionallyOwned(std::unique_ptr<T> ptr) : instance_(ptr.get()), unique_ptr_(std::move(ptr)) {
    if (!instance_) {
      WEBLOG_THROW(InvalidOptionallyOwnedException("`OptionallyOwned` can not own a null pointer."));
    }
  }

  OptionallyOwned(OptionallyOwned&& rhs) : instance_(rhs.instance_), unique_ptr_(std::move(rhs.unique_ptr_)) {
    if (!instance_) {
      WEBLOG_THROW(InvalidOptionallyOwnedException("`OptionallyOwned` moved from a moved-from holder."));
    }
    rhs.instance_ = nullptr;
  }

  T& Ref() const {
    if (!instance_) {
      WEBLOG_THROW(InvalidOptionallyOwnedException("`OptionallyOwned` accessed after being moved from."));
    }
    return *instance_;
  }

  T* operator->() const { return &Ref(); }

 private:
  T* instance_;                    // Null once moved away from.
  std::unique_ptr<T> unique_ptr_;  // Null when borrowing.

  OptionallyOwned() = delete;
  OptionallyOwned(const OptionallyOwned&) = delete;
  void operator=(const OptionallyOwned&) = delete;
  void operator=(OptionallyOwned&&) = delete;
};

}  // namespace weblog

#endif  // BRICKS_UTIL_OPTIONALLY_OWNED_H
