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

#ifndef BRICKS_STRINGS_SPLIT_H
#define BRICKS_STRINGS_SPLIT_H

#include <cctype>
#include <string>
#include <vector>

namespace weblog {
namespace strings {

// Separators usable as `Split<SEPARATOR>(s)`. Consecutive separators never produce empty fields.
enum class ByWhitespace { UseIsSpace };

namespace impl {

inline bool IsSeparator(char c, ByWhitespace) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

}  // namespace weblog::strings::impl

// Calls `processor(std::string&&)` for each non-empty field of `s`, returns the number of fields.
template <typename SEPARATOR, typename PROCESSOR>
inline size_t Split(const std::string& s, SEPARATOR separator, PROCESSOR&& processor) {
  size_t fields = 0u;
  size_t begin = 0u;
  for (size_t i = 0u; i <= s.length(); ++i) {
    if (i == s.length() || impl::IsSeparator(s[i], separator)) {
      if (i > begin) {
        processor(s.substr(begin, i - begin));
        ++fields;
      }
      begin = i + 1u;
    }
  }
  return fields;
}

template <typename SEPARATOR>
inline std::vector<std::string> Split(const std::string& s) {
  std::vector<std::string> result;
  Split(s, SEPARATOR(), [&result](std::string&& field) { result.push_back(std::move(field)); });
  return result;
}

}  // namespace weblog::strings
}  // namespace weblog

#endif  // BRICKS_STRINGS_SPLIT_H
