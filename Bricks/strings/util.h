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

#ifndef BRICKS_STRINGS_UTIL_H
#define BRICKS_STRINGS_UTIL_H

#include <cctype>
#include <sstream>
#include <string>
#include <type_traits>

namespace weblog {
namespace strings {

template <typename T>
inline typename std::enable_if<std::is_arithmetic<T>::value, std::string>::type ToString(T value) {
  return std::to_string(value);
}

// Strict parsing: returns `false` and leaves `output` untouched unless the whole `input` is consumed.
template <typename OUTPUT>
inline bool TryFromString(const std::string& input, OUTPUT& output) {
  static_assert(std::is_arithmetic<OUTPUT>::value, "`TryFromString` can only be used with arithmetic types.");
  if (input.empty() || std::isspace(static_cast<unsigned char>(input.front()))) {
    return false;
  }
  // `istream` would happily wrap "-1" around into an unsigned type.
  if (std::is_unsigned<OUTPUT>::value && input.front() == '-') {
    return false;
  }
  std::istringstream is(input);
  OUTPUT value;
  if (!(is >> value) || is.peek() != std::char_traits<char>::eof()) {
    return false;
  }
  output = value;
  return true;
}

inline bool TryFromString(const std::string& input, bool& output) {
  if (input == "true" || input == "True" || input == "1") {
    output = true;
  } else if (input == "false" || input == "False" || input == "0") {
    output = false;
  } else {
    return false;
  }
  return true;
}

inline std::string Trim(const std::string& s) {
  const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
  size_t begin = 0u;
  size_t end = s.length();
  while (begin < end && is_space(s[begin])) {
    ++begin;
  }
  while (end > begin && is_space(s[end - 1u])) {
    --end;
  }
  return s.substr(begin, end - begin);
}

}  // namespace strings
}  // namespace weblog

#endif  // BRICKS_STRINGS_UTIL_H
