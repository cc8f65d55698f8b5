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

// Platform selection for the handful of places that touch the OS directly: file metadata and temporary file names.
//
// Exactly one of `WEBLOG_POSIX`, `WEBLOG_APPLE` and `WEBLOG_WINDOWS` ends up defined. One set from the command line
// is respected, otherwise the compiler's own platform macros decide.

#ifndef WEBLOG_PORT_H
#define WEBLOG_PORT_H

#if defined(WEBLOG_POSIX) + defined(WEBLOG_APPLE) + defined(WEBLOG_WINDOWS) > 1
#error "Only one of `WEBLOG_POSIX`, `WEBLOG_APPLE` and `WEBLOG_WINDOWS` can be defined."
#endif

#if !defined(WEBLOG_POSIX) && !defined(WEBLOG_APPLE) && !defined(WEBLOG_WINDOWS)
#if defined(__linux)
#define WEBLOG_POSIX
#elif defined(__APPLE__)
#define WEBLOG_APPLE
#elif defined(_WIN32)
#define WEBLOG_WINDOWS
#else
#error "Unsupported platform, define one of `WEBLOG_POSIX`, `WEBLOG_APPLE` or `WEBLOG_WINDOWS` explicitly."
#endif
#endif

#ifdef WEBLOG_WINDOWS
#ifndef NOMINMAX
#define NOMINMAX  // Keep `std::min()` and `std::max()` usable.
#endif
#ifndef _CRT_SECURE_NO_WARNINGS
#define _CRT_SECURE_NO_WARNINGS
#endif
#endif  // WEBLOG_WINDOWS

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#endif  // WEBLOG_PORT_H
