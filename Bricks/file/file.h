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

#ifndef BRICKS_FILE_FILE_H
#define BRICKS_FILE_FILE_H

#include "../../port.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <sys/stat.h>

#ifdef WEBLOG_WINDOWS
#include <process.h>
#else
#include <unistd.h>
#endif

#include "exceptions.h"

#include "../strings/printf.h"

namespace weblog {

// The filesystem calls the log reader, the log creator and their tests make.
struct FileSystem {
  // Calls `f(std::string&& line)` for each line of the file, with the trailing '\n' removed.
  template <typename F>
  static inline void ReadFileByLines(const std::string& file_name, F&& f) {
    if (IsDirNoThrow(file_name)) {
      WEBLOG_THROW(CannotReadFileException(file_name));
    }
    std::ifstream fi(file_name);
    if (!fi.is_open()) {
      WEBLOG_THROW(CannotReadFileException(file_name));
    }
    std::string line;
    while (std::getline(fi, line)) {
      f(std::move(line));
    }
    if (fi.bad()) {
      WEBLOG_THROW(CannotReadFileException(file_name));  // LCOV_EXCL_LINE
    }
  }

  // `file_name` is `const char*` so that it can not be swapped with `contents` by accident.
  static inline void WriteStringToFile(const std::string& contents, const char* file_name, bool append = false) {
    std::ofstream fo(file_name, (append ? std::ofstream::app : std::ofstream::trunc) | std::ofstream::binary);
    if (!fo.is_open() || !(fo << contents) || !fo.flush()) {
      WEBLOG_THROW(FileException(file_name));
    }
  }

  // A fresh name in the system temporary directory. The file is not created.
  static inline std::string GenTmpFileName() {
#ifdef WEBLOG_WINDOWS
    const char* dir = std::getenv("TEMP");
    return strings::Printf("%s\\weblog-tmp-%d-%08x", dir ? dir : ".", ::_getpid(), std::rand());
#else
    // The process id keeps concurrently running binaries, each with the same `rand()` sequence, apart.
    return strings::Printf("/tmp/.weblog-tmp-%d-%08x", static_cast<int>(::getpid()), std::rand());
#endif
  }

  static inline bool IsDirNoThrow(const std::string& file_or_directory_name) {
    struct stat info;
    if (::stat(file_or_directory_name.c_str(), &info)) {
      return false;
    }
#ifdef WEBLOG_WINDOWS
    return (info.st_mode & _S_IFDIR) != 0;
#else
    return S_ISDIR(info.st_mode);
#endif
  }

  enum class RmFileParameters { ThrowExceptionOnError, Silent };
  static inline void RmFile(const std::string& file_name,
                            RmFileParameters parameters = RmFileParameters::ThrowExceptionOnError) {
    if (std::remove(file_name.c_str()) && parameters == RmFileParameters::ThrowExceptionOnError) {
      WEBLOG_THROW(FileException(file_name));
    }
  }

  // Removes the file when going out of scope, and, by default, when created as well.
  class ScopedRmFile final {
   public:
    explicit ScopedRmFile(const std::string& file_name, bool remove_now_as_well = true) : file_name_(file_name) {
      if (remove_now_as_well) {
        RmFile(file_name_, RmFileParameters::Silent);
      }
    }
    ~ScopedRmFile() { RmFile(file_name_, RmFileParameters::Silent); }

   private:
    std::string file_name_;
  };
};

}  // namespace weblog

#endif  // BRICKS_FILE_FILE_H
