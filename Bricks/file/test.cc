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

#include <string>
#include <vector>

#include "file.h"

#include <gtest/gtest.h>

using weblog::CannotReadFileException;
using weblog::FileException;
using weblog::FileSystem;

namespace {

std::vector<std::string> ReadLines(const std::string& file_name) {
  std::vector<std::string> lines;
  FileSystem::ReadFileByLines(file_name, [&lines](std::string&& line) { lines.push_back(std::move(line)); });
  return lines;
}

}  // namespace

TEST(File, WriteAndReadByLines) {
  const std::string fn = FileSystem::GenTmpFileName();
  const auto file_remover = FileSystem::ScopedRmFile(fn);

  FileSystem::WriteStringToFile("first\n\nthird\nno newline at the end", fn.c_str());
  EXPECT_EQ(std::vector<std::string>({"first", "", "third", "no newline at the end"}), ReadLines(fn));

  FileSystem::WriteStringToFile("overwritten\n", fn.c_str());
  FileSystem::WriteStringToFile("appended\n", fn.c_str(), true);
  EXPECT_EQ(std::vector<std::string>({"overwritten", "appended"}), ReadLines(fn));

  FileSystem::WriteStringToFile("", fn.c_str());
  EXPECT_TRUE(ReadLines(fn).empty());
}

TEST(File, ReadByLinesErrors) {
  const std::string fn = FileSystem::GenTmpFileName();
  const auto file_remover = FileSystem::ScopedRmFile(fn);
  EXPECT_THROW(ReadLines(fn), CannotReadFileException);

#ifndef WEBLOG_WINDOWS
  EXPECT_TRUE(FileSystem::IsDirNoThrow("/tmp"));
  EXPECT_THROW(ReadLines("/tmp"), CannotReadFileException);
  EXPECT_THROW(FileSystem::WriteStringToFile("nope", "/tmp"), FileException);
#endif
  EXPECT_FALSE(FileSystem::IsDirNoThrow(fn));
}

TEST(File, GenTmpFileNameIsFresh) {
  const std::string a = FileSystem::GenTmpFileName();
  const std::string b = FileSystem::GenTmpFileName();
  EXPECT_NE(a, b);
  EXPECT_THROW(ReadLines(a), CannotReadFileException);
}

TEST(File, RmFileAndScopedRmFile) {
  const std::string fn = FileSystem::GenTmpFileName();
  EXPECT_THROW(FileSystem::RmFile(fn), FileException);
  FileSystem::RmFile(fn, FileSystem::RmFileParameters::Silent);
  {
    const auto file_remover = FileSystem::ScopedRmFile(fn);
    FileSystem::WriteStringToFile("here", fn.c_str());
    EXPECT_EQ(std::vector<std::string>({"here"}), ReadLines(fn));
  }
  EXPECT_THROW(ReadLines(fn), CannotReadFileException);

  FileSystem::WriteStringToFile("kept until the scope ends", fn.c_str());
  {
    const auto file_remover = FileSystem::ScopedRmFile(fn, false);
    EXPECT_EQ(1u, ReadLines(fn).size());
  }
  EXPECT_THROW(ReadLines(fn), CannotReadFileException);
}
