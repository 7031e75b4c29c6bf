// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_FILE_FILE_TEST_UTIL_H_
#define AVIFMUX_FILE_FILE_TEST_UTIL_H_

#include <cstdint>
#include <string>

#include <gtest/gtest.h>

#include <avifmux/file.h>

namespace avifmux {

#define ASSERT_FILE_STREQ(file_name, str)                         \
  do {                                                            \
    std::string temp_data;                                        \
    ASSERT_TRUE(File::ReadFileToString((file_name), &temp_data)); \
    ASSERT_EQ(str, temp_data);                                    \
  } while (false)

// A write-only sink that accepts |accepted_bytes| and then rejects every
// further write.
class FailingFile : public File {
 public:
  explicit FailingFile(const std::string& file_name,
                       uint64_t accepted_bytes = 0)
      : File(file_name), remaining_(accepted_bytes) {}

  bool Close() override {
    delete this;
    return true;
  }
  int64_t Read(void*, uint64_t) override { return -1; }
  int64_t Write(const void*, uint64_t length) override {
    if (remaining_ == 0)
      return -1;
    const uint64_t written = length < remaining_ ? length : remaining_;
    remaining_ -= written;
    bytes_written_ += written;
    return written;
  }
  int64_t Size() override { return bytes_written_; }
  bool Flush() override { return true; }

 protected:
  bool Open() override { return true; }

 private:
  uint64_t remaining_;
  uint64_t bytes_written_ = 0;
};

}  // namespace avifmux

#endif  // AVIFMUX_FILE_FILE_TEST_UTIL_H_
