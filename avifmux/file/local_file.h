// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_FILE_LOCAL_FILE_H_
#define AVIFMUX_FILE_LOCAL_FILE_H_

#include <cstdint>
#include <cstdio>
#include <string>

#include <avifmux/file.h>

namespace avifmux {

/// A File on the local file system, backed by stdio.
class LocalFile : public File {
 public:
  /// @param mode is passed to fopen with "b" appended.
  LocalFile(const char* file_name, const char* mode);

  bool Close() override;
  int64_t Read(void* buffer, uint64_t length) override;
  int64_t Write(const void* buffer, uint64_t length) override;
  int64_t Size() override;
  bool Flush() override;

 protected:
  ~LocalFile() override;

  bool Open() override;

 private:
  std::string file_mode_;
  FILE* internal_file_;

  DISALLOW_COPY_AND_ASSIGN(LocalFile);
};

}  // namespace avifmux

#endif  // AVIFMUX_FILE_LOCAL_FILE_H_
