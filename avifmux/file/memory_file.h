// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_FILE_MEMORY_FILE_H_
#define AVIFMUX_FILE_MEMORY_FILE_H_

#include <cstdint>
#include <string>
#include <vector>

#include <avifmux/file.h>
#include <avifmux/macros/classes.h>

namespace avifmux {

/// Implements a File that is stored in memory. Meant for tests and for
/// callers that want the image bytes without touching the disk.
class MemoryFile : public File {
 public:
  MemoryFile(const std::string& file_name, const std::string& mode);

  bool Close() override;
  int64_t Read(void* buffer, uint64_t length) override;
  int64_t Write(const void* buffer, uint64_t length) override;
  int64_t Size() override;
  bool Flush() override;

  /// Drops the contents of every memory file. No MemoryFile may be open.
  static void DeleteAll();

 protected:
  ~MemoryFile() override;
  bool Open() override;

 private:
  std::string mode_;
  std::vector<uint8_t>* file_;
  uint64_t position_;

  DISALLOW_COPY_AND_ASSIGN(MemoryFile);
};

}  // namespace avifmux

#endif  // AVIFMUX_FILE_MEMORY_FILE_H_
