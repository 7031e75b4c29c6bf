// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_PUBLIC_FILE_H_
#define AVIFMUX_PUBLIC_FILE_H_

#include <cstdint>
#include <string>

#include <avifmux/export.h>
#include <avifmux/macros/classes.h>

namespace avifmux {

extern const char* kLocalFilePrefix;
extern const char* kMemoryFilePrefix;

/// Byte sink and source used by the muxer and the command-line tool. Files
/// are created by File::Open and released by Close().
class AVIFMUX_EXPORT File {
 public:
  /// Creates and opens a file. The implementation is picked by the name
  /// prefix: "file://" for a LocalFile, "memory://" for a MemoryFile. Names
  /// without a known prefix are local.
  /// @param mode is an fopen style mode, e.g. "r" or "w".
  /// @return The opened file, or nullptr on failure.
  static File* Open(const char* file_name, const char* mode);

  /// Flushes, releases the file and deletes this object. Every File must be
  /// released this way.
  /// @return false if buffered data could not be written.
  virtual bool Close() = 0;

  /// Reads up to @a length bytes into @a buffer.
  /// @return Bytes read, 0 at end of file, or a negative value on error.
  virtual int64_t Read(void* buffer, uint64_t length) = 0;

  /// Writes up to @a length bytes from @a buffer.
  /// @return Bytes written, or a negative value on error.
  virtual int64_t Write(const void* buffer, uint64_t length) = 0;

  /// @return The file size, or a negative value on error.
  virtual int64_t Size() = 0;

  virtual bool Flush() = 0;

  /// @return The name without its type prefix.
  const std::string& file_name() const { return file_name_; }

  /// Replaces @a contents with the whole of @a file_name.
  static bool ReadFileToString(const char* file_name, std::string* contents);

 protected:
  explicit File(const std::string& file_name) : file_name_(file_name) {}
  // Use Close() instead.
  virtual ~File() {}

  /// Called by File::Open() after construction.
  virtual bool Open() = 0;

 private:
  std::string file_name_;

  DISALLOW_COPY_AND_ASSIGN(File);
};

}  // namespace avifmux

#endif  // AVIFMUX_PUBLIC_FILE_H_
