// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_BASE_BUFFER_WRITER_H_
#define AVIFMUX_MEDIA_BASE_BUFFER_WRITER_H_

#include <cstdint>
#include <string>
#include <vector>

#include <avifmux/macros/classes.h>
#include <avifmux/status.h>

namespace avifmux {

class File;

namespace media {

/// A simple buffer writer implementation which appends various data types to
/// buffer. Boxes serialize themselves into it; it is also used to count the
/// bytes a box actually produces.
class BufferWriter {
 public:
  BufferWriter();
  /// Construct the object with a reserved capacity.
  /// @param reserved_size_in_bytes is intended for optimization and is
  ///        not a hard limit.
  explicit BufferWriter(size_t reserved_size_in_bytes);
  ~BufferWriter();

  /// These convenience functions append the integers (in network byte order,
  /// i.e. big endian) of various size and signedness to the end of the buffer.
  /// @{
  void AppendInt(uint8_t v);
  void AppendInt(uint16_t v);
  void AppendInt(uint32_t v);
  void AppendInt(uint64_t v);
  void AppendInt(int16_t v);
  void AppendInt(int32_t v);
  /// @}

  /// Append the least significant @a num_bytes of @a v to buffer.
  /// @param num_bytes should not be larger than sizeof(@a v).
  void AppendNBytes(uint64_t v, size_t num_bytes);

  void AppendVector(const std::vector<uint8_t>& v);
  void AppendString(const std::string& s);
  /// Append @a s followed by a terminating nul byte.
  void AppendCString(const std::string& s);
  void AppendArray(const uint8_t* buf, size_t size);

  void Clear() { buf_.clear(); }
  size_t Size() const { return buf_.size(); }
  /// @return Underlying buffer. Behavior is undefined if the buffer size is 0.
  const uint8_t* Buffer() const { return buf_.data(); }

  /// Write the buffer to file. The internal buffer will be cleared after
  /// writing.
  /// @param file should not be NULL.
  /// @return OK on success, FILE_FAILURE if the file stops accepting data.
  Status WriteToFile(File* file);

  /// Write @a size bytes starting at @a data to @a file, retrying on short
  /// writes. Used for data that is not worth copying into a BufferWriter.
  static Status WriteArrayToFile(const uint8_t* data, size_t size, File* file);

 private:
  // Internal implementation of multi-byte write.
  template <typename T>
  void AppendInternal(T v);

  std::vector<uint8_t> buf_;

  DISALLOW_COPY_AND_ASSIGN(BufferWriter);
};

}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_BASE_BUFFER_WRITER_H_
