// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_BASE_BUFFER_READER_H_
#define AVIFMUX_MEDIA_BASE_BUFFER_READER_H_

#include <cstdint>
#include <string>
#include <vector>

#include <avifmux/macros/classes.h>

namespace avifmux {
namespace media {

/// Reads big-endian integers and byte runs from a borrowed buffer. Every
/// read fails without moving the position when the buffer is too short.
class BufferReader {
 public:
  BufferReader(const uint8_t* buf, size_t size)
      : buf_(buf), size_(size), pos_(0) {}
  ~BufferReader() {}

  bool HasBytes(size_t count) const { return pos() + count <= size(); }

  [[nodiscard]] bool Read1(uint8_t* v);
  [[nodiscard]] bool Read2(uint16_t* v);
  [[nodiscard]] bool Read2s(int16_t* v);
  [[nodiscard]] bool Read4(uint32_t* v);
  [[nodiscard]] bool Read4s(int32_t* v);
  [[nodiscard]] bool Read8(uint64_t* v);

  [[nodiscard]] bool ReadToVector(std::vector<uint8_t>* t, size_t count);
  /// Reads up to and including a nul byte. The nul is not stored.
  [[nodiscard]] bool ReadCString(std::string* str);

  [[nodiscard]] bool SkipBytes(size_t num_bytes);

  const uint8_t* data() const { return buf_; }
  size_t size() const { return size_; }
  size_t pos() const { return pos_; }

 private:
  template <typename T>
  [[nodiscard]] bool Read(T* t);

  const uint8_t* buf_;
  size_t size_;
  size_t pos_;

  DISALLOW_COPY_AND_ASSIGN(BufferReader);
};

}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_BASE_BUFFER_READER_H_
