// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/base/buffer_reader.h>

#include <absl/log/check.h>

namespace avifmux {
namespace media {

bool BufferReader::Read1(uint8_t* v) {
  DCHECK(v != nullptr);
  if (!HasBytes(1))
    return false;
  *v = buf_[pos_++];
  return true;
}

bool BufferReader::Read2(uint16_t* v) {
  return Read(v);
}
bool BufferReader::Read2s(int16_t* v) {
  return Read(v);
}
bool BufferReader::Read4(uint32_t* v) {
  return Read(v);
}
bool BufferReader::Read4s(int32_t* v) {
  return Read(v);
}
bool BufferReader::Read8(uint64_t* v) {
  return Read(v);
}

bool BufferReader::ReadToVector(std::vector<uint8_t>* vec, size_t count) {
  DCHECK(vec != nullptr);
  if (!HasBytes(count))
    return false;
  vec->assign(buf_ + pos_, buf_ + pos_ + count);
  pos_ += count;
  return true;
}

bool BufferReader::ReadCString(std::string* str) {
  DCHECK(str);
  for (size_t count = 0; pos_ + count < size_; count++) {
    if (buf_[pos_ + count] == 0) {
      str->assign(buf_ + pos_, buf_ + pos_ + count);
      pos_ += count + 1;
      return true;
    }
  }
  return false;
}

bool BufferReader::SkipBytes(size_t num_bytes) {
  if (!HasBytes(num_bytes))
    return false;
  pos_ += num_bytes;
  return true;
}

template <typename T>
bool BufferReader::Read(T* v) {
  DCHECK(v != nullptr);
  if (!HasBytes(sizeof(*v)))
    return false;

  // Assemble in the unsigned domain so negative values round trip.
  uint64_t tmp = 0;
  for (size_t i = 0; i < sizeof(*v); ++i)
    tmp = (tmp << 8) | buf_[pos_++];
  *v = static_cast<T>(tmp);
  return true;
}

}  // namespace media
}  // namespace avifmux
