// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_FORMATS_MP4_BOX_BUFFER_H_
#define AVIFMUX_MEDIA_FORMATS_MP4_BOX_BUFFER_H_

#include <string>
#include <vector>

#include <absl/log/check.h>

#include <avifmux/macros/classes.h>
#include <avifmux/media/base/buffer_writer.h>
#include <avifmux/media/formats/mp4/box.h>

namespace avifmux {
namespace media {
namespace mp4 {

/// Class for MP4 box output. BoxBuffer wraps a BufferWriter and gives boxes a
/// bool-returning interface so box code reads as a chain of RCHECKs.
class BoxBuffer {
 public:
  /// @param writer should not be NULL.
  explicit BoxBuffer(BufferWriter* writer) : writer_(writer) {
    DCHECK(writer);
  }
  ~BoxBuffer() {}

  /// @return Number of bytes written to the underlying writer so far.
  size_t Size() const { return writer_->Size(); }

  /// @name Write a big-endian integer of the given width.
  /// @{
  bool WriteUInt8(uint8_t v) {
    writer_->AppendInt(v);
    return true;
  }
  bool WriteUInt16(uint16_t v) {
    writer_->AppendInt(v);
    return true;
  }
  bool WriteUInt32(uint32_t v) {
    writer_->AppendInt(v);
    return true;
  }
  bool WriteUInt64(uint64_t v) {
    writer_->AppendInt(v);
    return true;
  }
  bool WriteInt16(int16_t v) {
    writer_->AppendInt(v);
    return true;
  }
  bool WriteInt32(int32_t v) {
    writer_->AppendInt(v);
    return true;
  }
  /// @}

  /// Writes the low @a num_bytes bytes of @a v. Used for fields whose width
  /// depends on the box version.
  bool WriteUInt64NBytes(uint64_t v, size_t num_bytes) {
    writer_->AppendNBytes(v, num_bytes);
    return true;
  }

  bool WriteVector(const std::vector<uint8_t>& vector) {
    writer_->AppendVector(vector);
    return true;
  }

  /// Writes @a str followed by a nul terminator.
  bool WriteCString(const std::string& str) {
    writer_->AppendCString(str);
    return true;
  }

  bool WriteFourCC(FourCC fourcc) {
    writer_->AppendInt(static_cast<uint32_t>(fourcc));
    return true;
  }

  /// Writes a mandatory child box, whose size must already be computed.
  bool WriteChild(Box* box) {
    // The box is mandatory, i.e. the box size should not be 0.
    DCHECK_NE(0u, box->box_size()) << FourCCToString(box->BoxType());
    CHECK(box->WriteInternal(this));
    return true;
  }

  /// Writes an optional child box. It is skipped if its size is 0.
  bool TryWriteChild(Box* box) {
    if (box->box_size() != 0)
      CHECK(box->WriteInternal(this));
    return true;
  }

  /// Writes @a num_bytes zero bytes, for reserved and pre-defined fields.
  bool IgnoreBytes(size_t num_bytes) {
    writer_->AppendVector(std::vector<uint8_t>(num_bytes, 0));
    return true;
  }

  BufferWriter* writer() { return writer_; }

 private:
  BufferWriter* writer_;

  DISALLOW_COPY_AND_ASSIGN(BoxBuffer);
};

}  // namespace mp4
}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_FORMATS_MP4_BOX_BUFFER_H_
