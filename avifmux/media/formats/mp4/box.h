// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_FORMATS_MP4_BOX_H_
#define AVIFMUX_MEDIA_FORMATS_MP4_BOX_H_

#include <cstddef>
#include <cstdint>

#include <avifmux/media/base/fourccs.h>

namespace avifmux {
namespace media {

class BufferWriter;

namespace mp4 {

class BoxBuffer;

/// Base of every box the muxer writes (ISO/IEC 14496-12 section 4.2). Boxes
/// are plain structs; the muxer fills in their fields, sizes them, and then
/// serializes them.
struct Box {
 public:
  Box();
  virtual ~Box();
  /// Serializes the box and its children. Sizes are recomputed first, and
  /// exactly box_size() bytes are appended to @a writer.
  void Write(BufferWriter* writer);
  /// Serializes the header only, using the recomputed size.
  void WriteHeader(BufferWriter* writer);
  /// Recomputes and caches the size of the box including its children.
  /// @return 0 for an optional box that is left out of the output.
  uint32_t ComputeSize();
  virtual uint32_t HeaderSize() const;
  virtual FourCC BoxType() const = 0;

  /// @return The size cached by the last ComputeSize() call.
  uint32_t box_size() const { return box_size_; }

 protected:
  virtual bool WriteHeaderInternal(BoxBuffer* buffer);

 private:
  friend class BoxBuffer;
  // Requires an up to date box_size_.
  virtual bool WriteInternal(BoxBuffer* buffer) = 0;
  // Pure function of the fields. Does not touch box_size_.
  virtual size_t ComputeSizeInternal() = 0;

  // 64-bit box sizes are never needed for image headers.
  uint32_t box_size_;
};

/// Defines FullBox, which adds a version and flags to the box header.
struct FullBox : Box {
 public:
  FullBox();
  ~FullBox() override;

  uint32_t HeaderSize() const final;

  uint8_t version = 0;
  uint32_t flags = 0;

 protected:
  bool WriteHeaderInternal(BoxBuffer* buffer) final;
};

}  // namespace mp4
}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_FORMATS_MP4_BOX_H_
