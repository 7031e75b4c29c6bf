// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/formats/mp4/box.h>

#include <absl/log/check.h>
#include <absl/log/log.h>

#include <avifmux/media/base/rcheck.h>
#include <avifmux/media/formats/mp4/box_buffer.h>

namespace avifmux {
namespace media {
namespace mp4 {

Box::Box() : box_size_(0) {}
Box::~Box() {}

void Box::Write(BufferWriter* writer) {
  DCHECK(writer);
  // Compute and update box size.
  uint32_t size = ComputeSize();
  DCHECK_EQ(size, box_size_);

  size_t buffer_size_before_write = writer->Size();
  BoxBuffer buffer(writer);
  CHECK(WriteInternal(&buffer)) << FourCCToString(BoxType());
  DCHECK_EQ(box_size_, writer->Size() - buffer_size_before_write)
      << FourCCToString(BoxType());
}

void Box::WriteHeader(BufferWriter* writer) {
  DCHECK(writer);
  // Compute and update box size.
  uint32_t size = ComputeSize();
  DCHECK_EQ(size, box_size_);

  size_t buffer_size_before_write = writer->Size();
  BoxBuffer buffer(writer);
  CHECK(WriteHeaderInternal(&buffer));
  DCHECK_EQ(HeaderSize(), writer->Size() - buffer_size_before_write);
}

uint32_t Box::ComputeSize() {
  box_size_ = static_cast<uint32_t>(ComputeSizeInternal());
  return box_size_;
}

uint32_t Box::HeaderSize() const {
  const uint32_t kFourCCSize = 4;
  return kFourCCSize + sizeof(uint32_t);
}

bool Box::WriteHeaderInternal(BoxBuffer* buffer) {
  return buffer->WriteUInt32(box_size_) && buffer->WriteFourCC(BoxType());
}

FullBox::FullBox() = default;
FullBox::~FullBox() = default;

uint32_t FullBox::HeaderSize() const {
  // Additional 1-byte version and 3-byte flags.
  return Box::HeaderSize() + 1 + 3;
}

bool FullBox::WriteHeaderInternal(BoxBuffer* buffer) {
  RCHECK(Box::WriteHeaderInternal(buffer));
  DCHECK_EQ(0u, flags & 0xFF000000);
  return buffer->WriteUInt32((static_cast<uint32_t>(version) << 24) | flags);
}

}  // namespace mp4
}  // namespace media
}  // namespace avifmux
