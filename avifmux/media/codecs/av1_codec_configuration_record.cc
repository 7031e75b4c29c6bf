// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/codecs/av1_codec_configuration_record.h>

#include <absl/log/check.h>
#include <absl/strings/str_format.h>

#include <avifmux/media/base/bit_writer.h>

namespace avifmux {
namespace media {

AV1CodecConfigurationRecord::AV1CodecConfigurationRecord() = default;

AV1CodecConfigurationRecord::~AV1CodecConfigurationRecord() = default;

// https://aomediacodec.github.io/av1-isobmff/#av1codecconfigurationbox-section
// aligned (8) class AV1CodecConfigurationRecord {
//   unsigned int (1) marker = 1;
//   unsigned int (7) version = 1;
//   unsigned int (3) seq_profile;
//   unsigned int (5) seq_level_idx_0;
//   unsigned int (1) seq_tier_0;
//   unsigned int (1) high_bitdepth;
//   unsigned int (1) twelve_bit;
//   unsigned int (1) monochrome;
//   unsigned int (1) chroma_subsampling_x;
//   unsigned int (1) chroma_subsampling_y;
//   unsigned int (2) chroma_sample_position;
//   unsigned int (3) reserved = 0;
//   unsigned int (1) initial_presentation_delay_present;
//   unsigned int (4) reserved = 0;
//   unsigned int (8)[] configOBUs;
// }
// Image items carry their sequence header in the bitstream, so no configOBUs
// are written.
void AV1CodecConfigurationRecord::WriteToVector(
    std::vector<uint8_t>* data) const {
  DCHECK(bit_depth_ == 8 || bit_depth_ == 10 || bit_depth_ == 12)
      << "Unsupported bit depth " << static_cast<int>(bit_depth_);
  data->clear();

  BitWriter writer(data);
  writer.WriteBits(1, 1);
  writer.WriteBits(1, 7);
  writer.WriteBits(profile_, 3);
  writer.WriteBits(level_, 5);
  writer.WriteBits(tier_, 1);
  writer.WriteBits(bit_depth_ >= 10 ? 1 : 0, 1);
  writer.WriteBits(bit_depth_ >= 12 ? 1 : 0, 1);
  writer.WriteBits(mono_chrome_ ? 1 : 0, 1);
  writer.WriteBits(chroma_subsampling_x_ ? 1 : 0, 1);
  writer.WriteBits(chroma_subsampling_y_ ? 1 : 0, 1);
  writer.WriteBits(chroma_sample_position_, 2);
  writer.WriteBits(0, 8);
  writer.Flush();
  DCHECK_EQ(4u, writer.BytePos());
}

// https://aomediacodec.github.io/av1-isobmff/#codecsparam
//   <sample entry 4CC>.<profile>.<level><tier>.<bitDepth>
std::string AV1CodecConfigurationRecord::GetCodecString() const {
  return absl::StrFormat("av01.%d.%02d%c.%02d", profile_, level_,
                         tier_ ? 'H' : 'M', bit_depth_);
}

}  // namespace media
}  // namespace avifmux
