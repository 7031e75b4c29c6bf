// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_CODECS_AV1_CODEC_CONFIGURATION_RECORD_H_
#define AVIFMUX_MEDIA_CODECS_AV1_CODEC_CONFIGURATION_RECORD_H_

#include <cstdint>
#include <string>
#include <vector>

namespace avifmux {
namespace media {

/// Class for building the AV1 codec configuration record carried in `av1C`.
class AV1CodecConfigurationRecord {
 public:
  AV1CodecConfigurationRecord();
  ~AV1CodecConfigurationRecord();

  /// Serializes the record (without configOBUs) into @a data, replacing its
  /// contents. The result is always four bytes.
  void WriteToVector(std::vector<uint8_t>* data) const;

  /// @return The codec string, e.g. "av01.1.31M.08".
  std::string GetCodecString() const;

  void set_profile(uint8_t profile) { profile_ = profile; }
  void set_level(uint8_t level) { level_ = level; }
  void set_tier(uint8_t tier) { tier_ = tier; }
  /// @param bit_depth is 8, 10 or 12.
  void set_bit_depth(uint8_t bit_depth) { bit_depth_ = bit_depth; }
  void set_mono_chrome(bool mono_chrome) { mono_chrome_ = mono_chrome; }
  void set_chroma_subsampling_x(bool subsampling) {
    chroma_subsampling_x_ = subsampling;
  }
  void set_chroma_subsampling_y(bool subsampling) {
    chroma_subsampling_y_ = subsampling;
  }
  void set_chroma_sample_position(uint8_t position) {
    chroma_sample_position_ = position;
  }

 private:
  uint8_t profile_ = 0;
  uint8_t level_ = 0;
  uint8_t tier_ = 0;
  uint8_t bit_depth_ = 8;
  bool mono_chrome_ = false;
  bool chroma_subsampling_x_ = false;
  bool chroma_subsampling_y_ = false;
  uint8_t chroma_sample_position_ = 0;

  // Not using DISALLOW_COPY_AND_ASSIGN here intentionally to allow the compiler
  // generated copy constructor and assignment operator.
};

}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_CODECS_AV1_CODEC_CONFIGURATION_RECORD_H_
