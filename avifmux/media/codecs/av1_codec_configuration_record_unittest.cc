// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/codecs/av1_codec_configuration_record.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::ElementsAreArray;

namespace avifmux {
namespace media {

TEST(AV1CodecConfigurationRecordTest, Color444EightBit) {
  AV1CodecConfigurationRecord record;
  record.set_profile(1);
  record.set_level(31);

  std::vector<uint8_t> data;
  record.WriteToVector(&data);
  EXPECT_THAT(data, ElementsAreArray({0x81, 0x3f, 0x00, 0x00}));
  EXPECT_EQ("av01.1.31M.08", record.GetCodecString());
}

TEST(AV1CodecConfigurationRecordTest, MonochromeAlphaTenBit) {
  AV1CodecConfigurationRecord record;
  record.set_profile(0);
  record.set_level(31);
  record.set_bit_depth(10);
  record.set_mono_chrome(true);
  record.set_chroma_subsampling_x(true);
  record.set_chroma_subsampling_y(true);

  std::vector<uint8_t> data;
  record.WriteToVector(&data);
  // high_bitdepth | monochrome | subsampling_x | subsampling_y.
  EXPECT_THAT(data, ElementsAreArray({0x81, 0x1f, 0x5c, 0x00}));
  EXPECT_EQ("av01.0.31M.10", record.GetCodecString());
}

TEST(AV1CodecConfigurationRecordTest, TwelveBitHighTier) {
  AV1CodecConfigurationRecord record;
  record.set_profile(2);
  record.set_level(8);
  record.set_tier(1);
  record.set_bit_depth(12);
  record.set_chroma_sample_position(2);

  std::vector<uint8_t> data = {0xde, 0xad};
  record.WriteToVector(&data);
  EXPECT_THAT(data, ElementsAreArray({0x81, 0x48, 0xe2, 0x00}));
  EXPECT_EQ("av01.2.08H.12", record.GetCodecString());
}

}  // namespace media
}  // namespace avifmux
