// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/base/bit_writer.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::ElementsAreArray;

namespace avifmux {
namespace media {

TEST(BitWriterTest, SingleBit) {
  std::vector<uint8_t> storage;
  BitWriter writer(&storage);
  writer.WriteBits(1, 1);
  EXPECT_EQ(0u, writer.BytePos());
  writer.Flush();
  EXPECT_EQ(1u, writer.BytePos());

  EXPECT_THAT(storage, ElementsAreArray({0x80}));
}

TEST(BitWriterTest, PacksFieldsAcrossBytes) {
  std::vector<uint8_t> storage;
  BitWriter writer(&storage);
  writer.WriteBits(1, 1);     // marker
  writer.WriteBits(1, 7);     // version
  writer.WriteBits(2, 3);     // profile
  writer.WriteBits(31, 5);    // level
  writer.WriteBits(0x3, 2);
  EXPECT_EQ(2u, writer.BytePos());
  writer.Flush();

  EXPECT_THAT(storage, ElementsAreArray({0x81, 0x5f, 0xc0}));
}

TEST(BitWriterTest, AppendsAfterExistingData) {
  std::vector<uint8_t> storage = {0xaa};
  BitWriter writer(&storage);
  writer.WriteBits(0x55995599, 32);
  EXPECT_EQ(4u, writer.BytePos());
  writer.Flush();
  EXPECT_THAT(storage, ElementsAreArray({0xaa, 0x55, 0x99, 0x55, 0x99}));
}

}  // namespace media
}  // namespace avifmux
