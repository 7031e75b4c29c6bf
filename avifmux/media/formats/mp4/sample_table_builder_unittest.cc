// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/formats/mp4/sample_table_builder.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <avifmux/media/formats/mp4/box_definitions.h>

using ::testing::ElementsAre;

namespace avifmux {
namespace media {
namespace mp4 {

namespace {

FrameInfo Frame(uint64_t duration, bool sync, uint32_t size) {
  FrameInfo frame;
  frame.duration_in_timescales = duration;
  frame.sync = sync;
  frame.size = size;
  return frame;
}

MATCHER_P2(DecodingTimeEq, sample_count, sample_delta, "") {
  return arg.sample_count == static_cast<uint32_t>(sample_count) &&
         arg.sample_delta == static_cast<uint32_t>(sample_delta);
}

}  // namespace

class SampleTableBuilderTest : public testing::Test {
 public:
  SampleTableBuilderTest() : builder_(&stbl_) {}

  const std::vector<DecodingTime>& decoding_time() const {
    return stbl_.decoding_time_to_sample.decoding_time;
  }

 protected:
  SampleTable stbl_;
  SampleTableBuilder builder_;
};

TEST_F(SampleTableBuilderTest, MergesEqualDurations) {
  builder_.AddFrames({Frame(1, true, 10), Frame(1, true, 11),
                      Frame(1, true, 12), Frame(2, true, 13),
                      Frame(2, true, 14)});
  builder_.Finalize();

  EXPECT_THAT(decoding_time(),
              ElementsAre(DecodingTimeEq(3, 1), DecodingTimeEq(2, 2)));
  EXPECT_EQ(7u, builder_.duration());
}

TEST_F(SampleTableBuilderTest, SingleFrame) {
  builder_.AddFrame(Frame(5, true, 100));
  builder_.Finalize();

  EXPECT_THAT(decoding_time(), ElementsAre(DecodingTimeEq(1, 5)));
  ASSERT_EQ(1u, stbl_.sample_to_chunk.chunk_info.size());
  EXPECT_EQ(1u, stbl_.sample_to_chunk.chunk_info[0].first_chunk);
  EXPECT_EQ(1u, stbl_.sample_to_chunk.chunk_info[0].samples_per_chunk);
  EXPECT_EQ(1u, stbl_.sample_to_chunk.chunk_info[0].sample_description_index);
}

TEST_F(SampleTableBuilderTest, DurationChangingBack) {
  builder_.AddFrames(
      {Frame(3, true, 1), Frame(4, true, 1), Frame(3, true, 1)});
  builder_.Finalize();

  EXPECT_THAT(decoding_time(),
              ElementsAre(DecodingTimeEq(1, 3), DecodingTimeEq(1, 4),
                          DecodingTimeEq(1, 3)));
}

TEST_F(SampleTableBuilderTest, NoFrames) {
  builder_.Finalize();

  EXPECT_TRUE(decoding_time().empty());
  EXPECT_TRUE(stbl_.sample_to_chunk.chunk_info.empty());
  EXPECT_EQ(0u, stbl_.sample_size.sample_count);
  EXPECT_TRUE(stbl_.sample_size.sizes.empty());
  EXPECT_FALSE(stbl_.sync_sample.has_value());
  EXPECT_EQ(0u, builder_.duration());
  EXPECT_EQ(0u, builder_.data_size());
}

TEST_F(SampleTableBuilderTest, SyncSampleOmittedWhenAllFramesAreSync) {
  builder_.AddFrames({Frame(1, true, 1), Frame(1, true, 1)});
  builder_.Finalize();

  EXPECT_FALSE(stbl_.sync_sample.has_value());
}

TEST_F(SampleTableBuilderTest, SyncSampleListsOneBasedIndices) {
  builder_.AddFrames({Frame(1, true, 1), Frame(1, false, 1),
                      Frame(1, false, 1), Frame(1, true, 1),
                      Frame(1, false, 1)});
  builder_.Finalize();

  ASSERT_TRUE(stbl_.sync_sample.has_value());
  EXPECT_THAT(stbl_.sync_sample->sample_number, ElementsAre(1u, 4u));
}

TEST_F(SampleTableBuilderTest, EmptySyncSampleWhenNoFrameIsSync) {
  builder_.AddFrames({Frame(1, false, 1), Frame(1, false, 1)});
  builder_.Finalize();

  ASSERT_TRUE(stbl_.sync_sample.has_value());
  EXPECT_TRUE(stbl_.sync_sample->sample_number.empty());
  // The empty stss box is still written.
  EXPECT_EQ(16u, stbl_.sync_sample->ComputeSize());
}

TEST_F(SampleTableBuilderTest, SampleSizes) {
  builder_.AddFrames(
      {Frame(1, true, 100), Frame(1, false, 20), Frame(1, false, 30)});
  builder_.Finalize();

  EXPECT_EQ(0u, stbl_.sample_size.sample_size);
  EXPECT_EQ(3u, stbl_.sample_size.sample_count);
  EXPECT_THAT(stbl_.sample_size.sizes, ElementsAre(100u, 20u, 30u));
  ASSERT_EQ(1u, stbl_.sample_to_chunk.chunk_info.size());
  EXPECT_EQ(3u, stbl_.sample_to_chunk.chunk_info[0].samples_per_chunk);
  EXPECT_EQ(150u, builder_.data_size());
  EXPECT_EQ(3u, builder_.sample_count());
}

}  // namespace mp4
}  // namespace media
}  // namespace avifmux
