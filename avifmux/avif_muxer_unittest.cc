// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/avif_muxer.h>

#include <cstring>
#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <avifmux/file.h>
#include <avifmux/file/file_closer.h>
#include <avifmux/file/file_test_util.h>
#include <avifmux/file/memory_file.h>
#include <avifmux/media/base/fourccs.h>
#include <avifmux/media/formats/mp4/avif_test_util.h>
#include <avifmux/status/status_test_util.h>

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Not;

namespace avifmux {

using media::mp4::AvifTestReader;

namespace {

const char kColorData[] = "av12356abc";
const char kAlphaData[] = "alpha";
const uint32_t kWidth = 10;
const uint32_t kHeight = 20;
const char kOutputFile[] = "memory://image.avif";

// Box sizes of a 10x20 8-bit still without alpha and with default color.
const uint32_t kStillFileTypeSize = 28;
const uint32_t kStillMetadataSize = 222;
const uint32_t kMediaDataHeaderSize = 8;

const uint16_t kColorItemId = 1;
const uint16_t kAlphaItemId = 2;

std::vector<uint8_t> Bytes(const char* str) {
  return std::vector<uint8_t>(str, str + strlen(str));
}

uint32_t ReadUInt32(const std::vector<uint8_t>& data, size_t pos) {
  return (static_cast<uint32_t>(data[pos]) << 24) | (data[pos + 1] << 16) |
         (data[pos + 2] << 8) | data[pos + 3];
}

FrameInfo Frame(uint64_t duration, bool sync, uint32_t size) {
  FrameInfo frame;
  frame.duration_in_timescales = duration;
  frame.sync = sync;
  frame.size = size;
  return frame;
}

}  // namespace

class AvifMuxerTest : public testing::Test {
 public:
  AvifMuxerTest()
      : color_(Bytes(kColorData)), alpha_(Bytes(kAlphaData)) {
    image_.color_data = color_.data();
    image_.color_data_size = color_.size();
    image_.width = kWidth;
    image_.height = kHeight;
    image_.depth_bits = 8;
  }

  void TearDown() override { MemoryFile::DeleteAll(); }

  void AddAlpha() {
    image_.alpha_data = alpha_.data();
    image_.alpha_data_size = alpha_.size();
  }

  // Mux |image_| and parse the result.
  void MuxAndParse(const AvifMuxerParams& params = AvifMuxerParams()) {
    AvifMuxer muxer(params);
    output_.clear();
    ASSERT_OK(muxer.WriteToVector(image_, &output_));
    reader_.reset(new AvifTestReader(output_));
    ASSERT_TRUE(reader_->Parse());
  }

  std::vector<uint8_t> ExtractItem(uint16_t item_id) {
    std::vector<uint8_t> data;
    EXPECT_TRUE(reader_->ExtractItem(item_id, &data));
    return data;
  }

 protected:
  std::vector<uint8_t> color_;
  std::vector<uint8_t> alpha_;
  AvifImageParams image_;
  std::vector<uint8_t> output_;
  std::unique_ptr<AvifTestReader> reader_;
};

TEST_F(AvifMuxerTest, StillImageRoundTrip) {
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  EXPECT_THAT(reader_->top_level_boxes(),
              ElementsAre(media::FOURCC_ftyp, media::FOURCC_meta,
                          media::FOURCC_mdat));
  EXPECT_EQ(media::FOURCC_avif, reader_->major_brand());
  EXPECT_THAT(reader_->compatible_brands(),
              ElementsAre(media::FOURCC_avif, media::FOURCC_mif1,
                          media::FOURCC_miaf));
  EXPECT_EQ(kColorItemId, reader_->primary_item_id());
  EXPECT_EQ(color_, ExtractItem(kColorItemId));
}

TEST_F(AvifMuxerTest, StillImagePayloadOffset) {
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  // The color data is the only payload and sits right after the mdat header.
  ASSERT_EQ(reader_->payload_offset() + color_.size(), output_.size());
  EXPECT_EQ(color_, std::vector<uint8_t>(
                        output_.begin() + reader_->payload_offset(),
                        output_.end()));
}

TEST_F(AvifMuxerTest, StillImageLayout) {
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  const uint32_t kPayloadOffset =
      kStillFileTypeSize + kStillMetadataSize + kMediaDataHeaderSize;
  ASSERT_EQ(258u, kPayloadOffset);
  EXPECT_EQ(kStillFileTypeSize, ReadUInt32(output_, 0));
  EXPECT_EQ(kStillMetadataSize, ReadUInt32(output_, kStillFileTypeSize));
  EXPECT_EQ(268u, output_.size());

  ASSERT_EQ(1u, reader_->item_extents().count(kColorItemId));
  const std::vector<AvifTestReader::Extent>& extents =
      reader_->item_extents().at(kColorItemId);
  ASSERT_EQ(1u, extents.size());
  EXPECT_EQ(kPayloadOffset, extents[0].offset);
  EXPECT_EQ(10u, extents[0].length);
}

TEST_F(AvifMuxerTest, StillImageProperties) {
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  EXPECT_THAT(reader_->property_types(),
              ElementsAre(media::FOURCC_ispe, media::FOURCC_pixi,
                          media::FOURCC_av1C));
  ASSERT_EQ(1u, reader_->associations().count(kColorItemId));
  const std::vector<AvifTestReader::Association>& associations =
      reader_->associations().at(kColorItemId);
  ASSERT_EQ(3u, associations.size());
  EXPECT_EQ(1u, associations[0].property_index);
  EXPECT_FALSE(associations[0].essential);
  EXPECT_EQ(3u, associations[2].property_index);
  EXPECT_TRUE(associations[2].essential);
  EXPECT_TRUE(reader_->item_references().empty());
}

TEST_F(AvifMuxerTest, AlphaRoundTrip) {
  AddAlpha();
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  EXPECT_EQ(color_, ExtractItem(kColorItemId));
  EXPECT_EQ(alpha_, ExtractItem(kAlphaItemId));
  EXPECT_TRUE(reader_->HasItemReference(media::FOURCC_auxl, kAlphaItemId,
                                        kColorItemId));
  EXPECT_FALSE(reader_->HasItemReference(media::FOURCC_prem, kColorItemId,
                                         kAlphaItemId));
}

TEST_F(AvifMuxerTest, AlphaIsStoredBeforeColor) {
  AddAlpha();
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  std::vector<uint8_t> expected_payload = alpha_;
  expected_payload.insert(expected_payload.end(), color_.begin(),
                          color_.end());
  EXPECT_EQ(expected_payload,
            std::vector<uint8_t>(output_.begin() + reader_->payload_offset(),
                                 output_.end()));
}

TEST_F(AvifMuxerTest, AlphaProperties) {
  AddAlpha();
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  EXPECT_THAT(reader_->property_types(),
              ElementsAre(media::FOURCC_ispe, media::FOURCC_pixi,
                          media::FOURCC_av1C, media::FOURCC_pixi,
                          media::FOURCC_av1C, media::FOURCC_auxC));
  ASSERT_EQ(1u, reader_->associations().count(kAlphaItemId));
  const std::vector<AvifTestReader::Association>& associations =
      reader_->associations().at(kAlphaItemId);
  ASSERT_EQ(4u, associations.size());
  // The spatial extents are shared with the color item.
  EXPECT_EQ(1u, associations[0].property_index);
  EXPECT_EQ(4u, associations[1].property_index);
  EXPECT_EQ(5u, associations[2].property_index);
  EXPECT_TRUE(associations[2].essential);
  EXPECT_EQ(6u, associations[3].property_index);
}

TEST_F(AvifMuxerTest, PremultipliedAlpha) {
  AddAlpha();
  AvifMuxerParams params;
  params.premultiplied_alpha = true;
  ASSERT_NO_FATAL_FAILURE(MuxAndParse(params));

  EXPECT_TRUE(reader_->HasItemReference(media::FOURCC_prem, kColorItemId,
                                        kAlphaItemId));
  EXPECT_TRUE(reader_->HasItemReference(media::FOURCC_auxl, kAlphaItemId,
                                        kColorItemId));
  EXPECT_EQ(color_, ExtractItem(kColorItemId));
  EXPECT_EQ(alpha_, ExtractItem(kAlphaItemId));
}

TEST_F(AvifMuxerTest, PremultipliedWithoutAlphaHasNoReferences) {
  AvifMuxerParams params;
  params.premultiplied_alpha = true;
  ASSERT_NO_FATAL_FAILURE(MuxAndParse(params));

  EXPECT_TRUE(reader_->item_references().empty());
}

TEST_F(AvifMuxerTest, DefaultColorHasNoColr) {
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());
  EXPECT_THAT(reader_->property_types(), Not(Contains(media::FOURCC_colr)));
}

TEST_F(AvifMuxerTest, NonDefaultColorAddsColr) {
  AvifMuxerParams params;
  params.color.matrix_coefficients = MatrixCoefficients::kBt709;
  ASSERT_NO_FATAL_FAILURE(MuxAndParse(params));

  EXPECT_THAT(reader_->property_types(),
              ElementsAre(media::FOURCC_ispe, media::FOURCC_pixi,
                          media::FOURCC_av1C, media::FOURCC_colr));
  EXPECT_EQ(4u, reader_->associations().at(kColorItemId).size());
  EXPECT_EQ(color_, ExtractItem(kColorItemId));
}

TEST_F(AvifMuxerTest, LimitedRangeAddsColr) {
  AvifMuxerParams params;
  params.color.full_range = false;
  ASSERT_NO_FATAL_FAILURE(MuxAndParse(params));

  EXPECT_THAT(reader_->property_types(), Contains(media::FOURCC_colr));
}

TEST_F(AvifMuxerTest, WriteToFile) {
  AvifMuxer muxer;
  std::unique_ptr<File, FileCloser> file(File::Open(kOutputFile, "w"));
  ASSERT_TRUE(file);
  ASSERT_OK(muxer.Write(image_, file.get()));
  file.reset();

  std::vector<uint8_t> expected;
  ASSERT_OK(muxer.WriteToVector(image_, &expected));
  ASSERT_FILE_STREQ(kOutputFile,
                    std::string(expected.begin(), expected.end()));
}

TEST_F(AvifMuxerTest, WriteFailure) {
  AvifMuxer muxer;
  std::unique_ptr<File, FileCloser> file(new FailingFile("failing"));
  Status status = muxer.Write(image_, file.get());
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
}

TEST_F(AvifMuxerTest, Sequence) {
  image_.timescale = 30;
  image_.color_frames = std::vector<FrameInfo>{
      Frame(1, true, 4), Frame(1, false, 3), Frame(2, false, 3)};
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  EXPECT_THAT(reader_->top_level_boxes(),
              ElementsAre(media::FOURCC_ftyp, media::FOURCC_meta,
                          media::FOURCC_moov, media::FOURCC_mdat));
  EXPECT_EQ(media::FOURCC_avis, reader_->major_brand());
  EXPECT_THAT(reader_->compatible_brands(),
              ElementsAre(media::FOURCC_avif, media::FOURCC_avis,
                          media::FOURCC_mif1, media::FOURCC_miaf));

  ASSERT_EQ(1u, reader_->tracks().size());
  const AvifTestReader::TrackInfo& track = reader_->tracks()[0];
  EXPECT_EQ(1u, track.track_id);
  EXPECT_EQ(media::FOURCC_pict, track.handler_type);
  EXPECT_THAT(track.chunk_offsets,
              ElementsAre(static_cast<uint32_t>(reader_->payload_offset())));
  EXPECT_THAT(track.sample_sizes, ElementsAre(4u, 3u, 3u));
  EXPECT_TRUE(track.has_sync_sample);
  EXPECT_THAT(track.sync_samples, ElementsAre(1u));
  // The sample entry describes the default color, the item does not.
  EXPECT_TRUE(track.has_colr);
  EXPECT_THAT(reader_->property_types(), Not(Contains(media::FOURCC_colr)));
  EXPECT_EQ(color_, ExtractItem(kColorItemId));
}

TEST_F(AvifMuxerTest, SequenceOfSyncFramesHasNoSyncSampleTable) {
  image_.timescale = 30;
  image_.color_frames =
      std::vector<FrameInfo>{Frame(1, true, 5), Frame(1, true, 5)};
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  ASSERT_EQ(1u, reader_->tracks().size());
  EXPECT_FALSE(reader_->tracks()[0].has_sync_sample);
}

TEST_F(AvifMuxerTest, SequenceWithAlphaTrack) {
  AddAlpha();
  image_.timescale = 30;
  image_.color_frames =
      std::vector<FrameInfo>{Frame(1, true, 6), Frame(1, true, 4)};
  image_.alpha_frames =
      std::vector<FrameInfo>{Frame(1, true, 3), Frame(1, true, 2)};
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  ASSERT_EQ(2u, reader_->tracks().size());
  const AvifTestReader::TrackInfo& color_track = reader_->tracks()[0];
  const AvifTestReader::TrackInfo& alpha_track = reader_->tracks()[1];
  EXPECT_EQ(media::FOURCC_pict, color_track.handler_type);
  EXPECT_EQ(media::FOURCC_auxv, alpha_track.handler_type);
  EXPECT_EQ(2u, alpha_track.track_id);
  EXPECT_THAT(alpha_track.references, ElementsAre(media::FOURCC_auxl));
  EXPECT_TRUE(alpha_track.has_auxi);
  EXPECT_FALSE(color_track.has_auxi);
  EXPECT_TRUE(color_track.has_colr);
  EXPECT_FALSE(alpha_track.has_colr);

  // The alpha chunk follows the color frames.
  ASSERT_EQ(1u, color_track.chunk_offsets.size());
  ASSERT_EQ(1u, alpha_track.chunk_offsets.size());
  EXPECT_EQ(reader_->payload_offset(), color_track.chunk_offsets[0]);
  EXPECT_EQ(color_track.chunk_offsets[0] + 6 + 4,
            alpha_track.chunk_offsets[0]);

  // Items and tracks agree on where the data is.
  EXPECT_EQ(color_, ExtractItem(kColorItemId));
  EXPECT_EQ(alpha_, ExtractItem(kAlphaItemId));
  EXPECT_EQ(alpha_,
            std::vector<uint8_t>(
                output_.begin() + alpha_track.chunk_offsets[0],
                output_.begin() + alpha_track.chunk_offsets[0] + alpha_.size()));
}

TEST_F(AvifMuxerTest, SequenceWithAlphaItemOnly) {
  AddAlpha();
  image_.timescale = 30;
  image_.color_frames =
      std::vector<FrameInfo>{Frame(1, true, 6), Frame(1, true, 4)};
  ASSERT_NO_FATAL_FAILURE(MuxAndParse());

  // Without alpha frames the alpha image is an item but not a track.
  ASSERT_EQ(1u, reader_->tracks().size());
  EXPECT_EQ(media::FOURCC_pict, reader_->tracks()[0].handler_type);
  EXPECT_TRUE(reader_->HasItemReference(media::FOURCC_auxl, kAlphaItemId,
                                        kColorItemId));

  EXPECT_EQ(color_, ExtractItem(kColorItemId));
  EXPECT_EQ(alpha_, ExtractItem(kAlphaItemId));
  const std::vector<AvifTestReader::Extent>& alpha_extents =
      reader_->item_extents().at(kAlphaItemId);
  ASSERT_EQ(1u, alpha_extents.size());
  EXPECT_EQ(reader_->payload_offset() + color_.size(),
            alpha_extents[0].offset);
  EXPECT_EQ(output_.size(), alpha_extents[0].offset + alpha_.size());
}

TEST_F(AvifMuxerTest, SequenceColrInSampleEntry) {
  image_.timescale = 30;
  image_.color_frames = std::vector<FrameInfo>{Frame(1, true, 10)};
  AvifMuxerParams params;
  params.color.color_primaries = ColorPrimaries::kBt2020;
  params.color.transfer_characteristics = TransferCharacteristics::kSmpte2084;
  params.color.matrix_coefficients = MatrixCoefficients::kBt2020Ncl;
  ASSERT_NO_FATAL_FAILURE(MuxAndParse(params));

  ASSERT_EQ(1u, reader_->tracks().size());
  EXPECT_TRUE(reader_->tracks()[0].has_colr);
  EXPECT_THAT(reader_->property_types(), Contains(media::FOURCC_colr));
}

}  // namespace avifmux
