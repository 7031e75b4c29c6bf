// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/formats/mp4/avif_file.h>

#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <avifmux/file.h>
#include <avifmux/file/file_closer.h>
#include <avifmux/file/file_test_util.h>
#include <avifmux/file/memory_file.h>
#include <avifmux/media/formats/mp4/avif_test_util.h>
#include <avifmux/media/formats/mp4/sample_table_builder.h>
#include <avifmux/status/status_test_util.h>

using ::testing::ElementsAre;

namespace avifmux {
namespace media {
namespace mp4 {

namespace {
const uint8_t kColorData[] = {'c', 'o', 'l', 'o', 'r', 'd', 'a', 't', 'a', '!'};
const uint8_t kAlphaData[] = {'a', 'l', 'p', 'h', 'a'};
const uint32_t kMediaDataHeaderSize = 8;
const char kOutputFile[] = "memory://output.avif";
}  // namespace

class AvifFileTest : public testing::Test {
 public:
  void TearDown() override { MemoryFile::DeleteAll(); }

  // A still image with alpha first in mdat.
  void BuildStill() {
    file_.ftyp().major_brand = FOURCC_avif;
    file_.ftyp().compatible_brands = {FOURCC_avif, FOURCC_mif1, FOURCC_miaf};

    Metadata& meta = file_.meta();
    meta.handler.handler_type = FOURCC_pict;
    meta.primary_item.item_id = 1;
    AddItem(1, sizeof(kAlphaData), sizeof(kColorData));
    AddItem(2, 0, sizeof(kAlphaData));

    ImageSpatialExtents ispe;
    ispe.width = 10;
    ispe.height = 20;
    const uint8_t ispe_index = meta.properties.container.AddProperty(ispe);
    meta.properties.association.entries.resize(2);
    meta.properties.association.entries[0].item_id = 1;
    meta.properties.association.entries[0].associations.push_back(
        {ispe_index, false});
    meta.properties.association.entries[1].item_id = 2;
    meta.properties.association.entries[1].associations.push_back(
        {ispe_index, false});

    file_.AddDataChunk(kAlphaData, sizeof(kAlphaData));
    file_.AddDataChunk(kColorData, sizeof(kColorData));
  }

  // Adds one track per frame size list to the movie box.
  void BuildMovie(const std::vector<std::vector<uint32_t>>& track_sizes) {
    Movie& moov = file_.moov().emplace();
    for (const std::vector<uint32_t>& sizes : track_sizes) {
      moov.tracks.emplace_back();
      Track& track = moov.tracks.back();
      track.header.track_id = static_cast<uint32_t>(moov.tracks.size());
      SampleTable& stbl = track.media.information.sample_table;
      stbl.chunk_offset.offsets.resize(1);
      SampleTableBuilder builder(&stbl);
      for (uint32_t size : sizes) {
        FrameInfo frame;
        frame.duration_in_timescales = 1;
        frame.sync = true;
        frame.size = size;
        builder.AddFrame(frame);
      }
      builder.Finalize();
    }
  }

  std::vector<uint32_t> ChunkOffsets() {
    std::vector<uint32_t> offsets;
    for (const Track& track : file_.moov()->tracks) {
      const ChunkOffset& stco =
          track.media.information.sample_table.chunk_offset;
      offsets.insert(offsets.end(), stco.offsets.begin(), stco.offsets.end());
    }
    return offsets;
  }

 protected:
  AvifFile file_;

 private:
  void AddItem(uint16_t item_id, uint32_t offset, uint32_t length) {
    Metadata& meta = file_.meta();
    ItemLocationEntry location;
    location.item_id = item_id;
    location.extents.resize(1);
    location.extents[0].offset = offset;
    location.extents[0].length = length;
    meta.item_location.items.push_back(location);

    ItemInfoEntry info;
    info.item_id = item_id;
    info.item_type = FOURCC_av01;
    meta.item_info.entries.push_back(info);
  }
};

TEST_F(AvifFileTest, PayloadOffsetFollowsHeaders) {
  BuildStill();
  ASSERT_OK(file_.FinalizeLayout());

  EXPECT_EQ(file_.ftyp().box_size() + file_.meta().box_size() +
                kMediaDataHeaderSize,
            file_.payload_offset());
  EXPECT_EQ(sizeof(kAlphaData) + sizeof(kColorData), file_.payload_size());
}

TEST_F(AvifFileTest, ExtentsBecomeAbsolute) {
  BuildStill();
  ASSERT_OK(file_.FinalizeLayout());

  const std::vector<ItemLocationEntry>& items =
      file_.meta().item_location.items;
  ASSERT_EQ(2u, items.size());
  EXPECT_TRUE(items[0].extents[0].resolved);
  EXPECT_EQ(file_.payload_offset() + sizeof(kAlphaData),
            items[0].extents[0].offset);
  EXPECT_EQ(file_.payload_offset(), items[1].extents[0].offset);
}

TEST_F(AvifFileTest, MovieCountsTowardsPayloadOffset) {
  BuildStill();
  BuildMovie({{4, 6}});
  ASSERT_OK(file_.FinalizeLayout());

  EXPECT_EQ(file_.ftyp().box_size() + file_.meta().box_size() +
                file_.moov()->box_size() + kMediaDataHeaderSize,
            file_.payload_offset());
}

TEST_F(AvifFileTest, TrackChunkOffsetsAccumulate) {
  BuildStill();
  BuildMovie({{4, 6}, {2, 3}});
  ASSERT_OK(file_.FinalizeLayout());

  const uint32_t base = file_.payload_offset();
  EXPECT_THAT(ChunkOffsets(), ElementsAre(base, base + 4 + 6));
}

TEST_F(AvifFileTest, WriteToVectorRoundTrip) {
  BuildStill();
  ASSERT_OK(file_.FinalizeLayout());

  std::vector<uint8_t> output;
  file_.WriteToVector(&output);
  ASSERT_EQ(file_.payload_offset() + file_.payload_size(), output.size());

  AvifTestReader reader(output);
  ASSERT_TRUE(reader.Parse());
  EXPECT_THAT(reader.top_level_boxes(),
              ElementsAre(FOURCC_ftyp, FOURCC_meta, FOURCC_mdat));
  EXPECT_EQ(file_.payload_offset(), reader.payload_offset());

  std::vector<uint8_t> color;
  ASSERT_TRUE(reader.ExtractItem(1, &color));
  EXPECT_THAT(color, testing::ElementsAreArray(kColorData));
  std::vector<uint8_t> alpha;
  ASSERT_TRUE(reader.ExtractItem(2, &alpha));
  EXPECT_THAT(alpha, testing::ElementsAreArray(kAlphaData));
}

TEST_F(AvifFileTest, WriteToVectorAppends) {
  BuildStill();
  ASSERT_OK(file_.FinalizeLayout());

  std::vector<uint8_t> output = {1, 2, 3};
  file_.WriteToVector(&output);
  ASSERT_EQ(3 + file_.payload_offset() + file_.payload_size(), output.size());
  EXPECT_EQ(1u, output[0]);
}

TEST_F(AvifFileTest, WriteToFileMatchesWriteToVector) {
  BuildStill();
  ASSERT_OK(file_.FinalizeLayout());

  std::unique_ptr<File, FileCloser> output(File::Open(kOutputFile, "w"));
  ASSERT_TRUE(output);
  ASSERT_OK(file_.Write(output.get()));
  output.reset();

  std::vector<uint8_t> expected;
  file_.WriteToVector(&expected);
  ASSERT_FILE_STREQ(kOutputFile,
                    std::string(expected.begin(), expected.end()));
}

TEST_F(AvifFileTest, HeaderWriteFailure) {
  BuildStill();
  ASSERT_OK(file_.FinalizeLayout());

  std::unique_ptr<File, FileCloser> output(new FailingFile("failing"));
  Status status = file_.Write(output.get());
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
}

TEST_F(AvifFileTest, PayloadWriteFailure) {
  BuildStill();
  ASSERT_OK(file_.FinalizeLayout());

  // Accepts the headers and the alpha chunk only.
  std::unique_ptr<File, FileCloser> output(
      new FailingFile("failing", file_.payload_offset() + sizeof(kAlphaData)));
  Status status = file_.Write(output.get());
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
}

TEST_F(AvifFileTest, FileTooLarge) {
  BuildStill();
  // The data is never read since the layout is rejected.
  file_.AddDataChunk(kColorData, 0xFFFFFFF0u);
  Status status = file_.FinalizeLayout();
  EXPECT_EQ(error::MUXER_FAILURE, status.error_code());
}

TEST_F(AvifFileTest, WriteBeforeFinalizeLayoutDies) {
  BuildStill();
  std::vector<uint8_t> output;
  EXPECT_DEATH(file_.WriteToVector(&output), "has not been resolved");
}

}  // namespace mp4
}  // namespace media
}  // namespace avifmux
