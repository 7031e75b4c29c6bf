// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/formats/mp4/box_definitions.h>

#include <limits>
#include <memory>

#include <absl/log/log.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <avifmux/media/base/buffer_reader.h>
#include <avifmux/media/base/buffer_writer.h>

using ::testing::ElementsAreArray;

namespace avifmux {
namespace media {
namespace mp4 {
namespace {
const uint8_t kData4[] = {0x81, 0x3f, 0x00, 0x00};
const uint8_t kData8[] = {1, 8, 42, 98, 156};
const uint16_t kData16[] = {1, 2, 5};
const uint32_t kData32[] = {1, 24, 99, 1234, 9000000};
const char kAlphaUrn[] = "urn:mpeg:mpegB:cicp:systems:auxiliary:alpha";

std::vector<uint8_t> FourCCBytes(const char* fourcc) {
  return std::vector<uint8_t>(fourcc, fourcc + 4);
}
}  // namespace

template <typename T>
class BoxDefinitionsTestGeneral : public testing::Test {
 public:
  BoxDefinitionsTestGeneral() : buffer_(new BufferWriter) {}

  // Reads back the generic box header and checks it against |box|.
  void VerifyHeader(Box* box) {
    BufferReader reader(buffer_->Buffer(), buffer_->Size());
    uint32_t size = 0;
    uint32_t type = 0;
    ASSERT_TRUE(reader.Read4(&size));
    ASSERT_TRUE(reader.Read4(&type));
    EXPECT_EQ(buffer_->Size(), size);
    EXPECT_EQ(box->BoxType(), static_cast<FourCC>(type));
  }

  // Fill the box with sample data.
  void Fill(Box* box) {}

  // Modify the box with another set of data.
  void Modify(Box* box) {}

  // Is this box optional?
  bool IsOptional(const Box* box) { return false; }

  // Only the boxes whose version depends on their field values override
  // this.
  uint8_t GetAndClearVersion(Box* box) { return 0; }

  uint8_t GetAndClearVersion(MovieHeader* mvhd) { return ClearVersion(mvhd); }
  uint8_t GetAndClearVersion(TrackHeader* tkhd) { return ClearVersion(tkhd); }
  uint8_t GetAndClearVersion(MediaHeader* mdhd) { return ClearVersion(mdhd); }

  void Fill(FileType* ftyp) {
    ftyp->major_brand = FOURCC_avif;
    ftyp->compatible_brands.push_back(FOURCC_avif);
    ftyp->compatible_brands.push_back(FOURCC_mif1);
    ftyp->compatible_brands.push_back(FOURCC_miaf);
  }

  void Modify(FileType* ftyp) {
    ftyp->major_brand = FOURCC_avis;
    ftyp->compatible_brands.push_back(FOURCC_avis);
  }

  void Fill(HandlerReference* hdlr) {
    hdlr->handler_type = FOURCC_pict;
    hdlr->name = "avifmux";
  }

  void Modify(HandlerReference* hdlr) {
    hdlr->handler_type = FOURCC_auxv;
    hdlr->name.clear();
  }

  void Fill(PrimaryItem* pitm) { pitm->item_id = 1; }

  void Fill(ItemLocation* iloc) {
    iloc->items.resize(2);
    iloc->items[0].item_id = 1;
    iloc->items[0].extents.resize(1);
    iloc->items[0].extents[0].length = 10;
    iloc->items[0].extents[0].Resolve(200);
    iloc->items[1].item_id = 2;
    iloc->items[1].extents.resize(2);
    for (ItemExtent& extent : iloc->items[1].extents) {
      extent.length = 5;
      extent.Resolve(300);
    }
  }

  void Modify(ItemLocation* iloc) { iloc->items.pop_back(); }

  void Fill(ItemInfoEntry* infe) {
    infe->item_id = 2;
    infe->item_type = FOURCC_av01;
    infe->item_name = "Alpha";
  }

  void Modify(ItemInfoEntry* infe) { infe->item_name = "Color"; }

  void Fill(ItemInfo* iinf) {
    iinf->entries.resize(2);
    Fill(&iinf->entries[0]);
    Fill(&iinf->entries[1]);
    iinf->entries[0].item_id = 1;
  }

  void Modify(ItemInfo* iinf) { iinf->entries.pop_back(); }

  void Fill(SingleItemTypeReference* reference) {
    reference->reference_type = FOURCC_auxl;
    reference->from_item_id = 2;
    reference->to_item_ids.push_back(1);
  }

  void Modify(SingleItemTypeReference* reference) {
    reference->reference_type = FOURCC_prem;
    reference->from_item_id = 1;
    reference->to_item_ids.assign(std::begin(kData16), std::end(kData16));
  }

  void Fill(ItemReference* iref) {
    iref->references.resize(1);
    Fill(&iref->references[0]);
  }

  void Modify(ItemReference* iref) {
    iref->references.resize(2);
    Modify(&iref->references[1]);
  }

  void Fill(ImageSpatialExtents* ispe) {
    ispe->width = 10;
    ispe->height = 20;
  }

  void Fill(PixelInformation* pixi) {
    pixi->bits_per_channel.assign(3, 8);
  }

  void Modify(PixelInformation* pixi) {
    pixi->bits_per_channel.assign(1, 10);
  }

  void Fill(CodecConfiguration* codec_configuration) {
    codec_configuration->box_type = FOURCC_av1C;
    codec_configuration->data.assign(std::begin(kData4), std::end(kData4));
  }

  void Modify(CodecConfiguration* codec_configuration) {
    codec_configuration->data.assign(std::begin(kData8), std::end(kData8));
  }

  void Fill(AuxiliaryTypeProperty* auxc) { auxc->aux_type = kAlphaUrn; }

  void Fill(ColorParameters* colr) {
    colr->color_parameter_type = FOURCC_nclx;
    colr->color_primaries = 9;
    colr->transfer_characteristics = 16;
    colr->matrix_coefficients = 9;
    colr->video_full_range_flag = 0;
  }

  void Modify(ColorParameters* colr) { colr->video_full_range_flag = 1; }

  void Fill(ItemPropertyContainer* ipco) {
    ImageSpatialExtents ispe;
    Fill(&ispe);
    ipco->AddProperty(ispe);
    PixelInformation pixi;
    Fill(&pixi);
    ipco->AddProperty(pixi);
    CodecConfiguration av1c;
    Fill(&av1c);
    ipco->AddProperty(av1c);
  }

  void Modify(ItemPropertyContainer* ipco) {
    AuxiliaryTypeProperty auxc;
    Fill(&auxc);
    ipco->AddProperty(auxc);
    ColorParameters colr;
    Fill(&colr);
    ipco->AddProperty(colr);
  }

  void Fill(ItemPropertyAssociation* ipma) {
    ipma->entries.resize(1);
    ipma->entries[0].item_id = 1;
    ipma->entries[0].associations.push_back({1, false});
    ipma->entries[0].associations.push_back({2, false});
    ipma->entries[0].associations.push_back({3, true});
  }

  void Modify(ItemPropertyAssociation* ipma) {
    ipma->entries.resize(2);
    ipma->entries[1].item_id = 2;
    ipma->entries[1].associations.push_back({4, true});
  }

  void Fill(ItemProperties* iprp) {
    Fill(&iprp->container);
    Fill(&iprp->association);
  }

  void Modify(ItemProperties* iprp) {
    Modify(&iprp->container);
    Modify(&iprp->association);
  }

  void Fill(Metadata* meta) {
    Fill(&meta->handler);
    Fill(&meta->primary_item);
    Fill(&meta->item_location);
    Fill(&meta->item_info);
    Fill(&meta->properties);
  }

  void Modify(Metadata* meta) { Fill(&meta->item_reference); }

  void Fill(MovieHeader* mvhd) {
    mvhd->creation_time = 1234;
    mvhd->modification_time = 2345;
    mvhd->timescale = 90000;
    mvhd->duration = 123456789012LL;
    mvhd->next_track_id = 3;
    mvhd->version = 1;
  }

  void Modify(MovieHeader* mvhd) {
    mvhd->duration = 2345;
    mvhd->version = 0;
  }

  void Fill(TrackHeader* tkhd) {
    tkhd->track_id = 1;
    tkhd->duration = std::numeric_limits<uint64_t>::max();
    tkhd->width = 10 << 16;
    tkhd->height = 20 << 16;
    tkhd->version = 1;
  }

  void Modify(TrackHeader* tkhd) {
    tkhd->duration = 100;
    tkhd->version = 0;
  }

  void Fill(TrackReferenceType* reference) {
    reference->reference_type = FOURCC_auxl;
    reference->track_ids.push_back(1);
  }

  void Modify(TrackReferenceType* reference) {
    reference->track_ids.push_back(2);
  }

  void Fill(TrackReference* tref) {
    tref->references.resize(1);
    Fill(&tref->references[0]);
  }

  void Modify(TrackReference* tref) { Modify(&tref->references[0]); }

  void Modify(CodecConfigurationConstraints* ccst) {
    ccst->all_ref_pics_intra = true;
    ccst->max_ref_per_pic = 1;
  }

  void Fill(AuxiliaryTypeInfo* auxi) { auxi->aux_track_type = kAlphaUrn; }

  void Fill(VideoSampleEntry* entry) {
    entry->format = FOURCC_av01;
    entry->width = 10;
    entry->height = 20;
    Fill(&entry->codec_configuration);
  }

  void Modify(VideoSampleEntry* entry) {
    Fill(&entry->colr);
    Fill(&entry->auxi);
  }

  void Fill(SampleDescription* stsd) {
    stsd->video_entries.resize(1);
    Fill(&stsd->video_entries[0]);
  }

  void Modify(SampleDescription* stsd) { Modify(&stsd->video_entries[0]); }

  void Fill(DecodingTimeToSample* stts) {
    stts->decoding_time.push_back({3, 1});
    stts->decoding_time.push_back({2, 2});
  }

  void Modify(DecodingTimeToSample* stts) { stts->decoding_time.pop_back(); }

  void Fill(SampleToChunk* stsc) { stsc->chunk_info.push_back({1, 5, 1}); }

  void Fill(SampleSize* stsz) {
    stsz->sizes.assign(std::begin(kData32), std::end(kData32));
    stsz->sample_count = static_cast<uint32_t>(stsz->sizes.size());
  }

  void Modify(SampleSize* stsz) {
    stsz->sample_size = 100;
    stsz->sizes.clear();
  }

  void Fill(ChunkOffset* stco) { stco->offsets.push_back(400); }

  void Modify(ChunkOffset* stco) { stco->offsets.push_back(4000); }

  void Fill(SyncSample* stss) {
    stss->sample_number.push_back(1);
    stss->sample_number.push_back(4);
  }

  void Modify(SyncSample* stss) { stss->sample_number.clear(); }

  void Fill(SampleTable* stbl) {
    Fill(&stbl->description);
    Fill(&stbl->decoding_time_to_sample);
    Fill(&stbl->sample_to_chunk);
    Fill(&stbl->sample_size);
    Fill(&stbl->chunk_offset);
    stbl->sync_sample.emplace();
    Fill(&*stbl->sync_sample);
  }

  void Modify(SampleTable* stbl) { stbl->sync_sample.reset(); }

  void Fill(MediaHeader* mdhd) {
    mdhd->timescale = 30;
    mdhd->duration = 5;
    mdhd->version = 0;
  }

  void Modify(MediaHeader* mdhd) {
    mdhd->creation_time = 0x100000000ULL;
    mdhd->version = 1;
  }

  void Fill(DataEntryUrl* url) {}

  void Fill(DataReference* dref) {}

  void Fill(DataInformation* dinf) {}

  void Fill(MediaInformation* minf) { Fill(&minf->sample_table); }

  void Modify(MediaInformation* minf) { Modify(&minf->sample_table); }

  void Fill(Media* mdia) {
    Fill(&mdia->header);
    Fill(&mdia->handler);
    Fill(&mdia->information);
  }

  void Modify(Media* mdia) { Modify(&mdia->information); }

  void Fill(Track* trak) {
    Fill(&trak->header);
    Fill(&trak->media);
  }

  void Modify(Track* trak) { Fill(&trak->reference); }

  void Fill(Movie* moov) {
    Fill(&moov->header);
    moov->tracks.resize(2);
    Fill(&moov->tracks[0]);
    Fill(&moov->tracks[1]);
    moov->tracks[1].header.track_id = 2;
    Fill(&moov->tracks[1].reference);
  }

  void Modify(Movie* moov) { moov->tracks.pop_back(); }

  bool IsOptional(const ItemReference* box) { return true; }
  bool IsOptional(const CodecConfiguration* box) { return true; }
  bool IsOptional(const ColorParameters* box) { return true; }
  bool IsOptional(const TrackReference* box) { return true; }
  bool IsOptional(const AuxiliaryTypeInfo* box) { return true; }

 protected:
  std::unique_ptr<BufferWriter> buffer_;

 private:
  uint8_t ClearVersion(FullBox* full_box) {
    uint8_t version = full_box->version;
    full_box->version = 0;
    return version;
  }
};

typedef testing::Types<FileType,
                       HandlerReference,
                       PrimaryItem,
                       ItemLocation,
                       ItemInfoEntry,
                       ItemInfo,
                       SingleItemTypeReference,
                       ItemReference,
                       ImageSpatialExtents,
                       PixelInformation,
                       CodecConfiguration,
                       AuxiliaryTypeProperty,
                       ColorParameters,
                       ItemPropertyContainer,
                       ItemPropertyAssociation,
                       ItemProperties,
                       Metadata,
                       MovieHeader,
                       TrackHeader,
                       TrackReferenceType,
                       TrackReference,
                       CodecConfigurationConstraints,
                       AuxiliaryTypeInfo,
                       VideoSampleEntry,
                       SampleDescription,
                       DecodingTimeToSample,
                       SampleToChunk,
                       SampleSize,
                       ChunkOffset,
                       SyncSample,
                       SampleTable,
                       MediaHeader,
                       VideoMediaHeader,
                       DataEntryUrl,
                       DataReference,
                       DataInformation,
                       MediaInformation,
                       Media,
                       Track,
                       Movie>
    Boxes;

TYPED_TEST_SUITE_P(BoxDefinitionsTestGeneral);

TYPED_TEST_P(BoxDefinitionsTestGeneral, WriteMatchesComputedSize) {
  TypeParam box;
  this->Fill(&box);
  LOG(INFO) << "Processing " << FourCCToString(box.BoxType());
  box.Write(this->buffer_.get());

  EXPECT_EQ(box.box_size(), this->buffer_->Size());
  EXPECT_EQ(box.ComputeSize(), this->buffer_->Size());
  this->VerifyHeader(&box);
}

TYPED_TEST_P(BoxDefinitionsTestGeneral, WriteModifyWrite) {
  TypeParam box;
  this->Fill(&box);
  LOG(INFO) << "Processing " << FourCCToString(box.BoxType());
  // Save the expected version set earlier in function |Fill|, then clear
  // the version, expecting box.Write set version as expected.
  uint8_t version = this->GetAndClearVersion(&box);
  box.Write(this->buffer_.get());
  EXPECT_EQ(version, this->GetAndClearVersion(&box));

  this->buffer_->Clear();
  this->Modify(&box);
  version = this->GetAndClearVersion(&box);
  box.Write(this->buffer_.get());
  EXPECT_EQ(version, this->GetAndClearVersion(&box));

  EXPECT_EQ(box.box_size(), this->buffer_->Size());
  this->VerifyHeader(&box);
}

TYPED_TEST_P(BoxDefinitionsTestGeneral, Empty) {
  TypeParam box;
  if (this->IsOptional(&box)) {
    ASSERT_EQ(0u, box.ComputeSize());
  } else {
    ASSERT_NE(0u, box.ComputeSize());
  }
}

REGISTER_TYPED_TEST_SUITE_P(BoxDefinitionsTestGeneral,
                            WriteMatchesComputedSize,
                            WriteModifyWrite,
                            Empty);

INSTANTIATE_TYPED_TEST_SUITE_P(BoxDefinitionTypedTests,
                               BoxDefinitionsTestGeneral,
                               Boxes);

// Test other cases of box input.
class BoxDefinitionsTest : public BoxDefinitionsTestGeneral<Box> {
 protected:
  std::vector<uint8_t> Written() const {
    return std::vector<uint8_t>(buffer_->Buffer(),
                                buffer_->Buffer() + buffer_->Size());
  }
};

TEST_F(BoxDefinitionsTest, FileTypeBytes) {
  FileType ftyp;
  Fill(&ftyp);
  ftyp.Write(buffer_.get());

  std::vector<uint8_t> expected = {0, 0, 0, 28};
  for (const char* fourcc : {"ftyp", "avif"})
    for (uint8_t byte : FourCCBytes(fourcc))
      expected.push_back(byte);
  expected.insert(expected.end(), 4, 0);  // minor_version.
  for (const char* fourcc : {"avif", "mif1", "miaf"})
    for (uint8_t byte : FourCCBytes(fourcc))
      expected.push_back(byte);
  EXPECT_THAT(Written(), ElementsAreArray(expected));
}

TEST_F(BoxDefinitionsTest, HandlerReferenceSize) {
  HandlerReference hdlr;
  Fill(&hdlr);
  // Full box header, pre_defined, handler type, reserved and "avifmux\0".
  EXPECT_EQ(12u + 4 + 4 + 12 + 8, hdlr.ComputeSize());
}

TEST_F(BoxDefinitionsTest, ItemLocationBytes) {
  ItemLocation iloc;
  iloc.items.resize(1);
  iloc.items[0].item_id = 1;
  iloc.items[0].extents.resize(1);
  iloc.items[0].extents[0].offset = 4;
  iloc.items[0].extents[0].length = 10;
  iloc.items[0].extents[0].Resolve(96);
  iloc.Write(buffer_.get());

  const uint8_t kExpected[] = {
      0x00, 0x00, 0x00, 0x1e, 'i',  'l',  'o',  'c',   // header.
      0x00, 0x00, 0x00, 0x00,                          // version and flags.
      0x44, 0x00,                                      // field sizes.
      0x00, 0x01,                                      // item count.
      0x00, 0x01, 0x00, 0x00, 0x00, 0x01,              // id, dref, extents.
      0x00, 0x00, 0x00, 0x64, 0x00, 0x00, 0x00, 0x0a,  // offset, length.
  };
  EXPECT_THAT(Written(), ElementsAreArray(kExpected));
}

TEST_F(BoxDefinitionsTest, ItemExtentResolveAddsPayloadOffset) {
  ItemExtent extent;
  extent.offset = 5;
  extent.length = 3;
  EXPECT_FALSE(extent.resolved);
  extent.Resolve(100);
  EXPECT_TRUE(extent.resolved);
  EXPECT_EQ(105u, extent.offset);
  EXPECT_EQ(3u, extent.length);
}

TEST_F(BoxDefinitionsTest, WritingUnresolvedExtentDies) {
  ItemLocation iloc;
  iloc.items.resize(1);
  iloc.items[0].item_id = 1;
  iloc.items[0].extents.resize(1);
  iloc.items[0].extents[0].length = 10;
  EXPECT_DEATH(iloc.Write(buffer_.get()), "has not been resolved");
}

TEST_F(BoxDefinitionsTest, ItemInfoEntryIsVersion2) {
  ItemInfoEntry infe;
  Fill(&infe);
  infe.Write(buffer_.get());

  const uint8_t kExpected[] = {
      0x00, 0x00, 0x00, 0x1a, 'i', 'n', 'f', 'e',  // header.
      0x02, 0x00, 0x00, 0x00,                      // version 2.
      0x00, 0x02, 0x00, 0x00,                      // id, protection index.
      'a',  'v',  '0',  '1',  'A', 'l', 'p', 'h', 'a', 0x00,
  };
  EXPECT_THAT(Written(), ElementsAreArray(kExpected));
}

TEST_F(BoxDefinitionsTest, ItemReferenceSkippedWhenEmpty) {
  Metadata meta;
  Fill(&meta);
  const uint32_t size_without_references = meta.ComputeSize();
  EXPECT_EQ(0u, meta.item_reference.box_size());

  Fill(&meta.item_reference);
  // iref header plus an auxl reference from one item to another.
  EXPECT_EQ(size_without_references + 12 + 8 + 2 + 2 + 2, meta.ComputeSize());
}

TEST_F(BoxDefinitionsTest, AddPropertyReturnsOneBasedIndex) {
  ItemPropertyContainer ipco;
  EXPECT_EQ(1u, ipco.AddProperty(ImageSpatialExtents()));
  EXPECT_EQ(2u, ipco.AddProperty(PixelInformation()));
  EXPECT_EQ(3u, ipco.AddProperty(AuxiliaryTypeProperty()));
  ASSERT_EQ(3u, ipco.properties.size());
  EXPECT_TRUE(std::holds_alternative<PixelInformation>(ipco.properties[1]));
}

TEST_F(BoxDefinitionsTest, ItemPropertyAssociationBytes) {
  ItemPropertyAssociation ipma;
  ipma.entries.resize(1);
  ipma.entries[0].item_id = 1;
  ipma.entries[0].associations.push_back({1, false});
  ipma.entries[0].associations.push_back({3, true});
  ipma.Write(buffer_.get());

  const uint8_t kExpected[] = {
      0x00, 0x00, 0x00, 0x15, 'i',  'p',  'm',  'a',  // header.
      0x00, 0x00, 0x00, 0x00,                         // version and flags.
      0x00, 0x00, 0x00, 0x01,                         // entry count.
      0x00, 0x01, 0x02, 0x01, 0x83,
  };
  EXPECT_THAT(Written(), ElementsAreArray(kExpected));
}

TEST_F(BoxDefinitionsTest, ColorParametersBytes) {
  ColorParameters colr;
  colr.color_parameter_type = FOURCC_nclx;
  colr.color_primaries = 1;
  colr.transfer_characteristics = 13;
  colr.matrix_coefficients = 6;
  colr.video_full_range_flag = 1;
  colr.Write(buffer_.get());

  const uint8_t kExpected[] = {
      0x00, 0x00, 0x00, 0x13, 'c',  'o',  'l',  'r',  'n',  'c',
      'l',  'x',  0x00, 0x01, 0x00, 0x0d, 0x00, 0x06, 0x80,
  };
  EXPECT_THAT(Written(), ElementsAreArray(kExpected));
}

TEST_F(BoxDefinitionsTest, CodecConfigurationConstraintsBytes) {
  CodecConfigurationConstraints ccst;
  ccst.Write(buffer_.get());

  // intra_pred_used set, any number of reference pictures.
  const uint8_t kExpected[] = {
      0x00, 0x00, 0x00, 0x10, 'c',  'c',  's',  't',
      0x00, 0x00, 0x00, 0x00, 0x7c, 0x00, 0x00, 0x00,
  };
  EXPECT_THAT(Written(), ElementsAreArray(kExpected));
}

TEST_F(BoxDefinitionsTest, MediaHeaderLanguage) {
  MediaHeader mdhd;
  Fill(&mdhd);
  mdhd.Write(buffer_.get());

  std::vector<uint8_t> written = Written();
  ASSERT_EQ(32u, written.size());
  // "und" packed as three 5-bit characters.
  EXPECT_EQ(0x55, written[28]);
  EXPECT_EQ(0xc4, written[29]);
}

TEST_F(BoxDefinitionsTest, IndefiniteDurationUsesVersion1) {
  MovieHeader mvhd;
  mvhd.timescale = 1000;
  mvhd.duration = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(120u, mvhd.ComputeSize());
  EXPECT_EQ(1u, mvhd.version);

  TrackHeader tkhd;
  tkhd.duration = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(104u, tkhd.ComputeSize());
  EXPECT_EQ(1u, tkhd.version);
}

TEST_F(BoxDefinitionsTest, VideoSampleEntryOptionalChildren) {
  VideoSampleEntry entry;
  Fill(&entry);
  // Fixed fields, av1C with a 4 byte record and ccst.
  EXPECT_EQ(86u + 12 + 16, entry.ComputeSize());

  Fill(&entry.colr);
  Fill(&entry.auxi);
  EXPECT_EQ(86u + 12 + 16 + 19 + 12 + sizeof(kAlphaUrn), entry.ComputeSize());
}

TEST_F(BoxDefinitionsTest, SyncSampleOmittedWhenAbsent) {
  SampleTable stbl;
  Fill(&stbl);
  stbl.sync_sample->sample_number.clear();
  const uint32_t size_with_empty_sync_sample = stbl.ComputeSize();

  stbl.sync_sample.reset();
  EXPECT_EQ(size_with_empty_sync_sample - 16, stbl.ComputeSize());
}

TEST_F(BoxDefinitionsTest, MediaDataHeader) {
  MediaData mdat;
  mdat.data_size = 10;
  mdat.WriteHeader(buffer_.get());

  const uint8_t kExpected[] = {0x00, 0x00, 0x00, 0x12, 'm', 'd', 'a', 't'};
  EXPECT_THAT(Written(), ElementsAreArray(kExpected));
}

}  // namespace mp4
}  // namespace media
}  // namespace avifmux
