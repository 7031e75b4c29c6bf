// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_FORMATS_MP4_BOX_DEFINITIONS_H_
#define AVIFMUX_MEDIA_FORMATS_MP4_BOX_DEFINITIONS_H_

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <avifmux/media/base/fourccs.h>
#include <avifmux/media/formats/mp4/box.h>

namespace avifmux {
namespace media {
namespace mp4 {

class BoxBuffer;

#define DECLARE_BOX_METHODS(T)                    \
 public:                                          \
  T();                                            \
  ~T() override;                                  \
                                                  \
  FourCC BoxType() const override;                \
                                                  \
 private:                                         \
  bool WriteInternal(BoxBuffer* buffer) override; \
  size_t ComputeSizeInternal() override;          \
                                                  \
 public:

struct FileType : Box {
  DECLARE_BOX_METHODS(FileType);

  FourCC major_brand = FOURCC_NULL;
  uint32_t minor_version = 0;
  std::vector<FourCC> compatible_brands;
};

struct HandlerReference : FullBox {
  DECLARE_BOX_METHODS(HandlerReference);

  FourCC handler_type = FOURCC_NULL;
  std::string name;
};

// pitm.
struct PrimaryItem : FullBox {
  DECLARE_BOX_METHODS(PrimaryItem);

  uint16_t item_id = 0;
};

/// A contiguous byte range of an item's data. The offset is relative to the
/// start of the mdat payload until Resolve() is called, and absolute (from
/// the start of the file) afterwards.
struct ItemExtent {
  /// Converts the relative offset to an absolute one.
  /// @param payload_offset is the file offset of the first mdat payload byte.
  void Resolve(uint32_t payload_offset);

  uint32_t offset = 0;
  uint32_t length = 0;
  bool resolved = false;
};

struct ItemLocationEntry {
  uint16_t item_id = 0;
  std::vector<ItemExtent> extents;
};

// iloc.
struct ItemLocation : FullBox {
  DECLARE_BOX_METHODS(ItemLocation);

  std::vector<ItemLocationEntry> items;
};

// infe. Always written as version 2.
struct ItemInfoEntry : FullBox {
  DECLARE_BOX_METHODS(ItemInfoEntry);

  uint16_t item_id = 0;
  FourCC item_type = FOURCC_NULL;
  std::string item_name;
};

// iinf.
struct ItemInfo : FullBox {
  DECLARE_BOX_METHODS(ItemInfo);

  std::vector<ItemInfoEntry> entries;
};

/// A reference of one type from one item to others. The box type is the
/// reference type, e.g. `auxl` or `prem`.
struct SingleItemTypeReference : Box {
  DECLARE_BOX_METHODS(SingleItemTypeReference);

  FourCC reference_type = FOURCC_NULL;
  uint16_t from_item_id = 0;
  std::vector<uint16_t> to_item_ids;
};

// iref. Optional, skipped when there are no references.
struct ItemReference : FullBox {
  DECLARE_BOX_METHODS(ItemReference);

  std::vector<SingleItemTypeReference> references;
};

// ispe.
struct ImageSpatialExtents : FullBox {
  DECLARE_BOX_METHODS(ImageSpatialExtents);

  uint32_t width = 0;
  uint32_t height = 0;
};

// pixi.
struct PixelInformation : FullBox {
  DECLARE_BOX_METHODS(PixelInformation);

  std::vector<uint8_t> bits_per_channel;
};

// Holds a complete codec configuration record, e.g. av1C.
struct CodecConfiguration : Box {
  DECLARE_BOX_METHODS(CodecConfiguration);

  FourCC box_type = FOURCC_NULL;
  std::vector<uint8_t> data;
};

// auxC.
struct AuxiliaryTypeProperty : FullBox {
  DECLARE_BOX_METHODS(AuxiliaryTypeProperty);

  std::string aux_type;
};

// colr. Only the nclx flavor is written; it is skipped when
// |color_parameter_type| is not set.
struct ColorParameters : Box {
  DECLARE_BOX_METHODS(ColorParameters);

  FourCC color_parameter_type = FOURCC_NULL;
  uint16_t color_primaries = 1;
  uint16_t transfer_characteristics = 1;
  uint16_t matrix_coefficients = 1;
  uint8_t video_full_range_flag = 0;
};

/// One entry in the property pool of an image.
using ItemProperty = std::variant<ImageSpatialExtents,
                                  PixelInformation,
                                  CodecConfiguration,
                                  AuxiliaryTypeProperty,
                                  ColorParameters>;

// ipco.
struct ItemPropertyContainer : Box {
  DECLARE_BOX_METHODS(ItemPropertyContainer);

  /// Appends @a property to the pool.
  /// @return The 1-based index used to associate the property with items.
  uint8_t AddProperty(ItemProperty property);

  std::vector<ItemProperty> properties;
};

struct PropertyAssociation {
  uint8_t property_index = 0;
  bool essential = false;
};

struct ItemPropertyAssociationEntry {
  uint16_t item_id = 0;
  std::vector<PropertyAssociation> associations;
};

// ipma. Version 0 with 7-bit property indices.
struct ItemPropertyAssociation : FullBox {
  DECLARE_BOX_METHODS(ItemPropertyAssociation);

  std::vector<ItemPropertyAssociationEntry> entries;
};

// iprp.
struct ItemProperties : Box {
  DECLARE_BOX_METHODS(ItemProperties);

  ItemPropertyContainer container;
  ItemPropertyAssociation association;
};

// meta.
struct Metadata : FullBox {
  DECLARE_BOX_METHODS(Metadata);

  HandlerReference handler;
  PrimaryItem primary_item;
  ItemLocation item_location;
  ItemInfo item_info;
  ItemReference item_reference;
  ItemProperties properties;
};

struct MovieHeader : FullBox {
  DECLARE_BOX_METHODS(MovieHeader);

  uint64_t creation_time = 0;
  uint64_t modification_time = 0;
  uint32_t timescale = 0;
  uint64_t duration = 0;
  int32_t rate = 1 << 16;
  int16_t volume = 1 << 8;
  uint32_t next_track_id = 0;
};

struct TrackHeader : FullBox {
  enum TrackHeaderFlags {
    kTrackEnabled = 0x000001,
    kTrackInMovie = 0x000002,
    kTrackInPreview = 0x000004,
  };

  DECLARE_BOX_METHODS(TrackHeader);

  uint64_t creation_time = 0;
  uint64_t modification_time = 0;
  uint32_t track_id = 0;
  uint64_t duration = 0;
  int16_t layer = 0;
  int16_t alternate_group = 0;
  int16_t volume = 0;
  // width and height specify the track's visual presentation size as
  // fixed-point 16.16 values.
  uint32_t width = 0;
  uint32_t height = 0;
};

/// A typed list of referenced track ids inside `tref`.
struct TrackReferenceType : Box {
  DECLARE_BOX_METHODS(TrackReferenceType);

  FourCC reference_type = FOURCC_NULL;
  std::vector<uint32_t> track_ids;
};

// tref. Optional, skipped when there are no references.
struct TrackReference : Box {
  DECLARE_BOX_METHODS(TrackReference);

  std::vector<TrackReferenceType> references;
};

// ccst.
struct CodecConfigurationConstraints : FullBox {
  DECLARE_BOX_METHODS(CodecConfigurationConstraints);

  bool all_ref_pics_intra = false;
  bool intra_pred_used = true;
  // 4 bits. 15 means any number of references.
  uint8_t max_ref_per_pic = 15;
};

// auxi. Optional, skipped when |aux_track_type| is empty.
struct AuxiliaryTypeInfo : FullBox {
  DECLARE_BOX_METHODS(AuxiliaryTypeInfo);

  std::string aux_track_type;
};

struct VideoSampleEntry : Box {
  DECLARE_BOX_METHODS(VideoSampleEntry);

  FourCC format = FOURCC_NULL;
  // data_reference_index is 1-based and "dref" box is mandatory so it is
  // always present.
  uint16_t data_reference_index = 1u;
  uint16_t width = 0u;
  uint16_t height = 0u;

  CodecConfiguration codec_configuration;
  ColorParameters colr;
  CodecConfigurationConstraints ccst;
  AuxiliaryTypeInfo auxi;
};

// stsd.
struct SampleDescription : FullBox {
  DECLARE_BOX_METHODS(SampleDescription);

  std::vector<VideoSampleEntry> video_entries;
};

struct DecodingTime {
  uint32_t sample_count;
  uint32_t sample_delta;
};

// stts.
struct DecodingTimeToSample : FullBox {
  DECLARE_BOX_METHODS(DecodingTimeToSample);

  std::vector<DecodingTime> decoding_time;
};

struct ChunkInfo {
  uint32_t first_chunk;
  uint32_t samples_per_chunk;
  uint32_t sample_description_index;
};

// stsc.
struct SampleToChunk : FullBox {
  DECLARE_BOX_METHODS(SampleToChunk);

  std::vector<ChunkInfo> chunk_info;
};

// stsz.
struct SampleSize : FullBox {
  DECLARE_BOX_METHODS(SampleSize);

  uint32_t sample_size = 0u;
  uint32_t sample_count = 0u;
  std::vector<uint32_t> sizes;
};

// stco.
struct ChunkOffset : FullBox {
  DECLARE_BOX_METHODS(ChunkOffset);

  std::vector<uint32_t> offsets;
};

// stss. Unlike most optional boxes an empty one is still written, since it
// means no sample is a sync sample. Absence is modeled by the owner.
struct SyncSample : FullBox {
  DECLARE_BOX_METHODS(SyncSample);

  std::vector<uint32_t> sample_number;
};

struct SampleTable : Box {
  DECLARE_BOX_METHODS(SampleTable);

  SampleDescription description;
  DecodingTimeToSample decoding_time_to_sample;
  SampleToChunk sample_to_chunk;
  SampleSize sample_size;
  ChunkOffset chunk_offset;
  // Not present when every sample is a sync sample.
  std::optional<SyncSample> sync_sample;
};

struct MediaHeader : FullBox {
  DECLARE_BOX_METHODS(MediaHeader);

  uint64_t creation_time = 0u;
  uint64_t modification_time = 0u;
  uint32_t timescale = 0u;
  uint64_t duration = 0u;
  // ISO-639-2/T language code.
  std::string language = "und";
};

struct VideoMediaHeader : FullBox {
  DECLARE_BOX_METHODS(VideoMediaHeader);

  uint16_t graphicsmode = 0u;
  uint16_t opcolor_red = 0u;
  uint16_t opcolor_green = 0u;
  uint16_t opcolor_blue = 0u;
};

struct DataEntryUrl : FullBox {
  DECLARE_BOX_METHODS(DataEntryUrl);

  std::vector<uint8_t> location;
};

struct DataReference : FullBox {
  DECLARE_BOX_METHODS(DataReference);

  // Media data is always in the same file.
  std::vector<DataEntryUrl> data_entry = std::vector<DataEntryUrl>(1);
};

struct DataInformation : Box {
  DECLARE_BOX_METHODS(DataInformation);

  DataReference dref;
};

struct MediaInformation : Box {
  DECLARE_BOX_METHODS(MediaInformation);

  VideoMediaHeader vmhd;
  DataInformation dinf;
  SampleTable sample_table;
};

struct Media : Box {
  DECLARE_BOX_METHODS(Media);

  MediaHeader header;
  HandlerReference handler;
  MediaInformation information;
};

struct Track : Box {
  DECLARE_BOX_METHODS(Track);

  TrackHeader header;
  TrackReference reference;
  Media media;
};

struct Movie : Box {
  DECLARE_BOX_METHODS(Movie);

  MovieHeader header;
  std::vector<Track> tracks;
};

// The actual data is written separately.
struct MediaData : Box {
  DECLARE_BOX_METHODS(MediaData);

  uint32_t data_size = 0u;
};

#undef DECLARE_BOX_METHODS

}  // namespace mp4
}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_FORMATS_MP4_BOX_DEFINITIONS_H_
