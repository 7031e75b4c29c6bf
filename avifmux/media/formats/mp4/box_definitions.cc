// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/formats/mp4/box_definitions.h>

#include <iterator>
#include <limits>

#include <absl/log/check.h>
#include <absl/log/log.h>

#include <avifmux/macros/logging.h>
#include <avifmux/media/base/rcheck.h>
#include <avifmux/media/formats/mp4/box_buffer.h>

namespace {
const uint32_t kFourCCSize = 4;

// 9 uint32_t in big endian formatted array.
const uint8_t kUnityMatrix[] = {0, 1, 0, 0, 0, 0, 0, 0, 0,    0, 0, 0,
                                0, 0, 0, 0, 0, 1, 0, 0, 0,    0, 0, 0,
                                0, 0, 0, 0, 0, 0, 0, 0, 0x40, 0, 0, 0};

// Default values for VideoSampleEntry box.
const uint32_t kVideoResolution = 0x00480000;  // 72 dpi.
const uint16_t kVideoFrameCount = 1;
const uint16_t kVideoDepth = 0x0018;

const uint32_t kCompressorNameSize = 32u;
const char kAv1CompressorName[] = "\012AOM Coding";

// iloc field widths: offset_size = 4, length_size = 4, base_offset_size = 0,
// reserved = 0.
const uint8_t kIlocOffsetAndLengthSize = (4 << 4) | 4;
const uint8_t kIlocBaseOffsetSize = 0;

const uint8_t kEssentialBit = 0x80;

// Utility functions to check if the 64bit integers can fit in 32bit integer.
bool IsFitIn32Bits(uint64_t a) {
  return a <= std::numeric_limits<uint32_t>::max();
}

template <typename T1, typename T2, typename T3>
bool IsFitIn32Bits(T1 a1, T2 a2, T3 a3) {
  return IsFitIn32Bits(a1) && IsFitIn32Bits(a2) && IsFitIn32Bits(a3);
}

}  // namespace

namespace avifmux {
namespace media {
namespace mp4 {

FileType::FileType() = default;
FileType::~FileType() = default;

FourCC FileType::BoxType() const {
  return FOURCC_ftyp;
}

bool FileType::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteFourCC(major_brand) &&
         buffer->WriteUInt32(minor_version));
  for (FourCC brand : compatible_brands)
    RCHECK(buffer->WriteFourCC(brand));
  return true;
}

size_t FileType::ComputeSizeInternal() {
  return HeaderSize() + kFourCCSize + sizeof(minor_version) +
         kFourCCSize * compatible_brands.size();
}

HandlerReference::HandlerReference() = default;
HandlerReference::~HandlerReference() = default;

FourCC HandlerReference::BoxType() const {
  return FOURCC_hdlr;
}

bool HandlerReference::WriteInternal(BoxBuffer* buffer) {
  DCHECK_NE(handler_type, FOURCC_NULL);
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->IgnoreBytes(4) &&  // predefined.
         buffer->WriteFourCC(handler_type) &&
         buffer->IgnoreBytes(12) &&  // reserved.
         buffer->WriteCString(name));
  return true;
}

size_t HandlerReference::ComputeSizeInternal() {
  // 4 bytes predefined, 12 bytes reserved and a nul-terminated name.
  return HeaderSize() + kFourCCSize + 16 + name.size() + 1;
}

PrimaryItem::PrimaryItem() = default;
PrimaryItem::~PrimaryItem() = default;

FourCC PrimaryItem::BoxType() const {
  return FOURCC_pitm;
}

bool PrimaryItem::WriteInternal(BoxBuffer* buffer) {
  return WriteHeaderInternal(buffer) && buffer->WriteUInt16(item_id);
}

size_t PrimaryItem::ComputeSizeInternal() {
  return HeaderSize() + sizeof(item_id);
}

void ItemExtent::Resolve(uint32_t payload_offset) {
  DCHECK(!resolved) << "Extent resolved twice.";
  DCHECK_LE(offset, std::numeric_limits<uint32_t>::max() - payload_offset);
  offset += payload_offset;
  resolved = true;
}

ItemLocation::ItemLocation() = default;
ItemLocation::~ItemLocation() = default;

FourCC ItemLocation::BoxType() const {
  return FOURCC_iloc;
}

bool ItemLocation::WriteInternal(BoxBuffer* buffer) {
  DCHECK_EQ(0u, version);
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteUInt8(kIlocOffsetAndLengthSize) &&
         buffer->WriteUInt8(kIlocBaseOffsetSize) &&
         buffer->WriteUInt16(static_cast<uint16_t>(items.size())));
  for (const ItemLocationEntry& item : items) {
    RCHECK(buffer->WriteUInt16(item.item_id) &&
           buffer->WriteUInt16(0) &&  // data_reference_index: this file.
           buffer->WriteUInt16(static_cast<uint16_t>(item.extents.size())));
    for (const ItemExtent& extent : item.extents) {
      // Writing a relative offset would silently produce a corrupt file.
      CHECK(extent.resolved) << "Item " << item.item_id
                             << " extent offset has not been resolved.";
      RCHECK(buffer->WriteUInt32(extent.offset) &&
             buffer->WriteUInt32(extent.length));
    }
  }
  return true;
}

size_t ItemLocation::ComputeSizeInternal() {
  size_t box_size = HeaderSize() + sizeof(kIlocOffsetAndLengthSize) +
                    sizeof(kIlocBaseOffsetSize) + sizeof(uint16_t);
  for (const ItemLocationEntry& item : items) {
    box_size += sizeof(item.item_id) + sizeof(uint16_t) + sizeof(uint16_t) +
                (sizeof(uint32_t) + sizeof(uint32_t)) * item.extents.size();
  }
  return box_size;
}

ItemInfoEntry::ItemInfoEntry() {
  const uint8_t kItemInfoEntryVersion = 2;
  version = kItemInfoEntryVersion;
}
ItemInfoEntry::~ItemInfoEntry() = default;

FourCC ItemInfoEntry::BoxType() const {
  return FOURCC_infe;
}

bool ItemInfoEntry::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteUInt16(item_id) &&
         buffer->WriteUInt16(0) &&  // item_protection_index.
         buffer->WriteFourCC(item_type) && buffer->WriteCString(item_name));
  return true;
}

size_t ItemInfoEntry::ComputeSizeInternal() {
  return HeaderSize() + sizeof(item_id) + sizeof(uint16_t) + kFourCCSize +
         item_name.size() + 1;
}

ItemInfo::ItemInfo() = default;
ItemInfo::~ItemInfo() = default;

FourCC ItemInfo::BoxType() const {
  return FOURCC_iinf;
}

bool ItemInfo::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteUInt16(static_cast<uint16_t>(entries.size())));
  for (ItemInfoEntry& entry : entries)
    RCHECK(buffer->WriteChild(&entry));
  return true;
}

size_t ItemInfo::ComputeSizeInternal() {
  size_t box_size = HeaderSize() + sizeof(uint16_t);
  for (ItemInfoEntry& entry : entries)
    box_size += entry.ComputeSize();
  return box_size;
}

SingleItemTypeReference::SingleItemTypeReference() = default;
SingleItemTypeReference::~SingleItemTypeReference() = default;

FourCC SingleItemTypeReference::BoxType() const {
  return reference_type;
}

bool SingleItemTypeReference::WriteInternal(BoxBuffer* buffer) {
  DCHECK_NE(reference_type, FOURCC_NULL);
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteUInt16(from_item_id) &&
         buffer->WriteUInt16(static_cast<uint16_t>(to_item_ids.size())));
  for (uint16_t to_item_id : to_item_ids)
    RCHECK(buffer->WriteUInt16(to_item_id));
  return true;
}

size_t SingleItemTypeReference::ComputeSizeInternal() {
  return HeaderSize() + sizeof(from_item_id) + sizeof(uint16_t) +
         sizeof(uint16_t) * to_item_ids.size();
}

ItemReference::ItemReference() = default;
ItemReference::~ItemReference() = default;

FourCC ItemReference::BoxType() const {
  return FOURCC_iref;
}

bool ItemReference::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer));
  for (SingleItemTypeReference& reference : references)
    RCHECK(buffer->WriteChild(&reference));
  return true;
}

size_t ItemReference::ComputeSizeInternal() {
  // This box is optional. Skip it if there is nothing to reference.
  if (references.empty())
    return 0;
  size_t box_size = HeaderSize();
  for (SingleItemTypeReference& reference : references)
    box_size += reference.ComputeSize();
  return box_size;
}

ImageSpatialExtents::ImageSpatialExtents() = default;
ImageSpatialExtents::~ImageSpatialExtents() = default;

FourCC ImageSpatialExtents::BoxType() const {
  return FOURCC_ispe;
}

bool ImageSpatialExtents::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteUInt32(width) &&
         buffer->WriteUInt32(height));
  return true;
}

size_t ImageSpatialExtents::ComputeSizeInternal() {
  return HeaderSize() + sizeof(width) + sizeof(height);
}

PixelInformation::PixelInformation() = default;
PixelInformation::~PixelInformation() = default;

FourCC PixelInformation::BoxType() const {
  return FOURCC_pixi;
}

bool PixelInformation::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteUInt8(static_cast<uint8_t>(bits_per_channel.size())) &&
         buffer->WriteVector(bits_per_channel));
  return true;
}

size_t PixelInformation::ComputeSizeInternal() {
  return HeaderSize() + sizeof(uint8_t) + bits_per_channel.size();
}

CodecConfiguration::CodecConfiguration() = default;
CodecConfiguration::~CodecConfiguration() = default;

FourCC CodecConfiguration::BoxType() const {
  // CodecConfiguration box should be parsed according to format recovered in
  // VideoSampleEntry. |box_type| is determined dynamically there.
  return box_type;
}

bool CodecConfiguration::WriteInternal(BoxBuffer* buffer) {
  DCHECK_NE(box_type, FOURCC_NULL);
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteVector(data));
  return true;
}

size_t CodecConfiguration::ComputeSizeInternal() {
  if (data.empty())
    return 0;
  return HeaderSize() + data.size();
}

AuxiliaryTypeProperty::AuxiliaryTypeProperty() = default;
AuxiliaryTypeProperty::~AuxiliaryTypeProperty() = default;

FourCC AuxiliaryTypeProperty::BoxType() const {
  return FOURCC_auxC;
}

bool AuxiliaryTypeProperty::WriteInternal(BoxBuffer* buffer) {
  return WriteHeaderInternal(buffer) && buffer->WriteCString(aux_type);
}

size_t AuxiliaryTypeProperty::ComputeSizeInternal() {
  return HeaderSize() + aux_type.size() + 1;
}

ColorParameters::ColorParameters() = default;
ColorParameters::~ColorParameters() = default;

FourCC ColorParameters::BoxType() const {
  return FOURCC_colr;
}

bool ColorParameters::WriteInternal(BoxBuffer* buffer) {
  if (color_parameter_type != FOURCC_nclx) {
    NOTIMPLEMENTED() << "Color parameter type "
                     << FourCCToString(color_parameter_type);
    return false;
  }
  DCHECK_LE(video_full_range_flag, 1u);
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteFourCC(color_parameter_type) &&
         buffer->WriteUInt16(color_primaries) &&
         buffer->WriteUInt16(transfer_characteristics) &&
         buffer->WriteUInt16(matrix_coefficients) &&
         // full_range_flag (1 bit) followed by 7 reserved bits.
         buffer->WriteUInt8(video_full_range_flag << 7));
  return true;
}

size_t ColorParameters::ComputeSizeInternal() {
  // This box is optional. Skip it if it is not initialized.
  if (color_parameter_type == FOURCC_NULL)
    return 0;
  return HeaderSize() + kFourCCSize + sizeof(color_primaries) +
         sizeof(transfer_characteristics) + sizeof(matrix_coefficients) +
         sizeof(video_full_range_flag);
}

ItemPropertyContainer::ItemPropertyContainer() = default;
ItemPropertyContainer::~ItemPropertyContainer() = default;

FourCC ItemPropertyContainer::BoxType() const {
  return FOURCC_ipco;
}

uint8_t ItemPropertyContainer::AddProperty(ItemProperty property) {
  properties.push_back(std::move(property));
  // ipma version 0 without flag 1 only has 7 bits for the index.
  DCHECK_LT(properties.size(), 128u);
  return static_cast<uint8_t>(properties.size());
}

bool ItemPropertyContainer::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer));
  for (ItemProperty& property : properties) {
    RCHECK(std::visit([buffer](auto& box) { return buffer->WriteChild(&box); },
                      property));
  }
  return true;
}

size_t ItemPropertyContainer::ComputeSizeInternal() {
  size_t box_size = HeaderSize();
  for (ItemProperty& property : properties) {
    box_size += std::visit(
        [](auto& box) -> size_t { return box.ComputeSize(); }, property);
  }
  return box_size;
}

ItemPropertyAssociation::ItemPropertyAssociation() = default;
ItemPropertyAssociation::~ItemPropertyAssociation() = default;

FourCC ItemPropertyAssociation::BoxType() const {
  return FOURCC_ipma;
}

bool ItemPropertyAssociation::WriteInternal(BoxBuffer* buffer) {
  DCHECK_EQ(0u, version);
  DCHECK_EQ(0u, flags);
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteUInt32(static_cast<uint32_t>(entries.size())));
  for (const ItemPropertyAssociationEntry& entry : entries) {
    RCHECK(buffer->WriteUInt16(entry.item_id) &&
           buffer->WriteUInt8(static_cast<uint8_t>(entry.associations.size())));
    for (const PropertyAssociation& association : entry.associations) {
      DCHECK_LT(association.property_index, kEssentialBit);
      RCHECK(buffer->WriteUInt8(
          (association.essential ? kEssentialBit : 0) |
          association.property_index));
    }
  }
  return true;
}

size_t ItemPropertyAssociation::ComputeSizeInternal() {
  size_t box_size = HeaderSize() + sizeof(uint32_t);
  for (const ItemPropertyAssociationEntry& entry : entries) {
    box_size += sizeof(entry.item_id) + sizeof(uint8_t) +
                sizeof(uint8_t) * entry.associations.size();
  }
  return box_size;
}

ItemProperties::ItemProperties() = default;
ItemProperties::~ItemProperties() = default;

FourCC ItemProperties::BoxType() const {
  return FOURCC_iprp;
}

bool ItemProperties::WriteInternal(BoxBuffer* buffer) {
  return WriteHeaderInternal(buffer) && buffer->WriteChild(&container) &&
         buffer->WriteChild(&association);
}

size_t ItemProperties::ComputeSizeInternal() {
  return HeaderSize() + container.ComputeSize() + association.ComputeSize();
}

Metadata::Metadata() = default;
Metadata::~Metadata() = default;

FourCC Metadata::BoxType() const {
  return FOURCC_meta;
}

bool Metadata::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteChild(&handler) &&
         buffer->WriteChild(&primary_item) &&
         buffer->WriteChild(&item_location) && buffer->WriteChild(&item_info) &&
         buffer->TryWriteChild(&item_reference) &&
         buffer->WriteChild(&properties));
  return true;
}

size_t Metadata::ComputeSizeInternal() {
  return HeaderSize() + handler.ComputeSize() + primary_item.ComputeSize() +
         item_location.ComputeSize() + item_info.ComputeSize() +
         item_reference.ComputeSize() + properties.ComputeSize();
}

MovieHeader::MovieHeader() = default;
MovieHeader::~MovieHeader() = default;

FourCC MovieHeader::BoxType() const {
  return FOURCC_mvhd;
}

bool MovieHeader::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer));

  size_t num_bytes = (version == 1) ? sizeof(uint64_t) : sizeof(uint32_t);
  RCHECK(buffer->WriteUInt64NBytes(creation_time, num_bytes) &&
         buffer->WriteUInt64NBytes(modification_time, num_bytes) &&
         buffer->WriteUInt32(timescale) &&
         buffer->WriteUInt64NBytes(duration, num_bytes));

  std::vector<uint8_t> matrix(std::begin(kUnityMatrix), std::end(kUnityMatrix));
  RCHECK(buffer->WriteInt32(rate) && buffer->WriteInt16(volume) &&
         buffer->IgnoreBytes(10) &&  // reserved
         buffer->WriteVector(matrix) &&
         buffer->IgnoreBytes(24) &&  // predefined zero
         buffer->WriteUInt32(next_track_id));
  return true;
}

size_t MovieHeader::ComputeSizeInternal() {
  version = IsFitIn32Bits(creation_time, modification_time, duration) ? 0 : 1;
  return HeaderSize() + sizeof(uint32_t) * (1 + version) * 3 +
         sizeof(timescale) + sizeof(rate) + sizeof(volume) +
         sizeof(next_track_id) + sizeof(kUnityMatrix) + 10 +
         24;  // 10 bytes reserved, 24 bytes predefined.
}

TrackHeader::TrackHeader() {
  flags = kTrackEnabled | kTrackInMovie | kTrackInPreview;
}

TrackHeader::~TrackHeader() = default;

FourCC TrackHeader::BoxType() const {
  return FOURCC_tkhd;
}

bool TrackHeader::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer));

  size_t num_bytes = (version == 1) ? sizeof(uint64_t) : sizeof(uint32_t);
  RCHECK(buffer->WriteUInt64NBytes(creation_time, num_bytes) &&
         buffer->WriteUInt64NBytes(modification_time, num_bytes) &&
         buffer->WriteUInt32(track_id) &&
         buffer->IgnoreBytes(4) &&  // reserved
         buffer->WriteUInt64NBytes(duration, num_bytes));

  std::vector<uint8_t> matrix(std::begin(kUnityMatrix), std::end(kUnityMatrix));
  RCHECK(buffer->IgnoreBytes(8) &&  // reserved
         buffer->WriteInt16(layer) && buffer->WriteInt16(alternate_group) &&
         buffer->WriteInt16(volume) &&
         buffer->IgnoreBytes(2) &&  // reserved
         buffer->WriteVector(matrix) && buffer->WriteUInt32(width) &&
         buffer->WriteUInt32(height));
  return true;
}

size_t TrackHeader::ComputeSizeInternal() {
  version = IsFitIn32Bits(creation_time, modification_time, duration) ? 0 : 1;
  return HeaderSize() + sizeof(track_id) +
         sizeof(uint32_t) * (1 + version) * 3 + sizeof(layer) +
         sizeof(alternate_group) + sizeof(volume) + sizeof(width) +
         sizeof(height) + sizeof(kUnityMatrix) + 14;  // 14 bytes reserved.
}

TrackReferenceType::TrackReferenceType() = default;
TrackReferenceType::~TrackReferenceType() = default;

FourCC TrackReferenceType::BoxType() const {
  return reference_type;
}

bool TrackReferenceType::WriteInternal(BoxBuffer* buffer) {
  DCHECK_NE(reference_type, FOURCC_NULL);
  RCHECK(WriteHeaderInternal(buffer));
  for (uint32_t track_id : track_ids)
    RCHECK(buffer->WriteUInt32(track_id));
  return true;
}

size_t TrackReferenceType::ComputeSizeInternal() {
  return HeaderSize() + sizeof(uint32_t) * track_ids.size();
}

TrackReference::TrackReference() = default;
TrackReference::~TrackReference() = default;

FourCC TrackReference::BoxType() const {
  return FOURCC_tref;
}

bool TrackReference::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer));
  for (TrackReferenceType& reference : references)
    RCHECK(buffer->WriteChild(&reference));
  return true;
}

size_t TrackReference::ComputeSizeInternal() {
  // Track reference box is optional. Skip it if it is empty.
  if (references.empty())
    return 0;
  size_t box_size = HeaderSize();
  for (TrackReferenceType& reference : references)
    box_size += reference.ComputeSize();
  return box_size;
}

CodecConfigurationConstraints::CodecConfigurationConstraints() = default;
CodecConfigurationConstraints::~CodecConfigurationConstraints() = default;

FourCC CodecConfigurationConstraints::BoxType() const {
  return FOURCC_ccst;
}

bool CodecConfigurationConstraints::WriteInternal(BoxBuffer* buffer) {
  DCHECK_LT(max_ref_per_pic, 16u);
  // all_ref_pics_intra (1), intra_pred_used (1), max_ref_per_pic (4),
  // reserved (26).
  const uint32_t constraints =
      (static_cast<uint32_t>(all_ref_pics_intra) << 31) |
      (static_cast<uint32_t>(intra_pred_used) << 30) |
      (static_cast<uint32_t>(max_ref_per_pic) << 26);
  return WriteHeaderInternal(buffer) && buffer->WriteUInt32(constraints);
}

size_t CodecConfigurationConstraints::ComputeSizeInternal() {
  return HeaderSize() + sizeof(uint32_t);
}

AuxiliaryTypeInfo::AuxiliaryTypeInfo() = default;
AuxiliaryTypeInfo::~AuxiliaryTypeInfo() = default;

FourCC AuxiliaryTypeInfo::BoxType() const {
  return FOURCC_auxi;
}

bool AuxiliaryTypeInfo::WriteInternal(BoxBuffer* buffer) {
  return WriteHeaderInternal(buffer) && buffer->WriteCString(aux_track_type);
}

size_t AuxiliaryTypeInfo::ComputeSizeInternal() {
  // This box is optional. Skip it if it is not initialized.
  if (aux_track_type.empty())
    return 0;
  return HeaderSize() + aux_track_type.size() + 1;
}

VideoSampleEntry::VideoSampleEntry() = default;
VideoSampleEntry::~VideoSampleEntry() = default;

FourCC VideoSampleEntry::BoxType() const {
  if (format == FOURCC_NULL) {
    LOG(ERROR) << "VideoSampleEntry should be parsed according to the "
               << "handler type recovered in its Media ancestor.";
  }
  return format;
}

bool VideoSampleEntry::WriteInternal(BoxBuffer* buffer) {
  if (format != FOURCC_av01) {
    LOG(ERROR) << FourCCToString(format) << " is not supported.";
    return false;
  }
  DCHECK_EQ(codec_configuration.box_type, FOURCC_av1C);

  std::vector<uint8_t> compressor_name(std::begin(kAv1CompressorName),
                                       std::end(kAv1CompressorName));
  compressor_name.resize(kCompressorNameSize);

  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->IgnoreBytes(6) &&  // reserved.
         buffer->WriteUInt16(data_reference_index) &&
         buffer->IgnoreBytes(16) &&  // predefined 0.
         buffer->WriteUInt16(width) && buffer->WriteUInt16(height) &&
         buffer->WriteUInt32(kVideoResolution) &&
         buffer->WriteUInt32(kVideoResolution) &&
         buffer->IgnoreBytes(4) &&  // reserved.
         buffer->WriteUInt16(kVideoFrameCount) &&
         buffer->WriteVector(compressor_name) &&
         buffer->WriteUInt16(kVideoDepth) &&
         buffer->WriteInt16(-1));  // predefined.

  RCHECK(buffer->WriteChild(&codec_configuration) &&
         buffer->TryWriteChild(&colr) && buffer->WriteChild(&ccst) &&
         buffer->TryWriteChild(&auxi));
  return true;
}

size_t VideoSampleEntry::ComputeSizeInternal() {
  return HeaderSize() + sizeof(data_reference_index) + sizeof(width) +
         sizeof(height) + sizeof(kVideoResolution) * 2 +
         sizeof(kVideoFrameCount) + sizeof(kVideoDepth) + kCompressorNameSize +
         codec_configuration.ComputeSize() + colr.ComputeSize() +
         ccst.ComputeSize() + auxi.ComputeSize() + 6 + 4 + 16 +
         2;  // 6 + 4 bytes reserved, 16 + 2 bytes predefined.
}

SampleDescription::SampleDescription() = default;
SampleDescription::~SampleDescription() = default;

FourCC SampleDescription::BoxType() const {
  return FOURCC_stsd;
}

bool SampleDescription::WriteInternal(BoxBuffer* buffer) {
  DCHECK(!video_entries.empty());
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteUInt32(static_cast<uint32_t>(video_entries.size())));
  for (VideoSampleEntry& entry : video_entries)
    RCHECK(buffer->WriteChild(&entry));
  return true;
}

size_t SampleDescription::ComputeSizeInternal() {
  size_t box_size = HeaderSize() + sizeof(uint32_t);
  for (VideoSampleEntry& entry : video_entries)
    box_size += entry.ComputeSize();
  return box_size;
}

DecodingTimeToSample::DecodingTimeToSample() = default;
DecodingTimeToSample::~DecodingTimeToSample() = default;

FourCC DecodingTimeToSample::BoxType() const {
  return FOURCC_stts;
}

bool DecodingTimeToSample::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteUInt32(static_cast<uint32_t>(decoding_time.size())));
  for (const DecodingTime& entry : decoding_time) {
    RCHECK(buffer->WriteUInt32(entry.sample_count) &&
           buffer->WriteUInt32(entry.sample_delta));
  }
  return true;
}

size_t DecodingTimeToSample::ComputeSizeInternal() {
  return HeaderSize() + sizeof(uint32_t) +
         sizeof(DecodingTime) * decoding_time.size();
}

SampleToChunk::SampleToChunk() = default;
SampleToChunk::~SampleToChunk() = default;

FourCC SampleToChunk::BoxType() const {
  return FOURCC_stsc;
}

bool SampleToChunk::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteUInt32(static_cast<uint32_t>(chunk_info.size())));
  for (size_t i = 0; i < chunk_info.size(); ++i) {
    // first_chunk values are always increasing.
    RCHECK(i == 0 ? chunk_info[i].first_chunk == 1
                  : chunk_info[i].first_chunk > chunk_info[i - 1].first_chunk);
    RCHECK(buffer->WriteUInt32(chunk_info[i].first_chunk) &&
           buffer->WriteUInt32(chunk_info[i].samples_per_chunk) &&
           buffer->WriteUInt32(chunk_info[i].sample_description_index));
  }
  return true;
}

size_t SampleToChunk::ComputeSizeInternal() {
  return HeaderSize() + sizeof(uint32_t) +
         sizeof(ChunkInfo) * chunk_info.size();
}

SampleSize::SampleSize() = default;
SampleSize::~SampleSize() = default;

FourCC SampleSize::BoxType() const {
  return FOURCC_stsz;
}

bool SampleSize::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteUInt32(sample_size) &&
         buffer->WriteUInt32(sample_count));

  if (sample_size == 0) {
    DCHECK_EQ(sample_count, sizes.size());
    for (uint32_t size : sizes)
      RCHECK(buffer->WriteUInt32(size));
  }
  return true;
}

size_t SampleSize::ComputeSizeInternal() {
  return HeaderSize() + sizeof(sample_size) + sizeof(sample_count) +
         (sample_size == 0 ? sizeof(uint32_t) * sizes.size() : 0);
}

ChunkOffset::ChunkOffset() = default;
ChunkOffset::~ChunkOffset() = default;

FourCC ChunkOffset::BoxType() const {
  return FOURCC_stco;
}

bool ChunkOffset::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteUInt32(static_cast<uint32_t>(offsets.size())));
  for (uint32_t offset : offsets)
    RCHECK(buffer->WriteUInt32(offset));
  return true;
}

size_t ChunkOffset::ComputeSizeInternal() {
  return HeaderSize() + sizeof(uint32_t) + sizeof(uint32_t) * offsets.size();
}

SyncSample::SyncSample() = default;
SyncSample::~SyncSample() = default;

FourCC SyncSample::BoxType() const {
  return FOURCC_stss;
}

bool SyncSample::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteUInt32(static_cast<uint32_t>(sample_number.size())));
  for (uint32_t number : sample_number)
    RCHECK(buffer->WriteUInt32(number));
  return true;
}

size_t SyncSample::ComputeSizeInternal() {
  return HeaderSize() + sizeof(uint32_t) +
         sizeof(uint32_t) * sample_number.size();
}

SampleTable::SampleTable() = default;
SampleTable::~SampleTable() = default;

FourCC SampleTable::BoxType() const {
  return FOURCC_stbl;
}

bool SampleTable::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteChild(&description) &&
         buffer->WriteChild(&decoding_time_to_sample) &&
         buffer->WriteChild(&sample_to_chunk) &&
         buffer->WriteChild(&sample_size) &&
         buffer->WriteChild(&chunk_offset));
  if (sync_sample)
    RCHECK(buffer->WriteChild(&*sync_sample));
  return true;
}

size_t SampleTable::ComputeSizeInternal() {
  return HeaderSize() + description.ComputeSize() +
         decoding_time_to_sample.ComputeSize() +
         sample_to_chunk.ComputeSize() + sample_size.ComputeSize() +
         chunk_offset.ComputeSize() +
         (sync_sample ? sync_sample->ComputeSize() : 0);
}

MediaHeader::MediaHeader() = default;
MediaHeader::~MediaHeader() = default;

FourCC MediaHeader::BoxType() const {
  return FOURCC_mdhd;
}

bool MediaHeader::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer));

  // Lang format: bit(1) pad, unsigned int(5)[3] language.
  DCHECK_EQ(language.size(), 3u);
  uint16_t lang = 0;
  for (int i = 0; i < 3; ++i)
    lang |= (language[i] - 0x60) << ((2 - i) * 5);

  uint8_t num_bytes = (version == 1) ? sizeof(uint64_t) : sizeof(uint32_t);
  RCHECK(buffer->WriteUInt64NBytes(creation_time, num_bytes) &&
         buffer->WriteUInt64NBytes(modification_time, num_bytes) &&
         buffer->WriteUInt32(timescale) &&
         buffer->WriteUInt64NBytes(duration, num_bytes) &&
         buffer->WriteUInt16(lang) &&
         // predefined.
         buffer->IgnoreBytes(2));
  return true;
}

size_t MediaHeader::ComputeSizeInternal() {
  version = IsFitIn32Bits(creation_time, modification_time, duration) ? 0 : 1;
  return HeaderSize() + sizeof(timescale) +
         sizeof(uint32_t) * (1 + version) * 3 + sizeof(uint16_t) +
         2;  // 2 bytes predefined.
}

VideoMediaHeader::VideoMediaHeader() {
  const uint32_t kVideoMediaHeaderFlags = 1;
  flags = kVideoMediaHeaderFlags;
}

VideoMediaHeader::~VideoMediaHeader() = default;

FourCC VideoMediaHeader::BoxType() const {
  return FOURCC_vmhd;
}

bool VideoMediaHeader::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteUInt16(graphicsmode) &&
         buffer->WriteUInt16(opcolor_red) &&
         buffer->WriteUInt16(opcolor_green) &&
         buffer->WriteUInt16(opcolor_blue));
  return true;
}

size_t VideoMediaHeader::ComputeSizeInternal() {
  return HeaderSize() + sizeof(graphicsmode) + sizeof(opcolor_red) +
         sizeof(opcolor_green) + sizeof(opcolor_blue);
}

DataEntryUrl::DataEntryUrl() {
  const uint32_t kDataEntryUrlFlags = 1;
  flags = kDataEntryUrlFlags;
}

DataEntryUrl::~DataEntryUrl() = default;

FourCC DataEntryUrl::BoxType() const {
  return FOURCC_url;
}

bool DataEntryUrl::WriteInternal(BoxBuffer* buffer) {
  return WriteHeaderInternal(buffer) && buffer->WriteVector(location);
}

size_t DataEntryUrl::ComputeSizeInternal() {
  return HeaderSize() + location.size();
}

DataReference::DataReference() = default;
DataReference::~DataReference() = default;

FourCC DataReference::BoxType() const {
  return FOURCC_dref;
}

bool DataReference::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) &&
         buffer->WriteUInt32(static_cast<uint32_t>(data_entry.size())));
  for (DataEntryUrl& entry : data_entry)
    RCHECK(buffer->WriteChild(&entry));
  return true;
}

size_t DataReference::ComputeSizeInternal() {
  size_t box_size = HeaderSize() + sizeof(uint32_t);
  for (DataEntryUrl& entry : data_entry)
    box_size += entry.ComputeSize();
  return box_size;
}

DataInformation::DataInformation() = default;
DataInformation::~DataInformation() = default;

FourCC DataInformation::BoxType() const {
  return FOURCC_dinf;
}

bool DataInformation::WriteInternal(BoxBuffer* buffer) {
  return WriteHeaderInternal(buffer) && buffer->WriteChild(&dref);
}

size_t DataInformation::ComputeSizeInternal() {
  return HeaderSize() + dref.ComputeSize();
}

MediaInformation::MediaInformation() = default;
MediaInformation::~MediaInformation() = default;

FourCC MediaInformation::BoxType() const {
  return FOURCC_minf;
}

bool MediaInformation::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteChild(&vmhd) &&
         buffer->WriteChild(&dinf) && buffer->WriteChild(&sample_table));
  return true;
}

size_t MediaInformation::ComputeSizeInternal() {
  return HeaderSize() + vmhd.ComputeSize() + dinf.ComputeSize() +
         sample_table.ComputeSize();
}

Media::Media() = default;
Media::~Media() = default;

FourCC Media::BoxType() const {
  return FOURCC_mdia;
}

bool Media::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteChild(&header) &&
         buffer->WriteChild(&handler) && buffer->WriteChild(&information));
  return true;
}

size_t Media::ComputeSizeInternal() {
  return HeaderSize() + header.ComputeSize() + handler.ComputeSize() +
         information.ComputeSize();
}

Track::Track() = default;
Track::~Track() = default;

FourCC Track::BoxType() const {
  return FOURCC_trak;
}

bool Track::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteChild(&header) &&
         buffer->TryWriteChild(&reference) && buffer->WriteChild(&media));
  return true;
}

size_t Track::ComputeSizeInternal() {
  return HeaderSize() + header.ComputeSize() + reference.ComputeSize() +
         media.ComputeSize();
}

Movie::Movie() = default;
Movie::~Movie() = default;

FourCC Movie::BoxType() const {
  return FOURCC_moov;
}

bool Movie::WriteInternal(BoxBuffer* buffer) {
  RCHECK(WriteHeaderInternal(buffer) && buffer->WriteChild(&header));
  for (Track& track : tracks)
    RCHECK(buffer->WriteChild(&track));
  return true;
}

size_t Movie::ComputeSizeInternal() {
  size_t box_size = HeaderSize() + header.ComputeSize();
  for (Track& track : tracks)
    box_size += track.ComputeSize();
  return box_size;
}

MediaData::MediaData() = default;
MediaData::~MediaData() = default;

FourCC MediaData::BoxType() const {
  return FOURCC_mdat;
}

bool MediaData::WriteInternal(BoxBuffer* buffer) {
  NOTIMPLEMENTED() << "Actual data is written separately.";
  return false;
}

size_t MediaData::ComputeSizeInternal() {
  return HeaderSize() + data_size;
}

}  // namespace mp4
}  // namespace media
}  // namespace avifmux
