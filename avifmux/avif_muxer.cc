// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/avif_muxer.h>

#include <limits>

#include <absl/log/check.h>
#include <absl/log/log.h>

#include <avifmux/file.h>
#include <avifmux/macros/status.h>
#include <avifmux/media/codecs/av1_codec_configuration_record.h>
#include <avifmux/media/formats/mp4/avif_file.h>
#include <avifmux/media/formats/mp4/box_definitions.h>
#include <avifmux/media/formats/mp4/sample_table_builder.h>

namespace avifmux {

using media::AV1CodecConfigurationRecord;
using media::mp4::AvifFile;

namespace mp4 = media::mp4;

namespace {

const uint16_t kColorItemId = 1;
const uint16_t kAlphaItemId = 2;
const uint32_t kColorTrackId = 1;
const uint32_t kAlphaTrackId = 2;

const char kColorItemName[] = "Color";
const char kAlphaItemName[] = "Alpha";
const char kHandlerName[] = "avifmux";
const char kAlphaAuxiliaryType[] =
    "urn:mpeg:mpegB:cicp:systems:auxiliary:alpha";

// seq_level_idx 31 places no constraint on the stream.
const uint8_t kAv1Level = 31;
const uint8_t kAv1MainTier = 0;
const uint8_t kAv1ProfileMain = 0;
const uint8_t kAv1ProfileHigh = 1;
const uint8_t kAv1ProfileProfessional = 2;

// Sequences loop forever.
const uint64_t kIndefiniteDuration = std::numeric_limits<uint64_t>::max();

// The color image is 4:4:4, which needs the high profile unless the depth
// calls for the professional one.
AV1CodecConfigurationRecord ColorConfiguration(uint8_t depth_bits) {
  AV1CodecConfigurationRecord config;
  config.set_profile(depth_bits >= 12 ? kAv1ProfileProfessional
                                      : kAv1ProfileHigh);
  config.set_level(kAv1Level);
  config.set_tier(kAv1MainTier);
  config.set_bit_depth(depth_bits);
  return config;
}

AV1CodecConfigurationRecord AlphaConfiguration(uint8_t depth_bits) {
  AV1CodecConfigurationRecord config;
  config.set_profile(depth_bits >= 12 ? kAv1ProfileProfessional
                                      : kAv1ProfileMain);
  config.set_level(kAv1Level);
  config.set_tier(kAv1MainTier);
  config.set_bit_depth(depth_bits);
  config.set_mono_chrome(true);
  config.set_chroma_subsampling_x(true);
  config.set_chroma_subsampling_y(true);
  return config;
}

mp4::CodecConfiguration ToCodecConfiguration(
    const AV1CodecConfigurationRecord& config) {
  mp4::CodecConfiguration av1c;
  av1c.box_type = media::FOURCC_av1C;
  config.WriteToVector(&av1c.data);
  VLOG(1) << "AV1 configuration " << config.GetCodecString();
  return av1c;
}

mp4::ColorParameters ToColorParameters(const ColorParams& color) {
  mp4::ColorParameters colr;
  colr.color_parameter_type = media::FOURCC_nclx;
  colr.color_primaries = static_cast<uint16_t>(color.color_primaries);
  colr.transfer_characteristics =
      static_cast<uint16_t>(color.transfer_characteristics);
  colr.matrix_coefficients = static_cast<uint16_t>(color.matrix_coefficients);
  colr.video_full_range_flag = color.full_range ? 1 : 0;
  return colr;
}

void AddItem(uint16_t item_id,
             const char* item_name,
             uint32_t payload_offset,
             size_t size,
             mp4::Metadata* meta) {
  mp4::ItemInfoEntry infe;
  infe.item_id = item_id;
  infe.item_type = media::FOURCC_av01;
  infe.item_name = item_name;
  meta->item_info.entries.push_back(infe);

  mp4::ItemLocationEntry location;
  location.item_id = item_id;
  location.extents.resize(1);
  location.extents[0].offset = payload_offset;
  location.extents[0].length = static_cast<uint32_t>(size);
  meta->item_location.items.push_back(location);
}

void AddItemReference(media::FourCC type,
                      uint16_t from_item_id,
                      uint16_t to_item_id,
                      mp4::ItemReference* iref) {
  mp4::SingleItemTypeReference reference;
  reference.reference_type = type;
  reference.from_item_id = from_item_id;
  reference.to_item_ids.push_back(to_item_id);
  iref->references.push_back(reference);
}

// Sum of the frame sizes, which must match the size of the track's data.
uint64_t FramesDataSize(const std::vector<FrameInfo>& frames) {
  uint64_t data_size = 0;
  for (const FrameInfo& frame : frames)
    data_size += frame.size;
  return data_size;
}

struct TrackParams {
  uint32_t track_id;
  media::FourCC handler_type;
  const AV1CodecConfigurationRecord* config;
  const std::vector<FrameInfo>* frames;
};

void GenerateTrack(const TrackParams& params,
                   const AvifImageParams& image,
                   mp4::Track* trak) {
  trak->header.flags = mp4::TrackHeader::kTrackEnabled;
  trak->header.track_id = params.track_id;
  trak->header.duration = kIndefiniteDuration;
  trak->header.width = image.width << 16;
  trak->header.height = image.height << 16;

  trak->media.header.timescale = image.timescale;
  trak->media.handler.handler_type = params.handler_type;
  trak->media.handler.name = kHandlerName;

  mp4::SampleTable& stbl = trak->media.information.sample_table;
  stbl.description.video_entries.resize(1);
  mp4::VideoSampleEntry& entry = stbl.description.video_entries[0];
  entry.format = media::FOURCC_av01;
  entry.width = static_cast<uint16_t>(image.width);
  entry.height = static_cast<uint16_t>(image.height);
  entry.codec_configuration = ToCodecConfiguration(*params.config);

  // The offset is filled in once the file layout is known.
  stbl.chunk_offset.offsets.resize(1);

  mp4::SampleTableBuilder builder(&stbl);
  builder.AddFrames(*params.frames);
  builder.Finalize();
  trak->media.header.duration = builder.duration();
}

// Build the box tree of |image| into |avif_file| and queue its payload.
void Assemble(const AvifMuxerParams& params,
              const AvifImageParams& image,
              AvifFile* avif_file) {
  DCHECK(image.color_data);
  DCHECK(image.depth_bits == 8 || image.depth_bits == 10 ||
         image.depth_bits == 12)
      << "Unsupported depth " << static_cast<int>(image.depth_bits);
  DCHECK(!image.alpha_frames || image.alpha_data)
      << "Alpha frames without alpha data.";

  const bool has_alpha = image.alpha_data != nullptr;
  const bool is_sequence = image.color_frames.has_value();
  const bool has_alpha_track = is_sequence && image.alpha_frames && has_alpha;
  DCHECK(!is_sequence ||
         FramesDataSize(*image.color_frames) == image.color_data_size);
  DCHECK(!has_alpha_track ||
         FramesDataSize(*image.alpha_frames) == image.alpha_data_size);

  mp4::FileType& ftyp = avif_file->ftyp();
  ftyp.major_brand = is_sequence ? media::FOURCC_avis : media::FOURCC_avif;
  ftyp.compatible_brands.push_back(media::FOURCC_avif);
  if (is_sequence)
    ftyp.compatible_brands.push_back(media::FOURCC_avis);
  ftyp.compatible_brands.push_back(media::FOURCC_mif1);
  ftyp.compatible_brands.push_back(media::FOURCC_miaf);

  mp4::Metadata& meta = avif_file->meta();
  meta.handler.handler_type = media::FOURCC_pict;
  meta.handler.name = kHandlerName;
  meta.primary_item.item_id = kColorItemId;

  // Still images store alpha first. Sequences store the track chunks in
  // track order.
  uint32_t color_offset = 0;
  uint32_t alpha_offset = 0;
  if (has_alpha) {
    if (is_sequence) {
      alpha_offset = static_cast<uint32_t>(image.color_data_size);
    } else {
      color_offset = static_cast<uint32_t>(image.alpha_data_size);
    }
  }

  const AV1CodecConfigurationRecord color_config =
      ColorConfiguration(image.depth_bits);
  const AV1CodecConfigurationRecord alpha_config =
      AlphaConfiguration(image.depth_bits);
  const bool emit_colr = params.color != ColorParams();

  mp4::ItemPropertyContainer& ipco = meta.properties.container;
  mp4::ItemPropertyAssociation& ipma = meta.properties.association;

  mp4::ImageSpatialExtents ispe;
  ispe.width = image.width;
  ispe.height = image.height;
  const uint8_t ispe_index = ipco.AddProperty(ispe);

  mp4::PixelInformation color_pixi;
  color_pixi.bits_per_channel.assign(3, image.depth_bits);
  const uint8_t color_pixi_index = ipco.AddProperty(color_pixi);
  const uint8_t color_av1c_index =
      ipco.AddProperty(ToCodecConfiguration(color_config));

  AddItem(kColorItemId, kColorItemName, color_offset, image.color_data_size,
          &meta);
  mp4::ItemPropertyAssociationEntry color_entry;
  color_entry.item_id = kColorItemId;
  color_entry.associations = {{ispe_index, false},
                              {color_pixi_index, false},
                              {color_av1c_index, true}};
  if (emit_colr) {
    const uint8_t colr_index =
        ipco.AddProperty(ToColorParameters(params.color));
    color_entry.associations.push_back({colr_index, false});
  }
  ipma.entries.push_back(color_entry);

  if (has_alpha) {
    mp4::PixelInformation alpha_pixi;
    alpha_pixi.bits_per_channel.assign(1, image.depth_bits);
    const uint8_t alpha_pixi_index = ipco.AddProperty(alpha_pixi);
    const uint8_t alpha_av1c_index =
        ipco.AddProperty(ToCodecConfiguration(alpha_config));
    mp4::AuxiliaryTypeProperty auxc;
    auxc.aux_type = kAlphaAuxiliaryType;
    const uint8_t auxc_index = ipco.AddProperty(auxc);

    AddItem(kAlphaItemId, kAlphaItemName, alpha_offset, image.alpha_data_size,
            &meta);
    AddItemReference(media::FOURCC_auxl, kAlphaItemId, kColorItemId,
                     &meta.item_reference);
    if (params.premultiplied_alpha) {
      AddItemReference(media::FOURCC_prem, kColorItemId, kAlphaItemId,
                       &meta.item_reference);
    }

    mp4::ItemPropertyAssociationEntry alpha_entry;
    alpha_entry.item_id = kAlphaItemId;
    alpha_entry.associations = {{ispe_index, false},
                                {alpha_pixi_index, false},
                                {alpha_av1c_index, true},
                                {auxc_index, false}};
    ipma.entries.push_back(alpha_entry);
  }

  if (is_sequence) {
    mp4::Movie& moov = avif_file->moov().emplace();
    moov.header.timescale = image.timescale;
    moov.header.duration = kIndefiniteDuration;
    moov.tracks.resize(has_alpha_track ? 2 : 1);
    moov.header.next_track_id = static_cast<uint32_t>(moov.tracks.size()) + 1;

    GenerateTrack({kColorTrackId, media::FOURCC_pict, &color_config,
                   &*image.color_frames},
                  image, &moov.tracks[0]);
    // Sample entries always describe the color, defaults included.
    moov.tracks[0].media.information.sample_table.description.video_entries[0]
        .colr = ToColorParameters(params.color);

    if (has_alpha_track) {
      mp4::Track& alpha_trak = moov.tracks[1];
      GenerateTrack({kAlphaTrackId, media::FOURCC_auxv, &alpha_config,
                     &*image.alpha_frames},
                    image, &alpha_trak);
      mp4::TrackReferenceType auxl;
      auxl.reference_type = media::FOURCC_auxl;
      auxl.track_ids.push_back(kColorTrackId);
      alpha_trak.reference.references.push_back(auxl);
      alpha_trak.media.information.sample_table.description.video_entries[0]
          .auxi.aux_track_type = kAlphaAuxiliaryType;
    }
  }

  if (has_alpha && !is_sequence)
    avif_file->AddDataChunk(image.alpha_data, image.alpha_data_size);
  avif_file->AddDataChunk(image.color_data, image.color_data_size);
  if (has_alpha && is_sequence)
    avif_file->AddDataChunk(image.alpha_data, image.alpha_data_size);
}

}  // namespace

AvifMuxer::AvifMuxer() = default;

AvifMuxer::AvifMuxer(const AvifMuxerParams& params) : params_(params) {}

AvifMuxer::~AvifMuxer() = default;

Status AvifMuxer::Write(const AvifImageParams& image, File* file) const {
  DCHECK(file);
  AvifFile avif_file;
  Assemble(params_, image, &avif_file);
  RETURN_IF_ERROR(avif_file.FinalizeLayout());
  return avif_file.Write(file);
}

Status AvifMuxer::WriteToVector(const AvifImageParams& image,
                                std::vector<uint8_t>* output) const {
  DCHECK(output);
  AvifFile avif_file;
  Assemble(params_, image, &avif_file);
  RETURN_IF_ERROR(avif_file.FinalizeLayout());
  avif_file.WriteToVector(output);
  return Status::OK;
}

}  // namespace avifmux
