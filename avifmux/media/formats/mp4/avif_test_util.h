// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_FORMATS_MP4_AVIF_TEST_UTIL_H_
#define AVIFMUX_MEDIA_FORMATS_MP4_AVIF_TEST_UTIL_H_

#include <cstdint>
#include <map>
#include <vector>

#include <avifmux/media/base/fourccs.h>

namespace avifmux {
namespace media {
namespace mp4 {

/// A minimal AVIF reader for tests. It only understands the boxes needed to
/// check the muxer output and is independent of the box writing code.
class AvifTestReader {
 public:
  struct ItemReferenceEntry {
    FourCC type;
    uint16_t from_item_id;
    std::vector<uint16_t> to_item_ids;
  };

  struct Extent {
    uint32_t offset;
    uint32_t length;
  };

  struct Association {
    uint8_t property_index;
    bool essential;
  };

  struct TrackInfo {
    uint32_t track_id = 0;
    FourCC handler_type = FOURCC_NULL;
    std::vector<FourCC> references;
    std::vector<uint32_t> chunk_offsets;
    std::vector<uint32_t> sample_sizes;
    bool has_sync_sample = false;
    std::vector<uint32_t> sync_samples;
    bool has_colr = false;
    bool has_auxi = false;
  };

  explicit AvifTestReader(const std::vector<uint8_t>& file);

  /// Parse the file. @return false if it is malformed.
  [[nodiscard]] bool Parse();

  /// Copy the data of item @a item_id, following its extents.
  [[nodiscard]] bool ExtractItem(uint16_t item_id,
                                 std::vector<uint8_t>* data) const;

  /// @return true if an iref entry of @a type links @a from to @a to.
  bool HasItemReference(FourCC type, uint16_t from, uint16_t to) const;

  const std::vector<FourCC>& top_level_boxes() const {
    return top_level_boxes_;
  }
  FourCC major_brand() const { return major_brand_; }
  const std::vector<FourCC>& compatible_brands() const {
    return compatible_brands_;
  }
  uint16_t primary_item_id() const { return primary_item_id_; }
  const std::map<uint16_t, std::vector<Extent>>& item_extents() const {
    return item_extents_;
  }
  const std::vector<FourCC>& property_types() const { return property_types_; }
  const std::map<uint16_t, std::vector<Association>>& associations() const {
    return associations_;
  }
  const std::vector<ItemReferenceEntry>& item_references() const {
    return item_references_;
  }
  const std::vector<TrackInfo>& tracks() const { return tracks_; }
  /// File offset of the first mdat payload byte.
  size_t payload_offset() const { return payload_offset_; }

 private:
  bool ParseMeta(size_t begin, size_t end);
  bool ParseItemLocation(size_t begin, size_t end);
  bool ParseItemReference(size_t begin, size_t end);
  bool ParseItemProperties(size_t begin, size_t end);
  bool ParseMovie(size_t begin, size_t end);
  bool ParseTrack(size_t begin, size_t end, TrackInfo* track);
  bool ParseSampleTable(size_t begin, size_t end, TrackInfo* track);

  const std::vector<uint8_t>& file_;

  std::vector<FourCC> top_level_boxes_;
  FourCC major_brand_ = FOURCC_NULL;
  std::vector<FourCC> compatible_brands_;
  uint16_t primary_item_id_ = 0;
  std::map<uint16_t, std::vector<Extent>> item_extents_;
  std::vector<FourCC> property_types_;
  std::map<uint16_t, std::vector<Association>> associations_;
  std::vector<ItemReferenceEntry> item_references_;
  std::vector<TrackInfo> tracks_;
  size_t payload_offset_ = 0;
};

}  // namespace mp4
}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_FORMATS_MP4_AVIF_TEST_UTIL_H_
