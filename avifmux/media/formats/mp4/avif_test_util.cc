// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/formats/mp4/avif_test_util.h>

#include <absl/log/log.h>

#include <avifmux/media/base/buffer_reader.h>

namespace avifmux {
namespace media {
namespace mp4 {

namespace {

// Sample entry fields preceding the child boxes of a visual sample entry.
const size_t kVisualSampleEntryFieldsSize = 78;
// Version and flags of a full box.
const size_t kFullBoxFieldsSize = 4;

struct BoxHeader {
  FourCC type;
  // Offset of the first byte after the box header.
  size_t body;
  // Offset of the first byte after the box.
  size_t end;
};

bool ReadBoxHeader(const std::vector<uint8_t>& file,
                   size_t pos,
                   size_t end,
                   BoxHeader* header) {
  BufferReader reader(file.data() + pos, end - pos);
  uint32_t size = 0;
  uint32_t type = 0;
  if (!reader.Read4(&size) || !reader.Read4(&type))
    return false;
  if (size < reader.pos() || size > end - pos) {
    LOG(ERROR) << "Invalid size " << size << " for box "
               << FourCCToString(static_cast<FourCC>(type));
    return false;
  }
  header->type = static_cast<FourCC>(type);
  header->body = pos + reader.pos();
  header->end = pos + size;
  return true;
}

// Calls |visitor| for each box in [begin, end).
template <typename Visitor>
bool ForEachBox(const std::vector<uint8_t>& file,
                size_t begin,
                size_t end,
                Visitor visitor) {
  size_t pos = begin;
  while (pos < end) {
    BoxHeader header;
    if (!ReadBoxHeader(file, pos, end, &header) || !visitor(header))
      return false;
    pos = header.end;
  }
  return true;
}

bool ReadUInt32List(BufferReader* reader, std::vector<uint32_t>* values) {
  uint32_t count = 0;
  if (!reader->Read4(&count))
    return false;
  values->resize(count);
  for (uint32_t& value : *values) {
    if (!reader->Read4(&value))
      return false;
  }
  return true;
}

}  // namespace

AvifTestReader::AvifTestReader(const std::vector<uint8_t>& file)
    : file_(file) {}

bool AvifTestReader::Parse() {
  return ForEachBox(file_, 0, file_.size(), [this](const BoxHeader& box) {
    top_level_boxes_.push_back(box.type);
    switch (box.type) {
      case FOURCC_ftyp: {
        BufferReader reader(file_.data() + box.body, box.end - box.body);
        uint32_t brand = 0;
        uint32_t minor_version = 0;
        if (!reader.Read4(&brand) || !reader.Read4(&minor_version))
          return false;
        major_brand_ = static_cast<FourCC>(brand);
        while (reader.HasBytes(4)) {
          if (!reader.Read4(&brand))
            return false;
          compatible_brands_.push_back(static_cast<FourCC>(brand));
        }
        return true;
      }
      case FOURCC_meta:
        return ParseMeta(box.body, box.end);
      case FOURCC_moov:
        return ParseMovie(box.body, box.end);
      case FOURCC_mdat:
        payload_offset_ = box.body;
        return true;
      default:
        LOG(ERROR) << "Unexpected top level box "
                   << FourCCToString(box.type);
        return false;
    }
  });
}

bool AvifTestReader::ParseMeta(size_t begin, size_t end) {
  return ForEachBox(
      file_, begin + kFullBoxFieldsSize, end, [this](const BoxHeader& box) {
        switch (box.type) {
          case FOURCC_pitm: {
            BufferReader reader(file_.data() + box.body, box.end - box.body);
            return reader.SkipBytes(kFullBoxFieldsSize) &&
                   reader.Read2(&primary_item_id_);
          }
          case FOURCC_iloc:
            return ParseItemLocation(box.body, box.end);
          case FOURCC_iref:
            return ParseItemReference(box.body, box.end);
          case FOURCC_iprp:
            return ParseItemProperties(box.body, box.end);
          default:
            return true;
        }
      });
}

bool AvifTestReader::ParseItemLocation(size_t begin, size_t end) {
  BufferReader reader(file_.data() + begin, end - begin);
  uint32_t version_and_flags = 0;
  uint8_t offset_and_length_size = 0;
  uint8_t base_offset_size = 0;
  uint16_t item_count = 0;
  if (!reader.Read4(&version_and_flags) ||
      !reader.Read1(&offset_and_length_size) ||
      !reader.Read1(&base_offset_size) || !reader.Read2(&item_count)) {
    return false;
  }
  // Only 32-bit offsets and lengths without base offsets are understood.
  if (version_and_flags != 0 || offset_and_length_size != 0x44 ||
      base_offset_size != 0) {
    return false;
  }
  for (uint16_t i = 0; i < item_count; ++i) {
    uint16_t item_id = 0;
    uint16_t data_reference_index = 0;
    uint16_t extent_count = 0;
    if (!reader.Read2(&item_id) || !reader.Read2(&data_reference_index) ||
        !reader.Read2(&extent_count) || data_reference_index != 0) {
      return false;
    }
    std::vector<Extent>& extents = item_extents_[item_id];
    extents.resize(extent_count);
    for (Extent& extent : extents) {
      if (!reader.Read4(&extent.offset) || !reader.Read4(&extent.length))
        return false;
    }
  }
  return true;
}

bool AvifTestReader::ParseItemReference(size_t begin, size_t end) {
  return ForEachBox(
      file_, begin + kFullBoxFieldsSize, end, [this](const BoxHeader& box) {
        BufferReader reader(file_.data() + box.body, box.end - box.body);
        ItemReferenceEntry entry;
        entry.type = box.type;
        uint16_t count = 0;
        if (!reader.Read2(&entry.from_item_id) || !reader.Read2(&count))
          return false;
        entry.to_item_ids.resize(count);
        for (uint16_t& to_item_id : entry.to_item_ids) {
          if (!reader.Read2(&to_item_id))
            return false;
        }
        item_references_.push_back(entry);
        return true;
      });
}

bool AvifTestReader::ParseItemProperties(size_t begin, size_t end) {
  return ForEachBox(file_, begin, end, [this](const BoxHeader& box) {
    if (box.type == FOURCC_ipco) {
      return ForEachBox(file_, box.body, box.end,
                        [this](const BoxHeader& property) {
                          property_types_.push_back(property.type);
                          return true;
                        });
    }
    if (box.type != FOURCC_ipma)
      return true;

    BufferReader reader(file_.data() + box.body, box.end - box.body);
    uint32_t version_and_flags = 0;
    uint32_t entry_count = 0;
    if (!reader.Read4(&version_and_flags) || version_and_flags != 0 ||
        !reader.Read4(&entry_count)) {
      return false;
    }
    for (uint32_t i = 0; i < entry_count; ++i) {
      uint16_t item_id = 0;
      uint8_t count = 0;
      if (!reader.Read2(&item_id) || !reader.Read1(&count))
        return false;
      std::vector<Association>& associations = associations_[item_id];
      for (uint8_t j = 0; j < count; ++j) {
        uint8_t value = 0;
        if (!reader.Read1(&value))
          return false;
        associations.push_back(
            {static_cast<uint8_t>(value & 0x7f), (value & 0x80) != 0});
      }
    }
    return true;
  });
}

bool AvifTestReader::ParseMovie(size_t begin, size_t end) {
  return ForEachBox(file_, begin, end, [this](const BoxHeader& box) {
    if (box.type != FOURCC_trak)
      return true;
    TrackInfo track;
    if (!ParseTrack(box.body, box.end, &track))
      return false;
    tracks_.push_back(track);
    return true;
  });
}

bool AvifTestReader::ParseTrack(size_t begin, size_t end, TrackInfo* track) {
  return ForEachBox(file_, begin, end, [this, track](const BoxHeader& box) {
    switch (box.type) {
      case FOURCC_tkhd: {
        BufferReader reader(file_.data() + box.body, box.end - box.body);
        uint8_t version = 0;
        if (!reader.Read1(&version) || !reader.SkipBytes(3))
          return false;
        // Creation and modification times.
        const size_t times_size = version == 1 ? 16 : 8;
        return reader.SkipBytes(times_size) && reader.Read4(&track->track_id);
      }
      case FOURCC_tref:
        return ForEachBox(file_, box.body, box.end,
                          [track](const BoxHeader& reference) {
                            track->references.push_back(reference.type);
                            return true;
                          });
      case FOURCC_mdia:
        return ForEachBox(
            file_, box.body, box.end, [this, track](const BoxHeader& child) {
              if (child.type == FOURCC_hdlr) {
                BufferReader reader(file_.data() + child.body,
                                    child.end - child.body);
                uint32_t handler_type = 0;
                if (!reader.SkipBytes(kFullBoxFieldsSize + 4) ||
                    !reader.Read4(&handler_type)) {
                  return false;
                }
                track->handler_type = static_cast<FourCC>(handler_type);
                return true;
              }
              if (child.type != FOURCC_minf)
                return true;
              return ForEachBox(file_, child.body, child.end,
                                [this, track](const BoxHeader& grandchild) {
                                  if (grandchild.type != FOURCC_stbl)
                                    return true;
                                  return ParseSampleTable(grandchild.body,
                                                          grandchild.end,
                                                          track);
                                });
            });
      default:
        return true;
    }
  });
}

bool AvifTestReader::ParseSampleTable(size_t begin,
                                      size_t end,
                                      TrackInfo* track) {
  return ForEachBox(file_, begin, end, [this, track](const BoxHeader& box) {
    BufferReader reader(file_.data() + box.body, box.end - box.body);
    switch (box.type) {
      case FOURCC_stsd: {
        // Version, flags and entry count precede the sample entry.
        const size_t entry_begin = box.body + kFullBoxFieldsSize + 4;
        return ForEachBox(
            file_, entry_begin, box.end, [this, track](const BoxHeader& entry) {
              return ForEachBox(
                  file_, entry.body + kVisualSampleEntryFieldsSize, entry.end,
                  [track](const BoxHeader& child) {
                    track->has_colr |= child.type == FOURCC_colr;
                    track->has_auxi |= child.type == FOURCC_auxi;
                    return true;
                  });
            });
      }
      case FOURCC_stsz: {
        uint32_t sample_size = 0;
        if (!reader.SkipBytes(kFullBoxFieldsSize) ||
            !reader.Read4(&sample_size) ||
            !ReadUInt32List(&reader, &track->sample_sizes)) {
          return false;
        }
        return sample_size == 0;
      }
      case FOURCC_stco:
        return reader.SkipBytes(kFullBoxFieldsSize) &&
               ReadUInt32List(&reader, &track->chunk_offsets);
      case FOURCC_stss:
        track->has_sync_sample = true;
        return reader.SkipBytes(kFullBoxFieldsSize) &&
               ReadUInt32List(&reader, &track->sync_samples);
      default:
        return true;
    }
  });
}

bool AvifTestReader::ExtractItem(uint16_t item_id,
                                 std::vector<uint8_t>* data) const {
  auto iter = item_extents_.find(item_id);
  if (iter == item_extents_.end())
    return false;
  data->clear();
  for (const Extent& extent : iter->second) {
    if (static_cast<uint64_t>(extent.offset) + extent.length > file_.size())
      return false;
    data->insert(data->end(), file_.begin() + extent.offset,
                 file_.begin() + extent.offset + extent.length);
  }
  return true;
}

bool AvifTestReader::HasItemReference(FourCC type,
                                      uint16_t from,
                                      uint16_t to) const {
  for (const ItemReferenceEntry& entry : item_references_) {
    if (entry.type != type || entry.from_item_id != from)
      continue;
    for (uint16_t to_item_id : entry.to_item_ids) {
      if (to_item_id == to)
        return true;
    }
  }
  return false;
}

}  // namespace mp4
}  // namespace media
}  // namespace avifmux
