// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/formats/mp4/avif_file.h>

#include <limits>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/str_format.h>

#include <avifmux/file.h>
#include <avifmux/macros/status.h>
#include <avifmux/media/base/buffer_writer.h>

namespace avifmux {
namespace media {
namespace mp4 {

namespace {

// Total bytes of all samples described by |stsz|.
uint64_t SampleDataSize(const SampleSize& stsz) {
  if (stsz.sample_size != 0)
    return static_cast<uint64_t>(stsz.sample_size) * stsz.sample_count;
  uint64_t data_size = 0;
  for (uint32_t size : stsz.sizes)
    data_size += size;
  return data_size;
}

}  // namespace

AvifFile::AvifFile() = default;
AvifFile::~AvifFile() = default;

void AvifFile::AddDataChunk(const uint8_t* data, size_t size) {
  DCHECK(!layout_finalized_);
  DCHECK(data || size == 0);
  chunks_.push_back({data, size});
  payload_size_ += size;
}

Status AvifFile::FinalizeLayout() {
  DCHECK(!layout_finalized_) << "Layout finalized twice.";

  // Sizes are final from here on; resolution only rewrites offset values,
  // which have fixed widths.
  MediaData mdat;
  uint64_t headers_size = ftyp_.ComputeSize();
  headers_size += meta_.ComputeSize();
  if (moov_)
    headers_size += moov_->ComputeSize();
  headers_size += mdat.HeaderSize();

  if (headers_size + payload_size_ > std::numeric_limits<uint32_t>::max()) {
    return Status(error::MUXER_FAILURE,
                  absl::StrFormat("File size %u exceeds the 32-bit limit.",
                                  headers_size + payload_size_));
  }
  payload_offset_ = static_cast<uint32_t>(headers_size);

  for (ItemLocationEntry& item : meta_.item_location.items) {
    for (ItemExtent& extent : item.extents) {
      extent.Resolve(payload_offset_);
      VLOG(1) << "Item " << item.item_id << " extent at " << extent.offset
              << ", " << extent.length << " bytes.";
    }
  }

  // Each track has one chunk. Chunks follow each other in track order.
  if (moov_) {
    uint64_t chunk_offset = payload_offset_;
    for (Track& track : moov_->tracks) {
      SampleTable& stbl = track.media.information.sample_table;
      DCHECK_EQ(1u, stbl.chunk_offset.offsets.size());
      stbl.chunk_offset.offsets.assign(1, static_cast<uint32_t>(chunk_offset));
      VLOG(1) << "Track " << track.header.track_id << " chunk at "
              << chunk_offset;
      chunk_offset += SampleDataSize(stbl.sample_size);
    }
    DCHECK_LE(chunk_offset, payload_offset_ + payload_size_);
  }

  layout_finalized_ = true;
  return Status::OK;
}

void AvifFile::WriteHeaders(BufferWriter* buffer) {
  ftyp_.Write(buffer);
  meta_.Write(buffer);
  if (moov_)
    moov_->Write(buffer);

  MediaData mdat;
  mdat.data_size = static_cast<uint32_t>(payload_size_);
  mdat.WriteHeader(buffer);
  DCHECK_EQ(payload_offset_, buffer->Size());
}

Status AvifFile::Write(File* file) {
  DCHECK(file);

  BufferWriter buffer;
  WriteHeaders(&buffer);
  RETURN_IF_ERROR(buffer.WriteToFile(file));

  for (const DataChunk& chunk : chunks_) {
    RETURN_IF_ERROR(
        BufferWriter::WriteArrayToFile(chunk.data, chunk.size, file));
  }
  return Status::OK;
}

void AvifFile::WriteToVector(std::vector<uint8_t>* output) {
  DCHECK(output);

  BufferWriter buffer;
  WriteHeaders(&buffer);
  output->reserve(output->size() + buffer.Size() + payload_size_);
  output->insert(output->end(), buffer.Buffer(),
                 buffer.Buffer() + buffer.Size());
  for (const DataChunk& chunk : chunks_)
    output->insert(output->end(), chunk.data, chunk.data + chunk.size);
}

}  // namespace mp4
}  // namespace media
}  // namespace avifmux
