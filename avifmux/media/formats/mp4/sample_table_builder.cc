// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/formats/mp4/sample_table_builder.h>

#include <limits>

#include <absl/log/check.h>
#include <absl/log/log.h>

#include <avifmux/media/formats/mp4/box_definitions.h>

namespace avifmux {
namespace media {
namespace mp4 {

namespace {
const uint32_t kSampleDescriptionIndex = 1;
}  // namespace

SampleTableBuilder::SampleTableBuilder(SampleTable* stbl) : stbl_(stbl) {
  DCHECK(stbl);
}

SampleTableBuilder::~SampleTableBuilder() {}

void SampleTableBuilder::AddFrame(const FrameInfo& frame) {
  // stts sample deltas are 32 bits wide.
  DCHECK_LE(frame.duration_in_timescales,
            std::numeric_limits<uint32_t>::max());

  durations_.push_back(frame.duration_in_timescales);
  sizes_.push_back(frame.size);
  if (frame.sync)
    sync_sample_numbers_.push_back(static_cast<uint32_t>(sizes_.size()));

  duration_ += frame.duration_in_timescales;
  data_size_ += frame.size;
}

void SampleTableBuilder::AddFrames(const std::vector<FrameInfo>& frames) {
  for (const FrameInfo& frame : frames)
    AddFrame(frame);
}

void SampleTableBuilder::Finalize() {
  // Merge consecutive frames of equal duration into one stts entry.
  std::vector<DecodingTime>& decoding_time =
      stbl_->decoding_time_to_sample.decoding_time;
  decoding_time.clear();
  for (uint64_t duration : durations_) {
    const uint32_t delta = static_cast<uint32_t>(duration);
    if (!decoding_time.empty() && decoding_time.back().sample_delta == delta) {
      ++decoding_time.back().sample_count;
    } else {
      decoding_time.push_back({1, delta});
    }
  }

  // All frames are in the first and only chunk.
  stbl_->sample_to_chunk.chunk_info.clear();
  if (!sizes_.empty()) {
    stbl_->sample_to_chunk.chunk_info.push_back(
        {1, sample_count(), kSampleDescriptionIndex});
  }

  stbl_->sample_size.sample_size = 0;
  stbl_->sample_size.sample_count = sample_count();
  stbl_->sample_size.sizes = sizes_;

  // A missing stss means every sample is a sync sample. An empty one means
  // none is.
  if (sync_sample_numbers_.size() == sizes_.size()) {
    stbl_->sync_sample.reset();
  } else {
    stbl_->sync_sample.emplace();
    stbl_->sync_sample->sample_number = sync_sample_numbers_;
  }

  VLOG(1) << "Sample table: " << sample_count() << " samples, "
          << decoding_time.size() << " stts entries, duration " << duration_;
}

}  // namespace mp4
}  // namespace media
}  // namespace avifmux
