// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_FORMATS_MP4_SAMPLE_TABLE_BUILDER_H_
#define AVIFMUX_MEDIA_FORMATS_MP4_SAMPLE_TABLE_BUILDER_H_

#include <cstdint>
#include <vector>

#include <avifmux/avif_muxer.h>
#include <avifmux/macros/classes.h>

namespace avifmux {
namespace media {
namespace mp4 {

struct SampleTable;

/// SampleTableBuilder fills the timing, size and sync tables of a track from
/// a sequence of frames. All frames of a track go into a single chunk whose
/// offset is filled in later, once the file layout is known.
class SampleTableBuilder {
 public:
  /// @param stbl points to the sample table to fill. It should not be NULL
  ///        and must outlive this object.
  explicit SampleTableBuilder(SampleTable* stbl);
  ~SampleTableBuilder();

  /// Add a frame to the track.
  void AddFrame(const FrameInfo& frame);

  /// Convenience wrapper adding each frame of @a frames in order.
  void AddFrames(const std::vector<FrameInfo>& frames);

  /// Write the accumulated frames to the sample table. The stts runs are
  /// merged, and stss is omitted if every frame is a sync frame.
  void Finalize();

  /// @return Sum of frame durations, in timescale units.
  uint64_t duration() const { return duration_; }
  /// @return Sum of frame sizes in bytes.
  uint64_t data_size() const { return data_size_; }
  uint32_t sample_count() const { return static_cast<uint32_t>(sizes_.size()); }

 private:
  SampleTable* stbl_;

  std::vector<uint64_t> durations_;
  std::vector<uint32_t> sizes_;
  // 1-based.
  std::vector<uint32_t> sync_sample_numbers_;
  uint64_t duration_ = 0;
  uint64_t data_size_ = 0;

  DISALLOW_COPY_AND_ASSIGN(SampleTableBuilder);
};

}  // namespace mp4
}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_FORMATS_MP4_SAMPLE_TABLE_BUILDER_H_
