// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_FORMATS_MP4_AVIF_FILE_H_
#define AVIFMUX_MEDIA_FORMATS_MP4_AVIF_FILE_H_

#include <cstdint>
#include <optional>
#include <vector>

#include <avifmux/macros/classes.h>
#include <avifmux/media/formats/mp4/box_definitions.h>
#include <avifmux/status.h>

namespace avifmux {

class File;

namespace media {
namespace mp4 {

/// AvifFile owns the box tree of one AVIF file and references the payload
/// chunks that go into its mdat box.
///
/// Writing happens in two phases. FinalizeLayout() computes the box sizes and
/// turns every relative item extent and track chunk offset into an absolute
/// file offset. Write() or WriteToVector() then emit the headers followed by
/// the payload chunks, which are streamed from the caller's buffers.
class AvifFile {
 public:
  AvifFile();
  ~AvifFile();

  /// Append a payload chunk to mdat. Chunks are written in insertion order.
  /// @param data is borrowed and must stay valid until the file is written.
  void AddDataChunk(const uint8_t* data, size_t size);

  /// Compute box sizes and resolve all offsets. Must be called exactly once,
  /// after the box tree is complete and before writing.
  /// @return MUXER_FAILURE if the file cannot be addressed with 32-bit
  ///         offsets.
  Status FinalizeLayout();

  /// Write the whole file to @a file.
  /// @return FILE_FAILURE if the file does not accept all the data.
  Status Write(File* file);

  /// Append the whole file to @a output.
  void WriteToVector(std::vector<uint8_t>* output);

  FileType& ftyp() { return ftyp_; }
  Metadata& meta() { return meta_; }
  /// The movie box is only present in image sequences.
  std::optional<Movie>& moov() { return moov_; }

  /// @return File offset of the first mdat payload byte. Only valid after
  ///         FinalizeLayout().
  uint32_t payload_offset() const { return payload_offset_; }
  /// @return Total size of the payload chunks.
  uint64_t payload_size() const { return payload_size_; }

 private:
  struct DataChunk {
    const uint8_t* data;
    size_t size;
  };

  // Serialize ftyp, meta, moov and the mdat header.
  void WriteHeaders(BufferWriter* buffer);

  FileType ftyp_;
  Metadata meta_;
  std::optional<Movie> moov_;
  std::vector<DataChunk> chunks_;
  uint64_t payload_size_ = 0;
  uint32_t payload_offset_ = 0;
  bool layout_finalized_ = false;

  DISALLOW_COPY_AND_ASSIGN(AvifFile);
};

}  // namespace mp4
}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_FORMATS_MP4_AVIF_FILE_H_
