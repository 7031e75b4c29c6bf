// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_PUBLIC_AVIF_MUXER_H_
#define AVIFMUX_PUBLIC_AVIF_MUXER_H_

#include <cstdint>
#include <optional>
#include <vector>

#include <avifmux/color_constants.h>
#include <avifmux/export.h>
#include <avifmux/status.h>

namespace avifmux {

class File;

/// Describes one encoded frame of an image sequence.
struct FrameInfo {
  /// Frame duration in units of AvifImageParams::timescale.
  uint64_t duration_in_timescales = 0;
  /// Whether the frame can be decoded without reference to other frames.
  bool sync = false;
  /// Size of the frame's AV1 data in bytes.
  uint32_t size = 0;
};

/// Color description written to the `colr` property. A `colr` box is only
/// emitted when any value differs from the defaults below.
struct ColorParams {
  ColorPrimaries color_primaries = ColorPrimaries::kBt709;
  TransferCharacteristics transfer_characteristics =
      TransferCharacteristics::kSrgb;
  MatrixCoefficients matrix_coefficients = MatrixCoefficients::kBt601;
  bool full_range = true;

  bool operator==(const ColorParams& other) const {
    return color_primaries == other.color_primaries &&
           transfer_characteristics == other.transfer_characteristics &&
           matrix_coefficients == other.matrix_coefficients &&
           full_range == other.full_range;
  }
  bool operator!=(const ColorParams& other) const { return !(*this == other); }
};

/// Muxer-wide options.
struct AvifMuxerParams {
  /// Set if the color channels were multiplied by alpha before encoding. Adds
  /// a `prem` item reference so decoders undo the premultiplication. Only
  /// meaningful with alpha.
  bool premultiplied_alpha = false;
  ColorParams color;
};

/// The encoded image to mux. The data pointers are borrowed; they only need
/// to stay valid for the duration of the AvifMuxer call.
struct AvifImageParams {
  /// AV1 data for the color channels. Required. Must be 4:4:4 for bit depths
  /// below 12.
  const uint8_t* color_data = nullptr;
  size_t color_data_size = 0;
  /// Optional monochrome AV1 data for the alpha channel. Same dimensions and
  /// depth as the color data.
  const uint8_t* alpha_data = nullptr;
  size_t alpha_data_size = 0;

  uint32_t width = 0;
  uint32_t height = 0;
  /// 8, 10 or 12.
  uint8_t depth_bits = 8;

  /// @name Image sequence parameters. Setting |color_frames| produces an
  /// `avis` file; the frame sizes must add up to the respective data size.
  /// @{
  uint32_t timescale = 0;
  std::optional<std::vector<FrameInfo>> color_frames;
  std::optional<std::vector<FrameInfo>> alpha_frames;
  /// @}
};

/// Assembles AVIF still images and image sequences from already encoded AV1
/// data.
class AVIFMUX_EXPORT AvifMuxer {
 public:
  AvifMuxer();
  explicit AvifMuxer(const AvifMuxerParams& params);
  ~AvifMuxer();

  /// Writes a complete AVIF file.
  /// @param image is the encoded image. See AvifImageParams for the contract.
  /// @param file is the output sink. It is not closed.
  /// @return OK on success, FILE_FAILURE if the sink rejects data.
  Status Write(const AvifImageParams& image, File* file) const;

  /// Appends a complete AVIF file to @a output.
  Status WriteToVector(const AvifImageParams& image,
                       std::vector<uint8_t>* output) const;

 private:
  AvifMuxerParams params_;
};

}  // namespace avifmux

#endif  // AVIFMUX_PUBLIC_AVIF_MUXER_H_
