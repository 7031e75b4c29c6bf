// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_PUBLIC_COLOR_CONSTANTS_H_
#define AVIFMUX_PUBLIC_COLOR_CONSTANTS_H_

#include <cstdint>

namespace avifmux {

/// Coding-independent code points from ITU-T H.273. The muxer treats them as
/// opaque numbers and copies them into the `colr` box.

enum class ColorPrimaries : uint16_t {
  kBt709 = 1,
  kUnspecified = 2,
  kBt470M = 4,
  kBt470BG = 5,
  kBt601 = 6,
  kSmpte240 = 7,
  kGenericFilm = 8,
  kBt2020 = 9,
  kXyz = 10,
  kSmpte431 = 11,
  kSmpte432 = 12,
  kEbu3213 = 22,
};

enum class TransferCharacteristics : uint16_t {
  kBt709 = 1,
  kUnspecified = 2,
  kBt470M = 4,
  kBt470BG = 5,
  kBt601 = 6,
  kSmpte240 = 7,
  kLinear = 8,
  kLog = 9,
  kLogSqrt = 10,
  kIec61966 = 11,
  kBt1361 = 12,
  kSrgb = 13,
  kBt2020_10Bit = 14,
  kBt2020_12Bit = 15,
  // Perceptual quantizer (PQ).
  kSmpte2084 = 16,
  kSmpte428 = 17,
  // Hybrid log-gamma.
  kHlg = 18,
};

enum class MatrixCoefficients : uint16_t {
  // GBR, i.e. no matrix.
  kRgb = 0,
  kBt709 = 1,
  kUnspecified = 2,
  kFcc = 4,
  kBt470BG = 5,
  kBt601 = 6,
  kSmpte240 = 7,
  kYCgCo = 8,
  kBt2020Ncl = 9,
  kBt2020Cl = 10,
  kSmpte2085 = 11,
  kChromaticityNcl = 12,
  kChromaticityCl = 13,
  kICtCp = 14,
};

}  // namespace avifmux

#endif  // AVIFMUX_PUBLIC_COLOR_CONSTANTS_H_
