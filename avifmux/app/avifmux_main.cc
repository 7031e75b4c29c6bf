// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_split.h>

#include <avifmux/avif_muxer.h>
#include <avifmux/file.h>

ABSL_FLAG(std::string, color, "", "Required. File with the AV1 color data.");
ABSL_FLAG(std::string,
          alpha,
          "",
          "Optional. File with the monochrome AV1 alpha data.");
ABSL_FLAG(std::string, output, "", "Required. Output AVIF file.");
ABSL_FLAG(uint32_t, width, 0, "Image width in pixels.");
ABSL_FLAG(uint32_t, height, 0, "Image height in pixels.");
ABSL_FLAG(uint32_t, depth, 8, "Bits per channel: 8, 10 or 12.");
ABSL_FLAG(bool,
          premultiplied_alpha,
          false,
          "Set if the color channels were premultiplied by alpha.");
ABSL_FLAG(uint32_t, color_primaries, 1, "ITU-T H.273 color primaries.");
ABSL_FLAG(uint32_t,
          transfer_characteristics,
          13,
          "ITU-T H.273 transfer characteristics.");
ABSL_FLAG(uint32_t,
          matrix_coefficients,
          6,
          "ITU-T H.273 matrix coefficients.");
ABSL_FLAG(bool, full_range, true, "Set for full range samples.");
ABSL_FLAG(uint32_t,
          timescale,
          0,
          "Ticks per second for frame durations. Image sequences only.");
ABSL_FLAG(std::string,
          color_frames,
          "",
          "Comma separated color frames as duration:sync:size, e.g. "
          "'1:1:1024,1:0:200'. Produces an image sequence when set.");
ABSL_FLAG(std::string,
          alpha_frames,
          "",
          "Comma separated alpha frames, in the same format as "
          "--color_frames.");
ABSL_FLAG(bool, quiet, false, "When enabled, LOG(INFO) output is suppressed.");

namespace avifmux {
namespace {

const char kUsage[] =
    "%s --color=<file> [--alpha=<file>] --width=<w> --height=<h> "
    "--output=<file> [flags]\n\n"
    "  Wraps already encoded AV1 data into an AVIF still image. Pass\n"
    "  --timescale and --color_frames (and optionally --alpha_frames) to\n"
    "  produce an AVIF image sequence instead.\n";

enum ExitStatus {
  kSuccess = 0,
  kFailure = 1,
};

const uint32_t kMaxCodePoint = 255;

std::optional<std::vector<FrameInfo>> ParseFrames(const std::string& frames) {
  std::vector<FrameInfo> result;
  for (absl::string_view frame_str :
       absl::StrSplit(frames, ',', absl::SkipEmpty())) {
    std::vector<absl::string_view> fields = absl::StrSplit(frame_str, ':');
    FrameInfo frame;
    int sync = 0;
    if (fields.size() != 3 ||
        !absl::SimpleAtoi(fields[0], &frame.duration_in_timescales) ||
        !absl::SimpleAtoi(fields[1], &sync) ||
        !absl::SimpleAtoi(fields[2], &frame.size) || (sync != 0 && sync != 1)) {
      LOG(ERROR) << "Invalid frame '" << frame_str
                 << "'. Expecting duration:sync:size.";
      return std::nullopt;
    }
    frame.sync = sync == 1;
    result.push_back(frame);
  }
  return result;
}

bool ValidateFlags() {
  bool success = true;
  if (absl::GetFlag(FLAGS_color).empty()) {
    LOG(ERROR) << "--color is required.";
    success = false;
  }
  if (absl::GetFlag(FLAGS_output).empty()) {
    LOG(ERROR) << "--output is required.";
    success = false;
  }
  if (absl::GetFlag(FLAGS_width) == 0 || absl::GetFlag(FLAGS_height) == 0) {
    LOG(ERROR) << "--width and --height must be positive.";
    success = false;
  }
  const uint32_t depth = absl::GetFlag(FLAGS_depth);
  if (depth != 8 && depth != 10 && depth != 12) {
    LOG(ERROR) << "--depth must be 8, 10 or 12, got " << depth << ".";
    success = false;
  }
  if (absl::GetFlag(FLAGS_color_primaries) > kMaxCodePoint ||
      absl::GetFlag(FLAGS_transfer_characteristics) > kMaxCodePoint ||
      absl::GetFlag(FLAGS_matrix_coefficients) > kMaxCodePoint) {
    LOG(ERROR) << "Color code points must not exceed " << kMaxCodePoint << ".";
    success = false;
  }
  const bool is_sequence = !absl::GetFlag(FLAGS_color_frames).empty();
  if (is_sequence && absl::GetFlag(FLAGS_timescale) == 0) {
    LOG(ERROR) << "--timescale is required with --color_frames.";
    success = false;
  }
  if (!absl::GetFlag(FLAGS_alpha_frames).empty()) {
    if (!is_sequence) {
      LOG(ERROR) << "--alpha_frames requires --color_frames.";
      success = false;
    }
    if (absl::GetFlag(FLAGS_alpha).empty()) {
      LOG(ERROR) << "--alpha_frames requires --alpha.";
      success = false;
    }
  }
  return success;
}

// Checks that the frame sizes account for all of |data_size|.
bool ValidateFrameSizes(const char* name,
                        const std::vector<FrameInfo>& frames,
                        size_t data_size) {
  uint64_t frames_size = 0;
  for (const FrameInfo& frame : frames)
    frames_size += frame.size;
  if (frames_size != data_size) {
    LOG(ERROR) << absl::StrFormat(
        "%s frame sizes add up to %u bytes, but the data has %u bytes.", name,
        frames_size, data_size);
    return false;
  }
  return true;
}

int AvifmuxMain(int argc, char** argv) {
  absl::SetProgramUsageMessage(absl::StrFormat(kUsage, argv[0]));
  std::vector<char*> remaining_args = absl::ParseCommandLine(argc, argv);
  if (remaining_args.size() > 1) {
    std::cerr << "Usage: " << absl::ProgramUsageMessage();
    return kFailure;
  }

  if (absl::GetFlag(FLAGS_quiet))
    absl::SetMinLogLevel(absl::LogSeverityAtLeast::kWarning);
  absl::InitializeLog();

  if (!ValidateFlags())
    return kFailure;

  std::string color_data;
  if (!File::ReadFileToString(absl::GetFlag(FLAGS_color).c_str(),
                              &color_data)) {
    LOG(ERROR) << "Failed to read " << absl::GetFlag(FLAGS_color);
    return kFailure;
  }
  std::string alpha_data;
  const bool has_alpha = !absl::GetFlag(FLAGS_alpha).empty();
  if (has_alpha && !File::ReadFileToString(absl::GetFlag(FLAGS_alpha).c_str(),
                                           &alpha_data)) {
    LOG(ERROR) << "Failed to read " << absl::GetFlag(FLAGS_alpha);
    return kFailure;
  }

  AvifImageParams image;
  image.color_data = reinterpret_cast<const uint8_t*>(color_data.data());
  image.color_data_size = color_data.size();
  if (has_alpha) {
    image.alpha_data = reinterpret_cast<const uint8_t*>(alpha_data.data());
    image.alpha_data_size = alpha_data.size();
  }
  image.width = absl::GetFlag(FLAGS_width);
  image.height = absl::GetFlag(FLAGS_height);
  image.depth_bits = static_cast<uint8_t>(absl::GetFlag(FLAGS_depth));

  if (!absl::GetFlag(FLAGS_color_frames).empty()) {
    image.timescale = absl::GetFlag(FLAGS_timescale);
    image.color_frames = ParseFrames(absl::GetFlag(FLAGS_color_frames));
    if (!image.color_frames ||
        !ValidateFrameSizes("Color", *image.color_frames,
                            image.color_data_size)) {
      return kFailure;
    }
    if (!absl::GetFlag(FLAGS_alpha_frames).empty()) {
      image.alpha_frames = ParseFrames(absl::GetFlag(FLAGS_alpha_frames));
      if (!image.alpha_frames ||
          !ValidateFrameSizes("Alpha", *image.alpha_frames,
                              image.alpha_data_size)) {
        return kFailure;
      }
    }
  }

  AvifMuxerParams params;
  params.premultiplied_alpha = absl::GetFlag(FLAGS_premultiplied_alpha);
  params.color.color_primaries =
      static_cast<ColorPrimaries>(absl::GetFlag(FLAGS_color_primaries));
  params.color.transfer_characteristics = static_cast<TransferCharacteristics>(
      absl::GetFlag(FLAGS_transfer_characteristics));
  params.color.matrix_coefficients =
      static_cast<MatrixCoefficients>(absl::GetFlag(FLAGS_matrix_coefficients));
  params.color.full_range = absl::GetFlag(FLAGS_full_range);

  const std::string output = absl::GetFlag(FLAGS_output);
  File* file = File::Open(output.c_str(), "w");
  if (!file) {
    LOG(ERROR) << "Failed to open " << output;
    return kFailure;
  }

  AvifMuxer muxer(params);
  Status status = muxer.Write(image, file);
  if (!file->Close())
    status.Update(Status(error::FILE_FAILURE, "Failed to close " + output));
  if (!status.ok()) {
    LOG(ERROR) << "Muxing failed: " << status.ToString();
    return kFailure;
  }
  LOG(INFO) << "Wrote " << output;
  return kSuccess;
}

}  // namespace
}  // namespace avifmux

int main(int argc, char** argv) {
  return avifmux::AvifmuxMain(argc, argv);
}
