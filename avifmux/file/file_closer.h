// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_FILE_FILE_CLOSER_H_
#define AVIFMUX_FILE_FILE_CLOSER_H_

#include <absl/log/log.h>

#include <avifmux/file.h>

namespace avifmux {

/// Used by std::unique_ptr to automatically close the file when it goes out of
/// scope.
struct FileCloser {
  inline void operator()(File* file) const {
    if (file != nullptr) {
      const std::string filename = file->file_name();
      if (!file->Close()) {
        LOG(WARNING) << "Failed to close the file properly: " << filename;
      }
    }
  }
};

}  // namespace avifmux

#endif  // AVIFMUX_FILE_FILE_CLOSER_H_
