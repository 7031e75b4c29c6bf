// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/file/local_file.h>

#include <cstdio>
#include <filesystem>

#include <absl/log/check.h>
#include <absl/log/log.h>

#include <avifmux/macros/logging.h>

namespace avifmux {

// Images are binary, whatever the caller asked for.
const char kAdditionalFileMode[] = "b";

LocalFile::LocalFile(const char* file_name, const char* mode)
    : File(file_name), file_mode_(mode), internal_file_(nullptr) {
  if (file_mode_.find(kAdditionalFileMode) == std::string::npos)
    file_mode_ += kAdditionalFileMode;
}

bool LocalFile::Close() {
  bool result = true;
  if (internal_file_) {
    result = fclose(internal_file_) == 0;
    internal_file_ = nullptr;
  }
  delete this;
  return result;
}

int64_t LocalFile::Read(void* buffer, uint64_t length) {
  DCHECK(buffer != nullptr);
  DCHECK(internal_file_ != nullptr);
  size_t bytes_read = fread(buffer, sizeof(char), length, internal_file_);
  VLOG(2) << "Read " << length << " return " << bytes_read;
  if (bytes_read == 0 && ferror(internal_file_) != 0)
    return -1;
  return bytes_read;
}

int64_t LocalFile::Write(const void* buffer, uint64_t length) {
  DCHECK(buffer != nullptr);
  DCHECK(internal_file_ != nullptr);
  size_t bytes_written = fwrite(buffer, sizeof(char), length, internal_file_);
  VLOG(2) << "Write " << length << " return " << bytes_written;
  if (bytes_written == 0 && ferror(internal_file_) != 0)
    return -1;
  return bytes_written;
}

int64_t LocalFile::Size() {
  DCHECK(internal_file_ != nullptr);

  if (!Flush()) {
    LOG(ERROR) << "Cannot flush file " << file_name();
    return -1;
  }

  std::error_code ec;
  int64_t file_size =
      std::filesystem::file_size(std::filesystem::u8path(file_name()), ec);
  if (ec) {
    LOG(ERROR) << "Cannot get size of " << file_name() << ", error: " << ec;
    return -1;
  }
  return file_size;
}

bool LocalFile::Flush() {
  DCHECK(internal_file_ != nullptr);
  return fflush(internal_file_) == 0 && !ferror(internal_file_);
}

LocalFile::~LocalFile() {}

bool LocalFile::Open() {
  auto file_path = std::filesystem::u8path(file_name());

  // Output may be requested in a directory that does not exist yet.
  if (file_mode_.find("w") != std::string::npos) {
    auto parent_path = file_path.parent_path();
    std::error_code ec;
    if (!parent_path.empty() &&
        !std::filesystem::is_directory(parent_path, ec) &&
        !std::filesystem::create_directories(parent_path, ec)) {
      LOG(ERROR) << "Cannot create directory " << parent_path
                 << ", error: " << ec;
      return false;
    }
  }

  internal_file_ = fopen(file_path.u8string().c_str(), file_mode_.c_str());
  return internal_file_ != nullptr;
}

}  // namespace avifmux
