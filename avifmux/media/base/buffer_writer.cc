// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/base/buffer_writer.h>

#include <absl/base/internal/endian.h>
#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/str_format.h>

#include <avifmux/file.h>

namespace avifmux {
namespace media {

BufferWriter::BufferWriter() {
  // Image headers are small; the payload never goes through here.
  const size_t kDefaultReservedCapacity = 0x1000;  // 4KB.
  buf_.reserve(kDefaultReservedCapacity);
}
BufferWriter::BufferWriter(size_t reserved_size_in_bytes) {
  buf_.reserve(reserved_size_in_bytes);
}
BufferWriter::~BufferWriter() {}

void BufferWriter::AppendInt(uint8_t v) {
  buf_.push_back(v);
}
void BufferWriter::AppendInt(uint16_t v) {
  AppendInternal(absl::big_endian::FromHost16(v));
}
void BufferWriter::AppendInt(uint32_t v) {
  AppendInternal(absl::big_endian::FromHost32(v));
}
void BufferWriter::AppendInt(uint64_t v) {
  AppendInternal(absl::big_endian::FromHost64(v));
}
void BufferWriter::AppendInt(int16_t v) {
  AppendInternal(absl::big_endian::FromHost16(v));
}
void BufferWriter::AppendInt(int32_t v) {
  AppendInternal(absl::big_endian::FromHost32(v));
}

void BufferWriter::AppendNBytes(uint64_t v, size_t num_bytes) {
  DCHECK_GE(sizeof(v), num_bytes);
  v = absl::big_endian::FromHost64(v);
  const uint8_t* data = reinterpret_cast<uint8_t*>(&v);
  AppendArray(&data[sizeof(v) - num_bytes], num_bytes);
}

void BufferWriter::AppendVector(const std::vector<uint8_t>& v) {
  buf_.insert(buf_.end(), v.begin(), v.end());
}

void BufferWriter::AppendString(const std::string& s) {
  buf_.insert(buf_.end(), s.begin(), s.end());
}

void BufferWriter::AppendCString(const std::string& s) {
  DCHECK_EQ(s.find('\0'), std::string::npos);
  AppendString(s);
  buf_.push_back(0);
}

void BufferWriter::AppendArray(const uint8_t* buf, size_t size) {
  buf_.insert(buf_.end(), buf, buf + size);
}

Status BufferWriter::WriteToFile(File* file) {
  DCHECK(!buf_.empty());
  Status status = WriteArrayToFile(buf_.data(), buf_.size(), file);
  if (status.ok())
    buf_.clear();
  return status;
}

Status BufferWriter::WriteArrayToFile(const uint8_t* data,
                                      size_t size,
                                      File* file) {
  DCHECK(file);
  size_t remaining_size = size;
  while (remaining_size > 0) {
    int64_t size_written = file->Write(data, remaining_size);
    if (size_written <= 0) {
      return Status(error::FILE_FAILURE,
                    absl::StrFormat("Fail to write %u bytes to '%s'.",
                                    remaining_size, file->file_name()));
    }
    remaining_size -= size_written;
    data += size_written;
  }
  return Status::OK;
}

template <typename T>
void BufferWriter::AppendInternal(T v) {
  AppendArray(reinterpret_cast<uint8_t*>(&v), sizeof(T));
}

}  // namespace media
}  // namespace avifmux
