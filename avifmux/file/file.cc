// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/file.h>

#include <memory>
#include <string_view>

#include <absl/log/check.h>
#include <absl/log/log.h>

#include <avifmux/file/local_file.h>
#include <avifmux/file/memory_file.h>

namespace avifmux {

const char* kLocalFilePrefix = "file://";
const char* kMemoryFilePrefix = "memory://";

namespace {

typedef File* (*FileFactoryFunction)(const char* file_name, const char* mode);

struct FileTypeInfo {
  const char* type;
  const FileFactoryFunction factory_function;
};

File* CreateLocalFile(const char* file_name, const char* mode) {
  return new LocalFile(file_name, mode);
}

File* CreateMemoryFile(const char* file_name, const char* mode) {
  return new MemoryFile(file_name, mode);
}

// The first entry is the default for names without a prefix.
static const FileTypeInfo kFileTypeInfo[] = {
    {kLocalFilePrefix, &CreateLocalFile},
    {kMemoryFilePrefix, &CreateMemoryFile},
};

std::string_view GetFileTypePrefix(std::string_view file_name) {
  size_t pos = file_name.find("://");
  return (pos == std::string::npos) ? "" : file_name.substr(0, pos + 3);
}

const FileTypeInfo* GetFileTypeInfo(std::string_view file_name,
                                    std::string_view* real_file_name) {
  std::string_view file_type_prefix = GetFileTypePrefix(file_name);
  for (const FileTypeInfo& file_type : kFileTypeInfo) {
    if (file_type_prefix == file_type.type) {
      *real_file_name = file_name.substr(file_type_prefix.size());
      return &file_type;
    }
  }
  *real_file_name = file_name;
  return &kFileTypeInfo[0];
}

}  // namespace

File* File::Open(const char* file_name, const char* mode) {
  std::string_view real_file_name;
  const FileTypeInfo* file_type = GetFileTypeInfo(file_name, &real_file_name);
  DCHECK(file_type);
  File* file = file_type->factory_function(
      std::string(real_file_name).c_str(), mode);
  if (!file)
    return nullptr;
  if (!file->Open()) {
    delete file;
    return nullptr;
  }
  return file;
}

bool File::ReadFileToString(const char* file_name, std::string* contents) {
  DCHECK(contents);

  File* file = File::Open(file_name, "r");
  if (!file)
    return false;
  contents->clear();

  const size_t kBufferSize = 0x40000;  // 256KB.
  std::unique_ptr<char[]> buf(new char[kBufferSize]);

  int64_t len;
  while ((len = file->Read(buf.get(), kBufferSize)) > 0)
    contents->append(buf.get(), len);

  const bool closed = file->Close();
  return len == 0 && closed;
}

}  // namespace avifmux
