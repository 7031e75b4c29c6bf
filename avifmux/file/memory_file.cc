// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/file/memory_file.h>

#include <algorithm>
#include <cstring>
#include <map>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/synchronization/mutex.h>

#include <avifmux/macros/logging.h>

namespace avifmux {
namespace {

// Holds the data of every memory file, keyed by name.
class MemoryStore {
 public:
  static MemoryStore* Instance() {
    static MemoryStore instance;
    return &instance;
  }

  void DeleteAll() {
    absl::MutexLock auto_lock(&mutex_);
    if (!open_files_.empty()) {
      LOG(ERROR) << open_files_.size()
                 << " memory file(s) still open, not deleting anything.";
      return;
    }
    files_.clear();
  }

  std::vector<uint8_t>* Open(const std::string& file_name,
                             const std::string& mode) {
    absl::MutexLock auto_lock(&mutex_);

    if (open_files_.count(file_name) > 0) {
      NOTIMPLEMENTED() << "Memory file '" << file_name
                       << "' is already open.";
      return nullptr;
    }

    auto iter = files_.find(file_name);
    if (mode == "r") {
      if (iter == files_.end())
        return nullptr;
    } else if (mode == "w") {
      if (iter != files_.end())
        iter->second.clear();
    } else {
      NOTIMPLEMENTED() << "File mode '" << mode
                       << "' not supported by MemoryFile";
      return nullptr;
    }

    open_files_[file_name] = mode;
    return &files_[file_name];
  }

  bool Close(const std::string& file_name) {
    absl::MutexLock auto_lock(&mutex_);
    if (open_files_.erase(file_name) == 0) {
      LOG(ERROR) << "Cannot close memory file '" << file_name
                 << "' which is not open.";
      return false;
    }
    return true;
  }

 private:
  MemoryStore() = default;
  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;

  std::map<std::string, std::vector<uint8_t>> files_ ABSL_GUARDED_BY(mutex_);
  std::map<std::string, std::string> open_files_ ABSL_GUARDED_BY(mutex_);

  absl::Mutex mutex_;
};

}  // namespace

MemoryFile::MemoryFile(const std::string& file_name, const std::string& mode)
    : File(file_name), mode_(mode), file_(nullptr), position_(0) {}

MemoryFile::~MemoryFile() {}

bool MemoryFile::Close() {
  if (!MemoryStore::Instance()->Close(file_name()))
    return false;
  delete this;
  return true;
}

int64_t MemoryFile::Read(void* buffer, uint64_t length) {
  const uint64_t size = Size();
  DCHECK_LE(position_, size);
  if (position_ >= size)
    return 0;

  const uint64_t bytes_to_read = std::min(length, size - position_);
  memcpy(buffer, file_->data() + position_, bytes_to_read);
  position_ += bytes_to_read;
  return bytes_to_read;
}

int64_t MemoryFile::Write(const void* buffer, uint64_t length) {
  if (length == 0)
    return 0;

  if (file_->size() < position_ + length)
    file_->resize(position_ + length);

  memcpy(file_->data() + position_, buffer, length);
  position_ += length;
  return length;
}

int64_t MemoryFile::Size() {
  DCHECK(file_);
  return file_->size();
}

bool MemoryFile::Flush() {
  return true;
}

bool MemoryFile::Open() {
  file_ = MemoryStore::Instance()->Open(file_name(), mode_);
  if (!file_)
    return false;

  position_ = 0;
  return true;
}

void MemoryFile::DeleteAll() {
  MemoryStore::Instance()->DeleteAll();
}

}  // namespace avifmux
