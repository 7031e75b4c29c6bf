// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_BASE_BIT_WRITER_H_
#define AVIFMUX_MEDIA_BASE_BIT_WRITER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace avifmux {
namespace media {

/// Packs MSB-first bit fields into a byte vector.
class BitWriter {
 public:
  /// @param storage points to the vector this BitWriter appends to. Cannot be
  ///        nullptr.
  explicit BitWriter(std::vector<uint8_t>* storage);
  ~BitWriter() = default;

  /// Appends the low @a number_of_bits (1 to 32) bits of @a bits.
  void WriteBits(uint32_t bits, size_t number_of_bits);

  /// Write pending bits, and align bitstream with extra zero bits.
  void Flush();

  /// @return last written position, in bytes.
  size_t BytePos() const { return storage_->size() - initial_storage_size_; }

 private:
  BitWriter(const BitWriter&) = delete;
  BitWriter& operator=(const BitWriter&) = delete;

  // Accumulator for unwritten bits, left aligned.
  uint64_t bits_ = 0;
  int num_bits_ = 0;
  std::vector<uint8_t>* const storage_ = nullptr;
  const size_t initial_storage_size_ = 0;
};

}  // namespace media
}  // namespace avifmux

#endif  // AVIFMUX_MEDIA_BASE_BIT_WRITER_H_
