// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/media/base/buffer_writer.h>

#include <limits>
#include <memory>

#include <gtest/gtest.h>

#include <avifmux/file.h>
#include <avifmux/file/file_closer.h>
#include <avifmux/file/file_test_util.h>
#include <avifmux/file/memory_file.h>
#include <avifmux/macros/classes.h>
#include <avifmux/media/base/buffer_reader.h>
#include <avifmux/status/status_test_util.h>

namespace {
const int kReservedBufferCapacity = 1000;
const uint8_t kuint8 = 10;
const uint16_t kuint16 = 1000;
const int16_t kint16 = -1000;
const uint32_t kuint32 = 1000000;
const int32_t kint32 = -1000000;
const uint64_t kuint64 = 10000000000ULL;
const uint8_t kuint8Array[] = {10, 1, 100, 5, 3, 60};
}  // namespace

namespace avifmux {
namespace media {

class BufferWriterTest : public testing::Test {
 public:
  BufferWriterTest() : writer_(new BufferWriter(kReservedBufferCapacity)) {}

  void TearDown() override { MemoryFile::DeleteAll(); }

  void CreateReader() {
    reader_.reset(new BufferReader(writer_->Buffer(), writer_->Size()));
  }

  bool ReadInt(uint8_t* v) { return reader_->Read1(v); }
  bool ReadInt(uint16_t* v) { return reader_->Read2(v); }
  bool ReadInt(int16_t* v) { return reader_->Read2s(v); }
  bool ReadInt(uint32_t* v) { return reader_->Read4(v); }
  bool ReadInt(int32_t* v) { return reader_->Read4s(v); }
  bool ReadInt(uint64_t* v) { return reader_->Read8(v); }

  template <typename T>
  void ReadAndExpect(T expectation) {
    T data_read;
    ASSERT_TRUE(ReadInt(&data_read));
    ASSERT_EQ(expectation, data_read);
  }

  template <typename T>
  void Verify(T val) {
    T min = std::numeric_limits<T>::min();
    T max = std::numeric_limits<T>::max();

    writer_->AppendInt(min);
    writer_->AppendInt(max);
    writer_->AppendInt(val);
    ASSERT_EQ(sizeof(min) + sizeof(max) + sizeof(val), writer_->Size());

    CreateReader();
    ReadAndExpect(min);
    ReadAndExpect(max);
    ReadAndExpect(val);
  }

 protected:
  std::unique_ptr<BufferWriter> writer_;
  std::unique_ptr<BufferReader> reader_;

 private:
  DISALLOW_COPY_AND_ASSIGN(BufferWriterTest);
};

TEST_F(BufferWriterTest, Append1) { Verify(kuint8); }
TEST_F(BufferWriterTest, Append2) { Verify(kuint16); }
TEST_F(BufferWriterTest, Append2s) { Verify(kint16); }
TEST_F(BufferWriterTest, Append4) { Verify(kuint32); }
TEST_F(BufferWriterTest, Append4s) { Verify(kint32); }
TEST_F(BufferWriterTest, Append8) { Verify(kuint64); }

TEST_F(BufferWriterTest, BigEndianLayout) {
  writer_->AppendInt(static_cast<uint32_t>(0x00010203));
  ASSERT_EQ(4u, writer_->Size());
  EXPECT_EQ(0x00, writer_->Buffer()[0]);
  EXPECT_EQ(0x01, writer_->Buffer()[1]);
  EXPECT_EQ(0x02, writer_->Buffer()[2]);
  EXPECT_EQ(0x03, writer_->Buffer()[3]);
}

TEST_F(BufferWriterTest, AppendNBytes) {
  // Write the least significant four bytes and verify the result.
  writer_->AppendNBytes(kuint64, sizeof(uint32_t));
  ASSERT_EQ(sizeof(uint32_t), writer_->Size());

  CreateReader();
  ReadAndExpect(static_cast<uint32_t>(kuint64 & 0xFFFFFFFF));
}

TEST_F(BufferWriterTest, AppendVector) {
  std::vector<uint8_t> v(kuint8Array, kuint8Array + sizeof(kuint8Array));
  writer_->AppendVector(v);
  ASSERT_EQ(sizeof(kuint8Array), writer_->Size());

  CreateReader();
  std::vector<uint8_t> data_read;
  ASSERT_TRUE(reader_->ReadToVector(&data_read, sizeof(kuint8Array)));
  ASSERT_EQ(v, data_read);
}

TEST_F(BufferWriterTest, AppendCStringAddsTerminator) {
  writer_->AppendCString("Color");
  ASSERT_EQ(6u, writer_->Size());
  EXPECT_EQ(0, writer_->Buffer()[5]);

  CreateReader();
  std::string data_read;
  ASSERT_TRUE(reader_->ReadCString(&data_read));
  EXPECT_EQ("Color", data_read);
  EXPECT_FALSE(reader_->HasBytes(1));
}

TEST_F(BufferWriterTest, AppendEmptyCString) {
  writer_->AppendCString("");
  ASSERT_EQ(1u, writer_->Size());
}

TEST_F(BufferWriterTest, WriteToFile) {
  const char kOutputFile[] = "memory://buffer_writer_test";
  std::unique_ptr<File, FileCloser> output_file(File::Open(kOutputFile, "w"));
  ASSERT_TRUE(output_file);

  writer_->AppendArray(kuint8Array, sizeof(kuint8Array));
  ASSERT_OK(writer_->WriteToFile(output_file.get()));
  EXPECT_EQ(0u, writer_->Size());
  output_file.reset();

  std::string contents;
  ASSERT_TRUE(File::ReadFileToString(kOutputFile, &contents));
  EXPECT_EQ(std::string(kuint8Array, kuint8Array + sizeof(kuint8Array)),
            contents);
}

TEST_F(BufferWriterTest, WriteArrayToFileReportsFailure) {
  std::unique_ptr<File, FileCloser> file(new FailingFile("failing"));
  Status status = BufferWriter::WriteArrayToFile(
      kuint8Array, sizeof(kuint8Array), file.get());
  EXPECT_EQ(error::FILE_FAILURE, status.error_code());
}

TEST_F(BufferWriterTest, WriteToFileKeepsBufferOnFailure) {
  std::unique_ptr<File, FileCloser> file(new FailingFile("failing"));
  writer_->AppendArray(kuint8Array, sizeof(kuint8Array));
  EXPECT_NOT_OK(writer_->WriteToFile(file.get()));
  EXPECT_EQ(sizeof(kuint8Array), writer_->Size());
}

}  // namespace media
}  // namespace avifmux
