// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/file.h>

#include <cstring>
#include <filesystem>
#include <memory>

#include <gtest/gtest.h>

#include <avifmux/file/file_closer.h>
#include <avifmux/file/memory_file.h>

namespace avifmux {
namespace {

const uint8_t kWriteBuffer[] = {1, 2, 3, 4, 5, 6, 7, 8};
const int64_t kWriteBufferSize = sizeof(kWriteBuffer);

}  // namespace

class MemoryFileTest : public testing::Test {
 protected:
  void TearDown() override { MemoryFile::DeleteAll(); }
};

TEST_F(MemoryFileTest, WriteThenRead) {
  std::unique_ptr<File, FileCloser> writer(File::Open("memory://file1", "w"));
  ASSERT_TRUE(writer);
  ASSERT_EQ(kWriteBufferSize, writer->Write(kWriteBuffer, kWriteBufferSize));
  writer.reset();

  std::unique_ptr<File, FileCloser> reader(File::Open("memory://file1", "r"));
  ASSERT_TRUE(reader);
  uint8_t read_buffer[kWriteBufferSize];
  ASSERT_EQ(kWriteBufferSize, reader->Read(read_buffer, kWriteBufferSize));
  EXPECT_EQ(0, memcmp(kWriteBuffer, read_buffer, kWriteBufferSize));
  EXPECT_EQ(0, reader->Read(read_buffer, kWriteBufferSize));
}

TEST_F(MemoryFileTest, SupportsDifferentFiles) {
  std::unique_ptr<File, FileCloser> file1(File::Open("memory://file1", "w"));
  std::unique_ptr<File, FileCloser> file2(File::Open("memory://file2", "w"));
  ASSERT_TRUE(file1);
  ASSERT_TRUE(file2);

  ASSERT_EQ(kWriteBufferSize, file1->Write(kWriteBuffer, kWriteBufferSize));
  EXPECT_EQ(kWriteBufferSize, file1->Size());
  EXPECT_EQ(0, file2->Size());
}

TEST_F(MemoryFileTest, AppendsOnConsecutiveWrites) {
  std::unique_ptr<File, FileCloser> file(File::Open("memory://file1", "w"));
  ASSERT_TRUE(file);
  ASSERT_EQ(kWriteBufferSize, file->Write(kWriteBuffer, kWriteBufferSize));
  ASSERT_EQ(kWriteBufferSize, file->Write(kWriteBuffer, kWriteBufferSize));
  EXPECT_EQ(2 * kWriteBufferSize, file->Size());
}

TEST_F(MemoryFileTest, ReadMissingFileFails) {
  std::unique_ptr<File, FileCloser> file(File::Open("memory://file1", "r"));
  EXPECT_FALSE(file);
}

TEST_F(MemoryFileTest, OpenTwiceFails) {
  std::unique_ptr<File, FileCloser> file1(File::Open("memory://file1", "w"));
  ASSERT_TRUE(file1);
  std::unique_ptr<File, FileCloser> file2(File::Open("memory://file1", "w"));
  EXPECT_FALSE(file2);
}

TEST_F(MemoryFileTest, WriteExistingFileTruncates) {
  std::unique_ptr<File, FileCloser> file1(File::Open("memory://file1", "w"));
  ASSERT_TRUE(file1);
  ASSERT_EQ(kWriteBufferSize, file1->Write(kWriteBuffer, kWriteBufferSize));
  file1.reset();

  std::unique_ptr<File, FileCloser> file2(File::Open("memory://file1", "w"));
  ASSERT_TRUE(file2);
  EXPECT_EQ(0, file2->Size());
}

TEST_F(MemoryFileTest, ReadFileToString) {
  std::unique_ptr<File, FileCloser> file(File::Open("memory://file1", "w"));
  ASSERT_TRUE(file);
  ASSERT_EQ(3, file->Write("abc", 3));
  file.reset();

  std::string contents;
  ASSERT_TRUE(File::ReadFileToString("memory://file1", &contents));
  EXPECT_EQ("abc", contents);
}

TEST(LocalFileTest, WriteReadAndDelete) {
  const std::string path =
      (std::filesystem::temp_directory_path() / "avifmux_local_file_test/out")
          .string();

  std::unique_ptr<File, FileCloser> file(File::Open(path.c_str(), "w"));
  ASSERT_TRUE(file);
  ASSERT_EQ(kWriteBufferSize, file->Write(kWriteBuffer, kWriteBufferSize));
  EXPECT_EQ(kWriteBufferSize, file->Size());
  file.reset();

  std::string contents;
  ASSERT_TRUE(File::ReadFileToString(("file://" + path).c_str(), &contents));
  EXPECT_EQ(std::string(kWriteBuffer, kWriteBuffer + kWriteBufferSize),
            contents);

  EXPECT_TRUE(std::filesystem::remove(path));
  EXPECT_FALSE(File::ReadFileToString(path.c_str(), &contents));
}

}  // namespace avifmux
