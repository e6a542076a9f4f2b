/**
 * This file is part of filechunker.
 */

#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

#include <string>

#include "util/exception.h"
#include "util/mmap_file.h"
#include "util/posix.h"

using namespace std;  // NOLINT

class T_MemoryMappedFile : public ::testing::Test {
 protected:
  virtual void SetUp() {
    tmp_path_ = CreateTempDir("./filechunker_ut_mmap");
    ASSERT_NE("", tmp_path_);
  }

  virtual void TearDown() {
    if (tmp_path_ != "")
      RemoveTree(tmp_path_);
  }

  string CreateFileWithContent(const string &name, const string &content) {
    const string path = tmp_path_ + "/" + name;
    EXPECT_TRUE(SafeWriteToFile(content, path, kDefaultFileMode));
    return path;
  }

  string tmp_path_;
};


TEST_F(T_MemoryMappedFile, MapPath) {
  const string path = CreateFileWithContent("mappedfile.txt",
                                            "some dummy content\n");
  MemoryMappedFile mf(path);
  EXPECT_EQ(path, mf.file_path());
  EXPECT_FALSE(mf.IsMapped());
#ifndef FILECHUNKER_RAISE_EXCEPTIONS
  EXPECT_DEATH(mf.Unmap(), ".*");
#endif

  ASSERT_TRUE(mf.Map());
  EXPECT_TRUE(mf.IsMapped());
  EXPECT_FALSE(mf.Map());
  ASSERT_EQ(19U, mf.size());
  EXPECT_EQ("some dummy content\n",
            string(reinterpret_cast<char *>(mf.buffer()), mf.size()));

  mf.Unmap();
  EXPECT_FALSE(mf.IsMapped());
  EXPECT_TRUE(mf.buffer() == NULL);
  EXPECT_EQ(0U, mf.size());

  // Can be mapped again
  EXPECT_TRUE(mf.Map());
  EXPECT_EQ(19U, mf.size());
}


TEST_F(T_MemoryMappedFile, MapEmptyFile) {
  MemoryMappedFile mf(CreateFileWithContent("empty", ""));
  ASSERT_TRUE(mf.Map());
  EXPECT_TRUE(mf.IsMapped());
  EXPECT_TRUE(mf.buffer() == NULL);
  EXPECT_EQ(0U, mf.size());
  mf.Unmap();
  EXPECT_FALSE(mf.IsMapped());
}


TEST_F(T_MemoryMappedFile, MapDescriptor) {
  const string path = CreateFileWithContent("fd.txt", "0123456789");
  int fd = open(path.c_str(), O_RDONLY);
  ASSERT_GE(fd, 0);
  {
    MemoryMappedFile mf(fd);
    ASSERT_TRUE(mf.Map());
    EXPECT_EQ(10U, mf.size());
    EXPECT_EQ('0', mf.buffer()[0]);
    EXPECT_EQ('9', mf.buffer()[9]);
  }
  // The descriptor stays open
  EXPECT_EQ(0, close(fd));
}


TEST_F(T_MemoryMappedFile, MapFailures) {
  MemoryMappedFile missing(tmp_path_ + "/no_such_file");
  EXPECT_FALSE(missing.Map());
  EXPECT_FALSE(missing.IsMapped());

  MemoryMappedFile directory(tmp_path_);
  EXPECT_FALSE(directory.Map());

  MemoryMappedFile bad_descriptor(-1);
  EXPECT_FALSE(bad_descriptor.Map());

  const string path = CreateFileWithContent("wronly", "0123456789");
  int fd = open(path.c_str(), O_WRONLY);
  ASSERT_GE(fd, 0);
  MemoryMappedFile write_only(fd);
  EXPECT_FALSE(write_only.Map());
  EXPECT_EQ(0, close(fd));
}


#ifdef FILECHUNKER_RAISE_EXCEPTIONS
TEST_F(T_MemoryMappedFile, UnmapUnmapped) {
  MemoryMappedFile mf(tmp_path_ + "/no_such_file");
  EXPECT_THROW(mf.Unmap(), EFileChunkerException);
}
#else
TEST_F(T_MemoryMappedFile, UnmapUnmapped) {
  MemoryMappedFile mf(tmp_path_ + "/no_such_file");
  EXPECT_DEATH(mf.Unmap(), "");
}
#endif
