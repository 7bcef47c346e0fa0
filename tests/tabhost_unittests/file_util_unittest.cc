// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include <string>

#include "gtest/gtest.h"
#include "include/wrapper/cef_scoped_temp_dir.h"
#include "tabhost/common/file_util.h"

using namespace tabhost;

TEST(FileUtil, JoinPath) {
  // Should return whichever path component is non-empty.
  EXPECT_STREQ("", file_util::JoinPath("", "").c_str());
  EXPECT_STREQ("path1", file_util::JoinPath("path1", "").c_str());
  EXPECT_STREQ("path2", file_util::JoinPath("", "path2").c_str());

  const std::string& expected =
      std::string("path1") + file_util::kPathSep + std::string("path2");

  // Should always be 1 kPathSep character between paths.
  EXPECT_STREQ(expected.c_str(), file_util::JoinPath("path1", "path2").c_str());
  EXPECT_STREQ(expected.c_str(),
               file_util::JoinPath(std::string("path1") + file_util::kPathSep,
                                   "path2")
                   .c_str());
  EXPECT_STREQ(expected.c_str(),
               file_util::JoinPath("path1",
                                   file_util::kPathSep + std::string("path2"))
                   .c_str());
}

TEST(FileUtil, GetBaseName) {
  EXPECT_STREQ("", file_util::GetBaseName("").c_str());
  EXPECT_STREQ("foo", file_util::GetBaseName("foo").c_str());
  EXPECT_STREQ("foo.ext", file_util::GetBaseName("/path/to/foo.ext").c_str());
  EXPECT_STREQ("", file_util::GetBaseName("/path/to/").c_str());
}

TEST(FileUtil, GetFileExtension) {
  EXPECT_TRUE(file_util::GetFileExtension(std::string()).empty());
  EXPECT_TRUE(file_util::GetFileExtension("/path/to/foo").empty());
  EXPECT_STREQ("ext", file_util::GetFileExtension("/path/to/foo.ext").c_str());
  EXPECT_STREQ("gz", file_util::GetFileExtension("archive.tar.gz").c_str());

  // A leading dot marks a hidden file, not an extension.
  EXPECT_TRUE(file_util::GetFileExtension("/home/user/.bashrc").empty());

  // Dots in directory names are ignored.
  EXPECT_TRUE(file_util::GetFileExtension("/path.d/foo").empty());
}

TEST(FileUtil, RemoveFileExtension) {
  EXPECT_STREQ("foo", file_util::RemoveFileExtension("foo.ext").c_str());
  EXPECT_STREQ("archive.tar",
               file_util::RemoveFileExtension("archive.tar.gz").c_str());
  EXPECT_STREQ("foo", file_util::RemoveFileExtension("foo").c_str());
  EXPECT_STREQ(".bashrc", file_util::RemoveFileExtension(".bashrc").c_str());
}

TEST(FileUtil, CreateDirectory) {
  CefScopedTempDir dir;
  EXPECT_TRUE(dir.CreateUniqueTempDir());

  const std::string& nested = file_util::JoinPath(
      file_util::JoinPath(dir.GetPath(), "a"), file_util::JoinPath("b", "c"));
  EXPECT_FALSE(file_util::PathExists(nested));

  // Missing parents are created as well.
  EXPECT_TRUE(file_util::CreateDirectory(nested));
  EXPECT_TRUE(file_util::DirectoryExists(nested));

  // Creating an existing directory succeeds.
  EXPECT_TRUE(file_util::CreateDirectory(nested));

  EXPECT_FALSE(file_util::CreateDirectory(std::string()));
}

TEST(FileUtil, DirectoryExistsRejectsFiles) {
  CefScopedTempDir dir;
  EXPECT_TRUE(dir.CreateUniqueTempDir());

  const std::string& path = file_util::JoinPath(dir.GetPath(), "file.txt");
  FILE* file = fopen(path.c_str(), "w");
  ASSERT_TRUE(file);
  fclose(file);

  EXPECT_TRUE(file_util::PathExists(path));
  EXPECT_FALSE(file_util::DirectoryExists(path));
}

TEST(FileUtil, GetHomeDirectory) {
  EXPECT_FALSE(file_util::GetHomeDirectory().empty());
}
