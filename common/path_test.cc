// Copyright 2022 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "common/path.h"

#include <cstring>
#include <string>

#include "absl/strings/match.h"
#include "common/buffer.h"
#include "common/status_test_macros.h"
#include "gtest/gtest.h"

namespace func_sync {
namespace {

constexpr char kUnicodeText[] = u8"\U0001F964\U0001F964\U0001F964";
constexpr char kTestText[] = "test text";

class PathTest : public ::testing::Test {
 public:
  void SetUp() override {
    base_dir_ = path::Join(::testing::TempDir(), "__path_unittest_base");
    EXPECT_OK(path::RemoveAll(base_dir_));
    EXPECT_OK(path::CreateDirRec(base_dir_));
  }

  void TearDown() override { EXPECT_OK(path::RemoveAll(base_dir_)); }

 protected:
  std::string base_dir_;
};

TEST_F(PathTest, Join) {
  EXPECT_EQ(path::Join("a", "b"), "a/b");
  EXPECT_EQ(path::Join("a/", "b"), "a/b");
  EXPECT_EQ(path::Join("", "b"), "b");
  EXPECT_EQ(path::Join("a", ""), "a");
  EXPECT_EQ(path::Join("a", "b", "c"), "a/b/c");
}

TEST_F(PathTest, DirName) {
  EXPECT_EQ(path::DirName(""), "");
  EXPECT_EQ(path::DirName("foo"), "");
  EXPECT_EQ(path::DirName("/"), "/");
  EXPECT_EQ(path::DirName("/foo"), "/");
  EXPECT_EQ(path::DirName("a/b/c"), "a/b");
  EXPECT_EQ(path::DirName("a//c/"), "a");
}

TEST_F(PathTest, BaseName) {
  EXPECT_EQ(path::BaseName(""), "");
  EXPECT_EQ(path::BaseName("/"), "");
  EXPECT_EQ(path::BaseName("foo"), "foo");
  EXPECT_EQ(path::BaseName("a/b/c"), "c");
  EXPECT_EQ(path::BaseName("a/b/"), "b");
}

TEST_F(PathTest, WriteReadFileUnicode) {
  std::string file = path::Join(base_dir_, kUnicodeText);
  EXPECT_OK(path::WriteFile(file, kTestText));
  absl::StatusOr<std::string> data = path::ReadFile(file);
  ASSERT_OK(data);
  EXPECT_EQ(*data, kTestText);
}

TEST_F(PathTest, ReadMissingFileFails) {
  EXPECT_ERROR(NotFound, path::ReadFile(path::Join(base_dir_, "missing")));
}

TEST_F(PathTest, GetStatsDoesNotFollowSymlinks) {
  std::string file = path::Join(base_dir_, "file.txt");
  std::string link = path::Join(base_dir_, "link");
  EXPECT_OK(path::WriteFile(file, kTestText));
  EXPECT_OK(path::CreateSymlink("file.txt", link));

  path::Stats stats;
  EXPECT_OK(path::GetStats(file, &stats));
  EXPECT_TRUE(stats.IsRegular());
  EXPECT_EQ(stats.size, strlen(kTestText));

  EXPECT_OK(path::GetStats(link, &stats));
  EXPECT_TRUE(stats.IsSymlink());

  absl::StatusOr<std::string> target = path::GetSymlinkTarget(link);
  ASSERT_OK(target);
  EXPECT_EQ(*target, "file.txt");
}

TEST_F(PathTest, CheckParentsAreDirs) {
  EXPECT_OK(path::CreateDirRec(path::Join(base_dir_, "a", "b")));
  EXPECT_OK(path::WriteFile(path::Join(base_dir_, "file.txt"), kTestText));
  EXPECT_OK(path::CreateSymlink("a", path::Join(base_dir_, "link")));

  EXPECT_OK(path::CheckParentsAreDirs(base_dir_, "top.txt"));
  EXPECT_OK(path::CheckParentsAreDirs(base_dir_, "a/b/c.txt"));
  EXPECT_OK(path::CheckParentsAreDirs(base_dir_, "a/missing/x/c.txt"));
  EXPECT_OK(path::CheckParentsAreDirs(base_dir_, "link"));

  EXPECT_ERROR_MSG(FailedPrecondition, "not a directory",
                   path::CheckParentsAreDirs(base_dir_, "link/c.txt"));
  EXPECT_ERROR(FailedPrecondition,
               path::CheckParentsAreDirs(base_dir_, "file.txt/c.txt"));
}

TEST_F(PathTest, SetFileTimeWithNanoseconds) {
  std::string file = path::Join(base_dir_, "file.txt");
  EXPECT_OK(path::WriteFile(file, kTestText));
  EXPECT_OK(path::SetFileTime(file, 1000000000, 123456789));

  path::Stats stats;
  EXPECT_OK(path::GetStats(file, &stats));
  EXPECT_EQ(stats.mtime_sec, 1000000000);
  EXPECT_EQ(stats.mtime_nsec, 123456789u);
}

TEST_F(PathTest, CreateDirAndChangeMode) {
  std::string dir = path::Join(base_dir_, "dir");
  EXPECT_OK(path::CreateDir(dir, 0700));
  EXPECT_OK(path::ChangeMode(dir, 0750));

  path::Stats stats;
  EXPECT_OK(path::GetStats(dir, &stats));
  EXPECT_TRUE(stats.IsDir());
  EXPECT_EQ(stats.mode & 07777, 0750u);

  EXPECT_NOT_OK(path::CreateDir(path::Join(base_dir_, "x", "y"), 0700));
}

TEST_F(PathTest, CreateTempFileAndRename) {
  std::string temp_path;
  absl::StatusOr<FILE*> file =
      path::CreateTempFile(base_dir_, ".target.", &temp_path);
  ASSERT_OK(file);
  EXPECT_TRUE(absl::StrContains(path::BaseName(temp_path), ".target."));
  FileCloser closer(*file);
  EXPECT_EQ(fwrite("abc", 1, 3, *file), 3u);
  EXPECT_OK(closer.Close());

  std::string target = path::Join(base_dir_, "target");
  EXPECT_OK(path::RenameFile(temp_path, target));
  EXPECT_FALSE(path::Exists(temp_path));
  absl::StatusOr<std::string> data = path::ReadFile(target);
  ASSERT_OK(data);
  EXPECT_EQ(*data, "abc");
}

TEST_F(PathTest, StreamReadFileContents) {
  std::string file_path = path::Join(base_dir_, "file.txt");
  EXPECT_OK(path::WriteFile(file_path, "0123456789"));
  absl::StatusOr<FILE*> file = path::OpenFile(file_path, "rb");
  ASSERT_OK(file);
  FileCloser closer(*file);

  Buffer buffer(4);
  std::string contents;
  int num_calls = 0;
  bool eof = false;
  EXPECT_OK(path::StreamReadFileContents(
      *file, &buffer, [&](const void* data, size_t size) {
        ++num_calls;
        if (!data) {
          eof = true;
        } else {
          contents.append(static_cast<const char*>(data), size);
        }
        return absl::OkStatus();
      }));
  EXPECT_TRUE(eof);
  EXPECT_EQ(contents, "0123456789");
  EXPECT_EQ(num_calls, 4);
}

TEST_F(PathTest, RemoveMissingEntriesSucceeds) {
  EXPECT_OK(path::RemoveFile(path::Join(base_dir_, "missing")));
  EXPECT_OK(path::RemoveAll(path::Join(base_dir_, "missing")));
}

}  // namespace
}  // namespace func_sync
