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

#include "sync/dir_enumerator.h"

#include <string>
#include <vector>

#include "common/path.h"
#include "common/status_test_macros.h"
#include "gtest/gtest.h"

namespace func_sync {
namespace {

class DirEnumeratorTest : public ::testing::Test {
 public:
  void SetUp() override {
    root_ = path::Join(::testing::TempDir(), "__dir_enumerator_unittest");
    EXPECT_OK(path::RemoveAll(root_));
    EXPECT_OK(path::CreateDirRec(path::Join(root_, "b", "d")));
    EXPECT_OK(path::WriteFile(path::Join(root_, "b", "c.txt"), "c"));
    EXPECT_OK(path::WriteFile(path::Join(root_, "a.txt"), "aa"));
    EXPECT_OK(path::CreateSymlink("b", path::Join(root_, "link")));
  }

  void TearDown() override { EXPECT_OK(path::RemoveAll(root_)); }

 protected:
  struct Entry {
    std::string source_path;
    std::string relative_path;
    path::Stats stats;
  };

  absl::Status Walk(const std::string& root, std::vector<Entry>* entries) {
    return WalkDirectory(root)(
        [entries](const std::string& source_path,
                  const std::string& relative_path, const path::Stats& stats,
                  absl::Status walk_status) {
          EXPECT_OK(walk_status);
          entries->push_back({source_path, relative_path, stats});
          return absl::OkStatus();
        });
  }

  std::string root_;
};

TEST_F(DirEnumeratorTest, ParentsBeforeChildrenSortedByName) {
  std::vector<Entry> entries;
  ASSERT_OK(Walk(root_, &entries));

  std::vector<std::string> relative_paths;
  for (const Entry& entry : entries) {
    relative_paths.push_back(entry.relative_path);
  }
  EXPECT_EQ(relative_paths, std::vector<std::string>(
                                {"a.txt", "b", "b/c.txt", "b/d", "link"}));

  EXPECT_EQ(entries[0].source_path, path::Join(root_, "a.txt"));
  EXPECT_TRUE(entries[0].stats.IsRegular());
  EXPECT_EQ(entries[0].stats.size, 2u);
  EXPECT_TRUE(entries[1].stats.IsDir());
  EXPECT_EQ(entries[2].source_path, path::Join(root_, "b", "c.txt"));
  EXPECT_TRUE(entries[3].stats.IsDir());
}

TEST_F(DirEnumeratorTest, SymlinksAreNotFollowed) {
  std::vector<Entry> entries;
  ASSERT_OK(Walk(root_, &entries));
  ASSERT_EQ(entries.size(), 5u);
  EXPECT_EQ(entries[4].relative_path, "link");
  EXPECT_TRUE(entries[4].stats.IsSymlink());
}

TEST_F(DirEnumeratorTest, EmptyRoot) {
  std::string empty_dir = path::Join(root_, "b", "d");
  std::vector<Entry> entries;
  ASSERT_OK(Walk(empty_dir, &entries));
  EXPECT_TRUE(entries.empty());
}

TEST_F(DirEnumeratorTest, RootMustBeDirectory) {
  std::vector<Entry> entries;
  EXPECT_ERROR(InvalidArgument, Walk(path::Join(root_, "a.txt"), &entries));
  EXPECT_ERROR(InvalidArgument, Walk(path::Join(root_, "link"), &entries));
  EXPECT_ERROR(NotFound, Walk(path::Join(root_, "missing"), &entries));
  EXPECT_TRUE(entries.empty());
}

TEST_F(DirEnumeratorTest, ProcessErrorStopsWalk) {
  int count = 0;
  absl::Status status = WalkDirectory(root_)(
      [&count](const std::string&, const std::string& relative_path,
               const path::Stats&, absl::Status) -> absl::Status {
        ++count;
        if (relative_path == "b/c.txt") return absl::AbortedError("stop");
        return absl::OkStatus();
      });
  EXPECT_ERROR_MSG(Aborted, "stop", status);
  EXPECT_EQ(count, 3);
}

}  // namespace
}  // namespace func_sync
