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

#include <dirent.h>
#include <errno.h>

#include <algorithm>
#include <cstring>
#include <vector>

#include "absl/strings/str_format.h"
#include "common/status.h"
#include "common/status_macros.h"

namespace func_sync {
namespace {

// Closes the directory stream on destruction.
class DirCloser {
 public:
  explicit DirCloser(DIR* dir) : dir_(dir) {}
  ~DirCloser() { closedir(dir_); }

  DirCloser(const DirCloser&) = delete;
  DirCloser& operator=(const DirCloser&) = delete;

 private:
  DIR* dir_;
};

absl::Status ListDir(const std::string& dir_path,
                     std::vector<std::string>* names) {
  DIR* dir = opendir(dir_path.c_str());
  if (!dir) {
    return absl::ErrnoToStatus(
        errno, absl::StrFormat("opendir() failed for '%s'", dir_path));
  }
  DirCloser closer(dir);

  for (;;) {
    errno = 0;
    struct dirent* dent = readdir(dir);
    if (!dent) {
      if (errno != 0) {
        return absl::ErrnoToStatus(
            errno, absl::StrFormat("readdir() failed for '%s'", dir_path));
      }
      break;
    }
    if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
    names->push_back(dent->d_name);
  }
  std::sort(names->begin(), names->end());
  return absl::OkStatus();
}

// Reports the entries |names| of |dir_path| and recurses into directories.
absl::Status WalkEntries(const std::string& dir_path,
                         const std::string& relative_dir,
                         const std::vector<std::string>& names,
                         const ProcessFileFn& process) {
  for (const std::string& name : names) {
    std::string source_path = path::Join(dir_path, name);
    std::string relative_path =
        relative_dir.empty() ? name : relative_dir + "/" + name;

    path::Stats stats;
    absl::Status walk_status = path::GetStats(source_path, &stats);
    if (!walk_status.ok()) {
      RETURN_IF_ERROR(
          process(source_path, relative_path, path::Stats(), walk_status));
      continue;
    }
    RETURN_IF_ERROR(process(source_path, relative_path, stats, walk_status));
    if (!stats.IsDir()) continue;

    // A directory that cannot be listed is reported a second time, with the
    // error.
    std::vector<std::string> children;
    walk_status = ListDir(source_path, &children);
    if (!walk_status.ok()) {
      RETURN_IF_ERROR(
          process(source_path, relative_path, path::Stats(), walk_status));
      continue;
    }
    RETURN_IF_ERROR(WalkEntries(source_path, relative_path, children, process));
  }
  return absl::OkStatus();
}

}  // namespace

FileEnumerator WalkDirectory(const std::string& root) {
  return [root](const ProcessFileFn& process) -> absl::Status {
    path::Stats stats;
    RETURN_IF_ERROR(path::GetStats(root, &stats), "Failed to stat '%s'", root);
    if (!stats.IsDir()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("'%s' is not a directory", root));
    }
    std::vector<std::string> names;
    RETURN_IF_ERROR(ListDir(root, &names));
    return WalkEntries(root, std::string(), names, process);
  };
}

}  // namespace func_sync
