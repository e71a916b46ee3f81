/*
 * Copyright 2022 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef COMMON_PATH_H_
#define COMMON_PATH_H_

#include <sys/stat.h>

#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace func_sync {

class Buffer;

// Closes the file on destruction.
class FileCloser {
 public:
  explicit FileCloser(FILE* f) : fp_(f) {}
  ~FileCloser() {
    if (fp_) fclose(fp_);
  }

  FileCloser(const FileCloser&) = delete;
  FileCloser& operator=(const FileCloser&) = delete;

  // Closes the file now and reports whether buffered data could be flushed.
  absl::Status Close();

  FILE* get() const { return fp_; }

  // Gives up ownership without closing the file.
  FILE* Release() {
    FILE* fp = fp_;
    fp_ = nullptr;
    return fp;
  }

 private:
  FILE* fp_;
};

// Helpers for the local file system. All file paths are UTF-8, '/'-separated
// POSIX paths. Functions that inspect entries never follow symlinks.
namespace path {

// Joins |path| and |to_append|, adding a '/' separator if necessary.
std::string Join(absl::string_view path, absl::string_view to_append);
std::string Join(absl::string_view path, absl::string_view to_append1,
                 absl::string_view to_append2);

// Returns the parent directory part of |path|, e.g. "a/b" for "a/b/c" and ""
// for "c".
std::string DirName(const std::string& path);

// Returns the last component of |path|, e.g. "c" for "a/b/c".
std::string BaseName(const std::string& path);

// Type and permission information of a directory entry.
struct Stats {
  // st_mode as returned by lstat().
  uint32_t mode = 0;
  uint64_t size = 0;
  int64_t mtime_sec = 0;
  uint32_t mtime_nsec = 0;

  bool IsDir() const { return S_ISDIR(mode); }
  bool IsRegular() const { return S_ISREG(mode); }
  bool IsSymlink() const { return S_ISLNK(mode); }
};

// Gets the stats of the entry at |path|. Does not follow symlinks.
absl::Status GetStats(const std::string& path, Stats* stats);

// Returns true if an entry (of any type, including dangling symlinks) exists
// at |path|.
bool Exists(const std::string& path);

// Checks that every existing parent of |rel_path| below |root| is a real
// directory and not a symlink or file, so that writing |rel_path| stays
// inside |root|. Missing parents are fine. Returns FailedPrecondition
// otherwise. |root| itself is not checked.
absl::Status CheckParentsAreDirs(const std::string& root,
                                 const std::string& rel_path);

// Opens the file at |path| with the fopen() |mode|.
absl::StatusOr<FILE*> OpenFile(const std::string& path, const char* mode);

// Creates a new, empty file with a unique name starting with |prefix| in
// |dir|, opened for writing. Returns the path of the file in |temp_path|.
absl::StatusOr<FILE*> CreateTempFile(const std::string& dir,
                                     const std::string& prefix,
                                     std::string* temp_path);

// Called with consecutive pieces of the file. The final call passes
// (nullptr, 0) to indicate EOF.
using StreamReadFileHandler =
    std::function<absl::Status(const void* data, size_t size)>;

// Reads |file| piece by piece into |buffer| and calls |handler| for each
// piece. |buffer| must not be empty.
absl::Status StreamReadFileContents(FILE* file, Buffer* buffer,
                                    StreamReadFileHandler handler);

// Reads the whole file at |path|.
absl::StatusOr<std::string> ReadFile(const std::string& path);

// Writes |data| to the file at |path|, replacing existing contents.
absl::Status WriteFile(const std::string& path, absl::string_view data);

// Creates a symlink at |link_path| pointing to |target|.
absl::Status CreateSymlink(const std::string& target,
                           const std::string& link_path);

// Returns the target of the symlink at |link_path|.
absl::StatusOr<std::string> GetSymlinkTarget(const std::string& link_path);

// Creates the directory |path| with permission bits |mode|. The parent must
// exist.
absl::Status CreateDir(const std::string& path, uint32_t mode);

// Creates the directory |path| and all missing parents.
absl::Status CreateDirRec(const std::string& path);

// Removes the file or symlink at |path|. No-op if it does not exist.
absl::Status RemoveFile(const std::string& path);

// Removes the entry at |path|, recursively for directories. No-op if it does
// not exist.
absl::Status RemoveAll(const std::string& path);

// Atomically renames |from_path| to |to_path|, replacing an existing file.
absl::Status RenameFile(const std::string& from_path,
                        const std::string& to_path);

// Sets the permission bits of |path| to |mode|.
absl::Status ChangeMode(const std::string& path, uint32_t mode);

// Sets the access and modification time of |path|. Does not follow symlinks.
absl::Status SetFileTime(const std::string& path, int64_t mtime_sec,
                         uint32_t mtime_nsec);

}  // namespace path
}  // namespace func_sync

#endif  // COMMON_PATH_H_
