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

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "common/buffer.h"
#include "common/status.h"

namespace func_sync {
namespace {

// Returns a status with the canonical code for |err| and a message containing
// the formatted text and strerror(|err|).
template <typename... Args>
absl::Status ErrnoStatus(int err, const absl::FormatSpec<Args...>& format,
                         Args... args) {
  return absl::ErrnoToStatus(err, absl::StrFormat(format, args...));
}

template <typename... Args>
absl::Status ErrorCodeStatus(const std::error_code& code,
                             const absl::FormatSpec<Args...>& format,
                             Args... args) {
  if (!code) return absl::OkStatus();
  return absl::ErrnoToStatus(code.value(), absl::StrFormat(format, args...));
}

}  // namespace

absl::Status FileCloser::Close() {
  if (!fp_) return absl::OkStatus();
  FILE* fp = Release();
  if (fclose(fp) != 0) {
    return ErrnoStatus(errno, "fclose() failed");
  }
  return absl::OkStatus();
}

namespace path {

std::string Join(absl::string_view path, absl::string_view to_append) {
  if (path.empty()) return std::string(to_append);
  if (to_append.empty()) return std::string(path);
  if (path.back() == '/') return absl::StrCat(path, to_append);
  return absl::StrCat(path, "/", to_append);
}

std::string Join(absl::string_view path, absl::string_view to_append1,
                 absl::string_view to_append2) {
  return Join(Join(path, to_append1), to_append2);
}

std::string DirName(const std::string& path) {
  size_t non_sep_pos = path.find_last_not_of('/');
  if (non_sep_pos == std::string::npos) {
    // Handle "" and "/", "//".
    return path.empty() ? std::string() : std::string("/");
  }
  size_t sep_pos = path.find_last_of('/', non_sep_pos);
  // Handle "foo".
  if (sep_pos == std::string::npos) return std::string();
  // Handle "/foo" and "a//foo".
  size_t dir_end_pos = path.find_last_not_of('/', sep_pos);
  if (dir_end_pos == std::string::npos) return std::string("/");
  return path.substr(0, dir_end_pos + 1);
}

std::string BaseName(const std::string& path) {
  size_t non_sep_pos = path.find_last_not_of('/');
  if (non_sep_pos == std::string::npos) return std::string();
  size_t sep_pos = path.find_last_of('/', non_sep_pos);
  if (sep_pos == std::string::npos) return path.substr(0, non_sep_pos + 1);
  return path.substr(sep_pos + 1, non_sep_pos - sep_pos);
}

absl::Status GetStats(const std::string& path, Stats* stats) {
  struct stat os_stats;
  if (lstat(path.c_str(), &os_stats) != 0) {
    int err = errno;
    *stats = Stats();
    return ErrnoStatus(err, "Failed to stat '%s'", path);
  }

  stats->mode = os_stats.st_mode;
  stats->size = static_cast<uint64_t>(os_stats.st_size);
  stats->mtime_sec = static_cast<int64_t>(os_stats.st_mtim.tv_sec);
  stats->mtime_nsec = static_cast<uint32_t>(os_stats.st_mtim.tv_nsec);
  return absl::OkStatus();
}

absl::Status CheckParentsAreDirs(const std::string& root,
                                 const std::string& rel_path) {
  for (size_t pos = rel_path.find('/'); pos != std::string::npos;
       pos = rel_path.find('/', pos + 1)) {
    const std::string parent = Join(root, rel_path.substr(0, pos));
    Stats stats;
    absl::Status status = GetStats(parent, &stats);
    if (absl::IsNotFound(status)) return absl::OkStatus();
    if (!status.ok()) return status;
    if (!stats.IsDir()) {
      return absl::FailedPreconditionError(absl::StrFormat(
          "Parent '%s' of '%s' is not a directory", parent, rel_path));
    }
  }
  return absl::OkStatus();
}

bool Exists(const std::string& path) {
  Stats stats;
  return GetStats(path, &stats).ok();
}

absl::StatusOr<FILE*> OpenFile(const std::string& path, const char* mode) {
  FILE* file = fopen(path.c_str(), mode);
  if (!file) {
    return ErrnoStatus(errno, "Failed to open file '%s' with mode '%s'", path,
                       mode);
  }
  return file;
}

absl::StatusOr<FILE*> CreateTempFile(const std::string& dir,
                                     const std::string& prefix,
                                     std::string* temp_path) {
  std::string name_template = Join(dir, absl::StrCat(prefix, "XXXXXX"));
  int fd = mkstemp(&name_template[0]);
  if (fd < 0) {
    return ErrnoStatus(errno, "Failed to create temp file in '%s'", dir);
  }
  FILE* file = fdopen(fd, "wb");
  if (!file) {
    int err = errno;
    close(fd);
    unlink(name_template.c_str());
    return ErrnoStatus(err, "fdopen() failed for '%s'", name_template);
  }
  *temp_path = std::move(name_template);
  return file;
}

absl::Status StreamReadFileContents(FILE* file, Buffer* buffer,
                                    StreamReadFileHandler handler) {
  if (buffer->empty()) {
    return absl::FailedPreconditionError("Given buffer is empty");
  }

  for (;;) {
    const size_t num_read = fread(buffer->data(), 1, buffer->size(), file);

    // The handler might read from the file, so check for EOF now.
    bool eof = num_read != buffer->size() && feof(file);
    if (num_read > 0) {
      absl::Status status = handler(buffer->data(), num_read);
      if (!status.ok()) {
        return WrapStatus(status, "Handler failed");
      }
    }
    if (num_read != buffer->size()) {
      if (!eof) return ErrnoStatus(errno, "fread() failed");

      absl::Status status = handler(nullptr, 0);
      if (!status.ok()) {
        return WrapStatus(status, "Handler failed");
      }
      return absl::OkStatus();
    }
  }
}

absl::StatusOr<std::string> ReadFile(const std::string& path) {
  absl::StatusOr<FILE*> file = OpenFile(path, "rb");
  if (!file.ok()) {
    return file.status();
  }
  FileCloser closer(*file);

  std::string data;
  char buffer[16 * 1024];
  size_t num_read;
  while ((num_read = fread(buffer, 1, sizeof(buffer), *file)) > 0) {
    data.append(buffer, num_read);
  }
  if (ferror(*file)) {
    return ErrnoStatus(errno, "Failed to read file '%s'", path);
  }
  return data;
}

absl::Status WriteFile(const std::string& path, absl::string_view data) {
  absl::StatusOr<FILE*> file = OpenFile(path, "wb");
  if (!file.ok()) {
    return file.status();
  }
  FileCloser closer(*file);

  if (fwrite(data.data(), 1, data.size(), *file) != data.size()) {
    return ErrnoStatus(errno, "Failed to write %u bytes to file '%s'",
                       data.size(), path);
  }
  absl::Status status = closer.Close();
  return WrapStatus(status, "Failed to close file '%s'", path);
}

absl::Status CreateSymlink(const std::string& target,
                           const std::string& link_path) {
  if (symlink(target.c_str(), link_path.c_str()) != 0) {
    return ErrnoStatus(errno, "Failed to create symlink '%s' with target '%s'",
                       link_path, target);
  }
  return absl::OkStatus();
}

absl::StatusOr<std::string> GetSymlinkTarget(const std::string& link_path) {
  std::error_code error_code;
  std::filesystem::path target =
      std::filesystem::read_symlink(link_path, error_code);
  if (error_code) {
    return ErrorCodeStatus(error_code, "Failed to read symlink '%s'",
                           link_path);
  }
  return target.string();
}

absl::Status CreateDir(const std::string& path, uint32_t mode) {
  if (mkdir(path.c_str(), static_cast<mode_t>(mode)) != 0) {
    return ErrnoStatus(errno, "Failed to create directory '%s'", path);
  }
  return absl::OkStatus();
}

absl::Status CreateDirRec(const std::string& path) {
  std::error_code error_code;
  std::filesystem::create_directories(path, error_code);
  return ErrorCodeStatus(error_code, "Failed to create directory '%s'", path);
}

absl::Status RemoveFile(const std::string& path) {
  if (unlink(path.c_str()) != 0 && errno != ENOENT) {
    return ErrnoStatus(errno, "Failed to remove '%s'", path);
  }
  return absl::OkStatus();
}

absl::Status RemoveAll(const std::string& path) {
  std::error_code error_code;
  std::filesystem::remove_all(path, error_code);
  return ErrorCodeStatus(error_code, "Failed to remove '%s' recursively",
                         path);
}

absl::Status RenameFile(const std::string& from_path,
                        const std::string& to_path) {
  if (rename(from_path.c_str(), to_path.c_str()) != 0) {
    return ErrnoStatus(errno, "Failed to rename '%s' to '%s'", from_path,
                       to_path);
  }
  return absl::OkStatus();
}

absl::Status ChangeMode(const std::string& path, uint32_t mode) {
  if (chmod(path.c_str(), static_cast<mode_t>(mode)) != 0) {
    return ErrnoStatus(errno, "Failed to change mode of '%s' to %o", path,
                       mode);
  }
  return absl::OkStatus();
}

absl::Status SetFileTime(const std::string& path, int64_t mtime_sec,
                         uint32_t mtime_nsec) {
  struct timespec times[2];
  times[0].tv_sec = static_cast<time_t>(mtime_sec);
  times[0].tv_nsec = static_cast<long>(mtime_nsec);
  times[1] = times[0];
  if (utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
    return ErrnoStatus(errno, "Failed to set file time for '%s'", path);
  }
  return absl::OkStatus();
}

}  // namespace path
}  // namespace func_sync
