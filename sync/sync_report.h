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

#ifndef SYNC_SYNC_REPORT_H_
#define SYNC_SYNC_REPORT_H_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "sync/wire.h"

namespace func_sync {

// An error that affected a single file. The session continues.
struct FileError {
  // Manifest index of the file, kSessionStreamId if the file never made it
  // into the manifest.
  uint32_t stream_id = kSessionStreamId;
  std::string path;
  absl::Status status;
  // True if the peer reported the error.
  bool remote = false;
};

// Outcome of one session end. Filled in also for aborted sessions.
struct SyncReport {
  uint16_t protocol_version = 0;

  // Number of manifest entries.
  uint64_t files_total = 0;
  // Entries that were already up to date on the receiver.
  uint64_t files_up_to_date = 0;
  // Directories, symlinks and empty files created from their manifest record.
  uint64_t files_created = 0;
  // Files transferred in full.
  uint64_t files_transferred = 0;
  // Files updated through a delta.
  uint64_t files_patched = 0;
  // Extraneous entries removed from the receiver.
  uint64_t files_deleted = 0;
  // Payload bytes of file data and delta frames.
  uint64_t bytes_transferred = 0;

  std::vector<FileError> file_errors;

  // One-line summary for logging.
  std::string ToString() const;
};

// Serializes updates of a SyncReport from the threads of a session.
class ReportWriter {
 public:
  explicit ReportWriter(SyncReport* report);
  ~ReportWriter();

  ReportWriter(const ReportWriter&) = delete;
  ReportWriter& operator=(const ReportWriter&) = delete;

  // Records and logs a per-file error.
  void AddFileError(uint32_t stream_id, const std::string& path,
                    const absl::Status& status, bool remote)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Runs |update| with exclusive access to the report.
  void Update(const std::function<void(SyncReport* report)>& update)
      ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  absl::Mutex mutex_;
  SyncReport* report_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace func_sync

#endif  // SYNC_SYNC_REPORT_H_
