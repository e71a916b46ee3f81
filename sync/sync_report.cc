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

#include "sync/sync_report.h"

#include "absl/strings/str_format.h"
#include "common/log.h"

namespace func_sync {

std::string SyncReport::ToString() const {
  return absl::StrFormat(
      "protocol v%u, %u files: %u up to date, %u created, %u transferred, "
      "%u patched, %u deleted, %u bytes, %u errors",
      protocol_version, files_total, files_up_to_date, files_created,
      files_transferred, files_patched, files_deleted, bytes_transferred,
      file_errors.size());
}

ReportWriter::ReportWriter(SyncReport* report) : report_(report) {}

ReportWriter::~ReportWriter() = default;

void ReportWriter::AddFileError(uint32_t stream_id, const std::string& path,
                                const absl::Status& status, bool remote) {
  LOG_WARNING("%s error for '%s': %s", remote ? "Remote" : "Local", path,
              status.ToString());
  FileError error;
  error.stream_id = stream_id;
  error.path = path;
  error.status = status;
  error.remote = remote;

  absl::MutexLock lock(&mutex_);
  report_->file_errors.push_back(std::move(error));
}

void ReportWriter::Update(
    const std::function<void(SyncReport* report)>& update) {
  absl::MutexLock lock(&mutex_);
  update(report_);
}

}  // namespace func_sync
