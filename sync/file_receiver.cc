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

#include "sync/file_receiver.h"

#include <memory>
#include <thread>
#include <unordered_set>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "common/log.h"
#include "common/path.h"
#include "common/status.h"
#include "common/status_macros.h"
#include "sync/chunk_multiplexer.h"
#include "sync/dir_enumerator.h"
#include "sync/handshake.h"
#include "sync/rolling_delta.h"
#include "sync/socket.h"
#include "sync/stream_demuxer.h"
#include "sync/sync_errors.h"
#include "sync/wire.h"

namespace func_sync {
namespace {

// Sends the signature of the receiver's copy of a file as kSignature chunks.
class SignatureTask : public StreamTask {
 public:
  SignatureTask(uint32_t stream_id, std::string path, std::string target_path)
      : StreamTask(stream_id, std::move(path)),
        target_path_(std::move(target_path)) {}

 protected:
  absl::Status Run(ChunkQueue* queue,
                   const IsCancelledPredicate& is_cancelled) override {
    if (is_cancelled()) return absl::CancelledError("Session cancelled");

    FILE* fp;
    ASSIGN_OR_RETURN(fp, path::OpenFile(target_path_, "rb"));
    FileCloser closer(fp);

    ChunkWriter writer(queue, MessageType::kSignature, stream_id());
    RETURN_IF_ERROR(GenerateSignature(fp, &writer),
                    "Failed to compute signature of '%s'", target_path_);
    return writer.Finish();
  }

 private:
  const std::string target_path_;
};

// What the receiver needs from the sender for a manifest entry.
enum class Request { kNone, kFullFile, kDelta };

class FileReceiver {
 public:
  FileReceiver(Socket* socket, std::string root, const SessionConfig& config,
               SyncReport* report)
      : socket_(socket),
        root_(std::move(root)),
        config_(config),
        report_(report),
        reader_(socket),
        multiplexer_(socket, config.num_workers, config.chunk_queue_capacity) {
    multiplexer_.SetTaskCompletedCallback(
        [this](std::unique_ptr<StreamTask> task) { OnTaskCompleted(*task); });
  }

  ~FileReceiver() {
    if (planner_thread_.joinable()) planner_thread_.join();
  }

  absl::Status Run() {
    uint16_t version;
    ASSIGN_OR_RETURN(version,
                     NegotiateAsReceiver(socket_, &reader_,
                                         config_.GetHandshakeOptions()));
    report_.Update(
        [version](SyncReport* report) { report->protocol_version = version; });

    // From here on, fatal errors are reported to the sender.
    multiplexer_.Start();
    absl::Status status = ReadManifest();
    if (status.ok()) {
      demuxer_ = std::make_unique<StreamDemuxer>(&reader_, root_, &manifest_,
                                                 &report_);
      planner_thread_ = std::thread([this]() { PlannerThreadMain(); });
      status = demuxer_->Run();
      if (!status.ok()) Abort(status);
      planner_thread_.join();

      // A failed planner is the root cause of what the demuxer saw.
      if (!planner_status_.ok() && !absl::IsCancelled(planner_status_)) {
        status = planner_status_;
      }
    }
    if (status.ok()) status = multiplexer_.Finish();
    if (absl::IsCancelled(status) && !multiplexer_.WriterStatus().ok()) {
      status = multiplexer_.WriterStatus();
    }
    if (!status.ok()) {
      LOG_ERROR("Sync session failed: %s", status.ToString());
      Abort(status);
    }
    return status;
  }

 private:
  absl::Status ReadManifest() {
    for (;;) {
      FileInfo info;
      bool end;
      RETURN_IF_ERROR(DecodeFileInfo(&reader_, &info, &end));
      if (end) break;
      if (manifest_.size() >= kSessionStreamId) {
        return ProtocolError("Too many manifest entries");
      }
      manifest_.push_back(std::move(info));
    }
    const uint64_t num_files = manifest_.size();
    report_.Update(
        [num_files](SyncReport* report) { report->files_total = num_files; });
    LOG_INFO("Received manifest with %u entries", num_files);
    return absl::OkStatus();
  }

  void PlannerThreadMain() {
    planner_status_ = Plan();
    if (!planner_status_.ok() && !absl::IsCancelled(planner_status_)) {
      LOG_ERROR("Planning failed: %s", planner_status_.ToString());
      Abort(planner_status_);
    }
  }

  // Brings the target root in line with the manifest and sends the requests
  // for the files whose contents are needed, then ends the exchange.
  absl::Status Plan() {
    RETURN_IF_ERROR(path::CreateDirRec(root_));

    std::vector<bool> valid(manifest_.size(), false);
    std::unordered_set<std::string> keep;
    for (uint32_t id = 0; id < manifest_.size(); ++id) {
      const std::string& rel_path = manifest_[id].path;
      absl::Status status = ValidateRelativePath(rel_path);
      if (!status.ok()) {
        report_.AddFileError(id, rel_path, status, /*remote=*/false);
        continue;
      }
      valid[id] = true;

      // Keep the entry and its parent directories.
      for (std::string dir = rel_path; !dir.empty() && keep.insert(dir).second;
           dir = path::DirName(dir)) {
      }
    }

    if (config_.delete_extraneous) RETURN_IF_ERROR(DeleteExtraneous(keep));

    for (uint32_t id = 0; id < manifest_.size(); ++id) {
      if (IsAborted()) return absl::CancelledError("Session aborted");
      if (!valid[id]) continue;

      Request request = Request::kNone;
      absl::Status status = PrepareEntry(id, &request);
      if (!status.ok()) {
        report_.AddFileError(id, manifest_[id].path, status,
                             /*remote=*/false);
        continue;
      }

      switch (request) {
        case Request::kNone:
          break;
        case Request::kFullFile:
          demuxer_->ExpectStream(id, StreamKind::kFull);
          RETURN_IF_ERROR(multiplexer_.Push(Chunk(MessageType::kFileData, id)));
          break;
        case Request::kDelta:
          demuxer_->ExpectStream(id, StreamKind::kDelta);
          multiplexer_.QueueTask(std::make_unique<SignatureTask>(
              id, manifest_[id].path, path::Join(root_, manifest_[id].path)));
          break;
      }
    }

    multiplexer_.WaitForTasks();
    if (IsAborted()) return absl::CancelledError("Session aborted");
    LOG_DEBUG("Sent all requests");
    return multiplexer_.Push(Chunk(MessageType::kEndOfExchange, 0));
  }

  // Removes entries under the root that are not in |keep|.
  absl::Status DeleteExtraneous(const std::unordered_set<std::string>& keep) {
    std::vector<std::string> to_delete;
    auto process = [this, &keep, &to_delete](
                       const std::string& source_path,
                       const std::string& relative_path,
                       const path::Stats& /*stats*/,
                       absl::Status walk_status) -> absl::Status {
      if (!walk_status.ok()) {
        report_.AddFileError(kSessionStreamId, relative_path, walk_status,
                             /*remote=*/false);
      } else if (keep.find(relative_path) == keep.end()) {
        to_delete.push_back(source_path);
      }
      return absl::OkStatus();
    };
    RETURN_IF_ERROR(WalkDirectory(root_)(process),
                    "Failed to enumerate target directory '%s'", root_);

    // Children come after their parents and are already gone once the
    // parent was removed.
    uint64_t num_deleted = 0;
    for (const std::string& target_path : to_delete) {
      if (!path::Exists(target_path)) continue;
      absl::Status status = path::RemoveAll(target_path);
      if (!status.ok()) {
        report_.AddFileError(kSessionStreamId, target_path, status,
                             /*remote=*/false);
        continue;
      }
      LOG_DEBUG("Deleted '%s'", target_path);
      ++num_deleted;
    }
    report_.Update([num_deleted](SyncReport* report) {
      report->files_deleted += num_deleted;
    });
    return absl::OkStatus();
  }

  // Creates or updates the entry |id| locally as far as its manifest record
  // allows and determines what is needed from the sender.
  absl::Status PrepareEntry(uint32_t id, Request* request) {
    const FileInfo& info = manifest_[id];
    const std::string target_path = path::Join(root_, info.path);

    // An earlier entry may have placed a symlink where this entry expects a
    // parent directory.
    RETURN_IF_ERROR(path::CheckParentsAreDirs(root_, info.path));

    path::Stats stats;
    bool exists = true;
    absl::Status status = path::GetStats(target_path, &stats);
    if (absl::IsNotFound(status)) {
      exists = false;
      // Parents come before their children in the manifest (WalkDirectory
      // walks in pre-order), so they were created with their own permissions
      // already. This only creates parents missing from the manifest, with
      // default permissions.
      RETURN_IF_ERROR(path::CreateDirRec(path::DirName(target_path)));
    } else if (!status.ok()) {
      return status;
    }

    if (exists && (stats.IsDir() != info.IsDir() ||
                   stats.IsSymlink() != info.IsSymlink() ||
                   stats.IsRegular() != info.IsRegular())) {
      LOG_DEBUG("Replacing '%s', which changed its type", info.path);
      RETURN_IF_ERROR(path::RemoveAll(target_path));
      exists = false;
    }

    if (info.IsDir()) return PrepareDirectory(info, target_path, exists, stats);
    if (info.IsSymlink()) return PrepareSymlink(info, target_path, exists);

    const bool same_perms =
        (stats.mode & kWirePermissionMask) == info.Permissions();
    if (exists && stats.size == info.size &&
        stats.mtime_sec == info.mtime_sec &&
        stats.mtime_nsec == info.mtime_nsec) {
      if (!same_perms) {
        RETURN_IF_ERROR(path::ChangeMode(target_path, info.Permissions()));
      }
      report_.Update([](SyncReport* report) { ++report->files_up_to_date; });
      return absl::OkStatus();
    }

    if (info.size == 0) {
      RETURN_IF_ERROR(path::WriteFile(target_path, absl::string_view()));
      RETURN_IF_ERROR(path::ChangeMode(target_path, info.Permissions()));
      RETURN_IF_ERROR(
          path::SetFileTime(target_path, info.mtime_sec, info.mtime_nsec));
      report_.Update([](SyncReport* report) { ++report->files_created; });
      return absl::OkStatus();
    }

    // An empty local file has nothing to diff against.
    *request =
        exists && stats.size > 0 ? Request::kDelta : Request::kFullFile;
    return absl::OkStatus();
  }

  absl::Status PrepareDirectory(const FileInfo& info,
                                const std::string& target_path, bool exists,
                                const path::Stats& stats) {
    if (!exists) {
      RETURN_IF_ERROR(path::CreateDir(target_path, info.Permissions()));
      // mkdir() applies the umask.
      RETURN_IF_ERROR(path::ChangeMode(target_path, info.Permissions()));
      report_.Update([](SyncReport* report) { ++report->files_created; });
      return absl::OkStatus();
    }
    if ((stats.mode & kWirePermissionMask) != info.Permissions()) {
      RETURN_IF_ERROR(path::ChangeMode(target_path, info.Permissions()));
    }
    report_.Update([](SyncReport* report) { ++report->files_up_to_date; });
    return absl::OkStatus();
  }

  absl::Status PrepareSymlink(const FileInfo& info,
                              const std::string& target_path, bool exists) {
    if (exists) {
      std::string link_target;
      ASSIGN_OR_RETURN(link_target, path::GetSymlinkTarget(target_path));
      if (link_target == info.link_target) {
        report_.Update([](SyncReport* report) { ++report->files_up_to_date; });
        return absl::OkStatus();
      }
      RETURN_IF_ERROR(path::RemoveFile(target_path));
    }
    RETURN_IF_ERROR(path::CreateSymlink(info.link_target, target_path));
    RETURN_IF_ERROR(
        path::SetFileTime(target_path, info.mtime_sec, info.mtime_nsec));
    report_.Update([](SyncReport* report) { ++report->files_created; });
    return absl::OkStatus();
  }

  // Runs on a worker thread.
  void OnTaskCompleted(const StreamTask& task) {
    if (task.status().ok() || absl::IsCancelled(task.status())) return;

    // The sender got an error frame instead of the signature and won't send
    // a delta.
    demuxer_->ForgetStream(task.stream_id());
    report_.AddFileError(task.stream_id(), task.path(), task.status(),
                         /*remote=*/false);
  }

  void Abort(const absl::Status& status) ABSL_LOCKS_EXCLUDED(abort_mutex_) {
    absl::MutexLock lock(&abort_mutex_);
    if (aborted_) return;
    aborted_ = true;
    multiplexer_.Abort(status);
  }

  bool IsAborted() ABSL_LOCKS_EXCLUDED(abort_mutex_) {
    absl::MutexLock lock(&abort_mutex_);
    return aborted_;
  }

  Socket* const socket_;
  const std::string root_;
  const SessionConfig& config_;
  ReportWriter report_;
  FrameReader reader_;

  std::vector<FileInfo> manifest_;
  std::unique_ptr<StreamDemuxer> demuxer_;

  // Written by the planner thread, read after joining it.
  absl::Status planner_status_;
  std::thread planner_thread_;

  absl::Mutex abort_mutex_;
  bool aborted_ ABSL_GUARDED_BY(abort_mutex_) = false;

  // Destroyed first, so that no task outlives the members above.
  ChunkMultiplexer multiplexer_;
};

}  // namespace

absl::Status ReceiveFiles(Socket* socket, const std::string& root,
                          const SessionConfig& config, SyncReport* report) {
  RETURN_IF_ERROR(config.Validate());
  const absl::Time start_time = absl::Now();
  FileReceiver receiver(socket, root, config, report);
  absl::Status status = receiver.Run();
  LOG_INFO("Receiving finished in %0.3f sec: %s",
           absl::ToDoubleSeconds(absl::Now() - start_time),
           report->ToString());
  return status;
}

}  // namespace func_sync
