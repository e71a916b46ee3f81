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

#include "sync/file_sender.h"

#include <algorithm>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "common/buffer.h"
#include "common/log.h"
#include "common/path.h"
#include "common/status.h"
#include "common/status_macros.h"
#include "sync/chunk_multiplexer.h"
#include "sync/handshake.h"
#include "sync/rolling_delta.h"
#include "sync/socket.h"
#include "sync/sync_errors.h"
#include "sync/wire.h"

namespace func_sync {
namespace {

// Manifest bytes are sent in pieces of this size.
constexpr size_t kManifestSendSize = 64 * 1024;

// Streams the full contents of a file as kFileData chunks.
class SendFileTask : public StreamTask {
 public:
  SendFileTask(uint32_t stream_id, std::string path, std::string source_path)
      : StreamTask(stream_id, std::move(path)),
        source_path_(std::move(source_path)) {}

  uint64_t bytes_sent() const { return bytes_sent_; }

 protected:
  absl::Status Run(ChunkQueue* queue,
                   const IsCancelledPredicate& is_cancelled) override {
    FILE* fp;
    ASSIGN_OR_RETURN(fp, path::OpenFile(source_path_, "rb"));
    FileCloser closer(fp);

    ChunkWriter writer(queue, MessageType::kFileData, stream_id());
    Buffer buffer(kMaxChunkSize);
    RETURN_IF_ERROR(path::StreamReadFileContents(
                        fp, &buffer,
                        [&writer, &is_cancelled](const void* data,
                                                 size_t size) -> absl::Status {
                          if (is_cancelled()) {
                            return absl::CancelledError("Session cancelled");
                          }
                          if (!data) return absl::OkStatus();
                          return writer.Write(data, size);
                        }),
                    "Failed to read '%s'", source_path_);
    RETURN_IF_ERROR(writer.Finish());
    bytes_sent_ = writer.BytesWritten();
    return absl::OkStatus();
  }

 private:
  const std::string source_path_;
  uint64_t bytes_sent_ = 0;
};

// Diffs a file against the receiver's signature and streams the delta as
// kDelta chunks.
class DeltaTask : public StreamTask {
 public:
  DeltaTask(uint32_t stream_id, std::string path, std::string source_path,
            Buffer signature)
      : StreamTask(stream_id, std::move(path)),
        source_path_(std::move(source_path)),
        signature_data_(std::move(signature)) {}

  uint64_t bytes_sent() const { return bytes_sent_; }

 protected:
  absl::Status Run(ChunkQueue* queue,
                   const IsCancelledPredicate& is_cancelled) override {
    Signature signature;
    RETURN_IF_ERROR(Signature::Parse(signature_data_.view(), &signature),
                    "Bad signature for '%s'", path());
    signature_data_ = Buffer();
    if (is_cancelled()) return absl::CancelledError("Session cancelled");

    FILE* fp;
    ASSIGN_OR_RETURN(fp, path::OpenFile(source_path_, "rb"));
    FileCloser closer(fp);

    ChunkWriter writer(queue, MessageType::kDelta, stream_id());
    RETURN_IF_ERROR(GenerateDelta(signature, fp, &writer),
                    "Failed to diff '%s'", source_path_);
    RETURN_IF_ERROR(writer.Finish());
    bytes_sent_ = writer.BytesWritten();
    return absl::OkStatus();
  }

 private:
  const std::string source_path_;
  Buffer signature_data_;
  uint64_t bytes_sent_ = 0;
};

class FileSender {
 public:
  FileSender(Socket* socket, const SessionConfig& config, SyncReport* report)
      : socket_(socket),
        config_(config),
        report_(report),
        reader_(socket),
        multiplexer_(socket, config.num_workers, config.chunk_queue_capacity) {
    multiplexer_.SetTaskCompletedCallback(
        [this](std::unique_ptr<StreamTask> task) { OnTaskCompleted(*task); });
  }

  absl::Status Run(const FileEnumerator& enumerator) {
    RETURN_IF_ERROR(BuildManifest(enumerator));

    uint16_t version;
    ASSIGN_OR_RETURN(version,
                     NegotiateAsSender(socket_, &reader_,
                                       config_.GetHandshakeOptions()));
    report_.Update([version, this](SyncReport* report) {
      report->protocol_version = version;
      report->files_total = manifest_.size();
    });

    absl::Status status = SendManifest();
    if (status.ok()) {
      multiplexer_.Start();
      status = ServeRequests();
    }
    if (status.ok()) status = multiplexer_.Finish();
    if (absl::IsCancelled(status) && !multiplexer_.WriterStatus().ok()) {
      status = multiplexer_.WriterStatus();
    }
    if (!status.ok()) {
      LOG_ERROR("Sync session failed: %s", status.ToString());
      multiplexer_.Abort(status);
    }
    return status;
  }

 private:
  struct Entry {
    std::string source_path;
    bool requested = false;
    Buffer signature;
  };

  absl::Status BuildManifest(const FileEnumerator& enumerator) {
    auto process = [this](const std::string& source_path,
                          const std::string& relative_path,
                          const path::Stats& stats,
                          absl::Status walk_status) -> absl::Status {
      if (!walk_status.ok()) {
        report_.AddFileError(kSessionStreamId, relative_path, walk_status,
                             /*remote=*/false);
        return absl::OkStatus();
      }
      absl::Status status = AddToManifest(source_path, relative_path, stats);
      if (!status.ok()) {
        report_.AddFileError(kSessionStreamId, relative_path, status,
                             /*remote=*/false);
      }
      return absl::OkStatus();
    };
    RETURN_IF_ERROR(enumerator(process), "Failed to enumerate files");
    LOG_INFO("Found %u files to send", manifest_.size());
    return absl::OkStatus();
  }

  absl::Status AddToManifest(const std::string& source_path,
                             const std::string& relative_path,
                             const path::Stats& stats) {
    FileInfo info;
    info.path = relative_path;
    ASSIGN_OR_RETURN(info.mode, WireModeFromStMode(stats.mode));
    info.mtime_sec = stats.mtime_sec;
    info.mtime_nsec = stats.mtime_nsec;
    if (stats.IsRegular()) {
      info.size = stats.size;
    } else if (stats.IsSymlink()) {
      ASSIGN_OR_RETURN(info.link_target, path::GetSymlinkTarget(source_path));
    }

    // Validates the record before anything is sent.
    RETURN_IF_ERROR(EncodeFileInfo(info, &manifest_data_));
    manifest_.push_back(std::move(info));
    entries_.emplace_back();
    entries_.back().source_path = source_path;
    return absl::OkStatus();
  }

  absl::Status SendManifest() {
    EncodeManifestEnd(&manifest_data_);
    const char* data = manifest_data_.data();
    size_t size = manifest_data_.size();
    while (size > 0) {
      const size_t to_send = std::min(size, kManifestSendSize);
      RETURN_IF_ERROR(TransportError(socket_->Send(data, to_send),
                                     "Failed to send manifest"));
      data += to_send;
      size -= to_send;
    }
    LOG_DEBUG("Sent manifest with %u entries, %u bytes", manifest_.size(),
              manifest_data_.size());
    manifest_data_ = Buffer();
    return absl::OkStatus();
  }

  // Answers the receiver's requests until its end of exchange.
  absl::Status ServeRequests() {
    for (;;) {
      Message message;
      RETURN_IF_ERROR(reader_.ReadMessage(&message));
      const uint32_t stream_id = message.stream_id;

      switch (message.type) {
        case MessageType::kEndOfExchange:
          LOG_DEBUG("Receiver finished its requests");
          multiplexer_.WaitForTasks();
          return multiplexer_.Push(Chunk(MessageType::kEndOfExchange, 0));

        case MessageType::kError: {
          absl::Status remote_status;
          RETURN_IF_ERROR(DecodeErrorPayload(message.payload, &remote_status));
          if (stream_id == kSessionStreamId) {
            LOG_ERROR("Receiver aborted the session: %s",
                      remote_status.ToString());
            return remote_status;
          }
          Entry* entry;
          RETURN_IF_ERROR(GetEntry(message, &entry));
          entry->signature = Buffer();
          entry->requested = true;
          report_.AddFileError(stream_id, manifest_[stream_id].path,
                               remote_status, /*remote=*/true);
          break;
        }

        case MessageType::kFileData: {
          Entry* entry;
          RETURN_IF_ERROR(GetEntry(message, &entry));
          if (!message.payload.empty()) {
            return ProtocolError("File request for stream %u has a payload",
                                 stream_id);
          }
          entry->requested = true;
          multiplexer_.QueueTask(std::make_unique<SendFileTask>(
              stream_id, manifest_[stream_id].path, entry->source_path));
          break;
        }

        case MessageType::kSignature: {
          Entry* entry;
          RETURN_IF_ERROR(GetEntry(message, &entry));
          if (!message.payload.empty()) {
            entry->signature.append(message.payload.data(),
                                    message.payload.size());
            break;
          }
          entry->requested = true;
          multiplexer_.QueueTask(std::make_unique<DeltaTask>(
              stream_id, manifest_[stream_id].path, entry->source_path,
              std::move(entry->signature)));
          entry->signature = Buffer();
          break;
        }

        case MessageType::kDelta:
          return ProtocolError(
              "Unexpected %s frame for stream %u from receiver",
              MessageTypeName(message.type), stream_id);
      }
    }
  }

  // Returns the entry addressed by |message| or a protocol error if the
  // stream id is not a regular file of the manifest or was already served.
  absl::Status GetEntry(const Message& message, Entry** entry) {
    const uint32_t stream_id = message.stream_id;
    if (stream_id >= manifest_.size()) {
      return ProtocolError("%s frame for unknown stream %u",
                           MessageTypeName(message.type), stream_id);
    }
    if (!manifest_[stream_id].IsRegular()) {
      return ProtocolError("%s frame for stream %u, which is not a file",
                           MessageTypeName(message.type), stream_id);
    }
    *entry = &entries_[stream_id];
    if ((*entry)->requested) {
      return ProtocolError("Duplicate %s frame for stream %u",
                           MessageTypeName(message.type), stream_id);
    }
    return absl::OkStatus();
  }

  // Runs on a worker thread.
  void OnTaskCompleted(const StreamTask& task) {
    if (!task.status().ok()) {
      if (!absl::IsCancelled(task.status())) {
        report_.AddFileError(task.stream_id(), task.path(), task.status(),
                             /*remote=*/false);
      }
      return;
    }
    if (auto* send_task = dynamic_cast<const SendFileTask*>(&task)) {
      const uint64_t bytes = send_task->bytes_sent();
      report_.Update([bytes](SyncReport* report) {
        ++report->files_transferred;
        report->bytes_transferred += bytes;
      });
    } else if (auto* delta_task = dynamic_cast<const DeltaTask*>(&task)) {
      const uint64_t bytes = delta_task->bytes_sent();
      report_.Update([bytes](SyncReport* report) {
        ++report->files_patched;
        report->bytes_transferred += bytes;
      });
    }
  }

  Socket* const socket_;
  const SessionConfig& config_;
  ReportWriter report_;
  FrameReader reader_;

  std::vector<FileInfo> manifest_;
  Buffer manifest_data_;
  // Indexed by stream id, like |manifest_|.
  std::vector<Entry> entries_;

  // Destroyed first, so that no task outlives the members above.
  ChunkMultiplexer multiplexer_;
};

}  // namespace

absl::Status SendFiles(Socket* socket, const FileEnumerator& enumerator,
                       const SessionConfig& config, SyncReport* report) {
  RETURN_IF_ERROR(config.Validate());
  const absl::Time start_time = absl::Now();
  FileSender sender(socket, config, report);
  absl::Status status = sender.Run(enumerator);
  LOG_INFO("Sending finished in %0.3f sec: %s",
           absl::ToDoubleSeconds(absl::Now() - start_time),
           report->ToString());
  return status;
}

}  // namespace func_sync
