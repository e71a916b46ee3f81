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

#include "sync/stream_demuxer.h"

#include <cerrno>
#include <cstdio>

#include "absl/strings/str_cat.h"
#include "common/log.h"
#include "common/path.h"
#include "common/status.h"
#include "common/status_macros.h"
#include "sync/rolling_delta.h"
#include "sync/sync_errors.h"
#include "sync/sync_report.h"

namespace func_sync {

struct StreamDemuxer::Stream {
  StreamKind kind = StreamKind::kFull;
  State state = State::kExpected;

  // Temporary file that receives the new contents.
  std::string temp_path;
  std::unique_ptr<FileCloser> out;

  // Current copy of the file, only for deltas.
  std::unique_ptr<FileCloser> base;
  std::unique_ptr<DeltaApplier> applier;
};

StreamDemuxer::StreamDemuxer(FrameReader* reader, std::string root,
                             const std::vector<FileInfo>* manifest,
                             ReportWriter* report)
    : reader_(reader),
      root_(std::move(root)),
      manifest_(manifest),
      report_(report) {}

StreamDemuxer::~StreamDemuxer() {
  for (auto& [stream_id, stream] : streams_) {
    if (stream->state == State::kOpen) Discard(stream.get());
  }
}

void StreamDemuxer::ExpectStream(uint32_t stream_id, StreamKind kind) {
  absl::MutexLock lock(&mutex_);
  expected_[stream_id] = kind;
}

void StreamDemuxer::ForgetStream(uint32_t stream_id) {
  absl::MutexLock lock(&mutex_);
  expected_.erase(stream_id);
}

absl::Status StreamDemuxer::Run() {
  for (;;) {
    Message message;
    RETURN_IF_ERROR(reader_->ReadMessage(&message));

    switch (message.type) {
      case MessageType::kEndOfExchange:
        return FinishExchange();

      case MessageType::kError: {
        absl::Status remote_status;
        RETURN_IF_ERROR(DecodeErrorPayload(message.payload, &remote_status));
        if (message.stream_id == kSessionStreamId) {
          LOG_ERROR("Sender aborted the session: %s", remote_status.ToString());
          return remote_status;
        }
        RETURN_IF_ERROR(HandleStreamError(message.stream_id, remote_status));
        break;
      }

      case MessageType::kFileData:
      case MessageType::kDelta:
        RETURN_IF_ERROR(HandleData(&message));
        break;

      case MessageType::kSignature:
        return ProtocolError("Unexpected %s frame for stream %u from sender",
                             MessageTypeName(message.type), message.stream_id);
    }
  }
}

absl::Status StreamDemuxer::GetStream(uint32_t stream_id, Stream** stream) {
  auto it = streams_.find(stream_id);
  if (it != streams_.end()) {
    *stream = it->second.get();
    return absl::OkStatus();
  }

  StreamKind kind;
  {
    absl::MutexLock lock(&mutex_);
    auto expected_it = expected_.find(stream_id);
    if (expected_it == expected_.end()) {
      return ProtocolError("Frame for unknown stream %u", stream_id);
    }
    kind = expected_it->second;
    expected_.erase(expected_it);
  }

  auto new_stream = std::make_unique<Stream>();
  new_stream->kind = kind;
  *stream = new_stream.get();
  streams_[stream_id] = std::move(new_stream);
  return absl::OkStatus();
}

absl::Status StreamDemuxer::HandleData(Message* message) {
  const uint32_t stream_id = message->stream_id;
  Stream* stream;
  RETURN_IF_ERROR(GetStream(stream_id, &stream));

  MessageType expected_type = stream->kind == StreamKind::kFull
                                  ? MessageType::kFileData
                                  : MessageType::kDelta;
  if (message->type != expected_type) {
    return ProtocolError("Got %s frame for stream %u, expected %s",
                         MessageTypeName(message->type), stream_id,
                         MessageTypeName(expected_type));
  }

  const bool end_of_stream = message->payload.empty();
  switch (stream->state) {
    case State::kDone:
      return ProtocolError("%s frame for finished stream %u",
                           MessageTypeName(message->type), stream_id);

    case State::kFailed:
      // Skip the rest of the stream.
      if (end_of_stream) stream->state = State::kDone;
      return absl::OkStatus();

    case State::kExpected: {
      absl::Status status = OpenStream(stream_id, stream);
      if (!status.ok()) {
        Fail(stream_id, stream, status);
        if (end_of_stream) stream->state = State::kDone;
        return absl::OkStatus();
      }
      break;
    }

    case State::kOpen:
      break;
  }

  absl::Status status;
  if (end_of_stream) {
    status = FinalizeStream(stream_id, stream);
    if (!status.ok()) {
      Fail(stream_id, stream, status);
      stream->state = State::kDone;
    }
    return absl::OkStatus();
  }

  const uint64_t size = message->payload.size();
  report_->Update(
      [size](SyncReport* report) { report->bytes_transferred += size; });
  status = WriteData(stream, message->payload);
  if (!status.ok()) Fail(stream_id, stream, status);
  return absl::OkStatus();
}

absl::Status StreamDemuxer::HandleStreamError(
    uint32_t stream_id, const absl::Status& remote_status) {
  Stream* stream;
  RETURN_IF_ERROR(GetStream(stream_id, &stream));

  switch (stream->state) {
    case State::kDone:
      return ProtocolError("Error frame for finished stream %u", stream_id);

    case State::kFailed:
      // Already reported.
      break;

    case State::kExpected:
    case State::kOpen:
      Discard(stream);
      report_->AddFileError(stream_id, (*manifest_)[stream_id].path,
                            remote_status, /*remote=*/true);
      break;
  }
  stream->state = State::kDone;
  return absl::OkStatus();
}

absl::Status StreamDemuxer::FinishExchange() {
  const absl::Status incomplete = absl::DataLossError("Transfer incomplete");
  {
    absl::MutexLock lock(&mutex_);
    for (const auto& [stream_id, kind] : expected_) {
      report_->AddFileError(stream_id, (*manifest_)[stream_id].path,
                            incomplete, /*remote=*/false);
    }
    expected_.clear();
  }

  for (auto& [stream_id, stream] : streams_) {
    if (stream->state != State::kOpen) continue;
    Discard(stream.get());
    stream->state = State::kDone;
    report_->AddFileError(stream_id, (*manifest_)[stream_id].path, incomplete,
                          /*remote=*/false);
  }
  return absl::OkStatus();
}

absl::Status StreamDemuxer::OpenStream(uint32_t stream_id, Stream* stream) {
  const FileInfo& info = (*manifest_)[stream_id];
  const std::string target_path = path::Join(root_, info.path);
  const std::string prefix =
      absl::StrCat(".", path::BaseName(info.path), ".funcsync.");

  RETURN_IF_ERROR(path::CheckParentsAreDirs(root_, info.path));
  FILE* out;
  ASSIGN_OR_RETURN(out,
                   path::CreateTempFile(path::DirName(target_path), prefix,
                                        &stream->temp_path),
                   "Failed to create temp file for '%s'", info.path);
  stream->out = std::make_unique<FileCloser>(out);
  stream->state = State::kOpen;

  if (stream->kind == StreamKind::kDelta) {
    path::Stats stats;
    RETURN_IF_ERROR(path::GetStats(target_path, &stats),
                    "Failed to stat base file '%s'", info.path);
    FILE* base;
    ASSIGN_OR_RETURN(base, path::OpenFile(target_path, "rb"),
                     "Failed to open base file '%s'", info.path);
    stream->base = std::make_unique<FileCloser>(base);
    stream->applier = std::make_unique<DeltaApplier>(base, stats.size, out);
  }
  LOG_DEBUG("Receiving '%s' as %s", info.path,
            stream->kind == StreamKind::kFull ? "full file" : "delta");
  return absl::OkStatus();
}

absl::Status StreamDemuxer::WriteData(Stream* stream, const Buffer& data) {
  if (stream->applier) {
    return stream->applier->Update(data.data(), data.size());
  }
  if (fwrite(data.data(), 1, data.size(), stream->out->get()) != data.size()) {
    return absl::ErrnoToStatus(errno, "fwrite() failed");
  }
  return absl::OkStatus();
}

absl::Status StreamDemuxer::FinalizeStream(uint32_t stream_id,
                                           Stream* stream) {
  const FileInfo& info = (*manifest_)[stream_id];
  if (stream->applier) {
    RETURN_IF_ERROR(stream->applier->Finish(), "Failed to patch '%s'",
                    info.path);
    stream->applier.reset();
    RETURN_IF_ERROR(stream->base->Close());
  }
  RETURN_IF_ERROR(stream->out->Close(), "Failed to write '%s'",
                  stream->temp_path);

  const std::string target_path = path::Join(root_, info.path);
  RETURN_IF_ERROR(path::ChangeMode(stream->temp_path, info.Permissions()));
  RETURN_IF_ERROR(
      path::SetFileTime(stream->temp_path, info.mtime_sec, info.mtime_nsec));
  // The planner runs concurrently and may have replaced a parent meanwhile.
  RETURN_IF_ERROR(path::CheckParentsAreDirs(root_, info.path));
  RETURN_IF_ERROR(path::RenameFile(stream->temp_path, target_path));
  stream->temp_path.clear();
  stream->state = State::kDone;

  const bool patched = stream->kind == StreamKind::kDelta;
  report_->Update([patched](SyncReport* report) {
    if (patched) {
      ++report->files_patched;
    } else {
      ++report->files_transferred;
    }
  });
  LOG_DEBUG("Finished '%s'", info.path);
  return absl::OkStatus();
}

void StreamDemuxer::Discard(Stream* stream) {
  stream->applier.reset();
  stream->base.reset();
  if (stream->out) {
    absl::Status status = stream->out->Close();
    if (!status.ok()) {
      LOG_DEBUG("Failed to close '%s': %s", stream->temp_path,
                status.ToString());
    }
    stream->out.reset();
  }
  if (!stream->temp_path.empty()) {
    absl::Status status = path::RemoveFile(stream->temp_path);
    if (!status.ok()) {
      LOG_WARNING("Failed to remove '%s': %s", stream->temp_path,
                  status.ToString());
    }
    stream->temp_path.clear();
  }
}

void StreamDemuxer::Fail(uint32_t stream_id, Stream* stream,
                         const absl::Status& status) {
  Discard(stream);
  report_->AddFileError(stream_id, (*manifest_)[stream_id].path, status,
                        /*remote=*/false);
  stream->state = State::kFailed;
}

}  // namespace func_sync
