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

#include "sync/chunk_multiplexer.h"

#include <algorithm>
#include <cassert>

#include "common/log.h"
#include "common/status.h"
#include "common/status_macros.h"
#include "sync/socket.h"
#include "sync/sync_errors.h"

namespace func_sync {

ChunkQueue::ChunkQueue(size_t capacity) : capacity_(capacity) {}

ChunkQueue::~ChunkQueue() = default;

absl::Status ChunkQueue::Push(Chunk chunk) {
  absl::MutexLock lock(&mutex_);
  const size_t max_queued = std::max<size_t>(capacity_, 1);
  auto has_space = [this, max_queued]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return producers_cancelled_ || closed_ || chunks_.size() < max_queued;
  };
  mutex_.Await(absl::Condition(&has_space));
  if (producers_cancelled_) {
    return absl::CancelledError("Chunk queue cancelled");
  }
  if (closed_) {
    return absl::FailedPreconditionError("Chunk queue closed");
  }

  chunks_.push_back(std::move(chunk));
  const uint64_t ticket = ++num_pushed_;
  if (capacity_ > 0) return absl::OkStatus();

  // Rendezvous: wait until the consumer took the chunk.
  auto taken = [this, ticket]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return producers_cancelled_ || num_popped_ >= ticket;
  };
  mutex_.Await(absl::Condition(&taken));
  if (num_popped_ < ticket) {
    return absl::CancelledError("Chunk queue cancelled");
  }
  return absl::OkStatus();
}

bool ChunkQueue::Pop(Chunk* chunk) {
  absl::MutexLock lock(&mutex_);
  auto has_chunk = [this]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return consumer_cancelled_ || closed_ || !chunks_.empty();
  };
  mutex_.Await(absl::Condition(&has_chunk));
  if (consumer_cancelled_ || chunks_.empty()) return false;

  *chunk = std::move(chunks_.front());
  chunks_.pop_front();
  ++num_popped_;
  return true;
}

void ChunkQueue::Close() {
  absl::MutexLock lock(&mutex_);
  closed_ = true;
}

void ChunkQueue::Cancel() {
  absl::MutexLock lock(&mutex_);
  producers_cancelled_ = true;
  consumer_cancelled_ = true;
  chunks_.clear();
}

void ChunkQueue::Abort(absl::optional<Chunk> final_chunk) {
  absl::MutexLock lock(&mutex_);
  producers_cancelled_ = true;
  chunks_.clear();
  if (final_chunk) chunks_.push_back(std::move(*final_chunk));
  closed_ = true;
}

bool ChunkQueue::IsCancelled() const {
  absl::MutexLock lock(&mutex_);
  return producers_cancelled_;
}

ChunkWriter::ChunkWriter(ChunkQueue* queue, MessageType type,
                         uint32_t stream_id)
    : queue_(queue), type_(type), stream_id_(stream_id) {}

ChunkWriter::~ChunkWriter() = default;

absl::Status ChunkWriter::Write(const void* data, size_t size) {
  const char* curr = static_cast<const char*>(data);
  while (size > 0) {
    size_t to_copy = std::min(size, kMaxChunkSize - buffer_.size());
    buffer_.append(curr, to_copy);
    curr += to_copy;
    size -= to_copy;
    bytes_written_ += to_copy;
    if (buffer_.size() == kMaxChunkSize) {
      RETURN_IF_ERROR(Flush());
    }
  }
  return absl::OkStatus();
}

absl::Status ChunkWriter::Flush() {
  if (buffer_.empty()) return absl::OkStatus();
  Buffer data;
  data.reserve(kMaxChunkSize);
  std::swap(data, buffer_);
  return queue_->Push(Chunk(type_, stream_id_, std::move(data)));
}

absl::Status ChunkWriter::Finish() {
  RETURN_IF_ERROR(Flush());
  return queue_->Push(Chunk(type_, stream_id_));
}

StreamTask::StreamTask(uint32_t stream_id, std::string path)
    : stream_id_(stream_id), path_(std::move(path)) {}

StreamTask::~StreamTask() = default;

void StreamTask::ThreadRun(IsCancelledPredicate is_cancelled) {
  status_ = Run(queue_, is_cancelled);
  if (status_.ok() || absl::IsCancelled(status_) || is_cancelled()) return;

  LOG_WARNING("Stream %u ('%s') failed: %s", stream_id_, path_,
              status_.ToString());
  Buffer payload;
  absl::Status status = EncodeErrorPayload(status_, &payload);
  if (status.ok()) {
    status = queue_->Push(
        Chunk(MessageType::kError, stream_id_, std::move(payload)));
  }
  if (!status.ok() && !absl::IsCancelled(status)) {
    LOG_ERROR("Failed to report error of stream %u: %s", stream_id_,
              status.ToString());
  }
}

ChunkMultiplexer::ChunkMultiplexer(Socket* socket, size_t num_workers,
                                   size_t queue_capacity)
    : socket_(socket), queue_(queue_capacity), pool_(num_workers) {}

ChunkMultiplexer::~ChunkMultiplexer() {
  queue_.Cancel();
  pool_.Shutdown();
  StopWriter();
}

void ChunkMultiplexer::Start() {
  assert(!writer_thread_.joinable());
  writer_thread_ = std::thread([this]() { WriterThreadMain(); });
}

void ChunkMultiplexer::QueueTask(std::unique_ptr<StreamTask> task) {
  task->queue_ = &queue_;
  pool_.QueueTask(std::move(task));
}

absl::Status ChunkMultiplexer::Push(Chunk chunk) {
  return queue_.Push(std::move(chunk));
}

void ChunkMultiplexer::WaitForTasks() { pool_.Wait(); }

absl::Status ChunkMultiplexer::Finish() {
  pool_.Wait();
  queue_.Close();
  StopWriter();
  return WriterStatus();
}

void ChunkMultiplexer::Abort(const absl::Status& status) {
  absl::optional<Chunk> final_chunk;
  if (!IsTransportError(status) && !IsRemoteError(status) &&
      WriterStatus().ok()) {
    Buffer payload;
    absl::Status encode_status = EncodeErrorPayload(status, &payload);
    if (encode_status.ok()) {
      final_chunk = Chunk(MessageType::kError, kSessionStreamId,
                          std::move(payload));
    } else {
      LOG_ERROR("Failed to encode session error: %s",
                encode_status.ToString());
    }
  }

  queue_.Abort(std::move(final_chunk));
  pool_.Shutdown();
  StopWriter();
  socket_->ShutdownSendingEnd();
}

void ChunkMultiplexer::SetTaskCompletedCallback(TaskCompletedCallback cb) {
  pool_.SetTaskCompletedCallback(std::move(cb));
}

absl::Status ChunkMultiplexer::WriterStatus() const {
  absl::MutexLock lock(&status_mutex_);
  return writer_status_;
}

void ChunkMultiplexer::WriterThreadMain() {
  Buffer frame;
  Chunk chunk;
  while (queue_.Pop(&chunk)) {
    absl::Status status = SerializeFrame(chunk.type, chunk.stream_id,
                                         chunk.data.data(), chunk.data.size(),
                                         &frame);
    if (status.ok()) {
      status = TransportError(socket_->Send(frame.data(), frame.size()),
                              "Failed to send %s frame for stream %u",
                              MessageTypeName(chunk.type), chunk.stream_id);
    }
    if (!status.ok()) {
      LOG_ERROR("Writer failed: %s", status.ToString());
      {
        absl::MutexLock lock(&status_mutex_);
        writer_status_ = status;
      }
      // Unblock the workers. The session cannot continue without a writer.
      queue_.Cancel();
      socket_->ShutdownSendingEnd();
      return;
    }
    LOG_VERBOSE("Sent %s frame for stream %u with %u bytes",
                MessageTypeName(chunk.type), chunk.stream_id,
                chunk.data.size());
  }
}

void ChunkMultiplexer::StopWriter() {
  if (writer_thread_.joinable()) writer_thread_.join();
}

}  // namespace func_sync
