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

#ifndef SYNC_CHUNK_MULTIPLEXER_H_
#define SYNC_CHUNK_MULTIPLEXER_H_

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "common/buffer.h"
#include "common/threadpool.h"
#include "sync/byte_sink.h"
#include "sync/wire.h"

namespace func_sync {

class Socket;

// Chunks written by ChunkWriter carry at most that many bytes.
constexpr size_t kMaxChunkSize = 64 * 1024;

// Unit of work for the connection writer. Written as exactly one frame.
struct Chunk {
  MessageType type = MessageType::kFileData;
  uint32_t stream_id = 0;
  Buffer data;

  Chunk() = default;
  Chunk(MessageType type, uint32_t stream_id, Buffer data = Buffer())
      : type(type), stream_id(stream_id), data(std::move(data)) {}

  // Instances should be moved, not copied.
  Chunk(const Chunk& other) = delete;
  Chunk(Chunk&& other) = default;
  Chunk& operator=(const Chunk& other) = delete;
  Chunk& operator=(Chunk&& other) = default;
};

// Bounded multi-producer, single-consumer queue between the workers and the
// connection writer.
class ChunkQueue {
 public:
  // Producers block while |capacity| chunks are queued. A capacity of 0 makes
  // the queue a rendezvous: Push() returns once the consumer took the chunk.
  explicit ChunkQueue(size_t capacity);
  ~ChunkQueue();

  ChunkQueue(const ChunkQueue&) = delete;
  ChunkQueue& operator=(const ChunkQueue&) = delete;

  // Queues |chunk|. Returns a Cancelled error if the queue was cancelled or
  // aborted before or while blocking.
  absl::Status Push(Chunk chunk) ABSL_LOCKS_EXCLUDED(mutex_);

  // Takes the next chunk. Blocks until a chunk is available. Returns false if
  // the queue is closed and empty or if it was cancelled.
  bool Pop(Chunk* chunk) ABSL_LOCKS_EXCLUDED(mutex_);

  // No more chunks are pushed. Pop() returns the remaining chunks, then false.
  void Close() ABSL_LOCKS_EXCLUDED(mutex_);

  // Unblocks producers and the consumer. Queued chunks are dropped.
  void Cancel() ABSL_LOCKS_EXCLUDED(mutex_);

  // Drops queued chunks and unblocks producers, which get a Cancelled error.
  // If given, |final_chunk| becomes the last chunk the consumer pops.
  void Abort(absl::optional<Chunk> final_chunk) ABSL_LOCKS_EXCLUDED(mutex_);

  // True if Push() fails because of Cancel() or Abort().
  bool IsCancelled() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  const size_t capacity_;

  mutable absl::Mutex mutex_;
  std::deque<Chunk> chunks_ ABSL_GUARDED_BY(mutex_);
  uint64_t num_pushed_ ABSL_GUARDED_BY(mutex_) = 0;
  uint64_t num_popped_ ABSL_GUARDED_BY(mutex_) = 0;
  bool closed_ ABSL_GUARDED_BY(mutex_) = false;
  bool producers_cancelled_ ABSL_GUARDED_BY(mutex_) = false;
  bool consumer_cancelled_ ABSL_GUARDED_BY(mutex_) = false;
};

// Packages the bytes of one stream into chunks of at most kMaxChunkSize bytes.
class ChunkWriter : public ByteSink {
 public:
  ChunkWriter(ChunkQueue* queue, MessageType type, uint32_t stream_id);
  ~ChunkWriter();

  absl::Status Write(const void* data, size_t size) override;

  // Pushes buffered data, if any.
  absl::Status Flush();

  // Pushes buffered data and the empty chunk that terminates the stream.
  absl::Status Finish();

  // Number of payload bytes written so far.
  uint64_t BytesWritten() const { return bytes_written_; }

 private:
  ChunkQueue* queue_;
  const MessageType type_;
  const uint32_t stream_id_;
  Buffer buffer_;
  uint64_t bytes_written_ = 0;
};

// Task that produces the chunks of one stream on a worker thread.
class StreamTask {
 public:
  StreamTask(uint32_t stream_id, std::string path);
  virtual ~StreamTask();

  // Runs the task on a worker thread of the multiplexer.
  void ThreadRun(IsCancelledPredicate is_cancelled);

  uint32_t stream_id() const { return stream_id_; }
  const std::string& path() const { return path_; }

  // Result of Run(). Only valid once the task completed.
  const absl::Status& status() const { return status_; }

 protected:
  // Produces the stream by pushing chunks to |queue|. On failure other than
  // cancellation, an error chunk for the stream is pushed afterwards.
  virtual absl::Status Run(ChunkQueue* queue,
                           const IsCancelledPredicate& is_cancelled) = 0;

 private:
  friend class ChunkMultiplexer;

  const uint32_t stream_id_;
  const std::string path_;
  ChunkQueue* queue_ = nullptr;
  absl::Status status_;
};

// Runs StreamTasks on a worker pool and writes the chunks they produce to the
// socket from a single writer thread. Chunks of one stream are written in
// order. Chunks of different streams may interleave.
class ChunkMultiplexer {
 public:
  ChunkMultiplexer(Socket* socket, size_t num_workers, size_t queue_capacity);
  ~ChunkMultiplexer();

  ChunkMultiplexer(const ChunkMultiplexer&) = delete;
  ChunkMultiplexer& operator=(const ChunkMultiplexer&) = delete;

  // Starts the writer thread.
  void Start();

  // Queues |task| for execution on a worker thread.
  void QueueTask(std::unique_ptr<StreamTask> task);

  // Queues a chunk from the calling thread. Blocks while the queue is full.
  absl::Status Push(Chunk chunk);

  // Waits until all queued tasks completed.
  void WaitForTasks();

  // Waits for the tasks, writes the remaining chunks and stops the writer.
  // Returns the writer's status, a transport error if a write failed.
  absl::Status Finish();

  // Stops everything after a fatal error. Running tasks are cancelled and
  // queued chunks are dropped. Unless |status| is a transport or remote error
  // or the writer failed, a session error frame carrying |status| is written
  // before the writer stops. Finally shuts down the sending end of the socket
  // so that the peer stops waiting.
  void Abort(const absl::Status& status);

  using TaskCompletedCallback =
      std::function<void(std::unique_ptr<StreamTask> task)>;

  // Sets a callback that is called on the worker thread after a task ran.
  void SetTaskCompletedCallback(TaskCompletedCallback cb);

  // Status of the writer thread. OK unless a write failed.
  absl::Status WriterStatus() const ABSL_LOCKS_EXCLUDED(status_mutex_);

  size_t NumWorkers() const { return pool_.NumThreads(); }

 private:
  void WriterThreadMain();
  void StopWriter();

  Socket* const socket_;
  ChunkQueue queue_;
  Threadpool<StreamTask> pool_;
  std::thread writer_thread_;

  mutable absl::Mutex status_mutex_;
  absl::Status writer_status_ ABSL_GUARDED_BY(status_mutex_);
};

}  // namespace func_sync

#endif  // SYNC_CHUNK_MULTIPLEXER_H_
