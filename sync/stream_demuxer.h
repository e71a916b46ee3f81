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

#ifndef SYNC_STREAM_DEMUXER_H_
#define SYNC_STREAM_DEMUXER_H_

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "sync/wire.h"

namespace func_sync {

class ReportWriter;

// How the sender delivers the contents of a file.
enum class StreamKind {
  // kFileData chunks with the full contents.
  kFull,
  // kDelta chunks against the receiver's current copy.
  kDelta,
};

// Reads the sender's frames in arrival order and rebuilds the files they
// carry. Every file is written to a temporary file next to its target and
// renamed over the target once its stream ends.
class StreamDemuxer {
 public:
  // |manifest| is indexed by stream id. Files are written below |root|.
  StreamDemuxer(FrameReader* reader, std::string root,
                const std::vector<FileInfo>* manifest, ReportWriter* report);
  ~StreamDemuxer();

  StreamDemuxer(const StreamDemuxer&) = delete;
  StreamDemuxer& operator=(const StreamDemuxer&) = delete;

  // Announces that the sender will deliver stream |stream_id|. Frames for
  // streams that were not announced are protocol errors. Thread-safe, must be
  // called before the request for the stream is sent.
  void ExpectStream(uint32_t stream_id, StreamKind kind)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Withdraws an announced stream that the sender will not deliver, e.g.
  // because the receiver failed to send its signature. Thread-safe.
  void ForgetStream(uint32_t stream_id) ABSL_LOCKS_EXCLUDED(mutex_);

  // Processes frames until the sender's end of exchange. Per-file failures
  // are recorded in the report. Returns protocol, transport and remote
  // session errors.
  absl::Status Run();

 private:
  enum class State { kExpected, kOpen, kFailed, kDone };

  struct Stream;

  absl::Status HandleData(Message* message);
  absl::Status HandleStreamError(uint32_t stream_id,
                                 const absl::Status& remote_status);
  absl::Status FinishExchange();

  // Returns the stream for |stream_id| or a protocol error if the stream was
  // never announced.
  absl::Status GetStream(uint32_t stream_id, Stream** stream);

  absl::Status OpenStream(uint32_t stream_id, Stream* stream);
  absl::Status WriteData(Stream* stream, const Buffer& data);
  absl::Status FinalizeStream(uint32_t stream_id, Stream* stream);

  // Closes the files of |stream| and removes its temporary file.
  void Discard(Stream* stream);

  // Records a local per-file error and discards the stream.
  void Fail(uint32_t stream_id, Stream* stream, const absl::Status& status);

  FrameReader* const reader_;
  const std::string root_;
  const std::vector<FileInfo>* const manifest_;
  ReportWriter* const report_;

  // Only accessed by the thread calling Run().
  std::unordered_map<uint32_t, std::unique_ptr<Stream>> streams_;

  absl::Mutex mutex_;
  std::unordered_map<uint32_t, StreamKind> expected_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace func_sync

#endif  // SYNC_STREAM_DEMUXER_H_
