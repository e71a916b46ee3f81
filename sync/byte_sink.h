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

#ifndef SYNC_BYTE_SINK_H_
#define SYNC_BYTE_SINK_H_

#include <cstddef>

#include "absl/status/status.h"
#include "common/buffer.h"

namespace func_sync {

// Destination for generated signature, delta and file data.
class ByteSink {
 public:
  virtual ~ByteSink() = default;

  // Consumes |size| bytes from |data|.
  virtual absl::Status Write(const void* data, size_t size) = 0;
};

// Collects everything in a Buffer.
class BufferSink : public ByteSink {
 public:
  explicit BufferSink(Buffer* buffer) : buffer_(buffer) {}

  absl::Status Write(const void* data, size_t size) override {
    buffer_->append(data, size);
    return absl::OkStatus();
  }

 private:
  Buffer* buffer_;
};

}  // namespace func_sync

#endif  // SYNC_BYTE_SINK_H_
