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

#ifndef SYNC_SESSION_CONFIG_H_
#define SYNC_SESSION_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "sync/handshake.h"

namespace func_sync {

// Number of workers used if none is configured: hardware parallelism + 1.
size_t DefaultNumWorkers();

struct SessionConfig {
  // Number of worker threads that hash, diff and read files.
  size_t num_workers = DefaultNumWorkers();

  // Max number of chunks waiting for the connection writer. 0 hands every
  // chunk directly to the writer.
  size_t chunk_queue_capacity = 1;

  // Highest protocol version offered or accepted.
  uint16_t max_protocol_version = kProtocolVersion;

  // Receiver only: remove entries under the target root that are not in the
  // manifest.
  bool delete_extraneous = true;

  // Handshake preamble. Only changed by tests.
  std::string magic = kMagic;

  // Returns an InvalidArgument error if a value is out of range.
  absl::Status Validate() const;

  HandshakeOptions GetHandshakeOptions() const;
};

}  // namespace func_sync

#endif  // SYNC_SESSION_CONFIG_H_
