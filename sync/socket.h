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

#ifndef SYNC_SOCKET_H_
#define SYNC_SOCKET_H_

#include <cstddef>

#include "absl/status/status.h"

namespace func_sync {

// Ordered, reliable, bidirectional byte stream between the two session ends.
// During a session, Send() is called by one thread at a time and Receive() by
// one (possibly different) thread at a time.
class Socket {
 public:
  Socket() = default;
  virtual ~Socket() = default;

  // Sends |size| bytes from |buffer|. Blocks until all data was handed to the
  // connection.
  virtual absl::Status Send(const void* buffer, size_t size) = 0;

  // Receives data from the socket. Blocks until data is available or the
  // sending end of the socket gets shut down by the peer.
  // If |allow_partial_read| is false, blocks until |size| bytes are available.
  // If |allow_partial_read| is true, may return with success if less than
  // |size| (but more than 0) bytes were received.
  // The number of bytes written to |buffer| is returned in |bytes_received|.
  // Returns an error tagged with Tag::kSocketEof if the peer closed the
  // connection before enough data arrived.
  virtual absl::Status Receive(void* buffer, size_t size,
                               bool allow_partial_read,
                               size_t* bytes_received) = 0;

  // Closes the sending direction. The peer receives EOF after the pending
  // data. Further Send() calls fail.
  virtual void ShutdownSendingEnd() = 0;
};

}  // namespace func_sync

#endif  // SYNC_SOCKET_H_
