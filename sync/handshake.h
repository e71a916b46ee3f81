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

#ifndef SYNC_HANDSHAKE_H_
#define SYNC_HANDSHAKE_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"

namespace func_sync {

class FrameReader;
class Socket;

// Preamble that starts every session. Followed by a big-endian u16 version.
constexpr char kMagic[] = "FUNCSYNC";
constexpr size_t kMagicSize = sizeof(kMagic) - 1;

// Highest and lowest version implemented by this code.
constexpr uint16_t kProtocolVersion = 1;
constexpr uint16_t kMinProtocolVersion = 1;

// Version sent by the receiver to reject a handshake.
constexpr uint16_t kRejectedVersion = 0;

struct HandshakeOptions {
  // kMagicSize bytes sent and expected in the preamble.
  std::string magic = kMagic;

  // Highest version offered (sender) or accepted (receiver).
  uint16_t max_version = kProtocolVersion;
};

// Sends the preamble with |options.max_version| and adopts the version echoed
// by the receiver. Replies are read through |reader|, which must be the reader
// that is used for the rest of the session.
absl::StatusOr<uint16_t> NegotiateAsSender(Socket* socket, FrameReader* reader,
                                           const HandshakeOptions& options);

// Reads the sender's preamble, clamps the proposed version to
// |options.max_version| and echoes the result. Rejected handshakes are
// answered with kRejectedVersion before failing.
absl::StatusOr<uint16_t> NegotiateAsReceiver(Socket* socket,
                                             FrameReader* reader,
                                             const HandshakeOptions& options);

}  // namespace func_sync

#endif  // SYNC_HANDSHAKE_H_
