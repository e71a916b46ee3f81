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

#ifndef SYNC_SYNC_ERRORS_H_
#define SYNC_SYNC_ERRORS_H_

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "common/buffer.h"
#include "common/status.h"

namespace func_sync {

// Session failures are plain absl::Status values. The category is encoded in
// the status code and a Tag:
//
//   handshake   FailedPrecondition  Tag::kHandshake
//   protocol    DataLoss            Tag::kProtocol
//   transport   Unavailable         Tag::kTransport
//   remote      peer's code         Tag::kRemote
//
// Errors without one of these tags are either cancellation or per-file
// errors.

template <typename... Args>
absl::Status HandshakeError(const absl::FormatSpec<Args...>& format,
                            Args... args) {
  return SetTag(absl::FailedPreconditionError(absl::StrFormat(format, args...)),
                Tag::kHandshake);
}

template <typename... Args>
absl::Status ProtocolError(const absl::FormatSpec<Args...>& format,
                           Args... args) {
  return SetTag(absl::DataLossError(absl::StrFormat(format, args...)),
                Tag::kProtocol);
}

// Turns a failed socket operation into a transport error. Keeps the message
// of |status|. Returns OK if |status| is OK.
template <typename... Args>
absl::Status TransportError(absl::Status status,
                            const absl::FormatSpec<Args...>& format,
                            Args... args) {
  if (status.ok()) return status;
  return SetTag(absl::UnavailableError(absl::StrCat(
                    status.message(), "; ", absl::StrFormat(format, args...))),
                Tag::kTransport);
}

inline bool IsHandshakeError(const absl::Status& status) {
  return HasTag(status, Tag::kHandshake);
}
inline bool IsProtocolError(const absl::Status& status) {
  return HasTag(status, Tag::kProtocol);
}
inline bool IsTransportError(const absl::Status& status) {
  return HasTag(status, Tag::kTransport);
}
inline bool IsRemoteError(const absl::Status& status) {
  return HasTag(status, Tag::kRemote);
}

// Serializes |status| into the payload of an error frame.
absl::Status EncodeErrorPayload(const absl::Status& status, Buffer* payload);

// Parses the payload of an error frame sent by the peer. Returns the remote
// failure in |remote_status|, tagged with Tag::kRemote. Returns a protocol
// error if the payload is malformed.
absl::Status DecodeErrorPayload(const Buffer& payload,
                                absl::Status* remote_status);

}  // namespace func_sync

#endif  // SYNC_SYNC_ERRORS_H_
