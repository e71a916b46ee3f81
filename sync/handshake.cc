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

#include "sync/handshake.h"

#include <algorithm>
#include <cstring>

#include "absl/strings/escaping.h"
#include "common/buffer.h"
#include "common/log.h"
#include "common/status.h"
#include "sync/byte_order.h"
#include "sync/socket.h"
#include "sync/sync_errors.h"
#include "sync/wire.h"

namespace func_sync {
namespace {

constexpr size_t kPreambleSize = kMagicSize + sizeof(uint16_t);

absl::Status ValidateOptions(const HandshakeOptions& options) {
  if (options.magic.size() != kMagicSize) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Magic must be %u bytes, got %u", kMagicSize, options.magic.size()));
  }
  return absl::OkStatus();
}

absl::Status SendPreamble(Socket* socket, const std::string& magic,
                          uint16_t version) {
  Buffer preamble;
  preamble.append(magic.data(), magic.size());
  AppendU16(&preamble, version);
  return TransportError(socket->Send(preamble.data(), preamble.size()),
                        "Failed to send handshake");
}

absl::Status ReadPreamble(FrameReader* reader, std::string* magic,
                          uint16_t* version) {
  char preamble[kPreambleSize];
  absl::Status status = reader->ReadExact(preamble, sizeof(preamble));
  if (!status.ok()) {
    return WrapStatus(status, "Failed to read handshake");
  }
  magic->assign(preamble, kMagicSize);
  *version = LoadU16(preamble + kMagicSize);
  return absl::OkStatus();
}

// Answers a rejected handshake. Send failures are only logged.
void SendRejection(Socket* socket, const std::string& magic) {
  absl::Status status = SendPreamble(socket, magic, kRejectedVersion);
  if (!status.ok()) {
    LOG_WARNING("Failed to send handshake rejection: %s", status.ToString());
  }
}

}  // namespace

absl::StatusOr<uint16_t> NegotiateAsSender(Socket* socket, FrameReader* reader,
                                           const HandshakeOptions& options) {
  absl::Status status = ValidateOptions(options);
  if (!status.ok()) return status;

  status = SendPreamble(socket, options.magic, options.max_version);
  if (!status.ok()) return status;

  std::string magic;
  uint16_t version;
  status = ReadPreamble(reader, &magic, &version);
  if (!status.ok()) return status;

  if (magic != options.magic) {
    return HandshakeError("Bad magic '%s' in handshake reply",
                          absl::CHexEscape(magic));
  }
  if (version == kRejectedVersion) {
    return HandshakeError("Receiver rejected protocol version %u",
                          options.max_version);
  }
  if (version > options.max_version) {
    return HandshakeError(
        "Receiver chose protocol version %u above the proposed version %u",
        version, options.max_version);
  }
  if (version < kMinProtocolVersion || version > kProtocolVersion) {
    return HandshakeError("Protocol version %u is not supported", version);
  }

  LOG_INFO("Negotiated protocol version %u", version);
  return version;
}

absl::StatusOr<uint16_t> NegotiateAsReceiver(Socket* socket,
                                             FrameReader* reader,
                                             const HandshakeOptions& options) {
  absl::Status status = ValidateOptions(options);
  if (!status.ok()) return status;

  std::string magic;
  uint16_t proposed;
  status = ReadPreamble(reader, &magic, &proposed);
  if (!status.ok()) return status;

  if (magic != options.magic) {
    SendRejection(socket, options.magic);
    return HandshakeError("Bad magic '%s' in handshake",
                          absl::CHexEscape(magic));
  }

  uint16_t version = std::min(proposed, options.max_version);
  if (version < kMinProtocolVersion || version > kProtocolVersion) {
    SendRejection(socket, options.magic);
    return HandshakeError(
        "No common protocol version, proposed %u, supported %u to %u",
        proposed, kMinProtocolVersion,
        std::min(options.max_version, kProtocolVersion));
  }

  status = SendPreamble(socket, options.magic, version);
  if (!status.ok()) return status;

  LOG_INFO("Negotiated protocol version %u", version);
  return version;
}

}  // namespace func_sync
