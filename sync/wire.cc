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

#include "sync/wire.h"

#include <sys/stat.h>

#include <algorithm>
#include <cstring>

#include "absl/strings/str_split.h"
#include "common/log.h"
#include "common/status.h"
#include "sync/byte_order.h"
#include "sync/socket.h"
#include "sync/sync_errors.h"

namespace func_sync {
namespace {

// Size of socket reads. Large enough to pick up many small frames at once.
constexpr size_t kReadBufferSize = 64 * 1024;

// size u64, mode u32, mtime_sec i64, mtime_nsec u32.
constexpr size_t kFileInfoFixedSize = 8 + 4 + 8 + 4;

constexpr uint32_t kNanosPerSecond = 1000000000;

#define HANDLE_MESSAGE_TYPE(type) \
  case MessageType::type:         \
    return #type;

bool IsKnownMessageType(uint8_t value) {
  switch (static_cast<MessageType>(value)) {
    case MessageType::kSignature:
    case MessageType::kDelta:
    case MessageType::kFileData:
    case MessageType::kEndOfExchange:
    case MessageType::kError:
      return true;
  }
  return false;
}

// Validates fields shared by encoder and decoder.
absl::Status ValidateMode(uint32_t mode) {
  if ((mode & ~kWireValidBits) != 0) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Reserved mode bits set in %#x", mode));
  }
  if ((mode & kWireDirectory) && (mode & kWireSymlink)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Mode %#x marks an entry as directory and symlink", mode));
  }
  return absl::OkStatus();
}

}  // namespace

const char* MessageTypeName(MessageType type) {
  switch (type) {
    HANDLE_MESSAGE_TYPE(kSignature)
    HANDLE_MESSAGE_TYPE(kDelta)
    HANDLE_MESSAGE_TYPE(kFileData)
    HANDLE_MESSAGE_TYPE(kEndOfExchange)
    HANDLE_MESSAGE_TYPE(kError)
  }
  return "<unknown>";
}

#undef HANDLE_MESSAGE_TYPE

absl::Status SerializeFrame(MessageType type, uint32_t stream_id,
                            const void* payload, size_t payload_size,
                            Buffer* frame) {
  frame->clear();
  if (type == MessageType::kEndOfExchange) {
    AppendU8(frame, static_cast<uint8_t>(type));
    return absl::OkStatus();
  }

  if (payload_size > kMaxPayloadSize) {
    return MakeStatus("Max payload size exceeded: %u", payload_size);
  }
  if (stream_id == kSessionStreamId && type != MessageType::kError) {
    return MakeStatus("Session stream id used for %s", MessageTypeName(type));
  }

  frame->reserve(kFrameHeaderSize + payload_size);
  AppendU8(frame, static_cast<uint8_t>(type));
  AppendU32(frame, stream_id);
  AppendU32(frame, static_cast<uint32_t>(payload_size));
  frame->append(payload, payload_size);
  return absl::OkStatus();
}

FrameReader::FrameReader(Socket* socket) : socket_(socket) {}

FrameReader::~FrameReader() = default;

absl::Status FrameReader::Fill() {
  buffer_.resize(kReadBufferSize);
  size_t bytes_received = 0;
  absl::Status status = socket_->Receive(buffer_.data(), buffer_.size(),
                                         /*allow_partial_read=*/true,
                                         &bytes_received);
  buffer_.resize(bytes_received);
  pos_ = 0;
  if (HasTag(status, Tag::kSocketEof)) eof_ = true;
  return TransportError(status, "Failed to receive data");
}

absl::Status FrameReader::ReadExact(void* data, size_t size) {
  char* out = static_cast<char*>(data);
  while (size > 0) {
    if (pos_ == buffer_.size()) {
      absl::Status status = Fill();
      if (!status.ok()) return status;
    }
    size_t to_copy = std::min(size, buffer_.size() - pos_);
    memcpy(out, buffer_.data() + pos_, to_copy);
    pos_ += to_copy;
    out += to_copy;
    size -= to_copy;
  }
  return absl::OkStatus();
}

absl::Status FrameReader::ReadMessage(Message* message) {
  uint8_t type;
  absl::Status status = ReadExact(&type, 1);
  if (!status.ok()) {
    return WrapStatus(status, "Failed to read frame type");
  }
  if (!IsKnownMessageType(type)) {
    return ProtocolError("Unknown frame type %#x", type);
  }
  message->type = static_cast<MessageType>(type);
  message->payload.clear();
  if (message->type == MessageType::kEndOfExchange) {
    message->stream_id = 0;
    return absl::OkStatus();
  }

  uint8_t header[kFrameHeaderSize - 1];
  status = ReadExact(header, sizeof(header));
  if (!status.ok()) {
    return WrapStatus(status, "Failed to read %s frame header",
                      MessageTypeName(message->type));
  }
  message->stream_id = LoadU32(header);
  uint32_t payload_size = LoadU32(header + 4);
  if (payload_size > kMaxPayloadSize) {
    return ProtocolError("Max payload size exceeded: %u", payload_size);
  }
  if (message->stream_id == kSessionStreamId &&
      message->type != MessageType::kError) {
    return ProtocolError("Session stream id used for %s",
                         MessageTypeName(message->type));
  }

  message->payload.resize(payload_size);
  status = ReadExact(message->payload.data(), payload_size);
  if (!status.ok()) {
    return WrapStatus(status, "Failed to read payload of size %u",
                      payload_size);
  }

  LOG_VERBOSE("Received %s frame for stream %u with %u bytes",
              MessageTypeName(message->type), message->stream_id,
              payload_size);
  return absl::OkStatus();
}

bool FileInfo::operator==(const FileInfo& other) const {
  return path == other.path && size == other.size && mode == other.mode &&
         mtime_sec == other.mtime_sec && mtime_nsec == other.mtime_nsec &&
         link_target == other.link_target;
}

absl::StatusOr<uint32_t> WireModeFromStMode(uint32_t st_mode) {
  uint32_t mode = st_mode & kWirePermissionMask;
  if (S_ISDIR(st_mode)) return mode | kWireDirectory;
  if (S_ISLNK(st_mode)) return mode | kWireSymlink;
  if (S_ISREG(st_mode)) return mode;
  return absl::InvalidArgumentError(
      absl::StrFormat("Unsupported file type, mode %#o", st_mode));
}

absl::Status EncodeFileInfo(const FileInfo& info, Buffer* out) {
  if (info.path.empty()) {
    return absl::InvalidArgumentError("Empty path in manifest record");
  }
  if (info.path.size() > kMaxManifestStringSize) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Path of %u bytes exceeds limit of %u bytes", info.path.size(),
        kMaxManifestStringSize));
  }
  absl::Status status = ValidateMode(info.mode);
  if (!status.ok()) {
    return WrapStatus(status, "Invalid record for '%s'", info.path);
  }
  if (info.mtime_nsec >= kNanosPerSecond) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Invalid nanoseconds %u for '%s'", info.mtime_nsec, info.path));
  }
  if (!info.IsRegular() && info.size != 0) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Non-zero size %u for non-regular file '%s'", info.size, info.path));
  }
  if (!info.IsSymlink() && !info.link_target.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Link target set for non-symlink '%s'", info.path));
  }
  if (info.link_target.size() > kMaxManifestStringSize) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Link target of '%s' exceeds limit of %u bytes", info.path,
        kMaxManifestStringSize));
  }

  AppendU32(out, static_cast<uint32_t>(info.path.size()));
  out->append(info.path.data(), info.path.size());
  AppendU64(out, info.size);
  AppendU32(out, info.mode);
  AppendU64(out, static_cast<uint64_t>(info.mtime_sec));
  AppendU32(out, info.mtime_nsec);
  if (info.IsSymlink()) {
    AppendU32(out, static_cast<uint32_t>(info.link_target.size()));
    out->append(info.link_target.data(), info.link_target.size());
  }
  return absl::OkStatus();
}

void EncodeManifestEnd(Buffer* out) { AppendU32(out, 0); }

// Reads a record field. A connection that ends within the manifest is a
// truncated manifest.
#define READ_FIELD(reader, data, size, ...)                                 \
  do {                                                                      \
    absl::Status __status__ = (reader)->ReadExact(data, size);              \
    if (!__status__.ok()) {                                                 \
      if ((reader)->eof()) {                                                \
        return ProtocolError("Truncated manifest: %s",                      \
                             absl::StrFormat(__VA_ARGS__));                 \
      }                                                                     \
      return WrapStatus(__status__, __VA_ARGS__);                           \
    }                                                                       \
  } while (0)

absl::Status DecodeFileInfo(FrameReader* reader, FileInfo* info, bool* end) {
  *end = false;
  uint8_t len_bytes[4];
  READ_FIELD(reader, len_bytes, sizeof(len_bytes),
             "Failed to read path length");
  uint32_t path_len = LoadU32(len_bytes);
  if (path_len == 0) {
    *end = true;
    return absl::OkStatus();
  }
  if (path_len > kMaxManifestStringSize) {
    return ProtocolError("Path length %u exceeds limit of %u bytes", path_len,
                         kMaxManifestStringSize);
  }

  FileInfo result;
  result.path.resize(path_len);
  READ_FIELD(reader, &result.path[0], path_len, "Failed to read path");

  uint8_t fixed[kFileInfoFixedSize];
  READ_FIELD(reader, fixed, sizeof(fixed), "Failed to read record of '%s'",
             result.path);
  result.size = LoadU64(fixed);
  result.mode = LoadU32(fixed + 8);
  result.mtime_sec = static_cast<int64_t>(LoadU64(fixed + 12));
  result.mtime_nsec = LoadU32(fixed + 20);

  absl::Status status = ValidateMode(result.mode);
  if (!status.ok()) {
    return ProtocolError("Bad record for '%s': %s", result.path,
                         status.message());
  }
  if (result.mtime_nsec >= kNanosPerSecond) {
    return ProtocolError("Bad record for '%s': nanoseconds %u out of range",
                         result.path, result.mtime_nsec);
  }

  if (result.IsSymlink()) {
    READ_FIELD(reader, len_bytes, sizeof(len_bytes),
               "Failed to read link length of '%s'", result.path);
    uint32_t link_len = LoadU32(len_bytes);
    if (link_len > kMaxManifestStringSize) {
      return ProtocolError("Link length %u of '%s' exceeds limit of %u bytes",
                           link_len, result.path, kMaxManifestStringSize);
    }
    result.link_target.resize(link_len);
    if (link_len > 0) {
      READ_FIELD(reader, &result.link_target[0], link_len,
                 "Failed to read link target of '%s'", result.path);
    }
  }

  *info = std::move(result);
  return absl::OkStatus();
}

#undef READ_FIELD

absl::Status ValidateRelativePath(const std::string& path) {
  if (path.empty()) {
    return absl::InvalidArgumentError("Empty path");
  }
  if (path.front() == '/') {
    return absl::InvalidArgumentError(
        absl::StrFormat("Absolute path '%s'", path));
  }
  if (path.find('\\') != std::string::npos) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Backslash in path '%s'", path));
  }
  for (absl::string_view component : absl::StrSplit(path, '/')) {
    if (component.empty() || component == "." || component == "..") {
      return absl::InvalidArgumentError(
          absl::StrFormat("Invalid component '%s' in path '%s'", component,
                          path));
    }
  }
  return absl::OkStatus();
}

}  // namespace func_sync
