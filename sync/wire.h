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

#ifndef SYNC_WIRE_H_
#define SYNC_WIRE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/buffer.h"

namespace func_sync {

class Socket;

//
// Frames
//
// Every frame is [type u8][stream id u32][payload length u32][payload], except
// kEndOfExchange, which is the type byte only. Type values lie outside of the
// printable ASCII range.
//

enum class MessageType : uint8_t {
  // Block signature of the receiver's copy of a file. Receiver to sender.
  kSignature = 0xE1,

  // Delta against the receiver's copy. Sender to receiver.
  kDelta = 0xE2,

  // Full file contents. An empty payload from the receiver requests the file,
  // a sequence of payloads from the sender delivers it.
  kFileData = 0xE3,

  // The sending side has nothing more to send.
  kEndOfExchange = 0xE4,

  // A serialized ErrorInfo, see protos/messages.proto.
  kError = 0xE5,
};

const char* MessageTypeName(MessageType type);

// Stream id that addresses the session as a whole. Only valid for kError.
constexpr uint32_t kSessionStreamId = 0xFFFFFFFF;

// Larger payloads are rejected by the frame reader.
constexpr size_t kMaxPayloadSize = 16 * 1024 * 1024;

// 1 byte type, 4 bytes stream id, 4 bytes payload length.
constexpr size_t kFrameHeaderSize = 9;

struct Message {
  MessageType type = MessageType::kEndOfExchange;
  uint32_t stream_id = 0;
  Buffer payload;
};

// Serializes a frame into |frame|, replacing its contents.
absl::Status SerializeFrame(MessageType type, uint32_t stream_id,
                            const void* payload, size_t payload_size,
                            Buffer* frame);

// Buffered reader for the incoming half of the connection. Not thread-safe;
// used by the single reading thread of a session end.
class FrameReader {
 public:
  explicit FrameReader(Socket* socket);
  ~FrameReader();

  FrameReader(const FrameReader&) = delete;
  FrameReader& operator=(const FrameReader&) = delete;

  // Reads exactly |size| bytes. Fails with a transport error if the
  // connection fails or closes early.
  absl::Status ReadExact(void* data, size_t size);

  // Reads the next frame. Fails with a transport error on connection failure
  // and with a protocol error on unknown types, ids that are not allowed for
  // the type, or oversized payloads.
  absl::Status ReadMessage(Message* message);

  // True once the peer closed the connection.
  bool eof() const { return eof_; }

 private:
  absl::Status Fill();

  Socket* socket_;
  Buffer buffer_;
  size_t pos_ = 0;
  bool eof_ = false;
};

//
// Manifest
//
// A sequence of file records terminated by a four zero byte sentinel at the
// position of a path length. Integers are big-endian:
//
//   path_len u32 (>= 1), path, size u64, mode u32, mtime_sec i64,
//   mtime_nsec u32, [link_len u32, link]   (link only for symlinks)
//

// Wire mode, version 1. Defined independently of the host's st_mode layout.
constexpr uint32_t kWirePermissionMask = 07777;
constexpr uint32_t kWireDirectory = 1u << 16;
constexpr uint32_t kWireSymlink = 1u << 17;
constexpr uint32_t kWireValidBits =
    kWirePermissionMask | kWireDirectory | kWireSymlink;

// Max length of paths and symlink targets in a manifest record.
constexpr uint32_t kMaxManifestStringSize = 64 * 1024;

struct FileInfo {
  // Relative, '/'-separated path.
  std::string path;
  // Byte count. 0 for directories and symlinks.
  uint64_t size = 0;
  // Wire mode.
  uint32_t mode = 0;
  int64_t mtime_sec = 0;
  uint32_t mtime_nsec = 0;
  // Only set for symlinks.
  std::string link_target;

  bool IsDir() const { return (mode & kWireDirectory) != 0; }
  bool IsSymlink() const { return (mode & kWireSymlink) != 0; }
  bool IsRegular() const { return !IsDir() && !IsSymlink(); }
  uint32_t Permissions() const { return mode & kWirePermissionMask; }

  bool operator==(const FileInfo& other) const;
  bool operator!=(const FileInfo& other) const { return !(*this == other); }
};

// Converts a host st_mode to the wire mode. Fails for types other than
// regular files, directories and symlinks.
absl::StatusOr<uint32_t> WireModeFromStMode(uint32_t st_mode);

// Appends the record of |info| to |out|. Rejects records the decoder would
// reject, in particular empty paths.
absl::Status EncodeFileInfo(const FileInfo& info, Buffer* out);

// Appends the sentinel that ends the manifest.
void EncodeManifestEnd(Buffer* out);

// Reads the next record. Sets |end| to true and leaves |info| untouched when
// the sentinel is read. Fails with a protocol error on malformed or truncated
// records.
absl::Status DecodeFileInfo(FrameReader* reader, FileInfo* info, bool* end);

// Returns OK if |path| is a relative path that stays inside the target root:
// no leading '/', no empty, "." or ".." components and no backslashes.
absl::Status ValidateRelativePath(const std::string& path);

}  // namespace func_sync

#endif  // SYNC_WIRE_H_
