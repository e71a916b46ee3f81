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

#ifndef SYNC_ROLLING_DELTA_H_
#define SYNC_ROLLING_DELTA_H_

#include <array>
#include <cstdint>
#include <cstdio>
#include <unordered_map>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "common/buffer.h"
#include "sync/byte_sink.h"

namespace func_sync {

// Protocol constants.
constexpr uint32_t kBlockSize = 2048;
constexpr uint32_t kStrongHashSize = 16;
constexpr uint32_t kSignatureMagic = 0x46534731;  // "FSG1"
constexpr uint32_t kDeltaMagic = 0x46444C31;      // "FDL1"

// Largest block size accepted in a signature.
constexpr uint32_t kMaxBlockSize = 1024 * 1024;

// Delta op codes.
enum class DeltaOp : uint8_t {
  kEnd = 0x00,
  kLiteral = 0x01,  // len u32, bytes
  kCopy = 0x02,     // base offset u64, len u32
};

// Literal ops carry at most that many bytes.
constexpr uint32_t kMaxLiteralSize = 64 * 1024;

// Contiguous copies are combined up to that size.
constexpr uint32_t kMaxCopySize = 1024 * 1024;

using StrongHash = std::array<uint8_t, kStrongHashSize>;

// BLAKE3 of |data|, truncated to kStrongHashSize bytes.
StrongHash ComputeStrongHash(const void* data, size_t size);

// rsync-style weak checksum over a window of bytes. Both sums are kept modulo
// 2^16:
//   a = sum(x_i + 31)
//   b = sum of the running values of a
class RollingChecksum {
 public:
  RollingChecksum() = default;

  void Reset();

  // Appends |size| bytes to the window.
  void Update(const void* data, size_t size);

  // Slides the window by one byte: removes |out| from the front and appends
  // |in|. The window length stays the same.
  void Rotate(uint8_t out, uint8_t in);

  // (b << 16) | a.
  uint32_t Digest() const { return ((b_ & 0xffff) << 16) | (a_ & 0xffff); }

  size_t size() const { return count_; }

 private:
  uint32_t a_ = 0;
  uint32_t b_ = 0;
  size_t count_ = 0;
};

// Convenience wrapper for a whole buffer.
uint32_t ComputeWeakChecksum(const void* data, size_t size);

// Parsed block signature of a base file.
class Signature {
 public:
  Signature();
  ~Signature();

  Signature(Signature&&);
  Signature& operator=(Signature&&);

  // Parses the serialized signature in |data|. Fails with a DataLoss error if
  // the data is malformed.
  static absl::Status Parse(absl::string_view data, Signature* signature);

  uint32_t block_size() const { return block_size_; }
  uint64_t base_size() const { return base_size_; }
  size_t num_blocks() const { return weak_.size(); }

  uint32_t weak(size_t index) const { return weak_[index]; }
  const StrongHash& strong(size_t index) const { return strong_[index]; }

  // Length of block |index|. All blocks but the last one are full.
  uint32_t BlockLength(size_t index) const;

  // Indices of the blocks with weak checksum |weak|, in file order. Returns
  // nullptr if there are none.
  const std::vector<uint32_t>* FindBlocks(uint32_t weak) const;

 private:
  uint32_t block_size_ = 0;
  uint64_t base_size_ = 0;
  std::vector<uint32_t> weak_;
  std::vector<StrongHash> strong_;
  std::unordered_map<uint32_t, std::vector<uint32_t>> blocks_by_weak_;
};

// Reads |file| from the start and writes its signature to |sink|. Blocks are
// |block_size| bytes long.
absl::Status GenerateSignature(FILE* file, ByteSink* sink,
                               uint32_t block_size = kBlockSize);

// Reads |file| from the start and writes a delta to |sink| that turns the base
// file described by |signature| into the contents of |file|. The memory used
// is bounded independently of the file size.
absl::Status GenerateDelta(const Signature& signature, FILE* file,
                           ByteSink* sink);

// Applies a delta that arrives in pieces. The delta may be split at any byte.
// Malformed deltas fail with a DataLoss error.
class DeltaApplier {
 public:
  // Copy ops read from |base|, which has |base_size| bytes. Output is written
  // to |out|. Does not take ownership.
  DeltaApplier(FILE* base, uint64_t base_size, FILE* out);
  ~DeltaApplier();

  DeltaApplier(const DeltaApplier&) = delete;
  DeltaApplier& operator=(const DeltaApplier&) = delete;

  // Consumes the next piece of the delta.
  absl::Status Update(const void* data, size_t size);

  // Must be called after the last piece. Fails if the end op is missing.
  absl::Status Finish();

  // Number of bytes written to the output file.
  uint64_t BytesWritten() const { return bytes_written_; }

 private:
  enum class State {
    kMagic,
    kOpCode,
    kLiteralHeader,
    kLiteralData,
    kCopyHeader,
    kDone,
  };

  // Moves bytes from |*data| into |header_| until it holds |needed| bytes.
  // Returns true once it does.
  bool GatherHeader(const char** data, size_t* size, size_t needed);

  absl::Status WriteOutput(const void* data, size_t size);
  absl::Status CopyFromBase(uint64_t offset, uint32_t size);

  FILE* base_;
  uint64_t base_size_;
  FILE* out_;

  State state_ = State::kMagic;
  Buffer header_;
  uint32_t literal_remaining_ = 0;
  Buffer copy_buffer_;
  uint64_t bytes_written_ = 0;
};

}  // namespace func_sync

#endif  // SYNC_ROLLING_DELTA_H_
