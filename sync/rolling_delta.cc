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

#include "sync/rolling_delta.h"

#include <errno.h>
#include <sys/stat.h>

#include <algorithm>
#include <cstring>

#include "absl/strings/str_format.h"
#include "blake3.h"
#include "common/status.h"
#include "common/status_macros.h"
#include "sync/byte_order.h"

namespace func_sync {
namespace {

// Added to every byte so that runs of zeros still change the checksum.
constexpr uint32_t kCharOffset = 31;

// magic u32, block size u32, strong hash size u32, base size u64.
constexpr size_t kSignatureHeaderSize = 4 + 4 + 4 + 8;

// weak u32, strong hash.
constexpr size_t kSignatureEntrySize = 4 + kStrongHashSize;

// Generated data is handed to the sink in pieces of about that size.
constexpr size_t kOutputFlushSize = 64 * 1024;

// Read size for the file that the delta is generated for.
constexpr size_t kReadSize = 256 * 1024;

// Max size of a single read from the base file when applying copy ops.
constexpr size_t kCopyBufferSize = 64 * 1024;

static_assert(kStrongHashSize <= BLAKE3_OUT_LEN, "");

absl::Status SeekToStart(FILE* file) {
  if (fseeko(file, 0, SEEK_SET) != 0) {
    return absl::ErrnoToStatus(errno, "fseeko() failed");
  }
  return absl::OkStatus();
}

// Scans a file with a rolling window and emits copy ops for windows that match
// a block of the base file and literal ops for everything else.
//
// |window_| holds the not yet emitted part of the file:
//
//   [literal_start_, pos_)   unmatched bytes, emitted as literal
//   [pos_, pos_ + L)         current window
class DeltaGenerator {
 public:
  DeltaGenerator(const Signature& signature, FILE* file, ByteSink* sink)
      : signature_(signature), file_(file), sink_(sink) {}

  absl::Status Run() {
    RETURN_IF_ERROR(SeekToStart(file_));
    AppendU32(&out_, kDeltaMagic);

    const uint32_t block_size = signature_.block_size();
    const size_t num_blocks = signature_.num_blocks();
    const uint32_t tail_size =
        num_blocks > 0 && signature_.BlockLength(num_blocks - 1) < block_size
            ? signature_.BlockLength(num_blocks - 1)
            : 0;
    const bool has_full_blocks =
        num_blocks > 0 && (tail_size == 0 || num_blocks > 1);

    RollingChecksum rolling;
    bool rolling_valid = false;
    for (;;) {
      if (window_.size() - pos_ <= block_size && !eof_) {
        RETURN_IF_ERROR(Refill());
        continue;
      }

      size_t avail = window_.size() - pos_;
      if (avail >= block_size && has_full_blocks) {
        const char* curr = window_.data() + pos_;
        if (!rolling_valid) {
          rolling.Reset();
          rolling.Update(curr, block_size);
          rolling_valid = true;
        }

        uint32_t block;
        if (FindMatch(curr, rolling.Digest(), &block)) {
          RETURN_IF_ERROR(FlushLiteral());
          RETURN_IF_ERROR(
              AddCopy(static_cast<uint64_t>(block) * block_size, block_size));
          pos_ += block_size;
          literal_start_ = pos_;
          last_block_ = block;
          rolling_valid = false;
          continue;
        }

        if (avail > block_size) {
          rolling.Rotate(static_cast<uint8_t>(curr[0]),
                         static_cast<uint8_t>(curr[block_size]));
        } else {
          rolling_valid = false;
        }
        ++pos_;
        if (pos_ - literal_start_ >= kMaxLiteralSize) {
          RETURN_IF_ERROR(FlushLiteral());
        }
        continue;
      }

      if (!eof_) {
        // Nothing but a short block to match. Keep enough data for the tail.
        pos_ = window_.size() - (block_size - 1);
        RETURN_IF_ERROR(FlushLiteral());
        continue;
      }

      // Fewer than |block_size| bytes left. Only the short last block of the
      // base file can match, and only at the very end.
      const size_t end = window_.size();
      if (tail_size > 0 && end - literal_start_ >= tail_size) {
        const char* tail = window_.data() + end - tail_size;
        if (ComputeWeakChecksum(tail, tail_size) ==
                signature_.weak(num_blocks - 1) &&
            ComputeStrongHash(tail, tail_size) ==
                signature_.strong(num_blocks - 1)) {
          pos_ = end - tail_size;
          RETURN_IF_ERROR(FlushLiteral());
          RETURN_IF_ERROR(AddCopy(
              static_cast<uint64_t>(num_blocks - 1) * block_size, tail_size));
          literal_start_ = end;
        }
      }
      pos_ = end;
      break;
    }

    RETURN_IF_ERROR(FlushLiteral());
    RETURN_IF_ERROR(FlushCopy());
    AppendU8(&out_, static_cast<uint8_t>(DeltaOp::kEnd));
    return FlushOutput(/*force=*/true);
  }

 private:
  // Drops emitted data from the window and reads the next piece of the file.
  absl::Status Refill() {
    window_.erase_front(literal_start_);
    pos_ -= literal_start_;
    literal_start_ = 0;

    size_t prev_size = window_.size();
    window_.resize(prev_size + kReadSize);
    size_t num_read = fread(window_.data() + prev_size, 1, kReadSize, file_);
    window_.resize(prev_size + num_read);
    if (num_read < kReadSize) {
      if (ferror(file_)) {
        return MakeStatus("Failed to read %u bytes", kReadSize);
      }
      eof_ = true;
    }
    return absl::OkStatus();
  }

  // Looks up a full block with weak checksum |weak| whose data equals |data|.
  // Prefers the block after the previous match, the common case for unchanged
  // runs.
  bool FindMatch(const char* data, uint32_t weak, uint32_t* block) {
    const std::vector<uint32_t>* candidates = signature_.FindBlocks(weak);
    if (!candidates) return false;

    const uint32_t block_size = signature_.block_size();
    const int64_t preferred = last_block_ + 1;
    bool has_strong = false;
    StrongHash strong;
    bool found = false;
    for (uint32_t index : *candidates) {
      if (signature_.BlockLength(index) != block_size) continue;
      if (!has_strong) {
        strong = ComputeStrongHash(data, block_size);
        has_strong = true;
      }
      if (strong != signature_.strong(index)) continue;
      if (index == preferred) {
        *block = index;
        return true;
      }
      if (!found) {
        *block = index;
        found = true;
      }
    }
    return found;
  }

  absl::Status FlushLiteral() {
    if (pos_ == literal_start_) return absl::OkStatus();
    RETURN_IF_ERROR(FlushCopy());
    while (literal_start_ < pos_) {
      uint32_t size = static_cast<uint32_t>(
          std::min<size_t>(pos_ - literal_start_, kMaxLiteralSize));
      AppendU8(&out_, static_cast<uint8_t>(DeltaOp::kLiteral));
      AppendU32(&out_, size);
      out_.append(window_.data() + literal_start_, size);
      literal_start_ += size;
      RETURN_IF_ERROR(FlushOutput(/*force=*/false));
    }
    return absl::OkStatus();
  }

  absl::Status AddCopy(uint64_t offset, uint32_t size) {
    if (has_copy_ && copy_offset_ + copy_size_ == offset &&
        copy_size_ + size <= kMaxCopySize) {
      copy_size_ += size;
      return absl::OkStatus();
    }
    RETURN_IF_ERROR(FlushCopy());
    has_copy_ = true;
    copy_offset_ = offset;
    copy_size_ = size;
    return absl::OkStatus();
  }

  absl::Status FlushCopy() {
    if (!has_copy_) return absl::OkStatus();
    AppendU8(&out_, static_cast<uint8_t>(DeltaOp::kCopy));
    AppendU64(&out_, copy_offset_);
    AppendU32(&out_, copy_size_);
    has_copy_ = false;
    return FlushOutput(/*force=*/false);
  }

  absl::Status FlushOutput(bool force) {
    if (out_.empty() || (!force && out_.size() < kOutputFlushSize)) {
      return absl::OkStatus();
    }
    RETURN_IF_ERROR(sink_->Write(out_.data(), out_.size()));
    out_.clear();
    return absl::OkStatus();
  }

  const Signature& signature_;
  FILE* file_;
  ByteSink* sink_;

  Buffer window_;
  size_t literal_start_ = 0;
  size_t pos_ = 0;
  bool eof_ = false;

  // Pending copy op, not yet serialized.
  bool has_copy_ = false;
  uint64_t copy_offset_ = 0;
  uint32_t copy_size_ = 0;
  int64_t last_block_ = -1;

  Buffer out_;
};

}  // namespace

StrongHash ComputeStrongHash(const void* data, size_t size) {
  StrongHash hash;
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  blake3_hasher_finalize(&hasher, hash.data(), hash.size());
  return hash;
}

void RollingChecksum::Reset() {
  a_ = 0;
  b_ = 0;
  count_ = 0;
}

void RollingChecksum::Update(const void* data, size_t size) {
  const uint8_t* bytes = static_cast<const uint8_t*>(data);
  for (size_t n = 0; n < size; ++n) {
    a_ += bytes[n] + kCharOffset;
    b_ += a_;
  }
  count_ += size;
}

void RollingChecksum::Rotate(uint8_t out, uint8_t in) {
  a_ += static_cast<uint32_t>(in) - out;
  b_ += a_ - static_cast<uint32_t>(count_) * (out + kCharOffset);
}

uint32_t ComputeWeakChecksum(const void* data, size_t size) {
  RollingChecksum checksum;
  checksum.Update(data, size);
  return checksum.Digest();
}

Signature::Signature() = default;
Signature::~Signature() = default;
Signature::Signature(Signature&&) = default;
Signature& Signature::operator=(Signature&&) = default;

absl::Status Signature::Parse(absl::string_view data, Signature* signature) {
  if (data.size() < kSignatureHeaderSize) {
    return absl::DataLossError(
        absl::StrFormat("Signature of %u bytes is too short", data.size()));
  }
  uint32_t magic = LoadU32(data.data());
  if (magic != kSignatureMagic) {
    return absl::DataLossError(
        absl::StrFormat("Bad signature magic %#x", magic));
  }
  uint32_t block_size = LoadU32(data.data() + 4);
  uint32_t strong_size = LoadU32(data.data() + 8);
  uint64_t base_size = LoadU64(data.data() + 12);
  if (block_size == 0 || block_size > kMaxBlockSize) {
    return absl::DataLossError(
        absl::StrFormat("Invalid signature block size %u", block_size));
  }
  if (strong_size != kStrongHashSize) {
    return absl::DataLossError(absl::StrFormat(
        "Strong hash size %u does not match expected size %u", strong_size,
        kStrongHashSize));
  }

  uint64_t num_blocks =
      base_size / block_size + (base_size % block_size != 0 ? 1 : 0);
  size_t entries_size = data.size() - kSignatureHeaderSize;
  if (entries_size % kSignatureEntrySize != 0 ||
      entries_size / kSignatureEntrySize != num_blocks) {
    return absl::DataLossError(absl::StrFormat(
        "Signature has %u bytes of entries, expected %u blocks for %u bytes",
        entries_size, num_blocks, base_size));
  }

  Signature result;
  result.block_size_ = block_size;
  result.base_size_ = base_size;
  result.weak_.reserve(num_blocks);
  result.strong_.reserve(num_blocks);
  const char* entry = data.data() + kSignatureHeaderSize;
  for (uint32_t index = 0; index < num_blocks; ++index) {
    uint32_t weak = LoadU32(entry);
    StrongHash strong;
    memcpy(strong.data(), entry + 4, kStrongHashSize);
    result.weak_.push_back(weak);
    result.strong_.push_back(strong);
    result.blocks_by_weak_[weak].push_back(index);
    entry += kSignatureEntrySize;
  }
  *signature = std::move(result);
  return absl::OkStatus();
}

uint32_t Signature::BlockLength(size_t index) const {
  uint64_t offset = static_cast<uint64_t>(index) * block_size_;
  return static_cast<uint32_t>(
      std::min<uint64_t>(block_size_, base_size_ - offset));
}

const std::vector<uint32_t>* Signature::FindBlocks(uint32_t weak) const {
  auto it = blocks_by_weak_.find(weak);
  return it != blocks_by_weak_.end() ? &it->second : nullptr;
}

absl::Status GenerateSignature(FILE* file, ByteSink* sink,
                               uint32_t block_size) {
  if (block_size == 0 || block_size > kMaxBlockSize) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid block size %u", block_size));
  }
  struct stat st;
  if (fstat(fileno(file), &st) != 0) {
    return absl::ErrnoToStatus(errno, "fstat() failed");
  }
  const uint64_t file_size = static_cast<uint64_t>(st.st_size);
  RETURN_IF_ERROR(SeekToStart(file));

  Buffer out;
  AppendU32(&out, kSignatureMagic);
  AppendU32(&out, block_size);
  AppendU32(&out, kStrongHashSize);
  AppendU64(&out, file_size);

  Buffer block(block_size);
  uint64_t total_read = 0;
  for (;;) {
    size_t num_read = fread(block.data(), 1, block_size, file);
    if (num_read < block_size && ferror(file)) {
      return MakeStatus("Failed to read %u bytes at offset %u", block_size,
                        total_read);
    }
    if (num_read == 0) break;
    total_read += num_read;

    AppendU32(&out, ComputeWeakChecksum(block.data(), num_read));
    StrongHash strong = ComputeStrongHash(block.data(), num_read);
    out.append(strong.data(), strong.size());
    if (out.size() >= kOutputFlushSize) {
      RETURN_IF_ERROR(sink->Write(out.data(), out.size()));
      out.clear();
    }
    if (num_read < block_size) break;
  }

  if (total_read != file_size) {
    return absl::AbortedError(absl::StrFormat(
        "File size changed from %u to %u bytes while reading", file_size,
        total_read));
  }
  if (!out.empty()) {
    RETURN_IF_ERROR(sink->Write(out.data(), out.size()));
  }
  return absl::OkStatus();
}

absl::Status GenerateDelta(const Signature& signature, FILE* file,
                           ByteSink* sink) {
  DeltaGenerator generator(signature, file, sink);
  return generator.Run();
}

DeltaApplier::DeltaApplier(FILE* base, uint64_t base_size, FILE* out)
    : base_(base), base_size_(base_size), out_(out) {}

DeltaApplier::~DeltaApplier() = default;

absl::Status DeltaApplier::Update(const void* data, size_t size) {
  const char* curr = static_cast<const char*>(data);
  while (size > 0) {
    switch (state_) {
      case State::kMagic: {
        if (!GatherHeader(&curr, &size, 4)) break;
        uint32_t magic = LoadU32(header_.data());
        header_.clear();
        if (magic != kDeltaMagic) {
          return absl::DataLossError(
              absl::StrFormat("Bad delta magic %#x", magic));
        }
        state_ = State::kOpCode;
        break;
      }

      case State::kOpCode: {
        uint8_t op = static_cast<uint8_t>(*curr);
        ++curr;
        --size;
        switch (static_cast<DeltaOp>(op)) {
          case DeltaOp::kEnd:
            state_ = State::kDone;
            break;
          case DeltaOp::kLiteral:
            state_ = State::kLiteralHeader;
            break;
          case DeltaOp::kCopy:
            state_ = State::kCopyHeader;
            break;
          default:
            return absl::DataLossError(
                absl::StrFormat("Unknown delta op %#x", op));
        }
        break;
      }

      case State::kLiteralHeader:
        if (!GatherHeader(&curr, &size, 4)) break;
        literal_remaining_ = LoadU32(header_.data());
        header_.clear();
        state_ = literal_remaining_ > 0 ? State::kLiteralData : State::kOpCode;
        break;

      case State::kLiteralData: {
        size_t to_write = std::min<size_t>(size, literal_remaining_);
        RETURN_IF_ERROR(WriteOutput(curr, to_write));
        curr += to_write;
        size -= to_write;
        literal_remaining_ -= static_cast<uint32_t>(to_write);
        if (literal_remaining_ == 0) state_ = State::kOpCode;
        break;
      }

      case State::kCopyHeader: {
        if (!GatherHeader(&curr, &size, 12)) break;
        uint64_t offset = LoadU64(header_.data());
        uint32_t copy_size = LoadU32(header_.data() + 8);
        header_.clear();
        if (offset > base_size_ || copy_size > base_size_ - offset) {
          return absl::DataLossError(absl::StrFormat(
              "Copy of %u bytes at offset %u exceeds base file of %u bytes",
              copy_size, offset, base_size_));
        }
        RETURN_IF_ERROR(CopyFromBase(offset, copy_size));
        state_ = State::kOpCode;
        break;
      }

      case State::kDone:
        return absl::DataLossError(absl::StrFormat(
            "%u bytes of trailing data after the end of the delta", size));
    }
  }
  return absl::OkStatus();
}

absl::Status DeltaApplier::Finish() {
  if (state_ != State::kDone) {
    return absl::DataLossError("Delta ended without end marker");
  }
  return absl::OkStatus();
}

bool DeltaApplier::GatherHeader(const char** data, size_t* size,
                                size_t needed) {
  size_t to_copy = std::min(*size, needed - header_.size());
  header_.append(*data, to_copy);
  *data += to_copy;
  *size -= to_copy;
  return header_.size() == needed;
}

absl::Status DeltaApplier::WriteOutput(const void* data, size_t size) {
  if (size > 0 && fwrite(data, 1, size, out_) != size) {
    return absl::ErrnoToStatus(errno, "fwrite() failed");
  }
  bytes_written_ += size;
  return absl::OkStatus();
}

absl::Status DeltaApplier::CopyFromBase(uint64_t offset, uint32_t size) {
  if (fseeko(base_, static_cast<off_t>(offset), SEEK_SET) != 0) {
    return absl::ErrnoToStatus(errno, "fseeko() failed");
  }
  while (size > 0) {
    size_t to_read = std::min<size_t>(size, kCopyBufferSize);
    copy_buffer_.resize(to_read);
    if (fread(copy_buffer_.data(), 1, to_read, base_) != to_read) {
      return MakeStatus("Failed to read %u bytes at offset %u of the base file",
                        to_read, offset);
    }
    RETURN_IF_ERROR(WriteOutput(copy_buffer_.data(), to_read));
    offset += to_read;
    size -= static_cast<uint32_t>(to_read);
  }
  return absl::OkStatus();
}

}  // namespace func_sync
