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

#ifndef SYNC_BYTE_ORDER_H_
#define SYNC_BYTE_ORDER_H_

#include <cstdint>

#include "common/buffer.h"

namespace func_sync {

// All multi-byte integers on the wire are big-endian.

inline void AppendU8(Buffer* out, uint8_t value) { out->append(&value, 1); }

inline void AppendU16(Buffer* out, uint16_t value) {
  uint8_t bytes[] = {static_cast<uint8_t>(value >> 8),
                     static_cast<uint8_t>(value)};
  out->append(bytes, sizeof(bytes));
}

inline void AppendU32(Buffer* out, uint32_t value) {
  uint8_t bytes[] = {
      static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
      static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value)};
  out->append(bytes, sizeof(bytes));
}

inline void AppendU64(Buffer* out, uint64_t value) {
  AppendU32(out, static_cast<uint32_t>(value >> 32));
  AppendU32(out, static_cast<uint32_t>(value));
}

inline uint16_t LoadU16(const void* data) {
  const uint8_t* p = static_cast<const uint8_t*>(data);
  return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t LoadU32(const void* data) {
  const uint8_t* p = static_cast<const uint8_t*>(data);
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

inline uint64_t LoadU64(const void* data) {
  const uint8_t* p = static_cast<const uint8_t*>(data);
  return (static_cast<uint64_t>(LoadU32(p)) << 32) | LoadU32(p + 4);
}

}  // namespace func_sync

#endif  // SYNC_BYTE_ORDER_H_
