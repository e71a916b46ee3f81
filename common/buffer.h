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

#ifndef COMMON_BUFFER_H_
#define COMMON_BUFFER_H_

#include <cstddef>
#include <initializer_list>
#include <string>

#include "absl/strings/string_view.h"

namespace func_sync {

// Move-only byte buffer used for chunk payloads and wire data. Unlike
// std::vector<char>, resize() does not initialize new bytes, which matters
// when large blocks are read from files or sockets right after resizing.
class Buffer {
 public:
  Buffer();
  explicit Buffer(size_t size);
  Buffer(std::initializer_list<char> list);

  ~Buffer();

  Buffer(const Buffer& other) = delete;
  Buffer& operator=(const Buffer& other) = delete;

  Buffer(Buffer&& other) noexcept;
  Buffer& operator=(Buffer&& other) noexcept;

  bool operator==(const Buffer& other) const;
  bool operator!=(const Buffer& other) const;

  // Resizes the buffer. Grows the capacity by 1.5x the required size if it is
  // too small and keeps it otherwise. New bytes are not initialized.
  void resize(size_t new_size);

  // Makes sure the buffer capacity is at least the given number of bytes.
  void reserve(size_t capacity);

  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  size_t capacity() const { return capacity_; }

  // Resizes the buffer to 0 and keeps the allocation.
  void clear() { size_ = 0; }

  char* data() { return data_; }
  const char* data() const { return data_; }

  // Appends |data_size| bytes from |data|. The memory range must not overlap
  // with the buffer's data.
  void append(const void* data, size_t data_size);

  // Replaces the contents by |data_size| bytes from |data|.
  void assign(const void* data, size_t data_size);

  // Removes the first |count| bytes and moves the rest to the front.
  // Removes everything if |count| >= size().
  void erase_front(size_t count);

  // Returns a view of the contents. Invalidated by any modification.
  absl::string_view view() const { return absl::string_view(data_, size_); }

 private:
  char* data_ = nullptr;
  size_t size_ = 0;
  size_t capacity_ = 0;
};

}  // namespace func_sync

#endif  // COMMON_BUFFER_H_
