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

#include "common/buffer.h"

#include <cstdlib>
#include <cstring>
#include <utility>

namespace func_sync {

Buffer::Buffer() = default;

Buffer::Buffer(size_t size) { resize(size); }

Buffer::Buffer(std::initializer_list<char> list) {
  assign(list.begin(), list.size());
}

Buffer::Buffer(Buffer&& other) noexcept { *this = std::move(other); }

Buffer& Buffer::operator=(Buffer&& other) noexcept {
  if (this == &other) return *this;
  free(data_);

  data_ = std::exchange(other.data_, nullptr);
  size_ = std::exchange(other.size_, 0);
  capacity_ = std::exchange(other.capacity_, 0);
  return *this;
}

Buffer::~Buffer() { free(data_); }

bool Buffer::operator==(const Buffer& other) const {
  return size_ == other.size_ &&
         (size_ == 0 || memcmp(data_, other.data_, size_) == 0);
}

bool Buffer::operator!=(const Buffer& other) const { return !(*this == other); }

void Buffer::resize(size_t new_size) {
  if (capacity_ < new_size) {
    // Exact fit for the first allocation, 1.5x slack for growing buffers.
    reserve(capacity_ == 0 ? new_size : new_size + new_size / 2);
  }
  size_ = new_size;
}

void Buffer::reserve(size_t capacity) {
  if (capacity_ >= capacity) return;
  data_ = static_cast<char*>(realloc(data_, capacity));
  capacity_ = capacity;
}

void Buffer::append(const void* data, size_t data_size) {
  if (data_size == 0) return;
  size_t prev_size = size_;
  resize(prev_size + data_size);
  memcpy(data_ + prev_size, data, data_size);
}

void Buffer::assign(const void* data, size_t data_size) {
  clear();
  append(data, data_size);
}

void Buffer::erase_front(size_t count) {
  if (count >= size_) {
    size_ = 0;
    return;
  }
  memmove(data_, data_ + count, size_ - count);
  size_ -= count;
}

}  // namespace func_sync
