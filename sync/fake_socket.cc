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

#include "sync/fake_socket.h"

#include <algorithm>
#include <cstring>

#include "common/status.h"

namespace func_sync {

FakePipe::FakePipe() = default;

FakePipe::~FakePipe() = default;

absl::Status FakePipe::Write(const void* buffer, size_t size) {
  // Wait until we can send again.
  std::unique_lock<std::mutex> suspend_lock(suspend_mutex_);
  suspend_cv_.wait(suspend_lock, [this]() { return !writing_suspended_; });
  suspend_lock.unlock();

  std::unique_lock<std::mutex> lock(data_mutex_);
  if (closed_) {
    return absl::UnavailableError("Pipe is closed");
  }
  if (size > fail_after_) {
    return absl::UnavailableError("Connection reset");
  }
  if (fail_after_ != SIZE_MAX) fail_after_ -= size;
  data_.append(static_cast<const char*>(buffer), size);
  bytes_written_ += size;
  lock.unlock();
  data_cv_.notify_all();
  return absl::OkStatus();
}

absl::Status FakePipe::Read(void* buffer, size_t size, bool allow_partial_read,
                            size_t* bytes_read) {
  *bytes_read = 0;
  std::unique_lock<std::mutex> lock(data_mutex_);
  data_cv_.wait(lock, [this, size, allow_partial_read]() {
    size_t min_size = allow_partial_read ? 1 : size;
    return data_.size() >= min_size || closed_;
  });
  size_t min_size = allow_partial_read ? 1 : size;
  if (data_.size() < min_size) {
    return SetTag(absl::UnavailableError("Pipe is shut down"),
                  Tag::kSocketEof);
  }
  size_t to_copy = std::min(size, data_.size());
  memcpy(buffer, data_.data(), to_copy);
  *bytes_read = to_copy;

  // This is horribly inefficent, but should be OK in a fake.
  data_.erase(0, to_copy);
  return absl::OkStatus();
}

void FakePipe::Close() {
  std::unique_lock<std::mutex> lock(data_mutex_);
  closed_ = true;
  lock.unlock();
  data_cv_.notify_all();
}

void FakePipe::SuspendWriting(bool suspended) {
  std::unique_lock<std::mutex> lock(suspend_mutex_);
  writing_suspended_ = suspended;
  lock.unlock();
  suspend_cv_.notify_all();
}

void FakePipe::FailWritingAfter(size_t num_bytes) {
  std::lock_guard<std::mutex> lock(data_mutex_);
  fail_after_ = num_bytes;
}

size_t FakePipe::BytesWritten() {
  std::lock_guard<std::mutex> lock(data_mutex_);
  return bytes_written_;
}

FakeSocket::FakeSocket() {
  incoming_ = std::make_shared<FakePipe>();
  outgoing_ = incoming_;
}

FakeSocket::FakeSocket(std::shared_ptr<FakePipe> incoming,
                       std::shared_ptr<FakePipe> outgoing)
    : incoming_(std::move(incoming)), outgoing_(std::move(outgoing)) {}

FakeSocket::~FakeSocket() = default;

// static
void FakeSocket::CreatePair(std::unique_ptr<FakeSocket>* a,
                            std::unique_ptr<FakeSocket>* b) {
  auto a_to_b = std::make_shared<FakePipe>();
  auto b_to_a = std::make_shared<FakePipe>();
  *a = std::make_unique<FakeSocket>(b_to_a, a_to_b);
  *b = std::make_unique<FakeSocket>(a_to_b, b_to_a);
}

absl::Status FakeSocket::Send(const void* buffer, size_t size) {
  return outgoing_->Write(buffer, size);
}

absl::Status FakeSocket::Receive(void* buffer, size_t size,
                                 bool allow_partial_read,
                                 size_t* bytes_received) {
  return incoming_->Read(buffer, size, allow_partial_read, bytes_received);
}

void FakeSocket::ShutdownSendingEnd() { outgoing_->Close(); }

void FakeSocket::Disconnect() {
  outgoing_->Close();
  incoming_->Close();
}

void FakeSocket::SuspendSending(bool suspended) {
  outgoing_->SuspendWriting(suspended);
}

void FakeSocket::FailSendingAfter(size_t num_bytes) {
  outgoing_->FailWritingAfter(num_bytes);
}

size_t FakeSocket::BytesSent() { return outgoing_->BytesWritten(); }

}  // namespace func_sync
