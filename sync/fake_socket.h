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

#ifndef SYNC_FAKE_SOCKET_H_
#define SYNC_FAKE_SOCKET_H_

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "absl/status/status.h"
#include "sync/socket.h"

namespace func_sync {

// One direction of an in-process connection.
class FakePipe {
 public:
  FakePipe();
  ~FakePipe();

  absl::Status Write(const void* buffer, size_t size);
  absl::Status Read(void* buffer, size_t size, bool allow_partial_read,
                    size_t* bytes_read);

  // Closes the pipe. Readers still get the data written so far, then EOF.
  // Writers fail.
  void Close();

  // If set to true, blocks on Write() until it is set to false again.
  void SuspendWriting(bool suspended);

  // Makes Write() fail once more than |num_bytes| further bytes were written.
  void FailWritingAfter(size_t num_bytes);

  // Total number of bytes written.
  size_t BytesWritten();

 private:
  std::mutex data_mutex_;
  std::condition_variable data_cv_;
  std::string data_;
  bool closed_ = false;
  size_t bytes_written_ = 0;
  size_t fail_after_ = SIZE_MAX;

  bool writing_suspended_ = false;
  std::mutex suspend_mutex_;
  std::condition_variable suspend_cv_;
};

// Fake socket for tests. Either a loopback socket that receives the same data
// it sends, or one end of a connected pair created by CreatePair().
class FakeSocket : public Socket {
 public:
  // Loopback socket.
  FakeSocket();
  FakeSocket(std::shared_ptr<FakePipe> incoming,
             std::shared_ptr<FakePipe> outgoing);
  ~FakeSocket();

  // Creates two sockets where data sent on one is received on the other.
  static void CreatePair(std::unique_ptr<FakeSocket>* a,
                         std::unique_ptr<FakeSocket>* b);

  // Socket:
  absl::Status Send(const void* buffer, size_t size) override;  // thread-safe
  absl::Status Receive(void* buffer, size_t size, bool allow_partial_read,
                       size_t* bytes_received) override;  // thread-safe

  void ShutdownSendingEnd() override;

  // Closes both directions, like a dropped connection.
  void Disconnect();

  // If set to true, blocks on Send() until it is set to false again.
  void SuspendSending(bool suspended);

  // Makes Send() fail with an Unavailable error once more than |num_bytes|
  // further bytes were sent.
  void FailSendingAfter(size_t num_bytes);

  // Total number of bytes sent through this socket.
  size_t BytesSent();

 private:
  std::shared_ptr<FakePipe> incoming_;
  std::shared_ptr<FakePipe> outgoing_;
};

}  // namespace func_sync

#endif  // SYNC_FAKE_SOCKET_H_
