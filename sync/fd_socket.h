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

#ifndef SYNC_FD_SOCKET_H_
#define SYNC_FD_SOCKET_H_

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "sync/socket.h"

namespace func_sync {

// Socket over a pair of file descriptors, e.g. stdin/stdout of a process
// whose standard streams are piped to the peer. Does not own the descriptors,
// except that ShutdownSendingEnd() closes |out_fd|.
class FdSocket : public Socket {
 public:
  FdSocket(int in_fd, int out_fd);
  ~FdSocket();

  // Socket:
  absl::Status Send(const void* buffer, size_t size) override;
  absl::Status Receive(void* buffer, size_t size, bool allow_partial_read,
                       size_t* bytes_received) override;
  void ShutdownSendingEnd() override ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  int in_fd_;
  int out_fd_;

  absl::Mutex mutex_;
  bool send_closed_ ABSL_GUARDED_BY(mutex_) = false;
};

}  // namespace func_sync

#endif  // SYNC_FD_SOCKET_H_
