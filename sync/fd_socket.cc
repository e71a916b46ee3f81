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

#include "sync/fd_socket.h"

#include <errno.h>
#include <unistd.h>

#include <cstring>

#include "common/log.h"
#include "common/status.h"

namespace func_sync {

FdSocket::FdSocket(int in_fd, int out_fd) : in_fd_(in_fd), out_fd_(out_fd) {}

FdSocket::~FdSocket() = default;

absl::Status FdSocket::Send(const void* buffer, size_t size) {
  {
    absl::MutexLock lock(&mutex_);
    if (send_closed_) {
      return absl::FailedPreconditionError("Sending end is shut down");
    }
  }

  const char* curr = static_cast<const char*>(buffer);
  while (size > 0) {
    ssize_t written = write(out_fd_, curr, size);
    if (written < 0) {
      if (errno == EINTR) continue;
      return absl::ErrnoToStatus(errno, "write() failed");
    }
    curr += written;
    size -= static_cast<size_t>(written);
  }
  return absl::OkStatus();
}

absl::Status FdSocket::Receive(void* buffer, size_t size,
                               bool allow_partial_read,
                               size_t* bytes_received) {
  *bytes_received = 0;
  if (size == 0) return absl::OkStatus();

  char* curr = static_cast<char*>(buffer);
  while (*bytes_received < size) {
    ssize_t num_read = read(in_fd_, curr, size - *bytes_received);
    if (num_read < 0) {
      if (errno == EINTR) continue;
      return absl::ErrnoToStatus(errno, "read() failed");
    }
    if (num_read == 0) {
      LOG_DEBUG("EOF after %u of %u bytes", *bytes_received, size);
      return SetTag(absl::UnavailableError("Connection closed by peer"),
                    Tag::kSocketEof);
    }
    curr += num_read;
    *bytes_received += static_cast<size_t>(num_read);
    if (allow_partial_read) break;
  }
  return absl::OkStatus();
}

void FdSocket::ShutdownSendingEnd() {
  absl::MutexLock lock(&mutex_);
  if (send_closed_) return;
  send_closed_ = true;
  if (close(out_fd_) != 0) {
    LOG_WARNING("Failed to close descriptor %i: %s", out_fd_,
                strerror(errno));
  }
}

}  // namespace func_sync
