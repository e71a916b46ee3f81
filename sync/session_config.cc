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

#include "sync/session_config.h"

#include <thread>

#include "absl/strings/str_format.h"

namespace func_sync {

size_t DefaultNumWorkers() {
  // hardware_concurrency() returns 0 if the value is not computable.
  return std::thread::hardware_concurrency() + 1;
}

absl::Status SessionConfig::Validate() const {
  if (num_workers == 0) {
    return absl::InvalidArgumentError("Number of workers must be positive");
  }
  if (max_protocol_version < kMinProtocolVersion ||
      max_protocol_version > kProtocolVersion) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Protocol version %u is not in the supported range [%u, %u]",
        max_protocol_version, kMinProtocolVersion, kProtocolVersion));
  }
  if (magic.size() != kMagicSize) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Magic must be %u bytes", kMagicSize));
  }
  return absl::OkStatus();
}

HandshakeOptions SessionConfig::GetHandshakeOptions() const {
  HandshakeOptions options;
  options.magic = magic;
  options.max_version = max_protocol_version;
  return options;
}

}  // namespace func_sync
