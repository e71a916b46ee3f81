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

#include "sync/sync_errors.h"

#include <string>

#include "sync/protos/messages.pb.h"

namespace func_sync {

absl::Status EncodeErrorPayload(const absl::Status& status, Buffer* payload) {
  ErrorInfo info;
  info.set_code(static_cast<int32_t>(status.code()));
  info.set_message(std::string(status.message()));

  size_t size = info.ByteSizeLong();
  payload->resize(size);
  if (size > 0 &&
      !info.SerializeToArray(payload->data(), static_cast<int>(size))) {
    return MakeStatus("Failed to serialize error info");
  }
  return absl::OkStatus();
}

absl::Status DecodeErrorPayload(const Buffer& payload,
                                absl::Status* remote_status) {
  ErrorInfo info;
  if (!info.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
    return ProtocolError("Failed to parse error payload of size %u",
                         payload.size());
  }

  absl::StatusCode code = static_cast<absl::StatusCode>(info.code());
  if (code == absl::StatusCode::kOk ||
      info.code() > static_cast<int32_t>(absl::StatusCode::kUnauthenticated) ||
      info.code() < 0) {
    // An error frame never reports success.
    code = absl::StatusCode::kUnknown;
  }
  *remote_status =
      SetTag(absl::Status(code, absl::StrCat("Remote: ", info.message())),
             Tag::kRemote);
  return absl::OkStatus();
}

}  // namespace func_sync
