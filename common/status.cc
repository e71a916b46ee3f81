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

#include "common/status.h"

namespace func_sync {
namespace {

constexpr char kTagKey[] = "func_sync/tag";

// Tags are stored by name, so they survive reordering of the enum.
absl::optional<Tag> TagFromName(absl::string_view name) {
  for (int n = 0; n < static_cast<int>(Tag::kCount); ++n) {
    Tag tag = static_cast<Tag>(n);
    if (name == TagName(tag)) return tag;
  }
  return {};
}

}  // namespace

const char* TagName(Tag tag) {
  switch (tag) {
    case Tag::kSocketEof:
      return "socket_eof";
    case Tag::kHandshake:
      return "handshake";
    case Tag::kProtocol:
      return "protocol";
    case Tag::kTransport:
      return "transport";
    case Tag::kRemote:
      return "remote";
    case Tag::kCount:
      break;
  }
  return "<unknown>";
}

absl::Status SetTag(absl::Status status, Tag tag) {
  status.SetPayload(kTagKey, absl::Cord(TagName(tag)));
  return status;
}

bool HasTag(const absl::Status& status, Tag tag) {
  return GetTag(status) == tag;
}

absl::optional<Tag> GetTag(const absl::Status& status) {
  absl::optional<absl::Cord> payload = status.GetPayload(kTagKey);
  if (!payload.has_value()) return {};
  return TagFromName(std::string(payload.value()));
}

}  // namespace func_sync
