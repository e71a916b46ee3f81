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

#include "common/status_macros.h"
#include "common/status_test_macros.h"
#include "gtest/gtest.h"

namespace func_sync {
namespace {

absl::Status FailTagged() {
  RETURN_TAGGED_IF_ERROR(Tag::kTransport, absl::UnavailableError("gone"),
                         "Failed to send %u bytes", 5u);
  return absl::OkStatus();
}

TEST(StatusTest, WrapStatusKeepsCodeAndTag) {
  absl::Status status =
      SetTag(absl::DataLossError("bad record"), Tag::kProtocol);
  absl::Status wrapped = WrapStatus(status, "Failed to read file %i", 3);
  EXPECT_ERROR_MSG(DataLoss, "bad record; Failed to read file 3", wrapped);
  EXPECT_TAG(kProtocol, wrapped);
}

TEST(StatusTest, WrapOkStatusIsOk) {
  EXPECT_OK(WrapStatus(absl::OkStatus(), "never shown"));
}

TEST(StatusTest, GetTag) {
  EXPECT_FALSE(GetTag(absl::InternalError("x")).has_value());
  absl::Status status = SetTag(absl::InternalError("x"), Tag::kHandshake);
  ASSERT_TRUE(GetTag(status).has_value());
  EXPECT_EQ(*GetTag(status), Tag::kHandshake);
  EXPECT_FALSE(HasTag(status, Tag::kRemote));

  // Tags are overwritten.
  status = SetTag(status, Tag::kRemote);
  EXPECT_TAG(kRemote, status);
  EXPECT_FALSE(HasTag(status, Tag::kHandshake));
}

TEST(StatusTest, SetTagOnOkIsNoop) {
  EXPECT_FALSE(GetTag(SetTag(absl::OkStatus(), Tag::kRemote)).has_value());
}

TEST(StatusTest, ReturnTaggedIfError) {
  absl::Status status = FailTagged();
  EXPECT_ERROR_MSG(Unavailable, "gone; Failed to send 5 bytes", status);
  EXPECT_TAG(kTransport, status);
}

TEST(StatusTest, TagName) {
  EXPECT_STREQ(TagName(Tag::kSocketEof), "socket_eof");
  EXPECT_STREQ(TagName(Tag::kTransport), "transport");
}

}  // namespace
}  // namespace func_sync
