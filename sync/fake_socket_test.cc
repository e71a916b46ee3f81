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

#include <cstring>
#include <thread>

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "common/status.h"
#include "common/status_test_macros.h"
#include "gtest/gtest.h"

namespace func_sync {
namespace {

class FakeSocketTest : public ::testing::Test {
 public:
  void SetUp() override { FakeSocket::CreatePair(&a_, &b_); }

 protected:
  std::unique_ptr<FakeSocket> a_;
  std::unique_ptr<FakeSocket> b_;
};

TEST_F(FakeSocketTest, Loopback) {
  FakeSocket socket;
  EXPECT_OK(socket.Send("abc", 3));
  char buffer[3];
  size_t bytes_received;
  EXPECT_OK(socket.Receive(buffer, 3, /*allow_partial_read=*/false,
                           &bytes_received));
  EXPECT_EQ(memcmp(buffer, "abc", 3), 0);
}

TEST_F(FakeSocketTest, PairIsConnected) {
  EXPECT_OK(a_->Send("to b", 4));
  EXPECT_OK(b_->Send("to a", 4));
  EXPECT_EQ(a_->BytesSent(), 4u);

  char buffer[4];
  size_t bytes_received;
  EXPECT_OK(b_->Receive(buffer, 4, /*allow_partial_read=*/false,
                        &bytes_received));
  EXPECT_EQ(memcmp(buffer, "to b", 4), 0);
  EXPECT_OK(a_->Receive(buffer, 4, /*allow_partial_read=*/true,
                        &bytes_received));
  EXPECT_EQ(memcmp(buffer, "to a", 4), 0);
}

TEST_F(FakeSocketTest, ShutdownSendingEndDeliversPendingData) {
  EXPECT_OK(a_->Send("ab", 2));
  a_->ShutdownSendingEnd();
  EXPECT_NOT_OK(a_->Send("c", 1));

  char buffer[2];
  size_t bytes_received;
  EXPECT_OK(b_->Receive(buffer, 2, /*allow_partial_read=*/false,
                        &bytes_received));
  absl::Status status = b_->Receive(buffer, 1, /*allow_partial_read=*/true,
                                    &bytes_received);
  EXPECT_TRUE(HasTag(status, Tag::kSocketEof));

  // The other direction stays open.
  EXPECT_OK(b_->Send("x", 1));
}

TEST_F(FakeSocketTest, Disconnect) {
  a_->Disconnect();
  EXPECT_NOT_OK(a_->Send("a", 1));
  EXPECT_NOT_OK(b_->Send("b", 1));
}

TEST_F(FakeSocketTest, FailSendingAfter) {
  a_->FailSendingAfter(5);
  EXPECT_OK(a_->Send("abc", 3));
  EXPECT_ERROR(Unavailable, a_->Send("def", 3));
  EXPECT_OK(a_->Send("de", 2));
  EXPECT_EQ(a_->BytesSent(), 5u);
}

TEST_F(FakeSocketTest, SuspendSending) {
  a_->SuspendSending(true);
  std::thread sender([this]() { EXPECT_OK(a_->Send("a", 1)); });
  absl::SleepFor(absl::Milliseconds(10));
  EXPECT_EQ(a_->BytesSent(), 0u);
  a_->SuspendSending(false);
  sender.join();
  EXPECT_EQ(a_->BytesSent(), 1u);
}

}  // namespace
}  // namespace func_sync
