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

#include <cstring>

#include "gtest/gtest.h"

namespace func_sync {
namespace {

TEST(BufferTest, ConstructDefault) {
  Buffer b;
  EXPECT_EQ(b.size(), 0);
  EXPECT_EQ(b.data(), nullptr);
  EXPECT_TRUE(b.empty());
}

TEST(BufferTest, ConstructWithSize) {
  Buffer b(32);
  EXPECT_EQ(b.size(), 32);
  EXPECT_EQ(b.capacity(), 32);
  ASSERT_NE(b.data(), nullptr);
  memset(b.data(), 0, b.size());
}

TEST(BufferTest, MoveLeavesSourceEmpty) {
  Buffer b({'a', 'b'});
  Buffer b2(std::move(b));
  EXPECT_EQ(b.size(), 0);
  EXPECT_EQ(b.data(), nullptr);
  EXPECT_EQ(b2.view(), "ab");

  Buffer b3({'x'});
  b3 = std::move(b2);
  EXPECT_EQ(b3.view(), "ab");
  EXPECT_TRUE(b2.empty());
}

TEST(BufferTest, EqualsOperator) {
  EXPECT_TRUE(Buffer({1}) == Buffer({1}));
  EXPECT_TRUE(Buffer({1}) != Buffer({2}));
  EXPECT_TRUE(Buffer() == Buffer());
}

TEST(BufferTest, GrowKeepsData) {
  Buffer b(8);
  memcpy(b.data(), "01234567", 8);

  b.resize(10);
  EXPECT_EQ(b.size(), 10);
  EXPECT_EQ(b.capacity(), 15);
  EXPECT_EQ(memcmp(b.data(), "01234567", 8), 0);

  b.resize(2);
  EXPECT_EQ(b.capacity(), 15);
  EXPECT_EQ(b.view(), "01");
}

TEST(BufferTest, AppendAndAssign) {
  Buffer b;
  b.append("9", 1);
  b.append("123", 3);
  EXPECT_EQ(b.view(), "9123");

  b.assign("xy", 2);
  EXPECT_EQ(b.view(), "xy");
}

TEST(BufferTest, EraseFront) {
  Buffer b;
  b.append("header:payload", 14);
  b.erase_front(7);
  EXPECT_EQ(b.view(), "payload");

  b.erase_front(100);
  EXPECT_TRUE(b.empty());
}

}  // namespace
}  // namespace func_sync
