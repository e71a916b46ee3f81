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

#ifndef COMMON_STATUS_TEST_MACROS_H_
#define COMMON_STATUS_TEST_MACROS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "common/status.h"
#include "gtest/gtest.h"

namespace func_sync {
namespace status_testing {

template <class T>
const absl::Status& ToStatus(const absl::StatusOr<T>& result) {
  return result.status();
}
inline const absl::Status& ToStatus(const absl::Status& status) {
  return status;
}

inline ::testing::AssertionResult StatusIsOk(const char* expr,
                                             const absl::Status& status) {
  if (status.ok()) return ::testing::AssertionSuccess();
  return ::testing::AssertionFailure()
         << expr << " failed: " << status.ToString();
}

inline ::testing::AssertionResult StatusIsNotOk(const char* expr,
                                                const absl::Status& status) {
  if (!status.ok()) return ::testing::AssertionSuccess();
  return ::testing::AssertionFailure() << expr << " unexpectedly succeeded";
}

// Succeeds if |status| has |code| and, if |msg| is not empty, its message
// contains |msg|.
inline ::testing::AssertionResult StatusHasCode(const char* code_expr,
                                                const char* /*msg_expr*/,
                                                const char* expr,
                                                absl::StatusCode code,
                                                absl::string_view msg,
                                                const absl::Status& status) {
  if (status.code() != code) {
    return ::testing::AssertionFailure()
           << expr << " returned '" << status.ToString() << "', expected "
           << code_expr;
  }
  if (status.message().find(msg) == absl::string_view::npos) {
    return ::testing::AssertionFailure()
           << expr << " returned message '" << status.message()
           << "', expected it to contain '" << msg << "'";
  }
  return ::testing::AssertionSuccess();
}

inline ::testing::AssertionResult StatusHasTag(const char* tag_expr,
                                               const char* expr, Tag tag,
                                               const absl::Status& status) {
  if (HasTag(status, tag)) return ::testing::AssertionSuccess();
  return ::testing::AssertionFailure()
         << expr << " returned '" << status.ToString() << "', expected tag "
         << tag_expr;
}

}  // namespace status_testing
}  // namespace func_sync

// Status checks for gTest. |x| may be an absl::Status or an absl::StatusOr.
#define EXPECT_OK(x)                                            \
  EXPECT_PRED_FORMAT1(::func_sync::status_testing::StatusIsOk, \
                      ::func_sync::status_testing::ToStatus(x))
#define ASSERT_OK(x)                                            \
  ASSERT_PRED_FORMAT1(::func_sync::status_testing::StatusIsOk, \
                      ::func_sync::status_testing::ToStatus(x))

#define EXPECT_NOT_OK(x)                                           \
  EXPECT_PRED_FORMAT1(::func_sync::status_testing::StatusIsNotOk, \
                      ::func_sync::status_testing::ToStatus(x))
#define ASSERT_NOT_OK(x)                                           \
  ASSERT_PRED_FORMAT1(::func_sync::status_testing::StatusIsNotOk, \
                      ::func_sync::status_testing::ToStatus(x))

// |code| is an absl::StatusCode without the k prefix, e.g. Cancelled.
// EXPECT_ERROR_MSG also requires the message to contain |msg|.
#define EXPECT_ERROR(code, x) EXPECT_ERROR_MSG(code, "", x)
#define ASSERT_ERROR(code, x) ASSERT_ERROR_MSG(code, "", x)
#define EXPECT_ERROR_MSG(code, msg, x)                                 \
  EXPECT_PRED_FORMAT3(::func_sync::status_testing::StatusHasCode,     \
                      ::absl::StatusCode::k##code, msg,               \
                      ::func_sync::status_testing::ToStatus(x))
#define ASSERT_ERROR_MSG(code, msg, x)                                 \
  ASSERT_PRED_FORMAT3(::func_sync::status_testing::StatusHasCode,     \
                      ::absl::StatusCode::k##code, msg,               \
                      ::func_sync::status_testing::ToStatus(x))

// |tag| is a func_sync::Tag value, e.g. kTransport.
#define EXPECT_TAG(tag, x)                                         \
  EXPECT_PRED_FORMAT2(::func_sync::status_testing::StatusHasTag,  \
                      ::func_sync::Tag::tag,                      \
                      ::func_sync::status_testing::ToStatus(x))
#define ASSERT_TAG(tag, x)                                         \
  ASSERT_PRED_FORMAT2(::func_sync::status_testing::StatusHasTag,  \
                      ::func_sync::Tag::tag,                      \
                      ::func_sync::status_testing::ToStatus(x))

#endif  // COMMON_STATUS_TEST_MACROS_H_
