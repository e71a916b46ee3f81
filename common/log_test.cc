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

#include "common/log.h"

#include <string>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "common/path.h"
#include "common/status_test_macros.h"
#include "gtest/gtest.h"

namespace func_sync {
namespace {

constexpr char kLogMessage[] = "Test log";

class TestLog : public Log {
 public:
  explicit TestLog(LogLevel log_level) : Log(log_level) {}

  const LogRecord& last_record() const { return last_record_; }
  const std::string& last_prefix() const { return last_prefix_; }

 protected:
  void WriteLogMessage(const LogRecord& record) override {
    last_record_ = record;
    last_prefix_ = FormatPrefix(record);
  }

 private:
  LogRecord last_record_{LogLevel::kVerbose, "", 0, "", ""};
  std::string last_prefix_;
};

class LogTest : public ::testing::Test {
 public:
  void SetUp() override {
    Log::Initialize(std::make_unique<TestLog>(LogLevel::kInfo));
  }

  void TearDown() override { Log::Shutdown(); }

 protected:
  TestLog* Log() const { return static_cast<TestLog*>(Log::Instance()); }
};

TEST_F(LogTest, LogFormattedMessage) {
  LOG_WARNING("Sent %u bytes for '%s'", 123u, "a.txt");
  const LogRecord& record = Log()->last_record();
  EXPECT_EQ(record.message, "Sent 123 bytes for 'a.txt'");
  EXPECT_EQ(record.level, LogLevel::kWarning);
  EXPECT_STREQ(record.file, "log_test.cc");
  EXPECT_GT(record.line, 0);
  EXPECT_STREQ(record.func, "TestBody");
}

TEST_F(LogTest, IgnoresBelowLogLevel) {
  LOG_DEBUG(kLogMessage);
  EXPECT_EQ(Log()->last_record().message, "");

  Log()->SetLogLevel(LogLevel::kDebug);
  LOG_DEBUG(kLogMessage);
  EXPECT_EQ(Log()->last_record().message, kLogMessage);
}

TEST_F(LogTest, PrefixContainsTag) {
  LOG_INFO(kLogMessage);
  EXPECT_TRUE(absl::StartsWith(Log()->last_prefix(), "INFO    log_test.cc("))
      << Log()->last_prefix();

  Log()->SetTag("receive");
  LOG_ERROR(kLogMessage);
  EXPECT_TRUE(
      absl::StartsWith(Log()->last_prefix(), "[receive] ERROR   log_test.cc("))
      << Log()->last_prefix();
}

TEST(LogLevelTest, VerbosityToLogLevel) {
  EXPECT_EQ(Log::VerbosityToLogLevel(-1), LogLevel::kWarning);
  EXPECT_EQ(Log::VerbosityToLogLevel(0), LogLevel::kWarning);
  EXPECT_EQ(Log::VerbosityToLogLevel(1), LogLevel::kWarning);
  EXPECT_EQ(Log::VerbosityToLogLevel(2), LogLevel::kInfo);
  EXPECT_EQ(Log::VerbosityToLogLevel(3), LogLevel::kDebug);
  EXPECT_EQ(Log::VerbosityToLogLevel(4), LogLevel::kVerbose);
  EXPECT_EQ(Log::VerbosityToLogLevel(5), LogLevel::kVerbose);
}

TEST(LogLevelTest, Names) {
  EXPECT_STREQ(LogLevelName(LogLevel::kVerbose), "VERBOSE");
  EXPECT_STREQ(LogLevelName(LogLevel::kWarning), "WARNING");
}

TEST(FileLogTest, AppendsToFile) {
  std::string log_path =
      path::Join(::testing::TempDir(), "__func_sync_log_test.log");
  if (path::Exists(log_path)) EXPECT_OK(path::RemoveFile(log_path));

  auto log = std::make_unique<FileLog>(LogLevel::kInfo, log_path);
  EXPECT_TRUE(log->IsOpen());
  log->SetTag("send");
  Log::Initialize(std::move(log));
  LOG_ERROR("Error");
  LOG_DEBUG("Debug");
  Log::Shutdown();

  // A second session appends.
  Log::Initialize(std::make_unique<FileLog>(LogLevel::kInfo, log_path));
  LOG_INFO("Info");
  Log::Shutdown();

  absl::StatusOr<std::string> contents = path::ReadFile(log_path);
  ASSERT_OK(contents);
  std::vector<std::string> lines =
      absl::StrSplit(*contents, '\n', absl::SkipEmpty());
  ASSERT_EQ(lines.size(), 2);

  EXPECT_TRUE(absl::StrContains(lines[0], "[send] ERROR")) << lines[0];
  EXPECT_TRUE(absl::StrContains(lines[0], "log_test.cc")) << lines[0];
  EXPECT_TRUE(absl::StrContains(lines[0], "Error")) << lines[0];

  EXPECT_TRUE(absl::StrContains(lines[1], "INFO")) << lines[1];
  EXPECT_FALSE(absl::StrContains(lines[1], "[send]")) << lines[1];
  EXPECT_TRUE(absl::StrContains(lines[1], "Info")) << lines[1];

  // Date and time prefix.
  int yy, mo, da, hh, mm, ss, msec;
  EXPECT_EQ(sscanf(lines[0].c_str(), "%d-%d-%d %d:%d:%d.%d", &yy, &mo, &da, &hh,
                   &mm, &ss, &msec),
            7)
      << lines[0];

  EXPECT_OK(path::RemoveFile(log_path));
}

TEST(FileLogTest, UnwritablePath) {
  FileLog log(LogLevel::kInfo, path::Join(::testing::TempDir(),
                                          "does_not_exist", "x.log"));
  EXPECT_FALSE(log.IsOpen());
}

TEST(NoLogTest, LoggingWithoutLogDoesNotCrash) {
  LOG_ERROR("No log installed: %d", 1);
  LOG_DEBUG("Dropped");
}

}  // namespace
}  // namespace func_sync
