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

#include "sync/stream_demuxer.h"

#include <string>
#include <vector>

#include "common/log.h"
#include "common/path.h"
#include "common/status_test_macros.h"
#include "gtest/gtest.h"
#include "sync/byte_order.h"
#include "sync/dir_enumerator.h"
#include "sync/fake_socket.h"
#include "sync/rolling_delta.h"
#include "sync/sync_errors.h"
#include "sync/sync_report.h"

namespace func_sync {
namespace {

FileInfo MakeFile(const std::string& rel_path, uint64_t size) {
  FileInfo info;
  info.path = rel_path;
  info.size = size;
  info.mode = 0640;
  info.mtime_sec = 12345;
  info.mtime_nsec = 500;
  return info;
}

class StreamDemuxerTest : public ::testing::Test {
 public:
  void SetUp() override {
    Log::Initialize(std::make_unique<ConsoleLog>(LogLevel::kInfo));
    root_ = path::Join(::testing::TempDir(), "__stream_demuxer_unittest");
    EXPECT_OK(path::RemoveAll(root_));
    EXPECT_OK(path::CreateDirRec(root_));
  }

  void TearDown() override {
    EXPECT_OK(path::RemoveAll(root_));
    Log::Shutdown();
  }

 protected:
  void SendFrame(MessageType type, uint32_t stream_id,
                 const std::string& payload) {
    Buffer frame;
    ASSERT_OK(SerializeFrame(type, stream_id, payload.data(), payload.size(),
                             &frame));
    ASSERT_OK(socket_.Send(frame.data(), frame.size()));
  }

  void SendError(uint32_t stream_id, const absl::Status& status) {
    Buffer payload;
    ASSERT_OK(EncodeErrorPayload(status, &payload));
    SendFrame(MessageType::kError, stream_id,
              std::string(payload.data(), payload.size()));
  }

  void SendEnd() { SendFrame(MessageType::kEndOfExchange, 0, std::string()); }

  std::string ReadFile(const std::string& rel_path) {
    absl::StatusOr<std::string> data =
        path::ReadFile(path::Join(root_, rel_path));
    EXPECT_OK(data);
    return data.ok() ? *data : std::string();
  }

  // Returns the names of all entries in the root.
  std::vector<std::string> ListRoot() {
    std::vector<std::string> names;
    EXPECT_OK(WalkDirectory(root_)(
        [&names](const std::string&, const std::string& relative_path,
                 const path::Stats&, absl::Status) {
          names.push_back(relative_path);
          return absl::OkStatus();
        }));
    return names;
  }

  absl::Status Run() {
    StreamDemuxer demuxer(&reader_, root_, &manifest_, &report_writer_);
    for (const auto& [stream_id, kind] : expected_) {
      demuxer.ExpectStream(stream_id, kind);
    }
    for (uint32_t stream_id : forgotten_) demuxer.ForgetStream(stream_id);
    return demuxer.Run();
  }

  std::string root_;
  FakeSocket socket_;
  FrameReader reader_{&socket_};
  std::vector<FileInfo> manifest_;
  std::vector<std::pair<uint32_t, StreamKind>> expected_;
  std::vector<uint32_t> forgotten_;
  SyncReport report_;
  ReportWriter report_writer_{&report_};
};

TEST_F(StreamDemuxerTest, FullFile) {
  manifest_.push_back(MakeFile("a.txt", 5));
  expected_.emplace_back(0, StreamKind::kFull);
  SendFrame(MessageType::kFileData, 0, "hel");
  SendFrame(MessageType::kFileData, 0, "lo");
  SendFrame(MessageType::kFileData, 0, "");
  SendEnd();

  ASSERT_OK(Run());
  EXPECT_EQ(ReadFile("a.txt"), "hello");
  path::Stats stats;
  ASSERT_OK(path::GetStats(path::Join(root_, "a.txt"), &stats));
  EXPECT_EQ(stats.mode & 07777, 0640u);
  EXPECT_EQ(stats.mtime_sec, 12345);
  EXPECT_EQ(stats.mtime_nsec, 500u);

  EXPECT_EQ(report_.files_transferred, 1u);
  EXPECT_EQ(report_.bytes_transferred, 5u);
  EXPECT_TRUE(report_.file_errors.empty());
  EXPECT_EQ(ListRoot(), std::vector<std::string>({"a.txt"}));
}

TEST_F(StreamDemuxerTest, InterleavedStreams) {
  manifest_.push_back(MakeFile("a.txt", 2));
  manifest_.push_back(MakeFile("b.txt", 2));
  expected_.emplace_back(0, StreamKind::kFull);
  expected_.emplace_back(1, StreamKind::kFull);
  SendFrame(MessageType::kFileData, 1, "b");
  SendFrame(MessageType::kFileData, 0, "a");
  SendFrame(MessageType::kFileData, 1, "b");
  SendFrame(MessageType::kFileData, 0, "a");
  SendFrame(MessageType::kFileData, 0, "");
  SendFrame(MessageType::kFileData, 1, "");
  SendEnd();

  ASSERT_OK(Run());
  EXPECT_EQ(ReadFile("a.txt"), "aa");
  EXPECT_EQ(ReadFile("b.txt"), "bb");
  EXPECT_EQ(report_.files_transferred, 2u);
}

TEST_F(StreamDemuxerTest, Delta) {
  ASSERT_OK(path::WriteFile(path::Join(root_, "a.txt"), "base data"));
  manifest_.push_back(MakeFile("a.txt", 5));
  expected_.emplace_back(0, StreamKind::kDelta);

  Buffer delta;
  AppendU32(&delta, kDeltaMagic);
  AppendU8(&delta, static_cast<uint8_t>(DeltaOp::kCopy));
  AppendU64(&delta, 5);
  AppendU32(&delta, 4);
  AppendU8(&delta, static_cast<uint8_t>(DeltaOp::kLiteral));
  AppendU32(&delta, 1);
  delta.append("!", 1);
  AppendU8(&delta, static_cast<uint8_t>(DeltaOp::kEnd));

  // Split the delta in the middle of the copy op.
  std::string data(delta.data(), delta.size());
  SendFrame(MessageType::kDelta, 0, data.substr(0, 7));
  SendFrame(MessageType::kDelta, 0, data.substr(7));
  SendFrame(MessageType::kDelta, 0, "");
  SendEnd();

  ASSERT_OK(Run());
  EXPECT_EQ(ReadFile("a.txt"), "data!");
  EXPECT_EQ(report_.files_patched, 1u);
  EXPECT_EQ(report_.bytes_transferred, delta.size());
}

TEST_F(StreamDemuxerTest, BadDeltaIsFileError) {
  ASSERT_OK(path::WriteFile(path::Join(root_, "a.txt"), "base"));
  manifest_.push_back(MakeFile("a.txt", 4));
  manifest_.push_back(MakeFile("b.txt", 1));
  expected_.emplace_back(0, StreamKind::kDelta);
  expected_.emplace_back(1, StreamKind::kFull);
  SendFrame(MessageType::kDelta, 0, "XXXXXXXX");
  SendFrame(MessageType::kDelta, 0, "more");
  SendFrame(MessageType::kFileData, 1, "b");
  SendFrame(MessageType::kDelta, 0, "");
  SendFrame(MessageType::kFileData, 1, "");
  SendEnd();

  ASSERT_OK(Run());
  EXPECT_EQ(ReadFile("a.txt"), "base");
  EXPECT_EQ(ReadFile("b.txt"), "b");
  ASSERT_EQ(report_.file_errors.size(), 1u);
  EXPECT_EQ(report_.file_errors[0].stream_id, 0u);
  EXPECT_FALSE(report_.file_errors[0].remote);
  EXPECT_TRUE(absl::IsDataLoss(report_.file_errors[0].status));
  EXPECT_EQ(ListRoot(), std::vector<std::string>({"a.txt", "b.txt"}));
}

TEST_F(StreamDemuxerTest, MissingBaseFileIsFileError) {
  manifest_.push_back(MakeFile("a.txt", 4));
  expected_.emplace_back(0, StreamKind::kDelta);
  SendFrame(MessageType::kDelta, 0, "data");
  SendFrame(MessageType::kDelta, 0, "");
  SendEnd();

  ASSERT_OK(Run());
  ASSERT_EQ(report_.file_errors.size(), 1u);
  EXPECT_TRUE(absl::IsNotFound(report_.file_errors[0].status));
  EXPECT_TRUE(ListRoot().empty());
}

TEST_F(StreamDemuxerTest, SymlinkedParentIsFileError) {
  const std::string outside_dir = root_ + "_outside";
  ASSERT_OK(path::RemoveAll(outside_dir));
  ASSERT_OK(path::CreateDirRec(outside_dir));
  ASSERT_OK(path::CreateSymlink(outside_dir, path::Join(root_, "evil")));

  manifest_.push_back(MakeFile("evil/pwn.txt", 4));
  expected_.emplace_back(0, StreamKind::kFull);
  SendFrame(MessageType::kFileData, 0, "data");
  SendFrame(MessageType::kFileData, 0, "");
  SendEnd();

  ASSERT_OK(Run());
  ASSERT_EQ(report_.file_errors.size(), 1u);
  EXPECT_EQ(report_.file_errors[0].path, "evil/pwn.txt");
  EXPECT_ERROR_MSG(FailedPrecondition, "not a directory",
                   report_.file_errors[0].status);
  EXPECT_EQ(report_.files_transferred, 0u);

  std::vector<std::string> outside_entries;
  EXPECT_OK(WalkDirectory(outside_dir)(
      [&outside_entries](const std::string&, const std::string& relative_path,
                         const path::Stats&, absl::Status) {
        outside_entries.push_back(relative_path);
        return absl::OkStatus();
      }));
  EXPECT_TRUE(outside_entries.empty());
  EXPECT_OK(path::RemoveAll(outside_dir));
}

TEST_F(StreamDemuxerTest, RemoteStreamErrorDiscardsFile) {
  manifest_.push_back(MakeFile("a.txt", 10));
  expected_.emplace_back(0, StreamKind::kFull);
  SendFrame(MessageType::kFileData, 0, "partial");
  SendError(0, absl::PermissionDeniedError("no access"));
  SendEnd();

  ASSERT_OK(Run());
  EXPECT_TRUE(ListRoot().empty());
  ASSERT_EQ(report_.file_errors.size(), 1u);
  const FileError& error = report_.file_errors[0];
  EXPECT_EQ(error.path, "a.txt");
  EXPECT_TRUE(error.remote);
  EXPECT_TRUE(IsRemoteError(error.status));
  EXPECT_TRUE(absl::IsPermissionDenied(error.status));
}

TEST_F(StreamDemuxerTest, SessionErrorIsReturned) {
  SendError(kSessionStreamId, absl::InternalError("sender broke"));
  absl::Status status = Run();
  EXPECT_TRUE(IsRemoteError(status));
  EXPECT_ERROR_MSG(Internal, "sender broke", status);
}

TEST_F(StreamDemuxerTest, IncompleteStreamsAreFileErrors) {
  manifest_.push_back(MakeFile("a.txt", 10));
  manifest_.push_back(MakeFile("b.txt", 10));
  expected_.emplace_back(0, StreamKind::kFull);
  expected_.emplace_back(1, StreamKind::kFull);
  SendFrame(MessageType::kFileData, 0, "partial");
  SendEnd();

  ASSERT_OK(Run());
  EXPECT_TRUE(ListRoot().empty());
  ASSERT_EQ(report_.file_errors.size(), 2u);
  for (const FileError& error : report_.file_errors) {
    EXPECT_ERROR_MSG(DataLoss, "Transfer incomplete", error.status);
    EXPECT_FALSE(error.remote);
  }
}

TEST_F(StreamDemuxerTest, ForgottenStreamIsNotIncomplete) {
  manifest_.push_back(MakeFile("a.txt", 10));
  expected_.emplace_back(0, StreamKind::kDelta);
  forgotten_.push_back(0);
  SendEnd();

  ASSERT_OK(Run());
  EXPECT_TRUE(report_.file_errors.empty());
}

TEST_F(StreamDemuxerTest, UnknownStreamIsProtocolError) {
  manifest_.push_back(MakeFile("a.txt", 1));
  SendFrame(MessageType::kFileData, 0, "a");
  EXPECT_TRUE(IsProtocolError(Run()));
}

TEST_F(StreamDemuxerTest, WrongKindIsProtocolError) {
  manifest_.push_back(MakeFile("a.txt", 1));
  expected_.emplace_back(0, StreamKind::kFull);
  SendFrame(MessageType::kDelta, 0, "a");
  EXPECT_TRUE(IsProtocolError(Run()));
}

TEST_F(StreamDemuxerTest, SignatureFromSenderIsProtocolError) {
  manifest_.push_back(MakeFile("a.txt", 1));
  expected_.emplace_back(0, StreamKind::kFull);
  SendFrame(MessageType::kSignature, 0, "a");
  EXPECT_TRUE(IsProtocolError(Run()));
}

TEST_F(StreamDemuxerTest, DataAfterEndIsProtocolError) {
  manifest_.push_back(MakeFile("a.txt", 1));
  expected_.emplace_back(0, StreamKind::kFull);
  SendFrame(MessageType::kFileData, 0, "a");
  SendFrame(MessageType::kFileData, 0, "");
  SendFrame(MessageType::kFileData, 0, "b");
  EXPECT_TRUE(IsProtocolError(Run()));
  EXPECT_EQ(ReadFile("a.txt"), "a");
}

TEST_F(StreamDemuxerTest, ConnectionLossRemovesTempFiles) {
  manifest_.push_back(MakeFile("a.txt", 10));
  expected_.emplace_back(0, StreamKind::kFull);
  SendFrame(MessageType::kFileData, 0, "partial");
  socket_.ShutdownSendingEnd();

  EXPECT_TRUE(IsTransportError(Run()));
  EXPECT_TRUE(ListRoot().empty());
}

}  // namespace
}  // namespace func_sync
