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

#include "func_sync/sync_config.h"

#include <algorithm>
#include <memory>
#include <sstream>

#include "absl/flags/flag.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "common/path.h"
#include "common/status_macros.h"
#include "json/json.h"

ABSL_FLAG(std::string, mode, "",
          "Session end to run over stdin/stdout, 'send' or 'receive'");
ABSL_FLAG(std::string, dir, "",
          "Directory to send from or to make match the sender's directory");
ABSL_FLAG(int, num_workers, 0,
          "Number of threads that read, hash and diff files. 0 uses the "
          "number of hardware threads + 1");
ABSL_FLAG(int, chunk_queue_capacity, 1,
          "Max number of chunks waiting to be written to the connection. 0 "
          "hands every chunk directly to the writer");
ABSL_FLAG(bool, delete_extraneous, true,
          "Receiver only: delete files that are not present on the sender");
ABSL_FLAG(int, verbosity, 2, "Verbosity of the log output");
ABSL_FLAG(std::string, log_file, "",
          "File to write the log to. Logs to stderr if empty");

namespace func_sync {

SyncConfig::SyncConfig() {
  mode_ = absl::GetFlag(FLAGS_mode);
  dir_ = absl::GetFlag(FLAGS_dir);
  int num_workers = absl::GetFlag(FLAGS_num_workers);
  if (num_workers > 0) session_cfg_.num_workers = num_workers;
  session_cfg_.chunk_queue_capacity =
      std::max(absl::GetFlag(FLAGS_chunk_queue_capacity), 0);
  session_cfg_.delete_extraneous = absl::GetFlag(FLAGS_delete_extraneous);
  verbosity_ = absl::GetFlag(FLAGS_verbosity);
  log_file_ = absl::GetFlag(FLAGS_log_file);
}

SyncConfig::~SyncConfig() = default;

absl::Status SyncConfig::LoadFromFile(const std::string& path) {
  std::string data;
  ASSIGN_OR_RETURN(data, path::ReadFile(path));

  Json::Value config;
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  if (!reader->parse(data.data(), data.data() + data.size(), &config,
                     &errors)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Failed to parse config file '%s': %s", path, errors));
  }
  if (!config.isObject()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Config file '%s' is not a JSON object", path));
  }

#define ASSIGN_VAR(var, flag, type, value_type)                  \
  do {                                                            \
    if (config.isMember(#flag)) {                                 \
      if (config[#flag].isConvertibleTo(Json::value_type)) {      \
        var = config[#flag].as##type();                           \
        flags_read_from_file_.insert(#flag);                      \
      } else {                                                    \
        flag_read_errors_[#flag] = "Expected " #value_type;       \
      }                                                           \
    }                                                             \
  } while (0)

  ASSIGN_VAR(mode_, mode, String, stringValue);
  ASSIGN_VAR(dir_, dir, String, stringValue);
  ASSIGN_VAR(session_cfg_.num_workers, num_workers, UInt, uintValue);
  ASSIGN_VAR(session_cfg_.chunk_queue_capacity, chunk_queue_capacity, UInt,
             uintValue);
  ASSIGN_VAR(session_cfg_.delete_extraneous, delete_extraneous, Bool,
             booleanValue);
  ASSIGN_VAR(verbosity_, verbosity, Int, intValue);
  ASSIGN_VAR(log_file_, log_file, String, stringValue);

#undef ASSIGN_VAR

  return absl::OkStatus();
}

absl::Status SyncConfig::Validate() const {
  if (mode_ != "send" && mode_ != "receive") {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Invalid mode '%s', must be 'send' or 'receive'", mode_));
  }
  if (dir_.empty()) {
    return absl::InvalidArgumentError("No directory given");
  }
  return session_cfg_.Validate();
}

std::string SyncConfig::ToString() const {
  std::ostringstream ss;
  ss << "mode                 = " << mode_ << std::endl;
  ss << "dir                  = " << dir_ << std::endl;
  ss << "num_workers          = " << session_cfg_.num_workers << std::endl;
  ss << "chunk_queue_capacity = " << session_cfg_.chunk_queue_capacity
     << std::endl;
  ss << "delete_extraneous    = " << session_cfg_.delete_extraneous
     << std::endl;
  ss << "verbosity            = " << verbosity_ << std::endl;
  ss << "log_file             = " << log_file_ << std::endl;
  return ss.str();
}

std::string SyncConfig::GetFlagsReadFromFile() const {
  return absl::StrJoin(flags_read_from_file_, ", ");
}

std::string SyncConfig::GetFlagReadErrors() const {
  std::string error_str;
  for (const auto& [flag, error] : flag_read_errors_)
    error_str += absl::StrFormat("%sFailed to read '%s': %s",
                                 error_str.empty() ? "" : "\n", flag, error);
  return error_str;
}

}  // namespace func_sync
