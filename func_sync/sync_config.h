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

#ifndef FUNC_SYNC_SYNC_CONFIG_H_
#define FUNC_SYNC_SYNC_CONFIG_H_

#include <map>
#include <set>
#include <string>

#include "absl/status/status.h"
#include "sync/session_config.h"

namespace func_sync {

// Which end of the session the process runs.
enum class SyncMode { kSend, kReceive };

// Configuration of the func_sync command line tool. Reads flags from the
// command line and optionally applies overrides from a json file.
class SyncConfig {
 public:
  // Constructs the configuration by applying command line flags.
  SyncConfig();
  ~SyncConfig();

  // Loads a configuration from the JSON file at |path| and overrides any config
  // values that are set in this file. Sample json file:
  // {
  //   "mode":"receive",
  //   "dir":"/srv/func",
  //   "num_workers":8,
  //   "chunk_queue_capacity":4,
  //   "delete_extraneous":true,
  //   "verbosity":3,
  //   "log_file":"/tmp/func_sync.log"
  // }
  // Returns NotFoundError if the file does not exist.
  // Returns InvalidArgumentError if the file is not valid JSON.
  absl::Status LoadFromFile(const std::string& path);

  // Returns InvalidArgumentError if the combined settings are unusable.
  absl::Status Validate() const;

  // Returns a string with all config values, suitable for logging.
  std::string ToString() const;

  // Gets a comma-separated list of flags that were read from the JSON file.
  // These flags override command line flags.
  std::string GetFlagsReadFromFile() const;

  // Gets a newline-separated list of errors for each flag that could not be
  // read from the JSON file.
  std::string GetFlagReadErrors() const;

  SyncMode mode() const {
    return mode_ == "send" ? SyncMode::kSend : SyncMode::kReceive;
  }

  // Directory to send from or to receive into.
  const std::string& dir() const { return dir_; }

  const SessionConfig& session_cfg() const { return session_cfg_; }
  int verbosity() const { return verbosity_; }

  // Log file path. Logs go to stderr if empty.
  const std::string& log_file() const { return log_file_; }

 private:
  std::string mode_;
  std::string dir_;
  SessionConfig session_cfg_;
  int verbosity_ = 2;
  std::string log_file_;

  // Use a set, so the flags are sorted alphabetically.
  std::set<std::string> flags_read_from_file_;

  // Maps flags to errors occurred while reading this flag.
  std::map<std::string, std::string> flag_read_errors_;
};

}  // namespace func_sync

#endif  // FUNC_SYNC_SYNC_CONFIG_H_
