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

#ifndef SYNC_FILE_RECEIVER_H_
#define SYNC_FILE_RECEIVER_H_

#include <string>

#include "absl/status/status.h"
#include "sync/session_config.h"
#include "sync/sync_report.h"

namespace func_sync {

class Socket;

// Runs the receiving end of a session over |socket| and makes the directory
// |root| match the sender's manifest. Files that are missing are requested in
// full, files that differ in size or modification time are updated through
// deltas, and directories, symlinks and empty files are created from their
// manifest record. Unless disabled in |config|, entries under |root| that are
// not in the manifest are removed.
//
// Returns OK unless the session was aborted. Per-file failures and counters
// are written to |report| in either case.
absl::Status ReceiveFiles(Socket* socket, const std::string& root,
                          const SessionConfig& config, SyncReport* report);

}  // namespace func_sync

#endif  // SYNC_FILE_RECEIVER_H_
