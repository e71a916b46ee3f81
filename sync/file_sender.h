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

#ifndef SYNC_FILE_SENDER_H_
#define SYNC_FILE_SENDER_H_

#include "absl/status/status.h"
#include "sync/dir_enumerator.h"
#include "sync/session_config.h"
#include "sync/sync_report.h"

namespace func_sync {

class Socket;

// Runs the sending end of a session over |socket|: negotiates the protocol
// version, sends the manifest of the entries produced by |enumerator| and
// answers the receiver's file requests and signatures until the receiver
// ends the exchange.
//
// Returns OK unless the session was aborted. Per-file failures and counters
// are written to |report| in either case.
absl::Status SendFiles(Socket* socket, const FileEnumerator& enumerator,
                       const SessionConfig& config, SyncReport* report);

}  // namespace func_sync

#endif  // SYNC_FILE_SENDER_H_
