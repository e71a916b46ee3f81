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

#ifndef SYNC_DIR_ENUMERATOR_H_
#define SYNC_DIR_ENUMERATOR_H_

#include <functional>
#include <string>

#include "absl/status/status.h"
#include "common/path.h"

namespace func_sync {

// Called for every local entry to send. |source_path| is the path to read
// from, |relative_path| the '/'-separated path under the target root.
// |walk_status| is not OK if the entry could not be inspected, in which case
// |stats| is empty. Returning an error stops the enumeration.
using ProcessFileFn = std::function<absl::Status(
    const std::string& source_path, const std::string& relative_path,
    const path::Stats& stats, absl::Status walk_status)>;

// Calls |process| for every entry to send, parents before children.
using FileEnumerator = std::function<absl::Status(const ProcessFileFn& process)>;

// Enumerates the contents of |root| recursively. The root itself is not
// reported. Entries of a directory are reported sorted by name. Symlinks are
// reported as such and never followed. Fails if |root| is not a directory.
FileEnumerator WalkDirectory(const std::string& root);

}  // namespace func_sync

#endif  // SYNC_DIR_ENUMERATOR_H_
