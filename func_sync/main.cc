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

#include <signal.h>
#include <unistd.h>

#include <memory>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "common/log.h"
#include "common/status_macros.h"
#include "func_sync/sync_config.h"
#include "sync/dir_enumerator.h"
#include "sync/fd_socket.h"
#include "sync/file_receiver.h"
#include "sync/file_sender.h"
#include "sync/sync_report.h"

namespace func_sync {
namespace {

// Runs one session end over stdin/stdout, which are piped to the peer.
absl::Status Run(const SyncConfig& cfg, SyncReport* report) {
  FdSocket socket(STDIN_FILENO, STDOUT_FILENO);
  if (cfg.mode() == SyncMode::kSend) {
    return SendFiles(&socket, WalkDirectory(cfg.dir()), cfg.session_cfg(),
                     report);
  }
  return ReceiveFiles(&socket, cfg.dir(), cfg.session_cfg(), report);
}

// stdout carries the protocol, so logs go to stderr or to a file.
std::unique_ptr<Log> CreateLog(const SyncConfig& cfg) {
  LogLevel level = Log::VerbosityToLogLevel(cfg.verbosity());
  std::unique_ptr<Log> log;
  if (cfg.log_file().empty()) {
    log = std::make_unique<ConsoleLog>(level);
  } else {
    log = std::make_unique<FileLog>(level, cfg.log_file());
  }
  log->SetTag(cfg.mode() == SyncMode::kSend ? "send" : "receive");
  return log;
}

}  // namespace
}  // namespace func_sync

ABSL_FLAG(std::string, config_file, "",
          "Json configuration file that overrides command line flags");

int main(int argc, char* argv[]) {
  absl::ParseCommandLine(argc, argv);

  // A peer that goes away must not kill the process while writing.
  signal(SIGPIPE, SIG_IGN);

  // Set up config. Allow overriding this config |config_file|.
  func_sync::SyncConfig cfg;
  std::string config_file = absl::GetFlag(FLAGS_config_file);
  absl::Status cfg_load_status;
  if (!config_file.empty()) cfg_load_status = cfg.LoadFromFile(config_file);

  func_sync::ScopedLog scoped_log(func_sync::CreateLog(cfg));

  if (!config_file.empty()) {
    if (cfg_load_status.ok()) {
      LOG_INFO("Successfully loaded configuration file at '%s'", config_file);
    } else {
      LOG_ERROR("%s", cfg_load_status.message());
      return 1;
    }
  }

  std::string flags_read = cfg.GetFlagsReadFromFile();
  if (!flags_read.empty()) {
    LOG_INFO(
        "The following settings were read from the configuration file and "
        "override the corresponding command line flags if set: %s",
        flags_read);
  }

  std::string flag_errors = cfg.GetFlagReadErrors();
  if (!flag_errors.empty()) LOG_WARNING("%s", flag_errors);

  absl::Status status = cfg.Validate();
  if (!status.ok()) {
    LOG_ERROR("Invalid configuration: %s", status.message());
    return 1;
  }
  LOG_DEBUG("Configuration:\n%s", cfg.ToString());

  func_sync::SyncReport report;
  status = func_sync::Run(cfg, &report);
  LOG_INFO("%s", report.ToString());
  if (!status.ok()) {
    LOG_ERROR("Sync failed: %s", status.ToString());
    return 1;
  }

  // Per-file errors don't abort the session, but the result is incomplete.
  return report.file_errors.empty() ? 0 : 2;
}
