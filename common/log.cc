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

#include <cassert>

#include "absl/strings/str_cat.h"

namespace func_sync {

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kVerbose:
      return "VERBOSE";
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

Log* Log::instance_ = nullptr;

// static
void Log::Initialize(std::unique_ptr<Log> log) {
  assert(!instance_);
  instance_ = log.release();
}

// static
void Log::Shutdown() {
  delete instance_;
  instance_ = nullptr;
}

// static
Log* Log::Instance() {
  assert(instance_);
  return instance_;
}

Log::~Log() = default;

// static
LogLevel Log::VerbosityToLogLevel(int verbosity) {
  switch (verbosity) {
    case 0:
    case 1:
      return LogLevel::kWarning;
    case 2:
      return LogLevel::kInfo;
    case 3:
      return LogLevel::kDebug;
  }
  return verbosity < 0 ? LogLevel::kWarning : LogLevel::kVerbose;
}

std::string Log::FormatPrefix(const LogRecord& record) const {
  std::string prefix;
  if (!tag_.empty()) absl::StrAppend(&prefix, "[", tag_, "] ");
  absl::StrAppendFormat(&prefix, "%-7s %s(%i): ", LogLevelName(record.level),
                        record.file, record.line);
  return prefix;
}

// static
void Log::WriteToStderr(const LogRecord& record) {
  fprintf(stderr, "%-7s %s(%i): %s\n", LogLevelName(record.level), record.file,
          record.line, record.message.c_str());
}

void ConsoleLog::WriteLogMessage(const LogRecord& record) {
  absl::MutexLock lock(&mutex_);
  if (GetLogLevel() > LogLevel::kDebug) {
    // Lean output for users.
    if (tag().empty()) {
      fprintf(stderr, "%-7s %s\n", LogLevelName(record.level),
              record.message.c_str());
    } else {
      fprintf(stderr, "[%s] %-7s %s\n", tag().c_str(),
              LogLevelName(record.level), record.message.c_str());
    }
    return;
  }
  fprintf(stderr, "%0.3f %s%s(): %s\n", absl::ToDoubleSeconds(absl::Now() - start_time_),
          FormatPrefix(record).c_str(), record.func, record.message.c_str());
}

FileLog::FileLog(LogLevel log_level, const std::string& path)
    : Log(log_level), file_(fopen(path.c_str(), "at")) {
  if (!file_) fprintf(stderr, "Failed to open log file '%s'\n", path.c_str());
}

FileLog::~FileLog() {
  if (file_) fclose(file_);
}

void FileLog::WriteLogMessage(const LogRecord& record) {
  if (!file_) return;
  const std::string timestamp = absl::FormatTime(
      "%Y-%m-%d %H:%M:%E3S", absl::Now(), absl::LocalTimeZone());
  const std::string prefix = FormatPrefix(record);

  absl::MutexLock lock(&mutex_);
  fprintf(file_, "%s %s%s(): %s\n", timestamp.c_str(), prefix.c_str(),
          record.func, record.message.c_str());
  fflush(file_);
}

}  // namespace func_sync
