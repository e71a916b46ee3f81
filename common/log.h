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

#ifndef COMMON_LOG_H_
#define COMMON_LOG_H_

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include "absl/strings/str_format.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace func_sync {

enum class LogLevel { kVerbose, kDebug, kInfo, kWarning, kError };

// Returns "VERBOSE", "DEBUG" etc.
const char* LogLevelName(LogLevel level);

#define FUNC_SYNC_BASENAME \
  (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define FUNC_SYNC_LOG(level, ...)                                    \
  ::func_sync::Log::SafePrintf(::func_sync::LogLevel::level,         \
                               FUNC_SYNC_BASENAME, __LINE__, __func__, \
                               __VA_ARGS__)

#define LOG_VERBOSE(...) FUNC_SYNC_LOG(kVerbose, __VA_ARGS__);
#define LOG_DEBUG(...) FUNC_SYNC_LOG(kDebug, __VA_ARGS__);
#define LOG_INFO(...) FUNC_SYNC_LOG(kInfo, __VA_ARGS__);
#define LOG_WARNING(...) FUNC_SYNC_LOG(kWarning, __VA_ARGS__);
#define LOG_ERROR(...) FUNC_SYNC_LOG(kError, __VA_ARGS__);

// A single log message and where it was issued.
struct LogRecord {
  LogLevel level;
  const char* file;
  int line;
  const char* func;
  std::string message;
};

// Process-wide log. Both ends of a session usually write to the same
// terminal, so every line carries the tag of the end that wrote it.
class Log {
 public:
  // Installs |log| as the process-wide log. Must be called once before any
  // other thread logs.
  static void Initialize(std::unique_ptr<Log> log);

  // Deletes the process-wide log.
  static void Shutdown();

  static Log* Instance();

  template <typename... Args>
  static void SafePrintf(LogLevel level, const char* file, int line,
                         const char* func,
                         const absl::FormatSpec<Args...>& format,
                         Args... args) {
    Log* log = instance_;
    if (log && !log->IsEnabled(level)) return;
    if (!log && level < LogLevel::kWarning) return;

    LogRecord record{level, file, line, func,
                     absl::StrFormat(format, args...)};
    if (log) {
      log->WriteLogMessage(record);
    } else {
      WriteToStderr(record);
    }
  }

  // Maps the -v style verbosity of the command line to a log level.
  // 0 and 1 show warnings, 2 info, 3 debug and 4+ verbose messages.
  static LogLevel VerbosityToLogLevel(int verbosity);

  bool IsEnabled(LogLevel level) const { return log_level_ <= level; }
  void SetLogLevel(LogLevel log_level) { log_level_ = log_level; }
  LogLevel GetLogLevel() const { return log_level_; }

  // Tag printed in front of every message, e.g. "send" or "receive".
  void SetTag(std::string tag) { tag_ = std::move(tag); }
  const std::string& tag() const { return tag_; }

  virtual ~Log();

 protected:
  explicit Log(LogLevel log_level) : log_level_(log_level) {}

  virtual void WriteLogMessage(const LogRecord& record) = 0;

  // Returns "<tag> <LEVEL> <file>(<line>): " without the tag if it is empty.
  std::string FormatPrefix(const LogRecord& record) const;

 private:
  // Fallback for messages logged while no log is installed.
  static void WriteToStderr(const LogRecord& record);

  static Log* instance_;

  LogLevel log_level_;
  std::string tag_;
};

// Logs to stderr; stdout may carry protocol data. Messages get elapsed time
// and function names at debug level and below.
class ConsoleLog : public Log {
 public:
  explicit ConsoleLog(LogLevel log_level) : Log(log_level) {}

 protected:
  void WriteLogMessage(const LogRecord& record) override
      ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  absl::Mutex mutex_;
  const absl::Time start_time_ = absl::Now();
};

// Appends timestamped messages to a file, so that the history of repeated
// syncs is kept.
class FileLog : public Log {
 public:
  FileLog(LogLevel log_level, const std::string& path);
  ~FileLog();

  // Returns false if the file could not be opened. Messages are dropped then.
  bool IsOpen() const { return file_ != nullptr; }

 protected:
  void WriteLogMessage(const LogRecord& record) override
      ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  FILE* file_;
  absl::Mutex mutex_;
};

// Installs a log for the lifetime of the object.
class ScopedLog {
 public:
  explicit ScopedLog(std::unique_ptr<Log> log) {
    Log::Initialize(std::move(log));
  }
  ~ScopedLog() { Log::Shutdown(); }
};

}  // namespace func_sync

#endif  // COMMON_LOG_H_
