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

#ifndef COMMON_THREADPOOL_H_
#define COMMON_THREADPOOL_H_

#include <cassert>
#include <functional>
#include <memory>
#include <queue>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace func_sync {

// Returns true once the pool running a task is shutting down.
using IsCancelledPredicate = std::function<bool()>;

// Runs tasks of type |TaskT| on a fixed set of worker threads. |TaskT| must
// have a method
//   void ThreadRun(IsCancelledPredicate is_cancelled);
// that does the work on a worker thread.
template <typename TaskT>
class Threadpool {
 public:
  using TaskCompletedCallback = std::function<void(std::unique_ptr<TaskT>)>;

  explicit Threadpool(size_t num_threads) {
    workers_.reserve(num_threads);
    for (size_t n = 0; n < num_threads; ++n) {
      workers_.emplace_back([this]() { WorkerMain(); });
    }
  }

  ~Threadpool() { Shutdown(); }

  Threadpool(const Threadpool&) = delete;
  Threadpool& operator=(const Threadpool&) = delete;

  // Blocks until every queued task ran and was handed to the completion
  // callback, or until the pool shuts down.
  void Wait() ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    auto idle = [this]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
      return num_outstanding_ == 0 || shutdown_;
    };
    mutex_.Await(absl::Condition(&idle));
  }

  // Stops the workers. Running tasks see |is_cancelled| turn true and are
  // waited for. Tasks that did not start yet are destroyed without running.
  void Shutdown() ABSL_LOCKS_EXCLUDED(mutex_) {
    std::queue<std::unique_ptr<TaskT>> not_started;
    {
      absl::MutexLock lock(&mutex_);
      if (shutdown_) return;
      shutdown_ = true;
      num_outstanding_ -= pending_.size();
      std::swap(pending_, not_started);
    }
    for (std::thread& worker : workers_) {
      if (worker.joinable()) worker.join();
    }
  }

  // Queues |task| for a worker. Dropped if the pool is shut down.
  void QueueTask(std::unique_ptr<TaskT> task) ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    if (shutdown_) return;
    ++num_outstanding_;
    pending_.push(std::move(task));
  }

  // Sets a callback that receives each task on its worker thread once it ran.
  // Without a callback, tasks are destroyed right away.
  void SetTaskCompletedCallback(TaskCompletedCallback cb)
      ABSL_LOCKS_EXCLUDED(callback_mutex_) {
    absl::MutexLock lock(&callback_mutex_);
    on_task_completed_ = std::move(cb);
  }

  size_t NumThreads() const { return workers_.size(); }

  // Number of tasks that are queued or running.
  size_t NumOutstandingTasks() const ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    return num_outstanding_;
  }

 private:
  void WorkerMain() ABSL_LOCKS_EXCLUDED(mutex_) {
    const IsCancelledPredicate is_cancelled =
        [this]() ABSL_LOCKS_EXCLUDED(mutex_) {
          absl::MutexLock lock(&mutex_);
          return shutdown_;
        };

    for (;;) {
      std::unique_ptr<TaskT> task;
      {
        absl::MutexLock lock(&mutex_);
        auto has_work = [this]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
          return shutdown_ || !pending_.empty();
        };
        mutex_.Await(absl::Condition(&has_work));
        if (shutdown_) return;
        task = std::move(pending_.front());
        pending_.pop();
      }

      task->ThreadRun(is_cancelled);
      {
        absl::MutexLock lock(&callback_mutex_);
        if (on_task_completed_) on_task_completed_(std::move(task));
      }
      task.reset();

      // Only now, so that Wait() returns after all results were handed out.
      absl::MutexLock lock(&mutex_);
      assert(num_outstanding_ > 0);
      --num_outstanding_;
    }
  }

  mutable absl::Mutex mutex_;
  std::queue<std::unique_ptr<TaskT>> pending_ ABSL_GUARDED_BY(mutex_);
  size_t num_outstanding_ ABSL_GUARDED_BY(mutex_) = 0;
  bool shutdown_ ABSL_GUARDED_BY(mutex_) = false;

  absl::Mutex callback_mutex_;
  TaskCompletedCallback on_task_completed_ ABSL_GUARDED_BY(callback_mutex_);

  std::vector<std::thread> workers_;
};

}  // namespace func_sync

#endif  // COMMON_THREADPOOL_H_
