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

#include "common/threadpool.h"

#include <atomic>
#include <functional>
#include <set>

#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "gtest/gtest.h"

namespace func_sync {
namespace {

// Runs a lambda and remembers its id.
class FuncTask {
 public:
  using Func = std::function<void(const IsCancelledPredicate& is_cancelled)>;

  FuncTask(int id, Func func) : id_(id), func_(std::move(func)) {}

  void ThreadRun(IsCancelledPredicate is_cancelled) {
    func_(is_cancelled);
    ran_ = true;
  }

  int id() const { return id_; }
  bool ran() const { return ran_; }

 private:
  const int id_;
  Func func_;
  bool ran_ = false;
};

void Noop(const IsCancelledPredicate&) {}

TEST(ThreadpoolTest, WaitAndShutdownWithoutTasks) {
  Threadpool<FuncTask> pool(3);
  pool.Wait();
  pool.Shutdown();
  pool.Shutdown();
}

TEST(ThreadpoolTest, CallbackReceivesEveryTaskBeforeWaitReturns) {
  constexpr int kNumTasks = 19;
  constexpr int kNumThreads = 7;

  absl::Mutex mutex;
  std::set<int> completed_ids;

  Threadpool<FuncTask> pool(kNumThreads);
  EXPECT_EQ(pool.NumThreads(), kNumThreads);
  pool.SetTaskCompletedCallback(
      [&mutex, &completed_ids](std::unique_ptr<FuncTask> task) {
        EXPECT_TRUE(task->ran());
        absl::MutexLock lock(&mutex);
        completed_ids.insert(task->id());
      });
  for (int id = 0; id < kNumTasks; ++id) {
    pool.QueueTask(std::make_unique<FuncTask>(id, Noop));
  }
  pool.Wait();

  absl::MutexLock lock(&mutex);
  EXPECT_EQ(completed_ids.size(), kNumTasks);
  EXPECT_EQ(*completed_ids.begin(), 0);
  EXPECT_EQ(*completed_ids.rbegin(), kNumTasks - 1);
  EXPECT_EQ(pool.NumOutstandingTasks(), 0);
}

TEST(ThreadpoolTest, ShutdownCancelsRunningAndDropsPendingTasks) {
  absl::Notification started;
  std::atomic_bool saw_cancel{false};
  std::atomic_int num_callbacks{0};

  Threadpool<FuncTask> pool(1);
  pool.SetTaskCompletedCallback(
      [&num_callbacks](std::unique_ptr<FuncTask> task) {
        EXPECT_EQ(task->id(), 1);
        ++num_callbacks;
      });
  pool.QueueTask(std::make_unique<FuncTask>(
      1, [&](const IsCancelledPredicate& is_cancelled) {
        started.Notify();
        while (!is_cancelled()) std::this_thread::yield();
        saw_cancel = true;
      }));
  pool.QueueTask(std::make_unique<FuncTask>(2, Noop));

  started.WaitForNotification();
  pool.Shutdown();
  pool.Wait();

  EXPECT_TRUE(saw_cancel);
  EXPECT_EQ(num_callbacks, 1);
  EXPECT_EQ(pool.NumOutstandingTasks(), 0);
}

TEST(ThreadpoolTest, TasksQueuedAfterShutdownAreDropped) {
  std::atomic_bool ran{false};
  Threadpool<FuncTask> pool(2);
  pool.Shutdown();
  pool.QueueTask(std::make_unique<FuncTask>(
      1, [&ran](const IsCancelledPredicate&) { ran = true; }));
  pool.Wait();
  EXPECT_FALSE(ran);
  EXPECT_EQ(pool.NumOutstandingTasks(), 0);
}

}  // namespace
}  // namespace func_sync
