// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef RIDEGRAPH_BASE_THREADPOOL_H_
#define RIDEGRAPH_BASE_THREADPOOL_H_

#include <condition_variable>  // NOLINT
#include <functional>
#include <list>
#include <mutex>  // NOLINT
#include <thread>  // NOLINT
#include <vector>

namespace ridegraph {

// A fixed-size pool of worker threads consuming a FIFO of closures.
// The destructor waits for every scheduled closure to finish, so scoping the
// pool is the way to wait for a batch of tasks:
//
//   {
//     ThreadPool pool(4);
//     pool.StartWorkers();
//     for (...) pool.Schedule([...] { ... });
//   }  // All tasks are done here.
class ThreadPool {
 public:
  explicit ThreadPool(int num_threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void StartWorkers();
  void Schedule(std::function<void()> closure);

  // Blocks until a task is available; returns nullptr once the pool is being
  // destroyed and the queue is drained.
  std::function<void()> GetNextTask();

 private:
  const int num_workers_;
  std::list<std::function<void()>> tasks_;
  std::mutex mutex_;
  std::condition_variable condition_;
  bool waiting_to_finish_ = false;
  bool started_ = false;
  std::vector<std::thread> all_workers_;
};

}  // namespace ridegraph

#endif  // RIDEGRAPH_BASE_THREADPOOL_H_
