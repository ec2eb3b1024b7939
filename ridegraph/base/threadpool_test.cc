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

#include "ridegraph/base/threadpool.h"

#include <atomic>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace ridegraph {
namespace {

using ::testing::Each;

TEST(ThreadPoolTest, RunsEveryScheduledTaskBeforeDestruction) {
  std::vector<int> results(100, 0);
  {
    ThreadPool pool(4);
    pool.StartWorkers();
    for (int i = 0; i < results.size(); ++i) {
      pool.Schedule([&results, i] { results[i] = 1; });
    }
  }
  EXPECT_THAT(results, Each(1));
}

TEST(ThreadPoolTest, TasksScheduledBeforeStartAreRun) {
  std::atomic<int> num_runs = 0;
  {
    ThreadPool pool(2);
    for (int i = 0; i < 10; ++i) pool.Schedule([&num_runs] { ++num_runs; });
    pool.StartWorkers();
  }
  EXPECT_EQ(num_runs.load(), 10);
}

TEST(ThreadPoolTest, NeverStartedPoolIsDestroyedCleanly) {
  ThreadPool pool(3);
  pool.Schedule([] {});
}

}  // namespace
}  // namespace ridegraph
