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

#include "ridegraph/graph/distance_stats.h"

#include <cmath>
#include <random>
#include <vector>

#include "absl/status/status.h"
#include "benchmark/benchmark.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ridegraph/base/status_matchers.h"
#include "ridegraph/graph/hop_paths.h"

namespace ridegraph {
namespace {

using ::testing::DoubleNear;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::status::IsOkAndHolds;
using ::testing::status::StatusIs;

AdjacencyList RandomAdjacency(int num_nodes, int num_arcs, int seed) {
  std::mt19937 random(seed);
  std::uniform_int_distribution<int> node(0, num_nodes - 1);
  AdjacencyList adjacency(num_nodes);
  for (int i = 0; i < num_arcs; ++i) {
    adjacency[node(random)].push_back(node(random));
  }
  return adjacency;
}

TEST(AllBfsDistancesTest, Cycle) {
  const AdjacencyList cycle = {{1}, {2}, {0}};
  EXPECT_THAT(AllBfsDistances(cycle),
              IsOkAndHolds(ElementsAre(ElementsAre(0, 1, 2),
                                       ElementsAre(2, 0, 1),
                                       ElementsAre(1, 2, 0))));
}

TEST(AllBfsDistancesTest, EmptyGraph) {
  EXPECT_THAT(AllBfsDistances(AdjacencyList()), IsOkAndHolds(IsEmpty()));
  EXPECT_THAT(AllBfsDistances(AdjacencyList(), 4), IsOkAndHolds(IsEmpty()));
}

TEST(AllBfsDistancesTest, MultiThreadedMatchesSequential) {
  const AdjacencyList adjacency = RandomAdjacency(200, 500, /*seed=*/12);
  ASSERT_OK_AND_ASSIGN(const std::vector<std::vector<int>> sequential,
                       AllBfsDistances(adjacency, 1));
  for (const int num_threads : {2, 8}) {
    EXPECT_THAT(AllBfsDistances(adjacency, num_threads),
                IsOkAndHolds(sequential));
  }
}

TEST(AllBfsDistancesTest, InvalidArcIsReported) {
  const AdjacencyList adjacency = {{1}, {7}};
  EXPECT_THAT(AllBfsDistances(adjacency),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(AllBfsDistances(adjacency, 2),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(ComputeDistanceStatsTest, Cycle) {
  // Every source sees {0, 1, 2}.
  const std::vector<std::vector<int>> tables = {
      {0, 1, 2}, {2, 0, 1}, {1, 2, 0}};
  const DistanceStats stats = ComputeDistanceStats(tables);
  EXPECT_EQ(stats.num_finite_pairs, 9);
  EXPECT_DOUBLE_EQ(stats.mean, 1.0);
  EXPECT_DOUBLE_EQ(stats.stddev, std::sqrt(2.0 / 3.0));
  EXPECT_EQ(stats.max, 2);
}

TEST(ComputeDistanceStatsTest, IgnoresUnreachablePairs) {
  // The chain 0 → 1.
  const std::vector<std::vector<int>> tables = {{0, 1}, {kUnreachable, 0}};
  const DistanceStats stats = ComputeDistanceStats(tables);
  EXPECT_EQ(stats.num_finite_pairs, 3);
  EXPECT_DOUBLE_EQ(stats.mean, 1.0 / 3.0);
  // Population standard deviation: sqrt((2 * (1/3)^2 + (2/3)^2) / 3).
  EXPECT_THAT(stats.stddev, DoubleNear(std::sqrt(2.0) / 3.0, 1e-12));
  EXPECT_EQ(stats.max, 1);
}

TEST(ComputeDistanceStatsTest, SingleIsolatedNode) {
  const DistanceStats stats = ComputeDistanceStats(std::vector<std::vector<int>>{{0}});
  EXPECT_EQ(stats.num_finite_pairs, 1);
  EXPECT_EQ(stats.mean, 0.0);
  EXPECT_EQ(stats.stddev, 0.0);
  EXPECT_EQ(stats.max, 0);
}

TEST(ComputeDistanceStatsTest, NoFiniteDistanceFallsBackToZero) {
  for (const std::vector<std::vector<int>>& tables :
       {std::vector<std::vector<int>>(),
        std::vector<std::vector<int>>{{kUnreachable}}}) {
    const DistanceStats stats = ComputeDistanceStats(tables);
    EXPECT_EQ(stats.num_finite_pairs, 0);
    EXPECT_EQ(stats.mean, 0.0);
    EXPECT_EQ(stats.stddev, 0.0);
    EXPECT_EQ(stats.max, 0);
  }
}

TEST(ComputeDistanceStatsTest, MeanIsBetweenZeroAndMax) {
  for (int seed = 0; seed < 10; ++seed) {
    const AdjacencyList adjacency = RandomAdjacency(50, 80, seed);
    ASSERT_OK_AND_ASSIGN(const std::vector<std::vector<int>> tables,
                         AllBfsDistances(adjacency));
    const DistanceStats stats = ComputeDistanceStats(tables);
    EXPECT_GE(stats.num_finite_pairs, 50);
    EXPECT_GE(stats.mean, 0.0);
    EXPECT_LE(stats.mean, stats.max);
    EXPECT_GE(stats.stddev, 0.0);
  }
}

TEST(DistanceStatsTest, DebugString) {
  DistanceStats stats;
  stats.mean = 1.0;
  stats.stddev = 0.8165;
  stats.max = 2;
  stats.num_finite_pairs = 9;
  EXPECT_EQ(stats.DebugString(), "mean: 1.00, stddev: 0.82, max: 2 (9 pairs)");
}

void BM_AllBfsDistances(benchmark::State& state) {
  const int num_nodes = state.range(0);
  const AdjacencyList adjacency =
      RandomAdjacency(num_nodes, 4 * num_nodes, /*seed=*/0);
  for (auto _ : state) {
    auto tables = AllBfsDistances(adjacency, state.range(1));
    benchmark::DoNotOptimize(tables);
  }
}

BENCHMARK(BM_AllBfsDistances)
    ->ArgPair(100, 1)
    ->ArgPair(1000, 1)
    ->ArgPair(1000, 4);

}  // namespace
}  // namespace ridegraph
