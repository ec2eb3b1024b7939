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

#include "ridegraph/graph/hop_paths.h"

#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ridegraph/base/status_matchers.h"

namespace ridegraph {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;
using ::testing::status::IsOkAndHolds;
using ::testing::status::StatusIs;

// 0 → 1 → 2 → 0, the cycle A→B→C→A.
const AdjacencyList& Cycle() {
  static const auto* const kCycle = new AdjacencyList({{1}, {2}, {0}});
  return *kCycle;
}

// 0 → 1 → 3, 0 → 2 → 3, 3 → 4, and 5 → 0 with 5 unreachable from the others.
const AdjacencyList& Diamond() {
  static const auto* const kDiamond =
      new AdjacencyList({{1, 2}, {3}, {3}, {4}, {}, {0}});
  return *kDiamond;
}

TEST(BfsDistancesTest, Cycle) {
  EXPECT_THAT(BfsDistances(Cycle(), 0), IsOkAndHolds(ElementsAre(0, 1, 2)));
  EXPECT_THAT(BfsDistances(Cycle(), 1), IsOkAndHolds(ElementsAre(2, 0, 1)));
}

TEST(BfsDistancesTest, UnreachableNodes) {
  EXPECT_THAT(BfsDistances(Diamond(), 0),
              IsOkAndHolds(ElementsAre(0, 1, 1, 2, 3, kUnreachable)));
  EXPECT_THAT(BfsDistances(Diamond(), 4),
              IsOkAndHolds(ElementsAre(kUnreachable, kUnreachable,
                                       kUnreachable, kUnreachable, 0,
                                       kUnreachable)));
}

TEST(BfsDistancesTest, SelfDistanceIsZero) {
  for (const AdjacencyList* adjacency : {&Cycle(), &Diamond()}) {
    for (int node = 0; node < adjacency->size(); ++node) {
      ASSERT_OK_AND_ASSIGN(const std::vector<int> distances,
                           BfsDistances(*adjacency, node));
      EXPECT_EQ(distances[node], 0);
    }
  }
}

TEST(BfsDistancesTest, InvalidSource) {
  EXPECT_THAT(BfsDistances(Cycle(), 3),
              StatusIs(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(BfsDistances(AdjacencyList(), 0),
              StatusIs(absl::StatusCode::kOutOfRange));
}

TEST(ShortestPathTest, FollowsArcDirection) {
  EXPECT_THAT(ShortestPath(Cycle(), 0, 2), IsOkAndHolds(ElementsAre(0, 1, 2)));
  EXPECT_THAT(ShortestPath(Cycle(), 2, 1), IsOkAndHolds(ElementsAre(2, 0, 1)));
}

TEST(ShortestPathTest, StartIsEnd) {
  EXPECT_THAT(ShortestPath(Diamond(), 4, 4), IsOkAndHolds(ElementsAre(4)));
}

TEST(ShortestPathTest, NoPathBetweenDisconnectedNodes) {
  EXPECT_THAT(ShortestPath(Diamond(), 0, 5), IsOkAndHolds(IsEmpty()));
  EXPECT_THAT(ShortestPath(Diamond(), 4, 0), IsOkAndHolds(IsEmpty()));
  // Two isolated nodes.
  EXPECT_THAT(ShortestPath(AdjacencyList(2), 0, 1), IsOkAndHolds(IsEmpty()));
}

TEST(ShortestPathTest, ParallelArcs) {
  const AdjacencyList adjacency = {{1, 1, 1}, {}};
  EXPECT_THAT(ShortestPath(adjacency, 0, 1), IsOkAndHolds(ElementsAre(0, 1)));
}

TEST(ShortestPathTest, LengthMatchesBfsDistance) {
  const AdjacencyList& adjacency = Diamond();
  for (int start = 0; start < adjacency.size(); ++start) {
    ASSERT_OK_AND_ASSIGN(const std::vector<int> distances,
                         BfsDistances(adjacency, start));
    for (int end = 0; end < adjacency.size(); ++end) {
      ASSERT_OK_AND_ASSIGN(const std::vector<int> path,
                           ShortestPath(adjacency, start, end));
      if (distances[end] == kUnreachable) {
        EXPECT_THAT(path, IsEmpty());
        continue;
      }
      EXPECT_THAT(path, SizeIs(distances[end] + 1));
      EXPECT_EQ(path.front(), start);
      EXPECT_EQ(path.back(), end);
    }
  }
}

TEST(ShortestPathTest, InvalidNodes) {
  EXPECT_THAT(ShortestPath(Cycle(), -1, 0),
              StatusIs(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(ShortestPath(Cycle(), 0, 3),
              StatusIs(absl::StatusCode::kOutOfRange));
}

}  // namespace
}  // namespace ridegraph
