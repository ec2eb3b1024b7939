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

// All-pairs hop distances and their summary statistics.
//
// Usage example:
//   AdjacencyList adjacency = ...;
//   ASSIGN_OR_RETURN(const std::vector<std::vector<int>> tables,
//                    AllBfsDistances(adjacency, /*num_threads=*/4));
//   const DistanceStats stats = ComputeDistanceStats(tables);
//   LOG(INFO) << stats.mean << " +/- " << stats.stddev << ", max "
//             << stats.max;

#ifndef RIDEGRAPH_GRAPH_DISTANCE_STATS_H_
#define RIDEGRAPH_GRAPH_DISTANCE_STATS_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "ridegraph/graph/hop_paths.h"

namespace ridegraph {

// Summary of all the finite entries of a set of distance tables. Unreachable
// pairs are ignored; the zero distance of each node to itself is counted.
//
// When there is no finite entry at all (which only happens for an empty
// graph), every field is zero.
struct DistanceStats {
  double mean = 0.0;
  // Population standard deviation: the squared deviations are divided by
  // num_finite_pairs, not num_finite_pairs - 1.
  double stddev = 0.0;
  int max = 0;
  int64_t num_finite_pairs = 0;

  std::string DebugString() const;
};

// Returns BfsDistances(adjacency, source) for every source, element #source
// being the table of that source.
//
// With num_threads > 1, the BFS of each source is run as a separate task on a
// thread pool; each task only writes its own table, so the result is the same
// as the sequential one.
absl::StatusOr<std::vector<std::vector<int>>> AllBfsDistances(
    const AdjacencyList& adjacency, int num_threads = 1);

DistanceStats ComputeDistanceStats(
    absl::Span<const std::vector<int>> distance_tables);

}  // namespace ridegraph

#endif  // RIDEGRAPH_GRAPH_DISTANCE_STATS_H_
