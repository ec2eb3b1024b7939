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

// Hop-count shortest paths on a directed graph given as adjacency lists.
// Node indices are dense integers in [0, adjacency.size()); every arc has
// length one.

#ifndef RIDEGRAPH_GRAPH_HOP_PATHS_H_
#define RIDEGRAPH_GRAPH_HOP_PATHS_H_

#include <vector>

#include "absl/status/statusor.h"

namespace ridegraph {

// adjacency[u] lists the heads of the arcs leaving u. Duplicates are allowed
// and mean parallel arcs.
using AdjacencyList = std::vector<std::vector<int>>;

// Distance reported for nodes that can't be reached from the source.
inline constexpr int kUnreachable = -1;

// Returns a path with the fewest arcs from `start` to `end`, both included.
// Returns [start] if start == end, and an empty vector if `end` can't be
// reached from `start`. The search stops as soon as `end` is dequeued.
// Returns an OutOfRange error if `start` or `end` is not a valid node.
absl::StatusOr<std::vector<int>> ShortestPath(const AdjacencyList& adjacency,
                                              int start, int end);

// Returns the hop count from `source` to every node, or kUnreachable.
// The returned vector always has adjacency.size() elements, and its element
// #source is 0. Returns an OutOfRange error if `source` is not a valid node.
absl::StatusOr<std::vector<int>> BfsDistances(const AdjacencyList& adjacency,
                                              int source);

}  // namespace ridegraph

#endif  // RIDEGRAPH_GRAPH_HOP_PATHS_H_
