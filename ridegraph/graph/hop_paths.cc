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

#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "ridegraph/base/status_macros.h"
#include "ridegraph/graph/bfs.h"

namespace ridegraph {

absl::StatusOr<std::vector<int>> ShortestPath(const AdjacencyList& adjacency,
                                              int start, int end) {
  const int num_nodes = adjacency.size();
  if (end < 0 || end >= num_nodes) {
    return absl::OutOfRangeError(absl::StrFormat(
        "end=%d is not in [0, num_nodes=%d)", end, num_nodes));
  }
  BFSTree<int> tree;
  ASSIGN_OR_RETURN(tree, RunBFS(adjacency, num_nodes, start, /*stop_at=*/end));
  return GetBFSShortestPath(tree, end);
}

absl::StatusOr<std::vector<int>> BfsDistances(const AdjacencyList& adjacency,
                                              int source) {
  const int num_nodes = adjacency.size();
  BFSTree<int> tree;
  ASSIGN_OR_RETURN(tree, RunBFS(adjacency, num_nodes, source));
  return std::move(tree.distance);
}

}  // namespace ridegraph
