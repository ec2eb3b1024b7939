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

#ifndef RIDEGRAPH_GRAPH_BFS_H_
#define RIDEGRAPH_GRAPH_BFS_H_

#include <algorithm>
#include <cstddef>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

// Breadth-First-Search on any type of Graph on dense integers that implements
// the [] operator to yield the adjacency list: graph[i] should yield a
// vector<int>-like object that lists all the (outgoing) neighbors of node #i.
// Arcs are directed and all have length 1, so BFS distances are hop counts.
//
// Self-arcs and multi-arcs are supported: a node is discovered at most once
// whatever the number of arcs leading to it.
//
// ERRORS:
// A source or target outside [0, num_nodes) yields an OutOfRange error. An
// adjacency list mentioning a node outside [0, num_nodes) yields an
// InvalidArgument error. Calling graph[i] for i in [0, num_nodes) must be
// valid; this can't be checked.
//
// Example:
//   const int num_nodes = 3;
//   vector<vector<int>> graph = {{1}, {2}, {}};  // 0→1→2
//   BFSTree<int> tree = RunBFS(graph, num_nodes, /*source=*/0).value();
//   // tree.distance = [0, 1, 2], tree.parent = [0, 0, 1]
//   vector<int> path = GetBFSShortestPath(tree, 2).value();  // [0, 1, 2]

namespace ridegraph {

// Result of one BFS. Both vectors have num_nodes elements:
// - parent[i] is the node preceding #i on the shortest path from the source,
//   the source itself for the source, or -1 if #i wasn't reached;
// - distance[i] is the hop count from the source to #i, or -1 if #i wasn't
//   reached.
// When the search stopped early (see `stop_at` below), nodes that were not
// yet discovered are reported as unreached.
template <class NodeIndex = int>
struct BFSTree {
  NodeIndex source = -1;
  std::vector<NodeIndex> parent;
  std::vector<NodeIndex> distance;
};

// Runs a BFS in O(num_nodes + num_arcs) from `source`. If `stop_at` is a
// valid node, the search ends as soon as that node is dequeued: its distance
// and its ancestors are final, other nodes may be left unreached.
//
// TIE BREAKING: the parent of a node is always the first discovered node that
// has an arc to it, in the order of the adjacency lists.
template <class Graph, class NodeIndex = int>
absl::StatusOr<BFSTree<NodeIndex>> RunBFS(const Graph& graph,
                                          NodeIndex num_nodes,
                                          NodeIndex source,
                                          NodeIndex stop_at = -1);

// Returns the shortest path from the BFS source to `target`, in O(path
// length). `tree` must be exactly as returned by RunBFS().
// If `target` wasn't reached, returns the empty vector. Else the returned path
// always starts with the source and ends with the target (if source=target,
// returns [source]).
template <class NodeIndex>
absl::StatusOr<std::vector<NodeIndex>> GetBFSShortestPath(
    const BFSTree<NodeIndex>& tree, NodeIndex target);

// _____________________________________________________________________________
// Implementation of the templates.

template <class Graph, class NodeIndex>
absl::StatusOr<BFSTree<NodeIndex>> RunBFS(const Graph& graph,
                                          NodeIndex num_nodes,
                                          NodeIndex source,
                                          NodeIndex stop_at) {
  if (source < 0 || source >= num_nodes) {
    return absl::OutOfRangeError(absl::StrFormat(
        "source=%d is not in [0, num_nodes=%d)", source, num_nodes));
  }
  constexpr NodeIndex kNone = -1;  // NOLINT
  BFSTree<NodeIndex> tree;
  tree.source = source;
  tree.parent.assign(num_nodes, kNone);
  tree.distance.assign(num_nodes, kNone);
  tree.parent[source] = source;
  tree.distance[source] = 0;

  // The queue is a plain vector: nodes are never removed, only skipped over.
  std::vector<NodeIndex> bfs_queue = {source};
  size_t num_visited = 0;
  while (num_visited < bfs_queue.size()) {
    const NodeIndex node = bfs_queue[num_visited++];
    if (node == stop_at) break;
    const NodeIndex next_distance = tree.distance[node] + 1;
    for (const NodeIndex child : graph[node]) {
      if (child < 0 || child >= num_nodes) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid graph: graph[%d] contains %d, which is "
                            "not a valid node index in [0, num_nodes=%d)",
                            node, child, num_nodes));
      }
      if (tree.distance[child] != kNone) continue;  // Already discovered.
      tree.distance[child] = next_distance;
      tree.parent[child] = node;
      bfs_queue.push_back(child);
    }
  }
  return tree;
}

template <class NodeIndex>
absl::StatusOr<std::vector<NodeIndex>> GetBFSShortestPath(
    const BFSTree<NodeIndex>& tree, NodeIndex target) {
  const NodeIndex n = tree.parent.size();
  if (target < 0 || target >= n) {
    return absl::OutOfRangeError(
        absl::StrFormat("target=%d is not in [0, num_nodes=%d)", target, n));
  }

  std::vector<NodeIndex> path;
  constexpr NodeIndex kNone = -1;  // NOLINT
  if (tree.parent[target] == kNone) return path;
  path.reserve(tree.distance[target] + 1);
  while (true) {
    if (path.size() >= tree.parent.size()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Not a BFS tree: detected a cycle in the ascendance of node %d",
          target));
    }
    path.push_back(target);
    const NodeIndex parent = tree.parent[target];
    if (parent == target) break;
    if (parent < 0 || parent >= n) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Not a BFS tree: parent[%d]=%d is not in [0, num_nodes=%d)", target,
          parent, n));
    }
    target = parent;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

}  // namespace ridegraph

#endif  // RIDEGRAPH_GRAPH_BFS_H_
