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

// The directed graph of the locations of a ride log: one node per distinct
// location, one arc per ride.

#ifndef RIDEGRAPH_RIDES_LOCATION_GRAPH_H_
#define RIDEGRAPH_RIDES_LOCATION_GRAPH_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "ridegraph/graph/hop_paths.h"
#include "ridegraph/rides/trip_record.h"

namespace ridegraph {

// Node #i is the location location_names[i]. The names are sorted, so the
// numbering only depends on the set of locations, not on the ride order.
// A LocationGraph isn't meant to be modified after BuildLocationGraph().
struct LocationGraph {
  std::vector<std::string> location_names;
  absl::flat_hash_map<std::string, int> location_index;
  // adjacency[u] has one entry per ride leaving u, in ride order.
  AdjacencyList adjacency;

  int num_nodes() const { return location_names.size(); }
  int64_t num_arcs() const;

  // Returns the node of the location, or nullopt if no ride goes through it.
  std::optional<int> FindLocation(absl::string_view name) const;
};

// Returns the sorted list of all the origins and destinations, without
// duplicates.
std::vector<std::string> UniqueLocations(absl::Span<const TripRecord> records);

// Builds the graph in O(R log R) for R rides. An empty log gives an empty
// graph.
LocationGraph BuildLocationGraph(absl::Span<const TripRecord> records);

}  // namespace ridegraph

#endif  // RIDEGRAPH_RIDES_LOCATION_GRAPH_H_
