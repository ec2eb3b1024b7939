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

#include "ridegraph/rides/location_graph.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/log/check.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "ridegraph/rides/trip_record.h"

namespace ridegraph {

int64_t LocationGraph::num_arcs() const {
  int64_t num_arcs = 0;
  for (const std::vector<int>& heads : adjacency) num_arcs += heads.size();
  return num_arcs;
}

std::optional<int> LocationGraph::FindLocation(absl::string_view name) const {
  const auto it = location_index.find(name);
  if (it == location_index.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> UniqueLocations(absl::Span<const TripRecord> records) {
  absl::btree_set<std::string> locations;
  for (const TripRecord& record : records) {
    locations.insert(record.origin);
    locations.insert(record.destination);
  }
  return std::vector<std::string>(locations.begin(), locations.end());
}

LocationGraph BuildLocationGraph(absl::Span<const TripRecord> records) {
  LocationGraph graph;
  graph.location_names = UniqueLocations(records);
  const int num_nodes = graph.location_names.size();
  graph.location_index.reserve(num_nodes);
  for (int i = 0; i < num_nodes; ++i) {
    graph.location_index[graph.location_names[i]] = i;
  }
  graph.adjacency.resize(num_nodes);
  for (const TripRecord& record : records) {
    const std::optional<int> tail = graph.FindLocation(record.origin);
    const std::optional<int> head = graph.FindLocation(record.destination);
    // Both endpoints were inserted above.
    DCHECK(tail.has_value() && head.has_value()) << record;
    if (!tail.has_value() || !head.has_value()) continue;
    graph.adjacency[*tail].push_back(*head);
  }
  return graph;
}

}  // namespace ridegraph
