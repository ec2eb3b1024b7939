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

// Counting statistics over the rides of a log: most frequent direct routes,
// and most visited location of each trip category.

#ifndef RIDEGRAPH_RIDES_ROUTE_STATS_H_
#define RIDEGRAPH_RIDES_ROUTE_STATS_H_

#include <ostream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "ridegraph/rides/trip_record.h"

namespace ridegraph {

// A direct origin -> destination route. Routes are ordered by origin, then by
// destination.
struct Route {
  std::string origin;
  std::string destination;

  bool operator==(const Route& other) const {
    return origin == other.origin && destination == other.destination;
  }
  bool operator<(const Route& other) const {
    return std::tie(origin, destination) <
           std::tie(other.origin, other.destination);
  }

  template <typename H>
  friend H AbslHashValue(H h, const Route& route) {
    return H::combine(std::move(h), route.origin, route.destination);
  }
};

struct RouteCount {
  Route route;
  int count = 0;

  bool operator==(const RouteCount& other) const {
    return route == other.route && count == other.count;
  }
};

std::ostream& operator<<(std::ostream& out, const Route& route);
std::ostream& operator<<(std::ostream& out, const RouteCount& route_count);

// Returns the `k` routes taken by the most rides, by decreasing number of
// rides. Routes with the same number of rides are sorted by increasing Route.
// Returns all the routes if there are fewer than `k` of them.
// Returns an InvalidArgument error if k < 0.
absl::StatusOr<std::vector<RouteCount>> TopKRoutes(
    absl::Span<const TripRecord> records, int k);

// For each category, the number of times each location is the origin or the
// destination of a ride of that category. A ride from a location to itself
// counts twice. Categories without rides have no entry.
using HubCounts = absl::flat_hash_map<std::string, int>;
absl::flat_hash_map<TripCategory, HubCounts> CountHubsByCategory(
    absl::Span<const TripRecord> records);

// Returns the location with the largest count, the smallest name among the
// largest counts, or "" if `counts` is empty.
std::string MostPopularHub(const HubCounts& counts);

// The most popular hub of each category, or "" if there are no rides of that
// category.
struct CategoryHubs {
  std::string personal;
  std::string business;

  bool operator==(const CategoryHubs& other) const {
    return personal == other.personal && business == other.business;
  }
};

CategoryHubs PopularHubs(absl::Span<const TripRecord> records);

}  // namespace ridegraph

#endif  // RIDEGRAPH_RIDES_ROUTE_STATS_H_
