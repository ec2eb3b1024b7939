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

#include "ridegraph/rides/route_stats.h"

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "ridegraph/rides/trip_record.h"

namespace ridegraph {

std::ostream& operator<<(std::ostream& out, const Route& route) {
  return out << route.origin << " -> " << route.destination;
}

std::ostream& operator<<(std::ostream& out, const RouteCount& route_count) {
  return out << route_count.route << ": " << route_count.count;
}

absl::StatusOr<std::vector<RouteCount>> TopKRoutes(
    absl::Span<const TripRecord> records, int k) {
  if (k < 0) {
    return absl::InvalidArgumentError(absl::StrFormat("k=%d is negative", k));
  }
  absl::flat_hash_map<Route, int> num_rides;
  for (const TripRecord& record : records) {
    ++num_rides[Route{record.origin, record.destination}];
  }

  std::vector<RouteCount> routes;
  routes.reserve(num_rides.size());
  for (const auto& [route, count] : num_rides) {
    routes.push_back({route, count});
  }
  const auto by_decreasing_count = [](const RouteCount& a,
                                      const RouteCount& b) {
    if (a.count != b.count) return a.count > b.count;
    return a.route < b.route;
  };
  if (k < static_cast<int>(routes.size())) {
    std::partial_sort(routes.begin(), routes.begin() + k, routes.end(),
                      by_decreasing_count);
    routes.resize(k);
  } else {
    std::sort(routes.begin(), routes.end(), by_decreasing_count);
  }
  return routes;
}

absl::flat_hash_map<TripCategory, HubCounts> CountHubsByCategory(
    absl::Span<const TripRecord> records) {
  absl::flat_hash_map<TripCategory, HubCounts> counts;
  for (const TripRecord& record : records) {
    HubCounts& category_counts = counts[record.category];
    ++category_counts[record.origin];
    ++category_counts[record.destination];
  }
  return counts;
}

std::string MostPopularHub(const HubCounts& counts) {
  const std::string* best_location = nullptr;
  int best_count = 0;
  for (const auto& [location, count] : counts) {
    if (best_location == nullptr || count > best_count ||
        (count == best_count && location < *best_location)) {
      best_location = &location;
      best_count = count;
    }
  }
  return best_location == nullptr ? "" : *best_location;
}

CategoryHubs PopularHubs(absl::Span<const TripRecord> records) {
  const absl::flat_hash_map<TripCategory, HubCounts> counts =
      CountHubsByCategory(records);
  CategoryHubs hubs;
  if (const auto it = counts.find(TripCategory::kPersonal); it != counts.end()) {
    hubs.personal = MostPopularHub(it->second);
  }
  if (const auto it = counts.find(TripCategory::kBusiness); it != counts.end()) {
    hubs.business = MostPopularHub(it->second);
  }
  return hubs;
}

}  // namespace ridegraph
