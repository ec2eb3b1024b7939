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

// Runs every ride-log analysis once and formats the results.

#ifndef RIDEGRAPH_RIDES_RIDE_ANALYSIS_H_
#define RIDEGRAPH_RIDES_RIDE_ANALYSIS_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "ridegraph/graph/distance_stats.h"
#include "ridegraph/rides/record_source.h"
#include "ridegraph/rides/route_stats.h"
#include "ridegraph/rides/trip_record.h"

namespace ridegraph {

struct AnalysisOptions {
  // Number of most frequent routes to report. Must be non-negative.
  int top_k = 5;
  // Number of threads of the all-pairs BFS; 1 runs it on the calling thread.
  int num_threads = 1;
};

struct RideAnalysis {
  int64_t num_rides = 0;
  int num_locations = 0;
  int64_t num_arcs = 0;
  std::vector<RouteCount> top_routes;
  CategoryHubs hubs;
  // Location names along a shortest path between the endpoints of the most
  // frequent route. Empty if there are no rides.
  std::vector<std::string> top_route_path;
  DistanceStats distance_stats;
};

// `records` are analyzed as given; see RunRideAnalysis() for the filtering of
// unknown locations.
absl::StatusOr<RideAnalysis> AnalyzeRides(absl::Span<const TripRecord> records,
                                          const AnalysisOptions& options);

// Reads the rides of `source`, drops those with an unknown endpoint, and
// analyzes the rest.
absl::StatusOr<RideAnalysis> RunRideAnalysis(RecordSource* source,
                                             const AnalysisOptions& options);

// Returns a multi-line human-readable report.
std::string FormatRideAnalysis(const RideAnalysis& analysis);

}  // namespace ridegraph

#endif  // RIDEGRAPH_RIDES_RIDE_ANALYSIS_H_
