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

#include "ridegraph/rides/ride_analysis.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"
#include "ridegraph/base/status_macros.h"
#include "ridegraph/graph/distance_stats.h"
#include "ridegraph/graph/hop_paths.h"
#include "ridegraph/rides/location_graph.h"
#include "ridegraph/rides/record_source.h"
#include "ridegraph/rides/route_stats.h"
#include "ridegraph/rides/trip_record.h"

namespace ridegraph {

absl::StatusOr<RideAnalysis> AnalyzeRides(absl::Span<const TripRecord> records,
                                          const AnalysisOptions& options) {
  const LocationGraph graph = BuildLocationGraph(records);
  RideAnalysis analysis;
  analysis.num_rides = records.size();
  analysis.num_locations = graph.num_nodes();
  analysis.num_arcs = graph.num_arcs();
  LOG(INFO) << "Built location graph: " << analysis.num_locations
            << " locations, " << analysis.num_arcs << " arcs.";

  ASSIGN_OR_RETURN(analysis.top_routes, TopKRoutes(records, options.top_k));
  analysis.hubs = PopularHubs(records);

  // The most frequent route is needed even when top_k = 0.
  std::vector<RouteCount> top_route;
  ASSIGN_OR_RETURN(top_route, TopKRoutes(records, 1));
  if (!top_route.empty()) {
    const Route& route = top_route.front().route;
    const std::optional<int> start = graph.FindLocation(route.origin);
    const std::optional<int> end = graph.FindLocation(route.destination);
    CHECK(start.has_value() && end.has_value()) << route;
    std::vector<int> path;
    ASSIGN_OR_RETURN(path, ShortestPath(graph.adjacency, *start, *end));
    for (const int node : path) {
      analysis.top_route_path.push_back(graph.location_names[node]);
    }
  }

  std::vector<std::vector<int>> distance_tables;
  ASSIGN_OR_RETURN(distance_tables,
                   AllBfsDistances(graph.adjacency, options.num_threads));
  analysis.distance_stats = ComputeDistanceStats(distance_tables);
  LOG(INFO) << "Graph hops: " << analysis.distance_stats.DebugString();
  return analysis;
}

absl::StatusOr<RideAnalysis> RunRideAnalysis(RecordSource* source,
                                             const AnalysisOptions& options) {
  CHECK(source != nullptr);
  std::vector<TripRecord> records;
  ASSIGN_OR_RETURN(records, source->ReadRecords());
  const int64_t num_read = records.size();
  records = FilterUnknownLocations(std::move(records));
  LOG(INFO) << "Kept " << records.size() << " of " << num_read
            << " rides with known locations.";
  return AnalyzeRides(records, options);
}

std::string FormatRideAnalysis(const RideAnalysis& analysis) {
  std::string report =
      absl::StrFormat("Total rides after filter: %d\n", analysis.num_rides);
  absl::StrAppendFormat(&report, "\nTop %d routes:\n",
                        analysis.top_routes.size());
  for (const RouteCount& route_count : analysis.top_routes) {
    absl::StrAppendFormat(&report, "  %s -> %s: %d trips\n",
                          route_count.route.origin,
                          route_count.route.destination, route_count.count);
  }
  absl::StrAppendFormat(&report, "\nPersonal: %s\nBusiness: %s\n",
                        analysis.hubs.personal, analysis.hubs.business);
  if (!analysis.top_route_path.empty()) {
    absl::StrAppendFormat(&report, "\nShortest %s->%s: [%s]\n",
                          analysis.top_route_path.front(),
                          analysis.top_route_path.back(),
                          absl::StrJoin(analysis.top_route_path, ", "));
  }
  absl::StrAppendFormat(&report,
                        "\nGraph hops: mean %.2f, stddev %.2f, max %d\n",
                        analysis.distance_stats.mean,
                        analysis.distance_stats.stddev,
                        analysis.distance_stats.max);
  return report;
}

}  // namespace ridegraph
