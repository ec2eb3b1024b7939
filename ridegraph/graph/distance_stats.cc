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

#include "ridegraph/graph/distance_stats.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "ridegraph/base/threadpool.h"
#include "ridegraph/base/timer.h"
#include "ridegraph/graph/hop_paths.h"

namespace ridegraph {
namespace {

void ComputeOneSourceDistances(const AdjacencyList* adjacency, int source,
                               std::vector<int>* table,
                               absl::Status* status) {
  absl::StatusOr<std::vector<int>> distances =
      BfsDistances(*adjacency, source);
  if (!distances.ok()) {
    *status = distances.status();
    return;
  }
  *table = *std::move(distances);
}

}  // namespace

std::string DistanceStats::DebugString() const {
  return absl::StrFormat("mean: %.2f, stddev: %.2f, max: %d (%d pairs)", mean,
                         stddev, max, num_finite_pairs);
}

absl::StatusOr<std::vector<std::vector<int>>> AllBfsDistances(
    const AdjacencyList& adjacency, int num_threads) {
  const int num_nodes = adjacency.size();
  std::vector<std::vector<int>> tables(num_nodes);
  std::vector<absl::Status> statuses(num_nodes);
  WallTimer timer;
  timer.Start();
  if (num_threads <= 1 || num_nodes <= 1) {
    for (int source = 0; source < num_nodes; ++source) {
      ComputeOneSourceDistances(&adjacency, source, &tables[source],
                                &statuses[source]);
    }
  } else {
    ThreadPool pool(std::min(num_threads, num_nodes));
    pool.StartWorkers();
    for (int source = 0; source < num_nodes; ++source) {
      pool.Schedule([&adjacency, source, &tables, &statuses] {
        ComputeOneSourceDistances(&adjacency, source, &tables[source],
                                  &statuses[source]);
      });
    }
    // The pool destructor waits for all the tasks.
  }
  for (const absl::Status& status : statuses) {
    if (!status.ok()) return status;
  }
  VLOG(2) << "Elapsed time to compute " << num_nodes
          << " BFS distance tables: " << timer.Get() << "s";
  return tables;
}

DistanceStats ComputeDistanceStats(
    absl::Span<const std::vector<int>> distance_tables) {
  DistanceStats stats;
  double sum = 0.0;
  for (const std::vector<int>& table : distance_tables) {
    for (const int distance : table) {
      if (distance == kUnreachable) continue;
      DCHECK_GE(distance, 0);
      sum += distance;
      stats.max = std::max(stats.max, distance);
      ++stats.num_finite_pairs;
    }
  }
  if (stats.num_finite_pairs == 0) return stats;
  stats.mean = sum / stats.num_finite_pairs;

  double sum_of_squared_deviations = 0.0;
  for (const std::vector<int>& table : distance_tables) {
    for (const int distance : table) {
      if (distance == kUnreachable) continue;
      const double deviation = distance - stats.mean;
      sum_of_squared_deviations += deviation * deviation;
    }
  }
  stats.stddev = std::sqrt(sum_of_squared_deviations / stats.num_finite_pairs);
  return stats;
}

}  // namespace ridegraph
