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

// Analyzes a ride log:
//   ride_graph_main --input=UberDataset.csv --top_k=5 --num_threads=4

#include <cstdlib>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/log/globals.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "ridegraph/base/init_google.h"
#include "ridegraph/base/logging.h"
#include "ridegraph/base/timer.h"
#include "ridegraph/rides/record_source.h"
#include "ridegraph/rides/ride_analysis.h"

ABSL_FLAG(std::string, input, "", "Ride log (.csv) file name.");
ABSL_FLAG(int, top_k, 5, "Number of most frequent routes to report.");
ABSL_FLAG(int, num_threads, 1,
          "Number of threads used to compute the all-pairs hop distances.");

namespace ridegraph {
int Run(const std::string& filename) {
  WallTimer timer;
  timer.Start();
  AnalysisOptions options;
  options.top_k = absl::GetFlag(FLAGS_top_k);
  options.num_threads = absl::GetFlag(FLAGS_num_threads);

  CsvRideLogSource source(filename);
  const absl::StatusOr<RideAnalysis> analysis =
      RunRideAnalysis(&source, options);
  if (!analysis.ok()) {
    LOG(ERROR) << "Cannot analyze " << filename << ": " << analysis.status();
    return EXIT_FAILURE;
  }
  std::cout << FormatRideAnalysis(*analysis);
  LOG(INFO) << "Analysis done in " << timer.Get() << "s";
  return EXIT_SUCCESS;
}
}  // namespace ridegraph

int main(int argc, char** argv) {
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  InitGoogle(argv[0], &argc, &argv);
  if (absl::GetFlag(FLAGS_input).empty()) {
    LOG(FATAL) << "Please supply a ride log with --input=";
  }
  return ridegraph::Run(absl::GetFlag(FLAGS_input));
}
