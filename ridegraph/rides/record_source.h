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

// Where the rides come from. The analysis only sees a RecordSource, so tests
// and callers holding records in memory don't need a file.
//
// The ride log format is a comma-separated text file with a header line:
//   START_DATE,END_DATE,CATEGORY,START,STOP,MILES,PURPOSE
//   01-01-2016 21:11,01-01-2016 21:17,Business,Fort Pierce,Fort Pierce,5.1,
// Only the CATEGORY, START and STOP columns are used.

#ifndef RIDEGRAPH_RIDES_RECORD_SOURCE_H_
#define RIDEGRAPH_RIDES_RECORD_SOURCE_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "ridegraph/rides/trip_record.h"

namespace ridegraph {

class RecordSource {
 public:
  virtual ~RecordSource() = default;

  // Returns all the rides, in log order.
  virtual absl::StatusOr<std::vector<TripRecord>> ReadRecords() = 0;
};

class InMemoryRecordSource : public RecordSource {
 public:
  explicit InMemoryRecordSource(std::vector<TripRecord> records)
      : records_(std::move(records)) {}

  absl::StatusOr<std::vector<TripRecord>> ReadRecords() override {
    return records_;
  }

 private:
  const std::vector<TripRecord> records_;
};

class CsvRideLogSource : public RecordSource {
 public:
  explicit CsvRideLogSource(std::string filename)
      : filename_(std::move(filename)) {}

  // Returns a NotFound error if the file can't be opened. The first line is
  // skipped if it is a header, and so are lines with fewer than 5 columns.
  absl::StatusOr<std::vector<TripRecord>> ReadRecords() override;

  // Parses one data line. Any category other than "Business" is personal.
  static std::optional<TripRecord> ParseLine(absl::string_view line);

  // True iff the CATEGORY column holds the literal column name.
  static bool IsHeaderLine(absl::string_view line);

 private:
  const std::string filename_;
};

// Returns the records whose origin and destination are both non-empty and
// different from kUnknownLocation, in the same order.
std::vector<TripRecord> FilterUnknownLocations(
    std::vector<TripRecord> records);

}  // namespace ridegraph

#endif  // RIDEGRAPH_RIDES_RECORD_SOURCE_H_
