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

#include "ridegraph/rides/record_source.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/log/vlog_is_on.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "ridegraph/base/filelineiter.h"
#include "ridegraph/rides/trip_record.h"

namespace ridegraph {
namespace {
constexpr int kCategoryColumn = 2;
constexpr int kStartColumn = 3;
constexpr int kStopColumn = 4;
constexpr int kMinNumColumns = 5;

bool IsKnownLocation(absl::string_view location) {
  return !location.empty() && location != kUnknownLocation;
}
}  // namespace

std::optional<TripRecord> CsvRideLogSource::ParseLine(absl::string_view line) {
  const std::vector<absl::string_view> columns =
      absl::StrSplit(absl::StripAsciiWhitespace(line), ',');
  if (columns.size() < kMinNumColumns) return std::nullopt;
  TripRecord record;
  record.category = columns[kCategoryColumn] == "Business"
                        ? TripCategory::kBusiness
                        : TripCategory::kPersonal;
  record.origin = std::string(columns[kStartColumn]);
  record.destination = std::string(columns[kStopColumn]);
  return record;
}

bool CsvRideLogSource::IsHeaderLine(absl::string_view line) {
  const std::vector<absl::string_view> columns =
      absl::StrSplit(absl::StripAsciiWhitespace(line), ',');
  return columns.size() >= kMinNumColumns &&
         columns[kCategoryColumn] == "CATEGORY";
}

absl::StatusOr<std::vector<TripRecord>> CsvRideLogSource::ReadRecords() {
  FileLines lines(filename_);
  if (!lines.ok()) {
    return absl::NotFoundError(absl::StrCat("Cannot open ", filename_));
  }
  std::vector<TripRecord> records;
  int line_number = 0;
  for (const std::string& line : lines) {
    ++line_number;
    if (line_number == 1 && IsHeaderLine(line)) continue;
    std::optional<TripRecord> record = ParseLine(line);
    if (!record.has_value()) {
      VLOG(1) << filename_ << ":" << line_number
              << ": skipping line with fewer than " << kMinNumColumns
              << " columns: '" << line << "'";
      continue;
    }
    records.push_back(*std::move(record));
  }
  VLOG(1) << "Read " << records.size() << " rides from " << filename_;
  return records;
}

std::vector<TripRecord> FilterUnknownLocations(
    std::vector<TripRecord> records) {
  records.erase(std::remove_if(records.begin(), records.end(),
                               [](const TripRecord& record) {
                                 return !IsKnownLocation(record.origin) ||
                                        !IsKnownLocation(record.destination);
                               }),
                records.end());
  return records;
}

}  // namespace ridegraph
