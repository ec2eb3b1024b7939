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

#ifndef RIDEGRAPH_RIDES_TRIP_RECORD_H_
#define RIDEGRAPH_RIDES_TRIP_RECORD_H_

#include <ostream>
#include <string>

#include "absl/strings/string_view.h"

namespace ridegraph {

enum class TripCategory { kBusiness, kPersonal };

// Location name used by ride logs when the place wasn't recorded.
inline constexpr absl::string_view kUnknownLocation = "Unknown Location";

// Returns "Business" or "Personal".
absl::string_view TripCategoryName(TripCategory category);

// One ride of the log. Several rides may share the same endpoints.
struct TripRecord {
  std::string origin;
  std::string destination;
  TripCategory category = TripCategory::kPersonal;

  bool operator==(const TripRecord& other) const {
    return origin == other.origin && destination == other.destination &&
           category == other.category;
  }
  bool operator!=(const TripRecord& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& out, TripCategory category);
std::ostream& operator<<(std::ostream& out, const TripRecord& record);

}  // namespace ridegraph

#endif  // RIDEGRAPH_RIDES_TRIP_RECORD_H_
