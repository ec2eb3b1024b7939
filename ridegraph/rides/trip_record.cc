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

#include "ridegraph/rides/trip_record.h"

#include <ostream>

#include "absl/log/log.h"
#include "absl/strings/string_view.h"

namespace ridegraph {

absl::string_view TripCategoryName(TripCategory category) {
  switch (category) {
    case TripCategory::kBusiness:
      return "Business";
    case TripCategory::kPersonal:
      return "Personal";
  }
  LOG(DFATAL) << "Unknown trip category: " << static_cast<int>(category);
  return "";
}

std::ostream& operator<<(std::ostream& out, TripCategory category) {
  return out << TripCategoryName(category);
}

std::ostream& operator<<(std::ostream& out, const TripRecord& record) {
  return out << record.origin << " -> " << record.destination << " ("
             << record.category << ")";
}

}  // namespace ridegraph
