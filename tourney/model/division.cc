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

#include "tourney/model/division.h"

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "tourney/base/status_macros.h"

namespace tourney {

absl::string_view DivisionName(Division division) {
  switch (division) {
    case Division::kMixed:
      return "mixed";
    case Division::kGendered:
      return "gendered";
    case Division::kCloth:
      return "cloth";
  }
  return "unknown";
}

absl::StatusOr<Division> ParseDivision(absl::string_view name) {
  const std::string lower =
      absl::AsciiStrToLower(absl::StripAsciiWhitespace(name));
  for (const Division division : kAllDivisions) {
    if (lower == DivisionName(division)) return division;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown division: '", name, "'"));
}

absl::StatusOr<std::vector<Division>> ParseDivisionOrder(
    absl::string_view text) {
  std::vector<Division> order;
  for (const absl::string_view name : absl::StrSplit(text, ',')) {
    ASSIGN_OR_RETURN(const Division division, ParseDivision(name));
    if (std::find(order.begin(), order.end(), division) != order.end()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Division listed twice: ", DivisionName(division)));
    }
    order.push_back(division);
  }
  return order;
}

std::ostream& operator<<(std::ostream& out, Division division) {
  return out << DivisionName(division);
}

}  // namespace tourney
