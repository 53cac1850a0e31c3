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

#ifndef TOURNEY_MODEL_DIVISION_H_
#define TOURNEY_MODEL_DIVISION_H_

#include <array>
#include <ostream>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace tourney {

// Teams and matches are partitioned by division. Play never crosses a
// division boundary, refereeing may.
enum class Division {
  kMixed = 0,
  kGendered = 1,
  kCloth = 2,
};

inline constexpr int kNumDivisions = 3;

// All divisions in declaration order.
inline constexpr std::array<Division, kNumDivisions> kAllDivisions = {
    Division::kMixed, Division::kGendered, Division::kCloth};

inline int DivisionIndex(Division division) {
  return static_cast<int>(division);
}

// Returns "mixed", "gendered" or "cloth".
absl::string_view DivisionName(Division division);

// Parses a division name, case-insensitively.
absl::StatusOr<Division> ParseDivision(absl::string_view name);

// Parses a comma-separated list of distinct divisions, e.g.
// "cloth, mixed, gendered".
absl::StatusOr<std::vector<Division>> ParseDivisionOrder(
    absl::string_view text);

std::ostream& operator<<(std::ostream& out, Division division);

}  // namespace tourney

#endif  // TOURNEY_MODEL_DIVISION_H_
