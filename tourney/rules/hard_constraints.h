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

#ifndef TOURNEY_RULES_HARD_CONSTRAINTS_H_
#define TOURNEY_RULES_HARD_CONSTRAINTS_H_

#include <vector>

#include "absl/strings/string_view.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/schedule.h"

namespace tourney {

inline constexpr absl::string_view kDoubleBookingRuleName =
    "Prevent team double booking";
inline constexpr absl::string_view kSelfRefereeingRuleName =
    "Prevent self refereeing";
inline constexpr absl::string_view kFieldConflictRuleName =
    "Prevent field conflicts";

// Checks the invariants no configuration can disable. All the violations
// returned are critical:
//  - a team holds more than one role (playing, refereeing, special activity
//    duty) in a time slot,
//  - a team referees its own match,
//  - two matches of a time slot share a field.
// The priority of the returned violations is left to the caller.
std::vector<RuleViolation> FindHardConstraintViolations(
    const Schedule& schedule);

}  // namespace tourney

#endif  // TOURNEY_RULES_HARD_CONSTRAINTS_H_
