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

#ifndef TOURNEY_MODEL_RULE_VIOLATION_H_
#define TOURNEY_MODEL_RULE_VIOLATION_H_

#include <ostream>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "tourney/model/match.h"

namespace tourney {

// Ordered by increasing severity.
enum class ViolationLevel {
  kNote = 0,
  kWarning = 1,
  kAlert = 2,
  kCritical = 3,
};

absl::string_view ViolationLevelName(ViolationLevel level);

struct RuleViolation {
  // Name of the rule that reported the violation.
  std::string rule;
  std::string description;
  // Copies of the implicated matches, as they were when the schedule was
  // evaluated.
  std::vector<Match> matches;
  ViolationLevel level = ViolationLevel::kWarning;
  // Priority of the reporting rule.
  int priority = 1;
};

std::ostream& operator<<(std::ostream& out, const RuleViolation& violation);

}  // namespace tourney

#endif  // TOURNEY_MODEL_RULE_VIOLATION_H_
