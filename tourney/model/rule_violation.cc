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

#include "tourney/model/rule_violation.h"

#include <ostream>

#include "absl/strings/string_view.h"

namespace tourney {

absl::string_view ViolationLevelName(ViolationLevel level) {
  switch (level) {
    case ViolationLevel::kNote:
      return "note";
    case ViolationLevel::kWarning:
      return "warning";
    case ViolationLevel::kAlert:
      return "alert";
    case ViolationLevel::kCritical:
      return "critical";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& out, const RuleViolation& violation) {
  return out << "[" << ViolationLevelName(violation.level) << "] "
             << violation.rule << ": " << violation.description << " ("
             << violation.matches.size() << " matches, priority "
             << violation.priority << ")";
}

}  // namespace tourney
