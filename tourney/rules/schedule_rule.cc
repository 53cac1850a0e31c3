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

#include "tourney/rules/schedule_rule.h"

#include <string>
#include <utility>
#include <vector>

#include "tourney/model/match.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/schedule.h"

namespace tourney {

RuleViolation ScheduleRule::MakeViolation(std::string description,
                                          std::vector<Match> matches,
                                          ViolationLevel level) const {
  RuleViolation violation;
  violation.rule = name_;
  violation.description = std::move(description);
  violation.matches = std::move(matches);
  violation.level = level;
  violation.priority = priority_;
  return violation;
}

std::vector<RuleViolation> FunctionRule::Evaluate(
    const Schedule& schedule) const {
  if (!function_) return {};
  std::vector<RuleViolation> violations = function_(schedule);
  for (RuleViolation& violation : violations) {
    violation.rule = name();
    violation.priority = priority();
  }
  return violations;
}

const ScheduleRule* RuleSet::FindRule(const std::string& name) const {
  for (const auto& rule : rules_) {
    if (rule->name() == name) return rule.get();
  }
  return nullptr;
}

}  // namespace tourney
