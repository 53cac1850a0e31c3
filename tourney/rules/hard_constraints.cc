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

#include "tourney/rules/hard_constraints.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tourney/model/match.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/schedule.h"
#include "tourney/model/tournament.h"

namespace tourney {
namespace {

RuleViolation CriticalViolation(absl::string_view rule,
                                std::string description,
                                std::vector<Match> matches) {
  RuleViolation violation;
  violation.rule = std::string(rule);
  violation.description = std::move(description);
  violation.matches = std::move(matches);
  violation.level = ViolationLevel::kCritical;
  return violation;
}

}  // namespace

std::vector<RuleViolation> FindHardConstraintViolations(
    const Schedule& schedule) {
  const Tournament& tournament = schedule.tournament();
  // Keyed by time slot, then by team or field.
  absl::btree_map<int, absl::btree_map<TeamIndex, std::vector<Match>>> roles;
  absl::btree_map<int, absl::btree_map<std::string, std::vector<Match>>>
      fields;
  std::vector<RuleViolation> violations;

  for (const Match& match : schedule.matches()) {
    for (const TeamIndex team : match.InvolvedTeams()) {
      roles[match.time_slot()][team].push_back(match);
    }
    fields[match.time_slot()][match.field()].push_back(match);
    if (match.has_referee() && match.IsPlaying(match.referee())) {
      violations.push_back(CriticalViolation(
          kSelfRefereeingRuleName,
          absl::StrCat("Team ", tournament.TeamName(match.referee()),
                       " referees its own match in time slot ",
                       match.time_slot()),
          {match}));
    }
  }

  for (auto& [slot, by_team] : roles) {
    for (auto& [team, matches] : by_team) {
      if (matches.size() < 2) continue;
      violations.push_back(CriticalViolation(
          kDoubleBookingRuleName,
          absl::StrCat("Team ", tournament.TeamName(team), " has ",
                       matches.size(), " assignments in time slot ", slot),
          std::move(matches)));
    }
  }
  for (auto& [slot, by_field] : fields) {
    for (auto& [field, matches] : by_field) {
      if (matches.size() < 2) continue;
      violations.push_back(CriticalViolation(
          kFieldConflictRuleName,
          absl::StrCat(matches.size(), " matches share ", field,
                       " in time slot ", slot),
          std::move(matches)));
    }
  }
  return violations;
}

}  // namespace tourney
