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

#include "tourney/model/schedule.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "tourney/base/status_macros.h"
#include "tourney/model/division.h"
#include "tourney/model/match.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/tournament.h"
#include "tourney/rules/hard_constraints.h"
#include "tourney/rules/schedule_rule.h"

namespace tourney {
namespace {

absl::Status ValidateMatch(const Tournament& tournament, const Match& match,
                           int index) {
  const auto error = [&](auto... args) {
    return absl::InvalidArgumentError(
        absl::StrCat("Match #", index, " ", args...));
  };
  if (!tournament.IsValidTeam(match.team1())) {
    return error("references unknown team ", match.team1());
  }
  if (match.team2() != kNoTeam && !tournament.IsValidTeam(match.team2())) {
    return error("references unknown team ", match.team2());
  }
  if (match.referee() != kNoTeam && !tournament.IsValidTeam(match.referee())) {
    return error("references unknown referee team ", match.referee());
  }
  if (match.field().empty()) return error("has no field");
  if (match.IsSpecialActivity()) return absl::OkStatus();

  if (match.team2() == kNoTeam) return error("has a single team");
  if (match.team1() == match.team2()) {
    return error("opposes team '", tournament.TeamName(match.team1()),
                 "' to itself");
  }
  for (const TeamIndex team : {match.team1(), match.team2()}) {
    if (tournament.team(team).division != match.division()) {
      return error("plays team '", tournament.TeamName(team), "' of division ",
                   DivisionName(tournament.team(team).division),
                   " in division ", DivisionName(match.division()));
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<Schedule> Schedule::Create(
    std::shared_ptr<const Tournament> tournament, std::vector<Match> matches) {
  if (tournament == nullptr) {
    return absl::InvalidArgumentError("A schedule needs a tournament");
  }
  for (int i = 0; i < matches.size(); ++i) {
    RETURN_IF_ERROR(ValidateMatch(*tournament, matches[i], i));
    if (matches[i].IsSpecialActivity()) matches[i].set_locked(true);
  }
  return Schedule(std::move(tournament), std::move(matches));
}

Schedule::Schedule(std::shared_ptr<const Tournament> tournament,
                   std::vector<Match> matches)
    : tournament_(std::move(tournament)), matches_(std::move(matches)) {}

int64_t Schedule::Evaluate(const RuleSet& rules) {
  std::stable_sort(matches_.begin(), matches_.end(),
                   [](const Match& a, const Match& b) {
                     return a.time_slot() < b.time_slot();
                   });
  violations_.clear();
  score_ = 0;

  for (RuleViolation& violation : FindHardConstraintViolations(*this)) {
    violation.priority = rules.hard_constraint_weight();
    score_ += rules.hard_constraint_weight();
    violations_.push_back(std::move(violation));
  }
  for (const auto& rule : rules.rules()) {
    std::vector<RuleViolation> found = rule->Evaluate(*this);
    score_ += static_cast<int64_t>(found.size()) * rule->priority();
    for (RuleViolation& violation : found) {
      violations_.push_back(std::move(violation));
    }
  }
  evaluated_ = true;
  VLOG(3) << "Evaluated schedule: score " << score_ << ", "
          << violations_.size() << " violations";
  return score_;
}

bool Schedule::HasCriticalViolation() const {
  return std::any_of(violations_.begin(), violations_.end(),
                     [](const RuleViolation& violation) {
                       return violation.level == ViolationLevel::kCritical;
                     });
}

absl::StatusOr<Schedule> Schedule::SwapMatches(const Match& a,
                                               const Match& b) const {
  const int first = FindMatch(a);
  const int second = FindMatch(b);
  if (first < 0 || second < 0) {
    return absl::NotFoundError("Cannot swap matches missing from the schedule");
  }
  if (first == second) {
    return absl::InvalidArgumentError("Cannot swap a match with itself");
  }
  if (matches_[first].locked() || matches_[second].locked()) {
    return absl::FailedPreconditionError("Cannot swap locked matches");
  }
  Schedule result = DeepCopy();
  result.ClearEvaluation();
  Match& x = result.matches_[first];
  Match& y = result.matches_[second];
  const int slot = x.time_slot();
  std::string field = x.field();
  x.set_time_slot(y.time_slot());
  x.set_field(y.field());
  y.set_time_slot(slot);
  y.set_field(std::move(field));
  return result;
}

absl::StatusOr<Schedule> Schedule::SwapTimeSlots(int slot1, int slot2) const {
  for (const Match& match : matches_) {
    if (match.time_slot() != slot1 && match.time_slot() != slot2) continue;
    if (match.locked()) {
      return absl::FailedPreconditionError(
          absl::StrCat("Time slot ", match.time_slot(),
                       " holds a locked match or a special activity"));
    }
  }
  Schedule result = DeepCopy();
  result.ClearEvaluation();
  if (slot1 == slot2) return result;
  for (Match& match : result.matches_) {
    if (match.time_slot() == slot1) {
      match.set_time_slot(slot2);
    } else if (match.time_slot() == slot2) {
      match.set_time_slot(slot1);
    }
  }
  return result;
}

absl::StatusOr<Schedule> Schedule::MoveMatchesToTimeSlot(
    absl::Span<const Match> matches, int target_slot) const {
  if (matches.empty()) {
    return absl::InvalidArgumentError("No match to move");
  }
  absl::btree_set<int> moved;
  for (const Match& match : matches) {
    const int index = FindMatch(match);
    if (index < 0) {
      return absl::NotFoundError(
          absl::StrCat("Match not found: ", match.DebugString(tournament())));
    }
    if (matches_[index].locked()) {
      return absl::FailedPreconditionError(absl::StrCat(
          "Cannot move locked match: ", match.DebugString(tournament())));
    }
    moved.insert(index);
  }

  bool slot_exists = false;
  absl::flat_hash_set<std::string> used_fields;
  int staying = 0;
  for (int i = 0; i < matches_.size(); ++i) {
    const Match& match = matches_[i];
    if (match.time_slot() != target_slot) continue;
    slot_exists = true;
    if (match.IsSpecialActivity()) {
      return absl::FailedPreconditionError(absl::StrCat(
          "Time slot ", target_slot, " holds a special activity"));
    }
    if (moved.contains(i)) continue;
    ++staying;
    used_fields.insert(match.field());
  }
  if (!slot_exists) {
    return absl::FailedPreconditionError(
        absl::StrCat("Time slot ", target_slot, " does not exist"));
  }
  const int num_fields = NumFields();
  const int occupancy = staying + static_cast<int>(moved.size());
  if (occupancy > num_fields) {
    return absl::ResourceExhaustedError(
        absl::StrCat("Time slot ", target_slot, " cannot hold ", occupancy,
                     " matches on ", num_fields, " fields"));
  }

  std::vector<std::string> free_fields;
  for (std::string& field : Fields()) {
    if (!used_fields.contains(field)) free_fields.push_back(std::move(field));
  }
  DCHECK_GE(free_fields.size(), moved.size());
  Schedule result = DeepCopy();
  result.ClearEvaluation();
  int next_field = 0;
  for (const int index : moved) {
    Match& match = result.matches_[index];
    match.set_time_slot(target_slot);
    match.set_field(free_fields[next_field++]);
  }
  return result;
}

absl::StatusOr<Schedule> Schedule::ArrangeDivisionBlocks(
    absl::Span<const Division> order) const {
  std::array<bool, kNumDivisions> listed = {false, false, false};
  for (const Division division : order) {
    bool& seen = listed[DivisionIndex(division)];
    if (seen) {
      return absl::InvalidArgumentError(
          absl::StrCat("Division listed twice: ", DivisionName(division)));
    }
    seen = true;
  }
  absl::btree_set<int> occupied;
  for (const Match& match : matches_) {
    if (match.locked()) {
      occupied.insert(match.time_slot());
    } else if (!listed[DivisionIndex(match.division())]) {
      return absl::InvalidArgumentError(
          absl::StrCat("Division missing from the order: ",
                       DivisionName(match.division())));
    }
  }

  Schedule result = DeepCopy();
  result.ClearEvaluation();
  int slot = 1;
  for (const Division division : order) {
    for (Match& match : result.matches_) {
      if (match.locked() || match.division() != division) continue;
      while (occupied.contains(slot)) ++slot;
      match.set_time_slot(slot++);
    }
  }
  return result;
}

Match* Schedule::mutable_match(int index) {
  ClearEvaluation();
  return &matches_[index];
}

std::vector<Match>* Schedule::mutable_matches() {
  ClearEvaluation();
  return &matches_;
}

int Schedule::FindMatch(const Match& match) const {
  for (int i = 0; i < matches_.size(); ++i) {
    if (matches_[i].SameFixtureAs(match)) return i;
  }
  return -1;
}

std::vector<int> Schedule::MatchesInTimeSlot(int slot) const {
  std::vector<int> result;
  for (int i = 0; i < matches_.size(); ++i) {
    if (matches_[i].time_slot() == slot) result.push_back(i);
  }
  return result;
}

std::vector<int> Schedule::TimeSlots() const {
  absl::btree_set<int> slots;
  for (const Match& match : matches_) slots.insert(match.time_slot());
  return std::vector<int>(slots.begin(), slots.end());
}

std::vector<int> Schedule::RegularTimeSlots() const {
  absl::btree_set<int> slots;
  for (const Match& match : matches_) {
    if (!match.IsSpecialActivity()) slots.insert(match.time_slot());
  }
  return std::vector<int>(slots.begin(), slots.end());
}

std::vector<std::string> Schedule::Fields() const {
  absl::btree_set<std::string> fields;
  for (const Match& match : matches_) fields.insert(match.field());
  return std::vector<std::string>(fields.begin(), fields.end());
}

std::string Schedule::DebugString() const {
  std::string result;
  for (const Match& match : matches_) {
    absl::StrAppend(&result, match.DebugString(tournament()), "\n");
  }
  if (evaluated_) {
    absl::StrAppend(&result, "score: ", score_, " (", violations_.size(),
                    " violations)\n");
  }
  return result;
}

void Schedule::ClearEvaluation() {
  evaluated_ = false;
  score_ = 0;
  violations_.clear();
}

}  // namespace tourney
