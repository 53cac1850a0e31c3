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

#ifndef TOURNEY_MODEL_SCHEDULE_H_
#define TOURNEY_MODEL_SCHEDULE_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "tourney/model/division.h"
#include "tourney/model/match.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/tournament.h"

namespace tourney {

class RuleSet;

// An assignment of matches to time slots and fields, together with the
// violations and score computed by the last call to Evaluate().
//
// A Schedule owns its matches: copying a Schedule copies every Match, so a
// copy can be mutated without affecting the original. The Tournament the
// matches refer to is immutable and shared between copies.
//
// Mutation operators never modify a schedule in place; they return a new
// Schedule, or a non-OK status when the move is not possible (unknown or
// locked matches, missing time slot, not enough fields). Such statuses are
// expected during search and are not errors of the caller.
class Schedule {
 public:
  // Validates the matches against the tournament:
  //  - every team handle must exist,
  //  - the two teams of a regular match must be distinct members of the
  //    match division,
  //  - special activities need at least their first team and are locked.
  static absl::StatusOr<Schedule> Create(
      std::shared_ptr<const Tournament> tournament, std::vector<Match> matches);

  Schedule(const Schedule&) = default;
  Schedule(Schedule&&) = default;
  Schedule& operator=(const Schedule&) = default;
  Schedule& operator=(Schedule&&) = default;

  // Returns an independent copy, including the last evaluation.
  Schedule DeepCopy() const { return *this; }

  // Sorts the matches by time slot (stable), then computes the violations and
  // the score:
  //   score = sum over rules of (#violations * priority)
  //         + #hard violations * rules.hard_constraint_weight().
  // The hard constraints (double booking, self refereeing, field conflicts)
  // are checked whatever the rules.
  int64_t Evaluate(const RuleSet& rules);

  bool evaluated() const { return evaluated_; }
  // Both are only meaningful after Evaluate().
  int64_t score() const { return score_; }
  const std::vector<RuleViolation>& violations() const { return violations_; }
  bool HasCriticalViolation() const;

  // Exchanges the time slot and field of two matches.
  absl::StatusOr<Schedule> SwapMatches(const Match& a, const Match& b) const;

  // Moves every match of `slot1` to `slot2` and vice versa. Fails if either
  // slot holds a locked match or a special activity; empty slots are fine.
  absl::StatusOr<Schedule> SwapTimeSlots(int slot1, int slot2) const;

  // Moves the given matches to an existing time slot, on fields not used by
  // the matches staying there.
  absl::StatusOr<Schedule> MoveMatchesToTimeSlot(
      absl::Span<const Match> matches, int target_slot) const;

  // Lays the unlocked matches out division after division, in `order`, one
  // match per time slot from slot 1, keeping their fields and referees.
  // Slots holding a locked match or a special activity are skipped. Every
  // division with an unlocked match must appear once in `order`.
  absl::StatusOr<Schedule> ArrangeDivisionBlocks(
      absl::Span<const Division> order) const;

  const Tournament& tournament() const { return *tournament_; }
  const std::shared_ptr<const Tournament>& shared_tournament() const {
    return tournament_;
  }

  const std::vector<Match>& matches() const { return matches_; }
  int num_matches() const { return matches_.size(); }
  const Match& match(int index) const { return matches_[index]; }

  // In-place access for the mutation operators of the search. Any access
  // discards the last evaluation.
  Match* mutable_match(int index);
  std::vector<Match>* mutable_matches();

  // Returns the index of the match with the same fixture identity, or -1.
  int FindMatch(const Match& match) const;

  // Indices of the matches of a slot, in schedule order.
  std::vector<int> MatchesInTimeSlot(int slot) const;

  // Distinct time slots, ascending.
  std::vector<int> TimeSlots() const;
  // Distinct time slots holding at least one regular match, ascending.
  std::vector<int> RegularTimeSlots() const;

  // Distinct fields used by any match, sorted.
  std::vector<std::string> Fields() const;
  int NumFields() const { return Fields().size(); }

  std::string DebugString() const;

 private:
  Schedule(std::shared_ptr<const Tournament> tournament,
           std::vector<Match> matches);

  void ClearEvaluation();

  std::shared_ptr<const Tournament> tournament_;
  std::vector<Match> matches_;
  bool evaluated_ = false;
  int64_t score_ = 0;
  std::vector<RuleViolation> violations_;
};

}  // namespace tourney

#endif  // TOURNEY_MODEL_SCHEDULE_H_
