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

// Random perturbations of a schedule used by the search strategies.
//
// None of them moves a locked match: special activities and matches locked by
// the user keep their time slot and field. The matches perturbed keep their
// teams and division; only their time slot, field and referee change.

#ifndef TOURNEY_SEARCH_SCHEDULE_RANDOMIZER_H_
#define TOURNEY_SEARCH_SCHEDULE_RANDOMIZER_H_

#include <ostream>

#include "absl/random/bit_gen_ref.h"
#include "absl/strings/string_view.h"
#include "tourney/model/schedule.h"
#include "tourney/search/optimizer_parameters.pb.h"

namespace tourney {

enum class RandomizationKind {
  kBlockShuffle,
  kDivisionShuffle,
  kScatter,
};

absl::string_view RandomizationKindName(RandomizationKind kind);
std::ostream& operator<<(std::ostream& out, RandomizationKind kind);

// Makes the fields of the matches sharing a time slot distinct. In each slot,
// locked matches keep their field, then the first match on each field keeps
// it and the others take fields unused in the slot, drawn at random. Returns
// the number of matches left in conflict because the slot has more matches
// than there are fields.
int FixFieldConflicts(Schedule* schedule, absl::BitGenRef random);

class ScheduleRandomizer {
 public:
  // `random` must outlive the randomizer.
  ScheduleRandomizer(const RandomizationParameters& parameters,
                     absl::BitGenRef random);

  // Returns a perturbed copy of `schedule`, with field conflicts fixed and
  // referees reassigned. The kind of perturbation is drawn according to the
  // parameters; see last_kind().
  Schedule Randomize(const Schedule& schedule);
  RandomizationKind last_kind() const { return last_kind_; }

  // Shuffles the order of the divisions, then gives each division, as a
  // contiguous block, the next time slots of the sorted multiset of slots of
  // the movable matches. Matches keep their relative order within a division.
  void BlockShuffle(Schedule* schedule);

  // Shuffles the matches of each division among the time slots that division
  // already uses.
  void DivisionShuffle(Schedule* schedule);

  // Puts each movable match in a random existing time slot, without
  // exceeding the number of fields in any slot. Returns false, leaving the
  // schedule untouched, when the slots cannot hold all the matches.
  bool Scatter(Schedule* schedule);

  // Returns a copy of `first` in which, for each division with probability
  // `division_probability`, the movable matches take the time slot, field and
  // referee of the same pairing in `second`.
  Schedule Crossover(const Schedule& first, const Schedule& second,
                     double division_probability);

  // Exchanges the time slot and field of random pairs of movable matches,
  // about `fraction` of them in total. At least one pair is swapped.
  void PartialScramble(Schedule* schedule, double fraction);

  // Picks a random violation among those of highest priority in the last
  // evaluation of `schedule` and exchanges the time slot and field of two of
  // its movable matches, or of its only movable match and another random one.
  // Returns false, leaving the schedule untouched, when no such swap exists.
  bool StrategicSwap(Schedule* schedule);

 private:
  const RandomizationParameters parameters_;
  absl::BitGenRef random_;
  RandomizationKind last_kind_ = RandomizationKind::kDivisionShuffle;
};

}  // namespace tourney

#endif  // TOURNEY_SEARCH_SCHEDULE_RANDOMIZER_H_
