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

#ifndef TOURNEY_SEARCH_REFEREE_ASSIGNMENT_H_
#define TOURNEY_SEARCH_REFEREE_ASSIGNMENT_H_

#include "absl/random/bit_gen_ref.h"
#include "tourney/model/division.h"
#include "tourney/model/schedule.h"

namespace tourney {

struct RefereeAssignmentStats {
  int num_assigned = 0;
  // Matches left without a referee because no team was free.
  int num_unassigned = 0;
};

// Redistributes the referees of the regular, unlocked matches of every
// division after their time slots changed.
//
// The referees of a division are drawn from the teams already refereeing one
// of its matches, in a random order. Time slots are visited in ascending
// order and each match takes the next team of the cycling pool that:
//  - does not play in the match,
//  - neither plays nor referees anywhere else in the time slot.
// When the whole pool is busy, any team of the division free in the slot is
// used instead. A match with no free candidate is left without referee. Teams
// already refereeing in a slot are tracked across divisions, since refereeing
// may cross divisions.
RefereeAssignmentStats ReassignReferees(Schedule* schedule,
                                        absl::BitGenRef random);

}  // namespace tourney

#endif  // TOURNEY_SEARCH_REFEREE_ASSIGNMENT_H_
