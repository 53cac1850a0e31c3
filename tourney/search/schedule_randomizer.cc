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

#include "tourney/search/schedule_randomizer.h"

#include <algorithm>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/random/bit_gen_ref.h"
#include "absl/random/distributions.h"
#include "absl/strings/string_view.h"
#include "tourney/model/division.h"
#include "tourney/model/match.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/schedule.h"
#include "tourney/search/optimizer_parameters.pb.h"
#include "tourney/search/referee_assignment.h"

namespace tourney {
namespace {

std::vector<int> MovableMatches(const Schedule& schedule) {
  std::vector<int> indices;
  for (int i = 0; i < schedule.num_matches(); ++i) {
    if (!schedule.match(i).locked()) indices.push_back(i);
  }
  return indices;
}

// Movable matches grouped by division, each group sorted by time slot.
absl::btree_map<Division, std::vector<int>> MovableMatchesByDivision(
    const Schedule& schedule) {
  absl::btree_map<Division, std::vector<int>> groups;
  for (const int index : MovableMatches(schedule)) {
    groups[schedule.match(index).division()].push_back(index);
  }
  for (auto& [division, indices] : groups) {
    std::stable_sort(indices.begin(), indices.end(), [&](int a, int b) {
      return schedule.match(a).time_slot() < schedule.match(b).time_slot();
    });
  }
  return groups;
}

void SwapTimeSlotAndField(Match* a, Match* b) {
  const int slot = a->time_slot();
  std::string field = a->field();
  a->set_time_slot(b->time_slot());
  a->set_field(b->field());
  b->set_time_slot(slot);
  b->set_field(std::move(field));
}

}  // namespace

absl::string_view RandomizationKindName(RandomizationKind kind) {
  switch (kind) {
    case RandomizationKind::kBlockShuffle:
      return "block_shuffle";
    case RandomizationKind::kDivisionShuffle:
      return "division_shuffle";
    case RandomizationKind::kScatter:
      return "scatter";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& out, RandomizationKind kind) {
  return out << RandomizationKindName(kind);
}

int FixFieldConflicts(Schedule* schedule, absl::BitGenRef random) {
  const std::vector<std::string> fields = schedule->Fields();
  absl::btree_map<int, std::vector<int>> matches_by_slot;
  for (int i = 0; i < schedule->num_matches(); ++i) {
    matches_by_slot[schedule->match(i).time_slot()].push_back(i);
  }

  int num_unresolved = 0;
  for (const auto& [slot, indices] : matches_by_slot) {
    absl::flat_hash_set<std::string> used;
    int slot_unresolved = 0;
    for (const int index : indices) {
      const Match& match = schedule->match(index);
      if (match.locked() && !used.insert(match.field()).second) {
        ++slot_unresolved;
      }
    }
    std::vector<int> conflicting;
    for (const int index : indices) {
      const Match& match = schedule->match(index);
      if (!match.locked() && !used.insert(match.field()).second) {
        conflicting.push_back(index);
      }
    }
    if (!conflicting.empty()) {
      std::vector<std::string> free_fields;
      for (const std::string& field : fields) {
        if (!used.contains(field)) free_fields.push_back(field);
      }
      std::shuffle(free_fields.begin(), free_fields.end(), random);
      for (const int index : conflicting) {
        if (free_fields.empty()) {
          ++slot_unresolved;
          continue;
        }
        schedule->mutable_match(index)->set_field(free_fields.back());
        free_fields.pop_back();
      }
    }
    if (slot_unresolved > 0) {
      LOG_FIRST_N(WARNING, 10)
          << "Time slot " << slot << " has " << indices.size()
          << " matches for " << fields.size() << " fields";
    }
    num_unresolved += slot_unresolved;
  }
  return num_unresolved;
}

ScheduleRandomizer::ScheduleRandomizer(
    const RandomizationParameters& parameters, absl::BitGenRef random)
    : parameters_(parameters), random_(random) {}

Schedule ScheduleRandomizer::Randomize(const Schedule& schedule) {
  Schedule result = schedule.DeepCopy();
  const double draw = absl::Uniform(random_, 0.0, 1.0);
  if (draw < parameters_.block_shuffle_probability()) {
    last_kind_ = RandomizationKind::kBlockShuffle;
    BlockShuffle(&result);
  } else if (draw < parameters_.block_shuffle_probability() +
                        parameters_.division_shuffle_probability()) {
    last_kind_ = RandomizationKind::kDivisionShuffle;
    DivisionShuffle(&result);
  } else if (Scatter(&result)) {
    last_kind_ = RandomizationKind::kScatter;
  } else {
    last_kind_ = RandomizationKind::kDivisionShuffle;
    DivisionShuffle(&result);
  }
  FixFieldConflicts(&result, random_);
  const RefereeAssignmentStats stats = ReassignReferees(&result, random_);
  VLOG(3) << last_kind_ << ": " << stats.num_assigned
          << " referees assigned, " << stats.num_unassigned << " missing";
  return result;
}

void ScheduleRandomizer::BlockShuffle(Schedule* schedule) {
  const absl::btree_map<Division, std::vector<int>> blocks =
      MovableMatchesByDivision(*schedule);
  if (blocks.empty()) return;
  std::vector<int> slots;
  std::vector<Division> order;
  for (const auto& [division, indices] : blocks) {
    order.push_back(division);
    for (const int index : indices) {
      slots.push_back(schedule->match(index).time_slot());
    }
  }
  std::sort(slots.begin(), slots.end());
  std::shuffle(order.begin(), order.end(), random_);

  std::vector<Match>& matches = *schedule->mutable_matches();
  int next = 0;
  for (const Division division : order) {
    for (const int index : blocks.at(division)) {
      matches[index].set_time_slot(slots[next++]);
    }
  }
}

void ScheduleRandomizer::DivisionShuffle(Schedule* schedule) {
  const absl::btree_map<Division, std::vector<int>> groups =
      MovableMatchesByDivision(*schedule);
  if (groups.empty()) return;
  std::vector<Match>& matches = *schedule->mutable_matches();
  for (const auto& [division, indices] : groups) {
    std::vector<int> slots;
    slots.reserve(indices.size());
    for (const int index : indices) slots.push_back(matches[index].time_slot());
    std::shuffle(slots.begin(), slots.end(), random_);
    for (int i = 0; i < indices.size(); ++i) {
      matches[indices[i]].set_time_slot(slots[i]);
    }
  }
}

bool ScheduleRandomizer::Scatter(Schedule* schedule) {
  std::vector<int> movable = MovableMatches(*schedule);
  if (movable.empty()) return true;

  const int num_fields = schedule->NumFields();
  absl::btree_map<int, int> capacity;
  for (const int slot : schedule->RegularTimeSlots()) {
    capacity[slot] = num_fields;
  }
  for (const Match& match : schedule->matches()) {
    const auto it = capacity.find(match.time_slot());
    if (match.locked() && it != capacity.end()) --it->second;
  }
  std::vector<int> open_slots;
  int total_capacity = 0;
  for (const auto& [slot, free] : capacity) {
    if (free <= 0) continue;
    open_slots.push_back(slot);
    total_capacity += free;
  }
  if (total_capacity < movable.size()) return false;

  std::shuffle(movable.begin(), movable.end(), random_);
  std::vector<Match>& matches = *schedule->mutable_matches();
  for (const int index : movable) {
    DCHECK(!open_slots.empty());
    const int pick = absl::Uniform<int>(random_, 0, open_slots.size());
    const int slot = open_slots[pick];
    matches[index].set_time_slot(slot);
    if (--capacity[slot] == 0) {
      open_slots[pick] = open_slots.back();
      open_slots.pop_back();
    }
  }
  return true;
}

Schedule ScheduleRandomizer::Crossover(const Schedule& first,
                                       const Schedule& second,
                                       double division_probability) {
  Schedule child = first.DeepCopy();
  const std::vector<Match>& donors = second.matches();
  for (const Division division : kAllDivisions) {
    if (!absl::Bernoulli(random_, division_probability)) continue;
    std::vector<bool> used(donors.size(), false);
    for (Match& match : *child.mutable_matches()) {
      if (match.division() != division || match.locked()) continue;
      for (int j = 0; j < donors.size(); ++j) {
        const Match& donor = donors[j];
        if (used[j] || donor.locked() || !donor.SamePairingAs(match)) continue;
        used[j] = true;
        match.set_time_slot(donor.time_slot());
        match.set_field(donor.field());
        match.set_referee(donor.referee());
        break;
      }
    }
  }
  FixFieldConflicts(&child, random_);
  return child;
}

void ScheduleRandomizer::PartialScramble(Schedule* schedule, double fraction) {
  const std::vector<int> movable = MovableMatches(*schedule);
  if (movable.size() < 2) return;
  const int num_swaps =
      std::max(1, static_cast<int>(movable.size() * fraction / 2));
  std::vector<Match>& matches = *schedule->mutable_matches();
  for (int i = 0; i < num_swaps; ++i) {
    const int a = absl::Uniform<int>(random_, 0, movable.size());
    int b = absl::Uniform<int>(random_, 0, movable.size() - 1);
    if (b >= a) ++b;
    SwapTimeSlotAndField(&matches[movable[a]], &matches[movable[b]]);
  }
}

bool ScheduleRandomizer::StrategicSwap(Schedule* schedule) {
  // Movable matches named by each violation, for the violations having any.
  std::vector<std::pair<int, std::vector<int>>> targets;
  int top_priority = 0;
  for (const RuleViolation& violation : schedule->violations()) {
    std::vector<int> named;
    for (const Match& match : violation.matches) {
      const int index = schedule->FindMatch(match);
      if (index < 0 || schedule->match(index).locked()) continue;
      if (std::find(named.begin(), named.end(), index) == named.end()) {
        named.push_back(index);
      }
    }
    if (named.empty()) continue;
    top_priority = targets.empty()
                       ? violation.priority
                       : std::max(top_priority, violation.priority);
    targets.emplace_back(violation.priority, std::move(named));
  }
  targets.erase(std::remove_if(targets.begin(), targets.end(),
                               [top_priority](const auto& target) {
                                 return target.first != top_priority;
                               }),
                targets.end());
  if (targets.empty()) return false;

  const std::vector<int>& named =
      targets[absl::Uniform<int>(random_, 0, targets.size())].second;
  int a = named[0];
  int b = -1;
  if (named.size() >= 2) {
    const int i = absl::Uniform<int>(random_, 0, named.size());
    int j = absl::Uniform<int>(random_, 0, named.size() - 1);
    if (j >= i) ++j;
    a = named[i];
    b = named[j];
  } else {
    std::vector<int> others = MovableMatches(*schedule);
    others.erase(std::remove(others.begin(), others.end(), a), others.end());
    if (others.empty()) return false;
    b = others[absl::Uniform<int>(random_, 0, others.size())];
  }
  std::vector<Match>& matches = *schedule->mutable_matches();
  SwapTimeSlotAndField(&matches[a], &matches[b]);
  return true;
}

}  // namespace tourney
