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

#include "tourney/search/referee_assignment.h"

#include <algorithm>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/random/bit_gen_ref.h"
#include "tourney/model/division.h"
#include "tourney/model/match.h"
#include "tourney/model/schedule.h"
#include "tourney/model/tournament.h"

namespace tourney {
namespace {

// Teams holding a role in each time slot.
using SlotRoles = absl::flat_hash_map<int, absl::flat_hash_set<TeamIndex>>;

bool IsReassignable(const Match& match) {
  return !match.IsSpecialActivity() && !match.locked();
}

}  // namespace

RefereeAssignmentStats ReassignReferees(Schedule* schedule,
                                        absl::BitGenRef random) {
  RefereeAssignmentStats stats;
  const Tournament& tournament = schedule->tournament();
  std::vector<Match>& matches = *schedule->mutable_matches();

  SlotRoles playing;
  SlotRoles refereeing;
  for (const Match& match : matches) {
    for (const TeamIndex team : match.PlayingTeams()) {
      playing[match.time_slot()].insert(team);
    }
    if (match.has_referee() && !IsReassignable(match)) {
      refereeing[match.time_slot()].insert(match.referee());
    }
  }
  const auto is_free = [&](TeamIndex team, const Match& match) {
    if (match.IsPlaying(team)) return false;
    const int slot = match.time_slot();
    const auto busy = [&](const SlotRoles& roles) {
      const auto it = roles.find(slot);
      return it != roles.end() && it->second.contains(team);
    };
    return !busy(playing) && !busy(refereeing);
  };

  for (const Division division : kAllDivisions) {
    std::vector<int> indices;
    std::vector<TeamIndex> pool;
    absl::btree_set<TeamIndex> division_teams;
    for (int i = 0; i < matches.size(); ++i) {
      const Match& match = matches[i];
      if (match.division() != division || !IsReassignable(match)) continue;
      indices.push_back(i);
      division_teams.insert(match.team1());
      division_teams.insert(match.team2());
      if (match.has_referee() &&
          std::find(pool.begin(), pool.end(), match.referee()) == pool.end()) {
        pool.push_back(match.referee());
      }
    }
    if (pool.empty()) continue;
    std::shuffle(pool.begin(), pool.end(), random);
    std::stable_sort(indices.begin(), indices.end(), [&](int a, int b) {
      return matches[a].time_slot() < matches[b].time_slot();
    });
    for (const int index : indices) matches[index].clear_referee();

    int cursor = 0;
    for (const int index : indices) {
      Match& match = matches[index];
      TeamIndex referee = kNoTeam;
      for (int attempt = 0; attempt < pool.size(); ++attempt) {
        const TeamIndex candidate = pool[cursor++ % pool.size()];
        if (is_free(candidate, match)) {
          referee = candidate;
          break;
        }
      }
      if (referee == kNoTeam) {
        for (const TeamIndex candidate : division_teams) {
          if (is_free(candidate, match)) {
            referee = candidate;
            break;
          }
        }
      }
      if (referee == kNoTeam) {
        ++stats.num_unassigned;
        VLOG(1) << "No free referee for "
                << match.DebugString(tournament);
        continue;
      }
      match.set_referee(referee);
      refereeing[match.time_slot()].insert(referee);
      ++stats.num_assigned;
    }
  }
  return stats;
}

}  // namespace tourney
