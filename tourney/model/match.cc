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

#include "tourney/model/match.h"

#include <algorithm>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace tourney {

absl::string_view ActivityTypeName(ActivityType activity) {
  switch (activity) {
    case ActivityType::kRegular:
      return "REGULAR";
    case ActivityType::kSetup:
      return "SETUP";
    case ActivityType::kPackingDown:
      return "PACKING_DOWN";
  }
  return "UNKNOWN";
}

Match::Match(TeamIndex team1, TeamIndex team2, int time_slot,
             std::string field, Division division, TeamIndex referee,
             ActivityType activity, bool locked)
    : team1_(team1),
      team2_(team2),
      time_slot_(time_slot),
      field_(std::move(field)),
      division_(division),
      referee_(referee),
      activity_(activity),
      locked_(locked) {}

Match Match::Setup(TeamIndex team1, TeamIndex team2, int time_slot,
                   std::string field, Division division) {
  return Match(team1, team2, time_slot, std::move(field), division, kNoTeam,
               ActivityType::kSetup, /*locked=*/true);
}

Match Match::PackingDown(TeamIndex team1, TeamIndex team2, int time_slot,
                         std::string field, Division division) {
  return Match(team1, team2, time_slot, std::move(field), division, kNoTeam,
               ActivityType::kPackingDown, /*locked=*/true);
}

std::vector<TeamIndex> Match::PlayingTeams() const {
  std::vector<TeamIndex> teams;
  if (team1_ != kNoTeam) teams.push_back(team1_);
  if (team2_ != kNoTeam && team2_ != team1_) teams.push_back(team2_);
  return teams;
}

std::vector<TeamIndex> Match::InvolvedTeams() const {
  std::vector<TeamIndex> teams = PlayingTeams();
  if (referee_ != kNoTeam &&
      std::find(teams.begin(), teams.end(), referee_) == teams.end()) {
    teams.push_back(referee_);
  }
  return teams;
}

bool Match::SameFixtureAs(const Match& other) const {
  return SamePairingAs(other) && time_slot_ == other.time_slot_ &&
         field_ == other.field_;
}

bool Match::SamePairingAs(const Match& other) const {
  const bool same_teams =
      (team1_ == other.team1_ && team2_ == other.team2_) ||
      (team1_ == other.team2_ && team2_ == other.team1_);
  return same_teams && division_ == other.division_ &&
         activity_ == other.activity_;
}

std::string Match::DebugString(const Tournament& tournament) const {
  std::string result = absl::StrCat(
      "[slot ", time_slot_, " ", field_, " ", DivisionName(division_), "] ");
  if (IsSpecialActivity()) {
    absl::StrAppend(&result, ActivityTypeName(activity_), " ",
                    tournament.TeamName(team1_));
    if (team2_ != kNoTeam) {
      absl::StrAppend(&result, " & ", tournament.TeamName(team2_));
    }
  } else {
    absl::StrAppend(&result, tournament.TeamName(team1_), " vs ",
                    tournament.TeamName(team2_));
  }
  if (referee_ != kNoTeam) {
    absl::StrAppend(&result, " (ref: ", tournament.TeamName(referee_), ")");
  }
  if (locked_ && !IsSpecialActivity()) absl::StrAppend(&result, " locked");
  return result;
}

std::ostream& operator<<(std::ostream& out, const Match& match) {
  out << "{team1: " << match.team1() << ", team2: " << match.team2()
      << ", slot: " << match.time_slot() << ", field: " << match.field()
      << ", division: " << match.division()
      << ", referee: " << match.referee()
      << ", activity: " << ActivityTypeName(match.activity())
      << (match.locked() ? ", locked" : "") << "}";
  return out;
}

}  // namespace tourney
