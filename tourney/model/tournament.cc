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

#include "tourney/model/tournament.h"

#include <array>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "tourney/base/status_macros.h"
#include "tourney/model/division.h"

namespace tourney {

absl::StatusOr<TeamIndex> Tournament::AddTeam(absl::string_view name,
                                              Division division) {
  const absl::string_view stripped = absl::StripAsciiWhitespace(name);
  if (stripped.empty()) {
    return absl::InvalidArgumentError("Team name must not be empty");
  }
  auto& index = team_by_name_[DivisionIndex(division)];
  const TeamIndex team = teams_.size();
  if (!index.emplace(std::string(stripped), team).second) {
    return absl::AlreadyExistsError(absl::StrCat("Duplicate team '", stripped,
                                                 "' in division ",
                                                 DivisionName(division)));
  }
  teams_.push_back({std::string(stripped), division, {}});
  return team;
}

absl::StatusOr<PlayerIndex> Tournament::AddPlayer(
    absl::string_view name,
    absl::Span<const std::pair<Division, std::string>> team_names) {
  const absl::string_view stripped = absl::StripAsciiWhitespace(name);
  if (stripped.empty()) {
    return absl::InvalidArgumentError("Player name must not be empty");
  }
  if (player_by_name_.contains(stripped)) {
    return absl::AlreadyExistsError(
        absl::StrCat("Duplicate player '", stripped, "'"));
  }
  // Validated before anything is registered.
  std::array<absl::string_view, kNumDivisions> requested;
  for (const auto& [division, team_name] : team_names) {
    const absl::string_view team = absl::StripAsciiWhitespace(team_name);
    if (team.empty()) continue;
    absl::string_view& slot = requested[DivisionIndex(division)];
    if (!slot.empty() && slot != team) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Player '", stripped, "' cannot play for both '", slot, "' and '",
          team, "' in division ", DivisionName(division)));
    }
    slot = team;
  }

  const PlayerIndex player = players_.size();
  players_.push_back({std::string(stripped)});
  player_by_name_[std::string(stripped)] = player;
  for (const Division division : kAllDivisions) {
    const absl::string_view team_name = requested[DivisionIndex(division)];
    if (team_name.empty()) continue;
    TeamIndex team = FindTeam(division, team_name);
    if (team == kNoTeam) {
      ASSIGN_OR_RETURN(team, AddTeam(team_name, division));
    }
    RETURN_IF_ERROR(AddPlayerToTeam(player, team));
  }
  return player;
}

absl::Status Tournament::AddPlayerToTeam(PlayerIndex player, TeamIndex team) {
  if (player < 0 || player >= num_players()) {
    return absl::OutOfRangeError(absl::StrCat("Invalid player: ", player));
  }
  if (!IsValidTeam(team)) {
    return absl::OutOfRangeError(absl::StrCat("Invalid team: ", team));
  }
  Team& t = teams_[team];
  TeamIndex& slot = players_[player].teams[DivisionIndex(t.division)];
  if (slot == team) return absl::OkStatus();
  if (slot != kNoTeam) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Player '", players_[player].name, "' already plays for '",
        teams_[slot].name, "' in division ", DivisionName(t.division)));
  }
  slot = team;
  t.players.push_back(player);
  return absl::OkStatus();
}

TeamIndex Tournament::FindTeam(Division division,
                               absl::string_view name) const {
  const auto& index = team_by_name_[DivisionIndex(division)];
  const auto it = index.find(absl::StripAsciiWhitespace(name));
  return it == index.end() ? kNoTeam : it->second;
}

TeamIndex Tournament::FindTeamInAnyDivision(absl::string_view name) const {
  for (const Division division : kAllDivisions) {
    const TeamIndex team = FindTeam(division, name);
    if (team != kNoTeam) return team;
  }
  return kNoTeam;
}

PlayerIndex Tournament::FindPlayer(absl::string_view name) const {
  const auto it = player_by_name_.find(absl::StripAsciiWhitespace(name));
  return it == player_by_name_.end() ? kNoPlayer : it->second;
}

bool Tournament::IsMember(PlayerIndex player, TeamIndex team) const {
  if (!IsValidTeam(team) || player < 0 || player >= num_players()) {
    return false;
  }
  return players_[player].team(teams_[team].division) == team;
}

const std::string& Tournament::TeamName(TeamIndex team) const {
  static const std::string* const kNone = new std::string("-");
  return IsValidTeam(team) ? teams_[team].name : *kNone;
}

}  // namespace tourney
