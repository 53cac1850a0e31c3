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

// Reference data of a tournament: the players and the teams they form.
//
// A Tournament is filled once when the roster is imported and then shared,
// read-only, by every Schedule built on it. Teams and players are addressed
// through dense integer handles so that matches can be copied freely during
// search without copying (or aliasing) the roster.

#ifndef TOURNEY_MODEL_TOURNAMENT_H_
#define TOURNEY_MODEL_TOURNAMENT_H_

#include <array>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "tourney/model/division.h"

namespace tourney {

using TeamIndex = int;
using PlayerIndex = int;

inline constexpr TeamIndex kNoTeam = -1;
inline constexpr PlayerIndex kNoPlayer = -1;

struct Player {
  std::string name;
  // Team of the player in each division, kNoTeam when it does not play in
  // that division.
  std::array<TeamIndex, kNumDivisions> teams = {kNoTeam, kNoTeam, kNoTeam};

  TeamIndex team(Division division) const {
    return teams[DivisionIndex(division)];
  }
};

struct Team {
  std::string name;
  Division division = Division::kMixed;
  // In the order the players joined.
  std::vector<PlayerIndex> players;
};

class Tournament {
 public:
  Tournament() = default;

  // This type is neither copyable nor movable.
  Tournament(const Tournament&) = delete;
  Tournament& operator=(const Tournament&) = delete;

  // Registers a team. Names are unique within a division.
  absl::StatusOr<TeamIndex> AddTeam(absl::string_view name, Division division);

  // Registers a player with its team name in each division ("" for none).
  // Teams that do not exist yet are created. Nothing is registered when an
  // error is returned.
  absl::StatusOr<PlayerIndex> AddPlayer(
      absl::string_view name,
      absl::Span<const std::pair<Division, std::string>> team_names);

  // Adds a player to a team. A player belongs to at most one team per
  // division; adding it again to the same team is a no-op.
  absl::Status AddPlayerToTeam(PlayerIndex player, TeamIndex team);

  // Returns kNoTeam if there is no such team.
  TeamIndex FindTeam(Division division, absl::string_view name) const;
  // Looks in every division, in declaration order.
  TeamIndex FindTeamInAnyDivision(absl::string_view name) const;
  PlayerIndex FindPlayer(absl::string_view name) const;

  bool IsMember(PlayerIndex player, TeamIndex team) const;

  int num_teams() const { return teams_.size(); }
  int num_players() const { return players_.size(); }
  bool IsValidTeam(TeamIndex team) const {
    return team >= 0 && team < num_teams();
  }

  const Team& team(TeamIndex index) const { return teams_[index]; }
  const Player& player(PlayerIndex index) const { return players_[index]; }
  const std::vector<Team>& teams() const { return teams_; }
  const std::vector<Player>& players() const { return players_; }

  // Name of the team, or "-" for kNoTeam.
  const std::string& TeamName(TeamIndex team) const;

 private:
  std::vector<Team> teams_;
  std::vector<Player> players_;
  std::array<absl::flat_hash_map<std::string, TeamIndex>, kNumDivisions>
      team_by_name_;
  absl::flat_hash_map<std::string, PlayerIndex> player_by_name_;
};

}  // namespace tourney

#endif  // TOURNEY_MODEL_TOURNAMENT_H_
