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

#ifndef TOURNEY_MODEL_MATCH_H_
#define TOURNEY_MODEL_MATCH_H_

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "tourney/model/division.h"
#include "tourney/model/tournament.h"

namespace tourney {

enum class ActivityType {
  kRegular = 0,
  // Setting up the venue before the first game.
  kSetup = 1,
  // Packing the venue down after the last game.
  kPackingDown = 2,
};

absl::string_view ActivityTypeName(ActivityType activity);

// A game between two teams, or an administrative activity anchoring the start
// or the end of the day. Teams are referenced by handle into the Tournament
// the owning Schedule is built on, so copying a Match never copies a team.
class Match {
 public:
  Match(TeamIndex team1, TeamIndex team2, int time_slot, std::string field,
        Division division, TeamIndex referee = kNoTeam,
        ActivityType activity = ActivityType::kRegular, bool locked = false);

  // Convenience factories for the special activities. `team2` may be kNoTeam
  // when a single team is on duty.
  static Match Setup(TeamIndex team1, TeamIndex team2, int time_slot,
                     std::string field, Division division);
  static Match PackingDown(TeamIndex team1, TeamIndex team2, int time_slot,
                           std::string field, Division division);

  TeamIndex team1() const { return team1_; }
  TeamIndex team2() const { return team2_; }
  Division division() const { return division_; }
  ActivityType activity() const { return activity_; }

  int time_slot() const { return time_slot_; }
  void set_time_slot(int time_slot) { time_slot_ = time_slot; }

  const std::string& field() const { return field_; }
  void set_field(std::string field) { field_ = std::move(field); }

  TeamIndex referee() const { return referee_; }
  bool has_referee() const { return referee_ != kNoTeam; }
  void set_referee(TeamIndex referee) { referee_ = referee; }
  void clear_referee() { referee_ = kNoTeam; }

  // Special activities are always locked.
  bool locked() const { return locked_ || IsSpecialActivity(); }
  void set_locked(bool locked) { locked_ = locked; }

  bool IsSpecialActivity() const {
    return activity_ != ActivityType::kRegular;
  }
  bool IsSetup() const { return activity_ == ActivityType::kSetup; }
  bool IsPackingDown() const {
    return activity_ == ActivityType::kPackingDown;
  }

  // Whether `team` is one of the two sides of the match (for a special
  // activity, one of the teams on duty).
  bool IsPlaying(TeamIndex team) const {
    return team != kNoTeam && (team == team1_ || team == team2_);
  }
  bool IsRefereeing(TeamIndex team) const {
    return team != kNoTeam && team == referee_;
  }
  bool Involves(TeamIndex team) const {
    return IsPlaying(team) || IsRefereeing(team);
  }

  // The playing teams, without kNoTeam.
  std::vector<TeamIndex> PlayingTeams() const;
  // The playing teams followed by the referee, without kNoTeam.
  std::vector<TeamIndex> InvolvedTeams() const;

  // Identity used to locate a match in a schedule: same unordered team pair,
  // same time slot and same field.
  bool SameFixtureAs(const Match& other) const;

  // Same unordered team pair, division and activity, regardless of where and
  // when it is played.
  bool SamePairingAs(const Match& other) const;

  std::string DebugString(const Tournament& tournament) const;

 private:
  TeamIndex team1_;
  TeamIndex team2_;
  int time_slot_;
  std::string field_;
  Division division_;
  TeamIndex referee_;
  ActivityType activity_;
  bool locked_;
};

std::ostream& operator<<(std::ostream& out, const Match& match);

}  // namespace tourney

#endif  // TOURNEY_MODEL_MATCH_H_
