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

#include "tourney/rules/builtin_rules.h"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "tourney/model/division.h"
#include "tourney/model/match.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/schedule.h"
#include "tourney/model/tournament.h"

namespace tourney {
namespace {

using MatchList = std::vector<const Match*>;

// The matches of the schedule, stably sorted by time slot.
MatchList SortedMatches(const Schedule& schedule, bool regular_only) {
  MatchList matches;
  matches.reserve(schedule.num_matches());
  for (const Match& match : schedule.matches()) {
    if (regular_only && match.IsSpecialActivity()) continue;
    matches.push_back(&match);
  }
  std::stable_sort(matches.begin(), matches.end(),
                   [](const Match* a, const Match* b) {
                     return a->time_slot() < b->time_slot();
                   });
  return matches;
}

std::vector<Match> Copies(const MatchList& matches) {
  std::vector<Match> result;
  result.reserve(matches.size());
  for (const Match* match : matches) result.push_back(*match);
  return result;
}

absl::btree_map<int, MatchList> GroupByTimeSlot(const MatchList& matches) {
  absl::btree_map<int, MatchList> result;
  for (const Match* match : matches) {
    result[match->time_slot()].push_back(match);
  }
  return result;
}

absl::btree_map<TeamIndex, MatchList> GroupByPlayingTeam(
    const MatchList& matches) {
  absl::btree_map<TeamIndex, MatchList> result;
  for (const Match* match : matches) {
    for (const TeamIndex team : match->PlayingTeams()) {
      result[team].push_back(match);
    }
  }
  return result;
}

absl::btree_map<TeamIndex, MatchList> GroupByInvolvedTeam(
    const MatchList& matches) {
  absl::btree_map<TeamIndex, MatchList> result;
  for (const Match* match : matches) {
    for (const TeamIndex team : match->InvolvedTeams()) {
      result[team].push_back(match);
    }
  }
  return result;
}

// Matches played by any team of each player. Refereeing is a team duty and
// does not count.
absl::btree_map<PlayerIndex, MatchList> GroupByPlayer(
    const Tournament& tournament, const MatchList& matches) {
  absl::btree_map<PlayerIndex, MatchList> result;
  for (const Match* match : matches) {
    for (const TeamIndex team : match->PlayingTeams()) {
      for (const PlayerIndex player : tournament.team(team).players) {
        MatchList& list = result[player];
        if (list.empty() || list.back() != match) list.push_back(match);
      }
    }
  }
  return result;
}

std::vector<TeamIndex> TeamsOf(const Tournament& tournament,
                               PlayerIndex player) {
  std::vector<TeamIndex> teams;
  for (const TeamIndex team : tournament.player(player).teams) {
    if (team != kNoTeam) teams.push_back(team);
  }
  return teams;
}

// Maximal runs of at least two matches in strictly consecutive time slots.
// `matches` must be sorted by time slot.
std::vector<MatchList> ConsecutiveRuns(const MatchList& matches) {
  std::vector<MatchList> runs;
  int start = 0;
  for (int i = 1; i <= matches.size(); ++i) {
    if (i < matches.size() &&
        matches[i]->time_slot() == matches[i - 1]->time_slot() + 1) {
      continue;
    }
    if (i - start >= 2) {
      runs.emplace_back(matches.begin() + start, matches.begin() + i);
    }
    start = i;
  }
  return runs;
}

}  // namespace

std::vector<RuleViolation> AvoidBackToBackGames::Evaluate(
    const Schedule& schedule) const {
  const Tournament& tournament = schedule.tournament();
  const MatchList matches = SortedMatches(schedule, /*regular_only=*/true);
  std::vector<RuleViolation> violations;

  const auto report = [&](absl::string_view entity, const MatchList& run) {
    const int first = run.front()->time_slot();
    const int last = run.back()->time_slot();
    const std::string description =
        run.size() == 2
            ? absl::StrCat(entity, ": 2 back-to-back games in time slots ",
                           first, " and ", last)
            : absl::StrCat(entity, ": ", run.size(),
                           " consecutive games in time slots ", first, " and ",
                           last);
    violations.push_back(
        MakeViolation(description, Copies(run), ViolationLevel::kWarning));
  };

  absl::flat_hash_map<TeamIndex, std::vector<MatchList>> team_runs;
  for (const auto& [team, team_matches] : GroupByPlayingTeam(matches)) {
    for (MatchList& run : ConsecutiveRuns(team_matches)) {
      report(absl::StrCat("Team ", tournament.TeamName(team)), run);
      team_runs[team].push_back(std::move(run));
    }
  }
  for (const auto& [player, player_matches] :
       GroupByPlayer(tournament, matches)) {
    const std::vector<TeamIndex> teams = TeamsOf(tournament, player);
    for (const MatchList& run : ConsecutiveRuns(player_matches)) {
      const bool covered =
          std::any_of(teams.begin(), teams.end(), [&](TeamIndex team) {
            const auto it = team_runs.find(team);
            return it != team_runs.end() &&
                   std::find(it->second.begin(), it->second.end(), run) !=
                       it->second.end();
          });
      if (covered) continue;
      report(absl::StrCat("Player ", tournament.player(player).name), run);
    }
  }
  return violations;
}

std::vector<RuleViolation> AvoidFirstAndLastGame::Evaluate(
    const Schedule& schedule) const {
  const Tournament& tournament = schedule.tournament();
  const MatchList matches = SortedMatches(schedule, /*regular_only=*/false);
  std::vector<RuleViolation> violations;

  int first_slot = 0;
  int last_slot = 0;
  bool has_regular = false;
  for (const Match* match : matches) {
    if (match->IsSpecialActivity()) continue;
    if (!has_regular) first_slot = match->time_slot();
    last_slot = match->time_slot();
    has_regular = true;
  }
  if (!has_regular) return violations;

  // A single slot day belongs to both periods.
  MatchList first_period;
  MatchList last_period;
  for (const Match* match : matches) {
    if (match->IsSetup() ||
        (!match->IsSpecialActivity() && match->time_slot() == first_slot)) {
      first_period.push_back(match);
    }
    if (match->IsPackingDown() ||
        (!match->IsSpecialActivity() && match->time_slot() == last_slot)) {
      last_period.push_back(match);
    }
  }

  // On special activities every role counts, in games only playing does.
  const auto team_appears = [](const Match& match, TeamIndex team) {
    return match.IsSpecialActivity() ? match.Involves(team)
                                     : match.IsPlaying(team);
  };
  const auto teams_of_period = [&](const MatchList& period) {
    absl::btree_set<TeamIndex> teams;
    for (const Match* match : period) {
      for (const TeamIndex team : match->InvolvedTeams()) {
        if (team_appears(*match, team)) teams.insert(team);
      }
    }
    return teams;
  };
  const auto players_of_period = [&](const MatchList& period) {
    absl::btree_set<PlayerIndex> players;
    for (const Match* match : period) {
      for (const TeamIndex team : match->PlayingTeams()) {
        const auto& members = tournament.team(team).players;
        players.insert(members.begin(), members.end());
      }
    }
    return players;
  };
  // Matches of both periods selected by `keep`, each once.
  const auto relevant_matches = [&](const auto& keep) {
    MatchList result;
    for (const MatchList* period : {&first_period, &last_period}) {
      for (const Match* match : *period) {
        if (keep(*match) &&
            std::find(result.begin(), result.end(), match) == result.end()) {
          result.push_back(match);
        }
      }
    }
    return result;
  };

  const absl::btree_set<TeamIndex> last_teams = teams_of_period(last_period);
  absl::btree_set<TeamIndex> reported_teams;
  for (const TeamIndex team : teams_of_period(first_period)) {
    if (!last_teams.contains(team)) continue;
    reported_teams.insert(team);
    violations.push_back(MakeViolation(
        absl::StrCat("Team ", tournament.TeamName(team),
                     " participates in both first period (setup + first "
                     "game) and last period (last game + packdown) of the "
                     "day"),
        Copies(relevant_matches(
            [&](const Match& match) { return team_appears(match, team); })),
        ViolationLevel::kAlert));
  }

  const absl::btree_set<PlayerIndex> last_players =
      players_of_period(last_period);
  for (const PlayerIndex player : players_of_period(first_period)) {
    if (!last_players.contains(player)) continue;
    const std::vector<TeamIndex> teams = TeamsOf(tournament, player);
    if (std::any_of(teams.begin(), teams.end(), [&](TeamIndex team) {
          return reported_teams.contains(team);
        })) {
      continue;
    }
    violations.push_back(MakeViolation(
        absl::StrCat("Player ", tournament.player(player).name,
                     " participates in both first period (setup + first "
                     "game) and last period (last game + packdown) of the "
                     "day"),
        Copies(relevant_matches([&](const Match& match) {
          for (const TeamIndex team : match.PlayingTeams()) {
            if (tournament.IsMember(player, team)) return true;
          }
          return false;
        })),
        ViolationLevel::kAlert));
  }
  return violations;
}

std::vector<RuleViolation> AvoidRefereeingBeforePlaying::Evaluate(
    const Schedule& schedule) const {
  const Tournament& tournament = schedule.tournament();
  const absl::btree_map<int, MatchList> by_slot =
      GroupByTimeSlot(SortedMatches(schedule, /*regular_only=*/false));
  std::vector<RuleViolation> violations;
  for (auto it = by_slot.begin(); it != by_slot.end(); ++it) {
    const auto next = std::next(it);
    if (next == by_slot.end()) break;
    for (const Match* refereed : it->second) {
      if (!refereed->has_referee()) continue;
      const TeamIndex referee = refereed->referee();
      for (const Match* played : next->second) {
        if (played->IsSpecialActivity() || !played->IsPlaying(referee)) {
          continue;
        }
        violations.push_back(MakeViolation(
            absl::StrCat("Team ", tournament.TeamName(referee),
                         " referees in slot ", it->first, " and plays in slot ",
                         next->first),
            {*refereed, *played}, ViolationLevel::kNote));
      }
    }
  }
  return violations;
}

std::vector<RuleViolation> AvoidPlayingAfterSetup::Evaluate(
    const Schedule& schedule) const {
  const Tournament& tournament = schedule.tournament();
  const absl::btree_map<int, MatchList> by_slot =
      GroupByTimeSlot(SortedMatches(schedule, /*regular_only=*/false));
  std::vector<RuleViolation> violations;
  for (const auto& [slot, slot_matches] : by_slot) {
    const auto next = by_slot.find(slot + 1);
    if (next == by_slot.end()) continue;
    for (const Match* setup : slot_matches) {
      if (!setup->IsSetup()) continue;
      for (const TeamIndex team : setup->InvolvedTeams()) {
        for (const Match* played : next->second) {
          if (played->IsSpecialActivity() || !played->IsPlaying(team)) continue;
          violations.push_back(MakeViolation(
              absl::StrCat("Team ", tournament.TeamName(team),
                           " does setup in slot ", slot,
                           " and plays immediately after in slot ", slot + 1),
              {*setup, *played}, ViolationLevel::kCritical));
        }
      }
    }
  }
  return violations;
}

std::vector<RuleViolation> ManageRestTimeAndGaps::Evaluate(
    const Schedule& schedule) const {
  const Tournament& tournament = schedule.tournament();
  std::vector<RuleViolation> violations;
  for (const auto& [player, games] : GroupByPlayer(
           tournament, SortedMatches(schedule, /*regular_only=*/true))) {
    const std::string& name = tournament.player(player).name;
    for (int i = 1; i < games.size(); ++i) {
      const Match& previous = *games[i - 1];
      const Match& current = *games[i];
      const int gap = current.time_slot() - previous.time_slot() - 1;
      if (gap < min_rest_slots_) {
        violations.push_back(MakeViolation(
            absl::StrCat("Player ", name, " has insufficient rest (", gap,
                         " slots) between games in slots ",
                         previous.time_slot(), " and ", current.time_slot()),
            {previous, current}, ViolationLevel::kNote));
      } else if (gap > max_gap_slots_) {
        violations.push_back(MakeViolation(
            absl::StrCat("Player ", name, " has ", gap,
                         "-slot gap between games (slots ",
                         previous.time_slot(), " and ", current.time_slot(),
                         ")"),
            {previous, current}, ViolationLevel::kWarning));
      }
    }
  }
  return violations;
}

std::vector<RuleViolation> ManagePlayerGameBalance::Evaluate(
    const Schedule& schedule) const {
  const Tournament& tournament = schedule.tournament();
  std::vector<RuleViolation> violations;
  absl::btree_map<Division, absl::btree_map<PlayerIndex, int>>
      games_by_division;
  for (const auto& [player, games] : GroupByPlayer(
           tournament, SortedMatches(schedule, /*regular_only=*/true))) {
    if (games.size() > max_games_) {
      violations.push_back(MakeViolation(
          absl::StrCat("Player ", tournament.player(player).name,
                       " is scheduled for ", games.size(),
                       " games (max: ", max_games_, ")"),
          Copies(games), ViolationLevel::kWarning));
    }
    for (const Match* game : games) {
      ++games_by_division[game->division()][player];
    }
  }
  for (const auto& [division, games_by_player] : games_by_division) {
    int min_games = games_by_player.begin()->second;
    int max_games = min_games;
    for (const auto& [player, count] : games_by_player) {
      min_games = std::min(min_games, count);
      max_games = std::max(max_games, count);
    }
    if (max_games - min_games > max_game_difference_) {
      violations.push_back(MakeViolation(
          absl::StrCat("Game distribution imbalance in ",
                       DivisionName(division), ": ", min_games, "-", max_games,
                       " games (max difference: ", max_game_difference_, ")"),
          {}, ViolationLevel::kWarning));
    }
  }
  return violations;
}

double LimitVenueTime::HoursAtVenue(int first_slot, int last_slot) const {
  return (last_slot - first_slot + 1) * minutes_per_slot_ / 60.0;
}

std::vector<RuleViolation> LimitVenueTime::Evaluate(
    const Schedule& schedule) const {
  const Tournament& tournament = schedule.tournament();
  const MatchList matches = SortedMatches(schedule, /*regular_only=*/false);
  std::vector<RuleViolation> violations;
  const auto description = [&](absl::string_view entity, double hours) {
    return absl::StrFormat("%s needs to be at venue for %.1f hours (max: %gh)",
                           entity, hours, max_hours_);
  };

  absl::flat_hash_map<TeamIndex, double> team_hours;
  for (const auto& [team, team_matches] : GroupByInvolvedTeam(matches)) {
    if (team_matches.size() < 2) continue;
    const double hours = HoursAtVenue(team_matches.front()->time_slot(),
                                      team_matches.back()->time_slot());
    if (hours <= max_hours_) continue;
    team_hours[team] = hours;
    violations.push_back(MakeViolation(
        description(absl::StrCat("Team ", tournament.TeamName(team)), hours),
        Copies(team_matches), ViolationLevel::kWarning));
  }
  for (const auto& [player, player_matches] :
       GroupByPlayer(tournament, matches)) {
    if (player_matches.size() < 2) continue;
    const double hours = HoursAtVenue(player_matches.front()->time_slot(),
                                      player_matches.back()->time_slot());
    if (hours <= max_hours_) continue;
    bool covered = false;
    for (const TeamIndex team : TeamsOf(tournament, player)) {
      const auto it = team_hours.find(team);
      if (it != team_hours.end() &&
          hours <= it->second + kPlayerToleranceHours) {
        covered = true;
        break;
      }
    }
    if (covered) continue;
    violations.push_back(MakeViolation(
        description(absl::StrCat("Player ", tournament.player(player).name),
                    hours),
        Copies(player_matches), ViolationLevel::kWarning));
  }
  return violations;
}

std::vector<RuleViolation> EnsurePlayerWarmupTime::Evaluate(
    const Schedule& schedule) const {
  const Tournament& tournament = schedule.tournament();
  std::vector<RuleViolation> violations;
  for (const auto& [player, games] : GroupByPlayer(
           tournament, SortedMatches(schedule, /*regular_only=*/true))) {
    const Match& first = *games.front();
    if (first.time_slot() >= min_warmup_slots_ + 1) continue;
    violations.push_back(MakeViolation(
        absl::StrCat("Player ", tournament.player(player).name,
                     " has first game in slot ", first.time_slot(), " (needs ",
                     min_warmup_slots_, " warm-up slots)"),
        {first}, ViolationLevel::kNote));
  }
  return violations;
}

std::vector<RuleViolation> BalanceRefereeAssignments::Evaluate(
    const Schedule& schedule) const {
  absl::btree_map<TeamIndex, int> assignments;
  for (const Match& match : schedule.matches()) {
    if (match.has_referee()) ++assignments[match.referee()];
  }
  if (assignments.empty()) return {};
  int min_count = assignments.begin()->second;
  int max_count = min_count;
  for (const auto& [team, count] : assignments) {
    min_count = std::min(min_count, count);
    max_count = std::max(max_count, count);
  }
  if (max_count - min_count <= max_referee_difference_) return {};
  return {MakeViolation(
      absl::StrCat("Referee assignment imbalance: ", min_count, "-", max_count,
                   " assignments (max difference: ", max_referee_difference_,
                   ")"),
      {}, ViolationLevel::kWarning)};
}

std::vector<RuleViolation> EnsureFairFieldDistribution::Evaluate(
    const Schedule& schedule) const {
  const Tournament& tournament = schedule.tournament();
  std::vector<RuleViolation> violations;
  for (const auto& [team, games] :
       GroupByPlayingTeam(SortedMatches(schedule, /*regular_only=*/true))) {
    if (games.size() < kMinGames) continue;
    absl::btree_map<std::string, int> games_by_field;
    for (const Match* game : games) ++games_by_field[game->field()];
    // Ties go to the first field in name order.
    auto dominant = games_by_field.begin();
    for (auto it = games_by_field.begin(); it != games_by_field.end(); ++it) {
      if (it->second > dominant->second) dominant = it;
    }
    const double share = static_cast<double>(dominant->second) / games.size();
    if (share <= threshold_) continue;
    MatchList on_field;
    for (const Match* game : games) {
      if (game->field() == dominant->first) on_field.push_back(game);
    }
    violations.push_back(MakeViolation(
        absl::StrCat("Team ", tournament.TeamName(team), " plays ",
                     dominant->second, "/", games.size(), " games on ",
                     dominant->first),
        Copies(on_field), ViolationLevel::kWarning));
  }
  return violations;
}

std::vector<RuleViolation> DetectMixedDivisionsInTimeSlot::Evaluate(
    const Schedule& schedule) const {
  std::vector<RuleViolation> violations;
  for (const auto& [slot, slot_matches] :
       GroupByTimeSlot(SortedMatches(schedule, /*regular_only=*/true))) {
    absl::btree_set<Division> divisions;
    for (const Match* match : slot_matches) divisions.insert(match->division());
    if (divisions.size() < 2) continue;
    violations.push_back(MakeViolation(
        absl::StrCat("Time slot ", slot, " has multiple divisions: ",
                     absl::StrJoin(divisions, ", ",
                                   [](std::string* out, Division division) {
                                     absl::StrAppend(out,
                                                     DivisionName(division));
                                   })),
        Copies(slot_matches), ViolationLevel::kWarning));
  }
  return violations;
}

std::string PreventClubRefereeConflict::ClubName(absl::string_view team_name) {
  const absl::string_view name = absl::StripAsciiWhitespace(team_name);
  const size_t space = name.find(' ');
  return std::string(space == absl::string_view::npos ? name
                                                      : name.substr(0, space));
}

std::vector<RuleViolation> PreventClubRefereeConflict::Evaluate(
    const Schedule& schedule) const {
  const Tournament& tournament = schedule.tournament();
  std::vector<RuleViolation> violations;
  for (const auto& [slot, slot_matches] :
       GroupByTimeSlot(SortedMatches(schedule, /*regular_only=*/true))) {
    if (slot_matches.size() < 2) continue;
    for (const Match* refereed : slot_matches) {
      if (!refereed->has_referee()) continue;
      const std::string& referee_name =
          tournament.TeamName(refereed->referee());
      const std::string club = ClubName(referee_name);
      for (const Match* other : slot_matches) {
        if (other == refereed) continue;
        for (const TeamIndex team : other->PlayingTeams()) {
          const std::string& team_name = tournament.TeamName(team);
          if (ClubName(team_name) != club) continue;
          violations.push_back(MakeViolation(
              absl::StrCat("Team ", referee_name, " is refereeing in slot ",
                           slot, " while club team (", team_name,
                           ") is playing in the same slot"),
              {*refereed, *other}, ViolationLevel::kWarning));
          break;
        }
      }
    }
  }
  return violations;
}

}  // namespace tourney
