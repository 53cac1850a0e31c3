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

// The scheduling rules shipped with the library.
//
// Several rules check both teams and individual players. A player can belong
// to one team per division, so its day can differ from the day of any of its
// teams. To avoid reporting the same problem twice, a player violation is
// dropped when it is already implied by a violation of one of the player's
// teams; each rule documents what "implied" means for it.

#ifndef TOURNEY_RULES_BUILTIN_RULES_H_
#define TOURNEY_RULES_BUILTIN_RULES_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/schedule.h"
#include "tourney/rules/schedule_rule.h"

namespace tourney {

// Reports every maximal run of at least two games in strictly consecutive
// time slots, for each team and each player. Refereeing neither extends nor
// breaks a run. A player run is dropped when one of the player's teams has a
// run made of exactly the same matches.
class AvoidBackToBackGames : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 5;

  explicit AvoidBackToBackGames(int priority = kDefaultPriority)
      : ScheduleRule("Avoid back-to-back games", priority) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;
};

// The first period of the day is made of the setup activities and the
// earliest time slot holding a regular match; the last period of the latest
// such slot and the packing down activities. Teams and players present in
// both periods are reported, players only when none of their teams is.
class AvoidFirstAndLastGame : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 4;

  explicit AvoidFirstAndLastGame(int priority = kDefaultPriority)
      : ScheduleRule("Avoid having first and last game", priority) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;
};

// A team refereeing in a time slot and playing in the next occupied time slot.
// Playing then refereeing is fine.
class AvoidRefereeingBeforePlaying : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 4;

  explicit AvoidRefereeingBeforePlaying(int priority = kDefaultPriority)
      : ScheduleRule("Avoid refereeing before playing", priority) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;
};

// A team on setup duty in slot s playing in slot s + 1. Critical.
class AvoidPlayingAfterSetup : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 10;

  explicit AvoidPlayingAfterSetup(int priority = kDefaultPriority)
      : ScheduleRule("Avoid playing immediately after setup", priority) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;
};

// Per player, the number of free slots between two consecutive matches must
// be in [min_rest_slots, max_gap_slots].
class ManageRestTimeAndGaps : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 1;

  explicit ManageRestTimeAndGaps(int priority = kDefaultPriority,
                                 int min_rest_slots = 2,
                                 int max_gap_slots = 6)
      : ScheduleRule("Manage rest time and gaps", priority),
        min_rest_slots_(min_rest_slots),
        max_gap_slots_(max_gap_slots) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;

 private:
  const int min_rest_slots_;
  const int max_gap_slots_;
};

// Caps the number of regular games of each player, and the spread of these
// numbers among the players of a division.
class ManagePlayerGameBalance : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 1;

  explicit ManagePlayerGameBalance(int priority = kDefaultPriority,
                                   int max_games = 4,
                                   int max_game_difference = 1)
      : ScheduleRule("Manage player game balance", priority),
        max_games_(max_games),
        max_game_difference_(max_game_difference) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;

 private:
  const int max_games_;
  const int max_game_difference_;
};

// Time spent at the venue, from the start of the first to the end of the last
// activity, must not exceed max_hours. Teams count every role they hold,
// players only the matches their teams play. A player violation is dropped
// when one of the player's teams is reported with at most
// kPlayerToleranceHours less.
class LimitVenueTime : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 2;
  static constexpr double kPlayerToleranceHours = 0.5;

  explicit LimitVenueTime(int priority = kDefaultPriority,
                          double max_hours = 5.0, int minutes_per_slot = 40)
      : ScheduleRule("Limit venue time", priority),
        max_hours_(max_hours),
        minutes_per_slot_(minutes_per_slot) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;

  // Hours spent at the venue to attend every slot of [first_slot, last_slot].
  double HoursAtVenue(int first_slot, int last_slot) const;

  double max_hours() const { return max_hours_; }
  int minutes_per_slot() const { return minutes_per_slot_; }

 private:
  const double max_hours_;
  const int minutes_per_slot_;
};

// Players should not play their first game before slot min_warmup_slots + 1.
class EnsurePlayerWarmupTime : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 1;

  explicit EnsurePlayerWarmupTime(int priority = kDefaultPriority,
                                  int min_warmup_slots = 1)
      : ScheduleRule("Ensure player warm-up time", priority),
        min_warmup_slots_(min_warmup_slots) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;

 private:
  const int min_warmup_slots_;
};

// The numbers of matches refereed by the refereeing teams should not differ
// by more than max_referee_difference.
class BalanceRefereeAssignments : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 3;

  explicit BalanceRefereeAssignments(int priority = kDefaultPriority,
                                     int max_referee_difference = 1)
      : ScheduleRule("Balance referee assignments", priority),
        max_referee_difference_(max_referee_difference) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;

 private:
  const int max_referee_difference_;
};

// A team with at least kMinGames regular games should not play more than
// `threshold` of them on a single field.
class EnsureFairFieldDistribution : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 2;
  static constexpr int kMinGames = 3;

  explicit EnsureFairFieldDistribution(int priority = kDefaultPriority,
                                       double threshold = 0.6)
      : ScheduleRule("Ensure fair field distribution", priority),
        threshold_(threshold) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;

 private:
  const double threshold_;
};

// A time slot whose regular matches belong to several divisions.
class DetectMixedDivisionsInTimeSlot : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 2;

  explicit DetectMixedDivisionsInTimeSlot(int priority = kDefaultPriority)
      : ScheduleRule("Detect mixed divisions in time slot", priority) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;
};

// A team refereeing while another team of its club plays in the same slot.
// The club of a team is the first word of its name.
class PreventClubRefereeConflict : public ScheduleRule {
 public:
  static constexpr int kDefaultPriority = 3;

  explicit PreventClubRefereeConflict(int priority = kDefaultPriority)
      : ScheduleRule("Prevent club referee conflict", priority) {}

  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;

  static std::string ClubName(absl::string_view team_name);
};

}  // namespace tourney

#endif  // TOURNEY_RULES_BUILTIN_RULES_H_
