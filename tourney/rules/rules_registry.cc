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

#include "tourney/rules/rules_registry.h"

#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tourney/base/status_macros.h"
#include "tourney/rules/builtin_rules.h"
#include "tourney/rules/rule_config.pb.h"
#include "tourney/rules/schedule_rule.h"

namespace tourney {
namespace {

template <typename RuleType>
std::unique_ptr<ScheduleRule> MakeRule(int priority,
                                       const RuleParameterValues&) {
  return std::make_unique<RuleType>(priority);
}

int IntParameter(const RuleParameterValues& values, const std::string& name) {
  return static_cast<int>(std::lround(values.at(name)));
}

std::vector<RuleDefinition>* BuildRegistry() {
  auto* registry = new std::vector<RuleDefinition>();
  registry->push_back(
      {"avoid_playing_after_setup",
       "Avoid playing immediately after setup",
       "Teams on setup duty must not play in the time slot right after it.",
       RuleCategory::kTeam,
       AvoidPlayingAfterSetup::kDefaultPriority,
       /*enabled_by_default=*/true,
       {},
       MakeRule<AvoidPlayingAfterSetup>});
  registry->push_back(
      {"back_to_back",
       "Avoid back-to-back games",
       "Teams and players should not play in consecutive time slots.",
       RuleCategory::kBoth,
       AvoidBackToBackGames::kDefaultPriority,
       /*enabled_by_default=*/true,
       {},
       MakeRule<AvoidBackToBackGames>});
  registry->push_back(
      {"first_last",
       "Avoid having first and last game",
       "Teams and players should not be on duty both at the start (setup, "
       "first game) and at the end (last game, packing down) of the day.",
       RuleCategory::kBoth,
       AvoidFirstAndLastGame::kDefaultPriority,
       /*enabled_by_default=*/true,
       {},
       MakeRule<AvoidFirstAndLastGame>});
  registry->push_back(
      {"limit_venue_time",
       "Limit venue time",
       "Limits the time teams and players spend at the venue.",
       RuleCategory::kBoth,
       LimitVenueTime::kDefaultPriority,
       /*enabled_by_default=*/true,
       {{"max_hours", "Maximum hours at the venue", 5.0, 1.0, 12.0,
         /*integral=*/false},
        {"minutes_per_slot", "Duration of a time slot in minutes", 40.0, 15.0,
         120.0, /*integral=*/true}},
       [](int priority, const RuleParameterValues& values) {
         return std::make_unique<LimitVenueTime>(
             priority, values.at("max_hours"),
             IntParameter(values, "minutes_per_slot"));
       }});
  registry->push_back(
      {"reffing_before",
       "Avoid teams refereeing before playing",
       "Teams should not referee right before their own game.",
       RuleCategory::kTeam,
       AvoidRefereeingBeforePlaying::kDefaultPriority,
       /*enabled_by_default=*/true,
       {},
       MakeRule<AvoidRefereeingBeforePlaying>});
  registry->push_back(
      {"balance_referee",
       "Balance referee assignments",
       "Spreads refereeing duty evenly among the refereeing teams.",
       RuleCategory::kTeam,
       BalanceRefereeAssignments::kDefaultPriority,
       /*enabled_by_default=*/true,
       {{"max_referee_difference",
         "Maximum difference between the most and least refereeing teams", 1.0,
         0.0, 3.0, /*integral=*/true}},
       [](int priority, const RuleParameterValues& values) {
         return std::make_unique<BalanceRefereeAssignments>(
             priority, IntParameter(values, "max_referee_difference"));
       }});
  registry->push_back(
      {"fair_field_distribution",
       "Ensure fair field distribution",
       "Teams should not play most of their games on the same field.",
       RuleCategory::kTeam,
       EnsureFairFieldDistribution::kDefaultPriority,
       /*enabled_by_default=*/true,
       {{"threshold", "Largest share of games a team may play on one field",
         0.6, 0.3, 1.0, /*integral=*/false}},
       [](int priority, const RuleParameterValues& values) {
         return std::make_unique<EnsureFairFieldDistribution>(
             priority, values.at("threshold"));
       }});
  registry->push_back(
      {"manage_rest_and_gaps",
       "Manage rest time and gaps",
       "Players need some rest between games, but not hours of waiting.",
       RuleCategory::kPlayer,
       ManageRestTimeAndGaps::kDefaultPriority,
       /*enabled_by_default=*/true,
       {{"min_rest_slots", "Minimum free slots between two games", 2.0, 1.0,
         10.0, /*integral=*/true},
        {"max_gap_slots", "Maximum free slots between two games", 6.0, 2.0,
         20.0, /*integral=*/true}},
       [](int priority, const RuleParameterValues& values) {
         return std::make_unique<ManageRestTimeAndGaps>(
             priority, IntParameter(values, "min_rest_slots"),
             IntParameter(values, "max_gap_slots"));
       }});
  registry->push_back(
      {"manage_player_game_balance",
       "Manage player game balance",
       "Caps the games of each player and balances them within a division.",
       RuleCategory::kPlayer,
       ManagePlayerGameBalance::kDefaultPriority,
       /*enabled_by_default=*/true,
       {{"max_games", "Maximum games per player", 4.0, 1.0, 15.0,
         /*integral=*/true},
        {"max_game_difference",
         "Maximum difference of games between players of a division", 1.0,
         0.0, 5.0, /*integral=*/true}},
       [](int priority, const RuleParameterValues& values) {
         return std::make_unique<ManagePlayerGameBalance>(
             priority, IntParameter(values, "max_games"),
             IntParameter(values, "max_game_difference"));
       }});
  registry->push_back(
      {"warmup_time",
       "Ensure player warm-up time",
       "Players should not play in the very first time slots.",
       RuleCategory::kPlayer,
       EnsurePlayerWarmupTime::kDefaultPriority,
       /*enabled_by_default=*/false,
       {{"min_warmup_slots", "Time slots before the first game of a player",
         1.0, 0.0, 5.0, /*integral=*/true}},
       [](int priority, const RuleParameterValues& values) {
         return std::make_unique<EnsurePlayerWarmupTime>(
             priority, IntParameter(values, "min_warmup_slots"));
       }});
  registry->push_back(
      {"mixed_divisions_timeslot",
       "Detect mixed divisions in time slot",
       "A time slot should only hold games of a single division.",
       RuleCategory::kBoth,
       DetectMixedDivisionsInTimeSlot::kDefaultPriority,
       /*enabled_by_default=*/true,
       {},
       MakeRule<DetectMixedDivisionsInTimeSlot>});
  registry->push_back(
      {"club_referee_conflict",
       "Prevent club referee conflict",
       "Teams should not referee while another team of their club plays.",
       RuleCategory::kTeam,
       PreventClubRefereeConflict::kDefaultPriority,
       /*enabled_by_default=*/true,
       {},
       MakeRule<PreventClubRefereeConflict>});
  return registry;
}

// Ids used by older versions, and the rule that replaced them.
const absl::flat_hash_map<std::string, std::string>& RetiredRuleIds() {
  static const auto* const kRetired =
      new absl::flat_hash_map<std::string, std::string>({
          {"player_back_to_back", "back_to_back"},
          {"player_first_last", "first_last"},
          {"limit_team_venue_time", "limit_venue_time"},
          {"player_rest_time", "manage_rest_and_gaps"},
          {"avoid_large_gaps", "manage_rest_and_gaps"},
          {"player_game_limit", "manage_player_game_balance"},
          {"balance_game_distribution", "manage_player_game_balance"},
      });
  return *kRetired;
}

// The definition a config entry instantiates, or nullptr.
const RuleDefinition* DefinitionOf(const RuleConfig& config) {
  return FindRuleDefinition(config.has_base_rule_id() ? config.base_rule_id()
                                                      : config.id());
}

RuleConfig DefaultRuleConfig(const RuleDefinition& definition) {
  RuleConfig config;
  config.set_id(definition.id);
  config.set_name(definition.name);
  config.set_enabled(definition.enabled_by_default);
  config.set_priority(definition.default_priority);
  for (const RuleParameterDefinition& parameter : definition.parameters) {
    (*config.mutable_parameters())[parameter.name] = parameter.default_value;
  }
  return config;
}

absl::Status ValidateRuleConfig(const RuleConfig& config) {
  if (config.id().empty()) {
    return absl::InvalidArgumentError("Rule config without id");
  }
  const RuleDefinition* definition = DefinitionOf(config);
  if (definition == nullptr) {
    return absl::InvalidArgumentError(
        config.has_base_rule_id()
            ? absl::StrCat("Rule '", config.id(), "' duplicates unknown rule '",
                           config.base_rule_id(), "'")
            : absl::StrCat("Unknown rule '", config.id(), "'"));
  }
  if (config.has_priority() && config.priority() <= 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Rule '", config.id(), "': priority must be positive"));
  }
  for (const auto& [name, value] : config.parameters()) {
    const RuleParameterDefinition* parameter = definition->FindParameter(name);
    if (parameter == nullptr) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Rule '", config.id(), "' has no parameter '", name, "'"));
    }
    if (std::isnan(value) || value < parameter->min_value ||
        value > parameter->max_value) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Rule '", config.id(), "': parameter '", name, "' must be in [",
          parameter->min_value, ", ", parameter->max_value, "], got ", value));
    }
    if (parameter->integral && value != std::round(value)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Rule '", config.id(), "': parameter '", name,
                       "' must be an integer, got ", value));
    }
  }
  return absl::OkStatus();
}

}  // namespace

const RuleParameterDefinition* RuleDefinition::FindParameter(
    absl::string_view name) const {
  for (const RuleParameterDefinition& parameter : parameters) {
    if (parameter.name == name) return &parameter;
  }
  return nullptr;
}

const std::vector<RuleDefinition>& RulesRegistry() {
  static const std::vector<RuleDefinition>* const kRegistry = BuildRegistry();
  return *kRegistry;
}

const RuleDefinition* FindRuleDefinition(absl::string_view id) {
  for (const RuleDefinition& definition : RulesRegistry()) {
    if (definition.id == id) return &definition;
  }
  return nullptr;
}

RuleSetConfig DefaultRuleSetConfig() {
  RuleSetConfig config;
  for (const RuleDefinition& definition : RulesRegistry()) {
    *config.add_rules() = DefaultRuleConfig(definition);
  }
  return config;
}

absl::Status ValidateRuleSetConfig(const RuleSetConfig& config) {
  if (config.hard_constraint_weight() <= 0) {
    return absl::InvalidArgumentError(
        "hard_constraint_weight must be positive");
  }
  absl::flat_hash_set<std::string> ids;
  for (const RuleConfig& rule : config.rules()) {
    RETURN_IF_ERROR(ValidateRuleConfig(rule));
    if (!ids.insert(rule.id()).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate rule id '", rule.id(), "'"));
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<RuleSet> CreateRuleSet(const RuleSetConfig& config) {
  RETURN_IF_ERROR(ValidateRuleSetConfig(config));
  RuleSet rules;
  rules.set_hard_constraint_weight(config.hard_constraint_weight());
  for (const RuleConfig& rule : config.rules()) {
    if (!rule.enabled()) continue;
    const RuleDefinition& definition = *DefinitionOf(rule);
    RuleParameterValues values;
    for (const RuleParameterDefinition& parameter : definition.parameters) {
      const auto it = rule.parameters().find(parameter.name);
      values[parameter.name] =
          it == rule.parameters().end() ? parameter.default_value : it->second;
    }
    rules.Add(definition.factory(
        rule.has_priority() ? rule.priority() : definition.default_priority,
        values));
  }
  return rules;
}

RuleSetConfig MergeRuleSetConfig(const RuleSetConfig& existing) {
  RuleSetConfig merged;
  if (existing.has_hard_constraint_weight()) {
    merged.set_hard_constraint_weight(existing.hard_constraint_weight());
  }
  absl::flat_hash_set<std::string> seen;
  for (const RuleConfig& config : existing.rules()) {
    RuleConfig updated = config;
    if (!config.has_base_rule_id()) {
      const auto retired = RetiredRuleIds().find(config.id());
      if (retired != RetiredRuleIds().end()) {
        VLOG(1) << "Migrating rule '" << config.id() << "' to '"
                << retired->second << "'";
        updated.set_id(retired->second);
      }
    }
    const RuleDefinition* definition = DefinitionOf(updated);
    if (definition == nullptr) {
      LOG(INFO) << "Dropping unknown rule '" << config.id() << "'";
      continue;
    }
    if (!seen.insert(updated.id()).second) {
      VLOG(1) << "Dropping duplicate rule '" << updated.id() << "'";
      continue;
    }
    if (!updated.has_base_rule_id()) updated.set_name(definition->name);
    auto* parameters = updated.mutable_parameters();
    for (auto it = parameters->begin(); it != parameters->end();) {
      if (definition->FindParameter(it->first) == nullptr) {
        it = parameters->erase(it);
      } else {
        ++it;
      }
    }
    *merged.add_rules() = std::move(updated);
  }
  for (const RuleDefinition& definition : RulesRegistry()) {
    if (seen.contains(definition.id)) continue;
    VLOG(1) << "Adding new rule '" << definition.id << "'";
    *merged.add_rules() = DefaultRuleConfig(definition);
  }
  return merged;
}

RuleSet DefaultRuleSet() {
  RuleSet rules;
  rules.Emplace<AvoidPlayingAfterSetup>(10);
  rules.Emplace<AvoidBackToBackGames>(5);
  rules.Emplace<AvoidRefereeingBeforePlaying>(3);
  rules.Emplace<AvoidFirstAndLastGame>(1);
  return rules;
}

}  // namespace tourney
