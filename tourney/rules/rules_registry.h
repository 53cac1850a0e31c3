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

// Catalog of the built-in rules, and construction of a RuleSet from a
// RuleSetConfig.
//
// Example:
//   RuleSetConfig config = DefaultRuleSetConfig();
//   config.mutable_rules(0)->set_priority(8);
//   ASSIGN_OR_RETURN(RuleSet rules, CreateRuleSet(config));
//   schedule.Evaluate(rules);

#ifndef TOURNEY_RULES_RULES_REGISTRY_H_
#define TOURNEY_RULES_RULES_REGISTRY_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tourney/rules/rule_config.pb.h"
#include "tourney/rules/schedule_rule.h"

namespace tourney {

// Whether a rule looks at teams, at individual players, or at both.
enum class RuleCategory { kTeam, kPlayer, kBoth };

struct RuleParameterDefinition {
  std::string name;
  std::string description;
  double default_value = 0.0;
  double min_value = 0.0;
  double max_value = 0.0;
  // Integral parameters reject fractional values.
  bool integral = true;
};

// Parameter values by name, with every parameter of the rule present.
using RuleParameterValues = absl::flat_hash_map<std::string, double>;

struct RuleDefinition {
  std::string id;
  std::string name;
  std::string description;
  RuleCategory category = RuleCategory::kBoth;
  int default_priority = 1;
  bool enabled_by_default = true;
  std::vector<RuleParameterDefinition> parameters;
  std::function<std::unique_ptr<ScheduleRule>(int priority,
                                              const RuleParameterValues&)>
      factory;

  // Returns nullptr if the rule has no such parameter.
  const RuleParameterDefinition* FindParameter(absl::string_view name) const;
};

// The built-in rules, in default evaluation order.
const std::vector<RuleDefinition>& RulesRegistry();

// Returns nullptr for unknown ids.
const RuleDefinition* FindRuleDefinition(absl::string_view id);

// Every built-in rule with its default priority, parameters and enablement.
RuleSetConfig DefaultRuleSetConfig();

// Returns InvalidArgument for unknown or duplicate ids, non-positive
// priorities or weights, and unknown or out of range parameters.
absl::Status ValidateRuleSetConfig(const RuleSetConfig& config);

// Builds the enabled rules of a valid config, in config order.
absl::StatusOr<RuleSet> CreateRuleSet(const RuleSetConfig& config);

// Brings a config saved by an older version up to date: retired rule ids are
// mapped to the rule replacing them, unknown rules and duplicate ids are
// dropped, unknown parameters are dropped, and rules added since are appended
// with their defaults.
RuleSetConfig MergeRuleSetConfig(const RuleSetConfig& existing);

// The rules used when no configuration is given: no play right after setup,
// no back-to-back games, no refereeing right before playing, and not both
// the first and the last game of the day.
RuleSet DefaultRuleSet();

}  // namespace tourney

#endif  // TOURNEY_RULES_RULES_REGISTRY_H_
