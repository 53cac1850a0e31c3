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

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "google/protobuf/text_format.h"
#include "gtest/gtest.h"
#include "tourney/rules/builtin_rules.h"
#include "tourney/rules/rule_config.pb.h"
#include "tourney/rules/schedule_rule.h"

namespace tourney {
namespace {

using ::testing::HasSubstr;
using ::testing::IsNull;
using ::testing::NotNull;
using ::testing::SizeIs;

RuleSetConfig ParseConfig(const std::string& text) {
  RuleSetConfig config;
  EXPECT_TRUE(google::protobuf::TextFormat::ParseFromString(text, &config))
      << text;
  return config;
}

std::vector<std::string> RuleIds(const RuleSetConfig& config) {
  std::vector<std::string> ids;
  for (const RuleConfig& rule : config.rules()) ids.push_back(rule.id());
  return ids;
}

TEST(RulesRegistryTest, Contents) {
  EXPECT_THAT(RulesRegistry(), SizeIs(12));
  const RuleDefinition* venue = FindRuleDefinition("limit_venue_time");
  ASSERT_THAT(venue, NotNull());
  EXPECT_EQ(venue->name, "Limit venue time");
  EXPECT_EQ(venue->category, RuleCategory::kBoth);
  ASSERT_THAT(venue->FindParameter("max_hours"), NotNull());
  EXPECT_FALSE(venue->FindParameter("max_hours")->integral);
  EXPECT_THAT(venue->FindParameter("unknown"), IsNull());
  EXPECT_THAT(FindRuleDefinition("unknown"), IsNull());
}

TEST(RulesRegistryTest, DefaultConfigIsValid) {
  const RuleSetConfig config = DefaultRuleSetConfig();
  EXPECT_THAT(config.rules(), SizeIs(RulesRegistry().size()));
  EXPECT_EQ(config.hard_constraint_weight(),
            RuleSet::kDefaultHardConstraintWeight);
  EXPECT_TRUE(ValidateRuleSetConfig(config).ok());
}

TEST(RulesRegistryTest, CreateSkipsDisabledRules) {
  const absl::StatusOr<RuleSet> rules = CreateRuleSet(DefaultRuleSetConfig());
  ASSERT_TRUE(rules.ok()) << rules.status();
  EXPECT_EQ(rules->size(), RulesRegistry().size() - 1);
  EXPECT_THAT(rules->FindRule("Ensure player warm-up time"), IsNull());
  EXPECT_THAT(rules->FindRule("Limit venue time"), NotNull());
}

TEST(RulesRegistryTest, CreateUsesConfiguredValues) {
  const absl::StatusOr<RuleSet> rules = CreateRuleSet(ParseConfig(R"pb(
    hard_constraint_weight: 50
    rules { id: "back_to_back" priority: 9 }
    rules { id: "first_last" enabled: false }
    rules {
      id: "venue_short"
      base_rule_id: "limit_venue_time"
      parameters { key: "max_hours" value: 3.5 }
    }
  )pb"));
  ASSERT_TRUE(rules.ok()) << rules.status();
  EXPECT_EQ(rules->hard_constraint_weight(), 50);
  ASSERT_EQ(rules->size(), 2);
  EXPECT_EQ(rules->rules()[0]->name(), "Avoid back-to-back games");
  EXPECT_EQ(rules->rules()[0]->priority(), 9);
  const auto* venue =
      dynamic_cast<const LimitVenueTime*>(rules->rules()[1].get());
  ASSERT_THAT(venue, NotNull());
  EXPECT_EQ(venue->priority(), 2);
  EXPECT_EQ(venue->max_hours(), 3.5);
  EXPECT_EQ(venue->minutes_per_slot(), 40);
}

TEST(RulesRegistryTest, ValidationErrors) {
  const struct {
    std::string text;
    std::string error;
  } kCases[] = {
      {"rules { id: 'nope' }", "Unknown rule 'nope'"},
      {"rules { id: 'copy' base_rule_id: 'nope' }",
       "duplicates unknown rule 'nope'"},
      {"rules { id: 'back_to_back' priority: 0 }", "priority must be positive"},
      {"rules { id: 'back_to_back' } rules { id: 'back_to_back' }",
       "Duplicate rule id 'back_to_back'"},
      {"rules { id: 'back_to_back' parameters { key: 'x' value: 1 } }",
       "has no parameter 'x'"},
      {"rules { id: 'limit_venue_time' "
       "parameters { key: 'max_hours' value: 20 } }",
       "must be in [1, 12]"},
      {"rules { id: 'manage_rest_and_gaps' "
       "parameters { key: 'min_rest_slots' value: 2.5 } }",
       "must be an integer"},
      {"hard_constraint_weight: 0", "hard_constraint_weight"},
      {"rules { enabled: true }", "without id"},
  };
  for (const auto& test_case : kCases) {
    SCOPED_TRACE(test_case.text);
    const absl::Status status =
        ValidateRuleSetConfig(ParseConfig(test_case.text));
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_THAT(status.message(), HasSubstr(test_case.error));
    EXPECT_FALSE(CreateRuleSet(ParseConfig(test_case.text)).ok());
  }
}

TEST(RulesRegistryTest, MergeMigratesAndCompletes) {
  const RuleSetConfig merged = MergeRuleSetConfig(ParseConfig(R"pb(
    hard_constraint_weight: 20
    rules { id: "player_back_to_back" priority: 7 }
    rules { id: "retired_for_good" }
    rules {
      id: "limit_venue_time"
      parameters { key: "max_hours" value: 4 }
      parameters { key: "stale" value: 1 }
    }
  )pb"));
  EXPECT_EQ(merged.hard_constraint_weight(), 20);
  const std::vector<std::string> ids = RuleIds(merged);
  ASSERT_THAT(ids, SizeIs(RulesRegistry().size()));
  EXPECT_EQ(ids[0], "back_to_back");
  EXPECT_EQ(merged.rules(0).priority(), 7);
  EXPECT_EQ(merged.rules(0).name(), "Avoid back-to-back games");
  EXPECT_EQ(ids[1], "limit_venue_time");
  EXPECT_EQ(merged.rules(1).parameters().size(), 1);
  EXPECT_EQ(merged.rules(1).parameters().at("max_hours"), 4);
  EXPECT_TRUE(ValidateRuleSetConfig(merged).ok());
}

TEST(RulesRegistryTest, MergeDropsDuplicatesAfterMigration) {
  const RuleSetConfig merged = MergeRuleSetConfig(ParseConfig(R"pb(
    rules { id: "player_rest_time" priority: 3 }
    rules { id: "avoid_large_gaps" priority: 8 }
  )pb"));
  EXPECT_EQ(merged.rules(0).id(), "manage_rest_and_gaps");
  EXPECT_EQ(merged.rules(0).priority(), 3);
  EXPECT_THAT(merged.rules(), SizeIs(RulesRegistry().size()));
}

TEST(RulesRegistryTest, DefaultRuleSet) {
  const RuleSet rules = DefaultRuleSet();
  ASSERT_EQ(rules.size(), 4);
  EXPECT_EQ(rules.FindRule("Avoid playing immediately after setup")
                ->priority(),
            10);
  EXPECT_EQ(rules.FindRule("Avoid back-to-back games")->priority(), 5);
  EXPECT_EQ(rules.FindRule("Avoid refereeing before playing")->priority(), 3);
  EXPECT_EQ(rules.FindRule("Avoid having first and last game")->priority(), 1);
}

}  // namespace
}  // namespace tourney
