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


#include "tourney/search/genetic_algorithm.h"

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "tourney/model/match.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/schedule.h"
#include "tourney/model/tournament.h"
#include "tourney/model/test_util.h"
#include "tourney/rules/rules_registry.h"
#include "tourney/rules/schedule_rule.h"
#include "tourney/search/optimization_strategy.h"
#include "tourney/search/optimizer_parameters.h"
#include "tourney/search/optimizer_parameters.pb.h"
#include "tourney/search/schedule_randomizer.h"

namespace tourney {
namespace {

using ::testing::IsEmpty;
using ::testing::SizeIs;

// Individuals without critical violation first, each group by score.
bool IsSortedByFitness(const std::vector<Schedule>& population) {
  for (int i = 1; i < population.size(); ++i) {
    const Schedule& previous = population[i - 1];
    const Schedule& individual = population[i];
    if (previous.HasCriticalViolation() != individual.HasCriticalViolation()) {
      if (previous.HasCriticalViolation()) return false;
      continue;
    }
    if (previous.score() > individual.score()) return false;
  }
  return true;
}

class GeneticAlgorithmTest : public ::testing::Test {
 protected:
  GeneticAlgorithmTest()
      : random_(7),
        randomizer_(RandomizationParameters(), random_),
        rules_(DefaultRuleSet()),
        schedule_(TwoDivisionTestSchedule()) {
    parameters_.set_population_size(8);
    parameters_.set_elite_count(2);
    parameters_.set_stagnation_generations(3);
    schedule_.Evaluate(rules_);
  }

  std::mt19937 random_;
  GeneticAlgorithmParameters parameters_;
  ScheduleRandomizer randomizer_;
  RuleSet rules_;
  Schedule schedule_;
};

TEST_F(GeneticAlgorithmTest, FirstStepSeedsPopulation) {
  GeneticAlgorithmStrategy strategy(parameters_, &randomizer_, random_);
  EXPECT_EQ(strategy.name(), "genetic_algorithm");
  EXPECT_THAT(strategy.population(), IsEmpty());
  const OptimizationState state{schedule_, schedule_.score(), schedule_,
                                schedule_.score()};
  strategy.Step(state, 0, rules_);
  EXPECT_EQ(strategy.generation(), 1);
  EXPECT_THAT(strategy.population(), SizeIs(8));
  EXPECT_TRUE(IsSortedByFitness(strategy.population()));
  for (const Schedule& individual : strategy.population()) {
    EXPECT_TRUE(individual.evaluated());
    EXPECT_EQ(individual.num_matches(), schedule_.num_matches());
  }
  // The seed is in the first population, and elitism keeps its score.
  EXPECT_LE(strategy.population().front().score(), schedule_.score());
}

TEST_F(GeneticAlgorithmTest, ElitismNeverLosesTheLeader) {
  GeneticAlgorithmStrategy strategy(parameters_, &randomizer_, random_);
  Schedule current = schedule_;
  Schedule best = schedule_;
  int64_t leader_score = schedule_.score();
  for (int i = 0; i < 30; ++i) {
    StepResult result = strategy.Step(
        OptimizationState{current, current.score(), best, best.score()}, i,
        rules_);
    ASSERT_TRUE(IsSortedByFitness(strategy.population()));
    EXPECT_LE(strategy.population().front().score(), leader_score);
    leader_score = strategy.population().front().score();
    if (result.new_current.has_value()) {
      EXPECT_FALSE(result.new_current->HasCriticalViolation());
      EXPECT_EQ(result.new_current->score(), leader_score);
      current = *std::move(result.new_current);
    }
    if (result.new_best.has_value()) {
      EXPECT_LT(result.new_best->score(), best.score());
      best = *std::move(result.new_best);
    }
  }
  EXPECT_EQ(strategy.generation(), 30);
  EXPECT_THAT(strategy.population(), SizeIs(8));
  EXPECT_LE(best.score(), schedule_.score());
}

TEST_F(GeneticAlgorithmTest, WorksWithoutElites) {
  parameters_.set_elite_count(0);
  parameters_.set_mutation_rate(1.0);
  GeneticAlgorithmStrategy strategy(parameters_, &randomizer_, random_);
  const OptimizationState state{schedule_, schedule_.score(), schedule_,
                                schedule_.score()};
  for (int i = 0; i < 10; ++i) {
    const StepResult result = strategy.Step(state, i, rules_);
    if (result.new_current.has_value()) {
      EXPECT_FALSE(result.new_current->HasCriticalViolation());
    }
  }
  EXPECT_THAT(strategy.population(), SizeIs(8));
  EXPECT_TRUE(IsSortedByFitness(strategy.population()));
}

TEST_F(GeneticAlgorithmTest, DiversifiesAfterStagnation) {
  // Nothing to improve on a schedule without violations.
  const RuleSet no_rules;
  schedule_.Evaluate(no_rules);
  ASSERT_EQ(schedule_.score(), 0);
  GeneticAlgorithmStrategy strategy(parameters_, &randomizer_, random_);
  const OptimizationState state{schedule_, 0, schedule_, 0};
  // The seed already has the best score: every generation stagnates.
  for (int i = 0; i < 2; ++i) strategy.Step(state, i, no_rules);
  EXPECT_EQ(strategy.num_diversifications(), 0);
  strategy.Step(state, 2, no_rules);
  EXPECT_EQ(strategy.num_diversifications(), 1);
  for (int i = 3; i < 6; ++i) strategy.Step(state, i, no_rules);
  EXPECT_EQ(strategy.num_diversifications(), 2);
  EXPECT_THAT(strategy.population(), SizeIs(8));
  EXPECT_EQ(strategy.population().front().score(), 0);
}

// Every occupied time slot costs 50, so packing the games of Alpha into
// fewer slots scores lower even though Alpha is then double booked. Bravo
// playing in slot 1 costs 5.
RuleSet CompactingRules(TeamIndex bravo) {
  RuleSet rules;
  rules.set_hard_constraint_weight(1);
  rules.Emplace<FunctionRule>(
      "Occupied time slot", 50, [](const Schedule& schedule) {
        std::vector<RuleViolation> violations(schedule.TimeSlots().size());
        for (RuleViolation& violation : violations) {
          violation.description = "Occupied time slot";
        }
        return violations;
      });
  rules.Emplace<FunctionRule>(
      "Bravo opens", 5, [bravo](const Schedule& schedule) {
        std::vector<RuleViolation> violations;
        for (const Match& match : schedule.matches()) {
          if (match.time_slot() != 1 || !match.IsPlaying(bravo)) continue;
          RuleViolation violation;
          violation.description = "Bravo plays in the first time slot";
          violation.matches.push_back(match);
          violations.push_back(std::move(violation));
        }
        return violations;
      });
  return rules;
}

TEST(GeneticAlgorithmFeasibilityTest, CriticalIndividualsNeverLead) {
  TestScheduleBuilder builder;
  builder.AddMatch("Alpha", "Bravo", 1, "Field 1")
      .AddMatch("Alpha", "Charlie", 2, "Field 2")
      .AddMatch("Alpha", "Delta", 3, "Field 1")
      .AddMatch("Alpha", "Echo", 4, "Field 2");
  const RuleSet rules = CompactingRules(builder.FindOrAddTeam("Bravo"));
  Schedule schedule = builder.Build();
  schedule.Evaluate(rules);
  ASSERT_FALSE(schedule.HasCriticalViolation());
  ASSERT_EQ(schedule.score(), 205);

  std::mt19937 random(11);
  ScheduleRandomizer randomizer(RandomizationParameters(), random);
  GeneticAlgorithmParameters parameters;
  parameters.set_population_size(10);
  GeneticAlgorithmStrategy strategy(parameters, &randomizer, random);
  Schedule current = schedule;
  Schedule best = schedule;
  for (int i = 0; i < 50; ++i) {
    StepResult result = strategy.Step(
        OptimizationState{current, current.score(), best, best.score()}, i,
        rules);
    ASSERT_TRUE(IsSortedByFitness(strategy.population()));
    EXPECT_FALSE(strategy.population().front().HasCriticalViolation());
    ASSERT_TRUE(result.new_current.has_value());
    EXPECT_FALSE(result.new_current->HasCriticalViolation());
    current = *std::move(result.new_current);
    if (result.new_best.has_value()) {
      EXPECT_FALSE(result.new_best->HasCriticalViolation());
      best = *std::move(result.new_best);
    }
  }
  // Alpha needs four time slots; only moving Bravo out of slot 1 helps.
  EXPECT_EQ(best.score(), 200);
}

}  // namespace
}  // namespace tourney
