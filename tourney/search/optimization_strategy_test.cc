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


#include "tourney/search/optimization_strategy.h"

#include <cmath>
#include <cstdint>
#include <memory>
#include <random>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "tourney/model/schedule.h"
#include "tourney/model/test_util.h"
#include "tourney/rules/rules_registry.h"
#include "tourney/rules/schedule_rule.h"
#include "tourney/search/optimizer_parameters.h"
#include "tourney/search/optimizer_parameters.pb.h"
#include "tourney/search/schedule_randomizer.h"

namespace tourney {
namespace {

using ::testing::AllOf;
using ::testing::Ge;
using ::testing::Le;

TEST(AcceptCandidateTest, BetterIsAlwaysAccepted) {
  std::mt19937 random(1);
  EXPECT_TRUE(AcceptCandidate(10, 9, 0.0, random));
  EXPECT_TRUE(AcceptCandidate(10, 0, 1e-9, random));
}

TEST(AcceptCandidateTest, WorseIsRejectedWhenFrozen) {
  std::mt19937 random(2);
  for (int i = 0; i < 100; ++i) {
    EXPECT_FALSE(AcceptCandidate(10, 11, 0.0, random));
    EXPECT_FALSE(AcceptCandidate(10, 1000, 1.0, random));
  }
}

TEST(AcceptCandidateTest, EqualIsAcceptedWhenWarm) {
  std::mt19937 random(3);
  for (int i = 0; i < 100; ++i) {
    EXPECT_TRUE(AcceptCandidate(10, 10, 5.0, random));
  }
}

TEST(AcceptCandidateTest, MetropolisProbability) {
  std::mt19937 random(4);
  const int kNumTrials = 20000;
  int num_accepted = 0;
  for (int i = 0; i < kNumTrials; ++i) {
    if (AcceptCandidate(10, 20, 10.0, random)) ++num_accepted;
  }
  EXPECT_THAT(static_cast<double>(num_accepted) / kNumTrials,
              AllOf(Ge(std::exp(-1.0) - 0.02), Le(std::exp(-1.0) + 0.02)));
}

class StrategyTest : public ::testing::Test {
 protected:
  StrategyTest()
      : random_(5),
        parameters_(DefaultOptimizerParameters()),
        randomizer_(parameters_.randomization(), random_),
        rules_(DefaultRuleSet()),
        schedule_(TwoDivisionTestSchedule()) {
    schedule_.Evaluate(rules_);
  }

  // Runs `num_steps` steps on `strategy`, keeping the current and best
  // schedules the way the optimizer does, and checks every schedule
  // returned.
  void RunSteps(OptimizationStrategy* strategy, int num_steps) {
    Schedule current = schedule_;
    Schedule best = schedule_;
    for (int i = 0; i < num_steps; ++i) {
      StepResult result = strategy->Step(
          OptimizationState{current, current.score(), best, best.score()}, i,
          rules_);
      if (result.new_best.has_value()) {
        EXPECT_TRUE(result.new_best->evaluated());
        EXPECT_FALSE(result.new_best->HasCriticalViolation());
        EXPECT_LT(result.new_best->score(), best.score());
        best = *result.new_best;
      }
      if (result.new_current.has_value()) {
        EXPECT_TRUE(result.new_current->evaluated());
        EXPECT_FALSE(result.new_current->HasCriticalViolation());
        current = *std::move(result.new_current);
      }
    }
  }

  std::mt19937 random_;
  OptimizerParameters parameters_;
  ScheduleRandomizer randomizer_;
  RuleSet rules_;
  Schedule schedule_;
};

TEST_F(StrategyTest, SimulatedAnnealingNeverReturnsCriticalSchedules) {
  SimulatedAnnealingStrategy strategy(parameters_.simulated_annealing(),
                                      &randomizer_, random_);
  EXPECT_EQ(strategy.name(), "simulated_annealing");
  RunSteps(&strategy, 200);
}

TEST_F(StrategyTest, SimulatedAnnealingCoolsGeometrically) {
  SimulatedAnnealingParameters parameters;
  parameters.set_initial_temperature(100);
  parameters.set_cooling_rate(0.5);
  SimulatedAnnealingStrategy strategy(parameters, &randomizer_, random_);
  EXPECT_DOUBLE_EQ(strategy.temperature(), 100);
  RunSteps(&strategy, 3);
  EXPECT_DOUBLE_EQ(strategy.temperature(), 12.5);
}

TEST_F(StrategyTest, StrategicSearchNeverReturnsCriticalSchedules) {
  StrategicSearchStrategy strategy(parameters_.strategic_search(),
                                   &randomizer_, random_);
  EXPECT_EQ(strategy.name(), "strategic_search");
  RunSteps(&strategy, 200);
}

TEST_F(StrategyTest, StrategicSearchReheatsAfterRejections) {
  StrategicSearchParameters parameters = parameters_.strategic_search();
  parameters.set_initial_temperature(1.0);
  parameters.set_cooling_rate(1.0);
  parameters.set_max_consecutive_rejections(3);
  parameters.set_reheat_factor(2.0);
  parameters.set_max_temperature(3.0);
  StrategicSearchStrategy strategy(parameters, &randomizer_, random_);
  // No schedule can beat a current score this low.
  const OptimizationState state{schedule_, -1000000, schedule_, -1000000};
  for (int i = 0; i < 3; ++i) {
    EXPECT_FALSE(strategy.Step(state, i, rules_).new_current.has_value());
  }
  EXPECT_EQ(strategy.consecutive_rejections(), 3);
  EXPECT_DOUBLE_EQ(strategy.temperature(), 1.0);
  strategy.Step(state, 3, rules_);
  EXPECT_EQ(strategy.consecutive_rejections(), 0);
  EXPECT_DOUBLE_EQ(strategy.temperature(), 2.0);
  for (int i = 4; i < 8; ++i) strategy.Step(state, i, rules_);
  EXPECT_DOUBLE_EQ(strategy.temperature(), 3.0);
}

TEST_F(StrategyTest, MakeOptimizationStrategy) {
  OptimizerParameters parameters = DefaultOptimizerParameters();
  for (const OptimizationStrategyType type :
       {SIMULATED_ANNEALING, GENETIC_ALGORITHM, STRATEGIC_SEARCH}) {
    parameters.set_strategy(type);
    const std::unique_ptr<OptimizationStrategy> strategy =
        MakeOptimizationStrategy(parameters, &randomizer_, random_);
    ASSERT_NE(strategy, nullptr);
    OptimizationStrategyType parsed;
    ASSERT_TRUE(ParseOptimizationStrategyType(strategy->name(), &parsed));
    EXPECT_EQ(parsed, type);
  }
}

}  // namespace
}  // namespace tourney
