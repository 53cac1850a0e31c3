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


#include "tourney/search/schedule_randomizer.h"

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "tourney/model/division.h"
#include "tourney/model/match.h"
#include "tourney/model/schedule.h"
#include "tourney/model/test_util.h"
#include "tourney/rules/builtin_rules.h"
#include "tourney/rules/hard_constraints.h"
#include "tourney/rules/schedule_rule.h"
#include "tourney/search/optimizer_parameters.pb.h"

namespace tourney {
namespace {

using ::testing::ElementsAre;
using ::testing::Le;

// Sorted time slots of the regular matches of `division`.
std::vector<int> SlotsOf(const Schedule& schedule, Division division) {
  std::vector<int> slots;
  for (const Match& match : schedule.matches()) {
    if (match.IsSpecialActivity() || match.division() != division) continue;
    slots.push_back(match.time_slot());
  }
  std::sort(slots.begin(), slots.end());
  return slots;
}

std::vector<std::string> SpecialActivities(const Schedule& schedule) {
  std::vector<std::string> activities;
  for (const Match& match : schedule.matches()) {
    if (!match.IsSpecialActivity()) continue;
    activities.push_back(match.DebugString(schedule.tournament()));
  }
  return activities;
}

int NumFieldConflicts(const Schedule& schedule) {
  int count = 0;
  for (const RuleViolation& violation :
       FindHardConstraintViolations(schedule)) {
    if (violation.rule == kFieldConflictRuleName) ++count;
  }
  return count;
}

// The match of `schedule` with the same teams as `match`.
const Match& Counterpart(const Schedule& schedule, const Match& match) {
  for (const Match& other : schedule.matches()) {
    if (other.SamePairingAs(match)) return other;
  }
  ADD_FAILURE() << "No counterpart for " << match;
  return match;
}

TEST(RandomizationKindTest, Names) {
  EXPECT_EQ(RandomizationKindName(RandomizationKind::kBlockShuffle),
            "block_shuffle");
  EXPECT_EQ(RandomizationKindName(RandomizationKind::kDivisionShuffle),
            "division_shuffle");
  EXPECT_EQ(absl::StrCat(RandomizationKindName(RandomizationKind::kScatter)),
            "scatter");
}

TEST(FixFieldConflictsTest, MovesDuplicateToFreeField) {
  Schedule schedule = TestScheduleBuilder()
                          .AddMatch("Alpha", "Bravo", 1, "Field 1")
                          .AddMatch("Charlie", "Delta", 1, "Field 1")
                          .AddMatch("Echo", "Foxtrot", 1, "Field 2")
                          .AddMatch("Golf", "Hotel", 2, "Field 3")
                          .Build();
  std::mt19937 random(1);
  EXPECT_EQ(FixFieldConflicts(&schedule, random), 0);
  EXPECT_EQ(schedule.match(0).field(), "Field 1");
  EXPECT_EQ(schedule.match(1).field(), "Field 3");
  EXPECT_EQ(schedule.match(2).field(), "Field 2");
}

TEST(FixFieldConflictsTest, LockedMatchKeepsItsField) {
  Schedule schedule = TestScheduleBuilder()
                          .AddMatch("Alpha", "Bravo", 1, "Field 1")
                          .AddMatch("Charlie", "Delta", 1, "Field 1")
                          .Lock()
                          .AddMatch("Echo", "Foxtrot", 2, "Field 2")
                          .Build();
  std::mt19937 random(2);
  EXPECT_EQ(FixFieldConflicts(&schedule, random), 0);
  EXPECT_EQ(schedule.match(0).field(), "Field 2");
  EXPECT_EQ(schedule.match(1).field(), "Field 1");
}

TEST(FixFieldConflictsTest, TooManyMatchesInSlot) {
  Schedule schedule = TestScheduleBuilder()
                          .AddMatch("Alpha", "Bravo", 1, "Field 1")
                          .AddMatch("Charlie", "Delta", 1, "Field 1")
                          .AddMatch("Echo", "Foxtrot", 1, "Field 2")
                          .Build();
  std::mt19937 random(3);
  EXPECT_EQ(FixFieldConflicts(&schedule, random), 1);
}

TEST(ScheduleRandomizerTest, DivisionShuffleKeepsSlotsOfEachDivision) {
  const Schedule original = TwoDivisionTestSchedule();
  std::mt19937 random(4);
  ScheduleRandomizer randomizer(RandomizationParameters(), random);
  for (int i = 0; i < 20; ++i) {
    Schedule schedule = original;
    randomizer.DivisionShuffle(&schedule);
    for (const Division division : kAllDivisions) {
      EXPECT_EQ(SlotsOf(schedule, division), SlotsOf(original, division));
    }
    EXPECT_EQ(SpecialActivities(schedule), SpecialActivities(original));
  }
}

TEST(ScheduleRandomizerTest, BlockShuffleKeepsDivisionsContiguous) {
  const Schedule original = TwoDivisionTestSchedule();
  std::mt19937 random(5);
  ScheduleRandomizer randomizer(RandomizationParameters(), random);
  for (int i = 0; i < 20; ++i) {
    Schedule schedule = original;
    randomizer.BlockShuffle(&schedule);
    const std::vector<int> mixed = SlotsOf(schedule, Division::kMixed);
    const std::vector<int> gendered = SlotsOf(schedule, Division::kGendered);
    EXPECT_TRUE(mixed.back() <= gendered.front() ||
                gendered.back() <= mixed.front());
    std::vector<int> all = mixed;
    all.insert(all.end(), gendered.begin(), gendered.end());
    std::sort(all.begin(), all.end());
    EXPECT_THAT(all, ElementsAre(1, 1, 2, 2, 3, 3, 4, 5, 6));
    EXPECT_EQ(SpecialActivities(schedule), SpecialActivities(original));
  }
}

TEST(ScheduleRandomizerTest, ScatterRespectsFieldCapacity) {
  const Schedule original = TwoDivisionTestSchedule();
  std::mt19937 random(6);
  ScheduleRandomizer randomizer(RandomizationParameters(), random);
  for (int i = 0; i < 20; ++i) {
    Schedule schedule = original;
    ASSERT_TRUE(randomizer.Scatter(&schedule));
    absl::btree_map<int, int> matches_per_slot;
    for (const Match& match : schedule.matches()) {
      if (match.IsSpecialActivity()) continue;
      EXPECT_GE(match.time_slot(), 1);
      EXPECT_LE(match.time_slot(), 6);
      ++matches_per_slot[match.time_slot()];
    }
    for (const auto& [slot, count] : matches_per_slot) {
      EXPECT_THAT(count, Le(2)) << "slot " << slot;
    }
    EXPECT_EQ(SpecialActivities(schedule), SpecialActivities(original));
  }
}

TEST(ScheduleRandomizerTest, ScatterWithoutRoom) {
  Schedule schedule = TestScheduleBuilder()
                          .AddMatch("Alpha", "Bravo", 1, "Field 1")
                          .AddMatch("Charlie", "Delta", 1, "Field 1")
                          .Build();
  std::mt19937 random(7);
  ScheduleRandomizer randomizer(RandomizationParameters(), random);
  EXPECT_FALSE(randomizer.Scatter(&schedule));
  EXPECT_EQ(schedule.match(0).time_slot(), 1);
  EXPECT_EQ(schedule.match(1).time_slot(), 1);
}

TEST(ScheduleRandomizerTest, RandomizeKeepsScheduleConsistent) {
  const Schedule original = TwoDivisionTestSchedule();
  std::mt19937 random(8);
  ScheduleRandomizer randomizer(RandomizationParameters(), random);
  for (int i = 0; i < 50; ++i) {
    const Schedule schedule = randomizer.Randomize(original);
    SCOPED_TRACE(absl::StrCat(RandomizationKindName(randomizer.last_kind()),
                              "\n", schedule.DebugString()));
    EXPECT_EQ(schedule.num_matches(), original.num_matches());
    EXPECT_EQ(SpecialActivities(schedule), SpecialActivities(original));
    EXPECT_EQ(NumFieldConflicts(schedule), 0);
    for (const Match& match : schedule.matches()) {
      EXPECT_FALSE(match.has_referee() && match.IsPlaying(match.referee()));
    }
  }
  EXPECT_EQ(SlotsOf(original, Division::kMixed),
            std::vector<int>({1, 1, 2, 2, 3, 3}));
}

TEST(ScheduleRandomizerTest, RandomizeFollowsProbabilities) {
  const Schedule original = TwoDivisionTestSchedule();
  std::mt19937 random(9);
  RandomizationParameters parameters;
  parameters.set_block_shuffle_probability(1.0);
  parameters.set_division_shuffle_probability(0.0);
  ScheduleRandomizer block(parameters, random);
  block.Randomize(original);
  EXPECT_EQ(block.last_kind(), RandomizationKind::kBlockShuffle);

  parameters.set_block_shuffle_probability(0.0);
  ScheduleRandomizer scatter(parameters, random);
  scatter.Randomize(original);
  EXPECT_EQ(scatter.last_kind(), RandomizationKind::kScatter);
}

TEST(ScheduleRandomizerTest, CrossoverTakesSlotsFromSecondParent) {
  const Schedule first = TwoDivisionTestSchedule();
  std::mt19937 random(10);
  ScheduleRandomizer randomizer(RandomizationParameters(), random);
  Schedule second = first;
  randomizer.Scatter(&second);

  const Schedule same = randomizer.Crossover(first, second, 0.0);
  const Schedule child = randomizer.Crossover(first, second, 1.0);
  for (int i = 0; i < first.num_matches(); ++i) {
    EXPECT_EQ(same.match(i).time_slot(), first.match(i).time_slot());
    EXPECT_EQ(child.match(i).time_slot(),
              Counterpart(second, child.match(i)).time_slot());
  }
  EXPECT_EQ(SpecialActivities(child), SpecialActivities(first));
}

TEST(ScheduleRandomizerTest, PartialScrambleSwapsMovableMatches) {
  const Schedule original = TwoDivisionTestSchedule();
  std::mt19937 random(11);
  ScheduleRandomizer randomizer(RandomizationParameters(), random);
  Schedule schedule = original;
  randomizer.PartialScramble(&schedule, 0.1);
  int num_changed = 0;
  for (int i = 0; i < schedule.num_matches(); ++i) {
    const Match& before = original.match(i);
    const Match& after = schedule.match(i);
    if (before.time_slot() != after.time_slot() ||
        before.field() != after.field()) {
      ++num_changed;
    }
  }
  EXPECT_EQ(num_changed, 2);
  EXPECT_EQ(SpecialActivities(schedule), SpecialActivities(original));
}

class StrategicSwapTest : public ::testing::Test {
 protected:
  StrategicSwapTest()
      : random_(12), randomizer_(RandomizationParameters(), random_) {
    rules_.Emplace<AvoidBackToBackGames>();
  }

  std::mt19937 random_;
  ScheduleRandomizer randomizer_;
  RuleSet rules_;
};

TEST_F(StrategicSwapTest, SwapsMatchesOfTheViolation) {
  Schedule schedule = TestScheduleBuilder()
                          .AddMatch("Alpha", "Bravo", 1, "Field 1")
                          .AddMatch("Alpha", "Charlie", 2, "Field 2")
                          .AddMatch("Delta", "Echo", 4, "Field 1")
                          .Build();
  schedule.Evaluate(rules_);
  ASSERT_TRUE(randomizer_.StrategicSwap(&schedule));
  EXPECT_EQ(schedule.match(0).time_slot(), 2);
  EXPECT_EQ(schedule.match(0).field(), "Field 2");
  EXPECT_EQ(schedule.match(1).time_slot(), 1);
  EXPECT_EQ(schedule.match(1).field(), "Field 1");
  EXPECT_EQ(schedule.match(2).time_slot(), 4);
}

TEST_F(StrategicSwapTest, SingleMovableMatchSwapsWithAnother) {
  Schedule schedule = TestScheduleBuilder()
                          .AddMatch("Alpha", "Bravo", 1, "Field 1")
                          .Lock()
                          .AddMatch("Alpha", "Charlie", 2, "Field 1")
                          .AddMatch("Delta", "Echo", 4, "Field 2")
                          .Build();
  schedule.Evaluate(rules_);
  ASSERT_TRUE(randomizer_.StrategicSwap(&schedule));
  EXPECT_EQ(schedule.match(0).time_slot(), 1);
  EXPECT_EQ(schedule.match(1).time_slot(), 4);
  EXPECT_EQ(schedule.match(1).field(), "Field 2");
  EXPECT_EQ(schedule.match(2).time_slot(), 2);
}

TEST_F(StrategicSwapTest, NothingToSwap) {
  Schedule clean = TestScheduleBuilder()
                       .AddMatch("Alpha", "Bravo", 1, "Field 1")
                       .AddMatch("Charlie", "Delta", 2, "Field 1")
                       .Build();
  clean.Evaluate(rules_);
  EXPECT_FALSE(randomizer_.StrategicSwap(&clean));

  Schedule locked = TestScheduleBuilder()
                        .AddMatch("Alpha", "Bravo", 1, "Field 1")
                        .Lock()
                        .AddMatch("Alpha", "Charlie", 2, "Field 1")
                        .Lock()
                        .Build();
  locked.Evaluate(rules_);
  EXPECT_FALSE(randomizer_.StrategicSwap(&locked));
}

}  // namespace
}  // namespace tourney
