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

#ifndef TOURNEY_MODEL_TEST_UTIL_H_
#define TOURNEY_MODEL_TEST_UTIL_H_

#include <memory>
#include <vector>

#include "absl/strings/string_view.h"
#include "tourney/model/division.h"
#include "tourney/model/match.h"
#include "tourney/model/schedule.h"
#include "tourney/model/tournament.h"

namespace tourney {

// Builds small schedules for tests, naming teams instead of handles. Teams
// are created on first use, in the division of the match naming them.
//
// Example:
//   const Schedule schedule = TestScheduleBuilder()
//                                 .AddSetup("Alpha", 0, "Field 1")
//                                 .AddMatch("Alpha", "Bravo", 1, "Field 1",
//                                           /*referee=*/"Charlie")
//                                 .Build();
//
// Failures are test bugs and CHECK-fail.
class TestScheduleBuilder {
 public:
  TestScheduleBuilder();

  // Returns the team, creating it if needed.
  TeamIndex FindOrAddTeam(absl::string_view name,
                          Division division = Division::kMixed);

  // Adds a player to a team, creating both if needed.
  TestScheduleBuilder& AddPlayer(absl::string_view player,
                                 absl::string_view team,
                                 Division division = Division::kMixed);

  // A regular match in the mixed division. An empty referee means none.
  TestScheduleBuilder& AddMatch(absl::string_view team1,
                                absl::string_view team2, int time_slot,
                                absl::string_view field,
                                absl::string_view referee = "");
  TestScheduleBuilder& AddDivisionMatch(Division division,
                                        absl::string_view team1,
                                        absl::string_view team2, int time_slot,
                                        absl::string_view field,
                                        absl::string_view referee = "");
  // Locks the last match added.
  TestScheduleBuilder& Lock();

  TestScheduleBuilder& AddSetup(absl::string_view team, int time_slot,
                                absl::string_view field,
                                Division division = Division::kMixed);
  TestScheduleBuilder& AddPackingDown(absl::string_view team, int time_slot,
                                      absl::string_view field,
                                      Division division = Division::kMixed);

  const Tournament& tournament() const { return *tournament_; }
  const std::vector<Match>& matches() const { return matches_; }

  // The builder can be reused afterwards; every schedule built shares the
  // same tournament.
  Schedule Build() const;

 private:
  std::shared_ptr<Tournament> tournament_;
  std::vector<Match> matches_;
};

// Two divisions on two fields: a round robin of the mixed teams Alpha,
// Bravo, Charlie and Delta in time slots 1 to 3, refereed by Echo and
// Foxtrot, then the gendered games of Xray, Yankee and Zulu in slots 4 to 6.
// Echo sets up in slot 0 and Foxtrot packs down in slot 7. No team plays
// twice or referees while playing in a slot.
Schedule TwoDivisionTestSchedule();

}  // namespace tourney

#endif  // TOURNEY_MODEL_TEST_UTIL_H_
