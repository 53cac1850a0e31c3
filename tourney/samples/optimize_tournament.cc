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

// Builds a one-day tournament with four clubs fielding a team in each of the
// three divisions, schedules the round robins naively, then optimizes the
// schedule and prints the result.
//
// Example usage:
// ./optimize_tournament --strategy=strategic_search --iterations=2000 \
//     --params="simulated_annealing { initial_temperature: 80 }" \
//     --rules="rules { id: 'back_to_back' priority: 8 }"

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/text_format.h"
#include "tourney/base/status_macros.h"
#include "tourney/model/division.h"
#include "tourney/model/match.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/schedule.h"
#include "tourney/model/tournament.h"
#include "tourney/rules/rule_config.pb.h"
#include "tourney/rules/rules_registry.h"
#include "tourney/rules/schedule_rule.h"
#include "tourney/search/optimizer.h"
#include "tourney/search/optimizer_parameters.h"
#include "tourney/search/optimizer_parameters.pb.h"

ABSL_FLAG(std::string, strategy, "",
          "simulated_annealing, genetic_algorithm or strategic_search. "
          "Overrides --params.");
ABSL_FLAG(int, iterations, -1,
          "Number of iterations. Overrides --params when non-negative.");
ABSL_FLAG(int64_t, seed, -1,
          "Random seed. Overrides --params when non-negative.");
ABSL_FLAG(std::string, params, "",
          "OptimizerParameters in text format, merged over the defaults.");
ABSL_FLAG(std::string, rules, "",
          "RuleSetConfig in text format. Its rules are merged with the "
          "registry defaults. Uses the default rule set when empty.");

namespace tourney {
namespace {

constexpr char kClubs[][8] = {"Harbour", "Valley", "Summit", "Coast"};
constexpr int kNumFields = 3;
constexpr int kPlayersPerClub = 8;

std::string FieldName(int field) { return absl::StrCat("Field ", field + 1); }

// Every club has a team in each division. Its players are spread over the
// teams so that each player plays in two divisions.
absl::StatusOr<std::shared_ptr<const Tournament>> BuildTournament() {
  auto tournament = std::make_shared<Tournament>();
  for (const char* club : kClubs) {
    for (int p = 0; p < kPlayersPerClub; ++p) {
      const auto team = [club](Division division) {
        return std::make_pair(division,
                              absl::StrCat(club, " ", DivisionName(division)));
      };
      const std::vector<std::pair<Division, std::string>> teams = {
          team(Division::kMixed),
          team(p % 2 == 0 ? Division::kGendered : Division::kCloth)};
      RETURN_IF_ERROR(tournament
                          ->AddPlayer(absl::StrCat(club, " Player ", p + 1),
                                      teams)
                          .status());
    }
  }
  return tournament;
}

// Lays the round robin of each division out, division after division, on
// consecutive slots, with the first team of the division free in the slot as
// referee. Slot 0 is for the setup, the slot after the last game for packing
// down.
absl::StatusOr<Schedule> BuildInitialSchedule(
    std::shared_ptr<const Tournament> tournament) {
  std::vector<Match> matches;
  int next = 0;
  for (const Division division : kAllDivisions) {
    std::vector<TeamIndex> teams;
    for (const char* club : kClubs) {
      teams.push_back(tournament->FindTeam(
          division, absl::StrCat(club, " ", DivisionName(division))));
    }
    for (int i = 0; i < teams.size(); ++i) {
      for (int j = i + 1; j < teams.size(); ++j) {
        const int slot = 1 + next / kNumFields;
        const auto busy = [&](TeamIndex team) {
          for (const Match& match : matches) {
            if (match.time_slot() == slot && match.Involves(team)) return true;
          }
          return false;
        };
        TeamIndex referee = kNoTeam;
        for (const TeamIndex team : teams) {
          if (team != teams[i] && team != teams[j] && !busy(team)) {
            referee = team;
            break;
          }
        }
        matches.emplace_back(teams[i], teams[j], slot,
                             FieldName(next % kNumFields), division, referee);
        ++next;
      }
    }
  }
  const int last_slot = (next - 1) / kNumFields + 1;
  matches.push_back(Match::Setup(
      tournament->FindTeam(Division::kMixed, "Harbour mixed"), kNoTeam, 0,
      FieldName(0), Division::kMixed));
  matches.push_back(Match::PackingDown(
      tournament->FindTeam(Division::kCloth, "Coast cloth"), kNoTeam,
      last_slot + 1, FieldName(0), Division::kCloth));
  return Schedule::Create(std::move(tournament), std::move(matches));
}

absl::StatusOr<OptimizerParameters> ParametersFromFlags() {
  OptimizerParameters parameters = DefaultOptimizerParameters();
  const std::string text = absl::GetFlag(FLAGS_params);
  if (!text.empty()) {
    OptimizerParameters overrides;
    if (!google::protobuf::TextFormat::ParseFromString(text, &overrides)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Cannot parse --params: ", text));
    }
    parameters.MergeFrom(overrides);
  }
  const std::string strategy_name = absl::GetFlag(FLAGS_strategy);
  if (!strategy_name.empty()) {
    OptimizationStrategyType strategy;
    if (!ParseOptimizationStrategyType(strategy_name, &strategy)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Unknown strategy: ", strategy_name));
    }
    parameters.set_strategy(strategy);
  }
  if (absl::GetFlag(FLAGS_iterations) >= 0) {
    parameters.set_num_iterations(absl::GetFlag(FLAGS_iterations));
  }
  if (absl::GetFlag(FLAGS_seed) >= 0) {
    parameters.set_random_seed(absl::GetFlag(FLAGS_seed));
  }
  RETURN_IF_ERROR(ValidateOptimizerParameters(parameters));
  return parameters;
}

absl::StatusOr<RuleSet> RulesFromFlags() {
  const std::string text = absl::GetFlag(FLAGS_rules);
  if (text.empty()) return DefaultRuleSet();
  RuleSetConfig config;
  if (!google::protobuf::TextFormat::ParseFromString(text, &config)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot parse --rules: ", text));
  }
  return CreateRuleSet(MergeRuleSetConfig(config));
}

void LogViolations(const Schedule& schedule) {
  for (const RuleViolation& violation : schedule.violations()) {
    LOG(INFO) << "  " << violation;
  }
}

absl::Status Run() {
  ASSIGN_OR_RETURN(const OptimizerParameters parameters,
                   ParametersFromFlags());
  ASSIGN_OR_RETURN(const RuleSet rules, RulesFromFlags());
  ASSIGN_OR_RETURN(std::shared_ptr<const Tournament> tournament,
                   BuildTournament());
  ASSIGN_OR_RETURN(Schedule schedule, BuildInitialSchedule(tournament));

  schedule.Evaluate(rules);
  LOG(INFO) << "Initial schedule, score " << schedule.score() << ":\n"
            << schedule.DebugString();
  LogViolations(schedule);

  std::mt19937_64 random(parameters.random_seed());
  ASSIGN_OR_RETURN(
      const Schedule best,
      Optimize(schedule, rules, parameters, random,
               [](const OptimizationProgress& progress) {
                 VLOG(1) << "Iteration " << progress.iteration << "/"
                         << progress.num_iterations << ": current "
                         << progress.current_score << ", best "
                         << progress.best_score;
               }));

  LOG(INFO) << "Optimized schedule, score " << best.score() << ":\n"
            << best.DebugString();
  LogViolations(best);
  return absl::OkStatus();
}

}  // namespace
}  // namespace tourney

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      "Optimizes the schedule of a sample one-day tournament.");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  const absl::Status status = tourney::Run();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
