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

#ifndef TOURNEY_SEARCH_OPTIMIZATION_STRATEGY_H_
#define TOURNEY_SEARCH_OPTIMIZATION_STRATEGY_H_

#include <cstdint>
#include <memory>
#include <optional>

#include "absl/random/bit_gen_ref.h"
#include "absl/strings/string_view.h"
#include "tourney/model/schedule.h"
#include "tourney/rules/schedule_rule.h"
#include "tourney/search/optimizer_parameters.pb.h"
#include "tourney/search/schedule_randomizer.h"

namespace tourney {

// The search state handed to a strategy at each iteration. Both schedules are
// evaluated.
struct OptimizationState {
  const Schedule& current;
  int64_t current_score;
  const Schedule& best;
  int64_t best_score;
};

// Outcome of one iteration. Schedules returned are evaluated with the rules of
// the iteration.
struct StepResult {
  // Replaces the current schedule when set.
  std::optional<Schedule> new_current;
  // Candidate for the best schedule; only kept if strictly better.
  std::optional<Schedule> new_best;
};

// A search strategy, called once per iteration by the ScheduleOptimizer.
// Strategies keep their own state (temperature, population) across calls.
class OptimizationStrategy {
 public:
  virtual ~OptimizationStrategy() = default;

  virtual absl::string_view name() const = 0;

  // Produces and evaluates candidate schedules from `state`. Candidates with
  // a critical violation must never be returned.
  virtual StepResult Step(const OptimizationState& state, int iteration,
                          const RuleSet& rules) = 0;
};

// Metropolis criterion: a better candidate is always accepted, a worse one
// with probability exp((current_score - candidate_score) / temperature).
bool AcceptCandidate(int64_t current_score, int64_t candidate_score,
                     double temperature, absl::BitGenRef random);

// Random perturbations of the current schedule with simulated annealing
// acceptance and geometric cooling.
class SimulatedAnnealingStrategy : public OptimizationStrategy {
 public:
  // `randomizer` and `random` must outlive the strategy.
  SimulatedAnnealingStrategy(const SimulatedAnnealingParameters& parameters,
                             ScheduleRandomizer* randomizer,
                             absl::BitGenRef random);

  absl::string_view name() const override { return "simulated_annealing"; }
  StepResult Step(const OptimizationState& state, int iteration,
                  const RuleSet& rules) override;

  double temperature() const { return temperature_; }

 private:
  const SimulatedAnnealingParameters parameters_;
  ScheduleRandomizer* const randomizer_;
  absl::BitGenRef random_;
  double temperature_;
};

// Simulated annealing in which most moves swap matches named by the violations
// of highest priority. When targeted swaps make the schedule worse, a part of
// the matches is scrambled instead. After too many rejections in a row, the
// temperature is raised again, up to a maximum.
class StrategicSearchStrategy : public OptimizationStrategy {
 public:
  // `randomizer` and `random` must outlive the strategy.
  StrategicSearchStrategy(const StrategicSearchParameters& parameters,
                          ScheduleRandomizer* randomizer,
                          absl::BitGenRef random);

  absl::string_view name() const override { return "strategic_search"; }
  StepResult Step(const OptimizationState& state, int iteration,
                  const RuleSet& rules) override;

  double temperature() const { return temperature_; }
  int consecutive_rejections() const { return consecutive_rejections_; }

 private:
  // Returns an evaluated candidate built by targeted swaps.
  Schedule TargetedCandidate(const Schedule& current, const RuleSet& rules);
  void OnRejection();

  const StrategicSearchParameters parameters_;
  ScheduleRandomizer* const randomizer_;
  absl::BitGenRef random_;
  double temperature_;
  int consecutive_rejections_ = 0;
};

// Returns the strategy selected by `parameters.strategy()`. `parameters` must
// be valid.
std::unique_ptr<OptimizationStrategy> MakeOptimizationStrategy(
    const OptimizerParameters& parameters, ScheduleRandomizer* randomizer,
    absl::BitGenRef random);

}  // namespace tourney

#endif  // TOURNEY_SEARCH_OPTIMIZATION_STRATEGY_H_
