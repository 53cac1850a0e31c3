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

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <utility>

#include "absl/log/log.h"
#include "absl/random/bit_gen_ref.h"
#include "absl/random/distributions.h"
#include "tourney/model/schedule.h"
#include "tourney/rules/schedule_rule.h"
#include "tourney/search/genetic_algorithm.h"
#include "tourney/search/optimizer_parameters.pb.h"
#include "tourney/search/schedule_randomizer.h"

namespace tourney {

bool AcceptCandidate(int64_t current_score, int64_t candidate_score,
                     double temperature, absl::BitGenRef random) {
  if (candidate_score < current_score) return true;
  if (temperature <= 0) return false;
  const double probability =
      std::exp(static_cast<double>(current_score - candidate_score) /
               temperature);
  return absl::Bernoulli(random, std::min(1.0, probability));
}

SimulatedAnnealingStrategy::SimulatedAnnealingStrategy(
    const SimulatedAnnealingParameters& parameters,
    ScheduleRandomizer* randomizer, absl::BitGenRef random)
    : parameters_(parameters),
      randomizer_(randomizer),
      random_(random),
      temperature_(parameters.initial_temperature()) {}

StepResult SimulatedAnnealingStrategy::Step(const OptimizationState& state,
                                            int iteration,
                                            const RuleSet& rules) {
  StepResult result;
  Schedule candidate = randomizer_->Randomize(state.current);
  const int64_t score = candidate.Evaluate(rules);
  const double temperature = temperature_;
  temperature_ *= parameters_.cooling_rate();
  if (candidate.HasCriticalViolation()) {
    VLOG(2) << "Iteration " << iteration << ": rejected critical candidate";
    return result;
  }
  if (score < state.best_score) result.new_best = candidate;
  if (AcceptCandidate(state.current_score, score, temperature, random_)) {
    result.new_current = std::move(candidate);
  }
  return result;
}

StrategicSearchStrategy::StrategicSearchStrategy(
    const StrategicSearchParameters& parameters,
    ScheduleRandomizer* randomizer, absl::BitGenRef random)
    : parameters_(parameters),
      randomizer_(randomizer),
      random_(random),
      temperature_(parameters.initial_temperature()) {}

Schedule StrategicSearchStrategy::TargetedCandidate(const Schedule& current,
                                                    const RuleSet& rules) {
  Schedule candidate = current.DeepCopy();
  int num_swaps = 0;
  for (int attempt = 0; attempt < parameters_.swap_attempts(); ++attempt) {
    if (!randomizer_->StrategicSwap(&candidate)) break;
    ++num_swaps;
    if (candidate.Evaluate(rules) < current.score()) break;
  }
  if (num_swaps == 0) {
    candidate = randomizer_->Randomize(current);
  } else if (candidate.score() > current.score()) {
    randomizer_->PartialScramble(&candidate, parameters_.scramble_fraction());
  } else {
    return candidate;
  }
  candidate.Evaluate(rules);
  return candidate;
}

void StrategicSearchStrategy::OnRejection() {
  if (++consecutive_rejections_ <= parameters_.max_consecutive_rejections()) {
    return;
  }
  temperature_ = std::min(temperature_ * parameters_.reheat_factor(),
                          parameters_.max_temperature());
  consecutive_rejections_ = 0;
  VLOG(1) << "Reheating to temperature " << temperature_;
}

StepResult StrategicSearchStrategy::Step(const OptimizationState& state,
                                         int iteration,
                                         const RuleSet& rules) {
  StepResult result;
  Schedule candidate =
      !state.current.violations().empty() &&
              absl::Bernoulli(random_,
                              parameters_.targeted_move_probability())
          ? TargetedCandidate(state.current, rules)
          : randomizer_->Randomize(state.current);
  if (!candidate.evaluated()) candidate.Evaluate(rules);
  const double temperature = temperature_;
  temperature_ *= parameters_.cooling_rate();
  if (candidate.HasCriticalViolation()) {
    VLOG(2) << "Iteration " << iteration << ": rejected critical candidate";
    OnRejection();
    return result;
  }
  const int64_t score = candidate.score();
  if (score < state.best_score) result.new_best = candidate;
  if (AcceptCandidate(state.current_score, score, temperature, random_)) {
    consecutive_rejections_ = 0;
    result.new_current = std::move(candidate);
  } else {
    OnRejection();
  }
  return result;
}

std::unique_ptr<OptimizationStrategy> MakeOptimizationStrategy(
    const OptimizerParameters& parameters, ScheduleRandomizer* randomizer,
    absl::BitGenRef random) {
  switch (parameters.strategy()) {
    case SIMULATED_ANNEALING:
      return std::make_unique<SimulatedAnnealingStrategy>(
          parameters.simulated_annealing(), randomizer, random);
    case STRATEGIC_SEARCH:
      return std::make_unique<StrategicSearchStrategy>(
          parameters.strategic_search(), randomizer, random);
    case GENETIC_ALGORITHM:
      return std::make_unique<GeneticAlgorithmStrategy>(
          parameters.genetic_algorithm(), randomizer, random);
  }
  LOG(DFATAL) << "Unsupported optimization strategy: "
              << OptimizationStrategyType_Name(parameters.strategy());
  return nullptr;
}

}  // namespace tourney
