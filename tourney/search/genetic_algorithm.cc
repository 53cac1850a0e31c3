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

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/random/bit_gen_ref.h"
#include "absl/random/distributions.h"
#include "tourney/model/schedule.h"
#include "tourney/rules/schedule_rule.h"
#include "tourney/search/optimization_strategy.h"
#include "tourney/search/optimizer_parameters.pb.h"
#include "tourney/search/schedule_randomizer.h"

namespace tourney {
namespace {

// Individuals without critical violation come first, then lower scores.
bool Fitter(const Schedule& a, const Schedule& b) {
  const bool a_critical = a.HasCriticalViolation();
  const bool b_critical = b.HasCriticalViolation();
  if (a_critical != b_critical) return b_critical;
  return a.score() < b.score();
}

void SortByFitness(std::vector<Schedule>* population) {
  std::stable_sort(population->begin(), population->end(), Fitter);
}

int64_t FeasibleScore(const Schedule& schedule) {
  return schedule.HasCriticalViolation()
             ? std::numeric_limits<int64_t>::max()
             : schedule.score();
}

}  // namespace

GeneticAlgorithmStrategy::GeneticAlgorithmStrategy(
    const GeneticAlgorithmParameters& parameters,
    ScheduleRandomizer* randomizer, absl::BitGenRef random)
    : parameters_(parameters), randomizer_(randomizer), random_(random) {}

void GeneticAlgorithmStrategy::InitializePopulation(const Schedule& seed,
                                                    const RuleSet& rules) {
  population_.clear();
  population_.reserve(parameters_.population_size());
  population_.push_back(seed.DeepCopy());
  population_.back().Evaluate(rules);
  while (population_.size() < parameters_.population_size()) {
    population_.push_back(randomizer_->Randomize(seed));
    population_.back().Evaluate(rules);
  }
  SortByFitness(&population_);
  best_population_score_ = FeasibleScore(population_.front());
  stagnant_generations_ = 0;
}

const Schedule& GeneticAlgorithmStrategy::TournamentSelect() {
  DCHECK(!population_.empty());
  int winner = absl::Uniform<int>(random_, 0, population_.size());
  for (int i = 1; i < parameters_.tournament_size(); ++i) {
    const int contender = absl::Uniform<int>(random_, 0, population_.size());
    if (Fitter(population_[contender], population_[winner])) {
      winner = contender;
    }
  }
  return population_[winner];
}

Schedule GeneticAlgorithmStrategy::Mutate(Schedule child,
                                          const RuleSet& rules) {
  if (child.violations().empty() || !randomizer_->StrategicSwap(&child)) {
    child = randomizer_->Randomize(child);
  }
  child.Evaluate(rules);
  return child;
}

void GeneticAlgorithmStrategy::Diversify(const RuleSet& rules) {
  const int num_elites = std::max(1, parameters_.elite_count());
  for (int i = parameters_.elite_count(); i < population_.size(); ++i) {
    const Schedule& parent =
        population_[absl::Uniform<int>(random_, 0, num_elites)];
    Schedule fresh = randomizer_->Randomize(parent);
    fresh.Evaluate(rules);
    population_[i] = std::move(fresh);
  }
  SortByFitness(&population_);
  ++num_diversifications_;
  VLOG(1) << "Generation " << generation_
          << ": population diversified after stagnation";
}

StepResult GeneticAlgorithmStrategy::Step(const OptimizationState& state,
                                          int iteration,
                                          const RuleSet& rules) {
  if (population_.empty()) InitializePopulation(state.current, rules);

  std::vector<Schedule> next;
  next.reserve(parameters_.population_size());
  for (int i = 0; i < parameters_.elite_count(); ++i) {
    next.push_back(population_[i]);
  }
  while (next.size() < parameters_.population_size()) {
    const Schedule& first = TournamentSelect();
    const Schedule& second = TournamentSelect();
    Schedule child = randomizer_->Crossover(
        first, second, parameters_.division_crossover_probability());
    child.Evaluate(rules);
    if (absl::Bernoulli(random_, parameters_.mutation_rate())) {
      child = Mutate(std::move(child), rules);
    }
    next.push_back(std::move(child));
  }
  SortByFitness(&next);
  population_ = std::move(next);
  ++generation_;

  const int64_t leader_score = FeasibleScore(population_.front());
  if (leader_score < best_population_score_) {
    best_population_score_ = leader_score;
    stagnant_generations_ = 0;
  } else if (++stagnant_generations_ >= parameters_.stagnation_generations()) {
    Diversify(rules);
    stagnant_generations_ = 0;
  }

  StepResult result;
  const Schedule& leader = population_.front();
  VLOG(2) << "Iteration " << iteration << ", generation " << generation_
          << ": best score " << leader.score();
  if (leader.HasCriticalViolation()) return result;
  result.new_current = leader;
  if (leader.score() < state.best_score) result.new_best = leader;
  return result;
}

}  // namespace tourney
