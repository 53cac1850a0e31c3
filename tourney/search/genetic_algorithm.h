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

#ifndef TOURNEY_SEARCH_GENETIC_ALGORITHM_H_
#define TOURNEY_SEARCH_GENETIC_ALGORITHM_H_

#include <cstdint>
#include <limits>
#include <vector>

#include "absl/random/bit_gen_ref.h"
#include "absl/strings/string_view.h"
#include "tourney/model/schedule.h"
#include "tourney/rules/schedule_rule.h"
#include "tourney/search/optimization_strategy.h"
#include "tourney/search/optimizer_parameters.pb.h"
#include "tourney/search/schedule_randomizer.h"

namespace tourney {

// Evolves a population of schedules; each call to Step() produces one
// generation. The population is seeded on the first call with the current
// schedule and randomizations of it.
//
// A generation keeps the elite unchanged and fills the rest with children:
// two parents picked by tournament selection are crossed over division by
// division, then the child is mutated with probability mutation_rate, by a
// strategic swap when it has violations and by a randomization otherwise.
// Individuals with a critical violation rank after all others, whatever their
// score. When the best score without critical violation has not improved for
// stagnation_generations generations, every non-elite individual is replaced
// by a randomization of an elite one.
//
// The best individual is returned as new current schedule unless the whole
// population has critical violations, and as new best when it beats the best
// score.
class GeneticAlgorithmStrategy : public OptimizationStrategy {
 public:
  // `randomizer` and `random` must outlive the strategy.
  GeneticAlgorithmStrategy(const GeneticAlgorithmParameters& parameters,
                           ScheduleRandomizer* randomizer,
                           absl::BitGenRef random);

  absl::string_view name() const override { return "genetic_algorithm"; }
  StepResult Step(const OptimizationState& state, int iteration,
                  const RuleSet& rules) override;

  // Individuals without critical violation first, each group sorted by
  // increasing score. Empty before the first step.
  const std::vector<Schedule>& population() const { return population_; }
  int generation() const { return generation_; }
  int num_diversifications() const { return num_diversifications_; }

 private:
  void InitializePopulation(const Schedule& seed, const RuleSet& rules);
  void Diversify(const RuleSet& rules);
  const Schedule& TournamentSelect();
  Schedule Mutate(Schedule child, const RuleSet& rules);

  const GeneticAlgorithmParameters parameters_;
  ScheduleRandomizer* const randomizer_;
  absl::BitGenRef random_;
  std::vector<Schedule> population_;
  int generation_ = 0;
  int64_t best_population_score_ = std::numeric_limits<int64_t>::max();
  int stagnant_generations_ = 0;
  int num_diversifications_ = 0;
};

}  // namespace tourney

#endif  // TOURNEY_SEARCH_GENETIC_ALGORITHM_H_
