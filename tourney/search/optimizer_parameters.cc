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

#include "tourney/search/optimizer_parameters.h"

#include <cmath>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tourney/base/status_macros.h"
#include "tourney/search/optimizer_parameters.pb.h"

namespace tourney {
namespace {

using ::absl::InvalidArgumentError;
using ::absl::OkStatus;

absl::Status CheckPositive(double value, absl::string_view name) {
  if (std::isnan(value)) {
    return InvalidArgumentError(absl::StrCat(name, " is NAN"));
  }
  if (value <= 0) {
    return InvalidArgumentError(absl::StrCat(name, " must be positive"));
  }
  return OkStatus();
}

absl::Status CheckProbability(double value, absl::string_view name) {
  if (std::isnan(value)) {
    return InvalidArgumentError(absl::StrCat(name, " is NAN"));
  }
  if (value < 0 || value > 1) {
    return InvalidArgumentError(absl::StrCat(name, " must be in [0, 1]"));
  }
  return OkStatus();
}

absl::Status CheckCoolingRate(double value, absl::string_view name) {
  if (std::isnan(value)) {
    return InvalidArgumentError(absl::StrCat(name, " is NAN"));
  }
  if (value <= 0 || value > 1) {
    return InvalidArgumentError(absl::StrCat(name, " must be in (0, 1]"));
  }
  return OkStatus();
}

}  // namespace

OptimizerParameters DefaultOptimizerParameters() {
  OptimizerParameters parameters;
  parameters.set_strategy(SIMULATED_ANNEALING);
  parameters.set_num_iterations(10000);
  parameters.set_progress_interval(100);
  parameters.set_random_seed(0);

  RandomizationParameters* randomization = parameters.mutable_randomization();
  randomization->set_block_shuffle_probability(0.25);
  randomization->set_division_shuffle_probability(0.5);

  SimulatedAnnealingParameters* annealing =
      parameters.mutable_simulated_annealing();
  annealing->set_initial_temperature(150);
  annealing->set_cooling_rate(0.995);

  StrategicSearchParameters* strategic = parameters.mutable_strategic_search();
  strategic->set_initial_temperature(100);
  strategic->set_cooling_rate(0.997);
  strategic->set_targeted_move_probability(0.8);
  strategic->set_swap_attempts(3);
  strategic->set_scramble_fraction(0.3);
  strategic->set_max_consecutive_rejections(50);
  strategic->set_reheat_factor(1.5);
  strategic->set_max_temperature(200);

  GeneticAlgorithmParameters* genetic = parameters.mutable_genetic_algorithm();
  genetic->set_population_size(20);
  genetic->set_elite_count(2);
  genetic->set_tournament_size(3);
  genetic->set_division_crossover_probability(0.5);
  genetic->set_mutation_rate(0.3);
  genetic->set_stagnation_generations(15);
  return parameters;
}

absl::Status ValidateRandomizationParameters(
    const RandomizationParameters& parameters) {
  RETURN_IF_ERROR(CheckProbability(parameters.block_shuffle_probability(),
                                   "block_shuffle_probability"));
  RETURN_IF_ERROR(CheckProbability(parameters.division_shuffle_probability(),
                                   "division_shuffle_probability"));
  if (parameters.block_shuffle_probability() +
          parameters.division_shuffle_probability() >
      1.0) {
    return InvalidArgumentError(
        "block_shuffle_probability + division_shuffle_probability must not "
        "exceed 1");
  }
  return OkStatus();
}

absl::Status ValidateSimulatedAnnealingParameters(
    const SimulatedAnnealingParameters& parameters) {
  RETURN_IF_ERROR(
      CheckPositive(parameters.initial_temperature(), "initial_temperature"));
  RETURN_IF_ERROR(CheckCoolingRate(parameters.cooling_rate(), "cooling_rate"));
  return OkStatus();
}

absl::Status ValidateStrategicSearchParameters(
    const StrategicSearchParameters& parameters) {
  RETURN_IF_ERROR(
      CheckPositive(parameters.initial_temperature(), "initial_temperature"));
  RETURN_IF_ERROR(CheckCoolingRate(parameters.cooling_rate(), "cooling_rate"));
  RETURN_IF_ERROR(CheckProbability(parameters.targeted_move_probability(),
                                   "targeted_move_probability"));
  if (parameters.swap_attempts() < 1) {
    return InvalidArgumentError("swap_attempts must be at least 1");
  }
  RETURN_IF_ERROR(
      CheckProbability(parameters.scramble_fraction(), "scramble_fraction"));
  if (parameters.max_consecutive_rejections() < 1) {
    return InvalidArgumentError(
        "max_consecutive_rejections must be at least 1");
  }
  if (std::isnan(parameters.reheat_factor()) ||
      parameters.reheat_factor() < 1) {
    return InvalidArgumentError("reheat_factor must be at least 1");
  }
  RETURN_IF_ERROR(
      CheckPositive(parameters.max_temperature(), "max_temperature"));
  return OkStatus();
}

absl::Status ValidateGeneticAlgorithmParameters(
    const GeneticAlgorithmParameters& parameters) {
  if (parameters.population_size() < 2) {
    return InvalidArgumentError("population_size must be at least 2");
  }
  if (parameters.elite_count() < 0 ||
      parameters.elite_count() >= parameters.population_size()) {
    return InvalidArgumentError(
        "elite_count must be in [0, population_size)");
  }
  if (parameters.tournament_size() < 1) {
    return InvalidArgumentError("tournament_size must be at least 1");
  }
  RETURN_IF_ERROR(CheckProbability(parameters.division_crossover_probability(),
                                   "division_crossover_probability"));
  RETURN_IF_ERROR(
      CheckProbability(parameters.mutation_rate(), "mutation_rate"));
  if (parameters.stagnation_generations() < 1) {
    return InvalidArgumentError("stagnation_generations must be at least 1");
  }
  return OkStatus();
}

absl::Status ValidateOptimizerParameters(
    const OptimizerParameters& parameters) {
  if (!OptimizationStrategyType_IsValid(parameters.strategy())) {
    return InvalidArgumentError("invalid value for strategy");
  }
  if (parameters.num_iterations() < 0) {
    return InvalidArgumentError("num_iterations must be non-negative");
  }
  if (parameters.progress_interval() < 1) {
    return InvalidArgumentError("progress_interval must be at least 1");
  }
  RETURN_IF_ERROR(ValidateRandomizationParameters(parameters.randomization()));
  RETURN_IF_ERROR(
      ValidateSimulatedAnnealingParameters(parameters.simulated_annealing()));
  RETURN_IF_ERROR(
      ValidateStrategicSearchParameters(parameters.strategic_search()));
  RETURN_IF_ERROR(
      ValidateGeneticAlgorithmParameters(parameters.genetic_algorithm()));
  return OkStatus();
}

bool ParseOptimizationStrategyType(absl::string_view name,
                                   OptimizationStrategyType* strategy) {
  const std::string upper =
      absl::AsciiStrToUpper(absl::StripAsciiWhitespace(name));
  return OptimizationStrategyType_Parse(upper, strategy);
}

}  // namespace tourney
