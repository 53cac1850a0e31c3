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

#ifndef TOURNEY_SEARCH_OPTIMIZER_PARAMETERS_H_
#define TOURNEY_SEARCH_OPTIMIZER_PARAMETERS_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "tourney/search/optimizer_parameters.pb.h"

namespace tourney {

// Returns parameters with every field explicitly set to its default value.
OptimizerParameters DefaultOptimizerParameters();

// Returns InvalidArgument naming the first offending field, if any.
absl::Status ValidateOptimizerParameters(const OptimizerParameters& parameters);
absl::Status ValidateRandomizationParameters(
    const RandomizationParameters& parameters);
absl::Status ValidateSimulatedAnnealingParameters(
    const SimulatedAnnealingParameters& parameters);
absl::Status ValidateStrategicSearchParameters(
    const StrategicSearchParameters& parameters);
absl::Status ValidateGeneticAlgorithmParameters(
    const GeneticAlgorithmParameters& parameters);

// Parses "simulated_annealing", "genetic_algorithm" or "strategic_search",
// case-insensitively. Enum names are accepted too.
bool ParseOptimizationStrategyType(absl::string_view name,
                                   OptimizationStrategyType* strategy);

}  // namespace tourney

#endif  // TOURNEY_SEARCH_OPTIMIZER_PARAMETERS_H_
