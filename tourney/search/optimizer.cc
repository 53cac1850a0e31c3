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

#include "tourney/search/optimizer.h"

#include <algorithm>
#include <cstdint>
#include <utility>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/random/bit_gen_ref.h"
#include "absl/status/statusor.h"
#include "tourney/base/status_macros.h"
#include "tourney/model/schedule.h"
#include "tourney/rules/schedule_rule.h"
#include "tourney/search/optimization_strategy.h"
#include "tourney/search/optimizer_parameters.h"
#include "tourney/search/optimizer_parameters.pb.h"

namespace tourney {

ScheduleOptimizer::ScheduleOptimizer(Schedule schedule, const RuleSet* rules,
                                     const OptimizerParameters& parameters,
                                     absl::BitGenRef random)
    : rules_(*rules),
      parameters_(parameters),
      randomizer_(parameters.randomization(), random),
      strategy_(MakeOptimizationStrategy(parameters, &randomizer_, random)),
      current_(std::move(schedule)),
      best_(current_) {
  CHECK(strategy_ != nullptr);
  initial_score_ = current_.Evaluate(rules_);
  best_ = current_;
  VLOG(1) << strategy_->name() << ": initial score " << initial_score_
          << ", " << parameters_.num_iterations() << " iterations";
}

void ScheduleOptimizer::Iterate() {
  StepResult result = strategy_->Step(
      OptimizationState{current_, current_.score(), best_, best_.score()},
      iteration_, rules_);
  ++iteration_;

  if (result.new_current.has_value()) {
    current_ = *std::move(result.new_current);
    if (!current_.evaluated()) current_.Evaluate(rules_);
  }
  bool improved = false;
  if (result.new_best.has_value()) {
    Schedule& candidate = *result.new_best;
    if (!candidate.evaluated()) candidate.Evaluate(rules_);
    if (!candidate.HasCriticalViolation() &&
        candidate.score() < best_.score()) {
      best_ = std::move(candidate);
      improved = true;
    }
  }
  if (!current_.HasCriticalViolation() && current_.score() < best_.score()) {
    best_ = current_;
    improved = true;
  }
  if (improved) {
    VLOG(1) << "Iteration " << iteration_ << ": new best score "
            << best_.score();
    ReportProgress();
  }
}

void ScheduleOptimizer::ReportProgress() {
  last_reported_iteration_ = iteration_;
  if (progress_callback_ == nullptr) return;
  const int num_iterations = parameters_.num_iterations();
  const double progress =
      num_iterations == 0
          ? 1.0
          : static_cast<double>(iteration_) / num_iterations;
  progress_callback_(OptimizationProgress{
      iteration_, num_iterations, progress, initial_score_, current_.score(),
      best_.score(), best_.violations(), best_});
}

bool ScheduleOptimizer::RunSlice() {
  if (!done()) {
    const int end = std::min(iteration_ + parameters_.progress_interval(),
                             parameters_.num_iterations());
    while (iteration_ < end) Iterate();
  }
  if (last_reported_iteration_ != iteration_) ReportProgress();
  if (!done()) return true;
  VLOG(1) << strategy_->name() << ": done after " << iteration_
          << " iterations, score " << initial_score_ << " -> "
          << best_.score();
  return false;
}

Schedule ScheduleOptimizer::Optimize() {
  while (RunSlice()) {
  }
  return best_;
}

absl::StatusOr<Schedule> Optimize(const Schedule& schedule,
                                  const RuleSet& rules,
                                  const OptimizerParameters& parameters,
                                  absl::BitGenRef random,
                                  ProgressCallback progress_callback) {
  RETURN_IF_ERROR(ValidateOptimizerParameters(parameters));
  ScheduleOptimizer optimizer(schedule.DeepCopy(), &rules, parameters, random);
  optimizer.set_progress_callback(std::move(progress_callback));
  Schedule best = optimizer.Optimize();
  LOG(INFO) << optimizer.strategy().name() << ": score "
            << optimizer.initial_score() << " -> " << best.score() << " in "
            << optimizer.iteration() << " iterations";
  return best;
}

}  // namespace tourney
