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

// Schedule optimization driver.
//
// Example:
//   RuleSet rules = DefaultRuleSet();
//   OptimizerParameters parameters = DefaultOptimizerParameters();
//   parameters.set_strategy(STRATEGIC_SEARCH);
//   absl::BitGen random;
//   ASSIGN_OR_RETURN(Schedule best,
//                    Optimize(schedule, rules, parameters, random));
//
// The search runs in slices of progress_interval iterations (see RunSlice()),
// so that a caller owning an event loop can interleave other work and stop
// early by not calling RunSlice() again.

#ifndef TOURNEY_SEARCH_OPTIMIZER_H_
#define TOURNEY_SEARCH_OPTIMIZER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "absl/random/bit_gen_ref.h"
#include "absl/status/statusor.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/schedule.h"
#include "tourney/rules/schedule_rule.h"
#include "tourney/search/optimization_strategy.h"
#include "tourney/search/optimizer_parameters.pb.h"
#include "tourney/search/schedule_randomizer.h"

namespace tourney {

struct OptimizationProgress {
  int iteration;
  int num_iterations;
  // iteration / num_iterations, in [0, 1].
  double progress;
  int64_t initial_score;
  int64_t current_score;
  int64_t best_score;
  // Violations of the best schedule.
  std::vector<RuleViolation> violations;
  // Copy of the best schedule at the time of the report.
  Schedule best_schedule;
};

// Called after every slice of progress_interval iterations, on every
// improvement of the best schedule, and once the iteration budget is spent.
using ProgressCallback = std::function<void(const OptimizationProgress&)>;

class ScheduleOptimizer {
 public:
  // `parameters` must be valid (see ValidateOptimizerParameters()). `rules`
  // and `random` must outlive the optimizer. `schedule` is evaluated with
  // `rules` and becomes both the current and the best schedule.
  ScheduleOptimizer(Schedule schedule, const RuleSet* rules,
                    const OptimizerParameters& parameters,
                    absl::BitGenRef random);

  ScheduleOptimizer(const ScheduleOptimizer&) = delete;
  ScheduleOptimizer& operator=(const ScheduleOptimizer&) = delete;

  void set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
  }

  // Runs the next progress_interval iterations, or what remains of the
  // budget, then reports progress. Returns false once the budget is spent.
  bool RunSlice();

  // Runs all the remaining iterations and returns the best schedule.
  Schedule Optimize();

  bool done() const { return iteration_ >= parameters_.num_iterations(); }
  int iteration() const { return iteration_; }
  int64_t initial_score() const { return initial_score_; }
  const Schedule& current() const { return current_; }
  // Never scores worse than the initial schedule.
  const Schedule& best() const { return best_; }
  const OptimizationStrategy& strategy() const { return *strategy_; }

 private:
  void Iterate();
  void ReportProgress();

  const RuleSet& rules_;
  const OptimizerParameters parameters_;
  ScheduleRandomizer randomizer_;
  std::unique_ptr<OptimizationStrategy> strategy_;
  Schedule current_;
  Schedule best_;
  int64_t initial_score_ = 0;
  int iteration_ = 0;
  int last_reported_iteration_ = -1;
  ProgressCallback progress_callback_;
};

// Validates `parameters` and runs a ScheduleOptimizer on a copy of
// `schedule`. The input schedule is not modified.
absl::StatusOr<Schedule> Optimize(const Schedule& schedule,
                                  const RuleSet& rules,
                                  const OptimizerParameters& parameters,
                                  absl::BitGenRef random,
                                  ProgressCallback progress_callback = nullptr);

}  // namespace tourney

#endif  // TOURNEY_SEARCH_OPTIMIZER_H_
