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

#ifndef TOURNEY_RULES_SCHEDULE_RULE_H_
#define TOURNEY_RULES_SCHEDULE_RULE_H_

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/types/span.h"
#include "tourney/model/match.h"
#include "tourney/model/rule_violation.h"
#include "tourney/model/schedule.h"

namespace tourney {

// A soft constraint on a schedule. Each violation a rule reports adds its
// priority to the score of the schedule.
//
// Rules only read the schedule they evaluate, and must be deterministic:
// evaluating the same schedule twice yields the same violations in the same
// order.
class ScheduleRule {
 public:
  ScheduleRule(std::string name, int priority)
      : name_(std::move(name)), priority_(priority) {}
  virtual ~ScheduleRule() = default;

  const std::string& name() const { return name_; }
  int priority() const { return priority_; }

  // The matches of `schedule` are sorted by time slot.
  virtual std::vector<RuleViolation> Evaluate(
      const Schedule& schedule) const = 0;

 protected:
  // Fills the rule name and priority of a new violation.
  RuleViolation MakeViolation(std::string description,
                              std::vector<Match> matches,
                              ViolationLevel level) const;

 private:
  const std::string name_;
  const int priority_;
};

// A rule backed by a function, for rules defined by the host application.
class FunctionRule : public ScheduleRule {
 public:
  using EvaluationFunction =
      std::function<std::vector<RuleViolation>(const Schedule&)>;

  FunctionRule(std::string name, int priority, EvaluationFunction function)
      : ScheduleRule(std::move(name), priority),
        function_(std::move(function)) {}

  // Overwrites the rule name and priority of the violations returned by the
  // function.
  std::vector<RuleViolation> Evaluate(const Schedule& schedule) const override;

 private:
  EvaluationFunction function_;
};

// An ordered list of rules, plus the weight of the hard constraints that are
// always checked.
class RuleSet {
 public:
  static constexpr int kDefaultHardConstraintWeight = 10;

  RuleSet() = default;
  RuleSet(RuleSet&&) = default;
  RuleSet& operator=(RuleSet&&) = default;

  void Add(std::unique_ptr<ScheduleRule> rule) {
    rules_.push_back(std::move(rule));
  }

  // Constructs a rule in place and returns a borrowed pointer to it.
  template <typename RuleType, typename... Args>
  RuleType* Emplace(Args&&... args) {
    auto rule = std::make_unique<RuleType>(std::forward<Args>(args)...);
    RuleType* const result = rule.get();
    rules_.push_back(std::move(rule));
    return result;
  }

  absl::Span<const std::unique_ptr<ScheduleRule>> rules() const {
    return rules_;
  }
  int size() const { return rules_.size(); }
  bool empty() const { return rules_.empty(); }

  // Returns nullptr if no rule has this name.
  const ScheduleRule* FindRule(const std::string& name) const;

  int hard_constraint_weight() const { return hard_constraint_weight_; }
  void set_hard_constraint_weight(int weight) {
    hard_constraint_weight_ = weight;
  }

 private:
  std::vector<std::unique_ptr<ScheduleRule>> rules_;
  int hard_constraint_weight_ = kDefaultHardConstraintWeight;
};

}  // namespace tourney

#endif  // TOURNEY_RULES_SCHEDULE_RULE_H_
