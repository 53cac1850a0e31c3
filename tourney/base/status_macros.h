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

#ifndef TOURNEY_BASE_STATUS_MACROS_H_
#define TOURNEY_BASE_STATUS_MACROS_H_

#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Evaluates an expression returning an absl::Status and returns it from the
// enclosing function if it is not OK.
//
// Example:
//   RETURN_IF_ERROR(ValidateRuleConfig(config));
#define RETURN_IF_ERROR(expr)                                          \
  do {                                                                 \
    if (const ::absl::Status tourney_status_macro_internal = (expr);   \
        !tourney_status_macro_internal.ok()) {                         \
      return tourney_status_macro_internal;                            \
    }                                                                  \
  } while (false)

// Executes an expression returning an absl::StatusOr, moving its value into
// `lhs` or returning the error from the enclosing function.
//
// Example:
//   ASSIGN_OR_RETURN(const TeamIndex team, tournament.AddTeam(name, division));
//
// ASSIGN_OR_RETURN expands into several statements; it cannot be the body of
// an if statement without braces.
#define ASSIGN_OR_RETURN(lhs, rexpr)                                          \
  TOURNEY_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(                               \
      TOURNEY_STATUS_MACROS_IMPL_CONCAT_(tourney_status_or_value,             \
                                         __COUNTER__),                        \
      lhs, rexpr)

#define TOURNEY_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                                 \
  if (!statusor.ok()) return std::move(statusor).status();                 \
  lhs = std::move(statusor).value()

#define TOURNEY_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define TOURNEY_STATUS_MACROS_IMPL_CONCAT_(x, y) \
  TOURNEY_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y)

#endif  // TOURNEY_BASE_STATUS_MACROS_H_
