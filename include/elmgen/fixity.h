// Copyright 2023 Matt Rudary

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//     http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <map>

#include "elmgen/name.h"

namespace elmgen {

enum class associativity {
  LEFT,
  RIGHT,
  NONE,
};

/** How an infix operator binds. */
struct operator_fixity {
  int level;
  associativity assoc;
  /** Whether the right operand goes on its own line, as for `|>`. */
  bool breaks_line = false;

  /** The minimum precedence at which the left operand prints bare. */
  int left_precedence() const {
    return assoc == associativity::LEFT ? level : level + 1;
  }

  /** The minimum precedence at which the right operand prints bare. */
  int right_precedence() const {
    return assoc == associativity::RIGHT ? level : level + 1;
  }

  auto operator<=>(const operator_fixity&) const = default;
};

/** Precedence of `let`, lambdas, `case` and function arrows. */
constexpr int MIN_PRECEDENCE = 0;
/** Precedence of prefix application; binds tighter than any operator. */
constexpr int APPLICATION_PRECEDENCE = 10;

/** Keyed by the operator's qualified name, e.g. `Basics.+`. */
using fixity_table = std::map<Qualified, operator_fixity>;

/** The operators of Elm's core library and elm/parser. */
fixity_table default_fixities();

}  // namespace elmgen
