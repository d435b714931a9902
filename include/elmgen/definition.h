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

#include <compare>
#include <utility>
#include <variant>
#include <vector>

#include "elmgen/expression.h"
#include "elmgen/name.h"
#include "elmgen/type.h"

namespace elmgen {

namespace def {

/**
 * A top-level value with its type signature. Leading lambdas of `body`
 * are printed as the equation's arguments.
 */
struct constant_t {
  Qualified name;
  Type<Void> type;
  Expression<Void> body;

  std::weak_ordering operator<=>(const constant_t&) const = default;
};

/** A union type. Each constructor carries its argument types. */
struct type_t {
  Qualified name;
  std::vector<std::pair<Constructor, std::vector<Type<Void>>>> constructors;

  std::weak_ordering operator<=>(const type_t&) const = default;
};

struct alias_t {
  Qualified name;
  Type<Void> type;

  std::weak_ordering operator<=>(const alias_t&) const = default;
};

}  // namespace def

/**
 * A top-level declaration. Definitions are printed under their
 * unqualified name; the module part of `name` says where they live.
 */
using Definition = std::variant<def::constant_t, def::type_t, def::alias_t>;

}  // namespace elmgen
