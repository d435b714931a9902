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

#include <gmpxx.h>

#include <compare>
#include <string>

namespace elmgen {

/**
 * A string literal. The text is stored already escaped for the target
 * language and is emitted verbatim between double quotes.
 */
struct StringLiteral {
  std::u8string value;

  auto operator<=>(const StringLiteral&) const = default;
};

struct IntLiteral {
  mpz_class value;

  bool operator==(const IntLiteral& o) const { return cmp(value, o.value) == 0; }

  std::strong_ordering operator<=>(const IntLiteral& o) const {
    return cmp(value, o.value) <=> 0;
  }
};

/**
 * A floating point literal.
 *
 * Comparison uses the IEEE total order, so every value (including NaNs)
 * is equal to itself and -0.0 sorts before 0.0.
 */
struct FloatLiteral {
  double value;

  bool operator==(const FloatLiteral& o) const {
    return std::strong_order(value, o.value) == 0;
  }

  std::strong_ordering operator<=>(const FloatLiteral& o) const {
    return std::strong_order(value, o.value);
  }
};

}  // namespace elmgen
