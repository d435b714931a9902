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

#include "elmgen/environment.h"

#include <fmt/core.h>

#include <cstddef>
#include <limits>
#include <string>

#include "elmgen/error.h"
#include "elmgen/expression.h"
#include "elmgen/name.h"

namespace elmgen {

Local fresh_local(std::size_t i) {
  constexpr std::size_t LETTERS = 26;
  if (i == std::numeric_limits<std::size_t>::max()) {
    throw InternalError("Fresh name supply exhausted.");
  }
  std::u8string name(1, static_cast<char8_t>(u8'a' + i % LETTERS));
  if (i >= LETTERS) {
    const std::string suffix = fmt::format("{}", (i - LETTERS) / LETTERS);
    name.append(suffix.begin(), suffix.end());
  }
  return Local(name);
}

Environment<Void> empty_environment() {
  return Environment<Void>([](const Void& v) -> Local { absurd(v); });
}

}  // namespace elmgen
