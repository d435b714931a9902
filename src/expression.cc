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

#include "elmgen/expression.h"

#include <fmt/core.h>

#include <iterator>
#include <string>
#include <utility>

#include "elmgen/error.h"

namespace elmgen {

InternalError::InternalError(std::string msg)
    : msg(std::move(msg)),
      full_msg(fmt::format("elmgen: internal error: {}", this->msg)) {}

void absurd(const Void&) {
  throw InternalError("Inspected a value of an uninhabited type.");
}

void print_ast(std::string&, int, const Void& v) { absurd(v); }

void print_ast(std::string& out, int, const Bound& b) {
  fmt::format_to(std::back_inserter(out), "(Bound {} {})", b.scope, b.index);
}

}  // namespace elmgen
