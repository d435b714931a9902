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

#include <exception>
#include <string>

namespace elmgen {

/**
 * Error thrown when a tree handed to the printer violates the binding
 * invariants, or when the printer reaches a state that cannot occur on
 * well-formed input.
 *
 * These are programming errors in the caller (or in elmgen itself); the
 * whole render is abandoned and no partial output is produced.
 */
class InternalError : public std::exception {
 public:
  explicit InternalError(std::string msg);

  virtual const char* what() const noexcept override {
    return full_msg.c_str();
  }

  const std::string msg;
  const std::string full_msg;
};

}  // namespace elmgen
