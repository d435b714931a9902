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

#include <fmt/core.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <set>
#include <utility>
#include <vector>

#include "elmgen/error.h"
#include "elmgen/expression.h"
#include "elmgen/name.h"
#include "elmgen/pattern.h"

namespace elmgen {

/**
 * The `i`th name of the fresh name supply: `a` to `z`, then `a0` to
 * `z0`, `a1` to `z1`, and so on.
 */
Local fresh_local(std::size_t i);

/**
 * Display names for the variables in scope while printing an
 * `Expression<V>`.
 *
 * Free variables are named by a caller-supplied function. Each binder
 * opened while descending into the tree pushes a frame naming its
 * variables; a `Bound{n, i}` occurrence is variable `i` of the frame `n`
 * levels up. Environments are immutable values: `extend` returns a new
 * environment and leaves this one usable.
 *
 * Names already visible in the printed text, such as those of free
 * variables, can be withheld from the fresh name supply with `avoiding`,
 * so that no binder captures them.
 */
template <typename V>
class Environment {
 public:
  using free_names_t = std::function<Local(const V&)>;

  explicit Environment(free_names_t free_names)
      : free_names_(std::move(free_names)) {}

  /** This environment, with fresh names that also skip `names`. */
  Environment avoiding(const std::set<Local>& names) const {
    Environment env = *this;
    std::set<Local> reserved = names;
    if (reserved_ != nullptr) {
      reserved.insert(reserved_->begin(), reserved_->end());
    }
    env.reserved_ =
        std::make_shared<const std::set<Local>>(std::move(reserved));
    return env;
  }

  /** Opens a single-variable scope, naming its variable. */
  std::pair<Environment, Local> extend() const {
    Environment env = *this;
    Local name = env.take_fresh();
    env.frames_ = std::make_shared<const Frame>(
        Frame{.names = {{0, name}}, .parent = frames_});
    return {std::move(env), std::move(name)};
  }

  /**
   * Opens the scope of a case branch, naming the distinct variables of
   * `pattern` in ascending order of index.
   */
  Environment extend_for_pattern(const Pattern<int>& pattern) const {
    Environment env = *this;
    std::vector<std::pair<int, Local>> names;
    for (int index : pattern_variables(pattern)) {
      names.emplace_back(index, env.take_fresh());
    }
    env.frames_ = std::make_shared<const Frame>(
        Frame{.names = std::move(names), .parent = frames_});
    return env;
  }

  Local lookup(const Var<V>& var) const {
    if (const Bound* b = std::get_if<Bound>(&var)) return lookup(*b);
    return free_names_(std::get<V>(var));
  }

  /** Throws `InternalError` if no open scope binds `b`. */
  Local lookup(const Bound& b) const {
    const Frame* frame = frames_.get();
    for (std::size_t i = 0; frame != nullptr && i < b.scope; ++i) {
      frame = frame->parent.get();
    }
    if (frame == nullptr) {
      throw InternalError(fmt::format(
          "Placeholder refers to scope {} but only {} are open.", b.scope,
          depth()));
    }
    for (const auto& [index, name] : frame->names) {
      if (index == b.index) return name;
    }
    throw InternalError(
        fmt::format("Unbound pattern variable {} in scope {}.", b.index,
                    b.scope));
  }

  /** The number of open scopes. */
  std::size_t depth() const {
    std::size_t n = 0;
    for (const Frame* f = frames_.get(); f != nullptr; f = f->parent.get())
      ++n;
    return n;
  }

 private:
  struct Frame {
    std::vector<std::pair<int, Local>> names;
    std::shared_ptr<const Frame> parent;
  };

  free_names_t free_names_;
  std::shared_ptr<const Frame> frames_;
  std::shared_ptr<const std::set<Local>> reserved_;
  std::size_t next_fresh_ = 0;

  Local take_fresh() {
    for (;;) {
      Local name = fresh_local(next_fresh_++);
      if (reserved_ == nullptr || !reserved_->contains(name)) return name;
    }
  }
};

/** The environment for closed trees. */
Environment<Void> empty_environment();

}  // namespace elmgen
