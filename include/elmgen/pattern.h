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
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "elmgen/ast_printer.h"
#include "elmgen/literal.h"
#include "elmgen/name.h"

namespace elmgen {

template <typename Idx>
class Pattern;

namespace pat {

/** A variable declared by the pattern, identified by `index`. */
template <typename Idx>
struct var_t {
  Idx index;

  auto operator<=>(const var_t&) const = default;
};

struct wildcard_t {
  auto operator<=>(const wildcard_t&) const = default;
};

template <typename Idx>
struct con_t {
  Qualified constructor;
  std::vector<Pattern<Idx>> args;

  std::weak_ordering operator<=>(const con_t&) const = default;
};

template <typename Idx>
using repr = std::variant<var_t<Idx>, wildcard_t, con_t<Idx>, StringLiteral,
                          IntLiteral, FloatLiteral>;

template <typename Idx>
struct node {
  repr<Idx> r;
};

}  // namespace pat

/**
 * A case branch pattern. `Idx` identifies the variables the pattern
 * declares; a pattern may mention the same index more than once.
 */
template <typename Idx>
class Pattern {
 public:
  using repr_type = pat::repr<Idx>;

  static Pattern var(Idx index) { return make(pat::var_t<Idx>{index}); }

  static Pattern wildcard() { return make(pat::wildcard_t{}); }

  static Pattern con(Qualified constructor, std::vector<Pattern> args = {}) {
    return make(pat::con_t<Idx>{std::move(constructor), std::move(args)});
  }

  /** @overload Parses `constructor` as with `Qualified::parse`. */
  static Pattern con(std::u8string_view constructor,
                     std::vector<Pattern> args = {}) {
    return con(Qualified::parse(constructor), std::move(args));
  }

  static Pattern string(std::u8string value) {
    return make(StringLiteral{std::move(value)});
  }

  static Pattern integer(mpz_class value) {
    return make(IntLiteral{std::move(value)});
  }

  static Pattern floating(double value) { return make(FloatLiteral{value}); }

  const repr_type& repr() const { return node_->r; }

  template <typename T>
  const T* get_if() const {
    return std::get_if<T>(&node_->r);
  }

  friend bool operator==(const Pattern& l, const Pattern& r) {
    return l.node_ == r.node_ || l.node_->r == r.node_->r;
  }

  friend std::weak_ordering operator<=>(const Pattern& l, const Pattern& r) {
    if (l.node_ == r.node_) return std::weak_ordering::equivalent;
    return l.node_->r <=> r.node_->r;
  }

 private:
  std::shared_ptr<const pat::node<Idx>> node_;

  explicit Pattern(std::shared_ptr<const pat::node<Idx>> node)
      : node_(std::move(node)) {}

  template <typename T>
  static Pattern make(T t) {
    return Pattern(
        std::make_shared<const pat::node<Idx>>(pat::node<Idx>{std::move(t)}));
  }
};

namespace detail {

template <typename Idx>
void collect_pattern_variables(const Pattern<Idx>& p, std::set<Idx>& out) {
  if (const auto* v = p.template get_if<pat::var_t<Idx>>()) {
    out.insert(v->index);
  } else if (const auto* c = p.template get_if<pat::con_t<Idx>>()) {
    for (const auto& arg : c->args) collect_pattern_variables(arg, out);
  }
}

}  // namespace detail

/** The distinct variables declared by `p`, in ascending order. */
template <typename Idx>
std::set<Idx> pattern_variables(const Pattern<Idx>& p) {
  std::set<Idx> vars;
  detail::collect_pattern_variables(p, vars);
  return vars;
}

template <typename Idx>
void print_ast(std::string& out, int indent, const Pattern<Idx>& p) {
  std::visit(
      [&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, pat::var_t<Idx>>) {
          print_sexp(out, indent, "PVar", n.index);
        } else if constexpr (std::is_same_v<T, pat::wildcard_t>) {
          print_sexp(out, indent, "PWildcard");
        } else if constexpr (std::is_same_v<T, pat::con_t<Idx>>) {
          print_sexp(out, indent, "PCon", n.constructor, n.args);
        } else {
          print_ast(out, indent, n);
        }
      },
      p.repr());
}

}  // namespace elmgen
