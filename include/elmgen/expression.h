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

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "elmgen/ast_printer.h"
#include "elmgen/error.h"
#include "elmgen/literal.h"
#include "elmgen/name.h"
#include "elmgen/pattern.h"

/**
 * @file expression.h
 *
 * @brief The expression tree and its binder-safe substitution.
 *
 * Binders use a locally nameless representation. A variable occurrence
 * is either a free variable of type `V` or a `Bound` placeholder that
 * names its binder by counting the scopes between the occurrence and the
 * binder (0 is the innermost enclosing scope). Free variables and
 * placeholders are different alternatives of `Var<V>`, so substituting
 * for free variables can never rewrite a placeholder, and a substituted
 * value can never be captured by a binder it ends up under.
 *
 * A top-level tree is expected to be locally closed: every placeholder
 * refers to a scope inside the tree. Closed trees use `Void` for `V`.
 */

namespace elmgen {

/** An uninhabited type: the free-variable type of closed trees. */
struct Void {
  Void() = delete;

  friend auto operator<=>(const Void&, const Void&) = default;
};

/** Eliminates a `Void`, which cannot exist. Throws `InternalError`. */
[[noreturn]] void absurd(const Void&);

void print_ast(std::string& out, int indent, const Void& v);

/** A placeholder for a variable bound by an enclosing `Scope`. */
struct Bound {
  /** The number of scopes between this occurrence and its binder. */
  std::size_t scope;
  /** Which of the binder's variables; always 0 for single binders. */
  int index;

  auto operator<=>(const Bound&) const = default;
};

void print_ast(std::string& out, int indent, const Bound& b);

template <typename V>
using Var = std::variant<Bound, V>;

template <typename V>
class Expression;

/**
 * The body of a binder.
 *
 * `B` is the binder's index type: `std::monostate` for binders of a
 * single variable (`let`, lambda) and `int` for case branches, where the
 * index is the variable number declared by the branch's pattern. Inside
 * `body()`, `Bound{0, i}` refers to this scope's variable `i`.
 */
template <typename B, typename V>
class Scope {
 public:
  explicit Scope(Expression<V> body) : body_(std::move(body)) {}

  const Expression<V>& body() const { return body_; }

  friend bool operator==(const Scope&, const Scope&) = default;
  friend std::weak_ordering operator<=>(const Scope&,
                                        const Scope&) = default;

 private:
  Expression<V> body_;
};

template <typename V>
using Scope1 = Scope<std::monostate, V>;

template <typename V>
using ScopeN = Scope<int, V>;

template <typename V>
using Branch = std::pair<Pattern<int>, ScopeN<V>>;

namespace expr {

template <typename V>
struct var_t {
  Var<V> var;

  std::weak_ordering operator<=>(const var_t&) const = default;
};

struct global_t {
  Qualified name;

  std::weak_ordering operator<=>(const global_t&) const = default;
};

template <typename V>
struct app_t {
  Expression<V> fun;
  Expression<V> arg;

  std::weak_ordering operator<=>(const app_t&) const = default;
};

template <typename V>
struct let_t {
  Expression<V> bound;
  Scope1<V> body;

  std::weak_ordering operator<=>(const let_t&) const = default;
};

template <typename V>
struct lam_t {
  Scope1<V> body;

  std::weak_ordering operator<=>(const lam_t&) const = default;
};

template <typename V>
struct record_t {
  std::vector<std::pair<Field, Expression<V>>> fields;

  std::weak_ordering operator<=>(const record_t&) const = default;
};

/** A field accessor function, `.field`. */
struct proj_t {
  Field field;

  std::weak_ordering operator<=>(const proj_t&) const = default;
};

template <typename V>
struct case_t {
  Expression<V> scrutinee;
  std::vector<Branch<V>> branches;

  std::weak_ordering operator<=>(const case_t&) const = default;
};

template <typename V>
struct list_t {
  std::vector<Expression<V>> elements;

  std::weak_ordering operator<=>(const list_t&) const = default;
};

template <typename V>
using repr = std::variant<var_t<V>, global_t, app_t<V>, let_t<V>, lam_t<V>,
                          record_t<V>, proj_t, case_t<V>, list_t<V>,
                          StringLiteral, IntLiteral, FloatLiteral>;

template <typename V>
struct node {
  repr<V> r;
};

}  // namespace expr

/**
 * An immutable expression whose free variables have type `V`.
 *
 * Copies share structure. Nothing mutates a tree once built; the
 * operations in this file build new trees.
 */
template <typename V>
class Expression {
 public:
  using variable_type = V;
  using repr_type = expr::repr<V>;

  static Expression var(V v) { return make(expr::var_t<V>{std::move(v)}); }

  /**
   * A placeholder occurrence. Normally produced by `abstract`; building
   * placeholders by hand requires care to keep the tree locally closed.
   */
  static Expression bound(Bound b) { return make(expr::var_t<V>{b}); }

  static Expression global(Qualified name) {
    return make(expr::global_t{std::move(name)});
  }

  /** @overload Parses `name` as with `Qualified::parse`. */
  static Expression global(std::u8string_view name) {
    return global(Qualified::parse(name));
  }

  static Expression app(Expression fun, Expression arg) {
    return make(expr::app_t<V>{std::move(fun), std::move(arg)});
  }

  static Expression let(Expression bound, Scope1<V> body) {
    return make(expr::let_t<V>{std::move(bound), std::move(body)});
  }

  static Expression lam(Scope1<V> body) {
    return make(expr::lam_t<V>{std::move(body)});
  }

  /** Field names must be distinct; this is not checked. */
  static Expression record(
      std::vector<std::pair<Field, Expression>> fields) {
    return make(expr::record_t<V>{std::move(fields)});
  }

  static Expression proj(Field field) {
    return make(expr::proj_t{std::move(field)});
  }

  /**
   * Each branch's scope must bind exactly the variables declared by its
   * pattern. A mismatch is detected when the tree is printed.
   */
  static Expression case_of(Expression scrutinee,
                            std::vector<Branch<V>> branches) {
    return make(expr::case_t<V>{std::move(scrutinee), std::move(branches)});
  }

  static Expression list(std::vector<Expression> elements) {
    return make(expr::list_t<V>{std::move(elements)});
  }

  static Expression string(std::u8string value) {
    return make(StringLiteral{std::move(value)});
  }

  static Expression integer(mpz_class value) {
    return make(IntLiteral{std::move(value)});
  }

  static Expression floating(double value) {
    return make(FloatLiteral{value});
  }

  const repr_type& repr() const { return node_->r; }

  template <typename T>
  const T* get_if() const {
    return std::get_if<T>(&node_->r);
  }

  friend bool operator==(const Expression& l, const Expression& r)
    requires std::equality_comparable<V>
  {
    return l.node_ == r.node_ || l.node_->r == r.node_->r;
  }

  friend std::weak_ordering operator<=>(const Expression& l,
                                        const Expression& r)
    requires std::three_way_comparable<V, std::weak_ordering>
  {
    if (l.node_ == r.node_) return std::weak_ordering::equivalent;
    return l.node_->r <=> r.node_->r;
  }

 private:
  std::shared_ptr<const expr::node<V>> node_;

  explicit Expression(std::shared_ptr<const expr::node<V>> node)
      : node_(std::move(node)) {}

  template <typename T>
  static Expression make(T t) {
    return Expression(
        std::make_shared<const expr::node<V>>(expr::node<V>{std::move(t)}));
  }
};

namespace detail {

template <typename... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template <typename B>
int binder_index(const B& b) {
  if constexpr (std::is_same_v<B, std::monostate>) {
    return 0;
  } else {
    return b;
  }
}

template <typename B>
B binder_of(int index) {
  if constexpr (std::is_same_v<B, std::monostate>) {
    return std::monostate{};
  } else {
    return index;
  }
}

template <typename W, typename V, typename F>
Expression<W> traverse(const Expression<V>& e, std::size_t depth,
                       const F& on_var);

template <typename W, typename B, typename V, typename F>
Scope<B, W> traverse_scope(const Scope<B, V>& s, std::size_t depth,
                           const F& on_var) {
  return Scope<B, W>(traverse<W>(s.body(), depth + 1, on_var));
}

/**
 * Rebuilds `e` over variable type `W`, replacing each variable
 * occurrence `v` by `on_var(v, depth)`, where `depth` is the number of
 * scopes entered between `e` and the occurrence.
 */
template <typename W, typename V, typename F>
Expression<W> traverse(const Expression<V>& e, std::size_t depth,
                       const F& on_var) {
  using E = Expression<W>;
  auto rec = [&](const Expression<V>& sub) {
    return traverse<W>(sub, depth, on_var);
  };
  return std::visit(
      overloaded{
          [&](const expr::var_t<V>& n) -> E { return on_var(n.var, depth); },
          [&](const expr::global_t& n) -> E { return E::global(n.name); },
          [&](const expr::app_t<V>& n) -> E {
            return E::app(rec(n.fun), rec(n.arg));
          },
          [&](const expr::let_t<V>& n) -> E {
            return E::let(rec(n.bound),
                          traverse_scope<W>(n.body, depth, on_var));
          },
          [&](const expr::lam_t<V>& n) -> E {
            return E::lam(traverse_scope<W>(n.body, depth, on_var));
          },
          [&](const expr::record_t<V>& n) -> E {
            std::vector<std::pair<Field, E>> fields;
            fields.reserve(n.fields.size());
            for (const auto& [f, v] : n.fields) fields.emplace_back(f, rec(v));
            return E::record(std::move(fields));
          },
          [&](const expr::proj_t& n) -> E { return E::proj(n.field); },
          [&](const expr::case_t<V>& n) -> E {
            std::vector<Branch<W>> branches;
            branches.reserve(n.branches.size());
            for (const auto& [pat, scope] : n.branches) {
              branches.emplace_back(pat,
                                    traverse_scope<W>(scope, depth, on_var));
            }
            return E::case_of(rec(n.scrutinee), std::move(branches));
          },
          [&](const expr::list_t<V>& n) -> E {
            std::vector<E> elements;
            elements.reserve(n.elements.size());
            for (const auto& el : n.elements) elements.push_back(rec(el));
            return E::list(std::move(elements));
          },
          [&](const StringLiteral& n) -> E { return E::string(n.value); },
          [&](const IntLiteral& n) -> E { return E::integer(n.value); },
          [&](const FloatLiteral& n) -> E { return E::floating(n.value); },
      },
      e.repr());
}

/** Calls `f(v, depth)` for every variable occurrence, left to right. */
template <typename V, typename F>
void for_each_var(const Expression<V>& e, std::size_t depth, const F& f) {
  std::visit(
      overloaded{
          [&](const expr::var_t<V>& n) { f(n.var, depth); },
          [&](const expr::app_t<V>& n) {
            for_each_var(n.fun, depth, f);
            for_each_var(n.arg, depth, f);
          },
          [&](const expr::let_t<V>& n) {
            for_each_var(n.bound, depth, f);
            for_each_var(n.body.body(), depth + 1, f);
          },
          [&](const expr::lam_t<V>& n) {
            for_each_var(n.body.body(), depth + 1, f);
          },
          [&](const expr::record_t<V>& n) {
            for (const auto& field : n.fields)
              for_each_var(field.second, depth, f);
          },
          [&](const expr::case_t<V>& n) {
            for_each_var(n.scrutinee, depth, f);
            for (const auto& branch : n.branches)
              for_each_var(branch.second.body(), depth + 1, f);
          },
          [&](const expr::list_t<V>& n) {
            for (const auto& el : n.elements) for_each_var(el, depth, f);
          },
          [](const auto&) {},
      },
      e.repr());
}

/** Calls `f(name)` for every global occurrence, left to right. */
template <typename V, typename F>
void for_each_global(const Expression<V>& e, const F& f) {
  std::visit(
      overloaded{
          [&](const expr::global_t& n) { f(n.name); },
          [&](const expr::app_t<V>& n) {
            for_each_global(n.fun, f);
            for_each_global(n.arg, f);
          },
          [&](const expr::let_t<V>& n) {
            for_each_global(n.bound, f);
            for_each_global(n.body.body(), f);
          },
          [&](const expr::lam_t<V>& n) { for_each_global(n.body.body(), f); },
          [&](const expr::record_t<V>& n) {
            for (const auto& field : n.fields) for_each_global(field.second, f);
          },
          [&](const expr::case_t<V>& n) {
            for_each_global(n.scrutinee, f);
            for (const auto& branch : n.branches)
              for_each_global(branch.second.body(), f);
          },
          [&](const expr::list_t<V>& n) {
            for (const auto& el : n.elements) for_each_global(el, f);
          },
          [](const auto&) {},
      },
      e.repr());
}

/**
 * Adds `amount` to every placeholder in `e` that refers to a scope
 * outside `e`. Needed when `e` is moved under `amount` further binders.
 */
template <typename V>
Expression<V> shift(const Expression<V>& e, std::size_t amount) {
  if (amount == 0) return e;
  return traverse<V>(
      e, 0, [&](const Var<V>& v, std::size_t depth) -> Expression<V> {
        if (v.index() == 0) {
          Bound b = std::get<0>(v);
          if (b.scope >= depth) b.scope += amount;
          return Expression<V>::bound(b);
        }
        return Expression<V>::var(std::get<1>(v));
      });
}

}  // namespace detail

/**
 * Replaces every free variable `v` of `e` by `f(v)`.
 *
 * `f` must return an `Expression<W>` for some `W`; the result is an
 * `Expression<W>`. Placeholders are untouched, so a scope's own
 * variables keep referring to that scope. This is the monadic bind of
 * the expression type; with `f = Expression<V>::var` it copies `e`.
 */
template <typename V, typename F>
auto substitute(const Expression<V>& e, const F& f) {
  using W = typename std::remove_cvref_t<
      std::invoke_result_t<const F&, const V&>>::variable_type;
  return detail::traverse<W>(
      e, 0, [&](const Var<V>& v, std::size_t depth) -> Expression<W> {
        if (v.index() == 0) return Expression<W>::bound(std::get<0>(v));
        return detail::shift(Expression<W>(f(std::get<1>(v))), depth);
      });
}

/** Renames every free variable `v` of `e` to `f(v)`. */
template <typename V, typename F>
auto map_vars(const Expression<V>& e, const F& f) {
  using W = std::remove_cvref_t<std::invoke_result_t<const F&, const V&>>;
  return substitute(e, [&](const V& v) { return Expression<W>::var(f(v)); });
}

/** The free variable occurrences of `e`, left to right, with repeats. */
template <typename V>
std::vector<V> free_variables(const Expression<V>& e) {
  std::vector<V> vars;
  detail::for_each_var(e, 0, [&](const Var<V>& v, std::size_t) {
    if (v.index() == 1) vars.push_back(std::get<1>(v));
  });
  return vars;
}

/** `e` as a closed tree, or nullopt if it has free variables. */
template <typename V>
std::optional<Expression<Void>> close(const Expression<V>& e) {
  if (!free_variables(e).empty()) return std::nullopt;
  return substitute(e, [](const V&) -> Expression<Void> {
    throw InternalError("Free variable in a tree with none.");
  });
}

/**
 * Closes over the free variables selected by `f`.
 *
 * Every free variable `v` with `f(v) == b` becomes the scope's variable
 * `b`; the remaining free variables stay free.
 */
template <typename B, typename V, typename F>
Scope<B, V> abstract(const Expression<V>& e, const F& f) {
  return Scope<B, V>(detail::traverse<V>(
      e, 0, [&](const Var<V>& v, std::size_t depth) -> Expression<V> {
        if (v.index() == 1) {
          const std::optional<B> b = f(std::get<1>(v));
          if (b) {
            return Expression<V>::bound(
                Bound{depth, detail::binder_index(*b)});
          }
          return Expression<V>::var(std::get<1>(v));
        }
        Bound b = std::get<0>(v);
        if (b.scope >= depth) ++b.scope;
        return Expression<V>::bound(b);
      }));
}

/** Closes over the single free variable `var`. */
template <typename V>
Scope1<V> abstract1(const V& var, const Expression<V>& e) {
  return abstract<std::monostate>(
      e, [&](const V& v) -> std::optional<std::monostate> {
        if (v == var) return std::monostate{};
        return std::nullopt;
      });
}

/**
 * Opens `s`, replacing its variable `b` by `f(b)`. Placeholders that
 * refer to scopes outside `s` are re-indexed for the removed binder.
 */
template <typename B, typename V, typename F>
Expression<V> instantiate(const Scope<B, V>& s, const F& f) {
  return detail::traverse<V>(
      s.body(), 0, [&](const Var<V>& v, std::size_t depth) -> Expression<V> {
        if (v.index() == 1) return Expression<V>::var(std::get<1>(v));
        Bound b = std::get<0>(v);
        if (b.scope == depth)
          return detail::shift(
              Expression<V>(f(detail::binder_of<B>(b.index))), depth);
        if (b.scope > depth) --b.scope;
        return Expression<V>::bound(b);
      });
}

/** Opens the single-variable scope `s`, replacing its variable by `value`. */
template <typename V>
Expression<V> instantiate1(const Expression<V>& value, const Scope1<V>& s) {
  return instantiate(s, [&](std::monostate) { return value; });
}

/**
 * Decomposes a chain of applications into its head and arguments:
 * `App(App(f, a), b)` becomes `(f, [a, b])`. The head is never an `App`.
 */
template <typename V>
std::pair<Expression<V>, std::vector<Expression<V>>> apps_view(
    Expression<V> e) {
  std::vector<Expression<V>> args;
  while (const auto* a = e.template get_if<expr::app_t<V>>()) {
    args.push_back(a->arg);
    e = Expression<V>(a->fun);
  }
  std::reverse(args.begin(), args.end());
  return {std::move(e), std::move(args)};
}

/** `fn` applied to each of `args` in turn. */
template <typename V>
Expression<V> apply_all(Expression<V> fn,
                        const std::vector<Expression<V>>& args) {
  for (const auto& a : args) fn = Expression<V>::app(std::move(fn), a);
  return fn;
}

/** `e1 |> e2` */
template <typename V>
Expression<V> pipe_into(Expression<V> e1, Expression<V> e2) {
  return apply_all(Expression<V>::global(u8"Basics.|>"),
                   {std::move(e1), std::move(e2)});
}

/** The tuple `( e1, e2 )`. */
template <typename V>
Expression<V> pair(Expression<V> e1, Expression<V> e2) {
  return apply_all(Expression<V>::global(u8"Basics.,"),
                   {std::move(e1), std::move(e2)});
}

template <typename V>
concept AstPrintable = requires(std::string& out, const V& v) {
  print_ast(out, 0, v);
};

template <typename V>
  requires AstPrintable<V>
void print_ast(std::string& out, int indent, const Var<V>& v) {
  std::visit([&](const auto& x) { print_ast(out, indent, x); }, v);
}

template <typename B, typename V>
void print_ast(std::string& out, int indent, const Scope<B, V>& s) {
  print_sexp(out, indent, "Scope", s.body());
}

template <typename V>
  requires AstPrintable<V>
void print_ast(std::string& out, int indent, const Expression<V>& e) {
  std::visit(
      detail::overloaded{
          [&](const expr::var_t<V>& n) {
            print_sexp(out, indent, "Var", n.var);
          },
          [&](const expr::global_t& n) {
            print_sexp(out, indent, "Global", n.name);
          },
          [&](const expr::app_t<V>& n) {
            print_sexp(out, indent, "App", n.fun, n.arg);
          },
          [&](const expr::let_t<V>& n) {
            print_sexp(out, indent, "Let", n.bound, n.body);
          },
          [&](const expr::lam_t<V>& n) {
            print_sexp(out, indent, "Lam", n.body);
          },
          [&](const expr::record_t<V>& n) {
            print_sexp(out, indent, "Record", n.fields);
          },
          [&](const expr::proj_t& n) {
            print_sexp(out, indent, "Proj", n.field);
          },
          [&](const expr::case_t<V>& n) {
            print_sexp(out, indent, "Case", n.scrutinee, n.branches);
          },
          [&](const expr::list_t<V>& n) {
            print_sexp(out, indent, "List", n.elements);
          },
          [&](const auto& literal) { print_ast(out, indent, literal); },
      },
      e.repr());
}

template <typename V>
  requires AstPrintable<V>
std::string print_ast(const Expression<V>& e, int indent = 0) {
  std::string out;
  print_ast(out, indent, e);
  return out;
}

template <typename V>
  requires AstPrintable<V>
std::ostream& operator<<(std::ostream& os, const Expression<V>& e) {
  return os << print_ast(e);
}

}  // namespace elmgen
