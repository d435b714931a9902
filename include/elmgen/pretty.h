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
#include <gmpxx.h>

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "elmgen/definition.h"
#include "elmgen/environment.h"
#include "elmgen/error.h"
#include "elmgen/expression.h"
#include "elmgen/fixity.h"
#include "elmgen/name.h"
#include "elmgen/pattern.h"
#include "elmgen/type.h"

/**
 * @file pretty.h
 *
 * @brief Renders trees as Elm source text.
 *
 * Output uses the minimum number of parentheses allowed by the fixity
 * table and application precedence. Bound variables are given names from
 * the fresh name supply (see environment.h) in the order their binders
 * are opened, skipping any name that a free variable or an unqualified
 * global already prints as.
 */

namespace elmgen {

struct PrintOptions {
  /** Operators printed infix. Every other global prints prefix. */
  fixity_table fixities = default_fixities();
  /** Spaces per indentation level. Must not be negative. */
  int indent_width = 4;
};

namespace detail {

/** Accumulates output text. Lines never end in spaces. */
class Writer {
 public:
  void text(std::u8string_view s) { out_.append(s); }

  void newline(int indent) {
    out_ += u8'\n';
    out_.append(static_cast<std::size_t>(indent), u8' ');
  }

  void blank_line() { out_ += u8'\n'; }

  std::u8string take() { return std::move(out_); }

 private:
  std::u8string out_;
};

/** Throws `std::invalid_argument` if `options` cannot be printed with. */
void check_options(const PrintOptions& options);

/** `name` as written in source, shortened if it is imported by default. */
std::u8string qualified_text(const Qualified& name);

std::u8string int_text(const mpz_class& value);

/** `value` in a form that Elm reads back as a Float. */
std::u8string float_text(double value);

/** True for `Basics.,`, the pair constructor. */
bool is_tuple_constructor(const Qualified& name);

void print_type(Writer& out, int prec, const Type<Void>& t);

/**
 * The names under which the free variables of `e` and its unqualified
 * non-operator globals appear in the output.
 */
template <typename V>
std::set<Local> names_in_use(const Environment<V>& env,
                             const Expression<V>& e,
                             const fixity_table& fixities) {
  std::set<Local> names;
  for (const V& v : free_variables(e)) {
    names.insert(env.lookup(Var<V>(std::in_place_index<1>, v)));
  }
  for_each_global(e, [&](const Qualified& name) {
    if (fixities.contains(name)) return;
    if (auto local = default_import(name)) names.insert(std::move(*local));
  });
  return names;
}

template <typename V>
class ExpressionPrinter {
 public:
  ExpressionPrinter(const PrintOptions& options, Writer& out)
      : options_(options), out_(out) {}

  void expression(const Environment<V>& env, int prec, const Expression<V>& e,
                  int indent) {
    if (e.template get_if<expr::app_t<V>>() != nullptr ||
        e.template get_if<expr::global_t>() != nullptr) {
      auto [head, args] = apps_view(e);
      spine(env, prec, head, args, indent);
      return;
    }
    std::visit(
        overloaded{
            [&](const expr::var_t<V>& n) {
              out_.text(env.lookup(n.var).text);
            },
            [&](const expr::global_t&) {
              throw InternalError("Global outside an application spine.");
            },
            [&](const expr::app_t<V>&) {
              throw InternalError("Application outside its spine.");
            },
            [&](const expr::let_t<V>&) { let(env, prec, e, indent); },
            [&](const expr::lam_t<V>&) { lambda(env, prec, e, indent); },
            [&](const expr::record_t<V>& n) { record(env, n, indent); },
            [&](const expr::proj_t& n) {
              out_.text(u8".");
              out_.text(n.field.text);
            },
            [&](const expr::case_t<V>& n) { case_of(env, prec, n, indent); },
            [&](const expr::list_t<V>& n) { list(env, n, indent); },
            [&](const StringLiteral& n) { string(n.value); },
            [&](const IntLiteral& n) { out_.text(int_text(n.value)); },
            [&](const FloatLiteral& n) { out_.text(float_text(n.value)); },
        },
        e.repr());
  }

  /**
   * Prints a pattern of a case branch. `env` must be the branch's
   * environment, whose innermost scope names the pattern's variables.
   */
  void pattern(const Environment<V>& env, int prec, const Pattern<int>& p) {
    std::visit(
        overloaded{
            [&](const pat::var_t<int>& n) {
              out_.text(env.lookup(Bound{0, n.index}).text);
            },
            [&](const pat::wildcard_t&) { out_.text(u8"_"); },
            [&](const pat::con_t<int>& n) {
              if (is_tuple_constructor(n.constructor)) {
                if (n.args.size() != 2) {
                  throw InternalError(fmt::format(
                      "Pair pattern with {} components.", n.args.size()));
                }
                out_.text(u8"( ");
                pattern(env, MIN_PRECEDENCE, n.args[0]);
                out_.text(u8", ");
                pattern(env, MIN_PRECEDENCE, n.args[1]);
                out_.text(u8" )");
                return;
              }
              if (n.args.empty()) {
                out_.text(qualified_text(n.constructor));
                return;
              }
              const bool parens = prec > APPLICATION_PRECEDENCE;
              if (parens) out_.text(u8"(");
              out_.text(qualified_text(n.constructor));
              for (const auto& arg : n.args) {
                out_.text(u8" ");
                pattern(env, APPLICATION_PRECEDENCE + 1, arg);
              }
              if (parens) out_.text(u8")");
            },
            [&](const StringLiteral& n) { string(n.value); },
            [&](const IntLiteral& n) { out_.text(int_text(n.value)); },
            [&](const FloatLiteral& n) { out_.text(float_text(n.value)); },
        },
        p.repr());
  }

 private:
  const PrintOptions& options_;
  Writer& out_;

  int width() const { return options_.indent_width; }

  void spine(const Environment<V>& env, int prec, const Expression<V>& head,
             const std::vector<Expression<V>>& args, int indent) {
    if (const auto* g = head.template get_if<expr::global_t>()) {
      global_apps(env, prec, g->name, args, indent);
      return;
    }
    apps(env, prec, head, args, indent);
  }

  void global_apps(const Environment<V>& env, int prec, const Qualified& name,
                   const std::vector<Expression<V>>& args, int indent) {
    const auto fixity = options_.fixities.find(name);
    const bool is_operator = fixity != options_.fixities.end();
    const bool is_tuple = !is_operator && is_tuple_constructor(name);
    if (!is_operator && !is_tuple) {
      atom_apps(
          env, prec, [&] { out_.text(qualified_text(name)); }, args, indent);
      return;
    }
    if (args.size() < 2) {
      atom_apps(
          env, prec,
          [&] {
            out_.text(u8"(");
            if (is_tuple) {
              out_.text(u8",");
            } else {
              out_.text(name.name);
            }
            out_.text(u8")");
          },
          args, indent);
      return;
    }
    if (args.size() > 2) {
      // Saturate the operator, then apply the result to the rest.
      apps(env, prec,
           apply_all(Expression<V>::global(name), {args[0], args[1]}),
           std::vector<Expression<V>>(args.begin() + 2, args.end()), indent);
      return;
    }
    if (is_tuple) {
      out_.text(u8"( ");
      expression(env, MIN_PRECEDENCE, args[0], indent);
      out_.text(u8", ");
      expression(env, MIN_PRECEDENCE, args[1], indent);
      out_.text(u8" )");
      return;
    }
    binary(env, prec, name.name, fixity->second, args[0], args[1], indent);
  }

  void binary(const Environment<V>& env, int prec, std::u8string_view op,
              const operator_fixity& fixity, const Expression<V>& lhs,
              const Expression<V>& rhs, int indent) {
    const bool parens = prec > fixity.level;
    if (parens) out_.text(u8"(");
    expression(env, fixity.left_precedence(), lhs, indent);
    int rhs_indent = indent;
    if (fixity.breaks_line) {
      rhs_indent += width();
      out_.newline(rhs_indent);
    } else {
      out_.text(u8" ");
    }
    out_.text(op);
    out_.text(u8" ");
    expression(env, fixity.right_precedence(), rhs, rhs_indent);
    if (parens) out_.text(u8")");
  }

  void apps(const Environment<V>& env, int prec, const Expression<V>& fun,
            const std::vector<Expression<V>>& args, int indent) {
    if (args.empty()) {
      expression(env, prec, fun, indent);
      return;
    }
    atom_apps(
        env, prec,
        [&] { expression(env, APPLICATION_PRECEDENCE, fun, indent); }, args,
        indent);
  }

  template <typename F>
  void atom_apps(const Environment<V>& env, int prec, const F& write_head,
                 const std::vector<Expression<V>>& args, int indent) {
    if (args.empty()) {
      write_head();
      return;
    }
    const bool parens = prec > APPLICATION_PRECEDENCE;
    if (parens) out_.text(u8"(");
    write_head();
    for (const auto& arg : args) {
      out_.text(u8" ");
      expression(env, APPLICATION_PRECEDENCE + 1, arg, indent);
    }
    if (parens) out_.text(u8")");
  }

  void let(const Environment<V>& env, int prec, const Expression<V>& e,
           int indent) {
    const bool parens = prec > MIN_PRECEDENCE;
    if (parens) out_.text(u8"(");
    out_.text(u8"let");
    Environment<V> current = env;
    Expression<V> body = e;
    bool first = true;
    while (const auto* l = body.template get_if<expr::let_t<V>>()) {
      if (!first) out_.blank_line();
      first = false;
      auto [inner, name] = current.extend();
      out_.newline(indent + width());
      out_.text(name.text);
      out_.text(u8" =");
      out_.newline(indent + 2 * width());
      expression(current, MIN_PRECEDENCE, l->bound, indent + 2 * width());
      Expression<V> next = l->body.body();
      body = std::move(next);
      current = std::move(inner);
    }
    out_.newline(indent);
    out_.text(u8"in");
    out_.newline(indent);
    expression(current, MIN_PRECEDENCE, body, indent);
    if (parens) out_.text(u8")");
  }

  void lambda(const Environment<V>& env, int prec, const Expression<V>& e,
              int indent) {
    const bool parens = prec > MIN_PRECEDENCE;
    if (parens) out_.text(u8"(");
    out_.text(u8"\\");
    Environment<V> current = env;
    Expression<V> body = e;
    bool first = true;
    while (const auto* l = body.template get_if<expr::lam_t<V>>()) {
      if (!first) out_.text(u8" ");
      first = false;
      auto [inner, name] = current.extend();
      out_.text(name.text);
      Expression<V> next = l->body.body();
      body = std::move(next);
      current = std::move(inner);
    }
    out_.text(u8" -> ");
    expression(current, MIN_PRECEDENCE, body, indent);
    if (parens) out_.text(u8")");
  }

  void record(const Environment<V>& env, const expr::record_t<V>& n,
              int indent) {
    if (n.fields.empty()) {
      out_.text(u8"{}");
      return;
    }
    out_.text(u8"{ ");
    bool first = true;
    for (const auto& [field, value] : n.fields) {
      if (!first) out_.text(u8", ");
      first = false;
      out_.text(field.text);
      out_.text(u8" = ");
      expression(env, MIN_PRECEDENCE, value, indent);
    }
    out_.text(u8" }");
  }

  void list(const Environment<V>& env, const expr::list_t<V>& n, int indent) {
    if (n.elements.empty()) {
      out_.text(u8"[]");
      return;
    }
    out_.text(u8"[ ");
    bool first = true;
    for (const auto& element : n.elements) {
      if (!first) out_.text(u8", ");
      first = false;
      expression(env, MIN_PRECEDENCE, element, indent);
    }
    out_.text(u8" ]");
  }

  void case_of(const Environment<V>& env, int prec, const expr::case_t<V>& n,
               int indent) {
    const bool parens = prec > MIN_PRECEDENCE;
    if (parens) out_.text(u8"(");
    out_.text(u8"case ");
    expression(env, MIN_PRECEDENCE, n.scrutinee, indent);
    out_.text(u8" of");
    bool first = true;
    for (const auto& [pat, scope] : n.branches) {
      if (!first) out_.blank_line();
      first = false;
      // Each branch gets its own names; siblings may reuse them.
      const Environment<V> branch_env = env.extend_for_pattern(pat);
      out_.newline(indent + width());
      pattern(branch_env, MIN_PRECEDENCE, pat);
      out_.text(u8" ->");
      out_.newline(indent + 2 * width());
      expression(branch_env, MIN_PRECEDENCE, scope.body(),
                 indent + 2 * width());
    }
    if (parens) out_.text(u8")");
  }

  void string(const std::u8string& value) {
    out_.text(u8"\"");
    out_.text(value);
    out_.text(u8"\"");
  }
};

}  // namespace detail

/**
 * Prints `e`, naming its free variables through `env`.
 *
 * Throws `InternalError` if a placeholder in `e` has no binder, a case
 * branch uses a variable its pattern does not declare, or a pair pattern
 * does not have two components.
 */
template <typename V>
std::u8string print_expression(const Environment<V>& env,
                               const Expression<V>& e,
                               const PrintOptions& options = {}) {
  detail::check_options(options);
  detail::Writer out;
  detail::ExpressionPrinter<V>(options, out)
      .expression(env.avoiding(detail::names_in_use(env, e, options.fixities)),
                  MIN_PRECEDENCE, e, 0);
  return out.take();
}

/** Prints the closed expression `e`. */
std::u8string print_expression(const Expression<Void>& e,
                               const PrintOptions& options = {});

std::u8string print_type(const Type<Void>& t,
                         const PrintOptions& options = {});

/** Prints a declaration, without a trailing newline. */
std::u8string print_definition(const Definition& d,
                               const PrintOptions& options = {});

}  // namespace elmgen
