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

#include "elmgen/pretty.h"

#include <fmt/core.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "elmgen/definition.h"
#include "elmgen/environment.h"
#include "elmgen/expression.h"
#include "elmgen/fixity.h"
#include "elmgen/name.h"
#include "elmgen/text.h"
#include "elmgen/type.h"

namespace elmgen {

namespace detail {

void check_options(const PrintOptions& options) {
  if (options.indent_width < 0) {
    throw std::invalid_argument(fmt::format("Negative indent width {}.",
                                            options.indent_width));
  }
}

std::u8string qualified_text(const Qualified& name) {
  if (const auto local = default_import(name)) return local->text;
  return name.to_string();
}

std::u8string int_text(const mpz_class& value) {
  return to_u8string(value.get_str());
}

std::u8string float_text(double value) {
  std::string text = fmt::format("{}", value);
  // fmt drops the fractional part of integral values; Elm reads those as Int.
  if (std::all_of(text.begin(), text.end(),
                  [](char c) { return c == '-' || (c >= '0' && c <= '9'); })) {
    text += ".0";
  }
  return to_u8string(text);
}

bool is_tuple_constructor(const Qualified& name) {
  return name.name == u8"," && name.modules.size() == 1 &&
         name.modules.front() == u8"Basics";
}

void print_type(Writer& out, int prec, const Type<Void>& t) {
  std::visit(
      overloaded{
          [&](const ty::var_t<Void>& n) { absurd(n.var); },
          [&](const ty::global_t& n) { out.text(qualified_text(n.name)); },
          [&](const ty::app_t<Void>& n) {
            const bool parens = prec > APPLICATION_PRECEDENCE;
            if (parens) out.text(u8"(");
            print_type(out, APPLICATION_PRECEDENCE, n.fun);
            out.text(u8" ");
            print_type(out, APPLICATION_PRECEDENCE + 1, n.arg);
            if (parens) out.text(u8")");
          },
          [&](const ty::fun_t<Void>& n) {
            const bool parens = prec > MIN_PRECEDENCE;
            if (parens) out.text(u8"(");
            print_type(out, MIN_PRECEDENCE + 1, n.arg);
            out.text(u8" -> ");
            print_type(out, MIN_PRECEDENCE, n.result);
            if (parens) out.text(u8")");
          },
          [&](const ty::record_t<Void>& n) {
            if (n.fields.empty()) {
              out.text(u8"{}");
              return;
            }
            out.text(u8"{ ");
            bool first = true;
            for (const auto& [field, type] : n.fields) {
              if (first)
                first = false;
              else
                out.text(u8", ");
              out.text(field.text);
              out.text(u8" : ");
              print_type(out, MIN_PRECEDENCE, type);
            }
            out.text(u8" }");
          },
      },
      t.repr());
}

namespace {

class DefinitionPrinter {
 public:
  DefinitionPrinter(const PrintOptions& options, Writer& out)
      : options_(options), out_(out) {}

  void operator()(const def::constant_t& d) {
    out_.text(d.name.name);
    out_.text(u8" : ");
    print_type(out_, MIN_PRECEDENCE, d.type);
    out_.newline(0);
    out_.text(d.name.name);

    // Leading lambdas become the equation's arguments.
    Environment<Void> env = empty_environment();
    std::set<Local> reserved = names_in_use(env, d.body, options_.fixities);
    reserved.insert(Local(d.name.name));
    env = env.avoiding(reserved);
    Expression<Void> body = d.body;
    while (const auto* lam = body.get_if<expr::lam_t<Void>>()) {
      auto [inner, name] = env.extend();
      out_.text(u8" ");
      out_.text(name.text);
      Expression<Void> next = lam->body.body();
      body = std::move(next);
      env = std::move(inner);
    }
    out_.text(u8" =");
    out_.newline(options_.indent_width);
    ExpressionPrinter<Void>(options_, out_)
        .expression(env, MIN_PRECEDENCE, body, options_.indent_width);
  }

  void operator()(const def::type_t& d) {
    out_.text(u8"type ");
    out_.text(d.name.name);
    bool first = true;
    for (const auto& [constructor, args] : d.constructors) {
      out_.newline(options_.indent_width);
      out_.text(first ? u8"= " : u8"| ");
      first = false;
      out_.text(constructor.text);
      for (const auto& arg : args) {
        out_.text(u8" ");
        print_type(out_, APPLICATION_PRECEDENCE + 1, arg);
      }
    }
  }

  void operator()(const def::alias_t& d) {
    out_.text(u8"type alias ");
    out_.text(d.name.name);
    out_.text(u8" =");
    out_.newline(options_.indent_width);
    print_type(out_, MIN_PRECEDENCE, d.type);
  }

 private:
  const PrintOptions& options_;
  Writer& out_;
};

}  // namespace

}  // namespace detail

std::u8string print_expression(const Expression<Void>& e,
                               const PrintOptions& options) {
  return print_expression(empty_environment(), e, options);
}

std::u8string print_type(const Type<Void>& t, const PrintOptions& options) {
  detail::check_options(options);
  detail::Writer out;
  detail::print_type(out, MIN_PRECEDENCE, t);
  return out.take();
}

std::u8string print_definition(const Definition& d,
                               const PrintOptions& options) {
  detail::check_options(options);
  detail::Writer out;
  std::visit(detail::DefinitionPrinter(options, out), d);
  return out.take();
}

}  // namespace elmgen
