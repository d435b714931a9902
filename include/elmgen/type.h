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
#include <concepts>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "elmgen/ast_printer.h"
#include "elmgen/name.h"

namespace elmgen {

template <typename V>
class Type;

namespace ty {

template <typename V>
struct var_t {
  V var;

  auto operator<=>(const var_t&) const = default;
};

struct global_t {
  Qualified name;

  auto operator<=>(const global_t&) const = default;
};

template <typename V>
struct app_t {
  Type<V> fun;
  Type<V> arg;

  std::weak_ordering operator<=>(const app_t&) const = default;
};

/** A function type, `arg -> result`. */
template <typename V>
struct fun_t {
  Type<V> arg;
  Type<V> result;

  std::weak_ordering operator<=>(const fun_t&) const = default;
};

template <typename V>
struct record_t {
  std::vector<std::pair<Field, Type<V>>> fields;

  std::weak_ordering operator<=>(const record_t&) const = default;
};

template <typename V>
using repr =
    std::variant<var_t<V>, global_t, app_t<V>, fun_t<V>, record_t<V>>;

template <typename V>
struct node {
  repr<V> r;
};

}  // namespace ty

/** A type expression whose type variables have type `V`. */
template <typename V>
class Type {
 public:
  using repr_type = ty::repr<V>;

  static Type var(V v) { return make(ty::var_t<V>{std::move(v)}); }

  static Type global(Qualified name) {
    return make(ty::global_t{std::move(name)});
  }

  /** @overload Parses `name` as with `Qualified::parse`. */
  static Type global(std::u8string_view name) {
    return global(Qualified::parse(name));
  }

  static Type app(Type fun, Type arg) {
    return make(ty::app_t<V>{std::move(fun), std::move(arg)});
  }

  static Type fun(Type arg, Type result) {
    return make(ty::fun_t<V>{std::move(arg), std::move(result)});
  }

  static Type record(std::vector<std::pair<Field, Type>> fields) {
    return make(ty::record_t<V>{std::move(fields)});
  }

  const repr_type& repr() const { return node_->r; }

  template <typename T>
  const T* get_if() const {
    return std::get_if<T>(&node_->r);
  }

  friend bool operator==(const Type& l, const Type& r)
    requires std::equality_comparable<V>
  {
    return l.node_ == r.node_ || l.node_->r == r.node_->r;
  }

  friend std::weak_ordering operator<=>(const Type& l, const Type& r)
    requires std::three_way_comparable<V, std::weak_ordering>
  {
    if (l.node_ == r.node_) return std::weak_ordering::equivalent;
    return l.node_->r <=> r.node_->r;
  }

 private:
  std::shared_ptr<const ty::node<V>> node_;

  explicit Type(std::shared_ptr<const ty::node<V>> node)
      : node_(std::move(node)) {}

  template <typename T>
  static Type make(T t) {
    return Type(
        std::make_shared<const ty::node<V>>(ty::node<V>{std::move(t)}));
  }
};

/** `fn` applied to each of `args` in turn. */
template <typename V>
Type<V> apply_all(Type<V> fn, const std::vector<Type<V>>& args) {
  for (const auto& a : args) fn = Type<V>::app(std::move(fn), a);
  return fn;
}

/** Decomposes a chain of type applications into its head and arguments. */
template <typename V>
std::pair<Type<V>, std::vector<Type<V>>> apps_view(Type<V> t) {
  std::vector<Type<V>> args;
  while (const auto* a = t.template get_if<ty::app_t<V>>()) {
    args.insert(args.begin(), a->arg);
    t = Type<V>(a->fun);
  }
  return {std::move(t), std::move(args)};
}

template <typename V>
void print_ast(std::string& out, int indent, const Type<V>& t) {
  std::visit(
      [&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, ty::var_t<V>>) {
          print_sexp(out, indent, "TVar", n.var);
        } else if constexpr (std::is_same_v<T, ty::global_t>) {
          print_sexp(out, indent, "TGlobal", n.name);
        } else if constexpr (std::is_same_v<T, ty::app_t<V>>) {
          print_sexp(out, indent, "TApp", n.fun, n.arg);
        } else if constexpr (std::is_same_v<T, ty::fun_t<V>>) {
          print_sexp(out, indent, "TFun", n.arg, n.result);
        } else {
          print_sexp(out, indent, "TRecord", n.fields);
        }
      },
      t.repr());
}

}  // namespace elmgen
