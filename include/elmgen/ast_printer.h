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

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

/**
 * @file ast_printer.h
 *
 * @brief Debug rendering of trees as indented s-expressions.
 *
 * This is the structural "show" form of the trees, used in test failure
 * messages and when debugging a frontend. It is unrelated to the surface
 * syntax produced by pretty.h.
 */

namespace elmgen {

struct Local;
struct Field;
struct Qualified;
struct StringLiteral;
struct IntLiteral;
struct FloatLiteral;

void print_ast(std::string& out, int, const mpz_class& arg);
void print_ast(std::string& out, int, int arg);
void print_ast(std::string& out, int, std::size_t arg);
void print_ast(std::string& out, int, double arg);
void print_ast(std::string& out, int, const std::u8string& arg);
void print_ast(std::string& out, int, const Local& arg);
void print_ast(std::string& out, int, const Field& arg);
void print_ast(std::string& out, int, const Qualified& arg);
void print_ast(std::string& out, int, const StringLiteral& arg);
void print_ast(std::string& out, int, const IntLiteral& arg);
void print_ast(std::string& out, int, const FloatLiteral& arg);

template <typename K, typename V>
void print_ast(std::string& out, int indent, const std::pair<K, V>& arg) {
  std::string joiner(indent + 2, ' ');
  joiner = "\n" + joiner;
  out += '(';
  print_ast(out, indent, arg.first);
  out.append(joiner);
  out.append(". ");
  print_ast(out, indent + 4, arg.second);
  out += ')';
}

template <typename T>
void print_ast(std::string& out, int indent, const std::vector<T>& arg) {
  if (arg.size() == 0) {
    out.append("()");
    return;
  }
  if (arg.size() == 1) {
    out += '(';
    print_ast(out, indent, arg[0]);
    out += ')';
    return;
  }
  out += '(';
  std::string joiner(indent + 4, ' ');
  joiner = "\n" + joiner;
  for (const auto& a : arg) {
    out.append(joiner);
    print_ast(out, indent + 4, a);
  }
  out.append(joiner.data(), indent + 1);
  out += ')';
}

void print_ast_joined(std::string& out, int indent, const std::string&,
                      const auto& arg) {
  print_ast(out, indent, arg);
}

void print_ast_joined(std::string& out, int indent, const std::string& joiner,
                      const auto& first, const auto&... rest) {
  print_ast(out, indent, first);
  out.append(joiner);
  print_ast_joined(out, indent, joiner, rest...);
}

/** Prints `(HEAD ARG...)` with one argument per line. */
void print_sexp(std::string& out, int indent, const char* head,
                const auto&... args) {
  std::string joiner(indent + 4, ' ');
  joiner = "\n" + joiner;
  out += '(';
  out.append(head);
  if constexpr (sizeof...(args) > 0) {
    out.append(joiner);
    print_ast_joined(out, indent + 4, joiner, args...);
  }
  out += ')';
}

}  // namespace elmgen
