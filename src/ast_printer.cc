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

#include "elmgen/ast_printer.h"

#include <fmt/core.h>

#include <cstddef>
#include <iterator>
#include <string>

#include "elmgen/literal.h"
#include "elmgen/name.h"
#include "elmgen/text.h"

namespace elmgen {

void print_ast(std::string& out, int, const mpz_class& arg) {
  out.append(arg.get_str());
}

void print_ast(std::string& out, int, int arg) {
  fmt::format_to(std::back_inserter(out), "{}", arg);
}

void print_ast(std::string& out, int, std::size_t arg) {
  fmt::format_to(std::back_inserter(out), "{}", arg);
}

void print_ast(std::string& out, int, double arg) {
  fmt::format_to(std::back_inserter(out), "{}", arg);
}

void print_ast(std::string& out, int, const std::u8string& arg) {
  out += '"';
  to_std_string(arg, out);
  out += '"';
}

void print_ast(std::string& out, int, const Local& arg) {
  to_std_string(arg.text, out);
}

void print_ast(std::string& out, int, const Field& arg) {
  to_std_string(arg.text, out);
}

void print_ast(std::string& out, int, const Qualified& arg) {
  to_std_string(arg.to_string(), out);
}

void print_ast(std::string& out, int indent, const StringLiteral& arg) {
  print_sexp(out, indent, "String", arg.value);
}

void print_ast(std::string& out, int indent, const IntLiteral& arg) {
  print_sexp(out, indent, "Int", arg.value);
}

void print_ast(std::string& out, int indent, const FloatLiteral& arg) {
  print_sexp(out, indent, "Float", arg.value);
}

}  // namespace elmgen
