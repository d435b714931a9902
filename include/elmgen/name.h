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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file name.h
 *
 * @brief Names appearing in generated code.
 *
 * All name types validate that their text is utf-8 and throw
 * `std::invalid_argument` otherwise.
 */

namespace elmgen {

/** A local (unqualified) value identifier, e.g. a lambda argument. */
struct Local {
  std::u8string text;

  explicit Local(std::u8string_view text);

  auto operator<=>(const Local&) const = default;
};

/** A record field name. */
struct Field {
  std::u8string text;

  explicit Field(std::u8string_view text);

  auto operator<=>(const Field&) const = default;
};

/** An unqualified data constructor name. */
struct Constructor {
  std::u8string text;

  explicit Constructor(std::u8string_view text);

  auto operator<=>(const Constructor&) const = default;
};

/** A module path plus an identifier, e.g. `Maybe.Just` or `Basics.+`. */
struct Qualified {
  std::vector<std::u8string> modules;
  std::u8string name;

  Qualified(std::vector<std::u8string> modules, std::u8string name);

  /**
   * Parses dotted text into a qualified name.
   *
   * Leading segments that are module names (an uppercase letter followed
   * by identifier characters, terminated by a dot) form the module path;
   * the remainder, which may itself contain dots, is the identifier. So
   * `Parser.|.` has module path `Parser` and identifier `|.`, and
   * `Html.Attributes.class` has module path `Html.Attributes`.
   *
   * Throws `std::invalid_argument` if the identifier is empty or the text
   * is not utf-8.
   */
  static Qualified parse(std::u8string_view text);

  /** The dotted form, e.g. `List.::`. */
  std::u8string to_string() const;

  auto operator<=>(const Qualified&) const = default;
};

/**
 * The unqualified name under which `name` is visible without an import,
 * if any.
 *
 * Everything in `Basics` is imported unqualified, as are the built-in
 * list, maybe, result, string and char types and constructors.
 */
std::optional<Local> default_import(const Qualified& name);

}  // namespace elmgen
