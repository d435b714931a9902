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

#include "elmgen/name.h"

#include <fmt/core.h>

#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "elmgen/text.h"

namespace elmgen {

namespace {

std::u8string checked(std::u8string_view text, const char* what) {
  if (text.empty())
    throw std::invalid_argument(fmt::format("Empty {} name.", what));
  if (!is_valid_utf8(text))
    throw std::invalid_argument(
        fmt::format("{} name is not valid utf-8.", what));
  return std::u8string(text);
}

}  // namespace

Local::Local(std::u8string_view text) : text(checked(text, "local")) {}

Field::Field(std::u8string_view text) : text(checked(text, "field")) {}

Constructor::Constructor(std::u8string_view text)
    : text(checked(text, "constructor")) {}

Qualified::Qualified(std::vector<std::u8string> modules, std::u8string name)
    : modules(std::move(modules)), name(checked(name, "qualified")) {
  for (const auto& m : this->modules) checked(m, "module");
}

Qualified Qualified::parse(std::u8string_view text) {
  if (!is_valid_utf8(text))
    throw std::invalid_argument("Qualified name is not valid utf-8.");
  std::vector<std::u8string> modules;
  for (auto dot = text.find(u8'.'); dot != std::u8string_view::npos;
       dot = text.find(u8'.')) {
    const auto segment = text.substr(0, dot);
    if (!is_module_segment(segment)) break;
    modules.emplace_back(segment);
    text.remove_prefix(dot + 1);
  }
  return Qualified(std::move(modules), std::u8string(text));
}

std::u8string Qualified::to_string() const {
  std::u8string out;
  for (const auto& m : modules) {
    out += m;
    out += u8'.';
  }
  out += name;
  return out;
}

std::optional<Local> default_import(const Qualified& name) {
  static const std::map<std::u8string_view, std::u8string_view> IMPORTS{
      {u8"List.List", u8"List"},         {u8"List.::", u8"::"},
      {u8"Maybe.Maybe", u8"Maybe"},      {u8"Maybe.Nothing", u8"Nothing"},
      {u8"Maybe.Just", u8"Just"},        {u8"Result.Result", u8"Result"},
      {u8"Result.Ok", u8"Ok"},           {u8"Result.Err", u8"Err"},
      {u8"String.String", u8"String"},   {u8"Char.Char", u8"Char"},
  };

  if (name.modules.size() == 1 && name.modules.front() == u8"Basics")
    return Local(name.name);
  const auto it = IMPORTS.find(name.to_string());
  if (it == IMPORTS.end()) return std::nullopt;
  return Local(it->second);
}

}  // namespace elmgen
