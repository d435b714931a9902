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

#include "elmgen/fixity.h"

#include "elmgen/name.h"

namespace elmgen {

namespace {

void add(fixity_table& table, const char8_t* name, int level,
         associativity assoc, bool breaks_line = false) {
  table.emplace(Qualified::parse(name),
                operator_fixity{.level = level,
                                .assoc = assoc,
                                .breaks_line = breaks_line});
}

}  // namespace

fixity_table default_fixities() {
  using enum associativity;
  fixity_table table;
  add(table, u8"Basics.>>", 9, LEFT, true);
  add(table, u8"Basics.<<", 9, RIGHT, true);
  add(table, u8"Basics.^", 8, RIGHT);
  add(table, u8"Basics.*", 7, LEFT);
  add(table, u8"Basics./", 7, LEFT);
  add(table, u8"Basics.//", 7, LEFT);
  add(table, u8"Basics.%", 7, LEFT);
  add(table, u8"Basics.+", 6, LEFT);
  add(table, u8"Basics.-", 6, LEFT);
  add(table, u8"Parser.|.", 6, LEFT);
  add(table, u8"Parser.|=", 5, LEFT);
  add(table, u8"Basics.++", 5, RIGHT);
  add(table, u8"List.::", 5, RIGHT);
  add(table, u8"Basics.==", 4, NONE);
  add(table, u8"Basics./=", 4, NONE);
  add(table, u8"Basics.<", 4, NONE);
  add(table, u8"Basics.>", 4, NONE);
  add(table, u8"Basics.<=", 4, NONE);
  add(table, u8"Basics.>=", 4, NONE);
  add(table, u8"Basics.&&", 3, RIGHT);
  add(table, u8"Basics.||", 2, LEFT);
  add(table, u8"Basics.|>", 0, LEFT, true);
  add(table, u8"Basics.<|", 0, RIGHT, true);
  return table;
}

}  // namespace elmgen
