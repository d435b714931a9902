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

#include <gtest/gtest.h>

#include "elmgen/name.h"

namespace elmgen::testing {
namespace {

const operator_fixity& lookup(const fixity_table& table, const char8_t* op) {
  return table.at(Qualified::parse(op));
}

TEST(FixityTest, OperandPrecedences) {
  const operator_fixity left{.level = 6, .assoc = associativity::LEFT};
  EXPECT_EQ(left.left_precedence(), 6);
  EXPECT_EQ(left.right_precedence(), 7);

  const operator_fixity right{.level = 5, .assoc = associativity::RIGHT};
  EXPECT_EQ(right.left_precedence(), 6);
  EXPECT_EQ(right.right_precedence(), 5);

  const operator_fixity none{.level = 4, .assoc = associativity::NONE};
  EXPECT_EQ(none.left_precedence(), 5);
  EXPECT_EQ(none.right_precedence(), 5);
}

TEST(FixityTest, DefaultTable) {
  const auto table = default_fixities();
  EXPECT_EQ(table.size(), 23u);

  EXPECT_EQ(lookup(table, u8"Basics.*").level, 7);
  EXPECT_EQ(lookup(table, u8"Basics.^").assoc, associativity::RIGHT);
  EXPECT_EQ(lookup(table, u8"Basics.==").assoc, associativity::NONE);
  EXPECT_EQ(lookup(table, u8"Basics.&&").level, 3);
  EXPECT_EQ(lookup(table, u8"Basics.||").level, 2);
  EXPECT_EQ(lookup(table, u8"List.::").assoc, associativity::RIGHT);
  EXPECT_EQ(lookup(table, u8"Parser.|.").level, 6);
  EXPECT_EQ(lookup(table, u8"Parser.|=").level, 5);
}

TEST(FixityTest, LineBreakingOperators) {
  const auto table = default_fixities();
  for (const auto* op :
       {u8"Basics.|>", u8"Basics.<|", u8"Basics.>>", u8"Basics.<<"}) {
    EXPECT_TRUE(lookup(table, op).breaks_line);
  }
  EXPECT_FALSE(lookup(table, u8"Basics.+").breaks_line);
  EXPECT_EQ(lookup(table, u8"Basics.|>").level, MIN_PRECEDENCE);
}

TEST(FixityTest, ApplicationBindsTightest) {
  for (const auto& entry : default_fixities()) {
    EXPECT_LT(entry.second.level, APPLICATION_PRECEDENCE);
    EXPECT_GE(entry.second.level, MIN_PRECEDENCE);
  }
}

}  // namespace
}  // namespace elmgen::testing
