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

#include "elmgen/environment.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstddef>
#include <limits>
#include <set>

#include "elmgen/error.h"
#include "elmgen/expression.h"
#include "elmgen/name.h"
#include "elmgen/pattern.h"
#include "testing/test_util.h"

namespace elmgen::testing {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(FreshLocalTest, SingleLetters) {
  EXPECT_EQ(fresh_local(0).text, u8"a");
  EXPECT_EQ(fresh_local(1).text, u8"b");
  EXPECT_EQ(fresh_local(25).text, u8"z");
}

TEST(FreshLocalTest, NumberedAfterZ) {
  EXPECT_EQ(fresh_local(26).text, u8"a0");
  EXPECT_EQ(fresh_local(27).text, u8"b0");
  EXPECT_EQ(fresh_local(51).text, u8"z0");
  EXPECT_EQ(fresh_local(52).text, u8"a1");
  EXPECT_EQ(fresh_local(26 + 26 * 10 + 3).text, u8"d10");
}

TEST(FreshLocalTest, NeverRepeats) {
  std::set<Local> seen;
  for (std::size_t n = 0; n < 2000; ++n) {
    EXPECT_TRUE(seen.insert(fresh_local(n)).second) << n;
  }
}

TEST(FreshLocalTest, Exhaustion) {
  EXPECT_THROW(fresh_local(std::numeric_limits<std::size_t>::max()),
               InternalError);
}

TEST(EnvironmentTest, ExtendNamesInOrder) {
  const auto env = local_environment();
  const auto [e1, first] = env.extend();
  const auto [e2, second] = e1.extend();
  EXPECT_EQ(first.text, u8"a");
  EXPECT_EQ(second.text, u8"b");
  EXPECT_EQ(e2.lookup(Bound{0, 0}).text, u8"b");
  EXPECT_EQ(e2.lookup(Bound{1, 0}).text, u8"a");
  EXPECT_EQ(e2.depth(), 2u);
}

TEST(EnvironmentTest, ParentIsUnchanged) {
  const auto env = local_environment();
  const auto [child, name] = env.extend();
  const auto [sibling, sibling_name] = env.extend();
  EXPECT_EQ(name.text, u8"a");
  EXPECT_EQ(sibling_name.text, u8"a");
  EXPECT_EQ(env.depth(), 0u);
  EXPECT_THROW(env.lookup(Bound{0, 0}), InternalError);
}

TEST(EnvironmentTest, AvoidingSkipsNames) {
  const auto env =
      local_environment().avoiding({Local(u8"a"), Local(u8"c")});
  const auto [e1, first] = env.extend();
  const auto [e2, second] = e1.extend();
  EXPECT_EQ(first.text, u8"b");
  EXPECT_EQ(second.text, u8"d");

  const auto both = env.avoiding({Local(u8"b")});
  EXPECT_EQ(both.extend().second.text, u8"d");
  EXPECT_EQ(both.extend_for_pattern(P::var(0)).lookup(Bound{0, 0}).text,
            u8"d");
}

TEST(EnvironmentTest, FreeVariables) {
  const auto [env, name] = local_environment().extend();
  EXPECT_EQ(env.lookup(Var<Local>(Local(u8"free"))).text, u8"free");
  EXPECT_EQ(env.lookup(Var<Local>(Bound{0, 0})).text, u8"a");
}

TEST(EnvironmentTest, PatternVariablesInIndexOrder) {
  const auto p =
      P::con(u8"Foo.Bar", {P::var(3), P::wildcard(), P::var(1), P::var(3)});
  const auto env = local_environment().extend_for_pattern(p);
  EXPECT_EQ(env.lookup(Bound{0, 1}).text, u8"a");
  EXPECT_EQ(env.lookup(Bound{0, 3}).text, u8"b");
  EXPECT_EQ(env.extend().second.text, u8"c");
}

TEST(EnvironmentTest, UndeclaredPatternVariable) {
  const auto env =
      local_environment().extend_for_pattern(P::con(u8"Maybe.Just", {P::var(0)}));
  EXPECT_THROW(env.lookup(Bound{0, 1}), InternalError);
  EXPECT_THROW(env.lookup(Bound{1, 0}), InternalError);
}

TEST(EnvironmentTest, PatternWithoutVariables) {
  const auto env = local_environment().extend_for_pattern(P::wildcard());
  EXPECT_EQ(env.depth(), 1u);
  EXPECT_THROW(env.lookup(Bound{0, 0}), InternalError);
  EXPECT_EQ(env.extend().second.text, u8"a");
}

TEST(EnvironmentTest, EmptyEnvironment) {
  const auto [env, name] = empty_environment().extend();
  EXPECT_EQ(name.text, u8"a");
  EXPECT_EQ(env.lookup(Bound{0, 0}).text, u8"a");
}

TEST(PatternTest, Variables) {
  EXPECT_THAT(pattern_variables(P::con(
                  u8"Foo.Bar", {P::var(3), P::con(u8"Maybe.Just", {P::var(0)}),
                                P::var(3)})),
              ElementsAre(0, 3));
  EXPECT_THAT(pattern_variables(P::integer(4)), IsEmpty());
}

TEST(PatternTest, Equality) {
  EXPECT_EQ(P::con(u8"Maybe.Just", {P::var(0)}),
            P::con(Qualified::parse(u8"Maybe.Just"), {P::var(0)}));
  EXPECT_NE(P::var(0), P::var(1));
  EXPECT_NE(P::wildcard(), P::string(u8"_"));
  EXPECT_LT(P::var(0), P::var(1));
}

}  // namespace
}  // namespace elmgen::testing
