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

#include "elmgen/expression.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "elmgen/name.h"
#include "elmgen/pattern.h"
#include "testing/test_util.h"

namespace elmgen::testing {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

E rename_x_to_y(const Local& l) {
  return l.text == u8"x" ? v(u8"y") : E::var(l);
}

TEST(SubstituteTest, IdentityIsNoOp) {
  const E e = lam(u8"y", apps(v(u8"f"), {v(u8"x"), v(u8"y")}));
  EXPECT_EQ(substitute(e, [](const Local& l) { return E::var(l); }), e);
}

TEST(SubstituteTest, ReplacesFreeVariables) {
  const E e = op(u8"Basics.+", v(u8"x"), v(u8"z"));
  EXPECT_EQ(substitute(e, rename_x_to_y), op(u8"Basics.+", v(u8"y"), v(u8"z")));
}

TEST(SubstituteTest, DoesNotCapture) {
  // \y -> x, with x := y, must not become \y -> y.
  const E result = substitute(lam(u8"y", v(u8"x")), rename_x_to_y);
  EXPECT_THAT(result, PrintsAs(u8"\\a -> y"));

  const auto* l = result.get_if<expr::lam_t<Local>>();
  ASSERT_NE(l, nullptr);
  EXPECT_EQ(instantiate1(v(u8"z"), l->body), v(u8"y"));
}

TEST(SubstituteTest, LeavesBoundVariablesAlone) {
  const E result =
      substitute(lam(u8"y", apps(v(u8"y"), {v(u8"x")})), rename_x_to_y);
  EXPECT_THAT(result, PrintsAs(u8"\\a -> a y"));
}

TEST(SubstituteTest, ValueContainingBinders) {
  const E id = lam(u8"z", v(u8"z"));
  const E result = substitute(
      lam(u8"y", apps(v(u8"x"), {v(u8"y")})),
      [&](const Local& l) { return l.text == u8"x" ? id : E::var(l); });
  EXPECT_THAT(result, PrintsAs(u8"\\a -> (\\b -> b) a"));
}

TEST(SubstituteTest, ThroughCaseBranches) {
  const E e = E::case_of(
      v(u8"x"), {branch(P::con(u8"Maybe.Just", {P::var(0)}),
                        apps(v(u8"x"), {v(u8"j")}), {{u8"j", 0}})});
  EXPECT_THAT(substitute(e, rename_x_to_y),
              PrintsAs(u8"case y of\n    Just a ->\n        y a"));
}

TEST(SubstituteTest, ChangesVariableType) {
  const E e = apps(v(u8"f"), {v(u8"xs"), lam(u8"y", v(u8"zzz"))});
  const Expression<std::size_t> sizes =
      map_vars(e, [](const Local& l) { return l.text.size(); });
  EXPECT_THAT(free_variables(sizes), ElementsAre(1u, 2u, 3u));
}

TEST(FreeVariablesTest, OccurrenceOrder) {
  const E e =
      apps(v(u8"f"), {v(u8"x"), lam(u8"y", apps(v(u8"x"), {v(u8"y")}))});
  EXPECT_THAT(free_variables(e),
              ElementsAre(Local(u8"f"), Local(u8"x"), Local(u8"x")));
  EXPECT_THAT(free_variables(lam(u8"y", v(u8"y"))), IsEmpty());
}

TEST(CloseTest, ClosedTree) {
  const std::optional<Expression<Void>> c = close(lam(u8"x", v(u8"x")));
  ASSERT_TRUE(c.has_value());
  EXPECT_THAT(*c, PrintsAs(u8"\\a -> a"));
}

TEST(CloseTest, OpenTree) {
  EXPECT_EQ(close(lam(u8"x", v(u8"y"))), std::nullopt);
}

TEST(ScopeTest, AbstractNested) {
  const E e = lam(u8"x", lam(u8"y", apps(v(u8"x"), {v(u8"y")})));
  const E expected = E::lam(Scope1<Local>(E::lam(Scope1<Local>(
      E::app(E::bound(Bound{1, 0}), E::bound(Bound{0, 0}))))));
  EXPECT_EQ(e, expected);
}

TEST(ScopeTest, InstantiateNested) {
  const E e = lam(u8"x", lam(u8"y", apps(v(u8"x"), {v(u8"y")})));
  const auto* l = e.get_if<expr::lam_t<Local>>();
  ASSERT_NE(l, nullptr);
  EXPECT_EQ(instantiate1(v(u8"z"), l->body),
            lam(u8"y", apps(v(u8"z"), {v(u8"y")})));
}

TEST(ScopeTest, AbstractShiftsOuterPlaceholders) {
  const E open = E::app(v(u8"x"), E::bound(Bound{0, 0}));
  const Scope1<Local> s = abstract1(Local(u8"x"), open);
  EXPECT_EQ(s.body(), E::app(E::bound(Bound{0, 0}), E::bound(Bound{1, 0})));
  EXPECT_EQ(instantiate1(v(u8"x"), s), open);
}

TEST(ScopeTest, AbstractSeveralVariables) {
  const E e = apps(v(u8"a"), {v(u8"b"), v(u8"c")});
  const ScopeN<Local> s =
      abstract<int>(e, [](const Local& l) -> std::optional<int> {
        if (l.text == u8"a") return 1;
        if (l.text == u8"b") return 0;
        return std::nullopt;
      });
  EXPECT_EQ(s.body(), apps(E::bound(Bound{0, 1}),
                           {E::bound(Bound{0, 0}), v(u8"c")}));
  EXPECT_EQ(instantiate(s, [](int i) { return i == 0 ? v(u8"p") : v(u8"q"); }),
            apps(v(u8"q"), {v(u8"p"), v(u8"c")}));
}

TEST(ComparisonTest, BinderNamesDoNotMatter) {
  EXPECT_EQ(lam(u8"x", v(u8"x")), lam(u8"y", v(u8"y")));
  EXPECT_NE(lam(u8"x", v(u8"x")), lam(u8"x", v(u8"y")));
  EXPECT_NE(lam(u8"x", lam(u8"y", v(u8"x"))), lam(u8"x", lam(u8"y", v(u8"y"))));
}

TEST(ComparisonTest, Ordering) {
  EXPECT_LT(num(1), num(2));
  EXPECT_LT(v(u8"a"), v(u8"b"));
  EXPECT_EQ(num(7) <=> num(7), std::weak_ordering::equivalent);
  EXPECT_EQ(E::floating(1.5), E::floating(1.5));
  EXPECT_NE(E::string(u8"a"), E::string(u8"b"));
}

TEST(AppsViewTest, FlattensSpine) {
  const auto [head, args] =
      apps_view(apps(v(u8"f"), {v(u8"a"), v(u8"b"), v(u8"c")}));
  EXPECT_EQ(head, v(u8"f"));
  EXPECT_THAT(args, ElementsAre(v(u8"a"), v(u8"b"), v(u8"c")));
}

TEST(AppsViewTest, NonApplication) {
  const auto [head, args] = apps_view(v(u8"f"));
  EXPECT_EQ(head, v(u8"f"));
  EXPECT_THAT(args, IsEmpty());
}

TEST(CombinatorTest, ApplyAll) {
  EXPECT_EQ(apply_all(v(u8"f"), {v(u8"a"), v(u8"b")}),
            E::app(E::app(v(u8"f"), v(u8"a")), v(u8"b")));
  EXPECT_EQ(apply_all(v(u8"f"), {}), v(u8"f"));
}

TEST(CombinatorTest, PipeAndPair) {
  EXPECT_EQ(pipe_into(v(u8"x"), v(u8"f")),
            apps(g(u8"Basics.|>"), {v(u8"x"), v(u8"f")}));
  EXPECT_EQ(pair(v(u8"x"), v(u8"y")),
            apps(g(u8"Basics.,"), {v(u8"x"), v(u8"y")}));
}

TEST(PrintAstTest, Variables) {
  EXPECT_EQ(print_ast(v(u8"x")), "(Var\n    x)");
  EXPECT_EQ(print_ast(lam(u8"x", v(u8"x"))),
            "(Lam\n    (Scope\n        (Var\n            (Bound 0 0))))");
}

TEST(PrintAstTest, Application) {
  EXPECT_EQ(print_ast(op(u8"Basics.+", num(1), num(2))),
            "(App\n"
            "    (App\n"
            "        (Global\n"
            "            Basics.+)\n"
            "        (Int\n"
            "            1))\n"
            "    (Int\n"
            "        2))");
}

}  // namespace
}  // namespace elmgen::testing
