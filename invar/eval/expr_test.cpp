#include <gtest/gtest.h>
#include <invar/eval/expr.hpp>

namespace invar {
namespace {

using namespace dsl;

TEST(ExprTest, FreeVarsRespectBinders) {
    const ExprPtr expr = all(gt(dot(var("x"), "n"), var("k")),
                             {gen("x", dot(var("y"), "xs"))});
    const std::set<std::string> expected = {"k", "y"};
    EXPECT_EQ(free_vars(expr), expected);

    const ExprPtr shadowed =
        exists(var("x"), {gen("x", state("a")), gen("x", dot(var("x"), "b"))});
    EXPECT_TRUE(free_vars(shadowed).empty());
}

TEST(ExprTest, StateVarsAreCollected) {
    const ExprPtr expr = and_(in(var("v"), state("votes")),
                              all(bool_lit(true), {gen("s", state("stories"))}));
    const std::set<std::string> expected = {"stories", "votes"};
    EXPECT_EQ(state_vars(expr), expected);
}

TEST(ExprTest, SubstituteSkipsBoundOccurrences) {
    const ExprPtr expr =
        and_(eq(var("x"), int_lit(1)),
             exists(var("x"), {gen("x", state("xs")),
                               filter(eq(var("x"), var("y")))}));
    const ExprPtr result = substitute(expr, "x", int_lit(2));
    const ExprPtr expected =
        and_(eq(int_lit(2), int_lit(1)),
             exists(var("x"), {gen("x", state("xs")),
                               filter(eq(var("x"), var("y")))}));
    EXPECT_TRUE(alpha_equivalent(result, expected)) << *result;
}

TEST(ExprTest, SubstituteAvoidsCapture) {
    // Replacing y by x must not let the binder x capture it.
    const ExprPtr expr = exists(
        var("x"), {gen("x", state("xs")), filter(eq(var("x"), var("y")))});
    const ExprPtr result = substitute(expr, "y", var("x"));
    EXPECT_EQ(free_vars(result), std::set<std::string>({"x"}));
    const ExprPtr expected = exists(
        var("z"), {gen("z", state("xs")), filter(eq(var("z"), var("x")))});
    EXPECT_TRUE(alpha_equivalent(result, expected)) << *result;
}

TEST(ExprTest, SubstituteState) {
    const ExprPtr expr = in(var("v"), state("votes"));
    const ExprPtr post = substitute_state(
        expr, "votes", bag_union(state("votes"), singleton(var("r"))));
    EXPECT_TRUE(alpha_equivalent(
        post, in(var("v"), bag_union(state("votes"), singleton(var("r"))))));
}

TEST(ExprTest, AlphaEquivalence) {
    const ExprPtr lhs =
        all(in(var("a"), state("xs")), {gen("a", state("ys"))});
    const ExprPtr rhs =
        all(in(var("b"), state("xs")), {gen("b", state("ys"))});
    const ExprPtr other =
        all(in(var("b"), state("ys")), {gen("b", state("ys"))});
    EXPECT_TRUE(alpha_equivalent(lhs, rhs));
    EXPECT_FALSE(alpha_equivalent(lhs, other));
    EXPECT_EQ(canonical_key(lhs), canonical_key(rhs));
    EXPECT_NE(canonical_key(lhs), canonical_key(other));
    EXPECT_FALSE(alpha_equivalent(var("a"), var("b")));
}

TEST(ExprTest, FreshenRenamesBinders) {
    const ExprPtr expr = unique(var("x"), {gen("x", state("xs"))});
    const ExprPtr fresh = freshen(expr);
    EXPECT_TRUE(alpha_equivalent(expr, fresh));
    EXPECT_NE(fresh->clauses[0].var, "x");
}

TEST(ExprTest, FreshNamesAreDistinct) {
    const std::string a = fresh_name("x");
    const std::string b = fresh_name(a);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.substr(0, 2), "x%");
    EXPECT_EQ(b.substr(0, 2), "x%");
}

}  // namespace
}  // namespace invar
