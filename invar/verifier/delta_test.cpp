#include <gtest/gtest.h>
#include <invar/verifier/delta.hpp>

namespace invar {
namespace {

using namespace dsl;

#define EXPECT_ALPHA_EQ(lhs, rhs)                                    \
    EXPECT_TRUE(alpha_equivalent((lhs), (rhs))) << "expected " << *(rhs) \
                                                << "\nactual   " << *(lhs)

Operation insert_op(const std::string& target, ExprPtr arg) {
    Operation op;
    op.name = "insert";
    op.params = {{"r", Type::int_type()}};
    op.precondition = bool_lit(true);
    op.effects = {{Effect::INSERT, target, std::move(arg)}};
    return op;
}

TEST(DeltaTest, WeakestPostSubstitutesLastEffectFirst) {
    Operation op = insert_op("xs", var("r"));
    op.effects.push_back({Effect::REMOVE, "xs", int_lit(0)});
    const ExprPtr post = weakest_post(in(var("y"), state("xs")), op);
    const ExprPtr expected =
        in(var("y"), bag_diff(bag_union(state("xs"), singleton(var("r"))),
                              singleton(int_lit(0))));
    EXPECT_ALPHA_EQ(post, expected);
}

TEST(DeltaTest, EffectsSeeEarlierEffects) {
    Operation op = insert_op("xs", var("r"));
    op.effects.push_back({Effect::INSERT, "ys", len(state("xs"))});
    const ExprPtr post = weakest_post(in(int_lit(1), state("ys")), op);
    const ExprPtr xs = bag_union(state("xs"), singleton(var("r")));
    const ExprPtr expected =
        in(int_lit(1), bag_union(state("ys"), singleton(len(xs))));
    EXPECT_ALPHA_EQ(post, expected);
}

TEST(DeltaTest, MembershipInInsertion) {
    const ExprPtr expr =
        in(var("y"), bag_union(state("xs"), singleton(var("r"))));
    EXPECT_ALPHA_EQ(rewrite_deltas(expr),
                    or_(in(var("y"), state("xs")), eq(var("y"), var("r"))));
}

TEST(DeltaTest, MembershipInRemovalDependsOnPolarity) {
    const ExprPtr expr =
        in(var("y"), bag_diff(state("xs"), singleton(var("r"))));
    EXPECT_ALPHA_EQ(rewrite_deltas(expr, Polarity::POSITIVE),
                    and_(in(var("y"), state("xs")),
                         not_(eq(var("y"), var("r")))));
    EXPECT_ALPHA_EQ(rewrite_deltas(expr, Polarity::NEGATIVE),
                    in(var("y"), state("xs")));
    EXPECT_ALPHA_EQ(rewrite_deltas(expr, Polarity::NEUTRAL), expr);
}

TEST(DeltaTest, QuantifiersSplitOverInsertion) {
    const ExprPtr xs = bag_union(state("xs"), singleton(var("r")));
    EXPECT_ALPHA_EQ(
        rewrite_deltas(all(gt(var("x"), int_lit(0)), {gen("x", xs)})),
        and_(all(gt(var("x"), int_lit(0)), {gen("x", state("xs"))}),
             all(gt(var("r"), int_lit(0)), {})));
    EXPECT_ALPHA_EQ(
        rewrite_deltas(exists(var("x"), {gen("x", xs),
                                         filter(eq(var("x"), int_lit(3)))})),
        or_(exists(var("x"), {gen("x", state("xs")),
                              filter(eq(var("x"), int_lit(3)))}),
            exists(var("r"), {filter(eq(var("r"), int_lit(3)))})));
}

TEST(DeltaTest, QuantifiersOverEmptyBags) {
    EXPECT_TRUE(is_true(
        rewrite_deltas(all(bool_lit(false), {gen("x", empty_bag())}))));
    EXPECT_TRUE(is_false(
        rewrite_deltas(exists(var("x"), {gen("x", empty_bag())}))));
}

TEST(DeltaTest, UniqueOverInsertionAddsCrossCheck) {
    const ExprPtr xs = bag_union(state("xs"), singleton(var("r")));
    const ExprPtr expr = unique(dot(var("x"), "id"), {gen("x", xs)});
    std::vector<ExprPtr> conjuncts;
    split_conjuncts(nnf(rewrite_deltas(expr)), conjuncts);
    ASSERT_EQ(conjuncts.size(), 2UL);
    EXPECT_ALPHA_EQ(conjuncts[0],
                    unique(dot(var("x"), "id"), {gen("x", state("xs"))}));
    EXPECT_ALPHA_EQ(conjuncts[1],
                    all(ne(dot(var("x"), "id"), dot(var("r"), "id")),
                        {gen("x", state("xs"))}));
}

TEST(DeltaTest, UniqueOverRemoval) {
    const ExprPtr xs = bag_diff(state("xs"), singleton(var("r")));
    const ExprPtr expr = unique(var("x"), {gen("x", xs)});
    EXPECT_ALPHA_EQ(rewrite_deltas(expr, Polarity::POSITIVE),
                    unique(var("x"), {gen("x", state("xs"))}));
    EXPECT_TRUE(is_true(rewrite_deltas(expr, Polarity::NEGATIVE)));
}

TEST(DeltaTest, ExistsOverRemovalSkipsRemoved) {
    const ExprPtr xs = bag_diff(state("xs"), singleton(var("r")));
    const ExprPtr expr = exists(var("x"), {gen("x", xs)});
    EXPECT_ALPHA_EQ(rewrite_deltas(expr, Polarity::POSITIVE),
                    exists(var("x"), {gen("x", state("xs")),
                                      filter(not_(eq(var("x"), var("r"))))}));
}

TEST(DeltaTest, LenAndSum) {
    const ExprPtr xs = bag_union(state("xs"), singleton(var("r")));
    EXPECT_ALPHA_EQ(rewrite_deltas(len(xs)),
                    add(len(state("xs")), int_lit(1)));
    EXPECT_ALPHA_EQ(rewrite_deltas(sum(xs)), add(sum(state("xs")), var("r")));
}

TEST(DeltaTest, NnfPushesNegation) {
    const ExprPtr expr = not_(and_(lt(var("a"), var("b")),
                                   all(in(var("x"), state("ys")),
                                       {gen("x", state("xs"))})));
    const ExprPtr expected =
        or_(ge(var("a"), var("b")),
            exists(bool_lit(true), {gen("x", state("xs")),
                                    filter(not_(in(var("x"), state("ys"))))}));
    EXPECT_ALPHA_EQ(nnf(expr), expected);
}

TEST(DeltaTest, NnfNegatesExistsIntoAll) {
    const ExprPtr expr =
        not_(exists(var("v0"), {gen("v0", state("votes")),
                                filter(eq(var("v0"), var("v")))}));
    EXPECT_ALPHA_EQ(nnf(expr),
                    all(ne(var("v0"), var("v")), {gen("v0", state("votes"))}));
}

TEST(DeltaTest, SplitConjuncts) {
    std::vector<ExprPtr> conjuncts;
    split_conjuncts(and_(and_(var("a"), bool_lit(true)), var("b")), conjuncts);
    ASSERT_EQ(conjuncts.size(), 2UL);
    EXPECT_ALPHA_EQ(conjuncts[0], var("a"));
    EXPECT_ALPHA_EQ(conjuncts[1], var("b"));
}

}  // namespace
}  // namespace invar
