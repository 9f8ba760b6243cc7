#include <gtest/gtest.h>
#include <invar/verifier/prover.hpp>

namespace invar {
namespace {

using namespace dsl;

ExprPtr id(const std::string& name) { return dot(dot(var(name), "val"), "id"); }

TEST(ProverTest, Tautologies) {
    const ProverOptions options;
    EXPECT_TRUE(prove({}, bool_lit(true), options));
    EXPECT_TRUE(prove({}, eq(var("x"), var("x")), options));
    EXPECT_TRUE(prove({}, or_(in(var("x"), state("xs")),
                              not_(in(var("x"), state("xs")))),
                      options));
    EXPECT_FALSE(prove({}, eq(var("x"), var("y")), options));
    EXPECT_FALSE(prove({}, bool_lit(false), options));
}

TEST(ProverTest, Congruence) {
    const ProverOptions options;
    EXPECT_TRUE(prove({eq(var("a"), var("b"))}, eq(id("a"), id("b")), options));
    EXPECT_TRUE(prove({eq(var("x"), int_lit(1)), eq(var("y"), int_lit(2))},
                      ne(var("x"), var("y")), options));
    EXPECT_TRUE(prove({lt(var("x"), var("y"))}, ne(var("x"), var("y")),
                      options));
}

TEST(ProverTest, InstantiatesUniversalsOnMembers) {
    const ProverOptions options;
    const ExprPtr every = all(gt(var("x"), int_lit(0)), {gen("x", state("xs"))});
    EXPECT_TRUE(prove({every, in(var("a"), state("xs"))},
                      gt(var("a"), int_lit(0)), options));
    EXPECT_FALSE(prove({every}, gt(var("a"), int_lit(0)), options));
}

TEST(ProverTest, NestedUniversalsAndExistentials) {
    const ProverOptions options;
    // Every embedded vote is global, so some story's vote is global.
    const ExprPtr embedded =
        all(in(var("w"), state("votes")),
            {gen("t", state("stories")),
             gen("w", dot(dot(var("t"), "val"), "votes"))});
    const ExprPtr goal =
        all(in(var("w"), state("votes")),
            {gen("t", state("stories")),
             gen("w", dot(dot(var("t"), "val"), "votes")),
             filter(ne(var("w"), var("v")))});
    EXPECT_TRUE(prove({embedded}, goal, options));
}

TEST(ProverTest, CaseSplits) {
    const ProverOptions options;
    const ExprPtr p = in(var("a"), state("xs"));
    const ExprPtr q = in(var("b"), state("xs"));
    EXPECT_TRUE(prove({or_(p, q), implies(p, q)}, q, options));

    // No unit clause here, so only splitting finds the refutation.
    const std::vector<ExprPtr> hypotheses = {or_(p, q), or_(p, not_(q)),
                                             or_(not_(p), q)};
    ProverOptions no_splits;
    no_splits.splits = 0;
    EXPECT_TRUE(prove(hypotheses, and_(p, q), options));
    EXPECT_FALSE(prove(hypotheses, and_(p, q), no_splits));
}

TEST(ProverTest, UniqueHypotheses) {
    const ProverOptions options;
    const ExprPtr unique_ids = unique(id("x"), {gen("x", state("votes"))});
    const std::vector<ExprPtr> hypotheses = {
        unique_ids, in(var("a"), state("votes")), in(var("b"), state("votes")),
        eq(id("a"), id("b"))};
    EXPECT_TRUE(prove(hypotheses, eq(var("a"), var("b")), options));
    EXPECT_FALSE(prove({unique_ids, in(var("a"), state("votes")),
                        eq(id("a"), id("b"))},
                       eq(var("a"), var("b")), options));
}

TEST(ProverTest, PreconditionExcludesDuplicateIds) {
    const ProverOptions options;
    const ExprPtr pre =
        not_(exists(var("v0"), {gen("v0", state("votes")),
                                filter(eq(id("v0"), id("v")))}));
    EXPECT_TRUE(prove({pre, in(var("u"), state("votes"))},
                      ne(id("u"), id("v")), options));
}

}  // namespace
}  // namespace invar
