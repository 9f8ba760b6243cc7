#include <gtest/gtest.h>
#include <invar/verifier/congruence.hpp>

namespace invar {
namespace {

using namespace dsl;

TEST(CongruenceTest, TermsAreHashConsed) {
    Congruence cc;
    const size_t size = cc.size();
    const Congruence::Term x = cc.term(dot(var("a"), "id"));
    EXPECT_EQ(cc.term(dot(var("a"), "id")), x);
    EXPECT_EQ(cc.size(), size + 2);
    EXPECT_EQ(cc.term(bool_lit(true)), cc.true_term());
}

TEST(CongruenceTest, MergePropagatesThroughFunctions) {
    Congruence cc;
    const Congruence::Term fa = cc.term(dot(dot(var("a"), "val"), "id"));
    const Congruence::Term fb = cc.term(dot(dot(var("b"), "val"), "id"));
    EXPECT_FALSE(cc.equal(fa, fb));
    cc.merge(cc.term(var("a")), cc.term(var("b")));
    EXPECT_TRUE(cc.equal(fa, fb));
    EXPECT_FALSE(cc.inconsistent());
}

TEST(CongruenceTest, DistinctLiteralsConflict) {
    Congruence cc;
    cc.merge(cc.term(var("x")), cc.term(int_lit(1)));
    EXPECT_FALSE(cc.inconsistent());
    cc.merge(cc.term(var("y")), cc.term(int_lit(2)));
    EXPECT_EQ(cc.value(eq(var("x"), var("y"))), Trool::FALSE);
    cc.merge(cc.term(var("x")), cc.term(var("y")));
    EXPECT_TRUE(cc.inconsistent());
}

TEST(CongruenceTest, SeparatedTermsConflictWhenMerged) {
    Congruence cc;
    const ExprPtr lhs = dot(var("a"), "id");
    const ExprPtr rhs = dot(var("b"), "id");
    cc.separate(cc.term(lhs), cc.term(rhs));
    EXPECT_EQ(cc.value(ne(lhs, rhs)), Trool::TRUE);
    EXPECT_EQ(cc.value(eq(var("a"), var("b"))), Trool::MAYBE);
    cc.merge(cc.term(var("a")), cc.term(var("b")));
    EXPECT_TRUE(cc.inconsistent());
}

TEST(CongruenceTest, AtomsTakeTruthValues) {
    Congruence cc;
    const ExprPtr atom = in(var("v"), state("votes"));
    EXPECT_EQ(cc.value(atom), Trool::MAYBE);
    cc.merge(cc.term(atom), cc.false_term());
    EXPECT_EQ(cc.value(atom), Trool::FALSE);
    EXPECT_EQ(cc.value(not_(atom)), Trool::TRUE);

    // The same atom over an equal element is also false.
    cc.merge(cc.term(var("w")), cc.term(var("v")));
    EXPECT_EQ(cc.value(in(var("w"), state("votes"))), Trool::FALSE);
    cc.merge(cc.term(in(var("w"), state("votes"))), cc.true_term());
    EXPECT_TRUE(cc.inconsistent());
}

TEST(CongruenceTest, Orders) {
    Congruence cc;
    const Congruence::Term x = cc.term(var("x"));
    const Congruence::Term y = cc.term(var("y"));
    cc.order(x, y, true);
    EXPECT_FALSE(cc.inconsistent());
    cc.order(y, x, false);
    EXPECT_TRUE(cc.inconsistent());

    Congruence literals;
    literals.order(literals.term(var("x")), literals.term(int_lit(0)), false);
    literals.merge(literals.term(var("x")), literals.term(int_lit(1)));
    EXPECT_TRUE(literals.inconsistent());
    EXPECT_EQ(literals.value(lt(int_lit(1), int_lit(2))), Trool::TRUE);
}

TEST(CongruenceTest, ProjectionsOfRecordsSimplify) {
    Congruence cc;
    const ExprPtr made = record({{"a", var("x")}, {"b", var("y")}});
    EXPECT_EQ(cc.term(dot(made, "b")), cc.term(var("y")));
}

TEST(CongruenceTest, BindersAreOpaqueModuloRenaming) {
    Congruence cc;
    const ExprPtr lhs = all(in(var("a"), state("xs")), {gen("a", state("ys"))});
    const ExprPtr rhs = all(in(var("b"), state("xs")), {gen("b", state("ys"))});
    EXPECT_EQ(cc.term(lhs), cc.term(rhs));
}

}  // namespace
}  // namespace invar
