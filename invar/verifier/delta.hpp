// Reduction of post-state obligations to pre-state obligations.
//
// Design decisions:
// - Effects are pushed backwards by substituting b + [r] or b - [r] for each
//   written state variable b, last effect first.
// - Insertions are pushed out of quantifiers, membership, len and sum
//   exactly. Removals are approximated by polarity: goals are strengthened
//   in positive positions and hypotheses weakened in negative positions.
// - Anything not rewritable stays as an opaque term.

#pragma once

#include <invar/eval/expr.hpp>
#include <invar/model/schema.hpp>
#include <vector>

namespace invar {

enum class Polarity { POSITIVE, NEGATIVE, NEUTRAL };

// Formula over the pre-state equivalent to formula over the post-state.
ExprPtr weakest_post(const ExprPtr& formula, const Operation& operation);

ExprPtr rewrite_deltas(const ExprPtr& expr,
                       Polarity polarity = Polarity::POSITIVE);

// Negation normal form. Also drops the witness heads of exists, turns
// leading filters of quantifiers into connectives, and negates exists
// into all.
ExprPtr nnf(const ExprPtr& expr, bool negate = false);

// Flattens nested conjunctions, dropping literal true.
void split_conjuncts(const ExprPtr& expr, std::vector<ExprPtr>& conjuncts);

// Connectives that fold boolean literals.
ExprPtr make_not(const ExprPtr& arg);
ExprPtr make_and(const ExprPtr& lhs, const ExprPtr& rhs);
ExprPtr make_or(const ExprPtr& lhs, const ExprPtr& rhs);
ExprPtr make_implies(const ExprPtr& lhs, const ExprPtr& rhs);

bool is_true(const ExprPtr& expr);
bool is_false(const ExprPtr& expr);

}  // namespace invar
