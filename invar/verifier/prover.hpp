// Refutation prover for the quantified fragment used by invariants.
//
// Design decisions:
// - Formulas are put in negation normal form; existentials are skolemized
//   with fresh constants.
// - Universal hypotheses are instantiated only with terms known to be
//   members of their generator source, up to congruence.
// - Unique hypotheses are instantiated on pairs of known members.
// - Disjunctions are simplified against the congruence closure, then split
//   up to a fixed depth.
// - A failed proof means nothing: the prover is sound, not complete.

#pragma once

#include <invar/eval/expr.hpp>
#include <vector>

namespace invar {

struct ProverOptions {
    size_t rounds = 4;  // instantiation rounds per branch
    size_t splits = 8;  // case-split depth
};

// Proves that the hypotheses jointly imply the goal.
bool prove(const std::vector<ExprPtr>& hypotheses, const ExprPtr& goal,
           const ProverOptions& options);

}  // namespace invar
