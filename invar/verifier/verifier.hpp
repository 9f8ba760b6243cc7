// Static check that preconditions preserve invariants.
//
// For each operation and invariant decide, for all states and parameters,
//   Invariants(S) and Pre(p, S)  implies  Invariant(Apply(op, p, S)).
// The check is sound and incomplete: PROVEN is a proof, DISPROVEN carries a
// concrete counterexample, and INCONCLUSIVE is left to runtime checking.

#pragma once

#include <invar/model/schema.hpp>
#include <invar/util/trool.hpp>
#include <invar/verifier/prover.hpp>
#include <invar/verifier/sampler.hpp>
#include <string>
#include <vector>

namespace invar {

enum class VerdictKind { UNCHECKED, PROVEN, DISPROVEN, INCONCLUSIVE };
const char* verdict_kind_name(VerdictKind kind);

struct Verdict {
    std::string operation;
    std::string invariant;
    VerdictKind kind = VerdictKind::UNCHECKED;
    std::string reason;
    std::vector<std::string> obligations;  // undischarged, printed
    Counterexample counterexample;         // DISPROVEN only
};

std::ostream& operator<<(std::ostream& os, const Verdict& verdict);

class VerificationReport {
   public:
    const std::vector<Verdict>& verdicts() const { return m_verdicts; }
    const Verdict* find(const std::string& operation,
                        const std::string& invariant) const;
    size_t count(VerdictKind kind) const;

    // TRUE if every pair is proven, FALSE if any is disproven.
    Trool judgment(const std::string& operation) const;

    // Invariants to re-check at runtime after the operation.
    std::vector<std::string> unproven(const std::string& operation) const;

    bool deployable() const { return count(VerdictKind::DISPROVEN) == 0; }

   private:
    friend class Verifier;
    std::vector<Verdict> m_verdicts;
};

struct VerifierOptions {
    size_t threads;
    size_t samples;
    size_t seed;
    ProverOptions prover;

    // Defaults from INVAR_VERIFY_THREADS, INVAR_VERIFY_SAMPLES,
    // INVAR_VERIFY_SEED, INVAR_PROVER_ROUNDS and INVAR_PROVER_SPLITS.
    VerifierOptions();
};

class Verifier : noncopyable {
   public:
    Verifier(const Schema& schema, const VerifierOptions& options);

    // Operations are verified in parallel; results do not depend on the
    // number of threads.
    VerificationReport verify() const;

    Verdict verify_pair(const std::string& operation,
                        const std::string& invariant) const;

   private:
    Verdict check_pair(size_t operation, size_t invariant) const;

    const Schema& m_schema;
    const VerifierOptions m_options;
    std::vector<ExprPtr> m_invariant_conjuncts;
};

}  // namespace invar
