#include <algorithm>
#include <invar/util/worker_pool.hpp>
#include <invar/verifier/delta.hpp>
#include <invar/verifier/verifier.hpp>

namespace invar {

const char* verdict_kind_name(VerdictKind kind) {
    switch (kind) {
        case VerdictKind::UNCHECKED:
            return "UNCHECKED";
        case VerdictKind::PROVEN:
            return "PROVEN";
        case VerdictKind::DISPROVEN:
            return "DISPROVEN";
        case VerdictKind::INCONCLUSIVE:
            return "INCONCLUSIVE";
    }
    return "???";
}

std::ostream& operator<<(std::ostream& os, const Verdict& verdict) {
    os << verdict.operation << " / " << verdict.invariant << ": "
       << verdict_kind_name(verdict.kind);
    if (not verdict.reason.empty()) {
        os << " (" << verdict.reason << ")";
    }
    if (verdict.kind == VerdictKind::DISPROVEN) {
        os << " with";
        for (const auto& param : verdict.counterexample.params) {
            os << " " << param.first << " = " << param.second;
        }
        os << " in " << verdict.counterexample.state;
    }
    return os;
}

//----------------------------------------------------------------------------
// Report

const Verdict* VerificationReport::find(const std::string& operation,
                                        const std::string& invariant) const {
    for (const auto& verdict : m_verdicts) {
        if (verdict.operation == operation and verdict.invariant == invariant) {
            return &verdict;
        }
    }
    return nullptr;
}

size_t VerificationReport::count(VerdictKind kind) const {
    size_t result = 0;
    for (const auto& verdict : m_verdicts) {
        if (verdict.kind == kind) ++result;
    }
    return result;
}

Trool VerificationReport::judgment(const std::string& operation) const {
    Trool result = Trool::TRUE;
    for (const auto& verdict : m_verdicts) {
        if (verdict.operation != operation) continue;
        switch (verdict.kind) {
            case VerdictKind::PROVEN:
                break;
            case VerdictKind::DISPROVEN:
                result = and_trool(result, Trool::FALSE);
                break;
            default:
                result = and_trool(result, Trool::MAYBE);
                break;
        }
    }
    return result;
}

std::vector<std::string> VerificationReport::unproven(
    const std::string& operation) const {
    std::vector<std::string> result;
    for (const auto& verdict : m_verdicts) {
        if (verdict.operation == operation and
            verdict.kind != VerdictKind::PROVEN) {
            result.push_back(verdict.invariant);
        }
    }
    return result;
}

//----------------------------------------------------------------------------
// Verifier

VerifierOptions::VerifierOptions()
    : threads(getenv_default("INVAR_VERIFY_THREADS", 1UL)),
      samples(getenv_default("INVAR_VERIFY_SAMPLES", 2000UL)),
      seed(getenv_default("INVAR_VERIFY_SEED", 0UL)) {
    prover.rounds = getenv_default("INVAR_PROVER_ROUNDS", prover.rounds);
    prover.splits = getenv_default("INVAR_PROVER_SPLITS", prover.splits);
}

// Hypotheses are weakened (NEGATIVE), goals strengthened (POSITIVE).
static std::vector<ExprPtr> normalized_conjuncts(const ExprPtr& formula,
                                                 Polarity polarity) {
    std::vector<ExprPtr> result;
    split_conjuncts(nnf(rewrite_deltas(formula, polarity)), result);
    return result;
}

Verifier::Verifier(const Schema& schema, const VerifierOptions& options)
    : m_schema(schema), m_options(options) {
    for (const auto& invariant : schema.invariants()) {
        for (const auto& conjunct : normalized_conjuncts(invariant.formula,
                                                     Polarity::NEGATIVE)) {
            m_invariant_conjuncts.push_back(conjunct);
        }
    }
}

Verdict Verifier::check_pair(size_t op_index, size_t inv_index) const {
    const Operation& operation = m_schema.operations()[op_index];
    const Invariant& invariant = m_schema.invariants()[inv_index];
    Verdict verdict;
    verdict.operation = operation.name;
    verdict.invariant = invariant.name;

    bool framed = true;
    const auto writes = operation.writes();
    for (const auto& name : state_vars(invariant.formula)) {
        if (writes.count(name)) framed = false;
    }
    if (framed) {
        verdict.kind = VerdictKind::PROVEN;
        verdict.reason = "frame";
        return verdict;
    }

    std::vector<ExprPtr> hypotheses = m_invariant_conjuncts;
    for (const auto& conjunct : normalized_conjuncts(operation.precondition,
                                                 Polarity::NEGATIVE)) {
        hypotheses.push_back(conjunct);
    }

    const ExprPtr post = weakest_post(invariant.formula, operation);
    size_t inductive = 0;
    for (const auto& goal : normalized_conjuncts(post, Polarity::POSITIVE)) {
        bool discharged = false;
        for (const auto& hypothesis : hypotheses) {
            if (alpha_equivalent(goal, hypothesis)) {
                discharged = true;
                ++inductive;
                break;
            }
        }
        if (not discharged and not prove(hypotheses, goal, m_options.prover)) {
            verdict.obligations.push_back(print_expr(goal));
        }
    }

    if (verdict.obligations.empty()) {
        verdict.kind = VerdictKind::PROVEN;
        verdict.reason = inductive ? "induction" : "prover";
        return verdict;
    }

    rng_t rng(m_options.seed + 1000003UL * op_index + inv_index);
    if (find_counterexample(m_schema, operation, invariant,
                            m_options.samples, rng, verdict.counterexample)) {
        verdict.kind = VerdictKind::DISPROVEN;
        verdict.reason = "counterexample";
    } else {
        verdict.kind = VerdictKind::INCONCLUSIVE;
        verdict.reason = "no proof or counterexample";
    }
    return verdict;
}

Verdict Verifier::verify_pair(const std::string& operation,
                              const std::string& invariant) const {
    const auto& operations = m_schema.operations();
    const auto& invariants = m_schema.invariants();
    for (size_t i = 0; i < operations.size(); ++i) {
        if (operations[i].name != operation) continue;
        for (size_t j = 0; j < invariants.size(); ++j) {
            if (invariants[j].name == invariant) {
                return check_pair(i, j);
            }
        }
    }
    INVAR_ERROR("unknown pair " << operation << " / " << invariant);
}

VerificationReport Verifier::verify() const {
    const size_t op_count = m_schema.operations().size();
    const size_t inv_count = m_schema.invariants().size();
    INVAR_INFO("Verifying " << op_count << " operations against " << inv_count
                            << " invariants");
    Timer timer;

    VerificationReport report;
    report.m_verdicts.resize(op_count * inv_count);
    {
        WorkerPool pool(std::max<size_t>(1, m_options.threads));
        for (size_t i = 0; i < op_count; ++i) {
            pool.schedule([this, i, inv_count, &report]() {
                for (size_t j = 0; j < inv_count; ++j) {
                    report.m_verdicts[i * inv_count + j] = check_pair(i, j);
                }
            });
        }
    }

    for (const auto& verdict : report.m_verdicts) {
        if (verdict.kind == VerdictKind::PROVEN) {
            INVAR_DEBUG(verdict);
        } else {
            INVAR_INFO(verdict);
        }
    }
    INVAR_INFO("Verified in " << timer.elapsed() << " sec: "
                              << report.count(VerdictKind::PROVEN)
                              << " proven, "
                              << report.count(VerdictKind::DISPROVEN)
                              << " disproven, "
                              << report.count(VerdictKind::INCONCLUSIVE)
                              << " inconclusive");
    return report;
}

}  // namespace invar
