#include <invar/verifier/congruence.hpp>
#include <invar/verifier/delta.hpp>
#include <invar/verifier/prover.hpp>
#include <set>

namespace invar {

namespace {

struct Branch {
    Congruence cc;
    std::vector<ExprPtr> pending;
    std::vector<ExprPtr> disjunctions;
    std::vector<ExprPtr> universals;
    std::vector<ExprPtr> uniques;
    std::vector<std::pair<ExprPtr, ExprPtr>> members;  // (element, source)
    std::set<std::string> asserted;
    std::set<std::string> instances;

    bool closed() const { return cc.inconsistent(); }
};

void flatten_or(const ExprPtr& expr, std::vector<ExprPtr>& parts) {
    if (expr->kind == ExprKind::OR) {
        flatten_or(expr->args[0], parts);
        flatten_or(expr->args[1], parts);
    } else {
        parts.push_back(expr);
    }
}

size_t generator_index(const Expr& expr) {
    for (size_t i = 0; i < expr.clauses.size(); ++i) {
        if (expr.clauses[i].kind == Clause::GENERATOR) return i;
    }
    return expr.clauses.size();
}

size_t count_generators(const Expr& expr) {
    size_t count = 0;
    for (const auto& clause : expr.clauses) {
        if (clause.kind == Clause::GENERATOR) ++count;
    }
    return count;
}

// Replaces each existential binder by a fresh constant.
void skolemize(Branch& branch, ExprPtr expr) {
    while (not expr->clauses.empty()) {
        const Clause first = expr->clauses.front();
        const ExprPtr tail = make_comprehension(
            ExprKind::EXISTS, expr->head(),
            std::vector<Clause>(expr->clauses.begin() + 1,
                                expr->clauses.end()));
        if (first.kind == Clause::GENERATOR) {
            const ExprPtr constant = dsl::var(fresh_name("sk"));
            branch.pending.push_back(dsl::in(constant, first.expr));
            expr = substitute(tail, first.var, constant);
        } else {
            branch.pending.push_back(first.expr);
            expr = tail;
        }
    }
}

void assert_formula(Branch& branch, const ExprPtr& formula) {
    if (branch.closed()) return;
    if (not branch.asserted.insert(canonical_key(formula)).second) return;

    Congruence& cc = branch.cc;
    switch (formula->kind) {
        case ExprKind::LITERAL:
            if (is_false(formula)) {
                cc.merge(cc.true_term(), cc.false_term());
            }
            break;
        case ExprKind::AND:
            branch.pending.push_back(formula->args[0]);
            branch.pending.push_back(formula->args[1]);
            break;
        case ExprKind::OR:
            branch.disjunctions.push_back(formula);
            break;
        case ExprKind::EXISTS:
            skolemize(branch, formula);
            break;
        case ExprKind::ALL:
            if (generator_index(*formula) == 0) {
                branch.universals.push_back(formula);
            } else {
                branch.pending.push_back(nnf(formula));
            }
            break;
        case ExprKind::UNIQUE:
            if (count_generators(*formula) == 1) {
                branch.uniques.push_back(formula);
            }
            cc.merge(cc.term(formula), cc.true_term());
            break;
        case ExprKind::NOT:
            cc.merge(cc.term(formula->args[0]), cc.false_term());
            break;
        case ExprKind::EQ:
            cc.merge(cc.term(formula->args[0]), cc.term(formula->args[1]));
            break;
        case ExprKind::NE:
            cc.separate(cc.term(formula->args[0]), cc.term(formula->args[1]));
            break;
        case ExprKind::LT:
            cc.order(cc.term(formula->args[0]), cc.term(formula->args[1]),
                     true);
            break;
        case ExprKind::LE:
            cc.order(cc.term(formula->args[0]), cc.term(formula->args[1]),
                     false);
            break;
        case ExprKind::GT:
            cc.order(cc.term(formula->args[1]), cc.term(formula->args[0]),
                     true);
            break;
        case ExprKind::GE:
            cc.order(cc.term(formula->args[1]), cc.term(formula->args[0]),
                     false);
            break;
        case ExprKind::IN:
            branch.members.push_back({formula->args[0], formula->args[1]});
            cc.merge(cc.term(formula), cc.true_term());
            break;
        default:
            cc.merge(cc.term(formula), cc.true_term());
            break;
    }
}

void drain(Branch& branch) {
    while (not branch.pending.empty() and not branch.closed()) {
        const ExprPtr formula = branch.pending.back();
        branch.pending.pop_back();
        assert_formula(branch, formula);
    }
}

// Drops satisfied disjunctions and asserts those with one open disjunct.
void propagate(Branch& branch) {
    bool changed = true;
    while (changed and not branch.closed()) {
        changed = false;
        std::vector<ExprPtr> remaining;
        for (const auto& disjunction : branch.disjunctions) {
            std::vector<ExprPtr> parts;
            flatten_or(disjunction, parts);
            std::vector<ExprPtr> open;
            bool satisfied = false;
            for (const auto& part : parts) {
                switch (branch.cc.value(part)) {
                    case Trool::TRUE:
                        satisfied = true;
                        break;
                    case Trool::MAYBE:
                        open.push_back(part);
                        break;
                    case Trool::FALSE:
                        break;
                }
                if (satisfied) break;
            }
            if (satisfied) {
                changed = true;
            } else if (open.size() <= 1) {
                branch.pending.push_back(open.empty() ? dsl::bool_lit(false)
                                                      : open.front());
                changed = true;
            } else if (open.size() < parts.size()) {
                ExprPtr simplified = open.back();
                for (size_t i = open.size() - 1; i--;) {
                    simplified = dsl::or_(open[i], simplified);
                }
                remaining.push_back(simplified);
                changed = true;
            } else {
                remaining.push_back(disjunction);
            }
        }
        branch.disjunctions.swap(remaining);
        drain(branch);
    }
}

ExprPtr unique_instance(const ExprPtr& unique, const ExprPtr& lhs,
                        const ExprPtr& rhs) {
    const auto& clauses = unique->clauses;
    const size_t g = generator_index(*unique);
    const std::string& var = clauses[g].var;
    ExprPtr result = dsl::ne(substitute(unique->head(), var, lhs),
                             substitute(unique->head(), var, rhs));
    for (size_t i = 0; i < clauses.size(); ++i) {
        if (i == g) continue;
        const ExprPtr& cond = clauses[i].expr;
        if (i < g) {
            result = make_or(nnf(cond, true), result);
        } else {
            result = make_or(nnf(substitute(cond, var, lhs), true), result);
            result = make_or(nnf(substitute(cond, var, rhs), true), result);
        }
    }
    return make_or(dsl::eq(lhs, rhs), result);
}

// Returns whether any new formula was produced.
bool instantiate(Branch& branch) {
    const size_t pending = branch.pending.size();
    Congruence& cc = branch.cc;
    const auto members = branch.members;

    for (const auto& universal : branch.universals) {
        const Clause& first = universal->clauses.front();
        const Congruence::Term source = cc.term(first.expr);
        const std::string key = canonical_key(universal);
        for (const auto& member : members) {
            if (not cc.equal(source, cc.term(member.second))) continue;
            if (not branch.instances
                        .insert(key + " @ " + canonical_key(member.first))
                        .second) {
                continue;
            }
            const ExprPtr tail = make_comprehension(
                ExprKind::ALL, universal->head(),
                std::vector<Clause>(universal->clauses.begin() + 1,
                                    universal->clauses.end()));
            branch.pending.push_back(
                nnf(substitute(tail, first.var, member.first)));
        }
    }

    for (const auto& unique : branch.uniques) {
        const size_t g = generator_index(*unique);
        const Congruence::Term source = cc.term(unique->clauses[g].expr);
        const std::string key = canonical_key(unique);
        std::vector<ExprPtr> candidates;
        for (const auto& member : members) {
            if (cc.equal(source, cc.term(member.second))) {
                candidates.push_back(member.first);
            }
        }
        for (size_t i = 0; i < candidates.size(); ++i) {
            const std::string lhs = canonical_key(candidates[i]);
            for (size_t j = i + 1; j < candidates.size(); ++j) {
                const std::string rhs = canonical_key(candidates[j]);
                if (lhs == rhs) continue;
                if (not branch.instances
                            .insert(key + " @ " + lhs + " , " + rhs)
                            .second) {
                    continue;
                }
                branch.pending.push_back(
                    unique_instance(unique, candidates[i], candidates[j]));
            }
        }
    }

    return branch.pending.size() > pending;
}

bool refute(Branch& branch, const ProverOptions& options, size_t splits) {
    for (size_t round = 0; round <= options.rounds; ++round) {
        drain(branch);
        propagate(branch);
        if (branch.closed()) return true;
        if (round == options.rounds or not instantiate(branch)) break;
    }
    drain(branch);
    if (branch.closed()) return true;
    if (splits == 0 or branch.disjunctions.empty()) return false;

    const ExprPtr disjunction = branch.disjunctions.back();
    branch.disjunctions.pop_back();
    std::vector<ExprPtr> parts;
    flatten_or(disjunction, parts);
    for (const auto& part : parts) {
        Branch child = branch;
        child.pending.push_back(part);
        if (not refute(child, options, splits - 1)) return false;
    }
    return true;
}

}  // namespace

bool prove(const std::vector<ExprPtr>& hypotheses, const ExprPtr& goal,
           const ProverOptions& options) {
    Branch root;
    for (const auto& hypothesis : hypotheses) {
        root.pending.push_back(nnf(hypothesis));
    }
    root.pending.push_back(nnf(goal, true));
    const bool proved = refute(root, options, options.splits);
    INVAR_DEBUG((proved ? "proved " : "failed to prove ") << *goal);
    return proved;
}

}  // namespace invar
