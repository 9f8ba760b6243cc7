#include <algorithm>
#include <invar/verifier/congruence.hpp>
#include <map>

namespace invar {

Congruence::Congruence() : m_inconsistent(false) {
    m_true = term(dsl::bool_lit(true));
    m_false = term(dsl::bool_lit(false));
}

Congruence::Term Congruence::intern(const std::string& symbol,
                                    std::vector<Term> args,
                                    const Value& literal) {
    std::ostringstream key;
    key << symbol << "(";
    for (Term arg : args) {
        key << arg << ",";
    }
    key << ")";
    auto inserted = m_index.insert({key.str(), m_nodes.size()});
    if (not inserted.second) {
        return inserted.first->second;
    }

    const Term result = m_nodes.size();
    const bool compound = not args.empty();
    m_nodes.push_back({symbol, std::move(args), literal});
    m_parent.push_back(result);
    if (compound) {
        close();
    }
    if (not literal.is_none()) {
        check();
    }
    return result;
}

Congruence::Term Congruence::term(const ExprPtr& expr) {
    switch (expr->kind) {
        case ExprKind::LITERAL:
            return intern("lit " + canonical_key(expr), {}, expr->literal);
        case ExprKind::VAR:
            return intern("var " + expr->name, {}, Value());
        case ExprKind::STATE:
            return intern("state " + expr->name, {}, Value());
        case ExprKind::FIELD: {
            const ExprPtr& base = expr->args[0];
            if (base->kind == ExprKind::MAKE_RECORD) {
                for (size_t i = 0; i < base->names.size(); ++i) {
                    if (base->names[i] == expr->name) {
                        return term(base->args[i]);
                    }
                }
            }
            return intern("." + expr->name, {term(base)}, Value());
        }
        case ExprKind::COMPREHENSION:
        case ExprKind::EXISTS:
        case ExprKind::ALL:
        case ExprKind::UNIQUE:
            return intern("opaque " + canonical_key(expr), {}, Value());
        default: {
            std::string symbol = expr_kind_name(expr->kind);
            for (const auto& name : expr->names) {
                symbol += " " + name;
            }
            std::vector<Term> args;
            for (const auto& arg : expr->args) {
                args.push_back(term(arg));
            }
            return intern(symbol, std::move(args), Value());
        }
    }
}

Congruence::Term Congruence::find(Term term) {
    Term root = term;
    while (m_parent[root] != root) {
        root = m_parent[root];
    }
    while (m_parent[term] != root) {
        const Term next = m_parent[term];
        m_parent[term] = root;
        term = next;
    }
    return root;
}

void Congruence::merge(Term lhs, Term rhs) {
    lhs = find(lhs);
    rhs = find(rhs);
    if (lhs == rhs) return;
    m_parent[std::max(lhs, rhs)] = std::min(lhs, rhs);
    close();
    check();
}

void Congruence::separate(Term lhs, Term rhs) {
    m_distinct.push_back({lhs, rhs});
    check();
}

void Congruence::order(Term lhs, Term rhs, bool strict) {
    m_orders.push_back({{lhs, rhs}, strict});
    check();
}

// Merges classes of terms with the same symbol over equal arguments, until
// no two such classes remain.
void Congruence::close() {
    bool changed = true;
    while (changed) {
        changed = false;
        std::unordered_map<std::string, Term> signatures;
        for (Term t = 0; t < m_nodes.size(); ++t) {
            const Node& node = m_nodes[t];
            if (node.args.empty()) continue;
            std::ostringstream key;
            key << node.symbol << "(";
            for (Term arg : node.args) {
                key << find(arg) << ",";
            }
            key << ")";
            auto inserted = signatures.insert({key.str(), t});
            if (inserted.second) continue;
            const Term x = find(inserted.first->second);
            const Term y = find(t);
            if (x != y) {
                m_parent[std::max(x, y)] = std::min(x, y);
                changed = true;
            }
        }
    }
}

const Value& Congruence::class_literal(Term term) {
    static const Value none;
    const Term root = find(term);
    for (Term t = 0; t < m_nodes.size(); ++t) {
        if (not m_nodes[t].literal.is_none() and find(t) == root) {
            return m_nodes[t].literal;
        }
    }
    return none;
}

bool Congruence::separated(Term lhs, Term rhs) {
    lhs = find(lhs);
    rhs = find(rhs);
    if (lhs == rhs) return false;
    for (const auto& pair : m_distinct) {
        const Term x = find(pair.first);
        const Term y = find(pair.second);
        if ((x == lhs and y == rhs) or (x == rhs and y == lhs)) return true;
    }
    const Value& x = class_literal(lhs);
    const Value& y = class_literal(rhs);
    return not x.is_none() and not y.is_none() and x != y;
}

void Congruence::check() {
    if (m_inconsistent) return;

    std::map<Term, Term> literals;
    for (Term t = 0; t < m_nodes.size(); ++t) {
        if (m_nodes[t].literal.is_none()) continue;
        auto inserted = literals.insert({find(t), t});
        if (not inserted.second and
            m_nodes[inserted.first->second].literal != m_nodes[t].literal) {
            m_inconsistent = true;
            return;
        }
    }

    for (const auto& pair : m_distinct) {
        if (find(pair.first) == find(pair.second)) {
            m_inconsistent = true;
            return;
        }
    }

    for (const auto& order : m_orders) {
        const Term x = find(order.first.first);
        const Term y = find(order.first.second);
        const bool strict = order.second;
        if (x == y) {
            if (strict) {
                m_inconsistent = true;
                return;
            }
            continue;
        }
        const Value& lhs = class_literal(x);
        const Value& rhs = class_literal(y);
        if (lhs.kind() == Value::Kind::INT and rhs.kind() == Value::Kind::INT) {
            const int c = lhs.compare(rhs);
            if (strict ? c >= 0 : c > 0) {
                m_inconsistent = true;
                return;
            }
        }
        // x < y together with y <= x, or x <= y together with y < x.
        for (const auto& other : m_orders) {
            if (find(other.first.first) == y and
                find(other.first.second) == x and (strict or other.second)) {
                m_inconsistent = true;
                return;
            }
        }
    }
}

Trool Congruence::value(const ExprPtr& atom) {
    switch (atom->kind) {
        case ExprKind::NOT:
            return not_trool(value(atom->args[0]));
        case ExprKind::LITERAL:
            if (atom->literal.kind() == Value::Kind::BOOL) {
                return atom->literal.as_bool() ? Trool::TRUE : Trool::FALSE;
            }
            return Trool::MAYBE;
        case ExprKind::EQ:
        case ExprKind::NE: {
            const Term lhs = term(atom->args[0]);
            const Term rhs = term(atom->args[1]);
            Trool result = equal(lhs, rhs) ? Trool::TRUE
                                           : separated(lhs, rhs) ? Trool::FALSE
                                                                 : Trool::MAYBE;
            return atom->kind == ExprKind::EQ ? result : not_trool(result);
        }
        case ExprKind::LT:
        case ExprKind::LE:
        case ExprKind::GT:
        case ExprKind::GE: {
            const Term lhs = term(atom->args[0]);
            const Term rhs = term(atom->args[1]);
            const bool strict =
                atom->kind == ExprKind::LT or atom->kind == ExprKind::GT;
            if (equal(lhs, rhs)) {
                return strict ? Trool::FALSE : Trool::TRUE;
            }
            const Value& x = class_literal(lhs);
            const Value& y = class_literal(rhs);
            if (x.kind() != Value::Kind::INT or y.kind() != Value::Kind::INT) {
                return Trool::MAYBE;
            }
            const int c = x.compare(y);
            switch (atom->kind) {
                case ExprKind::LT:
                    return c < 0 ? Trool::TRUE : Trool::FALSE;
                case ExprKind::LE:
                    return c <= 0 ? Trool::TRUE : Trool::FALSE;
                case ExprKind::GT:
                    return c > 0 ? Trool::TRUE : Trool::FALSE;
                default:
                    return c >= 0 ? Trool::TRUE : Trool::FALSE;
            }
        }
        default: {
            const Term t = term(atom);
            if (equal(t, m_true)) return Trool::TRUE;
            if (equal(t, m_false)) return Trool::FALSE;
            return Trool::MAYBE;
        }
    }
}

}  // namespace invar
