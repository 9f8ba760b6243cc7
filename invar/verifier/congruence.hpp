// Congruence closure over ground terms.
//
// Design decisions:
// - Terms are cons-hashed: equal symbols over equal argument ids share an id.
// - Binding forms are opaque constants keyed modulo bound-variable names.
// - Boolean atoms are asserted by merging them with TRUE or FALSE.
// - Two classes holding different literal values are a contradiction.
// - The structure only grows; branches of a proof search copy it.

#pragma once

#include <invar/eval/expr.hpp>
#include <invar/util/trool.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace invar {

class Congruence {
   public:
    typedef uint32_t Term;

    Congruence();

    Term term(const ExprPtr& expr);
    Term true_term() const { return m_true; }
    Term false_term() const { return m_false; }
    size_t size() const { return m_nodes.size(); }

    void merge(Term lhs, Term rhs);
    void separate(Term lhs, Term rhs);
    // lhs < rhs if strict, else lhs <= rhs.
    void order(Term lhs, Term rhs, bool strict);

    bool equal(Term lhs, Term rhs) { return find(lhs) == find(rhs); }
    bool inconsistent() const { return m_inconsistent; }

    // Truth of an atom or negated atom in the current closure.
    Trool value(const ExprPtr& atom);

   private:
    struct Node {
        std::string symbol;
        std::vector<Term> args;
        Value literal;  // none unless a literal
    };

    Term intern(const std::string& symbol, std::vector<Term> args,
                const Value& literal);
    Term find(Term term);
    bool separated(Term lhs, Term rhs);
    const Value& class_literal(Term term);
    void close();
    void check();

    std::vector<Node> m_nodes;
    std::vector<Term> m_parent;
    std::unordered_map<std::string, Term> m_index;
    std::vector<std::pair<Term, Term>> m_distinct;
    std::vector<std::pair<std::pair<Term, Term>, bool>> m_orders;
    Term m_true;
    Term m_false;
    bool m_inconsistent;
};

}  // namespace invar
