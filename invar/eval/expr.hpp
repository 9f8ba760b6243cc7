// Syntax of the comprehension language.
//
// Design decisions:
// - Expressions are immutable trees shared by pointer.
// - Comprehensions carry an ordered clause list; a generator binds its
//   variable in every later clause and in the head.
// - Quantifiers are comprehensions with a different reading of the head:
//   EXISTS ignores it, ALL tests it, UNIQUE projects it, COMPREHENSION
//   collects it into a bag.

#pragma once

#include <initializer_list>
#include <invar/model/value.hpp>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace invar {

enum class ExprKind {
    LITERAL,
    VAR,
    STATE,
    FIELD,
    MAKE_RECORD,
    NOT,
    NEG,
    AND,
    OR,
    IMPLIES,
    EQ,
    NE,
    LT,
    LE,
    GT,
    GE,
    ADD,
    SUB,
    MUL,
    IN,
    LEN,
    SUM,
    EMPTY_BAG,
    SINGLETON,
    BAG_UNION,
    BAG_DIFF,
    COMPREHENSION,
    EXISTS,
    ALL,
    UNIQUE
};
const char* expr_kind_name(ExprKind kind);

struct Expr;
typedef std::shared_ptr<const Expr> ExprPtr;

struct Clause {
    enum Kind { GENERATOR, FILTER };

    Kind kind;
    std::string var;  // GENERATOR only
    ExprPtr expr;     // source bag, or filter condition
};

struct Expr {
    ExprKind kind;
    Value literal;                   // LITERAL
    std::string name;                // VAR, STATE, FIELD
    std::vector<ExprPtr> args;       // operands; a comprehension's head
    std::vector<std::string> names;  // MAKE_RECORD field names
    std::vector<Clause> clauses;     // comprehensions

    explicit Expr(ExprKind k) : kind(k) {}

    bool is_comprehension() const {
        return kind == ExprKind::COMPREHENSION or kind == ExprKind::EXISTS or
               kind == ExprKind::ALL or kind == ExprKind::UNIQUE;
    }
    const ExprPtr& head() const { return args.at(0); }
};

std::ostream& operator<<(std::ostream& os, const Expr& expr);
std::string print_expr(const ExprPtr& expr);

//----------------------------------------------------------------------------
// Construction

namespace dsl {

ExprPtr lit(const Value& value);
ExprPtr int_lit(long value);
ExprPtr bool_lit(bool value);
ExprPtr str_lit(const std::string& value);
ExprPtr var(const std::string& name);
ExprPtr state(const std::string& name);
ExprPtr dot(ExprPtr expr, const std::string& field);
ExprPtr record(std::vector<std::pair<std::string, ExprPtr>> fields);

ExprPtr not_(ExprPtr arg);
ExprPtr neg(ExprPtr arg);
ExprPtr and_(ExprPtr lhs, ExprPtr rhs);
ExprPtr and_(const std::vector<ExprPtr>& args);  // true if empty
ExprPtr or_(ExprPtr lhs, ExprPtr rhs);
ExprPtr or_(const std::vector<ExprPtr>& args);  // false if empty
ExprPtr implies(ExprPtr lhs, ExprPtr rhs);
ExprPtr eq(ExprPtr lhs, ExprPtr rhs);
ExprPtr ne(ExprPtr lhs, ExprPtr rhs);
ExprPtr lt(ExprPtr lhs, ExprPtr rhs);
ExprPtr le(ExprPtr lhs, ExprPtr rhs);
ExprPtr gt(ExprPtr lhs, ExprPtr rhs);
ExprPtr ge(ExprPtr lhs, ExprPtr rhs);
ExprPtr add(ExprPtr lhs, ExprPtr rhs);
ExprPtr sub(ExprPtr lhs, ExprPtr rhs);
ExprPtr mul(ExprPtr lhs, ExprPtr rhs);
ExprPtr in(ExprPtr elem, ExprPtr bag);
ExprPtr len(ExprPtr bag);
ExprPtr sum(ExprPtr bag);

ExprPtr empty_bag();
ExprPtr singleton(ExprPtr elem);
ExprPtr bag_union(ExprPtr lhs, ExprPtr rhs);
ExprPtr bag_diff(ExprPtr lhs, ExprPtr rhs);

Clause gen(const std::string& var, ExprPtr source);
Clause filter(ExprPtr cond);
ExprPtr comprehension(ExprPtr head, std::vector<Clause> clauses);
ExprPtr exists(ExprPtr head, std::vector<Clause> clauses);
ExprPtr all(ExprPtr cond, std::vector<Clause> clauses);
ExprPtr unique(ExprPtr head, std::vector<Clause> clauses);

}  // namespace dsl

// Generic node builders, used when rebuilding trees.
ExprPtr make_unary(ExprKind kind, ExprPtr arg);
ExprPtr make_binary(ExprKind kind, ExprPtr lhs, ExprPtr rhs);
ExprPtr make_comprehension(ExprKind kind, ExprPtr head,
                           std::vector<Clause> clauses);
ExprPtr with_args(const ExprPtr& expr, std::vector<ExprPtr> args);

//----------------------------------------------------------------------------
// Analysis and rewriting

std::string fresh_name(const std::string& base);

std::set<std::string> free_vars(const ExprPtr& expr);
std::set<std::string> state_vars(const ExprPtr& expr);

// Capture-avoiding substitution.
ExprPtr substitute(const ExprPtr& expr, const std::string& var,
                   const ExprPtr& value);
ExprPtr substitute_state(const ExprPtr& expr, const std::string& name,
                         const ExprPtr& value);

// Renames every bound variable to a fresh name.
ExprPtr freshen(const ExprPtr& expr);

bool alpha_equivalent(const ExprPtr& lhs, const ExprPtr& rhs);

// Equal for alpha-equivalent expressions, different otherwise.
std::string canonical_key(const ExprPtr& expr);

}  // namespace invar
