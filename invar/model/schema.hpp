// Declarations loaded once and never modified.
//
// Design decisions:
// - Invariants and operations keep declaration order, which fixes the order
//   of verification reports.
// - An operation writes exactly the state variables its effects target.
// - Effects apply in sequence: each argument sees the state produced by the
//   effects before it.

#pragma once

#include <invar/eval/expr.hpp>
#include <invar/model/value.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace invar {

struct Param {
    std::string name;
    TypePtr type;
};

// Arity and type check of actual parameters, as PARAMETER_ERROR.
Status check_params(const std::vector<Param>& formals,
                    const std::vector<Value>& actuals);

struct Invariant {
    std::string name;
    ExprPtr formula;  // closed boolean formula over state
};

struct Effect {
    enum Kind { INSERT, REMOVE };

    Kind kind;
    std::string target;  // state variable
    ExprPtr arg;         // over parameters and state
};

const char* effect_kind_name(Effect::Kind kind);

struct Operation {
    std::string name;
    std::vector<Param> params;
    ExprPtr precondition;
    std::vector<Effect> effects;

    std::set<std::string> writes() const;
};

struct Query {
    std::string name;
    std::vector<Param> params;
    ExprPtr body;  // a comprehension

    // Optional stable sort of result rows by order_key, evaluated with the
    // row bound to order_var.
    std::string order_var;
    ExprPtr order_key;
    bool descending = false;
};

class Schema {
   public:
    void add_type(TypePtr type);
    void add_state(const std::string& name, TypePtr bag_type);
    void add_invariant(const std::string& name, ExprPtr formula);
    void add_query(Query query);
    // A null precondition means true.
    void add_operation(Operation operation);

    const std::map<std::string, TypePtr>& types() const { return types_; }
    const std::map<std::string, TypePtr>& state_types() const {
        return state_types_;
    }
    const std::vector<Invariant>& invariants() const { return invariants_; }
    const std::vector<Query>& queries() const { return queries_; }
    const std::vector<Operation>& operations() const { return operations_; }

    // Each returns nullptr if undeclared.
    const Invariant* find_invariant(const std::string& name) const;
    const Query* find_query(const std::string& name) const;
    const Operation* find_operation(const std::string& name) const;

    // Describes every malformed declaration; a valid schema adds nothing.
    void validate(std::vector<std::string>& errors) const;

   private:
    std::map<std::string, TypePtr> types_;
    std::map<std::string, TypePtr> state_types_;
    std::vector<Invariant> invariants_;
    std::vector<Query> queries_;
    std::vector<Operation> operations_;
};

}  // namespace invar
