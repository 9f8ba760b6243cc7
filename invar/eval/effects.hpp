#pragma once

#include <invar/eval/evaluator.hpp>
#include <invar/model/schema.hpp>
#include <vector>

namespace invar {

// Binds an operation's or query's formal parameters, in order.
void bind_params(Env& env, const std::vector<Param>& formals,
                 const std::vector<Value>& actuals);

// These throw EvaluationError.
bool eval_precondition(const Operation& operation,
                       const std::vector<Value>& params, const State& state);

// Applies effects in sequence to a copy of the state. Each inserted value
// must conform to the element type of its target.
State apply_effects(const Schema& schema, const Operation& operation,
                    const std::vector<Value>& params, const State& state);

}  // namespace invar
