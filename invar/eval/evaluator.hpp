#pragma once

#include <invar/eval/expr.hpp>
#include <invar/model/state.hpp>
#include <string>
#include <utility>
#include <vector>

namespace invar {

// Variable bindings over a fixed state. Inner bindings shadow outer ones.
class Env : noncopyable {
   public:
    explicit Env(const State& state) : state_(state) {}

    const State& state() const { return state_; }

    void push(const std::string& name, const Value& value) {
        bindings_.emplace_back(name, value);
    }
    void pop() { bindings_.pop_back(); }

    const Value* find(const std::string& name) const {
        for (auto i = bindings_.rbegin(); i != bindings_.rend(); ++i) {
            if (i->first == name) return &i->second;
        }
        return nullptr;
    }

    // Scoped binding, popped on destruction.
    class Let : noncopyable {
       public:
        Let(Env& env, const std::string& name, const Value& value)
            : env_(env) {
            env_.push(name, value);
        }
        ~Let() { env_.pop(); }

       private:
        Env& env_;
    };

   private:
    const State& state_;
    std::vector<std::pair<std::string, Value>> bindings_;
};

// Evaluation is pure: it never modifies the state.
// These throw EvaluationError.
Value eval(const ExprPtr& expr, Env& env);
bool eval_bool(const ExprPtr& expr, Env& env);

// Non-throwing wrapper for callers that report errors as values.
Status try_eval(const ExprPtr& expr, Env& env, Value& result);

}  // namespace invar
