#include <invar/eval/effects.hpp>

namespace invar {

void bind_params(Env& env, const std::vector<Param>& formals,
                 const std::vector<Value>& actuals) {
    INVAR_ASSERT_EQ(formals.size(), actuals.size());
    for (size_t i = 0; i < formals.size(); ++i) {
        env.push(formals[i].name, actuals[i]);
    }
}

bool eval_precondition(const Operation& operation,
                       const std::vector<Value>& params, const State& state) {
    Env env(state);
    bind_params(env, operation.params, params);
    return eval_bool(operation.precondition, env);
}

State apply_effects(const Schema& schema, const Operation& operation,
                    const std::vector<Value>& params, const State& state) {
    State result = state;
    for (const auto& effect : operation.effects) {
        Value arg;
        {
            Env env(result);
            bind_params(env, operation.params, params);
            arg = eval(effect.arg, env);
        }
        const TypePtr& bag_type = map_find(schema.state_types(), effect.target);
        std::string error;
        if (not conforms(arg, *bag_type->element(), error)) {
            throw EvaluationError(std::string(effect_kind_name(effect.kind)) +
                                  " into " + effect.target + ": " + error);
        }
        const Bag* bag = result.find(effect.target);
        const Bag current = bag ? *bag : Bag();
        switch (effect.kind) {
            case Effect::INSERT:
                result.set(effect.target, current.insert(arg));
                break;
            case Effect::REMOVE:
                result.set(effect.target, current.remove(arg));
                break;
        }
    }
    return result;
}

}  // namespace invar
