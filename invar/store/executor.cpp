#include <invar/eval/effects.hpp>
#include <invar/store/executor.hpp>

namespace invar {

Executor::Executor(const Schema& schema, const VerificationReport& report)
    : m_schema(schema) {
    for (const auto& operation : schema.operations()) {
        auto& checks = m_runtime_checks[operation.name];
        for (const auto& name : report.unproven(operation.name)) {
            const Invariant* invariant = schema.find_invariant(name);
            INVAR_ASSERT(invariant, "unknown invariant " << name);
            checks.push_back(invariant);
        }
        if (not checks.empty()) {
            INVAR_DEBUG(operation.name << " re-checks " << checks.size()
                                       << " invariants at runtime");
        }
    }
}

Status Executor::check_invariants(const Operation& operation,
                                  const State& state) const {
    for (const Invariant* invariant : runtime_checks(operation.name)) {
        Env env(state);
        Value holds;
        Status status = try_eval(invariant->formula, env, holds);
        if (not status.ok()) {
            return Status(ErrorCode::INVARIANT_VIOLATED_AT_RUNTIME,
                          invariant->name + ": " + status.message);
        }
        if (holds.kind() != Value::Kind::BOOL or not holds.as_bool()) {
            return Status(ErrorCode::INVARIANT_VIOLATED_AT_RUNTIME,
                          operation.name + " broke " + invariant->name);
        }
    }
    return Status();
}

Status Executor::apply(Store& store, const Operation& operation,
                       const std::vector<Value>& params) const {
    Status status = check_params(operation.params, params);
    if (not status.ok()) {
        return status;
    }

    // Handles in params must carry the vals their identities already carry.
    HandleIndex added;
    std::string error;
    for (const auto& param : params) {
        if (not added.add(param, error)) {
            return Status(ErrorCode::PARAMETER_ERROR, error);
        }
    }

    SharedMutex::UniqueLock lock(store.m_mutex);

    if (not store.m_handles.agrees(added, error)) {
        return Status(ErrorCode::PARAMETER_ERROR, error);
    }

    State next;
    try {
        if (not eval_precondition(operation, params, store.m_state)) {
            return Status(ErrorCode::PRECONDITION_VIOLATION,
                          operation.name + " precondition is false");
        }
        next = apply_effects(m_schema, operation, params, store.m_state);
    } catch (const EvaluationError& e) {
        return Status(ErrorCode::EVALUATION_ERROR, e.message);
    }

    status = check_invariants(operation, next);
    if (not status.ok()) {
        INVAR_WARN("rolled back " << operation.name << ": " << status.message);
        return status;
    }

    store.commit(next, added);
    return Status();
}

}  // namespace invar
