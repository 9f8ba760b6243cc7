#include <invar/engine.hpp>
#include <invar/eval/evaluator.hpp>

namespace invar {

Engine::Engine(const VerifierOptions& options) : m_options(options) {}

const VerificationReport& Engine::load_schema(const Schema& schema) {
    INVAR_ASSERT(not m_schema, "schema is already loaded");

    std::vector<std::string> errors;
    schema.validate(errors);
    if (not errors.empty()) {
        for (const auto& error : errors) {
            INVAR_WARN(error);
        }
        INVAR_ERROR("schema has " << errors.size() << " errors");
    }

    m_schema.reset(new Schema(schema));
    m_report = Verifier(*m_schema, m_options).verify();
    for (const auto& verdict : m_report.verdicts()) {
        if (verdict.kind == VerdictKind::DISPROVEN) {
            INVAR_WARN(verdict);
        }
    }
    m_executor.reset(new Executor(*m_schema, m_report));
    return m_report;
}

const Schema& Engine::schema() const {
    INVAR_ASSERT(m_schema, "no schema is loaded");
    return *m_schema;
}

Status Engine::init_state(Store& store, const State& seed) const {
    const Schema& schema = this->schema();

    for (const auto& pair : seed.bags()) {
        if (not schema.state_types().count(pair.first)) {
            return Status(ErrorCode::INVALID_SEED,
                          "unknown state variable " + pair.first);
        }
    }

    State state;
    HandleIndex handles;
    for (const auto& pair : schema.state_types()) {
        const Bag* bag = seed.find(pair.first);
        if (bag) {
            check_conforms(Value::bag(*bag), *pair.second);
            std::string error;
            if (not handles.add(*bag, error)) {
                return Status(ErrorCode::INVALID_SEED,
                              pair.first + ": " + error);
            }
            state.set(pair.first, *bag);
        } else {
            state.set(pair.first, Bag());
        }
    }

    for (const auto& invariant : schema.invariants()) {
        Env env(state);
        Value holds;
        Status status = try_eval(invariant.formula, env, holds);
        if (not status.ok()) {
            return Status(ErrorCode::INVALID_SEED,
                          invariant.name + ": " + status.message);
        }
        if (holds.kind() != Value::Kind::BOOL or not holds.as_bool()) {
            return Status(ErrorCode::INVALID_SEED,
                          "seed violates " + invariant.name);
        }
    }

    store.reset(state);
    INVAR_DEBUG("initialized store with " << state);
    return Status();
}

QueryResult Engine::run_query(const Store& store, const std::string& name,
                              const std::vector<Value>& params) const {
    const Query* query = schema().find_query(name);
    if (not query) {
        QueryResult result;
        result.status = Status(ErrorCode::NOT_FOUND, "unknown query " + name);
        return result;
    }
    return invar::run_query(*query, params, store.snapshot());
}

Status Engine::apply_operation(Store& store, const std::string& name,
                               const std::vector<Value>& params) const {
    const Operation* operation = schema().find_operation(name);
    if (not operation) {
        return Status(ErrorCode::NOT_FOUND, "unknown operation " + name);
    }
    return m_executor->apply(store, *operation, params);
}

}  // namespace invar
