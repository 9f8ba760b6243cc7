#pragma once

#include <invar/model/schema.hpp>
#include <invar/query/query_engine.hpp>
#include <invar/store/executor.hpp>
#include <invar/store/store.hpp>
#include <invar/verifier/verifier.hpp>
#include <memory>

namespace invar {

// The surface handed to a front end: load a schema once, then run queries and
// operations against stores built for it.
class Engine : noncopyable {
   public:
    explicit Engine(const VerifierOptions& options = VerifierOptions());

    // Validates and verifies the schema. A malformed schema is fatal.
    const VerificationReport& load_schema(const Schema& schema);

    const Schema& schema() const;
    const VerificationReport& report() const { return m_report; }

    // Replaces the store's contents by the seed, with missing state variables
    // empty. Fails with INVALID_SEED if the seed breaks an invariant.
    Status init_state(Store& store, const State& seed = State()) const;

    QueryResult run_query(const Store& store, const std::string& name,
                          const std::vector<Value>& params) const;

    Status apply_operation(Store& store, const std::string& name,
                           const std::vector<Value>& params) const;

   private:
    const VerifierOptions m_options;
    std::unique_ptr<Schema> m_schema;
    VerificationReport m_report;
    std::unique_ptr<Executor> m_executor;
};

}  // namespace invar
