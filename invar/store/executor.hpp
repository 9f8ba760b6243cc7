#pragma once

#include <invar/model/schema.hpp>
#include <invar/store/store.hpp>
#include <invar/verifier/verifier.hpp>
#include <map>
#include <vector>

namespace invar {

// Applies operations to a store as serializable transactions. Invariants whose
// preservation was not proven statically are re-checked after the effects,
// and a failed re-check discards the new state.
class Executor : noncopyable {
   public:
    Executor(const Schema& schema, const VerificationReport& report);

    Status apply(Store& store, const Operation& operation,
                 const std::vector<Value>& params) const;

    // Invariants re-checked after the given operation.
    const std::vector<const Invariant*>& runtime_checks(
        const std::string& operation) const {
        return map_find(m_runtime_checks, operation);
    }

   private:
    Status check_invariants(const Operation& operation,
                            const State& state) const;

    const Schema& m_schema;
    std::map<std::string, std::vector<const Invariant*>> m_runtime_checks;
};

}  // namespace invar
