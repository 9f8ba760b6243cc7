#pragma once

#include <invar/model/schema.hpp>
#include <invar/model/state.hpp>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace invar {

// Draws small values by type. Handles come from a per-sample pool, so the
// same identity always carries the same val, as in every state the store
// accepts.
class Sampler : noncopyable {
   public:
    Sampler(const Schema& schema, rng_t& rng);

    // Starts a new sample, redrawing every handle pool.
    void reset();

    Value sample(const TypePtr& type);
    State sample_state();

   private:
    Value sample_handle(const TypePtr& type);
    Bag sample_bag(const TypePtr& element, size_t max_size);
    bool building(const TypePtr& type) const;

    const Schema& m_schema;
    rng_t& m_rng;
    std::map<std::string, std::vector<Value>> m_pools;
    std::set<std::string> m_building;
    uint64_t m_next_id;
};

struct Counterexample {
    std::vector<std::pair<std::string, Value>> params;
    State state;
};

// Searches for parameters and a state satisfying every invariant and the
// precondition, from which the operation breaks the given invariant.
bool find_counterexample(const Schema& schema, const Operation& operation,
                         const Invariant& invariant, size_t samples,
                         rng_t& rng, Counterexample& result);

}  // namespace invar
