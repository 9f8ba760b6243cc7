#pragma once

#include <invar/model/schema.hpp>
#include <invar/model/state.hpp>
#include <vector>

namespace invar {

struct QueryResult {
    Status status;
    std::vector<Value> rows;
};

// Runs a query against a snapshot. Rows come in generator order, then are
// stably sorted by the declared key, if any. Never modifies the state.
QueryResult run_query(const Query& query, const std::vector<Value>& params,
                      const State& state);

}  // namespace invar
