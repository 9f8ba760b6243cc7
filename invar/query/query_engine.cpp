#include <algorithm>
#include <invar/eval/effects.hpp>
#include <invar/query/query_engine.hpp>

namespace invar {

namespace {

void sort_rows(const Query& query, const std::vector<Value>& params,
               const State& state, std::vector<Value>& rows) {
    std::vector<std::pair<Value, size_t>> keyed;
    keyed.reserve(rows.size());
    {
        Env env(state);
        bind_params(env, query.params, params);
        for (size_t i = 0; i < rows.size(); ++i) {
            Env::Let let(env, query.order_var, rows[i]);
            keyed.emplace_back(eval(query.order_key, env), i);
            if (keyed.back().first.kind() != keyed.front().first.kind()) {
                throw EvaluationError("sort keys of different kinds in query " +
                                      query.name);
            }
        }
    }
    const bool descending = query.descending;
    std::stable_sort(keyed.begin(), keyed.end(),
                     [descending](const std::pair<Value, size_t>& x,
                                  const std::pair<Value, size_t>& y) {
                         const int c = x.first.compare(y.first);
                         return descending ? c > 0 : c < 0;
                     });
    std::vector<Value> sorted;
    sorted.reserve(rows.size());
    for (const auto& pair : keyed) {
        sorted.push_back(rows[pair.second]);
    }
    rows.swap(sorted);
}

}  // namespace

QueryResult run_query(const Query& query, const std::vector<Value>& params,
                      const State& state) {
    QueryResult result;
    result.status = check_params(query.params, params);
    if (not result.status.ok()) {
        return result;
    }

    try {
        Env env(state);
        bind_params(env, query.params, params);
        const Value rows = eval(query.body, env);
        result.rows = rows.as_bag().items();
        if (query.order_key) {
            sort_rows(query, params, state, result.rows);
        }
    } catch (const EvaluationError& e) {
        result.status = Status(ErrorCode::EVALUATION_ERROR, e.message);
        result.rows.clear();
    }

    INVAR_DEBUG("query " << query.name << " returned " << result.rows.size()
                         << " rows");
    return result;
}

}  // namespace invar
