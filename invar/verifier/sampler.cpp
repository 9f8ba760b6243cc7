#include <algorithm>
#include <invar/eval/effects.hpp>
#include <invar/verifier/sampler.hpp>

namespace invar {

namespace {

const size_t POOL_SIZE = 3;
const size_t MAX_STATE_BAG_SIZE = 3;
const size_t MAX_FIELD_BAG_SIZE = 2;
const long MAX_INT = 2;
const char* const STRINGS[] = {"a", "b"};

}  // namespace

Sampler::Sampler(const Schema& schema, rng_t& rng)
    : m_schema(schema), m_rng(rng), m_next_id(0) {}

void Sampler::reset() {
    m_pools.clear();
    m_building.clear();
    m_next_id = 0;
}

bool Sampler::building(const TypePtr& type) const {
    return type->kind() == TypeKind::HANDLE and m_building.count(type->name());
}

Value Sampler::sample(const TypePtr& type) {
    if (not type) {
        return Value::from_int(0);
    }
    switch (type->kind()) {
        case TypeKind::INT: {
            std::uniform_int_distribution<long> random_int(0, MAX_INT);
            return Value::from_int(random_int(m_rng));
        }
        case TypeKind::BOOL: {
            std::bernoulli_distribution random_bool(0.5);
            return Value::from_bool(random_bool(m_rng));
        }
        case TypeKind::STRING: {
            std::uniform_int_distribution<size_t> random_index(0, 1);
            return Value::from_string(STRINGS[random_index(m_rng)]);
        }
        case TypeKind::RECORD: {
            std::vector<Value> fields;
            for (const auto& field : type->fields()) {
                fields.push_back(sample(field.second));
            }
            return Value::record(type, std::move(fields));
        }
        case TypeKind::HANDLE:
            return sample_handle(type);
        case TypeKind::BAG:
            return Value::bag(sample_bag(type->element(), MAX_FIELD_BAG_SIZE));
    }
    INVAR_ERROR("unknown type kind");
}

Value Sampler::sample_handle(const TypePtr& type) {
    std::vector<Value>& pool = m_pools[type->name()];
    if (pool.empty() and not building(type)) {
        m_building.insert(type->name());
        for (size_t i = 0; i < POOL_SIZE; ++i) {
            const Value val = sample(type->val_type());
            pool.push_back(Value::handle(type, ++m_next_id, val));
        }
        m_building.erase(type->name());
    }
    INVAR_ASSERT(not pool.empty(),
                 "cannot sample handle type " << *type << " inside itself");
    std::uniform_int_distribution<size_t> random_index(0, pool.size() - 1);
    return pool[random_index(m_rng)];
}

// Handles are drawn without repetition; other values independently.
Bag Sampler::sample_bag(const TypePtr& element, size_t max_size) {
    if (building(element)) {
        return Bag();
    }
    std::uniform_int_distribution<size_t> random_size(0, max_size);
    size_t size = random_size(m_rng);
    std::vector<Value> items;
    if (element->kind() == TypeKind::HANDLE) {
        sample_handle(element);
        std::vector<Value> pool = m_pools[element->name()];
        std::shuffle(pool.begin(), pool.end(), m_rng);
        size = std::min(size, pool.size());
        items.assign(pool.begin(), pool.begin() + size);
    } else {
        for (size_t i = 0; i < size; ++i) {
            items.push_back(sample(element));
        }
    }
    return Bag(std::move(items));
}

State Sampler::sample_state() {
    State state;
    for (const auto& pair : m_schema.state_types()) {
        state.set(pair.first,
                  sample_bag(pair.second->element(), MAX_STATE_BAG_SIZE));
    }
    return state;
}

//----------------------------------------------------------------------------
// Counterexample search

static bool holds_invariants(const Schema& schema, const State& state) {
    for (const auto& invariant : schema.invariants()) {
        Env env(state);
        if (not eval_bool(invariant.formula, env)) return false;
    }
    return true;
}

bool find_counterexample(const Schema& schema, const Operation& operation,
                         const Invariant& invariant, size_t samples,
                         rng_t& rng, Counterexample& result) {
    Sampler sampler(schema, rng);
    size_t admissible = 0;
    for (size_t i = 0; i < samples; ++i) {
        sampler.reset();
        const State state = sampler.sample_state();
        std::vector<Value> params;
        for (const auto& param : operation.params) {
            params.push_back(sampler.sample(param.type));
        }

        try {
            if (not holds_invariants(schema, state)) continue;
            if (not eval_precondition(operation, params, state)) continue;
            ++admissible;
            const State post = apply_effects(schema, operation, params, state);
            Env env(post);
            if (eval_bool(invariant.formula, env)) continue;
        } catch (const EvaluationError& e) {
            INVAR_DEBUG("rejected sample: " << e.message);
            continue;
        }

        result.params.clear();
        for (size_t p = 0; p < params.size(); ++p) {
            result.params.push_back({operation.params[p].name, params[p]});
        }
        result.state = state;
        return true;
    }
    INVAR_DEBUG(operation.name << " / " << invariant.name << ": "
                               << admissible << " of " << samples
                               << " samples admissible, none failed");
    return false;
}

}  // namespace invar
