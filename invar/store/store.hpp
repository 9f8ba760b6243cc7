#pragma once

#include <atomic>
#include <invar/model/state.hpp>
#include <invar/util/threading.hpp>

namespace invar {

class Executor;

// Owns the authoritative state. Writers hold the exclusive lock for a whole
// check-apply-commit sequence; readers copy a snapshot under the shared lock
// and evaluate outside it.
class Store : noncopyable {
   public:
    Store() : m_next_id(0), m_version(0) {}

    State snapshot() const {
        SharedMutex::SharedLock lock(m_mutex);
        return m_state;
    }

    // Number of committed changes, including resets.
    uint64_t version() const { return m_version.load(); }

    // Fresh identities never collide with any handle the store has held.
    uint64_t new_id() { return ++m_next_id; }
    Value new_handle(const TypePtr& type, const Value& val) {
        return Value::handle(type, new_id(), val);
    }

    // The state's handles must agree on their vals.
    void reset(const State& state);

   private:
    friend class Executor;

    // Requires the exclusive lock.
    void commit(State& state, const HandleIndex& added);
    void reserve_ids(uint64_t max_id);

    mutable SharedMutex m_mutex;
    State m_state;
    HandleIndex m_handles;  // every identity held since the last reset
    std::atomic<uint64_t> m_next_id;
    std::atomic<uint64_t> m_version;
};

}  // namespace invar
