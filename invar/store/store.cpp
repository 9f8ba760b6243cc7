#include <invar/store/store.hpp>

namespace invar {

void Store::reserve_ids(uint64_t max_id) {
    uint64_t next_id = m_next_id.load();
    while (next_id < max_id and
           not m_next_id.compare_exchange_weak(next_id, max_id)) {
    }
}

void Store::reset(const State& state) {
    HandleIndex handles;
    for (const auto& pair : state.bags()) {
        std::string error;
        if (not handles.add(pair.second, error)) {
            INVAR_ERROR("inconsistent handles in " << pair.first << ": "
                                                   << error);
        }
    }

    SharedMutex::UniqueLock lock(m_mutex);
    m_state = state;
    m_handles = std::move(handles);
    reserve_ids(m_handles.max_id());
    ++m_version;
}

void Store::commit(State& state, const HandleIndex& added) {
    std::swap(m_state, state);
    m_handles.merge(added);
    reserve_ids(added.max_id());
    ++m_version;
}

}  // namespace invar
