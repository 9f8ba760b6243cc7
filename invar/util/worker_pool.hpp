#pragma once

#include <tbb/concurrent_queue.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <invar/util/util.hpp>
#include <mutex>
#include <thread>
#include <vector>

namespace invar {

// Runs scheduled tasks on a fixed set of threads. The destructor drains the
// queue before joining, so every scheduled task runs exactly once.
class WorkerPool : noncopyable {
    typedef std::function<void()> Task;

    std::atomic<bool> m_accepting;
    tbb::concurrent_queue<Task> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_condition;
    std::vector<std::thread> m_pool;

   public:
    explicit WorkerPool(size_t thread_count) : m_accepting(true) {
        INVAR_ASSERT_LT(0UL, thread_count);
        INVAR_DEBUG("Starting pool of " << thread_count << " workers");
        for (size_t i = 0; i < thread_count; ++i) {
            m_pool.push_back(std::thread([this]() { this->do_work(); }));
        }
    }

    ~WorkerPool() {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_accepting.store(false);
        }
        m_condition.notify_all();
        for (auto& worker : m_pool) {
            worker.join();
        }
        INVAR_DEBUG("Stopped pool of " << m_pool.size() << " workers");
    }

    void schedule(Task&& task) {
        INVAR_ASSERT(m_accepting.load(), "pool is not accepting tasks");
        m_queue.push(std::move(task));
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.notify_one();
    }

   private:
    void do_work() {
        while (true) {
            Task task;
            if (m_queue.try_pop(task)) {
                task();
                continue;
            }
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, [this]() {
                return not m_queue.empty() or not m_accepting.load();
            });
            if (m_queue.empty()) {
                return;
            }
        }
    }
};

}  // namespace invar
