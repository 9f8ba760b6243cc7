#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <invar/util/util.hpp>
#include <invar/util/worker_pool.hpp>

namespace invar {
namespace {

void test_pool(size_t thread_count, size_t max_duration) {
    INVAR_INFO("Testing pool of " << thread_count << " threads "
                                  << "with tasks taking up to "
                                  << max_duration << "ms");
    std::atomic<uint_fast64_t> counter(0);
    {
        WorkerPool pool(thread_count);
        for (size_t duration = 0; duration <= max_duration; ++duration) {
            pool.schedule([duration, &counter] {
                std::this_thread::sleep_for(
                    std::chrono::milliseconds(duration));
                ++counter;
            });
        }
    }
    EXPECT_EQ(counter.load(), 1 + max_duration);
}

TEST(WorkerPoolTest, RunsEveryTaskOnce) {
    test_pool(1, 20);
    test_pool(10, 100);
    test_pool(10, 20);
}

TEST(WorkerPoolTest, IdleWorkersWakeForLateTasks) {
    std::atomic<size_t> counter(0);
    {
        WorkerPool pool(4);
        // Let every worker go idle first.
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        for (size_t i = 0; i < 10; ++i) {
            pool.schedule([&counter] { ++counter; });
        }
    }
    EXPECT_EQ(counter.load(), 10UL);
}

TEST(WorkerPoolTest, IdlePoolStops) {
    WorkerPool pool(4);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
}

}  // namespace
}  // namespace invar
