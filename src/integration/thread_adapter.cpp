/**
 * @file thread_adapter.cpp
 * @brief thread_system pool for C-MOVE sub-association jobs
 */

#include <dul/integration/thread_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>

#include <mutex>
#include <stdexcept>

namespace dul::integration {

namespace {

constexpr const char* pool_name = "dul_move_jobs";

struct pool_state {
    std::mutex mutex;
    std::shared_ptr<kcenon::thread::thread_pool> pool;
};

auto state() -> pool_state& {
    static pool_state instance;
    return instance;
}

/// Requires state().mutex
auto start_pool(pool_state& s) -> bool {
    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < thread_adapter::worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        if (!pool->enqueue(std::move(worker))) {
            return false;
        }
    }
    if (!pool->start()) {
        return false;
    }
    s.pool = std::move(pool);
    return true;
}

}  // namespace

void thread_adapter::enqueue(std::function<void()> job) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if ((!s.pool || !s.pool->is_running()) && !start_pool(s)) {
        throw std::runtime_error("Cannot start the move job pool");
    }
    if (!s.pool->submit_task(std::move(job))) {
        throw std::runtime_error("Move job pool refused the job");
    }
}

void thread_adapter::shutdown() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.pool) {
        s.pool->stop(false);
        s.pool.reset();
    }
}

auto thread_adapter::running_workers() -> std::size_t {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.pool && s.pool->is_running() ? s.pool->get_thread_count() : 0;
}

}  // namespace dul::integration
