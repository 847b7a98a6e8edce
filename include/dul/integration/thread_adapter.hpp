/**
 * @file thread_adapter.hpp
 * @brief thread_system pool for C-MOVE sub-association jobs
 *
 * Association workers own a dedicated thread each. A C-MOVE additionally
 * needs a second association to the move destination, driven while the
 * originating association keeps reporting progress and watching for
 * C-CANCEL. That job runs on this pool.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>

namespace dul::integration {

/**
 * @class thread_adapter
 * @brief Static facade over one kcenon::thread::thread_pool
 *
 * The pool starts on the first submission and again after shutdown().
 * All public methods are thread-safe.
 *
 * @code
 * auto job = thread_adapter::submit([=] { run_move_job(...); });
 * while (job.wait_for(interval) != std::future_status::ready) {
 *     report_progress();
 * }
 * job.get();
 * @endcode
 */
class thread_adapter {
public:
    /// Workers started with the pool, so concurrent moves are bounded
    static constexpr std::size_t worker_count = 4;

    /**
     * @brief Queue a job and get a future for its result
     *
     * Exceptions thrown by the job are captured in the future.
     *
     * @throws std::runtime_error if the pool cannot be started or refuses the job
     */
    template <typename F>
    [[nodiscard]] static auto submit(F&& job)
        -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    /// Stop the pool once queued jobs have run
    static void shutdown();

    /// Workers of the running pool, 0 when stopped
    [[nodiscard]] static auto running_workers() -> std::size_t;

    thread_adapter() = delete;

private:
    static void enqueue(std::function<void()> job);
};

template <typename F>
auto thread_adapter::submit(F&& job)
    -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using return_type = std::invoke_result_t<std::decay_t<F>>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(job));
    auto future = task->get_future();
    enqueue([task]() { (*task)(); });
    return future;
}

}  // namespace dul::integration
