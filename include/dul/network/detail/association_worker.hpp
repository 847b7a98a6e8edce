/**
 * @file association_worker.hpp
 * @brief Dedicated thread for one association of a dicom_server
 */

#ifndef DUL_NETWORK_DETAIL_ASSOCIATION_WORKER_HPP
#define DUL_NETWORK_DETAIL_ASSOCIATION_WORKER_HPP

#include <kcenon/thread/core/thread_base.h>
#include <kcenon/common/patterns/result.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace dul::network::detail {

namespace common = kcenon::common;

/**
 * @brief Runs one association session to completion on its own thread
 *
 * The first do_work() runs the whole session; the worker is done
 * afterwards and idles until the server stops it.
 */
class association_worker : public kcenon::thread::thread_base {
public:
    using result_void = common::VoidResult;
    using session_function = std::function<void()>;

    association_worker(uint64_t session_id, session_function session);
    ~association_worker() override;

    association_worker(const association_worker&) = delete;
    association_worker& operator=(const association_worker&) = delete;

    [[nodiscard]] auto session_id() const noexcept -> uint64_t { return session_id_; }

    /// true once the session function returned
    [[nodiscard]] bool is_done() const noexcept {
        return done_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::string to_string() const override;

protected:
    result_void do_work() override;
    [[nodiscard]] bool should_continue_work() const override;

private:
    uint64_t session_id_;
    session_function session_;
    std::atomic<bool> done_{false};
};

}  // namespace dul::network::detail

#endif  // DUL_NETWORK_DETAIL_ASSOCIATION_WORKER_HPP
