/**
 * @file accept_worker.hpp
 * @brief Worker thread that accepts TCP connections for dicom_server
 *
 * Built on thread_system's thread_base. Each do_work() waits up to the poll
 * interval for one connection on the server's listener and hands it to the
 * connection callback; the maintenance callback runs after every wait.
 *
 * @see dicom_server
 */

#ifndef DUL_NETWORK_DETAIL_ACCEPT_WORKER_HPP
#define DUL_NETWORK_DETAIL_ACCEPT_WORKER_HPP

#include "dul/network/transport.hpp"

#include <kcenon/thread/core/thread_base.h>
#include <kcenon/common/patterns/result.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace dul::network::detail {

namespace common = kcenon::common;

/**
 * @brief Accept loop of a dicom_server
 *
 * The listener is owned by the server and must outlive the worker.
 */
class accept_worker : public kcenon::thread::thread_base {
public:
    // =========================================================================
    // Type Aliases
    // =========================================================================

    using result_void = common::VoidResult;

    /// Invoked on the worker thread for each accepted connection
    using connection_callback = std::function<void(std::unique_ptr<tcp_transport>)>;

    /// Callback type for periodic maintenance tasks
    using maintenance_callback = std::function<void()>;

    // =========================================================================
    // Construction / Destruction
    // =========================================================================

    /**
     * @param listener Listening socket, already bound
     * @param on_connection Receives each accepted connection
     * @param on_maintenance Optional periodic task (reaping finished sessions)
     */
    accept_worker(tcp_listener& listener,
                  connection_callback on_connection,
                  maintenance_callback on_maintenance = nullptr);

    ~accept_worker() override;

    // Non-copyable, non-movable (owns thread resources)
    accept_worker(const accept_worker&) = delete;
    accept_worker& operator=(const accept_worker&) = delete;
    accept_worker(accept_worker&&) = delete;
    accept_worker& operator=(accept_worker&&) = delete;

    // =========================================================================
    // Configuration / Status
    // =========================================================================

    /// How long one do_work() waits for a connection
    void set_poll_interval(std::chrono::milliseconds interval) noexcept {
        poll_interval_ = interval;
    }

    [[nodiscard]] bool is_accepting() const noexcept;

    /// Connections handed to the callback so far
    [[nodiscard]] auto accepted_count() const noexcept -> uint64_t {
        return accepted_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::string to_string() const override;

protected:
    // =========================================================================
    // thread_base Overrides
    // =========================================================================

    result_void before_start() override;

    /**
     * @brief Accept at most one connection, then run maintenance
     *
     * Accept failures are logged and retried on the next call.
     */
    result_void do_work() override;

    result_void after_stop() override;

    /// Keeps do_work() running back to back until stop is requested
    [[nodiscard]] bool should_continue_work() const override;

    void on_stop_requested() override;

private:
    tcp_listener& listener_;
    connection_callback on_connection_;
    maintenance_callback on_maintenance_;
    std::chrono::milliseconds poll_interval_{100};
    std::atomic<uint64_t> accepted_{0};
    std::atomic<bool> accepting_{false};
};

}  // namespace dul::network::detail

#endif  // DUL_NETWORK_DETAIL_ACCEPT_WORKER_HPP
