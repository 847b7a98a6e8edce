/**
 * @file accept_worker.cpp
 * @brief Implementation of the accept_worker class
 */

#include "dul/network/detail/accept_worker.hpp"

#include "dul/integration/logger_adapter.hpp"

#include <sstream>

namespace dul::network::detail {

using integration::logger_adapter;

// =============================================================================
// Construction / Destruction
// =============================================================================

accept_worker::accept_worker(
    tcp_listener& listener,
    connection_callback on_connection,
    maintenance_callback on_maintenance)
    : thread_base("accept_worker")
    , listener_(listener)
    , on_connection_(std::move(on_connection))
    , on_maintenance_(std::move(on_maintenance)) {
}

accept_worker::~accept_worker() {
    if (is_running()) {
        stop();
    }
}

// =============================================================================
// Status
// =============================================================================

bool accept_worker::is_accepting() const noexcept {
    return accepting_.load(std::memory_order_acquire);
}

std::string accept_worker::to_string() const {
    std::ostringstream oss;
    oss << "accept_worker{"
        << "port=" << listener_.local_port()
        << ", accepting=" << (is_accepting() ? "true" : "false")
        << ", running=" << (is_running() ? "true" : "false")
        << ", accepted=" << accepted_count()
        << "}";
    return oss.str();
}

// =============================================================================
// thread_base Overrides
// =============================================================================

accept_worker::result_void accept_worker::before_start() {
    if (!listener_.is_listening()) {
        return common::VoidResult(common::error_info{
            -1, "Listener is not bound", "accept_worker"});
    }
    accepting_.store(true, std::memory_order_release);
    return {};
}

accept_worker::result_void accept_worker::do_work() {
    if (!is_accepting()) {
        return {};
    }

    auto accepted = listener_.accept(poll_interval_);
    if (accepted.is_err()) {
        logger_adapter::warn("Accept on port {} failed: {}", listener_.local_port(),
                             accepted.error().message);
    } else if (accepted.value()) {
        accepted_.fetch_add(1, std::memory_order_relaxed);
        logger_adapter::debug("Connection from {}", accepted.value()->remote_address());
        if (on_connection_) {
            on_connection_(std::move(accepted.value()));
        }
    }

    if (on_maintenance_) {
        on_maintenance_();
    }
    return {};
}

accept_worker::result_void accept_worker::after_stop() {
    accepting_.store(false, std::memory_order_release);
    return {};
}

bool accept_worker::should_continue_work() const {
    return is_accepting();
}

void accept_worker::on_stop_requested() {
    accepting_.store(false, std::memory_order_release);
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    shutdown_cv_.notify_all();
}

}  // namespace dul::network::detail
