/**
 * @file association_worker.cpp
 * @brief Implementation of the association_worker class
 */

#include "dul/network/detail/association_worker.hpp"

#include "dul/integration/logger_adapter.hpp"

#include <exception>
#include <sstream>

namespace dul::network::detail {

using integration::logger_adapter;

association_worker::association_worker(uint64_t session_id, session_function session)
    : thread_base("association_worker")
    , session_id_(session_id)
    , session_(std::move(session)) {
}

association_worker::~association_worker() {
    if (is_running()) {
        stop();
    }
}

std::string association_worker::to_string() const {
    std::ostringstream oss;
    oss << "association_worker{"
        << "session=" << session_id_
        << ", done=" << (is_done() ? "true" : "false")
        << ", running=" << (is_running() ? "true" : "false")
        << "}";
    return oss.str();
}

association_worker::result_void association_worker::do_work() {
    if (is_done()) {
        return {};
    }

    try {
        if (session_) {
            session_();
        }
    } catch (const std::exception& e) {
        logger_adapter::error("Session {} terminated: {}", session_id_, e.what());
    } catch (...) {
        logger_adapter::error("Session {} terminated by a non-standard exception", session_id_);
    }

    done_.store(true, std::memory_order_release);
    return {};
}

bool association_worker::should_continue_work() const {
    return !is_done();
}

}  // namespace dul::network::detail
