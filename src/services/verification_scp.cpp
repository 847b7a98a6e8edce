/**
 * @file verification_scp.cpp
 * @brief Implementation of the Verification SCP service
 */

#include "dul/services/verification_scp.hpp"

#include "dul/core/uid_registry.hpp"
#include "dul/integration/logger_adapter.hpp"
#include "dul/network/dimse/command_field.hpp"

namespace dul::services {

std::vector<std::string> verification_scp::supported_sop_classes() const {
    return {std::string(core::uids::verification)};
}

network::dimse::status_code verification_scp::handle_request(network::request_context& ctx) {
    using namespace network::dimse;

    if (ctx.request().command() != command_field::c_echo_rq) {
        integration::logger_adapter::warn("Expected C-ECHO-RQ but received {}",
                                          to_string(ctx.request().command()));
        return status_error_unrecognized_operation;
    }

    echo_count_.fetch_add(1, std::memory_order_relaxed);
    return status_success;
}

std::string_view verification_scp::service_name() const noexcept {
    return "Verification SCP";
}

auto verification_scp::echo_count() const noexcept -> uint64_t {
    return echo_count_.load(std::memory_order_relaxed);
}

}  // namespace dul::services
