/**
 * @file events.cpp
 * @brief event_dispatcher implementation
 */

#include "dul/network/events.hpp"

#include "dul/integration/logger_adapter.hpp"

#include <algorithm>
#include <exception>

namespace dul::network {

using integration::logger_adapter;

auto request_event_for(dimse::command_field cmd) noexcept -> std::optional<event_type> {
    using dimse::command_field;
    switch (cmd) {
        case command_field::c_echo_rq: return event_type::c_echo;
        case command_field::c_store_rq: return event_type::c_store;
        case command_field::c_find_rq: return event_type::c_find;
        case command_field::c_get_rq: return event_type::c_get;
        case command_field::c_move_rq: return event_type::c_move;
        case command_field::n_event_report_rq: return event_type::n_event_report;
        case command_field::n_get_rq: return event_type::n_get;
        case command_field::n_set_rq: return event_type::n_set;
        case command_field::n_action_rq: return event_type::n_action;
        case command_field::n_create_rq: return event_type::n_create;
        case command_field::n_delete_rq: return event_type::n_delete;
        default: return std::nullopt;
    }
}

auto to_string(event_type type) noexcept -> std::string_view {
    switch (type) {
        case event_type::association_requested: return "association-requested";
        case event_type::association_accepted: return "association-accepted";
        case event_type::association_rejected: return "association-rejected";
        case event_type::association_established: return "association-established";
        case event_type::association_released: return "association-released";
        case event_type::association_aborted: return "association-aborted";
        case event_type::connection_opened: return "connection-opened";
        case event_type::connection_closed: return "connection-closed";
        case event_type::pdu_sent: return "pdu-sent";
        case event_type::pdu_received: return "pdu-received";
        case event_type::state_transition: return "state-transition";
        case event_type::dimse_sent: return "dimse-sent";
        case event_type::dimse_received: return "dimse-received";
        case event_type::c_echo: return "C-ECHO";
        case event_type::c_store: return "C-STORE";
        case event_type::c_find: return "C-FIND";
        case event_type::c_get: return "C-GET";
        case event_type::c_move: return "C-MOVE";
        case event_type::n_event_report: return "N-EVENT-REPORT";
        case event_type::n_get: return "N-GET";
        case event_type::n_set: return "N-SET";
        case event_type::n_action: return "N-ACTION";
        case event_type::n_create: return "N-CREATE";
        case event_type::n_delete: return "N-DELETE";
    }
    return "unknown";
}

// =============================================================================
// Registration
// =============================================================================

auto event_dispatcher::subscribe(event_type type, event_callback callback) -> subscription_id {
    std::lock_guard lock(mutex_);
    auto id = next_id_++;
    subscriptions_.push_back({id, type, std::move(callback)});
    return id;
}

bool event_dispatcher::unsubscribe(subscription_id id) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [id](const subscription& s) { return s.id == id; });
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

VoidResult event_dispatcher::set_request_handler(event_type type, request_handler handler) {
    if (!is_request_event(type)) {
        return dul_void_error(error_codes::invalid_argument,
                              "Not a request event", std::string(to_string(type)));
    }
    std::lock_guard lock(mutex_);
    handlers_[type] = std::move(handler);
    return {};
}

void event_dispatcher::clear_request_handler(event_type type) {
    std::lock_guard lock(mutex_);
    handlers_.erase(type);
}

auto event_dispatcher::request_handler_for(event_type type) const -> request_handler {
    std::lock_guard lock(mutex_);
    auto it = handlers_.find(type);
    return it == handlers_.end() ? request_handler{} : it->second;
}

bool event_dispatcher::has_subscribers(event_type type) const {
    std::lock_guard lock(mutex_);
    return std::any_of(subscriptions_.begin(), subscriptions_.end(),
                       [type](const subscription& s) { return s.type == type; });
}

// =============================================================================
// Publication
// =============================================================================

void event_dispatcher::publish(const association_event& event) const {
    std::vector<event_callback> callbacks;
    {
        std::lock_guard lock(mutex_);
        for (const auto& s : subscriptions_) {
            if (s.type == event.type) {
                callbacks.push_back(s.callback);
            }
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            logger_adapter::error("Event callback for {} threw: {}",
                                  to_string(event.type), e.what());
        }
    }
}

}  // namespace dul::network
