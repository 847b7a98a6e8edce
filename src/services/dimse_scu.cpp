/**
 * @file dimse_scu.cpp
 * @brief Implementation of the DIMSE requestor helpers
 */

#include "dul/services/dimse_scu.hpp"

#include "dul/core/uid_registry.hpp"
#include "dul/integration/logger_adapter.hpp"
#include "dul/network/association.hpp"
#include "dul/network/dimse/command_field.hpp"

#include <exception>

namespace dul::services {

using integration::logger_adapter;
using namespace network::dimse;

namespace {

[[nodiscard]] auto response_command_for(command_field request) -> command_field {
    return static_cast<command_field>(static_cast<uint16_t>(request) | 0x8000);
}

[[nodiscard]] auto counters_of(const dimse_message& rsp) -> network::subop_counters {
    network::subop_counters counters;
    counters.remaining = rsp.remaining_subops().value_or(0);
    counters.completed = rsp.completed_subops().value_or(0);
    counters.failed = rsp.failed_subops().value_or(0);
    counters.warning = rsp.warning_subops().value_or(0);
    return counters;
}

}  // namespace

dimse_scu::dimse_scu(const dimse_scu_config& config)
    : config_(config) {
}

size_t dimse_scu::requests_sent() const noexcept {
    return requests_sent_.load(std::memory_order_relaxed);
}

// =============================================================================
// DIMSE-C
// =============================================================================

auto dimse_scu::echo(network::association& assoc) -> Result<status_code> {
    auto context_id = context_for(assoc, core::uids::verification);
    if (context_id.is_err()) {
        return context_id.error();
    }

    const auto message_id = assoc.next_message_id();
    auto sent = send(assoc, context_id.value(), make_c_echo_rq(message_id));
    if (sent.is_err()) {
        return sent.error();
    }

    auto rsp = assoc.receive_response(message_id, response_timeout(assoc));
    if (rsp.is_err()) {
        return rsp.error();
    }
    return rsp.value().message.status();
}

auto dimse_scu::store(network::association& assoc,
                      std::string_view sop_class_uid,
                      std::string_view sop_instance_uid,
                      std::string_view transfer_syntax,
                      std::vector<uint8_t> dataset) -> Result<status_code> {
    auto context_id = context_for(assoc, sop_class_uid, transfer_syntax);
    if (context_id.is_err()) {
        return context_id.error();
    }

    const auto message_id = assoc.next_message_id();
    auto rq = make_c_store_rq(message_id, sop_class_uid, sop_instance_uid, config_.priority);
    rq.set_dataset(std::move(dataset));

    auto sent = send(assoc, context_id.value(), rq);
    if (sent.is_err()) {
        return sent.error();
    }

    auto rsp = assoc.receive_response(message_id, response_timeout(assoc));
    if (rsp.is_err()) {
        return rsp.error();
    }

    const auto status = rsp.value().message.status();
    logger_adapter::debug("C-STORE {} -> 0x{:04X}", sop_instance_uid, status);
    return status;
}

auto dimse_scu::find(network::association& assoc,
                     std::string_view sop_class_uid,
                     std::vector<uint8_t> identifier,
                     find_match_callback on_match) -> Result<find_result> {
    const auto start_time = std::chrono::steady_clock::now();

    auto context_id = context_for(assoc, sop_class_uid);
    if (context_id.is_err()) {
        return context_id.error();
    }

    const auto message_id = assoc.next_message_id();
    auto rq = make_c_find_rq(message_id, sop_class_uid, config_.priority);
    rq.set_dataset(std::move(identifier));

    auto sent = send(assoc, context_id.value(), rq);
    if (sent.is_err()) {
        return sent.error();
    }

    find_result result;
    while (true) {
        auto rsp = assoc.receive_response(message_id, response_timeout(assoc));
        if (rsp.is_err()) {
            return rsp.error();
        }

        auto message = std::move(rsp.value().message);
        if (message.command() != command_field::c_find_rsp) {
            return dul_error<find_result>(error_codes::unexpected_response,
                                          "Expected C-FIND-RSP",
                                          std::string(to_string(message.command())));
        }

        const auto status = message.status();
        if (!is_pending(status)) {
            result.status = status;
            break;
        }

        ++result.total_pending;
        if (!message.has_dataset()) {
            continue;
        }

        auto match = message.take_dataset();
        const bool keep_going = !on_match || on_match(match);
        result.matches.push_back(std::move(match));

        if (!keep_going && !result.cancel_sent) {
            auto cancelled = cancel(assoc, context_id.value(), message_id);
            if (cancelled.is_err()) {
                logger_adapter::warn("Failed to send C-CANCEL: {}", cancelled.error().message);
            } else {
                result.cancel_sent = true;
            }
        }
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    logger_adapter::debug("C-FIND completed: {} matches in {} ms, status 0x{:04X}",
                          result.matches.size(), result.elapsed.count(), result.status);
    return result;
}

auto dimse_scu::get(network::association& assoc,
                    std::string_view sop_class_uid,
                    std::vector<uint8_t> identifier,
                    get_store_handler on_store,
                    retrieve_progress_callback on_progress) -> Result<retrieve_result> {
    auto context_id = context_for(assoc, sop_class_uid);
    if (context_id.is_err()) {
        return context_id.error();
    }

    auto rq = make_c_get_rq(assoc.next_message_id(), sop_class_uid, config_.priority);
    rq.set_dataset(std::move(identifier));
    return retrieve(assoc, context_id.value(), std::move(rq), &on_store, on_progress);
}

auto dimse_scu::move(network::association& assoc,
                     std::string_view sop_class_uid,
                     std::string_view move_destination,
                     std::vector<uint8_t> identifier,
                     retrieve_progress_callback on_progress) -> Result<retrieve_result> {
    if (move_destination.empty() || move_destination.size() > 16) {
        return dul_error<retrieve_result>(error_codes::retrieve_missing_destination,
                                          "Move destination must be 1-16 characters",
                                          std::string(move_destination));
    }

    auto context_id = context_for(assoc, sop_class_uid);
    if (context_id.is_err()) {
        return context_id.error();
    }

    auto rq = make_c_move_rq(assoc.next_message_id(), sop_class_uid, move_destination,
                             config_.priority);
    rq.set_dataset(std::move(identifier));
    return retrieve(assoc, context_id.value(), std::move(rq), nullptr, on_progress);
}

VoidResult dimse_scu::cancel(network::association& assoc, uint8_t context_id,
                             uint16_t message_id) {
    logger_adapter::debug("Sending C-CANCEL for message {}", message_id);
    return send(assoc, context_id, make_c_cancel_rq(message_id));
}

// =============================================================================
// DIMSE-N
// =============================================================================

auto dimse_scu::n_event_report(network::association& assoc,
                               std::string_view sop_class_uid,
                               std::string_view sop_instance_uid,
                               uint16_t event_type_id,
                               std::optional<std::vector<uint8_t>> event_info)
    -> Result<n_result> {
    auto rq = make_n_event_report_rq(assoc.next_message_id(), sop_class_uid,
                                     sop_instance_uid, event_type_id);
    if (event_info) {
        rq.set_dataset(std::move(*event_info));
    }
    return n_exchange(assoc, std::move(rq));
}

auto dimse_scu::n_get(network::association& assoc,
                      std::string_view sop_class_uid,
                      std::string_view sop_instance_uid,
                      const std::vector<core::dicom_tag>& attributes) -> Result<n_result> {
    return n_exchange(assoc, make_n_get_rq(assoc.next_message_id(), sop_class_uid,
                                           sop_instance_uid, attributes));
}

auto dimse_scu::n_set(network::association& assoc,
                      std::string_view sop_class_uid,
                      std::string_view sop_instance_uid,
                      std::vector<uint8_t> modifications) -> Result<n_result> {
    auto rq = make_n_set_rq(assoc.next_message_id(), sop_class_uid, sop_instance_uid);
    rq.set_dataset(std::move(modifications));
    return n_exchange(assoc, std::move(rq));
}

auto dimse_scu::n_action(network::association& assoc,
                         std::string_view sop_class_uid,
                         std::string_view sop_instance_uid,
                         uint16_t action_type_id,
                         std::optional<std::vector<uint8_t>> action_info) -> Result<n_result> {
    auto rq = make_n_action_rq(assoc.next_message_id(), sop_class_uid, sop_instance_uid,
                               action_type_id);
    if (action_info) {
        rq.set_dataset(std::move(*action_info));
    }
    return n_exchange(assoc, std::move(rq));
}

auto dimse_scu::n_create(network::association& assoc,
                         std::string_view sop_class_uid,
                         std::string_view sop_instance_uid,
                         std::optional<std::vector<uint8_t>> attributes) -> Result<n_result> {
    auto rq = make_n_create_rq(assoc.next_message_id(), sop_class_uid, sop_instance_uid);
    if (attributes) {
        rq.set_dataset(std::move(*attributes));
    }
    return n_exchange(assoc, std::move(rq));
}

auto dimse_scu::n_delete(network::association& assoc,
                         std::string_view sop_class_uid,
                         std::string_view sop_instance_uid) -> Result<n_result> {
    return n_exchange(assoc, make_n_delete_rq(assoc.next_message_id(), sop_class_uid,
                                              sop_instance_uid));
}

// =============================================================================
// Private Implementation
// =============================================================================

auto dimse_scu::context_for(network::association& assoc,
                            std::string_view sop_class_uid,
                            std::string_view transfer_syntax) -> Result<uint8_t> {
    if (!assoc.is_established()) {
        return dul_error<uint8_t>(error_codes::association_not_established,
                                  "Association not established");
    }

    auto context_id = assoc.accepted_context_id(sop_class_uid, transfer_syntax);
    if (!context_id) {
        return dul_error<uint8_t>(error_codes::no_acceptable_context,
                                  "No accepted presentation context for SOP Class",
                                  std::string(sop_class_uid));
    }
    return *context_id;
}

VoidResult dimse_scu::send(network::association& assoc, uint8_t context_id,
                           const dimse_message& request) {
    auto sent = assoc.send_dimse(context_id, request);
    if (sent.is_ok()) {
        requests_sent_.fetch_add(1, std::memory_order_relaxed);
    }
    return sent;
}

auto dimse_scu::response_timeout(const network::association& assoc) const
    -> std::chrono::milliseconds {
    return config_.timeout.count() > 0 ? config_.timeout : assoc.timeouts().dimse;
}

auto dimse_scu::n_exchange(network::association& assoc, dimse_message request)
    -> Result<n_result> {
    auto context_id = context_for(assoc, request.sop_class_uid());
    if (context_id.is_err()) {
        return context_id.error();
    }

    const auto message_id = request.message_id();
    const auto expected = response_command_for(request.command());

    auto sent = send(assoc, context_id.value(), request);
    if (sent.is_err()) {
        return sent.error();
    }

    auto rsp = assoc.receive_response(message_id, response_timeout(assoc));
    if (rsp.is_err()) {
        return rsp.error();
    }

    auto message = std::move(rsp.value().message);
    if (message.command() != expected) {
        return dul_error<n_result>(error_codes::unexpected_response,
                                   "Unexpected response to " +
                                       std::string(to_string(request.command())),
                                   std::string(to_string(message.command())));
    }

    n_result result;
    result.status = message.status();
    result.affected_sop_instance_uid = message.affected_sop_instance_uid();
    result.error_comment = message.error_comment();
    if (message.has_dataset()) {
        result.dataset = message.take_dataset();
    }
    return result;
}

auto dimse_scu::retrieve(network::association& assoc,
                         uint8_t context_id,
                         dimse_message request,
                         const get_store_handler* on_store,
                         const retrieve_progress_callback& on_progress)
    -> Result<retrieve_result> {
    const auto message_id = request.message_id();
    const auto expected = response_command_for(request.command());

    auto sent = send(assoc, context_id, request);
    if (sent.is_err()) {
        return sent.error();
    }

    retrieve_result result;
    bool cancel_sent = false;

    while (true) {
        // C-GET interleaves C-STORE requests with its own responses
        auto received = on_store != nullptr
                            ? assoc.receive_dimse(response_timeout(assoc))
                            : assoc.receive_response(message_id, response_timeout(assoc));
        if (received.is_err()) {
            return received.error();
        }

        const auto rsp_context = received.value().context_id;
        auto message = std::move(received.value().message);

        if (message.command() == command_field::c_store_rq && on_store != nullptr) {
            status_code store_status = status_refused_out_of_resources;
            if (*on_store) {
                auto ts = assoc.transfer_syntax_of(rsp_context).value_or(std::string{});
                try {
                    store_status = (*on_store)(message, ts);
                } catch (const std::exception& e) {
                    logger_adapter::error("C-STORE handler threw: {}", e.what());
                    store_status = status_store_error_processing;
                }
            }

            auto store_rsp = make_c_store_rsp(message.message_id(),
                                              message.affected_sop_class_uid(),
                                              message.affected_sop_instance_uid(),
                                              store_status);
            auto answered = assoc.send_dimse(rsp_context, store_rsp);
            if (answered.is_err()) {
                return answered.error();
            }
            ++result.stores_received;
            continue;
        }

        if (message.command() != expected || message.message_id_responded_to() != message_id) {
            logger_adapter::warn("Ignoring {} while waiting for {}", to_string(message.command()),
                                 to_string(expected));
            continue;
        }

        const auto status = message.status();
        if (is_pending(status)) {
            ++result.pending_responses;
            if (on_progress && !on_progress(counters_of(message)) && !cancel_sent) {
                auto cancelled = cancel(assoc, context_id, message_id);
                if (cancelled.is_err()) {
                    return cancelled.error();
                }
                cancel_sent = true;
            }
            continue;
        }

        result.status = status;
        result.counters = counters_of(message);
        result.error_comment = message.error_comment();
        break;
    }

    logger_adapter::debug("{} finished with 0x{:04X}: {} completed, {} failed, {} warning",
                          to_string(request.command()), result.status,
                          result.counters.completed, result.counters.failed,
                          result.counters.warning);
    return result;
}

}  // namespace dul::services
