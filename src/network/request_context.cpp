/**
 * @file request_context.cpp
 * @brief Pending responses, cancellation and C-GET sub-operations
 */

#include "dul/network/request_context.hpp"

#include "dul/integration/logger_adapter.hpp"
#include "dul/network/association.hpp"

namespace dul::network {

using integration::logger_adapter;

request_context::request_context(association& owner, uint8_t context_id,
                                 dimse::dimse_message request)
    : owner_(owner)
    , context_id_(context_id)
    , request_(std::move(request)) {
    if (const auto* ctx = owner_.negotiated().find_context(context_id)) {
        context_ = *ctx;
    } else {
        context_.id = context_id;
    }
}

// =============================================================================
// Responses
// =============================================================================

VoidResult request_context::send_pending(dimse::status_code status,
                                         std::optional<std::vector<uint8_t>> dataset) {
    auto rsp = dimse::make_response_for(request_, status);
    if (dataset) {
        rsp.set_dataset(std::move(*dataset));
    }

    auto sent = owner_.send_dimse(context_id_, rsp);
    if (sent.is_err()) {
        return sent;
    }
    ++pending_sent_;
    return owner_.poll_messages();
}

VoidResult request_context::send_pending(dimse::status_code status,
                                         const subop_counters& counters) {
    auto rsp = dimse::make_response_for(request_, status);
    rsp.set_remaining_subops(counters.remaining);
    rsp.set_completed_subops(counters.completed);
    rsp.set_failed_subops(counters.failed);
    rsp.set_warning_subops(counters.warning);

    auto sent = owner_.send_dimse(context_id_, rsp);
    if (sent.is_err()) {
        return sent;
    }
    ++pending_sent_;
    return owner_.poll_messages();
}

bool request_context::is_cancelled() {
    if (cancelled_) {
        return true;
    }

    auto polled = owner_.poll_messages();
    if (polled.is_err()) {
        // The association is gone; nobody is waiting for more responses
        logger_adapter::debug("Stopping request {}: {}", request_.message_id(),
                              polled.error().message);
        cancelled_ = true;
        return true;
    }

    if (owner_.take_cancel(request_.message_id())) {
        logger_adapter::info("C-CANCEL received for message {}", request_.message_id());
        cancelled_ = true;
    }
    return cancelled_;
}

auto request_context::final_response(dimse::status_code status) const -> dimse::dimse_message {
    auto rsp = dimse::make_response_for(request_, status);

    if (response_dataset_) {
        rsp.set_dataset(*response_dataset_);
    }
    if (error_comment_) {
        rsp.set_error_comment(*error_comment_);
    }
    if (affected_instance_) {
        rsp.set_affected_sop_instance_uid(*affected_instance_);
    }
    if (final_counters_) {
        // Remaining is only meaningful while the operation is in progress
        if (dimse::is_cancel(status) || dimse::is_pending(status)) {
            rsp.set_remaining_subops(final_counters_->remaining);
        }
        rsp.set_completed_subops(final_counters_->completed);
        rsp.set_failed_subops(final_counters_->failed);
        rsp.set_warning_subops(final_counters_->warning);
    }
    return rsp;
}

// =============================================================================
// C-GET Sub-operations
// =============================================================================

auto request_context::store_sub_operation(std::string_view sop_class_uid,
                                          std::string_view sop_instance_uid,
                                          std::string_view transfer_syntax,
                                          std::vector<uint8_t> dataset)
    -> Result<dimse::status_code> {
    // The data set is sent as stored; no context in another syntax will do
    std::optional<uint8_t> store_context;
    for (const auto& ctx : owner_.negotiated().contexts) {
        if (ctx.is_accepted() && ctx.requestor_scp && ctx.abstract_syntax == sop_class_uid &&
            ctx.transfer_syntax == transfer_syntax) {
            store_context = ctx.id;
            break;
        }
    }

    if (!store_context) {
        return dul_error<dimse::status_code>(
            error_codes::no_acceptable_context,
            "No storage context in the data set's transfer syntax with the requestor "
            "in the SCP role",
            std::string(sop_class_uid) + " / " + std::string(transfer_syntax));
    }

    const auto message_id = owner_.next_message_id();
    auto rq = dimse::make_c_store_rq(message_id, sop_class_uid, sop_instance_uid,
                                     request_.priority());
    rq.set_dataset(std::move(dataset));

    auto sent = owner_.send_dimse(*store_context, rq);
    if (sent.is_err()) {
        return sent.error();
    }

    auto rsp = owner_.receive_response(message_id, owner_.timeouts().dimse);
    if (rsp.is_err()) {
        return rsp.error();
    }
    return rsp.value().message.status();
}

}  // namespace dul::network
