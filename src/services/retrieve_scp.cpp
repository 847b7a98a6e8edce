/**
 * @file retrieve_scp.cpp
 * @brief Implementation of the Retrieve SCP service (C-MOVE/C-GET)
 */

#include "dul/services/retrieve_scp.hpp"

#include "dul/core/uid_registry.hpp"
#include "dul/integration/logger_adapter.hpp"
#include "dul/integration/thread_adapter.hpp"
#include "dul/network/association.hpp"
#include "dul/network/dimse/command_field.hpp"
#include "dul/network/dimse/status_codes.hpp"

#include <algorithm>
#include <future>
#include <limits>
#include <utility>

namespace dul::services {

using integration::logger_adapter;
using namespace network::dimse;

namespace {

/// Error Comment is an LO element
constexpr std::size_t max_error_comment_length = 64;

/// Sub-operation counters are US elements
constexpr std::size_t max_sub_operations = std::numeric_limits<uint16_t>::max();

/// Presentation context ids are odd numbers 1-255
constexpr std::size_t max_proposed_contexts = 128;

/**
 * @brief Progress shared between a C-MOVE request and its sub-association job
 */
struct move_progress {
    std::atomic<uint16_t> completed{0};
    std::atomic<uint16_t> failed{0};
    std::atomic<uint16_t> warning{0};
    std::atomic<bool> associated{false};
    std::atomic<bool> cancel{false};

    [[nodiscard]] auto snapshot(uint16_t total) const -> network::subop_counters {
        network::subop_counters counters;
        counters.completed = completed.load();
        counters.failed = failed.load();
        counters.warning = warning.load();
        const auto done = counters.completed + counters.failed + counters.warning;
        counters.remaining = static_cast<uint16_t>(total > done ? total - done : 0);
        return counters;
    }
};

auto refuse_too_many_matches(network::request_context& ctx, std::size_t count)
    -> status_code {
    logger_adapter::warn("Retrieve matched {} instances; sub-operation counts stop at {}",
                         count, max_sub_operations);
    ctx.set_error_comment("Too many matching instances for one request");
    return status_refused_out_of_resources_matches;
}

void count_store_status(status_code status, network::subop_counters& counters) {
    if (is_success(status)) {
        ++counters.completed;
    } else if (is_warning(status)) {
        ++counters.warning;
    } else {
        ++counters.failed;
    }
}

/// One context per (SOP class, transfer syntax) so no transcoding is needed
auto propose_storage_contexts(const std::vector<retrieve_item>& items)
    -> std::vector<network::presentation_context_rq> {
    std::vector<network::presentation_context_rq> contexts;
    uint8_t next_id = 1;
    for (const auto& item : items) {
        auto it = std::find_if(contexts.begin(), contexts.end(), [&](const auto& c) {
            return c.abstract_syntax == item.sop_class_uid &&
                   c.transfer_syntaxes.front() == item.transfer_syntax;
        });
        if (it != contexts.end()) {
            continue;
        }
        if (contexts.size() == max_proposed_contexts) {
            logger_adapter::warn("C-MOVE needs more than {} presentation contexts; "
                                 "remaining instances will fail",
                                 max_proposed_contexts);
            break;
        }
        contexts.emplace_back(next_id, item.sop_class_uid,
                              std::vector<std::string>{item.transfer_syntax});
        next_id = static_cast<uint8_t>(next_id + 2);
    }
    return contexts;
}

/**
 * @brief Sub-association job: store every item at the move destination
 */
void run_move_job(const std::shared_ptr<move_progress>& progress,
                  const retrieve_destination& destination,
                  const network::association_config& config,
                  std::vector<retrieve_item> items,
                  const std::string& originator_ae,
                  uint16_t originator_message_id,
                  uint16_t priority) {
    auto connected = network::association::connect(destination.host, destination.port, config);
    if (connected.is_err()) {
        logger_adapter::warn("C-MOVE sub-association to {} ({}:{}) failed: {}",
                             config.called_ae_title, destination.host, destination.port,
                             connected.error().message);
        return;
    }
    progress->associated = true;

    auto& sub = *connected.value();
    for (auto& item : items) {
        if (progress->cancel) {
            break;
        }

        auto context_id = sub.accepted_context_id(item.sop_class_uid, item.transfer_syntax);
        if (!context_id) {
            logger_adapter::warn("{} did not accept {} in {}", config.called_ae_title,
                                 item.sop_class_uid, item.transfer_syntax);
            ++progress->failed;
            continue;
        }

        const auto message_id = sub.next_message_id();
        auto rq = make_c_store_rq(message_id, item.sop_class_uid, item.sop_instance_uid,
                                  priority);
        rq.set_move_originator_aet(originator_ae);
        rq.set_move_originator_message_id(originator_message_id);
        rq.set_dataset(std::move(item.dataset));

        auto sent = sub.send_dimse(*context_id, rq);
        if (sent.is_err()) {
            logger_adapter::warn("C-STORE to {} failed: {}", config.called_ae_title,
                                 sent.error().message);
            ++progress->failed;
            break;
        }

        auto rsp = sub.receive_response(message_id, sub.timeouts().dimse);
        if (rsp.is_err()) {
            logger_adapter::warn("No C-STORE response from {}: {}", config.called_ae_title,
                                 rsp.error().message);
            ++progress->failed;
            break;
        }

        const auto status = rsp.value().message.status();
        if (is_success(status)) {
            ++progress->completed;
        } else if (is_warning(status)) {
            ++progress->warning;
        } else {
            ++progress->failed;
        }
    }

    if (sub.is_established()) {
        auto released = sub.release();
        if (released.is_err()) {
            logger_adapter::debug("Release of C-MOVE sub-association failed: {}",
                                  released.error().message);
        }
    }
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

retrieve_scp::retrieve_scp()
    : storage_sop_classes_{std::string(core::uids::ct_image_storage),
                           std::string(core::uids::mr_image_storage),
                           std::string(core::uids::us_image_storage),
                           std::string(core::uids::secondary_capture_image_storage),
                           std::string(core::uids::digital_xray_image_storage)} {
}

// =============================================================================
// Configuration
// =============================================================================

void retrieve_scp::set_retrieve_handler(retrieve_handler handler) {
    retrieve_handler_ = std::move(handler);
}

void retrieve_scp::set_destination_resolver(destination_resolver resolver) {
    destination_resolver_ = std::move(resolver);
}

void retrieve_scp::set_storage_sop_classes(std::vector<std::string> sop_classes) {
    storage_sop_classes_ = std::move(sop_classes);
}

void retrieve_scp::set_progress_interval(duration interval) {
    progress_interval_ = interval;
}

// =============================================================================
// scp_service Interface Implementation
// =============================================================================

std::vector<std::string> retrieve_scp::supported_sop_classes() const {
    return {std::string(core::uids::patient_root_move),
            std::string(core::uids::study_root_move),
            std::string(core::uids::patient_root_get),
            std::string(core::uids::study_root_get)};
}

network::dimse::status_code retrieve_scp::handle_request(network::request_context& ctx) {
    switch (ctx.request().command()) {
        case command_field::c_move_rq:
            return handle_c_move(ctx);

        case command_field::c_get_rq:
            return handle_c_get(ctx);

        default:
            logger_adapter::warn("Retrieve SCP received {}", to_string(ctx.request().command()));
            return status_error_unrecognized_operation;
    }
}

std::vector<network::supported_context> retrieve_scp::presentation_contexts(
    const std::vector<std::string>& transfer_syntaxes) const {
    auto contexts = scp_service::presentation_contexts(transfer_syntaxes);
    for (const auto& uid : storage_sop_classes_) {
        contexts.emplace_back(uid, transfer_syntaxes, false, true);
    }
    return contexts;
}

std::string_view retrieve_scp::service_name() const noexcept {
    return "Retrieve SCP";
}

// =============================================================================
// Statistics
// =============================================================================

size_t retrieve_scp::move_operations() const noexcept {
    return move_operations_.load();
}

size_t retrieve_scp::get_operations() const noexcept {
    return get_operations_.load();
}

size_t retrieve_scp::images_transferred() const noexcept {
    return images_transferred_.load();
}

void retrieve_scp::reset_statistics() noexcept {
    move_operations_ = 0;
    get_operations_ = 0;
    images_transferred_ = 0;
}

network::dimse::status_code retrieve_scp::completion_status(
    const network::subop_counters& counters) noexcept {
    if (counters.failed == 0 && counters.warning == 0) {
        return status_success;
    }
    if (counters.completed == 0 && counters.warning == 0) {
        return status_refused_out_of_resources_subops;
    }
    return status_warning_subops_complete_failures;
}

// =============================================================================
// Private Implementation
// =============================================================================

std::optional<std::vector<retrieve_item>> retrieve_scp::find_items(
    network::request_context& ctx) {
    if (!retrieve_handler_) {
        ctx.set_error_comment("No retrieve handler configured");
        return std::nullopt;
    }

    auto found = retrieve_handler_(ctx);
    if (found.is_err()) {
        logger_adapter::warn("Retrieve lookup failed: {}", found.error().message);
        ctx.set_error_comment(found.error().message.substr(0, max_error_comment_length));
        return std::nullopt;
    }
    return std::move(found.value());
}

// =============================================================================
// Private Implementation - C-MOVE
// =============================================================================

network::dimse::status_code retrieve_scp::handle_c_move(network::request_context& ctx) {
    ++move_operations_;

    const auto& request = ctx.request();
    const auto destination_ae = request.move_destination();
    if (destination_ae.empty() || !destination_resolver_) {
        return status_refused_move_destination_unknown;
    }

    auto destination = destination_resolver_(destination_ae);
    if (!destination) {
        logger_adapter::info("Unknown move destination {}", destination_ae);
        return status_refused_move_destination_unknown;
    }

    auto items = find_items(ctx);
    if (!items) {
        return status_move_error_processing;
    }
    if (items->size() > max_sub_operations) {
        return refuse_too_many_matches(ctx, items->size());
    }

    const auto total = static_cast<uint16_t>(items->size());
    if (total == 0) {
        ctx.set_final_counters({});
        return status_success;
    }

    auto& owner = ctx.owning_association();

    network::association_config config;
    config.calling_ae_title = owner.called_ae();
    config.called_ae_title = destination_ae;
    config.proposed_contexts = propose_storage_contexts(*items);
    config.timeouts = owner.timeouts();

    logger_adapter::info("C-MOVE of {} instances to {} ({}:{}) for {}", total, destination_ae,
                         destination->host, destination->port, owner.calling_ae());

    auto progress = std::make_shared<move_progress>();
    auto job = integration::thread_adapter::submit(
        [progress, dest = *destination, config = std::move(config),
         items = std::move(*items), originator = owner.calling_ae(),
         originator_id = request.message_id(), priority = request.priority()]() mutable {
            run_move_job(progress, dest, config, std::move(items), originator, originator_id,
                         priority);
        });

    bool cancelled = false;
    network::subop_counters reported{total, 0, 0, 0};
    while (job.wait_for(progress_interval_) != std::future_status::ready) {
        if (cancelled) {
            continue;
        }
        if (ctx.is_cancelled()) {
            cancelled = true;
            progress->cancel = true;
            continue;
        }

        auto current = progress->snapshot(total);
        if (progress->associated && current != reported) {
            auto sent = ctx.send_pending(status_pending, current);
            if (sent.is_err()) {
                cancelled = true;
                progress->cancel = true;
                continue;
            }
            reported = current;
        }
    }

    try {
        job.get();
    } catch (const std::exception& e) {
        logger_adapter::error("C-MOVE sub-association job failed: {}", e.what());
    }

    auto counters = progress->snapshot(total);
    images_transferred_ += counters.completed + counters.warning;

    if (!progress->associated) {
        ctx.set_error_comment("Cannot associate with move destination");
        return status_refused_move_destination_unknown;
    }

    if (cancelled) {
        ctx.set_final_counters(counters);
        return status_cancel;
    }

    // Instances the job never attempted count as failures
    counters.failed = static_cast<uint16_t>(counters.failed + counters.remaining);
    counters.remaining = 0;
    ctx.set_final_counters(counters);
    return completion_status(counters);
}

// =============================================================================
// Private Implementation - C-GET
// =============================================================================

network::dimse::status_code retrieve_scp::handle_c_get(network::request_context& ctx) {
    ++get_operations_;

    auto items = find_items(ctx);
    if (!items) {
        return status_get_error_processing;
    }
    if (items->size() > max_sub_operations) {
        return refuse_too_many_matches(ctx, items->size());
    }

    network::subop_counters counters;
    counters.remaining = static_cast<uint16_t>(items->size());

    for (auto& item : *items) {
        if (ctx.is_cancelled()) {
            ctx.set_final_counters(counters);
            return status_cancel;
        }

        auto pending = ctx.send_pending(status_pending, counters);
        if (pending.is_err()) {
            logger_adapter::warn("C-GET aborted: {}", pending.error().message);
            return status_get_error_processing;
        }

        auto stored = ctx.store_sub_operation(item.sop_class_uid, item.sop_instance_uid,
                                              item.transfer_syntax, std::move(item.dataset));
        --counters.remaining;
        if (stored.is_err()) {
            ++counters.failed;
            if (stored.error().code != error_codes::no_acceptable_context) {
                logger_adapter::warn("C-GET sub-operation failed: {}", stored.error().message);
                if (!ctx.owning_association().is_established()) {
                    return status_get_error_processing;
                }
            }
            continue;
        }
        count_store_status(stored.value(), counters);
    }

    images_transferred_ += counters.completed + counters.warning;
    ctx.set_final_counters(counters);
    return completion_status(counters);
}

}  // namespace dul::services
