/**
 * @file association.cpp
 * @brief Association establishment, data transfer and release over TCP
 */

#include "dul/network/association.hpp"

#include "dul/network/pdu_decoder.hpp"
#include "dul/network/pdu_encoder.hpp"

#include <algorithm>
#include <array>

namespace dul::network {

using integration::association_outcome;
using integration::logger_adapter;

namespace {

constexpr std::size_t receive_chunk_size = 64 * 1024;

/// Abort reason for a PDU the decoder refused
[[nodiscard]] auto abort_reason_for(const error_info& error) noexcept -> abort_reason {
    return error.code == error_codes::invalid_pdu_type ? abort_reason::unrecognized_pdu
                                                       : abort_reason::invalid_pdu_parameter;
}

[[nodiscard]] bool is_decode_error(int code) noexcept {
    return code == error_codes::pdu_decoding_error || code == error_codes::incomplete_pdu ||
           code == error_codes::invalid_pdu_type || code == error_codes::invalid_item_type ||
           code == error_codes::malformed_pdu || code == error_codes::pdu_too_large;
}

[[nodiscard]] auto make_error_info(int code, const std::string& message,
                                   const std::string& details = {}) -> error_info {
    if (details.empty()) {
        return error_info{code, message, "dul"};
    }
    return error_info{code, message, "dul", details};
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

association::association(association_role role, const timeout_config& timeouts,
                         std::shared_ptr<event_dispatcher> events,
                         std::size_t receive_ceiling)
    : machine_(role)
    , artim_(timeouts.artim)
    , timeouts_(timeouts)
    , events_(std::move(events))
    , framer_(receive_ceiling) {}

association::~association() {
    if (!machine_.is_terminal()) {
        abort();
    }
    close_transport();
}

// =============================================================================
// Requestor Establishment
// =============================================================================

auto association::connect(const std::string& host, uint16_t port,
                          const association_config& config,
                          std::shared_ptr<event_dispatcher> events)
    -> Result<std::unique_ptr<association>> {
    std::unique_ptr<association> assoc(new association(
        association_role::requestor, config.timeouts, std::move(events),
        config.receive_ceiling));
    assoc->calling_ae_ = config.calling_ae_title;
    assoc->called_ae_ = config.called_ae_title;
    assoc->remote_address_ = host + ":" + std::to_string(port);

    (void)assoc->fire(ul_event::evt1);

    auto transport = tcp_transport::connect(host, port, config.timeouts.connect);
    if (transport.is_err()) {
        assoc->outcome_ = association_outcome::aborted_locally;
        assoc->outcome_detail_ = transport.error().message;
        (void)assoc->fire(ul_event::evt15);
        return transport.error();
    }
    assoc->transport_ = std::move(transport.value());
    assoc->remote_address_ = assoc->transport_->remote_address();
    assoc->publish_simple(event_type::connection_opened);

    auto rq = acse::request(config);
    assoc->request_ = rq;
    assoc->publish_simple(event_type::association_requested);

    const pdu request_pdu{rq};
    auto sent = assoc->fire(ul_event::evt2, &request_pdu);
    if (sent.is_err()) {
        return sent.error();
    }

    auto received = assoc->read_pdu(make_deadline(config.timeouts.acse));
    if (received.is_err()) {
        return assoc->on_receive_error(received.error(), error_codes::acse_timeout);
    }

    const auto& reply = received.value();
    switch (type_of(reply)) {
        case pdu_type::associate_ac: {
            (void)assoc->fire(ul_event::evt3);
            auto params = acse::interpret_accept(rq, std::get<associate_ac>(reply));
            if (params.is_err()) {
                assoc->outcome_ = association_outcome::protocol_error;
                assoc->outcome_detail_ = params.error().message;
                assoc->abort(abort_reason::invalid_pdu_parameter);
                return params.error();
            }
            assoc->params_ = std::move(params.value());
            assoc->publish_simple(event_type::association_accepted);

            if (!assoc->params_.any_accepted()) {
                assoc->outcome_detail_ = "no presentation context accepted";
                assoc->abort();
                return make_error_info(error_codes::no_acceptable_context,
                                       "Peer accepted no presentation context",
                                       config.called_ae_title);
            }

            logger_adapter::log_association_established(
                assoc->calling_ae_, assoc->called_ae_, assoc->remote_address_);
            assoc->publish_simple(event_type::association_established);
            return assoc;
        }

        case pdu_type::associate_rj: {
            const auto& rj = std::get<associate_rj>(reply);
            assoc->rejection_ = rj;
            (void)assoc->fire(ul_event::evt4);
            return make_error_info(error_codes::association_rejected,
                                   "Association rejected", describe_rejection(rj));
        }

        case pdu_type::abort:
            assoc->peer_abort_ = std::get<abort_pdu>(reply);
            assoc->outcome_ = association_outcome::aborted_by_peer;
            (void)assoc->fire(ul_event::evt16);
            return make_error_info(error_codes::association_aborted,
                                   "Peer aborted during establishment");

        default:
            return assoc->fail_with_abort(event_for(type_of(reply)),
                                          abort_reason::unexpected_pdu,
                                          error_codes::protocol_violation,
                                          "Unexpected PDU during establishment");
    }
}

// =============================================================================
// Acceptor Establishment
// =============================================================================

auto association::accept(std::unique_ptr<tcp_transport> transport,
                         const acceptor_config& config,
                         std::shared_ptr<event_dispatcher> events,
                         std::optional<associate_rj> forced_rejection)
    -> Result<std::unique_ptr<association>> {
    if (!transport || !transport->is_open()) {
        return make_error_info(error_codes::invalid_argument, "Transport is not connected");
    }

    std::unique_ptr<association> assoc(new association(
        association_role::acceptor, config.timeouts, std::move(events),
        config.receive_ceiling));
    assoc->remote_address_ = transport->remote_address();
    assoc->transport_ = std::move(transport);
    assoc->called_ae_ = config.ae_title;

    (void)assoc->fire(ul_event::evt5);
    assoc->publish_simple(event_type::connection_opened);

    // ARTIM bounds the wait for the A-ASSOCIATE-RQ
    deadline until;
    if (auto remaining = assoc->artim_.remaining()) {
        until = clock::now() + *remaining;
    }
    auto received = assoc->read_pdu(until);
    if (received.is_err()) {
        const auto& error = received.error();
        if (error.code == error_codes::receive_timeout) {
            assoc->outcome_ = association_outcome::timed_out;
            assoc->outcome_detail_ = "ARTIM expired before A-ASSOCIATE-RQ";
            (void)assoc->fire(ul_event::evt18);
            return make_error_info(error_codes::artim_timeout,
                                   "No A-ASSOCIATE-RQ before ARTIM expiry",
                                   assoc->remote_address_);
        }
        return assoc->on_receive_error(error, error_codes::artim_timeout);
    }

    const auto& request = received.value();
    if (type_of(request) != pdu_type::associate_rq) {
        return assoc->fail_with_abort(event_for(type_of(request)),
                                      abort_reason::unexpected_pdu,
                                      error_codes::protocol_violation,
                                      "Expected A-ASSOCIATE-RQ");
    }

    const auto& rq = std::get<associate_rq>(request);
    assoc->calling_ae_ = rq.calling_ae_title;
    assoc->called_ae_ = rq.called_ae_title;
    assoc->request_ = rq;
    assoc->publish_simple(event_type::association_requested);

    (void)assoc->fire(ul_event::evt6, nullptr, true);

    association_decision decision;
    if (forced_rejection) {
        decision.response = *forced_rejection;
        decision.reason = "local limit exceeded";
    } else {
        decision = acse::evaluate(rq, config);
    }

    if (decision.accepted()) {
        assoc->params_ = std::move(decision.params);
        const pdu ac_pdu{std::get<associate_ac>(decision.response)};
        auto sent = assoc->fire(ul_event::evt7, &ac_pdu);
        if (sent.is_err()) {
            return sent.error();
        }
        assoc->publish_simple(event_type::association_accepted);
        logger_adapter::log_association_established(
            assoc->calling_ae_, assoc->called_ae_, assoc->remote_address_);
        assoc->publish_simple(event_type::association_established);
        return assoc;
    }

    const auto& rj = std::get<associate_rj>(decision.response);
    assoc->rejection_ = rj;
    assoc->outcome_detail_ = decision.reason;
    logger_adapter::info("Rejecting association from {} ({}): {}", assoc->calling_ae_,
                         assoc->remote_address_, decision.reason);

    const pdu rj_pdu{rj};
    (void)assoc->fire(ul_event::evt8, &rj_pdu);
    assoc->await_close();
    return make_error_info(error_codes::association_rejected, decision.reason,
                           describe_rejection(rj));
}

// =============================================================================
// State Queries
// =============================================================================

auto association::transfer_syntax_of(uint8_t context_id) const -> std::optional<std::string> {
    const auto* ctx = params_.find_context(context_id);
    if (ctx == nullptr || !ctx->is_accepted()) {
        return std::nullopt;
    }
    return ctx->transfer_syntax;
}

auto association::rejection() const -> std::optional<rejection_info> {
    if (!rejection_) {
        return std::nullopt;
    }
    return rejection_info(*rejection_);
}

auto association::next_message_id() noexcept -> uint16_t {
    auto id = next_message_id_++;
    if (next_message_id_ == 0) {
        next_message_id_ = 1;
    }
    return id;
}

auto association::bytes_sent() const noexcept -> uint64_t {
    return transport_ ? transport_->bytes_sent() : 0;
}

auto association::bytes_received() const noexcept -> uint64_t {
    return transport_ ? transport_->bytes_received() : 0;
}

// =============================================================================
// Data Transfer
// =============================================================================

VoidResult association::send_dimse(uint8_t context_id, const dimse::dimse_message& message) {
    if (!machine_.is_established()) {
        return dul_void_error(error_codes::association_not_established,
                              "Association is not established",
                              std::string(to_string(machine_.state())));
    }

    const auto* ctx = params_.find_context(context_id);
    if (ctx == nullptr || !ctx->is_accepted()) {
        return dul_void_error(error_codes::invalid_context_id,
                              "Presentation context is not accepted",
                              std::to_string(context_id));
    }

    dimse::pdv_fragmenter fragmenter(params_.peer_max_pdu_length);
    auto fragments = fragmenter.fragment(context_id, message);
    if (fragments.is_err()) {
        return fragments.error();
    }

    for (auto& fragment : fragments.value()) {
        const pdu value{std::move(fragment)};
        auto sent = fire(ul_event::evt9, &value);
        if (sent.is_err()) {
            return sent;
        }
    }

    if (events_ && events_->has_subscribers(event_type::dimse_sent)) {
        association_event e;
        e.type = event_type::dimse_sent;
        e.command = message.command();
        e.message_id = message.message_id();
        e.context_id = context_id;
        if (message.is_response()) {
            e.status = message.status();
        }
        publish(std::move(e));
    }
    return ok();
}

auto association::receive_dimse(duration timeout) -> Result<dimse::received_message> {
    const auto until = make_deadline(timeout);
    while (inbox_.empty()) {
        auto pumped = pump(until, error_codes::dimse_timeout);
        if (pumped.is_err()) {
            return pumped.error();
        }
    }
    return take_inbox_front();
}

auto association::next_message() -> Result<dimse::received_message> {
    const auto until = make_deadline(timeouts_.network);
    while (inbox_.empty()) {
        auto pumped = pump(until, error_codes::network_timeout);
        if (pumped.is_err()) {
            return pumped.error();
        }
    }
    return take_inbox_front();
}

auto association::receive_response(uint16_t message_id, duration timeout)
    -> Result<dimse::received_message> {
    const auto until = make_deadline(timeout);
    for (;;) {
        auto it = std::find_if(inbox_.begin(), inbox_.end(), [message_id](const auto& m) {
            return m.message.is_response() &&
                   m.message.message_id_responded_to() == message_id;
        });
        if (it != inbox_.end()) {
            auto found = std::move(*it);
            inbox_.erase(it);
            return found;
        }

        auto pumped = pump(until, error_codes::dimse_timeout);
        if (pumped.is_err()) {
            return pumped.error();
        }
    }
}

VoidResult association::poll_messages() {
    while (machine_.is_established()) {
        auto next = try_read_pdu();
        if (next.is_err()) {
            return on_receive_error(next.error(), error_codes::network_timeout);
        }
        if (!next.value()) {
            break;
        }
        auto processed = process_incoming(*next.value());
        if (processed.is_err()) {
            return processed;
        }
    }
    return ok();
}

bool association::take_cancel(uint16_t message_id) {
    auto it = std::find_if(inbox_.begin(), inbox_.end(), [message_id](const auto& m) {
        return m.message.command() == dimse::command_field::c_cancel_rq &&
               m.message.message_id_responded_to() == message_id;
    });
    if (it == inbox_.end()) {
        return false;
    }
    inbox_.erase(it);
    return true;
}

auto association::take_inbox_front() -> dimse::received_message {
    auto front = std::move(inbox_.front());
    inbox_.pop_front();
    return front;
}

// =============================================================================
// Release / Abort
// =============================================================================

VoidResult association::release() {
    if (!machine_.is_established()) {
        return dul_void_error(error_codes::invalid_association_state,
                              "Release requires an established association",
                              std::string(to_string(machine_.state())));
    }

    const pdu release_request{acse::release_request()};
    auto sent = fire(ul_event::evt11, &release_request);
    if (sent.is_err()) {
        return sent;
    }

    const auto until = make_deadline(timeouts_.acse);
    while (!machine_.is_terminal()) {
        if (machine_.state() == ul_state::sta13) {
            await_close();
            break;
        }

        auto received = read_pdu(until);
        if (received.is_err()) {
            return on_receive_error(received.error(), error_codes::acse_timeout);
        }

        const auto& value = received.value();
        switch (type_of(value)) {
            case pdu_type::release_rp:
                (void)fire(ul_event::evt13);
                if (machine_.state() == ul_state::sta12) {
                    // Collision, acceptor side: answer the peer's request last
                    const pdu reply{acse::release_response()};
                    (void)fire(ul_event::evt14, &reply);
                }
                break;

            case pdu_type::release_rq:
                (void)fire(ul_event::evt12);
                logger_adapter::debug("Release collision with {} ({})", peer_ae(),
                                      to_string(machine_.state()));
                if (machine_.state() == ul_state::sta9) {
                    // Collision, requestor side: answer first, then await the reply
                    const pdu reply{acse::release_response()};
                    (void)fire(ul_event::evt14, &reply);
                }
                break;

            case pdu_type::p_data_tf: {
                (void)fire(ul_event::evt10);
                auto completed = assembler_.feed(std::get<p_data_tf_pdu>(value));
                if (completed.is_err()) {
                    return fail_with_abort(ul_event::evt15, abort_reason::invalid_pdu_parameter,
                                           error_codes::protocol_violation,
                                           completed.error().message);
                }
                for (auto& message : completed.value()) {
                    inbox_.push_back(std::move(message));
                }
                break;
            }

            case pdu_type::abort:
                peer_abort_ = std::get<abort_pdu>(value);
                outcome_ = association_outcome::aborted_by_peer;
                (void)fire(ul_event::evt16);
                return dul_void_error(error_codes::association_aborted,
                                      "Peer aborted during release");

            default:
                return fail_with_abort(event_for(type_of(value)), abort_reason::unexpected_pdu,
                                       error_codes::protocol_violation,
                                       "Unexpected PDU during release");
        }
    }

    if (machine_.state() != ul_state::released) {
        return dul_void_error(error_codes::release_failed, "Association did not release",
                              std::string(to_string(machine_.state())));
    }
    return ok();
}

void association::abort(abort_reason reason) {
    if (machine_.is_terminal()) {
        return;
    }
    if (outcome_detail_.empty()) {
        outcome_ = association_outcome::aborted_locally;
        outcome_detail_ = "aborted by local user";
    }

    if (machine_.state() != ul_state::sta13) {
        const pdu value{acse::abort(abort_source::service_user, reason)};
        (void)fire(ul_event::evt15, &value);
    }
    close_transport();
    if (!machine_.is_terminal()) {
        (void)fire(ul_event::evt17);
    }
}

void association::interrupt() noexcept {
    if (transport_) {
        transport_->shutdown();
    }
}

// =============================================================================
// Protocol Machinery
// =============================================================================

VoidResult association::fire(ul_event event, const pdu* outgoing, bool acceptable) {
    const auto t = machine_.process(event, acceptable);
    artim_.apply(t.artim);

    if (!t.defined) {
        logger_adapter::warn("[{}] {} not allowed in {}; aborting", to_string(role()),
                             to_string(event), to_string(t.from));
    } else if (t.from != t.to) {
        logger_adapter::trace("[{}] {}: {} -> {} ({})", to_string(role()), to_string(event),
                              to_string(t.from), to_string(t.to), to_string(t.action));
    }

    if (events_ && events_->has_subscribers(event_type::state_transition)) {
        association_event e;
        e.type = event_type::state_transition;
        e.state_change = t;
        publish(std::move(e));
    }

    VoidResult sent = ok();
    switch (t.action) {
        case ul_action::ae_2:
        case ul_action::ae_7:
        case ul_action::ae_8:
        case ul_action::dt_1:
        case ul_action::ar_7:
            if (outgoing != nullptr) {
                sent = send_pdu(*outgoing);
            }
            break;

        case ul_action::ae_6:
            if (t.to == ul_state::sta13 && outgoing != nullptr) {
                sent = send_pdu(*outgoing);
            }
            break;

        case ul_action::ar_1:
            sent = send_pdu(pdu{acse::release_request()});
            break;

        case ul_action::ar_4:
        case ul_action::ar_9:
            sent = send_pdu(pdu{acse::release_response()});
            break;

        case ul_action::aa_1: {
            auto abort_sent = send_pdu(
                outgoing != nullptr ? *outgoing : pdu{acse::abort(abort_source::service_user)});
            if (abort_sent.is_err()) {
                logger_adapter::debug("A-ABORT not delivered: {}", abort_sent.error().message);
            }
            break;
        }

        case ul_action::aa_7:
        case ul_action::aa_8:
        case ul_action::protocol_abort: {
            auto abort_sent = send_pdu(
                outgoing != nullptr
                    ? *outgoing
                    : pdu{acse::abort(abort_source::service_provider,
                                      abort_reason::unexpected_pdu)});
            if (abort_sent.is_err()) {
                logger_adapter::debug("A-ABORT not delivered: {}", abort_sent.error().message);
            }
            break;
        }

        default:
            break;
    }

    if (t.closes_transport()) {
        close_transport();
    }

    if (sent.is_err() && !machine_.is_terminal()) {
        logger_adapter::warn("Send to {} failed: {}", remote_address_, sent.error().message);
        outcome_ = association_outcome::aborted_by_peer;
        outcome_detail_ = sent.error().message;
        close_transport();
        (void)fire(ul_event::evt17);
    }

    if (machine_.is_terminal()) {
        finish();
    }
    return sent;
}

VoidResult association::send_pdu(const pdu& value) {
    if (!transport_ || !transport_->is_open()) {
        return dul_void_error(error_codes::connection_closed, "Transport is closed");
    }

    auto encoded = pdu_encoder::encode(value);
    if (encoded.is_err()) {
        return encoded.error();
    }

    const auto& bytes = encoded.value();
    auto sent = transport_->send_all(bytes);
    if (sent.is_err()) {
        return sent;
    }

    if (events_ && events_->has_subscribers(event_type::pdu_sent)) {
        association_event e;
        e.type = event_type::pdu_sent;
        e.pdu = type_of(value);
        e.pdu_length = bytes.size();
        publish(std::move(e));
    }
    return ok();
}

void association::close_transport() noexcept {
    if (transport_ && transport_->is_open()) {
        transport_->close();
    }
}

void association::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    close_transport();

    switch (machine_.state()) {
        case ul_state::released:
            logger_adapter::log_association_released(calling_ae_, called_ae_);
            publish_simple(event_type::association_released);
            break;

        case ul_state::rejected: {
            auto diagnostic = rejection_ ? describe_rejection(*rejection_) : outcome_detail_;
            logger_adapter::log_association_rejected(calling_ae_, called_ae_, diagnostic);
            if (events_ && events_->has_subscribers(event_type::association_rejected)) {
                association_event e;
                e.type = event_type::association_rejected;
                e.rejection = rejection_;
                e.detail = diagnostic;
                publish(std::move(e));
            }
            break;
        }

        default:
            logger_adapter::log_association_aborted(calling_ae_, called_ae_, outcome_,
                                                    outcome_detail_);
            if (events_ && events_->has_subscribers(event_type::association_aborted)) {
                association_event e;
                e.type = event_type::association_aborted;
                e.abort = peer_abort_;
                e.detail = outcome_detail_;
                publish(std::move(e));
            }
            break;
    }

    publish_simple(event_type::connection_closed);
}

// =============================================================================
// Receive Path
// =============================================================================

auto association::make_deadline(duration timeout) -> deadline {
    if (timeout.count() <= 0) {
        return std::nullopt;
    }
    return clock::now() + timeout;
}

auto association::read_pdu(deadline until) -> Result<pdu> {
    if (!transport_ || !transport_->is_open()) {
        return make_error_info(error_codes::connection_closed, "Transport is closed");
    }

    std::array<uint8_t, receive_chunk_size> buffer{};
    for (;;) {
        auto frame = framer_.next_frame();
        if (frame.is_err()) {
            return frame.error();
        }
        if (frame.value()) {
            return decode_frame(*frame.value());
        }

        duration wait{0};
        if (until) {
            auto now = clock::now();
            if (now >= *until) {
                return make_error_info(error_codes::receive_timeout, "Timed out waiting for PDU",
                                       remote_address_);
            }
            wait = std::max(duration{1},
                            std::chrono::duration_cast<duration>(*until - now));
        }

        auto received = transport_->receive_some(buffer, wait);
        if (received.is_err()) {
            return received.error();
        }
        framer_.feed(std::span<const uint8_t>(buffer.data(), received.value()));
    }
}

auto association::try_read_pdu() -> Result<std::optional<pdu>> {
    if (!transport_ || !transport_->is_open()) {
        return make_error_info(error_codes::connection_closed, "Transport is closed");
    }

    std::array<uint8_t, receive_chunk_size> buffer{};
    for (;;) {
        auto frame = framer_.next_frame();
        if (frame.is_err()) {
            return frame.error();
        }
        if (frame.value()) {
            auto decoded = decode_frame(*frame.value());
            if (decoded.is_err()) {
                return decoded.error();
            }
            return std::optional<pdu>(std::move(decoded.value()));
        }

        auto received = transport_->receive_available(buffer);
        if (received.is_err()) {
            return received.error();
        }
        if (received.value() == 0) {
            return std::optional<pdu>{};
        }
        framer_.feed(std::span<const uint8_t>(buffer.data(), received.value()));
    }
}

auto association::decode_frame(const std::vector<uint8_t>& frame) -> Result<pdu> {
    auto decoded = pdu_decoder::decode(frame);
    if (decoded.is_err()) {
        return decoded.error();
    }

    if (events_ && events_->has_subscribers(event_type::pdu_received)) {
        association_event e;
        e.type = event_type::pdu_received;
        e.pdu = type_of(decoded.value());
        e.pdu_length = frame.size();
        publish(std::move(e));
    }
    return decoded;
}

VoidResult association::pump(deadline until, int timeout_code) {
    if (!machine_.is_established()) {
        if (machine_.state() == ul_state::released) {
            return dul_void_error(error_codes::already_released, "Association was released");
        }
        if (machine_.state() == ul_state::aborted) {
            return dul_void_error(error_codes::association_aborted, "Association was aborted");
        }
        return dul_void_error(error_codes::association_not_established,
                              "Association is not established",
                              std::string(to_string(machine_.state())));
    }

    auto received = read_pdu(until);
    if (received.is_err()) {
        return on_receive_error(received.error(), timeout_code);
    }
    return process_incoming(received.value());
}

VoidResult association::process_incoming(const pdu& value) {
    switch (type_of(value)) {
        case pdu_type::p_data_tf: {
            (void)fire(ul_event::evt10);
            auto completed = assembler_.feed(std::get<p_data_tf_pdu>(value));
            if (completed.is_err()) {
                return fail_with_abort(ul_event::evt15, abort_reason::invalid_pdu_parameter,
                                       error_codes::protocol_violation,
                                       completed.error().message);
            }
            for (auto& message : completed.value()) {
                if (events_ && events_->has_subscribers(event_type::dimse_received)) {
                    association_event e;
                    e.type = event_type::dimse_received;
                    e.command = message.message.command();
                    e.message_id = message.message.message_id();
                    e.context_id = message.context_id;
                    if (message.message.is_response()) {
                        e.status = message.message.status();
                    }
                    publish(std::move(e));
                }
                inbox_.push_back(std::move(message));
            }
            return ok();
        }

        case pdu_type::release_rq: {
            (void)fire(ul_event::evt12);
            const pdu reply{acse::release_response()};
            (void)fire(ul_event::evt14, &reply);
            await_close();
            return dul_void_error(error_codes::already_released, "Peer released the association",
                                  peer_ae());
        }

        case pdu_type::abort:
            peer_abort_ = std::get<abort_pdu>(value);
            outcome_ = association_outcome::aborted_by_peer;
            outcome_detail_ = std::string(to_string(peer_abort_->reason));
            (void)fire(ul_event::evt16);
            return dul_void_error(error_codes::association_aborted, "Peer aborted the association",
                                  outcome_detail_);

        default:
            return fail_with_abort(event_for(type_of(value)), abort_reason::unexpected_pdu,
                                   error_codes::protocol_violation,
                                   std::string("Unexpected ") +
                                       std::string(to_string(type_of(value))));
    }
}

// =============================================================================
// Failure Handling
// =============================================================================

auto association::on_receive_error(const error_info& error, int timeout_code) -> error_info {
    if (error.code == error_codes::receive_timeout) {
        outcome_ = association_outcome::timed_out;
        outcome_detail_ = error.message;
        local_timeout();
        return make_error_info(timeout_code, "Timed out waiting for peer", remote_address_);
    }

    if (is_decode_error(error.code)) {
        return fail_with_abort(ul_event::evt19, abort_reason_for(error), error.code,
                               error.message);
    }

    // Transport closed or failed underneath us
    if (!machine_.is_terminal()) {
        outcome_ = association_outcome::aborted_by_peer;
        outcome_detail_ = error.message;
        close_transport();
        (void)fire(ul_event::evt17);
    }
    return error;
}

auto association::fail_with_abort(ul_event event, abort_reason reason, int code,
                                   const std::string& message) -> error_info {
    logger_adapter::warn("Aborting association with {}: {}", remote_address_, message);
    outcome_ = association_outcome::protocol_error;
    outcome_detail_ = message;

    const pdu abort_value{acse::abort(abort_source::service_provider, reason)};
    (void)fire(event, &abort_value);
    close_transport();
    if (!machine_.is_terminal()) {
        (void)fire(ul_event::evt17);
    }
    return make_error_info(code, message, remote_address_);
}

void association::local_timeout() {
    if (machine_.is_terminal()) {
        return;
    }
    if (machine_.state() == ul_state::sta2 || machine_.state() == ul_state::sta13) {
        (void)fire(ul_event::evt18);
        return;
    }
    const pdu value{acse::abort(abort_source::service_user)};
    (void)fire(ul_event::evt15, &value);
    close_transport();
    if (!machine_.is_terminal()) {
        (void)fire(ul_event::evt17);
    }
}

void association::await_close() {
    while (machine_.state() == ul_state::sta13) {
        auto remaining = artim_.remaining();
        if (!remaining) {
            close_transport();
            (void)fire(ul_event::evt17);
            return;
        }
        if (remaining->count() == 0) {
            (void)fire(ul_event::evt18);
            return;
        }

        auto received = read_pdu(clock::now() + *remaining);
        if (received.is_err()) {
            if (received.error().code == error_codes::receive_timeout) {
                (void)fire(ul_event::evt18);
            } else if (is_decode_error(received.error().code)) {
                const pdu value{acse::abort(abort_source::service_provider,
                                            abort_reason_for(received.error()))};
                (void)fire(ul_event::evt19, &value);
                framer_.reset();
            } else {
                close_transport();
                (void)fire(ul_event::evt17);
            }
            continue;
        }
        (void)fire(event_for(type_of(received.value())));
    }
}

// =============================================================================
// Event Publication
// =============================================================================

void association::publish(association_event event) const {
    if (!events_) {
        return;
    }
    event.calling_ae = calling_ae_;
    event.called_ae = called_ae_;
    event.remote_address = remote_address_;
    events_->publish(event);
}

void association::publish_simple(event_type type, std::string detail) const {
    if (!events_ || !events_->has_subscribers(type)) {
        return;
    }
    association_event e;
    e.type = type;
    e.detail = std::move(detail);
    publish(std::move(e));
}

}  // namespace dul::network
