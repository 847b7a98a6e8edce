/**
 * @file association.hpp
 * @brief One DICOM association over a TCP connection
 *
 * The association owns its socket, a state_machine, the ARTIM timer and the
 * DIMSE reassembly buffer. Every PDU that crosses the wire is first run
 * through the state machine; the action it returns decides what is sent and
 * whether the transport is closed.
 *
 * An association is driven by exactly one thread. interrupt() is the only
 * member that may be called from another thread.
 *
 * @see DICOM PS3.8 Section 7 - DICOM Upper Layer Services
 * @see DICOM PS3.8 Section 9.2 - DICOM Upper Layer State Machine
 */

#ifndef DUL_NETWORK_ASSOCIATION_HPP
#define DUL_NETWORK_ASSOCIATION_HPP

#include "dul/core/result.hpp"
#include "dul/integration/logger_adapter.hpp"
#include "dul/network/acse.hpp"
#include "dul/network/association_config.hpp"
#include "dul/network/dimse/dimse_message.hpp"
#include "dul/network/dimse/pdv_fragmenter.hpp"
#include "dul/network/events.hpp"
#include "dul/network/pdu_framer.hpp"
#include "dul/network/pdu_types.hpp"
#include "dul/network/state_machine.hpp"
#include "dul/network/transport.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dul::network {

/**
 * @brief A DICOM association, requestor or acceptor side
 *
 * @example Requestor
 * @code
 * association_config config;
 * config.calling_ae_title = "MY_SCU";
 * config.called_ae_title = "ARCHIVE";
 * config.proposed_contexts = {{1, "1.2.840.10008.1.1", {"1.2.840.10008.1.2"}}};
 *
 * auto assoc = association::connect("archive.local", 11112, config);
 * if (assoc.is_ok()) {
 *     auto ctx = assoc.value()->accepted_context_id("1.2.840.10008.1.1");
 *     (void)assoc.value()->send_dimse(*ctx, dimse::make_c_echo_rq(1));
 *     auto rsp = assoc.value()->receive_dimse();
 *     (void)assoc.value()->release();
 * }
 * @endcode
 */
class association {
public:
    using clock = std::chrono::steady_clock;
    using duration = std::chrono::milliseconds;

    ~association();

    association(const association&) = delete;
    association& operator=(const association&) = delete;
    association(association&&) = delete;
    association& operator=(association&&) = delete;

    // =========================================================================
    // Establishment
    // =========================================================================

    /**
     * @brief Open a connection and negotiate an association
     *
     * @return The established association, or
     *         - connection_failed / connection_timeout when TCP connect fails
     *         - association_rejected when the peer answers A-ASSOCIATE-RJ
     *         - no_acceptable_context when the peer accepted no context
     *         - acse_timeout when no answer arrives in time
     */
    [[nodiscard]] static auto connect(const std::string& host, uint16_t port,
                                      const association_config& config,
                                      std::shared_ptr<event_dispatcher> events = nullptr)
        -> Result<std::unique_ptr<association>>;

    /**
     * @brief Run the acceptor side of establishment on an accepted connection
     *
     * @param forced_rejection When set, the request is read and answered with
     *        this A-ASSOCIATE-RJ regardless of its content
     * @return The established association, or association_rejected,
     *         artim_timeout, protocol_violation, connection_closed
     */
    [[nodiscard]] static auto accept(std::unique_ptr<tcp_transport> transport,
                                     const acceptor_config& config,
                                     std::shared_ptr<event_dispatcher> events = nullptr,
                                     std::optional<associate_rj> forced_rejection = std::nullopt)
        -> Result<std::unique_ptr<association>>;

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] auto state() const noexcept -> ul_state { return machine_.state(); }
    [[nodiscard]] auto role() const noexcept -> association_role { return machine_.role(); }
    [[nodiscard]] bool is_established() const noexcept { return machine_.is_established(); }
    [[nodiscard]] bool is_closed() const noexcept { return machine_.is_terminal(); }

    [[nodiscard]] auto calling_ae() const noexcept -> const std::string& { return calling_ae_; }
    [[nodiscard]] auto called_ae() const noexcept -> const std::string& { return called_ae_; }

    /// AE title of the other side
    [[nodiscard]] auto peer_ae() const noexcept -> const std::string& {
        return role() == association_role::requestor ? called_ae_ : calling_ae_;
    }

    [[nodiscard]] auto remote_address() const noexcept -> const std::string& {
        return remote_address_;
    }

    [[nodiscard]] auto negotiated() const noexcept -> const negotiated_parameters& {
        return params_;
    }

    [[nodiscard]] auto accepted_context_id(std::string_view abstract_syntax,
                                           std::string_view transfer_syntax = {}) const
        -> std::optional<uint8_t> {
        return params_.accepted_context_id(abstract_syntax, transfer_syntax);
    }

    /// Transfer syntax of an accepted context, nullopt otherwise
    [[nodiscard]] auto transfer_syntax_of(uint8_t context_id) const
        -> std::optional<std::string>;

    /// Set when the peer rejected (requestor) or we rejected (acceptor)
    [[nodiscard]] auto rejection() const -> std::optional<rejection_info>;

    /// Last A-ABORT received from the peer
    [[nodiscard]] auto peer_abort() const noexcept -> const std::optional<abort_pdu>& {
        return peer_abort_;
    }

    [[nodiscard]] auto timeouts() const noexcept -> const timeout_config& { return timeouts_; }

    [[nodiscard]] auto events() const noexcept -> const std::shared_ptr<event_dispatcher>& {
        return events_;
    }

    /// Allocate a Message ID for a request sent on this association
    [[nodiscard]] auto next_message_id() noexcept -> uint16_t;

    [[nodiscard]] auto bytes_sent() const noexcept -> uint64_t;
    [[nodiscard]] auto bytes_received() const noexcept -> uint64_t;

    // =========================================================================
    // Data Transfer
    // =========================================================================

    /**
     * @brief Fragment and send one DIMSE message
     * @return association_not_established, invalid_context_id, or a
     *         transport error (the association is then aborted)
     */
    [[nodiscard]] VoidResult send_dimse(uint8_t context_id, const dimse::dimse_message& message);

    /**
     * @brief Wait for the next complete DIMSE message
     *
     * Messages already drained by poll_messages() are returned first. An
     * A-RELEASE-RQ from the peer is answered automatically.
     *
     * @param timeout Zero waits indefinitely
     * @return The message, or
     *         - dimse_timeout (the association is aborted)
     *         - already_released when the peer released
     *         - association_aborted when the peer aborted
     *         - protocol_violation for an unexpected PDU
     */
    [[nodiscard]] auto receive_dimse(duration timeout) -> Result<dimse::received_message>;

    /// receive_dimse() bounded by the configured DIMSE timeout
    [[nodiscard]] auto receive_dimse() -> Result<dimse::received_message> {
        return receive_dimse(timeouts_.dimse);
    }

    /**
     * @brief Wait for the next message while nothing is outstanding
     *
     * Bounded by the network timeout; an idle association is aborted with
     * network_timeout once it expires.
     */
    [[nodiscard]] auto next_message() -> Result<dimse::received_message>;

    /**
     * @brief Wait for the response to a request sent with message_id
     *
     * Other messages that arrive meanwhile are kept for receive_dimse().
     */
    [[nodiscard]] auto receive_response(uint16_t message_id, duration timeout)
        -> Result<dimse::received_message>;

    /**
     * @brief Drain PDUs that have already arrived, without waiting
     *
     * Completed messages are queued for receive_dimse().
     */
    [[nodiscard]] VoidResult poll_messages();

    /// Remove a queued C-CANCEL-RQ for message_id; true if one was found
    [[nodiscard]] bool take_cancel(uint16_t message_id);

    /// Number of complete messages waiting to be received
    [[nodiscard]] auto pending_messages() const noexcept -> std::size_t { return inbox_.size(); }

    // =========================================================================
    // Release / Abort
    // =========================================================================

    /**
     * @brief Orderly release, including release collision
     *
     * @return Success once released, or acse_timeout (aborted),
     *         association_aborted, invalid_association_state
     */
    [[nodiscard]] VoidResult release();

    /// Send A-ABORT and close the transport without waiting for the peer
    void abort(abort_reason reason = abort_reason::not_specified);

    /// Unblock a pending wait from another thread; the owner sees connection_closed
    void interrupt() noexcept;

private:
    using deadline = std::optional<clock::time_point>;

    association(association_role role, const timeout_config& timeouts,
                std::shared_ptr<event_dispatcher> events, std::size_t receive_ceiling);

    // Protocol machinery
    VoidResult fire(ul_event event, const pdu* outgoing = nullptr, bool acceptable = true);
    VoidResult send_pdu(const pdu& value);
    void close_transport() noexcept;
    void finish();

    // Receive path
    [[nodiscard]] auto read_pdu(deadline until) -> Result<pdu>;
    [[nodiscard]] auto try_read_pdu() -> Result<std::optional<pdu>>;
    [[nodiscard]] auto decode_frame(const std::vector<uint8_t>& frame) -> Result<pdu>;
    [[nodiscard]] VoidResult pump(deadline until, int timeout_code);
    [[nodiscard]] VoidResult process_incoming(const pdu& value);
    [[nodiscard]] auto take_inbox_front() -> dimse::received_message;

    // Failure handling; each returns the error the caller should propagate
    [[nodiscard]] auto on_receive_error(const error_info& error, int timeout_code) -> error_info;
    [[nodiscard]] auto fail_with_abort(ul_event event, abort_reason reason, int code,
                                       const std::string& message) -> error_info;
    void local_timeout();
    void await_close();

    [[nodiscard]] static auto make_deadline(duration timeout) -> deadline;

    void publish(association_event event) const;
    void publish_simple(event_type type, std::string detail = {}) const;

    state_machine machine_;
    artim_timer artim_;
    timeout_config timeouts_;
    std::shared_ptr<event_dispatcher> events_;

    std::unique_ptr<tcp_transport> transport_;
    pdu_framer framer_;
    dimse::message_assembler assembler_;
    std::deque<dimse::received_message> inbox_;

    std::string calling_ae_;
    std::string called_ae_;
    std::string remote_address_;

    std::optional<associate_rq> request_;
    negotiated_parameters params_;
    std::optional<associate_rj> rejection_;
    std::optional<abort_pdu> peer_abort_;

    integration::association_outcome outcome_{integration::association_outcome::protocol_error};
    std::string outcome_detail_;
    bool finished_{false};
    uint16_t next_message_id_{1};
    uint64_t bytes_sent_{0};
    uint64_t bytes_received_{0};
};

}  // namespace dul::network

#endif  // DUL_NETWORK_ASSOCIATION_HPP
