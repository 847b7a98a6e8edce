/**
 * @file state_machine.hpp
 * @brief DICOM Upper Layer state machine (PS3.8 Section 9.2)
 *
 * A pure implementation of the Upper Layer state transition table. The
 * machine consumes events and reports the action the caller must perform
 * (send a PDU, close the transport, start or stop ARTIM); it never performs
 * I/O itself.
 *
 * The standard's "Sta1 after the transport closes" is split into three
 * terminal states so that callers can tell how the association ended.
 *
 * @see DICOM PS3.8 Table 9-10 - DICOM Upper Layer Protocol State Transition Table
 */

#ifndef DUL_NETWORK_STATE_MACHINE_HPP
#define DUL_NETWORK_STATE_MACHINE_HPP

#include "dul/network/pdu_types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dul::network {

// =============================================================================
// States, Events, Actions
// =============================================================================

enum class ul_state : uint8_t {
    sta1 = 1,   ///< Idle
    sta2,       ///< Transport open, awaiting A-ASSOCIATE-RQ
    sta3,       ///< Awaiting local A-ASSOCIATE response primitive
    sta4,       ///< Awaiting transport connection to open
    sta5,       ///< Awaiting A-ASSOCIATE-AC or A-ASSOCIATE-RJ
    sta6,       ///< Association established, ready for data transfer
    sta7,       ///< Awaiting A-RELEASE-RP
    sta8,       ///< Awaiting local A-RELEASE response primitive
    sta9,       ///< Release collision requestor: awaiting local A-RELEASE response
    sta10,      ///< Release collision acceptor: awaiting A-RELEASE-RP
    sta11,      ///< Release collision requestor: awaiting A-RELEASE-RP
    sta12,      ///< Release collision acceptor: awaiting local A-RELEASE response
    sta13,      ///< Awaiting transport connection close
    released,   ///< Terminal: orderly release completed
    aborted,    ///< Terminal: association aborted
    rejected,   ///< Terminal: association request rejected
};

enum class ul_event : uint8_t {
    evt1 = 1,  ///< A-ASSOCIATE request (local user)
    evt2,      ///< Transport connect confirmation
    evt3,      ///< A-ASSOCIATE-AC PDU received
    evt4,      ///< A-ASSOCIATE-RJ PDU received
    evt5,      ///< Transport connection indication
    evt6,      ///< A-ASSOCIATE-RQ PDU received
    evt7,      ///< A-ASSOCIATE response primitive (accept)
    evt8,      ///< A-ASSOCIATE response primitive (reject)
    evt9,      ///< P-DATA request primitive
    evt10,     ///< P-DATA-TF PDU received
    evt11,     ///< A-RELEASE request primitive
    evt12,     ///< A-RELEASE-RQ PDU received
    evt13,     ///< A-RELEASE-RP PDU received
    evt14,     ///< A-RELEASE response primitive
    evt15,     ///< A-ABORT request primitive
    evt16,     ///< A-ABORT PDU received
    evt17,     ///< Transport connection closed indication
    evt18,     ///< ARTIM timer expired
    evt19,     ///< Unrecognized or invalid PDU received
};

enum class ul_action : uint8_t {
    none,
    ae_1, ae_2, ae_3, ae_4, ae_5, ae_6, ae_7, ae_8,
    dt_1, dt_2,
    ar_1, ar_2, ar_3, ar_4, ar_5, ar_6, ar_7, ar_8, ar_9, ar_10,
    aa_1, aa_2, aa_3, aa_4, aa_5, aa_6, aa_7, aa_8,
    /// No transition defined for the (state, event) pair
    protocol_abort,
};

enum class association_role : uint8_t {
    requestor,
    acceptor,
};

/// What the caller must do with the ARTIM timer after a transition
enum class artim_command : uint8_t {
    none,
    start,  ///< Start, or restart if running
    stop,
};

/**
 * @brief Result of processing one event
 */
struct transition {
    ul_state from{ul_state::sta1};
    ul_state to{ul_state::sta1};
    ul_event event{ul_event::evt1};
    ul_action action{ul_action::none};

    /// false when the pair has no entry in the table
    bool defined{true};

    artim_command artim{artim_command::none};

    /// Whether the action puts an A-ABORT PDU on the wire
    [[nodiscard]] bool sends_abort() const noexcept {
        return action == ul_action::aa_1 || action == ul_action::aa_7 ||
               action == ul_action::aa_8 || action == ul_action::protocol_abort;
    }

    /// Whether the action closes the transport
    [[nodiscard]] bool closes_transport() const noexcept;
};

// =============================================================================
// State Machine
// =============================================================================

/**
 * @brief Upper Layer protocol state machine for one association
 *
 * @example
 * @code
 * state_machine sm(association_role::requestor);
 * sm.process(ul_event::evt1);   // Sta4, AE-1: connect
 * sm.process(ul_event::evt2);   // Sta5, AE-2: send A-ASSOCIATE-RQ
 * sm.process(ul_event::evt3);   // Sta6, AE-3: established
 * @endcode
 */
class state_machine {
public:
    explicit state_machine(association_role role) noexcept : role_(role) {}

    /**
     * @brief Apply an event
     *
     * @param acceptable For Evt6 only: whether the A-ASSOCIATE-RQ is
     *        acceptable to the service provider. When false, AE-6 rejects
     *        directly and moves to Sta13.
     */
    auto process(ul_event event, bool acceptable = true) -> transition;

    [[nodiscard]] auto state() const noexcept -> ul_state { return state_; }
    [[nodiscard]] auto role() const noexcept -> association_role { return role_; }

    [[nodiscard]] bool is_established() const noexcept { return state_ == ul_state::sta6; }
    [[nodiscard]] bool is_terminal() const noexcept { return is_terminal(state_); }

    /// Outcome Sta13 resolves to once the transport closes
    [[nodiscard]] auto pending_outcome() const noexcept -> std::optional<ul_state> {
        return pending_outcome_;
    }

    [[nodiscard]] static constexpr bool is_terminal(ul_state state) noexcept {
        return state == ul_state::released || state == ul_state::aborted ||
               state == ul_state::rejected;
    }

    /**
     * @brief Action the table assigns to a pair, nullopt when undefined
     *
     * Terminal states have no entries.
     */
    [[nodiscard]] static auto lookup(ul_state state, ul_event event) noexcept
        -> std::optional<ul_action>;

private:
    auto apply(ul_action action, ul_event event, bool acceptable) -> transition;
    [[nodiscard]] auto resolve_pending() const noexcept -> ul_state;

    association_role role_;
    ul_state state_{ul_state::sta1};
    std::optional<ul_state> pending_outcome_;
};

/**
 * @brief Event raised by receiving a PDU of the given type
 */
[[nodiscard]] constexpr auto event_for(pdu_type type) noexcept -> ul_event {
    switch (type) {
        case pdu_type::associate_rq: return ul_event::evt6;
        case pdu_type::associate_ac: return ul_event::evt3;
        case pdu_type::associate_rj: return ul_event::evt4;
        case pdu_type::p_data_tf: return ul_event::evt10;
        case pdu_type::release_rq: return ul_event::evt12;
        case pdu_type::release_rp: return ul_event::evt13;
        case pdu_type::abort: return ul_event::evt16;
    }
    return ul_event::evt19;
}

// =============================================================================
// ARTIM Timer
// =============================================================================

/**
 * @brief Association Request/Reject/Release timer
 *
 * Holds a deadline only; the owner polls expired() or waits for
 * remaining().
 */
class artim_timer {
public:
    using clock = std::chrono::steady_clock;
    using duration = std::chrono::milliseconds;

    explicit artim_timer(duration timeout = duration{30000}) noexcept : timeout_(timeout) {}

    /// Start or restart; a zero timeout leaves the timer stopped
    void start(clock::time_point now = clock::now()) noexcept;

    void stop() noexcept { deadline_.reset(); }

    /// Apply the command carried by a transition
    void apply(artim_command command, clock::time_point now = clock::now()) noexcept;

    [[nodiscard]] bool is_running() const noexcept { return deadline_.has_value(); }

    [[nodiscard]] bool expired(clock::time_point now = clock::now()) const noexcept {
        return deadline_ && now >= *deadline_;
    }

    /// Time left, zero once expired, nullopt when stopped
    [[nodiscard]] auto remaining(clock::time_point now = clock::now()) const noexcept
        -> std::optional<duration>;

    [[nodiscard]] auto timeout() const noexcept -> duration { return timeout_; }
    void set_timeout(duration timeout) noexcept { timeout_ = timeout; }

private:
    duration timeout_;
    std::optional<clock::time_point> deadline_;
};

// =============================================================================
// Conversion Functions
// =============================================================================

[[nodiscard]] auto to_string(ul_state state) noexcept -> std::string_view;
[[nodiscard]] auto to_string(ul_event event) noexcept -> std::string_view;
[[nodiscard]] auto to_string(ul_action action) noexcept -> std::string_view;

[[nodiscard]] constexpr auto to_string(association_role role) noexcept -> std::string_view {
    return role == association_role::requestor ? "requestor" : "acceptor";
}

}  // namespace dul::network

#endif  // DUL_NETWORK_STATE_MACHINE_HPP
