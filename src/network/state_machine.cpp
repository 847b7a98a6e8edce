/**
 * @file state_machine.cpp
 * @brief PS3.8 Table 9-10 transitions
 */

#include "dul/network/state_machine.hpp"

namespace dul::network {

namespace {

using enum ul_state;
using a = ul_action;

[[nodiscard]] constexpr bool in_range(ul_state s, ul_state lo, ul_state hi) noexcept {
    return static_cast<uint8_t>(s) >= static_cast<uint8_t>(lo) &&
           static_cast<uint8_t>(s) <= static_cast<uint8_t>(hi);
}

/// Sta3 and Sta5 to Sta12: states where an association PDU is unexpected
[[nodiscard]] constexpr bool awaiting_or_established(ul_state s) noexcept {
    return s == sta3 || in_range(s, sta5, sta12);
}

}  // namespace

// =============================================================================
// transition
// =============================================================================

bool transition::closes_transport() const noexcept {
    switch (action) {
        case ul_action::ae_4:
        case ul_action::ar_3:
        case ul_action::ar_5:
        case ul_action::aa_2:
        case ul_action::aa_3:
        case ul_action::aa_4:
        case ul_action::aa_5:
        case ul_action::protocol_abort:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Table Lookup
// =============================================================================

auto state_machine::lookup(ul_state s, ul_event event) noexcept -> std::optional<ul_action> {
    if (is_terminal(s)) {
        return std::nullopt;
    }

    switch (event) {
        case ul_event::evt1:
            if (s == sta1) return a::ae_1;
            break;

        case ul_event::evt2:
            if (s == sta4) return a::ae_2;
            break;

        case ul_event::evt3:
        case ul_event::evt4:
            if (s == sta2) return a::aa_1;
            if (s == sta5) return event == ul_event::evt3 ? a::ae_3 : a::ae_4;
            if (awaiting_or_established(s)) return a::aa_8;
            if (s == sta13) return a::aa_6;
            break;

        case ul_event::evt5:
            if (s == sta1) return a::ae_5;
            break;

        case ul_event::evt6:
            if (s == sta2) return a::ae_6;
            if (awaiting_or_established(s)) return a::aa_8;
            if (s == sta13) return a::aa_7;
            break;

        case ul_event::evt7:
            if (s == sta3) return a::ae_7;
            break;

        case ul_event::evt8:
            if (s == sta3) return a::ae_8;
            break;

        case ul_event::evt9:
            if (s == sta6) return a::dt_1;
            if (s == sta8) return a::ar_7;
            break;

        case ul_event::evt10:
            if (s == sta2) return a::aa_1;
            if (s == sta6) return a::dt_2;
            if (s == sta7) return a::ar_6;
            if (awaiting_or_established(s)) return a::aa_8;
            if (s == sta13) return a::aa_6;
            break;

        case ul_event::evt11:
            if (s == sta6) return a::ar_1;
            break;

        case ul_event::evt12:
            if (s == sta2) return a::aa_1;
            if (s == sta6) return a::ar_2;
            if (s == sta7) return a::ar_8;
            if (awaiting_or_established(s)) return a::aa_8;
            if (s == sta13) return a::aa_6;
            break;

        case ul_event::evt13:
            if (s == sta2) return a::aa_1;
            if (s == sta7 || s == sta11) return a::ar_3;
            if (s == sta10) return a::ar_10;
            if (awaiting_or_established(s)) return a::aa_8;
            if (s == sta13) return a::aa_6;
            break;

        case ul_event::evt14:
            if (s == sta8 || s == sta12) return a::ar_4;
            if (s == sta9) return a::ar_9;
            break;

        case ul_event::evt15:
            if (s == sta4) return a::aa_2;
            if (awaiting_or_established(s)) return a::aa_1;
            break;

        case ul_event::evt16:
            if (s == sta2 || s == sta13) return a::aa_2;
            if (awaiting_or_established(s)) return a::aa_3;
            break;

        case ul_event::evt17:
            if (s == sta2) return a::aa_5;
            if (in_range(s, sta3, sta12)) return a::aa_4;
            if (s == sta13) return a::ar_5;
            break;

        case ul_event::evt18:
            if (s == sta2 || s == sta13) return a::aa_2;
            break;

        case ul_event::evt19:
            if (s == sta2) return a::aa_1;
            if (awaiting_or_established(s)) return a::aa_8;
            if (s == sta13) return a::aa_7;
            break;
    }
    return std::nullopt;
}

// =============================================================================
// Event Processing
// =============================================================================

auto state_machine::process(ul_event event, bool acceptable) -> transition {
    if (is_terminal()) {
        return transition{state_, state_, event, ul_action::none, true, artim_command::none};
    }

    auto action = lookup(state_, event);
    if (!action) {
        transition t{state_, ul_state::aborted, event, ul_action::protocol_abort, false,
                     artim_command::stop};
        state_ = ul_state::aborted;
        pending_outcome_.reset();
        return t;
    }

    return apply(*action, event, acceptable);
}

auto state_machine::resolve_pending() const noexcept -> ul_state {
    return pending_outcome_.value_or(ul_state::aborted);
}

auto state_machine::apply(ul_action action, ul_event event, bool acceptable) -> transition {
    transition t{state_, state_, event, action, true, artim_command::none};

    switch (action) {
        case a::ae_1: t.to = sta4; break;
        case a::ae_2: t.to = sta5; break;
        case a::ae_3: t.to = sta6; break;
        case a::ae_4: t.to = rejected; break;

        case a::ae_5:
            t.to = sta2;
            t.artim = artim_command::start;
            break;

        case a::ae_6:
            if (acceptable) {
                t.to = sta3;
                t.artim = artim_command::stop;
            } else {
                pending_outcome_ = rejected;
                t.to = sta13;
                t.artim = artim_command::start;
            }
            break;

        case a::ae_7: t.to = sta6; break;

        case a::ae_8:
            pending_outcome_ = rejected;
            t.to = sta13;
            t.artim = artim_command::start;
            break;

        case a::dt_1:
        case a::dt_2:
            t.to = sta6;
            break;

        case a::ar_1: t.to = sta7; break;
        case a::ar_2: t.to = sta8; break;
        case a::ar_3: t.to = released; break;

        case a::ar_4:
            pending_outcome_ = released;
            t.to = sta13;
            t.artim = artim_command::start;
            break;

        case a::ar_5:
            t.to = resolve_pending();
            t.artim = artim_command::stop;
            break;

        case a::ar_6: t.to = sta7; break;
        case a::ar_7: t.to = sta8; break;
        case a::ar_8: t.to = role_ == association_role::requestor ? sta9 : sta10; break;
        case a::ar_9: t.to = sta11; break;
        case a::ar_10: t.to = sta12; break;

        case a::aa_1:
        case a::aa_8:
            pending_outcome_ = aborted;
            t.to = sta13;
            t.artim = artim_command::start;
            break;

        case a::aa_2:
            t.to = state_ == sta13 ? resolve_pending() : aborted;
            t.artim = artim_command::stop;
            break;

        case a::aa_3:
        case a::aa_4:
        case a::aa_5:
            t.to = aborted;
            t.artim = artim_command::stop;
            break;

        case a::aa_6:
            t.to = sta13;
            break;

        case a::aa_7:
            pending_outcome_ = aborted;
            t.to = sta13;
            break;

        case a::none:
        case a::protocol_abort:
            t.to = aborted;
            t.defined = false;
            break;
    }

    state_ = t.to;
    if (is_terminal()) {
        pending_outcome_.reset();
    }
    return t;
}

// =============================================================================
// ARTIM Timer
// =============================================================================

void artim_timer::start(clock::time_point now) noexcept {
    if (timeout_.count() <= 0) {
        deadline_.reset();
        return;
    }
    deadline_ = now + timeout_;
}

void artim_timer::apply(artim_command command, clock::time_point now) noexcept {
    switch (command) {
        case artim_command::start: start(now); break;
        case artim_command::stop: stop(); break;
        case artim_command::none: break;
    }
}

auto artim_timer::remaining(clock::time_point now) const noexcept -> std::optional<duration> {
    if (!deadline_) {
        return std::nullopt;
    }
    if (now >= *deadline_) {
        return duration::zero();
    }
    return std::chrono::duration_cast<duration>(*deadline_ - now);
}

// =============================================================================
// Conversion Functions
// =============================================================================

auto to_string(ul_state state) noexcept -> std::string_view {
    switch (state) {
        case sta1: return "Sta1 (Idle)";
        case sta2: return "Sta2 (Awaiting A-ASSOCIATE-RQ)";
        case sta3: return "Sta3 (Awaiting local A-ASSOCIATE response)";
        case sta4: return "Sta4 (Awaiting transport connection)";
        case sta5: return "Sta5 (Awaiting A-ASSOCIATE-AC/RJ)";
        case sta6: return "Sta6 (Established)";
        case sta7: return "Sta7 (Awaiting A-RELEASE-RP)";
        case sta8: return "Sta8 (Awaiting local A-RELEASE response)";
        case sta9: return "Sta9 (Collision requestor, awaiting local response)";
        case sta10: return "Sta10 (Collision acceptor, awaiting A-RELEASE-RP)";
        case sta11: return "Sta11 (Collision requestor, awaiting A-RELEASE-RP)";
        case sta12: return "Sta12 (Collision acceptor, awaiting local response)";
        case sta13: return "Sta13 (Awaiting transport close)";
        case released: return "Released";
        case aborted: return "Aborted";
        case rejected: return "Rejected";
    }
    return "Unknown";
}

auto to_string(ul_event event) noexcept -> std::string_view {
    switch (event) {
        case ul_event::evt1: return "Evt1 (A-ASSOCIATE request)";
        case ul_event::evt2: return "Evt2 (Transport connect confirm)";
        case ul_event::evt3: return "Evt3 (A-ASSOCIATE-AC received)";
        case ul_event::evt4: return "Evt4 (A-ASSOCIATE-RJ received)";
        case ul_event::evt5: return "Evt5 (Transport connect indication)";
        case ul_event::evt6: return "Evt6 (A-ASSOCIATE-RQ received)";
        case ul_event::evt7: return "Evt7 (A-ASSOCIATE response accept)";
        case ul_event::evt8: return "Evt8 (A-ASSOCIATE response reject)";
        case ul_event::evt9: return "Evt9 (P-DATA request)";
        case ul_event::evt10: return "Evt10 (P-DATA-TF received)";
        case ul_event::evt11: return "Evt11 (A-RELEASE request)";
        case ul_event::evt12: return "Evt12 (A-RELEASE-RQ received)";
        case ul_event::evt13: return "Evt13 (A-RELEASE-RP received)";
        case ul_event::evt14: return "Evt14 (A-RELEASE response)";
        case ul_event::evt15: return "Evt15 (A-ABORT request)";
        case ul_event::evt16: return "Evt16 (A-ABORT received)";
        case ul_event::evt17: return "Evt17 (Transport closed)";
        case ul_event::evt18: return "Evt18 (ARTIM expired)";
        case ul_event::evt19: return "Evt19 (Invalid PDU)";
    }
    return "Unknown";
}

auto to_string(ul_action action) noexcept -> std::string_view {
    switch (action) {
        case a::none: return "none";
        case a::ae_1: return "AE-1";
        case a::ae_2: return "AE-2";
        case a::ae_3: return "AE-3";
        case a::ae_4: return "AE-4";
        case a::ae_5: return "AE-5";
        case a::ae_6: return "AE-6";
        case a::ae_7: return "AE-7";
        case a::ae_8: return "AE-8";
        case a::dt_1: return "DT-1";
        case a::dt_2: return "DT-2";
        case a::ar_1: return "AR-1";
        case a::ar_2: return "AR-2";
        case a::ar_3: return "AR-3";
        case a::ar_4: return "AR-4";
        case a::ar_5: return "AR-5";
        case a::ar_6: return "AR-6";
        case a::ar_7: return "AR-7";
        case a::ar_8: return "AR-8";
        case a::ar_9: return "AR-9";
        case a::ar_10: return "AR-10";
        case a::aa_1: return "AA-1";
        case a::aa_2: return "AA-2";
        case a::aa_3: return "AA-3";
        case a::aa_4: return "AA-4";
        case a::aa_5: return "AA-5";
        case a::aa_6: return "AA-6";
        case a::aa_7: return "AA-7";
        case a::aa_8: return "AA-8";
        case a::protocol_abort: return "protocol-abort";
    }
    return "unknown";
}

}  // namespace dul::network
