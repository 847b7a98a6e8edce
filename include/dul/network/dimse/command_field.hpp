/**
 * @file command_field.hpp
 * @brief DIMSE command field values (0000,0100)
 *
 * @see DICOM PS3.7 Section 9.3 - DIMSE-C Service and Protocol
 * @see DICOM PS3.7 Section 10.3 - DIMSE-N Service and Protocol
 */

#ifndef DUL_NETWORK_DIMSE_COMMAND_FIELD_HPP
#define DUL_NETWORK_DIMSE_COMMAND_FIELD_HPP

#include <cstdint>
#include <string_view>

namespace dul::network::dimse {

/**
 * @brief DIMSE command field values.
 *
 * A response carries the request value with bit 15 set. C-CANCEL-RQ has
 * no response.
 */
enum class command_field : uint16_t {
    // ========================================================================
    // DIMSE-C
    // ========================================================================
    c_store_rq = 0x0001,
    c_store_rsp = 0x8001,
    c_get_rq = 0x0010,
    c_get_rsp = 0x8010,
    c_find_rq = 0x0020,
    c_find_rsp = 0x8020,
    c_move_rq = 0x0021,
    c_move_rsp = 0x8021,
    c_echo_rq = 0x0030,
    c_echo_rsp = 0x8030,
    c_cancel_rq = 0x0FFF,

    // ========================================================================
    // DIMSE-N
    // ========================================================================
    n_event_report_rq = 0x0100,
    n_event_report_rsp = 0x8100,
    n_get_rq = 0x0110,
    n_get_rsp = 0x8110,
    n_set_rq = 0x0120,
    n_set_rsp = 0x8120,
    n_action_rq = 0x0130,
    n_action_rsp = 0x8130,
    n_create_rq = 0x0140,
    n_create_rsp = 0x8140,
    n_delete_rq = 0x0150,
    n_delete_rsp = 0x8150,
};

[[nodiscard]] constexpr bool is_request(command_field cmd) noexcept {
    return (static_cast<uint16_t>(cmd) & 0x8000) == 0;
}

[[nodiscard]] constexpr bool is_response(command_field cmd) noexcept {
    return (static_cast<uint16_t>(cmd) & 0x8000) != 0;
}

/// true for C-STORE, C-GET, C-FIND, C-MOVE, C-ECHO and C-CANCEL
[[nodiscard]] constexpr bool is_dimse_c(command_field cmd) noexcept {
    const auto value = static_cast<uint16_t>(cmd) & 0x7FFF;
    return value <= 0x0030 || value == 0x0FFF;
}

[[nodiscard]] constexpr bool is_dimse_n(command_field cmd) noexcept {
    const auto value = static_cast<uint16_t>(cmd) & 0x7FFF;
    return value >= 0x0100 && value <= 0x0150;
}

/**
 * @brief Whether a command value names one of the defined operations.
 *
 * Used when decoding a received command set; anything else is a
 * protocol error.
 */
[[nodiscard]] constexpr bool is_known_command(uint16_t value) noexcept {
    switch (static_cast<command_field>(value)) {
        case command_field::c_store_rq: case command_field::c_store_rsp:
        case command_field::c_get_rq: case command_field::c_get_rsp:
        case command_field::c_find_rq: case command_field::c_find_rsp:
        case command_field::c_move_rq: case command_field::c_move_rsp:
        case command_field::c_echo_rq: case command_field::c_echo_rsp:
        case command_field::c_cancel_rq:
        case command_field::n_event_report_rq: case command_field::n_event_report_rsp:
        case command_field::n_get_rq: case command_field::n_get_rsp:
        case command_field::n_set_rq: case command_field::n_set_rsp:
        case command_field::n_action_rq: case command_field::n_action_rsp:
        case command_field::n_create_rq: case command_field::n_create_rsp:
        case command_field::n_delete_rq: case command_field::n_delete_rsp:
            return true;
    }
    return false;
}

/**
 * @brief Operations answered by a sequence of pending responses that the
 *        requestor may interrupt with C-CANCEL-RQ.
 */
[[nodiscard]] constexpr bool is_cancellable(command_field cmd) noexcept {
    return cmd == command_field::c_find_rq ||
           cmd == command_field::c_get_rq ||
           cmd == command_field::c_move_rq;
}

/// @note Not meaningful for C-CANCEL-RQ
[[nodiscard]] constexpr command_field get_response_command(
    command_field request) noexcept {
    return static_cast<command_field>(static_cast<uint16_t>(request) | 0x8000);
}

[[nodiscard]] constexpr command_field get_request_command(
    command_field response) noexcept {
    return static_cast<command_field>(static_cast<uint16_t>(response) & 0x7FFF);
}

[[nodiscard]] constexpr std::string_view to_string(command_field cmd) noexcept {
    switch (cmd) {
        case command_field::c_store_rq: return "C-STORE-RQ";
        case command_field::c_store_rsp: return "C-STORE-RSP";
        case command_field::c_get_rq: return "C-GET-RQ";
        case command_field::c_get_rsp: return "C-GET-RSP";
        case command_field::c_find_rq: return "C-FIND-RQ";
        case command_field::c_find_rsp: return "C-FIND-RSP";
        case command_field::c_move_rq: return "C-MOVE-RQ";
        case command_field::c_move_rsp: return "C-MOVE-RSP";
        case command_field::c_echo_rq: return "C-ECHO-RQ";
        case command_field::c_echo_rsp: return "C-ECHO-RSP";
        case command_field::c_cancel_rq: return "C-CANCEL-RQ";
        case command_field::n_event_report_rq: return "N-EVENT-REPORT-RQ";
        case command_field::n_event_report_rsp: return "N-EVENT-REPORT-RSP";
        case command_field::n_get_rq: return "N-GET-RQ";
        case command_field::n_get_rsp: return "N-GET-RSP";
        case command_field::n_set_rq: return "N-SET-RQ";
        case command_field::n_set_rsp: return "N-SET-RSP";
        case command_field::n_action_rq: return "N-ACTION-RQ";
        case command_field::n_action_rsp: return "N-ACTION-RSP";
        case command_field::n_create_rq: return "N-CREATE-RQ";
        case command_field::n_create_rsp: return "N-CREATE-RSP";
        case command_field::n_delete_rq: return "N-DELETE-RQ";
        case command_field::n_delete_rsp: return "N-DELETE-RSP";
    }
    return "UNKNOWN";
}

}  // namespace dul::network::dimse

#endif  // DUL_NETWORK_DIMSE_COMMAND_FIELD_HPP
