/**
 * @file status_codes.hpp
 * @brief DIMSE status values (0000,0900)
 *
 * @see DICOM PS3.7 Annex C - Status Type Encoding
 */

#ifndef DUL_NETWORK_DIMSE_STATUS_CODES_HPP
#define DUL_NETWORK_DIMSE_STATUS_CODES_HPP

#include "command_field.hpp"

#include <cstdint>
#include <string_view>

namespace dul::network::dimse {

using status_code = uint16_t;

/// @name General
/// @{
constexpr status_code status_success = 0x0000;
constexpr status_code status_pending = 0xFF00;
/// Pending, optional keys were not supported (C-FIND)
constexpr status_code status_pending_warning = 0xFF01;
constexpr status_code status_cancel = 0xFE00;
/// @}

/// @name Refusals
/// @{
constexpr status_code status_refused_out_of_resources = 0xA700;
constexpr status_code status_refused_out_of_resources_matches = 0xA701;
constexpr status_code status_refused_out_of_resources_subops = 0xA702;
constexpr status_code status_refused_move_destination_unknown = 0xA801;
constexpr status_code status_refused_sop_class_not_supported = 0x0122;
constexpr status_code status_refused_not_authorized = 0x0124;
/// @}

/// @name Errors
/// @{
constexpr status_code status_error_dataset_mismatch = 0xA900;
constexpr status_code status_error_cannot_understand = 0xC000;

/// "Unable to process" for C-STORE; the C-FIND/C-GET/C-MOVE variants follow
/// the same 0xCx10 / 0xCx11 pattern.
constexpr status_code status_store_error_cannot_decode = 0xC210;
constexpr status_code status_store_error_processing = 0xC211;
constexpr status_code status_find_error_cannot_decode = 0xC310;
constexpr status_code status_find_error_processing = 0xC311;
constexpr status_code status_get_error_cannot_decode = 0xC410;
constexpr status_code status_get_error_processing = 0xC411;
constexpr status_code status_move_error_cannot_decode = 0xC510;
constexpr status_code status_move_error_processing = 0xC511;

constexpr status_code status_error_duplicate_sop_instance = 0x0111;
constexpr status_code status_error_missing_attribute = 0x0120;
constexpr status_code status_error_missing_attribute_value = 0x0121;
/// @}

/// @name DIMSE-N failures
/// @{
constexpr status_code status_error_attribute_list_error = 0x0107;
constexpr status_code status_error_processing_failure = 0x0110;
constexpr status_code status_error_no_such_object_instance = 0x0112;
constexpr status_code status_error_no_such_event_type = 0x0113;
constexpr status_code status_error_attribute_value_out_of_range = 0x0116;
constexpr status_code status_error_invalid_object_instance = 0x0117;
constexpr status_code status_error_no_such_sop_class = 0x0118;
constexpr status_code status_error_class_instance_conflict = 0x0119;
constexpr status_code status_error_no_such_action_type = 0x0123;
constexpr status_code status_error_duplicate_invocation = 0x0210;
constexpr status_code status_error_unrecognized_operation = 0x0211;
constexpr status_code status_error_mistyped_argument = 0x0212;
constexpr status_code status_error_resource_limitation = 0x0213;
/// @}

/// @name Warnings
/// @{
/// Coercion of data elements (C-STORE), or sub-operations complete with
/// one or more failures or warnings (C-GET/C-MOVE)
constexpr status_code status_warning_subops_complete_failures = 0xB000;
constexpr status_code status_warning_elements_discarded = 0xB006;
constexpr status_code status_warning_dataset_mismatch = 0xB007;
/// @}

[[nodiscard]] constexpr bool is_success(status_code status) noexcept {
    return status == status_success;
}

[[nodiscard]] constexpr bool is_pending(status_code status) noexcept {
    return status == status_pending || status == status_pending_warning;
}

[[nodiscard]] constexpr bool is_cancel(status_code status) noexcept {
    return status == status_cancel;
}

[[nodiscard]] constexpr bool is_warning(status_code status) noexcept {
    return (status & 0xF000) == 0xB000 || status == 0x0001 ||
           status == 0x0107 || status == 0x0116;
}

/**
 * @brief Failure statuses: 0xAxxx, 0xCxxx and the DIMSE-N 0x01xx / 0x02xx range.
 *
 * 0x0107 and 0x0116 are warnings for N-SET/N-GET and are excluded.
 */
[[nodiscard]] constexpr bool is_failure(status_code status) noexcept {
    const auto high_nibble = (status & 0xF000) >> 12;
    if (status == 0x0107 || status == 0x0116) {
        return false;
    }
    return high_nibble == 0xA || high_nibble == 0xC ||
           (status >= 0x0100 && status <= 0x02FF);
}

/// A status that ends a (possibly multi-response) operation
[[nodiscard]] constexpr bool is_final(status_code status) noexcept {
    return !is_pending(status);
}

/**
 * @brief Status sent when a request's data set cannot be decoded.
 */
[[nodiscard]] constexpr status_code decode_failure_status(command_field request) noexcept {
    switch (request) {
        case command_field::c_store_rq: return status_store_error_cannot_decode;
        case command_field::c_find_rq: return status_find_error_cannot_decode;
        case command_field::c_get_rq: return status_get_error_cannot_decode;
        case command_field::c_move_rq: return status_move_error_cannot_decode;
        default: return status_error_processing_failure;
    }
}

/**
 * @brief Status sent when a request handler fails unexpectedly.
 */
[[nodiscard]] constexpr status_code processing_failure_status(command_field request) noexcept {
    switch (request) {
        case command_field::c_store_rq: return status_store_error_processing;
        case command_field::c_find_rq: return status_find_error_processing;
        case command_field::c_get_rq: return status_get_error_processing;
        case command_field::c_move_rq: return status_move_error_processing;
        default: return status_error_processing_failure;
    }
}

[[nodiscard]] constexpr std::string_view status_description(
    status_code status) noexcept {
    switch (status) {
        case status_success: return "Success";
        case status_pending: return "Pending";
        case status_pending_warning: return "Pending (Warning)";
        case status_cancel: return "Canceled";
        case status_refused_out_of_resources: return "Refused: Out of resources";
        case status_refused_out_of_resources_matches:
            return "Refused: Unable to calculate number of matches";
        case status_refused_out_of_resources_subops:
            return "Refused: Unable to perform sub-operations";
        case status_refused_move_destination_unknown:
            return "Refused: Move destination unknown";
        case status_refused_sop_class_not_supported:
            return "Refused: SOP class not supported";
        case status_refused_not_authorized: return "Refused: Not authorized";
        case status_error_dataset_mismatch:
            return "Error: Data set does not match SOP class";
        case status_error_cannot_understand: return "Error: Cannot understand";
        case status_store_error_cannot_decode:
        case status_find_error_cannot_decode:
        case status_get_error_cannot_decode:
        case status_move_error_cannot_decode:
            return "Error: Unable to decode data set";
        case status_store_error_processing:
        case status_find_error_processing:
        case status_get_error_processing:
        case status_move_error_processing:
            return "Error: Unable to process";
        case status_error_duplicate_sop_instance:
            return "Error: Duplicate SOP instance";
        case status_error_missing_attribute: return "Error: Missing attribute";
        case status_error_missing_attribute_value:
            return "Error: Missing attribute value";
        case status_error_attribute_list_error:
            return "Warning: Attribute list error";
        case status_error_processing_failure: return "Error: Processing failure";
        case status_error_no_such_object_instance: return "Error: No such object instance";
        case status_error_no_such_event_type: return "Error: No such event type";
        case status_error_attribute_value_out_of_range:
            return "Warning: Attribute value out of range";
        case status_error_invalid_object_instance:
            return "Error: Invalid object instance";
        case status_error_no_such_sop_class: return "Error: No such SOP class";
        case status_error_class_instance_conflict:
            return "Error: Class-instance conflict";
        case status_error_no_such_action_type: return "Error: No such action type";
        case status_error_duplicate_invocation: return "Error: Duplicate invocation";
        case status_error_unrecognized_operation:
            return "Error: Unrecognized operation";
        case status_error_mistyped_argument: return "Error: Mistyped argument";
        case status_error_resource_limitation: return "Error: Resource limitation";
        case status_warning_subops_complete_failures:
            return "Warning: Sub-operations complete with failures";
        case status_warning_elements_discarded: return "Warning: Elements discarded";
        case status_warning_dataset_mismatch:
            return "Warning: Data set does not match SOP class";
        default:
            if (is_warning(status)) return "Warning";
            if (is_failure(status)) return "Failure";
            return "Unknown status";
    }
}

[[nodiscard]] constexpr std::string_view status_category(
    status_code status) noexcept {
    if (is_success(status)) return "Success";
    if (is_pending(status)) return "Pending";
    if (is_cancel(status)) return "Cancel";
    if (is_warning(status)) return "Warning";
    if (is_failure(status)) return "Failure";
    return "Unknown";
}

}  // namespace dul::network::dimse

#endif  // DUL_NETWORK_DIMSE_STATUS_CODES_HPP
