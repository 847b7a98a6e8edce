/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the DICOM upper layer
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for dul_system, integrating with common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace dul {

/**
 * @brief Result type alias for upper layer operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief dul_system error codes
 *
 * Error code range: -700 to -899
 * Provides access to both common error codes and upper layer codes.
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    // ========================================================================
    // Protocol error codes (-700 to -799)
    // ========================================================================
    constexpr int dul_base = -700;

    // PDU codec errors (-700 to -719)
    constexpr int pdu_encoding_error = dul_base - 0;
    constexpr int pdu_decoding_error = dul_base - 1;
    constexpr int incomplete_pdu = dul_base - 2;
    constexpr int invalid_pdu_type = dul_base - 3;
    constexpr int invalid_item_type = dul_base - 4;
    constexpr int malformed_pdu = dul_base - 5;
    constexpr int pdu_too_large = dul_base - 6;

    // Negotiation errors (-720 to -739)
    constexpr int negotiation_failed = dul_base - 20;
    constexpr int no_acceptable_context = dul_base - 21;
    constexpr int context_limit_exceeded = dul_base - 22;
    constexpr int invalid_context_id = dul_base - 23;

    // DIMSE errors (-740 to -759)
    constexpr int dimse_error = dul_base - 40;
    constexpr int invalid_command_set = dul_base - 41;
    constexpr int missing_command_element = dul_base - 42;
    constexpr int fragment_sequence_error = dul_base - 43;
    constexpr int dataset_decode_failed = dul_base - 44;
    constexpr int dataset_encode_failed = dul_base - 45;

    // Association errors (-760 to -779)
    constexpr int association_rejected = dul_base - 60;
    constexpr int association_aborted = dul_base - 61;
    constexpr int invalid_association_state = dul_base - 62;
    constexpr int protocol_violation = dul_base - 63;
    constexpr int connection_failed = dul_base - 64;
    constexpr int connection_timeout = dul_base - 65;
    constexpr int send_failed = dul_base - 66;
    constexpr int receive_failed = dul_base - 67;
    constexpr int receive_timeout = dul_base - 68;
    constexpr int connection_closed = dul_base - 69;
    constexpr int acse_timeout = dul_base - 70;
    constexpr int dimse_timeout = dul_base - 71;
    constexpr int network_timeout = dul_base - 72;
    constexpr int artim_timeout = dul_base - 73;
    constexpr int release_failed = dul_base - 74;
    constexpr int already_released = dul_base - 75;

    // Server errors (-780 to -799)
    constexpr int server_already_running = dul_base - 80;
    constexpr int server_not_running = dul_base - 81;
    constexpr int invalid_configuration = dul_base - 82;
    constexpr int bind_failed = dul_base - 83;

    // ========================================================================
    // Service-specific error codes (-800 to -899)
    // ========================================================================
    constexpr int service_base = -800;

    constexpr int unexpected_command = service_base - 0;
    constexpr int handler_not_set = service_base - 1;
    constexpr int handler_failed = service_base - 2;
    constexpr int operation_cancelled = service_base - 3;
    constexpr int association_not_established = service_base - 4;
    constexpr int unexpected_response = service_base - 5;

    // C-MOVE/C-GET sub-operation errors (-840 to -859)
    constexpr int retrieve_missing_destination = service_base - 40;
    constexpr int retrieve_unknown_destination = service_base - 41;
    constexpr int retrieve_sub_operation_failed = service_base - 42;

    // Registry errors (-880 to -899)
    constexpr int duplicate_registration = service_base - 80;
    constexpr int unknown_uid = service_base - 81;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;
using kcenon::common::get_value;
using kcenon::common::get_error;

/**
 * @brief Create an error result with module context
 * @tparam T The result value type
 * @param code Error code from dul::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> dul_error(int code, const std::string& message,
                           const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "dul");
    }
    return kcenon::common::make_error<T>(code, message, "dul", details);
}

/**
 * @brief Create a void error result
 * @param code Error code from dul::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult dul_void_error(int code, const std::string& message,
                                 const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "dul"});
    }
    return VoidResult(error_info{code, message, "dul", details});
}

} // namespace dul

// Convenience macros for Result pattern usage

/**
 * @brief Return early if expression is an error
 */
#define DUL_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define DUL_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)

/**
 * @brief Return error if condition is true
 */
#define DUL_RETURN_ERROR_IF(condition, code, message) \
    COMMON_RETURN_ERROR_IF(condition, code, message, "dul")
