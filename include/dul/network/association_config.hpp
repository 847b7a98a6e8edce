/**
 * @file association_config.hpp
 * @brief Requestor and acceptor configuration for association setup
 *
 * @see DICOM PS3.8 Section 7.1 - A-ASSOCIATE Service
 * @see DICOM PS3.7 Annex D.3.3 - Extended Negotiation
 */

#ifndef DUL_NETWORK_ASSOCIATION_CONFIG_HPP
#define DUL_NETWORK_ASSOCIATION_CONFIG_HPP

#include "dul/network/pdu_types.hpp"
#include "dul/network/presentation_negotiator.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dul::network {

/// Implementation Class UID sent when the configuration leaves it empty
inline constexpr std::string_view default_implementation_class_uid =
    "1.2.826.0.1.3680043.2.1545.1";

/// Implementation Version Name sent when the configuration leaves it empty
inline constexpr std::string_view default_implementation_version_name = "DUL_SYSTEM_001";

// =============================================================================
// Timeouts
// =============================================================================

/**
 * @brief Timers applied to one association
 *
 * A zero duration disables the corresponding timeout.
 */
struct timeout_config {
    using duration = std::chrono::milliseconds;

    /// Wait for A-ASSOCIATE-AC/RJ and A-RELEASE-RP
    duration acse{30000};

    /// Wait for a DIMSE response once established
    duration dimse{30000};

    /// Inactivity on an open connection
    duration network{60000};

    /// ARTIM: A-ASSOCIATE-RQ after connect, transport close after release/reject
    duration artim{30000};

    /// TCP connect on the requestor side
    duration connect{10000};
};

// =============================================================================
// Extended Negotiation
// =============================================================================

/**
 * @brief Optional User Information sub-items proposed by a requestor
 */
struct extended_negotiation {
    std::optional<async_operations_window> async_operations;
    std::vector<scp_scu_role_selection> role_selections;
    std::vector<sop_class_extended_negotiation> sop_class_extended;
    std::vector<sop_class_common_extended_negotiation> sop_class_common_extended;
    std::optional<user_identity_rq> user_identity;
};

// =============================================================================
// Requestor Configuration
// =============================================================================

/**
 * @brief Configuration for an association requestor (SCU side)
 *
 * @example
 * @code
 * association_config config;
 * config.calling_ae_title = "MY_SCU";
 * config.called_ae_title = "REMOTE_SCP";
 * config.proposed_contexts.push_back({1, "1.2.840.10008.1.1",
 *                                     {"1.2.840.10008.1.2.1", "1.2.840.10008.1.2"}});
 * @endcode
 */
struct association_config {
    std::string calling_ae_title;
    std::string called_ae_title;
    std::vector<presentation_context_rq> proposed_contexts;

    /// Largest P-DATA-TF we are willing to receive, 0 for unlimited
    uint32_t max_pdu_length = default_max_pdu_length;

    std::string implementation_class_uid{default_implementation_class_uid};
    std::string implementation_version_name{default_implementation_version_name};

    extended_negotiation extended;
    timeout_config timeouts;

    /// Largest PDU accepted from the peer regardless of what it announces
    std::size_t receive_ceiling = 64 * 1024 * 1024;
};

// =============================================================================
// Acceptor Configuration
// =============================================================================

/**
 * @brief Acceptor verdict on a proposed User Identity
 */
struct user_identity_decision {
    bool accepted{false};

    /// Returned in a User Identity AC item when a positive response was requested
    std::string server_response;
};

/**
 * @brief Configuration for an association acceptor (SCP side)
 */
struct acceptor_config {
    std::string ae_title;

    /// Reject requests whose Called AE Title differs from ae_title
    bool check_called_ae{true};

    /// Allowed calling AE titles; empty accepts any
    std::vector<std::string> calling_ae_whitelist;

    std::vector<supported_context> supported_contexts;

    uint32_t max_pdu_length = default_max_pdu_length;
    std::string implementation_class_uid{default_implementation_class_uid};
    std::string implementation_version_name{default_implementation_version_name};

    /// Window returned when the requestor proposes asynchronous operations
    async_operations_window async_window{1, 1};

    /**
     * @brief Decides the application information echoed for a SOP class
     *
     * Called once per proposed SOP Class Extended Negotiation item. Returning
     * nullopt omits the item from the A-ASSOCIATE-AC. Unset means no item is
     * echoed.
     */
    std::function<std::optional<std::vector<uint8_t>>(
        const sop_class_extended_negotiation&)> sop_class_extended_policy;

    /**
     * @brief Validates a proposed User Identity
     *
     * Unset accepts every identity without a server response.
     */
    std::function<user_identity_decision(const user_identity_rq&)> user_identity_policy;

    timeout_config timeouts;
    std::size_t receive_ceiling = 64 * 1024 * 1024;
};

}  // namespace dul::network

#endif  // DUL_NETWORK_ASSOCIATION_CONFIG_HPP
