/**
 * @file dimse_scu.hpp
 * @brief Requestor-side helpers for every DIMSE-C and DIMSE-N operation
 *
 * dimse_scu builds the request, picks the accepted presentation context,
 * sends it over an established association and collects the responses,
 * including the pending responses of C-FIND, C-GET and C-MOVE and the
 * C-STORE sub-operations that arrive during a C-GET.
 *
 * @see DICOM PS3.7 Section 9 - DIMSE-C
 * @see DICOM PS3.7 Section 10 - DIMSE-N
 */

#ifndef DUL_SERVICES_DIMSE_SCU_HPP
#define DUL_SERVICES_DIMSE_SCU_HPP

#include "dul/core/dicom_tag.hpp"
#include "dul/core/result.hpp"
#include "dul/network/dimse/dimse_message.hpp"
#include "dul/network/dimse/status_codes.hpp"
#include "dul/network/request_context.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dul::network {
class association;
}

namespace dul::services {

// =============================================================================
// Results
// =============================================================================

/**
 * @brief Result of a C-FIND
 */
struct find_result {
    /// Identifiers of the pending responses that carried one
    std::vector<std::vector<uint8_t>> matches;

    /// Final DIMSE status code
    network::dimse::status_code status{0};

    /// Number of pending responses received
    size_t total_pending{0};

    bool cancel_sent{false};

    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool is_success() const noexcept {
        return status == network::dimse::status_success;
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return status == network::dimse::status_cancel;
    }
};

/**
 * @brief Result of a C-GET or C-MOVE
 */
struct retrieve_result {
    network::dimse::status_code status{0};

    /// Counters of the final response (remaining is only set on Cancel)
    network::subop_counters counters;

    size_t pending_responses{0};

    /// C-STORE sub-operations answered during a C-GET
    size_t stores_received{0};

    std::optional<std::string> error_comment;

    [[nodiscard]] bool is_success() const noexcept {
        return status == network::dimse::status_success;
    }
};

/**
 * @brief Result of a DIMSE-N request
 */
struct n_result {
    network::dimse::status_code status{0};

    /// Affected SOP Instance UID of the response (assigned by N-CREATE)
    std::string affected_sop_instance_uid;

    /// Attribute list returned by the SCP
    std::optional<std::vector<uint8_t>> dataset;

    std::optional<std::string> error_comment;

    [[nodiscard]] bool is_success() const noexcept {
        return network::dimse::is_success(status);
    }
};

// =============================================================================
// Callback Types
// =============================================================================

/**
 * @brief Called for each C-FIND match
 * @return false to send C-CANCEL; later matches are still counted
 */
using find_match_callback = std::function<bool(std::span<const uint8_t> identifier)>;

/**
 * @brief Answers a C-STORE sub-operation received during a C-GET
 * @return Status for the C-STORE-RSP
 */
using get_store_handler = std::function<network::dimse::status_code(
    const network::dimse::dimse_message& store_rq, std::string_view transfer_syntax)>;

/**
 * @brief Called for each pending C-GET/C-MOVE response
 * @return false to send C-CANCEL
 */
using retrieve_progress_callback = std::function<bool(const network::subop_counters&)>;

// =============================================================================
// Configuration
// =============================================================================

struct dimse_scu_config {
    /// Wait for each response; zero uses the association's DIMSE timeout
    std::chrono::milliseconds timeout{0};

    uint16_t priority{network::dimse::priority_medium};
};

// =============================================================================
// dimse_scu Class
// =============================================================================

/**
 * @brief DIMSE requestor operations over an established association
 *
 * @example Usage
 * @code
 * auto assoc = association::connect("archive.local", 11112, config);
 * if (assoc.is_err()) {
 *     return;
 * }
 *
 * dimse_scu scu;
 * auto echo = scu.echo(*assoc.value());
 *
 * auto found = scu.find(*assoc.value(), core::uids::study_root_find, identifier,
 *     [](std::span<const uint8_t> match) { return true; });
 *
 * (void)assoc.value()->release();
 * @endcode
 */
class dimse_scu {
public:
    dimse_scu() = default;
    explicit dimse_scu(const dimse_scu_config& config);

    // =========================================================================
    // DIMSE-C
    // =========================================================================

    /// C-ECHO on the Verification SOP class
    [[nodiscard]] auto echo(network::association& assoc) -> Result<network::dimse::status_code>;

    /**
     * @brief C-STORE one encoded instance
     *
     * @param transfer_syntax Transfer syntax of dataset; the context must
     *        have been accepted with it
     */
    [[nodiscard]] auto store(network::association& assoc,
                             std::string_view sop_class_uid,
                             std::string_view sop_instance_uid,
                             std::string_view transfer_syntax,
                             std::vector<uint8_t> dataset)
        -> Result<network::dimse::status_code>;

    /**
     * @brief C-FIND, collecting every pending response until the final one
     *
     * @param on_match Optional; returning false sends C-CANCEL
     */
    [[nodiscard]] auto find(network::association& assoc,
                            std::string_view sop_class_uid,
                            std::vector<uint8_t> identifier,
                            find_match_callback on_match = {}) -> Result<find_result>;

    /**
     * @brief C-GET, answering the C-STORE sub-operations on the same association
     *
     * Without a store handler every sub-operation is answered with
     * "out of resources" (0xA700).
     */
    [[nodiscard]] auto get(network::association& assoc,
                           std::string_view sop_class_uid,
                           std::vector<uint8_t> identifier,
                           get_store_handler on_store,
                           retrieve_progress_callback on_progress = {})
        -> Result<retrieve_result>;

    /**
     * @brief C-MOVE to another application entity
     */
    [[nodiscard]] auto move(network::association& assoc,
                            std::string_view sop_class_uid,
                            std::string_view move_destination,
                            std::vector<uint8_t> identifier,
                            retrieve_progress_callback on_progress = {})
        -> Result<retrieve_result>;

    /**
     * @brief C-CANCEL an outstanding C-FIND, C-GET or C-MOVE
     * @param context_id Context the cancelled request was sent on
     */
    [[nodiscard]] VoidResult cancel(network::association& assoc,
                                    uint8_t context_id,
                                    uint16_t message_id);

    // =========================================================================
    // DIMSE-N
    // =========================================================================

    [[nodiscard]] auto n_event_report(network::association& assoc,
                                      std::string_view sop_class_uid,
                                      std::string_view sop_instance_uid,
                                      uint16_t event_type_id,
                                      std::optional<std::vector<uint8_t>> event_info = std::nullopt)
        -> Result<n_result>;

    /// @param attributes Attributes to return; empty asks for all
    [[nodiscard]] auto n_get(network::association& assoc,
                             std::string_view sop_class_uid,
                             std::string_view sop_instance_uid,
                             const std::vector<core::dicom_tag>& attributes = {})
        -> Result<n_result>;

    [[nodiscard]] auto n_set(network::association& assoc,
                             std::string_view sop_class_uid,
                             std::string_view sop_instance_uid,
                             std::vector<uint8_t> modifications) -> Result<n_result>;

    [[nodiscard]] auto n_action(network::association& assoc,
                                std::string_view sop_class_uid,
                                std::string_view sop_instance_uid,
                                uint16_t action_type_id,
                                std::optional<std::vector<uint8_t>> action_info = std::nullopt)
        -> Result<n_result>;

    /// @param sop_instance_uid May be empty; the SCP then assigns one
    [[nodiscard]] auto n_create(network::association& assoc,
                                std::string_view sop_class_uid,
                                std::string_view sop_instance_uid = "",
                                std::optional<std::vector<uint8_t>> attributes = std::nullopt)
        -> Result<n_result>;

    [[nodiscard]] auto n_delete(network::association& assoc,
                                std::string_view sop_class_uid,
                                std::string_view sop_instance_uid) -> Result<n_result>;

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] auto config() const noexcept -> const dimse_scu_config& { return config_; }

    /// Requests sent since construction, C-CANCEL included
    [[nodiscard]] size_t requests_sent() const noexcept;

private:
    /// Accepted context for a SOP class, checked for an established association
    [[nodiscard]] auto context_for(network::association& assoc,
                                   std::string_view sop_class_uid,
                                   std::string_view transfer_syntax = {}) -> Result<uint8_t>;

    [[nodiscard]] VoidResult send(network::association& assoc, uint8_t context_id,
                                  const network::dimse::dimse_message& request);

    [[nodiscard]] auto response_timeout(const network::association& assoc) const
        -> std::chrono::milliseconds;

    /// Send a DIMSE-N request and wait for its single response
    [[nodiscard]] auto n_exchange(network::association& assoc,
                                  network::dimse::dimse_message request) -> Result<n_result>;

    /// Pending/final response loop shared by C-GET and C-MOVE
    [[nodiscard]] auto retrieve(network::association& assoc,
                                uint8_t context_id,
                                network::dimse::dimse_message request,
                                const get_store_handler* on_store,
                                const retrieve_progress_callback& on_progress)
        -> Result<retrieve_result>;

    dimse_scu_config config_;
    std::atomic<size_t> requests_sent_{0};
};

}  // namespace dul::services

#endif  // DUL_SERVICES_DIMSE_SCU_HPP
