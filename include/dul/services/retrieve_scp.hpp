/**
 * @file retrieve_scp.hpp
 * @brief DICOM Retrieve SCP service (C-MOVE/C-GET handler)
 *
 * The Retrieve SCP looks up the instances matching a retrieve identifier and
 * either transfers them to a move destination over a separate association
 * (C-MOVE) or returns them to the requester on the same association (C-GET).
 *
 * @see DICOM PS3.4 Section C - Query/Retrieve Service Class
 * @see DICOM PS3.7 Section 9.1.3 - C-MOVE Service
 * @see DICOM PS3.7 Section 9.1.4 - C-GET Service
 */

#ifndef DUL_SERVICES_RETRIEVE_SCP_HPP
#define DUL_SERVICES_RETRIEVE_SCP_HPP

#include "dul/core/result.hpp"
#include "dul/network/request_context.hpp"
#include "dul/services/scp_service.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dul::services {

// =============================================================================
// Handler Types
// =============================================================================

/**
 * @brief One composite instance to transfer in a C-STORE sub-operation
 */
struct retrieve_item {
    std::string sop_class_uid;
    std::string sop_instance_uid;

    /// Transfer syntax the encoded data set uses
    std::string transfer_syntax;

    std::vector<uint8_t> dataset;
};

/**
 * @brief Network address of a move destination
 */
struct retrieve_destination {
    std::string host;
    uint16_t port{0};
};

/**
 * @brief Looks up the instances matching a retrieve request
 *
 * The identifier is available as ctx.request_dataset(), or decoded as
 * ctx.decoded_dataset() when the server has a dataset_codec.
 */
using retrieve_handler = std::function<Result<std::vector<retrieve_item>>(
    const network::request_context& ctx)>;

/**
 * @brief Maps a Move Destination AE title to a network address
 *
 * @return std::nullopt if the AE title is unknown
 */
using destination_resolver =
    std::function<std::optional<retrieve_destination>(const std::string& ae_title)>;

// =============================================================================
// Retrieve SCP Class
// =============================================================================

/**
 * @brief Retrieve SCP service for handling C-MOVE and C-GET requests
 *
 * ## C-MOVE Message Flow
 *
 * ```
 * Viewer (SCU)          Archive (SCP)               Destination (SCP)
 *     │  C-MOVE-RQ          │                            │
 *     │────────────────────►│  A-ASSOCIATE (sub-assoc.)  │
 *     │                     │───────────────────────────►│
 *     │  C-MOVE-RSP         │  C-STORE-RQ (image 1)      │
 *     │  (Pending)          │───────────────────────────►│
 *     │◄────────────────────│◄───────────────────────────│
 *     │  ... (repeat)       │  ... (repeat)              │
 *     │  C-MOVE-RSP         │  A-RELEASE                 │
 *     │  (Success)          │───────────────────────────►│
 *     │◄────────────────────│                            │
 * ```
 *
 * The sub-association runs as a thread pool job; the request thread only
 * relays its progress as pending responses and forwards C-CANCEL.
 *
 * ## C-GET Message Flow
 *
 * ```
 * Viewer (SCU/SCP)                Archive (SCP/SCU)
 *     │  C-GET-RQ                      │
 *     │───────────────────────────────►│
 *     │  C-GET-RSP (Pending)           │
 *     │◄───────────────────────────────│
 *     │  C-STORE-RQ (image 1)          │  (on same association)
 *     │◄───────────────────────────────│
 *     │  C-STORE-RSP (Success)         │
 *     │───────────────────────────────►│
 *     │  C-GET-RSP (Success)           │
 *     │◄───────────────────────────────│
 * ```
 *
 * @example Usage
 * @code
 * auto scp = std::make_shared<retrieve_scp>();
 * scp->set_retrieve_handler([&archive](const network::request_context& ctx) {
 *     return archive.instances_for(ctx.request_dataset());
 * });
 * scp->set_destination_resolver([](const std::string& ae)
 *         -> std::optional<retrieve_destination> {
 *     if (ae == "VIEWER") return retrieve_destination{"192.168.1.10", 11112};
 *     return std::nullopt;
 * });
 * (void)server.register_service(scp);
 * @endcode
 */
class retrieve_scp final : public scp_service {
public:
    using duration = std::chrono::milliseconds;

    // =========================================================================
    // Construction
    // =========================================================================

    /**
     * @brief Construct a Retrieve SCP
     *
     * The storage SOP classes offered for C-GET default to the well-known
     * image storage classes of the UID registry.
     */
    retrieve_scp();

    ~retrieve_scp() override = default;

    // =========================================================================
    // Configuration
    // =========================================================================

    void set_retrieve_handler(retrieve_handler handler);

    void set_destination_resolver(destination_resolver resolver);

    /**
     * @brief Storage SOP classes the requestor may receive through C-GET
     *
     * Each is offered with the SCP role for the requestor.
     */
    void set_storage_sop_classes(std::vector<std::string> sop_classes);

    /// How often C-MOVE progress is relayed as pending responses
    void set_progress_interval(duration interval);

    // =========================================================================
    // scp_service Interface Implementation
    // =========================================================================

    /**
     * @return Patient Root and Study Root Move/Get SOP Classes
     */
    [[nodiscard]] std::vector<std::string> supported_sop_classes() const override;

    /**
     * @brief Handle a C-MOVE-RQ or C-GET-RQ
     *
     * @return Success, Warning (0xB000), Failure (0xA702), Cancel (0xFE00)
     *         or Move destination unknown (0xA801); the counters are
     *         attached to the final response through ctx
     */
    [[nodiscard]] network::dimse::status_code handle_request(
        network::request_context& ctx) override;

    /// Retrieve classes plus the storage classes with the requestor as SCP
    [[nodiscard]] std::vector<network::supported_context> presentation_contexts(
        const std::vector<std::string>& transfer_syntaxes) const override;

    /**
     * @return "Retrieve SCP"
     */
    [[nodiscard]] std::string_view service_name() const noexcept override;

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] size_t move_operations() const noexcept;
    [[nodiscard]] size_t get_operations() const noexcept;

    /// Instances stored with success or warning status
    [[nodiscard]] size_t images_transferred() const noexcept;

    void reset_statistics() noexcept;

    /**
     * @brief Final status for a set of finished sub-operations
     *
     * Success when nothing failed or warned, Failure (0xA702) when every
     * sub-operation failed, Warning (0xB000) otherwise.
     */
    [[nodiscard]] static network::dimse::status_code completion_status(
        const network::subop_counters& counters) noexcept;

private:
    [[nodiscard]] network::dimse::status_code handle_c_move(network::request_context& ctx);
    [[nodiscard]] network::dimse::status_code handle_c_get(network::request_context& ctx);

    /// Run the handler; on failure the error comment is set on ctx
    [[nodiscard]] std::optional<std::vector<retrieve_item>> find_items(
        network::request_context& ctx);

    retrieve_handler retrieve_handler_;
    destination_resolver destination_resolver_;
    std::vector<std::string> storage_sop_classes_;
    duration progress_interval_{50};

    std::atomic<size_t> move_operations_{0};
    std::atomic<size_t> get_operations_{0};
    std::atomic<size_t> images_transferred_{0};
};

}  // namespace dul::services

#endif  // DUL_SERVICES_RETRIEVE_SCP_HPP
