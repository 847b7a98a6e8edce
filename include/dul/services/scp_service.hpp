/**
 * @file scp_service.hpp
 * @brief Base class for DICOM SCP (Service Class Provider) services
 *
 * Each service answers the DIMSE requests of the SOP Classes it lists. The
 * server selects the service by the SOP Class UID of the request, hands it
 * a request_context and sends the status it returns as the final response.
 *
 * @see DICOM PS3.4 - Service Class Specifications
 * @see DICOM PS3.7 - Message Exchange
 */

#ifndef DUL_SERVICES_SCP_SERVICE_HPP
#define DUL_SERVICES_SCP_SERVICE_HPP

#include "dul/network/dimse/status_codes.hpp"
#include "dul/network/presentation_negotiator.hpp"
#include "dul/network/request_context.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dul::services {

/**
 * @brief Abstract base class for DICOM SCP services
 *
 * @example Usage
 * @code
 * class verification_scp : public scp_service {
 * public:
 *     std::vector<std::string> supported_sop_classes() const override {
 *         return {"1.2.840.10008.1.1"};
 *     }
 *
 *     network::dimse::status_code handle_request(
 *         network::request_context& ctx) override {
 *         return network::dimse::status_success;
 *     }
 * };
 * @endcode
 */
class scp_service {
public:
    // =========================================================================
    // Construction / Destruction
    // =========================================================================

    scp_service() = default;
    virtual ~scp_service() = default;

    // Non-copyable but movable
    scp_service(const scp_service&) = delete;
    scp_service& operator=(const scp_service&) = delete;
    scp_service(scp_service&&) = default;
    scp_service& operator=(scp_service&&) = default;

    // =========================================================================
    // Service Interface
    // =========================================================================

    /**
     * @brief Get the list of SOP Class UIDs supported by this service
     */
    [[nodiscard]] virtual std::vector<std::string> supported_sop_classes() const = 0;

    /**
     * @brief Handle one DIMSE request
     *
     * Pending responses are sent through ctx; the returned status becomes
     * the final response. Exceptions are caught by the server and answered
     * with the operation's processing-failure status.
     */
    [[nodiscard]] virtual network::dimse::status_code handle_request(
        network::request_context& ctx) = 0;

    /**
     * @brief Presentation contexts the acceptor must offer for this service
     *
     * The default offers every supported SOP class with the given transfer
     * syntaxes and the default roles. Services that need the requestor to
     * act as SCP (C-GET storage) override this.
     */
    [[nodiscard]] virtual std::vector<network::supported_context> presentation_contexts(
        const std::vector<std::string>& transfer_syntaxes) const {
        std::vector<network::supported_context> contexts;
        for (auto& uid : supported_sop_classes()) {
            contexts.emplace_back(std::move(uid), transfer_syntaxes);
        }
        return contexts;
    }

    // =========================================================================
    // Service Information
    // =========================================================================

    /**
     * @brief Get the service name for logging/debugging
     */
    [[nodiscard]] virtual std::string_view service_name() const noexcept = 0;

    /**
     * @brief Check if this service supports a specific SOP Class
     */
    [[nodiscard]] bool supports_sop_class(std::string_view sop_class_uid) const {
        const auto classes = supported_sop_classes();
        for (const auto& uid : classes) {
            if (uid == sop_class_uid) {
                return true;
            }
        }
        return false;
    }
};

/**
 * @brief Shared pointer type for SCP services
 */
using scp_service_ptr = std::shared_ptr<scp_service>;

}  // namespace dul::services

#endif  // DUL_SERVICES_SCP_SERVICE_HPP
