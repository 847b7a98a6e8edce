/**
 * @file verification_scp.hpp
 * @brief DICOM Verification SCP service (C-ECHO handler)
 *
 * C-ECHO is the simplest DICOM service, used to verify network connectivity
 * between DICOM applications (similar to ping).
 *
 * @see DICOM PS3.4 Section A.4 - Verification Service Class
 * @see DICOM PS3.7 Section 9.1 - C-ECHO Service
 */

#ifndef DUL_SERVICES_VERIFICATION_SCP_HPP
#define DUL_SERVICES_VERIFICATION_SCP_HPP

#include "dul/services/scp_service.hpp"

#include <atomic>
#include <cstdint>

namespace dul::services {

/**
 * @brief Verification SCP service for handling C-ECHO requests
 *
 * ```
 * SCU                                    SCP (this class)
 *  │  C-ECHO-RQ  (MessageID: N)           │
 *  │─────────────────────────────────────►│ handle_request()
 *  │  C-ECHO-RSP (Status: 0x0000)         │
 *  │◄─────────────────────────────────────│
 * ```
 *
 * @example Usage
 * @code
 * dicom_server server{config};
 * (void)server.register_service(std::make_shared<verification_scp>());
 * @endcode
 */
class verification_scp final : public scp_service {
public:
    verification_scp() = default;
    ~verification_scp() override = default;

    /**
     * @return Vector containing only the Verification SOP Class UID
     */
    [[nodiscard]] std::vector<std::string> supported_sop_classes() const override;

    /**
     * @brief Answer a C-ECHO-RQ with Success
     *
     * Any other command on the Verification SOP class is answered with
     * "unrecognized operation" (0x0211).
     */
    [[nodiscard]] network::dimse::status_code handle_request(
        network::request_context& ctx) override;

    /**
     * @return "Verification SCP"
     */
    [[nodiscard]] std::string_view service_name() const noexcept override;

    /// Number of C-ECHO requests answered
    [[nodiscard]] auto echo_count() const noexcept -> uint64_t;

private:
    std::atomic<uint64_t> echo_count_{0};
};

}  // namespace dul::services

#endif  // DUL_SERVICES_VERIFICATION_SCP_HPP
