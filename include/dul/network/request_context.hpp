/**
 * @file request_context.hpp
 * @brief Handler-side view of one incoming DIMSE request
 *
 * A request_context is created by the server for every request it
 * dispatches. Handlers use it to read the request, emit pending responses,
 * poll for C-CANCEL and shape the final response.
 */

#ifndef DUL_NETWORK_REQUEST_CONTEXT_HPP
#define DUL_NETWORK_REQUEST_CONTEXT_HPP

#include "dul/core/result.hpp"
#include "dul/network/dimse/dimse_message.hpp"
#include "dul/network/dimse/status_codes.hpp"
#include "dul/network/presentation_negotiator.hpp"

#include <any>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dul::network {

class association;

/**
 * @brief Sub-operation counters carried by C-GET and C-MOVE responses
 */
struct subop_counters {
    uint16_t remaining{0};
    uint16_t completed{0};
    uint16_t failed{0};
    uint16_t warning{0};

    bool operator==(const subop_counters&) const = default;
};

/**
 * @brief Context passed to request handlers and scp_service implementations
 *
 * Valid only for the duration of the handler call.
 *
 * @example Multi-response handler
 * @code
 * auto handler = [&](request_context& ctx) -> dimse::status_code {
 *     for (const auto& match : matches) {
 *         if (ctx.is_cancelled()) {
 *             return dimse::status_cancel;
 *         }
 *         (void)ctx.send_pending(dimse::status_pending, match);
 *     }
 *     return dimse::status_success;
 * };
 * @endcode
 */
class request_context {
public:
    request_context(association& owner, uint8_t context_id, dimse::dimse_message request);

    request_context(const request_context&) = delete;
    request_context& operator=(const request_context&) = delete;

    // =========================================================================
    // Request
    // =========================================================================

    [[nodiscard]] auto owning_association() noexcept -> association& { return owner_; }

    [[nodiscard]] auto context_id() const noexcept -> uint8_t { return context_id_; }

    /// The accepted presentation context the request arrived on
    [[nodiscard]] auto context() const noexcept -> const negotiated_context& { return context_; }

    [[nodiscard]] auto transfer_syntax() const noexcept -> const std::string& {
        return context_.transfer_syntax;
    }

    [[nodiscard]] auto request() const noexcept -> const dimse::dimse_message& {
        return request_;
    }

    /// Encoded request data set; empty when the request carries none
    [[nodiscard]] auto request_dataset() const noexcept -> std::span<const uint8_t> {
        return request_.dataset();
    }

    /// Data set decoded by the installed dataset_codec, empty without one
    [[nodiscard]] auto decoded_dataset() const noexcept -> const std::any& { return decoded_; }
    void set_decoded_dataset(std::any dataset) { decoded_ = std::move(dataset); }

    // =========================================================================
    // Responses
    // =========================================================================

    /**
     * @brief Send one pending response (C-FIND, C-GET, C-MOVE)
     *
     * Also drains arrived PDUs so that a following is_cancelled() sees a
     * C-CANCEL that is already on the wire.
     */
    [[nodiscard]] VoidResult send_pending(
        dimse::status_code status,
        std::optional<std::vector<uint8_t>> dataset = std::nullopt);

    /// Pending C-GET/C-MOVE response carrying sub-operation counters
    [[nodiscard]] VoidResult send_pending(dimse::status_code status,
                                          const subop_counters& counters);

    [[nodiscard]] auto pending_sent() const noexcept -> std::size_t { return pending_sent_; }

    /**
     * @brief true once the requestor sent C-CANCEL for this request
     *
     * Drains arrived PDUs without blocking. Stays true once observed.
     */
    [[nodiscard]] bool is_cancelled();

    /// Data set attached to the final response
    void set_response_dataset(std::vector<uint8_t> dataset) {
        response_dataset_ = std::move(dataset);
    }

    void set_error_comment(std::string comment) { error_comment_ = std::move(comment); }

    /// Counters attached to the final C-GET/C-MOVE response
    void set_final_counters(const subop_counters& counters) { final_counters_ = counters; }

    /// Affected SOP Instance UID for the final response (N-CREATE)
    void set_affected_sop_instance_uid(std::string uid) { affected_instance_ = std::move(uid); }

    /**
     * @brief Build the final response for this request
     */
    [[nodiscard]] auto final_response(dimse::status_code status) const -> dimse::dimse_message;

    // =========================================================================
    // C-GET Sub-operations
    // =========================================================================

    /**
     * @brief Send one C-STORE sub-operation over this association and wait
     *        for its response
     *
     * Requires an accepted context for sop_class_uid, in transfer_syntax, on
     * which the requestor took the SCP role.
     *
     * @return The C-STORE response status, no_acceptable_context, or the
     *         association error
     */
    [[nodiscard]] auto store_sub_operation(std::string_view sop_class_uid,
                                           std::string_view sop_instance_uid,
                                           std::string_view transfer_syntax,
                                           std::vector<uint8_t> dataset)
        -> Result<dimse::status_code>;

private:
    association& owner_;
    uint8_t context_id_;
    negotiated_context context_;
    dimse::dimse_message request_;
    std::any decoded_;

    std::size_t pending_sent_{0};
    bool cancelled_{false};

    std::optional<std::vector<uint8_t>> response_dataset_;
    std::optional<std::string> error_comment_;
    std::optional<subop_counters> final_counters_;
    std::optional<std::string> affected_instance_;
};

}  // namespace dul::network

#endif  // DUL_NETWORK_REQUEST_CONTEXT_HPP
