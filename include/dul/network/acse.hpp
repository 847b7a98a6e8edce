/**
 * @file acse.hpp
 * @brief Association Control Service Element primitives
 *
 * Builds and interprets the A-ASSOCIATE, A-RELEASE and A-ABORT PDUs. The
 * acceptor side decides between accept and reject here, including the
 * extended negotiation policy hooks; the requestor side turns an
 * A-ASSOCIATE-AC into the negotiated parameter set. No I/O is performed.
 *
 * @see DICOM PS3.8 Section 7 - DICOM Upper Layer Services
 * @see DICOM PS3.7 Annex D - Association Negotiation
 */

#ifndef DUL_NETWORK_ACSE_HPP
#define DUL_NETWORK_ACSE_HPP

#include "dul/core/result.hpp"
#include "dul/network/association_config.hpp"
#include "dul/network/pdu_types.hpp"
#include "dul/network/presentation_negotiator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dul::network {

// =============================================================================
// Negotiated Parameters
// =============================================================================

/**
 * @brief Everything agreed during association establishment
 *
 * Read-only once the association is established.
 */
struct negotiated_parameters {
    /// One entry per proposed context, in proposal order
    std::vector<negotiated_context> contexts;

    /// Largest P-DATA-TF the peer accepts, 0 for unlimited
    uint32_t peer_max_pdu_length{0};

    std::string peer_implementation_class_uid;
    std::string peer_implementation_version_name;

    /// Agreed asynchronous operations window, if one was negotiated
    std::optional<async_operations_window> async_operations;

    /// SOP Class Extended items agreed by the acceptor
    std::vector<sop_class_extended_negotiation> sop_class_extended;

    /// SOP Class Common Extended items proposed by the requestor
    std::vector<sop_class_common_extended_negotiation> sop_class_common_extended;

    /// Identity proposed by the requestor (acceptor side)
    std::optional<user_identity_rq> user_identity;

    /// Server response returned by the acceptor (requestor side)
    std::optional<user_identity_ac> user_identity_response;

    /// Context with the given id, or nullptr
    [[nodiscard]] auto find_context(uint8_t id) const noexcept -> const negotiated_context*;

    /**
     * @brief First accepted context for an abstract syntax
     * @param transfer_syntax When not empty, the context must use it
     */
    [[nodiscard]] auto accepted_context_id(std::string_view abstract_syntax,
                                           std::string_view transfer_syntax = {}) const
        -> std::optional<uint8_t>;

    [[nodiscard]] bool any_accepted() const noexcept;
};

// =============================================================================
// Rejection Info
// =============================================================================

/**
 * @brief Decoded A-ASSOCIATE-RJ with a readable description
 */
struct rejection_info {
    reject_result result{reject_result::rejected_permanent};
    uint8_t source{0};
    uint8_t reason{0};
    std::string description;

    rejection_info() = default;

    explicit rejection_info(const associate_rj& rj)
        : result(rj.result)
        , source(rj.source)
        , reason(rj.reason)
        , description(describe_rejection(rj)) {}

    [[nodiscard]] bool is_transient() const noexcept {
        return result == reject_result::rejected_transient;
    }
};

// =============================================================================
// Acceptor Decision
// =============================================================================

/**
 * @brief Outcome of evaluating an A-ASSOCIATE-RQ
 */
struct association_decision {
    /// The PDU to send back
    std::variant<associate_ac, associate_rj> response;

    /// Valid only when accepted()
    negotiated_parameters params;

    /// Why the request was rejected; empty when accepted
    std::string reason;

    [[nodiscard]] bool accepted() const noexcept {
        return std::holds_alternative<associate_ac>(response);
    }
};

// =============================================================================
// ACSE
// =============================================================================

/**
 * @brief Stateless builders and interpreters for association PDUs
 *
 * @example Acceptor
 * @code
 * auto decision = acse::evaluate(rq, config);
 * if (decision.accepted()) {
 *     send(std::get<associate_ac>(decision.response));
 * } else {
 *     send(std::get<associate_rj>(decision.response));
 * }
 * @endcode
 */
class acse {
public:
    /**
     * @brief Build the A-ASSOCIATE-RQ for a requestor configuration
     */
    [[nodiscard]] static auto request(const association_config& config) -> associate_rq;

    /**
     * @brief Decide whether to accept an A-ASSOCIATE-RQ
     *
     * Checks, in order: protocol version, application context, called AE
     * title, calling AE whitelist, context id validity, user identity and
     * finally the presentation contexts. The first failing check determines
     * the rejection triple.
     */
    [[nodiscard]] static auto evaluate(const associate_rq& rq, const acceptor_config& config)
        -> association_decision;

    /// Transient rejection for the simultaneous association limit (2, 3, 2)
    [[nodiscard]] static auto limit_exceeded() -> associate_rj;

    /**
     * @brief Requestor-side interpretation of an A-ASSOCIATE-AC
     * @return negotiation_failed when the AC contradicts the request
     */
    [[nodiscard]] static auto interpret_accept(const associate_rq& rq, const associate_ac& ac)
        -> Result<negotiated_parameters>;

    [[nodiscard]] static auto release_request() -> release_rq_pdu { return {}; }
    [[nodiscard]] static auto release_response() -> release_rp_pdu { return {}; }

    [[nodiscard]] static auto abort(abort_source source = abort_source::service_user,
                                    abort_reason reason = abort_reason::not_specified)
        -> abort_pdu {
        return abort_pdu{source, reason};
    }

private:
    [[nodiscard]] static auto reject(reject_result result, reject_source source,
                                     uint8_t reason, std::string why)
        -> association_decision;
};

}  // namespace dul::network

#endif  // DUL_NETWORK_ACSE_HPP
