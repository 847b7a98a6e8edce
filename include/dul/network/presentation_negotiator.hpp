/**
 * @file presentation_negotiator.hpp
 * @brief Presentation context negotiation per PS3.7 Annex D and PS3.8 9.3.2
 *
 * Matches the contexts proposed in an A-ASSOCIATE-RQ against the acceptor's
 * supported abstract syntax / transfer syntax / role combinations, and on the
 * requestor side checks that an A-ASSOCIATE-AC stays within what was
 * proposed. The negotiator performs no I/O.
 */

#ifndef DUL_NETWORK_PRESENTATION_NEGOTIATOR_HPP
#define DUL_NETWORK_PRESENTATION_NEGOTIATOR_HPP

#include "dul/core/result.hpp"
#include "pdu_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dul::network {

/**
 * @brief An abstract syntax the acceptor supports.
 *
 * The role flags describe which roles the association requestor may take
 * when it proposes an SCP/SCU Role Selection item for this SOP class. Without
 * a role item the default roles apply (requestor SCU, acceptor SCP).
 */
struct supported_context {
    std::string abstract_syntax;
    std::vector<std::string> transfer_syntaxes;  ///< Acceptable transfer syntaxes
    bool scu_role{true};   ///< Requestor may act as SCU
    bool scp_role{false};  ///< Requestor may act as SCP

    supported_context() = default;
    supported_context(std::string as, std::vector<std::string> ts,
                      bool scu = true, bool scp = false)
        : abstract_syntax(std::move(as))
        , transfer_syntaxes(std::move(ts))
        , scu_role(scu)
        , scp_role(scp) {}
};

/**
 * @brief Outcome of negotiating one proposed presentation context.
 */
struct negotiated_context {
    uint8_t id{0};
    std::string abstract_syntax;
    std::string transfer_syntax;  ///< Empty unless accepted
    presentation_context_result result{presentation_context_result::no_reason};
    bool requestor_scu{true};   ///< Requestor acts as SCU on this context
    bool requestor_scp{false};  ///< Requestor acts as SCP on this context

    [[nodiscard]] bool is_accepted() const noexcept {
        return result == presentation_context_result::acceptance;
    }

    bool operator==(const negotiated_context&) const = default;
};

/**
 * @brief Result of an acceptor-side negotiation.
 */
struct negotiation_result {
    /// One entry per proposed context, in proposal order, ids unchanged
    std::vector<negotiated_context> contexts;

    /// Role Selection items to echo in the A-ASSOCIATE-AC
    std::vector<scp_scu_role_selection> role_replies;

    [[nodiscard]] bool any_accepted() const noexcept;

    /// Presentation context items for the A-ASSOCIATE-AC
    [[nodiscard]] auto to_ac_items() const -> std::vector<presentation_context_ac>;
};

/**
 * @brief Stateless presentation context negotiator.
 *
 * @example
 * @code
 * presentation_negotiator negotiator({
 *     {"1.2.840.10008.1.1", {"1.2.840.10008.1.2"}}
 * });
 * auto result = negotiator.negotiate(rq.presentation_contexts,
 *                                    rq.user_info.role_selections);
 * @endcode
 */
class presentation_negotiator {
public:
    presentation_negotiator() = default;
    explicit presentation_negotiator(std::vector<supported_context> supported);

    /**
     * @brief Negotiate the proposed contexts.
     *
     * For each proposal the first supported entry with a matching abstract
     * syntax is used; the accepted transfer syntax is the first proposed one
     * the entry supports. Requested roles are intersected with the entry's
     * role flags; an empty intersection rejects the context with
     * user-rejection.
     *
     * @return Per-context results, or context_limit_exceeded /
     *         invalid_context_id when the proposal as a whole is invalid
     */
    [[nodiscard]] auto negotiate(
        const std::vector<presentation_context_rq>& proposed,
        const std::vector<scp_scu_role_selection>& requested_roles = {}) const
        -> Result<negotiation_result>;

    /**
     * @brief Check id parity, uniqueness and the 128-context ceiling.
     */
    [[nodiscard]] static VoidResult validate_proposal(
        const std::vector<presentation_context_rq>& proposed);

    /**
     * @brief Requestor-side check of an A-ASSOCIATE-AC against the proposal.
     *
     * @return Negotiated contexts in proposal order. Contexts the acceptor
     *         did not answer are reported with result no_reason.
     *         negotiation_failed when the response refers to an unknown id,
     *         accepts a transfer syntax that was not proposed, or widens a
     *         requested role.
     */
    [[nodiscard]] static auto validate_response(
        const std::vector<presentation_context_rq>& proposed,
        const std::vector<scp_scu_role_selection>& requested_roles,
        const associate_ac& ac) -> Result<std::vector<negotiated_context>>;

    [[nodiscard]] auto supported() const noexcept -> const std::vector<supported_context>& {
        return supported_;
    }

    void add_supported(supported_context context);

    [[nodiscard]] bool supports(std::string_view abstract_syntax) const noexcept;

private:
    [[nodiscard]] auto find_supported(std::string_view abstract_syntax) const noexcept
        -> const supported_context*;

    std::vector<supported_context> supported_;
};

}  // namespace dul::network

#endif  // DUL_NETWORK_PRESENTATION_NEGOTIATOR_HPP
