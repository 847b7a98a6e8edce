/**
 * @file pdv_fragmenter.hpp
 * @brief Splitting DIMSE messages into PDVs and reassembling them
 *
 * The maximum length negotiated in the peer's Maximum Length sub-item bounds
 * the variable field of each P-DATA-TF PDU, i.e. its list of PDV items. Each
 * PDV item spends 6 bytes on its own header, so one fragment carries at most
 * max_length - 6 bytes of command or data set payload.
 *
 * @see DICOM PS3.8 Section 9.3.5 and Annex E
 */

#ifndef DUL_NETWORK_DIMSE_PDV_FRAGMENTER_HPP
#define DUL_NETWORK_DIMSE_PDV_FRAGMENTER_HPP

#include "dimse_message.hpp"

#include "dul/core/result.hpp"
#include "dul/network/pdu_types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace dul::network::dimse {

/**
 * @brief Splits encoded DIMSE messages into P-DATA-TF PDUs.
 *
 * Every produced PDU carries exactly one PDV. The command stream is emitted
 * in full before the first data set fragment.
 */
class pdv_fragmenter {
public:
    /**
     * @param max_pdu_length Peer's maximum P-DATA-TF length, 0 for unlimited
     */
    explicit pdv_fragmenter(uint32_t max_pdu_length = default_max_pdu_length)
        : max_pdu_length_(max_pdu_length) {}

    /// Largest payload one PDV may carry, 0 when unlimited
    [[nodiscard]] auto max_fragment_payload() const noexcept -> std::size_t;

    /**
     * @brief Fragment one command stream and an optional data set stream.
     * @return pdu_too_large when the negotiated length leaves no room for
     *         payload
     */
    [[nodiscard]] auto fragment(uint8_t context_id,
                                std::span<const uint8_t> command,
                                std::optional<std::span<const uint8_t>> dataset) const
        -> Result<std::vector<p_data_tf_pdu>>;

    /// Encode a message and fragment it
    [[nodiscard]] auto fragment(uint8_t context_id, const dimse_message& message) const
        -> Result<std::vector<p_data_tf_pdu>>;

    [[nodiscard]] auto max_pdu_length() const noexcept -> uint32_t { return max_pdu_length_; }

private:
    void append_stream(std::vector<p_data_tf_pdu>& out, uint8_t context_id,
                       bool is_command, std::span<const uint8_t> stream) const;

    uint32_t max_pdu_length_;
};

/**
 * @brief A message rebuilt from its PDVs.
 */
struct received_message {
    uint8_t context_id{0};
    dimse_message message;
};

/**
 * @brief Reassembles DIMSE messages from received PDVs.
 *
 * Fragments must keep the context id of the message's first fragment,
 * and data set fragments may only follow the last command fragment. Both
 * violations are reported as fragment_sequence_error; a command stream that
 * does not decode is reported as invalid_command_set. Either is fatal to
 * the association.
 */
class message_assembler {
public:
    /**
     * @brief Consume the PDVs of one P-DATA-TF PDU.
     * @return Messages completed by this PDU, in order
     */
    [[nodiscard]] auto feed(const p_data_tf_pdu& pdu)
        -> Result<std::vector<received_message>>;

    /**
     * @brief Consume one PDV.
     * @return The completed message, or nullopt when more fragments follow
     */
    [[nodiscard]] auto add(const presentation_data_value& pdv)
        -> Result<std::optional<received_message>>;

    /// true while a message is partially received
    [[nodiscard]] bool in_progress() const noexcept { return context_id_.has_value(); }

    void reset();

private:
    [[nodiscard]] auto complete() -> Result<std::optional<received_message>>;

    std::optional<uint8_t> context_id_;
    std::vector<uint8_t> command_;
    std::vector<uint8_t> dataset_;
    bool command_complete_{false};
    bool expects_dataset_{false};
};

}  // namespace dul::network::dimse

#endif  // DUL_NETWORK_DIMSE_PDV_FRAGMENTER_HPP
