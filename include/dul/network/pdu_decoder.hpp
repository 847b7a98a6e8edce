#ifndef DUL_NETWORK_PDU_DECODER_HPP
#define DUL_NETWORK_PDU_DECODER_HPP

#include "pdu_types.hpp"
#include "dul/core/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dul::network {

/// Result type alias for PDU decoding operations
template<typename T>
using DecodeResult = dul::Result<T>;

/**
 * @brief Decoder for DICOM PDU (Protocol Data Unit) messages.
 *
 * This class provides static methods to decode the PDU types of the
 * DICOM PS3.8 Upper Layer Protocol. Decoding is strict: the input must hold
 * exactly one PDU, every declared item length must match the bytes that
 * follow, and unknown PDU, item or sub-item types are rejected.
 *
 * PDU Structure:
 * @code
 * +-----------+-----------+-------------+
 * | Type      | Reserved  | Length      |
 * | (1 byte)  | (1 byte)  | (4 bytes)   |
 * +-----------+-----------+-------------+
 * | PDU Data (Length bytes)             |
 * +-------------------------------------+
 * @endcode
 *
 * Errors carry dul::error_codes::incomplete_pdu when the buffer is shorter
 * than the declared length, and dul::error_codes::malformed_pdu for every
 * structural violation.
 *
 * @see DICOM PS3.8 Section 9 - Upper Layer Protocol
 */
class pdu_decoder {
public:
    /// @name General Decoding
    /// @{

    /**
     * @brief Decode any PDU from bytes.
     * @param data Buffer holding exactly one PDU
     * @return Result containing decoded PDU or error
     *
     * Detects the PDU type from the first byte and dispatches to the
     * matching typed decoder.
     */
    [[nodiscard]] static DecodeResult<pdu> decode(std::span<const uint8_t> data);

    /**
     * @brief Total PDU length (header + body) announced by a buffered header.
     * @param data Input byte buffer
     * @return Length once the 6-byte header is available, std::nullopt before
     *
     * The length is returned even if the body has not fully arrived, so a
     * streaming reader knows how many bytes it still needs.
     */
    [[nodiscard]] static std::optional<size_t> pdu_length(
        std::span<const uint8_t> data);

    /**
     * @brief Get the PDU type from buffer without full decoding.
     * @return PDU type if the first byte is a known type, std::nullopt otherwise
     */
    [[nodiscard]] static std::optional<pdu_type> peek_pdu_type(
        std::span<const uint8_t> data);

    /// true if @p type_byte names one of the seven Upper Layer PDUs
    [[nodiscard]] static constexpr bool is_known_pdu_type(uint8_t type_byte) noexcept {
        return type_byte >= static_cast<uint8_t>(pdu_type::associate_rq) &&
               type_byte <= static_cast<uint8_t>(pdu_type::abort);
    }

    /// @}

    /// @name Specific Decoders
    /// @{

    [[nodiscard]] static DecodeResult<associate_rq> decode_associate_rq(
        std::span<const uint8_t> data);

    [[nodiscard]] static DecodeResult<associate_ac> decode_associate_ac(
        std::span<const uint8_t> data);

    [[nodiscard]] static DecodeResult<associate_rj> decode_associate_rj(
        std::span<const uint8_t> data);

    [[nodiscard]] static DecodeResult<p_data_tf_pdu> decode_p_data_tf(
        std::span<const uint8_t> data);

    [[nodiscard]] static DecodeResult<release_rq_pdu> decode_release_rq(
        std::span<const uint8_t> data);

    [[nodiscard]] static DecodeResult<release_rp_pdu> decode_release_rp(
        std::span<const uint8_t> data);

    [[nodiscard]] static DecodeResult<abort_pdu> decode_abort(
        std::span<const uint8_t> data);

    /// @}

private:
    struct variable_items {
        std::string application_context;
        std::vector<presentation_context_rq> contexts_rq;
        std::vector<presentation_context_ac> contexts_ac;
        std::optional<user_information> user_info;
    };

    [[nodiscard]] static uint16_t read_uint16_be(
        std::span<const uint8_t> data, size_t offset);

    [[nodiscard]] static uint32_t read_uint32_be(
        std::span<const uint8_t> data, size_t offset);

    /// Read an AE Title (16 bytes, space-trimmed)
    [[nodiscard]] static std::string read_ae_title(
        std::span<const uint8_t> data, size_t offset);

    /// Read a UID string (trailing NUL/space padding trimmed)
    [[nodiscard]] static std::string read_uid(
        std::span<const uint8_t> data, size_t offset, size_t length);

    /**
     * @brief Validate PDU header against buffer size and expected type.
     * @return Declared PDU body length
     */
    [[nodiscard]] static DecodeResult<uint32_t> validate_pdu_header(
        std::span<const uint8_t> data, pdu_type expected_type);

    [[nodiscard]] static DecodeResult<variable_items> decode_variable_items(
        std::span<const uint8_t> data, bool is_rq);

    [[nodiscard]] static DecodeResult<presentation_context_rq> decode_presentation_context_rq(
        std::span<const uint8_t> item);

    [[nodiscard]] static DecodeResult<presentation_context_ac> decode_presentation_context_ac(
        std::span<const uint8_t> item);

    [[nodiscard]] static DecodeResult<user_information> decode_user_info_item(
        std::span<const uint8_t> item, bool is_rq);
};

}  // namespace dul::network

#endif  // DUL_NETWORK_PDU_DECODER_HPP
