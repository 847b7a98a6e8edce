/**
 * @file pdu_encoder.hpp
 * @brief DICOM Upper Layer PDU encoder
 *
 * Serializes PDU structures into their byte-exact wire image. Variable
 * length PDUs are validated before encoding so that every declared PDU and
 * item length matches the bytes that follow it.
 *
 * @see DICOM PS3.8 Section 9.3 - PDU Structure
 */

#ifndef DUL_NETWORK_PDU_ENCODER_HPP
#define DUL_NETWORK_PDU_ENCODER_HPP

#include "dul/core/result.hpp"
#include "pdu_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dul::network {

/// Result type for encoding operations
using encode_result = dul::Result<std::vector<uint8_t>>;

/**
 * @brief Encoder for DICOM Upper Layer PDUs.
 *
 * All functions are stateless. Multi-byte integers are written big-endian.
 *
 * @example
 * @code
 * associate_rq rq;
 * rq.called_ae_title = "STORE_SCP";
 * rq.calling_ae_title = "MODALITY";
 * rq.application_context = std::string(dicom_application_context);
 * rq.presentation_contexts.push_back({1, "1.2.840.10008.1.1", {"1.2.840.10008.1.2"}});
 * rq.user_info.max_pdu_length = default_max_pdu_length;
 * rq.user_info.implementation_class_uid = "1.2.826.0.1.3680043.2.1545.1";
 *
 * auto bytes = pdu_encoder::encode(rq);
 * @endcode
 */
class pdu_encoder {
public:
    /**
     * @brief Encode any PDU after validating its encodable invariants.
     * @param value The PDU to encode
     * @return Wire bytes, or pdu_encoding_error describing the violation
     */
    [[nodiscard]] static encode_result encode(const pdu& value);

    /// @name Association PDUs
    /// @{

    [[nodiscard]] static encode_result encode_associate_rq(const associate_rq& rq);

    [[nodiscard]] static encode_result encode_associate_ac(const associate_ac& ac);

    [[nodiscard]] static std::vector<uint8_t> encode_associate_rj(const associate_rj& rj);

    /// @}

    /// @name Release PDUs
    /// @{

    [[nodiscard]] static std::vector<uint8_t> encode_release_rq();

    [[nodiscard]] static std::vector<uint8_t> encode_release_rp();

    /// @}

    /// @name Abort PDU
    /// @{

    [[nodiscard]] static std::vector<uint8_t> encode_abort(uint8_t source, uint8_t reason);

    [[nodiscard]] static std::vector<uint8_t> encode_abort(abort_source source,
                                                           abort_reason reason);

    /// @}

    /// @name Data PDU
    /// @{

    [[nodiscard]] static encode_result encode_p_data_tf(
        const std::vector<presentation_data_value>& pdvs);

    [[nodiscard]] static encode_result encode_p_data_tf(const presentation_data_value& pdv);

    /// @}

    /**
     * @brief Encoded size of a P-DATA-TF PDU carrying the given payload sizes.
     *
     * Used by the DIMSE fragmenter to stay under the negotiated maximum length.
     */
    [[nodiscard]] static constexpr auto p_data_tf_size(std::size_t payload_bytes,
                                                       std::size_t pdv_count) noexcept
        -> std::size_t {
        return pdu_header_size + pdv_count * pdv_header_size + payload_bytes;
    }

private:
    /// @name Helper Functions
    /// @{

    static void write_uint16_be(std::vector<uint8_t>& buffer, uint16_t value);

    static void write_uint32_be(std::vector<uint8_t>& buffer, uint32_t value);

    static void write_ae_title(std::vector<uint8_t>& buffer, const std::string& ae_title);

    static void write_uid(std::vector<uint8_t>& buffer, const std::string& uid);

    [[nodiscard]] static auto padded_length(const std::string& uid) noexcept -> std::size_t;

    [[nodiscard]] static bool patch_item_length(std::vector<uint8_t>& buffer,
                                                std::size_t length_pos);

    static void update_pdu_length(std::vector<uint8_t>& buffer);

    [[nodiscard]] static VoidResult validate_ae_title(const std::string& ae_title,
                                                     const char* field);

    [[nodiscard]] static VoidResult validate_user_information(const user_information& info,
                                                              bool is_rq);

    static void encode_uid_item(std::vector<uint8_t>& buffer, item_type type,
                                const std::string& uid);

    static void encode_application_context(std::vector<uint8_t>& buffer,
                                           const std::string& context_name);

    [[nodiscard]] static bool encode_presentation_context_rq(
        std::vector<uint8_t>& buffer, const presentation_context_rq& pc);

    [[nodiscard]] static bool encode_presentation_context_ac(
        std::vector<uint8_t>& buffer, const presentation_context_ac& pc);

    [[nodiscard]] static bool encode_user_information(std::vector<uint8_t>& buffer,
                                                      const user_information& user_info);

    static void encode_associate_header(std::vector<uint8_t>& buffer,
                                        pdu_type type,
                                        uint16_t protocol_version,
                                        const std::string& called_ae,
                                        const std::string& calling_ae);

    /// @}
};

}  // namespace dul::network

#endif  // DUL_NETWORK_PDU_ENCODER_HPP
