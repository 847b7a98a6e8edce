/**
 * @file pdu_types.hpp
 * @brief DICOM Upper Layer PDU structures and protocol enumerations
 *
 * Plain data structures for every PDU and sub-item defined in PS3.8
 * Section 9.3 and Annex D. The structures carry decoded values only;
 * byte layout lives in pdu_encoder / pdu_decoder.
 *
 * @see DICOM PS3.8 Section 9.3 - DICOM Upper Layer Protocol for TCP/IP
 * @see DICOM PS3.7 Annex D - Association Negotiation
 */

#ifndef DUL_NETWORK_PDU_TYPES_HPP
#define DUL_NETWORK_PDU_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dul::network {

/**
 * @brief PDU (Protocol Data Unit) types as defined in DICOM PS3.8.
 *
 * These values represent the type field in PDU headers.
 */
enum class pdu_type : uint8_t {
    associate_rq = 0x01,  ///< A-ASSOCIATE-RQ (Association Request)
    associate_ac = 0x02,  ///< A-ASSOCIATE-AC (Association Accept)
    associate_rj = 0x03,  ///< A-ASSOCIATE-RJ (Association Reject)
    p_data_tf = 0x04,     ///< P-DATA-TF (Data Transfer)
    release_rq = 0x05,    ///< A-RELEASE-RQ (Release Request)
    release_rp = 0x06,    ///< A-RELEASE-RP (Release Response)
    abort = 0x07,         ///< A-ABORT (Abort)
};

/**
 * @brief Item types used in variable items of PDUs.
 */
enum class item_type : uint8_t {
    application_context = 0x10,     ///< Application Context Item
    presentation_context_rq = 0x20, ///< Presentation Context Item (RQ)
    presentation_context_ac = 0x21, ///< Presentation Context Item (AC)
    abstract_syntax = 0x30,         ///< Abstract Syntax Sub-item
    transfer_syntax = 0x40,         ///< Transfer Syntax Sub-item
    user_information = 0x50,        ///< User Information Item
    maximum_length = 0x51,          ///< Maximum Length Sub-item
    implementation_class_uid = 0x52,    ///< Implementation Class UID Sub-item
    async_operations_window = 0x53,     ///< Asynchronous Operations Window Sub-item
    scp_scu_role_selection = 0x54,      ///< SCP/SCU Role Selection Sub-item
    implementation_version_name = 0x55, ///< Implementation Version Name Sub-item
    sop_class_extended_negotiation = 0x56,        ///< SOP Class Extended Negotiation
    sop_class_common_extended_negotiation = 0x57, ///< SOP Class Common Extended Negotiation
    user_identity_rq = 0x58,        ///< User Identity RQ Sub-item
    user_identity_ac = 0x59,        ///< User Identity AC Sub-item
};

/**
 * @brief Result values for A-ASSOCIATE-AC presentation context.
 */
enum class presentation_context_result : uint8_t {
    acceptance = 0,                      ///< Accepted
    user_rejection = 1,                  ///< User-rejection
    no_reason = 2,                       ///< No reason (provider rejection)
    abstract_syntax_not_supported = 3,   ///< Abstract-syntax-not-supported
    transfer_syntaxes_not_supported = 4, ///< Transfer-syntaxes-not-supported
};

/**
 * @brief Abort source values.
 */
enum class abort_source : uint8_t {
    service_user = 0,       ///< DICOM UL service-user
    reserved = 1,           ///< Reserved
    service_provider = 2,   ///< DICOM UL service-provider (ACSE)
};

/**
 * @brief Abort reason values when source is service-provider.
 */
enum class abort_reason : uint8_t {
    not_specified = 0,              ///< Reason not specified
    unrecognized_pdu = 1,           ///< Unrecognized PDU
    unexpected_pdu = 2,             ///< Unexpected PDU
    reserved = 3,                   ///< Reserved
    unrecognized_pdu_parameter = 4, ///< Unrecognized PDU parameter
    unexpected_pdu_parameter = 5,   ///< Unexpected PDU parameter
    invalid_pdu_parameter = 6,      ///< Invalid PDU parameter value
};

/**
 * @brief Reject result values.
 */
enum class reject_result : uint8_t {
    rejected_permanent = 1,  ///< Rejected-permanent
    rejected_transient = 2,  ///< Rejected-transient
};

/**
 * @brief Reject source values.
 */
enum class reject_source : uint8_t {
    service_user = 1,                   ///< DICOM UL service-user
    service_provider_acse = 2,          ///< DICOM UL service-provider (ACSE)
    service_provider_presentation = 3,  ///< DICOM UL service-provider (Presentation)
};

/**
 * @brief Reject reason values when source is service-user.
 */
enum class reject_reason_user : uint8_t {
    no_reason = 1,                          ///< No reason given
    application_context_not_supported = 2,  ///< Application-context-name not supported
    calling_ae_not_recognized = 3,          ///< Calling-AE-title not recognized
    called_ae_not_recognized = 7,           ///< Called-AE-title not recognized
};

/**
 * @brief Reject reason values when source is service-provider (ACSE).
 */
enum class reject_reason_provider_acse : uint8_t {
    no_reason = 1,                       ///< No reason given
    protocol_version_not_supported = 2,  ///< Protocol-version not supported
};

/**
 * @brief Reject reason values when source is service-provider (Presentation).
 */
enum class reject_reason_provider_presentation : uint8_t {
    temporary_congestion = 1,  ///< Temporary congestion
    local_limit_exceeded = 2,  ///< Local limit exceeded
};

/**
 * @brief User Identity type values (PS3.7 Table D.3-14).
 */
enum class user_identity_type : uint8_t {
    username = 1,               ///< Username as UTF-8 string
    username_and_passcode = 2,  ///< Username and passcode
    kerberos = 3,               ///< Kerberos service ticket
    saml = 4,                   ///< SAML assertion
    jwt = 5,                    ///< JSON Web Token
};

// ============================================================================
// Sub-items
// ============================================================================

/**
 * @brief Presentation Data Value (PDV) item for P-DATA-TF.
 */
struct presentation_data_value {
    uint8_t context_id{0};       ///< Presentation Context ID (odd number 1-255)
    bool is_command{false};      ///< true if Command message, false if Data
    bool is_last{false};         ///< true if last fragment
    std::vector<uint8_t> data;   ///< Fragment data

    presentation_data_value() = default;
    presentation_data_value(uint8_t id, bool command, bool last, std::vector<uint8_t> d)
        : context_id(id), is_command(command), is_last(last), data(std::move(d)) {}

    /// Message control header byte (bit 0 = command, bit 1 = last)
    [[nodiscard]] constexpr auto control_header() const noexcept -> uint8_t {
        return static_cast<uint8_t>((is_command ? 0x01 : 0x00) |
                                    (is_last ? 0x02 : 0x00));
    }

    bool operator==(const presentation_data_value&) const = default;
};

/**
 * @brief Presentation Context for A-ASSOCIATE-RQ.
 */
struct presentation_context_rq {
    uint8_t id{0};                              ///< Presentation Context ID (odd number 1-255)
    std::string abstract_syntax;                ///< Abstract Syntax UID (SOP Class)
    std::vector<std::string> transfer_syntaxes; ///< Proposed Transfer Syntaxes

    presentation_context_rq() = default;
    presentation_context_rq(uint8_t context_id, std::string abs_syntax,
                            std::vector<std::string> ts_list)
        : id(context_id)
        , abstract_syntax(std::move(abs_syntax))
        , transfer_syntaxes(std::move(ts_list)) {}

    bool operator==(const presentation_context_rq&) const = default;
};

/**
 * @brief Presentation Context for A-ASSOCIATE-AC.
 *
 * transfer_syntax is only significant when result is acceptance.
 */
struct presentation_context_ac {
    uint8_t id{0};                                                           ///< Presentation Context ID
    presentation_context_result result{presentation_context_result::acceptance}; ///< Result/Reason
    std::string transfer_syntax;                                             ///< Accepted Transfer Syntax UID

    presentation_context_ac() = default;
    presentation_context_ac(uint8_t context_id, presentation_context_result res,
                            std::string ts = "")
        : id(context_id), result(res), transfer_syntax(std::move(ts)) {}

    bool operator==(const presentation_context_ac&) const = default;
};

/**
 * @brief SCP/SCU Role Selection Sub-item.
 */
struct scp_scu_role_selection {
    std::string sop_class_uid;  ///< SOP Class UID
    bool scu_role{false};       ///< SCU-role (true if supported)
    bool scp_role{false};       ///< SCP-role (true if supported)

    scp_scu_role_selection() = default;
    scp_scu_role_selection(std::string uid, bool scu, bool scp)
        : sop_class_uid(std::move(uid)), scu_role(scu), scp_role(scp) {}

    bool operator==(const scp_scu_role_selection&) const = default;
};

/**
 * @brief Asynchronous Operations Window Sub-item.
 *
 * A value of 0 means unlimited.
 */
struct async_operations_window {
    uint16_t max_operations_invoked{1};
    uint16_t max_operations_performed{1};

    bool operator==(const async_operations_window&) const = default;
};

/**
 * @brief SOP Class Extended Negotiation Sub-item.
 */
struct sop_class_extended_negotiation {
    std::string sop_class_uid;
    std::vector<uint8_t> service_class_application_information;

    bool operator==(const sop_class_extended_negotiation&) const = default;
};

/**
 * @brief SOP Class Common Extended Negotiation Sub-item (RQ only).
 */
struct sop_class_common_extended_negotiation {
    std::string sop_class_uid;
    std::string service_class_uid;
    std::vector<std::string> related_general_sop_classes;

    bool operator==(const sop_class_common_extended_negotiation&) const = default;
};

/**
 * @brief User Identity Negotiation Sub-item (RQ).
 *
 * Field contents are raw bytes; a Kerberos ticket or SAML assertion may
 * contain arbitrary octets.
 */
struct user_identity_rq {
    user_identity_type type{user_identity_type::username};
    bool positive_response_requested{false};
    std::string primary_field;
    std::string secondary_field;  ///< Only used with username_and_passcode

    bool operator==(const user_identity_rq&) const = default;
};

/**
 * @brief User Identity Negotiation Sub-item (AC).
 */
struct user_identity_ac {
    std::string server_response;

    bool operator==(const user_identity_ac&) const = default;
};

/**
 * @brief User Information for A-ASSOCIATE-RQ/AC.
 */
struct user_information {
    uint32_t max_pdu_length{0};              ///< Maximum Length of P-DATA-TF PDUs (0 = unlimited)
    std::string implementation_class_uid;    ///< Implementation Class UID
    std::string implementation_version_name; ///< Implementation Version Name (optional)
    std::optional<async_operations_window> async_operations;        ///< Optional
    std::vector<scp_scu_role_selection> role_selections;            ///< Optional
    std::vector<sop_class_extended_negotiation> sop_class_extended; ///< Optional
    std::vector<sop_class_common_extended_negotiation> sop_class_common_extended; ///< RQ only
    std::optional<user_identity_rq> user_identity_request;  ///< RQ only
    std::optional<user_identity_ac> user_identity_response; ///< AC only

    bool operator==(const user_information&) const = default;
};

// ============================================================================
// PDUs
// ============================================================================

/**
 * @brief A-ASSOCIATE-RQ PDU data.
 */
struct associate_rq {
    uint16_t protocol_version{0x0001};            ///< Protocol Version bit field
    std::string called_ae_title;                  ///< Called AE Title (16 chars max)
    std::string calling_ae_title;                 ///< Calling AE Title (16 chars max)
    std::string application_context;              ///< Application Context Name UID
    std::vector<presentation_context_rq> presentation_contexts; ///< Presentation Contexts
    user_information user_info;                   ///< User Information

    bool operator==(const associate_rq&) const = default;
};

/**
 * @brief A-ASSOCIATE-AC PDU data.
 */
struct associate_ac {
    uint16_t protocol_version{0x0001};            ///< Protocol Version bit field
    std::string called_ae_title;                  ///< Called AE Title (echoed, not tested)
    std::string calling_ae_title;                 ///< Calling AE Title (echoed, not tested)
    std::string application_context;              ///< Application Context Name UID
    std::vector<presentation_context_ac> presentation_contexts; ///< Presentation Contexts
    user_information user_info;                   ///< User Information

    bool operator==(const associate_ac&) const = default;
};

/**
 * @brief A-ASSOCIATE-RJ PDU data.
 */
struct associate_rj {
    reject_result result{reject_result::rejected_permanent};  ///< 1=permanent, 2=transient
    uint8_t source{0};  ///< Source (see reject_source)
    uint8_t reason{0};  ///< Reason/Diagnostic, interpretation depends on source

    associate_rj() = default;
    associate_rj(reject_result res, uint8_t src, uint8_t rsn)
        : result(res), source(src), reason(rsn) {}

    bool operator==(const associate_rj&) const = default;
};

struct release_rq_pdu {
    bool operator==(const release_rq_pdu&) const = default;
};

struct release_rp_pdu {
    bool operator==(const release_rp_pdu&) const = default;
};

/**
 * @brief A-ABORT PDU data.
 */
struct abort_pdu {
    abort_source source{abort_source::service_user};
    abort_reason reason{abort_reason::not_specified};

    abort_pdu() = default;
    abort_pdu(abort_source src, abort_reason rsn) : source(src), reason(rsn) {}

    bool operator==(const abort_pdu&) const = default;
};

/**
 * @brief P-DATA-TF PDU data.
 */
struct p_data_tf_pdu {
    std::vector<presentation_data_value> pdvs;

    p_data_tf_pdu() = default;
    explicit p_data_tf_pdu(std::vector<presentation_data_value> values)
        : pdvs(std::move(values)) {}

    bool operator==(const p_data_tf_pdu&) const = default;
};

/**
 * @brief Tagged union over every Upper Layer PDU.
 */
using pdu = std::variant<
    associate_rq,
    associate_ac,
    associate_rj,
    p_data_tf_pdu,
    release_rq_pdu,
    release_rp_pdu,
    abort_pdu
>;

/**
 * @brief PDU type carried by a pdu variant value.
 */
[[nodiscard]] auto type_of(const pdu& value) noexcept -> pdu_type;

// ============================================================================
// Constants
// ============================================================================

/// Default DICOM Application Context Name (PS3.7)
inline constexpr std::string_view dicom_application_context = "1.2.840.10008.3.1.1.1";

/// DICOM Protocol Version
inline constexpr uint16_t dicom_protocol_version = 0x0001;

/// AE Title length (fixed 16 characters, space-padded)
inline constexpr std::size_t ae_title_length = 16;

/// PDU header size (type + reserved + length)
inline constexpr std::size_t pdu_header_size = 6;

/// PDV item header size (item length + context id + control header)
inline constexpr std::size_t pdv_header_size = 6;

/// Maximum PDU length recommended by DICOM (16384 bytes)
inline constexpr uint32_t default_max_pdu_length = 16384;

/// Maximum PDU length value meaning "no limit"
inline constexpr uint32_t unlimited_max_pdu_length = 0;

/// Maximum number of presentation contexts in one association
inline constexpr std::size_t max_presentation_contexts = 128;

// ============================================================================
// Conversion Functions
// ============================================================================

[[nodiscard]] constexpr auto to_string(pdu_type type) noexcept -> std::string_view {
    switch (type) {
        case pdu_type::associate_rq: return "A-ASSOCIATE-RQ";
        case pdu_type::associate_ac: return "A-ASSOCIATE-AC";
        case pdu_type::associate_rj: return "A-ASSOCIATE-RJ";
        case pdu_type::p_data_tf: return "P-DATA-TF";
        case pdu_type::release_rq: return "A-RELEASE-RQ";
        case pdu_type::release_rp: return "A-RELEASE-RP";
        case pdu_type::abort: return "A-ABORT";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr auto to_string(presentation_context_result result) noexcept
    -> std::string_view {
    switch (result) {
        case presentation_context_result::acceptance: return "acceptance";
        case presentation_context_result::user_rejection: return "user-rejection";
        case presentation_context_result::no_reason: return "no-reason (provider rejection)";
        case presentation_context_result::abstract_syntax_not_supported:
            return "abstract-syntax-not-supported";
        case presentation_context_result::transfer_syntaxes_not_supported:
            return "transfer-syntaxes-not-supported";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto to_string(abort_source source) noexcept -> std::string_view {
    switch (source) {
        case abort_source::service_user: return "service-user";
        case abort_source::reserved: return "reserved";
        case abort_source::service_provider: return "service-provider";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto to_string(abort_reason reason) noexcept -> std::string_view {
    switch (reason) {
        case abort_reason::not_specified: return "reason-not-specified";
        case abort_reason::unrecognized_pdu: return "unrecognized-PDU";
        case abort_reason::unexpected_pdu: return "unexpected-PDU";
        case abort_reason::reserved: return "reserved";
        case abort_reason::unrecognized_pdu_parameter: return "unrecognized-PDU-parameter";
        case abort_reason::unexpected_pdu_parameter: return "unexpected-PDU-parameter";
        case abort_reason::invalid_pdu_parameter: return "invalid-PDU-parameter-value";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto to_string(reject_result result) noexcept -> std::string_view {
    switch (result) {
        case reject_result::rejected_permanent: return "rejected-permanent";
        case reject_result::rejected_transient: return "rejected-transient";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto to_string(reject_source source) noexcept -> std::string_view {
    switch (source) {
        case reject_source::service_user: return "service-user";
        case reject_source::service_provider_acse: return "service-provider (ACSE)";
        case reject_source::service_provider_presentation:
            return "service-provider (presentation)";
    }
    return "unknown";
}

/**
 * @brief Human-readable description of an A-ASSOCIATE-RJ diagnostic triple.
 */
[[nodiscard]] auto describe_rejection(const associate_rj& rj) -> std::string;

}  // namespace dul::network

#endif  // DUL_NETWORK_PDU_TYPES_HPP
