#include "dul/network/pdu_encoder.hpp"

#include <algorithm>
#include <limits>
#include <type_traits>

namespace dul::network {

namespace {

/// Maximum UID length (PS3.5 Section 9.1)
constexpr std::size_t max_uid_length = 64;

/// Maximum value of a 2-byte item length field
constexpr std::size_t max_item_length = std::numeric_limits<uint16_t>::max();

encode_result encoding_error(const std::string& message) {
    return dul::dul_error<std::vector<uint8_t>>(
        dul::error_codes::pdu_encoding_error, message);
}

VoidResult invalid_field(const std::string& message) {
    return dul::dul_void_error(dul::error_codes::pdu_encoding_error, message);
}

VoidResult validate_uid(const std::string& uid, const char* field) {
    if (uid.empty()) {
        return invalid_field(std::string(field) + " is empty");
    }
    if (uid.size() > max_uid_length) {
        return invalid_field(std::string(field) + " exceeds 64 characters: " + uid);
    }
    return ok();
}

}  // namespace

// ============================================================================
// Helper Functions
// ============================================================================

void pdu_encoder::write_uint16_be(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

void pdu_encoder::write_uint32_be(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

void pdu_encoder::write_ae_title(std::vector<uint8_t>& buffer,
                                 const std::string& ae_title) {
    // AE Title is exactly 16 bytes, space-padded
    std::string padded = ae_title.substr(0, ae_title_length);
    padded.resize(ae_title_length, ' ');
    buffer.insert(buffer.end(), padded.begin(), padded.end());
}

void pdu_encoder::write_uid(std::vector<uint8_t>& buffer, const std::string& uid) {
    buffer.insert(buffer.end(), uid.begin(), uid.end());
    // Pad to even length if necessary
    if (uid.size() % 2 != 0) {
        buffer.push_back(0x00);
    }
}

auto pdu_encoder::padded_length(const std::string& uid) noexcept -> std::size_t {
    return uid.size() + (uid.size() % 2);
}

bool pdu_encoder::patch_item_length(std::vector<uint8_t>& buffer,
                                    std::size_t length_pos) {
    // Item length covers everything after the 2-byte length field
    const std::size_t length = buffer.size() - length_pos - 2;
    if (length > max_item_length) {
        return false;
    }
    buffer[length_pos] = static_cast<uint8_t>((length >> 8) & 0xFF);
    buffer[length_pos + 1] = static_cast<uint8_t>(length & 0xFF);
    return true;
}

void pdu_encoder::update_pdu_length(std::vector<uint8_t>& buffer) {
    if (buffer.size() < pdu_header_size) {
        return;
    }
    // PDU length is bytes 2-5, and covers data after the 6-byte header
    const auto length = static_cast<uint32_t>(buffer.size() - pdu_header_size);
    buffer[2] = static_cast<uint8_t>((length >> 24) & 0xFF);
    buffer[3] = static_cast<uint8_t>((length >> 16) & 0xFF);
    buffer[4] = static_cast<uint8_t>((length >> 8) & 0xFF);
    buffer[5] = static_cast<uint8_t>(length & 0xFF);
}

// ============================================================================
// Validation
// ============================================================================

VoidResult pdu_encoder::validate_ae_title(const std::string& ae_title,
                                          const char* field) {
    if (ae_title.empty() ||
        ae_title.find_first_not_of(' ') == std::string::npos) {
        return invalid_field(std::string(field) + " is empty");
    }
    if (ae_title.size() > ae_title_length) {
        return invalid_field(std::string(field) + " exceeds 16 characters: " + ae_title);
    }
    return ok();
}

VoidResult pdu_encoder::validate_user_information(const user_information& info,
                                                  bool is_rq) {
    if (auto r = validate_uid(info.implementation_class_uid, "Implementation Class UID");
        r.is_err()) {
        return r;
    }

    if (info.implementation_version_name.size() > ae_title_length) {
        return invalid_field("Implementation Version Name exceeds 16 characters");
    }

    for (const auto& role : info.role_selections) {
        if (auto r = validate_uid(role.sop_class_uid, "Role selection SOP Class UID");
            r.is_err()) {
            return r;
        }
    }
    for (const auto& ext : info.sop_class_extended) {
        if (auto r = validate_uid(ext.sop_class_uid, "Extended negotiation SOP Class UID");
            r.is_err()) {
            return r;
        }
    }
    for (const auto& common : info.sop_class_common_extended) {
        if (auto r = validate_uid(common.sop_class_uid, "Common extended SOP Class UID");
            r.is_err()) {
            return r;
        }
        if (auto r = validate_uid(common.service_class_uid, "Common extended Service Class UID");
            r.is_err()) {
            return r;
        }
        for (const auto& related : common.related_general_sop_classes) {
            if (auto r = validate_uid(related, "Related General SOP Class UID"); r.is_err()) {
                return r;
            }
        }
    }

    if (is_rq) {
        if (info.user_identity_response) {
            return invalid_field("User Identity AC sub-item in A-ASSOCIATE-RQ");
        }
        if (info.user_identity_request && info.user_identity_request->primary_field.empty()) {
            return invalid_field("User Identity primary field is empty");
        }
    } else {
        if (info.user_identity_request) {
            return invalid_field("User Identity RQ sub-item in A-ASSOCIATE-AC");
        }
        if (!info.sop_class_common_extended.empty()) {
            return invalid_field("SOP Class Common Extended sub-item in A-ASSOCIATE-AC");
        }
    }
    return ok();
}

// ============================================================================
// Item Encoding
// ============================================================================

void pdu_encoder::encode_uid_item(std::vector<uint8_t>& buffer, item_type type,
                                  const std::string& uid) {
    // {type:1}{reserved:1}{length:2}{uid}
    buffer.push_back(static_cast<uint8_t>(type));
    buffer.push_back(0x00);  // Reserved
    write_uint16_be(buffer, static_cast<uint16_t>(padded_length(uid)));
    write_uid(buffer, uid);
}

void pdu_encoder::encode_application_context(std::vector<uint8_t>& buffer,
                                             const std::string& context_name) {
    encode_uid_item(buffer, item_type::application_context, context_name);
}

bool pdu_encoder::encode_presentation_context_rq(std::vector<uint8_t>& buffer,
                                                 const presentation_context_rq& pc) {
    // Presentation Context Item (RQ):
    // type 0x20, reserved, length(2), context id, 3 reserved,
    // one Abstract Syntax sub-item, one or more Transfer Syntax sub-items
    buffer.push_back(static_cast<uint8_t>(item_type::presentation_context_rq));
    buffer.push_back(0x00);  // Reserved

    const std::size_t length_pos = buffer.size();
    write_uint16_be(buffer, 0x0000);

    buffer.push_back(pc.id);
    buffer.push_back(0x00);  // Reserved
    buffer.push_back(0x00);  // Reserved
    buffer.push_back(0x00);  // Reserved

    encode_uid_item(buffer, item_type::abstract_syntax, pc.abstract_syntax);
    for (const auto& ts : pc.transfer_syntaxes) {
        encode_uid_item(buffer, item_type::transfer_syntax, ts);
    }

    return patch_item_length(buffer, length_pos);
}

bool pdu_encoder::encode_presentation_context_ac(std::vector<uint8_t>& buffer,
                                                 const presentation_context_ac& pc) {
    // Presentation Context Item (AC):
    // type 0x21, reserved, length(2), context id, reserved, result, reserved,
    // Transfer Syntax sub-item (not significant unless accepted)
    buffer.push_back(static_cast<uint8_t>(item_type::presentation_context_ac));
    buffer.push_back(0x00);  // Reserved

    const std::size_t length_pos = buffer.size();
    write_uint16_be(buffer, 0x0000);

    buffer.push_back(pc.id);
    buffer.push_back(0x00);  // Reserved
    buffer.push_back(static_cast<uint8_t>(pc.result));
    buffer.push_back(0x00);  // Reserved

    if (!pc.transfer_syntax.empty()) {
        encode_uid_item(buffer, item_type::transfer_syntax, pc.transfer_syntax);
    }

    return patch_item_length(buffer, length_pos);
}

bool pdu_encoder::encode_user_information(std::vector<uint8_t>& buffer,
                                          const user_information& user_info) {
    buffer.push_back(static_cast<uint8_t>(item_type::user_information));
    buffer.push_back(0x00);  // Reserved

    const std::size_t length_pos = buffer.size();
    write_uint16_be(buffer, 0x0000);

    // Maximum Length sub-item
    buffer.push_back(static_cast<uint8_t>(item_type::maximum_length));
    buffer.push_back(0x00);
    write_uint16_be(buffer, 0x0004);
    write_uint32_be(buffer, user_info.max_pdu_length);

    // Implementation Class UID sub-item
    encode_uid_item(buffer, item_type::implementation_class_uid,
                    user_info.implementation_class_uid);

    // Asynchronous Operations Window sub-item
    if (user_info.async_operations) {
        buffer.push_back(static_cast<uint8_t>(item_type::async_operations_window));
        buffer.push_back(0x00);
        write_uint16_be(buffer, 0x0004);
        write_uint16_be(buffer, user_info.async_operations->max_operations_invoked);
        write_uint16_be(buffer, user_info.async_operations->max_operations_performed);
    }

    // SCP/SCU Role Selection sub-items
    for (const auto& role : user_info.role_selections) {
        buffer.push_back(static_cast<uint8_t>(item_type::scp_scu_role_selection));
        buffer.push_back(0x00);
        const std::size_t item_pos = buffer.size();
        write_uint16_be(buffer, 0x0000);
        write_uint16_be(buffer, static_cast<uint16_t>(role.sop_class_uid.size()));
        buffer.insert(buffer.end(), role.sop_class_uid.begin(), role.sop_class_uid.end());
        buffer.push_back(role.scu_role ? 0x01 : 0x00);
        buffer.push_back(role.scp_role ? 0x01 : 0x00);
        if (!patch_item_length(buffer, item_pos)) {
            return false;
        }
    }

    // Implementation Version Name sub-item
    if (!user_info.implementation_version_name.empty()) {
        const auto& name = user_info.implementation_version_name;
        buffer.push_back(static_cast<uint8_t>(item_type::implementation_version_name));
        buffer.push_back(0x00);
        write_uint16_be(buffer, static_cast<uint16_t>(name.size()));
        buffer.insert(buffer.end(), name.begin(), name.end());
    }

    // SOP Class Extended Negotiation sub-items
    for (const auto& ext : user_info.sop_class_extended) {
        buffer.push_back(static_cast<uint8_t>(item_type::sop_class_extended_negotiation));
        buffer.push_back(0x00);
        const std::size_t item_pos = buffer.size();
        write_uint16_be(buffer, 0x0000);
        write_uint16_be(buffer, static_cast<uint16_t>(ext.sop_class_uid.size()));
        buffer.insert(buffer.end(), ext.sop_class_uid.begin(), ext.sop_class_uid.end());
        buffer.insert(buffer.end(),
                      ext.service_class_application_information.begin(),
                      ext.service_class_application_information.end());
        if (!patch_item_length(buffer, item_pos)) {
            return false;
        }
    }

    // SOP Class Common Extended Negotiation sub-items
    for (const auto& common : user_info.sop_class_common_extended) {
        buffer.push_back(static_cast<uint8_t>(item_type::sop_class_common_extended_negotiation));
        buffer.push_back(0x00);  // Sub-item version
        const std::size_t item_pos = buffer.size();
        write_uint16_be(buffer, 0x0000);

        write_uint16_be(buffer, static_cast<uint16_t>(common.sop_class_uid.size()));
        buffer.insert(buffer.end(), common.sop_class_uid.begin(), common.sop_class_uid.end());
        write_uint16_be(buffer, static_cast<uint16_t>(common.service_class_uid.size()));
        buffer.insert(buffer.end(), common.service_class_uid.begin(),
                      common.service_class_uid.end());

        const std::size_t related_pos = buffer.size();
        write_uint16_be(buffer, 0x0000);
        for (const auto& related : common.related_general_sop_classes) {
            write_uint16_be(buffer, static_cast<uint16_t>(related.size()));
            buffer.insert(buffer.end(), related.begin(), related.end());
        }
        if (!patch_item_length(buffer, related_pos) ||
            !patch_item_length(buffer, item_pos)) {
            return false;
        }
    }

    // User Identity sub-items
    if (user_info.user_identity_request) {
        const auto& identity = *user_info.user_identity_request;
        if (identity.primary_field.size() > max_item_length ||
            identity.secondary_field.size() > max_item_length) {
            return false;
        }
        buffer.push_back(static_cast<uint8_t>(item_type::user_identity_rq));
        buffer.push_back(0x00);
        const std::size_t item_pos = buffer.size();
        write_uint16_be(buffer, 0x0000);
        buffer.push_back(static_cast<uint8_t>(identity.type));
        buffer.push_back(identity.positive_response_requested ? 0x01 : 0x00);
        write_uint16_be(buffer, static_cast<uint16_t>(identity.primary_field.size()));
        buffer.insert(buffer.end(), identity.primary_field.begin(),
                      identity.primary_field.end());
        write_uint16_be(buffer, static_cast<uint16_t>(identity.secondary_field.size()));
        buffer.insert(buffer.end(), identity.secondary_field.begin(),
                      identity.secondary_field.end());
        if (!patch_item_length(buffer, item_pos)) {
            return false;
        }
    }

    if (user_info.user_identity_response) {
        const auto& response = user_info.user_identity_response->server_response;
        if (response.size() > max_item_length) {
            return false;
        }
        buffer.push_back(static_cast<uint8_t>(item_type::user_identity_ac));
        buffer.push_back(0x00);
        const std::size_t item_pos = buffer.size();
        write_uint16_be(buffer, 0x0000);
        write_uint16_be(buffer, static_cast<uint16_t>(response.size()));
        buffer.insert(buffer.end(), response.begin(), response.end());
        if (!patch_item_length(buffer, item_pos)) {
            return false;
        }
    }

    return patch_item_length(buffer, length_pos);
}

void pdu_encoder::encode_associate_header(std::vector<uint8_t>& buffer,
                                          pdu_type type,
                                          uint16_t protocol_version,
                                          const std::string& called_ae,
                                          const std::string& calling_ae) {
    // PDU Header
    buffer.push_back(static_cast<uint8_t>(type));
    buffer.push_back(0x00);  // Reserved
    write_uint32_be(buffer, 0x00000000);  // Length placeholder

    write_uint16_be(buffer, protocol_version);
    write_uint16_be(buffer, 0x0000);  // Reserved

    write_ae_title(buffer, called_ae);
    write_ae_title(buffer, calling_ae);

    // Reserved (32 bytes)
    buffer.insert(buffer.end(), 32, 0x00);
}

// ============================================================================
// PDU Encoding Functions
// ============================================================================

encode_result pdu_encoder::encode(const pdu& value) {
    return std::visit([](const auto& p) -> encode_result {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, associate_rq>) {
            return encode_associate_rq(p);
        } else if constexpr (std::is_same_v<T, associate_ac>) {
            return encode_associate_ac(p);
        } else if constexpr (std::is_same_v<T, associate_rj>) {
            return encode_associate_rj(p);
        } else if constexpr (std::is_same_v<T, p_data_tf_pdu>) {
            return encode_p_data_tf(p.pdvs);
        } else if constexpr (std::is_same_v<T, release_rq_pdu>) {
            return encode_release_rq();
        } else if constexpr (std::is_same_v<T, release_rp_pdu>) {
            return encode_release_rp();
        } else {
            return encode_abort(p.source, p.reason);
        }
    }, value);
}

encode_result pdu_encoder::encode_associate_rq(const associate_rq& rq) {
    if (auto r = validate_ae_title(rq.called_ae_title, "Called AE Title"); r.is_err()) {
        return r.error();
    }
    if (auto r = validate_ae_title(rq.calling_ae_title, "Calling AE Title"); r.is_err()) {
        return r.error();
    }
    if (rq.presentation_contexts.empty()) {
        return encoding_error("A-ASSOCIATE-RQ requires at least one presentation context");
    }
    if (rq.presentation_contexts.size() > max_presentation_contexts) {
        return encoding_error("A-ASSOCIATE-RQ proposes more than 128 presentation contexts");
    }
    for (const auto& pc : rq.presentation_contexts) {
        if (pc.id % 2 == 0) {
            return encoding_error("Presentation context ID must be odd: " +
                                  std::to_string(pc.id));
        }
        if (auto r = validate_uid(pc.abstract_syntax, "Abstract Syntax"); r.is_err()) {
            return r.error();
        }
        if (pc.transfer_syntaxes.empty()) {
            return encoding_error("Presentation context " + std::to_string(pc.id) +
                                  " proposes no transfer syntax");
        }
        for (const auto& ts : pc.transfer_syntaxes) {
            if (auto r = validate_uid(ts, "Transfer Syntax"); r.is_err()) {
                return r.error();
            }
        }
    }
    if (auto r = validate_user_information(rq.user_info, true); r.is_err()) {
        return r.error();
    }

    const std::string app_context = rq.application_context.empty()
                                        ? std::string(dicom_application_context)
                                        : rq.application_context;
    if (auto r = validate_uid(app_context, "Application Context Name"); r.is_err()) {
        return r.error();
    }

    std::vector<uint8_t> buffer;
    buffer.reserve(512);

    encode_associate_header(buffer, pdu_type::associate_rq, rq.protocol_version,
                            rq.called_ae_title, rq.calling_ae_title);
    encode_application_context(buffer, app_context);

    for (const auto& pc : rq.presentation_contexts) {
        if (!encode_presentation_context_rq(buffer, pc)) {
            return encoding_error("Presentation context item exceeds 65535 bytes");
        }
    }
    if (!encode_user_information(buffer, rq.user_info)) {
        return encoding_error("User information item exceeds 65535 bytes");
    }

    update_pdu_length(buffer);
    return buffer;
}

encode_result pdu_encoder::encode_associate_ac(const associate_ac& ac) {
    if (auto r = validate_ae_title(ac.called_ae_title, "Called AE Title"); r.is_err()) {
        return r.error();
    }
    if (auto r = validate_ae_title(ac.calling_ae_title, "Calling AE Title"); r.is_err()) {
        return r.error();
    }
    if (ac.presentation_contexts.size() > max_presentation_contexts) {
        return encoding_error("A-ASSOCIATE-AC carries more than 128 presentation contexts");
    }
    for (const auto& pc : ac.presentation_contexts) {
        if (pc.id % 2 == 0) {
            return encoding_error("Presentation context ID must be odd: " +
                                  std::to_string(pc.id));
        }
        if (pc.result == presentation_context_result::acceptance) {
            if (auto r = validate_uid(pc.transfer_syntax, "Accepted Transfer Syntax");
                r.is_err()) {
                return r.error();
            }
        }
    }
    if (auto r = validate_user_information(ac.user_info, false); r.is_err()) {
        return r.error();
    }

    const std::string app_context = ac.application_context.empty()
                                        ? std::string(dicom_application_context)
                                        : ac.application_context;

    std::vector<uint8_t> buffer;
    buffer.reserve(512);

    encode_associate_header(buffer, pdu_type::associate_ac, ac.protocol_version,
                            ac.called_ae_title, ac.calling_ae_title);
    encode_application_context(buffer, app_context);

    for (const auto& pc : ac.presentation_contexts) {
        if (!encode_presentation_context_ac(buffer, pc)) {
            return encoding_error("Presentation context item exceeds 65535 bytes");
        }
    }
    if (!encode_user_information(buffer, ac.user_info)) {
        return encoding_error("User information item exceeds 65535 bytes");
    }

    update_pdu_length(buffer);
    return buffer;
}

std::vector<uint8_t> pdu_encoder::encode_associate_rj(const associate_rj& rj) {
    // type 0x03, reserved, length 4, reserved, result, source, reason
    std::vector<uint8_t> buffer;
    buffer.reserve(10);

    buffer.push_back(static_cast<uint8_t>(pdu_type::associate_rj));
    buffer.push_back(0x00);
    write_uint32_be(buffer, 0x00000004);

    buffer.push_back(0x00);
    buffer.push_back(static_cast<uint8_t>(rj.result));
    buffer.push_back(rj.source);
    buffer.push_back(rj.reason);

    return buffer;
}

std::vector<uint8_t> pdu_encoder::encode_release_rq() {
    std::vector<uint8_t> buffer;
    buffer.reserve(10);

    buffer.push_back(static_cast<uint8_t>(pdu_type::release_rq));
    buffer.push_back(0x00);
    write_uint32_be(buffer, 0x00000004);
    write_uint32_be(buffer, 0x00000000);  // Reserved

    return buffer;
}

std::vector<uint8_t> pdu_encoder::encode_release_rp() {
    std::vector<uint8_t> buffer;
    buffer.reserve(10);

    buffer.push_back(static_cast<uint8_t>(pdu_type::release_rp));
    buffer.push_back(0x00);
    write_uint32_be(buffer, 0x00000004);
    write_uint32_be(buffer, 0x00000000);  // Reserved

    return buffer;
}

std::vector<uint8_t> pdu_encoder::encode_abort(uint8_t source, uint8_t reason) {
    // type 0x07, reserved, length 4, reserved, reserved, source, reason
    std::vector<uint8_t> buffer;
    buffer.reserve(10);

    buffer.push_back(static_cast<uint8_t>(pdu_type::abort));
    buffer.push_back(0x00);
    write_uint32_be(buffer, 0x00000004);
    buffer.push_back(0x00);
    buffer.push_back(0x00);
    buffer.push_back(source);
    buffer.push_back(reason);

    return buffer;
}

std::vector<uint8_t> pdu_encoder::encode_abort(abort_source source,
                                               abort_reason reason) {
    return encode_abort(static_cast<uint8_t>(source), static_cast<uint8_t>(reason));
}

encode_result pdu_encoder::encode_p_data_tf(
    const std::vector<presentation_data_value>& pdvs) {

    if (pdvs.empty()) {
        return encoding_error("P-DATA-TF requires at least one PDV item");
    }

    std::size_t payload = 0;
    for (const auto& pdv : pdvs) {
        if (pdv.context_id % 2 == 0) {
            return encoding_error("PDV presentation context ID must be odd: " +
                                  std::to_string(pdv.context_id));
        }
        payload += pdv.data.size();
    }

    const std::size_t total = p_data_tf_size(payload, pdvs.size());
    if (total - pdu_header_size > std::numeric_limits<uint32_t>::max()) {
        return encoding_error("P-DATA-TF exceeds the 32-bit PDU length field");
    }

    std::vector<uint8_t> buffer;
    buffer.reserve(total);

    buffer.push_back(static_cast<uint8_t>(pdu_type::p_data_tf));
    buffer.push_back(0x00);
    write_uint32_be(buffer, 0x00000000);

    for (const auto& pdv : pdvs) {
        // PDV item: length(4) = context id + control header + data
        write_uint32_be(buffer, static_cast<uint32_t>(2 + pdv.data.size()));
        buffer.push_back(pdv.context_id);
        buffer.push_back(pdv.control_header());
        buffer.insert(buffer.end(), pdv.data.begin(), pdv.data.end());
    }

    update_pdu_length(buffer);
    return buffer;
}

encode_result pdu_encoder::encode_p_data_tf(const presentation_data_value& pdv) {
    return encode_p_data_tf(std::vector<presentation_data_value>{pdv});
}

}  // namespace dul::network
