#include "dul/network/pdu_decoder.hpp"

#include <utility>

namespace dul::network {

namespace {

/// Fixed size PDUs (A-RELEASE-RQ, A-RELEASE-RP, A-ABORT, A-ASSOCIATE-RJ)
constexpr size_t fixed_pdu_size = 10;

/// ASSOCIATE PDU header size after 6-byte PDU header
/// (version + reserved + called AE + calling AE + reserved)
constexpr size_t associate_header_size = 68;  // 2 + 2 + 16 + 16 + 32

/// Item/sub-item header: type, reserved, 2-byte length
constexpr size_t item_header_size = 4;

template<typename T>
DecodeResult<T> make_error(int code, const std::string& msg) {
    return DecodeResult<T>::err(error_info(code, msg, "dul::network::pdu_decoder"));
}

template<typename T>
DecodeResult<T> malformed(const std::string& msg) {
    return make_error<T>(dul::error_codes::malformed_pdu, msg);
}

template<typename T>
DecodeResult<T> make_ok(T value) {
    return DecodeResult<T>::ok(std::move(value));
}

/// Bytes following a {type}{reserved}{length:2} header, bounds-checked
struct item_view {
    uint8_t type{0};
    std::span<const uint8_t> body;
};

std::optional<item_view> next_item(std::span<const uint8_t> data, size_t& pos) {
    if (pos + item_header_size > data.size()) {
        return std::nullopt;
    }
    const uint8_t type = data[pos];
    const size_t length = (static_cast<size_t>(data[pos + 2]) << 8) | data[pos + 3];
    if (pos + item_header_size + length > data.size()) {
        return std::nullopt;
    }
    item_view view{type, data.subspan(pos + item_header_size, length)};
    pos += item_header_size + length;
    return view;
}

std::string hex_byte(uint8_t value) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string out = "0x";
    out.push_back(digits[(value >> 4) & 0x0F]);
    out.push_back(digits[value & 0x0F]);
    return out;
}

}  // namespace

// ============================================================================
// Helper Functions
// ============================================================================

uint16_t pdu_decoder::read_uint16_be(std::span<const uint8_t> data, size_t offset) {
    return static_cast<uint16_t>(
        (static_cast<uint16_t>(data[offset]) << 8) |
        static_cast<uint16_t>(data[offset + 1]));
}

uint32_t pdu_decoder::read_uint32_be(std::span<const uint8_t> data, size_t offset) {
    return (static_cast<uint32_t>(data[offset]) << 24) |
           (static_cast<uint32_t>(data[offset + 1]) << 16) |
           (static_cast<uint32_t>(data[offset + 2]) << 8) |
           static_cast<uint32_t>(data[offset + 3]);
}

std::string pdu_decoder::read_ae_title(std::span<const uint8_t> data, size_t offset) {
    std::string ae_title(reinterpret_cast<const char*>(data.data() + offset),
                         ae_title_length);
    // Trim leading and trailing spaces (leading spaces are not significant)
    const auto begin = ae_title.find_first_not_of(' ');
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = ae_title.find_last_not_of(' ');
    return ae_title.substr(begin, end - begin + 1);
}

std::string pdu_decoder::read_uid(std::span<const uint8_t> data, size_t offset,
                                  size_t length) {
    std::string uid(reinterpret_cast<const char*>(data.data() + offset), length);
    // Strip the single NUL that pads an odd-length UID; other bytes are kept
    if (!uid.empty() && uid.back() == '\0') {
        uid.pop_back();
    }
    return uid;
}

DecodeResult<uint32_t> pdu_decoder::validate_pdu_header(
    std::span<const uint8_t> data, pdu_type expected_type) {

    if (data.size() < pdu_header_size) {
        return make_error<uint32_t>(dul::error_codes::incomplete_pdu,
            "Incomplete PDU header: have " + std::to_string(data.size()) + " bytes");
    }

    if (data[0] != static_cast<uint8_t>(expected_type)) {
        return malformed<uint32_t>(
            "Expected " + std::string(to_string(expected_type)) +
            ", got PDU type " + hex_byte(data[0]));
    }

    const uint32_t pdu_length = read_uint32_be(data, 2);
    const size_t total_length = pdu_header_size + pdu_length;

    if (data.size() < total_length) {
        return make_error<uint32_t>(dul::error_codes::incomplete_pdu,
            "Need " + std::to_string(total_length) +
            " bytes, have " + std::to_string(data.size()));
    }
    if (data.size() > total_length) {
        return malformed<uint32_t>(
            "Declared PDU length " + std::to_string(pdu_length) +
            " does not cover " + std::to_string(data.size() - pdu_header_size) +
            " body bytes");
    }

    return make_ok(pdu_length);
}

// ============================================================================
// General Decoding
// ============================================================================

std::optional<size_t> pdu_decoder::pdu_length(std::span<const uint8_t> data) {
    if (data.size() < pdu_header_size) {
        return std::nullopt;
    }
    return pdu_header_size + static_cast<size_t>(read_uint32_be(data, 2));
}

std::optional<pdu_type> pdu_decoder::peek_pdu_type(std::span<const uint8_t> data) {
    if (data.empty() || !is_known_pdu_type(data[0])) {
        return std::nullopt;
    }
    return static_cast<pdu_type>(data[0]);
}

DecodeResult<pdu> pdu_decoder::decode(std::span<const uint8_t> data) {
    if (data.size() < pdu_header_size) {
        return make_error<pdu>(dul::error_codes::incomplete_pdu,
            "Incomplete PDU header");
    }

    // Lift a typed decode result into the pdu variant
    auto lift = [](auto&& result) -> DecodeResult<pdu> {
        if (result.is_err()) {
            return result.error();
        }
        return make_ok<pdu>(pdu{std::move(result.value())});
    };

    switch (data[0]) {
        case 0x01: return lift(decode_associate_rq(data));
        case 0x02: return lift(decode_associate_ac(data));
        case 0x03: return lift(decode_associate_rj(data));
        case 0x04: return lift(decode_p_data_tf(data));
        case 0x05: return lift(decode_release_rq(data));
        case 0x06: return lift(decode_release_rp(data));
        case 0x07: return lift(decode_abort(data));
        default:
            return malformed<pdu>("Unknown PDU type: " + hex_byte(data[0]));
    }
}

// ============================================================================
// A-ASSOCIATE-RQ / AC Decoders
// ============================================================================

DecodeResult<associate_rq> pdu_decoder::decode_associate_rq(
    std::span<const uint8_t> data) {

    auto header_result = validate_pdu_header(data, pdu_type::associate_rq);
    if (header_result.is_err()) {
        return header_result.error();
    }
    if (header_result.value() < associate_header_size) {
        return malformed<associate_rq>("A-ASSOCIATE-RQ shorter than its fixed header");
    }

    associate_rq rq;
    rq.protocol_version = read_uint16_be(data, 6);
    // Reserved bytes 8-9
    rq.called_ae_title = read_ae_title(data, 10);
    rq.calling_ae_title = read_ae_title(data, 26);
    // Reserved bytes 42-73

    auto items_result = decode_variable_items(
        data.subspan(pdu_header_size + associate_header_size), true);
    if (items_result.is_err()) {
        return items_result.error();
    }
    auto& items = items_result.value();

    if (items.application_context.empty()) {
        return malformed<associate_rq>("A-ASSOCIATE-RQ has no Application Context item");
    }
    if (items.contexts_rq.empty()) {
        return malformed<associate_rq>("A-ASSOCIATE-RQ has no Presentation Context item");
    }
    if (!items.user_info) {
        return malformed<associate_rq>("A-ASSOCIATE-RQ has no User Information item");
    }

    rq.application_context = std::move(items.application_context);
    rq.presentation_contexts = std::move(items.contexts_rq);
    rq.user_info = std::move(*items.user_info);

    return make_ok(std::move(rq));
}

DecodeResult<associate_ac> pdu_decoder::decode_associate_ac(
    std::span<const uint8_t> data) {

    auto header_result = validate_pdu_header(data, pdu_type::associate_ac);
    if (header_result.is_err()) {
        return header_result.error();
    }
    if (header_result.value() < associate_header_size) {
        return malformed<associate_ac>("A-ASSOCIATE-AC shorter than its fixed header");
    }

    associate_ac ac;
    ac.protocol_version = read_uint16_be(data, 6);
    ac.called_ae_title = read_ae_title(data, 10);
    ac.calling_ae_title = read_ae_title(data, 26);

    auto items_result = decode_variable_items(
        data.subspan(pdu_header_size + associate_header_size), false);
    if (items_result.is_err()) {
        return items_result.error();
    }
    auto& items = items_result.value();

    if (items.application_context.empty()) {
        return malformed<associate_ac>("A-ASSOCIATE-AC has no Application Context item");
    }
    if (!items.user_info) {
        return malformed<associate_ac>("A-ASSOCIATE-AC has no User Information item");
    }

    ac.application_context = std::move(items.application_context);
    ac.presentation_contexts = std::move(items.contexts_ac);
    ac.user_info = std::move(*items.user_info);

    return make_ok(std::move(ac));
}

// ============================================================================
// A-ASSOCIATE-RJ Decoder
// ============================================================================

DecodeResult<associate_rj> pdu_decoder::decode_associate_rj(
    std::span<const uint8_t> data) {

    auto header_result = validate_pdu_header(data, pdu_type::associate_rj);
    if (header_result.is_err()) {
        return header_result.error();
    }
    if (data.size() != fixed_pdu_size) {
        return malformed<associate_rj>("A-ASSOCIATE-RJ length must be 4");
    }

    const uint8_t result = data[7];
    if (result != static_cast<uint8_t>(reject_result::rejected_permanent) &&
        result != static_cast<uint8_t>(reject_result::rejected_transient)) {
        return malformed<associate_rj>("Invalid A-ASSOCIATE-RJ result " + hex_byte(result));
    }
    const uint8_t source = data[8];
    if (source < static_cast<uint8_t>(reject_source::service_user) ||
        source > static_cast<uint8_t>(reject_source::service_provider_presentation)) {
        return malformed<associate_rj>("Invalid A-ASSOCIATE-RJ source " + hex_byte(source));
    }

    return make_ok(associate_rj(static_cast<reject_result>(result), source, data[9]));
}

// ============================================================================
// A-RELEASE-RQ / RP Decoders
// ============================================================================

DecodeResult<release_rq_pdu> pdu_decoder::decode_release_rq(
    std::span<const uint8_t> data) {

    auto header_result = validate_pdu_header(data, pdu_type::release_rq);
    if (header_result.is_err()) {
        return header_result.error();
    }
    if (data.size() != fixed_pdu_size) {
        return malformed<release_rq_pdu>("A-RELEASE-RQ length must be 4");
    }
    return make_ok(release_rq_pdu{});
}

DecodeResult<release_rp_pdu> pdu_decoder::decode_release_rp(
    std::span<const uint8_t> data) {

    auto header_result = validate_pdu_header(data, pdu_type::release_rp);
    if (header_result.is_err()) {
        return header_result.error();
    }
    if (data.size() != fixed_pdu_size) {
        return malformed<release_rp_pdu>("A-RELEASE-RP length must be 4");
    }
    return make_ok(release_rp_pdu{});
}

// ============================================================================
// A-ABORT Decoder
// ============================================================================

DecodeResult<abort_pdu> pdu_decoder::decode_abort(std::span<const uint8_t> data) {
    auto header_result = validate_pdu_header(data, pdu_type::abort);
    if (header_result.is_err()) {
        return header_result.error();
    }
    if (data.size() != fixed_pdu_size) {
        return malformed<abort_pdu>("A-ABORT length must be 4");
    }

    const uint8_t source = data[8];
    const uint8_t reason = data[9];
    if (source > static_cast<uint8_t>(abort_source::service_provider)) {
        return malformed<abort_pdu>("Invalid A-ABORT source " + hex_byte(source));
    }
    if (reason > static_cast<uint8_t>(abort_reason::invalid_pdu_parameter)) {
        return malformed<abort_pdu>("Invalid A-ABORT reason " + hex_byte(reason));
    }

    return make_ok(abort_pdu(static_cast<abort_source>(source),
                             static_cast<abort_reason>(reason)));
}

// ============================================================================
// P-DATA-TF Decoder
// ============================================================================

DecodeResult<p_data_tf_pdu> pdu_decoder::decode_p_data_tf(
    std::span<const uint8_t> data) {

    auto header_result = validate_pdu_header(data, pdu_type::p_data_tf);
    if (header_result.is_err()) {
        return header_result.error();
    }

    const size_t pdu_end = data.size();
    p_data_tf_pdu result;
    size_t pos = pdu_header_size;

    while (pos < pdu_end) {
        // PDV item: length(4), presentation context ID(1), control header(1), data
        if (pos + 4 > pdu_end) {
            return malformed<p_data_tf_pdu>("Incomplete PDV item length");
        }

        const uint32_t pdv_item_length = read_uint32_be(data, pos);
        pos += 4;

        if (pdv_item_length < 2) {
            return malformed<p_data_tf_pdu>("PDV item length too small");
        }
        if (pdv_item_length > pdu_end - pos) {
            return malformed<p_data_tf_pdu>("PDV item exceeds PDU bounds");
        }

        presentation_data_value pdv;
        pdv.context_id = data[pos];
        if (pdv.context_id % 2 == 0) {
            return malformed<p_data_tf_pdu>(
                "PDV presentation context ID must be odd: " +
                std::to_string(pdv.context_id));
        }

        const uint8_t control = data[pos + 1];
        pdv.is_command = (control & 0x01) != 0;
        pdv.is_last = (control & 0x02) != 0;
        pos += 2;

        const size_t data_length = pdv_item_length - 2;
        pdv.data.assign(data.begin() + static_cast<ptrdiff_t>(pos),
                        data.begin() + static_cast<ptrdiff_t>(pos + data_length));
        pos += data_length;

        result.pdvs.push_back(std::move(pdv));
    }

    if (result.pdvs.empty()) {
        return malformed<p_data_tf_pdu>("P-DATA-TF carries no PDV item");
    }

    return make_ok(std::move(result));
}

// ============================================================================
// Variable Items Decoder (for ASSOCIATE-RQ/AC)
// ============================================================================

DecodeResult<pdu_decoder::variable_items> pdu_decoder::decode_variable_items(
    std::span<const uint8_t> data, bool is_rq) {

    variable_items items;
    bool have_app_context = false;
    size_t pos = 0;

    while (pos < data.size()) {
        auto item = next_item(data, pos);
        if (!item) {
            return malformed<variable_items>("Item length exceeds PDU bounds");
        }

        switch (static_cast<item_type>(item->type)) {
            case item_type::application_context:
                if (have_app_context) {
                    return malformed<variable_items>("Duplicate Application Context item");
                }
                have_app_context = true;
                items.application_context = read_uid(item->body, 0, item->body.size());
                break;

            case item_type::presentation_context_rq: {
                if (!is_rq) {
                    return malformed<variable_items>(
                        "Presentation Context RQ item in A-ASSOCIATE-AC");
                }
                auto pc = decode_presentation_context_rq(item->body);
                if (pc.is_err()) {
                    return pc.error();
                }
                items.contexts_rq.push_back(std::move(pc.value()));
                break;
            }

            case item_type::presentation_context_ac: {
                if (is_rq) {
                    return malformed<variable_items>(
                        "Presentation Context AC item in A-ASSOCIATE-RQ");
                }
                auto pc = decode_presentation_context_ac(item->body);
                if (pc.is_err()) {
                    return pc.error();
                }
                items.contexts_ac.push_back(std::move(pc.value()));
                break;
            }

            case item_type::user_information: {
                if (items.user_info) {
                    return malformed<variable_items>("Duplicate User Information item");
                }
                auto info = decode_user_info_item(item->body, is_rq);
                if (info.is_err()) {
                    return info.error();
                }
                items.user_info = std::move(info.value());
                break;
            }

            default:
                return malformed<variable_items>(
                    "Unknown item type " + hex_byte(item->type));
        }
    }

    return make_ok(std::move(items));
}

DecodeResult<presentation_context_rq> pdu_decoder::decode_presentation_context_rq(
    std::span<const uint8_t> item) {

    if (item.size() < 4) {
        return malformed<presentation_context_rq>("Presentation Context item too short");
    }

    presentation_context_rq pc;
    pc.id = item[0];
    // 3 reserved bytes

    bool have_abstract_syntax = false;
    size_t pos = 4;
    while (pos < item.size()) {
        auto sub = next_item(item, pos);
        if (!sub) {
            return malformed<presentation_context_rq>(
                "Sub-item length exceeds Presentation Context item");
        }
        switch (static_cast<item_type>(sub->type)) {
            case item_type::abstract_syntax:
                if (have_abstract_syntax) {
                    return malformed<presentation_context_rq>(
                        "Duplicate Abstract Syntax in context " + std::to_string(pc.id));
                }
                have_abstract_syntax = true;
                pc.abstract_syntax = read_uid(sub->body, 0, sub->body.size());
                break;
            case item_type::transfer_syntax:
                pc.transfer_syntaxes.push_back(read_uid(sub->body, 0, sub->body.size()));
                break;
            default:
                return malformed<presentation_context_rq>(
                    "Unknown Presentation Context sub-item " + hex_byte(sub->type));
        }
    }

    if (!have_abstract_syntax || pc.abstract_syntax.empty()) {
        return malformed<presentation_context_rq>(
            "Presentation context " + std::to_string(pc.id) + " has no Abstract Syntax");
    }
    if (pc.transfer_syntaxes.empty()) {
        return malformed<presentation_context_rq>(
            "Presentation context " + std::to_string(pc.id) + " has no Transfer Syntax");
    }

    return make_ok(std::move(pc));
}

DecodeResult<presentation_context_ac> pdu_decoder::decode_presentation_context_ac(
    std::span<const uint8_t> item) {

    if (item.size() < 4) {
        return malformed<presentation_context_ac>("Presentation Context item too short");
    }

    presentation_context_ac pc;
    pc.id = item[0];
    // Reserved byte at 1
    if (item[2] > static_cast<uint8_t>(
                      presentation_context_result::transfer_syntaxes_not_supported)) {
        return malformed<presentation_context_ac>(
            "Invalid Presentation Context result " + hex_byte(item[2]));
    }
    pc.result = static_cast<presentation_context_result>(item[2]);
    // Reserved byte at 3

    bool have_transfer_syntax = false;
    size_t pos = 4;
    while (pos < item.size()) {
        auto sub = next_item(item, pos);
        if (!sub) {
            return malformed<presentation_context_ac>(
                "Sub-item length exceeds Presentation Context item");
        }
        if (static_cast<item_type>(sub->type) != item_type::transfer_syntax) {
            return malformed<presentation_context_ac>(
                "Unknown Presentation Context sub-item " + hex_byte(sub->type));
        }
        if (have_transfer_syntax) {
            return malformed<presentation_context_ac>(
                "Duplicate Transfer Syntax in context " + std::to_string(pc.id));
        }
        have_transfer_syntax = true;
        pc.transfer_syntax = read_uid(sub->body, 0, sub->body.size());
    }

    return make_ok(std::move(pc));
}

// ============================================================================
// User Information Decoder
// ============================================================================

DecodeResult<user_information> pdu_decoder::decode_user_info_item(
    std::span<const uint8_t> item, bool is_rq) {

    user_information info;
    bool have_max_length = false;
    bool have_impl_class = false;

    // Reads a {length:2}{bytes} field inside a sub-item body
    auto read_prefixed = [](std::span<const uint8_t> body, size_t& pos,
                            std::string& out) -> bool {
        if (pos + 2 > body.size()) {
            return false;
        }
        const size_t length = read_uint16_be(body, pos);
        pos += 2;
        if (pos + length > body.size()) {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(body.data() + pos), length);
        pos += length;
        return true;
    };

    size_t pos = 0;
    while (pos < item.size()) {
        auto sub = next_item(item, pos);
        if (!sub) {
            return malformed<user_information>(
                "Sub-item length exceeds User Information item");
        }
        const auto body = sub->body;

        switch (static_cast<item_type>(sub->type)) {
            case item_type::maximum_length:
                if (body.size() != 4) {
                    return malformed<user_information>("Maximum Length sub-item length must be 4");
                }
                info.max_pdu_length = read_uint32_be(body, 0);
                have_max_length = true;
                break;

            case item_type::implementation_class_uid:
                info.implementation_class_uid = read_uid(body, 0, body.size());
                have_impl_class = !info.implementation_class_uid.empty();
                break;

            case item_type::async_operations_window:
                if (body.size() != 4) {
                    return malformed<user_information>(
                        "Asynchronous Operations Window sub-item length must be 4");
                }
                info.async_operations = async_operations_window{
                    read_uint16_be(body, 0), read_uint16_be(body, 2)};
                break;

            case item_type::scp_scu_role_selection: {
                size_t p = 0;
                std::string uid;
                if (!read_prefixed(body, p, uid) || p + 2 != body.size()) {
                    return malformed<user_information>("Malformed SCP/SCU Role Selection sub-item");
                }
                if (!uid.empty() && uid.back() == '\0') {
                    uid.pop_back();
                }
                info.role_selections.emplace_back(std::move(uid), body[p] != 0,
                                                  body[p + 1] != 0);
                break;
            }

            case item_type::implementation_version_name:
                info.implementation_version_name = read_uid(body, 0, body.size());
                break;

            case item_type::sop_class_extended_negotiation: {
                size_t p = 0;
                sop_class_extended_negotiation ext;
                if (!read_prefixed(body, p, ext.sop_class_uid)) {
                    return malformed<user_information>(
                        "Malformed SOP Class Extended Negotiation sub-item");
                }
                ext.service_class_application_information.assign(
                    body.begin() + static_cast<ptrdiff_t>(p), body.end());
                info.sop_class_extended.push_back(std::move(ext));
                break;
            }

            case item_type::sop_class_common_extended_negotiation: {
                if (!is_rq) {
                    return malformed<user_information>(
                        "SOP Class Common Extended sub-item in A-ASSOCIATE-AC");
                }
                size_t p = 0;
                sop_class_common_extended_negotiation common;
                std::string related_block;
                if (!read_prefixed(body, p, common.sop_class_uid) ||
                    !read_prefixed(body, p, common.service_class_uid) ||
                    !read_prefixed(body, p, related_block) || p != body.size()) {
                    return malformed<user_information>(
                        "Malformed SOP Class Common Extended sub-item");
                }
                const std::span<const uint8_t> related(
                    reinterpret_cast<const uint8_t*>(related_block.data()),
                    related_block.size());
                size_t r = 0;
                while (r < related.size()) {
                    std::string uid;
                    if (!read_prefixed(related, r, uid)) {
                        return malformed<user_information>(
                            "Malformed Related General SOP Class list");
                    }
                    common.related_general_sop_classes.push_back(std::move(uid));
                }
                info.sop_class_common_extended.push_back(std::move(common));
                break;
            }

            case item_type::user_identity_rq: {
                if (!is_rq) {
                    return malformed<user_information>(
                        "User Identity RQ sub-item in A-ASSOCIATE-AC");
                }
                if (body.size() < 2) {
                    return malformed<user_information>("User Identity RQ sub-item too short");
                }
                user_identity_rq identity;
                if (body[0] < static_cast<uint8_t>(user_identity_type::username) ||
                    body[0] > static_cast<uint8_t>(user_identity_type::jwt)) {
                    return malformed<user_information>(
                        "Invalid User Identity type " + hex_byte(body[0]));
                }
                identity.type = static_cast<user_identity_type>(body[0]);
                identity.positive_response_requested = body[1] != 0;
                size_t p = 2;
                if (!read_prefixed(body, p, identity.primary_field) ||
                    !read_prefixed(body, p, identity.secondary_field) ||
                    p != body.size()) {
                    return malformed<user_information>("Malformed User Identity RQ sub-item");
                }
                info.user_identity_request = std::move(identity);
                break;
            }

            case item_type::user_identity_ac: {
                if (is_rq) {
                    return malformed<user_information>(
                        "User Identity AC sub-item in A-ASSOCIATE-RQ");
                }
                size_t p = 0;
                user_identity_ac response;
                if (!read_prefixed(body, p, response.server_response) || p != body.size()) {
                    return malformed<user_information>("Malformed User Identity AC sub-item");
                }
                info.user_identity_response = std::move(response);
                break;
            }

            default:
                return malformed<user_information>(
                    "Unknown User Information sub-item " + hex_byte(sub->type));
        }
    }

    if (is_rq && !have_max_length) {
        return malformed<user_information>("User Information has no Maximum Length sub-item");
    }
    if (is_rq && !have_impl_class) {
        return malformed<user_information>(
            "User Information has no Implementation Class UID sub-item");
    }

    return make_ok(std::move(info));
}

}  // namespace dul::network
