/**
 * @file dimse_message.cpp
 * @brief DIMSE message accessors, codec and factories
 */

#include "dul/network/dimse/dimse_message.hpp"

namespace dul::network::dimse {

namespace {

constexpr const char* module_name = "dul::network::dimse";

bool identified_by_message_id(command_field cmd) noexcept {
    return dimse::is_request(cmd) && cmd != command_field::c_cancel_rq;
}

void set_subops(dimse_message& msg, std::optional<uint16_t> remaining,
                uint16_t completed, uint16_t failed, uint16_t warning) {
    if (remaining) {
        msg.set_remaining_subops(*remaining);
    }
    msg.set_completed_subops(completed);
    msg.set_failed_subops(failed);
    msg.set_warning_subops(warning);
}

}  // namespace

dimse_message::dimse_message(command_field cmd, uint16_t message_id)
    : command_(cmd) {
    commands_.set_uint16(tag_command_field, static_cast<uint16_t>(cmd));
    if (identified_by_message_id(cmd)) {
        commands_.set_uint16(tag_message_id, message_id);
    }
    update_data_set_type();
}

auto dimse_message::message_id() const noexcept -> uint16_t {
    const auto tag = identified_by_message_id(command_) ? tag_message_id
                                                        : tag_message_id_responded_to;
    return commands_.get_uint16(tag).value_or(0);
}

// ============================================================================
// Dataset Access
// ============================================================================

auto dimse_message::dataset() const noexcept -> std::span<const uint8_t> {
    if (!dataset_) {
        return {};
    }
    return *dataset_;
}

void dimse_message::set_dataset(std::vector<uint8_t> bytes) {
    dataset_ = std::move(bytes);
    update_data_set_type();
}

auto dimse_message::take_dataset() -> std::vector<uint8_t> {
    std::vector<uint8_t> bytes;
    if (dataset_) {
        bytes = std::move(*dataset_);
    }
    clear_dataset();
    return bytes;
}

void dimse_message::clear_dataset() noexcept {
    dataset_.reset();
    update_data_set_type();
}

bool dimse_message::announces_dataset() const {
    return commands_.get_uint16(tag_command_data_set_type)
               .value_or(command_data_set_type_null) != command_data_set_type_null;
}

// ============================================================================
// Status
// ============================================================================

auto dimse_message::status() const -> status_code {
    return commands_.get_uint16(tag_status).value_or(status_success);
}

void dimse_message::set_status(status_code status) {
    commands_.set_uint16(tag_status, status);
}

auto dimse_message::error_comment() const -> std::optional<std::string> {
    return commands_.get_string(tag_error_comment);
}

void dimse_message::set_error_comment(std::string_view comment) {
    // LO, 64 characters
    commands_.set_text(tag_error_comment, comment.substr(0, 64));
}

auto dimse_message::error_id() const -> std::optional<uint16_t> {
    return commands_.get_uint16(tag_error_id);
}

void dimse_message::set_error_id(uint16_t id) {
    commands_.set_uint16(tag_error_id, id);
}

auto dimse_message::offending_elements() const -> std::vector<core::dicom_tag> {
    return commands_.get_tags(tag_offending_element).value_or(std::vector<core::dicom_tag>{});
}

void dimse_message::set_offending_elements(const std::vector<core::dicom_tag>& tags) {
    commands_.set_tags(tag_offending_element, tags);
}

// ============================================================================
// Common Attributes
// ============================================================================

auto dimse_message::affected_sop_class_uid() const -> std::string {
    return commands_.get_string(tag_affected_sop_class_uid).value_or("");
}

void dimse_message::set_affected_sop_class_uid(std::string_view uid) {
    commands_.set_uid(tag_affected_sop_class_uid, uid);
}

auto dimse_message::affected_sop_instance_uid() const -> std::string {
    return commands_.get_string(tag_affected_sop_instance_uid).value_or("");
}

void dimse_message::set_affected_sop_instance_uid(std::string_view uid) {
    commands_.set_uid(tag_affected_sop_instance_uid, uid);
}

auto dimse_message::priority() const -> uint16_t {
    return commands_.get_uint16(tag_priority).value_or(priority_medium);
}

void dimse_message::set_priority(uint16_t priority) {
    commands_.set_uint16(tag_priority, priority);
}

auto dimse_message::message_id_responded_to() const -> uint16_t {
    return commands_.get_uint16(tag_message_id_responded_to).value_or(0);
}

void dimse_message::set_message_id_responded_to(uint16_t id) {
    commands_.set_uint16(tag_message_id_responded_to, id);
}

// ============================================================================
// C-MOVE / C-GET
// ============================================================================

auto dimse_message::move_destination() const -> std::string {
    return commands_.get_string(tag_move_destination).value_or("");
}

void dimse_message::set_move_destination(std::string_view ae_title) {
    commands_.set_text(tag_move_destination, ae_title);
}

auto dimse_message::move_originator_aet() const -> std::optional<std::string> {
    return commands_.get_string(tag_move_originator_aet);
}

void dimse_message::set_move_originator_aet(std::string_view ae_title) {
    commands_.set_text(tag_move_originator_aet, ae_title);
}

auto dimse_message::move_originator_message_id() const -> std::optional<uint16_t> {
    return commands_.get_uint16(tag_move_originator_message_id);
}

void dimse_message::set_move_originator_message_id(uint16_t id) {
    commands_.set_uint16(tag_move_originator_message_id, id);
}

auto dimse_message::remaining_subops() const -> std::optional<uint16_t> {
    return commands_.get_uint16(tag_number_of_remaining_subops);
}

void dimse_message::set_remaining_subops(uint16_t count) {
    commands_.set_uint16(tag_number_of_remaining_subops, count);
}

auto dimse_message::completed_subops() const -> std::optional<uint16_t> {
    return commands_.get_uint16(tag_number_of_completed_subops);
}

void dimse_message::set_completed_subops(uint16_t count) {
    commands_.set_uint16(tag_number_of_completed_subops, count);
}

auto dimse_message::failed_subops() const -> std::optional<uint16_t> {
    return commands_.get_uint16(tag_number_of_failed_subops);
}

void dimse_message::set_failed_subops(uint16_t count) {
    commands_.set_uint16(tag_number_of_failed_subops, count);
}

auto dimse_message::warning_subops() const -> std::optional<uint16_t> {
    return commands_.get_uint16(tag_number_of_warning_subops);
}

void dimse_message::set_warning_subops(uint16_t count) {
    commands_.set_uint16(tag_number_of_warning_subops, count);
}

// ============================================================================
// DIMSE-N
// ============================================================================

auto dimse_message::requested_sop_class_uid() const -> std::string {
    return commands_.get_string(tag_requested_sop_class_uid).value_or("");
}

void dimse_message::set_requested_sop_class_uid(std::string_view uid) {
    commands_.set_uid(tag_requested_sop_class_uid, uid);
}

auto dimse_message::requested_sop_instance_uid() const -> std::string {
    return commands_.get_string(tag_requested_sop_instance_uid).value_or("");
}

void dimse_message::set_requested_sop_instance_uid(std::string_view uid) {
    commands_.set_uid(tag_requested_sop_instance_uid, uid);
}

auto dimse_message::event_type_id() const -> std::optional<uint16_t> {
    return commands_.get_uint16(tag_event_type_id);
}

void dimse_message::set_event_type_id(uint16_t type_id) {
    commands_.set_uint16(tag_event_type_id, type_id);
}

auto dimse_message::action_type_id() const -> std::optional<uint16_t> {
    return commands_.get_uint16(tag_action_type_id);
}

void dimse_message::set_action_type_id(uint16_t type_id) {
    commands_.set_uint16(tag_action_type_id, type_id);
}

auto dimse_message::attribute_identifier_list() const -> std::vector<core::dicom_tag> {
    return commands_.get_tags(tag_attribute_identifier_list)
        .value_or(std::vector<core::dicom_tag>{});
}

void dimse_message::set_attribute_identifier_list(const std::vector<core::dicom_tag>& tags) {
    commands_.set_tags(tag_attribute_identifier_list, tags);
}

auto dimse_message::sop_class_uid() const -> std::string {
    if (auto affected = commands_.get_string(tag_affected_sop_class_uid)) {
        return *affected;
    }
    return requested_sop_class_uid();
}

// ============================================================================
// Encoding/Decoding
// ============================================================================

auto dimse_message::encode() const -> dimse_result<encoded_message> {
    if (!is_valid()) {
        return error_info(dul::error_codes::invalid_command_set,
                          std::string("Cannot encode incomplete ") +
                              std::string(to_string(command_)),
                          module_name);
    }
    encoded_message encoded;
    encoded.first = commands_.encode();
    if (dataset_) {
        encoded.second = *dataset_;
    }
    return encoded;
}

auto dimse_message::decode(std::span<const uint8_t> command_data,
                           std::optional<std::vector<uint8_t>> dataset_data)
    -> dimse_result<dimse_message> {
    auto decoded = command_set::decode(command_data);
    if (decoded.is_err()) {
        return decoded.error();
    }

    auto field = decoded.value().get_uint16(tag_command_field);
    if (!field) {
        return error_info(dul::error_codes::missing_command_element,
                          "Command set has no Command Field (0000,0100)", module_name);
    }
    if (!is_known_command(*field)) {
        return error_info(dul::error_codes::invalid_command_set,
                          "Unknown command field " + std::to_string(*field), module_name);
    }

    dimse_message msg;
    msg.command_ = static_cast<command_field>(*field);
    msg.commands_ = std::move(decoded.value());

    if (msg.announces_dataset() != dataset_data.has_value()) {
        return error_info(dul::error_codes::invalid_command_set,
                          msg.announces_dataset()
                              ? "Command announces a data set that was not received"
                              : "Data set received for a command that announces none",
                          module_name);
    }
    msg.dataset_ = std::move(dataset_data);

    if (!msg.is_valid()) {
        return error_info(dul::error_codes::missing_command_element,
                          std::string(to_string(msg.command_)) +
                              " lacks its message identifier",
                          module_name);
    }
    return msg;
}

// ============================================================================
// Validation
// ============================================================================

auto dimse_message::is_valid() const noexcept -> bool {
    if (!commands_.contains(tag_command_field)) {
        return false;
    }
    if (identified_by_message_id(command_)) {
        return commands_.contains(tag_message_id);
    }
    return commands_.contains(tag_message_id_responded_to);
}

auto dimse_message::is_request() const noexcept -> bool {
    return dimse::is_request(command_);
}

auto dimse_message::is_response() const noexcept -> bool {
    return dimse::is_response(command_);
}

void dimse_message::update_data_set_type() {
    commands_.set_uint16(tag_command_data_set_type,
                         dataset_ ? command_data_set_type_present
                                  : command_data_set_type_null);
}

// ============================================================================
// DIMSE-C Factory Functions
// ============================================================================

auto make_c_echo_rq(uint16_t message_id, std::string_view sop_class_uid)
    -> dimse_message {
    dimse_message msg(command_field::c_echo_rq, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    return msg;
}

auto make_c_echo_rsp(uint16_t message_id_responded_to, status_code status,
                     std::string_view sop_class_uid) -> dimse_message {
    dimse_message msg(command_field::c_echo_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_status(status);
    return msg;
}

auto make_c_store_rq(uint16_t message_id, std::string_view sop_class_uid,
                     std::string_view sop_instance_uid, uint16_t priority)
    -> dimse_message {
    dimse_message msg(command_field::c_store_rq, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    msg.set_priority(priority);
    return msg;
}

auto make_c_store_rsp(uint16_t message_id_responded_to,
                      std::string_view sop_class_uid,
                      std::string_view sop_instance_uid, status_code status)
    -> dimse_message {
    dimse_message msg(command_field::c_store_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    msg.set_status(status);
    return msg;
}

auto make_c_find_rq(uint16_t message_id, std::string_view sop_class_uid,
                    uint16_t priority) -> dimse_message {
    dimse_message msg(command_field::c_find_rq, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_priority(priority);
    return msg;
}

auto make_c_find_rsp(uint16_t message_id_responded_to,
                     std::string_view sop_class_uid, status_code status)
    -> dimse_message {
    dimse_message msg(command_field::c_find_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_status(status);
    return msg;
}

auto make_c_get_rq(uint16_t message_id, std::string_view sop_class_uid,
                   uint16_t priority) -> dimse_message {
    dimse_message msg(command_field::c_get_rq, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_priority(priority);
    return msg;
}

auto make_c_get_rsp(uint16_t message_id_responded_to,
                    std::string_view sop_class_uid, status_code status,
                    std::optional<uint16_t> remaining, uint16_t completed,
                    uint16_t failed, uint16_t warning) -> dimse_message {
    dimse_message msg(command_field::c_get_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_status(status);
    set_subops(msg, remaining, completed, failed, warning);
    return msg;
}

auto make_c_move_rq(uint16_t message_id, std::string_view sop_class_uid,
                    std::string_view move_destination, uint16_t priority)
    -> dimse_message {
    dimse_message msg(command_field::c_move_rq, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_move_destination(move_destination);
    msg.set_priority(priority);
    return msg;
}

auto make_c_move_rsp(uint16_t message_id_responded_to,
                     std::string_view sop_class_uid, status_code status,
                     std::optional<uint16_t> remaining, uint16_t completed,
                     uint16_t failed, uint16_t warning) -> dimse_message {
    dimse_message msg(command_field::c_move_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_status(status);
    set_subops(msg, remaining, completed, failed, warning);
    return msg;
}

auto make_c_cancel_rq(uint16_t message_id_being_cancelled) -> dimse_message {
    dimse_message msg(command_field::c_cancel_rq, 0);
    msg.set_message_id_responded_to(message_id_being_cancelled);
    return msg;
}

// ============================================================================
// DIMSE-N Factory Functions
// ============================================================================

auto make_n_create_rq(uint16_t message_id, std::string_view sop_class_uid,
                      std::string_view sop_instance_uid) -> dimse_message {
    dimse_message msg(command_field::n_create_rq, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    if (!sop_instance_uid.empty()) {
        msg.set_affected_sop_instance_uid(sop_instance_uid);
    }
    return msg;
}

auto make_n_create_rsp(uint16_t message_id_responded_to,
                       std::string_view sop_class_uid,
                       std::string_view sop_instance_uid, status_code status)
    -> dimse_message {
    dimse_message msg(command_field::n_create_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    msg.set_status(status);
    return msg;
}

auto make_n_set_rq(uint16_t message_id, std::string_view sop_class_uid,
                   std::string_view sop_instance_uid) -> dimse_message {
    dimse_message msg(command_field::n_set_rq, message_id);
    msg.set_requested_sop_class_uid(sop_class_uid);
    msg.set_requested_sop_instance_uid(sop_instance_uid);
    return msg;
}

auto make_n_set_rsp(uint16_t message_id_responded_to,
                    std::string_view sop_class_uid,
                    std::string_view sop_instance_uid, status_code status)
    -> dimse_message {
    dimse_message msg(command_field::n_set_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    msg.set_status(status);
    return msg;
}

auto make_n_get_rq(uint16_t message_id, std::string_view sop_class_uid,
                   std::string_view sop_instance_uid,
                   const std::vector<core::dicom_tag>& attribute_tags)
    -> dimse_message {
    dimse_message msg(command_field::n_get_rq, message_id);
    msg.set_requested_sop_class_uid(sop_class_uid);
    msg.set_requested_sop_instance_uid(sop_instance_uid);
    if (!attribute_tags.empty()) {
        msg.set_attribute_identifier_list(attribute_tags);
    }
    return msg;
}

auto make_n_get_rsp(uint16_t message_id_responded_to,
                    std::string_view sop_class_uid,
                    std::string_view sop_instance_uid, status_code status)
    -> dimse_message {
    dimse_message msg(command_field::n_get_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    msg.set_status(status);
    return msg;
}

auto make_n_event_report_rq(uint16_t message_id, std::string_view sop_class_uid,
                            std::string_view sop_instance_uid,
                            uint16_t event_type_id) -> dimse_message {
    dimse_message msg(command_field::n_event_report_rq, message_id);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    msg.set_event_type_id(event_type_id);
    return msg;
}

auto make_n_event_report_rsp(uint16_t message_id_responded_to,
                             std::string_view sop_class_uid,
                             std::string_view sop_instance_uid,
                             uint16_t event_type_id, status_code status)
    -> dimse_message {
    dimse_message msg(command_field::n_event_report_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    msg.set_event_type_id(event_type_id);
    msg.set_status(status);
    return msg;
}

auto make_n_action_rq(uint16_t message_id, std::string_view sop_class_uid,
                      std::string_view sop_instance_uid,
                      uint16_t action_type_id) -> dimse_message {
    dimse_message msg(command_field::n_action_rq, message_id);
    msg.set_requested_sop_class_uid(sop_class_uid);
    msg.set_requested_sop_instance_uid(sop_instance_uid);
    msg.set_action_type_id(action_type_id);
    return msg;
}

auto make_n_action_rsp(uint16_t message_id_responded_to,
                       std::string_view sop_class_uid,
                       std::string_view sop_instance_uid,
                       uint16_t action_type_id, status_code status)
    -> dimse_message {
    dimse_message msg(command_field::n_action_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    msg.set_action_type_id(action_type_id);
    msg.set_status(status);
    return msg;
}

auto make_n_delete_rq(uint16_t message_id, std::string_view sop_class_uid,
                      std::string_view sop_instance_uid) -> dimse_message {
    dimse_message msg(command_field::n_delete_rq, message_id);
    msg.set_requested_sop_class_uid(sop_class_uid);
    msg.set_requested_sop_instance_uid(sop_instance_uid);
    return msg;
}

auto make_n_delete_rsp(uint16_t message_id_responded_to,
                       std::string_view sop_class_uid,
                       std::string_view sop_instance_uid, status_code status)
    -> dimse_message {
    dimse_message msg(command_field::n_delete_rsp, 0);
    msg.set_message_id_responded_to(message_id_responded_to);
    msg.set_affected_sop_class_uid(sop_class_uid);
    msg.set_affected_sop_instance_uid(sop_instance_uid);
    msg.set_status(status);
    return msg;
}

auto make_response_for(const dimse_message& request, status_code status)
    -> dimse_message {
    dimse_message rsp(get_response_command(request.command()), 0);
    rsp.set_message_id_responded_to(request.message_id());

    const auto sop_class = request.sop_class_uid();
    if (!sop_class.empty()) {
        rsp.set_affected_sop_class_uid(sop_class);
    }

    auto instance = request.affected_sop_instance_uid();
    if (instance.empty()) {
        instance = request.requested_sop_instance_uid();
    }
    if (!instance.empty()) {
        rsp.set_affected_sop_instance_uid(instance);
    }

    if (auto event = request.event_type_id()) {
        rsp.set_event_type_id(*event);
    }
    if (auto action = request.action_type_id()) {
        rsp.set_action_type_id(*action);
    }
    rsp.set_status(status);
    return rsp;
}

}  // namespace dul::network::dimse
