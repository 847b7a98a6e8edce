/**
 * @file dimse_message.hpp
 * @brief DIMSE message: command set plus optional opaque data set
 *
 * The upper layer never interprets data sets. A message carries the data
 * set as the byte stream received from (or destined for) the peer, encoded
 * in the presentation context's transfer syntax; conversion to a data model
 * is left to a dataset_codec.
 *
 * @see DICOM PS3.7 Section 6 - Message Structure
 * @see DICOM PS3.7 Section 9 - DIMSE-C Services
 * @see DICOM PS3.7 Section 10 - DIMSE-N Services
 */

#ifndef DUL_NETWORK_DIMSE_DIMSE_MESSAGE_HPP
#define DUL_NETWORK_DIMSE_DIMSE_MESSAGE_HPP

#include "command_field.hpp"
#include "command_set.hpp"
#include "status_codes.hpp"

#include "dul/core/dicom_tag.hpp"
#include "dul/core/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dul::network::dimse {

/// @name Command Tags
/// @{
constexpr core::dicom_tag tag_command_group_length{0x0000, 0x0000};
constexpr core::dicom_tag tag_affected_sop_class_uid{0x0000, 0x0002};
constexpr core::dicom_tag tag_requested_sop_class_uid{0x0000, 0x0003};
constexpr core::dicom_tag tag_command_field{0x0000, 0x0100};
constexpr core::dicom_tag tag_message_id{0x0000, 0x0110};
constexpr core::dicom_tag tag_message_id_responded_to{0x0000, 0x0120};
constexpr core::dicom_tag tag_move_destination{0x0000, 0x0600};
constexpr core::dicom_tag tag_priority{0x0000, 0x0700};
constexpr core::dicom_tag tag_command_data_set_type{0x0000, 0x0800};
constexpr core::dicom_tag tag_status{0x0000, 0x0900};
constexpr core::dicom_tag tag_offending_element{0x0000, 0x0901};
constexpr core::dicom_tag tag_error_comment{0x0000, 0x0902};
constexpr core::dicom_tag tag_error_id{0x0000, 0x0903};
constexpr core::dicom_tag tag_affected_sop_instance_uid{0x0000, 0x1000};
constexpr core::dicom_tag tag_requested_sop_instance_uid{0x0000, 0x1001};
constexpr core::dicom_tag tag_event_type_id{0x0000, 0x1002};
constexpr core::dicom_tag tag_attribute_identifier_list{0x0000, 0x1005};
constexpr core::dicom_tag tag_action_type_id{0x0000, 0x1008};
constexpr core::dicom_tag tag_number_of_remaining_subops{0x0000, 0x1020};
constexpr core::dicom_tag tag_number_of_completed_subops{0x0000, 0x1021};
constexpr core::dicom_tag tag_number_of_failed_subops{0x0000, 0x1022};
constexpr core::dicom_tag tag_number_of_warning_subops{0x0000, 0x1023};
constexpr core::dicom_tag tag_move_originator_aet{0x0000, 0x1030};
constexpr core::dicom_tag tag_move_originator_message_id{0x0000, 0x1031};
/// @}

/// Command Data Set Type value meaning "no data set follows"
constexpr uint16_t command_data_set_type_null = 0x0101;

/// Any value other than 0x0101 announces a data set
constexpr uint16_t command_data_set_type_present = 0x0001;

/// @name Priority Values
/// @{
constexpr uint16_t priority_low = 0x0002;
constexpr uint16_t priority_medium = 0x0000;
constexpr uint16_t priority_high = 0x0001;
/// @}

/// Verification SOP Class, the default for C-ECHO
inline constexpr std::string_view verification_sop_class_uid = "1.2.840.10008.1.1";

template <typename T>
using dimse_result = dul::Result<T>;

/**
 * @brief A DIMSE message.
 *
 * @example
 * @code
 * auto rq = make_c_store_rq(7, ct_image_storage, instance_uid);
 * rq.set_dataset(encoded_instance);
 * auto encoded = rq.encode();   // command bytes + data set bytes
 * @endcode
 */
class dimse_message {
public:
    // ========================================================================
    // Construction
    // ========================================================================

    /**
     * @brief Create a message of the given kind.
     *
     * For requests other than C-CANCEL the id is written to Message ID
     * (0000,0110). Responses and C-CANCEL identify the request through
     * set_message_id_responded_to().
     */
    dimse_message(command_field cmd, uint16_t message_id);

    dimse_message() = default;

    // ========================================================================
    // Command Set Access
    // ========================================================================

    [[nodiscard]] auto command() const noexcept -> command_field { return command_; }

    /// Message ID (requests), or Message ID Being Responded To otherwise
    [[nodiscard]] auto message_id() const noexcept -> uint16_t;

    [[nodiscard]] auto commands() noexcept -> command_set& { return commands_; }
    [[nodiscard]] auto commands() const noexcept -> const command_set& { return commands_; }

    // ========================================================================
    // Dataset Access
    // ========================================================================

    [[nodiscard]] bool has_dataset() const noexcept { return dataset_.has_value(); }

    /// Encoded data set; empty span when none is present
    [[nodiscard]] auto dataset() const noexcept -> std::span<const uint8_t>;

    /// Attach an encoded data set and mark it in Command Data Set Type
    void set_dataset(std::vector<uint8_t> bytes);

    /// Hand the data set bytes to the caller, leaving the message without one
    [[nodiscard]] auto take_dataset() -> std::vector<uint8_t>;

    void clear_dataset() noexcept;

    // ========================================================================
    // Status (for responses)
    // ========================================================================

    [[nodiscard]] auto status() const -> status_code;
    void set_status(status_code status);

    [[nodiscard]] auto error_comment() const -> std::optional<std::string>;
    void set_error_comment(std::string_view comment);

    [[nodiscard]] auto error_id() const -> std::optional<uint16_t>;
    void set_error_id(uint16_t id);

    [[nodiscard]] auto offending_elements() const -> std::vector<core::dicom_tag>;
    void set_offending_elements(const std::vector<core::dicom_tag>& tags);

    // ========================================================================
    // Common Attributes
    // ========================================================================

    [[nodiscard]] auto affected_sop_class_uid() const -> std::string;
    void set_affected_sop_class_uid(std::string_view uid);

    [[nodiscard]] auto affected_sop_instance_uid() const -> std::string;
    void set_affected_sop_instance_uid(std::string_view uid);

    /// 0 = medium, 1 = high, 2 = low
    [[nodiscard]] auto priority() const -> uint16_t;
    void set_priority(uint16_t priority);

    [[nodiscard]] auto message_id_responded_to() const -> uint16_t;
    void set_message_id_responded_to(uint16_t id);

    // ========================================================================
    // C-MOVE / C-GET
    // ========================================================================

    [[nodiscard]] auto move_destination() const -> std::string;
    void set_move_destination(std::string_view ae_title);

    /// Set on C-STORE sub-operations performed for a C-MOVE
    [[nodiscard]] auto move_originator_aet() const -> std::optional<std::string>;
    void set_move_originator_aet(std::string_view ae_title);

    [[nodiscard]] auto move_originator_message_id() const -> std::optional<uint16_t>;
    void set_move_originator_message_id(uint16_t id);

    [[nodiscard]] auto remaining_subops() const -> std::optional<uint16_t>;
    void set_remaining_subops(uint16_t count);

    [[nodiscard]] auto completed_subops() const -> std::optional<uint16_t>;
    void set_completed_subops(uint16_t count);

    [[nodiscard]] auto failed_subops() const -> std::optional<uint16_t>;
    void set_failed_subops(uint16_t count);

    [[nodiscard]] auto warning_subops() const -> std::optional<uint16_t>;
    void set_warning_subops(uint16_t count);

    // ========================================================================
    // DIMSE-N
    // ========================================================================

    [[nodiscard]] auto requested_sop_class_uid() const -> std::string;
    void set_requested_sop_class_uid(std::string_view uid);

    [[nodiscard]] auto requested_sop_instance_uid() const -> std::string;
    void set_requested_sop_instance_uid(std::string_view uid);

    [[nodiscard]] auto event_type_id() const -> std::optional<uint16_t>;
    void set_event_type_id(uint16_t type_id);

    [[nodiscard]] auto action_type_id() const -> std::optional<uint16_t>;
    void set_action_type_id(uint16_t type_id);

    [[nodiscard]] auto attribute_identifier_list() const -> std::vector<core::dicom_tag>;
    void set_attribute_identifier_list(const std::vector<core::dicom_tag>& tags);

    /**
     * @brief SOP Class UID the message refers to: Affected when present,
     *        Requested otherwise.
     */
    [[nodiscard]] auto sop_class_uid() const -> std::string;

    // ========================================================================
    // Encoding/Decoding
    // ========================================================================

    /// Command set bytes and data set bytes (empty when no data set)
    using encoded_message = std::pair<std::vector<uint8_t>, std::vector<uint8_t>>;

    /**
     * @brief Encode the command set and attach the data set bytes.
     * @return invalid_command_set when the message is not valid
     */
    [[nodiscard]] auto encode() const -> dimse_result<encoded_message>;

    /**
     * @brief Build a message from a received command stream.
     *
     * @param command_data Command bytes (Implicit VR Little Endian)
     * @param dataset_data Data set bytes, when the command announced one
     */
    [[nodiscard]] static auto decode(
        std::span<const uint8_t> command_data,
        std::optional<std::vector<uint8_t>> dataset_data = std::nullopt)
        -> dimse_result<dimse_message>;

    /**
     * @brief Whether Command Data Set Type announces a data set.
     */
    [[nodiscard]] bool announces_dataset() const;

    // ========================================================================
    // Validation
    // ========================================================================

    /**
     * @brief Command field is known and the message is identified.
     *
     * Requests other than C-CANCEL need a Message ID; responses and
     * C-CANCEL need a Message ID Being Responded To.
     */
    [[nodiscard]] auto is_valid() const noexcept -> bool;

    [[nodiscard]] auto is_request() const noexcept -> bool;
    [[nodiscard]] auto is_response() const noexcept -> bool;

    bool operator==(const dimse_message&) const = default;

private:
    void update_data_set_type();

    command_field command_{};
    command_set commands_;
    std::optional<std::vector<uint8_t>> dataset_;
};

// ============================================================================
// DIMSE-C Factory Functions
// ============================================================================

[[nodiscard]] auto make_c_echo_rq(
    uint16_t message_id,
    std::string_view sop_class_uid = verification_sop_class_uid) -> dimse_message;

[[nodiscard]] auto make_c_echo_rsp(
    uint16_t message_id_responded_to,
    status_code status = status_success,
    std::string_view sop_class_uid = verification_sop_class_uid) -> dimse_message;

[[nodiscard]] auto make_c_store_rq(
    uint16_t message_id,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    uint16_t priority = priority_medium) -> dimse_message;

[[nodiscard]] auto make_c_store_rsp(
    uint16_t message_id_responded_to,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    status_code status = status_success) -> dimse_message;

[[nodiscard]] auto make_c_find_rq(
    uint16_t message_id,
    std::string_view sop_class_uid,
    uint16_t priority = priority_medium) -> dimse_message;

[[nodiscard]] auto make_c_find_rsp(
    uint16_t message_id_responded_to,
    std::string_view sop_class_uid,
    status_code status) -> dimse_message;

[[nodiscard]] auto make_c_get_rq(
    uint16_t message_id,
    std::string_view sop_class_uid,
    uint16_t priority = priority_medium) -> dimse_message;

/**
 * @brief C-GET response; the counters are written when given.
 */
[[nodiscard]] auto make_c_get_rsp(
    uint16_t message_id_responded_to,
    std::string_view sop_class_uid,
    status_code status,
    std::optional<uint16_t> remaining = std::nullopt,
    uint16_t completed = 0,
    uint16_t failed = 0,
    uint16_t warning = 0) -> dimse_message;

/**
 * @brief C-MOVE request.
 * @param move_destination AE title of the node that receives the C-STOREs
 */
[[nodiscard]] auto make_c_move_rq(
    uint16_t message_id,
    std::string_view sop_class_uid,
    std::string_view move_destination,
    uint16_t priority = priority_medium) -> dimse_message;

[[nodiscard]] auto make_c_move_rsp(
    uint16_t message_id_responded_to,
    std::string_view sop_class_uid,
    status_code status,
    std::optional<uint16_t> remaining = std::nullopt,
    uint16_t completed = 0,
    uint16_t failed = 0,
    uint16_t warning = 0) -> dimse_message;

/**
 * @brief C-CANCEL request for an outstanding C-FIND, C-GET or C-MOVE.
 */
[[nodiscard]] auto make_c_cancel_rq(uint16_t message_id_being_cancelled) -> dimse_message;

// ============================================================================
// DIMSE-N Factory Functions
// ============================================================================

/// @param sop_instance_uid May be empty; the SCP then assigns one
[[nodiscard]] auto make_n_create_rq(
    uint16_t message_id,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid = "") -> dimse_message;

[[nodiscard]] auto make_n_create_rsp(
    uint16_t message_id_responded_to,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    status_code status = status_success) -> dimse_message;

[[nodiscard]] auto make_n_set_rq(
    uint16_t message_id,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid) -> dimse_message;

[[nodiscard]] auto make_n_set_rsp(
    uint16_t message_id_responded_to,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    status_code status = status_success) -> dimse_message;

/// @param attribute_tags Attributes to return; empty means all
[[nodiscard]] auto make_n_get_rq(
    uint16_t message_id,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    const std::vector<core::dicom_tag>& attribute_tags = {}) -> dimse_message;

[[nodiscard]] auto make_n_get_rsp(
    uint16_t message_id_responded_to,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    status_code status = status_success) -> dimse_message;

[[nodiscard]] auto make_n_event_report_rq(
    uint16_t message_id,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    uint16_t event_type_id) -> dimse_message;

[[nodiscard]] auto make_n_event_report_rsp(
    uint16_t message_id_responded_to,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    uint16_t event_type_id,
    status_code status = status_success) -> dimse_message;

[[nodiscard]] auto make_n_action_rq(
    uint16_t message_id,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    uint16_t action_type_id) -> dimse_message;

[[nodiscard]] auto make_n_action_rsp(
    uint16_t message_id_responded_to,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    uint16_t action_type_id,
    status_code status = status_success) -> dimse_message;

[[nodiscard]] auto make_n_delete_rq(
    uint16_t message_id,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid) -> dimse_message;

[[nodiscard]] auto make_n_delete_rsp(
    uint16_t message_id_responded_to,
    std::string_view sop_class_uid,
    std::string_view sop_instance_uid,
    status_code status = status_success) -> dimse_message;

/**
 * @brief Response skeleton for any request: command, id and SOP class
 *        (and instance, when the request carried one) filled in.
 */
[[nodiscard]] auto make_response_for(const dimse_message& request,
                                     status_code status) -> dimse_message;

}  // namespace dul::network::dimse

#endif  // DUL_NETWORK_DIMSE_DIMSE_MESSAGE_HPP
