/**
 * @file uid_registry.hpp
 * @brief Registry of well-known DICOM UIDs used during association setup
 *
 * Holds a compile-time table of the UIDs the upper layer itself needs
 * (application context, Verification, the uncompressed transfer syntaxes,
 * the Query/Retrieve information models and a handful of storage classes)
 * plus anything registered at runtime.
 *
 * @see DICOM PS3.6 Annex A - Registry of DICOM Unique Identifiers
 */

#pragma once

#include "dul/core/result.hpp"

#include <array>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dul::core {

/**
 * @brief What a UID identifies
 */
enum class uid_kind {
    application_context,  ///< Application Context Name
    sop_class,            ///< SOP Class (abstract syntax)
    transfer_syntax,      ///< Transfer Syntax
    meta_sop_class,       ///< Meta SOP Class
    other
};

/**
 * @brief One registry entry
 */
struct uid_info {
    std::string uid;
    std::string name;
    uid_kind kind{uid_kind::other};
    bool is_retired{false};

    bool operator==(const uid_info&) const = default;
};

// =============================================================================
// Well-known UIDs
// =============================================================================

namespace uids {

inline constexpr std::string_view dicom_application_context = "1.2.840.10008.3.1.1.1";
inline constexpr std::string_view verification = "1.2.840.10008.1.1";

inline constexpr std::string_view implicit_vr_little_endian = "1.2.840.10008.1.2";
inline constexpr std::string_view explicit_vr_little_endian = "1.2.840.10008.1.2.1";
inline constexpr std::string_view deflated_explicit_vr_little_endian = "1.2.840.10008.1.2.1.99";
inline constexpr std::string_view explicit_vr_big_endian = "1.2.840.10008.1.2.2";

inline constexpr std::string_view patient_root_find = "1.2.840.10008.5.1.4.1.2.1.1";
inline constexpr std::string_view patient_root_move = "1.2.840.10008.5.1.4.1.2.1.2";
inline constexpr std::string_view patient_root_get = "1.2.840.10008.5.1.4.1.2.1.3";
inline constexpr std::string_view study_root_find = "1.2.840.10008.5.1.4.1.2.2.1";
inline constexpr std::string_view study_root_move = "1.2.840.10008.5.1.4.1.2.2.2";
inline constexpr std::string_view study_root_get = "1.2.840.10008.5.1.4.1.2.2.3";
inline constexpr std::string_view modality_worklist_find = "1.2.840.10008.5.1.4.31";

inline constexpr std::string_view ct_image_storage = "1.2.840.10008.5.1.4.1.1.2";
inline constexpr std::string_view mr_image_storage = "1.2.840.10008.5.1.4.1.1.4";
inline constexpr std::string_view us_image_storage = "1.2.840.10008.5.1.4.1.1.6.1";
inline constexpr std::string_view secondary_capture_image_storage = "1.2.840.10008.5.1.4.1.1.7";
inline constexpr std::string_view digital_xray_image_storage = "1.2.840.10008.5.1.4.1.1.1.1";

inline constexpr std::string_view storage_commitment_push = "1.2.840.10008.1.20.1";
inline constexpr std::string_view modality_performed_procedure_step = "1.2.840.10008.3.1.2.3.3";

}  // namespace uids

// =============================================================================
// UID Registry
// =============================================================================

/**
 * @brief Process-wide UID lookup table
 *
 * The built-in table is read-only; register_uid() appends entries. Lookups
 * and registration are thread-safe.
 *
 * @example
 * @code
 * auto& registry = uid_registry::instance();
 * if (auto info = registry.lookup("1.2.840.10008.1.2.1")) {
 *     std::cout << info->name << "\n";   // Explicit VR Little Endian
 * }
 * (void)registry.register_uid({"1.2.3.4.5", "Private Storage", uid_kind::sop_class});
 * @endcode
 */
class uid_registry {
public:
    [[nodiscard]] static uid_registry& instance();

    /// Entry for a UID, or nullopt if unknown
    [[nodiscard]] auto lookup(std::string_view uid) const -> std::optional<uid_info>;

    [[nodiscard]] bool contains(std::string_view uid) const;

    /// Name for a UID, or the UID itself if unknown
    [[nodiscard]] auto name_of(std::string_view uid) const -> std::string;

    /// All UIDs of one kind, built-in entries first in table order
    [[nodiscard]] auto by_kind(uid_kind kind) const -> std::vector<std::string>;

    /**
     * @brief Append an entry
     * @return duplicate_registration if the UID is already known,
     *         invalid_argument if the UID is empty or longer than 64 characters
     */
    [[nodiscard]] VoidResult register_uid(uid_info info);

    [[nodiscard]] auto size() const -> std::size_t;

    /// Number of built-in entries
    [[nodiscard]] static auto builtin_count() noexcept -> std::size_t;

private:
    uid_registry() = default;
    ~uid_registry() = default;

    uid_registry(const uid_registry&) = delete;
    uid_registry& operator=(const uid_registry&) = delete;
    uid_registry(uid_registry&&) = delete;
    uid_registry& operator=(uid_registry&&) = delete;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, uid_info> registered_;
    std::vector<std::string> registration_order_;
};

/// Shorthand for uid_registry::instance().name_of(uid)
[[nodiscard]] auto uid_name(std::string_view uid) -> std::string;

[[nodiscard]] constexpr auto to_string(uid_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case uid_kind::application_context: return "application context";
        case uid_kind::sop_class: return "SOP class";
        case uid_kind::transfer_syntax: return "transfer syntax";
        case uid_kind::meta_sop_class: return "meta SOP class";
        case uid_kind::other: return "other";
    }
    return "other";
}

}  // namespace dul::core
