/**
 * @file uid_registry.cpp
 * @brief Built-in UID table and runtime registration
 */

#include "dul/core/uid_registry.hpp"

#include <algorithm>
#include <mutex>

namespace dul::core {

namespace {

struct builtin_entry {
    std::string_view uid;
    std::string_view name;
    uid_kind kind;
    bool is_retired;
};

constexpr std::array<builtin_entry, 22> builtin_table{{
    {uids::dicom_application_context, "DICOM Application Context Name",
     uid_kind::application_context, false},
    {uids::verification, "Verification SOP Class", uid_kind::sop_class, false},

    {uids::implicit_vr_little_endian, "Implicit VR Little Endian",
     uid_kind::transfer_syntax, false},
    {uids::explicit_vr_little_endian, "Explicit VR Little Endian",
     uid_kind::transfer_syntax, false},
    {uids::deflated_explicit_vr_little_endian, "Deflated Explicit VR Little Endian",
     uid_kind::transfer_syntax, false},
    {uids::explicit_vr_big_endian, "Explicit VR Big Endian",
     uid_kind::transfer_syntax, true},

    {uids::patient_root_find, "Patient Root Query/Retrieve Information Model - FIND",
     uid_kind::sop_class, false},
    {uids::patient_root_move, "Patient Root Query/Retrieve Information Model - MOVE",
     uid_kind::sop_class, false},
    {uids::patient_root_get, "Patient Root Query/Retrieve Information Model - GET",
     uid_kind::sop_class, false},
    {uids::study_root_find, "Study Root Query/Retrieve Information Model - FIND",
     uid_kind::sop_class, false},
    {uids::study_root_move, "Study Root Query/Retrieve Information Model - MOVE",
     uid_kind::sop_class, false},
    {uids::study_root_get, "Study Root Query/Retrieve Information Model - GET",
     uid_kind::sop_class, false},
    {uids::modality_worklist_find, "Modality Worklist Information Model - FIND",
     uid_kind::sop_class, false},

    {uids::ct_image_storage, "CT Image Storage", uid_kind::sop_class, false},
    {uids::mr_image_storage, "MR Image Storage", uid_kind::sop_class, false},
    {uids::us_image_storage, "Ultrasound Image Storage", uid_kind::sop_class, false},
    {uids::secondary_capture_image_storage, "Secondary Capture Image Storage",
     uid_kind::sop_class, false},
    {uids::digital_xray_image_storage, "Digital X-Ray Image Storage - For Presentation",
     uid_kind::sop_class, false},

    {uids::storage_commitment_push, "Storage Commitment Push Model SOP Class",
     uid_kind::sop_class, false},
    {uids::modality_performed_procedure_step, "Modality Performed Procedure Step SOP Class",
     uid_kind::sop_class, false},
    {"1.2.840.10008.3.1.2.3.4", "Modality Performed Procedure Step Retrieve SOP Class",
     uid_kind::sop_class, true},
    {"1.2.840.10008.5.1.1.9", "Basic Grayscale Print Management Meta SOP Class",
     uid_kind::meta_sop_class, false},
}};

[[nodiscard]] auto find_builtin(std::string_view uid) noexcept -> const builtin_entry* {
    auto it = std::find_if(builtin_table.begin(), builtin_table.end(),
                           [uid](const builtin_entry& e) { return e.uid == uid; });
    return it == builtin_table.end() ? nullptr : &*it;
}

[[nodiscard]] auto to_info(const builtin_entry& entry) -> uid_info {
    return uid_info{std::string(entry.uid), std::string(entry.name), entry.kind,
                    entry.is_retired};
}

}  // namespace

// =============================================================================
// Singleton
// =============================================================================

uid_registry& uid_registry::instance() {
    static uid_registry instance;
    return instance;
}

// =============================================================================
// Queries
// =============================================================================

auto uid_registry::lookup(std::string_view uid) const -> std::optional<uid_info> {
    if (const auto* entry = find_builtin(uid)) {
        return to_info(*entry);
    }

    std::shared_lock lock(mutex_);
    auto it = registered_.find(std::string(uid));
    if (it != registered_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool uid_registry::contains(std::string_view uid) const {
    return lookup(uid).has_value();
}

auto uid_registry::name_of(std::string_view uid) const -> std::string {
    auto info = lookup(uid);
    return info ? info->name : std::string(uid);
}

auto uid_registry::by_kind(uid_kind kind) const -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& entry : builtin_table) {
        if (entry.kind == kind) {
            result.emplace_back(entry.uid);
        }
    }

    std::shared_lock lock(mutex_);
    for (const auto& uid : registration_order_) {
        if (registered_.at(uid).kind == kind) {
            result.push_back(uid);
        }
    }
    return result;
}

auto uid_registry::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return builtin_table.size() + registered_.size();
}

auto uid_registry::builtin_count() noexcept -> std::size_t {
    return builtin_table.size();
}

// =============================================================================
// Registration
// =============================================================================

VoidResult uid_registry::register_uid(uid_info info) {
    if (info.uid.empty() || info.uid.size() > 64) {
        return dul_void_error(error_codes::invalid_argument,
                              "UID must be 1 to 64 characters", info.uid);
    }

    if (find_builtin(info.uid) != nullptr) {
        return dul_void_error(error_codes::duplicate_registration,
                              "UID is already registered", info.uid);
    }

    std::unique_lock lock(mutex_);
    if (registered_.contains(info.uid)) {
        return dul_void_error(error_codes::duplicate_registration,
                              "UID is already registered", info.uid);
    }

    registration_order_.push_back(info.uid);
    auto key = info.uid;
    registered_.emplace(std::move(key), std::move(info));
    return {};
}

auto uid_name(std::string_view uid) -> std::string {
    return uid_registry::instance().name_of(uid);
}

}  // namespace dul::core
