/**
 * @file command_set.hpp
 * @brief Group 0000 command element set, encoded Implicit VR Little Endian
 *
 * The command set of every DIMSE message is encoded with the Implicit VR
 * Little Endian transfer syntax regardless of what was negotiated for the
 * data set (PS3.7 Section 6.3.1). Command Group Length (0000,0000) is always
 * the first element and is computed on encode.
 *
 * @see DICOM PS3.7 Section 6.3 and Annex E - Command Dictionary
 */

#ifndef DUL_NETWORK_DIMSE_COMMAND_SET_HPP
#define DUL_NETWORK_DIMSE_COMMAND_SET_HPP

#include "dul/core/dicom_tag.hpp"
#include "dul/core/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dul::network::dimse {

/**
 * @brief Ordered map of command elements to their little-endian value bytes.
 *
 * Values are kept in encoded form; the typed accessors convert on the way
 * in and out. String values are padded to even length: UIDs with NUL,
 * other text with a space.
 */
class command_set {
public:
    using element_map = std::map<core::dicom_tag, std::vector<uint8_t>>;

    command_set() = default;

    // ========================================================================
    // Typed setters
    // ========================================================================

    void set_uint16(core::dicom_tag tag, uint16_t value);
    void set_uint32(core::dicom_tag tag, uint32_t value);

    /// UI value, NUL padded
    void set_uid(core::dicom_tag tag, std::string_view uid);

    /// AE / LO / SH value, space padded
    void set_text(core::dicom_tag tag, std::string_view text);

    /// AT value (multi-valued)
    void set_tags(core::dicom_tag tag, const std::vector<core::dicom_tag>& tags);

    // ========================================================================
    // Typed getters
    // ========================================================================

    [[nodiscard]] auto get_uint16(core::dicom_tag tag) const -> std::optional<uint16_t>;
    [[nodiscard]] auto get_uint32(core::dicom_tag tag) const -> std::optional<uint32_t>;

    /// String value with padding (NUL or space) trimmed from both ends
    [[nodiscard]] auto get_string(core::dicom_tag tag) const -> std::optional<std::string>;

    [[nodiscard]] auto get_tags(core::dicom_tag tag) const
        -> std::optional<std::vector<core::dicom_tag>>;

    // ========================================================================
    // Element access
    // ========================================================================

    [[nodiscard]] bool contains(core::dicom_tag tag) const noexcept {
        return elements_.find(tag) != elements_.end();
    }

    void remove(core::dicom_tag tag) { elements_.erase(tag); }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return elements_.size(); }

    [[nodiscard]] auto elements() const noexcept -> const element_map& { return elements_; }

    /// Raw value bytes, nullptr when absent
    [[nodiscard]] auto raw(core::dicom_tag tag) const -> const std::vector<uint8_t>*;

    // ========================================================================
    // Encoding
    // ========================================================================

    /**
     * @brief Encode as Implicit VR Little Endian with a leading group length.
     *
     * Any stored (0000,0000) value is ignored and recomputed.
     */
    [[nodiscard]] auto encode() const -> std::vector<uint8_t>;

    /**
     * @brief Decode an Implicit VR Little Endian command stream.
     *
     * Fails with invalid_command_set when an element is truncated, carries
     * an undefined length, lies outside group 0000, or when a present
     * Command Group Length disagrees with the bytes that follow it.
     */
    [[nodiscard]] static auto decode(std::span<const uint8_t> data)
        -> Result<command_set>;

    bool operator==(const command_set&) const = default;

private:
    element_map elements_;
};

}  // namespace dul::network::dimse

#endif  // DUL_NETWORK_DIMSE_COMMAND_SET_HPP
