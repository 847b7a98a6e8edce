/**
 * @file dicom_tag.hpp
 * @brief DICOM attribute tag (group, element)
 *
 * The upper layer treats data sets as opaque bytes, so tags only appear in
 * command sets: as command element keys and as the values of the AT
 * elements Attribute Identifier List (0000,1005) and Offending Element
 * (0000,0901).
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace dul::core {

/**
 * @brief A (group, element) pair stored as (group << 16) | element.
 */
class dicom_tag {
public:
    constexpr dicom_tag() noexcept : combined_{0} {}

    constexpr dicom_tag(uint16_t group, uint16_t element) noexcept
        : combined_{static_cast<uint32_t>(group) << 16 | element} {}

    explicit constexpr dicom_tag(uint32_t combined) noexcept
        : combined_{combined} {}

    [[nodiscard]] constexpr auto group() const noexcept -> uint16_t {
        return static_cast<uint16_t>(combined_ >> 16);
    }

    [[nodiscard]] constexpr auto element() const noexcept -> uint16_t {
        return static_cast<uint16_t>(combined_ & 0xFFFF);
    }

    [[nodiscard]] constexpr auto combined() const noexcept -> uint32_t {
        return combined_;
    }

    /// Command elements live in group 0000
    [[nodiscard]] constexpr bool is_command() const noexcept {
        return group() == 0x0000;
    }

    [[nodiscard]] constexpr bool is_group_length() const noexcept {
        return element() == 0x0000;
    }

    /// "(GGGG,EEEE)" with upper-case hex digits
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] constexpr auto operator<=>(const dicom_tag& other) const noexcept
        -> std::strong_ordering = default;

    [[nodiscard]] constexpr auto operator==(const dicom_tag& other) const noexcept
        -> bool = default;

private:
    uint32_t combined_;
};

}  // namespace dul::core
