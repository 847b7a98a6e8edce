/**
 * @file command_set.cpp
 * @brief Implicit VR Little Endian command set codec
 */

#include "dul/network/dimse/command_set.hpp"

namespace dul::network::dimse {

namespace {

constexpr core::dicom_tag group_length_tag{0x0000, 0x0000};
constexpr std::size_t element_header_size = 8;  // tag(4) + length(4)
constexpr uint32_t undefined_length = 0xFFFFFFFF;

void write_uint16_le(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void write_uint32_le(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

auto read_uint16_le(std::span<const uint8_t> data, std::size_t offset) -> uint16_t {
    return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

auto read_uint32_le(std::span<const uint8_t> data, std::size_t offset) -> uint32_t {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

auto padded_string(std::string_view value, char pad) -> std::vector<uint8_t> {
    std::vector<uint8_t> bytes(value.begin(), value.end());
    if (bytes.size() % 2 != 0) {
        bytes.push_back(static_cast<uint8_t>(pad));
    }
    return bytes;
}

auto invalid(const std::string& message) -> Result<command_set> {
    return error_info(dul::error_codes::invalid_command_set, message,
                      "dul::network::dimse::command_set");
}

}  // namespace

// =============================================================================
// Setters
// =============================================================================

void command_set::set_uint16(core::dicom_tag tag, uint16_t value) {
    std::vector<uint8_t> bytes;
    write_uint16_le(bytes, value);
    elements_[tag] = std::move(bytes);
}

void command_set::set_uint32(core::dicom_tag tag, uint32_t value) {
    std::vector<uint8_t> bytes;
    write_uint32_le(bytes, value);
    elements_[tag] = std::move(bytes);
}

void command_set::set_uid(core::dicom_tag tag, std::string_view uid) {
    elements_[tag] = padded_string(uid, '\0');
}

void command_set::set_text(core::dicom_tag tag, std::string_view text) {
    elements_[tag] = padded_string(text, ' ');
}

void command_set::set_tags(core::dicom_tag tag, const std::vector<core::dicom_tag>& tags) {
    std::vector<uint8_t> bytes;
    bytes.reserve(tags.size() * 4);
    for (const auto& value : tags) {
        write_uint16_le(bytes, value.group());
        write_uint16_le(bytes, value.element());
    }
    elements_[tag] = std::move(bytes);
}

// =============================================================================
// Getters
// =============================================================================

auto command_set::raw(core::dicom_tag tag) const -> const std::vector<uint8_t>* {
    auto it = elements_.find(tag);
    return it != elements_.end() ? &it->second : nullptr;
}

auto command_set::get_uint16(core::dicom_tag tag) const -> std::optional<uint16_t> {
    const auto* value = raw(tag);
    if (value == nullptr || value->size() < 2) {
        return std::nullopt;
    }
    return read_uint16_le(*value, 0);
}

auto command_set::get_uint32(core::dicom_tag tag) const -> std::optional<uint32_t> {
    const auto* value = raw(tag);
    if (value == nullptr || value->size() < 4) {
        return std::nullopt;
    }
    return read_uint32_le(*value, 0);
}

auto command_set::get_string(core::dicom_tag tag) const -> std::optional<std::string> {
    const auto* value = raw(tag);
    if (value == nullptr) {
        return std::nullopt;
    }
    std::string text(value->begin(), value->end());
    const auto first = text.find_first_not_of(std::string_view{" \0", 2});
    if (first == std::string::npos) {
        return std::string{};
    }
    const auto last = text.find_last_not_of(std::string_view{" \0", 2});
    return text.substr(first, last - first + 1);
}

auto command_set::get_tags(core::dicom_tag tag) const
    -> std::optional<std::vector<core::dicom_tag>> {
    const auto* value = raw(tag);
    if (value == nullptr || value->size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<core::dicom_tag> tags;
    tags.reserve(value->size() / 4);
    for (std::size_t offset = 0; offset < value->size(); offset += 4) {
        tags.emplace_back(read_uint16_le(*value, offset),
                          read_uint16_le(*value, offset + 2));
    }
    return tags;
}

// =============================================================================
// Encoding
// =============================================================================

auto command_set::encode() const -> std::vector<uint8_t> {
    uint32_t group_length = 0;
    for (const auto& [tag, value] : elements_) {
        if (tag == group_length_tag) {
            continue;
        }
        group_length += static_cast<uint32_t>(element_header_size + value.size());
    }

    std::vector<uint8_t> out;
    out.reserve(element_header_size + 4 + group_length);

    write_uint16_le(out, 0x0000);
    write_uint16_le(out, 0x0000);
    write_uint32_le(out, 4);
    write_uint32_le(out, group_length);

    for (const auto& [tag, value] : elements_) {
        if (tag == group_length_tag) {
            continue;
        }
        write_uint16_le(out, tag.group());
        write_uint16_le(out, tag.element());
        write_uint32_le(out, static_cast<uint32_t>(value.size()));
        out.insert(out.end(), value.begin(), value.end());
    }
    return out;
}

auto command_set::decode(std::span<const uint8_t> data) -> Result<command_set> {
    command_set result;
    std::optional<uint32_t> declared_group_length;
    std::size_t group_start = 0;

    std::size_t offset = 0;
    while (offset < data.size()) {
        if (data.size() - offset < element_header_size) {
            return invalid("Truncated command element header at offset " +
                           std::to_string(offset));
        }
        const core::dicom_tag tag{read_uint16_le(data, offset),
                                  read_uint16_le(data, offset + 2)};
        const uint32_t length = read_uint32_le(data, offset + 4);
        offset += element_header_size;

        if (!tag.is_command()) {
            return invalid("Element " + tag.to_string() + " outside command group");
        }
        if (length == undefined_length) {
            return invalid("Undefined length for command element " + tag.to_string());
        }
        if (data.size() - offset < length) {
            return invalid("Command element " + tag.to_string() +
                           " overruns the command stream");
        }

        std::vector<uint8_t> value(data.begin() + static_cast<std::ptrdiff_t>(offset),
                                   data.begin() + static_cast<std::ptrdiff_t>(offset + length));
        offset += length;

        if (tag == group_length_tag) {
            if (length != 4) {
                return invalid("Command Group Length must be 4 bytes");
            }
            declared_group_length = read_uint32_le(value, 0);
            group_start = offset;
            continue;
        }
        result.elements_[tag] = std::move(value);
    }

    if (declared_group_length && *declared_group_length != data.size() - group_start) {
        return invalid("Command Group Length " + std::to_string(*declared_group_length) +
                       " does not match " + std::to_string(data.size() - group_start) +
                       " bytes of command elements");
    }
    return result;
}

}  // namespace dul::network::dimse
