/**
 * @file dicom_tag.cpp
 * @brief dicom_tag formatting
 */

#include "dul/core/dicom_tag.hpp"

#include <array>

namespace dul::core {

namespace {

constexpr std::array<char, 16> hex_digits = {
    '0', '1', '2', '3', '4', '5', '6', '7',
    '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

void append_hex4(std::string& out, uint16_t value) {
    out += hex_digits[(value >> 12) & 0xF];
    out += hex_digits[(value >> 8) & 0xF];
    out += hex_digits[(value >> 4) & 0xF];
    out += hex_digits[value & 0xF];
}

}  // namespace

auto dicom_tag::to_string() const -> std::string {
    std::string result;
    result.reserve(11);
    result += '(';
    append_hex4(result, group());
    result += ',';
    append_hex4(result, element());
    result += ')';
    return result;
}

}  // namespace dul::core
