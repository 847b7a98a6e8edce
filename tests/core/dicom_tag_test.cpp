/**
 * @file dicom_tag_test.cpp
 * @brief Unit tests for dicom_tag class
 */

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <vector>

#include "dul/core/dicom_tag.hpp"

using namespace dul::core;

// ============================================================================
// Construction Tests
// ============================================================================

TEST_CASE("dicom_tag construction", "[dicom_tag][construction]") {
    SECTION("default is (0000,0000)") {
        const dicom_tag tag;
        CHECK(tag.combined() == 0);
        CHECK(tag.is_command());
        CHECK(tag.is_group_length());
    }

    SECTION("group and element") {
        const dicom_tag tag{0x0000, 0x0100};
        CHECK(tag.group() == 0x0000);
        CHECK(tag.element() == 0x0100);
        CHECK(tag.combined() == 0x00000100);
    }

    SECTION("combined value") {
        const dicom_tag tag{0x7FE00010u};
        CHECK(tag.group() == 0x7FE0);
        CHECK(tag.element() == 0x0010);
    }

    SECTION("usable in constant expressions") {
        constexpr dicom_tag command_field{0x0000, 0x0100};
        static_assert(command_field.is_command());
        static_assert(!command_field.is_group_length());
        static_assert(dicom_tag{0x0008, 0x0000}.is_group_length());
        CHECK(command_field.combined() == 0x0100);
    }
}

// ============================================================================
// Classification Tests
// ============================================================================

TEST_CASE("dicom_tag command group", "[dicom_tag][classification]") {
    CHECK(dicom_tag{0x0000, 0x0002}.is_command());
    CHECK(dicom_tag{0x0000, 0x0900}.is_command());
    CHECK_FALSE(dicom_tag{0x0008, 0x0016}.is_command());
    CHECK_FALSE(dicom_tag{0x0002, 0x0010}.is_command());
}

// ============================================================================
// String Conversion Tests
// ============================================================================

TEST_CASE("dicom_tag to_string", "[dicom_tag][string]") {
    CHECK(dicom_tag{0x0000, 0x0100}.to_string() == "(0000,0100)");
    CHECK(dicom_tag{0x7FE0, 0x0010}.to_string() == "(7FE0,0010)");
    CHECK(dicom_tag{0xFFFE, 0xE0DD}.to_string() == "(FFFE,E0DD)");
}

// ============================================================================
// Comparison Tests
// ============================================================================

TEST_CASE("dicom_tag ordering", "[dicom_tag][comparison]") {
    const dicom_tag group_length{0x0000, 0x0000};
    const dicom_tag command_field{0x0000, 0x0100};
    const dicom_tag patient_name{0x0010, 0x0010};

    CHECK(group_length < command_field);
    CHECK(command_field < patient_name);
    CHECK(patient_name > group_length);
    CHECK(command_field == dicom_tag{0x0000, 0x0100});
    CHECK(command_field != patient_name);

    // Command sets are encoded in ascending tag order
    std::vector<dicom_tag> tags{patient_name, command_field, group_length};
    std::sort(tags.begin(), tags.end());
    CHECK(tags.front() == group_length);
    CHECK(tags.back() == patient_name);
}
