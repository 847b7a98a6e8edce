/**
 * @file pdu_encoder_test.cpp
 * @brief Byte-level tests for the Upper Layer PDU encoder
 */

#include <catch2/catch_test_macros.hpp>

#include "dul/network/pdu_encoder.hpp"
#include "dul/network/pdu_types.hpp"

using namespace dul;
using namespace dul::network;

namespace {

// Helper function to extract 16-bit big-endian value
inline uint16_t read_uint16_be(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

// Helper function to extract 32-bit big-endian value
inline uint32_t read_uint32_be(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint32_t>(
        (data[offset] << 24) |
        (data[offset + 1] << 16) |
        (data[offset + 2] << 8) |
        data[offset + 3]
    );
}

inline std::string read_string(const std::vector<uint8_t>& data,
                               size_t offset, size_t length) {
    return std::string(data.begin() + static_cast<ptrdiff_t>(offset),
                       data.begin() + static_cast<ptrdiff_t>(offset + length));
}

associate_rq minimal_rq() {
    associate_rq rq;
    rq.called_ae_title = "ARCHIVE_SCP";
    rq.calling_ae_title = "MY_SCU";
    rq.application_context = std::string(dicom_application_context);
    rq.presentation_contexts.emplace_back(
        1, "1.2.840.10008.1.1", std::vector<std::string>{"1.2.840.10008.1.2"});
    rq.user_info.max_pdu_length = default_max_pdu_length;
    rq.user_info.implementation_class_uid = "1.2.3.4.5";
    return rq;
}

}  // namespace

TEST_CASE("pdu_encoder A-ASSOCIATE-RQ", "[network][pdu_encoder]") {
    SECTION("fixed header fields") {
        auto result = pdu_encoder::encode_associate_rq(minimal_rq());
        REQUIRE(result.is_ok());
        const auto& bytes = result.value();

        CHECK(bytes[0] == 0x01);
        CHECK(bytes[1] == 0x00);
        CHECK(read_uint32_be(bytes, 2) == bytes.size() - 6);
        CHECK(read_uint16_be(bytes, 6) == 0x0001);
        CHECK(read_uint16_be(bytes, 8) == 0x0000);
        CHECK(read_string(bytes, 10, 16) == "ARCHIVE_SCP     ");
        CHECK(read_string(bytes, 26, 16) == "MY_SCU          ");

        // 32 reserved bytes before the first variable item
        for (size_t i = 42; i < 74; ++i) {
            CHECK(bytes[i] == 0x00);
        }
        CHECK(bytes[74] == 0x10);  // Application Context item
    }

    SECTION("application context defaults when left empty") {
        auto rq = minimal_rq();
        rq.application_context.clear();
        auto result = pdu_encoder::encode_associate_rq(rq);
        REQUIRE(result.is_ok());
        const auto& bytes = result.value();
        const auto length = read_uint16_be(bytes, 76);
        CHECK(read_string(bytes, 78, length) == dicom_application_context);
    }

    SECTION("rejects an empty or oversized AE title") {
        auto rq = minimal_rq();
        rq.called_ae_title = "";
        CHECK(pdu_encoder::encode_associate_rq(rq).is_err());

        rq = minimal_rq();
        rq.calling_ae_title = "SEVENTEEN_CHARS__";
        CHECK(pdu_encoder::encode_associate_rq(rq).is_err());

        rq = minimal_rq();
        rq.calling_ae_title = "    ";
        CHECK(pdu_encoder::encode_associate_rq(rq).is_err());
    }

    SECTION("rejects even or missing presentation contexts") {
        auto rq = minimal_rq();
        rq.presentation_contexts.clear();
        auto empty = pdu_encoder::encode_associate_rq(rq);
        REQUIRE(empty.is_err());
        CHECK(empty.error().code == error_codes::pdu_encoding_error);

        rq = minimal_rq();
        rq.presentation_contexts[0].id = 2;
        CHECK(pdu_encoder::encode_associate_rq(rq).is_err());

        rq = minimal_rq();
        rq.presentation_contexts[0].transfer_syntaxes.clear();
        CHECK(pdu_encoder::encode_associate_rq(rq).is_err());
    }

    SECTION("rejects more than 128 presentation contexts") {
        auto rq = minimal_rq();
        rq.presentation_contexts.clear();
        for (int i = 0; i < 129; ++i) {
            rq.presentation_contexts.emplace_back(
                static_cast<uint8_t>(2 * i + 1), "1.2.840.10008.1.1",
                std::vector<std::string>{"1.2.840.10008.1.2"});
        }
        CHECK(pdu_encoder::encode_associate_rq(rq).is_err());
    }

    SECTION("rejects UIDs longer than 64 characters") {
        auto rq = minimal_rq();
        rq.presentation_contexts[0].abstract_syntax = std::string(65, '1');
        CHECK(pdu_encoder::encode_associate_rq(rq).is_err());
    }

    SECTION("rejects a missing implementation class UID") {
        auto rq = minimal_rq();
        rq.user_info.implementation_class_uid.clear();
        CHECK(pdu_encoder::encode_associate_rq(rq).is_err());
    }
}

TEST_CASE("pdu_encoder A-ASSOCIATE-RJ", "[network][pdu_encoder]") {
    associate_rj rj(reject_result::rejected_transient, 3, 2);
    auto bytes = pdu_encoder::encode_associate_rj(rj);

    REQUIRE(bytes.size() == 10);
    CHECK(bytes[0] == 0x03);
    CHECK(read_uint32_be(bytes, 2) == 4);
    CHECK(bytes[6] == 0x00);
    CHECK(bytes[7] == 0x02);
    CHECK(bytes[8] == 0x03);
    CHECK(bytes[9] == 0x02);
}

TEST_CASE("pdu_encoder release and abort", "[network][pdu_encoder]") {
    SECTION("A-RELEASE-RQ") {
        auto bytes = pdu_encoder::encode_release_rq();
        CHECK(bytes == std::vector<uint8_t>{0x05, 0x00, 0x00, 0x00, 0x00, 0x04,
                                            0x00, 0x00, 0x00, 0x00});
    }

    SECTION("A-RELEASE-RP") {
        auto bytes = pdu_encoder::encode_release_rp();
        CHECK(bytes == std::vector<uint8_t>{0x06, 0x00, 0x00, 0x00, 0x00, 0x04,
                                            0x00, 0x00, 0x00, 0x00});
    }

    SECTION("A-ABORT carries source and reason in the last two bytes") {
        auto bytes = pdu_encoder::encode_abort(abort_source::service_provider,
                                               abort_reason::unexpected_pdu);
        CHECK(bytes == std::vector<uint8_t>{0x07, 0x00, 0x00, 0x00, 0x00, 0x04,
                                            0x00, 0x00, 0x02, 0x02});
    }
}

TEST_CASE("pdu_encoder P-DATA-TF", "[network][pdu_encoder]") {
    SECTION("single PDV layout") {
        presentation_data_value pdv(1, true, true, {0xAA, 0xBB, 0xCC});
        auto result = pdu_encoder::encode_p_data_tf(pdv);
        REQUIRE(result.is_ok());
        const auto& bytes = result.value();

        REQUIRE(bytes.size() == 6 + 6 + 3);
        CHECK(bytes[0] == 0x04);
        CHECK(read_uint32_be(bytes, 2) == 9);
        CHECK(read_uint32_be(bytes, 6) == 5);  // context id + header + payload
        CHECK(bytes[10] == 0x01);
        CHECK(bytes[11] == 0x03);  // command | last
        CHECK(bytes[12] == 0xAA);
        CHECK(bytes[14] == 0xCC);
    }

    SECTION("p_data_tf_size matches encoded size") {
        std::vector<presentation_data_value> pdvs{
            {1, false, false, std::vector<uint8_t>(100, 0x11)},
            {1, false, true, std::vector<uint8_t>(50, 0x22)}};
        auto result = pdu_encoder::encode_p_data_tf(pdvs);
        REQUIRE(result.is_ok());
        CHECK(result.value().size() == pdu_encoder::p_data_tf_size(150, 2));
    }

    SECTION("rejects an empty PDV list and even context ids") {
        CHECK(pdu_encoder::encode_p_data_tf(std::vector<presentation_data_value>{}).is_err());
        CHECK(pdu_encoder::encode_p_data_tf(presentation_data_value(2, false, true, {0x01}))
                  .is_err());
    }
}

TEST_CASE("pdu_encoder generic encode dispatches on the variant", "[network][pdu_encoder]") {
    auto release = pdu_encoder::encode(pdu{release_rq_pdu{}});
    REQUIRE(release.is_ok());
    CHECK(release.value() == pdu_encoder::encode_release_rq());

    auto abort = pdu_encoder::encode(pdu{abort_pdu{abort_source::service_user,
                                                   abort_reason::not_specified}});
    REQUIRE(abort.is_ok());
    CHECK(abort.value()[0] == 0x07);

    CHECK(type_of(pdu{associate_rj{}}) == pdu_type::associate_rj);
}
