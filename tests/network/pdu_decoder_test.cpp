/**
 * @file pdu_decoder_test.cpp
 * @brief Tests for the Upper Layer PDU decoder
 */

#include <catch2/catch_test_macros.hpp>

#include "dul/network/pdu_decoder.hpp"
#include "dul/network/pdu_encoder.hpp"

#include <string>

using namespace dul;
using namespace dul::network;

namespace {

associate_rq full_rq() {
    associate_rq rq;
    rq.called_ae_title = "ARCHIVE";
    rq.calling_ae_title = "MODALITY_01";
    rq.application_context = std::string(dicom_application_context);
    rq.presentation_contexts.emplace_back(
        1, "1.2.840.10008.1.1", std::vector<std::string>{"1.2.840.10008.1.2"});
    rq.presentation_contexts.emplace_back(
        3, "1.2.840.10008.5.1.4.1.1.2",
        std::vector<std::string>{"1.2.840.10008.1.2.1", "1.2.840.10008.1.2"});

    auto& info = rq.user_info;
    info.max_pdu_length = 32768;
    info.implementation_class_uid = "1.2.826.0.1.3680043.2.1545.1";
    info.implementation_version_name = "DUL_TEST";
    info.async_operations = async_operations_window{4, 2};
    info.role_selections.emplace_back("1.2.840.10008.5.1.4.1.1.2", true, true);
    info.sop_class_extended.push_back({"1.2.840.10008.5.1.4.1.2.2.1", {0x01, 0x00, 0x01}});
    info.sop_class_common_extended.push_back(
        {"1.2.840.10008.5.1.4.1.1.2", "1.2.840.10008.4.2", {"1.2.840.10008.5.1.4.1.1.2.1"}});
    info.user_identity_request =
        user_identity_rq{user_identity_type::username_and_passcode, true, "alice", "secret"};
    return rq;
}

associate_ac full_ac() {
    associate_ac ac;
    ac.called_ae_title = "ARCHIVE";
    ac.calling_ae_title = "MODALITY_01";
    ac.application_context = std::string(dicom_application_context);
    ac.presentation_contexts.emplace_back(1, presentation_context_result::acceptance,
                                          "1.2.840.10008.1.2");
    ac.presentation_contexts.emplace_back(
        3, presentation_context_result::abstract_syntax_not_supported, "");
    ac.user_info.max_pdu_length = 0;
    ac.user_info.implementation_class_uid = "1.2.3.4";
    ac.user_info.async_operations = async_operations_window{1, 1};
    ac.user_info.role_selections.emplace_back("1.2.840.10008.5.1.4.1.1.2", false, true);
    ac.user_info.user_identity_response = user_identity_ac{"token-123"};
    return ac;
}

std::vector<uint8_t> encoded(const pdu& value) {
    auto bytes = pdu_encoder::encode(value);
    REQUIRE(bytes.is_ok());
    return bytes.value();
}

}  // namespace

TEST_CASE("pdu_decoder pdu_length", "[network][pdu_decoder]") {
    SECTION("needs the full header") {
        std::vector<uint8_t> partial{0x04, 0x00, 0x00, 0x00};
        CHECK_FALSE(pdu_decoder::pdu_length(partial).has_value());
    }

    SECTION("reports header plus declared body length before the body arrives") {
        std::vector<uint8_t> header{0x04, 0x00, 0x00, 0x00, 0x01, 0x00};
        auto length = pdu_decoder::pdu_length(header);
        REQUIRE(length.has_value());
        CHECK(*length == 6 + 256);
    }
}

TEST_CASE("pdu_decoder peek_pdu_type", "[network][pdu_decoder]") {
    CHECK(pdu_decoder::peek_pdu_type(std::vector<uint8_t>{0x05}) == pdu_type::release_rq);
    CHECK_FALSE(pdu_decoder::peek_pdu_type(std::vector<uint8_t>{0x09}).has_value());
    CHECK_FALSE(pdu_decoder::peek_pdu_type(std::vector<uint8_t>{}).has_value());
    CHECK(pdu_decoder::is_known_pdu_type(0x07));
    CHECK_FALSE(pdu_decoder::is_known_pdu_type(0x00));
}

TEST_CASE("pdu_decoder round-trip", "[network][pdu_decoder]") {
    SECTION("A-ASSOCIATE-RQ with every user information sub-item") {
        pdu original{full_rq()};
        auto decoded = pdu_decoder::decode(encoded(original));
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == original);
    }

    SECTION("A-ASSOCIATE-AC with a rejected context") {
        pdu original{full_ac()};
        auto decoded = pdu_decoder::decode(encoded(original));
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == original);
    }

    SECTION("a version name keeps its trailing space") {
        auto rq = full_rq();
        rq.user_info.implementation_version_name = "DUL 1.0 ";
        pdu original{rq};
        auto decoded = pdu_decoder::decode(encoded(original));
        REQUIRE(decoded.is_ok());
        const auto& info = std::get<associate_rq>(decoded.value()).user_info;
        CHECK(info.implementation_version_name == "DUL 1.0 ");
        CHECK(info.implementation_class_uid == "1.2.826.0.1.3680043.2.1545.1");
    }

    SECTION("only the NUL padding of an odd-length UID is stripped") {
        auto rq = full_rq();
        rq.user_info.implementation_class_uid = "1.2.3.45";
        rq.presentation_contexts[0].abstract_syntax = "1.2.840.10008.1.1";
        pdu original{rq};
        auto decoded = pdu_decoder::decode(encoded(original));
        REQUIRE(decoded.is_ok());
        const auto& got = std::get<associate_rq>(decoded.value());
        CHECK(got.user_info.implementation_class_uid == "1.2.3.45");
        CHECK(got.presentation_contexts[0].abstract_syntax == "1.2.840.10008.1.1");
    }

    SECTION("a role selection UID loses one NUL pad") {
        auto rq = full_rq();
        rq.user_info.role_selections.clear();
        rq.user_info.role_selections.emplace_back(std::string("1.2.840.10008.5.1.4.1.1.2\0", 26),
                                                  true, false);
        pdu original{rq};
        auto decoded = pdu_decoder::decode(encoded(original));
        REQUIRE(decoded.is_ok());
        const auto& roles = std::get<associate_rq>(decoded.value()).user_info.role_selections;
        REQUIRE(roles.size() == 1);
        CHECK(roles[0].sop_class_uid == "1.2.840.10008.5.1.4.1.1.2");
        CHECK(roles[0].scu_role);
        CHECK_FALSE(roles[0].scp_role);
    }

    SECTION("A-ASSOCIATE-RJ") {
        pdu original{associate_rj(reject_result::rejected_permanent, 1, 7)};
        auto decoded = pdu_decoder::decode(encoded(original));
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == original);
    }

    SECTION("P-DATA-TF with several PDVs") {
        pdu original{p_data_tf_pdu({{1, true, true, {0x01, 0x02}},
                                    {1, false, false, std::vector<uint8_t>(300, 0x7F)},
                                    {1, false, true, {}}})};
        auto decoded = pdu_decoder::decode(encoded(original));
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == original);
    }

    SECTION("release and abort PDUs") {
        for (const pdu& original : {pdu{release_rq_pdu{}}, pdu{release_rp_pdu{}},
                                    pdu{abort_pdu{abort_source::service_provider,
                                                  abort_reason::invalid_pdu_parameter}}}) {
            auto decoded = pdu_decoder::decode(encoded(original));
            REQUIRE(decoded.is_ok());
            CHECK(decoded.value() == original);
        }
    }
}

TEST_CASE("pdu_decoder rejects malformed input", "[network][pdu_decoder]") {
    SECTION("short buffer is incomplete") {
        auto result = pdu_decoder::decode(std::vector<uint8_t>{0x05, 0x00, 0x00});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::incomplete_pdu);
    }

    SECTION("body shorter than the declared length is incomplete") {
        auto result = pdu_decoder::decode(
            std::vector<uint8_t>{0x05, 0x00, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::incomplete_pdu);
    }

    SECTION("unknown PDU type") {
        auto result = pdu_decoder::decode(
            std::vector<uint8_t>{0x09, 0x00, 0x00, 0x00, 0x00, 0x00});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::malformed_pdu);
    }

    SECTION("release PDU with a wrong length") {
        auto result = pdu_decoder::decode(
            std::vector<uint8_t>{0x05, 0x00, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00});
        CHECK(result.is_err());
    }

    SECTION("A-ASSOCIATE-RJ with an invalid result value") {
        auto result = pdu_decoder::decode(
            std::vector<uint8_t>{0x03, 0x00, 0x00, 0x00, 0x00, 0x04, 0x00, 0x05, 0x01, 0x01});
        CHECK(result.is_err());
    }

    SECTION("PDV item running past the PDU") {
        auto result = pdu_decoder::decode(std::vector<uint8_t>{
            0x04, 0x00, 0x00, 0x00, 0x00, 0x08,
            0x00, 0x00, 0x00, 0x10, 0x01, 0x03, 0xAA, 0xBB});
        CHECK(result.is_err());
    }

    SECTION("P-DATA-TF without PDV items") {
        auto result = pdu_decoder::decode(
            std::vector<uint8_t>{0x04, 0x00, 0x00, 0x00, 0x00, 0x00});
        CHECK(result.is_err());
    }
}

TEST_CASE("describe_rejection", "[network][pdu_decoder]") {
    auto text = describe_rejection(associate_rj(reject_result::rejected_transient, 3, 2));
    CHECK(text.find("transient") != std::string::npos);

    auto user = describe_rejection(associate_rj(reject_result::rejected_permanent, 1, 3));
    CHECK(user.find("calling AE title not recognized") != std::string::npos);
}
