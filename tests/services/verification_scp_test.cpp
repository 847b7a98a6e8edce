/**
 * @file verification_scp_test.cpp
 * @brief Unit tests for Verification SCP service
 */

#include <dul/core/uid_registry.hpp>
#include <dul/network/dicom_server.hpp>
#include <dul/network/dimse/command_field.hpp>
#include <dul/network/dimse/dimse_message.hpp>
#include <dul/network/dimse/status_codes.hpp>
#include <dul/services/dimse_scu.hpp>
#include <dul/services/verification_scp.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace dul;
using namespace dul::services;
using namespace dul::network;
using namespace dul::network::dimse;
using namespace std::chrono_literals;

// ============================================================================
// verification_scp Construction Tests
// ============================================================================

TEST_CASE("verification_scp construction", "[services][verification]") {
    verification_scp scp;

    SECTION("service name is correct") {
        CHECK(scp.service_name() == "Verification SCP");
    }

    SECTION("supports exactly one SOP class") {
        auto classes = scp.supported_sop_classes();
        REQUIRE(classes.size() == 1);
        CHECK(classes[0] == verification_sop_class_uid);
    }

    SECTION("supports_sop_class") {
        CHECK(scp.supports_sop_class("1.2.840.10008.1.1"));
        CHECK_FALSE(scp.supports_sop_class(core::uids::ct_image_storage));
        CHECK_FALSE(scp.supports_sop_class(""));
    }

    SECTION("offers verification with every transfer syntax given") {
        auto contexts = scp.presentation_contexts({"1.2.840.10008.1.2.1", "1.2.840.10008.1.2"});
        REQUIRE(contexts.size() == 1);
        CHECK(contexts[0].abstract_syntax == verification_sop_class_uid);
        CHECK(contexts[0].transfer_syntaxes.size() == 2);
        CHECK(contexts[0].scu_role);
        CHECK_FALSE(contexts[0].scp_role);
    }

    SECTION("no echo answered yet") {
        CHECK(scp.echo_count() == 0);
    }
}

TEST_CASE("verification_scp is an scp_service", "[services][verification]") {
    scp_service_ptr base = std::make_shared<verification_scp>();
    CHECK(base->service_name() == "Verification SCP");
    CHECK(base->supports_sop_class(verification_sop_class_uid));
}

// ============================================================================
// verification_scp over an association
// ============================================================================

TEST_CASE("verification_scp answers requests", "[services][verification][loopback]") {
    server_config config("VERIFY", 41650);
    config.transfer_syntaxes = {std::string(core::uids::implicit_vr_little_endian)};
    dicom_server server(config);
    auto scp = std::make_shared<verification_scp>();
    REQUIRE(server.register_service(scp).is_ok());
    REQUIRE(server.start().is_ok());

    association_config client;
    client.calling_ae_title = "ECHOSCU";
    client.called_ae_title = "VERIFY";
    client.proposed_contexts.emplace_back(
        1, std::string(verification_sop_class_uid),
        std::vector<std::string>{std::string(core::uids::implicit_vr_little_endian)});
    client.timeouts.dimse = 2000ms;

    auto assoc = association::connect("127.0.0.1", server.port(), client);
    REQUIRE(assoc.is_ok());

    SECTION("C-ECHO succeeds and is counted") {
        dimse_scu scu;
        for (int i = 0; i < 3; ++i) {
            auto status = scu.echo(*assoc.value());
            REQUIRE(status.is_ok());
            CHECK(status.value() == status_success);
        }
        CHECK(scp.echo_count() == 3);
        CHECK(scu.requests_sent() == 3);
    }

    SECTION("other commands are unrecognized operations") {
        const auto message_id = assoc.value()->next_message_id();
        auto rq = make_c_find_rq(message_id, verification_sop_class_uid);
        rq.set_dataset({0x08, 0x00, 0x52, 0x00, 0x00, 0x00, 0x00, 0x00});
        REQUIRE(assoc.value()->send_dimse(1, rq).is_ok());

        auto rsp = assoc.value()->receive_response(message_id, 2000ms);
        REQUIRE(rsp.is_ok());
        CHECK(rsp.value().message.command() == command_field::c_find_rsp);
        CHECK(rsp.value().message.status() == status_error_unrecognized_operation);
        CHECK(scp.echo_count() == 0);
    }

    REQUIRE(assoc.value()->release().is_ok());
    server.stop();
}
