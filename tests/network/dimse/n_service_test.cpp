/**
 * @file n_service_test.cpp
 * @brief Unit tests for DIMSE-N messages (N-CREATE, N-SET, N-GET, N-EVENT-REPORT,
 *        N-ACTION, N-DELETE)
 */

#include <dul/network/dimse/command_field.hpp>
#include <dul/network/dimse/dimse_message.hpp>
#include <dul/network/dimse/status_codes.hpp>

#include <dul/core/dicom_tag.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace dul::network::dimse;
using namespace dul::core;

namespace {

constexpr std::string_view mpps_class = "1.2.840.10008.3.1.2.3.3";
constexpr std::string_view commitment_class = "1.2.840.10008.1.20.1";
constexpr std::string_view commitment_instance = "1.2.840.10008.1.20.1.1";
constexpr std::string_view instance_uid = "1.2.3.4.5.6.7.8.9";

auto round_trip(const dimse_message& msg) -> dimse_message {
    auto encoded = msg.encode();
    REQUIRE(encoded.is_ok());
    std::optional<std::vector<uint8_t>> dataset;
    if (msg.has_dataset()) {
        dataset = encoded.value().second;
    }
    auto decoded = dimse_message::decode(encoded.value().first, std::move(dataset));
    REQUIRE(decoded.is_ok());
    return decoded.value();
}

}  // namespace

// ============================================================================
// DIMSE-N Status Codes Tests
// ============================================================================

TEST_CASE("DIMSE-N specific status codes", "[dimse][status][n-service]") {
    SECTION("Attribute list warnings") {
        CHECK_FALSE(is_failure(status_error_attribute_list_error));
        CHECK(is_warning(status_error_attribute_list_error));
        CHECK(is_warning(status_error_attribute_value_out_of_range));
    }

    SECTION("Object instance errors") {
        CHECK(is_failure(status_error_invalid_object_instance));
        CHECK(is_failure(status_error_no_such_sop_class));
        CHECK(is_failure(status_error_class_instance_conflict));
        CHECK(status_description(status_error_invalid_object_instance) ==
              "Error: Invalid object instance");
    }

    SECTION("Operation errors") {
        CHECK(is_failure(status_error_duplicate_invocation));
        CHECK(is_failure(status_error_unrecognized_operation));
        CHECK(is_failure(status_error_mistyped_argument));
        CHECK(is_failure(status_error_resource_limitation));
        CHECK(is_failure(status_error_no_such_action_type));
        CHECK(is_failure(status_error_no_such_event_type));
    }
}

// ============================================================================
// N-CREATE Tests
// ============================================================================

TEST_CASE("N-CREATE messages", "[dimse][message][n-create]") {
    SECTION("request with instance UID") {
        auto msg = make_n_create_rq(1, mpps_class, instance_uid);
        CHECK(msg.command() == command_field::n_create_rq);
        CHECK(is_dimse_n(msg.command()));
        CHECK(msg.affected_sop_class_uid() == mpps_class);
        CHECK(msg.affected_sop_instance_uid() == instance_uid);
    }

    SECTION("request without instance UID leaves the choice to the SCP") {
        auto msg = make_n_create_rq(2, mpps_class);
        CHECK(msg.affected_sop_instance_uid().empty());
        CHECK_FALSE(msg.commands().contains(tag_affected_sop_instance_uid));
    }

    SECTION("response carries the assigned instance") {
        auto msg = make_n_create_rsp(2, mpps_class, instance_uid);
        CHECK(msg.message_id_responded_to() == 2);
        CHECK(msg.affected_sop_instance_uid() == instance_uid);
        CHECK(msg.status() == status_success);
    }

    SECTION("encode/decode with attributes") {
        auto original = make_n_create_rq(42, mpps_class, instance_uid);
        original.set_dataset({0x10, 0x00, 0x20, 0x00, 0x02, 0x00, 0x00, 0x00, '4', '2'});
        auto decoded = round_trip(original);
        CHECK(decoded == original);
    }
}

// ============================================================================
// N-SET / N-GET Tests
// ============================================================================

TEST_CASE("N-SET messages", "[dimse][message][n-set]") {
    auto rq = make_n_set_rq(5, mpps_class, instance_uid);
    CHECK(rq.requested_sop_class_uid() == mpps_class);
    CHECK(rq.requested_sop_instance_uid() == instance_uid);
    CHECK(rq.sop_class_uid() == mpps_class);
    CHECK(rq.affected_sop_class_uid().empty());

    auto rsp = make_response_for(rq, status_success);
    CHECK(rsp.command() == command_field::n_set_rsp);
    CHECK(rsp.affected_sop_class_uid() == mpps_class);
    CHECK(rsp.affected_sop_instance_uid() == instance_uid);
}

TEST_CASE("N-GET attribute identifier list", "[dimse][message][n-get]") {
    const std::vector<dicom_tag> attributes{{0x0010, 0x0010}, {0x0010, 0x0020},
                                            {0x0040, 0x0252}};

    SECTION("list survives encode/decode") {
        auto original = make_n_get_rq(3, mpps_class, instance_uid, attributes);
        auto decoded = round_trip(original);
        CHECK(decoded.attribute_identifier_list() == attributes);
    }

    SECTION("empty list requests all attributes") {
        auto msg = make_n_get_rq(4, mpps_class, instance_uid);
        CHECK_FALSE(msg.commands().contains(tag_attribute_identifier_list));
        CHECK(msg.attribute_identifier_list().empty());
    }
}

// ============================================================================
// N-EVENT-REPORT / N-ACTION / N-DELETE Tests
// ============================================================================

TEST_CASE("N-EVENT-REPORT messages", "[dimse][message][n-event-report]") {
    auto rq = make_n_event_report_rq(8, commitment_class, commitment_instance, 1);
    CHECK(rq.event_type_id() == uint16_t{1});
    CHECK(rq.affected_sop_instance_uid() == commitment_instance);

    auto rsp = make_response_for(rq, status_success);
    CHECK(rsp.command() == command_field::n_event_report_rsp);
    CHECK(rsp.event_type_id() == uint16_t{1});

    auto decoded = round_trip(rq);
    CHECK(decoded.event_type_id() == uint16_t{1});
}

TEST_CASE("N-ACTION messages", "[dimse][message][n-action]") {
    auto rq = make_n_action_rq(9, commitment_class, commitment_instance, 1);
    rq.set_dataset({0x08, 0x00, 0x95, 0x11, 0x00, 0x00, 0x00, 0x00});
    CHECK(rq.action_type_id() == uint16_t{1});
    CHECK(rq.requested_sop_instance_uid() == commitment_instance);

    auto decoded = round_trip(rq);
    CHECK(decoded == rq);

    auto rsp = make_n_action_rsp(9, commitment_class, commitment_instance, 1,
                                 status_error_no_such_action_type);
    CHECK(is_failure(rsp.status()));
}

TEST_CASE("N-DELETE messages", "[dimse][message][n-delete]") {
    auto rq = make_n_delete_rq(10, mpps_class, instance_uid);
    CHECK(rq.command() == command_field::n_delete_rq);
    CHECK_FALSE(rq.has_dataset());

    auto rsp = make_n_delete_rsp(10, mpps_class, instance_uid);
    CHECK(rsp.is_response());
    CHECK(round_trip(rsp) == rsp);
}

TEST_CASE("DIMSE-N request/response conversion", "[dimse][command_field]") {
    CHECK(get_response_command(command_field::n_create_rq) == command_field::n_create_rsp);
    CHECK(get_request_command(command_field::n_action_rsp) == command_field::n_action_rq);
    CHECK(to_string(command_field::n_event_report_rq) == "N-EVENT-REPORT-RQ");
    CHECK_FALSE(is_dimse_c(command_field::n_get_rq));
}
