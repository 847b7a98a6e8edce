/**
 * @file dimse_message_test.cpp
 * @brief Unit tests for DIMSE message class
 */

#include <dul/network/dimse/command_field.hpp>
#include <dul/network/dimse/dimse_message.hpp>
#include <dul/network/dimse/status_codes.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace dul;
using namespace dul::network::dimse;

namespace {

constexpr std::string_view ct_image_storage = "1.2.840.10008.5.1.4.1.1.2";
constexpr std::string_view study_root_find = "1.2.840.10008.5.1.4.1.2.2.1";
constexpr std::string_view study_root_move = "1.2.840.10008.5.1.4.1.2.2.2";

}  // namespace

// ============================================================================
// Command Field Tests
// ============================================================================

TEST_CASE("command_field request/response detection", "[dimse][command_field]") {
    SECTION("C-STORE commands") {
        CHECK(is_request(command_field::c_store_rq));
        CHECK_FALSE(is_response(command_field::c_store_rq));

        CHECK_FALSE(is_request(command_field::c_store_rsp));
        CHECK(is_response(command_field::c_store_rsp));
    }

    SECTION("C-CANCEL is a request") {
        CHECK(is_request(command_field::c_cancel_rq));
        CHECK(is_dimse_c(command_field::c_cancel_rq));
    }

    SECTION("cancellable operations") {
        CHECK(is_cancellable(command_field::c_find_rq));
        CHECK(is_cancellable(command_field::c_get_rq));
        CHECK(is_cancellable(command_field::c_move_rq));
        CHECK_FALSE(is_cancellable(command_field::c_store_rq));
    }

    SECTION("known command values") {
        CHECK(is_known_command(0x0030));
        CHECK(is_known_command(0x8020));
        CHECK_FALSE(is_known_command(0x1234));
    }
}

TEST_CASE("command_field response/request conversion", "[dimse][command_field]") {
    CHECK(get_response_command(command_field::c_find_rq) == command_field::c_find_rsp);
    CHECK(get_request_command(command_field::c_move_rsp) == command_field::c_move_rq);
    CHECK(to_string(command_field::c_echo_rq) == "C-ECHO-RQ");
}

// ============================================================================
// Status Code Tests
// ============================================================================

TEST_CASE("status_codes classification", "[dimse][status]") {
    SECTION("success and pending") {
        CHECK(is_success(status_success));
        CHECK(is_pending(status_pending));
        CHECK(is_pending(status_pending_warning));
        CHECK_FALSE(is_final(status_pending));
        CHECK(is_final(status_success));
    }

    SECTION("cancel") {
        CHECK(is_cancel(status_cancel));
        CHECK(is_final(status_cancel));
    }

    SECTION("warnings") {
        CHECK(is_warning(status_warning_subops_complete_failures));
        CHECK(is_warning(0x0001));
        CHECK_FALSE(is_failure(0x0107));
    }

    SECTION("failures") {
        CHECK(is_failure(status_refused_out_of_resources));
        CHECK(is_failure(status_refused_move_destination_unknown));
        CHECK(is_failure(status_refused_sop_class_not_supported));
        CHECK(is_failure(status_move_error_processing));
        CHECK(status_category(0xC123) == "Failure");
    }
}

TEST_CASE("status_codes for failed requests", "[dimse][status]") {
    CHECK(decode_failure_status(command_field::c_store_rq) == 0xC210);
    CHECK(decode_failure_status(command_field::c_find_rq) == 0xC310);
    CHECK(decode_failure_status(command_field::n_set_rq) == 0x0110);
    CHECK(processing_failure_status(command_field::c_get_rq) == 0xC411);
    CHECK(processing_failure_status(command_field::c_move_rq) == 0xC511);
    CHECK(processing_failure_status(command_field::c_echo_rq) == 0x0110);
    CHECK(status_description(status_refused_move_destination_unknown) ==
          "Refused: Move destination unknown");
}

// ============================================================================
// Message Construction Tests
// ============================================================================

TEST_CASE("dimse_message C-ECHO", "[dimse][message][c-echo]") {
    auto rq = make_c_echo_rq(7);
    CHECK(rq.command() == command_field::c_echo_rq);
    CHECK(rq.message_id() == 7);
    CHECK(rq.affected_sop_class_uid() == verification_sop_class_uid);
    CHECK(rq.is_request());
    CHECK(rq.is_valid());
    CHECK_FALSE(rq.has_dataset());
    CHECK_FALSE(rq.announces_dataset());

    auto rsp = make_c_echo_rsp(7);
    CHECK(rsp.is_response());
    CHECK(rsp.message_id() == 7);
    CHECK(rsp.message_id_responded_to() == 7);
    CHECK(rsp.status() == status_success);
}

TEST_CASE("dimse_message C-STORE", "[dimse][message][c-store]") {
    auto rq = make_c_store_rq(3, ct_image_storage, "1.2.3.4.5", priority_high);
    CHECK(rq.affected_sop_class_uid() == ct_image_storage);
    CHECK(rq.affected_sop_instance_uid() == "1.2.3.4.5");
    CHECK(rq.priority() == priority_high);

    SECTION("move originator attributes") {
        rq.set_move_originator_aet("MOVE_SCU");
        rq.set_move_originator_message_id(12);
        CHECK(rq.move_originator_aet() == "MOVE_SCU");
        CHECK(rq.move_originator_message_id() == uint16_t{12});
    }

    SECTION("odd-length UIDs are padded with NUL") {
        const auto* raw = rq.commands().raw(tag_affected_sop_instance_uid);
        REQUIRE(raw != nullptr);
        REQUIRE(raw->size() == 10);
        CHECK(raw->back() == 0x00);
    }
}

TEST_CASE("dimse_message dataset management", "[dimse][message]") {
    auto rq = make_c_find_rq(1, study_root_find);
    CHECK(rq.commands().get_uint16(tag_command_data_set_type) == command_data_set_type_null);

    rq.set_dataset({0x08, 0x00, 0x52, 0x00});
    CHECK(rq.has_dataset());
    CHECK(rq.announces_dataset());
    CHECK(rq.dataset().size() == 4);

    auto taken = rq.take_dataset();
    CHECK(taken.size() == 4);
    CHECK_FALSE(rq.has_dataset());
    CHECK_FALSE(rq.announces_dataset());
}

TEST_CASE("dimse_message error comment is limited to 64 characters", "[dimse][message]") {
    auto rsp = make_c_find_rsp(1, study_root_find, status_find_error_processing);
    rsp.set_error_comment(std::string(100, 'x'));
    REQUIRE(rsp.error_comment().has_value());
    CHECK(rsp.error_comment()->size() == 64);
}

TEST_CASE("dimse_message sub-operation counts", "[dimse][message]") {
    auto pending = make_c_move_rsp(5, study_root_move, status_pending, 8, 2, 1, 0);
    CHECK(pending.remaining_subops() == uint16_t{8});
    CHECK(pending.completed_subops() == uint16_t{2});
    CHECK(pending.failed_subops() == uint16_t{1});
    CHECK(pending.warning_subops() == uint16_t{0});

    auto final_rsp = make_c_move_rsp(5, study_root_move, status_success);
    CHECK_FALSE(final_rsp.remaining_subops().has_value());
    CHECK(final_rsp.completed_subops() == uint16_t{0});
}

TEST_CASE("dimse_message C-MOVE and C-CANCEL", "[dimse][message][c-move]") {
    auto rq = make_c_move_rq(9, study_root_move, "STORE_SCP");
    CHECK(rq.move_destination() == "STORE_SCP");

    auto cancel = make_c_cancel_rq(9);
    CHECK(cancel.command() == command_field::c_cancel_rq);
    CHECK(cancel.message_id() == 9);
    CHECK(cancel.is_valid());
    CHECK_FALSE(cancel.commands().contains(tag_message_id));
}

TEST_CASE("make_response_for", "[dimse][message]") {
    auto rq = make_c_store_rq(11, ct_image_storage, "1.2.3");
    auto rsp = make_response_for(rq, status_success);
    CHECK(rsp.command() == command_field::c_store_rsp);
    CHECK(rsp.message_id_responded_to() == 11);
    CHECK(rsp.affected_sop_class_uid() == ct_image_storage);
    CHECK(rsp.affected_sop_instance_uid() == "1.2.3");
    CHECK(rsp.status() == status_success);
}

// ============================================================================
// Encode/Decode Tests
// ============================================================================

TEST_CASE("dimse_message encode/decode", "[dimse][message][codec]") {
    SECTION("C-STORE with data set") {
        auto original = make_c_store_rq(42, ct_image_storage, "1.2.3.4");
        original.set_dataset({0x10, 0x00, 0x10, 0x00, 0x04, 0x00, 0x00, 0x00,
                              'D', 'O', 'E', ' '});

        auto encoded = original.encode();
        REQUIRE(encoded.is_ok());
        const auto& [command, dataset] = encoded.value();
        CHECK(dataset.size() == 12);

        auto decoded = dimse_message::decode(command, dataset);
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == original);
    }

    SECTION("response with status and error comment") {
        auto original = make_c_find_rsp(3, study_root_find, status_find_error_processing);
        original.set_error_comment("database unavailable");

        auto encoded = original.encode();
        REQUIRE(encoded.is_ok());
        auto decoded = dimse_message::decode(encoded.value().first);
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value().status() == status_find_error_processing);
        CHECK(decoded.value().error_comment() == "database unavailable");
    }

    SECTION("announced data set must be present") {
        auto msg = make_c_find_rq(1, study_root_find);
        msg.set_dataset({0x00, 0x00});
        auto encoded = msg.encode();
        REQUIRE(encoded.is_ok());

        auto decoded = dimse_message::decode(encoded.value().first);
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == error_codes::invalid_command_set);
    }

    SECTION("missing command field") {
        command_set commands;
        commands.set_uint16(tag_message_id, 1);
        auto decoded = dimse_message::decode(commands.encode());
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == error_codes::missing_command_element);
    }

    SECTION("request without message id") {
        command_set commands;
        commands.set_uint16(tag_command_field, 0x0030);
        commands.set_uint16(tag_command_data_set_type, command_data_set_type_null);
        auto decoded = dimse_message::decode(commands.encode());
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == error_codes::missing_command_element);
    }

    SECTION("incomplete messages do not encode") {
        dimse_message empty;
        CHECK(empty.encode().is_err());
    }
}
