/**
 * @file events_test.cpp
 * @brief Tests for association event subscription and request handler registration
 */

#include <catch2/catch_test_macros.hpp>

#include "dul/network/events.hpp"
#include "dul/network/request_context.hpp"

#include <stdexcept>
#include <vector>

using namespace dul;
using namespace dul::network;

TEST_CASE("event_dispatcher subscriptions", "[network][events]") {
    event_dispatcher events;
    std::vector<std::string> seen;

    auto id = events.subscribe(event_type::association_established,
                               [&](const association_event& e) { seen.push_back(e.calling_ae); });
    CHECK(events.has_subscribers(event_type::association_established));
    CHECK_FALSE(events.has_subscribers(event_type::association_released));

    association_event event;
    event.type = event_type::association_established;
    event.calling_ae = "MODALITY";
    events.publish(event);

    SECTION("only matching callbacks run") {
        association_event other;
        other.type = event_type::association_released;
        events.publish(other);
        REQUIRE(seen.size() == 1);
        CHECK(seen[0] == "MODALITY");
    }

    SECTION("unsubscribe stops delivery") {
        CHECK(events.unsubscribe(id));
        CHECK_FALSE(events.unsubscribe(id));
        events.publish(event);
        CHECK(seen.size() == 1);
        CHECK_FALSE(events.has_subscribers(event_type::association_established));
    }

    SECTION("a throwing callback does not stop the others") {
        events.subscribe(event_type::association_established,
                         [](const association_event&) { throw std::runtime_error("boom"); });
        events.subscribe(event_type::association_established,
                         [&](const association_event&) { seen.push_back("second"); });
        events.publish(event);
        REQUIRE(seen.size() == 3);
        CHECK(seen[2] == "second");
    }
}

TEST_CASE("event_dispatcher request handlers", "[network][events]") {
    event_dispatcher events;
    auto handler = [](request_context&) { return dimse::status_success; };

    SECTION("only request events accept handlers") {
        auto bad = events.set_request_handler(event_type::association_aborted, handler);
        REQUIRE(bad.is_err());
        CHECK(bad.error().code == error_codes::invalid_argument);

        CHECK(events.set_request_handler(event_type::c_find, handler).is_ok());
        CHECK(static_cast<bool>(events.request_handler_for(event_type::c_find)));
    }

    SECTION("clearing removes the handler") {
        REQUIRE(events.set_request_handler(event_type::n_action, handler).is_ok());
        events.clear_request_handler(event_type::n_action);
        CHECK_FALSE(static_cast<bool>(events.request_handler_for(event_type::n_action)));
    }

    SECTION("no handler installed") {
        CHECK_FALSE(static_cast<bool>(events.request_handler_for(event_type::c_store)));
    }
}

TEST_CASE("request_event_for maps DIMSE request commands", "[network][events]") {
    using dimse::command_field;
    CHECK(request_event_for(command_field::c_echo_rq) == event_type::c_echo);
    CHECK(request_event_for(command_field::c_move_rq) == event_type::c_move);
    CHECK(request_event_for(command_field::n_delete_rq) == event_type::n_delete);
    CHECK_FALSE(request_event_for(command_field::c_cancel_rq).has_value());
    CHECK_FALSE(request_event_for(command_field::c_echo_rsp).has_value());

    CHECK(is_request_event(event_type::c_store));
    CHECK_FALSE(is_request_event(event_type::pdu_received));
    CHECK(to_string(event_type::association_established) == "association-established");
}
