/**
 * @file pdu_framer_test.cpp
 * @brief Tests for splitting a TCP byte stream into PDUs
 */

#include <catch2/catch_test_macros.hpp>

#include "dul/network/pdu_encoder.hpp"
#include "dul/network/pdu_framer.hpp"

using namespace dul;
using namespace dul::network;

TEST_CASE("pdu_framer reassembles PDUs split across reads", "[network][pdu_framer]") {
    pdu_framer framer;
    auto release = pdu_encoder::encode_release_rq();

    SECTION("empty framer yields nothing") {
        auto next = framer.next_frame();
        REQUIRE(next.is_ok());
        CHECK_FALSE(next.value().has_value());
        CHECK_FALSE(framer.in_frame());
    }

    SECTION("byte-by-byte feeding") {
        for (size_t i = 0; i + 1 < release.size(); ++i) {
            framer.feed(std::span<const uint8_t>(&release[i], 1));
            auto next = framer.next_frame();
            REQUIRE(next.is_ok());
            CHECK_FALSE(next.value().has_value());
        }
        framer.feed(std::span<const uint8_t>(&release.back(), 1));

        auto next = framer.next_frame();
        REQUIRE(next.is_ok());
        REQUIRE(next.value().has_value());
        CHECK(*next.value() == release);
        CHECK(framer.buffered() == 0);
    }

    SECTION("two PDUs in one read") {
        auto abort = pdu_encoder::encode_abort(abort_source::service_user,
                                               abort_reason::not_specified);
        std::vector<uint8_t> stream = release;
        stream.insert(stream.end(), abort.begin(), abort.end());
        framer.feed(stream);

        auto first = framer.next_frame();
        REQUIRE(first.is_ok());
        REQUIRE(first.value().has_value());
        CHECK(*first.value() == release);

        auto second = framer.next_frame();
        REQUIRE(second.is_ok());
        REQUIRE(second.value().has_value());
        CHECK(*second.value() == abort);

        auto third = framer.next_frame();
        REQUIRE(third.is_ok());
        CHECK_FALSE(third.value().has_value());
    }
}

TEST_CASE("pdu_framer rejects invalid headers", "[network][pdu_framer]") {
    SECTION("unknown type byte is reported before the header completes") {
        pdu_framer framer;
        framer.feed(std::vector<uint8_t>{0x0A});
        auto next = framer.next_frame();
        REQUIRE(next.is_err());
        CHECK(next.error().code == error_codes::invalid_pdu_type);

        // The stream stays unusable until reset
        framer.feed(pdu_encoder::encode_release_rp());
        CHECK(framer.next_frame().is_err());

        framer.reset();
        framer.feed(pdu_encoder::encode_release_rp());
        auto after_reset = framer.next_frame();
        REQUIRE(after_reset.is_ok());
        CHECK(after_reset.value().has_value());
    }

    SECTION("declared length above the receive ceiling") {
        pdu_framer framer(1024);
        framer.feed(std::vector<uint8_t>{0x04, 0x00, 0x00, 0x01, 0x00, 0x00});
        auto next = framer.next_frame();
        REQUIRE(next.is_err());
        CHECK(next.error().code == error_codes::malformed_pdu);
    }

    SECTION("ceiling can be raised") {
        pdu_framer framer(8);
        framer.set_receive_ceiling(1024);
        CHECK(framer.receive_ceiling() == 1024);
        framer.feed(pdu_encoder::encode_release_rq());
        auto next = framer.next_frame();
        REQUIRE(next.is_ok());
        CHECK(next.value().has_value());
    }
}
