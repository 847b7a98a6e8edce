/**
 * @file pdv_fragmenter_test.cpp
 * @brief Tests for PDV fragmentation and DIMSE message reassembly
 */

#include <dul/network/dimse/dimse_message.hpp>
#include <dul/network/dimse/pdv_fragmenter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <numeric>

using namespace dul;
using namespace dul::network;
using namespace dul::network::dimse;

namespace {

std::vector<uint8_t> pattern(std::size_t size) {
    std::vector<uint8_t> bytes(size);
    std::iota(bytes.begin(), bytes.end(), uint8_t{0});
    return bytes;
}

}  // namespace

// ============================================================================
// Fragmentation
// ============================================================================

TEST_CASE("pdv_fragmenter splits large data sets", "[dimse][fragmenter]") {
    const auto command = pattern(40);
    const auto dataset = pattern(200000);

    pdv_fragmenter fragmenter(16384);
    CHECK(fragmenter.max_fragment_payload() == 16378);

    auto result = fragmenter.fragment(3, command, std::span<const uint8_t>(dataset));
    REQUIRE(result.is_ok());
    const auto& pdus = result.value();

    // 1 command PDU + ceil(200000 / 16378) data PDUs
    REQUIRE(pdus.size() == 1 + 13);

    SECTION("every PDU holds a single PDV within the limit") {
        for (const auto& pdu : pdus) {
            REQUIRE(pdu.pdvs.size() == 1);
            CHECK(pdu.pdvs[0].context_id == 3);
            CHECK(pdu.pdvs[0].data.size() + pdv_header_size <= 16384);
        }
    }

    SECTION("the command comes first and is flagged last") {
        CHECK(pdus[0].pdvs[0].is_command);
        CHECK(pdus[0].pdvs[0].is_last);
        CHECK(pdus[0].pdvs[0].data == command);
    }

    SECTION("only the final data fragment carries the last bit") {
        int last_count = 0;
        std::vector<uint8_t> joined;
        for (std::size_t i = 1; i < pdus.size(); ++i) {
            const auto& pdv = pdus[i].pdvs[0];
            CHECK_FALSE(pdv.is_command);
            if (pdv.is_last) {
                ++last_count;
                CHECK(i == pdus.size() - 1);
            }
            joined.insert(joined.end(), pdv.data.begin(), pdv.data.end());
        }
        CHECK(last_count == 1);
        CHECK(joined == dataset);
        CHECK(pdus.back().pdvs[0].data.size() == 200000 - 12 * 16378);
    }
}

TEST_CASE("pdv_fragmenter limits", "[dimse][fragmenter]") {
    const auto command = pattern(100);

    SECTION("unlimited length keeps each stream whole") {
        pdv_fragmenter fragmenter(unlimited_max_pdu_length);
        auto data = pattern(100000);
        auto result = fragmenter.fragment(1, command, std::span<const uint8_t>(data));
        REQUIRE(result.is_ok());
        REQUIRE(result.value().size() == 2);
        CHECK(result.value()[1].pdvs[0].data.size() == 100000);
    }

    SECTION("without a data set only the command is sent") {
        pdv_fragmenter fragmenter;
        auto result = fragmenter.fragment(1, command, std::nullopt);
        REQUIRE(result.is_ok());
        CHECK(result.value().size() == 1);
    }

    SECTION("a length that leaves no payload room is rejected") {
        pdv_fragmenter fragmenter(6);
        auto result = fragmenter.fragment(1, command, std::nullopt);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::pdu_too_large);
    }
}

// ============================================================================
// Reassembly
// ============================================================================

TEST_CASE("message_assembler rebuilds fragmented messages", "[dimse][assembler]") {
    auto original = make_c_store_rq(17, "1.2.840.10008.5.1.4.1.1.2", "1.2.3.4");
    original.set_dataset(pattern(50000));

    pdv_fragmenter fragmenter(4096);
    auto pdus = fragmenter.fragment(5, original);
    REQUIRE(pdus.is_ok());
    REQUIRE(pdus.value().size() > 2);

    message_assembler assembler;
    std::vector<received_message> completed;
    for (const auto& pdu : pdus.value()) {
        auto fed = assembler.feed(pdu);
        REQUIRE(fed.is_ok());
        for (auto& msg : fed.value()) {
            completed.push_back(std::move(msg));
        }
    }

    REQUIRE(completed.size() == 1);
    CHECK(completed[0].context_id == 5);
    CHECK(completed[0].message == original);
    CHECK_FALSE(assembler.in_progress());
}

TEST_CASE("message_assembler completes commands without a data set", "[dimse][assembler]") {
    auto echo = make_c_echo_rq(1);
    auto encoded = echo.encode();
    REQUIRE(encoded.is_ok());

    message_assembler assembler;
    auto result = assembler.add({1, true, true, encoded.value().first});
    REQUIRE(result.is_ok());
    REQUIRE(result.value().has_value());
    CHECK(result.value()->message.command() == command_field::c_echo_rq);
}

TEST_CASE("message_assembler rejects out-of-sequence fragments", "[dimse][assembler]") {
    auto store = make_c_store_rq(2, "1.2.840.10008.5.1.4.1.1.2", "1.2.3");
    store.set_dataset(pattern(10));
    auto encoded = store.encode();
    REQUIRE(encoded.is_ok());
    const auto& command = encoded.value().first;

    message_assembler assembler;

    SECTION("data set before the command is complete") {
        auto result = assembler.add({1, false, true, pattern(4)});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::fragment_sequence_error);
    }

    SECTION("context id changes mid-message") {
        std::vector<uint8_t> head(command.begin(), command.begin() + 8);
        REQUIRE(assembler.add({1, true, false, head}).is_ok());
        CHECK(assembler.in_progress());

        auto result = assembler.add({3, true, true, {}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::fragment_sequence_error);
        CHECK_FALSE(assembler.in_progress());
    }

    SECTION("command fragment after the command completed") {
        REQUIRE(assembler.add({1, true, true, command}).is_ok());
        auto result = assembler.add({1, true, true, command});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::fragment_sequence_error);
    }

    SECTION("data set for a command that announced none") {
        auto echo = make_c_echo_rq(4).encode();
        REQUIRE(echo.is_ok());
        auto first = assembler.add({1, true, true, echo.value().first});
        REQUIRE(first.is_ok());
        REQUIRE(first.value().has_value());

        // A fresh message cannot start with a data fragment
        CHECK(assembler.add({1, false, true, pattern(2)}).is_err());
    }

    SECTION("undecodable command stream") {
        auto result = assembler.add({1, true, true, {0x08, 0x00, 0x10, 0x00}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_command_set);
    }
}
