/**
 * @file presentation_negotiator_test.cpp
 * @brief Tests for presentation context negotiation
 */

#include <catch2/catch_test_macros.hpp>

#include "dul/network/presentation_negotiator.hpp"

using namespace dul;
using namespace dul::network;

namespace {

constexpr const char* verification = "1.2.840.10008.1.1";
constexpr const char* ct_storage = "1.2.840.10008.5.1.4.1.1.2";
constexpr const char* ts_a = "1.2.840.10008.1.2.1";    // Explicit VR LE
constexpr const char* ts_b = "1.2.840.10008.1.2";      // Implicit VR LE
constexpr const char* ts_c = "1.2.840.10008.1.2.2";    // Explicit VR BE

}  // namespace

TEST_CASE("negotiate picks the first common transfer syntax", "[network][negotiator]") {
    presentation_negotiator negotiator({{verification, {ts_b, ts_c}}});

    auto result = negotiator.negotiate({{1, verification, {ts_a, ts_b}}});
    REQUIRE(result.is_ok());
    REQUIRE(result.value().contexts.size() == 1);

    const auto& ctx = result.value().contexts[0];
    CHECK(ctx.id == 1);
    CHECK(ctx.is_accepted());
    CHECK(ctx.transfer_syntax == ts_b);
    CHECK(result.value().any_accepted());
}

TEST_CASE("negotiate follows requestor preference order", "[network][negotiator]") {
    presentation_negotiator negotiator({{verification, {ts_c, ts_b, ts_a}}});

    auto result = negotiator.negotiate({{1, verification, {ts_a, ts_b}}});
    REQUIRE(result.is_ok());
    CHECK(result.value().contexts[0].transfer_syntax == ts_a);

    // Same input, same answer
    auto again = negotiator.negotiate({{1, verification, {ts_a, ts_b}}});
    REQUIRE(again.is_ok());
    CHECK(again.value().contexts == result.value().contexts);
}

TEST_CASE("negotiate reports per-context rejection reasons", "[network][negotiator]") {
    presentation_negotiator negotiator({{verification, {ts_b}}});

    auto result = negotiator.negotiate({{1, ct_storage, {ts_b}},
                                        {3, verification, {ts_c}},
                                        {5, verification, {ts_b}}});
    REQUIRE(result.is_ok());
    const auto& contexts = result.value().contexts;
    REQUIRE(contexts.size() == 3);

    SECTION("ids and order are preserved") {
        CHECK(contexts[0].id == 1);
        CHECK(contexts[1].id == 3);
        CHECK(contexts[2].id == 5);
    }

    SECTION("unknown abstract syntax") {
        CHECK(contexts[0].result == presentation_context_result::abstract_syntax_not_supported);
        CHECK(contexts[0].transfer_syntax.empty());
    }

    SECTION("no common transfer syntax") {
        CHECK(contexts[1].result ==
              presentation_context_result::transfer_syntaxes_not_supported);
    }

    SECTION("still accepts the remaining context") {
        CHECK(contexts[2].is_accepted());
        CHECK(result.value().any_accepted());
    }

    SECTION("A-ASSOCIATE-AC items mirror the contexts") {
        auto items = result.value().to_ac_items();
        REQUIRE(items.size() == 3);
        CHECK(items[0].result == presentation_context_result::abstract_syntax_not_supported);
        CHECK(items[2].transfer_syntax == ts_b);
    }
}

TEST_CASE("negotiate with nothing acceptable", "[network][negotiator]") {
    presentation_negotiator negotiator({{verification, {ts_b}}});
    auto result = negotiator.negotiate({{1, ct_storage, {ts_b}}});
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value().any_accepted());
}

TEST_CASE("negotiate validates the proposal", "[network][negotiator]") {
    presentation_negotiator negotiator({{verification, {ts_b}}});

    SECTION("even context id") {
        auto result = negotiator.negotiate({{2, verification, {ts_b}}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_context_id);
    }

    SECTION("duplicate context id") {
        auto result = negotiator.negotiate({{1, verification, {ts_b}},
                                            {1, verification, {ts_b}}});
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_context_id);
    }

    SECTION("more than 128 contexts") {
        std::vector<presentation_context_rq> proposed;
        for (int i = 0; i < 129; ++i) {
            proposed.emplace_back(static_cast<uint8_t>((2 * i + 1) & 0xFF), verification,
                                  std::vector<std::string>{ts_b});
        }
        auto result = negotiator.negotiate(proposed);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::context_limit_exceeded);
    }
}

TEST_CASE("negotiate intersects SCP/SCU roles", "[network][negotiator]") {
    presentation_negotiator negotiator({{ct_storage, {ts_b}, false, true},
                                        {verification, {ts_b}, true, false}});

    SECTION("requestor asks for SCP on a storage class") {
        auto result = negotiator.negotiate({{1, ct_storage, {ts_b}}},
                                           {{ct_storage, true, true}});
        REQUIRE(result.is_ok());
        const auto& ctx = result.value().contexts[0];
        CHECK(ctx.is_accepted());
        CHECK_FALSE(ctx.requestor_scu);
        CHECK(ctx.requestor_scp);

        REQUIRE(result.value().role_replies.size() == 1);
        CHECK(result.value().role_replies[0] == scp_scu_role_selection(ct_storage, false, true));
    }

    SECTION("empty intersection rejects the context") {
        auto result = negotiator.negotiate({{1, verification, {ts_b}}},
                                           {{verification, false, true}});
        REQUIRE(result.is_ok());
        CHECK(result.value().contexts[0].result == presentation_context_result::user_rejection);
        CHECK(result.value().role_replies.empty());
    }

    SECTION("without a role item the default roles apply") {
        auto result = negotiator.negotiate({{1, ct_storage, {ts_b}}});
        REQUIRE(result.is_ok());
        CHECK(result.value().contexts[0].requestor_scu);
        CHECK_FALSE(result.value().contexts[0].requestor_scp);
    }
}

TEST_CASE("validate_response checks the acceptor's answer", "[network][negotiator]") {
    std::vector<presentation_context_rq> proposed{{1, verification, {ts_a, ts_b}},
                                                  {3, ct_storage, {ts_b}}};
    associate_ac ac;

    SECTION("valid answer with one unanswered context") {
        ac.presentation_contexts.emplace_back(1, presentation_context_result::acceptance, ts_b);
        auto result = presentation_negotiator::validate_response(proposed, {}, ac);
        REQUIRE(result.is_ok());
        REQUIRE(result.value().size() == 2);
        CHECK(result.value()[0].transfer_syntax == ts_b);
        CHECK(result.value()[1].result == presentation_context_result::no_reason);
    }

    SECTION("unproposed context id") {
        ac.presentation_contexts.emplace_back(5, presentation_context_result::acceptance, ts_b);
        auto result = presentation_negotiator::validate_response(proposed, {}, ac);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::negotiation_failed);
    }

    SECTION("unproposed transfer syntax") {
        ac.presentation_contexts.emplace_back(3, presentation_context_result::acceptance, ts_a);
        CHECK(presentation_negotiator::validate_response(proposed, {}, ac).is_err());
    }

    SECTION("widened role") {
        ac.presentation_contexts.emplace_back(3, presentation_context_result::acceptance, ts_b);
        ac.user_info.role_selections.emplace_back(ct_storage, true, true);
        CHECK(presentation_negotiator::validate_response(
                  proposed, {{ct_storage, false, true}}, ac).is_err());
    }

    SECTION("role reply sets the requestor roles") {
        ac.presentation_contexts.emplace_back(3, presentation_context_result::acceptance, ts_b);
        ac.user_info.role_selections.emplace_back(ct_storage, false, true);
        auto result = presentation_negotiator::validate_response(
            proposed, {{ct_storage, true, true}}, ac);
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value()[1].requestor_scu);
        CHECK(result.value()[1].requestor_scp);
    }
}
