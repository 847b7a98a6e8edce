/**
 * @file acse_test.cpp
 * @brief Tests for A-ASSOCIATE evaluation and interpretation
 */

#include <catch2/catch_test_macros.hpp>

#include "dul/network/acse.hpp"

using namespace dul;
using namespace dul::network;

namespace {

constexpr const char* verification = "1.2.840.10008.1.1";
constexpr const char* ct_storage = "1.2.840.10008.5.1.4.1.1.2";
constexpr const char* implicit_le = "1.2.840.10008.1.2";

association_config requestor_config() {
    association_config config;
    config.calling_ae_title = "MODALITY";
    config.called_ae_title = "ARCHIVE";
    config.proposed_contexts.emplace_back(1, verification,
                                          std::vector<std::string>{implicit_le});
    config.max_pdu_length = 32768;
    return config;
}

acceptor_config archive_config() {
    acceptor_config config;
    config.ae_title = "ARCHIVE";
    config.supported_contexts.emplace_back(verification, std::vector<std::string>{implicit_le});
    config.max_pdu_length = 65536;
    return config;
}

const associate_rj& rejection(const association_decision& decision) {
    return std::get<associate_rj>(decision.response);
}

}  // namespace

TEST_CASE("acse::request builds the A-ASSOCIATE-RQ", "[network][acse]") {
    auto config = requestor_config();
    config.implementation_class_uid.clear();
    config.extended.async_operations = async_operations_window{2, 2};

    auto rq = acse::request(config);
    CHECK(rq.protocol_version == dicom_protocol_version);
    CHECK(rq.calling_ae_title == "MODALITY");
    CHECK(rq.called_ae_title == "ARCHIVE");
    CHECK(rq.application_context == dicom_application_context);
    CHECK(rq.presentation_contexts == config.proposed_contexts);
    CHECK(rq.user_info.max_pdu_length == 32768);
    CHECK(rq.user_info.implementation_class_uid == default_implementation_class_uid);
    REQUIRE(rq.user_info.async_operations.has_value());
    CHECK(rq.user_info.async_operations->max_operations_invoked == 2);
}

TEST_CASE("acse::evaluate accepts a valid request", "[network][acse]") {
    auto rq = acse::request(requestor_config());
    auto decision = acse::evaluate(rq, archive_config());

    REQUIRE(decision.accepted());
    CHECK(decision.reason.empty());

    const auto& ac = std::get<associate_ac>(decision.response);
    CHECK(ac.called_ae_title == "ARCHIVE");
    CHECK(ac.calling_ae_title == "MODALITY");
    CHECK(ac.user_info.max_pdu_length == 65536);
    REQUIRE(ac.presentation_contexts.size() == 1);
    CHECK(ac.presentation_contexts[0].result == presentation_context_result::acceptance);

    CHECK(decision.params.peer_max_pdu_length == 32768);
    CHECK(decision.params.accepted_context_id(verification) == uint8_t{1});
    CHECK_FALSE(decision.params.accepted_context_id(ct_storage).has_value());
    CHECK_FALSE(ac.user_info.async_operations.has_value());
}

TEST_CASE("acse::evaluate rejection triples", "[network][acse]") {
    auto rq = acse::request(requestor_config());
    auto config = archive_config();

    SECTION("unsupported protocol version") {
        rq.protocol_version = 0x0002;
        auto decision = acse::evaluate(rq, config);
        REQUIRE_FALSE(decision.accepted());
        CHECK(rejection(decision) ==
              associate_rj(reject_result::rejected_permanent, 2, 2));
    }

    SECTION("unknown application context") {
        rq.application_context = "1.2.3.4";
        auto decision = acse::evaluate(rq, config);
        REQUIRE_FALSE(decision.accepted());
        CHECK(rejection(decision) ==
              associate_rj(reject_result::rejected_permanent, 1, 2));
    }

    SECTION("wrong called AE title") {
        rq.called_ae_title = "OTHER";
        auto decision = acse::evaluate(rq, config);
        REQUIRE_FALSE(decision.accepted());
        CHECK(rejection(decision) ==
              associate_rj(reject_result::rejected_permanent, 1, 7));
        CHECK_FALSE(decision.reason.empty());
    }

    SECTION("called AE check can be disabled") {
        rq.called_ae_title = "OTHER";
        config.check_called_ae = false;
        CHECK(acse::evaluate(rq, config).accepted());
    }

    SECTION("calling AE outside the whitelist") {
        config.calling_ae_whitelist = {"CT_01", "MR_01"};
        auto decision = acse::evaluate(rq, config);
        REQUIRE_FALSE(decision.accepted());
        CHECK(rejection(decision) ==
              associate_rj(reject_result::rejected_permanent, 1, 3));

        config.calling_ae_whitelist.push_back("MODALITY");
        CHECK(acse::evaluate(rq, config).accepted());
    }

    SECTION("no acceptable presentation context") {
        rq.presentation_contexts[0].abstract_syntax = ct_storage;
        auto decision = acse::evaluate(rq, config);
        REQUIRE_FALSE(decision.accepted());
        CHECK(rejection(decision) ==
              associate_rj(reject_result::rejected_permanent, 1, 1));
    }

    SECTION("even presentation context id") {
        rq.presentation_contexts[0].id = 4;
        CHECK_FALSE(acse::evaluate(rq, config).accepted());
    }
}

TEST_CASE("acse::limit_exceeded is transient", "[network][acse]") {
    auto rj = acse::limit_exceeded();
    CHECK(rj.result == reject_result::rejected_transient);
    CHECK(rj.source == 3);
    CHECK(rj.reason == 2);

    rejection_info info(rj);
    CHECK(info.is_transient());
    CHECK_FALSE(info.description.empty());
}

TEST_CASE("acse::evaluate extended negotiation", "[network][acse]") {
    auto requestor = requestor_config();
    auto config = archive_config();

    SECTION("asynchronous operations window is answered with the acceptor's") {
        requestor.extended.async_operations = async_operations_window{8, 8};
        config.async_window = async_operations_window{1, 1};
        auto decision = acse::evaluate(acse::request(requestor), config);
        REQUIRE(decision.accepted());
        const auto& ac = std::get<associate_ac>(decision.response);
        REQUIRE(ac.user_info.async_operations.has_value());
        CHECK(ac.user_info.async_operations->max_operations_invoked == 1);
        CHECK(decision.params.async_operations == ac.user_info.async_operations);
    }

    SECTION("SOP class extended items echo only what the policy returns") {
        requestor.extended.sop_class_extended.push_back({verification, {0x01}});
        requestor.extended.sop_class_extended.push_back({ct_storage, {0x02}});
        config.sop_class_extended_policy = [](const sop_class_extended_negotiation& item)
            -> std::optional<std::vector<uint8_t>> {
            if (item.sop_class_uid == verification) {
                return std::vector<uint8_t>{0x00};
            }
            return std::nullopt;
        };
        auto decision = acse::evaluate(acse::request(requestor), config);
        REQUIRE(decision.accepted());
        const auto& ac = std::get<associate_ac>(decision.response);
        REQUIRE(ac.user_info.sop_class_extended.size() == 1);
        CHECK(ac.user_info.sop_class_extended[0].sop_class_uid == verification);
    }

    SECTION("user identity with a positive response") {
        requestor.extended.user_identity =
            user_identity_rq{user_identity_type::username_and_passcode, true, "alice", "pw"};
        config.user_identity_policy = [](const user_identity_rq& id) {
            return user_identity_decision{id.primary_field == "alice", "welcome"};
        };

        auto decision = acse::evaluate(acse::request(requestor), config);
        REQUIRE(decision.accepted());
        const auto& ac = std::get<associate_ac>(decision.response);
        REQUIRE(ac.user_info.user_identity_response.has_value());
        CHECK(ac.user_info.user_identity_response->server_response == "welcome");
        REQUIRE(decision.params.user_identity.has_value());
        CHECK(decision.params.user_identity->primary_field == "alice");

        requestor.extended.user_identity->primary_field = "mallory";
        auto refused = acse::evaluate(acse::request(requestor), config);
        REQUIRE_FALSE(refused.accepted());
        CHECK(rejection(refused).result == reject_result::rejected_transient);
        CHECK(rejection(refused).source ==
              static_cast<uint8_t>(reject_source::service_provider_acse));
        CHECK(rejection(refused).reason ==
              static_cast<uint8_t>(reject_reason_provider_acse::no_reason));
    }
}

TEST_CASE("acse::interpret_accept", "[network][acse]") {
    auto requestor = requestor_config();
    auto rq = acse::request(requestor);
    auto decision = acse::evaluate(rq, archive_config());
    REQUIRE(decision.accepted());
    auto ac = std::get<associate_ac>(decision.response);

    SECTION("accepted contexts and peer parameters") {
        auto params = acse::interpret_accept(rq, ac);
        REQUIRE(params.is_ok());
        CHECK(params.value().peer_max_pdu_length == 65536);
        CHECK(params.value().accepted_context_id(verification, implicit_le) == uint8_t{1});
        CHECK(params.value().any_accepted());
        REQUIRE(params.value().find_context(1) != nullptr);
        CHECK(params.value().find_context(3) == nullptr);
    }

    SECTION("identity response without a request is a negotiation failure") {
        ac.user_info.user_identity_response = user_identity_ac{"unexpected"};
        auto params = acse::interpret_accept(rq, ac);
        REQUIRE(params.is_err());
        CHECK(params.error().code == error_codes::negotiation_failed);
    }

    SECTION("answer for an unproposed context") {
        ac.presentation_contexts[0].id = 9;
        CHECK(acse::interpret_accept(rq, ac).is_err());
    }
}
