/**
 * @file retrieve_scp_test.cpp
 * @brief Unit tests for the Retrieve SCP service (C-MOVE/C-GET)
 */

#include <dul/core/uid_registry.hpp>
#include <dul/network/dicom_server.hpp>
#include <dul/network/dimse/status_codes.hpp>
#include <dul/services/dimse_scu.hpp>
#include <dul/services/retrieve_scp.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>

using namespace dul;
using namespace dul::services;
using namespace dul::network;
using namespace dul::network::dimse;
using namespace std::chrono_literals;

namespace {

constexpr uint16_t TEST_PORT_BASE = 41600;

std::atomic<uint16_t> port_counter{0};

uint16_t get_test_port() {
    return TEST_PORT_BASE + port_counter.fetch_add(1);
}

bool contains(const std::vector<std::string>& uids, std::string_view uid) {
    return std::find(uids.begin(), uids.end(), uid) != uids.end();
}

const std::vector<uint8_t> any_study{0x0D, 0x00, 0x20, 0x00, 0x02, 0x00, 0x00, 0x00, '*', ' '};

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("retrieve_scp construction", "[services][retrieve]") {
    retrieve_scp scp;

    CHECK(scp.service_name() == "Retrieve SCP");
    CHECK(scp.move_operations() == 0);
    CHECK(scp.get_operations() == 0);
    CHECK(scp.images_transferred() == 0);

    SECTION("supports the retrieve information models") {
        auto classes = scp.supported_sop_classes();
        CHECK(classes.size() == 4);
        CHECK(contains(classes, core::uids::patient_root_move));
        CHECK(contains(classes, core::uids::study_root_move));
        CHECK(contains(classes, core::uids::patient_root_get));
        CHECK(contains(classes, core::uids::study_root_get));
        CHECK_FALSE(contains(classes, core::uids::study_root_find));
    }

    SECTION("storage classes are not served directly") {
        CHECK_FALSE(scp.supports_sop_class(core::uids::ct_image_storage));
    }
}

// ============================================================================
// Presentation contexts
// ============================================================================

TEST_CASE("retrieve_scp presentation contexts", "[services][retrieve]") {
    retrieve_scp scp;
    const std::vector<std::string> syntaxes{std::string(core::uids::implicit_vr_little_endian)};

    SECTION("storage classes are offered with the requestor as SCP") {
        auto contexts = scp.presentation_contexts(syntaxes);
        auto ct = std::find_if(contexts.begin(), contexts.end(), [](const auto& c) {
            return c.abstract_syntax == core::uids::ct_image_storage;
        });
        REQUIRE(ct != contexts.end());
        CHECK_FALSE(ct->scu_role);
        CHECK(ct->scp_role);

        auto move = std::find_if(contexts.begin(), contexts.end(), [](const auto& c) {
            return c.abstract_syntax == core::uids::study_root_move;
        });
        REQUIRE(move != contexts.end());
        CHECK(move->scu_role);
        CHECK_FALSE(move->scp_role);
        CHECK(move->transfer_syntaxes == syntaxes);
    }

    SECTION("storage classes can be replaced") {
        scp.set_storage_sop_classes({std::string(core::uids::mr_image_storage)});
        auto contexts = scp.presentation_contexts(syntaxes);
        CHECK(contexts.size() == 5);
        CHECK(std::none_of(contexts.begin(), contexts.end(), [](const auto& c) {
            return c.abstract_syntax == core::uids::ct_image_storage;
        }));
    }
}

// ============================================================================
// Completion status
// ============================================================================

TEST_CASE("retrieve_scp completion status", "[services][retrieve]") {
    SECTION("all completed") {
        CHECK(retrieve_scp::completion_status({0, 3, 0, 0}) == status_success);
    }

    SECTION("nothing to transfer") {
        CHECK(retrieve_scp::completion_status({}) == status_success);
    }

    SECTION("some failed") {
        CHECK(retrieve_scp::completion_status({0, 2, 1, 0}) ==
              status_warning_subops_complete_failures);
    }

    SECTION("warnings only") {
        CHECK(retrieve_scp::completion_status({0, 0, 0, 2}) ==
              status_warning_subops_complete_failures);
    }

    SECTION("all failed") {
        auto status = retrieve_scp::completion_status({0, 0, 4, 0});
        CHECK(status == status_refused_out_of_resources_subops);
        CHECK(is_failure(status));
    }
}

TEST_CASE("retrieve_scp statistics reset", "[services][retrieve]") {
    retrieve_scp scp;
    scp.reset_statistics();
    CHECK(scp.move_operations() == 0);
    CHECK(scp.images_transferred() == 0);
}

// ============================================================================
// Sub-operation limits
// ============================================================================

TEST_CASE("retrieve_scp refuses more matches than the counters can hold",
          "[services][retrieve][loopback]") {
    const std::string implicit_le(core::uids::implicit_vr_little_endian);

    server_config config("ARCHIVE", get_test_port());
    config.transfer_syntaxes = {implicit_le};
    dicom_server server(config);

    std::atomic<int> lookups{0};
    std::atomic<int> resolved{0};
    auto scp = std::make_shared<retrieve_scp>();
    scp->set_retrieve_handler([&](const request_context&) -> Result<std::vector<retrieve_item>> {
        lookups++;
        retrieve_item item;
        item.sop_class_uid = std::string(core::uids::ct_image_storage);
        item.sop_instance_uid = "1.2.3";
        item.transfer_syntax = implicit_le;
        return std::vector<retrieve_item>(65536, item);
    });
    scp->set_destination_resolver([&](const std::string&) -> std::optional<retrieve_destination> {
        resolved++;
        return retrieve_destination{"127.0.0.1", 1};
    });
    REQUIRE(server.register_service(scp).is_ok());
    REQUIRE(server.start().is_ok());

    association_config client;
    client.calling_ae_title = "VIEWER";
    client.called_ae_title = "ARCHIVE";
    client.proposed_contexts.emplace_back(1, std::string(core::uids::study_root_get),
                                          std::vector<std::string>{implicit_le});
    client.proposed_contexts.emplace_back(3, std::string(core::uids::study_root_move),
                                          std::vector<std::string>{implicit_le});
    client.proposed_contexts.emplace_back(5, std::string(core::uids::ct_image_storage),
                                          std::vector<std::string>{implicit_le});
    client.extended.role_selections.emplace_back(std::string(core::uids::ct_image_storage),
                                                 false, true);
    client.timeouts.dimse = 5000ms;
    auto assoc = association::connect("127.0.0.1", server.port(), client);
    REQUIRE(assoc.is_ok());

    dimse_scu scu;

    SECTION("C-GET sends no sub-operations") {
        std::atomic<int> stores{0};
        auto result = scu.get(*assoc.value(), core::uids::study_root_get, any_study,
                              [&](const dimse_message&, std::string_view) {
                                  stores++;
                                  return status_success;
                              });
        REQUIRE(result.is_ok());
        CHECK(result.value().status == status_refused_out_of_resources_matches);
        CHECK(stores.load() == 0);
        CHECK(scp->images_transferred() == 0);
    }

    SECTION("C-MOVE never opens a sub-association") {
        auto result = scu.move(*assoc.value(), core::uids::study_root_move, "DEST", any_study);
        REQUIRE(result.is_ok());
        CHECK(result.value().status == status_refused_out_of_resources_matches);
        CHECK(resolved.load() == 1);
        CHECK(scp->images_transferred() == 0);
    }

    CHECK(lookups.load() == 1);
    REQUIRE(assoc.value()->release().is_ok());
    server.stop();
}
