/**
 * @file association_test.cpp
 * @brief Loopback tests for association establishment, data transfer,
 *        release and abort
 */

#include <catch2/catch_test_macros.hpp>

#include "dul/integration/logger_adapter.hpp"
#include "dul/network/association.hpp"
#include "dul/network/dimse/dimse_message.hpp"
#include "dul/network/dimse/status_codes.hpp"
#include "dul/network/pdu_decoder.hpp"
#include "dul/network/pdu_encoder.hpp"
#include "dul/network/pdu_framer.hpp"
#include "dul/network/transport.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>
#include <thread>

using namespace dul;
using namespace dul::network;
using namespace std::chrono_literals;

namespace {

constexpr const char* verification = "1.2.840.10008.1.1";
constexpr const char* implicit_le = "1.2.840.10008.1.2";

constexpr uint16_t TEST_PORT_BASE = 41300;

// Each listener in this file binds its own port
std::atomic<uint16_t> port_counter{0};

uint16_t get_test_port() {
    return TEST_PORT_BASE + port_counter.fetch_add(1);
}

association_config modality_config() {
    association_config config;
    config.calling_ae_title = "MODALITY";
    config.called_ae_title = "ARCHIVE";
    config.proposed_contexts.emplace_back(1, verification,
                                          std::vector<std::string>{implicit_le});
    config.timeouts.acse = 2000ms;
    config.timeouts.dimse = 2000ms;
    config.timeouts.artim = 1000ms;
    return config;
}

acceptor_config archive_config() {
    acceptor_config config;
    config.ae_title = "ARCHIVE";
    config.supported_contexts.emplace_back(verification, std::vector<std::string>{implicit_le});
    config.timeouts.acse = 2000ms;
    config.timeouts.dimse = 2000ms;
    config.timeouts.artim = 1000ms;
    return config;
}

/// Accepts one connection on a background thread and runs the acceptor side
struct loopback_acceptor {
    tcp_listener listener;
    std::future<Result<std::unique_ptr<association>>> pending;

    explicit loopback_acceptor(acceptor_config config,
                               std::optional<associate_rj> forced = std::nullopt) {
        REQUIRE(listener.listen(get_test_port()).is_ok());
        pending = std::async(std::launch::async,
                             [this, config = std::move(config), forced]()
                                 -> Result<std::unique_ptr<association>> {
                                 auto transport = listener.accept(3000ms);
                                 if (transport.is_err()) {
                                     return transport.error();
                                 }
                                 if (!transport.value()) {
                                     return dul_error<std::unique_ptr<association>>(
                                         error_codes::connection_timeout, "no connection");
                                 }
                                 return association::accept(std::move(transport.value()),
                                                            config, nullptr, forced);
                             });
    }

    [[nodiscard]] auto port() const -> uint16_t { return listener.local_port(); }
};

/// Peer that answers with hand-built PDUs on one accepted connection
struct raw_peer {
    tcp_listener listener;
    std::unique_ptr<tcp_transport> transport;
    pdu_framer framer;

    raw_peer() { REQUIRE(listener.listen(get_test_port()).is_ok()); }

    [[nodiscard]] auto port() const -> uint16_t { return listener.local_port(); }

    bool accept_connection() {
        auto accepted = listener.accept(3000ms);
        if (accepted.is_err() || !accepted.value()) {
            return false;
        }
        transport = std::move(accepted.value());
        return true;
    }

    auto read_pdu() -> Result<pdu> {
        std::array<uint8_t, 4096> buffer{};
        for (;;) {
            auto frame = framer.next_frame();
            if (frame.is_err()) {
                return frame.error();
            }
            if (frame.value()) {
                return pdu_decoder::decode(*frame.value());
            }
            auto got = transport->receive_some(buffer, 2000ms);
            if (got.is_err()) {
                return got.error();
            }
            framer.feed(std::span<const uint8_t>(buffer.data(), got.value()));
        }
    }

    /// Read the A-ASSOCIATE-RQ and accept context 1 with Implicit VR LE
    bool accept_association() {
        auto rq = read_pdu();
        if (rq.is_err() || type_of(rq.value()) != pdu_type::associate_rq) {
            return false;
        }
        associate_ac ac;
        ac.called_ae_title = "ARCHIVE";
        ac.calling_ae_title = "MODALITY";
        ac.application_context = std::string(dicom_application_context);
        presentation_context_ac accepted;
        accepted.id = 1;
        accepted.result = presentation_context_result::acceptance;
        accepted.transfer_syntax = implicit_le;
        ac.presentation_contexts.push_back(accepted);
        ac.user_info.max_pdu_length = 16384;
        ac.user_info.implementation_class_uid = "1.2.826.0.1.3680043.2.1545.1";
        auto encoded = pdu_encoder::encode_associate_ac(ac);
        return encoded.is_ok() && transport->send_all(encoded.value()).is_ok();
    }
};

}  // namespace

// ============================================================================
// Establishment
// ============================================================================

TEST_CASE("association establishes over loopback", "[network][association]") {
    loopback_acceptor acceptor(archive_config());

    auto requestor = association::connect("127.0.0.1", acceptor.port(), modality_config());
    REQUIRE(requestor.is_ok());
    auto accepted = acceptor.pending.get();
    REQUIRE(accepted.is_ok());

    auto& scu = *requestor.value();
    auto& scp = *accepted.value();

    CHECK(scu.is_established());
    CHECK(scp.is_established());
    CHECK(scu.state() == ul_state::sta6);
    CHECK(scu.role() == association_role::requestor);
    CHECK(scp.role() == association_role::acceptor);
    CHECK(scu.peer_ae() == "ARCHIVE");
    CHECK(scp.peer_ae() == "MODALITY");

    auto ctx = scu.accepted_context_id(verification);
    REQUIRE(ctx.has_value());
    CHECK(*ctx == 1);
    CHECK(scu.transfer_syntax_of(1) == std::string{implicit_le});
    CHECK(scp.transfer_syntax_of(1) == std::string{implicit_le});
    CHECK_FALSE(scu.transfer_syntax_of(3).has_value());

    scu.abort();
    CHECK(scu.is_closed());
}

TEST_CASE("association rejected by called AE title", "[network][association]") {
    auto config = archive_config();
    config.ae_title = "OTHER";
    loopback_acceptor acceptor(config);

    auto requestor = association::connect("127.0.0.1", acceptor.port(), modality_config());
    REQUIRE(requestor.is_err());
    CHECK(requestor.error().code == error_codes::association_rejected);

    auto accepted = acceptor.pending.get();
    REQUIRE(accepted.is_err());
    CHECK(accepted.error().code == error_codes::association_rejected);
}

TEST_CASE("association forced rejection is returned to the requestor", "[network][association]") {
    associate_rj limit{reject_result::rejected_transient,
                       static_cast<uint8_t>(reject_source::service_provider_presentation),
                       static_cast<uint8_t>(
                           reject_reason_provider_presentation::local_limit_exceeded)};
    loopback_acceptor acceptor(archive_config(), limit);

    auto requestor = association::connect("127.0.0.1", acceptor.port(), modality_config());
    REQUIRE(requestor.is_err());
    CHECK(requestor.error().code == error_codes::association_rejected);

    auto accepted = acceptor.pending.get();
    REQUIRE(accepted.is_err());
    CHECK(accepted.error().code == error_codes::association_rejected);
}

TEST_CASE("association without a common context", "[network][association]") {
    auto config = archive_config();
    config.supported_contexts.clear();
    config.supported_contexts.emplace_back("1.2.840.10008.5.1.4.1.1.2",
                                           std::vector<std::string>{implicit_le});
    loopback_acceptor acceptor(config);

    auto requestor = association::connect("127.0.0.1", acceptor.port(), modality_config());
    REQUIRE(requestor.is_err());
    // The acceptor rejects when no context survives negotiation
    CHECK(requestor.error().code == error_codes::association_rejected);
    (void)acceptor.pending.get();
}

TEST_CASE("association ARTIM expires without a request", "[network][association]") {
    auto config = archive_config();
    config.timeouts.artim = 200ms;
    loopback_acceptor acceptor(config);

    auto silent = tcp_transport::connect("127.0.0.1", acceptor.port(), 2000ms);
    REQUIRE(silent.is_ok());

    auto accepted = acceptor.pending.get();
    REQUIRE(accepted.is_err());
    CHECK(accepted.error().code == error_codes::artim_timeout);
}

// ============================================================================
// Data Transfer and Release
// ============================================================================

TEST_CASE("association C-ECHO round trip and release", "[network][association]") {
    loopback_acceptor acceptor(archive_config());

    auto requestor = association::connect("127.0.0.1", acceptor.port(), modality_config());
    REQUIRE(requestor.is_ok());
    auto accepted = acceptor.pending.get();
    REQUIRE(accepted.is_ok());

    auto& scu = *requestor.value();
    auto scp = std::move(accepted.value());

    auto server = std::async(std::launch::async, [&scp]() -> int {
        auto rq = scp->receive_dimse(2000ms);
        if (rq.is_err()) {
            return rq.error().code;
        }
        auto rsp = dimse::make_response_for(rq.value().message, dimse::status_success);
        if (scp->send_dimse(rq.value().context_id, rsp).is_err()) {
            return -1;
        }
        auto next = scp->receive_dimse(2000ms);
        return next.is_err() ? next.error().code : 0;
    });

    const auto message_id = scu.next_message_id();
    REQUIRE(scu.send_dimse(1, dimse::make_c_echo_rq(message_id)).is_ok());

    auto rsp = scu.receive_response(message_id, 2000ms);
    REQUIRE(rsp.is_ok());
    CHECK(rsp.value().message.command() == dimse::command_field::c_echo_rsp);
    CHECK(rsp.value().message.status() == dimse::status_success);
    CHECK(rsp.value().message.message_id_responded_to() == message_id);

    auto released = scu.release();
    REQUIRE(released.is_ok());
    CHECK(scu.state() == ul_state::released);
    CHECK(scu.bytes_sent() > 0);

    CHECK(server.get() == error_codes::already_released);
    CHECK(scp->is_closed());
}

TEST_CASE("association send on an unknown context", "[network][association]") {
    loopback_acceptor acceptor(archive_config());
    auto requestor = association::connect("127.0.0.1", acceptor.port(), modality_config());
    REQUIRE(requestor.is_ok());
    auto accepted = acceptor.pending.get();
    REQUIRE(accepted.is_ok());

    auto result = requestor.value()->send_dimse(5, dimse::make_c_echo_rq(1));
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_context_id);
    CHECK(requestor.value()->is_established());

    requestor.value()->abort();
}

TEST_CASE("association DIMSE timeout aborts", "[network][association]") {
    loopback_acceptor acceptor(archive_config());
    auto requestor = association::connect("127.0.0.1", acceptor.port(), modality_config());
    REQUIRE(requestor.is_ok());
    auto accepted = acceptor.pending.get();
    REQUIRE(accepted.is_ok());

    auto& scu = *requestor.value();
    REQUIRE(scu.send_dimse(1, dimse::make_c_echo_rq(scu.next_message_id())).is_ok());

    // The acceptor never answers
    auto rsp = scu.receive_dimse(200ms);
    REQUIRE(rsp.is_err());
    CHECK(rsp.error().code == error_codes::dimse_timeout);
    CHECK(scu.state() == ul_state::aborted);

    SECTION("the peer sees the abort after the queued request") {
        auto& scp = *accepted.value();
        auto rq = scp.receive_dimse(2000ms);
        REQUIRE(rq.is_ok());
        CHECK(rq.value().message.command() == dimse::command_field::c_echo_rq);

        auto next = scp.receive_dimse(2000ms);
        REQUIRE(next.is_err());
        CHECK(next.error().code == error_codes::association_aborted);
        CHECK(scp.peer_abort().has_value());
    }

    SECTION("further sends are refused") {
        auto again = scu.send_dimse(1, dimse::make_c_echo_rq(2));
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::association_not_established);
    }
}

TEST_CASE("association release collision", "[network][association]") {
    loopback_acceptor acceptor(archive_config());
    auto requestor = association::connect("127.0.0.1", acceptor.port(), modality_config());
    REQUIRE(requestor.is_ok());
    auto accepted = acceptor.pending.get();
    REQUIRE(accepted.is_ok());

    auto scp = std::move(accepted.value());

    // Both sides send A-RELEASE-RQ before reading, so each one sees the
    // other's request while awaiting A-RELEASE-RP.
    auto acceptor_side = std::async(std::launch::async, [&scp] { return scp->release(); });
    auto requestor_result = requestor.value()->release();
    auto acceptor_result = acceptor_side.get();

    CHECK(requestor_result.is_ok());
    CHECK(acceptor_result.is_ok());
    CHECK(requestor.value()->state() == ul_state::released);
    CHECK(scp->state() == ul_state::released);
}

TEST_CASE("association local abort reaches the peer", "[network][association]") {
    loopback_acceptor acceptor(archive_config());
    auto requestor = association::connect("127.0.0.1", acceptor.port(), modality_config());
    REQUIRE(requestor.is_ok());
    auto accepted = acceptor.pending.get();
    REQUIRE(accepted.is_ok());

    requestor.value()->abort(abort_reason::not_specified);
    CHECK(requestor.value()->state() == ul_state::aborted);

    auto& scp = *accepted.value();
    auto result = scp.receive_dimse(2000ms);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::association_aborted);
    REQUIRE(scp.peer_abort().has_value());
    CHECK(scp.peer_abort()->source == abort_source::service_user);

    SECTION("release after abort is refused") {
        auto released = requestor.value()->release();
        CHECK(released.is_err());
    }
}

TEST_CASE("association release aborts on a misordered data fragment",
          "[network][association][release]") {
    raw_peer peer;

    // The peer answers A-RELEASE-RQ with a data set fragment for which no
    // command was ever sent
    auto peer_side = std::async(std::launch::async, [&peer]() -> std::optional<abort_pdu> {
        if (!peer.accept_connection() || !peer.accept_association()) {
            return std::nullopt;
        }
        auto release_request = peer.read_pdu();
        if (release_request.is_err() ||
            type_of(release_request.value()) != pdu_type::release_rq) {
            return std::nullopt;
        }
        presentation_data_value stray{1, false, false, {0x08, 0x00, 0x16, 0x00}};
        auto encoded = pdu_encoder::encode_p_data_tf(stray);
        if (encoded.is_err() || peer.transport->send_all(encoded.value()).is_err()) {
            return std::nullopt;
        }
        auto answer = peer.read_pdu();
        if (answer.is_err() || type_of(answer.value()) != pdu_type::abort) {
            return std::nullopt;
        }
        return std::get<abort_pdu>(answer.value());
    });

    auto requestor = association::connect("127.0.0.1", peer.port(), modality_config());
    REQUIRE(requestor.is_ok());

    auto released = requestor.value()->release();
    REQUIRE(released.is_err());
    CHECK(released.error().code == error_codes::protocol_violation);
    CHECK(requestor.value()->state() == ul_state::aborted);

    auto abort = peer_side.get();
    REQUIRE(abort.has_value());
    CHECK(abort->source == abort_source::service_provider);
    CHECK(abort->reason == abort_reason::invalid_pdu_parameter);
}

TEST_CASE("association idle beyond the network timeout aborts", "[network][association]") {
    auto config = archive_config();
    config.timeouts.network = 200ms;
    loopback_acceptor acceptor(config);

    auto requestor = association::connect("127.0.0.1", acceptor.port(), modality_config());
    REQUIRE(requestor.is_ok());
    auto accepted = acceptor.pending.get();
    REQUIRE(accepted.is_ok());

    auto& scp = *accepted.value();
    auto start = std::chrono::steady_clock::now();
    auto idle = scp.next_message();
    REQUIRE(idle.is_err());
    CHECK(idle.error().code == error_codes::network_timeout);
    CHECK(std::chrono::steady_clock::now() - start >= 150ms);
    CHECK(scp.state() == ul_state::aborted);

    // The requestor sees the A-ABORT sent on expiry
    auto seen = requestor.value()->receive_dimse(2000ms);
    REQUIRE(seen.is_err());
    CHECK(seen.error().code == error_codes::association_aborted);
}

TEST_CASE("association lifecycle lands in the audit trail", "[network][association][audit]") {
    using integration::logger_adapter;

    const auto dir = std::filesystem::temp_directory_path() / "dul_association_audit";
    std::filesystem::remove_all(dir);
    integration::logger_config logging;
    logging.log_directory = dir;
    logging.enable_console = false;
    logging.enable_file = false;
    logging.audit_file = dir / "audit.jsonl";
    logging.async_mode = false;
    logger_adapter::initialize(logging);

    {
        loopback_acceptor acceptor(archive_config());
        auto requestor =
            association::connect("127.0.0.1", acceptor.port(), modality_config());
        REQUIRE(requestor.is_ok());
        auto accepted = acceptor.pending.get();
        REQUIRE(accepted.is_ok());

        auto scp = std::move(accepted.value());
        auto acceptor_side = std::async(std::launch::async, [&scp] {
            return scp->receive_dimse(2000ms);
        });
        REQUIRE(requestor.value()->release().is_ok());
        auto seen = acceptor_side.get();
        REQUIRE(seen.is_err());
        CHECK(seen.error().code == error_codes::already_released);
    }
    logger_adapter::shutdown();

    std::vector<std::string> lines;
    std::ifstream in(dir / "audit.jsonl");
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    std::filesystem::remove_all(dir);

    auto count = [&lines](std::string_view needle) {
        return std::count_if(lines.begin(), lines.end(), [needle](const std::string& line) {
            return line.find(needle) != std::string::npos;
        });
    };
    // One entry per side of the association
    CHECK(count("ASSOCIATION_ESTABLISHED") == 2);
    CHECK(count("ASSOCIATION_RELEASED") == 2);
    CHECK(count("\"calling_ae\":\"MODALITY\"") == 4);
}
