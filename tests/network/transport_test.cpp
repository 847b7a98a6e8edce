/**
 * @file transport_test.cpp
 * @brief Loopback tests for tcp_transport and tcp_listener
 */

#include <catch2/catch_test_macros.hpp>

#include "dul/network/transport.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <thread>

using namespace dul;
using namespace dul::network;
using namespace std::chrono_literals;

namespace {

constexpr uint16_t TEST_PORT_BASE = 41500;

std::atomic<uint16_t> port_counter{0};

uint16_t get_test_port() {
    return TEST_PORT_BASE + port_counter.fetch_add(1);
}

/// Read exactly count bytes or fail
std::vector<uint8_t> read_exactly(tcp_transport& transport, std::size_t count) {
    std::vector<uint8_t> out;
    std::array<uint8_t, 64> buffer{};
    while (out.size() < count) {
        auto want = std::min(buffer.size(), count - out.size());
        auto got = transport.receive_some(std::span<uint8_t>(buffer.data(), want), 2000ms);
        REQUIRE(got.is_ok());
        out.insert(out.end(), buffer.begin(), buffer.begin() + got.value());
    }
    return out;
}

}  // namespace

TEST_CASE("tcp_listener refuses port zero", "[network][transport]") {
    tcp_listener listener;
    auto result = listener.listen(0);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_argument);
    CHECK_FALSE(listener.is_listening());
}

TEST_CASE("tcp_listener lifecycle", "[network][transport]") {
    tcp_listener listener;
    const auto port = get_test_port();
    REQUIRE(listener.listen(port).is_ok());
    CHECK(listener.is_listening());
    CHECK(listener.local_port() == port);

    auto again = listener.listen(port);
    REQUIRE(again.is_err());
    CHECK(again.error().code == error_codes::server_already_running);

    SECTION("accept times out with no connection") {
        auto accepted = listener.accept(50ms);
        REQUIRE(accepted.is_ok());
        CHECK(accepted.value() == nullptr);
    }

    SECTION("accept after close reports the listener closed") {
        listener.close();
        CHECK_FALSE(listener.is_listening());
        auto accepted = listener.accept(50ms);
        REQUIRE(accepted.is_err());
        CHECK(accepted.error().code == error_codes::server_not_running);
    }
}

TEST_CASE("tcp_transport exchanges bytes over loopback", "[network][transport]") {
    tcp_listener listener;
    const auto port = get_test_port();
    REQUIRE(listener.listen(port).is_ok());

    auto client = tcp_transport::connect("127.0.0.1", port, 2000ms);
    REQUIRE(client.is_ok());
    CHECK(client.value()->remote_address() == "127.0.0.1:" + std::to_string(port));

    auto accepted = listener.accept(2000ms);
    REQUIRE(accepted.is_ok());
    REQUIRE(accepted.value() != nullptr);
    auto& server_side = *accepted.value();
    auto& client_side = *client.value();

    // A-ASSOCIATE-RQ header split across two sends arrives in order
    const std::vector<uint8_t> first{0x01, 0x00, 0x00, 0x00};
    const std::vector<uint8_t> second{0x00, 0x44, 0x00, 0x01};
    REQUIRE(client_side.send_all(first).is_ok());
    REQUIRE(client_side.send_all(second).is_ok());

    auto received = read_exactly(server_side, 8);
    CHECK(received == std::vector<uint8_t>{0x01, 0x00, 0x00, 0x00, 0x00, 0x44, 0x00, 0x01});
    CHECK(client_side.bytes_sent() == 8);
    CHECK(server_side.bytes_received() == 8);

    SECTION("nothing pending reads as zero without waiting") {
        std::array<uint8_t, 16> buffer{};
        auto got = server_side.receive_available(buffer);
        REQUIRE(got.is_ok());
        CHECK(got.value() == 0);
    }

    SECTION("a read deadline expires as receive_timeout") {
        std::array<uint8_t, 16> buffer{};
        auto start = std::chrono::steady_clock::now();
        auto got = server_side.receive_some(buffer, 100ms);
        REQUIRE(got.is_err());
        CHECK(got.error().code == error_codes::receive_timeout);
        CHECK(std::chrono::steady_clock::now() - start >= 90ms);
    }

    SECTION("replies flow back to the requestor") {
        const std::vector<uint8_t> reply{0x02, 0x00, 0x00, 0x00, 0x00, 0x00};
        REQUIRE(server_side.send_all(reply).is_ok());
        CHECK(read_exactly(client_side, reply.size()) == reply);
    }

    SECTION("shutdown interrupts a blocked reader") {
        std::thread interrupter([&] {
            std::this_thread::sleep_for(100ms);
            server_side.shutdown();
        });
        std::array<uint8_t, 16> buffer{};
        auto got = server_side.receive_some(buffer, 5000ms);
        interrupter.join();
        REQUIRE(got.is_err());
        CHECK(got.error().code == error_codes::connection_closed);
    }

    SECTION("a closed transport refuses to send") {
        client_side.close();
        CHECK_FALSE(client_side.is_open());
        auto sent = client_side.send_all(first);
        REQUIRE(sent.is_err());
        CHECK(sent.error().code == error_codes::connection_closed);
    }
}

TEST_CASE("tcp_transport connect to a closed port fails", "[network][transport]") {
    auto client = tcp_transport::connect("127.0.0.1", get_test_port(), 2000ms);
    REQUIRE(client.is_err());
    CHECK((client.error().code == error_codes::connection_failed ||
           client.error().code == error_codes::connection_timeout));
}
