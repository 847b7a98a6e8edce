/**
 * @file transport.hpp
 * @brief Blocking TCP transport over network_system sessions
 *
 * The Upper Layer runs over TCP (PS3.8 Section 9.1). network_system owns the
 * sockets and delivers received bytes through callbacks; each transport
 * queues them so that the association thread can read with a deadline. Every
 * timer the protocol defines is enforced by the reader, without a separate
 * timer thread.
 *
 * A requestor transport wraps a messaging_client. A tcp_listener wraps a
 * messaging_server and hands out one transport per accepted session.
 */

#ifndef DUL_NETWORK_TRANSPORT_HPP
#define DUL_NETWORK_TRANSPORT_HPP

#include "dul/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace dul::network {

/**
 * @brief One connected TCP stream
 *
 * Owned exclusively; the session is stopped on destruction. A zero timeout
 * means "wait indefinitely".
 */
class tcp_transport {
public:
    using duration = std::chrono::milliseconds;

    /// network_system session and receive queue, defined in transport.cpp
    class impl;

    explicit tcp_transport(std::unique_ptr<impl> state);

    ~tcp_transport();

    tcp_transport(const tcp_transport&) = delete;
    tcp_transport& operator=(const tcp_transport&) = delete;
    tcp_transport(tcp_transport&&) = delete;
    tcp_transport& operator=(tcp_transport&&) = delete;

    /**
     * @brief Open a connection with a messaging_client
     * @return connection_failed or connection_timeout on failure
     */
    [[nodiscard]] static auto connect(const std::string& host, uint16_t port,
                                      duration timeout) -> Result<std::unique_ptr<tcp_transport>>;

    /**
     * @brief Queue every byte for sending
     * @return connection_closed once the transport or the peer has closed
     */
    [[nodiscard]] VoidResult send_all(std::span<const uint8_t> data);

    /**
     * @brief Read what is available, waiting up to timeout for the first byte
     * @return Bytes read (> 0); receive_timeout, or connection_closed once the
     *         peer closed and everything it sent has been read
     */
    [[nodiscard]] auto receive_some(std::span<uint8_t> buffer, duration timeout)
        -> Result<std::size_t>;

    /**
     * @brief Read without waiting
     * @return Bytes read, 0 when nothing is pending; connection_closed on EOF
     */
    [[nodiscard]] auto receive_available(std::span<uint8_t> buffer) -> Result<std::size_t>;

    /**
     * @brief Interrupt pending waits from another thread
     *
     * Stops the session; the owner still calls close().
     */
    void shutdown() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept;

    /// "host:port" for requestors, a session label for accepted connections
    [[nodiscard]] auto remote_address() const -> const std::string&;

    [[nodiscard]] auto bytes_sent() const noexcept -> uint64_t;
    [[nodiscard]] auto bytes_received() const noexcept -> uint64_t;

private:
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Listening TCP endpoint backed by a messaging_server
 */
class tcp_listener {
public:
    using duration = std::chrono::milliseconds;

    tcp_listener();
    ~tcp_listener();

    tcp_listener(const tcp_listener&) = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;

    /**
     * @brief Start accepting connections on all interfaces
     * @param port Port to bind; must be non-zero
     * @return invalid_argument for port 0, bind_failed when the server
     *         cannot start, server_already_running when already listening
     */
    [[nodiscard]] VoidResult listen(uint16_t port);

    /**
     * @brief Wait for one connection
     * @return A connected transport, nullptr when the timeout elapsed
     */
    [[nodiscard]] auto accept(duration timeout) -> Result<std::unique_ptr<tcp_transport>>;

    void close() noexcept;

    [[nodiscard]] bool is_listening() const noexcept;

    [[nodiscard]] auto local_port() const noexcept -> uint16_t;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace dul::network

#endif  // DUL_NETWORK_TRANSPORT_HPP
