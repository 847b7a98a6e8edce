/**
 * @file transport.cpp
 * @brief network_system implementation of tcp_transport and tcp_listener
 */

#include "dul/network/transport.hpp"

#include "dul/compat/format.hpp"

#include <kcenon/network/core/messaging_client.h>
#include <kcenon/network/core/messaging_server.h>
#include <kcenon/network/session/messaging_session.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <system_error>
#include <vector>

namespace dul::network {

namespace {

constexpr const char* module_name = "dul.transport";

/// Longest single wait before re-checking whether the session stopped
constexpr std::chrono::milliseconds liveness_check{50};

using client_ptr = std::shared_ptr<kcenon::network::core::messaging_client>;
using server_ptr = std::shared_ptr<kcenon::network::core::messaging_server>;
using session_ptr = std::shared_ptr<kcenon::network::session::messaging_session>;

// =============================================================================
// Receive Queue
// =============================================================================

/**
 * @brief Bytes handed over by network_system I/O callbacks
 *
 * Written from the network_system I/O thread, read by the association thread.
 * Once closed, whatever was already queued can still be read.
 */
class receive_queue {
public:
    void push(const std::vector<uint8_t>& data) {
        if (data.empty()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            chunks_.push_back(data);
            received_ += data.size();
        }
        cv_.notify_all();
    }

    void close(std::string reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            reason_ = std::move(reason);
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto received() const noexcept -> uint64_t { return received_.load(); }

    template <typename StoppedFn>
    [[nodiscard]] auto take(std::span<uint8_t> buffer, std::chrono::milliseconds timeout,
                            StoppedFn&& stopped) -> Result<std::size_t> {
        using clock = std::chrono::steady_clock;
        std::optional<clock::time_point> until;
        if (timeout.count() > 0) {
            until = clock::now() + timeout;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        while (chunks_.empty() && !closed_) {
            if (stopped()) {
                closed_ = true;
                reason_ = "Connection closed by peer";
                break;
            }
            auto slice = liveness_check;
            if (until) {
                auto now = clock::now();
                if (now >= *until) {
                    return error_info(error_codes::receive_timeout,
                                      compat::format("Nothing received within {} ms",
                                                     timeout.count()),
                                      module_name);
                }
                slice = std::min(slice, std::chrono::duration_cast<std::chrono::milliseconds>(
                                            *until - now) + std::chrono::milliseconds{1});
            }
            cv_.wait_for(lock, slice);
        }
        return copy_out(buffer);
    }

    [[nodiscard]] auto take_available(std::span<uint8_t> buffer) -> Result<std::size_t> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (chunks_.empty() && !closed_) {
            return Result<std::size_t>::ok(0);
        }
        return copy_out(buffer);
    }

private:
    /// Requires mutex_
    [[nodiscard]] auto copy_out(std::span<uint8_t> buffer) -> Result<std::size_t> {
        if (chunks_.empty()) {
            return error_info(error_codes::connection_closed, reason_, module_name);
        }

        std::size_t copied = 0;
        while (copied < buffer.size() && !chunks_.empty()) {
            const auto& front = chunks_.front();
            auto count = std::min(buffer.size() - copied, front.size() - front_offset_);
            std::memcpy(buffer.data() + copied, front.data() + front_offset_, count);
            copied += count;
            front_offset_ += count;
            if (front_offset_ == front.size()) {
                chunks_.pop_front();
                front_offset_ = 0;
            }
        }
        return Result<std::size_t>::ok(copied);
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::vector<uint8_t>> chunks_;
    std::size_t front_offset_{0};
    bool closed_{false};
    std::string reason_{"Connection closed"};
    std::atomic<uint64_t> received_{0};
};

}  // namespace

// =============================================================================
// tcp_transport::impl
// =============================================================================

class tcp_transport::impl {
public:
    impl(client_ptr client, std::shared_ptr<receive_queue> queue, std::string remote)
        : client_(std::move(client))
        , queue_(std::move(queue))
        , remote_address_(std::move(remote)) {}

    impl(session_ptr session, std::shared_ptr<receive_queue> queue, std::string remote)
        : session_(std::move(session))
        , queue_(std::move(queue))
        , remote_address_(std::move(remote)) {}

    [[nodiscard]] bool peer_stopped() const {
        return session_ && session_->is_stopped();
    }

    void send(std::vector<uint8_t>&& data) {
        if (client_) {
            (void)client_->send_packet(std::move(data));
        } else if (session_) {
            (void)session_->send_packet(std::move(data));
        }
    }

    void stop() noexcept {
        if (client_) {
            (void)client_->stop_client();
        }
        if (session_) {
            session_->stop_session();
        }
    }

    client_ptr client_;
    session_ptr session_;
    std::shared_ptr<receive_queue> queue_;
    std::string remote_address_;
    std::atomic<bool> open_{true};
    std::atomic<uint64_t> bytes_sent_{0};
};

// =============================================================================
// tcp_transport
// =============================================================================

tcp_transport::tcp_transport(std::unique_ptr<impl> state)
    : impl_(std::move(state)) {}

tcp_transport::~tcp_transport() {
    close();
}

auto tcp_transport::connect(const std::string& host, uint16_t port, duration timeout)
    -> Result<std::unique_ptr<tcp_transport>> {
    // Settled exactly once by whichever of the two callbacks fires first
    struct connect_signal {
        std::promise<std::error_code> promise;
        std::atomic<bool> settled{false};

        void settle(std::error_code ec) {
            if (!settled.exchange(true)) {
                promise.set_value(ec);
            }
        }
    };

    auto client = std::make_shared<kcenon::network::core::messaging_client>("dul_requestor");
    auto queue = std::make_shared<receive_queue>();
    auto signal = std::make_shared<connect_signal>();
    auto connected = signal->promise.get_future();

    client->set_receive_callback([queue](const std::vector<uint8_t>& data) {
        queue->push(data);
    });
    client->set_connected_callback([signal]() {
        signal->settle(std::error_code{});
    });
    client->set_disconnected_callback([queue]() {
        queue->close("Connection closed by peer");
    });
    client->set_error_callback([signal, queue](std::error_code ec) {
        signal->settle(ec);
        queue->close(ec.message());
    });

    auto started = client->start_client(host, port);
    if (started.is_err()) {
        return error_info(error_codes::connection_failed,
                          compat::format("Cannot connect to {}:{}: {}", host, port,
                                         started.error().message),
                          module_name);
    }

    if (timeout.count() > 0 &&
        connected.wait_for(timeout) == std::future_status::timeout) {
        (void)client->stop_client();
        return error_info(error_codes::connection_timeout,
                          compat::format("Connect to {}:{} timed out", host, port),
                          module_name);
    }

    auto ec = connected.get();
    if (ec) {
        (void)client->stop_client();
        return error_info(error_codes::connection_failed,
                          compat::format("Cannot connect to {}:{}: {}", host, port,
                                         ec.message()),
                          module_name);
    }

    return Result<std::unique_ptr<tcp_transport>>::ok(std::make_unique<tcp_transport>(
        std::make_unique<impl>(std::move(client), std::move(queue),
                               compat::format("{}:{}", host, port))));
}

VoidResult tcp_transport::send_all(std::span<const uint8_t> data) {
    if (!is_open() || impl_->peer_stopped()) {
        return dul_void_error(error_codes::connection_closed, "Transport is closed",
                              impl_->remote_address_);
    }

    impl_->send(std::vector<uint8_t>(data.begin(), data.end()));
    impl_->bytes_sent_ += data.size();
    return {};
}

auto tcp_transport::receive_some(std::span<uint8_t> buffer, duration timeout)
    -> Result<std::size_t> {
    if (!is_open()) {
        return error_info(error_codes::connection_closed, "Transport is closed", module_name);
    }
    return impl_->queue_->take(buffer, timeout, [this]() { return impl_->peer_stopped(); });
}

auto tcp_transport::receive_available(std::span<uint8_t> buffer) -> Result<std::size_t> {
    if (!is_open()) {
        return error_info(error_codes::connection_closed, "Transport is closed", module_name);
    }
    return impl_->queue_->take_available(buffer);
}

void tcp_transport::shutdown() noexcept {
    impl_->queue_->close("Transport interrupted");
    impl_->stop();
}

void tcp_transport::close() noexcept {
    if (impl_ && impl_->open_.exchange(false)) {
        impl_->stop();
        impl_->queue_->close("Transport closed");
    }
}

bool tcp_transport::is_open() const noexcept {
    return impl_ && impl_->open_.load();
}

auto tcp_transport::remote_address() const -> const std::string& {
    return impl_->remote_address_;
}

auto tcp_transport::bytes_sent() const noexcept -> uint64_t {
    return impl_->bytes_sent_.load();
}

auto tcp_transport::bytes_received() const noexcept -> uint64_t {
    return impl_->queue_->received();
}

// =============================================================================
// Session Routing
// =============================================================================

namespace {

/**
 * @brief Routes messaging_server callbacks to per-session receive queues
 *
 * Captured by the server callbacks, so it outlives the listener while the
 * I/O thread is still delivering.
 */
class session_router {
public:
    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        listening_ = true;
    }

    void on_connection(const session_ptr& session) {
        if (!session) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!listening_) {
                session->stop_session();
                return;
            }
            prune();
            auto queue = queue_for(session);
            auto label = compat::format("{}#{}", session->server_id(), ++sequence_);
            pending_.push_back(std::make_unique<tcp_transport>(
                std::make_unique<tcp_transport::impl>(session, std::move(queue),
                                                      std::move(label))));
        }
        cv_.notify_all();
    }

    void on_receive(const session_ptr& session, const std::vector<uint8_t>& data) {
        std::shared_ptr<receive_queue> queue;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue = queue_for(session);
        }
        queue->push(data);
    }

    void on_error(const session_ptr& session, std::error_code ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(session.get());
        if (it != routes_.end()) {
            it->second.queue->close(ec.message());
        }
    }

    /// The callback names a session id only; close every stopped session
    void on_disconnection() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, route] : routes_) {
            auto session = route.session.lock();
            if (!session || session->is_stopped()) {
                route.queue->close("Connection closed by peer");
            }
        }
    }

    [[nodiscard]] auto next(std::chrono::milliseconds timeout)
        -> Result<std::unique_ptr<tcp_transport>> {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this]() { return !pending_.empty() || !listening_; };
        if (timeout.count() > 0) {
            cv_.wait_for(lock, timeout, ready);
        } else {
            cv_.wait(lock, ready);
        }

        if (!listening_) {
            return error_info(error_codes::server_not_running, "Listener is closed",
                              module_name);
        }
        if (pending_.empty()) {
            return Result<std::unique_ptr<tcp_transport>>::ok(nullptr);
        }
        auto transport = std::move(pending_.front());
        pending_.pop_front();
        return Result<std::unique_ptr<tcp_transport>>::ok(std::move(transport));
    }

    void shutdown() {
        std::deque<std::unique_ptr<tcp_transport>> abandoned;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listening_ = false;
            abandoned.swap(pending_);
            for (auto& [key, route] : routes_) {
                route.queue->close("Listener closed");
            }
            routes_.clear();
        }
        cv_.notify_all();
        abandoned.clear();
    }

private:
    struct route {
        std::weak_ptr<kcenon::network::session::messaging_session> session;
        std::shared_ptr<receive_queue> queue;
    };

    /// Requires mutex_
    [[nodiscard]] auto queue_for(const session_ptr& session) -> std::shared_ptr<receive_queue> {
        auto& entry = routes_[session.get()];
        if (!entry.queue || entry.session.expired()) {
            entry.session = session;
            entry.queue = std::make_shared<receive_queue>();
        }
        return entry.queue;
    }

    /// Requires mutex_
    void prune() {
        for (auto it = routes_.begin(); it != routes_.end();) {
            if (it->second.session.expired()) {
                it = routes_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<const kcenon::network::session::messaging_session*, route> routes_;
    std::deque<std::unique_ptr<tcp_transport>> pending_;
    uint64_t sequence_{0};
    bool listening_{false};
};

}  // namespace

// =============================================================================
// tcp_listener
// =============================================================================

class tcp_listener::impl {
public:
    server_ptr server;
    std::shared_ptr<session_router> router = std::make_shared<session_router>();
    uint16_t port{0};
};

tcp_listener::tcp_listener()
    : impl_(std::make_unique<impl>()) {}

tcp_listener::~tcp_listener() {
    close();
}

VoidResult tcp_listener::listen(uint16_t port) {
    if (impl_->server) {
        return dul_void_error(error_codes::server_already_running, "Listener already open");
    }
    if (port == 0) {
        return dul_void_error(error_codes::invalid_argument, "Listen port must be non-zero");
    }

    auto server = std::make_shared<kcenon::network::core::messaging_server>(
        compat::format("dul_listener_{}", port));
    auto router = impl_->router;

    server->set_connection_callback(
        [router](std::shared_ptr<kcenon::network::session::messaging_session> session) {
            router->on_connection(session);
        });

    server->set_disconnection_callback(
        [router](const std::string& /*session_id*/) {
            router->on_disconnection();
        });

    server->set_receive_callback(
        [router](std::shared_ptr<kcenon::network::session::messaging_session> session,
                 const std::vector<uint8_t>& data) {
            router->on_receive(session, data);
        });

    server->set_error_callback(
        [router](std::shared_ptr<kcenon::network::session::messaging_session> session,
                 std::error_code ec) {
            router->on_error(session, ec);
        });

    router->open();
    auto started = server->start_server(port);
    if (started.is_err()) {
        router->shutdown();
        impl_->router = std::make_shared<session_router>();
        return dul_void_error(error_codes::bind_failed,
                              compat::format("Cannot listen on port {}", port),
                              started.error().message);
    }

    impl_->server = std::move(server);
    impl_->port = port;
    return {};
}

auto tcp_listener::accept(duration timeout) -> Result<std::unique_ptr<tcp_transport>> {
    if (!impl_->server) {
        return error_info(error_codes::server_not_running, "Listener is closed", module_name);
    }
    return impl_->router->next(timeout);
}

void tcp_listener::close() noexcept {
    if (!impl_ || !impl_->server) {
        return;
    }
    (void)impl_->server->stop_server();
    impl_->router->shutdown();
    impl_->router = std::make_shared<session_router>();
    impl_->server.reset();
}

bool tcp_listener::is_listening() const noexcept {
    return impl_ && impl_->server != nullptr;
}

auto tcp_listener::local_port() const noexcept -> uint16_t {
    return impl_ ? impl_->port : 0;
}

}  // namespace dul::network
