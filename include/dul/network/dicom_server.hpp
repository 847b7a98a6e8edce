/**
 * @file dicom_server.hpp
 * @brief Multi-threaded DICOM acceptor handling concurrent associations
 *
 * The server accepts TCP connections on an accept_worker, runs each
 * association on its own association_worker and dispatches every DIMSE
 * request to the scp_service registered for its SOP class, falling back to
 * the request handlers of its event_dispatcher.
 *
 * @see DICOM PS3.8 - Network Communication Support for Message Exchange
 */

#ifndef DUL_NETWORK_DICOM_SERVER_HPP
#define DUL_NETWORK_DICOM_SERVER_HPP

#include "dul/network/association.hpp"
#include "dul/network/dataset_codec.hpp"
#include "dul/network/detail/accept_worker.hpp"
#include "dul/network/detail/association_worker.hpp"
#include "dul/network/events.hpp"
#include "dul/network/server_config.hpp"
#include "dul/network/transport.hpp"
#include "dul/services/service_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dul::network {

/**
 * @brief Multi-threaded DICOM server
 *
 * @example Usage
 * @code
 * server_config config("ARCHIVE", 11112);
 * config.max_associations = 20;
 *
 * dicom_server server{config};
 * (void)server.register_service(std::make_shared<services::verification_scp>());
 *
 * (void)server.events()->set_request_handler(event_type::c_find,
 *     [](request_context& ctx) { return dimse::status_success; });
 * server.add_supported_context({"1.2.840.10008.5.1.4.1.2.2.1",
 *                               config.transfer_syntaxes});
 *
 * auto result = server.start();
 * if (result.is_err()) {
 *     return 1;
 * }
 * server.wait_for_shutdown();
 * @endcode
 */
class dicom_server {
public:
    // =========================================================================
    // Type Aliases
    // =========================================================================

    using clock = std::chrono::steady_clock;
    using duration = std::chrono::milliseconds;
    using time_point = clock::time_point;

    /// Callback type for association events
    using association_callback = std::function<void(const association&)>;

    /// Callback type for error events
    using error_callback = std::function<void(const std::string&)>;

    // =========================================================================
    // Construction / Destruction
    // =========================================================================

    explicit dicom_server(const server_config& config);

    /**
     * @brief Destructor (stops server if running)
     */
    ~dicom_server();

    // Non-copyable, non-movable (owns network resources)
    dicom_server(const dicom_server&) = delete;
    dicom_server& operator=(const dicom_server&) = delete;
    dicom_server(dicom_server&&) = delete;
    dicom_server& operator=(dicom_server&&) = delete;

    // =========================================================================
    // Service Registration
    // =========================================================================

    /**
     * @brief Register an SCP service for the SOP classes it supports
     * @note Services must be registered before calling start()
     */
    [[nodiscard]] VoidResult register_service(services::scp_service_ptr service);

    /**
     * @brief Offer an additional presentation context
     *
     * Needed for SOP classes answered through event handlers rather than a
     * registered service.
     */
    void add_supported_context(supported_context context);

    /// Dispatcher shared by every association of this server
    [[nodiscard]] auto events() const noexcept -> const std::shared_ptr<event_dispatcher>& {
        return events_;
    }

    /// Decode request data sets before dispatch
    void set_dataset_codec(dataset_codec_ptr codec);

    void set_user_identity_policy(
        std::function<user_identity_decision(const user_identity_rq&)> policy);

    void set_sop_class_extended_policy(
        std::function<std::optional<std::vector<uint8_t>>(
            const sop_class_extended_negotiation&)> policy);

    /**
     * @brief Get list of supported SOP Class UIDs
     */
    [[nodiscard]] std::vector<std::string> supported_sop_classes() const;

    // =========================================================================
    // Lifecycle Management
    // =========================================================================

    /**
     * @brief Bind the port and begin accepting connections
     * @return invalid_configuration, bind_failed or server_already_running
     */
    [[nodiscard]] VoidResult start();

    /**
     * @brief Stop accepting, interrupt active associations and wait for them
     *
     * @param timeout Maximum time to wait for association workers to finish
     */
    void stop(duration timeout = std::chrono::seconds{30});

    /**
     * @brief Block until stop() has completed
     */
    void wait_for_shutdown();

    // =========================================================================
    // Status Queries
    // =========================================================================

    [[nodiscard]] bool is_running() const noexcept;

    /// Port actually bound, useful when the configured port is 0
    [[nodiscard]] uint16_t port() const noexcept;

    [[nodiscard]] size_t active_associations() const noexcept;

    [[nodiscard]] server_statistics get_statistics() const;

    [[nodiscard]] const server_config& config() const noexcept;

    // =========================================================================
    // Callbacks
    // =========================================================================

    /// Called on the association thread once an association is established
    void on_association_established(association_callback callback);

    /// Called on the association thread after an orderly release
    void on_association_released(association_callback callback);

    void on_error(error_callback callback);

private:
    // =========================================================================
    // Private Implementation
    // =========================================================================

    /// One accepted connection and the worker that serves it
    struct session {
        uint64_t id{0};
        std::string remote_address;
        time_point connected_at;

        /// Connection waiting to be picked up by the worker
        std::unique_ptr<tcp_transport> pending_transport;

        /// Established association; cleared before it is destroyed
        std::mutex mutex;
        association* assoc{nullptr};

        std::unique_ptr<detail::association_worker> worker;
    };

    // =========================================================================
    // Private Methods
    // =========================================================================

    /// Accept callback: start a worker for the connection
    void handle_connection(std::unique_ptr<tcp_transport> transport);

    /// Whole lifetime of one association (runs in its worker thread)
    void run_session(const std::shared_ptr<session>& s, bool over_limit);

    /// Process incoming DIMSE messages until the association ends
    void message_loop(association& assoc);

    /// Answer one request
    void dispatch(association& assoc, dimse::received_message received);

    /// Final status for a request, from a service, a handler or the defaults
    [[nodiscard]] dimse::status_code invoke_handler(request_context& ctx);

    [[nodiscard]] acceptor_config build_acceptor_config() const;

    /// Stop and drop workers whose session has ended
    void reap_finished_sessions();

    void report_error(const std::string& error);

    // =========================================================================
    // Member Variables
    // =========================================================================

    server_config config_;
    services::service_registry registry_;
    std::vector<supported_context> extra_contexts_;
    std::shared_ptr<event_dispatcher> events_;
    dataset_codec_ptr codec_;
    std::function<user_identity_decision(const user_identity_rq&)> user_identity_policy_;
    std::function<std::optional<std::vector<uint8_t>>(const sop_class_extended_negotiation&)>
        sop_class_extended_policy_;

    /// Built by start(), read-only while running
    acceptor_config acceptor_config_;

    tcp_listener listener_;
    std::unique_ptr<detail::accept_worker> accept_worker_;

    std::map<uint64_t, std::shared_ptr<session>> sessions_;
    mutable std::mutex sessions_mutex_;

    mutable server_statistics stats_;
    mutable std::mutex stats_mutex_;

    std::atomic<uint64_t> session_id_counter_{0};
    std::atomic<size_t> active_{0};
    std::atomic<bool> running_{false};

    std::condition_variable shutdown_cv_;
    std::mutex shutdown_mutex_;

    association_callback on_established_cb_;
    association_callback on_released_cb_;
    error_callback on_error_cb_;
    mutable std::mutex callback_mutex_;
};

}  // namespace dul::network

#endif  // DUL_NETWORK_DICOM_SERVER_HPP
