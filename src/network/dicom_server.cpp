/**
 * @file dicom_server.cpp
 * @brief Implementation of the DICOM server
 */

#include "dul/network/dicom_server.hpp"

#include "dul/core/uid_registry.hpp"
#include "dul/integration/logger_adapter.hpp"

#include <algorithm>
#include <exception>
#include <thread>

namespace dul::network {

using integration::logger_adapter;

namespace {

/// Error Comment is an LO element
constexpr std::size_t max_error_comment_length = 64;

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

dicom_server::dicom_server(const server_config& config)
    : config_(config)
    , events_(std::make_shared<event_dispatcher>()) {
}

dicom_server::~dicom_server() {
    stop();
}

// =============================================================================
// Service Registration
// =============================================================================

VoidResult dicom_server::register_service(services::scp_service_ptr service) {
    if (running_) {
        return dul_void_error(error_codes::server_already_running,
                              "Services must be registered before start()");
    }
    auto name = service ? std::string(service->service_name()) : std::string{};
    auto added = registry_.add(std::move(service));
    if (added.is_ok()) {
        logger_adapter::debug("Registered service {}", name);
    }
    return added;
}

void dicom_server::add_supported_context(supported_context context) {
    extra_contexts_.push_back(std::move(context));
}

void dicom_server::set_dataset_codec(dataset_codec_ptr codec) {
    codec_ = std::move(codec);
}

void dicom_server::set_user_identity_policy(
    std::function<user_identity_decision(const user_identity_rq&)> policy) {
    user_identity_policy_ = std::move(policy);
}

void dicom_server::set_sop_class_extended_policy(
    std::function<std::optional<std::vector<uint8_t>>(
        const sop_class_extended_negotiation&)> policy) {
    sop_class_extended_policy_ = std::move(policy);
}

std::vector<std::string> dicom_server::supported_sop_classes() const {
    std::vector<std::string> result;
    for (const auto& ctx : build_acceptor_config().supported_contexts) {
        result.push_back(ctx.abstract_syntax);
    }
    return result;
}

// =============================================================================
// Lifecycle Management
// =============================================================================

VoidResult dicom_server::start() {
    if (running_) {
        return dul_void_error(error_codes::server_already_running, "Server is already running");
    }

    if (config_.ae_title.empty() || config_.ae_title.size() > ae_title_length) {
        return dul_void_error(error_codes::invalid_configuration,
                              "AE title must be 1-16 characters", config_.ae_title);
    }
    if (config_.transfer_syntaxes.empty()) {
        return dul_void_error(error_codes::invalid_configuration,
                              "At least one transfer syntax is required");
    }
    if (config_.port == 0) {
        return dul_void_error(error_codes::invalid_configuration, "Port must be non-zero");
    }

    acceptor_config_ = build_acceptor_config();

    auto bound = listener_.listen(config_.port);
    if (bound.is_err()) {
        return bound;
    }

    // Reset statistics
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_ = server_statistics{};
        stats_.start_time = clock::now();
        stats_.last_activity = stats_.start_time;
    }

    running_ = true;

    accept_worker_ = std::make_unique<detail::accept_worker>(
        listener_,
        [this](std::unique_ptr<tcp_transport> transport) {
            handle_connection(std::move(transport));
        },
        [this]() {
            reap_finished_sessions();
        });
    accept_worker_->set_wake_interval(std::chrono::milliseconds(100));

    auto start_result = accept_worker_->start();
    if (start_result.has_error()) {
        running_ = false;
        accept_worker_.reset();
        listener_.close();
        return dul_void_error(error_codes::server_not_running,
                              "Failed to start accept worker",
                              start_result.get_error().to_string());
    }

    logger_adapter::info("{} listening on port {} ({} presentation contexts, limit {})",
                         config_.ae_title, listener_.local_port(),
                         acceptor_config_.supported_contexts.size(),
                         config_.max_associations);
    return {};
}

void dicom_server::stop(duration timeout) {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    if (accept_worker_) {
        accept_worker_->stop();
        accept_worker_.reset();
    }
    listener_.close();

    // Wake every association that is waiting on its socket
    std::vector<std::shared_ptr<session>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, s] : sessions_) {
            sessions.push_back(s);
        }
    }
    for (const auto& s : sessions) {
        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->assoc != nullptr) {
            s->assoc->interrupt();
        }
    }

    auto deadline = clock::now() + timeout;
    auto all_done = [&sessions]() {
        return std::all_of(sessions.begin(), sessions.end(), [](const auto& s) {
            return !s->worker || s->worker->is_done();
        });
    };
    while (!all_done() && clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    if (!all_done()) {
        logger_adapter::warn("Stopping {} with associations still running", config_.ae_title);
    }

    for (const auto& s : sessions) {
        if (s->worker) {
            s->worker->stop();
        }
    }
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.clear();
    }

    logger_adapter::info("{} stopped", config_.ae_title);

    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    shutdown_cv_.notify_all();
}

void dicom_server::wait_for_shutdown() {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    shutdown_cv_.wait(lock, [this]() { return !running_; });
}

// =============================================================================
// Status Queries
// =============================================================================

bool dicom_server::is_running() const noexcept {
    return running_;
}

uint16_t dicom_server::port() const noexcept {
    return listener_.is_listening() ? listener_.local_port() : config_.port;
}

size_t dicom_server::active_associations() const noexcept {
    return active_.load();
}

server_statistics dicom_server::get_statistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    server_statistics result = stats_;
    result.active_associations = active_associations();
    return result;
}

const server_config& dicom_server::config() const noexcept {
    return config_;
}

// =============================================================================
// Callbacks
// =============================================================================

void dicom_server::on_association_established(association_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_established_cb_ = std::move(callback);
}

void dicom_server::on_association_released(association_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_released_cb_ = std::move(callback);
}

void dicom_server::on_error(error_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_error_cb_ = std::move(callback);
}

// =============================================================================
// Private Methods - Association Handling
// =============================================================================

acceptor_config dicom_server::build_acceptor_config() const {
    acceptor_config cfg;
    cfg.ae_title = config_.ae_title;
    cfg.check_called_ae = config_.check_called_ae;
    if (!config_.accept_unknown_calling_ae) {
        cfg.calling_ae_whitelist = config_.ae_whitelist;
    }
    cfg.max_pdu_length = config_.max_pdu_size;
    cfg.implementation_class_uid = config_.implementation_class_uid;
    cfg.implementation_version_name = config_.implementation_version_name;
    cfg.user_identity_policy = user_identity_policy_;
    cfg.sop_class_extended_policy = sop_class_extended_policy_;

    cfg.timeouts.acse = std::chrono::duration_cast<duration>(config_.association_timeout);
    cfg.timeouts.artim = std::chrono::duration_cast<duration>(config_.artim_timeout);
    cfg.timeouts.dimse = std::chrono::duration_cast<duration>(config_.dimse_timeout);
    cfg.timeouts.network = std::chrono::duration_cast<duration>(config_.idle_timeout);

    cfg.supported_contexts = registry_.presentation_contexts(config_.transfer_syntaxes);
    for (const auto& extra : extra_contexts_) {
        auto it = std::find_if(cfg.supported_contexts.begin(), cfg.supported_contexts.end(),
                               [&](const auto& c) {
                                   return c.abstract_syntax == extra.abstract_syntax;
                               });
        if (it == cfg.supported_contexts.end()) {
            cfg.supported_contexts.push_back(extra);
        }
    }

    // C-ECHO is answered even without a registered service
    auto has_verification = std::any_of(
        cfg.supported_contexts.begin(), cfg.supported_contexts.end(),
        [](const auto& c) { return c.abstract_syntax == core::uids::verification; });
    if (!has_verification) {
        cfg.supported_contexts.emplace_back(std::string(core::uids::verification),
                                            config_.transfer_syntaxes);
    }
    return cfg;
}

void dicom_server::handle_connection(std::unique_ptr<tcp_transport> transport) {
    if (!running_) {
        return;
    }

    const bool over_limit = config_.max_associations > 0 &&
                            active_.load() >= config_.max_associations;
    if (!over_limit) {
        active_.fetch_add(1);
    }

    auto s = std::make_shared<session>();
    s->id = session_id_counter_.fetch_add(1, std::memory_order_relaxed);
    s->remote_address = transport->remote_address();
    s->connected_at = clock::now();
    s->pending_transport = std::move(transport);
    s->worker = std::make_unique<detail::association_worker>(
        s->id, [this, s, over_limit]() { run_session(s, over_limit); });

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.emplace(s->id, s);
    }

    auto started = s->worker->start();
    if (started.has_error()) {
        report_error("Failed to start association worker: " +
                     started.get_error().to_string());
        if (!over_limit) {
            active_.fetch_sub(1);
        }
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(s->id);
    }
}

void dicom_server::run_session(const std::shared_ptr<session>& s, bool over_limit) {
    std::optional<associate_rj> forced;
    if (over_limit) {
        logger_adapter::warn("Association limit {} reached; rejecting {}",
                             config_.max_associations, s->remote_address);
        forced = acse::limit_exceeded();
    }

    auto accepted = association::accept(std::move(s->pending_transport), acceptor_config_,
                                        events_, forced);
    if (accepted.is_err()) {
        const auto& error = accepted.error();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            if (error.code == error_codes::association_rejected) {
                stats_.rejected_associations++;
            } else {
                stats_.aborted_associations++;
            }
        }
        logger_adapter::info("Association from {} not established: {}", s->remote_address,
                             error.message);
        if (!over_limit) {
            active_.fetch_sub(1);
        }
        return;
    }

    auto assoc = std::move(accepted.value());
    {
        std::lock_guard<std::mutex> lock(s->mutex);
        s->assoc = assoc.get();
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_associations++;
        stats_.last_activity = clock::now();
    }
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (on_established_cb_) {
            on_established_cb_(*assoc);
        }
    }

    message_loop(*assoc);

    if (assoc->is_established()) {
        assoc->abort();
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.bytes_sent += assoc->bytes_sent();
        stats_.bytes_received += assoc->bytes_received();
        if (assoc->state() == ul_state::aborted) {
            stats_.aborted_associations++;
        }
    }
    if (assoc->state() == ul_state::released) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (on_released_cb_) {
            on_released_cb_(*assoc);
        }
    }

    {
        std::lock_guard<std::mutex> lock(s->mutex);
        s->assoc = nullptr;
    }
    assoc.reset();
    active_.fetch_sub(1);
}

void dicom_server::message_loop(association& assoc) {
    while (running_ && assoc.is_established()) {
        auto received = assoc.next_message();
        if (received.is_err()) {
            const auto& error = received.error();
            if (error.code == error_codes::already_released) {
                logger_adapter::debug("{} released the association", assoc.calling_ae());
            } else if (error.code == error_codes::network_timeout) {
                logger_adapter::info("Association with {} idle for {}s; aborted",
                                     assoc.calling_ae(), config_.idle_timeout.count());
            } else if (running_) {
                report_error(assoc.calling_ae() + ": " + error.message);
            }
            break;
        }

        dispatch(assoc, std::move(received.value()));

        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_processed++;
        stats_.last_activity = clock::now();
    }
}

void dicom_server::dispatch(association& assoc, dimse::received_message received) {
    const auto command = received.message.command();

    if (!received.message.is_request()) {
        logger_adapter::warn("Ignoring {} from {}: no request outstanding",
                             dimse::to_string(command), assoc.calling_ae());
        return;
    }
    if (command == dimse::command_field::c_cancel_rq) {
        logger_adapter::debug("C-CANCEL for message {} with no operation in progress",
                              received.message.message_id_responded_to());
        return;
    }

    request_context ctx(assoc, received.context_id, std::move(received.message));

    dimse::status_code status = dimse::status_success;
    bool decoded = true;
    if (codec_ && ctx.request().has_dataset()) {
        auto dataset = codec_->decode(ctx.request_dataset(), ctx.transfer_syntax());
        if (dataset.is_err()) {
            decoded = false;
            status = dimse::decode_failure_status(command);
            auto comment = dataset.error().message;
            ctx.set_error_comment(comment.substr(0, max_error_comment_length));
            logger_adapter::warn("Cannot decode {} data set from {}: {}",
                                 dimse::to_string(command), assoc.calling_ae(),
                                 dataset.error().message);
        } else {
            ctx.set_decoded_dataset(std::move(dataset.value()));
        }
    }

    if (decoded) {
        status = invoke_handler(ctx);
    }

    if (!assoc.is_established()) {
        return;
    }

    auto sent = assoc.send_dimse(received.context_id, ctx.final_response(status));
    if (sent.is_err()) {
        report_error("Failed to send response: " + sent.error().message);
        return;
    }

    logger_adapter::log_dimse_exchange(assoc.calling_ae(), dimse::to_string(command),
                                       ctx.request().sop_class_uid(), status);
}

dimse::status_code dicom_server::invoke_handler(request_context& ctx) {
    const auto command = ctx.request().command();
    const auto sop_class = ctx.request().sop_class_uid();

    try {
        if (auto service = registry_.find(sop_class)) {
            return service->handle_request(ctx);
        }

        if (auto event = request_event_for(command)) {
            if (auto handler = events_->request_handler_for(*event)) {
                return handler(ctx);
            }
        }
    } catch (const std::exception& e) {
        logger_adapter::error("Handler for {} ({}) threw: {}", dimse::to_string(command),
                              sop_class, e.what());
        ctx.set_error_comment(std::string(e.what()).substr(0, max_error_comment_length));
        return dimse::processing_failure_status(command);
    } catch (...) {
        logger_adapter::error("Handler for {} ({}) threw a non-standard exception",
                              dimse::to_string(command), sop_class);
        return dimse::processing_failure_status(command);
    }

    if (command == dimse::command_field::c_echo_rq) {
        return dimse::status_success;
    }

    logger_adapter::warn("No handler for {} on {}", dimse::to_string(command), sop_class);
    return dimse::status_refused_sop_class_not_supported;
}

void dicom_server::reap_finished_sessions() {
    std::vector<std::shared_ptr<session>> finished;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->worker && it->second->worker->is_done()) {
                finished.push_back(it->second);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& s : finished) {
        s->worker->stop();
    }
}

void dicom_server::report_error(const std::string& error) {
    logger_adapter::error("{}", error);
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (on_error_cb_) {
        on_error_cb_(error);
    }
}

}  // namespace dul::network
