/**
 * @file logger_adapter.cpp
 * @brief logger_system backed logging and audit trail
 */

#include <dul/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace dul::integration {

namespace {

auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warn;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::fatal;
        case log_level::off: break;
    }
    return kcenon::logger::log_level::off;
}

/// UTC, millisecond precision: 2024-05-01T09:30:00.125Z
auto utc_timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    return dul::compat::format("{}.{:03}Z", date, millis);
}

void append_json_string(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += dul::compat::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void append_field(std::string& out, std::string_view key, std::string_view value) {
    if (out.size() > 1) {
        out += ',';
    }
    append_json_string(out, key);
    out += ':';
    append_json_string(out, value);
}

auto status_text(uint16_t status) -> std::string {
    return dul::compat::format("0x{:04X}", status);
}

}  // namespace

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logger_) {
            return;
        }

        if (config.enable_file) {
            std::filesystem::create_directories(config.log_directory);
        }
        if (!config.audit_file.empty() && config.audit_file.has_parent_path()) {
            std::filesystem::create_directories(config.audit_file.parent_path());
        }

        logger_ = std::make_unique<kcenon::logger::logger>(config.async_mode);
        logger_->set_min_level(to_logger_level(config.min_level));
        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / "dul.log").string(),
                config.max_file_size_mb * 1024 * 1024, config.max_files));
        }
        logger_->start();

        {
            std::lock_guard<std::mutex> audit_lock(audit_mutex_);
            audit_file_ = config.audit_file;
        }
        min_level_ = config.min_level;
        running_ = true;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
        std::lock_guard<std::mutex> audit_lock(audit_mutex_);
        audit_file_.clear();
    }

    [[nodiscard]] bool running() const noexcept { return running_; }

    [[nodiscard]] bool enabled(log_level level) const noexcept {
        return running_ && level != log_level::off && level >= min_level_.load();
    }

    void write(log_level level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logger_) {
            logger_->log(to_logger_level(level), message);
        }
    }

    void set_min_level(log_level level) {
        min_level_ = level;
        std::lock_guard<std::mutex> lock(mutex_);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
    }

    void append_audit(const std::string& line) {
        std::lock_guard<std::mutex> lock(audit_mutex_);
        if (!running_ || audit_file_.empty()) {
            return;
        }
        std::ofstream out(audit_file_, std::ios::app);
        if (out) {
            out << line << '\n';
        }
    }

private:
    std::mutex mutex_;
    std::mutex audit_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<log_level> min_level_{log_level::info};
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_file_;
};

auto logger_adapter::instance() -> impl& {
    static impl state;
    return state;
}

// =============================================================================
// Logging
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    instance().initialize(config);
}

void logger_adapter::shutdown() {
    instance().shutdown();
}

auto logger_adapter::is_initialized() noexcept -> bool {
    return instance().running();
}

void logger_adapter::log(log_level level, const std::string& message) {
    if (instance().enabled(level)) {
        instance().write(level, message);
    }
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return instance().enabled(level);
}

void logger_adapter::set_min_level(log_level level) {
    instance().set_min_level(level);
}

// =============================================================================
// Audit Trail
// =============================================================================

auto to_string(association_outcome outcome) noexcept -> std::string_view {
    switch (outcome) {
        case association_outcome::released: return "released";
        case association_outcome::aborted_by_peer: return "aborted_by_peer";
        case association_outcome::aborted_locally: return "aborted_locally";
        case association_outcome::timed_out: return "timed_out";
        case association_outcome::protocol_error: return "protocol_error";
    }
    return "unknown";
}

auto to_string(audit_event event) noexcept -> std::string_view {
    switch (event) {
        case audit_event::association_established: return "ASSOCIATION_ESTABLISHED";
        case audit_event::association_released: return "ASSOCIATION_RELEASED";
        case audit_event::association_rejected: return "ASSOCIATION_REJECTED";
        case audit_event::association_aborted: return "ASSOCIATION_ABORTED";
        case audit_event::dimse_exchange: return "DIMSE_EXCHANGE";
    }
    return "UNKNOWN";
}

auto logger_adapter::to_json(const audit_record& record) -> std::string {
    std::string json = "{";
    append_field(json, "timestamp", utc_timestamp());
    append_field(json, "event_type", to_string(record.event));
    append_field(json, "outcome", record.outcome);
    if (!record.calling_ae.empty()) {
        append_field(json, "calling_ae", record.calling_ae);
    }
    if (!record.called_ae.empty()) {
        append_field(json, "called_ae", record.called_ae);
    }
    if (!record.detail.empty()) {
        append_field(json, "detail", record.detail);
    }
    if (!record.sop_class_uid.empty()) {
        append_field(json, "sop_class_uid", record.sop_class_uid);
    }
    if (record.status) {
        append_field(json, "status", status_text(*record.status));
    }
    json += '}';
    return json;
}

void logger_adapter::audit(const audit_record& record) {
    switch (record.event) {
        case audit_event::association_established:
            info("Association established: {} -> {} ({})", record.calling_ae,
                 record.called_ae, record.detail);
            break;
        case audit_event::association_released:
            debug("Association released: {} -> {}", record.calling_ae, record.called_ae);
            break;
        case audit_event::association_rejected:
            warn("Association rejected: {} -> {}: {}", record.calling_ae, record.called_ae,
                 record.detail);
            break;
        case audit_event::association_aborted:
            warn("Association aborted ({}): {} -> {}: {}", record.outcome, record.calling_ae,
                 record.called_ae, record.detail);
            break;
        case audit_event::dimse_exchange:
            debug("{} with {} ({}) -> status {}", record.detail, record.calling_ae,
                  record.sop_class_uid, status_text(record.status.value_or(0)));
            break;
    }
    instance().append_audit(to_json(record));
}

void logger_adapter::log_association_established(const std::string& calling_ae,
                                                 const std::string& called_ae,
                                                 const std::string& remote_address) {
    audit({audit_event::association_established, calling_ae, called_ae, "success",
           remote_address, {}, std::nullopt});
}

void logger_adapter::log_association_released(const std::string& calling_ae,
                                              const std::string& called_ae) {
    audit({audit_event::association_released, calling_ae, called_ae, "success", {}, {},
           std::nullopt});
}

void logger_adapter::log_association_rejected(const std::string& calling_ae,
                                              const std::string& called_ae,
                                              const std::string& diagnostic) {
    audit({audit_event::association_rejected, calling_ae, called_ae, "failure", diagnostic,
           {}, std::nullopt});
}

void logger_adapter::log_association_aborted(const std::string& calling_ae,
                                             const std::string& called_ae,
                                             association_outcome outcome,
                                             const std::string& detail) {
    audit({audit_event::association_aborted, calling_ae, called_ae,
           std::string(to_string(outcome)), detail, {}, std::nullopt});
}

void logger_adapter::log_dimse_exchange(const std::string& peer_ae,
                                        std::string_view command,
                                        const std::string& sop_class_uid,
                                        uint16_t status) {
    audit({audit_event::dimse_exchange, peer_ae, {}, status == 0 ? "success" : "status",
           std::string(command), sop_class_uid, status});
}

}  // namespace dul::integration
