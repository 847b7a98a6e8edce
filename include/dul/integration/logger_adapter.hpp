/**
 * @file logger_adapter.hpp
 * @brief Upper layer logging and association audit trail over logger_system
 *
 * All protocol code logs through this adapter. Messages logged before
 * initialize() are dropped.
 *
 * The audit trail is a JSON Lines file: one object per association
 * lifecycle event or DIMSE exchange, written synchronously so that it
 * survives a crash of the logger's writer thread.
 */

#pragma once

#include <dul/compat/format.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dul::integration {

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @enum association_outcome
 * @brief How an association ended, for the audit trail
 */
enum class association_outcome {
    released,
    aborted_by_peer,
    aborted_locally,
    timed_out,
    protocol_error
};

[[nodiscard]] auto to_string(association_outcome outcome) noexcept -> std::string_view;

/**
 * @enum audit_event
 * @brief Kinds of audit trail entries
 */
enum class audit_event {
    association_established,
    association_released,
    association_rejected,
    association_aborted,
    dimse_exchange
};

[[nodiscard]] auto to_string(audit_event event) noexcept -> std::string_view;

/**
 * @struct audit_record
 * @brief One line of the audit trail
 */
struct audit_record {
    audit_event event{audit_event::association_established};
    std::string calling_ae;
    std::string called_ae;

    /// "success", "failure", or an association_outcome name
    std::string outcome{"success"};

    /// Remote address, rejection diagnostic, abort detail or DIMSE command
    std::string detail;

    /// DIMSE exchanges only
    std::string sop_class_uid;
    std::optional<uint16_t> status;
};

struct logger_config {
    /// Directory for dul.log
    std::filesystem::path log_directory{"logs"};

    log_level min_level{log_level::info};

    bool enable_console{true};

    bool enable_file{true};

    /// Audit trail file; empty disables the audit trail
    std::filesystem::path audit_file;

    /// Rotation threshold for dul.log
    std::size_t max_file_size_mb{50};

    std::size_t max_files{5};

    /// Hand messages to logger_system's background writer thread
    bool async_mode{true};
};

/**
 * @class logger_adapter
 * @brief Static logging facade
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/dul";
 * config.audit_file = "/var/log/dul/audit.jsonl";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Listening on port {}", 11112);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    static void initialize(const logger_config& config);

    /// Flush pending messages and release the writers
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(dul::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, dul::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(dul::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, dul::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(dul::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::info)) {
            log(log_level::info, dul::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void warn(dul::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::warn)) {
            log(log_level::warn, dul::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void error(dul::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::error)) {
            log(log_level::error, dul::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void set_min_level(log_level level);

    // ─────────────────────────────────────────────────────
    // Association Audit Trail
    // ─────────────────────────────────────────────────────

    /// Log the record as a message and append it to the audit file
    static void audit(const audit_record& record);

    /// The record as one JSON object, without the trailing newline
    [[nodiscard]] static auto to_json(const audit_record& record) -> std::string;

    static void log_association_established(const std::string& calling_ae,
                                            const std::string& called_ae,
                                            const std::string& remote_address);

    static void log_association_released(const std::string& calling_ae,
                                         const std::string& called_ae);

    /// @param diagnostic Result/source/reason in readable form
    static void log_association_rejected(const std::string& calling_ae,
                                         const std::string& called_ae,
                                         const std::string& diagnostic);

    static void log_association_aborted(const std::string& calling_ae,
                                        const std::string& called_ae,
                                        association_outcome outcome,
                                        const std::string& detail);

    static void log_dimse_exchange(const std::string& peer_ae,
                                   std::string_view command,
                                   const std::string& sop_class_uid,
                                   uint16_t status);

private:
    class impl;
    static auto instance() -> impl&;
};

}  // namespace dul::integration
