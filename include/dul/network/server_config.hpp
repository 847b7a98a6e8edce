/**
 * @file server_config.hpp
 * @brief DICOM server configuration and statistics
 *
 * @see DICOM PS3.8 - Network Communication Support for Message Exchange
 */

#ifndef DUL_NETWORK_SERVER_CONFIG_HPP
#define DUL_NETWORK_SERVER_CONFIG_HPP

#include "dul/network/association_config.hpp"
#include "dul/network/pdu_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace dul::network {

/**
 * @brief Configuration for a listening DICOM server
 *
 * @example Usage
 * @code
 * server_config config;
 * config.ae_title = "MY_SCP";
 * config.port = 11112;
 * config.max_associations = 10;
 * config.ae_whitelist = {"MODALITY1", "MODALITY2"};
 *
 * dicom_server server{config};
 * @endcode
 */
struct server_config {
    /// Application Entity Title for this server (16 chars max)
    std::string ae_title{"DUL_SCP"};

    /// Port to listen on (default: 11112, standard alternate DICOM port)
    uint16_t port{11112};

    /// Maximum concurrent associations (0 = unlimited)
    size_t max_associations{20};

    /// Maximum PDU size for data transfer
    uint32_t max_pdu_size{default_max_pdu_length};

    /// Idle timeout for established associations (0 = no timeout)
    std::chrono::seconds idle_timeout{300};

    /// Timeout for association negotiation and release (ACSE timer)
    std::chrono::seconds association_timeout{30};

    /// ARTIM timeout
    std::chrono::seconds artim_timeout{30};

    /// DIMSE timeout for sub-operations the server initiates
    std::chrono::seconds dimse_timeout{30};

    /// AE Title whitelist (empty = accept all)
    std::vector<std::string> ae_whitelist;

    /// Accept unknown calling AE titles (when whitelist is non-empty)
    bool accept_unknown_calling_ae{false};

    /// Reject requests whose Called AE Title differs from ae_title
    bool check_called_ae{true};

    /// Implementation Class UID
    std::string implementation_class_uid{default_implementation_class_uid};

    /// Implementation Version Name
    std::string implementation_version_name{default_implementation_version_name};

    /// Transfer syntaxes offered for every registered SOP class
    std::vector<std::string> transfer_syntaxes{"1.2.840.10008.1.2.1",
                                               "1.2.840.10008.1.2"};

    server_config() = default;

    server_config(std::string ae, uint16_t listen_port)
        : ae_title(std::move(ae))
        , port(listen_port) {}
};

/**
 * @brief Statistics for server monitoring
 */
struct server_statistics {
    /// Total associations since server start
    uint64_t total_associations{0};

    /// Currently active associations
    size_t active_associations{0};

    /// Total associations rejected (limit or negotiation)
    uint64_t rejected_associations{0};

    /// Total associations that ended aborted
    uint64_t aborted_associations{0};

    /// Total DIMSE messages processed
    uint64_t messages_processed{0};

    /// Total bytes received
    uint64_t bytes_received{0};

    /// Total bytes sent
    uint64_t bytes_sent{0};

    /// Server start time
    std::chrono::steady_clock::time_point start_time{};

    /// Time of last activity
    std::chrono::steady_clock::time_point last_activity{};

    [[nodiscard]] std::chrono::seconds uptime() const noexcept {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::seconds>(now - start_time);
    }
};

}  // namespace dul::network

#endif  // DUL_NETWORK_SERVER_CONFIG_HPP
