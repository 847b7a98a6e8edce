/**
 * @file pdu_framer.hpp
 * @brief Incremental PDU framing over a TCP byte stream
 *
 * TCP delivers an unstructured byte stream; the framer reassembles it into
 * complete PDU frames. Bytes are fed as they arrive; a frame is produced
 * once its 6-byte header and the declared number of body bytes are buffered.
 */

#ifndef DUL_NETWORK_PDU_FRAMER_HPP
#define DUL_NETWORK_PDU_FRAMER_HPP

#include "dul/core/result.hpp"
#include "pdu_types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace dul::network {

/**
 * @brief Splits a received byte stream into complete PDU frames.
 *
 * The framer validates only the PDU header: an unknown type byte is reported
 * as soon as the first byte of a frame is buffered, and a declared length
 * above the receive ceiling is reported once the header is complete. Body
 * contents are left to pdu_decoder.
 *
 * After an error the framer is poisoned and keeps returning the same error
 * until reset().
 */
class pdu_framer {
public:
    /// Default upper bound for one received PDU (header included)
    static constexpr std::size_t default_receive_ceiling = 64 * 1024 * 1024;

    explicit pdu_framer(std::size_t receive_ceiling = default_receive_ceiling);

    /// Append received bytes
    void feed(std::span<const uint8_t> bytes);

    /**
     * @brief Take the next complete frame.
     * @return A complete PDU (header + body), std::nullopt when more bytes
     *         are needed, or an error for an invalid header
     */
    [[nodiscard]] auto next_frame() -> Result<std::optional<std::vector<uint8_t>>>;

    /// Bytes currently buffered and not yet returned as a frame
    [[nodiscard]] auto buffered() const noexcept -> std::size_t {
        return buffer_.size();
    }

    /// true while a frame has been started but not completed
    [[nodiscard]] bool in_frame() const noexcept { return !buffer_.empty(); }

    [[nodiscard]] auto receive_ceiling() const noexcept -> std::size_t {
        return receive_ceiling_;
    }

    void set_receive_ceiling(std::size_t ceiling) noexcept { receive_ceiling_ = ceiling; }

    /// Drop buffered bytes and clear an error
    void reset();

private:
    std::vector<uint8_t> buffer_;
    std::size_t receive_ceiling_;
    std::optional<error_info> error_;
};

}  // namespace dul::network

#endif  // DUL_NETWORK_PDU_FRAMER_HPP
