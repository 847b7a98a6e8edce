/**
 * @file pdu_framer.cpp
 * @brief Incremental PDU framing implementation
 */

#include "dul/network/pdu_framer.hpp"
#include "dul/network/pdu_decoder.hpp"

namespace dul::network {

pdu_framer::pdu_framer(std::size_t receive_ceiling)
    : receive_ceiling_(receive_ceiling) {}

void pdu_framer::feed(std::span<const uint8_t> bytes) {
    if (error_) {
        return;
    }
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

auto pdu_framer::next_frame() -> Result<std::optional<std::vector<uint8_t>>> {
    using frame = std::optional<std::vector<uint8_t>>;
    using frame_result = Result<frame>;

    if (error_) {
        return *error_;
    }
    if (buffer_.empty()) {
        return frame_result::ok(frame{});
    }

    // Reject an unknown type as soon as the first byte is visible
    if (!pdu_decoder::is_known_pdu_type(buffer_[0])) {
        error_ = error_info(dul::error_codes::invalid_pdu_type,
                            "Unknown PDU type " + std::to_string(buffer_[0]),
                            "dul::network::pdu_framer");
        return *error_;
    }

    auto length_opt = pdu_decoder::pdu_length(buffer_);
    if (!length_opt) {
        // Header not complete yet
        return frame_result::ok(frame{});
    }

    const std::size_t total = *length_opt;
    if (total > receive_ceiling_) {
        error_ = error_info(dul::error_codes::malformed_pdu,
                            "Declared PDU length " + std::to_string(total) +
                                " exceeds receive ceiling " +
                                std::to_string(receive_ceiling_),
                            "dul::network::pdu_framer");
        return *error_;
    }

    if (buffer_.size() < total) {
        return frame_result::ok(frame{});
    }

    // Extract the complete PDU
    std::vector<uint8_t> bytes(
        buffer_.begin(),
        buffer_.begin() + static_cast<std::ptrdiff_t>(total));
    buffer_.erase(buffer_.begin(),
                  buffer_.begin() + static_cast<std::ptrdiff_t>(total));

    return frame_result::ok(frame{std::move(bytes)});
}

void pdu_framer::reset() {
    buffer_.clear();
    error_.reset();
}

}  // namespace dul::network
