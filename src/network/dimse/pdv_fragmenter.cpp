/**
 * @file pdv_fragmenter.cpp
 * @brief PDV fragmentation and message reassembly
 */

#include "dul/network/dimse/pdv_fragmenter.hpp"

#include <algorithm>

namespace dul::network::dimse {

namespace {

constexpr const char* module_name = "dul::network::dimse::pdv_fragmenter";

template <typename T>
auto sequence_error(const std::string& message) -> Result<T> {
    return error_info(dul::error_codes::fragment_sequence_error, message, module_name);
}

}  // namespace

// =============================================================================
// pdv_fragmenter
// =============================================================================

auto pdv_fragmenter::max_fragment_payload() const noexcept -> std::size_t {
    if (max_pdu_length_ == unlimited_max_pdu_length) {
        return 0;
    }
    if (max_pdu_length_ <= pdv_header_size) {
        return 0;
    }
    return max_pdu_length_ - pdv_header_size;
}

void pdv_fragmenter::append_stream(std::vector<p_data_tf_pdu>& out,
                                   uint8_t context_id, bool is_command,
                                   std::span<const uint8_t> stream) const {
    const auto limit = max_fragment_payload();
    if (limit == 0 || stream.size() <= limit) {
        p_data_tf_pdu pdu;
        pdu.pdvs.emplace_back(context_id, is_command, true,
                              std::vector<uint8_t>(stream.begin(), stream.end()));
        out.push_back(std::move(pdu));
        return;
    }

    std::size_t offset = 0;
    while (offset < stream.size()) {
        const auto chunk = std::min(limit, stream.size() - offset);
        const bool last = offset + chunk == stream.size();
        auto first = stream.begin() + static_cast<std::ptrdiff_t>(offset);

        p_data_tf_pdu pdu;
        pdu.pdvs.emplace_back(context_id, is_command, last,
                              std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(chunk)));
        out.push_back(std::move(pdu));
        offset += chunk;
    }
}

auto pdv_fragmenter::fragment(uint8_t context_id,
                              std::span<const uint8_t> command,
                              std::optional<std::span<const uint8_t>> dataset) const
    -> Result<std::vector<p_data_tf_pdu>> {
    if (max_pdu_length_ != unlimited_max_pdu_length &&
        max_pdu_length_ <= pdv_header_size) {
        return error_info(dul::error_codes::pdu_too_large,
                          "Maximum PDU length " + std::to_string(max_pdu_length_) +
                              " leaves no room for PDV payload",
                          module_name);
    }

    std::vector<p_data_tf_pdu> pdus;
    append_stream(pdus, context_id, true, command);
    if (dataset) {
        append_stream(pdus, context_id, false, *dataset);
    }
    return pdus;
}

auto pdv_fragmenter::fragment(uint8_t context_id, const dimse_message& message) const
    -> Result<std::vector<p_data_tf_pdu>> {
    auto encoded = message.encode();
    if (encoded.is_err()) {
        return encoded.error();
    }
    const auto& [command, dataset] = encoded.value();

    std::optional<std::span<const uint8_t>> data;
    if (message.has_dataset()) {
        data = std::span<const uint8_t>(dataset);
    }
    return fragment(context_id, command, data);
}

// =============================================================================
// message_assembler
// =============================================================================

auto message_assembler::feed(const p_data_tf_pdu& pdu)
    -> Result<std::vector<received_message>> {
    std::vector<received_message> completed;
    for (const auto& pdv : pdu.pdvs) {
        auto result = add(pdv);
        if (result.is_err()) {
            return result.error();
        }
        if (result.value()) {
            completed.push_back(std::move(*result.value()));
        }
    }
    return completed;
}

auto message_assembler::add(const presentation_data_value& pdv)
    -> Result<std::optional<received_message>> {
    using add_result = Result<std::optional<received_message>>;

    if (context_id_ && *context_id_ != pdv.context_id) {
        const auto expected = *context_id_;
        reset();
        return sequence_error<std::optional<received_message>>(
            "PDV context id changed from " + std::to_string(expected) + " to " +
            std::to_string(pdv.context_id) + " within one message");
    }
    context_id_ = pdv.context_id;

    if (pdv.is_command) {
        if (command_complete_) {
            reset();
            return sequence_error<std::optional<received_message>>(
                "Command fragment received after the last command fragment");
        }
        command_.insert(command_.end(), pdv.data.begin(), pdv.data.end());
        if (!pdv.is_last) {
            return add_result::ok(std::optional<received_message>{});
        }

        command_complete_ = true;
        auto commands = command_set::decode(command_);
        if (commands.is_err()) {
            reset();
            return commands.error();
        }
        expects_dataset_ =
            commands.value().get_uint16(tag_command_data_set_type)
                .value_or(command_data_set_type_null) != command_data_set_type_null;
        if (!expects_dataset_) {
            return complete();
        }
        return add_result::ok(std::optional<received_message>{});
    }

    if (!command_complete_) {
        reset();
        return sequence_error<std::optional<received_message>>(
            "Data set fragment received before the command was complete");
    }
    if (!expects_dataset_) {
        reset();
        return sequence_error<std::optional<received_message>>(
            "Data set fragment received for a command without a data set");
    }

    dataset_.insert(dataset_.end(), pdv.data.begin(), pdv.data.end());
    if (!pdv.is_last) {
        return add_result::ok(std::optional<received_message>{});
    }
    return complete();
}

auto message_assembler::complete() -> Result<std::optional<received_message>> {
    std::optional<std::vector<uint8_t>> dataset;
    if (expects_dataset_) {
        dataset = std::move(dataset_);
    }
    auto decoded = dimse_message::decode(command_, std::move(dataset));
    const auto context_id = *context_id_;
    reset();

    if (decoded.is_err()) {
        return decoded.error();
    }
    received_message received;
    received.context_id = context_id;
    received.message = std::move(decoded.value());
    return std::optional<received_message>(std::move(received));
}

void message_assembler::reset() {
    context_id_.reset();
    command_.clear();
    dataset_.clear();
    command_complete_ = false;
    expects_dataset_ = false;
}

}  // namespace dul::network::dimse
