/**
 * @file acse.cpp
 * @brief A-ASSOCIATE evaluation and interpretation
 */

#include "dul/network/acse.hpp"

#include "dul/compat/format.hpp"

#include <algorithm>

namespace dul::network {

// =============================================================================
// negotiated_parameters
// =============================================================================

auto negotiated_parameters::find_context(uint8_t id) const noexcept
    -> const negotiated_context* {
    auto it = std::find_if(contexts.begin(), contexts.end(),
                           [id](const negotiated_context& c) { return c.id == id; });
    return it == contexts.end() ? nullptr : &*it;
}

auto negotiated_parameters::accepted_context_id(std::string_view abstract_syntax,
                                                std::string_view transfer_syntax) const
    -> std::optional<uint8_t> {
    for (const auto& ctx : contexts) {
        if (!ctx.is_accepted() || ctx.abstract_syntax != abstract_syntax) {
            continue;
        }
        if (!transfer_syntax.empty() && ctx.transfer_syntax != transfer_syntax) {
            continue;
        }
        return ctx.id;
    }
    return std::nullopt;
}

bool negotiated_parameters::any_accepted() const noexcept {
    return std::any_of(contexts.begin(), contexts.end(),
                       [](const negotiated_context& c) { return c.is_accepted(); });
}

// =============================================================================
// Requestor
// =============================================================================

auto acse::request(const association_config& config) -> associate_rq {
    associate_rq rq;
    rq.protocol_version = dicom_protocol_version;
    rq.called_ae_title = config.called_ae_title;
    rq.calling_ae_title = config.calling_ae_title;
    rq.application_context = std::string(dicom_application_context);
    rq.presentation_contexts = config.proposed_contexts;

    auto& info = rq.user_info;
    info.max_pdu_length = config.max_pdu_length;
    info.implementation_class_uid = config.implementation_class_uid.empty()
        ? std::string(default_implementation_class_uid)
        : config.implementation_class_uid;
    info.implementation_version_name = config.implementation_version_name;
    info.async_operations = config.extended.async_operations;
    info.role_selections = config.extended.role_selections;
    info.sop_class_extended = config.extended.sop_class_extended;
    info.sop_class_common_extended = config.extended.sop_class_common_extended;
    info.user_identity_request = config.extended.user_identity;

    return rq;
}

auto acse::interpret_accept(const associate_rq& rq, const associate_ac& ac)
    -> Result<negotiated_parameters> {
    auto contexts = presentation_negotiator::validate_response(
        rq.presentation_contexts, rq.user_info.role_selections, ac);
    if (contexts.is_err()) {
        return contexts.error();
    }

    if (ac.user_info.user_identity_response &&
        !(rq.user_info.user_identity_request &&
          rq.user_info.user_identity_request->positive_response_requested)) {
        return error_info(error_codes::negotiation_failed,
                          "User Identity response without a positive response request",
                          "dul");
    }

    negotiated_parameters params;
    params.contexts = std::move(contexts.value());
    params.peer_max_pdu_length = ac.user_info.max_pdu_length;
    params.peer_implementation_class_uid = ac.user_info.implementation_class_uid;
    params.peer_implementation_version_name = ac.user_info.implementation_version_name;
    if (rq.user_info.async_operations) {
        params.async_operations = ac.user_info.async_operations;
    }
    params.sop_class_extended = ac.user_info.sop_class_extended;
    params.sop_class_common_extended = rq.user_info.sop_class_common_extended;
    params.user_identity = rq.user_info.user_identity_request;
    params.user_identity_response = ac.user_info.user_identity_response;

    return Result<negotiated_parameters>::ok(std::move(params));
}

// =============================================================================
// Acceptor
// =============================================================================

auto acse::reject(reject_result result, reject_source source, uint8_t reason,
                  std::string why) -> association_decision {
    association_decision decision{
        associate_rj{result, static_cast<uint8_t>(source), reason}, {}, std::move(why)};
    return decision;
}

auto acse::limit_exceeded() -> associate_rj {
    return associate_rj{
        reject_result::rejected_transient,
        static_cast<uint8_t>(reject_source::service_provider_presentation),
        static_cast<uint8_t>(reject_reason_provider_presentation::local_limit_exceeded)};
}

auto acse::evaluate(const associate_rq& rq, const acceptor_config& config)
    -> association_decision {
    constexpr auto permanent = reject_result::rejected_permanent;

    if ((rq.protocol_version & 0x0001) == 0) {
        return reject(permanent, reject_source::service_provider_acse,
                      static_cast<uint8_t>(
                          reject_reason_provider_acse::protocol_version_not_supported),
                      compat::format("protocol version 0x{:04X} not supported",
                                     rq.protocol_version));
    }

    if (rq.application_context != dicom_application_context) {
        return reject(permanent, reject_source::service_user,
                      static_cast<uint8_t>(
                          reject_reason_user::application_context_not_supported),
                      compat::format("application context {} not supported",
                                     rq.application_context));
    }

    if (config.check_called_ae && rq.called_ae_title != config.ae_title) {
        return reject(permanent, reject_source::service_user,
                      static_cast<uint8_t>(reject_reason_user::called_ae_not_recognized),
                      compat::format("called AE '{}' is not '{}'",
                                     rq.called_ae_title, config.ae_title));
    }

    if (!config.calling_ae_whitelist.empty() &&
        std::find(config.calling_ae_whitelist.begin(), config.calling_ae_whitelist.end(),
                  rq.calling_ae_title) == config.calling_ae_whitelist.end()) {
        return reject(permanent, reject_source::service_user,
                      static_cast<uint8_t>(reject_reason_user::calling_ae_not_recognized),
                      compat::format("calling AE '{}' not in whitelist",
                                     rq.calling_ae_title));
    }

    if (auto valid = presentation_negotiator::validate_proposal(rq.presentation_contexts);
        valid.is_err()) {
        return reject(permanent, reject_source::service_user,
                      static_cast<uint8_t>(reject_reason_user::no_reason),
                      valid.error().message);
    }

    const auto& info = rq.user_info;

    std::optional<user_identity_ac> identity_response;
    if (info.user_identity_request && config.user_identity_policy) {
        auto verdict = config.user_identity_policy(*info.user_identity_request);
        if (!verdict.accepted) {
            return reject(reject_result::rejected_transient, reject_source::service_provider_acse,
                          static_cast<uint8_t>(reject_reason_provider_acse::no_reason),
                          "user identity refused");
        }
        if (info.user_identity_request->positive_response_requested) {
            identity_response = user_identity_ac{std::move(verdict.server_response)};
        }
    }

    presentation_negotiator negotiator(config.supported_contexts);
    auto negotiated = negotiator.negotiate(rq.presentation_contexts, info.role_selections);
    if (negotiated.is_err()) {
        return reject(permanent, reject_source::service_user,
                      static_cast<uint8_t>(reject_reason_user::no_reason),
                      negotiated.error().message);
    }

    auto& result = negotiated.value();
    if (!result.any_accepted()) {
        return reject(permanent, reject_source::service_user,
                      static_cast<uint8_t>(reject_reason_user::no_reason),
                      "no presentation context accepted");
    }

    associate_ac ac;
    ac.protocol_version = dicom_protocol_version;
    ac.called_ae_title = rq.called_ae_title;
    ac.calling_ae_title = rq.calling_ae_title;
    ac.application_context = std::string(dicom_application_context);
    ac.presentation_contexts = result.to_ac_items();

    auto& reply = ac.user_info;
    reply.max_pdu_length = config.max_pdu_length;
    reply.implementation_class_uid = config.implementation_class_uid.empty()
        ? std::string(default_implementation_class_uid)
        : config.implementation_class_uid;
    reply.implementation_version_name = config.implementation_version_name;
    if (info.async_operations) {
        reply.async_operations = config.async_window;
    }
    reply.role_selections = result.role_replies;

    if (config.sop_class_extended_policy) {
        for (const auto& item : info.sop_class_extended) {
            if (auto echoed = config.sop_class_extended_policy(item)) {
                reply.sop_class_extended.push_back({item.sop_class_uid, std::move(*echoed)});
            }
        }
    }
    reply.user_identity_response = identity_response;

    association_decision decision;
    decision.params.contexts = std::move(result.contexts);
    decision.params.peer_max_pdu_length = info.max_pdu_length;
    decision.params.peer_implementation_class_uid = info.implementation_class_uid;
    decision.params.peer_implementation_version_name = info.implementation_version_name;
    decision.params.async_operations = reply.async_operations;
    decision.params.sop_class_extended = reply.sop_class_extended;
    decision.params.sop_class_common_extended = info.sop_class_common_extended;
    decision.params.user_identity = info.user_identity_request;
    decision.response = std::move(ac);
    return decision;
}

}  // namespace dul::network
