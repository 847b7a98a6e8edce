/**
 * @file pdu_types.cpp
 * @brief PDU variant helpers and rejection descriptions
 */

#include "dul/network/pdu_types.hpp"

#include <sstream>
#include <type_traits>

namespace dul::network {

auto type_of(const pdu& value) noexcept -> pdu_type {
    return std::visit([](const auto& p) -> pdu_type {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, associate_rq>) {
            return pdu_type::associate_rq;
        } else if constexpr (std::is_same_v<T, associate_ac>) {
            return pdu_type::associate_ac;
        } else if constexpr (std::is_same_v<T, associate_rj>) {
            return pdu_type::associate_rj;
        } else if constexpr (std::is_same_v<T, p_data_tf_pdu>) {
            return pdu_type::p_data_tf;
        } else if constexpr (std::is_same_v<T, release_rq_pdu>) {
            return pdu_type::release_rq;
        } else if constexpr (std::is_same_v<T, release_rp_pdu>) {
            return pdu_type::release_rp;
        } else {
            return pdu_type::abort;
        }
    }, value);
}

auto describe_rejection(const associate_rj& rj) -> std::string {
    std::ostringstream oss;
    oss << "Association rejected: ";

    if (rj.result == reject_result::rejected_permanent) {
        oss << "permanent, ";
    } else if (rj.result == reject_result::rejected_transient) {
        oss << "transient, ";
    } else {
        oss << "result=unknown (" << static_cast<int>(rj.result) << "), ";
    }

    switch (static_cast<reject_source>(rj.source)) {
        case reject_source::service_user:
            oss << "source=service-user, ";
            switch (static_cast<reject_reason_user>(rj.reason)) {
                case reject_reason_user::no_reason:
                    oss << "reason=no reason given";
                    break;
                case reject_reason_user::application_context_not_supported:
                    oss << "reason=application context not supported";
                    break;
                case reject_reason_user::calling_ae_not_recognized:
                    oss << "reason=calling AE title not recognized";
                    break;
                case reject_reason_user::called_ae_not_recognized:
                    oss << "reason=called AE title not recognized";
                    break;
                default:
                    oss << "reason=unknown (" << static_cast<int>(rj.reason) << ")";
            }
            break;
        case reject_source::service_provider_acse:
            oss << "source=service-provider (ACSE), ";
            switch (static_cast<reject_reason_provider_acse>(rj.reason)) {
                case reject_reason_provider_acse::no_reason:
                    oss << "reason=no reason given";
                    break;
                case reject_reason_provider_acse::protocol_version_not_supported:
                    oss << "reason=protocol version not supported";
                    break;
                default:
                    oss << "reason=unknown (" << static_cast<int>(rj.reason) << ")";
            }
            break;
        case reject_source::service_provider_presentation:
            oss << "source=service-provider (Presentation), ";
            switch (static_cast<reject_reason_provider_presentation>(rj.reason)) {
                case reject_reason_provider_presentation::temporary_congestion:
                    oss << "reason=temporary congestion";
                    break;
                case reject_reason_provider_presentation::local_limit_exceeded:
                    oss << "reason=local limit exceeded";
                    break;
                default:
                    oss << "reason=unknown (" << static_cast<int>(rj.reason) << ")";
            }
            break;
        default:
            oss << "source=unknown (" << static_cast<int>(rj.source) << ")";
    }

    return oss.str();
}

}  // namespace dul::network
