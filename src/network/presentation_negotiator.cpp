/**
 * @file presentation_negotiator.cpp
 * @brief Presentation context negotiation implementation
 */

#include "dul/network/presentation_negotiator.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace dul::network {

namespace {

VoidResult negotiation_error(int code, const std::string& message) {
    return dul::dul_void_error(code, message);
}

auto find_role(const std::vector<scp_scu_role_selection>& roles,
               const std::string& uid) -> const scp_scu_role_selection* {
    auto it = std::find_if(roles.begin(), roles.end(),
        [&uid](const auto& role) { return role.sop_class_uid == uid; });
    return it != roles.end() ? &*it : nullptr;
}

}  // namespace

// =============================================================================
// negotiation_result
// =============================================================================

bool negotiation_result::any_accepted() const noexcept {
    return std::any_of(contexts.begin(), contexts.end(),
                       [](const auto& ctx) { return ctx.is_accepted(); });
}

auto negotiation_result::to_ac_items() const -> std::vector<presentation_context_ac> {
    std::vector<presentation_context_ac> items;
    items.reserve(contexts.size());
    for (const auto& ctx : contexts) {
        items.emplace_back(ctx.id, ctx.result, ctx.transfer_syntax);
    }
    return items;
}

// =============================================================================
// presentation_negotiator
// =============================================================================

presentation_negotiator::presentation_negotiator(std::vector<supported_context> supported)
    : supported_(std::move(supported)) {}

void presentation_negotiator::add_supported(supported_context context) {
    supported_.push_back(std::move(context));
}

bool presentation_negotiator::supports(std::string_view abstract_syntax) const noexcept {
    return find_supported(abstract_syntax) != nullptr;
}

auto presentation_negotiator::find_supported(std::string_view abstract_syntax) const noexcept
    -> const supported_context* {
    for (const auto& entry : supported_) {
        if (entry.abstract_syntax == abstract_syntax) {
            return &entry;
        }
    }
    return nullptr;
}

VoidResult presentation_negotiator::validate_proposal(
    const std::vector<presentation_context_rq>& proposed) {

    if (proposed.size() > max_presentation_contexts) {
        return negotiation_error(dul::error_codes::context_limit_exceeded,
            "Proposal carries " + std::to_string(proposed.size()) +
            " presentation contexts, limit is 128");
    }

    std::set<uint8_t> seen;
    for (const auto& pc : proposed) {
        if (pc.id % 2 == 0) {
            return negotiation_error(dul::error_codes::invalid_context_id,
                "Presentation context ID must be odd: " + std::to_string(pc.id));
        }
        if (!seen.insert(pc.id).second) {
            return negotiation_error(dul::error_codes::invalid_context_id,
                "Duplicate presentation context ID: " + std::to_string(pc.id));
        }
    }
    return ok();
}

auto presentation_negotiator::negotiate(
    const std::vector<presentation_context_rq>& proposed,
    const std::vector<scp_scu_role_selection>& requested_roles) const
    -> Result<negotiation_result> {

    if (auto valid = validate_proposal(proposed); valid.is_err()) {
        return valid.error();
    }

    negotiation_result result;
    result.contexts.reserve(proposed.size());

    for (const auto& pc : proposed) {
        negotiated_context ctx;
        ctx.id = pc.id;
        ctx.abstract_syntax = pc.abstract_syntax;

        const auto* entry = find_supported(pc.abstract_syntax);
        if (entry == nullptr) {
            ctx.result = presentation_context_result::abstract_syntax_not_supported;
            result.contexts.push_back(std::move(ctx));
            continue;
        }

        // First proposed transfer syntax the acceptor supports wins
        auto ts_it = std::find_if(pc.transfer_syntaxes.begin(), pc.transfer_syntaxes.end(),
            [entry](const std::string& ts) {
                return std::find(entry->transfer_syntaxes.begin(),
                                 entry->transfer_syntaxes.end(),
                                 ts) != entry->transfer_syntaxes.end();
            });
        if (ts_it == pc.transfer_syntaxes.end()) {
            ctx.result = presentation_context_result::transfer_syntaxes_not_supported;
            result.contexts.push_back(std::move(ctx));
            continue;
        }

        if (const auto* role = find_role(requested_roles, pc.abstract_syntax)) {
            const bool scu = role->scu_role && entry->scu_role;
            const bool scp = role->scp_role && entry->scp_role;
            if (!scu && !scp) {
                ctx.result = presentation_context_result::user_rejection;
                result.contexts.push_back(std::move(ctx));
                continue;
            }
            ctx.requestor_scu = scu;
            ctx.requestor_scp = scp;
        }

        ctx.result = presentation_context_result::acceptance;
        ctx.transfer_syntax = *ts_it;
        result.contexts.push_back(std::move(ctx));
    }

    // Echo the agreed role once per SOP class that has an accepted context
    std::set<std::string> replied;
    for (const auto& role : requested_roles) {
        if (replied.count(role.sop_class_uid) != 0) {
            continue;
        }
        auto accepted = std::find_if(result.contexts.begin(), result.contexts.end(),
            [&role](const negotiated_context& ctx) {
                return ctx.is_accepted() && ctx.abstract_syntax == role.sop_class_uid;
            });
        if (accepted == result.contexts.end()) {
            continue;
        }
        replied.insert(role.sop_class_uid);
        result.role_replies.emplace_back(role.sop_class_uid,
                                         accepted->requestor_scu,
                                         accepted->requestor_scp);
    }

    return result;
}

auto presentation_negotiator::validate_response(
    const std::vector<presentation_context_rq>& proposed,
    const std::vector<scp_scu_role_selection>& requested_roles,
    const associate_ac& ac) -> Result<std::vector<negotiated_context>> {

    auto failure = [](const std::string& message) {
        return dul::dul_error<std::vector<negotiated_context>>(
            dul::error_codes::negotiation_failed, message);
    };

    std::map<uint8_t, const presentation_context_ac*> answers;
    for (const auto& pc_ac : ac.presentation_contexts) {
        auto proposal = std::find_if(proposed.begin(), proposed.end(),
            [&pc_ac](const auto& pc) { return pc.id == pc_ac.id; });
        if (proposal == proposed.end()) {
            return failure("A-ASSOCIATE-AC answers unproposed context " +
                           std::to_string(pc_ac.id));
        }
        if (!answers.emplace(pc_ac.id, &pc_ac).second) {
            return failure("A-ASSOCIATE-AC answers context " +
                           std::to_string(pc_ac.id) + " twice");
        }
        if (pc_ac.result == presentation_context_result::acceptance &&
            std::find(proposal->transfer_syntaxes.begin(),
                      proposal->transfer_syntaxes.end(),
                      pc_ac.transfer_syntax) == proposal->transfer_syntaxes.end()) {
            return failure("Context " + std::to_string(pc_ac.id) +
                           " accepted with unproposed transfer syntax " +
                           pc_ac.transfer_syntax);
        }
    }

    for (const auto& reply : ac.user_info.role_selections) {
        const auto* requested = find_role(requested_roles, reply.sop_class_uid);
        if (requested == nullptr) {
            return failure("A-ASSOCIATE-AC returns unrequested role for " +
                           reply.sop_class_uid);
        }
        if ((reply.scu_role && !requested->scu_role) ||
            (reply.scp_role && !requested->scp_role)) {
            return failure("A-ASSOCIATE-AC widens requested role for " +
                           reply.sop_class_uid);
        }
    }

    std::vector<negotiated_context> contexts;
    contexts.reserve(proposed.size());
    for (const auto& pc : proposed) {
        negotiated_context ctx;
        ctx.id = pc.id;
        ctx.abstract_syntax = pc.abstract_syntax;

        auto answer = answers.find(pc.id);
        if (answer == answers.end()) {
            ctx.result = presentation_context_result::no_reason;
            contexts.push_back(std::move(ctx));
            continue;
        }

        ctx.result = answer->second->result;
        if (ctx.is_accepted()) {
            ctx.transfer_syntax = answer->second->transfer_syntax;
            if (const auto* reply = find_role(ac.user_info.role_selections,
                                              pc.abstract_syntax)) {
                ctx.requestor_scu = reply->scu_role;
                ctx.requestor_scp = reply->scp_role;
            }
        }
        contexts.push_back(std::move(ctx));
    }

    return contexts;
}

}  // namespace dul::network
