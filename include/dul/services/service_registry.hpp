/**
 * @file service_registry.hpp
 * @brief SOP Class UID to scp_service map
 */

#ifndef DUL_SERVICES_SERVICE_REGISTRY_HPP
#define DUL_SERVICES_SERVICE_REGISTRY_HPP

#include "dul/core/result.hpp"
#include "dul/services/scp_service.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace dul::services {

/**
 * @brief Selects the service that answers a SOP class
 *
 * A SOP class maps to at most one service. Lookups are thread-safe.
 */
class service_registry {
public:
    /**
     * @brief Register a service for every SOP class it supports
     * @return invalid_argument for a null service or one without SOP
     *         classes, duplicate_registration when a SOP class is taken
     */
    [[nodiscard]] VoidResult add(scp_service_ptr service) {
        if (!service) {
            return dul_void_error(error_codes::invalid_argument, "Service is null");
        }
        auto classes = service->supported_sop_classes();
        if (classes.empty()) {
            return dul_void_error(error_codes::invalid_argument,
                                  "Service supports no SOP class",
                                  std::string(service->service_name()));
        }

        std::lock_guard lock(mutex_);
        for (const auto& uid : classes) {
            if (by_sop_class_.count(uid) != 0) {
                return dul_void_error(error_codes::duplicate_registration,
                                      "SOP class already has a service", uid);
            }
        }
        for (const auto& uid : classes) {
            by_sop_class_.emplace(uid, service);
        }
        services_.push_back(std::move(service));
        return {};
    }

    /// Service for a SOP class, nullptr when none is registered
    [[nodiscard]] auto find(std::string_view sop_class_uid) const -> scp_service_ptr {
        std::lock_guard lock(mutex_);
        auto it = by_sop_class_.find(std::string(sop_class_uid));
        return it == by_sop_class_.end() ? nullptr : it->second;
    }

    [[nodiscard]] auto services() const -> std::vector<scp_service_ptr> {
        std::lock_guard lock(mutex_);
        return services_;
    }

    [[nodiscard]] auto sop_classes() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        std::vector<std::string> uids;
        uids.reserve(by_sop_class_.size());
        for (const auto& [uid, service] : by_sop_class_) {
            uids.push_back(uid);
        }
        return uids;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard lock(mutex_);
        return services_.empty();
    }

    /**
     * @brief Presentation contexts of all services, one per SOP class
     *
     * When two services list the same SOP class (a storage class needed by
     * C-GET and a storage service, for example) the first entry wins, with
     * the union of its roles.
     */
    [[nodiscard]] auto presentation_contexts(
        const std::vector<std::string>& transfer_syntaxes) const
        -> std::vector<network::supported_context> {
        std::lock_guard lock(mutex_);
        std::vector<network::supported_context> merged;
        for (const auto& service : services_) {
            for (auto& ctx : service->presentation_contexts(transfer_syntaxes)) {
                auto it = std::find_if(merged.begin(), merged.end(), [&](const auto& m) {
                    return m.abstract_syntax == ctx.abstract_syntax;
                });
                if (it == merged.end()) {
                    merged.push_back(std::move(ctx));
                } else {
                    it->scu_role = it->scu_role || ctx.scu_role;
                    it->scp_role = it->scp_role || ctx.scp_role;
                }
            }
        }
        return merged;
    }

private:
    mutable std::mutex mutex_;
    std::vector<scp_service_ptr> services_;
    std::map<std::string, scp_service_ptr> by_sop_class_;
};

}  // namespace dul::services

#endif  // DUL_SERVICES_SERVICE_REGISTRY_HPP
