/**
 * @file events.hpp
 * @brief Association events and the per-association event dispatcher
 *
 * Application code observes an association through notification callbacks
 * and answers DIMSE requests through request handlers. Both are registered
 * on an event_dispatcher and invoked synchronously from the thread that
 * owns the association.
 */

#ifndef DUL_NETWORK_EVENTS_HPP
#define DUL_NETWORK_EVENTS_HPP

#include "dul/core/result.hpp"
#include "dul/network/dimse/command_field.hpp"
#include "dul/network/dimse/status_codes.hpp"
#include "dul/network/pdu_types.hpp"
#include "dul/network/state_machine.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dul::network {

class request_context;

// =============================================================================
// Event Types
// =============================================================================

enum class event_type : uint8_t {
    // Notifications
    association_requested,
    association_accepted,
    association_rejected,
    association_established,
    association_released,
    association_aborted,
    connection_opened,
    connection_closed,
    pdu_sent,
    pdu_received,
    state_transition,
    dimse_sent,
    dimse_received,

    // Requests
    c_echo,
    c_store,
    c_find,
    c_get,
    c_move,
    n_event_report,
    n_get,
    n_set,
    n_action,
    n_create,
    n_delete,
};

[[nodiscard]] constexpr bool is_request_event(event_type type) noexcept {
    return type >= event_type::c_echo;
}

/**
 * @brief Request event for a DIMSE request command
 *
 * C-CANCEL has no event; it is surfaced through request_context::is_cancelled().
 */
[[nodiscard]] auto request_event_for(dimse::command_field cmd) noexcept
    -> std::optional<event_type>;

[[nodiscard]] auto to_string(event_type type) noexcept -> std::string_view;

// =============================================================================
// Event Payload
// =============================================================================

/**
 * @brief Notification delivered to subscribers
 *
 * Only the members relevant to the event type are set.
 */
struct association_event {
    event_type type{event_type::connection_opened};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    std::string calling_ae;
    std::string called_ae;
    std::string remote_address;

    /// pdu_sent, pdu_received
    std::optional<pdu_type> pdu;
    std::size_t pdu_length{0};

    /// state_transition
    std::optional<transition> state_change;

    /// dimse_sent, dimse_received
    std::optional<dimse::command_field> command;
    uint16_t message_id{0};
    uint8_t context_id{0};
    std::optional<dimse::status_code> status;

    /// association_rejected
    std::optional<associate_rj> rejection;

    /// association_aborted, when an A-ABORT was sent or received
    std::optional<abort_pdu> abort;

    std::string detail;
};

// =============================================================================
// Event Dispatcher
// =============================================================================

/**
 * @brief Registry of notification callbacks and request handlers
 *
 * Each association holds a shared_ptr to one dispatcher; a server shares
 * one dispatcher between all of its associations. Registration is
 * thread-safe. Callbacks run on the association thread and must not block
 * indefinitely.
 *
 * @example
 * @code
 * auto events = std::make_shared<event_dispatcher>();
 * events->subscribe(event_type::association_established,
 *                   [](const association_event& e) { log(e.calling_ae); });
 * (void)events->set_request_handler(event_type::c_find,
 *     [](request_context& ctx) {
 *         ctx.send_pending(status_pending, match_bytes);
 *         return status_success;
 *     });
 * @endcode
 */
class event_dispatcher {
public:
    using subscription_id = uint64_t;
    using event_callback = std::function<void(const association_event&)>;
    using request_handler = std::function<dimse::status_code(request_context&)>;

    /**
     * @brief Register a notification callback
     * @return Id for unsubscribe()
     */
    auto subscribe(event_type type, event_callback callback) -> subscription_id;

    bool unsubscribe(subscription_id id);

    /**
     * @brief Install the handler for a request event, replacing any previous one
     * @return invalid_argument if type is not a request event
     */
    [[nodiscard]] VoidResult set_request_handler(event_type type, request_handler handler);

    void clear_request_handler(event_type type);

    /// Handler for a request event, empty when none is installed
    [[nodiscard]] auto request_handler_for(event_type type) const -> request_handler;

    [[nodiscard]] bool has_subscribers(event_type type) const;

    /**
     * @brief Invoke every callback subscribed to event.type
     *
     * A callback that throws is logged and skipped.
     */
    void publish(const association_event& event) const;

private:
    struct subscription {
        subscription_id id;
        event_type type;
        event_callback callback;
    };

    mutable std::mutex mutex_;
    std::vector<subscription> subscriptions_;
    std::map<event_type, request_handler> handlers_;
    subscription_id next_id_{1};
};

}  // namespace dul::network

#endif  // DUL_NETWORK_EVENTS_HPP
