#pragma once

/// @file event_bus.hpp
/// @brief Named-event publish/subscribe bus
///
/// The EventBus provides:
/// - Listeners keyed by event name, delivered in registration order
/// - Fire-once listeners
/// - Synchronous and awaited (emit_async) delivery
/// - Failure isolation: a failing listener is reported on the ERROR event
///   and never aborts delivery to the remaining listeners
/// - Catch-all listeners for bridging one bus onto another
/// - Thread-safe access; listeners run without the bus lock held

#include "fwd.hpp"
#include "events.hpp"

#include <sker/core/async.hpp>
#include <sker/core/error.hpp>
#include <sker/core/id.hpp>

#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sker_event {

// =============================================================================
// Listener Types
// =============================================================================

/// Unique listener identifier
struct ListenerId {
    std::uint64_t id = 0;

    [[nodiscard]] bool is_valid() const noexcept { return id != 0; }

    bool operator==(const ListenerId& other) const { return id == other.id; }
    bool operator!=(const ListenerId& other) const { return id != other.id; }
};

/// Synchronous listener
using Handler = std::function<void(const std::any& payload)>;

/// Listener with asynchronous completion
using AsyncHandler = std::function<std::future<void>(const std::any& payload)>;

/// Catch-all listener, receives every event name with its payload
using AnyHandler = std::function<void(const std::string& event, const std::any& payload)>;

// =============================================================================
// Event Bus
// =============================================================================

class EventBus {
public:
    static constexpr std::size_t DEFAULT_MAX_LISTENERS = 10;

    EventBus();
    explicit EventBus(std::string name);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // =========================================================================
    // Subscription
    // =========================================================================

    /// Register a listener. Fails on an empty event name or handler.
    [[nodiscard]] sker_core::Result<ListenerId> on(const std::string& event, Handler handler);

    /// Register a listener removed right before its first invocation
    [[nodiscard]] sker_core::Result<ListenerId> once(const std::string& event, Handler handler);

    /// Register a listener whose work completes asynchronously.
    /// emit() does not wait for it; emit_async() does.
    [[nodiscard]] sker_core::Result<ListenerId> on_async(const std::string& event, AsyncHandler handler);

    /// Typed listener; payloads of another type are skipped
    template<typename T, typename F>
    [[nodiscard]] sker_core::Result<ListenerId> on(const std::string& event, F&& handler) {
        return on(event, typed_handler<T>(event, std::forward<F>(handler)));
    }

    /// Typed fire-once listener
    template<typename T, typename F>
    [[nodiscard]] sker_core::Result<ListenerId> once(const std::string& event, F&& handler) {
        return once(event, typed_handler<T>(event, std::forward<F>(handler)));
    }

    /// Remove one listener
    void off(const std::string& event, ListenerId id);

    /// Remove every listener of an event
    void off(const std::string& event);

    /// Register a catch-all listener, invoked after the named listeners
    [[nodiscard]] ListenerId on_any(AnyHandler handler);

    void off_any(ListenerId id);

    void remove_all_listeners();
    void remove_all_listeners(const std::string& event);

    // =========================================================================
    // Publishing
    // =========================================================================

    /// Deliver synchronously in registration order. Asynchronous listeners
    /// are started but not awaited; their failures are still reported.
    void emit(const std::string& event, const std::any& payload = {});

    /// Deliver in registration order, waiting for each listener's completion
    /// before starting the next.
    /// @return HandlerFailed if any listener failed (all listeners still ran)
    sker_core::Result<void> emit_async(const std::string& event, const std::any& payload = {});

    /// Block until un-awaited asynchronous listener work has settled
    void wait_for_pending();

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] std::size_t listener_count(const std::string& event) const;

    /// Names of events with at least one listener
    [[nodiscard]] std::vector<std::string> event_names() const;

    /// Warn when one event gets more than @p max listeners. 0 disables the check.
    void set_max_listeners(std::size_t max);

    [[nodiscard]] std::size_t max_listeners() const;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

private:
    struct Listener {
        ListenerId id;
        Handler handler;
        AsyncHandler async_handler;
        bool once = false;
        std::atomic<bool> removed{false};
    };

    struct AnyListener {
        ListenerId id;
        AnyHandler handler;
        std::atomic<bool> removed{false};
    };

    using ListenerPtr = std::shared_ptr<Listener>;
    using AnyListenerPtr = std::shared_ptr<AnyListener>;

    template<typename T, typename F>
    static Handler typed_handler(const std::string& event, F&& handler) {
        return [event, h = std::forward<F>(handler)](const std::any& payload) {
            if (const T* typed = std::any_cast<T>(&payload)) {
                h(*typed);
            } else {
                report_type_mismatch(event, payload);
            }
        };
    }

    static void report_type_mismatch(const std::string& event, const std::any& payload);

    sker_core::Result<ListenerId> add_listener(const std::string& event, ListenerPtr listener);

    /// Claim a listener for invocation. False if it was removed, or a
    /// fire-once listener that already fired.
    bool claim(const std::string& event, const ListenerPtr& listener);

    /// Invoke one listener. When @p await is false, async completion is
    /// watched in the background. Returns the listener's failure, if any.
    sker_core::Result<void> invoke(
        const std::string& event, const ListenerPtr& listener, const std::any& payload, bool await);

    void invoke_any(const std::string& event, const std::any& payload);

    /// Log a listener failure and re-emit it as GENERIC_ERROR
    void report_failure(const std::string& event, const sker_core::Error& error);

    std::string m_name;
    mutable std::shared_mutex m_mutex;
    std::map<std::string, std::vector<ListenerPtr>> m_listeners;
    std::vector<AnyListenerPtr> m_any_listeners;
    std::size_t m_max_listeners = DEFAULT_MAX_LISTENERS;
    sker_core::IdGenerator m_ids;
    sker_core::BackgroundTasks m_pending;
};

} // namespace sker_event
