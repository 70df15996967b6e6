#pragma once

/// @file lifecycle.hpp
/// @brief Lifecycle state machine with start/stop hooks
///
/// States: Created -> Starting -> Started -> Stopping -> Stopped, with
/// Error reachable from Starting (a start hook failed) or Stopping (a stop
/// hook failed). Start is fail-fast, stop is best-effort.

#include "fwd.hpp"

#include <sker/core/async.hpp>
#include <sker/core/error.hpp>
#include <sker/event/event_bus.hpp>

#include <any>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sker_kernel {

// =============================================================================
// Lifecycle Types
// =============================================================================

enum class LifecycleState : std::uint8_t {
    Created,
    Starting,
    Started,
    Stopping,
    Stopped,
    Error,
};

[[nodiscard]] const char* lifecycle_state_name(LifecycleState state);

enum class HookPhase : std::uint8_t {
    Start,
    Stop,
};

[[nodiscard]] const char* hook_phase_name(HookPhase phase);

/// Hook receiving the token that is cancelled if the hook times out
using HookHandler = std::function<sker_core::Result<void>(const sker_core::CancellationToken&)>;

/// Hook that does not observe cancellation
using SimpleHookHandler = std::function<sker_core::Result<void>()>;

struct HookOptions {
    std::string name;                                 ///< Empty: anonymous
    std::optional<std::chrono::milliseconds> timeout; ///< Falls back to the manager default
};

struct LifecycleOptions {
    std::chrono::milliseconds start_timeout{30000};  ///< Default per start hook, 0 = no timer
    std::chrono::milliseconds stop_timeout{10000};   ///< Default per stop hook, 0 = no timer
    bool graceful_shutdown = false;                  ///< stop() on SIGINT/SIGTERM
};

/// Payload of events::LIFECYCLE_STATE_CHANGED
struct StateChangedEvent {
    LifecycleState old_state;
    LifecycleState new_state;
};

/// Payload of the hookExecuting / hookExecuted / hookError events
struct HookEvent {
    std::string name;
    HookPhase phase;
    std::optional<sker_core::Error> error;
};

// =============================================================================
// Lifecycle Manager
// =============================================================================

class LifecycleManager {
public:
    explicit LifecycleManager(LifecycleOptions options = {});
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    // =========================================================================
    // Hook Registration
    // =========================================================================

    /// Append a start hook. Start hooks run in registration order.
    sker_core::Result<void> on_start(HookHandler handler, HookOptions options = {});
    sker_core::Result<void> on_start(SimpleHookHandler handler, HookOptions options = {});

    /// Add a stop hook. Stop hooks run in reverse registration order.
    sker_core::Result<void> on_stop(HookHandler handler, HookOptions options = {});
    sker_core::Result<void> on_stop(SimpleHookHandler handler, HookOptions options = {});

    /// Remove the first hook with this name
    bool remove_start_hook(const std::string& name);
    bool remove_stop_hook(const std::string& name);

    [[nodiscard]] std::size_t start_hook_count() const;
    [[nodiscard]] std::size_t stop_hook_count() const;

    // =========================================================================
    // Transitions
    // =========================================================================

    /// Run the start hooks. Concurrent callers share one run and its result.
    /// No-op when already Started; InvalidState unless Created or Stopped.
    sker_core::Result<void> start();

    /// Run every stop hook, collecting failures. Allowed from Started or
    /// Error; no-op when already Stopped.
    sker_core::Result<void> stop();

    /// stop() when Started or Error, then start()
    sker_core::Result<void> restart();

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] LifecycleState state() const;
    [[nodiscard]] bool is_started() const { return state() == LifecycleState::Started; }
    [[nodiscard]] bool is_stopped() const { return state() == LifecycleState::Stopped; }
    [[nodiscard]] bool is_starting() const { return state() == LifecycleState::Starting; }
    [[nodiscard]] bool is_stopping() const { return state() == LifecycleState::Stopping; }

    /// Block until the manager reaches @p target or the timeout expires
    bool wait_for_state(LifecycleState target, std::chrono::milliseconds timeout) const;

    [[nodiscard]] const LifecycleOptions& options() const noexcept { return m_options; }

    /// True when SIGINT/SIGTERM interception is active
    [[nodiscard]] bool handles_signals() const noexcept { return m_signal_watcher != nullptr; }

    // =========================================================================
    // Events
    // =========================================================================

    [[nodiscard]] sker_event::EventBus& events() noexcept { return m_events; }

    sker_core::Result<sker_event::ListenerId> on(const std::string& event, sker_event::Handler handler) {
        return m_events.on(event, std::move(handler));
    }

    sker_core::Result<sker_event::ListenerId> once(const std::string& event, sker_event::Handler handler) {
        return m_events.once(event, std::move(handler));
    }

    void off(const std::string& event, sker_event::ListenerId id) { m_events.off(event, id); }

    void emit(const std::string& event, const std::any& payload = {}) { m_events.emit(event, payload); }

private:
    struct Hook {
        std::string name;
        HookHandler handler;
        std::optional<std::chrono::milliseconds> timeout;
    };

    /// Run shared by start()/stop() callers: either joins an in-flight
    /// operation or becomes its owner
    using Operation = std::shared_future<sker_core::Result<void>>;

    sker_core::Result<void> run_start(LifecycleState previous);
    sker_core::Result<void> run_stop(LifecycleState previous);
    sker_core::Result<void> execute_hook(const Hook& hook, HookPhase phase);

    /// Swap the state without notifying; returns the previous state
    LifecycleState exchange_state(LifecycleState next);

    /// Swap the state and emit stateChanged
    void set_state(LifecycleState next);

    void notify_state_changed(LifecycleState old_state, LifecycleState new_state);

    LifecycleOptions m_options;
    sker_event::EventBus m_events{"lifecycle"};

    mutable std::mutex m_hooks_mutex;
    std::vector<Hook> m_start_hooks;
    std::vector<Hook> m_stop_hooks;

    mutable std::mutex m_state_mutex;
    mutable std::condition_variable m_state_cv;
    LifecycleState m_state = LifecycleState::Created;

    std::mutex m_operation_mutex;
    std::optional<Operation> m_start_operation;
    std::optional<Operation> m_stop_operation;

    sker_core::BackgroundTasks m_background;
    std::unique_ptr<ShutdownSignalWatcher> m_signal_watcher;
};

} // namespace sker_kernel
