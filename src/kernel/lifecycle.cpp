/// @file lifecycle.cpp
/// @brief LifecycleManager implementation

#include <sker/kernel/lifecycle.hpp>
#include <sker/kernel/signals.hpp>
#include <sker/core/log.hpp>

#include <algorithm>

namespace sker_kernel {

using sker_core::CancellationToken;
using sker_core::Err;
using sker_core::Error;
using sker_core::ErrorCode;
using sker_core::LifecycleError;
using sker_core::Ok;
using sker_core::Result;

namespace events = sker_event::events;

const char* lifecycle_state_name(LifecycleState state) {
    switch (state) {
        case LifecycleState::Created: return "created";
        case LifecycleState::Starting: return "starting";
        case LifecycleState::Started: return "started";
        case LifecycleState::Stopping: return "stopping";
        case LifecycleState::Stopped: return "stopped";
        case LifecycleState::Error: return "error";
        default: return "unknown";
    }
}

const char* hook_phase_name(HookPhase phase) {
    switch (phase) {
        case HookPhase::Start: return "start";
        case HookPhase::Stop: return "stop";
        default: return "unknown";
    }
}

namespace {

HookHandler adapt(SimpleHookHandler handler) {
    if (!handler) {
        return {};
    }
    return [handler = std::move(handler)](const CancellationToken&) { return handler(); };
}

std::string resolve_hook_name(const std::string& name, HookPhase phase) {
    if (!name.empty()) {
        return name;
    }
    return std::string("anonymous-") + hook_phase_name(phase) + "-hook";
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

LifecycleManager::LifecycleManager(LifecycleOptions options)
    : m_options(options)
{
    if (!m_options.graceful_shutdown) {
        return;
    }

    auto watcher = ShutdownSignalWatcher::install([this](int) {
        auto result = stop();
        if (!result) {
            sker_core::lifecycle_logger()->error(
                "Stop after shutdown signal failed: {}", sker_core::build_error_chain(result.error()));
        }
    });

    if (watcher) {
        m_signal_watcher = std::move(watcher).value();
    } else {
        sker_core::lifecycle_logger()->warn(
            "Graceful shutdown disabled: {}", watcher.error().message());
    }
}

LifecycleManager::~LifecycleManager() {
    // The watcher may be inside stop(); it must be gone before members are
    m_signal_watcher.reset();
    m_background.join_all();
}

// =============================================================================
// Hook Registration
// =============================================================================

Result<void> LifecycleManager::on_start(HookHandler handler, HookOptions options) {
    if (!handler) {
        return Err(Error(ErrorCode::InvalidArgument, "Start hook handler is required"));
    }

    std::lock_guard<std::mutex> lock(m_hooks_mutex);
    m_start_hooks.push_back(Hook{
        resolve_hook_name(options.name, HookPhase::Start), std::move(handler), options.timeout});
    return Ok();
}

Result<void> LifecycleManager::on_start(SimpleHookHandler handler, HookOptions options) {
    return on_start(adapt(std::move(handler)), std::move(options));
}

Result<void> LifecycleManager::on_stop(HookHandler handler, HookOptions options) {
    if (!handler) {
        return Err(Error(ErrorCode::InvalidArgument, "Stop hook handler is required"));
    }

    // Last registered, first stopped
    std::lock_guard<std::mutex> lock(m_hooks_mutex);
    m_stop_hooks.insert(m_stop_hooks.begin(), Hook{
        resolve_hook_name(options.name, HookPhase::Stop), std::move(handler), options.timeout});
    return Ok();
}

Result<void> LifecycleManager::on_stop(SimpleHookHandler handler, HookOptions options) {
    return on_stop(adapt(std::move(handler)), std::move(options));
}

bool LifecycleManager::remove_start_hook(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_hooks_mutex);
    auto it = std::find_if(m_start_hooks.begin(), m_start_hooks.end(),
        [&name](const Hook& hook) { return hook.name == name; });
    if (it == m_start_hooks.end()) {
        return false;
    }
    m_start_hooks.erase(it);
    return true;
}

bool LifecycleManager::remove_stop_hook(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_hooks_mutex);
    auto it = std::find_if(m_stop_hooks.begin(), m_stop_hooks.end(),
        [&name](const Hook& hook) { return hook.name == name; });
    if (it == m_stop_hooks.end()) {
        return false;
    }
    m_stop_hooks.erase(it);
    return true;
}

std::size_t LifecycleManager::start_hook_count() const {
    std::lock_guard<std::mutex> lock(m_hooks_mutex);
    return m_start_hooks.size();
}

std::size_t LifecycleManager::stop_hook_count() const {
    std::lock_guard<std::mutex> lock(m_hooks_mutex);
    return m_stop_hooks.size();
}

// =============================================================================
// Transitions
// =============================================================================

Result<void> LifecycleManager::start() {
    std::promise<Result<void>> promise;
    LifecycleState previous;
    {
        std::unique_lock<std::mutex> lock(m_operation_mutex);
        if (m_start_operation) {
            Operation pending = *m_start_operation;
            lock.unlock();
            return pending.get();
        }

        LifecycleState current = state();
        if (current == LifecycleState::Started) {
            return Ok();
        }
        if (current != LifecycleState::Created && current != LifecycleState::Stopped) {
            return Err(LifecycleError::invalid_state("start", lifecycle_state_name(current)));
        }

        m_start_operation = promise.get_future().share();
        previous = exchange_state(LifecycleState::Starting);
    }

    Result<void> result = run_start(previous);
    promise.set_value(result);

    std::lock_guard<std::mutex> lock(m_operation_mutex);
    m_start_operation.reset();
    return result;
}

Result<void> LifecycleManager::stop() {
    std::promise<Result<void>> promise;
    LifecycleState previous;
    {
        std::unique_lock<std::mutex> lock(m_operation_mutex);
        if (m_stop_operation) {
            Operation pending = *m_stop_operation;
            lock.unlock();
            return pending.get();
        }

        LifecycleState current = state();
        if (current == LifecycleState::Stopped) {
            return Ok();
        }
        if (current != LifecycleState::Started && current != LifecycleState::Error) {
            return Err(LifecycleError::invalid_state("stop", lifecycle_state_name(current)));
        }

        m_stop_operation = promise.get_future().share();
        previous = exchange_state(LifecycleState::Stopping);
    }

    Result<void> result = run_stop(previous);
    promise.set_value(result);

    std::lock_guard<std::mutex> lock(m_operation_mutex);
    m_stop_operation.reset();
    return result;
}

Result<void> LifecycleManager::restart() {
    LifecycleState current = state();
    if (current == LifecycleState::Started || current == LifecycleState::Error) {
        auto stopped = stop();
        if (!stopped) {
            return stopped;
        }
    }
    return start();
}

Result<void> LifecycleManager::run_start(LifecycleState previous) {
    notify_state_changed(previous, LifecycleState::Starting);
    m_events.emit(events::LIFECYCLE_STARTING);
    sker_core::lifecycle_logger()->debug("Starting lifecycle");

    std::vector<Hook> hooks;
    {
        std::lock_guard<std::mutex> lock(m_hooks_mutex);
        hooks = m_start_hooks;
    }

    for (const auto& hook : hooks) {
        auto result = execute_hook(hook, HookPhase::Start);
        if (!result) {
            Error err(LifecycleError::start_failed(hook.name, result.error().message()));
            err.with_cause(result.error());

            set_state(LifecycleState::Error);
            sker_core::lifecycle_logger()->error("{}", err.message());
            m_events.emit(events::GENERIC_ERROR, sker_event::ErrorEvent{err, events::LIFECYCLE_STARTING});
            return Err(std::move(err));
        }
    }

    set_state(LifecycleState::Started);
    m_events.emit(events::LIFECYCLE_STARTED);
    sker_core::lifecycle_logger()->info("Lifecycle started ({} hook(s))", hooks.size());
    return Ok();
}

Result<void> LifecycleManager::run_stop(LifecycleState previous) {
    notify_state_changed(previous, LifecycleState::Stopping);
    m_events.emit(events::LIFECYCLE_STOPPING);
    sker_core::lifecycle_logger()->debug("Stopping lifecycle");

    std::vector<Hook> hooks;
    {
        std::lock_guard<std::mutex> lock(m_hooks_mutex);
        hooks = m_stop_hooks;
    }

    std::vector<Error> failures;
    for (const auto& hook : hooks) {
        auto result = execute_hook(hook, HookPhase::Stop);
        if (!result) {
            failures.push_back(result.error());
        }
    }

    if (!failures.empty()) {
        std::string summary = std::to_string(failures.size()) + " stop hook(s) failed:";
        for (const auto& failure : failures) {
            summary += " " + failure.message() + ";";
        }
        summary.pop_back();

        Error err(LifecycleError::stop_failed(summary));
        for (auto& failure : failures) {
            err.add_child(std::move(failure));
        }

        set_state(LifecycleState::Error);
        sker_core::lifecycle_logger()->error("{}", err.message());
        m_events.emit(events::GENERIC_ERROR, sker_event::ErrorEvent{err, events::LIFECYCLE_STOPPING});
        return Err(std::move(err));
    }

    set_state(LifecycleState::Stopped);
    m_events.emit(events::LIFECYCLE_STOPPED);
    sker_core::lifecycle_logger()->info("Lifecycle stopped");
    return Ok();
}

Result<void> LifecycleManager::execute_hook(const Hook& hook, HookPhase phase) {
    const char* phase_name = hook_phase_name(phase);
    std::chrono::milliseconds timeout = hook.timeout.value_or(
        phase == HookPhase::Start ? m_options.start_timeout : m_options.stop_timeout);

    m_events.emit(events::LIFECYCLE_HOOK_EXECUTING, HookEvent{hook.name, phase, std::nullopt});
    sker_core::lifecycle_logger()->debug("Executing {} hook \"{}\"", phase_name, hook.name);

    // Both are captured by value: a timed-out hook outlives this frame
    CancellationToken token;
    HookHandler handler = hook.handler;
    auto result = sker_core::run_with_timeout<void>(
        m_background,
        [handler, token]() { return handler(token); },
        timeout,
        token);

    if (result) {
        m_events.emit(events::LIFECYCLE_HOOK_EXECUTED, HookEvent{hook.name, phase, std::nullopt});
        return Ok();
    }

    Error err = (result.error().code() == ErrorCode::Timeout && token.is_cancelled())
        ? Error(LifecycleError::hook_timeout(hook.name, phase_name, timeout.count()))
        : Error(LifecycleError::hook_failed(hook.name, phase_name, result.error().message()));
    err.with_cause(result.error());

    sker_core::lifecycle_logger()->warn("{}", err.message());
    m_events.emit(events::LIFECYCLE_HOOK_ERROR, HookEvent{hook.name, phase, err});
    return Err(std::move(err));
}

// =============================================================================
// State
// =============================================================================

LifecycleState LifecycleManager::state() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_state;
}

bool LifecycleManager::wait_for_state(LifecycleState target, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_state_mutex);
    return m_state_cv.wait_for(lock, timeout, [this, target] { return m_state == target; });
}

LifecycleState LifecycleManager::exchange_state(LifecycleState next) {
    LifecycleState previous;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        previous = m_state;
        m_state = next;
    }
    m_state_cv.notify_all();
    return previous;
}

void LifecycleManager::set_state(LifecycleState next) {
    LifecycleState previous = exchange_state(next);
    notify_state_changed(previous, next);
}

void LifecycleManager::notify_state_changed(LifecycleState old_state, LifecycleState new_state) {
    sker_core::lifecycle_logger()->debug("State: {} -> {}",
        lifecycle_state_name(old_state), lifecycle_state_name(new_state));
    m_events.emit(events::LIFECYCLE_STATE_CHANGED, StateChangedEvent{old_state, new_state});
}

} // namespace sker_kernel
