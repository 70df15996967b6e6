/// @file event_bus.cpp
/// @brief EventBus implementation

#include <sker/event/event_bus.hpp>
#include <sker/core/log.hpp>

#include <algorithm>
#include <mutex>
#include <typeinfo>

namespace sker_event {

using sker_core::Err;
using sker_core::Error;
using sker_core::ErrorCode;
using sker_core::EventError;
using sker_core::Ok;
using sker_core::Result;

// =============================================================================
// Construction
// =============================================================================

EventBus::EventBus() : m_name("bus") {}

EventBus::EventBus(std::string name) : m_name(std::move(name)) {}

EventBus::~EventBus() {
    // Watchers of un-awaited listeners call back into this bus
    m_pending.join_all();
}

// =============================================================================
// Subscription
// =============================================================================

Result<ListenerId> EventBus::on(const std::string& event, Handler handler) {
    if (!handler) {
        return Err<ListenerId>(EventError::invalid_argument("handler is required"));
    }
    auto listener = std::make_shared<Listener>();
    listener->handler = std::move(handler);
    return add_listener(event, std::move(listener));
}

Result<ListenerId> EventBus::once(const std::string& event, Handler handler) {
    if (!handler) {
        return Err<ListenerId>(EventError::invalid_argument("handler is required"));
    }
    auto listener = std::make_shared<Listener>();
    listener->handler = std::move(handler);
    listener->once = true;
    return add_listener(event, std::move(listener));
}

Result<ListenerId> EventBus::on_async(const std::string& event, AsyncHandler handler) {
    if (!handler) {
        return Err<ListenerId>(EventError::invalid_argument("handler is required"));
    }
    auto listener = std::make_shared<Listener>();
    listener->async_handler = std::move(handler);
    return add_listener(event, std::move(listener));
}

Result<ListenerId> EventBus::add_listener(const std::string& event, ListenerPtr listener) {
    if (event.empty()) {
        return Err<ListenerId>(EventError::invalid_argument("event name is required"));
    }

    listener->id = ListenerId{m_ids.next()};
    ListenerId id = listener->id;

    std::size_t count = 0;
    std::size_t max = 0;
    {
        std::unique_lock lock(m_mutex);
        auto& listeners = m_listeners[event];
        listeners.push_back(std::move(listener));
        count = listeners.size();
        max = m_max_listeners;
    }

    if (max > 0 && count > max) {
        sker_core::event_logger()->warn(
            "[{}] Maximum listeners ({}) exceeded for event \"{}\" ({} registered). "
            "This could indicate a leak.", m_name, max, event, count);
    }

    return Ok(id);
}

void EventBus::off(const std::string& event, ListenerId id) {
    std::unique_lock lock(m_mutex);
    auto it = m_listeners.find(event);
    if (it == m_listeners.end()) {
        return;
    }

    auto& listeners = it->second;
    auto found = std::find_if(listeners.begin(), listeners.end(),
        [id](const ListenerPtr& l) { return l->id == id; });
    if (found != listeners.end()) {
        (*found)->removed.store(true, std::memory_order_release);
        listeners.erase(found);
    }
    if (listeners.empty()) {
        m_listeners.erase(it);
    }
}

void EventBus::off(const std::string& event) {
    remove_all_listeners(event);
}

ListenerId EventBus::on_any(AnyHandler handler) {
    auto listener = std::make_shared<AnyListener>();
    listener->id = ListenerId{m_ids.next()};
    listener->handler = std::move(handler);
    ListenerId id = listener->id;

    std::unique_lock lock(m_mutex);
    m_any_listeners.push_back(std::move(listener));
    return id;
}

void EventBus::off_any(ListenerId id) {
    std::unique_lock lock(m_mutex);
    auto found = std::find_if(m_any_listeners.begin(), m_any_listeners.end(),
        [id](const AnyListenerPtr& l) { return l->id == id; });
    if (found != m_any_listeners.end()) {
        (*found)->removed.store(true, std::memory_order_release);
        m_any_listeners.erase(found);
    }
}

void EventBus::remove_all_listeners() {
    std::unique_lock lock(m_mutex);
    for (auto& [event, listeners] : m_listeners) {
        for (auto& listener : listeners) {
            listener->removed.store(true, std::memory_order_release);
        }
    }
    m_listeners.clear();
}

void EventBus::remove_all_listeners(const std::string& event) {
    std::unique_lock lock(m_mutex);
    auto it = m_listeners.find(event);
    if (it == m_listeners.end()) {
        return;
    }
    for (auto& listener : it->second) {
        listener->removed.store(true, std::memory_order_release);
    }
    m_listeners.erase(it);
}

// =============================================================================
// Publishing
// =============================================================================

void EventBus::emit(const std::string& event, const std::any& payload) {
    if (event.empty()) {
        sker_core::event_logger()->warn("[{}] emit() called without an event name, ignored", m_name);
        return;
    }

    std::vector<ListenerPtr> snapshot;
    {
        std::shared_lock lock(m_mutex);
        auto it = m_listeners.find(event);
        if (it != m_listeners.end()) {
            snapshot = it->second;
        }
    }

    for (const auto& listener : snapshot) {
        if (!claim(event, listener)) {
            continue;
        }
        auto result = invoke(event, listener, payload, false);
        if (!result) {
            report_failure(event, result.error());
        }
    }

    invoke_any(event, payload);
}

Result<void> EventBus::emit_async(const std::string& event, const std::any& payload) {
    if (event.empty()) {
        return Err(EventError::invalid_argument("event name is required"));
    }

    std::vector<ListenerPtr> snapshot;
    {
        std::shared_lock lock(m_mutex);
        auto it = m_listeners.find(event);
        if (it != m_listeners.end()) {
            snapshot = it->second;
        }
    }

    std::vector<Error> failures;
    for (const auto& listener : snapshot) {
        if (!claim(event, listener)) {
            continue;
        }
        auto result = invoke(event, listener, payload, true);
        if (!result) {
            report_failure(event, result.error());
            failures.push_back(result.error());
        }
    }

    invoke_any(event, payload);

    if (!failures.empty()) {
        Error err(EventError::handler_failed(event, std::to_string(failures.size()) + " listener(s) failed"));
        for (auto& failure : failures) {
            err.add_child(std::move(failure));
        }
        return Err(std::move(err));
    }
    return Ok();
}

void EventBus::wait_for_pending() {
    m_pending.join_all();
}

bool EventBus::claim(const std::string& event, const ListenerPtr& listener) {
    if (!listener->once) {
        return !listener->removed.load(std::memory_order_acquire);
    }

    // A fire-once listener is unregistered before it runs
    if (listener->removed.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }

    std::unique_lock lock(m_mutex);
    auto it = m_listeners.find(event);
    if (it != m_listeners.end()) {
        auto& listeners = it->second;
        listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
        if (listeners.empty()) {
            m_listeners.erase(it);
        }
    }
    return true;
}

Result<void> EventBus::invoke(
    const std::string& event, const ListenerPtr& listener, const std::any& payload, bool await)
{
    if (listener->handler) {
        return sker_core::invoke_guarded([&] { listener->handler(payload); }, ErrorCode::EventFailed);
    }

    auto started = sker_core::invoke_guarded(
        [&]() -> Result<std::future<void>> { return listener->async_handler(payload); },
        ErrorCode::EventFailed);
    if (!started) {
        return Err(started.error());
    }

    auto future = std::make_shared<std::future<void>>(std::move(started).value());
    if (!future->valid()) {
        return Ok();
    }

    if (await) {
        return sker_core::invoke_guarded([&] { future->get(); }, ErrorCode::EventFailed);
    }

    m_pending.spawn([this, event, future]() {
        auto result = sker_core::invoke_guarded([&] { future->get(); }, ErrorCode::EventFailed);
        if (!result) {
            report_failure(event, result.error());
        }
    });
    return Ok();
}

void EventBus::invoke_any(const std::string& event, const std::any& payload) {
    std::vector<AnyListenerPtr> snapshot;
    {
        std::shared_lock lock(m_mutex);
        snapshot = m_any_listeners;
    }

    for (const auto& listener : snapshot) {
        if (listener->removed.load(std::memory_order_acquire)) {
            continue;
        }
        auto result = sker_core::invoke_guarded(
            [&] { listener->handler(event, payload); }, ErrorCode::EventFailed);
        if (!result) {
            report_failure(event, result.error());
        }
    }
}

void EventBus::report_failure(const std::string& event, const Error& error) {
    if (event == events::GENERIC_ERROR) {
        sker_core::event_logger()->error(
            "[{}] Listener for \"{}\" failed while handling an error: {}",
            m_name, event, sker_core::build_error_chain(error));
        return;
    }

    sker_core::event_logger()->warn(
        "[{}] Listener for \"{}\" failed: {}", m_name, event, error.message());

    emit(events::GENERIC_ERROR, ErrorEvent{error, event});
}

void EventBus::report_type_mismatch(const std::string& event, const std::any& payload) {
    sker_core::event_logger()->debug(
        "Typed listener for \"{}\" skipped payload of type {}", event, payload.type().name());
}

// =============================================================================
// Introspection
// =============================================================================

std::size_t EventBus::listener_count(const std::string& event) const {
    std::shared_lock lock(m_mutex);
    auto it = m_listeners.find(event);
    return it != m_listeners.end() ? it->second.size() : 0;
}

std::vector<std::string> EventBus::event_names() const {
    std::shared_lock lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_listeners.size());
    for (const auto& [event, listeners] : m_listeners) {
        if (!listeners.empty()) {
            names.push_back(event);
        }
    }
    return names;
}

void EventBus::set_max_listeners(std::size_t max) {
    std::unique_lock lock(m_mutex);
    m_max_listeners = max;
}

std::size_t EventBus::max_listeners() const {
    std::shared_lock lock(m_mutex);
    return m_max_listeners;
}

} // namespace sker_event
