#pragma once

/// @file middleware.hpp
/// @brief Priority-ordered middleware pipeline
///
/// Middleware run as a chain of responsibility: each handler receives the
/// context and a `next` continuation, and the chain only advances when the
/// handler calls it. Lower priority values run first; equal priorities run
/// in registration order.

#include "fwd.hpp"

#include <sker/core/async.hpp>
#include <sker/core/error.hpp>
#include <sker/core/id.hpp>
#include <sker/core/value.hpp>
#include <sker/event/event_bus.hpp>

#include <any>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sker_kernel {

// =============================================================================
// MiddlewareContext
// =============================================================================

/// Per-unit-of-work state passed by reference through one chain
struct MiddlewareContext {
    std::any request;
    std::any response;
    sker_core::ValueStore data;
    sker_core::ValueStore metadata;
    std::string request_id;
    std::string trace_id;
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
    sker_core::CancellationToken cancellation;  ///< Cancelled when a timed execution gives up

    /// Fresh context; missing ids are generated
    [[nodiscard]] static MiddlewareContext create(std::string request_id = {}, std::string trace_id = {});

    template<typename T>
    [[nodiscard]] T* request_as() { return std::any_cast<T>(&request); }

    template<typename T>
    [[nodiscard]] const T* request_as() const { return std::any_cast<T>(&request); }

    template<typename T>
    [[nodiscard]] T* response_as() { return std::any_cast<T>(&response); }

    template<typename T>
    [[nodiscard]] const T* response_as() const { return std::any_cast<T>(&response); }

    [[nodiscard]] bool cancelled() const noexcept { return cancellation.is_cancelled(); }

    [[nodiscard]] std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at);
    }
};

// =============================================================================
// Middleware Types
// =============================================================================

/// Handle returned by use(), usable wherever a name is
struct MiddlewareId {
    std::uint64_t id = 0;

    [[nodiscard]] bool is_valid() const noexcept { return id != 0; }

    bool operator==(const MiddlewareId& other) const { return id == other.id; }
    bool operator!=(const MiddlewareId& other) const { return id != other.id; }
};

/// Continue with the rest of the chain. Returns the first downstream failure.
using Next = std::function<sker_core::Result<void>()>;

using MiddlewareHandler = std::function<sker_core::Result<void>(MiddlewareContext& ctx, const Next& next)>;

struct MiddlewareOptions {
    std::string name;
    std::int32_t priority = 0;  ///< Lower runs earlier
    bool enabled = true;
};

struct MiddlewareInfo {
    MiddlewareId id;
    std::string name;
    std::int32_t priority = 0;
    bool enabled = true;
};

// =============================================================================
// Middleware Events
// =============================================================================

/// Payload of middlewareAdded, middlewareRemoved, middlewareEnabled,
/// middlewareDisabled
struct MiddlewareEvent {
    MiddlewareInfo middleware;
};

struct MiddlewareInsertedEvent {
    MiddlewareInfo middleware;
    std::string anchor;
    bool before = true;
};

struct MiddlewaresClearedEvent {
    std::size_t count = 0;
};

/// Payload of middlewareExecuting and middlewareExecuted
struct MiddlewareExecutionEvent {
    std::string name;
    const MiddlewareContext* context = nullptr;
};

struct MiddlewareErrorEvent {
    std::string name;
    sker_core::Error error;
    const MiddlewareContext* context = nullptr;
};

/// Payload of middlewareChainCompleted and middlewareChainFailed
struct MiddlewareChainEvent {
    std::vector<std::string> executed;
    std::optional<sker_core::Error> error;
    const MiddlewareContext* context = nullptr;
};

struct MiddlewareTimeoutEvent {
    std::int64_t timeout_ms = 0;
    const MiddlewareContext* context = nullptr;
};

// =============================================================================
// MiddlewareManager
// =============================================================================

class MiddlewareManager {
public:
    MiddlewareManager() = default;
    ~MiddlewareManager();

    MiddlewareManager(const MiddlewareManager&) = delete;
    MiddlewareManager& operator=(const MiddlewareManager&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Append a middleware
    /// @return InvalidArgument for an empty handler
    sker_core::Result<MiddlewareId> use(MiddlewareHandler handler, MiddlewareOptions options = {});

    /// Remove the first middleware with this name (or id)
    bool remove(const std::string& name);
    bool remove(MiddlewareId id);

    /// Toggle without reordering. False if no such middleware.
    bool enable(const std::string& name);
    bool enable(MiddlewareId id);
    bool disable(const std::string& name);
    bool disable(MiddlewareId id);

    void clear();

    /// Insert right before the named middleware in execution order.
    /// options.priority is ignored: the new entry takes the anchor's priority
    /// so it stays next to the anchor. False if the anchor does not exist.
    bool insert_before(const std::string& anchor, MiddlewareHandler handler, MiddlewareOptions options = {});

    /// Insert right after the named middleware in execution order.
    /// Priority is taken from the anchor, as for insert_before.
    bool insert_after(const std::string& anchor, MiddlewareHandler handler, MiddlewareOptions options = {});

    // =========================================================================
    // Execution
    // =========================================================================

    /// Run the enabled middleware in order. An empty chain succeeds without
    /// emitting anything.
    sker_core::Result<void> execute(MiddlewareContext& ctx);

    /// Run the chain against a timer. On timeout the context's token is
    /// cancelled, middlewareTimeout is emitted and a Timeout error returned;
    /// the chain itself keeps running in the background until it notices.
    sker_core::Result<void> execute_with_timeout(
        std::shared_ptr<MiddlewareContext> ctx, std::chrono::milliseconds timeout);

    // =========================================================================
    // Queries
    // =========================================================================

    /// Registration order
    [[nodiscard]] std::vector<MiddlewareInfo> middlewares() const;

    /// Enabled names in execution order (anonymous entries as "anonymous-N")
    [[nodiscard]] std::vector<std::string> execution_order() const;

    [[nodiscard]] std::size_t middleware_count() const;
    [[nodiscard]] std::size_t enabled_middleware_count() const;

    [[nodiscard]] bool has_middleware(const std::string& name) const;
    [[nodiscard]] bool has_middleware(MiddlewareId id) const;

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
    struct Entry {
        MiddlewareId id;
        std::string name;
        MiddlewareHandler handler;
        std::int32_t priority = 0;
        bool enabled = true;

        [[nodiscard]] MiddlewareInfo info() const { return MiddlewareInfo{id, name, priority, enabled}; }
    };

    using EntryPtr = std::shared_ptr<Entry>;

    /// Per-execution state shared by the continuations of one chain
    struct Chain {
        std::vector<Entry> entries;
        std::vector<std::string> executed;
        bool error_raised = false;
    };

    sker_core::Result<void> run_from(Chain& chain, MiddlewareContext& ctx, std::size_t index);

    bool insert_relative(const std::string& anchor, MiddlewareHandler handler,
                         MiddlewareOptions options, bool before);

    bool set_enabled(const std::function<bool(const Entry&)>& match, bool enabled);

    bool remove_if(const std::function<bool(const Entry&)>& match);

    /// Enabled entries in execution order. Caller holds m_mutex.
    std::vector<Entry> enabled_chain() const;

    /// Rebuild the sorted view if membership or priorities changed. Caller
    /// holds m_mutex.
    void ensure_sorted() const;

    static std::string display_name(const Entry& entry, std::size_t index);

    sker_event::EventBus m_events{"middleware"};

    mutable std::mutex m_mutex;
    std::vector<EntryPtr> m_entries;
    mutable std::vector<EntryPtr> m_sorted;
    mutable bool m_sorted_valid = true;
    sker_core::IdGenerator m_ids;

    sker_core::BackgroundTasks m_background;
};

} // namespace sker_kernel
