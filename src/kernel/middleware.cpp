/// @file middleware.cpp
/// @brief MiddlewareManager implementation

#include <sker/kernel/middleware.hpp>
#include <sker/core/log.hpp>

#include <algorithm>

namespace sker_kernel {

using sker_core::Err;
using sker_core::Error;
using sker_core::ErrorCode;
using sker_core::MiddlewareError;
using sker_core::Ok;
using sker_core::Result;

namespace events = sker_event::events;

// =============================================================================
// MiddlewareContext
// =============================================================================

MiddlewareContext MiddlewareContext::create(std::string request_id, std::string trace_id) {
    MiddlewareContext ctx;
    ctx.request_id = request_id.empty() ? sker_core::generate_uuid() : std::move(request_id);
    ctx.trace_id = trace_id.empty() ? sker_core::generate_uuid() : std::move(trace_id);
    return ctx;
}

// =============================================================================
// Registration
// =============================================================================

MiddlewareManager::~MiddlewareManager() {
    // Chains abandoned by execute_with_timeout still reference this manager
    m_background.join_all();
}

Result<MiddlewareId> MiddlewareManager::use(MiddlewareHandler handler, MiddlewareOptions options) {
    if (!handler) {
        return Err<MiddlewareId>(MiddlewareError::invalid_argument("Middleware handler must be callable"));
    }

    auto entry = std::make_shared<Entry>();
    entry->id = MiddlewareId{m_ids.next()};
    entry->name = std::move(options.name);
    entry->handler = std::move(handler);
    entry->priority = options.priority;
    entry->enabled = options.enabled;
    MiddlewareInfo info = entry->info();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.push_back(std::move(entry));
        m_sorted_valid = false;
    }

    sker_core::middleware_logger()->debug("Added middleware \"{}\" (priority {})", info.name, info.priority);
    m_events.emit(events::MIDDLEWARE_ADDED, MiddlewareEvent{info});
    return Ok(info.id);
}

bool MiddlewareManager::remove(const std::string& name) {
    return remove_if([&name](const Entry& entry) { return entry.name == name; });
}

bool MiddlewareManager::remove(MiddlewareId id) {
    return remove_if([id](const Entry& entry) { return entry.id == id; });
}

bool MiddlewareManager::remove_if(const std::function<bool(const Entry&)>& match) {
    MiddlewareInfo info;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_entries.begin(), m_entries.end(),
            [&match](const EntryPtr& entry) { return match(*entry); });
        if (it == m_entries.end()) {
            return false;
        }
        info = (*it)->info();
        m_entries.erase(it);
        m_sorted_valid = false;
    }

    sker_core::middleware_logger()->debug("Removed middleware \"{}\"", info.name);
    m_events.emit(events::MIDDLEWARE_REMOVED, MiddlewareEvent{info});
    return true;
}

bool MiddlewareManager::enable(const std::string& name) {
    return set_enabled([&name](const Entry& entry) { return entry.name == name; }, true);
}

bool MiddlewareManager::enable(MiddlewareId id) {
    return set_enabled([id](const Entry& entry) { return entry.id == id; }, true);
}

bool MiddlewareManager::disable(const std::string& name) {
    return set_enabled([&name](const Entry& entry) { return entry.name == name; }, false);
}

bool MiddlewareManager::disable(MiddlewareId id) {
    return set_enabled([id](const Entry& entry) { return entry.id == id; }, false);
}

bool MiddlewareManager::set_enabled(const std::function<bool(const Entry&)>& match, bool enabled) {
    MiddlewareInfo info;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_entries.begin(), m_entries.end(),
            [&match](const EntryPtr& entry) { return match(*entry); });
        if (it == m_entries.end()) {
            return false;
        }
        // The sorted view holds the same entries; no reorder needed
        (*it)->enabled = enabled;
        info = (*it)->info();
    }

    m_events.emit(enabled ? events::MIDDLEWARE_ENABLED : events::MIDDLEWARE_DISABLED, MiddlewareEvent{info});
    return true;
}

void MiddlewareManager::clear() {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        count = m_entries.size();
        m_entries.clear();
        m_sorted.clear();
        m_sorted_valid = true;
    }

    sker_core::middleware_logger()->debug("Cleared {} middleware", count);
    m_events.emit(events::MIDDLEWARES_CLEARED, MiddlewaresClearedEvent{count});
}

bool MiddlewareManager::insert_before(const std::string& anchor, MiddlewareHandler handler, MiddlewareOptions options) {
    return insert_relative(anchor, std::move(handler), std::move(options), true);
}

bool MiddlewareManager::insert_after(const std::string& anchor, MiddlewareHandler handler, MiddlewareOptions options) {
    return insert_relative(anchor, std::move(handler), std::move(options), false);
}

bool MiddlewareManager::insert_relative(
    const std::string& anchor, MiddlewareHandler handler, MiddlewareOptions options, bool before)
{
    if (!handler) {
        sker_core::middleware_logger()->warn("Ignoring insert next to \"{}\": handler is not callable", anchor);
        return false;
    }

    MiddlewareInfo info;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_entries.begin(), m_entries.end(),
            [&anchor](const EntryPtr& entry) { return entry->name == anchor; });
        if (it == m_entries.end()) {
            return false;
        }

        // Same priority as the anchor and adjacent to it in registration
        // order, so the stable sort keeps the two side by side
        auto entry = std::make_shared<Entry>();
        entry->id = MiddlewareId{m_ids.next()};
        entry->name = std::move(options.name);
        entry->handler = std::move(handler);
        entry->priority = (*it)->priority;
        entry->enabled = options.enabled;
        info = entry->info();

        if (options.priority != 0 && options.priority != entry->priority) {
            sker_core::middleware_logger()->debug(
                "Middleware \"{}\" takes priority {} from \"{}\" instead of {}",
                info.name, entry->priority, anchor, options.priority);
        }

        m_entries.insert(before ? it : std::next(it), std::move(entry));
        m_sorted_valid = false;
    }

    sker_core::middleware_logger()->debug("Inserted middleware \"{}\" {} \"{}\"",
        info.name, before ? "before" : "after", anchor);
    m_events.emit(events::MIDDLEWARE_INSERTED, MiddlewareInsertedEvent{info, anchor, before});
    return true;
}

// =============================================================================
// Execution
// =============================================================================

Result<void> MiddlewareManager::execute(MiddlewareContext& ctx) {
    Chain chain;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        chain.entries = enabled_chain();
    }

    if (chain.entries.empty()) {
        return Ok();
    }

    auto result = run_from(chain, ctx, 0);
    if (!result) {
        sker_core::middleware_logger()->warn("Middleware chain failed after {} handler(s): {}",
            chain.executed.size(), result.error().message());
        m_events.emit(events::MIDDLEWARE_CHAIN_FAILED,
            MiddlewareChainEvent{chain.executed, result.error(), &ctx});
        return result;
    }

    m_events.emit(events::MIDDLEWARE_CHAIN_COMPLETED, MiddlewareChainEvent{chain.executed, std::nullopt, &ctx});
    return Ok();
}

Result<void> MiddlewareManager::run_from(Chain& chain, MiddlewareContext& ctx, std::size_t index) {
    if (index >= chain.entries.size()) {
        return Ok();
    }

    const Entry& entry = chain.entries[index];
    std::string name = display_name(entry, index);

    if (ctx.cancelled()) {
        chain.error_raised = true;
        return Err(MiddlewareError::cancelled(name, chain.executed));
    }

    m_events.emit(events::MIDDLEWARE_EXECUTING, MiddlewareExecutionEvent{name, &ctx});
    chain.executed.push_back(name);

    bool next_called = false;
    Next next = [this, &chain, &ctx, &next_called, &name, index]() -> Result<void> {
        if (next_called) {
            return Err(MiddlewareError::invalid_state(name, "next() called more than once"));
        }
        next_called = true;
        return run_from(chain, ctx, index + 1);
    };

    auto result = sker_core::invoke_guarded(
        [&entry, &ctx, &next]() { return entry.handler(ctx, next); },
        ErrorCode::MiddlewareFailed);

    if (!result) {
        // Already reported by the middleware that failed further down
        if (chain.error_raised && result.error().is<MiddlewareError>()) {
            return result;
        }

        Error err(MiddlewareError::handler_failed(name, chain.executed, result.error().message()));
        err.with_cause(result.error());
        chain.error_raised = true;

        m_events.emit(events::MIDDLEWARE_ERROR, MiddlewareErrorEvent{name, err, &ctx});
        return Err(std::move(err));
    }

    m_events.emit(events::MIDDLEWARE_EXECUTED, MiddlewareExecutionEvent{name, &ctx});
    return Ok();
}

Result<void> MiddlewareManager::execute_with_timeout(
    std::shared_ptr<MiddlewareContext> ctx, std::chrono::milliseconds timeout)
{
    if (!ctx) {
        return Err(MiddlewareError::invalid_argument("Middleware context is required"));
    }

    sker_core::CancellationToken token = ctx->cancellation;
    auto result = sker_core::run_with_timeout<void>(
        m_background,
        [this, ctx]() { return execute(*ctx); },
        timeout,
        token);

    if (!result && result.error().code() == ErrorCode::Timeout && !result.error().is<MiddlewareError>()) {
        sker_core::middleware_logger()->warn("Middleware execution timed out after {}ms", timeout.count());
        m_events.emit(events::MIDDLEWARE_TIMEOUT, MiddlewareTimeoutEvent{timeout.count(), ctx.get()});

        Error err(MiddlewareError::timeout(timeout.count()));
        err.with_context("request_id", ctx->request_id);
        return Err(std::move(err));
    }
    return result;
}

// =============================================================================
// Ordering
// =============================================================================

void MiddlewareManager::ensure_sorted() const {
    if (m_sorted_valid) {
        return;
    }
    m_sorted = m_entries;
    std::stable_sort(m_sorted.begin(), m_sorted.end(),
        [](const EntryPtr& a, const EntryPtr& b) { return a->priority < b->priority; });
    m_sorted_valid = true;
}

std::vector<MiddlewareManager::Entry> MiddlewareManager::enabled_chain() const {
    ensure_sorted();
    std::vector<Entry> chain;
    chain.reserve(m_sorted.size());
    for (const auto& entry : m_sorted) {
        if (entry->enabled) {
            chain.push_back(*entry);
        }
    }
    return chain;
}

std::string MiddlewareManager::display_name(const Entry& entry, std::size_t index) {
    if (!entry.name.empty()) {
        return entry.name;
    }
    return "anonymous-" + std::to_string(index + 1);
}

// =============================================================================
// Queries
// =============================================================================

std::vector<MiddlewareInfo> MiddlewareManager::middlewares() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<MiddlewareInfo> infos;
    infos.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        infos.push_back(entry->info());
    }
    return infos;
}

std::vector<std::string> MiddlewareManager::execution_order() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Entry> chain = enabled_chain();
    std::vector<std::string> names;
    names.reserve(chain.size());
    for (std::size_t i = 0; i < chain.size(); ++i) {
        names.push_back(display_name(chain[i], i));
    }
    return names;
}

std::size_t MiddlewareManager::middleware_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::size_t MiddlewareManager::enabled_middleware_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [](const EntryPtr& entry) { return entry->enabled; }));
}

bool MiddlewareManager::has_middleware(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_entries.begin(), m_entries.end(),
        [&name](const EntryPtr& entry) { return entry->name == name; });
}

bool MiddlewareManager::has_middleware(MiddlewareId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_entries.begin(), m_entries.end(),
        [id](const EntryPtr& entry) { return entry->id == id; });
}

} // namespace sker_kernel
