#pragma once

/// @file error.hpp
/// @brief Error handling types for sker_core

#include "fwd.hpp"
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace sker_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    Timeout,
    Cancelled,
    StartFailed,
    StopFailed,
    PluginFailed,
    MiddlewareFailed,
    EventFailed,
    ConfigInvalid,
    InitializationFailed,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::StartFailed: return "StartFailed";
        case ErrorCode::StopFailed: return "StopFailed";
        case ErrorCode::PluginFailed: return "PluginFailed";
        case ErrorCode::MiddlewareFailed: return "MiddlewareFailed";
        case ErrorCode::EventFailed: return "EventFailed";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
        case ErrorCode::InitializationFailed: return "InitializationFailed";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Event bus errors
struct EventError {
    enum class Kind : std::uint8_t {
        InvalidArgument,  // Empty event name or handler
        HandlerFailed,    // One or more listeners failed
    };

    Kind kind;
    std::string message;
    std::string event;

    [[nodiscard]] static EventError invalid_argument(const std::string& reason) {
        return EventError{Kind::InvalidArgument, "Invalid event registration: " + reason, {}};
    }

    [[nodiscard]] static EventError handler_failed(const std::string& event_name, const std::string& reason) {
        return EventError{Kind::HandlerFailed,
            "Listener for '" + event_name + "' failed: " + reason, event_name};
    }
};

/// Lifecycle errors
struct LifecycleError {
    enum class Kind : std::uint8_t {
        InvalidState,  // Transition not allowed from current state
        HookFailed,    // Hook returned an error or threw
        HookTimeout,   // Hook exceeded its timeout
        StartFailed,   // Start sequence aborted
        StopFailed,    // Stop sequence finished with failures
    };

    Kind kind;
    std::string message;
    std::string hook;
    std::string phase;  // "start" or "stop"

    [[nodiscard]] static LifecycleError invalid_state(const std::string& operation, const std::string& state) {
        return LifecycleError{Kind::InvalidState,
            "Cannot " + operation + " from state: " + state, {}, operation};
    }

    [[nodiscard]] static LifecycleError hook_failed(
        const std::string& hook_name, const std::string& hook_phase, const std::string& reason) {
        return LifecycleError{Kind::HookFailed,
            hook_phase + " hook \"" + hook_name + "\" failed: " + reason, hook_name, hook_phase};
    }

    [[nodiscard]] static LifecycleError hook_timeout(
        const std::string& hook_name, const std::string& hook_phase, std::int64_t timeout_ms) {
        return LifecycleError{Kind::HookTimeout,
            hook_phase + " hook \"" + hook_name + "\" timed out after " + std::to_string(timeout_ms) + "ms",
            hook_name, hook_phase};
    }

    [[nodiscard]] static LifecycleError start_failed(const std::string& hook_name, const std::string& reason) {
        return LifecycleError{Kind::StartFailed, "Failed to start lifecycle: " + reason, hook_name, "start"};
    }

    [[nodiscard]] static LifecycleError stop_failed(const std::string& reason) {
        return LifecycleError{Kind::StopFailed, "Failed to stop lifecycle: " + reason, {}, "stop"};
    }
};

/// Plugin-related errors
struct PluginError {
    enum class Kind : std::uint8_t {
        InvalidArgument,    // Bad registration arguments
        NotFound,           // Plugin not registered
        AlreadyRegistered,  // Name already taken
        InitFailed,         // initialize() failed
        DestroyFailed,      // destroy() failed
        InvalidState,       // Operation not allowed in current state
        BatchFailed,        // initialize_all / destroy_all had failures
    };

    Kind kind;
    std::string message;
    std::string plugin_id;
    std::string phase;  // "initialize" or "destroy"

    [[nodiscard]] static PluginError invalid_argument(const std::string& reason) {
        return PluginError{Kind::InvalidArgument, reason, {}, {}};
    }

    [[nodiscard]] static PluginError not_found(const std::string& id) {
        return PluginError{Kind::NotFound, "Plugin \"" + id + "\" not found", id, {}};
    }

    [[nodiscard]] static PluginError already_registered(const std::string& id) {
        return PluginError{Kind::AlreadyRegistered, "Plugin \"" + id + "\" is already registered", id, {}};
    }

    [[nodiscard]] static PluginError init_failed(const std::string& id, const std::string& reason) {
        return PluginError{Kind::InitFailed,
            "Failed to initialize plugin \"" + id + "\": " + reason, id, "initialize"};
    }

    [[nodiscard]] static PluginError destroy_failed(const std::string& id, const std::string& reason) {
        return PluginError{Kind::DestroyFailed,
            "Failed to destroy plugin \"" + id + "\": " + reason, id, "destroy"};
    }

    [[nodiscard]] static PluginError invalid_state(const std::string& id, const std::string& reason) {
        return PluginError{Kind::InvalidState, "Plugin \"" + id + "\": " + reason, id, {}};
    }

    [[nodiscard]] static PluginError batch_failed(const std::string& phase_name, const std::string& summary) {
        return PluginError{Kind::BatchFailed, summary, {}, phase_name};
    }
};

/// Middleware pipeline errors
struct MiddlewareError {
    enum class Kind : std::uint8_t {
        InvalidArgument,  // Bad registration arguments
        HandlerFailed,    // A handler failed, chain aborted
        Timeout,          // Chain did not finish in time
        Cancelled,        // Chain stopped at a cancelled token
        InvalidState,     // Misuse of next()
    };

    Kind kind;
    std::string message;
    std::string middleware;
    std::vector<std::string> executed;
    std::int64_t timeout_ms = 0;

    [[nodiscard]] static MiddlewareError invalid_argument(const std::string& reason) {
        return MiddlewareError{Kind::InvalidArgument, reason, {}, {}, 0};
    }

    [[nodiscard]] static MiddlewareError handler_failed(
        const std::string& name, std::vector<std::string> executed_names, const std::string& reason) {
        return MiddlewareError{Kind::HandlerFailed,
            "Middleware \"" + name + "\" failed: " + reason, name, std::move(executed_names), 0};
    }

    [[nodiscard]] static MiddlewareError timeout(std::int64_t ms) {
        return MiddlewareError{Kind::Timeout,
            "Middleware execution timed out after " + std::to_string(ms) + "ms", {}, {}, ms};
    }

    [[nodiscard]] static MiddlewareError cancelled(const std::string& before, std::vector<std::string> executed_names) {
        return MiddlewareError{Kind::Cancelled,
            "Middleware chain cancelled before \"" + before + "\"", before, std::move(executed_names), 0};
    }

    [[nodiscard]] static MiddlewareError invalid_state(const std::string& name, const std::string& reason) {
        return MiddlewareError{Kind::InvalidState, "Middleware \"" + name + "\": " + reason, name, {}, 0};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        NotFound,     // Key or file missing
        ParseError,   // Malformed source
        IOError,      // Source could not be read
        Invalid,      // Validation rejected the configuration
    };

    Kind kind;
    std::string message;
    std::string source;

    [[nodiscard]] static ConfigError not_found(const std::string& what) {
        return ConfigError{Kind::NotFound, "Config not found: " + what, what};
    }

    [[nodiscard]] static ConfigError parse_error(const std::string& src, const std::string& reason) {
        return ConfigError{Kind::ParseError, "Failed to parse " + src + ": " + reason, src};
    }

    [[nodiscard]] static ConfigError io_error(const std::string& src, const std::string& reason) {
        return ConfigError{Kind::IOError, "Failed to read " + src + ": " + reason, src};
    }

    [[nodiscard]] static ConfigError invalid(const std::string& reason) {
        return ConfigError{Kind::Invalid, "Invalid configuration: " + reason, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        EventError,
        LifecycleError,
        PluginError,
        MiddlewareError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(EventError err) : m_code(to_error_code(err)), m_error(std::move(err)) {}
    Error(LifecycleError err) : m_code(to_error_code(err)), m_error(std::move(err)) {}
    Error(PluginError err) : m_code(to_error_code(err)), m_error(std::move(err)) {}
    Error(MiddlewareError err) : m_code(to_error_code(err)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Aggregate of several failures under one code
    [[nodiscard]] static Error aggregate(ErrorCode code, const std::string& msg, std::vector<Error> children) {
        Error err(code, msg);
        err.m_children = std::move(children);
        return err;
    }

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

    /// Attach the error that caused this one
    Error& with_cause(Error cause) {
        m_cause = std::make_shared<const Error>(std::move(cause));
        return *this;
    }

    /// Underlying cause, or nullptr
    [[nodiscard]] const Error* cause() const noexcept { return m_cause.get(); }

    /// Innermost error in the cause chain
    [[nodiscard]] const Error& root_cause() const noexcept {
        const Error* current = this;
        while (current->m_cause) {
            current = current->m_cause.get();
        }
        return *current;
    }

    /// Per-item failures of an aggregate error
    [[nodiscard]] const std::vector<Error>& children() const noexcept { return m_children; }

    void add_child(Error child) { m_children.push_back(std::move(child)); }

private:
    static ErrorCode to_error_code(const EventError& err) {
        switch (err.kind) {
            case EventError::Kind::InvalidArgument: return ErrorCode::InvalidArgument;
            case EventError::Kind::HandlerFailed: return ErrorCode::EventFailed;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(const LifecycleError& err) {
        switch (err.kind) {
            case LifecycleError::Kind::InvalidState: return ErrorCode::InvalidState;
            case LifecycleError::Kind::HookTimeout: return ErrorCode::Timeout;
            case LifecycleError::Kind::HookFailed:
                return err.phase == "stop" ? ErrorCode::StopFailed : ErrorCode::StartFailed;
            case LifecycleError::Kind::StartFailed: return ErrorCode::StartFailed;
            case LifecycleError::Kind::StopFailed: return ErrorCode::StopFailed;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(const PluginError& err) {
        switch (err.kind) {
            case PluginError::Kind::InvalidArgument: return ErrorCode::InvalidArgument;
            case PluginError::Kind::NotFound: return ErrorCode::NotFound;
            case PluginError::Kind::AlreadyRegistered: return ErrorCode::AlreadyExists;
            case PluginError::Kind::InitFailed: return ErrorCode::PluginFailed;
            case PluginError::Kind::DestroyFailed: return ErrorCode::PluginFailed;
            case PluginError::Kind::InvalidState: return ErrorCode::InvalidState;
            case PluginError::Kind::BatchFailed: return ErrorCode::PluginFailed;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(const MiddlewareError& err) {
        switch (err.kind) {
            case MiddlewareError::Kind::InvalidArgument: return ErrorCode::InvalidArgument;
            case MiddlewareError::Kind::HandlerFailed: return ErrorCode::MiddlewareFailed;
            case MiddlewareError::Kind::Timeout: return ErrorCode::Timeout;
            case MiddlewareError::Kind::Cancelled: return ErrorCode::Cancelled;
            case MiddlewareError::Kind::InvalidState: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(const ConfigError& err) {
        switch (err.kind) {
            case ConfigError::Kind::NotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
            case ConfigError::Kind::IOError: return ErrorCode::IOError;
            case ConfigError::Kind::Invalid: return ErrorCode::ConfigInvalid;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
    std::shared_ptr<const Error> m_cause;
    std::vector<Error> m_children;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (value or error)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message including causes and aggregated children
std::string build_error_chain(const Error& error);

/// Convert a caught exception into an Error
Error error_from_exception(const std::exception& e, ErrorCode code = ErrorCode::Unknown);

/// Convert an in-flight exception (inside a catch block) into an Error
Error error_from_current_exception(ErrorCode code = ErrorCode::Unknown);

namespace detail {

template<typename F>
using guarded_result_t = std::conditional_t<
    std::is_void_v<std::invoke_result_t<F&>>,
    Result<void>,
    std::invoke_result_t<F&>>;

} // namespace detail

/// Invoke a user callback at a kernel boundary. Exceptions become errors.
/// Callbacks returning void yield Result<void>; callbacks returning a
/// Result pass it through unchanged.
template<typename F>
detail::guarded_result_t<F> invoke_guarded(F&& func, ErrorCode code = ErrorCode::Unknown) {
    using Out = detail::guarded_result_t<F>;
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<F&>>) {
            func();
            return Out();
        } else {
            return func();
        }
    } catch (...) {
        return Out(error_from_current_exception(code));
    }
}

} // namespace sker_core
