#pragma once

/// @file events.hpp
/// @brief Event name catalog emitted by the kernel

#include "fwd.hpp"
#include <sker/core/error.hpp>
#include <string>

namespace sker_event {

/// Payload of events::GENERIC_ERROR: a listener (or manager) failure and
/// the event that was being delivered when it happened
struct ErrorEvent {
    sker_core::Error error;
    std::string event;
};

namespace events {

// Generic
constexpr const char* GENERIC_ERROR = "ERROR";

// Lifecycle
constexpr const char* LIFECYCLE_STARTING = "starting";
constexpr const char* LIFECYCLE_STARTED = "started";
constexpr const char* LIFECYCLE_STOPPING = "stopping";
constexpr const char* LIFECYCLE_STOPPED = "stopped";
constexpr const char* LIFECYCLE_STATE_CHANGED = "stateChanged";
constexpr const char* LIFECYCLE_HOOK_EXECUTING = "hookExecuting";
constexpr const char* LIFECYCLE_HOOK_EXECUTED = "hookExecuted";
constexpr const char* LIFECYCLE_HOOK_ERROR = "hookError";

// Plugins
constexpr const char* PLUGIN_REGISTERED = "pluginRegistered";
constexpr const char* PLUGIN_UNREGISTERED = "pluginUnregistered";
constexpr const char* PLUGIN_SKIPPED = "pluginSkipped";
constexpr const char* PLUGIN_INITIALIZING = "pluginInitializing";
constexpr const char* PLUGIN_INITIALIZED = "pluginInitialized";
constexpr const char* PLUGIN_ERROR = "pluginError";
constexpr const char* PLUGIN_DESTROYING = "pluginDestroying";
constexpr const char* PLUGIN_DESTROYED = "pluginDestroyed";
constexpr const char* PLUGIN_ENABLED = "pluginEnabled";
constexpr const char* PLUGIN_DISABLED = "pluginDisabled";
constexpr const char* PLUGIN_CONFIG_UPDATED = "pluginConfigUpdated";

// Middleware
constexpr const char* MIDDLEWARE_ADDED = "middlewareAdded";
constexpr const char* MIDDLEWARE_REMOVED = "middlewareRemoved";
constexpr const char* MIDDLEWARE_ENABLED = "middlewareEnabled";
constexpr const char* MIDDLEWARE_DISABLED = "middlewareDisabled";
constexpr const char* MIDDLEWARE_INSERTED = "middlewareInserted";
constexpr const char* MIDDLEWARES_CLEARED = "middlewaresCleared";
constexpr const char* MIDDLEWARE_EXECUTING = "middlewareExecuting";
constexpr const char* MIDDLEWARE_EXECUTED = "middlewareExecuted";
constexpr const char* MIDDLEWARE_ERROR = "middlewareError";
constexpr const char* MIDDLEWARE_CHAIN_COMPLETED = "middlewareChainCompleted";
constexpr const char* MIDDLEWARE_CHAIN_FAILED = "middlewareChainFailed";
constexpr const char* MIDDLEWARE_TIMEOUT = "middlewareTimeout";

// Config
constexpr const char* CONFIG_CHANGE = "change";
constexpr const char* CONFIG_RESET = "reset";

// Core
constexpr const char* CORE_INITIALIZED = "coreInitialized";
constexpr const char* CORE_STARTING = "coreStarting";
constexpr const char* CORE_STARTED = "coreStarted";
constexpr const char* CORE_START_FAILED = "coreStartFailed";
constexpr const char* CORE_STOPPING = "coreStopping";
constexpr const char* CORE_STOPPED = "coreStopped";
constexpr const char* CORE_STOP_FAILED = "coreStopFailed";
constexpr const char* CORE_RESTARTING = "coreRestarting";
constexpr const char* CORE_RESTARTED = "coreRestarted";
constexpr const char* CORE_RESTART_FAILED = "coreRestartFailed";
constexpr const char* LIFECYCLE_ERROR = "lifecycleError";
constexpr const char* CORE_PLUGIN_ERROR = "corePluginError";
constexpr const char* CORE_MIDDLEWARE_ERROR = "coreMiddlewareError";
constexpr const char* CORE_CONFIG_CHANGE = "coreConfigChange";

} // namespace events

} // namespace sker_event
