#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for sker_kernel

#include <cstdint>

namespace sker_kernel {

// Lifecycle
enum class LifecycleState : std::uint8_t;
enum class HookPhase : std::uint8_t;
struct HookOptions;
struct LifecycleOptions;
class LifecycleManager;
class ShutdownSignalWatcher;

// Plugins
struct PluginConfig;
struct PluginContext;
struct PluginInfo;
class Plugin;
class PluginManager;
class PluginCatalog;

// Middleware
struct MiddlewareId;
struct MiddlewareOptions;
struct MiddlewareContext;
class MiddlewareManager;

// Config
enum class ConfigLayerPriority : std::int32_t;
struct ConfigOptions;
class ConfigManager;

// Composition root
struct CoreOptions;
struct CoreInfo;
class Core;

} // namespace sker_kernel
