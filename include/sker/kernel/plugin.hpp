#pragma once

/// @file plugin.hpp
/// @brief Plugin contract, plugin manager and package catalog
///
/// A plugin is registered under a unique name, initialized explicitly (or in
/// a batch with initialize_all) and destroyed in reverse initialization
/// order. Initialization produces an instance that callers can look up by
/// plugin name; its lifetime is bound to the plugin record.

#include "fwd.hpp"

#include <sker/core/error.hpp>
#include <sker/core/value.hpp>
#include <sker/core/version.hpp>
#include <sker/event/event_bus.hpp>

#include <spdlog/spdlog.h>

#include <any>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sker_kernel {

// =============================================================================
// Plugin Configuration
// =============================================================================

/// Plugin descriptor: which package provides it, its options, and whether
/// it takes part in initialization
struct PluginConfig {
    std::string name;
    std::string package;
    sker_core::Options options;
    bool enabled = true;
};

/// Everything a plugin sees while it initializes
struct PluginContext {
    Core* core = nullptr;                      ///< Owning core, null for a standalone manager
    sker_core::Options config;                 ///< Current plugin options
    std::shared_ptr<spdlog::logger> logger;    ///< Logger named after the plugin
    sker_core::ValueStore data;                ///< Extension data kept with the record

    template<typename T>
    [[nodiscard]] T option(const std::string& key, T default_value) const {
        return sker_core::option_or<T>(config, key, std::move(default_value));
    }
};

// =============================================================================
// Plugin (Base Class)
// =============================================================================

/// Base class for all plugins
class Plugin {
public:
    virtual ~Plugin() = default;

    /// Plugin name, used when the registration does not provide one
    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual sker_core::Version version() const {
        return sker_core::Version{0, 1, 0};
    }

    /// False if the plugin has no initializer; such plugins are rejected
    [[nodiscard]] virtual bool can_initialize() const { return true; }

    /// Set the plugin up and return the instance exposed to callers
    virtual sker_core::Result<std::any> initialize(PluginContext& ctx) = 0;

    /// Tear down. Called at most once per successful initialize().
    virtual sker_core::Result<void> destroy() {
        return sker_core::Ok();
    }
};

/// Plugin assembled from callables
class FunctionPlugin : public Plugin {
public:
    using InitializeFn = std::function<sker_core::Result<std::any>(PluginContext&)>;
    using DestroyFn = std::function<sker_core::Result<void>()>;

    FunctionPlugin(std::string name, InitializeFn initialize, DestroyFn destroy = {},
                   sker_core::Version version = sker_core::Version{0, 1, 0})
        : m_name(std::move(name))
        , m_initialize(std::move(initialize))
        , m_destroy(std::move(destroy))
        , m_version(version) {}

    [[nodiscard]] std::string name() const override { return m_name; }
    [[nodiscard]] sker_core::Version version() const override { return m_version; }
    [[nodiscard]] bool can_initialize() const override { return static_cast<bool>(m_initialize); }

    sker_core::Result<std::any> initialize(PluginContext& ctx) override;
    sker_core::Result<void> destroy() override;

private:
    std::string m_name;
    InitializeFn m_initialize;
    DestroyFn m_destroy;
    sker_core::Version m_version;
};

/// Convenience factory for FunctionPlugin
[[nodiscard]] std::unique_ptr<Plugin> make_plugin(
    std::string name,
    FunctionPlugin::InitializeFn initialize,
    FunctionPlugin::DestroyFn destroy = {},
    sker_core::Version version = sker_core::Version{0, 1, 0});

// =============================================================================
// Plugin Events
// =============================================================================

/// Payload of pluginUnregistered, pluginInitializing, pluginInitialized,
/// pluginDestroying, pluginDestroyed, pluginEnabled, pluginDisabled
struct PluginEvent {
    std::string name;
};

struct PluginRegisteredEvent {
    std::string name;
    PluginConfig config;
};

struct PluginSkippedEvent {
    std::string name;
    std::string reason;
};

struct PluginErrorEvent {
    std::string name;
    sker_core::Error error;
    std::string phase;  ///< "initialize" or "destroy"
};

struct PluginConfigUpdatedEvent {
    std::string name;
    sker_core::Options old_config;
    sker_core::Options new_config;
};

/// Registry snapshot entry
struct PluginInfo {
    std::string name;
    sker_core::Version version;
    PluginConfig config;
    bool initialized = false;
};

// =============================================================================
// PluginManager
// =============================================================================

class PluginManager {
public:
    explicit PluginManager(Core* core = nullptr);
    ~PluginManager();

    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register a plugin. Never initializes it.
    /// @return InvalidArgument for an empty name or a plugin without an
    ///         initializer, AlreadyExists for a taken name
    sker_core::Result<void> register_plugin(
        const std::string& name, std::unique_ptr<Plugin> plugin, PluginConfig config = {});

    /// Remove a plugin. Unknown names are a no-op.
    /// @return InvalidState if the plugin is initialized (destroy it first)
    sker_core::Result<void> unregister_plugin(const std::string& name);

    // =========================================================================
    // Initialization
    // =========================================================================

    /// Initialize one plugin. No-op if already initialized; disabled
    /// plugins are skipped.
    sker_core::Result<void> initialize(const std::string& name);

    /// Initialize every plugin in registration order. Failures do not stop
    /// the batch; they are returned together as one aggregate error.
    sker_core::Result<void> initialize_all();

    /// Destroy one plugin. No-op if unknown or not initialized.
    sker_core::Result<void> destroy(const std::string& name);

    /// Destroy every initialized plugin in reverse initialization order
    sker_core::Result<void> destroy_all();

    /// Set enabled and initialize if needed. No-op if already enabled.
    sker_core::Result<void> enable(const std::string& name);

    /// Destroy if needed and clear enabled. No-op if already disabled.
    sker_core::Result<void> disable(const std::string& name);

    /// Merge @p options into the plugin's stored config and live context
    sker_core::Result<void> update_plugin_config(const std::string& name, const sker_core::Options& options);

    // =========================================================================
    // Queries
    // =========================================================================

    /// Instance produced by an initialized plugin; nullptr if the plugin is
    /// unknown, not initialized, or holds another type
    template<typename T>
    [[nodiscard]] T* get(const std::string& name) {
        std::any* value = instance(name);
        return value ? std::any_cast<T>(value) : nullptr;
    }

    [[nodiscard]] std::any* instance(const std::string& name);

    [[nodiscard]] bool has(const std::string& name) const;
    [[nodiscard]] bool is_initialized(const std::string& name) const;
    [[nodiscard]] std::size_t plugin_count() const;

    /// Names in registration order
    [[nodiscard]] std::vector<std::string> registered_plugins() const;

    /// Names in initialization order
    [[nodiscard]] std::vector<std::string> initialized_plugins() const;

    [[nodiscard]] std::optional<PluginConfig> plugin_config(const std::string& name) const;

    [[nodiscard]] std::map<std::string, PluginInfo> all_plugin_info() const;

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
    struct Record {
        std::unique_ptr<Plugin> plugin;
        PluginConfig config;
        PluginContext context;
        bool initialized = false;
        bool busy = false;  // initialize() or destroy() in progress
        std::any instance;
    };

    sker_core::Result<void> fail(const std::string& name, const std::string& phase, sker_core::Error err);

    Core* m_core;
    sker_event::EventBus m_events{"plugins"};

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<Record>> m_records;
    std::vector<std::string> m_registration_order;
    std::vector<std::string> m_initialization_order;
};

// =============================================================================
// PluginCatalog
// =============================================================================

/// Maps a package name (PluginConfig::package) to a plugin factory so that
/// descriptors can be turned into plugin objects
class PluginCatalog {
public:
    using Factory = std::function<std::unique_ptr<Plugin>(const PluginConfig&)>;

    PluginCatalog() = default;

    PluginCatalog(const PluginCatalog&) = delete;
    PluginCatalog& operator=(const PluginCatalog&) = delete;

    /// Process-wide catalog used when no catalog is supplied
    [[nodiscard]] static PluginCatalog& global();

    /// @return AlreadyExists if the package is taken
    sker_core::Result<void> add(const std::string& package, Factory factory);

    bool remove(const std::string& package);

    [[nodiscard]] bool contains(const std::string& package) const;

    [[nodiscard]] std::vector<std::string> packages() const;

    /// Build the plugin for a descriptor
    /// @return NotFound for an unknown package
    [[nodiscard]] sker_core::Result<std::unique_ptr<Plugin>> create(const PluginConfig& config) const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Factory> m_factories;
};

} // namespace sker_kernel

/// @brief Register a plugin class in the global catalog under a package name
///
/// @code
/// class MetricsPlugin : public sker_kernel::Plugin { ... };
/// SKER_REGISTER_PLUGIN("metrics", MetricsPlugin)
/// @endcode
#define SKER_REGISTER_PLUGIN(package, PluginClass) \
    namespace { \
    const bool sker_plugin_registered_##PluginClass = \
        ::sker_kernel::PluginCatalog::global().add(package, \
            [](const ::sker_kernel::PluginConfig&) -> std::unique_ptr<::sker_kernel::Plugin> { \
                return std::make_unique<PluginClass>(); \
            }).is_ok(); \
    }
