/// @file core.hpp
/// @brief Service kernel composition root
///
/// The Core ties together:
/// - Configuration (layered ConfigManager)
/// - Lifecycle (start/stop hooks, graceful shutdown)
/// - Plugins (materialized from descriptors through a PluginCatalog)
/// - Middleware (per unit of work, independent of start/stop)
///
/// Manager error events are re-emitted on the Core's own bus under core*
/// names; with bridge_events every manager event is forwarded verbatim.

#pragma once

#include "fwd.hpp"
#include "config.hpp"
#include "lifecycle.hpp"
#include "middleware.hpp"
#include "plugin.hpp"

#include <sker/core/error.hpp>
#include <sker/core/log.hpp>
#include <sker/event/event_bus.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sker_kernel {

// =============================================================================
// Core Options
// =============================================================================

struct CoreOptions {
    std::string service_name;
    std::string version;
    std::string environment;               ///< Empty: "development"
    std::vector<PluginConfig> plugins;     ///< Resolved through the catalog at create()
    LifecycleOptions lifecycle;
    ConfigOptions config;
    bool bridge_events = false;            ///< Forward every manager event onto the core bus
    std::optional<spdlog::level::level_enum> log_level;  ///< Applied globally by create()
    PluginCatalog* catalog = nullptr;      ///< Null: PluginCatalog::global()

    /// Parse a service manifest:
    /// {"serviceName", "version", "environment", "bridgeEvents", "logLevel",
    ///  "plugins": [{"name", "package", "enabled", "options": {...}}],
    ///  "lifecycle": {"startTimeout", "stopTimeout", "gracefulShutdown"},
    ///  "config": {"defaults": {...}, "files": [...], "envPrefix"}}
    [[nodiscard]] static sker_core::Result<CoreOptions> from_json(const std::string& content);

    [[nodiscard]] static sker_core::Result<CoreOptions> from_json_file(const std::filesystem::path& path);
};

// =============================================================================
// Core Info & Events
// =============================================================================

/// Read-only snapshot of a running core
struct CoreInfo {
    std::string service_name;
    std::string version;
    std::string environment;
    LifecycleState state = LifecycleState::Created;
    std::chrono::milliseconds uptime{0};
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::vector<std::string> plugins;      ///< Initialized plugins, initialization order
    sker_core::Options config;             ///< Resolved configuration

    [[nodiscard]] std::string to_json(int indent = 2) const;
};

/// Payload of coreInitialized, coreStarting, coreStarted, coreStopping,
/// coreStopped, coreRestarting, coreRestarted
struct CoreStatusEvent {
    std::string service_name;
    std::string version;
    std::string environment;
    std::chrono::milliseconds uptime{0};
};

/// Payload of coreStartFailed, coreStopFailed, coreRestartFailed
struct CoreFailureEvent {
    sker_core::Error error;
};

// =============================================================================
// Core
// =============================================================================

class Core {
public:
    /// Validate options, materialize plugin descriptors and load configuration
    /// @return InitializationFailed on missing service name or version, an
    ///         unknown plugin package, or a configuration that fails validation
    [[nodiscard]] static sker_core::Result<std::unique_ptr<Core>> create(CoreOptions options);

    ~Core();

    // Non-copyable
    Core(const Core&) = delete;
    Core& operator=(const Core&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Initialize every plugin, then run the lifecycle start hooks.
    /// Already started is a no-op.
    sker_core::Result<void> start();

    /// Run the lifecycle stop hooks, then destroy plugins in reverse
    /// initialization order. Both steps run even if the first fails.
    sker_core::Result<void> stop();

    /// stop() then start(). Failures keep their StopFailed / StartFailed code.
    sker_core::Result<void> restart();

    [[nodiscard]] LifecycleState state() const { return m_lifecycle.state(); }
    [[nodiscard]] bool is_started() const { return m_lifecycle.is_started(); }
    [[nodiscard]] bool is_stopped() const { return m_lifecycle.is_stopped(); }

    /// Time since construction
    [[nodiscard]] std::chrono::milliseconds uptime() const;

    // =========================================================================
    // Identity
    // =========================================================================

    [[nodiscard]] const std::string& service_name() const noexcept { return m_options.service_name; }
    [[nodiscard]] const std::string& version() const noexcept { return m_options.version; }
    [[nodiscard]] const std::string& environment() const noexcept { return m_options.environment; }
    [[nodiscard]] const CoreOptions& options() const noexcept { return m_options; }

    [[nodiscard]] CoreInfo info() const;

    // =========================================================================
    // Managers
    // =========================================================================

    [[nodiscard]] ConfigManager& config() { return m_config; }
    [[nodiscard]] const ConfigManager& config() const { return m_config; }

    [[nodiscard]] LifecycleManager& lifecycle() { return m_lifecycle; }
    [[nodiscard]] const LifecycleManager& lifecycle() const { return m_lifecycle; }

    [[nodiscard]] PluginManager& plugins() { return m_plugins; }
    [[nodiscard]] const PluginManager& plugins() const { return m_plugins; }

    [[nodiscard]] MiddlewareManager& middleware() { return m_middleware; }
    [[nodiscard]] const MiddlewareManager& middleware() const { return m_middleware; }

    // =========================================================================
    // Plugins
    // =========================================================================

    /// Instance produced by an initialized plugin
    /// @return NotFound if absent, uninitialized, or of another type
    template<typename T>
    [[nodiscard]] sker_core::Result<T*> get_plugin(const std::string& name) {
        if (T* instance = m_plugins.get<T>(name)) {
            return sker_core::Ok(instance);
        }
        return sker_core::Err<T*>(sker_core::Error(sker_core::ErrorCode::NotFound,
            "Plugin \"" + name + "\" not found or not initialized"));
    }

    /// True once the plugin is initialized
    [[nodiscard]] bool has_plugin(const std::string& name) const;

    /// Logger for a collaborator of this core
    [[nodiscard]] std::shared_ptr<spdlog::logger> get_logger(const std::string& name) const {
        return sker_core::get_logger(name);
    }

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
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Use create()
    Core(PrivateTag, CoreOptions options);

private:
    void setup_bridges();
    void bridge(sker_event::EventBus& source, const char* from, const char* to);

    sker_core::Result<void> run_start();
    sker_core::Result<void> run_stop();

    [[nodiscard]] CoreStatusEvent status() const;

private:
    CoreOptions m_options;
    std::chrono::steady_clock::time_point m_created_at;

    sker_event::EventBus m_events{"core"};
    ConfigManager m_config;
    LifecycleManager m_lifecycle;
    PluginManager m_plugins;
    MiddlewareManager m_middleware;

    std::mutex m_operation_mutex;  // serializes start/stop/restart
};

} // namespace sker_kernel
