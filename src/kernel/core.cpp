/// @file core.cpp
/// @brief Service kernel composition root implementation

#include <sker/kernel/core.hpp>
#include <sker/core/log.hpp>

#include "json_options.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <initializer_list>
#include <sstream>
#include <utility>

namespace sker_kernel {

using sker_core::ConfigError;
using sker_core::Err;
using sker_core::Error;
using sker_core::ErrorCode;
using sker_core::Ok;
using sker_core::Result;

namespace events = sker_event::events;

namespace {

constexpr const char* MANIFEST_SOURCE = "service manifest";

std::string summarize(const std::vector<Error>& failures) {
    std::string summary;
    for (const auto& failure : failures) {
        if (!summary.empty()) {
            summary += "; ";
        }
        summary += failure.message();
    }
    return summary;
}

} // anonymous namespace

// =============================================================================
// CoreOptions
// =============================================================================

Result<CoreOptions> CoreOptions::from_json(const std::string& content) {
    CoreOptions options;

    try {
        nlohmann::json j = nlohmann::json::parse(content);
        if (!j.is_object()) {
            return Err<CoreOptions>(ConfigError::parse_error(MANIFEST_SOURCE, "top-level value must be an object"));
        }

        options.service_name = j.value("serviceName", std::string{});
        options.version = j.value("version", std::string{});
        options.environment = j.value("environment", std::string{});
        options.bridge_events = j.value("bridgeEvents", false);

        if (auto it = j.find("logLevel"); it != j.end()) {
            auto level = sker_core::parse_log_level(it->get<std::string>());
            if (!level) {
                return Err<CoreOptions>(ConfigError::parse_error(MANIFEST_SOURCE,
                    "unknown log level \"" + it->get<std::string>() + "\""));
            }
            options.log_level = *level;
        }

        if (auto it = j.find("plugins"); it != j.end()) {
            if (!it->is_array()) {
                return Err<CoreOptions>(ConfigError::parse_error(MANIFEST_SOURCE, "\"plugins\" must be an array"));
            }
            for (const auto& entry : *it) {
                PluginConfig plugin;
                plugin.name = entry.at("name").get<std::string>();
                plugin.package = entry.value("package", std::string{});
                plugin.enabled = entry.value("enabled", true);
                if (auto opts = entry.find("options"); opts != entry.end() && opts->is_object()) {
                    detail::flatten_json(*opts, "", plugin.options);
                }
                options.plugins.push_back(std::move(plugin));
            }
        }

        if (auto it = j.find("lifecycle"); it != j.end() && it->is_object()) {
            auto& lifecycle = options.lifecycle;
            lifecycle.start_timeout = std::chrono::milliseconds(
                it->value("startTimeout", static_cast<std::int64_t>(lifecycle.start_timeout.count())));
            lifecycle.stop_timeout = std::chrono::milliseconds(
                it->value("stopTimeout", static_cast<std::int64_t>(lifecycle.stop_timeout.count())));
            lifecycle.graceful_shutdown = it->value("gracefulShutdown", lifecycle.graceful_shutdown);
        }

        if (auto it = j.find("config"); it != j.end() && it->is_object()) {
            if (auto defaults = it->find("defaults"); defaults != it->end() && defaults->is_object()) {
                detail::flatten_json(*defaults, "", options.config.defaults);
            }
            if (auto files = it->find("files"); files != it->end() && files->is_array()) {
                for (const auto& file : *files) {
                    options.config.files.emplace_back(file.get<std::string>());
                }
            }
            if (auto prefix = it->find("envPrefix"); prefix != it->end() && prefix->is_string()) {
                options.config.env_prefix = prefix->get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<CoreOptions>(ConfigError::parse_error(MANIFEST_SOURCE, e.what()));
    }

    return Ok(std::move(options));
}

Result<CoreOptions> CoreOptions::from_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<CoreOptions>(ConfigError::io_error(path.string(), "cannot open file"));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

// =============================================================================
// CoreInfo
// =============================================================================

std::string CoreInfo::to_json(int indent) const {
    nlohmann::json config_json = nlohmann::json::object();
    for (const auto& [key, value] : config) {
        std::visit([&config_json, &key = key](const auto& v) { config_json[key] = v; }, value);
    }

    nlohmann::json j;
    j["serviceName"] = service_name;
    j["version"] = version;
    j["environment"] = environment;
    j["state"] = lifecycle_state_name(state);
    j["uptime"] = uptime.count();
    j["logLevel"] = sker_core::log_level_name(log_level);
    j["plugins"] = plugins;
    j["config"] = std::move(config_json);
    return j.dump(indent);
}

// =============================================================================
// Core
// =============================================================================

Result<std::unique_ptr<Core>> Core::create(CoreOptions options) {
    using CorePtr = std::unique_ptr<Core>;

    if (options.service_name.empty()) {
        return Err<CorePtr>(Error(ErrorCode::InitializationFailed, "Service name is required"));
    }
    if (options.version.empty()) {
        return Err<CorePtr>(Error(ErrorCode::InitializationFailed, "Service version is required"));
    }
    if (options.environment.empty()) {
        options.environment = "development";
    }

    // Materialize every descriptor before building anything
    PluginCatalog& catalog = options.catalog ? *options.catalog : PluginCatalog::global();
    std::vector<std::pair<PluginConfig, std::unique_ptr<Plugin>>> resolved;
    for (const auto& descriptor : options.plugins) {
        if (descriptor.name.empty()) {
            return Err<CorePtr>(Error(ErrorCode::InitializationFailed, "Plugin descriptor without a name"));
        }

        auto plugin = catalog.create(descriptor);
        if (!plugin) {
            Error err(ErrorCode::InitializationFailed, "Failed to load plugin \"" + descriptor.name + "\"");
            err.with_cause(plugin.error());
            return Err<CorePtr>(std::move(err));
        }
        resolved.emplace_back(descriptor, std::move(plugin).value());
    }

    if (options.log_level) {
        sker_core::set_global_log_level(*options.log_level);
    }

    auto core = std::make_unique<Core>(PrivateTag{}, std::move(options));

    auto loaded = core->m_config.load();
    if (!loaded) {
        Error err(ErrorCode::InitializationFailed, "Failed to load configuration");
        err.with_cause(loaded.error());
        return Err<CorePtr>(std::move(err));
    }

    for (auto& [config, plugin] : resolved) {
        std::string name = config.name;
        auto registered = core->m_plugins.register_plugin(name, std::move(plugin), std::move(config));
        if (!registered) {
            Error err(ErrorCode::InitializationFailed, "Failed to register plugin \"" + name + "\"");
            err.with_cause(registered.error());
            return Err<CorePtr>(std::move(err));
        }
    }

    sker_core::kernel_logger()->info("Initialized {} v{} ({}) with {} plugin(s)",
        core->service_name(), core->version(), core->environment(), core->m_plugins.plugin_count());
    core->m_events.emit(events::CORE_INITIALIZED, core->status());

    return Ok(std::move(core));
}

Core::Core(PrivateTag, CoreOptions options)
    : m_options(std::move(options))
    , m_created_at(std::chrono::steady_clock::now())
    , m_config(m_options.config)
    , m_lifecycle(m_options.lifecycle)
    , m_plugins(this)
{
    setup_bridges();
}

Core::~Core() {
    if (m_lifecycle.is_started() || !m_plugins.initialized_plugins().empty()) {
        auto result = stop();
        if (!result) {
            sker_core::kernel_logger()->error("Error stopping {} during teardown: {}",
                m_options.service_name, sker_core::build_error_chain(result.error()));
        }
    }
}

void Core::setup_bridges() {
    bridge(m_lifecycle.events(), events::GENERIC_ERROR, events::LIFECYCLE_ERROR);
    bridge(m_plugins.events(), events::PLUGIN_ERROR, events::CORE_PLUGIN_ERROR);
    bridge(m_middleware.events(), events::MIDDLEWARE_ERROR, events::CORE_MIDDLEWARE_ERROR);
    bridge(m_config.events(), events::CONFIG_CHANGE, events::CORE_CONFIG_CHANGE);

    if (!m_options.bridge_events) {
        return;
    }

    for (sker_event::EventBus* bus : {&m_lifecycle.events(), &m_plugins.events(),
                                      &m_middleware.events(), &m_config.events()}) {
        static_cast<void>(bus->on_any([this](const std::string& event, const std::any& payload) {
            m_events.emit(event, payload);
        }));
    }
}

void Core::bridge(sker_event::EventBus& source, const char* from, const char* to) {
    auto id = source.on(from, [this, to](const std::any& payload) {
        m_events.emit(to, payload);
    });
    if (!id) {
        sker_core::kernel_logger()->warn("Failed to bridge {}.{} -> {}: {}",
            source.name(), from, to, id.error().message());
    }
}

std::chrono::milliseconds Core::uptime() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_created_at);
}

CoreStatusEvent Core::status() const {
    return CoreStatusEvent{m_options.service_name, m_options.version, m_options.environment, uptime()};
}

bool Core::has_plugin(const std::string& name) const {
    return m_plugins.is_initialized(name);
}

CoreInfo Core::info() const {
    CoreInfo info;
    info.service_name = m_options.service_name;
    info.version = m_options.version;
    info.environment = m_options.environment;
    info.state = m_lifecycle.state();
    info.uptime = uptime();
    info.log_level = sker_core::get_global_log_level();
    info.plugins = m_plugins.initialized_plugins();
    info.config = m_config.all();
    return info;
}

// =============================================================================
// Start / Stop
// =============================================================================

Result<void> Core::run_start() {
    auto plugins = m_plugins.initialize_all();
    if (!plugins) {
        Error err(ErrorCode::StartFailed,
            "Failed to start " + m_options.service_name + ": " + plugins.error().message());
        err.with_cause(plugins.error());
        return Err(std::move(err));
    }

    return m_lifecycle.start();
}

Result<void> Core::run_stop() {
    std::vector<Error> failures;

    LifecycleState state = m_lifecycle.state();
    if (state == LifecycleState::Started || state == LifecycleState::Stopping
        || state == LifecycleState::Error) {
        auto stopped = m_lifecycle.stop();
        if (!stopped) {
            failures.push_back(stopped.error());
        }
    }

    auto destroyed = m_plugins.destroy_all();
    if (!destroyed) {
        failures.push_back(destroyed.error());
    }

    if (!failures.empty()) {
        std::string message = "Failed to stop " + m_options.service_name + ": " + summarize(failures);
        return Err(Error::aggregate(ErrorCode::StopFailed, message, std::move(failures)));
    }
    return Ok();
}

Result<void> Core::start() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);

    if (m_lifecycle.is_started()) {
        return Ok();
    }

    sker_core::kernel_logger()->info("Starting {} v{}", m_options.service_name, m_options.version);
    m_events.emit(events::CORE_STARTING, status());

    auto result = run_start();
    if (!result) {
        sker_core::kernel_logger()->error("{}", sker_core::build_error_chain(result.error()));
        m_events.emit(events::CORE_START_FAILED, CoreFailureEvent{result.error()});
        return result;
    }

    sker_core::kernel_logger()->info("{} started", m_options.service_name);
    m_events.emit(events::CORE_STARTED, status());
    return Ok();
}

Result<void> Core::stop() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);

    sker_core::kernel_logger()->info("Stopping {}", m_options.service_name);
    m_events.emit(events::CORE_STOPPING, status());

    auto result = run_stop();
    if (!result) {
        sker_core::kernel_logger()->error("{}", sker_core::build_error_chain(result.error()));
        m_events.emit(events::CORE_STOP_FAILED, CoreFailureEvent{result.error()});
        return result;
    }

    sker_core::kernel_logger()->info("{} stopped (uptime {}ms)", m_options.service_name, uptime().count());
    m_events.emit(events::CORE_STOPPED, status());
    return Ok();
}

Result<void> Core::restart() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);

    sker_core::kernel_logger()->info("Restarting {}", m_options.service_name);
    m_events.emit(events::CORE_RESTARTING, status());

    auto result = run_stop();
    if (result) {
        result = run_start();
    }

    if (!result) {
        sker_core::kernel_logger()->error("{}", sker_core::build_error_chain(result.error()));
        m_events.emit(events::CORE_RESTART_FAILED, CoreFailureEvent{result.error()});
        return result;
    }

    m_events.emit(events::CORE_RESTARTED, status());
    return Ok();
}

} // namespace sker_kernel
