/// @file plugin.cpp
/// @brief PluginManager and PluginCatalog implementation

#include <sker/kernel/plugin.hpp>
#include <sker/core/log.hpp>

#include <algorithm>

namespace sker_kernel {

using sker_core::Err;
using sker_core::Error;
using sker_core::ErrorCode;
using sker_core::Ok;
using sker_core::PluginError;
using sker_core::Result;

namespace events = sker_event::events;

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

} // anonymous namespace

// =============================================================================
// FunctionPlugin
// =============================================================================

Result<std::any> FunctionPlugin::initialize(PluginContext& ctx) {
    if (!m_initialize) {
        return Err<std::any>(PluginError::invalid_state(m_name, "no initializer"));
    }
    return m_initialize(ctx);
}

Result<void> FunctionPlugin::destroy() {
    if (!m_destroy) {
        return Ok();
    }
    return m_destroy();
}

std::unique_ptr<Plugin> make_plugin(
    std::string name,
    FunctionPlugin::InitializeFn initialize,
    FunctionPlugin::DestroyFn destroy,
    sker_core::Version version)
{
    return std::make_unique<FunctionPlugin>(
        std::move(name), std::move(initialize), std::move(destroy), version);
}

// =============================================================================
// PluginManager
// =============================================================================

PluginManager::PluginManager(Core* core) : m_core(core) {}

PluginManager::~PluginManager() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialization_order.empty()) {
        sker_core::plugin_logger()->warn(
            "Plugin manager released with {} initialized plugin(s): {}",
            m_initialization_order.size(), join_names(m_initialization_order));
    }
}

Result<void> PluginManager::register_plugin(
    const std::string& name, std::unique_ptr<Plugin> plugin, PluginConfig config)
{
    if (name.empty()) {
        return Err(PluginError::invalid_argument("Plugin name is required"));
    }
    if (!plugin || !plugin->can_initialize()) {
        return Err(PluginError::invalid_argument("Plugin \"" + name + "\" must have an initialize method"));
    }

    if (config.name.empty()) {
        config.name = name;
    }

    auto record = std::make_unique<Record>();
    record->plugin = std::move(plugin);
    record->config = config;
    record->context.core = m_core;
    record->context.config = config.options;
    record->context.logger = sker_core::get_logger(name);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_records.find(name) != m_records.end()) {
            return Err(PluginError::already_registered(name));
        }
        m_records.emplace(name, std::move(record));
        m_registration_order.push_back(name);
    }

    sker_core::plugin_logger()->debug("Registered plugin \"{}\"", name);
    m_events.emit(events::PLUGIN_REGISTERED, PluginRegisteredEvent{name, std::move(config)});
    return Ok();
}

Result<void> PluginManager::unregister_plugin(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(name);
        if (it == m_records.end()) {
            return Ok();
        }
        if (it->second->initialized || it->second->busy) {
            return Err(PluginError::invalid_state(name, "cannot unregister an initialized plugin, destroy it first"));
        }
        m_records.erase(it);
        m_registration_order.erase(
            std::remove(m_registration_order.begin(), m_registration_order.end(), name),
            m_registration_order.end());
    }

    sker_core::plugin_logger()->debug("Unregistered plugin \"{}\"", name);
    m_events.emit(events::PLUGIN_UNREGISTERED, PluginEvent{name});
    return Ok();
}

// =============================================================================
// Initialization
// =============================================================================

Result<void> PluginManager::initialize(const std::string& name) {
    Record* record = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(name);
        if (it == m_records.end()) {
            return Err(PluginError::not_found(name));
        }
        record = it->second.get();
        if (record->initialized || record->busy) {
            return Ok();
        }
        if (record->config.enabled) {
            record->busy = true;
        }
    }

    if (!record->busy) {
        sker_core::plugin_logger()->debug("Skipping disabled plugin \"{}\"", name);
        m_events.emit(events::PLUGIN_SKIPPED, PluginSkippedEvent{name, "disabled"});
        return Ok();
    }

    m_events.emit(events::PLUGIN_INITIALIZING, PluginEvent{name});

    auto result = sker_core::invoke_guarded(
        [record]() { return record->plugin->initialize(record->context); },
        ErrorCode::PluginFailed);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        record->busy = false;
        if (result) {
            record->instance = std::move(result).value();
            record->initialized = true;
            m_initialization_order.push_back(name);
        }
    }

    if (!result) {
        Error err(PluginError::init_failed(name, result.error().message()));
        err.with_cause(result.error());
        return fail(name, "initialize", std::move(err));
    }

    sker_core::plugin_logger()->info("Initialized plugin \"{}\"", name);
    m_events.emit(events::PLUGIN_INITIALIZED, PluginEvent{name});
    return Ok();
}

Result<void> PluginManager::initialize_all() {
    std::vector<std::string> names = registered_plugins();

    std::vector<std::string> failed;
    std::vector<Error> failures;
    for (const auto& name : names) {
        auto result = initialize(name);
        if (!result) {
            failed.push_back(name);
            failures.push_back(result.error());
        }
    }

    if (failures.empty()) {
        return Ok();
    }

    Error err(PluginError::batch_failed("initialize",
        "Failed to initialize " + std::to_string(failures.size()) + " plugin(s): " + join_names(failed)));
    err.with_context("plugins", join_names(failed));
    for (auto& failure : failures) {
        err.add_child(std::move(failure));
    }
    return Err(std::move(err));
}

Result<void> PluginManager::destroy(const std::string& name) {
    Record* record = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(name);
        if (it == m_records.end() || !it->second->initialized || it->second->busy) {
            return Ok();
        }
        record = it->second.get();
        record->busy = true;
    }

    m_events.emit(events::PLUGIN_DESTROYING, PluginEvent{name});

    auto result = sker_core::invoke_guarded(
        [record]() { return record->plugin->destroy(); },
        ErrorCode::PluginFailed);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        record->busy = false;
        if (result) {
            record->initialized = false;
            record->instance.reset();
            m_initialization_order.erase(
                std::remove(m_initialization_order.begin(), m_initialization_order.end(), name),
                m_initialization_order.end());
        }
    }

    if (!result) {
        Error err(PluginError::destroy_failed(name, result.error().message()));
        err.with_cause(result.error());
        return fail(name, "destroy", std::move(err));
    }

    sker_core::plugin_logger()->info("Destroyed plugin \"{}\"", name);
    m_events.emit(events::PLUGIN_DESTROYED, PluginEvent{name});
    return Ok();
}

Result<void> PluginManager::destroy_all() {
    std::vector<std::string> names = initialized_plugins();
    std::reverse(names.begin(), names.end());

    std::vector<std::string> failed;
    std::vector<Error> failures;
    for (const auto& name : names) {
        auto result = destroy(name);
        if (!result) {
            failed.push_back(name);
            failures.push_back(result.error());
        }
    }

    if (failures.empty()) {
        return Ok();
    }

    Error err(PluginError::batch_failed("destroy",
        "Failed to destroy " + std::to_string(failures.size()) + " plugin(s): " + join_names(failed)));
    err.with_context("plugins", join_names(failed));
    for (auto& failure : failures) {
        err.add_child(std::move(failure));
    }
    return Err(std::move(err));
}

Result<void> PluginManager::fail(const std::string& name, const std::string& phase, Error err) {
    sker_core::plugin_logger()->error("{}", sker_core::build_error_chain(err));
    m_events.emit(events::PLUGIN_ERROR, PluginErrorEvent{name, err, phase});
    return Err(std::move(err));
}

Result<void> PluginManager::enable(const std::string& name) {
    bool needs_init = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(name);
        if (it == m_records.end()) {
            return Err(PluginError::not_found(name));
        }
        if (it->second->config.enabled) {
            return Ok();
        }
        it->second->config.enabled = true;
        needs_init = !it->second->initialized;
    }

    if (needs_init) {
        auto result = initialize(name);
        if (!result) {
            return result;
        }
    }

    m_events.emit(events::PLUGIN_ENABLED, PluginEvent{name});
    return Ok();
}

Result<void> PluginManager::disable(const std::string& name) {
    bool needs_destroy = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(name);
        if (it == m_records.end()) {
            return Err(PluginError::not_found(name));
        }
        if (!it->second->config.enabled) {
            return Ok();
        }
        needs_destroy = it->second->initialized;
    }

    if (needs_destroy) {
        auto result = destroy(name);
        if (!result) {
            return result;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(name);
        if (it != m_records.end()) {
            it->second->config.enabled = false;
        }
    }

    m_events.emit(events::PLUGIN_DISABLED, PluginEvent{name});
    return Ok();
}

Result<void> PluginManager::update_plugin_config(const std::string& name, const sker_core::Options& options) {
    PluginConfigUpdatedEvent event;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(name);
        if (it == m_records.end()) {
            return Err(PluginError::not_found(name));
        }
        Record& record = *it->second;
        event.name = name;
        event.old_config = record.context.config;
        record.context.config = sker_core::merge_options(record.context.config, options);
        record.config.options = sker_core::merge_options(record.config.options, options);
        event.new_config = record.context.config;
    }

    sker_core::plugin_logger()->debug("Updated config of plugin \"{}\" ({} key(s))", name, options.size());
    m_events.emit(events::PLUGIN_CONFIG_UPDATED, std::move(event));
    return Ok();
}

// =============================================================================
// Queries
// =============================================================================

std::any* PluginManager::instance(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(name);
    if (it == m_records.end() || !it->second->initialized) {
        return nullptr;
    }
    return &it->second->instance;
}

bool PluginManager::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.find(name) != m_records.end();
}

bool PluginManager::is_initialized(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(name);
    return it != m_records.end() && it->second->initialized;
}

std::size_t PluginManager::plugin_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

std::vector<std::string> PluginManager::registered_plugins() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registration_order;
}

std::vector<std::string> PluginManager::initialized_plugins() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialization_order;
}

std::optional<PluginConfig> PluginManager::plugin_config(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(name);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second->config;
}

std::map<std::string, PluginInfo> PluginManager::all_plugin_info() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<std::string, PluginInfo> info;
    for (const auto& [name, record] : m_records) {
        info.emplace(name, PluginInfo{name, record->plugin->version(), record->config, record->initialized});
    }
    return info;
}

// =============================================================================
// PluginCatalog
// =============================================================================

PluginCatalog& PluginCatalog::global() {
    static PluginCatalog catalog;
    return catalog;
}

Result<void> PluginCatalog::add(const std::string& package, Factory factory) {
    if (package.empty() || !factory) {
        return Err(PluginError::invalid_argument("Catalog entries need a package name and a factory"));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_factories.emplace(package, std::move(factory)).second) {
        return Err(Error(ErrorCode::AlreadyExists, "Package \"" + package + "\" is already in the catalog"));
    }
    return Ok();
}

bool PluginCatalog::remove(const std::string& package) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_factories.erase(package) > 0;
}

bool PluginCatalog::contains(const std::string& package) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_factories.find(package) != m_factories.end();
}

std::vector<std::string> PluginCatalog::packages() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_factories.size());
    for (const auto& [package, factory] : m_factories) {
        names.push_back(package);
    }
    return names;
}

Result<std::unique_ptr<Plugin>> PluginCatalog::create(const PluginConfig& config) const {
    const std::string& package = config.package.empty() ? config.name : config.package;

    Factory factory;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_factories.find(package);
        if (it == m_factories.end()) {
            return Err<std::unique_ptr<Plugin>>(
                Error(ErrorCode::NotFound, "No plugin package \"" + package + "\" in the catalog"));
        }
        factory = it->second;
    }

    auto created = sker_core::invoke_guarded(
        [&]() -> Result<std::unique_ptr<Plugin>> { return factory(config); },
        ErrorCode::PluginFailed);
    if (!created) {
        return created;
    }
    if (!created.value()) {
        return Err<std::unique_ptr<Plugin>>(
            PluginError::init_failed(config.name, "package \"" + package + "\" produced no plugin"));
    }
    return created;
}

} // namespace sker_kernel
