/// @file config.cpp
/// @brief Configuration system implementation

#include <sker/kernel/config.hpp>
#include <sker/core/log.hpp>

#include "json_options.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <unistd.h>

extern char** environ;

namespace sker_kernel {

using sker_core::ConfigError;
using sker_core::ConfigValue;
using sker_core::Err;
using sker_core::Error;
using sker_core::ErrorCode;
using sker_core::Ok;
using sker_core::Options;
using sker_core::Result;

namespace events = sker_event::events;

const char* config_layer_name(ConfigLayerPriority priority) {
    switch (priority) {
        case ConfigLayerPriority::Override: return "override";
        case ConfigLayerPriority::Environment: return "environment";
        case ConfigLayerPriority::File: return "file";
        case ConfigLayerPriority::Defaults: return "defaults";
        default: return "unknown";
    }
}

namespace {

std::string join_key(const std::string& prefix, const std::string& key) {
    return prefix.empty() ? key : prefix + "." + key;
}

void flatten_toml(const toml::table& table, const std::string& prefix, Options& out) {
    for (auto&& [key, node] : table) {
        std::string name = join_key(prefix, std::string(key.str()));

        if (const auto* child = node.as_table()) {
            flatten_toml(*child, name, out);
        } else if (node.is_boolean()) {
            out[name] = ConfigValue{*node.value<bool>()};
        } else if (node.is_integer()) {
            out[name] = ConfigValue{*node.value<std::int64_t>()};
        } else if (node.is_floating_point()) {
            out[name] = ConfigValue{*node.value<double>()};
        } else if (node.is_string()) {
            out[name] = ConfigValue{*node.value<std::string>()};
        } else if (const auto* arr = node.as_array()) {
            std::vector<std::string> items;
            for (const auto& item : *arr) {
                if (auto str = item.value<std::string>()) {
                    items.push_back(*str);
                } else if (auto num = item.value<std::int64_t>()) {
                    items.push_back(std::to_string(*num));
                }
            }
            out[name] = ConfigValue{std::move(items)};
        } else {
            sker_core::config_logger()->debug("Skipping unsupported TOML value at \"{}\"", name);
        }
    }
}

Result<std::string> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<std::string>(ConfigError::not_found(path.string()));
    }

    std::ifstream file(path);
    if (!file) {
        return Err<std::string>(ConfigError::io_error(path.string(), "cannot open file"));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return Ok(buffer.str());
}

} // anonymous namespace

namespace detail {

void flatten_json(const nlohmann::json& node, const std::string& prefix, Options& out) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            detail::flatten_json(it.value(), join_key(prefix, it.key()), out);
        }
        return;
    }

    if (node.is_boolean()) {
        out[prefix] = ConfigValue{node.get<bool>()};
    } else if (node.is_number_integer()) {
        out[prefix] = ConfigValue{node.get<std::int64_t>()};
    } else if (node.is_number_float()) {
        out[prefix] = ConfigValue{node.get<double>()};
    } else if (node.is_string()) {
        out[prefix] = ConfigValue{node.get<std::string>()};
    } else if (node.is_array()) {
        std::vector<std::string> items;
        items.reserve(node.size());
        for (const auto& item : node) {
            items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
        out[prefix] = ConfigValue{std::move(items)};
    }
}

} // namespace detail

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigManager
// =============================================================================

ConfigManager::ConfigManager(ConfigOptions options)
    : m_options(std::move(options))
{
    for (auto priority : {ConfigLayerPriority::Override, ConfigLayerPriority::Environment,
                          ConfigLayerPriority::File, ConfigLayerPriority::Defaults}) {
        m_layers.push_back(std::make_unique<ConfigLayer>(priority));
    }

    ConfigLayer& defaults = layer_mut(ConfigLayerPriority::Defaults);
    for (const auto& [key, value] : m_options.defaults) {
        defaults.set(key, value);
    }
}

Result<void> ConfigManager::load() {
    load_sources();
    return validate();
}

void ConfigManager::load_sources() {
    for (const auto& path : m_options.files) {
        auto result = load_file(path);
        if (!result) {
            sker_core::config_logger()->warn("Failed to load config from {}: {}",
                path.string(), result.error().message());
        }
    }

    if (m_options.env_prefix) {
        load_environment(*m_options.env_prefix);
    }
}

const ConfigLayer& ConfigManager::layer(ConfigLayerPriority priority) const {
    for (const auto& layer : m_layers) {
        if (layer->priority() == priority) {
            return *layer;
        }
    }
    return *m_layers.back();
}

ConfigLayer& ConfigManager::layer_mut(ConfigLayerPriority priority) {
    for (auto& layer : m_layers) {
        if (layer->priority() == priority) {
            return *layer;
        }
    }
    return *m_layers.back();
}

// =============================================================================
// Value Access
// =============================================================================

std::optional<ConfigValue> ConfigManager::resolve(const std::string& key) const {
    for (const auto& layer : m_layers) {
        if (auto value = layer->get(key)) {
            return value;
        }
    }
    return std::nullopt;
}

Options ConfigManager::resolve_all() const {
    Options merged;
    // Lowest priority first, higher layers overwrite
    for (auto it = m_layers.rbegin(); it != m_layers.rend(); ++it) {
        for (const auto& [key, value] : (*it)->values()) {
            merged[key] = value;
        }
    }
    return merged;
}

bool ConfigManager::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return resolve(key).has_value();
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return resolve(key);
}

Options ConfigManager::all() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return resolve_all();
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v == "true" || *v == "1" || *v == "yes";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        ConfigValue parsed = sker_core::parse_config_value(*v);
        if (auto* i = std::get_if<std::int64_t>(&parsed)) {
            return *i;
        }
        return default_value;
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }

    return default_value;
}

double ConfigManager::get_float(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<double>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return static_cast<double>(*v);
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        ConfigValue parsed = sker_core::parse_config_value(*v);
        if (auto* d = std::get_if<double>(&parsed)) {
            return *d;
        }
        if (auto* i = std::get_if<std::int64_t>(&parsed)) {
            return static_cast<double>(*i);
        }
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    return sker_core::config_value_to_string(*value);
}

std::vector<std::string> ConfigManager::get_string_array(
    const std::string& key,
    const std::vector<std::string>& default_value) const
{
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::vector<std::string>>(&*value)) {
        return *v;
    }

    return default_value;
}

// =============================================================================
// Value Setting
// =============================================================================

void ConfigManager::set(const std::string& key, ConfigValue value) {
    std::optional<ConfigValue> old_value;
    std::optional<ConfigValue> new_value;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        old_value = resolve(key);
        layer_mut(ConfigLayerPriority::Override).set(key, std::move(value));
        new_value = resolve(key);
    }

    if (old_value != new_value) {
        notify_change(key, new_value, old_value);
    }
}

bool ConfigManager::remove(const std::string& key) {
    std::optional<ConfigValue> old_value;
    std::optional<ConfigValue> new_value;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        old_value = resolve(key);
        for (auto& layer : m_layers) {
            if (layer->priority() != ConfigLayerPriority::Defaults) {
                removed = layer->remove(key) || removed;
            }
        }
        new_value = resolve(key);
    }

    if (removed) {
        notify_change(key, new_value, old_value);
    }
    return removed;
}

Result<void> ConfigManager::reset() {
    Options old_config;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        old_config = resolve_all();
        for (auto& layer : m_layers) {
            if (layer->priority() != ConfigLayerPriority::Defaults) {
                layer->clear();
            }
        }
    }

    load_sources();

    Options new_config = all();
    sker_core::config_logger()->debug("Configuration reset ({} key(s))", new_config.size());
    m_events.emit(events::CONFIG_RESET, ConfigResetEvent{std::move(old_config), std::move(new_config)});
    return validate();
}

// =============================================================================
// Sources
// =============================================================================

Result<void> ConfigManager::load_file(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return load_json(path);
    }
    if (ext == ".toml") {
        return load_toml(path);
    }
    return Err(ConfigError::parse_error(path.string(), "unsupported config file format"));
}

Result<void> ConfigManager::load_json(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return Err(content.error());
    }
    return load_json_string(content.value(), path.string());
}

Result<void> ConfigManager::load_json_string(const std::string& content, const std::string& source) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        return Err(ConfigError::parse_error(source, e.what()));
    }

    if (!j.is_object()) {
        return Err(ConfigError::parse_error(source, "top-level value must be an object"));
    }

    Options values;
    detail::flatten_json(j, "", values);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ConfigLayer& file = layer_mut(ConfigLayerPriority::File);
        for (auto& [key, value] : values) {
            file.set(key, std::move(value));
        }
    }

    sker_core::config_logger()->debug("Loaded {} key(s) from {}", values.size(), source);
    return Ok();
}

Result<void> ConfigManager::load_toml(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return Err(content.error());
    }
    return load_toml_string(content.value(), path.string());
}

Result<void> ConfigManager::load_toml_string(const std::string& content, const std::string& source) {
    Options values;
    try {
        toml::table tbl = toml::parse(content, source);
        flatten_toml(tbl, "", values);
    } catch (const toml::parse_error& err) {
        return Err(ConfigError::parse_error(source, std::string(err.description())));
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ConfigLayer& file = layer_mut(ConfigLayerPriority::File);
        for (auto& [key, value] : values) {
            file.set(key, std::move(value));
        }
    }

    sker_core::config_logger()->debug("Loaded {} key(s) from {}", values.size(), source);
    return Ok();
}

std::size_t ConfigManager::load_environment(const std::string& prefix) {
    Options values;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string variable(*entry);
        auto eq = variable.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string name = variable.substr(0, eq);
        if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        // PREFIX_SERVER_PORT -> server.port
        std::string key = name.substr(prefix.size());
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
            return c == '_' ? '.' : static_cast<char>(std::tolower(c));
        });
        values[key] = sker_core::parse_config_value(variable.substr(eq + 1));
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ConfigLayer& env = layer_mut(ConfigLayerPriority::Environment);
        for (const auto& [key, value] : values) {
            env.set(key, value);
        }
    }

    sker_core::config_logger()->debug("Loaded {} environment variable(s) with prefix \"{}\"", values.size(), prefix);
    return values.size();
}

Result<void> ConfigManager::validate() const {
    if (!m_options.validator) {
        return Ok();
    }

    Options resolved = all();
    auto result = sker_core::invoke_guarded(
        [this, &resolved]() { return m_options.validator(resolved); },
        ErrorCode::ConfigInvalid);
    if (!result) {
        Error err(ConfigError::invalid(result.error().message()));
        err.with_cause(result.error());
        sker_core::config_logger()->error("{}", err.message());
        return Err(std::move(err));
    }
    return Ok();
}

// =============================================================================
// Watchers
// =============================================================================

ConfigWatchId ConfigManager::on_change(const std::string& key, ConfigWatcher watcher) {
    std::lock_guard<std::mutex> lock(m_watch_mutex);
    ConfigWatchId id = m_next_watch++;
    m_watches.push_back(Watch{id, key, std::move(watcher)});
    return id;
}

bool ConfigManager::unwatch(ConfigWatchId id) {
    std::lock_guard<std::mutex> lock(m_watch_mutex);
    auto it = std::find_if(m_watches.begin(), m_watches.end(),
        [id](const Watch& watch) { return watch.id == id; });
    if (it == m_watches.end()) {
        return false;
    }
    m_watches.erase(it);
    return true;
}

void ConfigManager::notify_change(
    const std::string& key,
    const std::optional<ConfigValue>& value,
    const std::optional<ConfigValue>& old_value)
{
    m_events.emit(events::CONFIG_CHANGE, ConfigChangeEvent{key, value, old_value});

    std::vector<ConfigWatcher> watchers;
    {
        std::lock_guard<std::mutex> lock(m_watch_mutex);
        for (const auto& watch : m_watches) {
            if (watch.key == key && watch.watcher) {
                watchers.push_back(watch.watcher);
            }
        }
    }

    for (const auto& watcher : watchers) {
        auto result = sker_core::invoke_guarded([&watcher, &value]() { watcher(value); });
        if (!result) {
            sker_core::config_logger()->error("Config watcher error for key \"{}\": {}",
                key, result.error().message());
        }
    }
}

} // namespace sker_kernel
