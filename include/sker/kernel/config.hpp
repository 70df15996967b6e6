/// @file config.hpp
/// @brief Layered service configuration
///
/// Provides layered configuration with:
/// - Default values
/// - Configuration file loading (JSON, TOML)
/// - Environment variables (PREFIX_A_B -> a.b)
/// - Runtime overrides with change notification
/// - Optional validation of the resolved view

#pragma once

#include "fwd.hpp"

#include <sker/core/error.hpp>
#include <sker/core/value.hpp>
#include <sker/event/event_bus.hpp>

#include <any>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace sker_kernel {

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    Override = -1000,    ///< Runtime set() calls (highest)
    Environment = -500,  ///< Environment variables
    File = 0,            ///< Configuration files
    Defaults = 1000,     ///< Built-in defaults (lowest)
};

[[nodiscard]] const char* config_layer_name(ConfigLayerPriority priority);

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(ConfigLayerPriority priority)
        : m_priority(priority) {}

    [[nodiscard]] const char* name() const { return config_layer_name(m_priority); }

    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;

    [[nodiscard]] std::optional<sker_core::ConfigValue> get(const std::string& key) const;

    void set(const std::string& key, sker_core::ConfigValue value);

    bool remove(const std::string& key);

    void clear() { m_values.clear(); }

    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] const sker_core::Options& values() const { return m_values; }

    [[nodiscard]] std::size_t size() const { return m_values.size(); }

    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    ConfigLayerPriority m_priority;
    sker_core::Options m_values;
};

// =============================================================================
// Config Types
// =============================================================================

/// Payload of events::CONFIG_CHANGE. Empty value means the key is gone.
struct ConfigChangeEvent {
    std::string key;
    std::optional<sker_core::ConfigValue> value;
    std::optional<sker_core::ConfigValue> old_value;
};

/// Payload of events::CONFIG_RESET
struct ConfigResetEvent {
    sker_core::Options old_config;
    sker_core::Options new_config;
};

/// Checks the resolved configuration
using ConfigValidator = std::function<sker_core::Result<void>(const sker_core::Options& resolved)>;

/// Per-key change callback
using ConfigWatcher = std::function<void(const std::optional<sker_core::ConfigValue>& value)>;

using ConfigWatchId = std::uint64_t;

struct ConfigOptions {
    sker_core::Options defaults;
    std::vector<std::filesystem::path> files;   ///< .json or .toml, loaded in order
    std::optional<std::string> env_prefix;      ///< Unset: environment is not read
    ConfigValidator validator;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    explicit ConfigManager(ConfigOptions options = {});
    ~ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Read every configured source, then validate. A source that fails to
    /// load is logged and skipped; only validation failures are returned.
    sker_core::Result<void> load();

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool has(const std::string& key) const;

    /// Value from the highest priority layer that holds the key
    [[nodiscard]] std::optional<sker_core::ConfigValue> get(const std::string& key) const;

    template<typename T>
    [[nodiscard]] T get_or(const std::string& key, T default_value) const {
        auto value = get(key);
        if (!value) return default_value;

        if constexpr (std::is_same_v<T, bool>) {
            if (auto* v = std::get_if<bool>(&*value)) return *v;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto* v = std::get_if<std::int64_t>(&*value)) return static_cast<T>(*v);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto* v = std::get_if<double>(&*value)) return static_cast<T>(*v);
            if (auto* v = std::get_if<std::int64_t>(&*value)) return static_cast<T>(*v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (auto* v = std::get_if<std::string>(&*value)) return *v;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            if (auto* v = std::get_if<std::vector<std::string>>(&*value)) return *v;
        }

        return default_value;
    }

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;

    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;

    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;

    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;

    [[nodiscard]] std::vector<std::string> get_string_array(
        const std::string& key,
        const std::vector<std::string>& default_value = {}) const;

    /// Resolved view of every key
    [[nodiscard]] sker_core::Options all() const;

    // =========================================================================
    // Value Setting
    // =========================================================================

    /// Set in the override layer. Emits change when the resolved value differs.
    void set(const std::string& key, sker_core::ConfigValue value);

    /// Drop the key from every layer but the defaults
    bool remove(const std::string& key);

    /// Clear overrides and loaded sources, reload them and emit reset
    sker_core::Result<void> reset();

    // =========================================================================
    // Sources
    // =========================================================================

    /// Load a file into the file layer, format chosen by extension
    sker_core::Result<void> load_file(const std::filesystem::path& path);

    sker_core::Result<void> load_json(const std::filesystem::path& path);
    sker_core::Result<void> load_json_string(const std::string& content, const std::string& source = "<string>");

    sker_core::Result<void> load_toml(const std::filesystem::path& path);
    sker_core::Result<void> load_toml_string(const std::string& content, const std::string& source = "<string>");

    /// Load PREFIX_* environment variables into the environment layer
    /// @return Number of variables read
    std::size_t load_environment(const std::string& prefix);

    /// Run the validator (if any) against the resolved view
    sker_core::Result<void> validate() const;

    // =========================================================================
    // Watchers & Events
    // =========================================================================

    /// Call @p watcher whenever @p key changes through set() or remove()
    ConfigWatchId on_change(const std::string& key, ConfigWatcher watcher);

    bool unwatch(ConfigWatchId id);

    [[nodiscard]] sker_event::EventBus& events() noexcept { return m_events; }

    sker_core::Result<sker_event::ListenerId> on(const std::string& event, sker_event::Handler handler) {
        return m_events.on(event, std::move(handler));
    }

    void off(const std::string& event, sker_event::ListenerId id) { m_events.off(event, id); }

    [[nodiscard]] const ConfigLayer& layer(ConfigLayerPriority priority) const;

    [[nodiscard]] const ConfigOptions& options() const noexcept { return m_options; }

private:
    ConfigLayer& layer_mut(ConfigLayerPriority priority);

    /// Caller holds m_mutex
    std::optional<sker_core::ConfigValue> resolve(const std::string& key) const;
    sker_core::Options resolve_all() const;

    void load_sources();

    void notify_change(const std::string& key,
                       const std::optional<sker_core::ConfigValue>& value,
                       const std::optional<sker_core::ConfigValue>& old_value);

private:
    struct Watch {
        ConfigWatchId id;
        std::string key;
        ConfigWatcher watcher;
    };

    ConfigOptions m_options;
    sker_event::EventBus m_events{"config"};

    mutable std::mutex m_mutex;
    std::vector<std::unique_ptr<ConfigLayer>> m_layers;  // sorted, highest priority first

    std::mutex m_watch_mutex;
    std::vector<Watch> m_watches;
    ConfigWatchId m_next_watch = 1;
};

} // namespace sker_kernel
