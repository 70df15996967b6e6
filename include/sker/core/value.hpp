#pragma once

/// @file value.hpp
/// @brief Typed configuration values and a type-erased value store

#include "fwd.hpp"
#include <any>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace sker_core {

// =============================================================================
// ConfigValue
// =============================================================================

/// Configuration value (plugin options, config layers)
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// Configuration value type
enum class ConfigValueType : std::uint8_t {
    Bool,
    Int,
    Float,
    String,
    StringArray,
};

/// Free-form options bag keyed by option name
using Options = std::map<std::string, ConfigValue>;

[[nodiscard]] ConfigValueType config_value_type(const ConfigValue& value);

[[nodiscard]] const char* config_value_type_name(ConfigValueType type);

/// Render a value for logs ("true", "42", "a,b")
[[nodiscard]] std::string config_value_to_string(const ConfigValue& value);

/// Infer a value from text: true/false, integer, float, else string
[[nodiscard]] ConfigValue parse_config_value(const std::string& text);

/// Typed read from an options bag
template<typename T>
[[nodiscard]] T option_or(const Options& options, const std::string& key, T default_value) {
    auto it = options.find(key);
    if (it == options.end()) {
        return default_value;
    }
    const ConfigValue& value = it->second;

    if constexpr (std::is_same_v<T, bool>) {
        if (auto* v = std::get_if<bool>(&value)) return *v;
    } else if constexpr (std::is_integral_v<T>) {
        if (auto* v = std::get_if<std::int64_t>(&value)) return static_cast<T>(*v);
    } else if constexpr (std::is_floating_point_v<T>) {
        if (auto* v = std::get_if<double>(&value)) return static_cast<T>(*v);
        if (auto* v = std::get_if<std::int64_t>(&value)) return static_cast<T>(*v);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (auto* v = std::get_if<std::string>(&value)) return *v;
    } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
        if (auto* v = std::get_if<std::vector<std::string>>(&value)) return *v;
    }

    return default_value;
}

/// Shallow merge: keys in overlay replace keys in base
[[nodiscard]] Options merge_options(const Options& base, const Options& overlay);

// =============================================================================
// ValueStore
// =============================================================================

/// String-keyed store of arbitrary values with typed accessors.
///
/// A child store reads through to its parent for keys it does not hold
/// itself; writes and removals only ever touch the local entries.
/// Not synchronized.
class ValueStore {
public:
    ValueStore() = default;

    /// Create a store that falls back to @p parent on lookup misses
    [[nodiscard]] static ValueStore child(std::shared_ptr<const ValueStore> parent) {
        ValueStore store;
        store.m_parent = std::move(parent);
        return store;
    }

    template<typename T>
    void insert(const std::string& key, T value) {
        m_values[key] = std::move(value);
    }

    void set(const std::string& key, std::any value) {
        m_values[key] = std::move(value);
    }

    /// Typed lookup (local first, then parent); nullptr on miss or type mismatch
    template<typename T>
    [[nodiscard]] const T* get(const std::string& key) const {
        const std::any* value = find(key);
        return value ? std::any_cast<T>(value) : nullptr;
    }

    /// Mutable typed lookup of a local entry
    template<typename T>
    [[nodiscard]] T* get_mut(const std::string& key) {
        auto it = m_values.find(key);
        if (it == m_values.end()) {
            return nullptr;
        }
        return std::any_cast<T>(&it->second);
    }

    template<typename T>
    [[nodiscard]] T get_or(const std::string& key, T default_value) const {
        const T* value = get<T>(key);
        return value ? *value : std::move(default_value);
    }

    /// Untyped lookup (local first, then parent)
    [[nodiscard]] const std::any* find(const std::string& key) const;

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }

    [[nodiscard]] bool contains_local(const std::string& key) const {
        return m_values.find(key) != m_values.end();
    }

    bool remove(const std::string& key) {
        return m_values.erase(key) > 0;
    }

    void clear() { m_values.clear(); }

    /// Keys visible through this store, parent keys included
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_values.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_values.empty(); }

    [[nodiscard]] const ValueStore* parent() const noexcept { return m_parent.get(); }

private:
    std::map<std::string, std::any> m_values;
    std::shared_ptr<const ValueStore> m_parent;
};

} // namespace sker_core
