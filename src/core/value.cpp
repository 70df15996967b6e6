/// @file value.cpp
/// @brief ConfigValue helpers and ValueStore implementation

#include <sker/core/value.hpp>
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>

namespace sker_core {

// =============================================================================
// ConfigValue
// =============================================================================

ConfigValueType config_value_type(const ConfigValue& value) {
    switch (value.index()) {
        case 0: return ConfigValueType::Bool;
        case 1: return ConfigValueType::Int;
        case 2: return ConfigValueType::Float;
        case 3: return ConfigValueType::String;
        default: return ConfigValueType::StringArray;
    }
}

const char* config_value_type_name(ConfigValueType type) {
    switch (type) {
        case ConfigValueType::Bool: return "bool";
        case ConfigValueType::Int: return "int";
        case ConfigValueType::Float: return "float";
        case ConfigValueType::String: return "string";
        case ConfigValueType::StringArray: return "string[]";
        default: return "unknown";
    }
}

std::string config_value_to_string(const ConfigValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string joined;
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) joined += ",";
                joined += v[i];
            }
            return joined;
        }
    }, value);
}

ConfigValue parse_config_value(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true") return ConfigValue{true};
    if (lower == "false") return ConfigValue{false};

    if (!text.empty()) {
        std::size_t pos = 0;
        try {
            std::int64_t int_val = std::stoll(text, &pos);
            if (pos == text.size()) {
                return ConfigValue{int_val};
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }

        try {
            double float_val = std::stod(text, &pos);
            if (pos == text.size()) {
                return ConfigValue{float_val};
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
    }

    return ConfigValue{text};
}

Options merge_options(const Options& base, const Options& overlay) {
    Options merged = base;
    for (const auto& [key, value] : overlay) {
        merged[key] = value;
    }
    return merged;
}

// =============================================================================
// ValueStore
// =============================================================================

const std::any* ValueStore::find(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return &it->second;
    }
    return m_parent ? m_parent->find(key) : nullptr;
}

std::vector<std::string> ValueStore::keys() const {
    std::set<std::string> unique;
    for (const auto& [key, _] : m_values) {
        unique.insert(key);
    }
    if (m_parent) {
        for (auto& key : m_parent->keys()) {
            unique.insert(std::move(key));
        }
    }
    return {unique.begin(), unique.end()};
}

} // namespace sker_core
