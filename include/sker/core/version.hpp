#pragma once

/// @file version.hpp
/// @brief Semantic versioning for sker

#include "fwd.hpp"
#include "error.hpp"
#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

namespace sker_core {

// =============================================================================
// Version
// =============================================================================

/// Semantic version (major.minor.patch)
struct Version {
    std::uint16_t major = 0;
    std::uint16_t minor = 0;
    std::uint16_t patch = 0;

    constexpr Version() noexcept = default;

    constexpr Version(std::uint16_t maj, std::uint16_t min, std::uint16_t pat) noexcept
        : major(maj), minor(min), patch(pat) {}

    [[nodiscard]] static constexpr Version create(std::uint16_t maj, std::uint16_t min = 0, std::uint16_t pat = 0) noexcept {
        return Version{maj, min, pat};
    }

    /// Pre-1.0: minor must match exactly.
    /// Post-1.0: major must match, and self >= other.
    [[nodiscard]] constexpr bool is_compatible_with(const Version& other) const noexcept {
        if (major == 0 && other.major == 0) {
            return minor == other.minor && patch >= other.patch;
        }
        return major == other.major &&
               (minor > other.minor || (minor == other.minor && patch >= other.patch));
    }

    /// Parse "major.minor.patch" or "major.minor"
    [[nodiscard]] static std::optional<Version> parse(const std::string& s) {
        Version v;
        char dot1 = 0;
        char dot2 = 0;
        std::istringstream iss(s);

        if (iss >> v.major >> dot1 >> v.minor >> dot2 >> v.patch) {
            if (dot1 == '.' && dot2 == '.') {
                return v;
            }
        }

        iss.clear();
        iss.str(s);
        v.patch = 0;
        if (iss >> v.major >> dot1 >> v.minor && dot1 == '.') {
            return v;
        }

        return std::nullopt;
    }

    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }

    constexpr auto operator<=>(const Version&) const noexcept = default;
    constexpr bool operator==(const Version&) const noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, const Version& v) {
    return os << v.major << '.' << v.minor << '.' << v.patch;
}

// =============================================================================
// Version Utilities (Implemented in version.cpp)
// =============================================================================

/// Version of the sker kernel itself
Version sker_version();

/// Parse a version, accepting "-prerelease" and "+build" suffixes
Result<Version> parse_version(const std::string& str);

} // namespace sker_core

template<>
struct std::hash<sker_core::Version> {
    std::size_t operator()(const sker_core::Version& v) const noexcept {
        return std::hash<std::uint64_t>{}(
            (static_cast<std::uint64_t>(v.major) << 32) |
            (static_cast<std::uint64_t>(v.minor) << 16) |
            static_cast<std::uint64_t>(v.patch));
    }
};
