/// @file version.cpp
/// @brief Version utilities implementation for sker_core

#include <sker/core/version.hpp>
#include <regex>

namespace sker_core {

static constexpr Version SKER_VERSION = Version{0, 3, 0};

Version sker_version() {
    return SKER_VERSION;
}

/// Format: major.minor.patch[-prerelease][+build]
Result<Version> parse_version(const std::string& str) {
    static const std::regex version_regex(
        R"(^v?(\d+)\.(\d+)(?:\.(\d+))?(?:-[0-9A-Za-z.-]+)?(?:\+[0-9A-Za-z.-]+)?$)");
    std::smatch match;

    if (!std::regex_match(str, match, version_regex)) {
        return Err<Version>(Error(ErrorCode::ParseError, "Invalid version format: " + str));
    }

    auto component = [&match](std::size_t index) -> std::optional<std::uint16_t> {
        if (!match[index].matched) {
            return std::uint16_t{0};
        }
        unsigned long value = 0;
        try {
            value = std::stoul(match[index].str());
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
        if (value > 0xFFFF) {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(value);
    };

    auto major = component(1);
    auto minor = component(2);
    auto patch = component(3);
    if (!major || !minor || !patch) {
        return Err<Version>(Error(ErrorCode::ParseError, "Version number overflow: " + str));
    }

    return Ok(Version{*major, *minor, *patch});
}

} // namespace sker_core
