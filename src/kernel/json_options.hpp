/// @file json_options.hpp
/// @brief JSON to option map conversion shared by config and manifest loading

#pragma once

#include <sker/core/value.hpp>

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace sker_kernel::detail {

/// Flatten nested objects into dotted keys. Nulls are skipped; arrays become
/// string lists with non-string items rendered as JSON.
void flatten_json(const nlohmann::json& node, const std::string& prefix, sker_core::Options& out);

} // namespace sker_kernel::detail
