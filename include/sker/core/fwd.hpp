#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for sker_core module

#include <cstdint>

namespace sker_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Version
// =============================================================================

struct Version;

// =============================================================================
// Values
// =============================================================================

class ValueStore;

// =============================================================================
// Async
// =============================================================================

class CancellationToken;
class BackgroundTasks;

} // namespace sker_core
