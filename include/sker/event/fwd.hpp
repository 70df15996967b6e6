#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for sker_event

#include <cstdint>

namespace sker_event {

// IDs
struct ListenerId;

// Core types
class EventBus;

// Payloads
struct ErrorEvent;

} // namespace sker_event
