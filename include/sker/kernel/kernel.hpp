/// @file kernel.hpp
/// @brief Main include for the sker service kernel

#pragma once

#include "fwd.hpp"
#include "signals.hpp"
#include "config.hpp"
#include "lifecycle.hpp"
#include "plugin.hpp"
#include "middleware.hpp"
#include "core.hpp"

#include <sker/core/error.hpp>
#include <sker/core/log.hpp>
#include <sker/event/event_bus.hpp>
