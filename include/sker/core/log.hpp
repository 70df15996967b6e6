#pragma once

/// @file log.hpp
/// @brief Logging utilities for sker

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define SKER_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define SKER_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define SKER_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define SKER_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define SKER_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define SKER_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace sker_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system. Applies to loggers created afterwards and
/// resets the level of existing ones.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Kernel (Core composition root) logger
std::shared_ptr<spdlog::logger> kernel_logger();

/// Event bus logger
std::shared_ptr<spdlog::logger> event_logger();

/// Lifecycle manager logger
std::shared_ptr<spdlog::logger> lifecycle_logger();

/// Plugin manager logger
std::shared_ptr<spdlog::logger> plugin_logger();

/// Middleware manager logger
std::shared_ptr<spdlog::logger> middleware_logger();

/// Config manager logger
std::shared_ptr<spdlog::logger> config_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Parse log level from string ("info", "warn", ...)
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Inverse of parse_log_level
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush every named logger and the default logger
void flush_all_loggers();

void shutdown_logging();

} // namespace sker_core
