#pragma once

/// @file log.hpp
/// @brief Logging utilities for arphys

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define ARPHYS_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define ARPHYS_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define ARPHYS_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define ARPHYS_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define ARPHYS_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define ARPHYS_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace arphys_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 5 * 1024 * 1024;  // 5 MB
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging. Loggers created before the call keep their sinks
/// but pick up the new level.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger used by the simulation (world, collision, snapping)
std::shared_ptr<spdlog::logger> physics_logger();

/// Logger used by the performance manager
std::shared_ptr<spdlog::logger> perf_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

void set_logger_level(const std::string& name, spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log a message followed by `{key="value", ...}`
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// Traces entry and exit of a block with its duration
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "arphys_physics");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define ARPHYS_LOG_SCOPE(name) ::arphys_core::LogScope _log_scope_##__LINE__(name)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

void shutdown_logging();

} // namespace arphys_core
