/// @file log.cpp
/// @brief Named logger registry for arphys
///
/// Every subsystem logs through a named spdlog logger so that the
/// simulation, snapping and performance output can be filtered separately.

#include <arphys/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <sstream>
#include <vector>

namespace arphys_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    LogConfig config;
};

LoggerRegistry& registry() {
    static LoggerRegistry reg;
    return reg;
}

/// Build sinks for a new logger. Caller holds the registry mutex.
std::vector<spdlog::sink_ptr> make_sinks(const LoggerRegistry& reg, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (reg.config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (reg.config.file_enabled && !reg.config.log_directory.empty()) {
        auto path = std::filesystem::path(reg.config.log_directory) / (name + ".log");
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), reg.config.max_file_size, reg.config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file '{}': {}", path.string(), e.what());
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(config.level);
    }
    spdlog::set_level(config.level);
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        return it->second;
    }

    // Another component may have registered the name directly with spdlog
    if (auto existing = spdlog::get(name)) {
        reg.loggers.emplace(name, existing);
        return existing;
    }

    auto sinks = make_sinks(reg, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.config.level);
    spdlog::register_logger(logger);
    reg.loggers.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> physics_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("arphys_physics");
    return logger;
}

std::shared_ptr<spdlog::logger> perf_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("arphys_perf");
    return logger;
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config.level = level;
    spdlog::set_level(level);
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        it->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Logging
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    std::ostringstream oss;
    oss << message;
    if (!fields.empty()) {
        oss << " {";
        const char* sep = "";
        for (const auto& [key, value] : fields) {
            oss << sep << key << "=\"" << value << "\"";
            sep = ", ";
        }
        oss << "}";
    }
    get_logger(logger_name)->log(level, oss.str());
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace("> {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("< {} ({}us)", m_name, elapsed.count());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();
}

} // namespace arphys_core
