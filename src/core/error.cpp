/// @file error.cpp
/// @brief Error formatting and error statistics for arphys_core

#include <arphys/core/error.hpp>

#include <atomic>
#include <sstream>

namespace arphys_core {

namespace detail {

const char* physics_kind_name(PhysicsError::Kind kind) {
    switch (kind) {
        case PhysicsError::Kind::InvalidMass: return "InvalidMass";
        case PhysicsError::Kind::InvalidGeometry: return "InvalidGeometry";
        default: return "Unknown";
    }
}

const char* config_kind_name(ConfigError::Kind kind) {
    switch (kind) {
        case ConfigError::Kind::Io: return "Io";
        case ConfigError::Kind::Parse: return "Parse";
        case ConfigError::Kind::InvalidValue: return "InvalidValue";
        default: return "Unknown";
    }
}

} // namespace detail

// =============================================================================
// Error Chain
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, PhysicsError>) {
            oss << "[PhysicsError:" << detail::physics_kind_name(err.kind) << "] " << err.message;
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << "[ConfigError:" << detail::config_kind_name(err.kind) << "] " << err.message;
            if (!err.key.empty()) {
                oss << " (key: " << err.key << ")";
            }
        }
    }, error.variant());

    if (!error.context().empty()) {
        oss << " (";
        const char* sep = "";
        for (const auto& [key, value] : error.context()) {
            oss << sep << key << "=" << value;
            sep = ", ";
        }
        oss << ")";
    }

    return oss.str();
}

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

namespace {

struct ErrorStats {
    std::atomic<std::uint64_t> total{0};
    std::atomic<std::uint64_t> physics{0};
    std::atomic<std::uint64_t> config{0};
    std::atomic<std::uint64_t> generic{0};
};

ErrorStats s_error_stats;

} // anonymous namespace

void record_error(const Error& error) {
    s_error_stats.total.fetch_add(1, std::memory_order_relaxed);

    if (error.is<PhysicsError>()) {
        s_error_stats.physics.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ConfigError>()) {
        s_error_stats.config.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total.store(0, std::memory_order_relaxed);
    s_error_stats.physics.store(0, std::memory_order_relaxed);
    s_error_stats.config.store(0, std::memory_order_relaxed);
    s_error_stats.generic.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Errors: total=" << s_error_stats.total.load()
        << " physics=" << s_error_stats.physics.load()
        << " config=" << s_error_stats.config.load()
        << " generic=" << s_error_stats.generic.load();
    return oss.str();
}

} // namespace debug

} // namespace arphys_core
