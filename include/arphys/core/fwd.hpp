#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arphys_core module

#include <cstdint>

namespace arphys_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct PhysicsError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace arphys_core
