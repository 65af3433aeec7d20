#pragma once

/// @file error.hpp
/// @brief Error handling types for arphys_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace arphys_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
};

[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Registration errors. Unknown ids are not errors: lookups return
/// nullptr or false.
struct PhysicsError {
    enum class Kind : std::uint8_t {
        InvalidMass,        // Non-kinematic body with mass <= 0
        InvalidGeometry,    // Non-positive or non-finite extents, empty mesh, zero normal
    };

    Kind kind;
    std::string message;
    std::string subject;  // Offending id or geometry description

    [[nodiscard]] static PhysicsError invalid_mass(float mass) {
        return PhysicsError{Kind::InvalidMass,
            "Dynamic body requires positive mass, got " + std::to_string(mass),
            std::to_string(mass)};
    }

    [[nodiscard]] static PhysicsError invalid_geometry(const std::string& reason) {
        return PhysicsError{Kind::InvalidGeometry, "Invalid geometry: " + reason, {}};
    }
};

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        Io,            // File missing or unreadable
        Parse,         // Malformed JSON
        InvalidValue,  // Well-formed but out of range
    };

    Kind kind;
    std::string message;
    std::string key;  // Offending key for InvalidValue, path for Io

    [[nodiscard]] static ConfigError io(const std::string& path) {
        return ConfigError{Kind::Io, "Cannot read configuration file: " + path, path};
    }

    [[nodiscard]] static ConfigError parse(const std::string& detail) {
        return ConfigError{Kind::Parse, "Malformed configuration: " + detail, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, key};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        PhysicsError,
        ConfigError,
        std::string  // Generic message
    >;

    Error() : m_code(ErrorCode::Unknown), m_error(std::string("Unknown error")) {}
    Error(PhysicsError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(PhysicsError::Kind kind) {
        switch (kind) {
            case PhysicsError::Kind::InvalidMass: return ErrorCode::InvalidArgument;
            case PhysicsError::Kind::InvalidGeometry: return ErrorCode::ValidationError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::Io: return ErrorCode::IOError;
            case ConfigError::Kind::Parse: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::ValidationError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Value-or-error return type
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Value access, undefined if error
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Error access, undefined if ok
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T fallback) const {
        return m_value.has_value() ? *m_value : std::move(fallback);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Throws std::runtime_error carrying the error message
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error(describe(m_error));
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error(describe(m_error));
        }
        return std::move(*m_value);
    }

    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        using R = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        return R(std::move(m_error));
    }

private:
    static std::string describe(const E& err) {
        if constexpr (std::is_same_v<E, Error>) {
            return err.message();
        } else {
            return "Result contains error";
        }
    }

    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (error.cpp)
// =============================================================================

/// "[Code] [Kind] message (key=value, ...)"
std::string build_error_chain(const Error& error);

namespace debug {

/// Count an error by kind; used by the world when registration fails
void record_error(const Error& error);

std::uint64_t total_error_count();

void reset_error_stats();

std::string error_stats_summary();

} // namespace debug

} // namespace arphys_core
