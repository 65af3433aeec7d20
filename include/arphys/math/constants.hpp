#pragma once

/// @file constants.hpp
/// @brief Scalar constants for arphys_math

#include <limits>

namespace arphys_math {

namespace consts {

inline constexpr float PI = 3.14159265358979323846f;
inline constexpr float TAU = 6.28318530717958647692f;
inline constexpr float FRAC_PI_2 = 1.57079632679489661923f;

inline constexpr float DEG_TO_RAD = PI / 180.0f;
inline constexpr float RAD_TO_DEG = 180.0f / PI;

/// Tolerance for degenerate lengths and comparisons
inline constexpr float EPSILON = 1e-6f;

/// Looser tolerance used by approximate equality in tests and snapping
inline constexpr float EPSILON_LOOSE = 1e-4f;

inline constexpr float MAX_FLOAT = std::numeric_limits<float>::max();

} // namespace consts

} // namespace arphys_math
