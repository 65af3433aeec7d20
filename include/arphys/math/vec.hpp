#pragma once

/// @file vec.hpp
/// @brief Vec3 helpers on top of GLM

#include "types.hpp"
#include <algorithm>
#include <cmath>

namespace arphys_math {

[[nodiscard]] inline float length(const Vec3& v) noexcept {
    return glm::length(v);
}

[[nodiscard]] inline float length_squared(const Vec3& v) noexcept {
    return glm::length2(v);
}

[[nodiscard]] inline float distance(const Vec3& a, const Vec3& b) noexcept {
    return glm::distance(a, b);
}

[[nodiscard]] inline float distance_squared(const Vec3& a, const Vec3& b) noexcept {
    return glm::length2(b - a);
}

/// Normalize, or return zero when the length is below EPSILON
[[nodiscard]] inline Vec3 normalize_or_zero(const Vec3& v) noexcept {
    const float len_sq = glm::length2(v);
    if (len_sq < consts::EPSILON * consts::EPSILON) {
        return vec3::ZERO;
    }
    return v * (1.0f / std::sqrt(len_sq));
}

/// Scale `v` down so that its length does not exceed `max_length`
[[nodiscard]] inline Vec3 clamp_length(const Vec3& v, float max_length) noexcept {
    const float len_sq = glm::length2(v);
    if (len_sq <= max_length * max_length || len_sq < consts::EPSILON * consts::EPSILON) {
        return v;
    }
    return v * (max_length / std::sqrt(len_sq));
}

[[nodiscard]] inline Vec3 project(const Vec3& v, const Vec3& onto) noexcept {
    const float len_sq = glm::length2(onto);
    if (len_sq < consts::EPSILON * consts::EPSILON) {
        return vec3::ZERO;
    }
    return onto * (glm::dot(v, onto) / len_sq);
}

/// Closest point to `p` on segment [a, b]
[[nodiscard]] inline Vec3 closest_point_on_segment(const Vec3& p, const Vec3& a, const Vec3& b) noexcept {
    const Vec3 ab = b - a;
    const float len_sq = glm::length2(ab);
    if (len_sq < consts::EPSILON * consts::EPSILON) {
        return a;
    }
    const float t = std::clamp(glm::dot(p - a, ab) / len_sq, 0.0f, 1.0f);
    return a + ab * t;
}

[[nodiscard]] inline Vec3 min(const Vec3& a, const Vec3& b) noexcept {
    return glm::min(a, b);
}

[[nodiscard]] inline Vec3 max(const Vec3& a, const Vec3& b) noexcept {
    return glm::max(a, b);
}

[[nodiscard]] inline float max_component(const Vec3& v) noexcept {
    return std::max({v.x, v.y, v.z});
}

[[nodiscard]] inline float min_component(const Vec3& v) noexcept {
    return std::min({v.x, v.y, v.z});
}

[[nodiscard]] inline bool is_finite(const Vec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/// Hermite ease 3t^2 - 2t^3 with t clamped to [0, 1]
[[nodiscard]] inline float smoothstep(float t) noexcept {
    t = std::clamp(t, 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

template<typename T>
[[nodiscard]] inline T lerp(const T& a, const T& b, float t) noexcept {
    return glm::mix(a, b, t);
}

template<typename T>
[[nodiscard]] inline bool approx_equal(const T& a, const T& b,
                                        float epsilon = consts::EPSILON) noexcept {
    return glm::all(glm::lessThan(glm::abs(a - b), T(epsilon)));
}

[[nodiscard]] inline bool approx_equal(float a, float b, float epsilon = consts::EPSILON) noexcept {
    return std::abs(a - b) < epsilon;
}

} // namespace arphys_math
