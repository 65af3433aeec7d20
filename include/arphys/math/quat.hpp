#pragma once

/// @file quat.hpp
/// @brief Quaternion helpers on top of GLM

#include "types.hpp"
#include "vec.hpp"
#include <cmath>

namespace arphys_math {

/// @param axis Rotation axis (must be normalized)
/// @param angle Angle in radians
[[nodiscard]] inline Quat quat_from_axis_angle(const Vec3& axis, float angle) noexcept {
    return glm::angleAxis(angle, axis);
}

/// Rotation whose columns are the given orthonormal basis
[[nodiscard]] inline Quat quat_from_basis(const Vec3& x, const Vec3& y, const Vec3& z) noexcept {
    return glm::quat_cast(Mat3(x, y, z));
}

[[nodiscard]] inline Quat normalize_or_identity(const Quat& q) noexcept {
    const float len_sq = glm::length2(q);
    if (len_sq < consts::EPSILON * consts::EPSILON) {
        return quat::IDENTITY;
    }
    return q * (1.0f / std::sqrt(len_sq));
}

[[nodiscard]] inline Vec3 rotate(const Quat& q, const Vec3& v) noexcept {
    return q * v;
}

/// Body up axis (+Y) in world space
[[nodiscard]] inline Vec3 up_of(const Quat& q) noexcept {
    return q * vec3::UP;
}

/// Body forward axis (-Z) in world space
[[nodiscard]] inline Vec3 forward_of(const Quat& q) noexcept {
    return q * vec3::FORWARD;
}

/// Shortest-arc interpolation
[[nodiscard]] inline Quat slerp(const Quat& a, const Quat& b, float t) noexcept {
    return glm::slerp(a, b, t);
}

/// Angle between two orientations in radians
[[nodiscard]] inline float angle_between(const Quat& a, const Quat& b) noexcept {
    const float d = std::min(std::abs(glm::dot(a, b)), 1.0f);
    return 2.0f * std::acos(d);
}

} // namespace arphys_math
