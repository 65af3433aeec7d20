#pragma once

/// @file mat.hpp
/// @brief Rigid transform helpers for Mat4

#include "types.hpp"
#include "quat.hpp"

namespace arphys_math {

[[nodiscard]] inline Mat4 translation(const Vec3& v) noexcept {
    return glm::translate(Mat4(1.0f), v);
}

/// Translation * rotation
[[nodiscard]] inline Mat4 rotation_translation(const Quat& rotation, const Vec3& t) noexcept {
    Mat4 m = glm::mat4_cast(rotation);
    m[3] = Vec4(t, 1.0f);
    return m;
}

[[nodiscard]] inline Vec3 get_translation(const Mat4& m) noexcept {
    return Vec3(m[3]);
}

/// Rotation part of a rigid transform (scale is normalized away)
[[nodiscard]] inline Quat get_rotation(const Mat4& m) noexcept {
    Mat3 r(m);
    r[0] = normalize_or_zero(r[0]);
    r[1] = normalize_or_zero(r[1]);
    r[2] = normalize_or_zero(r[2]);
    return normalize_or_identity(glm::quat_cast(r));
}

[[nodiscard]] inline Vec3 transform_point(const Mat4& m, const Vec3& p) noexcept {
    return Vec3(m * Vec4(p, 1.0f));
}

[[nodiscard]] inline Vec3 transform_vector(const Mat4& m, const Vec3& v) noexcept {
    return Vec3(m * Vec4(v, 0.0f));
}

/// Normals transform by the inverse transpose
[[nodiscard]] inline Vec3 transform_normal(const Mat4& m, const Vec3& n) noexcept {
    const Mat3 normal_matrix = glm::transpose(glm::inverse(Mat3(m)));
    return normalize_or_zero(normal_matrix * n);
}

[[nodiscard]] inline Mat4 inverse(const Mat4& m) noexcept {
    return glm::inverse(m);
}

} // namespace arphys_math
