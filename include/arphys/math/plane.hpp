#pragma once

/// @file plane.hpp
/// @brief Plane and frustum planes for arphys_math

#include "types.hpp"
#include "vec.hpp"
#include <array>
#include <cstddef>

namespace arphys_math {

// =============================================================================
// Plane
// =============================================================================

/// Plane dot(normal, p) + distance = 0
struct Plane {
    Vec3 normal = vec3::UP;   ///< Unit normal
    float distance = 0.0f;    ///< Offset term of the plane equation

    Plane() noexcept = default;

    /// @param n Normal (normalized here; a zero vector yields +Y)
    Plane(const Vec3& n, float d) noexcept : distance(d) {
        const float len = glm::length(n);
        if (len > consts::EPSILON) {
            normal = n / len;
            distance = d / len;
        }
    }

    static Plane from_point_normal(const Vec3& point, const Vec3& n) noexcept {
        Plane p(n, 0.0f);
        p.distance = -glm::dot(p.normal, point);
        return p;
    }

    /// Positive in front of the plane, negative behind
    [[nodiscard]] float signed_distance(const Vec3& point) const noexcept {
        return glm::dot(normal, point) + distance;
    }

    [[nodiscard]] Vec3 closest_point(const Vec3& point) const noexcept {
        return point - normal * signed_distance(point);
    }

    /// Point on the plane nearest the origin
    [[nodiscard]] Vec3 origin_point() const noexcept {
        return -normal * distance;
    }
};

// =============================================================================
// Frustum
// =============================================================================

enum class FrustumTestResult {
    Inside,
    Outside,
    Intersecting
};

/// Six planes facing inward: left, right, bottom, top, near, far
struct FrustumPlanes {
    static constexpr std::size_t LEFT   = 0;
    static constexpr std::size_t RIGHT  = 1;
    static constexpr std::size_t BOTTOM = 2;
    static constexpr std::size_t TOP    = 3;
    static constexpr std::size_t Z_NEAR = 4;
    static constexpr std::size_t Z_FAR  = 5;

    std::array<Plane, 6> planes;

    /// Gribb/Hartmann extraction from a column-major view-projection,
    /// OpenGL clip depth [-1, 1]
    static FrustumPlanes from_view_projection(const Mat4& vp) noexcept {
        auto row = [&vp](int r) {
            return Vec4(vp[0][r], vp[1][r], vp[2][r], vp[3][r]);
        };
        const Vec4 r0 = row(0), r1 = row(1), r2 = row(2), r3 = row(3);
        const std::array<Vec4, 6> eqs = {r3 + r0, r3 - r0, r3 + r1, r3 - r1, r3 + r2, r3 - r2};

        FrustumPlanes f;
        for (std::size_t i = 0; i < eqs.size(); ++i) {
            f.planes[i] = Plane(Vec3(eqs[i]), eqs[i].w);
        }
        return f;
    }

    [[nodiscard]] FrustumTestResult test_sphere(const Vec3& center, float radius) const noexcept {
        FrustumTestResult result = FrustumTestResult::Inside;
        for (const auto& plane : planes) {
            const float d = plane.signed_distance(center);
            if (d < -radius) {
                return FrustumTestResult::Outside;
            }
            if (d < radius) {
                result = FrustumTestResult::Intersecting;
            }
        }
        return result;
    }
};

} // namespace arphys_math
