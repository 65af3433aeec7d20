#pragma once

/// @file bounds.hpp
/// @brief Axis-aligned boxes and bounding spheres

#include "types.hpp"
#include "vec.hpp"
#include "mat.hpp"
#include <array>
#include <optional>
#include <span>

namespace arphys_math {

// =============================================================================
// AABB
// =============================================================================

/// Axis-aligned box. Default constructed boxes are empty (min > max) so that
/// expanding one by a point yields the degenerate box at that point.
struct AABB {
    Vec3 min = Vec3(consts::MAX_FLOAT);
    Vec3 max = Vec3(-consts::MAX_FLOAT);

    AABB() noexcept = default;
    AABB(const Vec3& min_point, const Vec3& max_point) noexcept
        : min(min_point), max(max_point) {}

    static AABB from_center_half_extents(const Vec3& center, const Vec3& half_extents) noexcept {
        return AABB(center - half_extents, center + half_extents);
    }

    static AABB from_points(std::span<const Vec3> points) noexcept {
        AABB result;
        for (const auto& p : points) {
            result.expand_to_include(p);
        }
        return result;
    }

    [[nodiscard]] Vec3 center() const noexcept { return (min + max) * 0.5f; }
    [[nodiscard]] Vec3 half_extents() const noexcept { return (max - min) * 0.5f; }
    [[nodiscard]] Vec3 size() const noexcept { return max - min; }

    [[nodiscard]] float volume() const noexcept {
        if (is_empty()) return 0.0f;
        const Vec3 s = size();
        return s.x * s.y * s.z;
    }

    [[nodiscard]] bool is_empty() const noexcept {
        return min.x > max.x || min.y > max.y || min.z > max.z;
    }

    void expand_to_include(const Vec3& point) noexcept {
        min = arphys_math::min(min, point);
        max = arphys_math::max(max, point);
    }

    void expand_to_include(const AABB& other) noexcept {
        min = arphys_math::min(min, other.min);
        max = arphys_math::max(max, other.max);
    }

    [[nodiscard]] AABB union_with(const AABB& other) const noexcept {
        AABB result = *this;
        result.expand_to_include(other);
        return result;
    }

    /// Overlap region, or nullopt when the boxes are disjoint
    [[nodiscard]] std::optional<AABB> intersection(const AABB& other) const noexcept {
        AABB result(arphys_math::max(min, other.min), arphys_math::min(max, other.max));
        if (result.is_empty()) {
            return std::nullopt;
        }
        return result;
    }

    [[nodiscard]] AABB expanded(float amount) const noexcept {
        return AABB(min - Vec3(amount), max + Vec3(amount));
    }

    [[nodiscard]] bool contains_point(const Vec3& p) const noexcept {
        return p.x >= min.x && p.x <= max.x &&
               p.y >= min.y && p.y <= max.y &&
               p.z >= min.z && p.z <= max.z;
    }

    [[nodiscard]] bool intersects(const AABB& other) const noexcept {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y &&
               min.z <= other.max.z && max.z >= other.min.z;
    }

    [[nodiscard]] Vec3 closest_point(const Vec3& p) const noexcept {
        return glm::clamp(p, min, max);
    }

    [[nodiscard]] float distance_squared_to_point(const Vec3& p) const noexcept {
        return glm::length2(p - closest_point(p));
    }

    [[nodiscard]] std::array<Vec3, 8> corners() const noexcept {
        return {{
            Vec3(min.x, min.y, min.z), Vec3(max.x, min.y, min.z),
            Vec3(min.x, max.y, min.z), Vec3(max.x, max.y, min.z),
            Vec3(min.x, min.y, max.z), Vec3(max.x, min.y, max.z),
            Vec3(min.x, max.y, max.z), Vec3(max.x, max.y, max.z)
        }};
    }

    /// World-space box enclosing this box after `m`
    [[nodiscard]] AABB transform(const Mat4& m) const noexcept {
        if (is_empty()) return *this;
        AABB result;
        for (const auto& c : corners()) {
            result.expand_to_include(transform_point(m, c));
        }
        return result;
    }

    bool operator==(const AABB& other) const noexcept {
        return min == other.min && max == other.max;
    }
};

// =============================================================================
// Sphere
// =============================================================================

struct Sphere {
    Vec3 center = vec3::ZERO;
    float radius = 0.0f;

    Sphere() noexcept = default;
    Sphere(const Vec3& c, float r) noexcept : center(c), radius(r) {}

    static Sphere from_aabb(const AABB& aabb) noexcept {
        return Sphere(aabb.center(), glm::length(aabb.half_extents()));
    }

    [[nodiscard]] bool contains_point(const Vec3& p) const noexcept {
        return glm::length2(p - center) <= radius * radius;
    }

    [[nodiscard]] bool intersects_sphere(const Sphere& other) const noexcept {
        const float r = radius + other.radius;
        return glm::length2(other.center - center) <= r * r;
    }

    [[nodiscard]] bool intersects_aabb(const AABB& aabb) const noexcept {
        return aabb.distance_squared_to_point(center) <= radius * radius;
    }

    [[nodiscard]] AABB to_aabb() const noexcept {
        return AABB(center - Vec3(radius), center + Vec3(radius));
    }
};

} // namespace arphys_math
