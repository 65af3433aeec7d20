/// @file geometry.cpp
/// @brief Bounding geometry queries and factories

#include <arphys/physics/geometry.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace arphys_physics {

using arphys_core::Err;
using arphys_core::Error;
using arphys_core::Ok;
using arphys_core::PhysicsError;
using arphys_core::Result;
using arphys_math::AABB;
using arphys_math::Vec2;
using arphys_math::Vec3;
namespace consts = arphys_math::consts;

namespace {

/// Variant visitor built from lambdas
template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr float k_min_extent = 0.01f;

Vec3 plane_center(const PlaneGeometry& plane) noexcept {
    return arphys_math::normalize_or_zero(plane.normal) * plane.distance;
}

AABB mesh_bounds(const MeshGeometry& mesh) noexcept {
    if (!mesh.bounds.is_empty() || mesh.vertices.empty()) {
        return mesh.bounds;
    }
    return AABB::from_points(mesh.vertices);
}

/// Moller-Trumbore; returns t along `dir` or nullopt
std::optional<float> ray_triangle(const Vec3& origin, const Vec3& dir,
                                  const Vec3& v0, const Vec3& v1, const Vec3& v2) noexcept {
    const Vec3 e1 = v1 - v0;
    const Vec3 e2 = v2 - v0;
    const Vec3 p = glm::cross(dir, e2);
    const float det = glm::dot(e1, p);
    if (std::abs(det) < consts::EPSILON) {
        return std::nullopt;
    }

    const float inv_det = 1.0f / det;
    const Vec3 s = origin - v0;
    const float u = glm::dot(s, p) * inv_det;
    if (u < 0.0f || u > 1.0f) {
        return std::nullopt;
    }

    const Vec3 q = glm::cross(s, e1);
    const float v = glm::dot(dir, q) * inv_det;
    if (v < 0.0f || u + v > 1.0f) {
        return std::nullopt;
    }

    const float t = glm::dot(e2, q) * inv_det;
    if (t < consts::EPSILON) {
        return std::nullopt;
    }
    return t;
}

template<typename F>
void for_each_triangle(const MeshGeometry& mesh, F&& func) {
    const std::size_t count = mesh.indices.size() / 3;
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint32_t a = mesh.indices[i * 3];
        const std::uint32_t b = mesh.indices[i * 3 + 1];
        const std::uint32_t c = mesh.indices[i * 3 + 2];
        if (a >= mesh.vertices.size() || b >= mesh.vertices.size() || c >= mesh.vertices.size()) {
            continue;
        }
        func(mesh.vertices[a], mesh.vertices[b], mesh.vertices[c]);
    }
}

std::optional<float> raycast_box(const Vec3& half, const Vec3& origin, const Vec3& dir, float max_distance) noexcept {
    float t_min = 0.0f;
    float t_max = max_distance;
    for (int axis = 0; axis < 3; ++axis) {
        if (std::abs(dir[axis]) < consts::EPSILON) {
            if (origin[axis] < -half[axis] || origin[axis] > half[axis]) {
                return std::nullopt;
            }
            continue;
        }
        const float inv = 1.0f / dir[axis];
        float t1 = (-half[axis] - origin[axis]) * inv;
        float t2 = (half[axis] - origin[axis]) * inv;
        if (t1 > t2) std::swap(t1, t2);
        t_min = std::max(t_min, t1);
        t_max = std::min(t_max, t2);
        if (t_min > t_max) {
            return std::nullopt;
        }
    }
    return t_min;
}

Result<Geometry> validated(Geometry geometry) {
    auto check = validate(geometry);
    if (check.is_err()) {
        return Err<Geometry>(check.error());
    }
    return geometry;
}

} // anonymous namespace

// =============================================================================
// Kind
// =============================================================================

const char* to_string(GeometryKind kind) {
    switch (kind) {
        case GeometryKind::Sphere: return "Sphere";
        case GeometryKind::Box: return "Box";
        case GeometryKind::Plane: return "Plane";
        case GeometryKind::Mesh: return "Mesh";
    }
    return "Unknown";
}

GeometryKind geometry_kind(const Geometry& geometry) noexcept {
    return std::visit(Overloaded{
        [](const SphereGeometry&) { return GeometryKind::Sphere; },
        [](const BoxGeometry&) { return GeometryKind::Box; },
        [](const PlaneGeometry&) { return GeometryKind::Plane; },
        [](const MeshGeometry&) { return GeometryKind::Mesh; },
    }, geometry);
}

// =============================================================================
// Queries
// =============================================================================

void plane_axes(const Vec3& normal, Vec3& u, Vec3& v) noexcept {
    const Vec3 n = arphys_math::normalize_or_zero(normal);
    if (std::abs(n.y) > 0.99f || arphys_math::length_squared(n) == 0.0f) {
        // Horizontal patch: keep u on world X
        u = arphys_math::vec3::X;
        v = arphys_math::normalize_or_zero(glm::cross(u, n));
        if (arphys_math::length_squared(v) == 0.0f) {
            v = arphys_math::vec3::Z;
        }
        return;
    }
    u = arphys_math::normalize_or_zero(glm::cross(arphys_math::vec3::UP, n));
    v = glm::cross(n, u);
}

AABB local_bounds(const Geometry& geometry) noexcept {
    return std::visit(Overloaded{
        [](const SphereGeometry& s) {
            return AABB(Vec3(-s.radius), Vec3(s.radius));
        },
        [](const BoxGeometry& b) {
            return AABB::from_center_half_extents(arphys_math::vec3::ZERO, b.size * 0.5f);
        },
        [](const PlaneGeometry& p) {
            Vec3 u, v;
            plane_axes(p.normal, u, v);
            const Vec3 c = plane_center(p);
            const Vec3 du = u * (p.extent.x * 0.5f);
            const Vec3 dv = v * (p.extent.y * 0.5f);
            AABB box;
            box.expand_to_include(c + du + dv);
            box.expand_to_include(c + du - dv);
            box.expand_to_include(c - du + dv);
            box.expand_to_include(c - du - dv);
            return box;
        },
        [](const MeshGeometry& m) {
            return mesh_bounds(m);
        },
    }, geometry);
}

float bounding_radius(const Geometry& geometry) noexcept {
    return std::visit(Overloaded{
        [](const SphereGeometry& s) { return s.radius; },
        [](const BoxGeometry& b) { return glm::length(b.size) * 0.5f; },
        [&geometry](const PlaneGeometry&) { return glm::length(local_bounds(geometry).size()) * 0.5f; },
        [](const MeshGeometry& m) {
            const AABB box = mesh_bounds(m);
            return box.is_empty() ? 0.0f : glm::length(box.size()) * 0.5f;
        },
    }, geometry);
}

float volume(const Geometry& geometry) noexcept {
    return std::visit(Overloaded{
        [](const SphereGeometry& s) {
            return (4.0f / 3.0f) * consts::PI * s.radius * s.radius * s.radius;
        },
        [](const BoxGeometry& b) { return b.size.x * b.size.y * b.size.z; },
        [](const PlaneGeometry&) { return 0.0f; },
        [](const MeshGeometry& m) {
            // Sum of signed tetrahedra against the origin
            float total = 0.0f;
            for_each_triangle(m, [&total](const Vec3& a, const Vec3& b, const Vec3& c) {
                total += glm::dot(a, glm::cross(b, c)) / 6.0f;
            });
            return std::abs(total);
        },
    }, geometry);
}

float surface_area(const Geometry& geometry) noexcept {
    return std::visit(Overloaded{
        [](const SphereGeometry& s) { return 4.0f * consts::PI * s.radius * s.radius; },
        [](const BoxGeometry& b) {
            return 2.0f * (b.size.x * b.size.y + b.size.y * b.size.z + b.size.z * b.size.x);
        },
        [](const PlaneGeometry& p) { return p.extent.x * p.extent.y; },
        [](const MeshGeometry& m) {
            float total = 0.0f;
            for_each_triangle(m, [&total](const Vec3& a, const Vec3& b, const Vec3& c) {
                total += glm::length(glm::cross(b - a, c - a)) * 0.5f;
            });
            return total;
        },
    }, geometry);
}

std::optional<float> raycast(const Geometry& geometry, const Vec3& origin,
                             const Vec3& direction, float max_distance) noexcept {
    const Vec3 dir = arphys_math::normalize_or_zero(direction);
    if (arphys_math::length_squared(dir) == 0.0f) {
        return std::nullopt;
    }

    std::optional<float> hit = std::visit(Overloaded{
        [&](const SphereGeometry& s) -> std::optional<float> {
            const float b = glm::dot(origin, dir);
            const float c = glm::dot(origin, origin) - s.radius * s.radius;
            const float disc = b * b - c;
            if (disc < 0.0f) return std::nullopt;
            const float root = std::sqrt(disc);
            const float t0 = -b - root;
            const float t1 = -b + root;
            if (t1 < 0.0f) return std::nullopt;
            return t0 >= 0.0f ? t0 : 0.0f;
        },
        [&](const BoxGeometry& b) -> std::optional<float> {
            return raycast_box(b.size * 0.5f, origin, dir, max_distance);
        },
        [&](const PlaneGeometry& p) -> std::optional<float> {
            const Vec3 n = arphys_math::normalize_or_zero(p.normal);
            const float denom = glm::dot(n, dir);
            if (std::abs(denom) < consts::EPSILON) return std::nullopt;
            const Vec3 c = plane_center(p);
            const float t = glm::dot(n, c - origin) / denom;
            if (t < 0.0f) return std::nullopt;
            Vec3 u, v;
            plane_axes(p.normal, u, v);
            const Vec3 local = origin + dir * t - c;
            if (std::abs(glm::dot(local, u)) > p.extent.x * 0.5f ||
                std::abs(glm::dot(local, v)) > p.extent.y * 0.5f) {
                return std::nullopt;
            }
            return t;
        },
        [&](const MeshGeometry& m) -> std::optional<float> {
            std::optional<float> nearest;
            for_each_triangle(m, [&](const Vec3& a, const Vec3& b, const Vec3& c) {
                auto t = ray_triangle(origin, dir, a, b, c);
                if (t && (!nearest || *t < *nearest)) nearest = t;
            });
            return nearest;
        },
    }, geometry);

    if (hit && *hit > max_distance) {
        return std::nullopt;
    }
    return hit;
}

bool contains_point(const Geometry& geometry, const Vec3& point) noexcept {
    return std::visit(Overloaded{
        [&](const SphereGeometry& s) {
            return arphys_math::length_squared(point) <= s.radius * s.radius;
        },
        [&](const BoxGeometry& b) {
            const Vec3 half = b.size * 0.5f;
            return std::abs(point.x) <= half.x && std::abs(point.y) <= half.y && std::abs(point.z) <= half.z;
        },
        [](const PlaneGeometry&) { return false; },
        [&](const MeshGeometry& m) {
            if (!mesh_bounds(m).contains_point(point)) return false;
            // Odd number of crossings along a skewed ray means inside
            const Vec3 dir = glm::normalize(Vec3(1.0f, 0.0137f, 0.0071f));
            std::size_t crossings = 0;
            for_each_triangle(m, [&](const Vec3& a, const Vec3& b, const Vec3& c) {
                if (ray_triangle(point, dir, a, b, c)) ++crossings;
            });
            return (crossings % 2) == 1;
        },
    }, geometry);
}

// =============================================================================
// Validation
// =============================================================================

Result<void> validate(const Geometry& geometry) {
    auto invalid = [](const std::string& reason) {
        return Err(PhysicsError::invalid_geometry(reason));
    };

    return std::visit(Overloaded{
        [&](const SphereGeometry& s) -> Result<void> {
            if (!(s.radius > 0.0f) || !std::isfinite(s.radius)) {
                return invalid("sphere radius must be positive, got " + std::to_string(s.radius));
            }
            return Ok();
        },
        [&](const BoxGeometry& b) -> Result<void> {
            if (!(arphys_math::min_component(b.size) > 0.0f) || !arphys_math::is_finite(b.size)) {
                return invalid("box size must be positive on every axis");
            }
            return Ok();
        },
        [&](const PlaneGeometry& p) -> Result<void> {
            if (!arphys_math::is_finite(p.normal) || !std::isfinite(p.distance)) {
                return invalid("plane normal and distance must be finite");
            }
            if (arphys_math::length_squared(p.normal) < consts::EPSILON) {
                return invalid("plane normal must be non-zero");
            }
            if (!(p.extent.x > 0.0f) || !(p.extent.y > 0.0f) ||
                !std::isfinite(p.extent.x) || !std::isfinite(p.extent.y)) {
                return invalid("plane extent must be positive and finite");
            }
            return Ok();
        },
        [&](const MeshGeometry& m) -> Result<void> {
            if (m.vertices.empty()) {
                return invalid("mesh has no vertices");
            }
            if (m.indices.empty() || m.indices.size() % 3 != 0) {
                return invalid("mesh index count must be a non-zero multiple of 3");
            }
            for (const Vec3& v : m.vertices) {
                if (!arphys_math::is_finite(v)) {
                    return invalid("mesh vertices must be finite");
                }
            }
            for (std::uint32_t index : m.indices) {
                if (index >= m.vertices.size()) {
                    return invalid("mesh index " + std::to_string(index) + " out of range");
                }
            }
            return Ok();
        },
    }, geometry);
}

// =============================================================================
// Factories
// =============================================================================

Result<Geometry> make_sphere(float radius) {
    return validated(SphereGeometry{radius});
}

Result<Geometry> make_box(float width, float height, float depth) {
    return make_box(Vec3(width, height, depth));
}

Result<Geometry> make_box(const Vec3& size) {
    return validated(BoxGeometry{size});
}

Result<Geometry> make_plane(const Vec3& normal, const Vec3& point, const Vec2& extent) {
    const Vec3 n = arphys_math::normalize_or_zero(normal);
    return validated(PlaneGeometry{n, glm::dot(n, point), extent});
}

Result<Geometry> make_floor_plane(float height, const Vec2& extent) {
    return validated(PlaneGeometry{arphys_math::vec3::UP, height, extent});
}

Result<Geometry> make_wall_plane(const Vec3& normal, float distance, const Vec2& extent) {
    return validated(PlaneGeometry{arphys_math::normalize_or_zero(normal), distance, extent});
}

Result<Geometry> make_mesh(std::vector<Vec3> vertices, std::vector<std::uint32_t> indices) {
    MeshGeometry mesh;
    mesh.bounds = AABB::from_points(vertices);
    mesh.vertices = std::move(vertices);
    mesh.indices = std::move(indices);
    return validated(std::move(mesh));
}

Geometry geometry_from_extents(const Vec3& extents) {
    Vec3 size = arphys_math::is_finite(extents) ? glm::abs(extents) : Vec3(0.1f);
    size = glm::max(size, Vec3(k_min_extent));
    return BoxGeometry{size};
}

} // namespace arphys_physics
