/// @file geometry.hpp
/// @brief Bounding geometry for entities and static colliders
///
/// Collision works on coarse bounding volumes: entities are treated as
/// spheres of their bounding radius, static colliders keep their exact
/// sphere/box/plane shape, and meshes are approximated by their vertex box.

#pragma once

#include "types.hpp"

#include <arphys/core/error.hpp>

#include <optional>
#include <variant>
#include <vector>

namespace arphys_physics {

// =============================================================================
// Geometry Variants
// =============================================================================

struct SphereGeometry {
    float radius = 0.5f;
};

/// Box centred on the local origin
struct BoxGeometry {
    arphys_math::Vec3 size{1.0f};   ///< Full extents
};

/// Finite plane patch. The patch centre is normal * distance in local space,
/// extent.x spans the patch's horizontal axis and extent.y its second axis.
struct PlaneGeometry {
    arphys_math::Vec3 normal = arphys_math::vec3::UP;
    float distance = 0.0f;
    arphys_math::Vec2 extent{1.0f, 1.0f};
};

/// Triangle soup. `bounds` is the local vertex box, filled by make_mesh.
struct MeshGeometry {
    std::vector<arphys_math::Vec3> vertices;
    std::vector<std::uint32_t> indices;
    arphys_math::AABB bounds;
};

using Geometry = std::variant<SphereGeometry, BoxGeometry, PlaneGeometry, MeshGeometry>;

enum class GeometryKind : std::uint8_t {
    Sphere,
    Box,
    Plane,
    Mesh,
};

[[nodiscard]] const char* to_string(GeometryKind kind);

[[nodiscard]] GeometryKind geometry_kind(const Geometry& geometry) noexcept;

// =============================================================================
// Queries (local space)
// =============================================================================

/// Radius of the sphere used for entity collision
[[nodiscard]] float bounding_radius(const Geometry& geometry) noexcept;

[[nodiscard]] arphys_math::AABB local_bounds(const Geometry& geometry) noexcept;

[[nodiscard]] float volume(const Geometry& geometry) noexcept;

[[nodiscard]] float surface_area(const Geometry& geometry) noexcept;

/// Point containment. Planes never contain points; meshes use ray parity.
[[nodiscard]] bool contains_point(const Geometry& geometry, const arphys_math::Vec3& point) noexcept;

/// Distance along `direction` to the first hit, or nullopt
[[nodiscard]] std::optional<float> raycast(const Geometry& geometry,
                                           const arphys_math::Vec3& origin,
                                           const arphys_math::Vec3& direction,
                                           float max_distance = arphys_math::consts::MAX_FLOAT) noexcept;

/// In-plane axes of a plane patch: u (horizontal where possible) and v
void plane_axes(const arphys_math::Vec3& normal, arphys_math::Vec3& u, arphys_math::Vec3& v) noexcept;

/// Rejects zero or negative extents, zero normals and malformed meshes
[[nodiscard]] arphys_core::Result<void> validate(const Geometry& geometry);

// =============================================================================
// Factories
// =============================================================================

[[nodiscard]] arphys_core::Result<Geometry> make_sphere(float radius);

[[nodiscard]] arphys_core::Result<Geometry> make_box(float width, float height, float depth);

[[nodiscard]] arphys_core::Result<Geometry> make_box(const arphys_math::Vec3& size);

/// Plane through `point` with normal `normal`
[[nodiscard]] arphys_core::Result<Geometry> make_plane(const arphys_math::Vec3& normal,
                                                       const arphys_math::Vec3& point,
                                                       const arphys_math::Vec2& extent);

/// Horizontal plane facing up at `height`
[[nodiscard]] arphys_core::Result<Geometry> make_floor_plane(float height, const arphys_math::Vec2& extent);

/// Vertical plane whose normal points into the room
[[nodiscard]] arphys_core::Result<Geometry> make_wall_plane(const arphys_math::Vec3& normal, float distance,
                                                            const arphys_math::Vec2& extent);

[[nodiscard]] arphys_core::Result<Geometry> make_mesh(std::vector<arphys_math::Vec3> vertices,
                                                      std::vector<std::uint32_t> indices);

/// Box of the handle's visual extents, used when an entity is registered
/// without explicit geometry. Flat extents are thickened to a minimum size.
[[nodiscard]] Geometry geometry_from_extents(const arphys_math::Vec3& extents);

} // namespace arphys_physics
