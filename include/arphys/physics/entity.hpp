/// @file entity.hpp
/// @brief Simulated entities, static colliders and snap targets

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "geometry.hpp"

#include <arphys/math/plane.hpp>

#include <memory>
#include <optional>
#include <string>

namespace arphys_physics {

// =============================================================================
// PhysicsEntity
// =============================================================================

/// Rigid body state owned by the world. Collision treats every entity as a
/// sphere of `bounding_radius` around `position`.
struct PhysicsEntity {
    EntityId id;

    arphys_math::Vec3 position{0.0f};
    arphys_math::Quat orientation = arphys_math::quat::IDENTITY;
    arphys_math::Vec3 linear_velocity{0.0f};
    arphys_math::Vec3 angular_velocity{0.0f};

    // Accumulated since the last integration, cleared by the integrator
    arphys_math::Vec3 force{0.0f};
    arphys_math::Vec3 torque{0.0f};

    float mass = 1.0f;
    float moment_of_inertia = 0.4f;     ///< 0.4 * mass (solid sphere factor)
    Material material;
    Geometry geometry = SphereGeometry{};
    float bounding_radius = 0.5f;
    CollisionGroup collision_group = groups::Furniture;

    bool is_kinematic = false;
    bool is_active = true;              ///< Enabled and awake
    bool is_physics_enabled = true;
    bool is_sleeping = false;
    bool can_snap = true;
    bool casts_shadows = true;
    float sleep_timer = 0.0f;           ///< Seconds spent below the sleep threshold

    std::shared_ptr<IEntityHandle> handle;

    /// Zero for kinematic bodies
    [[nodiscard]] float inverse_mass() const noexcept {
        return (is_kinematic || mass <= 0.0f) ? 0.0f : 1.0f / mass;
    }

    [[nodiscard]] float inverse_inertia() const noexcept {
        return (is_kinematic || moment_of_inertia <= 0.0f) ? 0.0f : 1.0f / moment_of_inertia;
    }

    [[nodiscard]] float linear_speed() const noexcept {
        return arphys_math::length(linear_velocity);
    }

    [[nodiscard]] float angular_speed() const noexcept {
        return arphys_math::length(angular_velocity);
    }

    [[nodiscard]] arphys_math::Mat4 transform() const noexcept {
        return arphys_math::rotation_translation(orientation, position);
    }

    /// Cube around the bounding sphere, grown by `margin`
    [[nodiscard]] arphys_math::AABB world_bounds(float margin = 0.0f) const noexcept {
        const float r = bounding_radius + margin;
        return arphys_math::AABB(position - arphys_math::Vec3(r), position + arphys_math::Vec3(r));
    }

    [[nodiscard]] static float inertia_for_mass(float mass) noexcept { return 0.4f * mass; }
};

/// World-owned entity storage
using EntityStore = arphys_structures::SlotMap<PhysicsEntity>;

/// "index v generation", for log lines
[[nodiscard]] std::string entity_label(EntityId id);

/// Registration parameters for PhysicsWorld::add_entity
struct EntityDesc {
    arphys_math::Vec3 position{0.0f};
    arphys_math::Quat orientation = arphys_math::quat::IDENTITY;
    arphys_math::Vec3 linear_velocity{0.0f};
    arphys_math::Vec3 angular_velocity{0.0f};

    float mass = 1.0f;
    std::optional<Geometry> geometry;       ///< Derived from the handle's extents when absent
    std::optional<float> friction;          ///< Config default when absent
    std::optional<float> restitution;       ///< Config default when absent
    float density = 1.0f;
    CollisionGroup collision_group = groups::Furniture;

    bool is_kinematic = false;
    bool can_snap = true;
    bool casts_shadows = true;

    std::shared_ptr<IEntityHandle> handle;

    [[nodiscard]] static EntityDesc make_dynamic(const arphys_math::Vec3& pos, float mass, Geometry geometry);

    [[nodiscard]] static EntityDesc make_kinematic(const arphys_math::Vec3& pos, Geometry geometry);

    /// Geometry comes from the handle
    [[nodiscard]] static EntityDesc from_handle(std::shared_ptr<IEntityHandle> handle, float mass);
};

// =============================================================================
// StaticCollider
// =============================================================================

/// Scanned room surface. The transform only changes through
/// CollisionDetector::update_static_collider.
struct StaticCollider {
    ColliderId id;
    arphys_math::Mat4 transform{1.0f};
    Geometry geometry = PlaneGeometry{};

    // Derived by refresh()
    arphys_math::Mat4 inverse_transform{1.0f};
    arphys_math::AABB world_bounds;

    /// Recompute the derived fields after the transform or geometry changed
    void refresh() noexcept;

    /// World-space plane of a plane collider (the patch extent is ignored)
    [[nodiscard]] arphys_math::Plane world_plane() const noexcept;
};

// =============================================================================
// SnapTarget
// =============================================================================

struct SnapTargetDesc {
    arphys_math::Mat4 transform{1.0f};
    SnapTargetType type = SnapTargetType::Floor;
    arphys_math::Vec3 normal = arphys_math::vec3::UP;   ///< Local; for edges the segment vector
    arphys_math::AABB bounds;                           ///< Local extent, empty for unbounded
};

/// Reference the snap system aligns entities against. Targets are independent
/// of static colliders, although the surface feed usually creates both.
struct SnapTarget {
    SnapTargetId id;
    arphys_math::Mat4 transform{1.0f};
    SnapTargetType type = SnapTargetType::Floor;
    arphys_math::Vec3 normal = arphys_math::vec3::UP;
    arphys_math::AABB bounds;

    [[nodiscard]] arphys_math::Vec3 position() const noexcept {
        return arphys_math::get_translation(transform);
    }

    /// Unit world normal
    [[nodiscard]] arphys_math::Vec3 world_normal() const noexcept {
        return arphys_math::transform_normal(transform, normal);
    }

    /// World edge segment vector, length preserved
    [[nodiscard]] arphys_math::Vec3 world_edge() const noexcept {
        return arphys_math::transform_vector(transform, normal);
    }

    [[nodiscard]] arphys_math::AABB world_bounds() const noexcept {
        return bounds.transform(transform);
    }

    [[nodiscard]] bool is_bounded() const noexcept { return !bounds.is_empty(); }
};

} // namespace arphys_physics
