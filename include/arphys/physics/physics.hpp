/// @file physics.hpp
/// @brief Main include header for arphys_physics
///
/// arphys_physics simulates furniture placed in a scanned room:
/// - Rigid bodies approximated by bounding spheres
/// - Uniform-grid broad phase with cached static candidates
/// - Contacts against scanned planes, boxes and meshes
/// - Snapping to floors, walls, corners and edges
/// - Frame budget tracking with LOD, culling and emergency degradation
///
/// ## Quick Start
///
/// ### Creating the System
/// ```cpp
/// #include <arphys/physics/physics.hpp>
///
/// arphys_physics::PhysicsSystem physics(arphys_physics::PhysicsConfig::defaults());
/// ```
///
/// ### Feeding Scanned Surfaces
/// ```cpp
/// auto floor = arphys_physics::make_floor_plane(0.0f, {4.0f, 4.0f});
/// physics.surfaces().enqueue(
///     arphys_physics::SurfaceEvent::added("floor-anchor", arphys_math::Mat4(1.0f), floor.value()));
/// ```
///
/// ### Adding Furniture
/// ```cpp
/// auto desc = arphys_physics::EntityDesc::from_handle(chair_node, 8.0f);
/// desc.position = {0.0f, 0.5f, 0.0f};
///
/// if (auto id = physics.add_entity(desc); id.is_ok()) {
///     physics.snap_to_surface(id.value(), arphys_physics::SnapType::Floor);
/// }
/// ```
///
/// ### Per Frame
/// ```cpp
/// physics.set_viewer(camera_position, camera_view_projection);
/// physics.update(frame_dt);
/// ```
///
/// ### Collision Callbacks
/// ```cpp
/// physics.world().on_collision_begin([](const arphys_physics::CollisionPair& pair) {
///     play_bump_sound(pair);
/// });
/// ```

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "geometry.hpp"
#include "entity.hpp"
#include "config.hpp"
#include "spatial_grid.hpp"
#include "collision.hpp"
#include "integrator.hpp"
#include "world.hpp"
#include "snap.hpp"
#include "performance.hpp"
#include "surface_feed.hpp"
#include "system.hpp"

namespace arphys_physics {

/// Prelude - commonly used types
namespace prelude {
    using arphys_physics::PhysicsSystem;
    using arphys_physics::PhysicsWorld;
    using arphys_physics::PhysicsConfig;
    using arphys_physics::PhysicsStats;
    using arphys_physics::QualityTier;

    using arphys_physics::PhysicsEntity;
    using arphys_physics::EntityDesc;
    using arphys_physics::EntityId;
    using arphys_physics::IEntityHandle;
    using arphys_physics::Material;

    using arphys_physics::Geometry;
    using arphys_physics::SphereGeometry;
    using arphys_physics::BoxGeometry;
    using arphys_physics::PlaneGeometry;
    using arphys_physics::MeshGeometry;

    using arphys_physics::StaticCollider;
    using arphys_physics::ColliderId;
    using arphys_physics::CollisionPair;
    using arphys_physics::CollisionGroup;

    using arphys_physics::SnapSystem;
    using arphys_physics::SnapType;
    using arphys_physics::SnapTargetType;
    using arphys_physics::SnapTargetDesc;
    using arphys_physics::SnapResult;

    using arphys_physics::SurfaceEvent;
    using arphys_physics::FrameDirective;
} // namespace prelude

} // namespace arphys_physics
