/// @file collision.hpp
/// @brief Broad phase, narrow phase and impulse resolution
///
/// Entities are approximated by their bounding sphere. Static colliders
/// keep their shape: planes use signed distance, boxes a closest-point
/// clamp in collider space, meshes the box of their bounds and spheres a
/// sphere-sphere test.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "entity.hpp"
#include "config.hpp"
#include "spatial_grid.hpp"
#include "batch.hpp"

#include <arphys/core/error.hpp>
#include <arphys/memory/object_pool.hpp>

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace arphys_physics {

// =============================================================================
// Narrow Phase
// =============================================================================

/// Contact when |b - a| < ra + rb + margin. The normal points from a to b,
/// the contact point lies on a's surface. Coincident centers never collide.
[[nodiscard]] std::optional<Contact> test_sphere_sphere(const arphys_math::Vec3& center_a, float radius_a,
                                                        const arphys_math::Vec3& center_b, float radius_b,
                                                        float margin) noexcept;

/// Unbounded plane; the normal is the plane normal
[[nodiscard]] std::optional<Contact> test_sphere_plane(const arphys_math::Vec3& center, float radius,
                                                       const arphys_math::Plane& plane, float margin) noexcept;

/// Oriented box given by its transform, inverse and local box. A center
/// inside the box is pushed out through the nearest face.
[[nodiscard]] std::optional<Contact> test_sphere_box(const arphys_math::Vec3& center, float radius,
                                                     const arphys_math::Mat4& transform,
                                                     const arphys_math::Mat4& inverse_transform,
                                                     const arphys_math::AABB& local_box,
                                                     float margin) noexcept;

/// Dispatch on the collider's geometry. The normal points from the surface
/// toward the entity.
[[nodiscard]] std::optional<Contact> test_entity_static(const PhysicsEntity& entity,
                                                        const StaticCollider& collider,
                                                        float margin) noexcept;

// =============================================================================
// Resolution
// =============================================================================

struct ResolutionSettings {
    float rest_velocity_threshold = 0.5f;   ///< Static contacts approaching slower than this do not bounce
    float positional_correction = 0.8f;     ///< Share of penetration removed for entity pairs
    CollisionPrecision precision = CollisionPrecision::Full;
};

/// Positional split by inverse mass, then a normal impulse. Pairs that are
/// separating or have no finite mass are left alone.
void resolve_entity_entity(PhysicsEntity& a, PhysicsEntity& b, const Contact& contact,
                           const ResolutionSettings& settings) noexcept;

/// Full push-out. An approaching entity also loses its normal speed to
/// restitution and, at full precision, tangential speed to friction.
void resolve_entity_static(PhysicsEntity& entity, const Contact& contact,
                           const ResolutionSettings& settings) noexcept;

// =============================================================================
// CollisionDetector
// =============================================================================

class CollisionDetector {
public:
    explicit CollisionDetector(const PhysicsConfig& config = PhysicsConfig{});

    CollisionDetector(const CollisionDetector&) = delete;
    CollisionDetector& operator=(const CollisionDetector&) = delete;

    /// Picks up margin, precision, grid and pool settings
    void set_config(const PhysicsConfig& config);

    // =========================================================================
    // Static Colliders
    // =========================================================================

    [[nodiscard]] arphys_core::Result<ColliderId> add_static_collider(const arphys_math::Mat4& transform,
                                                                      Geometry geometry);

    /// Move a collider, optionally replacing its geometry. Invalid
    /// replacement geometry leaves the collider unchanged.
    bool update_static_collider(ColliderId id, const arphys_math::Mat4& transform,
                                std::optional<Geometry> geometry = std::nullopt);

    bool remove_static_collider(ColliderId id);

    [[nodiscard]] const StaticCollider* static_collider(ColliderId id) const;

    [[nodiscard]] std::size_t static_collider_count() const noexcept { return m_statics.size(); }

    /// Tracked entities whose cells overlap the collider's footprint
    [[nodiscard]] std::vector<EntityId> entities_near_collider(ColliderId id) const {
        return m_grid.entities_near_static(id);
    }

    // =========================================================================
    // Entity Tracking
    // =========================================================================

    /// Refresh the entity's grid cells
    void track_entity(const PhysicsEntity& entity);

    void untrack_entity(EntityId id);

    [[nodiscard]] bool is_tracked(EntityId id) const { return m_grid.contains_entity(id); }

    // =========================================================================
    // Detection
    // =========================================================================

    /// Find and resolve this step's contacts and raise begin/end events
    /// @return Contacts found this step, valid until the next call
    const std::vector<Collision>& detect_collisions(EntityStore& entities);

    [[nodiscard]] const std::vector<Collision>& last_collisions() const noexcept { return m_collisions; }

    [[nodiscard]] const std::unordered_set<CollisionPair>& active_pairs() const noexcept { return m_active_pairs; }

    [[nodiscard]] bool is_colliding(EntityId a, EntityId b) const;

    [[nodiscard]] bool is_colliding(EntityId entity, ColliderId collider) const;

    void on_collision_begin(CollisionCallback callback) { m_on_begin = std::move(callback); }
    void on_collision_end(CollisionCallback callback) { m_on_end = std::move(callback); }

    // =========================================================================
    // Maintenance
    // =========================================================================

    /// Throttled sweep of empty grid cells
    std::size_t optimize(double now) { return m_grid.optimize(now); }

    /// Shrink the scratch pools
    std::size_t trim_pools();

    [[nodiscard]] std::size_t pooled_objects() const noexcept;

    [[nodiscard]] CollisionStats stats() const;

    [[nodiscard]] SpatialGrid& grid() noexcept { return m_grid; }
    [[nodiscard]] const SpatialGrid& grid() const noexcept { return m_grid; }

    [[nodiscard]] const BatchProcessor& batcher() const noexcept { return m_batcher; }

    void clear();

private:
    using EntityPairs = std::vector<std::pair<EntityId, EntityId>>;
    using StaticPairs = std::vector<std::pair<EntityId, ColliderId>>;

    const std::vector<ColliderId>& static_candidates(EntityId id);
    void invalidate_cache_for_cells(const std::vector<GridCell>& cells);
    void invalidate_cache_for_collider(ColliderId id);

    void gather_pairs(EntityStore& entities, EntityPairs& pairs, StaticPairs& statics);
    void narrow_phase(EntityStore& entities, EntityPairs& pairs, StaticPairs& statics);
    void resolve_all(EntityStore& entities);
    void update_pair_events(const EntityStore& entities);
    [[nodiscard]] bool is_dormant(const CollisionPair& pair, const EntityStore& entities) const;

    PhysicsConfig m_config;
    ResolutionSettings m_resolution;

    SpatialGrid m_grid;
    std::unordered_map<ColliderId, StaticCollider> m_statics;
    std::uint64_t m_next_collider_id = 1;

    // Per-entity static candidates, dropped when the entity changes cells
    // or a collider touching its cells changes
    std::unordered_map<EntityId, std::vector<ColliderId>> m_static_cache;

    arphys_memory::ObjectPool<EntityPairs> m_pair_pool;
    arphys_memory::ObjectPool<StaticPairs> m_static_pair_pool;
    BatchProcessor m_batcher;

    std::vector<Collision> m_collisions;
    std::unordered_set<CollisionPair> m_active_pairs;
    CollisionCallback m_on_begin;
    CollisionCallback m_on_end;

    CollisionStats m_stats;
    std::uint64_t m_warning_count = 0;
};

} // namespace arphys_physics
