/// @file snap.hpp
/// @brief Assisted alignment of entities to floors, walls, corners and edges

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "entity.hpp"
#include "config.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>

namespace arphys_physics {

// =============================================================================
// Snap Data
// =============================================================================

/// Outcome of a snap request
struct SnapResult {
    bool snapped = false;
    SnapTargetType target_type = SnapTargetType::Floor;
    arphys_math::Vec3 snap_point{0.0f};
    SnapTargetId target;
};

/// Per-entity snap state. `is_snapped` turns true once the interpolation
/// has finished and stays true until the snap breaks.
struct SnapState {
    bool is_snapped = false;
    SnapTargetId target;
    SnapTargetType target_type = SnapTargetType::Floor;
    arphys_math::Vec3 snap_point{0.0f};
    double snap_time = 0.0;         ///< Simulation time the snap completed
};

/// Eased move from the entity's position to its snap point
struct SnapOperation {
    EntityId entity;
    SnapTargetId target;
    arphys_math::Vec3 start_position{0.0f};
    arphys_math::Vec3 target_position{0.0f};
    arphys_math::Quat start_orientation = arphys_math::quat::IDENTITY;
    arphys_math::Quat target_orientation = arphys_math::quat::IDENTITY;
    float elapsed = 0.0f;
    float duration = 0.3f;

    [[nodiscard]] float progress() const noexcept {
        return duration > 0.0f ? std::min(elapsed / duration, 1.0f) : 1.0f;
    }

    // Summed frame deltas land a hair short of the duration
    [[nodiscard]] bool is_complete() const noexcept { return elapsed + 1e-4f >= duration; }
};

/// A target scored against one entity
struct SnapCandidate {
    SnapTargetId target;
    SnapTargetType type = SnapTargetType::Floor;
    arphys_math::Vec3 point{0.0f};
    float distance = 0.0f;
    float alignment = 0.0f;         ///< [0, 1], 1 when the relevant axis matches the target normal
    float score = 0.0f;             ///< Lower is better
};

/// Snap point, distance and alignment of `target` for `entity`.
/// Bounded targets reject points outside their bounds grown by the radius.
[[nodiscard]] std::optional<SnapCandidate> evaluate_snap_target(const PhysicsEntity& entity,
                                                                const SnapTarget& target);

/// Whether `type` requests targets of kind `target`
[[nodiscard]] bool snap_type_accepts(SnapType type, SnapTargetType target) noexcept;

/// Orientation an entity takes when snapped to `target`
[[nodiscard]] arphys_math::Quat snap_orientation(const SnapTarget& target,
                                                 const arphys_math::Quat& current) noexcept;

// =============================================================================
// SnapSystem
// =============================================================================

/// Drives every registered entity through
/// unsnapped -> snapping -> snapped (maintained) -> unsnapped.
///
/// Time advances with the simulation delta handed to update(), so an
/// interpolation takes `snap_duration` seconds of simulated time.
class SnapSystem {
public:
    explicit SnapSystem(const PhysicsConfig& config = PhysicsConfig{});

    void set_config(const PhysicsConfig& config) { m_config = config; }

    // =========================================================================
    // Targets
    // =========================================================================

    SnapTargetId add_snap_target(const SnapTargetDesc& desc);

    /// Move a target, optionally replacing its local bounds
    bool update_snap_target(SnapTargetId id, const arphys_math::Mat4& transform,
                            std::optional<arphys_math::AABB> bounds = std::nullopt);

    /// Snaps and interpolations toward the target break on the next update
    bool remove_snap_target(SnapTargetId id);

    [[nodiscard]] const SnapTarget* snap_target(SnapTargetId id) const;

    [[nodiscard]] std::size_t snap_target_count() const noexcept { return m_targets.size(); }

    // =========================================================================
    // Entities
    // =========================================================================

    void register_entity(EntityId id);

    /// Drops the entity's state and any interpolation in flight
    bool unregister_entity(EntityId id);

    [[nodiscard]] bool is_registered(EntityId id) const { return m_registered.count(id) > 0; }

    /// Find the best target within the search radius and start moving
    /// the entity onto it
    SnapResult snap_to_surface(PhysicsWorld& world, EntityId id, SnapType type);

    /// Release a held or in-progress snap
    bool unsnap(EntityId id);

    /// Lowest-scoring candidate within `max_distance`
    [[nodiscard]] std::optional<SnapCandidate> find_best_target(const PhysicsEntity& entity,
                                                                SnapType type,
                                                                float max_distance) const;

    /// Advance interpolations, hold snapped entities and try automatic snaps
    void update(PhysicsWorld& world, float dt);

    [[nodiscard]] const SnapState* state(EntityId id) const;

    [[nodiscard]] bool is_snapped(EntityId id) const;

    [[nodiscard]] bool is_snapping(EntityId id) const { return m_operations.count(id) > 0; }

    [[nodiscard]] const SnapOperation* operation(EntityId id) const;

    [[nodiscard]] SnapStats stats() const;

    void clear();

private:
    [[nodiscard]] bool target_enabled(SnapTargetType type) const noexcept;
    void begin_snap(PhysicsWorld& world, PhysicsEntity& entity, const SnapCandidate& candidate);
    void advance_operations(PhysicsWorld& world, float dt);
    void maintain_snaps(PhysicsWorld& world);
    void try_auto_snap(PhysicsWorld& world);
    void break_snap(EntityId id, const char* reason);

    PhysicsConfig m_config;

    std::map<SnapTargetId, SnapTarget> m_targets;
    std::uint64_t m_next_target_id = 1;

    std::set<EntityId> m_registered;
    std::unordered_map<EntityId, SnapState> m_states;
    std::map<EntityId, SnapOperation> m_operations;

    double m_time = 0.0;
    SnapStats m_stats;
};

} // namespace arphys_physics
