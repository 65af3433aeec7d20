/// @file world.hpp
/// @brief Entity registry and the per-frame simulation step

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "entity.hpp"
#include "config.hpp"
#include "collision.hpp"
#include "integrator.hpp"

#include <arphys/core/error.hpp>
#include <arphys/structures/command_queue.hpp>

#include <functional>
#include <optional>
#include <set>
#include <vector>

namespace arphys_physics {

// =============================================================================
// PhysicsWorld
// =============================================================================

/// Owns every simulated entity and runs the step:
/// deferred commands, gravity, integration, damping, collision, sleep,
/// handle write-back.
///
/// The world is single threaded. Other threads hand work to it through
/// defer(), which is drained at the start of the next step.
class PhysicsWorld {
public:
    using Command = std::function<void(PhysicsWorld&)>;

    explicit PhysicsWorld(PhysicsConfig config = PhysicsConfig{});

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    // =========================================================================
    // Simulation
    // =========================================================================

    /// Advance by `dt` seconds. A non-positive `dt` only drains commands.
    void step(float dt);

    /// Queue `command` for the start of the next step (thread-safe)
    void defer(Command command);

    [[nodiscard]] std::size_t pending_commands() const { return m_commands.size(); }

    [[nodiscard]] const PhysicsConfig& config() const noexcept { return m_config; }

    /// Takes effect at the start of the next step
    void update_config(const PhysicsConfig& config);

    [[nodiscard]] bool has_pending_config() const noexcept { return m_pending_config.has_value(); }

    // =========================================================================
    // Entities
    // =========================================================================

    /// Fails for a dynamic body without positive mass or for invalid geometry
    [[nodiscard]] arphys_core::Result<EntityId> add_entity(const EntityDesc& desc);

    bool remove_entity(EntityId id);

    [[nodiscard]] PhysicsEntity* entity(EntityId id) { return m_entities.get(id); }
    [[nodiscard]] const PhysicsEntity* entity(EntityId id) const { return m_entities.get(id); }

    [[nodiscard]] bool contains(EntityId id) const { return m_entities.contains(id); }

    [[nodiscard]] std::size_t entity_count() const noexcept { return m_entities.size(); }

    [[nodiscard]] std::vector<EntityId> entity_ids() const { return m_entities.keys(); }

    template<typename F>
    void for_each_entity(F&& func) const {
        m_entities.for_each([&func](EntityId, const PhysicsEntity& e) { func(e); });
    }

    /// Enabled and awake, in id order
    [[nodiscard]] const std::set<EntityId>& active_entities() const noexcept { return m_active; }

    [[nodiscard]] const std::set<EntityId>& sleeping_entities() const noexcept { return m_sleeping; }

    [[nodiscard]] bool is_sleeping(EntityId id) const { return m_sleeping.count(id) > 0; }

    // =========================================================================
    // Motion Control
    // =========================================================================

    /// Disabled entities keep their state but are neither simulated nor collided
    bool set_physics_enabled(EntityId id, bool enabled);

    /// Teleport; intended for kinematic bodies driven by the host
    bool set_kinematic_transform(EntityId id, const arphys_math::Vec3& position,
                                 const arphys_math::Quat& orientation);

    bool set_velocity(EntityId id, const arphys_math::Vec3& velocity);

    bool set_angular_velocity(EntityId id, const arphys_math::Vec3& angular_velocity);

    bool set_collision_group(EntityId id, CollisionGroup group);

    /// Accumulate a force for the next step. With `point` the lever arm
    /// (point - position) also produces a torque. Wakes the entity.
    /// @return false for unknown or kinematic entities
    bool apply_force(EntityId id, const arphys_math::Vec3& force,
                     std::optional<arphys_math::Vec3> point = std::nullopt);

    /// Instant velocity change J / m, plus (r x J) / I with a point
    bool apply_impulse(EntityId id, const arphys_math::Vec3& impulse,
                       std::optional<arphys_math::Vec3> point = std::nullopt);

    bool apply_torque(EntityId id, const arphys_math::Vec3& torque);

    bool wake(EntityId id);

    /// Kinematic and disabled entities cannot sleep
    bool put_to_sleep(EntityId id);

    /// Push the current transform to the entity's handle
    bool sync_handle(EntityId id);

    // =========================================================================
    // Static Colliders
    // =========================================================================

    [[nodiscard]] arphys_core::Result<ColliderId> add_static_collider(const arphys_math::Mat4& transform,
                                                                      Geometry geometry) {
        return m_collision.add_static_collider(transform, std::move(geometry));
    }

    /// Sleeping entities near the old or the new footprint are woken
    bool update_static_collider(ColliderId id, const arphys_math::Mat4& transform,
                                std::optional<Geometry> geometry = std::nullopt);

    /// Sleeping entities the collider was supporting are woken
    bool remove_static_collider(ColliderId id);

    [[nodiscard]] const StaticCollider* static_collider(ColliderId id) const {
        return m_collision.static_collider(id);
    }

    // =========================================================================
    // Collision
    // =========================================================================

    [[nodiscard]] CollisionDetector& collision() noexcept { return m_collision; }
    [[nodiscard]] const CollisionDetector& collision() const noexcept { return m_collision; }

    void on_collision_begin(CollisionCallback callback) { m_collision.on_collision_begin(std::move(callback)); }
    void on_collision_end(CollisionCallback callback) { m_collision.on_collision_end(std::move(callback)); }

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] WorldStats stats() const;

    [[nodiscard]] double simulated_time() const noexcept { return m_simulated_time; }

    [[nodiscard]] std::uint64_t step_count() const noexcept { return m_step_count; }

    /// Remove every entity and static collider
    void clear();

private:
    void apply_pending_config();
    void apply_forces_and_integrate(float dt);
    void evaluate_sleep(float dt, std::vector<EntityId>& fell_asleep);
    void push_transforms(const std::vector<EntityId>& fell_asleep);

    void sleep_entity(PhysicsEntity& entity);
    void wake_entity(PhysicsEntity& entity);
    void wake_sleepers(const std::vector<EntityId>& ids);

    PhysicsConfig m_config;
    std::optional<PhysicsConfig> m_pending_config;

    EntityStore m_entities;
    std::set<EntityId> m_active;
    std::set<EntityId> m_sleeping;

    CollisionDetector m_collision;
    arphys_structures::CommandQueue<Command> m_commands;

    std::uint64_t m_step_count = 0;
    double m_simulated_time = 0.0;
    float m_last_step_ms = 0.0f;
};

} // namespace arphys_physics
