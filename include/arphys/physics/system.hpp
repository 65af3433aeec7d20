/// @file system.hpp
/// @brief Frame-level facade over world, snapping, surfaces and performance

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "world.hpp"
#include "snap.hpp"
#include "performance.hpp"
#include "surface_feed.hpp"

#include <arphys/core/error.hpp>

namespace arphys_physics {

/// Entry point for the host application. One update() per rendered frame.
class PhysicsSystem {
public:
    explicit PhysicsSystem(PhysicsConfig config = PhysicsConfig{});

    PhysicsSystem(const PhysicsSystem&) = delete;
    PhysicsSystem& operator=(const PhysicsSystem&) = delete;

    // =========================================================================
    // Frame
    // =========================================================================

    /// Surfaces, step, snapping, then performance accounting
    /// @return The directive produced for this frame
    FrameDirective update(float dt);

    // =========================================================================
    // Entities
    // =========================================================================

    /// Snap-capable entities are registered with the snap system
    [[nodiscard]] arphys_core::Result<EntityId> add_entity(const EntityDesc& desc);

    bool remove_entity(EntityId id);

    SnapResult snap_to_surface(EntityId id, SnapType type) {
        return m_snap.snap_to_surface(m_world, id, type);
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Applies from the next step; emergency adjustments stay on top
    void update_config(const PhysicsConfig& config);

    void set_quality(QualityTier tier);

    /// Configuration as requested, without emergency adjustments
    [[nodiscard]] const PhysicsConfig& config() const noexcept { return m_config; }

    void set_viewer(const arphys_math::Vec3& position,
                    std::optional<arphys_math::Mat4> view_projection = std::nullopt) {
        m_performance.set_viewer(position, std::move(view_projection));
    }

    // =========================================================================
    // Components
    // =========================================================================

    [[nodiscard]] PhysicsWorld& world() noexcept { return m_world; }
    [[nodiscard]] const PhysicsWorld& world() const noexcept { return m_world; }

    [[nodiscard]] SnapSystem& snap() noexcept { return m_snap; }
    [[nodiscard]] const SnapSystem& snap() const noexcept { return m_snap; }

    [[nodiscard]] PerformanceManager& performance() noexcept { return m_performance; }
    [[nodiscard]] const PerformanceManager& performance() const noexcept { return m_performance; }

    [[nodiscard]] SurfaceFeed& surfaces() noexcept { return m_surfaces; }

    [[nodiscard]] PhysicsStats stats() const;

private:
    void push_config();
    void adapt_cell_size();
    void apply_directive(const FrameDirective& directive);

    PhysicsConfig m_config;

    PhysicsWorld m_world;
    SnapSystem m_snap;
    PerformanceManager m_performance;
    SurfaceFeed m_surfaces;

    float m_last_frame_ms = 0.0f;
};

} // namespace arphys_physics
