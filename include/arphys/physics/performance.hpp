/// @file performance.hpp
/// @brief Frame budget tracking, level of detail, culling and memory estimates

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "batch.hpp"

#include <arphys/math/plane.hpp>

#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace arphys_physics {

// =============================================================================
// LodManager
// =============================================================================

/// Discrete detail level per entity from its distance to the viewer.
/// Level i covers distances up to lod_distances[i]; beyond the last
/// boundary the level is lod_distances.size().
class LodManager {
public:
    explicit LodManager(const PerformanceConfig& config = PerformanceConfig{});

    void set_config(const PerformanceConfig& config) { m_config = config; }

    /// Level for `distance`. With a previous level the distance has to pass
    /// a boundary by more than the hysteresis before the level changes.
    [[nodiscard]] std::uint32_t level_for_distance(float distance,
                                                   std::optional<std::uint32_t> previous = std::nullopt) const noexcept;

    /// Update and return the entity's level
    std::uint32_t update(EntityId id, float distance);

    [[nodiscard]] std::optional<std::uint32_t> level(EntityId id) const;

    void remove(EntityId id) { m_levels.erase(id); }

    /// Forget every entity not in `live`
    void retain(const std::unordered_set<EntityId>& live);

    [[nodiscard]] float average_level() const noexcept;

    [[nodiscard]] std::size_t tracked() const noexcept { return m_levels.size(); }

    [[nodiscard]] std::uint64_t transitions() const noexcept { return m_transitions; }

    void clear();

private:
    PerformanceConfig m_config;
    std::unordered_map<EntityId, std::uint32_t> m_levels;
    std::uint64_t m_transitions = 0;
};

// =============================================================================
// Culler
// =============================================================================

/// Marks entities that skip optional per-frame work. Culled entities are
/// still simulated and collided.
class Culler {
public:
    explicit Culler(const PerformanceConfig& config = PerformanceConfig{});

    void set_config(const PerformanceConfig& config) { m_config = config; }

    /// Without a view-projection only distance culling applies
    void set_viewer(const arphys_math::Vec3& position,
                    std::optional<arphys_math::Mat4> view_projection = std::nullopt);

    [[nodiscard]] const arphys_math::Vec3& viewer_position() const noexcept { return m_viewer; }

    /// Within the cull distance and not fully outside the frustum
    [[nodiscard]] bool is_visible(const arphys_math::Vec3& center, float radius) const noexcept;

    /// @return true when the entity is now culled
    bool update(EntityId id, const arphys_math::Vec3& center, float radius);

    [[nodiscard]] bool is_culled(EntityId id) const { return m_culled.count(id) > 0; }

    [[nodiscard]] const std::unordered_set<EntityId>& culled() const noexcept { return m_culled; }

    [[nodiscard]] std::size_t culled_count() const noexcept { return m_culled.size(); }

    void remove(EntityId id) { m_culled.erase(id); }

    void retain(const std::unordered_set<EntityId>& live);

    void clear() { m_culled.clear(); }

private:
    PerformanceConfig m_config;
    arphys_math::Vec3 m_viewer{0.0f};
    std::optional<arphys_math::FrustumPlanes> m_frustum;
    std::unordered_set<EntityId> m_culled;
};

// =============================================================================
// MemoryTracker
// =============================================================================

/// Counts gathered at the end of a frame
struct FrameSnapshot {
    std::uint32_t total_entities = 0;
    std::uint32_t active_entities = 0;
    std::uint32_t sleeping_entities = 0;
    std::uint32_t static_colliders = 0;
    std::uint32_t snap_targets = 0;
    std::uint32_t grid_cells = 0;
    std::uint32_t collisions = 0;
    std::uint32_t pooled_objects = 0;
    std::uint32_t batches = 0;

    /// Everything but snap_targets, which the world does not own
    [[nodiscard]] static FrameSnapshot capture(const PhysicsWorld& world);
};

/// Estimated footprint of the simulation state. Counts are exact, per
/// object sizes are approximations.
class MemoryTracker {
public:
    [[nodiscard]] static std::size_t estimate(const FrameSnapshot& snapshot) noexcept;

    /// @return The estimate for `snapshot`
    std::size_t record(const FrameSnapshot& snapshot) noexcept;

    [[nodiscard]] std::size_t current_bytes() const noexcept { return m_current; }
    [[nodiscard]] std::size_t peak_bytes() const noexcept { return m_peak; }

    void reset() noexcept {
        m_current = 0;
        m_peak = 0;
    }

private:
    std::size_t m_current = 0;
    std::size_t m_peak = 0;
};

// =============================================================================
// PerformanceManager
// =============================================================================

/// What the owner should change before the next step
struct FrameDirective {
    bool enter_emergency = false;
    bool exit_emergency = false;
    bool emergency_active = false;
    bool memory_cleanup = false;            ///< Trim pools and sweep empty grid cells

    [[nodiscard]] bool changes_config() const noexcept { return enter_emergency || exit_emergency; }
};

/// Watches frame times against the quality budget and degrades optional
/// work before frames are dropped. Reads world state only; configuration
/// changes go back to the owner as a FrameDirective.
class PerformanceManager {
public:
    explicit PerformanceManager(const PhysicsConfig& config = PhysicsConfig{});

    void set_config(const PhysicsConfig& config);

    void set_viewer(const arphys_math::Vec3& position,
                    std::optional<arphys_math::Mat4> view_projection = std::nullopt);

    /// Refresh LOD and culling once per optimization interval
    /// @return true when a pass ran
    bool optimize(const PhysicsWorld& world, double now);

    /// Account for a finished frame. Never throws.
    FrameDirective end_frame(float frame_seconds, const FrameSnapshot& snapshot);

    [[nodiscard]] bool is_emergency() const noexcept { return m_emergency; }

    /// Mean bounding radius seen by the last optimize pass
    [[nodiscard]] float average_radius() const noexcept { return m_average_radius; }

    /// Sleep twice as eagerly, drop shadows and occlusion
    [[nodiscard]] static PhysicsConfig emergency_config(const PhysicsConfig& base);

    [[nodiscard]] PerformanceStats stats() const;

    [[nodiscard]] LodManager& lod() noexcept { return m_lod; }
    [[nodiscard]] const LodManager& lod() const noexcept { return m_lod; }

    [[nodiscard]] Culler& culler() noexcept { return m_culler; }
    [[nodiscard]] const Culler& culler() const noexcept { return m_culler; }

    [[nodiscard]] const MemoryTracker& memory() const noexcept { return m_memory; }

    void reset();

private:
    PerformanceConfig m_config;
    float m_budget = 0.008f;

    LodManager m_lod;
    Culler m_culler;
    MemoryTracker m_memory;
    BatchProcessor m_batcher;

    std::optional<double> m_last_optimize;
    float m_average_radius = 0.0f;

    bool m_emergency = false;
    std::uint32_t m_over_budget_frames = 0;
    std::uint32_t m_good_frames = 0;
    std::uint32_t m_emergency_activations = 0;
    std::uint64_t m_slow_frame_count = 0;

    float m_frame_time = 0.0f;
    float m_average_frame_time = 0.0f;
    std::uint64_t m_frame_count = 0;
    FrameSnapshot m_last_snapshot;
};

} // namespace arphys_physics
