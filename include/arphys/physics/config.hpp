/// @file config.hpp
/// @brief Simulation, snapping and performance configuration

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <arphys/core/error.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace arphys_physics {

// =============================================================================
// Quality
// =============================================================================

/// Per-tier budget and optional costs
struct QualitySettings {
    float performance_budget = 0.008f;  ///< Seconds per step
    bool shadows_enabled = true;
    bool occlusion_enabled = true;
    CollisionPrecision precision = CollisionPrecision::Full;

    [[nodiscard]] static QualitySettings for_tier(QualityTier tier);
};

// =============================================================================
// PerformanceConfig
// =============================================================================

struct PerformanceConfig {
    std::array<float, 4> lod_distances{5.0f, 15.0f, 30.0f, 50.0f};  ///< Ascending level boundaries
    float lod_hysteresis = 1.0f;
    float max_cull_distance = 50.0f;
    bool frustum_culling_enabled = true;
    float frame_time_threshold = 0.016f;        ///< Frames slower than this are logged as warnings
    std::uint32_t emergency_frame_count = 3;    ///< Consecutive over-budget frames before emergency mode
    std::uint32_t recovery_frame_count = 120;   ///< Consecutive good frames before leaving it
    float optimization_interval = 1.0f;         ///< Seconds between LOD/culling passes
    std::size_t pool_capacity = 100;
    std::size_t memory_threshold_bytes = 100u * 1024u * 1024u;
    std::size_t batch_size = 64;
    bool adaptive_cell_size = false;            ///< Follow the recommended grid cell size
};

// =============================================================================
// PhysicsConfig
// =============================================================================

/// World, collision and snap parameters. Changes made through
/// PhysicsWorld::update_config take effect at the next step.
struct PhysicsConfig {
    // Motion
    arphys_math::Vec3 gravity{0.0f, -9.81f, 0.0f};
    float linear_damping = 0.98f;       ///< Velocity multiplier per step
    float angular_damping = 0.98f;
    float max_velocity = 10.0f;
    bool gravity_enabled = true;
    bool simulation_enabled = true;

    // Sleep
    float sleep_threshold = 0.01f;      ///< Linear (m/s) and angular (rad/s) speed
    float time_to_sleep = 1.0f;

    // Collision
    bool collision_detection_enabled = true;
    float collision_margin = 0.01f;
    float rest_velocity_threshold = 0.5f;   ///< Approach speed below which static contacts are inelastic
    float default_friction = 0.7f;
    float default_restitution = 0.3f;
    float grid_cell_size = 1.0f;
    float grid_optimize_interval = 5.0f;
    std::uint32_t max_collision_checks_warning = 100;

    // Snapping
    bool snap_to_floor_enabled = true;
    bool snap_to_wall_enabled = true;
    bool auto_snap_enabled = true;
    float snap_distance = 0.05f;
    float snap_search_radius = 1.0f;
    float snap_duration = 0.3f;
    float snap_spring_constant = 100.0f;
    float snap_hold_tolerance = 0.015f;
    float snap_auto_max_speed = 1.0f;
    float snap_angle_tolerance = 15.0f;     ///< Degrees

    // Quality
    QualityTier quality = QualityTier::High;
    float performance_budget = 0.008f;
    bool shadows_enabled = true;
    bool occlusion_enabled = true;
    CollisionPrecision precision = CollisionPrecision::Full;

    PerformanceConfig performance;

    // =========================================================================
    // Presets
    // =========================================================================

    [[nodiscard]] static PhysicsConfig defaults();

    /// Ultra tier, finer grid, tighter sleep
    [[nodiscard]] static PhysicsConfig high_fidelity();

    /// Low tier, coarser grid, eager sleep
    [[nodiscard]] static PhysicsConfig performance_preset();

    /// Copy the tier's budget, shadow/occlusion toggles and precision
    void apply_quality(QualityTier tier);

    // =========================================================================
    // Validation and serialization
    // =========================================================================

    /// Range checks; the first offending key is reported
    [[nodiscard]] arphys_core::Result<void> validate() const;

    /// Missing keys keep their defaults
    [[nodiscard]] static arphys_core::Result<PhysicsConfig> from_json(const std::string& text);

    [[nodiscard]] static arphys_core::Result<PhysicsConfig> load_from_file(const std::string& path);

    [[nodiscard]] std::string to_json() const;

    [[nodiscard]] arphys_core::Result<void> save_to_file(const std::string& path) const;
};

} // namespace arphys_physics
