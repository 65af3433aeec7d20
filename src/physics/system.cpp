/// @file system.cpp
/// @brief PhysicsSystem implementation

#include <arphys/physics/system.hpp>

#include <arphys/core/log.hpp>

#include <chrono>
#include <cmath>

namespace arphys_physics {

namespace {

/// Relative difference before the grid is rebuilt at the recommended size
constexpr float k_cell_size_tolerance = 0.25f;

} // anonymous namespace

PhysicsSystem::PhysicsSystem(PhysicsConfig config)
    : m_config(std::move(config))
    , m_world(m_config)
    , m_snap(m_config)
    , m_performance(m_config) {}

FrameDirective PhysicsSystem::update(float dt) {
    const auto start = std::chrono::steady_clock::now();

    m_surfaces.process(m_world, m_snap);

    if (m_config.simulation_enabled) {
        m_world.step(dt);
        m_snap.update(m_world, dt);
    }

    if (m_performance.optimize(m_world, m_world.simulated_time())) {
        adapt_cell_size();
    }

    const auto elapsed = std::chrono::steady_clock::now() - start;
    const float frame_seconds = std::chrono::duration<float>(elapsed).count();
    m_last_frame_ms = frame_seconds * 1000.0f;

    FrameSnapshot snapshot = FrameSnapshot::capture(m_world);
    snapshot.snap_targets = static_cast<std::uint32_t>(m_snap.snap_target_count());

    const FrameDirective directive = m_performance.end_frame(frame_seconds, snapshot);
    apply_directive(directive);
    return directive;
}

arphys_core::Result<EntityId> PhysicsSystem::add_entity(const EntityDesc& desc) {
    auto id = m_world.add_entity(desc);
    if (id.is_ok() && desc.can_snap && !desc.is_kinematic) {
        m_snap.register_entity(id.value());
    }
    return id;
}

bool PhysicsSystem::remove_entity(EntityId id) {
    m_snap.unregister_entity(id);
    m_performance.lod().remove(id);
    m_performance.culler().remove(id);
    return m_world.remove_entity(id);
}

void PhysicsSystem::update_config(const PhysicsConfig& config) {
    m_config = config;
    push_config();
}

void PhysicsSystem::set_quality(QualityTier tier) {
    m_config.apply_quality(tier);
    push_config();
    arphys_core::physics_logger()->info("Quality set to {}", to_string(tier));
}

void PhysicsSystem::push_config() {
    m_world.update_config(m_performance.is_emergency()
                              ? PerformanceManager::emergency_config(m_config)
                              : m_config);
    m_snap.set_config(m_config);
    m_performance.set_config(m_config);
}

void PhysicsSystem::adapt_cell_size() {
    if (!m_config.performance.adaptive_cell_size || m_performance.average_radius() <= 0.0f) {
        return;
    }

    const float recommended = SpatialGrid::recommended_cell_size(m_performance.average_radius());
    const float current = m_config.grid_cell_size;
    if (std::abs(recommended - current) <= current * k_cell_size_tolerance) {
        return;
    }

    m_config.grid_cell_size = recommended;
    push_config();
    arphys_core::physics_logger()->info("Grid cell size adapted from {:.2f} m to {:.2f} m", current, recommended);
}

void PhysicsSystem::apply_directive(const FrameDirective& directive) {
    if (directive.changes_config()) {
        m_world.update_config(directive.emergency_active
                                  ? PerformanceManager::emergency_config(m_config)
                                  : m_config);
    }

    if (directive.memory_cleanup) {
        const std::size_t trimmed = m_world.collision().trim_pools();
        const std::size_t cells = m_world.collision().grid().compact();
        arphys_core::perf_logger()->debug("Memory cleanup: {} pooled objects, {} grid cells released",
                                          trimmed, cells);
    }
}

PhysicsStats PhysicsSystem::stats() const {
    PhysicsStats s;
    s.world = m_world.stats();
    s.collision = m_world.collision().stats();
    s.snap = m_snap.stats();
    s.performance = m_performance.stats();
    s.surfaces = static_cast<std::uint32_t>(m_surfaces.surface_count());
    s.frame_time_ms = m_last_frame_ms;
    return s;
}

} // namespace arphys_physics
