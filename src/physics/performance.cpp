/// @file performance.cpp
/// @brief Performance manager implementation

#include <arphys/physics/performance.hpp>
#include <arphys/physics/world.hpp>
#include <arphys/physics/snap.hpp>

#include <arphys/core/log.hpp>

#include <algorithm>
#include <vector>

namespace arphys_physics {

using arphys_math::Vec3;

namespace {

// Per-object estimates for the memory tracker
constexpr std::size_t k_grid_cell_bytes = 96;
constexpr std::size_t k_pooled_object_bytes = 512;

/// Weight of the newest frame in the running average
constexpr float k_average_weight = 0.1f;

} // anonymous namespace

// =============================================================================
// LodManager
// =============================================================================

LodManager::LodManager(const PerformanceConfig& config)
    : m_config(config) {}

std::uint32_t LodManager::level_for_distance(float distance, std::optional<std::uint32_t> previous) const noexcept {
    const auto& bounds = m_config.lod_distances;
    const auto max_level = static_cast<std::uint32_t>(bounds.size());

    if (!previous) {
        std::uint32_t level = 0;
        while (level < max_level && distance > bounds[level]) {
            ++level;
        }
        return level;
    }

    std::uint32_t level = std::min(*previous, max_level);
    const float h = m_config.lod_hysteresis;
    while (level < max_level && distance > bounds[level] + h) {
        ++level;
    }
    while (level > 0 && distance < bounds[level - 1] - h) {
        --level;
    }
    return level;
}

std::uint32_t LodManager::update(EntityId id, float distance) {
    auto it = m_levels.find(id);
    if (it == m_levels.end()) {
        const std::uint32_t level = level_for_distance(distance);
        m_levels.emplace(id, level);
        return level;
    }

    const std::uint32_t level = level_for_distance(distance, it->second);
    if (level != it->second) {
        ++m_transitions;
        it->second = level;
    }
    return level;
}

std::optional<std::uint32_t> LodManager::level(EntityId id) const {
    auto it = m_levels.find(id);
    if (it == m_levels.end()) {
        return std::nullopt;
    }
    return it->second;
}

void LodManager::retain(const std::unordered_set<EntityId>& live) {
    for (auto it = m_levels.begin(); it != m_levels.end();) {
        if (live.count(it->first) == 0) {
            it = m_levels.erase(it);
        } else {
            ++it;
        }
    }
}

float LodManager::average_level() const noexcept {
    if (m_levels.empty()) {
        return 0.0f;
    }
    float sum = 0.0f;
    for (const auto& [id, level] : m_levels) {
        sum += static_cast<float>(level);
    }
    return sum / static_cast<float>(m_levels.size());
}

void LodManager::clear() {
    m_levels.clear();
    m_transitions = 0;
}

// =============================================================================
// Culler
// =============================================================================

Culler::Culler(const PerformanceConfig& config)
    : m_config(config) {}

void Culler::set_viewer(const Vec3& position, std::optional<arphys_math::Mat4> view_projection) {
    m_viewer = position;
    if (view_projection) {
        m_frustum = arphys_math::FrustumPlanes::from_view_projection(*view_projection);
    } else {
        m_frustum.reset();
    }
}

bool Culler::is_visible(const Vec3& center, float radius) const noexcept {
    if (arphys_math::distance(m_viewer, center) - radius > m_config.max_cull_distance) {
        return false;
    }
    if (m_config.frustum_culling_enabled && m_frustum) {
        return m_frustum->test_sphere(center, radius) != arphys_math::FrustumTestResult::Outside;
    }
    return true;
}

bool Culler::update(EntityId id, const Vec3& center, float radius) {
    if (is_visible(center, radius)) {
        m_culled.erase(id);
        return false;
    }
    m_culled.insert(id);
    return true;
}

void Culler::retain(const std::unordered_set<EntityId>& live) {
    for (auto it = m_culled.begin(); it != m_culled.end();) {
        if (live.count(*it) == 0) {
            it = m_culled.erase(it);
        } else {
            ++it;
        }
    }
}

// =============================================================================
// MemoryTracker
// =============================================================================

FrameSnapshot FrameSnapshot::capture(const PhysicsWorld& world) {
    const WorldStats ws = world.stats();
    const CollisionStats cs = world.collision().stats();

    FrameSnapshot s;
    s.total_entities = ws.total_entities;
    s.active_entities = ws.active_entities;
    s.sleeping_entities = ws.sleeping_entities;
    s.static_colliders = cs.static_colliders;
    s.grid_cells = cs.grid.total_cells;
    s.collisions = cs.active_collisions;
    s.pooled_objects = static_cast<std::uint32_t>(world.collision().pooled_objects());
    s.batches = cs.batches;
    return s;
}

std::size_t MemoryTracker::estimate(const FrameSnapshot& snapshot) noexcept {
    return snapshot.total_entities * sizeof(PhysicsEntity)
         + snapshot.static_colliders * sizeof(StaticCollider)
         + snapshot.snap_targets * sizeof(SnapTarget)
         + snapshot.grid_cells * k_grid_cell_bytes
         + snapshot.collisions * sizeof(Collision)
         + snapshot.pooled_objects * k_pooled_object_bytes;
}

std::size_t MemoryTracker::record(const FrameSnapshot& snapshot) noexcept {
    m_current = estimate(snapshot);
    m_peak = std::max(m_peak, m_current);
    return m_current;
}

// =============================================================================
// PerformanceManager
// =============================================================================

PerformanceManager::PerformanceManager(const PhysicsConfig& config)
    : m_config(config.performance)
    , m_budget(config.performance_budget)
    , m_lod(config.performance)
    , m_culler(config.performance)
    , m_batcher(config.performance.batch_size) {}

void PerformanceManager::set_config(const PhysicsConfig& config) {
    m_config = config.performance;
    m_budget = config.performance_budget;
    m_lod.set_config(config.performance);
    m_culler.set_config(config.performance);
    m_batcher.set_batch_size(config.performance.batch_size);
}

void PerformanceManager::set_viewer(const Vec3& position, std::optional<arphys_math::Mat4> view_projection) {
    m_culler.set_viewer(position, std::move(view_projection));
}

bool PerformanceManager::optimize(const PhysicsWorld& world, double now) {
    if (m_last_optimize && now - *m_last_optimize < m_config.optimization_interval) {
        return false;
    }
    m_last_optimize = now;

    std::vector<const PhysicsEntity*> entities;
    entities.reserve(world.entity_count());
    world.for_each_entity([&entities](const PhysicsEntity& e) {
        if (e.is_physics_enabled) entities.push_back(&e);
    });

    std::unordered_set<EntityId> live;
    live.reserve(entities.size());

    const Vec3 viewer = m_culler.viewer_position();
    float radius_sum = 0.0f;
    m_batcher.process(std::span<const PhysicsEntity*>(entities), [&](auto batch) {
        for (const PhysicsEntity* e : batch) {
            live.insert(e->id);
            radius_sum += e->bounding_radius;
            m_lod.update(e->id, arphys_math::distance(viewer, e->position));
            m_culler.update(e->id, e->position, e->bounding_radius);
        }
    });

    m_lod.retain(live);
    m_culler.retain(live);
    m_average_radius = entities.empty() ? 0.0f : radius_sum / static_cast<float>(entities.size());

    arphys_core::perf_logger()->trace("Optimize pass: {} entities, average LOD {:.2f}, {} culled",
                                      entities.size(), m_lod.average_level(), m_culler.culled_count());
    return true;
}

FrameDirective PerformanceManager::end_frame(float frame_seconds, const FrameSnapshot& snapshot) {
    auto logger = arphys_core::perf_logger();

    m_last_snapshot = snapshot;
    m_frame_time = frame_seconds;
    m_average_frame_time = (m_frame_count++ == 0)
        ? frame_seconds
        : m_average_frame_time + (frame_seconds - m_average_frame_time) * k_average_weight;

    if (frame_seconds > m_config.frame_time_threshold && m_slow_frame_count++ % 300 == 0) {
        logger->warn("Frame took {:.2f} ms, above the {:.2f} ms threshold",
                     frame_seconds * 1000.0f, m_config.frame_time_threshold * 1000.0f);
    }

    if (frame_seconds > m_budget) {
        ++m_over_budget_frames;
        m_good_frames = 0;
    } else {
        ++m_good_frames;
        m_over_budget_frames = 0;
    }

    FrameDirective directive;

    if (!m_emergency && m_over_budget_frames >= m_config.emergency_frame_count) {
        m_emergency = true;
        ++m_emergency_activations;
        directive.enter_emergency = true;
        directive.memory_cleanup = true;
        logger->warn("Entering emergency mode after {} frames over the {:.1f} ms budget",
                     m_over_budget_frames, m_budget * 1000.0f);
    } else if (m_emergency && m_good_frames >= m_config.recovery_frame_count) {
        m_emergency = false;
        directive.exit_emergency = true;
        logger->info("Leaving emergency mode after {} frames within budget", m_good_frames);
    }

    if (m_memory.record(snapshot) > m_config.memory_threshold_bytes) {
        directive.memory_cleanup = true;
        logger->debug("Estimated memory {} bytes above threshold, requesting cleanup", m_memory.current_bytes());
    }

    directive.emergency_active = m_emergency;
    return directive;
}

PhysicsConfig PerformanceManager::emergency_config(const PhysicsConfig& base) {
    PhysicsConfig config = base;
    config.sleep_threshold *= 2.0f;
    config.time_to_sleep *= 0.5f;
    config.shadows_enabled = false;
    config.occlusion_enabled = false;
    return config;
}

PerformanceStats PerformanceManager::stats() const {
    PerformanceStats s;
    s.frame_time_ms = m_frame_time * 1000.0f;
    s.average_frame_time_ms = m_average_frame_time * 1000.0f;
    s.memory_bytes = m_memory.current_bytes();
    s.active_entities = m_last_snapshot.active_entities;
    s.sleeping_entities = m_last_snapshot.sleeping_entities;
    s.average_lod = m_lod.average_level();
    s.culled_entities = static_cast<std::uint32_t>(m_culler.culled_count());
    s.batched_operations = m_last_snapshot.batches + static_cast<std::uint32_t>(m_batcher.total_batches());
    s.pooled_objects = m_last_snapshot.pooled_objects;
    s.over_budget_frames = m_over_budget_frames;
    s.emergency_activations = m_emergency_activations;
    s.emergency_mode = m_emergency;
    return s;
}

void PerformanceManager::reset() {
    m_lod.clear();
    m_culler.clear();
    m_memory.reset();
    m_batcher.reset_stats();
    m_last_optimize.reset();
    m_average_radius = 0.0f;
    m_emergency = false;
    m_over_budget_frames = 0;
    m_good_frames = 0;
    m_emergency_activations = 0;
    m_slow_frame_count = 0;
    m_frame_time = 0.0f;
    m_average_frame_time = 0.0f;
    m_frame_count = 0;
    m_last_snapshot = FrameSnapshot{};
}

} // namespace arphys_physics
