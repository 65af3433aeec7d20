/// @file collision.cpp
/// @brief Collision detection and response implementation

#include <arphys/physics/collision.hpp>

#include <arphys/core/log.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <span>

namespace arphys_physics {

using arphys_math::Vec3;
namespace consts = arphys_math::consts;

// =============================================================================
// Narrow Phase
// =============================================================================

std::optional<Contact> test_sphere_sphere(const Vec3& center_a, float radius_a,
                                          const Vec3& center_b, float radius_b,
                                          float margin) noexcept {
    const Vec3 delta = center_b - center_a;
    const float dist = arphys_math::length(delta);
    const float reach = radius_a + radius_b + margin;
    if (dist >= reach || dist < consts::EPSILON) {
        return std::nullopt;
    }

    const Vec3 n = delta / dist;
    return Contact{center_a + n * radius_a, n, reach - dist};
}

std::optional<Contact> test_sphere_plane(const Vec3& center, float radius,
                                         const arphys_math::Plane& plane, float margin) noexcept {
    const float d = plane.signed_distance(center);
    const float reach = radius + margin;
    if (d >= reach) {
        return std::nullopt;
    }
    return Contact{center - plane.normal * d, plane.normal, reach - d};
}

std::optional<Contact> test_sphere_box(const Vec3& center, float radius,
                                       const arphys_math::Mat4& transform,
                                       const arphys_math::Mat4& inverse_transform,
                                       const arphys_math::AABB& local_box,
                                       float margin) noexcept {
    if (local_box.is_empty()) {
        return std::nullopt;
    }

    const Vec3 box_center = local_box.center();
    const Vec3 half = local_box.half_extents();
    const Vec3 local = arphys_math::transform_point(inverse_transform, center) - box_center;
    const Vec3 clamped = glm::clamp(local, -half, half);
    const float reach = radius + margin;

    if (clamped == local) {
        // Center inside: leave through the face with the least depth
        int axis = 0;
        float best = half.x - std::abs(local.x);
        for (int i = 1; i < 3; ++i) {
            const float depth = half[i] - std::abs(local[i]);
            if (depth < best) {
                best = depth;
                axis = i;
            }
        }
        const float sign = local[axis] >= 0.0f ? 1.0f : -1.0f;
        Vec3 local_normal(0.0f);
        local_normal[axis] = sign;
        Vec3 face_point = local;
        face_point[axis] = sign * half[axis];

        const Vec3 world_point = arphys_math::transform_point(transform, face_point + box_center);
        const Vec3 n = arphys_math::transform_normal(transform, local_normal);
        return Contact{world_point, n, arphys_math::distance(center, world_point) + reach};
    }

    const Vec3 closest = arphys_math::transform_point(transform, clamped + box_center);
    const Vec3 delta = center - closest;
    const float dist = arphys_math::length(delta);
    if (dist >= reach || dist < consts::EPSILON) {
        return std::nullopt;
    }
    return Contact{closest, delta / dist, reach - dist};
}

std::optional<Contact> test_entity_static(const PhysicsEntity& entity,
                                          const StaticCollider& collider,
                                          float margin) noexcept {
    const Vec3& p = entity.position;
    const float r = entity.bounding_radius;

    if (const auto* sphere = std::get_if<SphereGeometry>(&collider.geometry)) {
        const Vec3 center = arphys_math::get_translation(collider.transform);
        auto contact = test_sphere_sphere(p, r, center, sphere->radius, margin);
        if (!contact) return std::nullopt;
        const Vec3 n = -contact->normal;
        return Contact{center + n * sphere->radius, n, contact->penetration};
    }

    if (const auto* box = std::get_if<BoxGeometry>(&collider.geometry)) {
        const arphys_math::AABB local_box = arphys_math::AABB::from_center_half_extents(
            arphys_math::vec3::ZERO, box->size * 0.5f);
        return test_sphere_box(p, r, collider.transform, collider.inverse_transform, local_box, margin);
    }

    if (const auto* mesh = std::get_if<MeshGeometry>(&collider.geometry)) {
        // Meshes collide as the box of their bounds
        return test_sphere_box(p, r, collider.transform, collider.inverse_transform, mesh->bounds, margin);
    }

    const auto& plane = std::get<PlaneGeometry>(collider.geometry);

    // Outside the patch (grown by the radius) there is nothing to stand on
    Vec3 u, v;
    plane_axes(plane.normal, u, v);
    const Vec3 patch_center = arphys_math::normalize_or_zero(plane.normal) * plane.distance;
    const Vec3 local = arphys_math::transform_point(collider.inverse_transform, p) - patch_center;
    if (std::abs(glm::dot(local, u)) > plane.extent.x * 0.5f + r ||
        std::abs(glm::dot(local, v)) > plane.extent.y * 0.5f + r) {
        return std::nullopt;
    }

    return test_sphere_plane(p, r, collider.world_plane(), margin);
}

// =============================================================================
// Resolution
// =============================================================================

void resolve_entity_entity(PhysicsEntity& a, PhysicsEntity& b, const Contact& contact,
                           const ResolutionSettings& settings) noexcept {
    const float inv_a = a.inverse_mass();
    const float inv_b = b.inverse_mass();
    const float inv_sum = inv_a + inv_b;
    if (inv_sum <= 0.0f) {
        return;
    }

    const Vec3& n = contact.normal;

    // Heavier body moves less
    const float correction = contact.penetration * settings.positional_correction;
    a.position -= n * (correction * inv_a / inv_sum);
    b.position += n * (correction * inv_b / inv_sum);

    const Vec3 relative = b.linear_velocity - a.linear_velocity;
    const float vn = glm::dot(relative, n);
    if (vn > 0.0f) {
        return;
    }

    const float restitution = std::min(a.material.restitution, b.material.restitution);
    const float j = -(1.0f + restitution) * vn / inv_sum;
    a.linear_velocity -= n * (j * inv_a);
    b.linear_velocity += n * (j * inv_b);
}

void resolve_entity_static(PhysicsEntity& entity, const Contact& contact,
                           const ResolutionSettings& settings) noexcept {
    if (entity.is_kinematic) {
        return;
    }

    const Vec3& n = contact.normal;
    entity.position += n * contact.penetration;

    Vec3& v = entity.linear_velocity;
    const float vn = glm::dot(v, n);
    if (vn >= 0.0f) {
        return;
    }

    const float restitution = (-vn < settings.rest_velocity_threshold) ? 0.0f : entity.material.restitution;
    v -= n * ((1.0f + restitution) * vn);

    if (settings.precision == CollisionPrecision::Full) {
        const Vec3 tangent = v - n * glm::dot(v, n);
        v -= tangent * std::clamp(entity.material.friction, 0.0f, 1.0f);
    }
}

// =============================================================================
// CollisionDetector
// =============================================================================

namespace {

bool pair_less(const CollisionPair& x, const CollisionPair& y) {
    if (x.kind != y.kind) return x.kind < y.kind;
    if (x.a != y.a) return x.a < y.a;
    return x.b < y.b;
}

} // anonymous namespace

CollisionDetector::CollisionDetector(const PhysicsConfig& config)
    : m_config(config)
    , m_grid(config.grid_cell_size, config.grid_optimize_interval)
    , m_pair_pool(config.performance.pool_capacity, [](EntityPairs& v) { v.clear(); })
    , m_static_pair_pool(config.performance.pool_capacity, [](StaticPairs& v) { v.clear(); })
    , m_batcher(config.performance.batch_size) {
    m_resolution.rest_velocity_threshold = config.rest_velocity_threshold;
    m_resolution.precision = config.precision;
}

void CollisionDetector::set_config(const PhysicsConfig& config) {
    const bool margin_changed = config.collision_margin != m_config.collision_margin;
    const bool cells_changed = config.grid_cell_size != m_grid.cell_size();
    m_config = config;

    m_resolution.rest_velocity_threshold = config.rest_velocity_threshold;
    m_resolution.precision = config.precision;

    m_grid.set_optimize_interval(config.grid_optimize_interval);
    m_grid.set_cell_size(config.grid_cell_size);
    if (margin_changed) {
        for (const auto& [id, collider] : m_statics) {
            m_grid.update_static_collider(id, collider.world_bounds.expanded(config.collision_margin));
        }
    }
    if (margin_changed || cells_changed) {
        m_static_cache.clear();
    }

    m_batcher.set_batch_size(config.performance.batch_size);
    m_pair_pool.set_max_size(config.performance.pool_capacity);
    m_static_pair_pool.set_max_size(config.performance.pool_capacity);
}

// =============================================================================
// Static Colliders
// =============================================================================

arphys_core::Result<ColliderId> CollisionDetector::add_static_collider(const arphys_math::Mat4& transform,
                                                                       Geometry geometry) {
    auto valid = validate(geometry);
    if (valid.is_err()) {
        arphys_core::debug::record_error(valid.error());
        return arphys_core::Err<ColliderId>(valid.error());
    }

    const ColliderId id{m_next_collider_id++};
    StaticCollider collider;
    collider.id = id;
    collider.transform = transform;
    collider.geometry = std::move(geometry);
    collider.refresh();

    m_grid.add_static_collider(id, collider.world_bounds.expanded(m_config.collision_margin));
    m_statics.emplace(id, std::move(collider));
    invalidate_cache_for_collider(id);

    arphys_core::physics_logger()->debug("Static collider {} added ({})", id.value,
                                         to_string(geometry_kind(m_statics.at(id).geometry)));
    return id;
}

bool CollisionDetector::update_static_collider(ColliderId id, const arphys_math::Mat4& transform,
                                               std::optional<Geometry> geometry) {
    auto it = m_statics.find(id);
    if (it == m_statics.end()) {
        return false;
    }

    if (geometry) {
        auto valid = validate(*geometry);
        if (valid.is_err()) {
            arphys_core::debug::record_error(valid.error());
            arphys_core::physics_logger()->warn("Static collider {} update rejected: {}",
                                                id.value, valid.error().message());
            return false;
        }
    }

    // Entities near the old and the new footprint both lose their cache
    invalidate_cache_for_collider(id);

    StaticCollider& collider = it->second;
    collider.transform = transform;
    if (geometry) {
        collider.geometry = std::move(*geometry);
    }
    collider.refresh();
    m_grid.update_static_collider(id, collider.world_bounds.expanded(m_config.collision_margin));
    invalidate_cache_for_collider(id);

    arphys_core::physics_logger()->debug("Static collider {} updated", id.value);
    return true;
}

bool CollisionDetector::remove_static_collider(ColliderId id) {
    auto it = m_statics.find(id);
    if (it == m_statics.end()) {
        return false;
    }

    invalidate_cache_for_collider(id);
    m_grid.remove_static_collider(id);
    m_statics.erase(it);

    arphys_core::physics_logger()->debug("Static collider {} removed", id.value);
    return true;
}

const StaticCollider* CollisionDetector::static_collider(ColliderId id) const {
    auto it = m_statics.find(id);
    return it != m_statics.end() ? &it->second : nullptr;
}

// =============================================================================
// Entity Tracking
// =============================================================================

void CollisionDetector::track_entity(const PhysicsEntity& entity) {
    const bool moved = m_grid.update_entity(entity.id, entity.position,
                                            entity.bounding_radius + m_config.collision_margin);
    if (moved) {
        m_static_cache.erase(entity.id);
    }
}

void CollisionDetector::untrack_entity(EntityId id) {
    m_grid.remove_entity(id);
    m_static_cache.erase(id);
}

const std::vector<ColliderId>& CollisionDetector::static_candidates(EntityId id) {
    auto it = m_static_cache.find(id);
    if (it != m_static_cache.end()) {
        ++m_stats.static_cache_hits;
        return it->second;
    }
    ++m_stats.static_cache_misses;
    return m_static_cache[id] = m_grid.potential_static_collisions(id);
}

void CollisionDetector::invalidate_cache_for_cells(const std::vector<GridCell>& cells) {
    for (EntityId id : m_grid.entities_in_cells(cells)) {
        m_static_cache.erase(id);
    }
}

void CollisionDetector::invalidate_cache_for_collider(ColliderId id) {
    if (m_grid.is_oversized(id)) {
        m_static_cache.clear();
        return;
    }
    if (const auto* cells = m_grid.static_cells(id)) {
        invalidate_cache_for_cells(*cells);
    }
}

// =============================================================================
// Detection
// =============================================================================

const std::vector<Collision>& CollisionDetector::detect_collisions(EntityStore& entities) {
    const auto start = std::chrono::steady_clock::now();

    m_collisions.clear();
    m_stats.collision_checks = 0;
    m_stats.broad_phase_pairs = 0;
    m_stats.batches = 0;
    m_stats.static_cache_hits = 0;
    m_stats.static_cache_misses = 0;

    EntityPairs pairs = m_pair_pool.acquire();
    StaticPairs statics = m_static_pair_pool.acquire();

    gather_pairs(entities, pairs, statics);
    narrow_phase(entities, pairs, statics);
    resolve_all(entities);
    update_pair_events(entities);

    m_pair_pool.release(std::move(pairs));
    m_static_pair_pool.release(std::move(statics));

    m_stats.active_collisions = static_cast<std::uint32_t>(m_collisions.size());
    if (m_stats.collision_checks > m_config.max_collision_checks_warning) {
        if (m_warning_count++ % 300 == 0) {
            arphys_core::physics_logger()->warn("{} collision checks this step exceed the limit of {}",
                                                m_stats.collision_checks,
                                                m_config.max_collision_checks_warning);
        }
    }

    const auto elapsed = std::chrono::steady_clock::now() - start;
    m_stats.detect_time_ms = std::chrono::duration<float, std::milli>(elapsed).count();
    return m_collisions;
}

void CollisionDetector::gather_pairs(EntityStore& entities, EntityPairs& pairs, StaticPairs& statics) {
    // Grid first so every query below sees this step's positions
    entities.for_each([this](EntityId id, PhysicsEntity& entity) {
        if (entity.is_physics_enabled) {
            track_entity(entity);
        } else if (m_grid.contains_entity(id)) {
            untrack_entity(id);
        }
    });

    entities.for_each([&](EntityId id, PhysicsEntity& a) {
        if (!a.is_active || !a.is_physics_enabled || a.collision_group == groups::None) {
            return;
        }

        for (EntityId other : m_grid.potential_collisions(id)) {
            const PhysicsEntity* b = entities.get(other);
            if (b == nullptr || !b->is_physics_enabled) continue;
            if (!groups_collide(a.collision_group, b->collision_group)) continue;
            // Two awake entities: the lower id emits the pair
            if (b->is_active && other < id) continue;
            pairs.emplace_back(std::min(id, other), std::max(id, other));
        }

        for (ColliderId collider : static_candidates(id)) {
            statics.emplace_back(id, collider);
        }
    });

    m_stats.broad_phase_pairs = static_cast<std::uint32_t>(pairs.size() + statics.size());
}

void CollisionDetector::narrow_phase(EntityStore& entities, EntityPairs& pairs, StaticPairs& statics) {
    const float margin = m_config.collision_margin;

    m_stats.batches += static_cast<std::uint32_t>(m_batcher.process(
        std::span<std::pair<EntityId, EntityId>>(pairs), [&](auto batch) {
            for (const auto& [ia, ib] : batch) {
                ++m_stats.collision_checks;
                const PhysicsEntity* a = entities.get(ia);
                const PhysicsEntity* b = entities.get(ib);
                if (a == nullptr || b == nullptr) continue;

                auto contact = test_sphere_sphere(a->position, a->bounding_radius,
                                                  b->position, b->bounding_radius, margin);
                if (contact) {
                    m_collisions.push_back(Collision{CollisionKind::EntityEntity, ia, ib, ColliderId{}, *contact});
                }
            }
        }));

    m_stats.batches += static_cast<std::uint32_t>(m_batcher.process(
        std::span<std::pair<EntityId, ColliderId>>(statics), [&](auto batch) {
            for (const auto& [entity_id, collider_id] : batch) {
                ++m_stats.collision_checks;
                const PhysicsEntity* entity = entities.get(entity_id);
                const StaticCollider* collider = static_collider(collider_id);
                if (entity == nullptr || collider == nullptr) continue;

                auto contact = test_entity_static(*entity, *collider, margin);
                if (contact) {
                    m_collisions.push_back(Collision{CollisionKind::EntityStatic, entity_id, EntityId{},
                                                     collider_id, *contact});
                }
            }
        }));
}

void CollisionDetector::resolve_all(EntityStore& entities) {
    for (const Collision& collision : m_collisions) {
        PhysicsEntity* a = entities.get(collision.entity_a);
        if (a == nullptr) continue;

        if (collision.kind == CollisionKind::EntityEntity) {
            PhysicsEntity* b = entities.get(collision.entity_b);
            if (b != nullptr) {
                resolve_entity_entity(*a, *b, collision.contact, m_resolution);
            }
        } else {
            resolve_entity_static(*a, collision.contact, m_resolution);
        }
    }
}

bool CollisionDetector::is_dormant(const CollisionPair& pair, const EntityStore& entities) const {
    auto sleeping = [&entities](std::uint64_t bits) {
        const PhysicsEntity* e = entities.get(EntityId::from_bits(bits));
        return e != nullptr && e->is_physics_enabled && e->is_sleeping;
    };

    if (pair.kind == CollisionKind::EntityEntity) {
        return sleeping(pair.a) && sleeping(pair.b);
    }
    return sleeping(pair.a) && m_statics.count(ColliderId{pair.b}) > 0;
}

void CollisionDetector::update_pair_events(const EntityStore& entities) {
    std::unordered_set<CollisionPair> current;
    current.reserve(m_collisions.size());
    for (const Collision& collision : m_collisions) {
        current.insert(CollisionPair::from(collision));
    }

    std::vector<CollisionPair> ended;
    for (const CollisionPair& previous : m_active_pairs) {
        if (current.count(previous) > 0) continue;
        // Resting contacts of sleeping bodies are not re-tested but still touch
        if (is_dormant(previous, entities)) {
            current.insert(previous);
        } else {
            ended.push_back(previous);
        }
    }

    std::vector<CollisionPair> began;
    for (const CollisionPair& pair : current) {
        if (m_active_pairs.count(pair) == 0) {
            began.push_back(pair);
        }
    }

    m_active_pairs.swap(current);

    std::sort(began.begin(), began.end(), pair_less);
    std::sort(ended.begin(), ended.end(), pair_less);

    auto logger = arphys_core::physics_logger();
    for (const CollisionPair& pair : began) {
        ++m_stats.begin_events;
        logger->debug("Collision begin [{}] {} <-> {}", to_string(pair.kind), pair.a, pair.b);
        if (m_on_begin) m_on_begin(pair);
    }
    for (const CollisionPair& pair : ended) {
        ++m_stats.end_events;
        logger->debug("Collision end [{}] {} <-> {}", to_string(pair.kind), pair.a, pair.b);
        if (m_on_end) m_on_end(pair);
    }
}

bool CollisionDetector::is_colliding(EntityId a, EntityId b) const {
    return m_active_pairs.count(CollisionPair::entities(a, b)) > 0;
}

bool CollisionDetector::is_colliding(EntityId entity, ColliderId collider) const {
    return m_active_pairs.count(CollisionPair::with_static(entity, collider)) > 0;
}

// =============================================================================
// Maintenance
// =============================================================================

std::size_t CollisionDetector::trim_pools() {
    return m_pair_pool.trim() + m_static_pair_pool.trim();
}

std::size_t CollisionDetector::pooled_objects() const noexcept {
    return m_pair_pool.idle_count() + m_static_pair_pool.idle_count();
}

CollisionStats CollisionDetector::stats() const {
    CollisionStats s = m_stats;
    s.static_colliders = static_cast<std::uint32_t>(m_statics.size());
    s.grid = m_grid.stats();
    return s;
}

void CollisionDetector::clear() {
    m_grid.clear();
    m_statics.clear();
    m_static_cache.clear();
    m_collisions.clear();
    m_active_pairs.clear();
    m_pair_pool.clear();
    m_static_pair_pool.clear();
    m_stats = CollisionStats{};
}

} // namespace arphys_physics
