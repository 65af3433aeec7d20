/// @file snap.cpp
/// @brief SnapSystem implementation

#include <arphys/physics/snap.hpp>
#include <arphys/physics/world.hpp>

#include <arphys/core/log.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace arphys_physics {

using arphys_math::Vec3;
using arphys_math::Quat;

namespace {

/// Alignment reported for point-like targets, which have no preferred axis
constexpr float k_neutral_alignment = 0.5f;

} // anonymous namespace

// =============================================================================
// Target Evaluation
// =============================================================================

bool snap_type_accepts(SnapType type, SnapTargetType target) noexcept {
    switch (type) {
        case SnapType::Floor: return target == SnapTargetType::Floor;
        case SnapType::Wall: return target == SnapTargetType::Wall;
        case SnapType::Surface: return target == SnapTargetType::Floor || target == SnapTargetType::Wall;
        case SnapType::Automatic: return true;
    }
    return false;
}

std::optional<SnapCandidate> evaluate_snap_target(const PhysicsEntity& entity, const SnapTarget& target) {
    const Vec3& p = entity.position;
    const float r = entity.bounding_radius;
    const Vec3 tp = target.position();

    SnapCandidate candidate;
    candidate.target = target.id;
    candidate.type = target.type;

    // Point on the target surface the entity will rest against
    Vec3 surface_point = tp;

    switch (target.type) {
        case SnapTargetType::Floor: {
            const Vec3 n = target.world_normal();
            candidate.point = Vec3(p.x, tp.y + r, p.z);
            candidate.distance = std::abs((p.y - r) - tp.y);
            candidate.alignment = std::abs(glm::dot(arphys_math::up_of(entity.orientation), n));
            surface_point = Vec3(p.x, tp.y, p.z);
            break;
        }
        case SnapTargetType::Wall: {
            const Vec3 n = target.world_normal();
            const float offset = glm::dot(p - tp, n) - r;
            candidate.point = p - n * offset;
            candidate.distance = std::abs(offset);
            candidate.alignment = std::abs(glm::dot(arphys_math::forward_of(entity.orientation), n));
            surface_point = candidate.point - n * r;
            break;
        }
        case SnapTargetType::Corner:
            candidate.point = tp;
            candidate.distance = arphys_math::distance(p, tp);
            candidate.alignment = k_neutral_alignment;
            break;
        case SnapTargetType::Edge:
            candidate.point = arphys_math::closest_point_on_segment(p, tp, tp + target.world_edge());
            candidate.distance = arphys_math::distance(p, candidate.point);
            candidate.alignment = k_neutral_alignment;
            surface_point = candidate.point;
            break;
    }

    if (target.is_bounded() && !target.world_bounds().expanded(r).contains_point(surface_point)) {
        return std::nullopt;
    }

    candidate.score = candidate.distance * 2.0f + (1.0f - candidate.alignment);
    return candidate;
}

Quat snap_orientation(const SnapTarget& target, const Quat& current) noexcept {
    switch (target.type) {
        case SnapTargetType::Floor:
            return arphys_math::quat::IDENTITY;
        case SnapTargetType::Wall: {
            // Face away from the wall: body forward (-Z) along the normal
            const Vec3 n = target.world_normal();
            const Vec3 z = -n;
            const Vec3 x = arphys_math::normalize_or_zero(glm::cross(arphys_math::vec3::UP, z));
            if (arphys_math::length_squared(x) < arphys_math::consts::EPSILON) {
                return current;
            }
            const Vec3 y = glm::cross(z, x);
            return arphys_math::normalize_or_identity(arphys_math::quat_from_basis(x, y, z));
        }
        case SnapTargetType::Corner:
        case SnapTargetType::Edge:
            break;
    }
    return current;
}

// =============================================================================
// SnapSystem
// =============================================================================

SnapSystem::SnapSystem(const PhysicsConfig& config)
    : m_config(config) {}

SnapTargetId SnapSystem::add_snap_target(const SnapTargetDesc& desc) {
    const SnapTargetId id{m_next_target_id++};

    SnapTarget target;
    target.id = id;
    target.transform = desc.transform;
    target.type = desc.type;
    target.normal = desc.normal;
    target.bounds = desc.bounds;
    m_targets.emplace(id, target);

    arphys_core::physics_logger()->debug("Snap target {} added ({})", id.value, to_string(desc.type));
    return id;
}

bool SnapSystem::update_snap_target(SnapTargetId id, const arphys_math::Mat4& transform,
                                    std::optional<arphys_math::AABB> bounds) {
    auto it = m_targets.find(id);
    if (it == m_targets.end()) {
        return false;
    }
    it->second.transform = transform;
    if (bounds) {
        it->second.bounds = *bounds;
    }
    return true;
}

bool SnapSystem::remove_snap_target(SnapTargetId id) {
    if (m_targets.erase(id) == 0) {
        return false;
    }
    arphys_core::physics_logger()->debug("Snap target {} removed", id.value);
    return true;
}

const SnapTarget* SnapSystem::snap_target(SnapTargetId id) const {
    auto it = m_targets.find(id);
    return it != m_targets.end() ? &it->second : nullptr;
}

void SnapSystem::register_entity(EntityId id) {
    m_registered.insert(id);
}

bool SnapSystem::unregister_entity(EntityId id) {
    m_states.erase(id);
    m_operations.erase(id);
    return m_registered.erase(id) > 0;
}

bool SnapSystem::target_enabled(SnapTargetType type) const noexcept {
    switch (type) {
        case SnapTargetType::Floor: return m_config.snap_to_floor_enabled;
        case SnapTargetType::Wall: return m_config.snap_to_wall_enabled;
        case SnapTargetType::Corner:
        case SnapTargetType::Edge:
            return m_config.snap_to_floor_enabled || m_config.snap_to_wall_enabled;
    }
    return false;
}

std::optional<SnapCandidate> SnapSystem::find_best_target(const PhysicsEntity& entity, SnapType type,
                                                          float max_distance) const {
    std::optional<SnapCandidate> best;
    for (const auto& [id, target] : m_targets) {
        if (!snap_type_accepts(type, target.type) || !target_enabled(target.type)) {
            continue;
        }

        auto candidate = evaluate_snap_target(entity, target);
        if (!candidate || candidate->distance > max_distance) {
            continue;
        }
        if (!best || candidate->score < best->score) {
            best = candidate;
        }
    }
    return best;
}

SnapResult SnapSystem::snap_to_surface(PhysicsWorld& world, EntityId id, SnapType type) {
    ++m_stats.snap_operations;

    PhysicsEntity* entity = world.entity(id);
    if (entity == nullptr || !entity->can_snap || entity->is_kinematic || !entity->is_physics_enabled) {
        return SnapResult{};
    }

    register_entity(id);

    auto candidate = find_best_target(*entity, type, m_config.snap_search_radius);
    if (!candidate) {
        arphys_core::physics_logger()->debug("No {} snap target near entity {}", to_string(type), entity_label(id));
        return SnapResult{};
    }

    begin_snap(world, *entity, *candidate);
    ++m_stats.successful_snaps;
    return SnapResult{true, candidate->type, candidate->point, candidate->target};
}

void SnapSystem::begin_snap(PhysicsWorld& world, PhysicsEntity& entity, const SnapCandidate& candidate) {
    const SnapTarget& target = m_targets.at(candidate.target);

    Quat orientation = snap_orientation(target, entity.orientation);
    const float tolerance = m_config.snap_angle_tolerance * arphys_math::consts::DEG_TO_RAD;
    if (arphys_math::angle_between(orientation, entity.orientation) <= tolerance) {
        orientation = entity.orientation;
    }

    SnapOperation op;
    op.entity = entity.id;
    op.target = candidate.target;
    op.start_position = entity.position;
    op.target_position = candidate.point;
    op.start_orientation = entity.orientation;
    op.target_orientation = orientation;
    op.duration = m_config.snap_duration;
    m_operations[entity.id] = op;

    SnapState& state = m_states[entity.id];
    state = SnapState{};
    state.target = candidate.target;
    state.target_type = candidate.type;
    state.snap_point = candidate.point;

    world.wake(entity.id);

    arphys_core::physics_logger()->debug("Entity {} snapping to {} target {} (distance {:.3f}, score {:.3f})",
                                         entity_label(entity.id), to_string(candidate.type),
                                         candidate.target.value, candidate.distance, candidate.score);
}

bool SnapSystem::unsnap(EntityId id) {
    const bool had_op = m_operations.erase(id) > 0;
    const bool had_state = m_states.erase(id) > 0;
    return had_op || had_state;
}

// =============================================================================
// Update
// =============================================================================

void SnapSystem::update(PhysicsWorld& world, float dt) {
    if (dt > 0.0f) {
        m_time += dt;
    }

    advance_operations(world, dt > 0.0f ? dt : 0.0f);
    maintain_snaps(world);
    try_auto_snap(world);
}

void SnapSystem::advance_operations(PhysicsWorld& world, float dt) {
    std::vector<EntityId> finished;
    std::vector<EntityId> cancelled;

    for (auto& [id, op] : m_operations) {
        PhysicsEntity* entity = world.entity(id);
        if (entity == nullptr || m_targets.count(op.target) == 0) {
            cancelled.push_back(id);
            continue;
        }

        op.elapsed += dt;
        const float s = arphys_math::smoothstep(op.progress());

        if (op.is_complete()) {
            entity->position = op.target_position;
            entity->orientation = op.target_orientation;
            entity->linear_velocity = arphys_math::vec3::ZERO;
            entity->angular_velocity = arphys_math::vec3::ZERO;
            finished.push_back(id);
        } else {
            entity->position = arphys_math::lerp(op.start_position, op.target_position, s);
            entity->orientation = arphys_math::normalize_or_identity(
                arphys_math::slerp(op.start_orientation, op.target_orientation, s));
            entity->linear_velocity *= 1.0f - 0.5f * s;
            entity->angular_velocity *= 1.0f - 0.5f * s;
        }
        world.sync_handle(id);
    }

    for (EntityId id : cancelled) {
        m_operations.erase(id);
        m_states.erase(id);
        arphys_core::physics_logger()->debug("Snap of entity {} cancelled", entity_label(id));
    }

    for (EntityId id : finished) {
        m_operations.erase(id);
        SnapState& state = m_states[id];
        state.is_snapped = true;
        state.snap_time = m_time;
        arphys_core::physics_logger()->debug("Entity {} snapped to target {}", entity_label(id), state.target.value);
    }
}

void SnapSystem::maintain_snaps(PhysicsWorld& world) {
    std::vector<std::pair<EntityId, const char*>> broken;

    for (const auto& [id, state] : m_states) {
        if (!state.is_snapped || m_operations.count(id) > 0) {
            continue;
        }

        const PhysicsEntity* entity = world.entity(id);
        if (entity == nullptr) {
            broken.emplace_back(id, "entity removed");
            continue;
        }
        if (m_targets.count(state.target) == 0) {
            broken.emplace_back(id, "target removed");
            continue;
        }

        const Vec3 offset = state.snap_point - entity->position;
        const float drift = arphys_math::length(offset);
        if (drift > 2.0f * m_config.snap_distance) {
            broken.emplace_back(id, "drifted away");
        } else if (drift > m_config.snap_hold_tolerance) {
            world.apply_force(id, offset * m_config.snap_spring_constant);
        }
    }

    for (const auto& [id, reason] : broken) {
        break_snap(id, reason);
    }
}

void SnapSystem::try_auto_snap(PhysicsWorld& world) {
    if (!m_config.auto_snap_enabled) {
        return;
    }

    std::vector<EntityId> stale;
    for (EntityId id : m_registered) {
        if (m_operations.count(id) > 0) {
            continue;
        }
        auto it = m_states.find(id);
        if (it != m_states.end() && it->second.is_snapped) {
            continue;
        }

        PhysicsEntity* entity = world.entity(id);
        if (entity == nullptr) {
            stale.push_back(id);
            continue;
        }
        if (!entity->can_snap || !entity->is_physics_enabled || entity->is_kinematic || entity->is_sleeping) {
            continue;
        }
        if (entity->linear_speed() > m_config.snap_auto_max_speed) {
            continue;
        }

        auto candidate = find_best_target(*entity, SnapType::Automatic, m_config.snap_distance);
        if (candidate) {
            ++m_stats.snap_operations;
            ++m_stats.successful_snaps;
            begin_snap(world, *entity, *candidate);
        }
    }

    for (EntityId id : stale) {
        unregister_entity(id);
    }
}

void SnapSystem::break_snap(EntityId id, const char* reason) {
    m_states.erase(id);
    ++m_stats.broken_snaps;
    arphys_core::physics_logger()->debug("Snap of entity {} broken: {}", entity_label(id), reason);
}

// =============================================================================
// Queries
// =============================================================================

const SnapState* SnapSystem::state(EntityId id) const {
    auto it = m_states.find(id);
    return it != m_states.end() ? &it->second : nullptr;
}

bool SnapSystem::is_snapped(EntityId id) const {
    const SnapState* s = state(id);
    return s != nullptr && s->is_snapped;
}

const SnapOperation* SnapSystem::operation(EntityId id) const {
    auto it = m_operations.find(id);
    return it != m_operations.end() ? &it->second : nullptr;
}

SnapStats SnapSystem::stats() const {
    SnapStats s = m_stats;
    s.active_operations = static_cast<std::uint32_t>(m_operations.size());
    s.snap_targets = static_cast<std::uint32_t>(m_targets.size());
    for (const auto& [id, state] : m_states) {
        if (state.is_snapped) ++s.active_snaps;
    }
    return s;
}

void SnapSystem::clear() {
    m_targets.clear();
    m_registered.clear();
    m_states.clear();
    m_operations.clear();
    m_stats = SnapStats{};
}

} // namespace arphys_physics
