/// @file world.cpp
/// @brief PhysicsWorld implementation

#include <arphys/physics/world.hpp>

#include <arphys/core/log.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>

namespace arphys_physics {

using arphys_math::Vec3;

namespace {

/// Steps between summary log lines
constexpr std::uint64_t k_summary_interval = 300;

} // anonymous namespace

PhysicsWorld::PhysicsWorld(PhysicsConfig config)
    : m_config(std::move(config))
    , m_collision(m_config) {
    arphys_core::physics_logger()->info("Physics world created (quality {}, cell size {:.2f} m)",
                                        to_string(m_config.quality), m_config.grid_cell_size);
}

// =============================================================================
// Simulation
// =============================================================================

void PhysicsWorld::step(float dt) {
    const auto start = std::chrono::steady_clock::now();

    apply_pending_config();
    m_commands.drain([this](Command& command) { command(*this); });

    if (!(dt > 0.0f) || !std::isfinite(dt) || !m_config.simulation_enabled) {
        return;
    }

    apply_forces_and_integrate(dt);

    if (m_config.collision_detection_enabled) {
        m_collision.detect_collisions(m_entities);
    }

    std::vector<EntityId> fell_asleep;
    evaluate_sleep(dt, fell_asleep);
    push_transforms(fell_asleep);

    ++m_step_count;
    m_simulated_time += dt;
    m_collision.optimize(m_simulated_time);

    const auto elapsed = std::chrono::steady_clock::now() - start;
    m_last_step_ms = std::chrono::duration<float, std::milli>(elapsed).count();

    if (m_step_count % k_summary_interval == 0) {
        arphys_core::physics_logger()->info(
            "Step {}: {} entities ({} active, {} sleeping), {} contacts, {:.3f} ms",
            m_step_count, m_entities.size(), m_active.size(), m_sleeping.size(),
            m_collision.last_collisions().size(), m_last_step_ms);
    }
}

void PhysicsWorld::defer(Command command) {
    m_commands.push(std::move(command));
}

void PhysicsWorld::update_config(const PhysicsConfig& config) {
    m_pending_config = config;
}

void PhysicsWorld::apply_pending_config() {
    if (!m_pending_config) {
        return;
    }
    m_config = std::move(*m_pending_config);
    m_pending_config.reset();
    m_collision.set_config(m_config);
    arphys_core::physics_logger()->debug("Physics config applied (quality {})", to_string(m_config.quality));
}

void PhysicsWorld::apply_forces_and_integrate(float dt) {
    const bool gravity = m_config.gravity_enabled;

    for (EntityId id : m_active) {
        PhysicsEntity* entity = m_entities.get(id);
        if (entity == nullptr || entity->is_kinematic) {
            continue;
        }

        if (gravity) {
            entity->force += m_config.gravity * entity->mass;
        }

        Integrator::integrate(*entity, dt, m_config.max_velocity);

        entity->linear_velocity *= m_config.linear_damping;
        entity->angular_velocity *= m_config.angular_damping;
    }
}

void PhysicsWorld::evaluate_sleep(float dt, std::vector<EntityId>& fell_asleep) {
    const float threshold = m_config.sleep_threshold;

    for (EntityId id : m_active) {
        PhysicsEntity* entity = m_entities.get(id);
        if (entity == nullptr || entity->is_kinematic) {
            continue;
        }

        if (entity->linear_speed() < threshold && entity->angular_speed() < threshold) {
            entity->sleep_timer += dt;
            if (entity->sleep_timer >= m_config.time_to_sleep) {
                fell_asleep.push_back(id);
            }
        } else {
            entity->sleep_timer = 0.0f;
        }
    }

    // Sleepers pushed by an awake body this step wake up, the rest are held still
    std::vector<EntityId> woken;
    for (EntityId id : m_sleeping) {
        PhysicsEntity* entity = m_entities.get(id);
        if (entity == nullptr) {
            continue;
        }
        if (entity->linear_speed() > threshold || entity->angular_speed() > threshold) {
            woken.push_back(id);
        } else {
            entity->linear_velocity = arphys_math::vec3::ZERO;
            entity->angular_velocity = arphys_math::vec3::ZERO;
        }
    }

    for (EntityId id : fell_asleep) {
        sleep_entity(*m_entities.get(id));
    }
    for (EntityId id : woken) {
        wake_entity(*m_entities.get(id));
    }
}

void PhysicsWorld::push_transforms(const std::vector<EntityId>& fell_asleep) {
    auto push = [this](EntityId id) {
        const PhysicsEntity* entity = m_entities.get(id);
        if (entity != nullptr && entity->handle && !entity->is_kinematic) {
            entity->handle->set_world_transform(entity->position, entity->orientation);
        }
    };

    for (EntityId id : m_active) {
        push(id);
    }
    for (EntityId id : fell_asleep) {
        push(id);
    }
}

void PhysicsWorld::sleep_entity(PhysicsEntity& entity) {
    entity.is_sleeping = true;
    entity.is_active = false;
    entity.linear_velocity = arphys_math::vec3::ZERO;
    entity.angular_velocity = arphys_math::vec3::ZERO;
    entity.force = arphys_math::vec3::ZERO;
    entity.torque = arphys_math::vec3::ZERO;

    m_active.erase(entity.id);
    m_sleeping.insert(entity.id);

    arphys_core::physics_logger()->debug("Entity {} fell asleep", entity_label(entity.id));
}

void PhysicsWorld::wake_entity(PhysicsEntity& entity) {
    entity.is_sleeping = false;
    entity.is_active = entity.is_physics_enabled;
    entity.sleep_timer = 0.0f;

    m_sleeping.erase(entity.id);
    if (entity.is_active) {
        m_active.insert(entity.id);
    }

    arphys_core::physics_logger()->debug("Entity {} woke up", entity_label(entity.id));
}

// =============================================================================
// Entities
// =============================================================================

arphys_core::Result<EntityId> PhysicsWorld::add_entity(const EntityDesc& desc) {
    if (!desc.is_kinematic && !(desc.mass > 0.0f && std::isfinite(desc.mass))) {
        arphys_core::Error error(arphys_core::PhysicsError::invalid_mass(desc.mass));
        arphys_core::debug::record_error(error);
        arphys_core::physics_logger()->warn("Entity rejected: {}", error.message());
        return arphys_core::Err<EntityId>(std::move(error));
    }

    Geometry geometry = SphereGeometry{};
    if (desc.geometry) {
        geometry = *desc.geometry;
    } else if (desc.handle) {
        geometry = geometry_from_extents(desc.handle->visual_extents());
    }

    auto valid = validate(geometry);
    if (valid.is_err()) {
        arphys_core::debug::record_error(valid.error());
        arphys_core::physics_logger()->warn("Entity rejected: {}", valid.error().message());
        return arphys_core::Err<EntityId>(valid.error());
    }

    PhysicsEntity entity;
    entity.position = desc.position;
    entity.orientation = arphys_math::normalize_or_identity(desc.orientation);
    entity.linear_velocity = desc.linear_velocity;
    entity.angular_velocity = desc.angular_velocity;
    entity.mass = desc.is_kinematic ? std::max(desc.mass, 0.0f) : desc.mass;
    entity.moment_of_inertia = PhysicsEntity::inertia_for_mass(entity.mass);
    entity.material.friction = std::clamp(desc.friction.value_or(m_config.default_friction), 0.0f, 1.0f);
    entity.material.restitution = std::clamp(desc.restitution.value_or(m_config.default_restitution), 0.0f, 1.0f);
    entity.material.density = desc.density;
    entity.bounding_radius = bounding_radius(geometry);
    entity.geometry = std::move(geometry);
    entity.collision_group = desc.collision_group;
    entity.is_kinematic = desc.is_kinematic;
    entity.can_snap = desc.can_snap;
    entity.casts_shadows = desc.casts_shadows;
    entity.handle = desc.handle;

    const EntityId id = m_entities.insert(std::move(entity));
    PhysicsEntity& stored = *m_entities.get(id);
    stored.id = id;

    m_active.insert(id);
    m_collision.track_entity(stored);

    arphys_core::physics_logger()->debug("Entity {} added ({}, mass {:.2f}, radius {:.3f}{})",
                                         entity_label(id), to_string(geometry_kind(stored.geometry)),
                                         stored.mass, stored.bounding_radius,
                                         stored.is_kinematic ? ", kinematic" : "");
    return id;
}

bool PhysicsWorld::remove_entity(EntityId id) {
    if (!m_entities.contains(id)) {
        return false;
    }

    m_active.erase(id);
    m_sleeping.erase(id);
    m_collision.untrack_entity(id);
    m_entities.erase(id);

    arphys_core::physics_logger()->debug("Entity {} removed", entity_label(id));
    return true;
}

// =============================================================================
// Motion Control
// =============================================================================

bool PhysicsWorld::set_physics_enabled(EntityId id, bool enabled) {
    PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr) {
        return false;
    }
    if (entity->is_physics_enabled == enabled) {
        return true;
    }

    entity->is_physics_enabled = enabled;
    if (enabled) {
        entity->is_active = true;
        entity->is_sleeping = false;
        entity->sleep_timer = 0.0f;
        m_active.insert(id);
        m_collision.track_entity(*entity);
    } else {
        entity->is_active = false;
        entity->is_sleeping = false;
        m_active.erase(id);
        m_sleeping.erase(id);
        m_collision.untrack_entity(id);
    }
    return true;
}

bool PhysicsWorld::set_kinematic_transform(EntityId id, const Vec3& position,
                                           const arphys_math::Quat& orientation) {
    PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr) {
        return false;
    }

    entity->position = position;
    entity->orientation = arphys_math::normalize_or_identity(orientation);
    if (entity->is_sleeping) {
        wake_entity(*entity);
    }
    return true;
}

bool PhysicsWorld::set_velocity(EntityId id, const Vec3& velocity) {
    PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr) {
        return false;
    }

    entity->linear_velocity = velocity;
    if (entity->is_sleeping && arphys_math::length(velocity) > m_config.sleep_threshold) {
        wake_entity(*entity);
    }
    return true;
}

bool PhysicsWorld::set_angular_velocity(EntityId id, const Vec3& angular_velocity) {
    PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr) {
        return false;
    }

    entity->angular_velocity = angular_velocity;
    if (entity->is_sleeping && arphys_math::length(angular_velocity) > m_config.sleep_threshold) {
        wake_entity(*entity);
    }
    return true;
}

bool PhysicsWorld::set_collision_group(EntityId id, CollisionGroup group) {
    PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr) {
        return false;
    }
    entity->collision_group = group;
    return true;
}

bool PhysicsWorld::apply_force(EntityId id, const Vec3& force, std::optional<Vec3> point) {
    PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr || entity->is_kinematic) {
        return false;
    }

    if (entity->is_sleeping) {
        wake_entity(*entity);
    }
    entity->force += force;
    if (point) {
        entity->torque += glm::cross(*point - entity->position, force);
    }
    return true;
}

bool PhysicsWorld::apply_impulse(EntityId id, const Vec3& impulse, std::optional<Vec3> point) {
    PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr || entity->is_kinematic) {
        return false;
    }

    if (entity->is_sleeping) {
        wake_entity(*entity);
    }
    entity->linear_velocity += impulse * entity->inverse_mass();
    if (point) {
        entity->angular_velocity += glm::cross(*point - entity->position, impulse) * entity->inverse_inertia();
    }
    return true;
}

bool PhysicsWorld::apply_torque(EntityId id, const Vec3& torque) {
    PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr || entity->is_kinematic) {
        return false;
    }

    if (entity->is_sleeping) {
        wake_entity(*entity);
    }
    entity->torque += torque;
    return true;
}

bool PhysicsWorld::wake(EntityId id) {
    PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr) {
        return false;
    }
    if (entity->is_sleeping) {
        wake_entity(*entity);
    }
    return true;
}

bool PhysicsWorld::put_to_sleep(EntityId id) {
    PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr || entity->is_kinematic || !entity->is_physics_enabled) {
        return false;
    }
    if (!entity->is_sleeping) {
        sleep_entity(*entity);
    }
    return true;
}

bool PhysicsWorld::sync_handle(EntityId id) {
    const PhysicsEntity* entity = m_entities.get(id);
    if (entity == nullptr || !entity->handle) {
        return false;
    }
    entity->handle->set_world_transform(entity->position, entity->orientation);
    return true;
}

// =============================================================================
// Static Colliders
// =============================================================================

bool PhysicsWorld::update_static_collider(ColliderId id, const arphys_math::Mat4& transform,
                                          std::optional<Geometry> geometry) {
    std::vector<EntityId> nearby = m_collision.entities_near_collider(id);
    if (!m_collision.update_static_collider(id, transform, std::move(geometry))) {
        return false;
    }
    const std::vector<EntityId> after = m_collision.entities_near_collider(id);
    nearby.insert(nearby.end(), after.begin(), after.end());
    wake_sleepers(nearby);
    return true;
}

bool PhysicsWorld::remove_static_collider(ColliderId id) {
    const std::vector<EntityId> nearby = m_collision.entities_near_collider(id);
    if (!m_collision.remove_static_collider(id)) {
        return false;
    }
    wake_sleepers(nearby);
    return true;
}

void PhysicsWorld::wake_sleepers(const std::vector<EntityId>& ids) {
    for (EntityId id : ids) {
        PhysicsEntity* entity = m_entities.get(id);
        if (entity != nullptr && entity->is_sleeping) {
            wake_entity(*entity);
        }
    }
}

// =============================================================================
// Statistics
// =============================================================================

WorldStats PhysicsWorld::stats() const {
    WorldStats s;
    s.total_entities = static_cast<std::uint32_t>(m_entities.size());
    s.active_entities = static_cast<std::uint32_t>(m_active.size());
    s.sleeping_entities = static_cast<std::uint32_t>(m_sleeping.size());
    m_entities.for_each([&s](EntityId, const PhysicsEntity& entity) {
        if (entity.is_kinematic) ++s.kinematic_entities;
    });
    s.step_count = m_step_count;
    s.simulated_time = m_simulated_time;
    s.step_time_ms = m_last_step_ms;
    return s;
}

void PhysicsWorld::clear() {
    m_entities.clear();
    m_active.clear();
    m_sleeping.clear();
    m_collision.clear();
    arphys_core::physics_logger()->debug("Physics world cleared");
}

} // namespace arphys_physics
