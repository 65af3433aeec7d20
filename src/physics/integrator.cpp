/// @file integrator.cpp
/// @brief Integrator implementation

#include <arphys/physics/integrator.hpp>

namespace arphys_physics {

void Integrator::integrate(PhysicsEntity& entity, float dt, float max_velocity) noexcept {
    if (entity.is_kinematic) {
        return;
    }

    integrate_linear(entity, dt, max_velocity);
    integrate_angular(entity, dt);

    entity.force = arphys_math::vec3::ZERO;
    entity.torque = arphys_math::vec3::ZERO;
}

void Integrator::integrate_linear(PhysicsEntity& entity, float dt, float max_velocity) noexcept {
    const arphys_math::Vec3 acceleration = entity.force * entity.inverse_mass();

    entity.position += entity.linear_velocity * dt + acceleration * (0.5f * dt * dt);
    entity.linear_velocity += acceleration * dt;
    entity.linear_velocity = arphys_math::clamp_length(entity.linear_velocity, max_velocity);
}

void Integrator::integrate_angular(PhysicsEntity& entity, float dt) noexcept {
    const arphys_math::Vec3 alpha = entity.torque * entity.inverse_inertia();
    const arphys_math::Vec3 theta = entity.angular_velocity * dt + alpha * (0.5f * dt * dt);

    const float angle = arphys_math::length(theta);
    if (angle > arphys_math::consts::EPSILON) {
        const arphys_math::Quat delta = arphys_math::quat_from_axis_angle(theta / angle, angle);
        entity.orientation = arphys_math::normalize_or_identity(delta * entity.orientation);
    }

    entity.angular_velocity += alpha * dt;
}

} // namespace arphys_physics
