/// @file integrator.hpp
/// @brief Semi-implicit motion integration

#pragma once

#include "fwd.hpp"
#include "entity.hpp"

namespace arphys_physics {

/// Velocity-Verlet style integration of accumulated force and torque.
///
/// Linear:  p += v dt + a dt^2 / 2, v += a dt, |v| clamped to max_velocity
/// Angular: theta = w dt + alpha dt^2 / 2 applied as a left-multiplied
///          axis-angle rotation, w += alpha dt
///
/// Forces and torques are cleared afterwards. Kinematic entities are
/// driven externally and skipped entirely.
class Integrator {
public:
    static void integrate(PhysicsEntity& entity, float dt, float max_velocity) noexcept;

    static void integrate_linear(PhysicsEntity& entity, float dt, float max_velocity) noexcept;

    static void integrate_angular(PhysicsEntity& entity, float dt) noexcept;
};

} // namespace arphys_physics
