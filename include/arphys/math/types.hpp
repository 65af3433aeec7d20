#pragma once

/// @file types.hpp
/// @brief GLM configuration and basis constants for arphys_math

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/norm.hpp>
#include <glm/gtx/quaternion.hpp>

#include "fwd.hpp"
#include "constants.hpp"

namespace arphys_math {

// =============================================================================
// Vector Constants
// =============================================================================

namespace vec3 {
    inline constexpr Vec3 ZERO  = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 ONE   = Vec3(1.0f, 1.0f, 1.0f);
    inline constexpr Vec3 X     = Vec3(1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 Y     = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 Z     = Vec3(0.0f, 0.0f, 1.0f);

    // World basis used by tracking: +Y up, -Z forward
    inline constexpr Vec3 UP      = Y;
    inline constexpr Vec3 DOWN    = Vec3(0.0f, -1.0f, 0.0f);
    inline constexpr Vec3 FORWARD = Vec3(0.0f, 0.0f, -1.0f);
}

// =============================================================================
// Matrix / Quaternion Constants
// =============================================================================

namespace mat4 {
    inline const Mat4 IDENTITY = Mat4(1.0f);
}

namespace quat {
    inline const Quat IDENTITY = Quat(1.0f, 0.0f, 0.0f, 0.0f); // w, x, y, z
}

} // namespace arphys_math
