#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arphys_math types

#include <glm/fwd.hpp>

namespace arphys_math {

// =============================================================================
// GLM aliases
// =============================================================================
using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;
using IVec3 = glm::ivec3;

using Mat3 = glm::mat3;
using Mat4 = glm::mat4;

using Quat = glm::quat;

// =============================================================================
// arphys_math types
// =============================================================================
struct AABB;
struct Sphere;
struct Plane;
struct FrustumPlanes;

enum class FrustumTestResult;

} // namespace arphys_math
