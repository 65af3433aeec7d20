/// @file entity.cpp
/// @brief Entity descriptors and static collider helpers for arphys_physics

#include <arphys/physics/entity.hpp>

namespace arphys_physics {

std::string entity_label(EntityId id) {
    return std::to_string(id.index) + "v" + std::to_string(id.generation);
}

// =============================================================================
// EntityDesc
// =============================================================================

EntityDesc EntityDesc::make_dynamic(const arphys_math::Vec3& pos, float mass, Geometry geometry) {
    EntityDesc desc;
    desc.position = pos;
    desc.mass = mass;
    desc.geometry = std::move(geometry);
    return desc;
}

EntityDesc EntityDesc::make_kinematic(const arphys_math::Vec3& pos, Geometry geometry) {
    EntityDesc desc;
    desc.position = pos;
    desc.mass = 0.0f;
    desc.geometry = std::move(geometry);
    desc.is_kinematic = true;
    return desc;
}

EntityDesc EntityDesc::from_handle(std::shared_ptr<IEntityHandle> handle, float mass) {
    EntityDesc desc;
    desc.mass = mass;
    desc.handle = std::move(handle);
    return desc;
}

// =============================================================================
// StaticCollider
// =============================================================================

void StaticCollider::refresh() noexcept {
    inverse_transform = arphys_math::inverse(transform);
    world_bounds = local_bounds(geometry).transform(transform);
}

arphys_math::Plane StaticCollider::world_plane() const noexcept {
    const auto* plane = std::get_if<PlaneGeometry>(&geometry);
    if (plane == nullptr) {
        return arphys_math::Plane{};
    }
    const arphys_math::Vec3 n = arphys_math::transform_normal(transform, plane->normal);
    const arphys_math::Vec3 origin = arphys_math::transform_point(
        transform, arphys_math::normalize_or_zero(plane->normal) * plane->distance);
    return arphys_math::Plane::from_point_normal(origin, n);
}

} // namespace arphys_physics
