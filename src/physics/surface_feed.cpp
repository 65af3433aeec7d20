/// @file surface_feed.cpp
/// @brief SurfaceFeed implementation

#include <arphys/physics/surface_feed.hpp>
#include <arphys/physics/world.hpp>
#include <arphys/physics/snap.hpp>

#include <arphys/core/log.hpp>

namespace arphys_physics {

using arphys_math::Vec3;

namespace {

/// |normal.y| above this counts as horizontal
constexpr float k_horizontal_threshold = 0.8f;

} // anonymous namespace

const char* to_string(SurfaceEventKind kind) {
    switch (kind) {
        case SurfaceEventKind::Added: return "Added";
        case SurfaceEventKind::Updated: return "Updated";
        case SurfaceEventKind::Removed: return "Removed";
    }
    return "Unknown";
}

// =============================================================================
// SurfaceEvent
// =============================================================================

SurfaceEvent SurfaceEvent::added(std::string anchor_id, const arphys_math::Mat4& transform, Geometry geometry) {
    return SurfaceEvent{SurfaceEventKind::Added, std::move(anchor_id), transform, std::move(geometry)};
}

SurfaceEvent SurfaceEvent::updated(std::string anchor_id, const arphys_math::Mat4& transform,
                                   std::optional<Geometry> geometry) {
    return SurfaceEvent{SurfaceEventKind::Updated, std::move(anchor_id), transform, std::move(geometry)};
}

SurfaceEvent SurfaceEvent::removed(std::string anchor_id) {
    return SurfaceEvent{SurfaceEventKind::Removed, std::move(anchor_id), arphys_math::Mat4(1.0f), std::nullopt};
}

// =============================================================================
// SurfaceFeed
// =============================================================================

void SurfaceFeed::enqueue(SurfaceEvent event) {
    m_queue.push(std::move(event));
}

std::size_t SurfaceFeed::process(PhysicsWorld& world, SnapSystem& snap) {
    std::size_t applied = 0;
    m_queue.drain([&](SurfaceEvent& event) {
        bool changed = false;
        switch (event.kind) {
            case SurfaceEventKind::Added: changed = apply_added(world, snap, event); break;
            case SurfaceEventKind::Updated: changed = apply_updated(world, snap, event); break;
            case SurfaceEventKind::Removed: changed = apply_removed(world, snap, event); break;
        }
        if (changed) ++applied;
    });
    return applied;
}

const SurfaceBinding* SurfaceFeed::binding(const std::string& anchor_id) const {
    auto it = m_bindings.find(anchor_id);
    return it != m_bindings.end() ? &it->second : nullptr;
}

std::optional<SnapTargetType> SurfaceFeed::classify(const arphys_math::Mat4& transform,
                                                    const PlaneGeometry& plane) noexcept {
    const Vec3 n = arphys_math::transform_normal(transform, plane.normal);
    if (n.y > k_horizontal_threshold) {
        return SnapTargetType::Floor;
    }
    if (n.y < -k_horizontal_threshold) {
        return std::nullopt;    // Ceiling
    }
    return SnapTargetType::Wall;
}

bool SurfaceFeed::apply_added(PhysicsWorld& world, SnapSystem& snap, SurfaceEvent& event) {
    if (m_bindings.count(event.anchor_id) > 0) {
        // Re-announced anchor
        return apply_updated(world, snap, event);
    }

    if (!event.geometry) {
        arphys_core::physics_logger()->warn("Surface {} added without geometry, ignored", event.anchor_id);
        return false;
    }

    auto collider_id = world.add_static_collider(event.transform, std::move(*event.geometry));
    if (collider_id.is_err()) {
        arphys_core::physics_logger()->warn("Surface {} rejected: {}", event.anchor_id,
                                            collider_id.error().message());
        return false;
    }

    SurfaceBinding binding;
    binding.collider = collider_id.value();
    sync_snap_target(snap, binding, *world.static_collider(binding.collider));
    m_bindings.emplace(event.anchor_id, binding);

    arphys_core::physics_logger()->debug("Surface {} -> collider {}{}", event.anchor_id, binding.collider.value,
                                         binding.snap_target ? " with snap target" : "");
    return true;
}

bool SurfaceFeed::apply_updated(PhysicsWorld& world, SnapSystem& snap, SurfaceEvent& event) {
    auto it = m_bindings.find(event.anchor_id);
    if (it == m_bindings.end()) {
        arphys_core::physics_logger()->debug("Update for unknown surface {} ignored", event.anchor_id);
        return false;
    }

    SurfaceBinding& binding = it->second;
    if (!world.update_static_collider(binding.collider, event.transform, std::move(event.geometry))) {
        return false;
    }

    sync_snap_target(snap, binding, *world.static_collider(binding.collider));
    return true;
}

bool SurfaceFeed::apply_removed(PhysicsWorld& world, SnapSystem& snap, const SurfaceEvent& event) {
    auto it = m_bindings.find(event.anchor_id);
    if (it == m_bindings.end()) {
        arphys_core::physics_logger()->debug("Removal of unknown surface {} ignored", event.anchor_id);
        return false;
    }

    world.remove_static_collider(it->second.collider);
    if (it->second.snap_target) {
        snap.remove_snap_target(*it->second.snap_target);
    }
    m_bindings.erase(it);

    arphys_core::physics_logger()->debug("Surface {} removed", event.anchor_id);
    return true;
}

void SurfaceFeed::sync_snap_target(SnapSystem& snap, SurfaceBinding& binding, const StaticCollider& collider) {
    const auto* plane = std::get_if<PlaneGeometry>(&collider.geometry);
    const std::optional<SnapTargetType> type = plane ? classify(collider.transform, *plane) : std::nullopt;

    if (!type) {
        if (binding.snap_target) {
            snap.remove_snap_target(*binding.snap_target);
            binding.snap_target.reset();
        }
        return;
    }

    // Targets sit at the patch center with bounds relative to it
    const Vec3 center = arphys_math::normalize_or_zero(plane->normal) * plane->distance;
    const arphys_math::Mat4 transform = collider.transform * arphys_math::translation(center);
    const arphys_math::AABB patch = local_bounds(collider.geometry);
    const arphys_math::AABB bounds(patch.min - center, patch.max - center);

    if (binding.snap_target) {
        const SnapTarget* existing = snap.snap_target(*binding.snap_target);
        if (existing != nullptr && existing->type == *type) {
            snap.update_snap_target(*binding.snap_target, transform, bounds);
            return;
        }
        snap.remove_snap_target(*binding.snap_target);
    }

    SnapTargetDesc desc;
    desc.transform = transform;
    desc.type = *type;
    desc.normal = plane->normal;
    desc.bounds = bounds;
    binding.snap_target = snap.add_snap_target(desc);
}

} // namespace arphys_physics
