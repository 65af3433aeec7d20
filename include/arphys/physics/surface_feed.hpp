/// @file surface_feed.hpp
/// @brief Scanned-surface events turned into static colliders and snap targets

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "geometry.hpp"

#include <arphys/structures/command_queue.hpp>

#include <optional>
#include <string>
#include <unordered_map>

namespace arphys_physics {

enum class SurfaceEventKind : std::uint8_t {
    Added,
    Updated,
    Removed,
};

[[nodiscard]] const char* to_string(SurfaceEventKind kind);

/// One change reported by the AR session for an anchored surface
struct SurfaceEvent {
    SurfaceEventKind kind = SurfaceEventKind::Added;
    std::string anchor_id;
    arphys_math::Mat4 transform{1.0f};
    std::optional<Geometry> geometry;   ///< Required for Added, optional for Updated

    [[nodiscard]] static SurfaceEvent added(std::string anchor_id, const arphys_math::Mat4& transform,
                                            Geometry geometry);

    [[nodiscard]] static SurfaceEvent updated(std::string anchor_id, const arphys_math::Mat4& transform,
                                              std::optional<Geometry> geometry = std::nullopt);

    [[nodiscard]] static SurfaceEvent removed(std::string anchor_id);
};

/// What an anchor currently maps to
struct SurfaceBinding {
    ColliderId collider;
    std::optional<SnapTargetId> snap_target;
};

/// Queue of surface events applied at the step boundary.
///
/// Planes become a collider plus a floor or wall snap target chosen by
/// their world normal; downward-facing planes and meshes only collide.
class SurfaceFeed {
public:
    SurfaceFeed() = default;

    SurfaceFeed(const SurfaceFeed&) = delete;
    SurfaceFeed& operator=(const SurfaceFeed&) = delete;

    /// Thread-safe
    void enqueue(SurfaceEvent event);

    [[nodiscard]] std::size_t pending() const { return m_queue.size(); }

    /// Apply every queued event in order
    /// @return Number of events that changed the world
    std::size_t process(PhysicsWorld& world, SnapSystem& snap);

    [[nodiscard]] const SurfaceBinding* binding(const std::string& anchor_id) const;

    [[nodiscard]] std::size_t surface_count() const noexcept { return m_bindings.size(); }

    /// Snap target type for a plane placed by `transform`, if any
    [[nodiscard]] static std::optional<SnapTargetType> classify(const arphys_math::Mat4& transform,
                                                                const PlaneGeometry& plane) noexcept;

    /// Forget all bindings without touching the world
    void clear() { m_bindings.clear(); }

private:
    bool apply_added(PhysicsWorld& world, SnapSystem& snap, SurfaceEvent& event);
    bool apply_updated(PhysicsWorld& world, SnapSystem& snap, SurfaceEvent& event);
    bool apply_removed(PhysicsWorld& world, SnapSystem& snap, const SurfaceEvent& event);

    void sync_snap_target(SnapSystem& snap, SurfaceBinding& binding, const StaticCollider& collider);

    arphys_structures::CommandQueue<SurfaceEvent> m_queue;
    std::unordered_map<std::string, SurfaceBinding> m_bindings;
};

} // namespace arphys_physics
