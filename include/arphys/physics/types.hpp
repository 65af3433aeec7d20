/// @file types.hpp
/// @brief Core types for arphys_physics

#pragma once

#include "fwd.hpp"

#include <arphys/math/bounds.hpp>
#include <arphys/math/mat.hpp>
#include <arphys/math/quat.hpp>
#include <arphys/math/vec.hpp>
#include <arphys/structures/slot_map.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

namespace arphys_physics {

// =============================================================================
// Enumerations
// =============================================================================

/// Which kind of object the second half of a contact is
enum class CollisionKind : std::uint8_t {
    EntityEntity,   ///< Two simulated entities
    EntityStatic,   ///< Entity against a scanned static collider
};

[[nodiscard]] const char* to_string(CollisionKind kind);

/// Requested snap behaviour, filters which target types are candidates
enum class SnapType : std::uint8_t {
    Floor,          ///< Floor targets only
    Wall,           ///< Wall targets only
    Surface,        ///< Floor or wall
    Automatic,      ///< Any target type
};

[[nodiscard]] const char* to_string(SnapType type);

enum class SnapTargetType : std::uint8_t {
    Floor,
    Wall,
    Corner,
    Edge,
};

[[nodiscard]] const char* to_string(SnapTargetType type);

/// Discrete quality preset chosen by the host application
enum class QualityTier : std::uint8_t {
    Low,
    Medium,
    High,
    Ultra,
};

[[nodiscard]] const char* to_string(QualityTier tier);

/// Narrow-phase fidelity. Reduced skips the friction impulse against static geometry.
enum class CollisionPrecision : std::uint8_t {
    Full,
    Reduced,
};

[[nodiscard]] const char* to_string(CollisionPrecision precision);

// =============================================================================
// Collision Groups
// =============================================================================

using CollisionGroup = std::uint32_t;

namespace groups {
    constexpr CollisionGroup None       = 0;
    constexpr CollisionGroup Furniture  = 1u << 0;
    constexpr CollisionGroup Decoration = 1u << 1;
    constexpr CollisionGroup Structure  = 1u << 2;
    constexpr CollisionGroup All        = ~0u;
} // namespace groups

/// Two groups interact when they share at least one bit; None never collides
[[nodiscard]] inline bool groups_collide(CollisionGroup a, CollisionGroup b) noexcept {
    return (a & b) != 0;
}

// =============================================================================
// Identifiers
// =============================================================================

/// Generational entity handle; stale after the entity is removed
using EntityId = arphys_structures::SlotKey<PhysicsEntity>;

/// Static collider identifier (never reused)
struct ColliderId {
    std::uint64_t value = 0;

    [[nodiscard]] bool is_valid() const noexcept { return value != 0; }
    [[nodiscard]] static ColliderId invalid() { return ColliderId{0}; }

    bool operator==(const ColliderId& other) const noexcept { return value == other.value; }
    bool operator!=(const ColliderId& other) const noexcept { return value != other.value; }
    bool operator<(const ColliderId& other) const noexcept { return value < other.value; }
};

/// Snap target identifier (never reused)
struct SnapTargetId {
    std::uint64_t value = 0;

    [[nodiscard]] bool is_valid() const noexcept { return value != 0; }
    [[nodiscard]] static SnapTargetId invalid() { return SnapTargetId{0}; }

    bool operator==(const SnapTargetId& other) const noexcept { return value == other.value; }
    bool operator!=(const SnapTargetId& other) const noexcept { return value != other.value; }
    bool operator<(const SnapTargetId& other) const noexcept { return value < other.value; }
};

// =============================================================================
// Material
// =============================================================================

struct Material {
    float friction = 0.7f;      ///< [0, 1], fraction of tangential velocity removed per contact
    float restitution = 0.3f;   ///< [0, 1]
    float density = 1.0f;

    // Presets for common furniture surfaces
    [[nodiscard]] static Material wood();
    [[nodiscard]] static Material fabric();
    [[nodiscard]] static Material metal();
    [[nodiscard]] static Material glass();
};

// =============================================================================
// External Entity Handle
// =============================================================================

/// Host-side object (model node, AR anchor entity) a simulated entity mirrors.
/// The world reads the visual extents once at registration and writes the
/// simulated transform back after every step.
class IEntityHandle {
public:
    virtual ~IEntityHandle() = default;

    [[nodiscard]] virtual std::uint64_t handle_id() const = 0;

    /// Full size of the visual bounds in local space
    [[nodiscard]] virtual arphys_math::Vec3 visual_extents() const = 0;

    virtual void set_world_transform(const arphys_math::Vec3& position,
                                     const arphys_math::Quat& orientation) = 0;
};

// =============================================================================
// Contacts
// =============================================================================

/// Result of a narrow-phase primitive test
struct Contact {
    arphys_math::Vec3 point{0.0f};    ///< World contact point
    arphys_math::Vec3 normal{0.0f};   ///< Unit normal, A toward B (entity pairs) or surface toward entity (static)
    float penetration = 0.0f;         ///< Overlap depth including the collision margin
};

/// One contact found during a step
struct Collision {
    CollisionKind kind = CollisionKind::EntityEntity;
    EntityId entity_a;
    EntityId entity_b;              ///< Valid for EntityEntity
    ColliderId collider;            ///< Valid for EntityStatic
    Contact contact;
};

/// Order-independent identity of a touching pair
struct CollisionPair {
    CollisionKind kind = CollisionKind::EntityEntity;
    std::uint64_t a = 0;
    std::uint64_t b = 0;

    [[nodiscard]] static CollisionPair entities(EntityId x, EntityId y) noexcept {
        std::uint64_t bx = x.to_bits();
        std::uint64_t by = y.to_bits();
        if (by < bx) std::swap(bx, by);
        return CollisionPair{CollisionKind::EntityEntity, bx, by};
    }

    [[nodiscard]] static CollisionPair with_static(EntityId entity, ColliderId collider) noexcept {
        return CollisionPair{CollisionKind::EntityStatic, entity.to_bits(), collider.value};
    }

    [[nodiscard]] static CollisionPair from(const Collision& c) noexcept {
        return c.kind == CollisionKind::EntityEntity ? entities(c.entity_a, c.entity_b)
                                                     : with_static(c.entity_a, c.collider);
    }

    [[nodiscard]] EntityId first_entity() const noexcept { return EntityId::from_bits(a); }

    bool operator==(const CollisionPair& other) const noexcept {
        return kind == other.kind && a == other.a && b == other.b;
    }
    bool operator!=(const CollisionPair& other) const noexcept { return !(*this == other); }
};

using CollisionCallback = std::function<void(const CollisionPair&)>;

// =============================================================================
// Statistics
// =============================================================================

struct GridStats {
    std::uint32_t active_cells = 0;         ///< Cells holding at least one occupant
    std::uint32_t total_cells = 0;          ///< Allocated cells, including empty ones awaiting a sweep
    std::uint32_t total_entities = 0;
    std::uint32_t total_static_colliders = 0;
    float cell_size = 0.0f;
};

struct CollisionStats {
    std::uint32_t collision_checks = 0;     ///< Narrow-phase tests this step
    std::uint32_t broad_phase_pairs = 0;
    std::uint32_t active_collisions = 0;
    std::uint32_t static_colliders = 0;
    std::uint32_t batches = 0;
    std::uint32_t static_cache_hits = 0;
    std::uint32_t static_cache_misses = 0;
    std::uint64_t begin_events = 0;         ///< Since construction
    std::uint64_t end_events = 0;
    GridStats grid;
    float detect_time_ms = 0.0f;
};

struct WorldStats {
    std::uint32_t total_entities = 0;
    std::uint32_t active_entities = 0;
    std::uint32_t sleeping_entities = 0;
    std::uint32_t kinematic_entities = 0;
    std::uint64_t step_count = 0;
    double simulated_time = 0.0;
    float step_time_ms = 0.0f;
};

struct SnapStats {
    std::uint32_t snap_operations = 0;      ///< Snap attempts (explicit and automatic)
    std::uint32_t successful_snaps = 0;
    std::uint32_t broken_snaps = 0;
    std::uint32_t active_snaps = 0;         ///< Entities currently held
    std::uint32_t active_operations = 0;    ///< Interpolations in flight
    std::uint32_t snap_targets = 0;
};

struct PerformanceStats {
    float frame_time_ms = 0.0f;
    float average_frame_time_ms = 0.0f;
    std::size_t memory_bytes = 0;
    std::uint32_t active_entities = 0;
    std::uint32_t sleeping_entities = 0;
    float average_lod = 0.0f;
    std::uint32_t culled_entities = 0;
    std::uint32_t batched_operations = 0;
    std::uint32_t pooled_objects = 0;
    std::uint32_t over_budget_frames = 0;   ///< Consecutive
    std::uint32_t emergency_activations = 0;
    bool emergency_mode = false;
};

/// Everything a diagnostics overlay polls
struct PhysicsStats {
    WorldStats world;
    CollisionStats collision;
    SnapStats snap;
    PerformanceStats performance;
    std::uint32_t surfaces = 0;
    float frame_time_ms = 0.0f;
};

} // namespace arphys_physics

// =============================================================================
// Hash Specializations
// =============================================================================

template<>
struct std::hash<arphys_physics::ColliderId> {
    std::size_t operator()(const arphys_physics::ColliderId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template<>
struct std::hash<arphys_physics::SnapTargetId> {
    std::size_t operator()(const arphys_physics::SnapTargetId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template<>
struct std::hash<arphys_physics::CollisionPair> {
    std::size_t operator()(const arphys_physics::CollisionPair& p) const noexcept {
        std::size_t h = std::hash<std::uint64_t>{}(p.a);
        h ^= std::hash<std::uint64_t>{}(p.b) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        return h ^ static_cast<std::size_t>(p.kind);
    }
};
