/// @file spatial_grid.hpp
/// @brief Uniform spatial hash for broad phase candidate lookup
///
/// Every entity and static collider is recorded in each cell its bounding
/// box overlaps, so two objects that overlap always share a cell. Queries
/// may return objects that do not actually touch; the narrow phase filters
/// those.

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace arphys_physics {

// =============================================================================
// GridCell
// =============================================================================

/// Integer cell coordinate, floor(position / cell_size)
struct GridCell {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t z = 0;

    bool operator==(const GridCell& other) const noexcept {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const GridCell& other) const noexcept { return !(*this == other); }
    bool operator<(const GridCell& other) const noexcept {
        if (x != other.x) return x < other.x;
        if (y != other.y) return y < other.y;
        return z < other.z;
    }
};

struct GridCellHash {
    std::size_t operator()(const GridCell& c) const noexcept {
        // Teschner et al. spatial hash primes
        return (static_cast<std::size_t>(static_cast<std::uint32_t>(c.x)) * 73856093u) ^
               (static_cast<std::size_t>(static_cast<std::uint32_t>(c.y)) * 19349663u) ^
               (static_cast<std::size_t>(static_cast<std::uint32_t>(c.z)) * 83492791u);
    }
};

// =============================================================================
// SpatialGrid
// =============================================================================

class SpatialGrid {
public:
    /// Entities and static colliders spanning more cells than this, or with
    /// non-finite bounds, are kept in overflow lists that every query returns
    static constexpr std::size_t k_max_static_cells = 4096;

    explicit SpatialGrid(float cell_size = 1.0f, float optimize_interval = 5.0f);

    // =========================================================================
    // Cell math
    // =========================================================================

    [[nodiscard]] GridCell world_to_grid(const arphys_math::Vec3& position) const noexcept;

    [[nodiscard]] arphys_math::AABB cell_bounds(const GridCell& cell) const noexcept;

    /// Number of cells overlapping `bounds`, saturating; the maximum value
    /// for a non-finite box
    [[nodiscard]] std::uint64_t cell_count(const arphys_math::AABB& bounds) const noexcept;

    /// Every cell overlapping `bounds`; empty for an empty or non-finite box
    /// and for one spanning more than k_max_static_cells cells
    [[nodiscard]] std::vector<GridCell> cells_for_bounds(const arphys_math::AABB& bounds) const;

    [[nodiscard]] float cell_size() const noexcept { return m_cell_size; }

    /// Rebuild all membership for a new cell size
    void set_cell_size(float cell_size);

    void set_optimize_interval(float seconds) noexcept { m_optimize_interval = seconds; }

    /// Twice the average diameter, never below 0.25
    [[nodiscard]] static float recommended_cell_size(float average_radius) noexcept;

    // =========================================================================
    // Entities
    // =========================================================================

    /// Record the entity in the cells overlapping position +- radius.
    /// Cells it left stay allocated until the next sweep.
    /// @return true if the entity's cell set changed
    bool update_entity(EntityId id, const arphys_math::Vec3& position, float radius);

    bool remove_entity(EntityId id);

    [[nodiscard]] bool contains_entity(EntityId id) const;

    [[nodiscard]] const std::vector<GridCell>* entity_cells(EntityId id) const;

    // =========================================================================
    // Static colliders
    // =========================================================================

    /// Insert, or replace the membership of an existing collider
    void add_static_collider(ColliderId id, const arphys_math::AABB& bounds);

    /// @return false if the collider is unknown
    bool update_static_collider(ColliderId id, const arphys_math::AABB& bounds);

    bool remove_static_collider(ColliderId id);

    [[nodiscard]] bool contains_static_collider(ColliderId id) const;

    [[nodiscard]] const std::vector<GridCell>* static_cells(ColliderId id) const;

    /// Colliders too large for per-cell membership
    [[nodiscard]] bool is_oversized(ColliderId id) const;

    /// Entities too large for per-cell membership
    [[nodiscard]] bool is_oversized(EntityId id) const;

    // =========================================================================
    // Queries
    // =========================================================================

    /// Other entities sharing at least one cell, sorted
    [[nodiscard]] std::vector<EntityId> potential_collisions(EntityId id) const;

    /// Static colliders sharing at least one cell with the entity, sorted
    [[nodiscard]] std::vector<ColliderId> potential_static_collisions(EntityId id) const;

    /// Entities recorded in any of `cells`, sorted
    [[nodiscard]] std::vector<EntityId> entities_in_cells(const std::vector<GridCell>& cells) const;

    /// Entities sharing a cell with the collider, or every entity when the
    /// collider is oversized; empty for an unknown collider. Sorted.
    [[nodiscard]] std::vector<EntityId> entities_near_static(ColliderId id) const;

    /// Occupants of every cell overlapping the sphere, sorted
    [[nodiscard]] std::vector<EntityId> entities_in_radius(const arphys_math::Vec3& center, float radius) const;

    [[nodiscard]] std::vector<ColliderId> static_colliders_in_radius(const arphys_math::Vec3& center,
                                                                     float radius) const;

    // =========================================================================
    // Maintenance
    // =========================================================================

    /// Sweep empty cells if `optimize_interval` has passed since the last sweep
    /// @param now Seconds on any monotonic clock
    /// @return Number of cells removed
    std::size_t optimize(double now);

    /// Sweep empty cells unconditionally
    std::size_t compact();

    [[nodiscard]] GridStats stats() const;

    void clear();

private:
    struct Cell {
        std::vector<EntityId> entities;
        std::vector<ColliderId> statics;

        [[nodiscard]] bool empty() const noexcept { return entities.empty() && statics.empty(); }
    };

    struct Membership {
        arphys_math::AABB bounds;
        std::vector<GridCell> cells;
    };

    /// nullopt when the box is too large or non-finite for cell membership
    [[nodiscard]] std::optional<std::vector<GridCell>> bounded_cells(const arphys_math::AABB& bounds) const;

    void place_entity(EntityId id, Membership& membership, std::optional<std::vector<GridCell>> cells);
    void insert_entity_cells(EntityId id, const std::vector<GridCell>& cells);
    void erase_entity_cells(EntityId id, const std::vector<GridCell>& cells, bool drop_empty);
    void insert_static_cells(ColliderId id, Membership& membership);
    void erase_static_cells(ColliderId id, const std::vector<GridCell>& cells);

    template<typename F>
    void for_each_cell_in_radius(const arphys_math::Vec3& center, float radius, F&& func) const;

    float m_cell_size;
    float m_optimize_interval;
    double m_last_optimize = 0.0;

    std::unordered_map<GridCell, Cell, GridCellHash> m_cells;
    std::unordered_map<EntityId, Membership> m_entities;
    std::unordered_map<ColliderId, Membership> m_statics;
    std::unordered_set<ColliderId> m_oversized_statics;
    std::unordered_set<EntityId> m_oversized_entities;
};

} // namespace arphys_physics
