/// @file spatial_grid.cpp
/// @brief Uniform spatial hash implementation

#include <arphys/physics/spatial_grid.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace arphys_physics {

namespace {

std::int32_t to_cell_coord(float v, float cell_size) noexcept {
    const float c = std::floor(v / cell_size);
    constexpr float lo = static_cast<float>(std::numeric_limits<std::int32_t>::min() / 2);
    constexpr float hi = static_cast<float>(std::numeric_limits<std::int32_t>::max() / 2);
    return static_cast<std::int32_t>(std::clamp(c, lo, hi));
}

template<typename T>
void erase_value(std::vector<T>& values, const T& value) {
    auto it = std::find(values.begin(), values.end(), value);
    if (it != values.end()) {
        *it = values.back();
        values.pop_back();
    }
}

template<typename T>
void sort_unique(std::vector<T>& values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

} // anonymous namespace

SpatialGrid::SpatialGrid(float cell_size, float optimize_interval)
    : m_cell_size(cell_size > 0.0f ? cell_size : 1.0f)
    , m_optimize_interval(optimize_interval) {}

// =============================================================================
// Cell math
// =============================================================================

GridCell SpatialGrid::world_to_grid(const arphys_math::Vec3& position) const noexcept {
    return GridCell{
        to_cell_coord(position.x, m_cell_size),
        to_cell_coord(position.y, m_cell_size),
        to_cell_coord(position.z, m_cell_size),
    };
}

arphys_math::AABB SpatialGrid::cell_bounds(const GridCell& cell) const noexcept {
    const arphys_math::Vec3 min(static_cast<float>(cell.x) * m_cell_size,
                                static_cast<float>(cell.y) * m_cell_size,
                                static_cast<float>(cell.z) * m_cell_size);
    return arphys_math::AABB(min, min + arphys_math::Vec3(m_cell_size));
}

std::uint64_t SpatialGrid::cell_count(const arphys_math::AABB& bounds) const noexcept {
    constexpr std::uint64_t k_unbounded = std::numeric_limits<std::uint64_t>::max();
    if (bounds.is_empty()) {
        return 0;
    }
    if (!arphys_math::is_finite(bounds.min) || !arphys_math::is_finite(bounds.max)) {
        return k_unbounded;
    }

    const GridCell lo = world_to_grid(bounds.min);
    const GridCell hi = world_to_grid(bounds.max);
    const auto span = [](std::int32_t a, std::int32_t b) {
        return static_cast<std::uint64_t>(static_cast<std::int64_t>(b) - a + 1);
    };

    // Coordinates are clamped to +-2^30, so two spans always fit
    const std::uint64_t xy = span(lo.x, hi.x) * span(lo.y, hi.y);
    const std::uint64_t z = span(lo.z, hi.z);
    return xy > k_unbounded / z ? k_unbounded : xy * z;
}

std::optional<std::vector<GridCell>> SpatialGrid::bounded_cells(const arphys_math::AABB& bounds) const {
    const std::uint64_t count = cell_count(bounds);
    if (count > k_max_static_cells) {
        return std::nullopt;
    }

    std::vector<GridCell> cells;
    if (count == 0) {
        return cells;
    }
    cells.reserve(static_cast<std::size_t>(count));

    const GridCell lo = world_to_grid(bounds.min);
    const GridCell hi = world_to_grid(bounds.max);
    for (std::int32_t x = lo.x; x <= hi.x; ++x) {
        for (std::int32_t y = lo.y; y <= hi.y; ++y) {
            for (std::int32_t z = lo.z; z <= hi.z; ++z) {
                cells.push_back(GridCell{x, y, z});
            }
        }
    }
    return cells;
}

std::vector<GridCell> SpatialGrid::cells_for_bounds(const arphys_math::AABB& bounds) const {
    auto cells = bounded_cells(bounds);
    return cells ? std::move(*cells) : std::vector<GridCell>{};
}

void SpatialGrid::set_cell_size(float cell_size) {
    if (!(cell_size > 0.0f) || cell_size == m_cell_size) {
        return;
    }

    m_cell_size = cell_size;
    m_cells.clear();
    m_oversized_statics.clear();
    m_oversized_entities.clear();

    for (auto& [id, membership] : m_entities) {
        place_entity(id, membership, bounded_cells(membership.bounds));
    }
    for (auto& [id, membership] : m_statics) {
        insert_static_cells(id, membership);
    }
}

float SpatialGrid::recommended_cell_size(float average_radius) noexcept {
    return std::max(0.25f, average_radius * 4.0f);
}

// =============================================================================
// Entities
// =============================================================================

bool SpatialGrid::update_entity(EntityId id, const arphys_math::Vec3& position, float radius) {
    const float r = std::max(radius, 0.0f);
    const arphys_math::AABB bounds(position - arphys_math::Vec3(r), position + arphys_math::Vec3(r));
    std::optional<std::vector<GridCell>> cells = bounded_cells(bounds);

    auto it = m_entities.find(id);
    if (it == m_entities.end()) {
        Membership membership{bounds, {}};
        place_entity(id, membership, std::move(cells));
        m_entities.emplace(id, std::move(membership));
        return true;
    }

    Membership& membership = it->second;
    membership.bounds = bounds;
    const bool was_oversized = m_oversized_entities.count(id) > 0;
    if (cells ? (!was_oversized && membership.cells == *cells) : was_oversized) {
        return false;
    }

    erase_entity_cells(id, membership.cells, false);
    m_oversized_entities.erase(id);
    place_entity(id, membership, std::move(cells));
    return true;
}

bool SpatialGrid::remove_entity(EntityId id) {
    auto it = m_entities.find(id);
    if (it == m_entities.end()) {
        return false;
    }
    erase_entity_cells(id, it->second.cells, true);
    m_oversized_entities.erase(id);
    m_entities.erase(it);
    return true;
}

bool SpatialGrid::contains_entity(EntityId id) const {
    return m_entities.count(id) > 0;
}

const std::vector<GridCell>* SpatialGrid::entity_cells(EntityId id) const {
    auto it = m_entities.find(id);
    return it != m_entities.end() ? &it->second.cells : nullptr;
}

bool SpatialGrid::is_oversized(EntityId id) const {
    return m_oversized_entities.count(id) > 0;
}

void SpatialGrid::place_entity(EntityId id, Membership& membership, std::optional<std::vector<GridCell>> cells) {
    if (!cells) {
        membership.cells.clear();
        m_oversized_entities.insert(id);
        return;
    }
    insert_entity_cells(id, *cells);
    membership.cells = std::move(*cells);
}

void SpatialGrid::insert_entity_cells(EntityId id, const std::vector<GridCell>& cells) {
    for (const auto& cell : cells) {
        m_cells[cell].entities.push_back(id);
    }
}

void SpatialGrid::erase_entity_cells(EntityId id, const std::vector<GridCell>& cells, bool drop_empty) {
    for (const auto& cell : cells) {
        auto it = m_cells.find(cell);
        if (it == m_cells.end()) continue;
        erase_value(it->second.entities, id);
        if (drop_empty && it->second.empty()) {
            m_cells.erase(it);
        }
    }
}

// =============================================================================
// Static colliders
// =============================================================================

void SpatialGrid::add_static_collider(ColliderId id, const arphys_math::AABB& bounds) {
    auto it = m_statics.find(id);
    if (it != m_statics.end()) {
        update_static_collider(id, bounds);
        return;
    }
    Membership membership{bounds, {}};
    insert_static_cells(id, membership);
    m_statics.emplace(id, std::move(membership));
}

bool SpatialGrid::update_static_collider(ColliderId id, const arphys_math::AABB& bounds) {
    auto it = m_statics.find(id);
    if (it == m_statics.end()) {
        return false;
    }
    erase_static_cells(id, it->second.cells);
    m_oversized_statics.erase(id);
    it->second.bounds = bounds;
    insert_static_cells(id, it->second);
    return true;
}

bool SpatialGrid::remove_static_collider(ColliderId id) {
    auto it = m_statics.find(id);
    if (it == m_statics.end()) {
        return false;
    }
    erase_static_cells(id, it->second.cells);
    m_oversized_statics.erase(id);
    m_statics.erase(it);
    return true;
}

bool SpatialGrid::contains_static_collider(ColliderId id) const {
    return m_statics.count(id) > 0;
}

const std::vector<GridCell>* SpatialGrid::static_cells(ColliderId id) const {
    auto it = m_statics.find(id);
    return it != m_statics.end() ? &it->second.cells : nullptr;
}

bool SpatialGrid::is_oversized(ColliderId id) const {
    return m_oversized_statics.count(id) > 0;
}

void SpatialGrid::insert_static_cells(ColliderId id, Membership& membership) {
    auto cells = bounded_cells(membership.bounds);
    if (!cells) {
        membership.cells.clear();
        m_oversized_statics.insert(id);
        return;
    }
    membership.cells = std::move(*cells);
    for (const auto& cell : membership.cells) {
        m_cells[cell].statics.push_back(id);
    }
}

void SpatialGrid::erase_static_cells(ColliderId id, const std::vector<GridCell>& cells) {
    for (const auto& cell : cells) {
        auto it = m_cells.find(cell);
        if (it == m_cells.end()) continue;
        erase_value(it->second.statics, id);
        if (it->second.empty()) {
            m_cells.erase(it);
        }
    }
}

// =============================================================================
// Queries
// =============================================================================

std::vector<EntityId> SpatialGrid::potential_collisions(EntityId id) const {
    std::vector<EntityId> out;
    auto it = m_entities.find(id);
    if (it == m_entities.end()) {
        return out;
    }

    if (is_oversized(id)) {
        for (const auto& [other, membership] : m_entities) {
            if (other != id) out.push_back(other);
        }
        sort_unique(out);
        return out;
    }

    for (const auto& cell : it->second.cells) {
        auto cell_it = m_cells.find(cell);
        if (cell_it == m_cells.end()) continue;
        for (EntityId other : cell_it->second.entities) {
            if (other != id) out.push_back(other);
        }
    }
    for (EntityId other : m_oversized_entities) {
        if (other != id) out.push_back(other);
    }
    sort_unique(out);
    return out;
}

std::vector<ColliderId> SpatialGrid::potential_static_collisions(EntityId id) const {
    std::vector<ColliderId> out;
    auto it = m_entities.find(id);
    if (it == m_entities.end()) {
        return out;
    }

    if (is_oversized(id)) {
        for (const auto& [collider, membership] : m_statics) {
            out.push_back(collider);
        }
        sort_unique(out);
        return out;
    }

    for (const auto& cell : it->second.cells) {
        auto cell_it = m_cells.find(cell);
        if (cell_it == m_cells.end()) continue;
        out.insert(out.end(), cell_it->second.statics.begin(), cell_it->second.statics.end());
    }
    out.insert(out.end(), m_oversized_statics.begin(), m_oversized_statics.end());
    sort_unique(out);
    return out;
}

std::vector<EntityId> SpatialGrid::entities_in_cells(const std::vector<GridCell>& cells) const {
    std::vector<EntityId> out;
    for (const auto& cell : cells) {
        auto it = m_cells.find(cell);
        if (it == m_cells.end()) continue;
        out.insert(out.end(), it->second.entities.begin(), it->second.entities.end());
    }
    out.insert(out.end(), m_oversized_entities.begin(), m_oversized_entities.end());
    sort_unique(out);
    return out;
}

std::vector<EntityId> SpatialGrid::entities_near_static(ColliderId id) const {
    if (is_oversized(id)) {
        std::vector<EntityId> out;
        out.reserve(m_entities.size());
        for (const auto& [entity, membership] : m_entities) {
            out.push_back(entity);
        }
        sort_unique(out);
        return out;
    }
    auto it = m_statics.find(id);
    if (it == m_statics.end()) {
        return {};
    }
    return entities_in_cells(it->second.cells);
}

template<typename F>
void SpatialGrid::for_each_cell_in_radius(const arphys_math::Vec3& center, float radius, F&& func) const {
    const float r = std::max(radius, 0.0f);
    const arphys_math::AABB query(center - arphys_math::Vec3(r), center + arphys_math::Vec3(r));
    auto cells = bounded_cells(query);
    if (!cells) {
        for (const auto& [key, cell] : m_cells) {
            func(cell);
        }
        return;
    }
    for (const auto& cell : *cells) {
        auto it = m_cells.find(cell);
        if (it != m_cells.end()) {
            func(it->second);
        }
    }
}

std::vector<EntityId> SpatialGrid::entities_in_radius(const arphys_math::Vec3& center, float radius) const {
    std::vector<EntityId> out;
    for_each_cell_in_radius(center, radius, [&out](const Cell& cell) {
        out.insert(out.end(), cell.entities.begin(), cell.entities.end());
    });
    out.insert(out.end(), m_oversized_entities.begin(), m_oversized_entities.end());
    sort_unique(out);
    return out;
}

std::vector<ColliderId> SpatialGrid::static_colliders_in_radius(const arphys_math::Vec3& center,
                                                                float radius) const {
    std::vector<ColliderId> out;
    for_each_cell_in_radius(center, radius, [&out](const Cell& cell) {
        out.insert(out.end(), cell.statics.begin(), cell.statics.end());
    });
    out.insert(out.end(), m_oversized_statics.begin(), m_oversized_statics.end());
    sort_unique(out);
    return out;
}

// =============================================================================
// Maintenance
// =============================================================================

std::size_t SpatialGrid::optimize(double now) {
    if (now - m_last_optimize < static_cast<double>(m_optimize_interval)) {
        return 0;
    }
    m_last_optimize = now;
    return compact();
}

std::size_t SpatialGrid::compact() {
    std::size_t removed = 0;
    for (auto it = m_cells.begin(); it != m_cells.end();) {
        if (it->second.empty()) {
            it = m_cells.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

GridStats SpatialGrid::stats() const {
    GridStats s;
    s.total_cells = static_cast<std::uint32_t>(m_cells.size());
    for (const auto& [cell, contents] : m_cells) {
        if (!contents.empty()) ++s.active_cells;
    }
    s.total_entities = static_cast<std::uint32_t>(m_entities.size());
    s.total_static_colliders = static_cast<std::uint32_t>(m_statics.size());
    s.cell_size = m_cell_size;
    return s;
}

void SpatialGrid::clear() {
    m_cells.clear();
    m_entities.clear();
    m_statics.clear();
    m_oversized_statics.clear();
    m_oversized_entities.clear();
    m_last_optimize = 0.0;
}

} // namespace arphys_physics
