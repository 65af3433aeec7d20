// arphys_physics spatial grid tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arphys/physics/spatial_grid.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace arphys_physics;
using arphys_math::AABB;
using arphys_math::Vec3;
using Catch::Matchers::WithinAbs;

namespace {

EntityId entity(std::uint32_t index) {
    return EntityId(index, 0);
}

bool spheres_overlap(const Vec3& a, float ra, const Vec3& b, float rb) {
    const AABB box_a(a - Vec3(ra), a + Vec3(ra));
    const AABB box_b(b - Vec3(rb), b + Vec3(rb));
    return box_a.intersects(box_b);
}

} // anonymous namespace

TEST_CASE("SpatialGrid cell math", "[physics][spatial_grid]") {
    SpatialGrid grid(2.0f);

    SECTION("world_to_grid floors toward negative infinity") {
        REQUIRE(grid.world_to_grid(Vec3(0.5f, 1.9f, 3.0f)) == GridCell{0, 0, 1});
        REQUIRE(grid.world_to_grid(Vec3(-0.5f, -2.0f, -2.1f)) == GridCell{-1, -1, -2});
    }

    SECTION("cell_bounds spans one cell") {
        AABB b = grid.cell_bounds(GridCell{1, -1, 0});
        REQUIRE(arphys_math::approx_equal(b.min, Vec3(2.0f, -2.0f, 0.0f)));
        REQUIRE(arphys_math::approx_equal(b.max, Vec3(4.0f, 0.0f, 2.0f)));
    }

    SECTION("cells_for_bounds covers every overlapped cell") {
        auto cells = grid.cells_for_bounds(AABB(Vec3(-0.5f, 0.5f, 0.5f), Vec3(0.5f, 0.5f, 2.5f)));
        REQUIRE(cells.size() == 4);
        REQUIRE(grid.cells_for_bounds(AABB{}).empty());
    }

    SECTION("recommended cell size") {
        REQUIRE_THAT(SpatialGrid::recommended_cell_size(0.5f), WithinAbs(2.0f, 1e-6));
        REQUIRE_THAT(SpatialGrid::recommended_cell_size(0.01f), WithinAbs(0.25f, 1e-6));
    }
}

TEST_CASE("SpatialGrid entity membership", "[physics][spatial_grid]") {
    SpatialGrid grid(1.0f);
    const EntityId a = entity(0);
    const EntityId b = entity(1);

    REQUIRE(grid.update_entity(a, Vec3(0.5f), 0.25f));
    REQUIRE(grid.update_entity(b, Vec3(0.6f), 0.25f));
    REQUIRE(grid.contains_entity(a));

    SECTION("entities in the same cell are candidates") {
        auto candidates = grid.potential_collisions(a);
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0] == b);
    }

    SECTION("moving inside a cell keeps membership") {
        REQUIRE_FALSE(grid.update_entity(a, Vec3(0.55f), 0.25f));
    }

    SECTION("moving away drops the candidate") {
        REQUIRE(grid.update_entity(a, Vec3(10.5f), 0.25f));
        REQUIRE(grid.potential_collisions(a).empty());
        REQUIRE(grid.potential_collisions(b).empty());
    }

    SECTION("a sphere straddling a boundary occupies both cells") {
        grid.update_entity(a, Vec3(1.0f, 0.5f, 0.5f), 0.25f);
        REQUIRE(grid.entity_cells(a)->size() == 2);
    }

    SECTION("remove") {
        REQUIRE(grid.remove_entity(a));
        REQUIRE_FALSE(grid.remove_entity(a));
        REQUIRE_FALSE(grid.contains_entity(a));
        REQUIRE(grid.potential_collisions(b).empty());
    }
}

TEST_CASE("SpatialGrid broad phase never misses an overlap", "[physics][spatial_grid]") {
    SpatialGrid grid(0.75f);
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> pos(-4.0f, 4.0f);
    std::uniform_real_distribution<float> rad(0.05f, 0.8f);

    struct Body { Vec3 p; float r; };
    std::vector<Body> bodies;
    for (std::uint32_t i = 0; i < 80; ++i) {
        bodies.push_back({Vec3(pos(rng), pos(rng) * 0.25f, pos(rng)), rad(rng)});
        grid.update_entity(entity(i), bodies.back().p, bodies.back().r);
    }

    for (std::uint32_t i = 0; i < bodies.size(); ++i) {
        auto candidates = grid.potential_collisions(entity(i));
        for (std::uint32_t j = 0; j < bodies.size(); ++j) {
            if (i == j) continue;
            if (spheres_overlap(bodies[i].p, bodies[i].r, bodies[j].p, bodies[j].r)) {
                REQUIRE(std::binary_search(candidates.begin(), candidates.end(), entity(j)));
            }
        }
    }
}

TEST_CASE("SpatialGrid static colliders", "[physics][spatial_grid]") {
    SpatialGrid grid(1.0f);
    const EntityId chair = entity(0);
    const ColliderId floor{1};
    const ColliderId wall{2};

    grid.add_static_collider(floor, AABB(Vec3(-2.0f, -0.01f, -2.0f), Vec3(2.0f, 0.01f, 2.0f)));
    grid.add_static_collider(wall, AABB(Vec3(5.0f, 0.0f, -2.0f), Vec3(5.01f, 2.0f, 2.0f)));
    grid.update_entity(chair, Vec3(0.2f, 0.3f, 0.2f), 0.3f);

    auto statics = grid.potential_static_collisions(chair);
    REQUIRE(statics.size() == 1);
    REQUIRE(statics[0] == floor);

    SECTION("update moves membership") {
        REQUIRE(grid.update_static_collider(wall, AABB(Vec3(0.0f), Vec3(0.5f))));
        REQUIRE(grid.potential_static_collisions(chair).size() == 2);
        REQUIRE_FALSE(grid.update_static_collider(ColliderId{99}, AABB(Vec3(0.0f), Vec3(1.0f))));
    }

    SECTION("remove") {
        REQUIRE(grid.remove_static_collider(floor));
        REQUIRE(grid.potential_static_collisions(chair).empty());
        REQUIRE_FALSE(grid.contains_static_collider(floor));
    }

    SECTION("entities near a collider") {
        REQUIRE(grid.entities_near_static(floor) == std::vector<EntityId>{chair});
        REQUIRE(grid.entities_near_static(wall).empty());
        REQUIRE(grid.entities_near_static(ColliderId{99}).empty());
    }

    SECTION("oversized colliders are returned by every static query") {
        const ColliderId huge{3};
        grid.add_static_collider(huge, AABB(Vec3(-100.0f), Vec3(100.0f)));
        REQUIRE(grid.is_oversized(huge));
        REQUIRE(grid.static_cells(huge)->empty());
        REQUIRE(grid.entities_near_static(huge) == std::vector<EntityId>{chair});

        grid.update_entity(chair, Vec3(50.0f), 0.3f);
        auto far = grid.potential_static_collisions(chair);
        REQUIRE(far.size() == 1);
        REQUIRE(far[0] == huge);

        auto around = grid.static_colliders_in_radius(Vec3(-60.0f), 1.0f);
        REQUIRE(std::find(around.begin(), around.end(), huge) != around.end());
    }
}

TEST_CASE("SpatialGrid unbounded and enormous boxes", "[physics][spatial_grid]") {
    SpatialGrid grid(1.0f);
    const float inf = std::numeric_limits<float>::infinity();
    const EntityId chair = entity(0);
    grid.update_entity(chair, Vec3(0.5f, 0.3f, 0.5f), 0.3f);

    SECTION("cell counts saturate instead of overflowing") {
        REQUIRE(grid.cell_count(AABB{}) == 0);
        REQUIRE(grid.cell_count(AABB(Vec3(0.5f), Vec3(1.5f))) == 8);
        REQUIRE(grid.cell_count(AABB(Vec3(-inf), Vec3(inf))) == std::numeric_limits<std::uint64_t>::max());
        REQUIRE(grid.cell_count(AABB(Vec3(-1e30f), Vec3(1e30f))) > SpatialGrid::k_max_static_cells);
        REQUIRE(grid.cells_for_bounds(AABB(Vec3(-1e30f), Vec3(1e30f))).empty());
    }

    SECTION("non-finite static bounds still reach every entity") {
        const ColliderId sky{1};
        grid.add_static_collider(sky, AABB(Vec3(-inf), Vec3(inf)));
        REQUIRE(grid.is_oversized(sky));
        auto statics = grid.potential_static_collisions(chair);
        REQUIRE(std::find(statics.begin(), statics.end(), sky) != statics.end());
    }

    SECTION("huge finite static bounds go to the overflow list") {
        const ColliderId slab{2};
        grid.add_static_collider(slab, AABB(Vec3(-1e30f), Vec3(1e30f)));
        REQUIRE(grid.is_oversized(slab));
        REQUIRE(grid.potential_static_collisions(chair).size() == 1);
    }

    SECTION("oversized entities pair with everything") {
        const EntityId blob = entity(1);
        const EntityId far = entity(2);
        grid.update_entity(far, Vec3(500.0f), 0.1f);
        REQUIRE(grid.update_entity(blob, Vec3(0.0f), 1e20f));
        REQUIRE(grid.is_oversized(blob));
        REQUIRE(grid.entity_cells(blob)->empty());

        REQUIRE(grid.potential_collisions(blob) == std::vector<EntityId>{chair, far});
        auto from_chair = grid.potential_collisions(chair);
        REQUIRE(std::find(from_chair.begin(), from_chair.end(), blob) != from_chair.end());
        auto nearby = grid.entities_in_radius(Vec3(500.0f), 0.5f);
        REQUIRE(std::find(nearby.begin(), nearby.end(), blob) != nearby.end());

        REQUIRE_FALSE(grid.update_entity(blob, Vec3(1.0f), 1e20f));
        REQUIRE(grid.update_entity(blob, Vec3(0.5f), 0.1f));
        REQUIRE_FALSE(grid.is_oversized(blob));
        REQUIRE(grid.potential_collisions(far).empty());
    }

    SECTION("a NaN position is tracked conservatively") {
        const EntityId lost = entity(3);
        grid.update_entity(lost, Vec3(std::nanf(""), 0.0f, 0.0f), 0.2f);
        REQUIRE(grid.is_oversized(lost));
        REQUIRE(grid.remove_entity(lost));
        REQUIRE_FALSE(grid.is_oversized(lost));
    }

    SECTION("radius queries too large for cells scan everything") {
        auto all = grid.entities_in_radius(Vec3(0.0f), 1e20f);
        REQUIRE(all == std::vector<EntityId>{chair});
    }
}

TEST_CASE("SpatialGrid radius queries", "[physics][spatial_grid]") {
    SpatialGrid grid(1.0f);
    grid.update_entity(entity(0), Vec3(0.5f), 0.1f);
    grid.update_entity(entity(1), Vec3(3.5f), 0.1f);

    auto near = grid.entities_in_radius(Vec3(0.0f), 1.0f);
    REQUIRE(near.size() == 1);
    REQUIRE(near[0] == entity(0));

    auto both = grid.entities_in_radius(Vec3(2.0f), 2.0f);
    REQUIRE(both.size() == 2);
}

TEST_CASE("SpatialGrid sweeps empty cells", "[physics][spatial_grid]") {
    SpatialGrid grid(1.0f, 5.0f);
    const EntityId a = entity(0);
    grid.update_entity(a, Vec3(0.5f), 0.1f);
    grid.update_entity(a, Vec3(4.5f), 0.1f);

    auto stats = grid.stats();
    REQUIRE(stats.total_cells == 2);
    REQUIRE(stats.active_cells == 1);

    SECTION("optimize waits for the interval") {
        REQUIRE(grid.optimize(1.0) == 0);
        REQUIRE(grid.optimize(6.0) == 1);
        REQUIRE(grid.stats().total_cells == 1);
    }

    SECTION("compact always sweeps") {
        REQUIRE(grid.compact() == 1);
        REQUIRE(grid.compact() == 0);
    }
}

TEST_CASE("SpatialGrid cell size change rebuilds membership", "[physics][spatial_grid]") {
    SpatialGrid grid(1.0f);
    grid.update_entity(entity(0), Vec3(0.5f), 0.1f);
    grid.update_entity(entity(1), Vec3(1.5f), 0.1f);
    grid.add_static_collider(ColliderId{1}, AABB(Vec3(1.2f), Vec3(1.4f)));

    REQUIRE(grid.potential_collisions(entity(0)).empty());

    grid.set_cell_size(4.0f);
    REQUIRE_THAT(grid.cell_size(), WithinAbs(4.0f, 1e-6));
    REQUIRE(grid.potential_collisions(entity(0)).size() == 1);
    REQUIRE(grid.potential_static_collisions(entity(0)).size() == 1);
}
