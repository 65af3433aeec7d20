// arphys_math bounds tests (AABB, Sphere)

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arphys/math/math.hpp>
#include <vector>

using namespace arphys_math;
using Catch::Matchers::WithinAbs;

// =============================================================================
// AABB Tests
// =============================================================================

TEST_CASE("AABB construction", "[math][aabb]") {
    SECTION("default is empty") {
        AABB box;
        REQUIRE(box.is_empty());
        REQUIRE(box.volume() == 0.0f);
    }

    SECTION("from center and half extents") {
        AABB box = AABB::from_center_half_extents(Vec3(1.0f, 2.0f, 3.0f), Vec3(0.5f));
        REQUIRE(box.min == Vec3(0.5f, 1.5f, 2.5f));
        REQUIRE(box.max == Vec3(1.5f, 2.5f, 3.5f));
        REQUIRE_THAT(box.volume(), WithinAbs(1.0f, 1e-6));
    }

    SECTION("from points") {
        std::vector<Vec3> points = {
            Vec3(-1.0f, 0.0f, 0.0f),
            Vec3(1.0f, 0.0f, 0.0f),
            Vec3(0.0f, 2.0f, 0.0f),
            Vec3(0.0f, 0.0f, 3.0f)
        };
        AABB box = AABB::from_points(points);
        REQUIRE(box.min == Vec3(-1.0f, 0.0f, 0.0f));
        REQUIRE(box.max == Vec3(1.0f, 2.0f, 3.0f));
        REQUIRE(box.size() == Vec3(2.0f, 2.0f, 3.0f));
    }
}

TEST_CASE("AABB set operations", "[math][aabb]") {
    AABB a(Vec3(0.0f), Vec3(2.0f));
    AABB b(Vec3(1.0f), Vec3(3.0f));
    AABB far(Vec3(10.0f), Vec3(11.0f));

    SECTION("union") {
        AABB u = a.union_with(b);
        REQUIRE(u.min == Vec3(0.0f));
        REQUIRE(u.max == Vec3(3.0f));
    }

    SECTION("intersection") {
        auto i = a.intersection(b);
        REQUIRE(i.has_value());
        REQUIRE(i->min == Vec3(1.0f));
        REQUIRE(i->max == Vec3(2.0f));
        REQUIRE_FALSE(a.intersection(far).has_value());
    }

    SECTION("intersects and contains") {
        REQUIRE(a.intersects(b));
        REQUIRE_FALSE(a.intersects(far));
        REQUIRE(a.contains_point(Vec3(1.0f)));
        REQUIRE_FALSE(a.contains_point(Vec3(2.5f)));
    }

    SECTION("expanded") {
        AABB e = a.expanded(0.5f);
        REQUIRE(e.min == Vec3(-0.5f));
        REQUIRE(e.max == Vec3(2.5f));
    }
}

TEST_CASE("AABB transform encloses rotated box", "[math][aabb]") {
    AABB box(Vec3(-1.0f, -0.5f, -0.5f), Vec3(1.0f, 0.5f, 0.5f));
    Mat4 m = rotation_translation(quat_from_axis_angle(vec3::Y, consts::FRAC_PI_2), Vec3(0.0f, 1.0f, 0.0f));

    AABB t = box.transform(m);
    REQUIRE_THAT(t.min.x, WithinAbs(-0.5f, 1e-5));
    REQUIRE_THAT(t.max.x, WithinAbs(0.5f, 1e-5));
    REQUIRE_THAT(t.min.z, WithinAbs(-1.0f, 1e-5));
    REQUIRE_THAT(t.max.z, WithinAbs(1.0f, 1e-5));
    REQUIRE_THAT(t.min.y, WithinAbs(0.5f, 1e-5));
}

TEST_CASE("AABB distance queries", "[math][aabb]") {
    AABB box(Vec3(0.0f), Vec3(1.0f));
    REQUIRE(box.closest_point(Vec3(2.0f, 0.5f, 0.5f)) == Vec3(1.0f, 0.5f, 0.5f));
    REQUIRE_THAT(box.distance_squared_to_point(Vec3(3.0f, 0.5f, 0.5f)), WithinAbs(4.0f, 1e-6));
    REQUIRE(box.distance_squared_to_point(Vec3(0.5f)) == 0.0f);
}

// =============================================================================
// Sphere Tests
// =============================================================================

TEST_CASE("Sphere queries", "[math][sphere]") {
    Sphere s(Vec3(0.0f), 1.0f);

    REQUIRE(s.contains_point(Vec3(0.5f, 0.0f, 0.0f)));
    REQUIRE_FALSE(s.contains_point(Vec3(1.5f, 0.0f, 0.0f)));
    REQUIRE(s.intersects_sphere(Sphere(Vec3(1.9f, 0.0f, 0.0f), 1.0f)));
    REQUIRE_FALSE(s.intersects_sphere(Sphere(Vec3(2.1f, 0.0f, 0.0f), 1.0f)));
    REQUIRE(s.intersects_aabb(AABB(Vec3(0.9f, -0.1f, -0.1f), Vec3(2.0f, 0.1f, 0.1f))));

    AABB box = s.to_aabb();
    REQUIRE(box.min == Vec3(-1.0f));
    REQUIRE(box.max == Vec3(1.0f));

    Sphere from_box = Sphere::from_aabb(AABB(Vec3(-1.0f), Vec3(1.0f)));
    REQUIRE_THAT(from_box.radius, WithinAbs(std::sqrt(3.0f), 1e-5));
}
