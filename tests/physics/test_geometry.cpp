// arphys_physics geometry tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arphys/physics/geometry.hpp>

#include <cmath>
#include <limits>

using namespace arphys_physics;
using arphys_math::Vec2;
using arphys_math::Vec3;
using Catch::Matchers::WithinAbs;

TEST_CASE("Geometry factories validate their input", "[physics][geometry]") {
    SECTION("sphere") {
        REQUIRE(make_sphere(0.5f).is_ok());
        REQUIRE(make_sphere(0.0f).is_err());
        REQUIRE(make_sphere(-1.0f).is_err());
    }

    SECTION("box") {
        REQUIRE(make_box(1.0f, 2.0f, 3.0f).is_ok());
        auto flat = make_box(1.0f, 0.0f, 1.0f);
        REQUIRE(flat.is_err());
        REQUIRE(flat.error().code() == arphys_core::ErrorCode::ValidationError);
    }

    SECTION("plane") {
        REQUIRE(make_floor_plane(0.0f, Vec2(2.0f, 2.0f)).is_ok());
        REQUIRE(make_plane(Vec3(0.0f), Vec3(0.0f), Vec2(1.0f, 1.0f)).is_err());
        REQUIRE(make_wall_plane(arphys_math::vec3::X, 0.0f, Vec2(0.0f, 1.0f)).is_err());
    }

    SECTION("non-finite planes") {
        const float inf = std::numeric_limits<float>::infinity();
        REQUIRE(make_floor_plane(0.0f, Vec2(inf, inf)).is_err());
        REQUIRE(make_floor_plane(0.0f, Vec2(4.0f, std::nanf(""))).is_err());
        REQUIRE(make_floor_plane(inf, Vec2(4.0f, 4.0f)).is_err());
        REQUIRE(validate(PlaneGeometry{Vec3(0.0f, inf, 0.0f), 0.0f, Vec2(1.0f)}).is_err());
    }

    SECTION("mesh") {
        std::vector<Vec3> tri{{0, 0, 0}, {1, 0, 0}, {0, 1, 0}};
        REQUIRE(make_mesh(tri, {0, 1, 2}).is_ok());
        REQUIRE(make_mesh(tri, {0, 1}).is_err());
        REQUIRE(make_mesh(tri, {0, 1, 7}).is_err());
        REQUIRE(make_mesh({}, {0, 1, 2}).is_err());

        std::vector<Vec3> broken{{0, 0, 0}, {std::nanf(""), 0, 0}, {0, 1, 0}};
        REQUIRE(make_mesh(broken, {0, 1, 2}).is_err());
    }
}

TEST_CASE("Geometry bounding radius and volume", "[physics][geometry]") {
    REQUIRE_THAT(bounding_radius(SphereGeometry{0.3f}), WithinAbs(0.3f, 1e-6));
    REQUIRE_THAT(bounding_radius(BoxGeometry{Vec3(2.0f, 2.0f, 1.0f)}), WithinAbs(1.5f, 1e-5));

    REQUIRE_THAT(volume(BoxGeometry{Vec3(1.0f, 2.0f, 3.0f)}), WithinAbs(6.0f, 1e-5));
    REQUIRE_THAT(volume(SphereGeometry{1.0f}), WithinAbs(4.18879f, 1e-4));
    REQUIRE_THAT(volume(PlaneGeometry{}), WithinAbs(0.0f, 1e-6));

    REQUIRE_THAT(surface_area(BoxGeometry{Vec3(1.0f)}), WithinAbs(6.0f, 1e-5));
    REQUIRE_THAT(surface_area(PlaneGeometry{arphys_math::vec3::UP, 0.0f, Vec2(2.0f, 3.0f)}), WithinAbs(6.0f, 1e-5));
}

TEST_CASE("Geometry mesh volume and containment", "[physics][geometry]") {
    // Unit cube, outward winding
    std::vector<Vec3> v{
        {0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0},
        {0, 0, 1}, {1, 0, 1}, {1, 1, 1}, {0, 1, 1},
    };
    std::vector<std::uint32_t> idx{
        0, 2, 1, 0, 3, 2,   // -z
        4, 5, 6, 4, 6, 7,   // +z
        0, 1, 5, 0, 5, 4,   // -y
        3, 7, 6, 3, 6, 2,   // +y
        0, 4, 7, 0, 7, 3,   // -x
        1, 2, 6, 1, 6, 5,   // +x
    };

    auto mesh = make_mesh(v, idx);
    REQUIRE(mesh.is_ok());

    REQUIRE_THAT(volume(mesh.value()), WithinAbs(1.0f, 1e-5));
    REQUIRE(contains_point(mesh.value(), Vec3(0.5f, 0.5f, 0.5f)));
    REQUIRE_FALSE(contains_point(mesh.value(), Vec3(1.5f, 0.5f, 0.5f)));

    const auto box = local_bounds(mesh.value());
    REQUIRE(arphys_math::approx_equal(box.min, Vec3(0.0f)));
    REQUIRE(arphys_math::approx_equal(box.max, Vec3(1.0f)));
}

TEST_CASE("Geometry plane patch", "[physics][geometry]") {
    auto floor = make_floor_plane(0.5f, Vec2(4.0f, 2.0f));
    REQUIRE(floor.is_ok());

    const auto box = local_bounds(floor.value());
    REQUIRE_THAT(box.center().y, WithinAbs(0.5f, 1e-6));
    REQUIRE_THAT(box.size().x, WithinAbs(4.0f, 1e-5));
    REQUIRE_THAT(box.size().z, WithinAbs(2.0f, 1e-5));

    SECTION("make_plane stores the offset along the normal") {
        auto wall = make_plane(Vec3(-2.0f, 0.0f, 0.0f), Vec3(3.0f, 1.0f, 0.0f), Vec2(1.0f, 1.0f));
        REQUIRE(wall.is_ok());
        const auto& p = std::get<PlaneGeometry>(wall.value());
        REQUIRE(arphys_math::approx_equal(p.normal, Vec3(-1.0f, 0.0f, 0.0f)));
        REQUIRE_THAT(p.distance, WithinAbs(-3.0f, 1e-6));
    }

    SECTION("axes are orthonormal and horizontal for walls") {
        Vec3 u, v;
        plane_axes(arphys_math::vec3::Z, u, v);
        REQUIRE_THAT(glm::dot(u, v), WithinAbs(0.0f, 1e-6));
        REQUIRE_THAT(u.y, WithinAbs(0.0f, 1e-6));
        REQUIRE_THAT(arphys_math::length(u), WithinAbs(1.0f, 1e-6));
        REQUIRE_THAT(arphys_math::length(v), WithinAbs(1.0f, 1e-6));
    }
}

TEST_CASE("Geometry raycast", "[physics][geometry]") {
    SECTION("sphere") {
        auto hit = raycast(SphereGeometry{1.0f}, Vec3(0.0f, 0.0f, -5.0f), arphys_math::vec3::Z);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(*hit, WithinAbs(4.0f, 1e-5));
    }

    SECTION("box") {
        auto hit = raycast(BoxGeometry{Vec3(2.0f)}, Vec3(-5.0f, 0.0f, 0.0f), arphys_math::vec3::X);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(*hit, WithinAbs(4.0f, 1e-5));
        REQUIRE_FALSE(raycast(BoxGeometry{Vec3(2.0f)}, Vec3(-5.0f, 3.0f, 0.0f), arphys_math::vec3::X));
    }

    SECTION("plane patch misses outside its extent") {
        PlaneGeometry floor{arphys_math::vec3::UP, 0.0f, Vec2(1.0f, 1.0f)};
        auto hit = raycast(floor, Vec3(0.0f, 2.0f, 0.0f), arphys_math::vec3::DOWN);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(*hit, WithinAbs(2.0f, 1e-5));
        REQUIRE_FALSE(raycast(floor, Vec3(3.0f, 2.0f, 0.0f), arphys_math::vec3::DOWN));
    }

    SECTION("max distance") {
        REQUIRE_FALSE(raycast(SphereGeometry{1.0f}, Vec3(0.0f, 0.0f, -5.0f), arphys_math::vec3::Z, 3.0f));
    }
}

TEST_CASE("Geometry from handle extents", "[physics][geometry]") {
    auto g = geometry_from_extents(Vec3(1.0f, 0.0f, 2.0f));
    const auto& box = std::get<BoxGeometry>(g);
    REQUIRE(box.size.y > 0.0f);
    REQUIRE_THAT(box.size.x, WithinAbs(1.0f, 1e-6));
    REQUIRE(validate(g).is_ok());

    auto degenerate = geometry_from_extents(Vec3(std::nanf(""), 1.0f, 1.0f));
    REQUIRE(validate(degenerate).is_ok());
}
