// arphys_physics integrator tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arphys/physics/integrator.hpp>

using namespace arphys_physics;
using arphys_math::Vec3;
using Catch::Matchers::WithinAbs;

TEST_CASE("Integrator linear motion", "[physics][integrator]") {
    PhysicsEntity e;
    e.mass = 2.0f;

    SECTION("constant velocity") {
        e.linear_velocity = Vec3(1.0f, 0.0f, 0.0f);
        Integrator::integrate(e, 0.5f, 10.0f);
        REQUIRE_THAT(e.position.x, WithinAbs(0.5f, 1e-6));
    }

    SECTION("force uses half a dt squared") {
        e.force = Vec3(0.0f, 4.0f, 0.0f);   // a = 2
        Integrator::integrate(e, 1.0f, 10.0f);
        REQUIRE_THAT(e.position.y, WithinAbs(1.0f, 1e-6));
        REQUIRE_THAT(e.linear_velocity.y, WithinAbs(2.0f, 1e-6));
        REQUIRE(e.force == arphys_math::vec3::ZERO);
    }

    SECTION("speed is clamped") {
        e.linear_velocity = Vec3(30.0f, 40.0f, 0.0f);
        Integrator::integrate(e, 0.01f, 10.0f);
        REQUIRE_THAT(e.linear_speed(), WithinAbs(10.0f, 1e-4));
    }
}

TEST_CASE("Integrator angular motion", "[physics][integrator]") {
    PhysicsEntity e;
    e.angular_velocity = Vec3(0.0f, arphys_math::consts::PI, 0.0f);

    Integrator::integrate(e, 0.5f, 10.0f);

    // Quarter turn about +Y takes forward (-Z) to -X
    const Vec3 forward = arphys_math::forward_of(e.orientation);
    REQUIRE_THAT(forward.x, WithinAbs(-1.0f, 1e-5));
    REQUIRE_THAT(forward.z, WithinAbs(0.0f, 1e-5));

    SECTION("torque accelerates and is cleared") {
        PhysicsEntity spun;
        spun.moment_of_inertia = 0.5f;
        spun.torque = Vec3(0.0f, 0.0f, 1.0f);
        Integrator::integrate(spun, 1.0f, 10.0f);
        REQUIRE_THAT(spun.angular_velocity.z, WithinAbs(2.0f, 1e-6));
        REQUIRE(spun.torque == arphys_math::vec3::ZERO);
    }
}

TEST_CASE("Integrator skips kinematic entities", "[physics][integrator]") {
    PhysicsEntity e;
    e.is_kinematic = true;
    e.linear_velocity = Vec3(1.0f);
    e.force = Vec3(5.0f);

    Integrator::integrate(e, 1.0f, 10.0f);

    REQUIRE(e.position == arphys_math::vec3::ZERO);
    REQUIRE(e.force == Vec3(5.0f));
}
