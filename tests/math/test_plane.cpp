// arphys_math plane and frustum tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arphys/math/math.hpp>

using namespace arphys_math;
using Catch::Matchers::WithinAbs;

TEST_CASE("Plane signed distance", "[math][plane]") {
    Plane floor = Plane::from_point_normal(Vec3(0.0f, 1.0f, 0.0f), vec3::UP);

    REQUIRE_THAT(floor.signed_distance(Vec3(0.0f, 3.0f, 0.0f)), WithinAbs(2.0f, 1e-6));
    REQUIRE_THAT(floor.signed_distance(Vec3(5.0f, 0.0f, 5.0f)), WithinAbs(-1.0f, 1e-6));
    REQUIRE(approx_equal(floor.closest_point(Vec3(2.0f, 7.0f, -1.0f)), Vec3(2.0f, 1.0f, -1.0f)));
    REQUIRE(approx_equal(floor.origin_point(), Vec3(0.0f, 1.0f, 0.0f)));
}

TEST_CASE("Plane normalizes its normal", "[math][plane]") {
    Plane p(Vec3(0.0f, 0.0f, 2.0f), 4.0f);
    REQUIRE_THAT(length(p.normal), WithinAbs(1.0f, 1e-6));
    REQUIRE_THAT(p.distance, WithinAbs(2.0f, 1e-6));

    Plane degenerate(vec3::ZERO, 1.0f);
    REQUIRE(degenerate.normal == vec3::UP);
}

TEST_CASE("Frustum sphere test", "[math][frustum]") {
    Mat4 proj = glm::perspective(consts::FRAC_PI_2, 1.0f, 0.1f, 100.0f);
    Mat4 view = glm::lookAt(vec3::ZERO, vec3::FORWARD, vec3::UP);
    FrustumPlanes frustum = FrustumPlanes::from_view_projection(proj * view);

    REQUIRE(frustum.test_sphere(Vec3(0.0f, 0.0f, -10.0f), 0.5f) == FrustumTestResult::Inside);
    REQUIRE(frustum.test_sphere(Vec3(0.0f, 0.0f, 10.0f), 0.5f) == FrustumTestResult::Outside);
    REQUIRE(frustum.test_sphere(Vec3(0.0f, 0.0f, -200.0f), 1.0f) == FrustumTestResult::Outside);
    REQUIRE(frustum.test_sphere(Vec3(0.0f, 0.0f, -100.0f), 1.0f) == FrustumTestResult::Intersecting);
}
