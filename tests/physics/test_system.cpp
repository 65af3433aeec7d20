// arphys_physics system tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arphys/physics/physics.hpp>

using namespace arphys_physics;
using arphys_math::Mat4;
using arphys_math::Vec2;
using arphys_math::Vec3;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float k_dt = 1.0f / 60.0f;

PhysicsConfig floating_config() {
    PhysicsConfig config;
    config.gravity_enabled = false;
    config.auto_snap_enabled = false;
    return config;
}

void feed_floor(PhysicsSystem& system, float height) {
    system.surfaces().enqueue(
        SurfaceEvent::added("floor", Mat4(1.0f), make_floor_plane(height, Vec2(4.0f, 4.0f)).value()));
}

} // anonymous namespace

TEST_CASE("PhysicsSystem applies surface events on update", "[physics][system]") {
    PhysicsSystem system(floating_config());
    feed_floor(system, 0.0f);

    REQUIRE(system.world().collision().static_collider_count() == 0);
    system.update(k_dt);

    REQUIRE(system.world().collision().static_collider_count() == 1);
    REQUIRE(system.snap().snap_target_count() == 1);
    REQUIRE(system.stats().surfaces == 1);
}

TEST_CASE("PhysicsSystem entity registration", "[physics][system]") {
    PhysicsSystem system(floating_config());

    const EntityId ball =
        system.add_entity(EntityDesc::make_dynamic(Vec3(0.0f, 1.0f, 0.0f), 1.0f, SphereGeometry{0.25f})).value();
    REQUIRE(system.snap().is_registered(ball));

    const EntityId mover = system.add_entity(EntityDesc::make_kinematic(Vec3(1.0f), SphereGeometry{0.25f})).value();
    REQUIRE_FALSE(system.snap().is_registered(mover));

    EntityDesc fixed = EntityDesc::make_dynamic(Vec3(2.0f), 1.0f, SphereGeometry{0.25f});
    fixed.can_snap = false;
    const EntityId pinned = system.add_entity(fixed).value();
    REQUIRE_FALSE(system.snap().is_registered(pinned));

    SECTION("invalid entities are not registered anywhere") {
        auto bad = system.add_entity(EntityDesc::make_dynamic(Vec3(0.0f), -1.0f, SphereGeometry{0.25f}));
        REQUIRE(bad.is_err());
        REQUIRE(system.world().entity_count() == 3);
    }

    SECTION("removal unregisters") {
        REQUIRE(system.remove_entity(ball));
        REQUIRE_FALSE(system.snap().is_registered(ball));
        REQUIRE(system.world().entity(ball) == nullptr);
        REQUIRE_FALSE(system.remove_entity(ball));
    }
}

TEST_CASE("PhysicsSystem snaps onto fed surfaces", "[physics][system]") {
    PhysicsSystem system(floating_config());
    feed_floor(system, 0.0f);
    const EntityId ball =
        system.add_entity(EntityDesc::make_dynamic(Vec3(0.5f, 0.5f, 0.5f), 1.0f, SphereGeometry{0.25f})).value();
    system.update(k_dt);

    SnapResult result = system.snap_to_surface(ball, SnapType::Floor);
    REQUIRE(result.snapped);
    REQUIRE_THAT(result.snap_point.y, WithinAbs(0.25f, 1e-5));

    for (int i = 0; i < 60; ++i) {
        system.update(k_dt);
    }
    REQUIRE(system.snap().is_snapped(ball));
    REQUIRE_THAT(system.world().entity(ball)->position.y, WithinAbs(0.25f, 0.02f));
    REQUIRE(system.stats().snap.successful_snaps == 1);
}

TEST_CASE("PhysicsSystem drops furniture onto the floor", "[physics][system]") {
    PhysicsConfig config;
    config.auto_snap_enabled = false;
    PhysicsSystem system(config);
    feed_floor(system, 0.0f);

    const EntityId ball =
        system.add_entity(EntityDesc::make_dynamic(Vec3(0.0f, 1.0f, 0.0f), 1.0f, SphereGeometry{0.25f})).value();
    for (int i = 0; i < 240; ++i) {
        system.update(k_dt);
    }

    const float y = system.world().entity(ball)->position.y;
    REQUIRE(y > 0.2f);
    REQUIRE(y < 0.35f);
}

TEST_CASE("PhysicsSystem quality changes reach the world on the next step", "[physics][system]") {
    PhysicsSystem system;
    system.set_quality(QualityTier::Low);

    REQUIRE(system.config().quality == QualityTier::Low);
    REQUIRE_THAT(system.config().performance_budget, WithinAbs(0.020f, 1e-6));
    REQUIRE(system.world().has_pending_config());
    REQUIRE(system.world().config().quality == QualityTier::High);

    system.update(k_dt);
    REQUIRE_FALSE(system.world().has_pending_config());
    REQUIRE(system.world().config().quality == QualityTier::Low);
}

TEST_CASE("PhysicsSystem emergency mode degrades the world config", "[physics][system]") {
    PhysicsConfig config = floating_config();
    config.performance_budget = 1e-9f;   // every frame is over budget
    PhysicsSystem system(config);
    system.add_entity(EntityDesc::make_dynamic(Vec3(0.0f), 1.0f, SphereGeometry{0.25f})).value();

    REQUIRE_FALSE(system.update(k_dt).enter_emergency);
    REQUIRE_FALSE(system.update(k_dt).enter_emergency);
    const FrameDirective directive = system.update(k_dt);
    REQUIRE(directive.enter_emergency);
    REQUIRE(system.performance().is_emergency());
    REQUIRE(system.stats().performance.emergency_activations == 1);

    system.update(k_dt);
    REQUIRE_THAT(system.world().config().sleep_threshold, WithinAbs(config.sleep_threshold * 2.0f, 1e-7));
    REQUIRE_FALSE(system.world().config().shadows_enabled);

    // The requested config is untouched
    REQUIRE_THAT(system.config().sleep_threshold, WithinAbs(config.sleep_threshold, 1e-7));

    SECTION("config updates stay degraded while the emergency lasts") {
        PhysicsConfig next = system.config();
        next.time_to_sleep = 2.0f;
        system.update_config(next);
        system.update(k_dt);
        REQUIRE_THAT(system.world().config().time_to_sleep, WithinAbs(1.0f, 1e-6));
        REQUIRE_THAT(system.config().time_to_sleep, WithinAbs(2.0f, 1e-6));
    }
}

TEST_CASE("PhysicsSystem stats", "[physics][system]") {
    PhysicsSystem system(floating_config());
    feed_floor(system, 0.0f);
    system.add_entity(EntityDesc::make_dynamic(Vec3(0.0f, 1.0f, 0.0f), 1.0f, SphereGeometry{0.25f})).value();
    system.add_entity(EntityDesc::make_dynamic(Vec3(1.0f, 1.0f, 0.0f), 1.0f, SphereGeometry{0.25f})).value();

    system.update(k_dt);
    system.update(k_dt);

    const PhysicsStats stats = system.stats();
    REQUIRE(stats.world.total_entities == 2);
    REQUIRE(stats.world.step_count == 2);
    REQUIRE_THAT(stats.world.simulated_time, WithinAbs(2.0 * k_dt, 1e-6));
    REQUIRE(stats.collision.static_colliders == 1);
    REQUIRE(stats.snap.snap_targets == 1);
    REQUIRE(stats.surfaces == 1);
    REQUIRE(stats.frame_time_ms >= 0.0f);
    REQUIRE(stats.performance.memory_bytes > 0);
}

TEST_CASE("PhysicsSystem with simulation disabled", "[physics][system]") {
    PhysicsConfig config;
    config.simulation_enabled = false;
    PhysicsSystem system(config);
    const EntityId ball =
        system.add_entity(EntityDesc::make_dynamic(Vec3(0.0f, 1.0f, 0.0f), 1.0f, SphereGeometry{0.25f})).value();

    for (int i = 0; i < 10; ++i) {
        system.update(k_dt);
    }
    REQUIRE(system.stats().world.step_count == 0);
    REQUIRE_THAT(system.world().entity(ball)->position.y, WithinAbs(1.0f, 1e-6));
}
