// arphys_physics config tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arphys/physics/config.hpp>

#include <cstdio>
#include <filesystem>

using namespace arphys_physics;
using Catch::Matchers::WithinAbs;

TEST_CASE("PhysicsConfig defaults validate", "[physics][config]") {
    REQUIRE(PhysicsConfig::defaults().validate().is_ok());
    REQUIRE(PhysicsConfig::high_fidelity().validate().is_ok());
    REQUIRE(PhysicsConfig::performance_preset().validate().is_ok());

    const auto fast = PhysicsConfig::performance_preset();
    REQUIRE(fast.quality == QualityTier::Low);
    REQUIRE(fast.precision == CollisionPrecision::Reduced);
    REQUIRE_FALSE(fast.shadows_enabled);
}

TEST_CASE("PhysicsConfig quality tiers", "[physics][config]") {
    PhysicsConfig config;

    config.apply_quality(QualityTier::Medium);
    REQUIRE_THAT(config.performance_budget, WithinAbs(0.012f, 1e-6));
    REQUIRE(config.shadows_enabled);
    REQUIRE_FALSE(config.occlusion_enabled);

    config.apply_quality(QualityTier::Ultra);
    REQUIRE_THAT(config.performance_budget, WithinAbs(0.005f, 1e-6));
    REQUIRE(config.precision == CollisionPrecision::Full);
}

TEST_CASE("PhysicsConfig validation reports the offending key", "[physics][config]") {
    PhysicsConfig config;

    SECTION("damping") {
        config.linear_damping = 1.5f;
        auto result = config.validate();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == arphys_core::ErrorCode::ValidationError);
        REQUIRE(result.error().as<arphys_core::ConfigError>()->key == "linear_damping");
    }

    SECTION("snap radius below snap distance") {
        config.snap_search_radius = 0.01f;
        REQUIRE(config.validate().error().as<arphys_core::ConfigError>()->key == "snap_search_radius");
    }

    SECTION("lod distances must ascend") {
        config.performance.lod_distances = {5.0f, 4.0f, 30.0f, 50.0f};
        REQUIRE(config.validate().is_err());
    }
}

TEST_CASE("PhysicsConfig from JSON", "[physics][config]") {
    SECTION("missing keys keep their defaults") {
        auto result = PhysicsConfig::from_json(R"({"gravity": [0, -3.7, 0], "time_to_sleep": 2.5})");
        REQUIRE(result.is_ok());
        REQUIRE_THAT(result.value().gravity.y, WithinAbs(-3.7f, 1e-6));
        REQUIRE_THAT(result.value().time_to_sleep, WithinAbs(2.5f, 1e-6));
        REQUIRE_THAT(result.value().snap_distance, WithinAbs(0.05f, 1e-6));
    }

    SECTION("quality seeds the tier fields, explicit keys win") {
        auto result = PhysicsConfig::from_json(R"({"quality": "low", "shadows_enabled": true})");
        REQUIRE(result.is_ok());
        REQUIRE(result.value().quality == QualityTier::Low);
        REQUIRE_THAT(result.value().performance_budget, WithinAbs(0.020f, 1e-6));
        REQUIRE(result.value().shadows_enabled);
    }

    SECTION("nested performance block") {
        auto result = PhysicsConfig::from_json(
            R"({"performance": {"lod_distances": [2, 4, 8, 16], "emergency_frame_count": 5}})");
        REQUIRE(result.is_ok());
        REQUIRE_THAT(result.value().performance.lod_distances[2], WithinAbs(8.0f, 1e-6));
        REQUIRE(result.value().performance.emergency_frame_count == 5);
    }

    SECTION("malformed text") {
        auto result = PhysicsConfig::from_json("{ not json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == arphys_core::ErrorCode::ParseError);
    }

    SECTION("unknown quality tier") {
        auto result = PhysicsConfig::from_json(R"({"quality": "cinematic"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == arphys_core::ErrorCode::ValidationError);
    }

    SECTION("wrong value type") {
        REQUIRE(PhysicsConfig::from_json(R"({"max_velocity": "fast"})").is_err());
    }

    SECTION("out of range value") {
        REQUIRE(PhysicsConfig::from_json(R"({"default_friction": 2.0})").is_err());
    }

    SECTION("top level must be an object") {
        REQUIRE(PhysicsConfig::from_json("[1, 2, 3]").is_err());
    }
}

TEST_CASE("PhysicsConfig JSON round trip", "[physics][config]") {
    PhysicsConfig config = PhysicsConfig::performance_preset();
    config.snap_distance = 0.08f;
    config.performance.adaptive_cell_size = true;

    auto parsed = PhysicsConfig::from_json(config.to_json());
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().quality == QualityTier::Low);
    REQUIRE(parsed.value().precision == CollisionPrecision::Reduced);
    REQUIRE_THAT(parsed.value().snap_distance, WithinAbs(0.08f, 1e-6));
    REQUIRE_THAT(parsed.value().grid_cell_size, WithinAbs(2.0f, 1e-6));
    REQUIRE_THAT(parsed.value().performance.lod_distances[0], WithinAbs(3.0f, 1e-6));
    REQUIRE(parsed.value().performance.adaptive_cell_size);
}

TEST_CASE("PhysicsConfig files", "[physics][config]") {
    SECTION("missing file") {
        auto result = PhysicsConfig::load_from_file("/nonexistent/arphys/physics.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == arphys_core::ErrorCode::IOError);
    }

    SECTION("save and load") {
        const auto path = (std::filesystem::temp_directory_path() / "arphys_config_test.json").string();
        PhysicsConfig config;
        config.time_to_sleep = 3.0f;
        REQUIRE(config.save_to_file(path).is_ok());

        auto loaded = PhysicsConfig::load_from_file(path);
        REQUIRE(loaded.is_ok());
        REQUIRE_THAT(loaded.value().time_to_sleep, WithinAbs(3.0f, 1e-6));
        std::remove(path.c_str());
    }
}
