// arphys_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <arphys/core/error.hpp>
#include <string>

using namespace arphys_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Something failed");
        REQUIRE(err.message() == "Something failed");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidState, "World is stepping");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.message() == "World is stepping");
    }

    SECTION("with context") {
        Error err = Error("Registration failed").with_context("entity", "42");
        auto* ctx = err.get_context("entity");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "42");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error kinds map to codes", "[core][error]") {
    SECTION("invalid mass") {
        Error err = PhysicsError::invalid_mass(-1.0f);
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.is<PhysicsError>());
        REQUIRE(err.as<PhysicsError>()->kind == PhysicsError::Kind::InvalidMass);
    }

    SECTION("invalid geometry") {
        Error err = PhysicsError::invalid_geometry("radius must be positive");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.message().find("radius") != std::string::npos);
    }

    SECTION("registration errors keep their subject") {
        Error err = PhysicsError::invalid_mass(0.0f);
        REQUIRE(err.as<PhysicsError>()->subject == std::to_string(0.0f));
        REQUIRE(Error(PhysicsError::invalid_geometry("empty mesh")).as<PhysicsError>()->subject.empty());
    }

    SECTION("config errors") {
        REQUIRE(Error(ConfigError::io("/nope.json")).code() == ErrorCode::IOError);
        REQUIRE(Error(ConfigError::parse("line 1")).code() == ErrorCode::ParseError);
        Error err = ConfigError::invalid_value("max_velocity", "must be positive");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.as<ConfigError>()->key == "max_velocity");
        REQUIRE(err.as<PhysicsError>() == nullptr);
    }
}

TEST_CASE("build_error_chain includes kind and context", "[core][error]") {
    Error err = PhysicsError::invalid_geometry("plane normal must be non-zero");
    err.with_context("op", "update_static_collider");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[ValidationError]") != std::string::npos);
    REQUIRE(chain.find("InvalidGeometry") != std::string::npos);
    REQUIRE(chain.find("op=update_static_collider") != std::string::npos);
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();
    debug::record_error(PhysicsError::invalid_mass(0.0f));
    debug::record_error(ConfigError::parse("eof"));
    debug::record_error(Error("plain"));

    REQUIRE(debug::total_error_count() == 3);
    REQUIRE(debug::error_stats_summary().find("physics=1") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST_CASE("Result basic operations", "[core][result]") {
    SECTION("Ok value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
        REQUIRE(*r == 42);
    }

    SECTION("Err value") {
        Result<int> r = Err<int>(PhysicsError::invalid_mass(0.0f));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(r.value_or(-1) == -1);
    }

    SECTION("unwrap on error throws with message") {
        Result<int> r = Err<int>(Error("boom"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);
    }

    SECTION("void result") {
        Result<void> ok = Ok();
        REQUIRE(ok.is_ok());
        Result<void> err = Err(Error("failed"));
        REQUIRE(err.is_err());
        REQUIRE_THROWS(err.unwrap());
    }
}

TEST_CASE("Result combinators", "[core][result]") {
    SECTION("map") {
        Result<int> r = Ok(20);
        auto doubled = r.map([](int v) { return v * 2.0f; });
        REQUIRE(doubled.is_ok());
        REQUIRE(doubled.value() == 40.0f);
    }

    SECTION("map propagates error") {
        Result<int> r = Err<int>(Error("bad"));
        auto mapped = r.map([](int v) { return v + 1; });
        REQUIRE(mapped.is_err());
        REQUIRE(mapped.error().message() == "bad");
    }

    SECTION("and_then") {
        Result<int> r = Ok(5);
        auto chained = r.and_then([](int v) -> Result<std::string> {
            if (v > 3) return Ok(std::string("big"));
            return Err<std::string>(Error("small"));
        });
        REQUIRE(chained.is_ok());
        REQUIRE(chained.value() == "big");
    }
}
