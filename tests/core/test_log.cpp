// arphys_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <arphys/core/log.hpp>

using namespace arphys_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
}

TEST_CASE("log_level_name round trips parse_log_level", "[core][log]") {
    for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
                       spdlog::level::warn, spdlog::level::err, spdlog::level::critical}) {
        auto parsed = parse_log_level(log_level_name(level));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == level);
    }
}

TEST_CASE("Named loggers are cached", "[core][log]") {
    auto a = get_logger("test_logger");
    auto b = get_logger("test_logger");
    REQUIRE(a == b);
    REQUIRE(a->name() == "test_logger");
    REQUIRE(physics_logger()->name() == "arphys_physics");
    REQUIRE(perf_logger()->name() == "arphys_perf");
}

TEST_CASE("Global level applies to registered loggers", "[core][log]") {
    auto logger = get_logger("level_check");

    set_global_log_level(spdlog::level::warn);
    REQUIRE(get_global_log_level() == spdlog::level::warn);
    REQUIRE(logger->level() == spdlog::level::warn);

    set_logger_level("level_check", spdlog::level::trace);
    REQUIRE(logger->level() == spdlog::level::trace);

    set_global_log_level(spdlog::level::info);
    REQUIRE(logger->level() == spdlog::level::info);
}

TEST_CASE("LogScope and structured logging do not throw", "[core][log]") {
    REQUIRE_NOTHROW([] {
        LogScope scope("unit", "scope_check");
        log_structured(spdlog::level::info, "scope_check", "snap", {{"entity", "1"}, {"target", "2"}});
    }());
}
