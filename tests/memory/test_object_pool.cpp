/// @file test_object_pool.cpp
/// @brief Tests for ObjectPool

#include <catch2/catch_test_macros.hpp>
#include <arphys/memory/fwd.hpp>
#include <arphys/memory/object_pool.hpp>
#include <vector>

using namespace arphys_memory;

TEST_CASE("ObjectPool: acquire from empty pool creates", "[memory][object_pool]") {
    ObjectPool<std::vector<int>> pool(4);

    auto v = pool.acquire();
    REQUIRE(v.empty());
    REQUIRE(pool.stats().created == 1);
    REQUIRE(pool.stats().reused == 0);
}

TEST_CASE("ObjectPool: release then acquire reuses", "[memory][object_pool]") {
    ObjectPool<std::vector<int>> pool(4, [](std::vector<int>& v) { v.clear(); });

    auto v = pool.acquire();
    v.reserve(64);
    v.push_back(1);
    pool.release(std::move(v));
    REQUIRE(pool.idle_count() == 1);

    auto again = pool.acquire();
    REQUIRE(again.empty());
    REQUIRE(again.capacity() >= 64);
    REQUIRE(pool.stats().reused == 1);
    REQUIRE(pool.idle_count() == 0);
}

TEST_CASE("ObjectPool: release beyond max is dropped", "[memory][object_pool]") {
    ObjectPool<int> pool(2);
    pool.release(1);
    pool.release(2);
    pool.release(3);

    REQUIRE(pool.idle_count() == 2);
    REQUIRE(pool.stats().dropped == 1);
    REQUIRE(pool.acquire() == 2);
}

TEST_CASE("ObjectPool: trim keeps half of max", "[memory][object_pool]") {
    ObjectPool<int> pool(10);
    for (int i = 0; i < 10; ++i) {
        pool.release(i);
    }

    REQUIRE(pool.trim() == 5);
    REQUIRE(pool.idle_count() == 5);
    REQUIRE(pool.trim() == 0);

    REQUIRE(pool.clear() == 5);
    REQUIRE(pool.idle_count() == 0);
    REQUIRE(pool.stats().trimmed == 10);
}

TEST_CASE("ObjectPool: shrinking max size", "[memory][object_pool]") {
    ObjectPool<int> pool(8);
    for (int i = 0; i < 8; ++i) {
        pool.release(i);
    }
    pool.set_max_size(4);
    REQUIRE(pool.max_size() == 4);
    REQUIRE(pool.trim() == 6);
    REQUIRE(pool.idle_count() == 2);
}
