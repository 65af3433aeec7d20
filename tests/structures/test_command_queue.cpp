// arphys_structures CommandQueue tests

#include <catch2/catch_test_macros.hpp>
#include <arphys/structures/command_queue.hpp>
#include <atomic>
#include <functional>
#include <thread>
#include <vector>

using namespace arphys_structures;

TEST_CASE("CommandQueue preserves push order", "[structures][command_queue]") {
    CommandQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.push(3);
    REQUIRE(queue.size() == 3);

    std::vector<int> seen;
    REQUIRE(queue.drain([&seen](int v) { seen.push_back(v); }) == 3);
    REQUIRE(seen == std::vector<int>{1, 2, 3});
    REQUIRE(queue.empty());
}

TEST_CASE("CommandQueue commands pushed during drain wait for the next drain", "[structures][command_queue]") {
    CommandQueue<std::function<void()>> queue;
    int runs = 0;
    queue.push([&] {
        ++runs;
        queue.push([&] { ++runs; });
    });

    queue.drain([](auto& cmd) { cmd(); });
    REQUIRE(runs == 1);
    REQUIRE(queue.size() == 1);

    queue.drain([](auto& cmd) { cmd(); });
    REQUIRE(runs == 2);
}

TEST_CASE("CommandQueue accepts concurrent producers", "[structures][command_queue]") {
    CommandQueue<int> queue;
    constexpr int per_thread = 1000;

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&queue] {
            for (int i = 0; i < per_thread; ++i) {
                queue.push(1);
            }
        });
    }
    for (auto& th : producers) {
        th.join();
    }

    int total = 0;
    queue.drain([&total](int v) { total += v; });
    REQUIRE(total == 4 * per_thread);
}
