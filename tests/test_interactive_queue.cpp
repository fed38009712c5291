#include <catch2/catch_test_macros.hpp>

#include "jobs/interactive_queue.hpp"

#include <atomic>
#include <thread>
#include <vector>

TEST_CASE("InteractiveQueue", "[queue]") {
    InteractiveQueue queue;

    SECTION("ConstructingThreadOwns") {
        REQUIRE(queue.on_owner_thread());
        bool other = true;
        std::thread t([&] { other = queue.on_owner_thread(); });
        t.join();
        REQUIRE_FALSE(other);
    }

    SECTION("DrainRunsInOrder") {
        std::vector<int> ran;
        queue.post([&] { ran.push_back(1); });
        queue.post([&] { ran.push_back(2); });
        REQUIRE(queue.pending() == 2);
        REQUIRE(queue.drain() == 2);
        REQUIRE(ran == std::vector<int>{1, 2});
        REQUIRE(queue.pending() == 0);
    }

    SECTION("TasksPostedWhileDrainingRun") {
        int count = 0;
        queue.post([&] {
            ++count;
            queue.post([&] { ++count; });
        });
        REQUIRE(queue.drain() == 2);
        REQUIRE(count == 2);
    }

    SECTION("NotifyOnPost") {
        std::atomic<int> wakeups{0};
        queue.set_notify([&] { ++wakeups; });
        std::thread worker([&] { queue.post([] {}); });
        worker.join();
        REQUIRE(wakeups == 1);
        REQUIRE(queue.drain() == 1);
    }

    SECTION("SetOwner") {
        std::thread::id other;
        std::thread t([&] { other = std::this_thread::get_id(); });
        t.join();
        queue.set_owner(other);
        REQUIRE_FALSE(queue.on_owner_thread());
        queue.set_owner(std::this_thread::get_id());
        REQUIRE(queue.on_owner_thread());
    }
}
