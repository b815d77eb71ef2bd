#include <catch2/catch_test_macros.hpp>
#include "WorkQueue.h"

#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <thread>

using frontier_crawler::crawler::WorkQueue;
using namespace std::chrono_literals;

TEST_CASE("WorkQueue hands out ready entries in order", "[WorkQueue]") {
    WorkQueue queue;
    queue.push("https://a.com/1");
    queue.push("https://a.com/2");
    REQUIRE(queue.size() == 2);

    REQUIRE(queue.waitAndPop(10ms) == std::optional<std::string>("https://a.com/1"));
    REQUIRE(queue.waitAndPop(10ms) == std::optional<std::string>("https://a.com/2"));
    REQUIRE(queue.empty());

    SECTION("Times out when empty") {
        auto started = std::chrono::steady_clock::now();
        REQUIRE_FALSE(queue.waitAndPop(50ms).has_value());
        REQUIRE(std::chrono::steady_clock::now() - started >= 50ms);
    }
}

TEST_CASE("WorkQueue holds delayed entries back", "[WorkQueue]") {
    WorkQueue queue;
    queue.pushDelayed("https://a.com/retry", 200ms);

    REQUIRE(queue.size() == 1);
    REQUIRE(queue.delayedSize() == 1);
    REQUIRE_FALSE(queue.waitAndPop(20ms).has_value());

    auto item = queue.waitAndPop(2000ms);
    REQUIRE(item == std::optional<std::string>("https://a.com/retry"));
    REQUIRE(queue.empty());

    SECTION("Zero delay is an ordinary push") {
        queue.pushDelayed("https://a.com/now", 0ms);
        REQUIRE(queue.delayedSize() == 0);
        REQUIRE(queue.waitAndPop(10ms).has_value());
    }
}

TEST_CASE("WorkQueue releases a blocked consumer on push", "[WorkQueue]") {
    WorkQueue queue;
    auto consumer = std::async(std::launch::async, [&queue] { return queue.waitAndPop(5000ms); });

    std::this_thread::sleep_for(50ms);
    queue.push("https://a.com/late");

    REQUIRE(consumer.wait_for(2s) == std::future_status::ready);
    REQUIRE(consumer.get() == std::optional<std::string>("https://a.com/late"));
}

TEST_CASE("WorkQueue wakeAll releases idle consumers", "[WorkQueue]") {
    WorkQueue queue;
    auto consumer = std::async(std::launch::async, [&queue] { return queue.waitAndPop(10000ms); });

    std::this_thread::sleep_for(50ms);
    queue.wakeAll();

    REQUIRE(consumer.wait_for(2s) == std::future_status::ready);
    REQUIRE_FALSE(consumer.get().has_value());
}

TEST_CASE("WorkQueue removeByPrefix matches literally", "[WorkQueue]") {
    WorkQueue queue;
    queue.push("https://a.com/blog/1");
    queue.push("https://a.com/blogger");
    queue.push("https://a.com/about");
    queue.pushDelayed("https://a.com/blog/2", 60000ms);

    REQUIRE(queue.removeByPrefix("https://a.com/blog") == 3);
    REQUIRE(queue.size() == 1);
    REQUIRE(queue.waitAndPop(10ms) == std::optional<std::string>("https://a.com/about"));
}

TEST_CASE("WorkQueue serves concurrent consumers without loss", "[WorkQueue]") {
    WorkQueue queue;
    const int total = 200;
    for (int i = 0; i < total; ++i) {
        queue.push("https://a.com/" + std::to_string(i));
    }

    std::mutex seenMutex;
    std::set<std::string> seen;
    std::vector<std::thread> consumers;
    for (int t = 0; t < 4; ++t) {
        consumers.emplace_back([&] {
            while (auto url = queue.waitAndPop(50ms)) {
                std::lock_guard<std::mutex> lock(seenMutex);
                seen.insert(*url);
            }
        });
    }
    for (auto& thread : consumers) {
        thread.join();
    }

    REQUIRE(seen.size() == static_cast<size_t>(total));
    REQUIRE(queue.empty());
}
