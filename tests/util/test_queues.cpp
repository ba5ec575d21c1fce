#include "util/queues.hpp"

#include <catch2/catch_test_macros.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace scape::util;

TEST_CASE("SPSCQueue rejects capacities that are not powers of two", "[queues]") {
    REQUIRE_THROWS_AS(SPSCQueue<int>(0), std::invalid_argument);
    REQUIRE_THROWS_AS(SPSCQueue<int>(6), std::invalid_argument);

    SPSCQueue<int> queue(8);
    REQUIRE(queue.capacity() == 8);
    REQUIRE(queue.size() == 0);
}

TEST_CASE("SPSCQueue keeps FIFO order and reports fullness", "[queues]") {
    SPSCQueue<int> queue(4);

    for (int i = 0; i < 4; ++i) {
        REQUIRE(queue.try_push(i));
    }
    REQUIRE_FALSE(queue.try_push(99));
    REQUIRE(queue.size() == 4);

    for (int i = 0; i < 4; ++i) {
        auto value = queue.try_pop();
        REQUIRE(value.has_value());
        REQUIRE(*value == i);
    }
    REQUIRE_FALSE(queue.try_pop().has_value());
}

TEST_CASE("SPSCQueue wraps around its buffer", "[queues]") {
    SPSCQueue<std::string> queue(2);
    for (int round = 0; round < 10; ++round) {
        REQUIRE(queue.try_push("a" + std::to_string(round)));
        REQUIRE(queue.try_push("b" + std::to_string(round)));
        REQUIRE(*queue.try_pop() == "a" + std::to_string(round));
        REQUIRE(*queue.try_pop() == "b" + std::to_string(round));
    }
}

TEST_CASE("SPSCQueue moves callables and destroys leftovers", "[queues]") {
    auto tracker = std::make_shared<int>(0);
    {
        SPSCQueue<std::function<void()>> queue(4);
        REQUIRE(queue.try_push([tracker] { ++*tracker; }));
        REQUIRE(queue.try_push([tracker] { *tracker += 10; }));
        REQUIRE(tracker.use_count() == 3);

        auto first = queue.try_pop();
        REQUIRE(first.has_value());
        (*first)();
        REQUIRE(*tracker == 1);
    }
    // The unpopped callable is destroyed with the queue
    REQUIRE(tracker.use_count() == 1);
}

TEST_CASE("SPSCQueue hands items across threads in order", "[queues]") {
    constexpr int COUNT = 10000;
    SPSCQueue<int> queue(64);
    std::vector<int> received;
    received.reserve(COUNT);

    std::thread producer([&queue] {
        for (int i = 0; i < COUNT; ++i) {
            while (!queue.try_push(i)) {
                std::this_thread::yield();
            }
        }
    });

    while (static_cast<int>(received.size()) < COUNT) {
        if (auto value = queue.try_pop()) {
            received.push_back(*value);
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();

    for (int i = 0; i < COUNT; ++i) {
        REQUIRE(received[static_cast<size_t>(i)] == i);
    }
}
