#include "core/hook_queue.hpp"

#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace scape::core;

TEST_CASE("HookQueue runs hooks immediately when idle", "[hook_queue]") {
    HookQueue queue;
    int runs = 0;
    REQUIRE(queue.submit("a", [&] { ++runs; }));
    REQUIRE(runs == 1);
    REQUIRE_FALSE(queue.running());
    REQUIRE(queue.pending() == 0);

    REQUIRE_FALSE(queue.submit("empty", HookQueue::Hook{}));
}

TEST_CASE("HookQueue defers nested hooks in submission order", "[hook_queue]") {
    HookQueue queue;
    std::vector<std::string> trace;

    queue.submit("outer", [&] {
        trace.emplace_back("outer begin");
        bool ran = queue.submit("first", [&] {
            trace.emplace_back("first");
            queue.submit("third", [&] { trace.emplace_back("third"); });
        });
        REQUIRE_FALSE(ran);
        queue.submit("second", [&] { trace.emplace_back("second"); });
        REQUIRE(queue.running());
        REQUIRE(queue.pending() == 2);
        trace.emplace_back("outer end");
    });

    REQUIRE(trace ==
            std::vector<std::string>{"outer begin", "outer end", "first", "second", "third"});
    REQUIRE_FALSE(queue.running());
}

TEST_CASE("HookQueue stays usable after a hook throws", "[hook_queue]") {
    HookQueue queue;
    std::vector<std::string> trace;

    REQUIRE_THROWS_AS(queue.submit("outer",
                                   [&] {
                                       queue.submit("queued", [&] { trace.emplace_back("queued"); });
                                       throw std::runtime_error("hook failed");
                                   }),
                      std::runtime_error);
    REQUIRE_FALSE(queue.running());
    REQUIRE(queue.pending() == 1);
    REQUIRE(trace.empty());

    REQUIRE(queue.submit("next", [&] { trace.emplace_back("next"); }));
    REQUIRE(trace == std::vector<std::string>{"queued", "next"});
    REQUIRE(queue.pending() == 0);
}
