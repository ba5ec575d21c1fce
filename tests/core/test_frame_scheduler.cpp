#include "core/frame_scheduler.hpp"

#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace scape::core;
using namespace std::chrono_literals;

namespace {

class FakeTarget final : public FrameTarget {
public:
    std::vector<Region> submitted;
    int schedule_requests = 0;
    bool accept = true;

    auto submit_frame(OutputId, const Region& damage) -> bool override {
        submitted.push_back(damage);
        return accept;
    }
    void schedule_frame(OutputId) override { ++schedule_requests; }
};

const Clock::time_point T0{std::chrono::seconds{10}};

} // namespace

TEST_CASE("FrameScheduler requests a frame on first damage", "[frame_scheduler]") {
    FakeTarget target;
    FrameScheduler scheduler(1, target, true);
    REQUIRE(scheduler.state() == FrameState::idle);

    scheduler.add_damage(Region({0, 0, 10, 10}), T0);
    REQUIRE(scheduler.state() == FrameState::frame_requested);
    REQUIRE(target.schedule_requests == 1);
    REQUIRE(target.submitted.empty());

    scheduler.add_damage(Region({20, 20, 10, 10}), T0);
    REQUIRE(target.schedule_requests == 1);

    scheduler.frame_opportunity(T0);
    REQUIRE(scheduler.state() == FrameState::frame_pending);
    REQUIRE(target.submitted.size() == 1);
    REQUIRE(target.submitted[0].extents() == Rect{0, 0, 30, 30});
    REQUIRE(scheduler.damage().empty());

    scheduler.present_complete(T0);
    REQUIRE(scheduler.state() == FrameState::idle);
}

TEST_CASE("FrameScheduler coalesces damage while a frame is pending", "[frame_scheduler]") {
    FakeTarget target;
    FrameScheduler scheduler(1, target, true);
    scheduler.add_damage(Region({0, 0, 10, 10}), T0);
    scheduler.frame_opportunity(T0);
    REQUIRE(scheduler.state() == FrameState::frame_pending);

    for (int i = 0; i < 25; ++i) {
        scheduler.add_damage(Region({i * 10, 0, 10, 10}), T0);
    }
    REQUIRE(target.submitted.size() == 1);
    REQUIRE(target.schedule_requests == 1);

    scheduler.present_complete(T0);
    REQUIRE(scheduler.state() == FrameState::frame_requested);
    REQUIRE(target.schedule_requests == 2);

    scheduler.frame_opportunity(T0);
    REQUIRE(target.submitted.size() == 2);
    REQUIRE(target.submitted[1].extents() == Rect{0, 0, 250, 10});
    REQUIRE(scheduler.frames_submitted() == 2);
}

TEST_CASE("FrameScheduler ignores opportunities without a request", "[frame_scheduler]") {
    FakeTarget target;
    FrameScheduler scheduler(1, target, true);
    scheduler.frame_opportunity(T0);
    scheduler.present_complete(T0);
    scheduler.add_damage(Region{}, T0);
    REQUIRE(target.submitted.empty());
    REQUIRE(scheduler.state() == FrameState::idle);
}

TEST_CASE("FrameScheduler without hardware sync submits immediately", "[frame_scheduler]") {
    FakeTarget target;
    FrameScheduler scheduler(1, target, false);
    scheduler.add_damage(Region({0, 0, 5, 5}), T0);
    REQUIRE(target.schedule_requests == 0);
    REQUIRE(target.submitted.size() == 1);
    REQUIRE(scheduler.state() == FrameState::frame_pending);
}

TEST_CASE("FrameScheduler backs off after rejected submits", "[frame_scheduler]") {
    FakeTarget target;
    target.accept = false;
    FrameScheduler scheduler(1, target, true, BackoffPolicy{.initial = 10ms, .max = 40ms});

    scheduler.add_damage(Region({0, 0, 10, 10}), T0);
    scheduler.frame_opportunity(T0);
    REQUIRE(scheduler.degraded());
    REQUIRE(scheduler.state() == FrameState::frame_requested);
    REQUIRE(scheduler.retry_deadline() == T0 + 10ms);
    REQUIRE_FALSE(scheduler.damage().empty());

    // Opportunities before the deadline do nothing
    scheduler.frame_opportunity(T0 + 5ms);
    REQUIRE(target.submitted.size() == 1);

    scheduler.tick(T0 + 10ms);
    REQUIRE(target.submitted.size() == 2);
    REQUIRE(scheduler.retry_deadline() == T0 + 30ms);

    scheduler.tick(T0 + 30ms);
    REQUIRE(scheduler.retry_deadline() == T0 + 70ms);
    scheduler.tick(T0 + 70ms);
    // Capped at the maximum
    REQUIRE(scheduler.retry_deadline() == T0 + 110ms);
    REQUIRE(scheduler.submit_failures() == 4);

    target.accept = true;
    scheduler.tick(T0 + 110ms);
    REQUIRE_FALSE(scheduler.degraded());
    REQUIRE(scheduler.state() == FrameState::frame_pending);
    REQUIRE_FALSE(scheduler.retry_deadline().has_value());
    REQUIRE(scheduler.current_backoff() == 10ms);
}
