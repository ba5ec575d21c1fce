#include "ipc/control_handler.hpp"

#include "core/fakes.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace scape;
using namespace scape::ipc;

TEST_CASE("Control handler lists outputs and windows", "[control_handler]") {
    test::CompositorFixture fx;
    fx.add_output("DP-1");
    fx.open_window(1, "foot");
    fx.open_window(2, "mpv");

    auto outputs = handle_control_request(fx.compositor, {.command = ControlCommand::list_outputs});
    REQUIRE(outputs.ok);
    REQUIRE(outputs.outputs.size() == 1);
    REQUIRE(outputs.outputs[0].name == "DP-1");

    auto windows = handle_control_request(fx.compositor, {.command = ControlCommand::list_windows});
    REQUIRE(windows.ok);
    REQUIRE(windows.windows.size() == 2);
}

TEST_CASE("Control handler resolves windows by id or app id", "[control_handler]") {
    test::CompositorFixture fx;
    fx.add_output("DP-1");
    auto foot = fx.open_window(1, "foot");
    auto mpv = fx.open_window(2, "mpv");
    REQUIRE(fx.compositor.focused_window(fx.compositor.default_seat()) == mpv);

    auto by_app = handle_control_request(
        fx.compositor, {.command = ControlCommand::focus_window, .argument = "foot"});
    REQUIRE(by_app.ok);
    REQUIRE(fx.compositor.focused_window(fx.compositor.default_seat()) == foot);

    auto by_id = handle_control_request(
        fx.compositor,
        {.command = ControlCommand::close_window, .argument = std::to_string(mpv)});
    REQUIRE(by_id.ok);
    REQUIRE(fx.sink.closed == std::vector<core::WindowId>{mpv});

    auto missing = handle_control_request(
        fx.compositor, {.command = ControlCommand::focus_window, .argument = "firefox"});
    REQUIRE_FALSE(missing.ok);
    REQUIRE(missing.message.find("firefox") != std::string::npos);

    auto unknown_id = handle_control_request(
        fx.compositor, {.command = ControlCommand::close_window, .argument = "4242"});
    REQUIRE_FALSE(unknown_id.ok);
}

TEST_CASE("Control handler schedules reloads and quits", "[control_handler]") {
    test::CompositorFixture fx;
    bool quit_called = false;
    fx.compositor.set_quit_handler([&] { quit_called = true; });

    auto reload = handle_control_request(fx.compositor, {.command = ControlCommand::reload_config});
    REQUIRE(reload.ok);
    REQUIRE(fx.compositor.next_deadline().has_value());

    auto quit = handle_control_request(fx.compositor, {.command = ControlCommand::quit});
    REQUIRE(quit.ok);
    REQUIRE(fx.compositor.quit_requested());
    REQUIRE(quit_called);
}
