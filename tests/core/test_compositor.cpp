#include "core/compositor.hpp"

#include "core/fakes.hpp"
#include "support/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>
#include <fstream>

using namespace scape::core;
using namespace scape;
using namespace std::chrono_literals;

namespace {

constexpr uint32_t KEY_A = 30;
constexpr uint32_t KEYSYM_A = 0x61;
constexpr uint32_t KEY_Q = 16;
constexpr uint32_t KEYSYM_Q = 0x71;

/// Returns canned tables per script source and counts hook calls.
class FakeEngine final : public PolicyEngine {
public:
    std::map<std::string, PolicyTables> tables_for;
    std::vector<std::string> loaded_sources;
    int startup_calls = 0;
    int map_calls = 0;
    int unmap_calls = 0;
    int output_calls = 0;
    int tick_calls = 0;
    std::vector<CallbackRef> callbacks;
    bool fail_hooks = false;

    auto load(std::string_view source, std::string_view) -> Result<PolicyTables> override {
        auto it = tables_for.find(std::string(source));
        if (it == tables_for.end()) {
            return make_error<PolicyTables>(ErrorCode::script_error, "syntax error near 'oops'");
        }
        loaded_sources.emplace_back(source);
        return it->second;
    }

    auto on_startup() -> Result<void> override { return hook(startup_calls); }
    auto on_window_map(const WindowInfo&) -> Result<void> override { return hook(map_calls); }
    auto on_window_unmap(const WindowInfo&) -> Result<void> override {
        return hook(unmap_calls);
    }
    auto on_output_change(const std::vector<OutputInfo>&) -> Result<void> override {
        return hook(output_calls);
    }
    auto on_tick() -> Result<void> override { return hook(tick_calls); }
    auto invoke_callback(CallbackRef ref) -> Result<void> override {
        callbacks.push_back(ref);
        return {};
    }

private:
    auto hook(int& counter) -> Result<void> {
        ++counter;
        if (fail_hooks) {
            return make_error<void>(ErrorCode::script_error, "attempt to index a nil value");
        }
        return {};
    }
};

auto spawn_binding(uint32_t mods, uint32_t keysym, std::string command, bool consume = true)
    -> Binding {
    return Binding{.modifiers = mods,
                   .keysym = keysym,
                   .action = action::Spawn{std::move(command)},
                   .consume = consume};
}

/// Runs frame callbacks until every output is idle again.
void settle(test::CompositorFixture& f) {
    for (int i = 0; i < 4; ++i) {
        for (const auto& output : f.compositor.outputs().outputs()) {
            f.compositor.frame_done(output.id);
        }
    }
}

void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream(path, std::ios::trunc) << contents;
}

auto install_engine(test::CompositorFixture& f) -> FakeEngine* {
    auto engine = std::make_unique<FakeEngine>();
    auto* raw = engine.get();
    f.compositor.set_policy_engine(std::move(engine));
    return raw;
}

} // namespace

TEST_CASE("Compositor centers unruled windows on the output under the pointer",
          "[compositor]") {
    test::CompositorFixture f;
    auto a = f.add_output("A");
    auto b = f.add_output("B");
    REQUIRE(f.compositor.outputs().find(b)->rect() == Rect{1920, 0, 1920, 1080});

    f.compositor.pointer_motion(f.compositor.default_seat(), {2500, 500}, 1);
    auto window = f.open_window(1, "foot");

    const auto* w = f.window(window);
    REQUIRE(w->home == b);
    REQUIRE(w->geometry == Rect{2680, 390, 400, 300});
    REQUIRE(f.compositor.focused_window(f.compositor.default_seat()) == window);
    REQUIRE_FALSE(f.sink.configures.empty());
    REQUIRE(f.sink.configures.back().window == window);
    REQUIRE(f.sink.configures.back().activated);

    f.compositor.pointer_motion(f.compositor.default_seat(), {100, 100}, 2);
    auto second = f.open_window(2, "editor");
    REQUIRE(f.window(second)->home == a);
}

TEST_CASE("Compositor re-homes windows from an unplugged output", "[compositor]") {
    test::CompositorFixture f;
    auto a = f.add_output("A");
    auto b = f.add_output("B");

    std::vector<WindowId> windows;
    for (ClientId client = 1; client <= 3; ++client) {
        windows.push_back(f.open_window(client, "app" + std::to_string(client), {400, 300}, a));
    }
    settle(f);
    const auto composes_before = f.render.composes_on(b);

    f.compositor.output_removed(a);
    REQUIRE(f.compositor.outputs().find(a) == nullptr);
    REQUIRE(f.compositor.scheduler(a) == nullptr);

    for (auto wid : windows) {
        const auto* w = f.window(wid);
        REQUIRE(w->mapped);
        REQUIRE(w->home == b);
        REQUIRE(w->outputs == std::set<OutputId>{b});
    }
    REQUIRE(f.compositor.tree().windows_on(b).size() == 3);

    // The destination gets one full-output repaint
    f.compositor.frame_done(b);
    REQUIRE(f.render.composes_on(b) == composes_before + 1);
    const auto& last = f.render.composes.back();
    REQUIRE(last.output == b);
    REQUIRE(last.damage.extents() == Rect{1920, 0, 1920, 1080});
    REQUIRE(last.items.size() == 3);

    // Focus survives on a re-homed window
    REQUIRE(f.compositor.focused_window(f.compositor.default_seat()).has_value());
}

TEST_CASE("Compositor coalesces damage behind a pending frame", "[compositor]") {
    test::CompositorFixture f;
    auto out = f.add_output("A");
    auto window = f.open_window(1, "foot");
    settle(f);
    REQUIRE(f.compositor.scheduler(out)->state() == FrameState::idle);

    auto surface = f.window(window)->surface;
    REQUIRE(f.compositor.commit(surface, 2, {400, 300}, Region({0, 0, 10, 10})));
    REQUIRE(f.compositor.scheduler(out)->state() == FrameState::frame_requested);
    const auto scheduled_before = f.render.scheduled.size();
    REQUIRE(scheduled_before > 0);

    f.compositor.frame_done(out);
    REQUIRE(f.compositor.scheduler(out)->state() == FrameState::frame_pending);
    REQUIRE(f.compositor.outputs().find(out)->pending_frame);
    const auto composes_before = f.render.composes_on(out);

    for (int i = 0; i < 10; ++i) {
        REQUIRE(f.compositor.commit(surface, 3 + i, {400, 300}, Region({i * 20, 0, 10, 10})));
    }
    REQUIRE(f.render.composes_on(out) == composes_before);
    REQUIRE(f.render.scheduled.size() == scheduled_before);

    f.compositor.frame_done(out);
    REQUIRE(f.render.composes_on(out) == composes_before + 1);
    REQUIRE(f.render.scheduled.size() == scheduled_before + 1);

    f.compositor.frame_done(out);
    REQUIRE(f.render.composes_on(out) == composes_before + 1);
    REQUIRE(f.compositor.scheduler(out)->state() == FrameState::idle);
}

TEST_CASE("Compositor never delivers keys consumed by a binding", "[compositor]") {
    test::CompositorFixture f;
    f.add_output("A");
    auto* engine = install_engine(f);
    PolicyTables tables;
    tables.bindings.push_back(spawn_binding(modifier::LOGO, KEYSYM_Q, "foot"));
    engine->tables_for["B1"] = tables;

    test::TempDir dir("scape_compositor");
    auto script = dir.path() / "init.lua";
    write_file(script, "B1");
    REQUIRE(f.compositor.load_policy(script));

    f.open_window(1, "editor");
    f.compositor.set_spawn_environment({{"WAYLAND_DISPLAY", "wayland-1"}});
    const auto seat = f.compositor.default_seat();

    f.compositor.modifiers(seat, modifier::LOGO);
    REQUIRE(f.compositor.key(seat, {KEY_Q, KEYSYM_Q, true, 1}) == KeyDisposition::consumed);
    f.compositor.modifiers(seat, 0);
    REQUIRE(f.compositor.key(seat, {KEY_Q, KEYSYM_Q, false, 2}) == KeyDisposition::consumed);

    REQUIRE(f.sink.keys.empty());
    REQUIRE(f.launcher.commands == std::vector<std::string>{"foot"});
    REQUIRE(f.launcher.last_env.at("WAYLAND_DISPLAY") == "wayland-1");

    REQUIRE(f.compositor.key(seat, {KEY_A, KEYSYM_A, true, 3}) == KeyDisposition::forwarded);
    REQUIRE(f.sink.keys.size() == 1);
}

TEST_CASE("Compositor reload swaps binding tables atomically", "[compositor]") {
    test::CompositorFixture f;
    f.add_output("A");
    auto* engine = install_engine(f);
    PolicyTables first;
    first.bindings.push_back(spawn_binding(0, KEYSYM_A, "one"));
    PolicyTables second;
    second.bindings.push_back(spawn_binding(0, KEYSYM_A, "two"));
    engine->tables_for["B1"] = first;
    engine->tables_for["B2"] = second;

    test::TempDir dir("scape_compositor");
    auto script = dir.path() / "init.lua";
    write_file(script, "B1");
    REQUIRE(f.compositor.load_policy(script));
    const auto seat = f.compositor.default_seat();

    auto press = [&](uint32_t time) {
        f.compositor.key(seat, {KEY_A, KEYSYM_A, true, time});
        f.compositor.key(seat, {KEY_A, KEYSYM_A, false, time + 1});
    };

    press(1);
    REQUIRE(f.launcher.commands.back() == "one");

    write_file(script, "B2");
    f.compositor.request_reload();
    f.clock.advance(100ms);
    f.compositor.request_reload();
    REQUIRE(f.compositor.next_deadline() == f.clock.now() + 200ms);

    f.clock.advance(150ms);
    f.compositor.tick();
    // Still inside the debounce window
    press(10);
    REQUIRE(f.launcher.commands.back() == "one");

    f.clock.advance(50ms);
    f.compositor.tick();
    REQUIRE(f.compositor.reload_count() == 2);
    press(20);
    REQUIRE(f.launcher.commands.back() == "two");

    SECTION("A broken script keeps the previous tables") {
        write_file(script, "oops");
        f.compositor.request_reload();
        f.clock.advance(200ms);
        f.compositor.tick();
        REQUIRE(f.compositor.reload_count() == 2);
        press(30);
        REQUIRE(f.launcher.commands.back() == "two");
    }
}

TEST_CASE("Compositor keeps running when policy hooks fail", "[compositor]") {
    test::CompositorFixture f;
    auto* engine = install_engine(f);
    engine->fail_hooks = true;
    engine->tables_for["ok"] = PolicyTables{.tick_interval_ms = 50};

    test::TempDir dir("scape_compositor");
    auto script = dir.path() / "init.lua";
    write_file(script, "ok");
    REQUIRE(f.compositor.load_policy(script));

    f.compositor.startup();
    f.add_output("A");
    auto window = f.open_window(1, "foot");
    REQUIRE(f.window(window)->mapped);

    f.clock.advance(60ms);
    f.compositor.tick();

    auto surface = f.window(window)->surface;
    f.compositor.destroy_surface(surface);
    REQUIRE(f.window(window) == nullptr);

    REQUIRE(engine->startup_calls == 1);
    REQUIRE(engine->map_calls == 1);
    REQUIRE(engine->unmap_calls == 1);
    REQUIRE(engine->output_calls == 1);
    REQUIRE(engine->tick_calls == 1);
    REQUIRE_FALSE(f.compositor.hooks().running());
}

TEST_CASE("Compositor loading without a script or engine reports errors", "[compositor]") {
    test::CompositorFixture f;
    auto no_engine = f.compositor.load_policy("/nonexistent/init.lua");
    REQUIRE(no_engine.error().code == ErrorCode::script_error);

    install_engine(f);
    auto missing = f.compositor.load_policy("/nonexistent/init.lua");
    REQUIRE(missing.error().code == ErrorCode::file_not_found);
}

TEST_CASE("Compositor places windows mapped before any output", "[compositor]") {
    test::CompositorFixture f;
    auto window = f.open_window(1, "foot");
    REQUIRE(f.window(window)->detached);

    f.sink.configures.clear();
    auto out = f.add_output("A", 1000, 800);
    const auto* w = f.window(window);
    REQUIRE_FALSE(w->detached);
    REQUIRE(w->home == out);
    REQUIRE(w->geometry == Rect{300, 250, 400, 300});
    REQUIRE(f.sink.configures.size() == 1);
}

TEST_CASE("Compositor focus falls back after unmap", "[compositor]") {
    test::CompositorFixture f;
    f.add_output("A");
    auto first = f.open_window(1, "first");
    auto second = f.open_window(2, "second");
    const auto seat = f.compositor.default_seat();
    REQUIRE(f.compositor.focused_window(seat) == second);

    auto popup_parent = f.window(second)->surface;
    auto popup = f.compositor.create_surface(2, SurfaceRole::popup, popup_parent, {5, 5});
    REQUIRE(popup);

    f.compositor.unmap_window(second);
    REQUIRE(f.compositor.focused_window(seat) == first);
    REQUIRE(f.sink.popups_done == std::vector<SurfaceId>{*popup});

    // Unmapping twice is harmless
    f.compositor.unmap_window(second);
    REQUIRE(f.compositor.focused_window(seat) == first);
}

TEST_CASE("Compositor refuses clients beyond the limit", "[compositor]") {
    CompositorConfig config;
    config.max_clients = 2;
    config.max_surfaces = 3;
    test::CompositorFixture f(config);

    REQUIRE(f.compositor.client_connected(1));
    REQUIRE(f.compositor.client_connected(2));
    auto refused = f.compositor.client_connected(3);
    REQUIRE(refused.error().code == ErrorCode::resource_exhausted);

    for (int i = 0; i < 3; ++i) {
        REQUIRE(f.compositor.create_surface(1));
    }
    auto too_many = f.compositor.create_surface(2);
    REQUIRE(too_many.error().code == ErrorCode::resource_exhausted);

    f.compositor.client_disconnected(1);
    REQUIRE(f.compositor.client_connected(3));
    REQUIRE(f.compositor.create_surface(3));
}

TEST_CASE("Compositor disconnects clients that violate the protocol", "[compositor]") {
    test::CompositorFixture f;
    f.add_output("A");
    auto bad = f.open_window(1, "bad");
    auto good = f.open_window(2, "good");

    f.compositor.protocol_violation(1, "invalid buffer");
    REQUIRE(f.sink.disconnected == std::vector<ClientId>{1});
    REQUIRE(f.window(bad) == nullptr);
    REQUIRE(f.window(good)->mapped);
    REQUIRE(f.compositor.tree().surfaces_of(1).empty());
}

TEST_CASE("Compositor binding actions", "[compositor]") {
    test::CompositorFixture f;
    f.add_output("A");
    auto* engine = install_engine(f);
    PolicyTables tables;
    tables.zones.push_back(Zone{.name = "left", .rect = {0, 0, 960, 1080}});
    tables.bindings.push_back(Binding{.modifiers = modifier::LOGO,
                                      .keysym = 0x31,
                                      .action = action::FocusOrSpawn{"foot", "foot --server"}});
    tables.bindings.push_back(
        Binding{.modifiers = modifier::LOGO, .keysym = 0x68, .action = action::MoveToZone{"left"}});
    tables.bindings.push_back(
        Binding{.modifiers = modifier::LOGO, .keysym = 0x77, .action = action::CloseWindow{}});
    tables.bindings.push_back(
        Binding{.modifiers = modifier::LOGO, .keysym = 0x32, .action = action::VtSwitch{2}});
    tables.bindings.push_back(
        Binding{.modifiers = modifier::LOGO, .keysym = 0x63, .action = action::Callback{42}});
    tables.bindings.push_back(
        Binding{.modifiers = modifier::LOGO, .keysym = 0x74, .action = action::Tab{1}});
    engine->tables_for["tables"] = tables;

    test::TempDir dir("scape_compositor");
    auto script = dir.path() / "init.lua";
    write_file(script, "tables");
    REQUIRE(f.compositor.load_policy(script));

    const auto seat = f.compositor.default_seat();
    f.compositor.modifiers(seat, modifier::LOGO);
    uint32_t keycode = 100;
    auto chord = [&](uint32_t keysym) {
        f.compositor.key(seat, {keycode, keysym, true, 0});
        f.compositor.key(seat, {keycode, keysym, false, 0});
        ++keycode;
    };

    chord(0x31);
    REQUIRE(f.launcher.commands == std::vector<std::string>{"foot --server"});

    auto foot = f.open_window(1, "foot");
    auto other = f.open_window(2, "other");
    REQUIRE(f.compositor.focused_window(seat) == other);

    chord(0x31);
    REQUIRE(f.launcher.commands.size() == 1);
    REQUIRE(f.compositor.focused_window(seat) == foot);

    chord(0x68);
    REQUIRE(f.window(foot)->geometry == Rect{0, 0, 960, 1080});

    chord(0x74);
    REQUIRE(f.compositor.focused_window(seat) == other);

    chord(0x77);
    REQUIRE(f.sink.closed == std::vector<WindowId>{other});

    chord(0x32);
    REQUIRE(f.session.switched == std::vector<uint32_t>{2});

    chord(0x63);
    REQUIRE(engine->callbacks == std::vector<CallbackRef>{42});
}

TEST_CASE("Compositor retries rejected frames on the deadline", "[compositor]") {
    CompositorConfig config;
    config.backoff = BackoffPolicy{.initial = 20ms, .max = 200ms};
    test::CompositorFixture f(config);
    auto out = f.add_output("A");
    settle(f);

    f.render.fail = true;
    auto window = f.open_window(1, "foot");
    f.compositor.frame_done(out);
    REQUIRE(f.compositor.outputs().find(out)->degraded);
    auto deadline = f.compositor.next_deadline();
    REQUIRE(deadline == f.clock.now() + 20ms);

    f.render.fail = false;
    f.clock.advance(20ms);
    f.compositor.tick();
    REQUIRE_FALSE(f.compositor.outputs().find(out)->degraded);
    REQUIRE(f.compositor.scheduler(out)->state() == FrameState::frame_pending);
    REQUIRE(f.render.composes.back().items.front().surface == f.window(window)->surface);
}

TEST_CASE("Compositor restores output positions from the snapshot", "[compositor]") {
    test::CompositorFixture f;
    LayoutSnapshot snapshot;
    snapshot.outputs.push_back(OutputSnapshot{.name = "DP-2",
                                              .x = -1920,
                                              .y = 0,
                                              .width = 1920,
                                              .height = 1080,
                                              .scale = 1.0,
                                              .enabled = true});
    snapshot.seats.push_back(SeatSnapshot{.name = "seat0", .pointer_x = -100, .pointer_y = 50});
    f.compositor.set_snapshot(snapshot);

    auto secondary = f.add_output("DP-2");
    auto primary = f.add_output("DP-1");
    REQUIRE(f.compositor.outputs().find(primary)->rect().x == 0);
    REQUIRE(f.compositor.outputs().find(secondary)->rect().x == -1920);

    const auto* seat = f.compositor.seats().find(f.compositor.default_seat());
    REQUIRE(seat->pointer == Point{-100, 50});

    auto saved = f.compositor.snapshot();
    REQUIRE(saved.find_output("DP-2")->x == -1920);
}

TEST_CASE("Compositor applies output configuration changes", "[compositor]") {
    test::CompositorFixture f;
    auto a = f.add_output("A");
    auto b = f.add_output("B");
    auto window = f.open_window(1, "foot", {400, 300}, b);

    REQUIRE(f.compositor.configure_output("B", OutputChange{.enabled = false}));
    REQUIRE(f.window(window)->home == a);

    REQUIRE(f.compositor.configure_output("B", OutputChange{.enabled = true}));
    REQUIRE(f.compositor.configure_output("A", OutputChange{.scale = 2.0}));
    REQUIRE(f.compositor.outputs().find(a)->rect().width == 960);
    REQUIRE_FALSE(f.compositor.configure_output("missing", OutputChange{}));

    auto infos = f.compositor.output_infos();
    REQUIRE(infos.size() == 2);
    REQUIRE(infos[0].scale == 2.0);
}

TEST_CASE("Compositor quit runs the handler once", "[compositor]") {
    test::CompositorFixture f;
    int calls = 0;
    f.compositor.set_quit_handler([&] { ++calls; });
    f.compositor.quit();
    f.compositor.quit();
    REQUIRE(calls == 1);
    REQUIRE(f.compositor.quit_requested());
}

TEST_CASE("Compositor re-offers a still screencast frame on the deadline", "[compositor]") {
    CompositorConfig config;
    config.screencast_policy = ScreencastPolicy::periodic;
    config.screencast_interval = 100ms;
    test::CompositorFixture f(config);
    auto out = f.add_output("A");
    f.open_window(1, "foot");

    auto consumer = f.compositor.screencast().subscribe(out);
    settle(f);
    auto first = f.compositor.screencast().pull(consumer);
    REQUIRE(first);
    REQUIRE_FALSE(f.compositor.screencast().pull(consumer).has_value());

    // Nothing else is pending, so the re-offer is the only thing to wake up for
    auto deadline = f.compositor.next_deadline();
    REQUIRE(deadline.has_value());
    REQUIRE(*deadline <= first->presented_at + 100ms);
    REQUIRE(f.compositor.screencast().next_reoffer() == first->presented_at + 100ms);

    f.clock.advance(500ms);
    f.compositor.tick();
    auto again = f.compositor.screencast().pull(consumer);
    REQUIRE(again);
    REQUIRE(again->frame_number == first->frame_number);
    REQUIRE(f.compositor.screencast().next_reoffer() == f.clock.now() + 100ms);
    REQUIRE(*f.compositor.next_deadline() <= f.clock.now() + 100ms);

    SECTION("No consumers, no wakeups") {
        REQUIRE(f.compositor.screencast().unsubscribe(consumer));
        REQUIRE_FALSE(f.compositor.screencast().next_reoffer().has_value());
    }
}

TEST_CASE("Compositor disconnects clients that give a surface a second role", "[compositor]") {
    test::CompositorFixture f;
    f.add_output("A");
    auto window = f.open_window(1, "foot");
    auto bystander = f.open_window(2, "editor");

    auto child = f.compositor.create_surface(1, SurfaceRole::subsurface, f.window(window)->surface);
    REQUIRE(child);
    auto second_role = f.compositor.create_window(*child, "foot", "again", false);
    REQUIRE_FALSE(second_role);
    REQUIRE(second_role.error().code == ErrorCode::protocol_violation);
    REQUIRE(f.sink.disconnected == std::vector<ClientId>{1});
    REQUIRE(f.window(window) == nullptr);
    REQUIRE(f.window(bystander)->mapped);

    SECTION("Unknown surfaces are not a violation") {
        REQUIRE_FALSE(f.compositor.create_window(9999, "x", "y", false));
        REQUIRE(f.sink.disconnected.size() == 1);
    }
}

TEST_CASE("Compositor holds exactly one imported buffer per surface", "[compositor]") {
    test::CompositorFixture f;
    auto out = f.add_output("A");
    auto window = f.open_window(1, "foot");
    auto surface = f.window(window)->surface;

    REQUIRE(f.render.imported.size() == 1);
    const auto first_token = f.render.imported.begin()->first;
    REQUIRE(f.compositor.tree().find_surface(surface)->buffer == first_token);

    f.compositor.frame_done(out);
    REQUIRE(f.render.composes.back().items.front().buffer == first_token);

    REQUIRE(f.compositor.commit(surface, 7, {400, 300}, Region({0, 0, 10, 10})));
    REQUIRE(f.render.imported.size() == 1);
    REQUIRE(f.render.imported.begin()->second == 7);
    REQUIRE(f.render.released == std::vector<BufferToken>{first_token});

    SECTION("Committing without a buffer drops the old one") {
        REQUIRE(f.compositor.commit(surface, std::nullopt, {0, 0}, Region{}));
        REQUIRE(f.render.imported.empty());
        REQUIRE_FALSE(f.compositor.tree().find_surface(surface)->buffer.has_value());
    }

    SECTION("Destroying the surface releases its buffer") {
        f.compositor.destroy_surface(surface);
        REQUIRE(f.render.imported.empty());
    }

    SECTION("An unusable buffer disconnects the client") {
        f.render.unusable.insert(13);
        auto rejected = f.compositor.commit(surface, 13, {400, 300}, Region{});
        REQUIRE_FALSE(rejected);
        REQUIRE(rejected.error().code == ErrorCode::protocol_violation);
        REQUIRE(f.sink.disconnected == std::vector<ClientId>{1});
        REQUIRE(f.window(window) == nullptr);
        REQUIRE(f.render.imported.empty());
    }
}

TEST_CASE("Compositor popup grabs end with the popup", "[compositor]") {
    test::CompositorFixture f;
    f.add_output("A");
    auto window = f.open_window(1, "foot");
    auto other = f.open_window(2, "editor");
    const auto seat = f.compositor.default_seat();

    auto popup = f.compositor.create_surface(1, SurfaceRole::popup, f.window(window)->surface,
                                             {10, 10});
    REQUIRE(popup);
    REQUIRE(f.compositor.commit(*popup, 3, {50, 50}, Region({0, 0, 50, 50})));

    REQUIRE(f.compositor.request_popup_grab(seat, *popup));
    REQUIRE(f.compositor.router().state(seat) == RouterState::pointer_grabbed);

    auto conflict = f.compositor.request_popup_grab(seat, *popup);
    REQUIRE_FALSE(conflict);
    REQUIRE(conflict.error().code == ErrorCode::grab_conflict);
    REQUIRE_FALSE(f.compositor.grab_input(other, GrabKind::keyboard));

    f.compositor.destroy_surface(*popup);
    REQUIRE(f.compositor.router().state(seat) == RouterState::idle);
    REQUIRE_FALSE(f.compositor.release_input());

    SECTION("Policy grabs go through the default seat") {
        REQUIRE(f.compositor.grab_input(other, GrabKind::keyboard));
        REQUIRE(f.compositor.router().state(seat) == RouterState::keyboard_grabbed);
        REQUIRE(f.compositor.release_input());
        REQUIRE(f.compositor.router().state(seat) == RouterState::idle);
    }

    SECTION("Non-popup surfaces cannot take a popup grab") {
        auto missing = f.compositor.request_popup_grab(seat, f.window(window)->surface);
        REQUIRE_FALSE(missing);
        REQUIRE(f.compositor.router().state(seat) == RouterState::idle);
    }
}
