#include "script/lua_policy.hpp"

#include <catch2/catch_test_macros.hpp>
#include <core/seat.hpp>
#include <string>
#include <variant>
#include <vector>

using namespace scape;
using namespace scape::script;

namespace {

class FakeHost final : public core::PolicyHost {
public:
    std::vector<std::string> calls;
    std::vector<core::WindowInfo> windows;
    std::vector<core::OutputInfo> outputs;
    core::OutputChange last_change;

    void spawn(const std::string& command) override { calls.push_back("spawn " + command); }
    void focus_or_spawn(const std::string& app_id, const std::string& command) override {
        calls.push_back("focus_or_spawn " + app_id + " " + command);
    }
    auto move_to_zone(const std::string& zone) -> bool override {
        calls.push_back("move_to_zone " + zone);
        return zone == "left";
    }
    auto focus_window(core::WindowId window) -> bool override {
        calls.push_back("focus_window " + std::to_string(window));
        return true;
    }
    auto close_window(core::WindowId window) -> bool override {
        calls.push_back("close_window " + std::to_string(window));
        return true;
    }
    [[nodiscard]] auto window_infos() const -> std::vector<core::WindowInfo> override {
        return windows;
    }
    [[nodiscard]] auto output_infos() const -> std::vector<core::OutputInfo> override {
        return outputs;
    }
    auto configure_output(const std::string& name, const core::OutputChange& change)
        -> bool override {
        calls.push_back("set_output " + name);
        last_change = change;
        return true;
    }
    auto grab_input(core::WindowId window, core::GrabKind kind) -> bool override {
        calls.push_back("grab " + std::to_string(window) +
                        (kind == core::GrabKind::pointer ? " pointer" : " keyboard"));
        return true;
    }
    auto release_input() -> bool override {
        calls.emplace_back("release_grab");
        return false;
    }
    void quit() override { calls.emplace_back("quit"); }
};

} // namespace

TEST_CASE("parse_modifiers accepts separators and aliases", "[lua_policy]") {
    REQUIRE(*parse_modifiers("") == 0);
    REQUIRE(*parse_modifiers("logo|shift") == (core::modifier::LOGO | core::modifier::SHIFT));
    REQUIRE(*parse_modifiers(" super | ctrl ") == (core::modifier::LOGO | core::modifier::CTRL));
    REQUIRE(*parse_modifiers("alt|control") == (core::modifier::ALT | core::modifier::CTRL));

    auto bad = parse_modifiers("logo|hyper");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().code == ErrorCode::script_error);
}

TEST_CASE("parse_key resolves names to level-zero keysyms", "[lua_policy]") {
    uint32_t mods = 0;
    REQUIRE(*parse_key("q", mods) == 0x71);
    REQUIRE(mods == 0);

    REQUIRE(*parse_key("Q", mods) == 0x71);
    REQUIRE(mods == core::modifier::SHIFT);

    mods = 0;
    REQUIRE(*parse_key("Return", mods) == 0xff0d);
    REQUIRE(*parse_key("return", mods) == 0xff0d);
    REQUIRE_FALSE(parse_key("NotAKey", mods));
    REQUIRE_FALSE(parse_key("", mods));
}

TEST_CASE("LuaPolicyEngine builds tables from a script", "[lua_policy]") {
    FakeHost host;
    LuaPolicyEngine engine(host);

    auto tables = engine.load(R"lua(
        scape.map_key{mods = "logo", key = "Return", action = {type = "spawn", command = "foot"}}
        scape.map_key{mods = "logo|shift", key = "q", action = "quit"}
        scape.map_key{mods = "logo", key = "2", action = {type = "tab", index = 2}, consume = false}
        scape.map_key{mods = "ctrl|alt", key = "F3", action = {type = "vt_switch", vt = 3}}
        scape.map_key{mods = "logo", key = "c", callback = function() scape.spawn("from-callback") end}
        scape.add_window_rule{app_id = "mpv", output = "HDMI-A-1", focus = false}
        scape.add_window_rule{title = "Picture", kind = "xwayland", x = 10, y = 20,
                              width = 320, height = 180, click_through = true}
        scape.set_zones{
            {name = "left", x = 0, y = 0, width = 960, height = 1080, default = true},
            {name = "right", x = 960, y = 0, width = 960, height = 1080},
        }
    )lua",
                              "init.lua");
    REQUIRE(tables);
    REQUIRE(engine.loaded());

    REQUIRE(tables->bindings.size() == 5);
    const auto& spawn = tables->bindings[0];
    REQUIRE(spawn.modifiers == core::modifier::LOGO);
    REQUIRE(spawn.keysym == 0xff0d);
    REQUIRE(std::get<core::action::Spawn>(spawn.action).command == "foot");
    REQUIRE(spawn.consume);

    REQUIRE(tables->bindings[1].modifiers == (core::modifier::LOGO | core::modifier::SHIFT));
    REQUIRE(std::holds_alternative<core::action::Quit>(tables->bindings[1].action));
    REQUIRE(std::get<core::action::Tab>(tables->bindings[2].action).index == 1);
    REQUIRE_FALSE(tables->bindings[2].consume);
    REQUIRE(std::get<core::action::VtSwitch>(tables->bindings[3].action).vt == 3);
    REQUIRE(std::holds_alternative<core::action::Callback>(tables->bindings[4].action));

    REQUIRE(tables->rules.size() == 2);
    REQUIRE(tables->rules[0].matcher.app_id == "mpv");
    REQUIRE(tables->rules[0].directive.focus == false);
    REQUIRE(tables->rules[1].matcher.kind == core::WindowKind::xwayland);
    REQUIRE(tables->rules[1].directive.size == core::Size{320, 180});
    REQUIRE(tables->rules[1].directive.click_through == true);

    REQUIRE(tables->zones.size() == 2);
    REQUIRE(tables->zones[0].is_default);
    REQUIRE(tables->zones[1].rect == core::Rect{960, 0, 960, 1080});

    SECTION("Callbacks run with host access") {
        auto ref = std::get<core::action::Callback>(tables->bindings[4].action).ref;
        REQUIRE(engine.invoke_callback(ref));
        REQUIRE(host.calls == std::vector<std::string>{"spawn from-callback"});
    }
}

TEST_CASE("LuaPolicyEngine keeps the previous state when a load fails", "[lua_policy]") {
    FakeHost host;
    LuaPolicyEngine engine(host);
    REQUIRE(engine.load("scape.on_startup(function() scape.spawn('first') end)", "a.lua"));

    SECTION("Syntax error") {
        auto result = engine.load("scape.map_key{", "b.lua");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::script_error);
    }

    SECTION("Runtime error") {
        auto result = engine.load("error('boom')", "b.lua");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().message.find("boom") != std::string::npos);
    }

    SECTION("Invalid table entry") {
        auto result = engine.load(R"(scape.map_key{mods = "hyper", key = "a", action = "quit"})",
                                  "b.lua");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().message.find("hyper") != std::string::npos);
    }

    REQUIRE(engine.on_startup());
    REQUIRE(host.calls == std::vector<std::string>{"spawn first"});
}

TEST_CASE("LuaPolicyEngine separates load-time and run-time calls", "[lua_policy]") {
    FakeHost host;
    LuaPolicyEngine engine(host);

    auto host_call_during_load = engine.load("scape.spawn('too-early')", "init.lua");
    REQUIRE_FALSE(host_call_during_load);
    REQUIRE(host.calls.empty());

    REQUIRE(engine.load(R"lua(
        scape.on_startup(function()
            scape.map_key{key = "a", action = "quit"}
        end)
    )lua",
                        "init.lua"));
    auto table_call_at_runtime = engine.on_startup();
    REQUIRE_FALSE(table_call_at_runtime);
    REQUIRE(table_call_at_runtime.error().message.find("only available while the script loads") !=
            std::string::npos);
}

TEST_CASE("LuaPolicyEngine hooks receive window and output tables", "[lua_policy]") {
    FakeHost host;
    host.outputs.push_back(core::OutputInfo{
        .id = 1, .name = "DP-1", .rect = {0, 0, 1920, 1080}, .scale = 1.0, .enabled = true});
    LuaPolicyEngine engine(host);

    REQUIRE(engine.load(R"lua(
        scape.on_window_map(function(w)
            if w.app_id == "foot" then
                scape.move_to_zone("left")
                scape.focus_window(w.id)
            end
        end)
        scape.on_window_unmap(function(w) scape.spawn("bye " .. w.title) end)
        scape.on_connector_change(function(outputs)
            for _, o in ipairs(outputs) do
                if o.name == "DP-1" then
                    scape.set_output(o.name, {x = 100, y = 0, scale = 1.5})
                end
            end
        end)
        scape.on_tick(function()
            if #scape.windows() == 0 then scape.quit() end
        end, 250)
        scape.on_startup(function() scape.focus_or_spawn("foot", "foot --server") end)
    )lua",
                        "init.lua"));

    core::WindowInfo foot;
    foot.id = 7;
    foot.app_id = "foot";
    foot.title = "shell";

    REQUIRE(engine.on_window_map(foot));
    REQUIRE(engine.on_window_unmap(foot));
    REQUIRE(engine.on_output_change(host.output_infos()));
    REQUIRE(engine.on_tick());
    REQUIRE(engine.on_startup());

    REQUIRE(host.calls == std::vector<std::string>{"move_to_zone left", "focus_window 7",
                                                   "spawn bye shell", "set_output DP-1", "quit",
                                                   "focus_or_spawn foot foot --server"});
    REQUIRE(host.last_change.position == core::Point{100, 0});
    REQUIRE(host.last_change.scale == 1.5);
    REQUIRE_FALSE(host.last_change.enabled.has_value());
}

TEST_CASE("LuaPolicyEngine reports on_tick interval in the tables", "[lua_policy]") {
    FakeHost host;
    LuaPolicyEngine engine(host);
    auto tables = engine.load("scape.on_tick(function() end, 500)", "init.lua");
    REQUIRE(tables);
    REQUIRE(tables->tick_interval_ms == 500);

    REQUIRE_FALSE(engine.load("scape.on_tick(function() end, -1)", "init.lua"));
}

TEST_CASE("LuaPolicyEngine isolates hook failures", "[lua_policy]") {
    FakeHost host;
    LuaPolicyEngine engine(host, LuaPolicyOptions{.instruction_limit = 100'000});
    REQUIRE(engine.load(R"lua(
        scape.on_startup(function() local t = nil; return t.field end)
        scape.on_startup(function() scape.spawn("second hook") end)
        scape.on_tick(function() while true do end end)
    )lua",
                        "init.lua"));

    auto startup = engine.on_startup();
    REQUIRE_FALSE(startup);
    // A failing hook does not stop the others
    REQUIRE(host.calls == std::vector<std::string>{"spawn second hook"});

    auto runaway = engine.on_tick();
    REQUIRE_FALSE(runaway);
    REQUIRE(runaway.error().message.find("instruction limit") != std::string::npos);

    // The interpreter is still usable afterwards
    REQUIRE_FALSE(engine.on_startup());
    REQUIRE(host.calls.size() == 2);
}

TEST_CASE("LuaPolicyEngine sandbox hides file and module access", "[lua_policy]") {
    FakeHost host;
    LuaPolicyEngine engine(host);

    REQUIRE_FALSE(engine.load("dofile('/etc/passwd')", "init.lua"));
    REQUIRE_FALSE(engine.load("require('os')", "init.lua"));
    REQUIRE_FALSE(engine.load("io.open('/tmp/x', 'w')", "init.lua"));
    REQUIRE_FALSE(engine.load("os.execute('true')", "init.lua"));
    REQUIRE(engine.load("print(string.format('%d', math.floor(2.5)))", "init.lua"));
}

TEST_CASE("LuaPolicyEngine hooks are no-ops before a script loads", "[lua_policy]") {
    FakeHost host;
    LuaPolicyEngine engine(host);
    REQUIRE_FALSE(engine.loaded());
    REQUIRE(engine.on_startup());
    REQUIRE(engine.on_tick());
    REQUIRE_FALSE(engine.invoke_callback(1));
}

TEST_CASE("LuaPolicyEngine exposes seat grabs to callbacks", "[lua_policy]") {
    FakeHost host;
    LuaPolicyEngine engine(host);
    REQUIRE(engine.load(R"lua(
        scape.on_window_map(function(w)
            if w.app_id == "locker" then
                assert(scape.grab(w.id))
                assert(scape.grab(w.id, "pointer"))
            end
        end)
        scape.on_window_unmap(function(w)
            assert(scape.release_grab() == false)
        end)
        scape.on_tick(function() scape.grab(1, "touch") end)
    )lua",
                        "init.lua"));

    core::WindowInfo locker;
    locker.id = 3;
    locker.app_id = "locker";
    REQUIRE(engine.on_window_map(locker));
    REQUIRE(engine.on_window_unmap(locker));
    REQUIRE(host.calls ==
            std::vector<std::string>{"grab 3 keyboard", "grab 3 pointer", "release_grab"});

    auto bad_kind = engine.on_tick();
    REQUIRE_FALSE(bad_kind);
    REQUIRE(bad_kind.error().message.find("'keyboard' or 'pointer'") != std::string::npos);

    REQUIRE_FALSE(engine.load("scape.grab(1)", "init.lua"));
}

TEST_CASE("LuaPolicyEngine reads tables without running metamethods", "[lua_policy]") {
    FakeHost host;
    LuaPolicyEngine engine(host);

    auto tables = engine.load(R"lua(
        local strict = {__index = function(_, key) error("no field " .. key) end}
        scape.map_key(setmetatable({key = "a", action = "quit"}, strict))
        scape.add_window_rule(setmetatable({app_id = "mpv"}, strict))
    )lua",
                              "init.lua");
    REQUIRE(tables);
    REQUIRE(tables->bindings.size() == 1);
    REQUIRE(tables->bindings[0].modifiers == 0);
    REQUIRE(tables->rules.size() == 1);

    SECTION("A failing __tostring in print is an ordinary script error") {
        auto result = engine.load(R"lua(
            print("value", setmetatable({}, {__tostring = function() error("cannot print") end}))
        )lua",
                                  "print.lua");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().message.find("cannot print") != std::string::npos);
        REQUIRE(engine.load("print('still', 1, true, nil)", "print.lua"));
    }
}
