#include "lua_policy.hpp"

#include <cctype>
#include <core/seat.hpp>
#include <functional>
#include <lua.hpp>
#include <optional>
#include <string>
#include <util/logging.hpp>
#include <util/profiling.hpp>
#include <vector>
#include <xkbcommon/xkbcommon.h>

namespace scape::script {

struct LuaPolicyEngine::State {
    lua_State* L = nullptr;
    core::PolicyHost* host = nullptr;
    uint64_t instruction_limit = 0;
    uint64_t executed = 0;
    bool loading = false;
    core::PolicyTables tables;
    std::vector<int> startup_hooks;
    std::vector<int> window_map_hooks;
    std::vector<int> window_unmap_hooks;
    std::vector<int> output_change_hooks;
    std::vector<int> tick_hooks;

    State() = default;
    ~State() {
        if (L != nullptr) {
            lua_close(L);
        }
    }

    State(const State&) = delete;
    State& operator=(const State&) = delete;
    State(State&&) = delete;
    State& operator=(State&&) = delete;
};

namespace {

using State = LuaPolicyEngine::State;

constexpr int COUNT_HOOK_STRIDE = 1000;

// Only the address matters: registry key for the owning State
const char STATE_KEY = 0;

auto state_of(lua_State* L) -> State* {
    lua_rawgetp(L, LUA_REGISTRYINDEX, &STATE_KEY);
    auto* state = static_cast<State*>(lua_touserdata(L, -1));
    lua_pop(L, 1);
    return state;
}

void count_hook(lua_State* L, lua_Debug* /*ar*/) {
    auto* state = state_of(L);
    state->executed += COUNT_HOOK_STRIDE;
    if (state->executed > state->instruction_limit) {
        luaL_error(L, "instruction limit of %llu exceeded",
                   static_cast<unsigned long long>(state->instruction_limit));
    }
}

auto message_handler(lua_State* L) -> int {
    const char* msg = lua_tostring(L, 1);
    if (msg == nullptr) {
        msg = luaL_tolstring(L, 1, nullptr);
    }
    luaL_traceback(L, L, msg, 1);
    return 1;
}

/// Expects the function and its @p nargs arguments on top of the stack.
auto protected_call(State& state, int nargs) -> Result<void> {
    lua_State* L = state.L;
    const int base = lua_gettop(L) - nargs;
    lua_pushcfunction(L, message_handler);
    lua_insert(L, base);
    state.executed = 0;
    const int status = lua_pcall(L, nargs, 0, base);
    lua_remove(L, base);
    if (status != LUA_OK) {
        std::string message = lua_tostring(L, -1) != nullptr ? lua_tostring(L, -1) : "unknown";
        lua_pop(L, 1);
        return make_error<void>(ErrorCode::script_error, std::move(message));
    }
    return {};
}

/// Runs @p impl and converts its error into a Lua error once no C++ object is alive.
template <typename Fn>
auto guarded(lua_State* L, Fn&& impl) -> int {
    int results = 0;
    bool failed = false;
    {
        Result<int> result = impl(L);
        if (result) {
            results = *result;
        } else {
            lua_pushstring(L, result.error().message.c_str());
            failed = true;
        }
    }
    if (failed) {
        return lua_error(L);
    }
    return results;
}

auto fail(std::string message) -> Result<int> {
    return make_error<int>(ErrorCode::script_error, std::move(message));
}

/// Pushes table[key] without running metamethods, so no Lua error can unwind past the caller.
auto raw_field(lua_State* L, int table, const char* key) -> int {
    lua_pushstring(L, key);
    return lua_rawget(L, table);
}

auto opt_string(lua_State* L, int table, const char* key) -> Result<std::optional<std::string>> {
    raw_field(L, table, key);
    std::optional<std::string> out;
    const int type = lua_type(L, -1);
    if (type == LUA_TSTRING) {
        out = lua_tostring(L, -1);
    }
    lua_pop(L, 1);
    if (type != LUA_TSTRING && type != LUA_TNIL) {
        return make_error<std::optional<std::string>>(
            ErrorCode::script_error, std::string("field '") + key + "' must be a string");
    }
    return out;
}

auto opt_integer(lua_State* L, int table, const char* key) -> Result<std::optional<int64_t>> {
    raw_field(L, table, key);
    std::optional<int64_t> out;
    const int type = lua_type(L, -1);
    bool valid = type == LUA_TNIL;
    if (type == LUA_TNUMBER) {
        int is_integer = 0;
        lua_Integer value = lua_tointegerx(L, -1, &is_integer);
        if (is_integer != 0) {
            out = static_cast<int64_t>(value);
            valid = true;
        }
    }
    lua_pop(L, 1);
    if (!valid) {
        return make_error<std::optional<int64_t>>(
            ErrorCode::script_error, std::string("field '") + key + "' must be an integer");
    }
    return out;
}

auto opt_number(lua_State* L, int table, const char* key) -> Result<std::optional<double>> {
    raw_field(L, table, key);
    std::optional<double> out;
    const int type = lua_type(L, -1);
    if (type == LUA_TNUMBER) {
        out = static_cast<double>(lua_tonumber(L, -1));
    }
    lua_pop(L, 1);
    if (type != LUA_TNUMBER && type != LUA_TNIL) {
        return make_error<std::optional<double>>(
            ErrorCode::script_error, std::string("field '") + key + "' must be a number");
    }
    return out;
}

auto opt_bool(lua_State* L, int table, const char* key) -> Result<std::optional<bool>> {
    raw_field(L, table, key);
    std::optional<bool> out;
    const int type = lua_type(L, -1);
    if (type == LUA_TBOOLEAN) {
        out = lua_toboolean(L, -1) != 0;
    }
    lua_pop(L, 1);
    if (type != LUA_TBOOLEAN && type != LUA_TNIL) {
        return make_error<std::optional<bool>>(
            ErrorCode::script_error, std::string("field '") + key + "' must be a boolean");
    }
    return out;
}

auto require_loading(const State& state, const char* fn) -> Result<void> {
    if (!state.loading) {
        return make_error<void>(ErrorCode::script_error,
                                std::string("scape.") + fn +
                                    " is only available while the script loads");
    }
    return {};
}

auto require_running(const State& state, const char* fn) -> Result<void> {
    if (state.loading) {
        return make_error<void>(ErrorCode::script_error,
                                std::string("scape.") + fn +
                                    " is not available while the script loads; call it from "
                                    "scape.on_startup");
    }
    return {};
}

auto parse_action(lua_State* L, int table) -> Result<std::optional<core::Action>> {
    using ActionResult = Result<std::optional<core::Action>>;
    const int type = raw_field(L, table, "action");

    if (type == LUA_TNIL) {
        lua_pop(L, 1);
        return std::optional<core::Action>{};
    }

    if (type == LUA_TSTRING) {
        std::string name = lua_tostring(L, -1);
        lua_pop(L, 1);
        if (name == "quit") {
            return std::optional<core::Action>{core::action::Quit{}};
        }
        if (name == "close_window") {
            return std::optional<core::Action>{core::action::CloseWindow{}};
        }
        if (name == "none") {
            return std::optional<core::Action>{core::action::None{}};
        }
        return make_error<std::optional<core::Action>>(ErrorCode::script_error,
                                                       "unknown action '" + name + "'");
    }

    if (type != LUA_TTABLE) {
        lua_pop(L, 1);
        return make_error<std::optional<core::Action>>(ErrorCode::script_error,
                                                       "action must be a string or a table");
    }

    const int action_table = lua_gettop(L);
    auto finish = [&](ActionResult result) {
        lua_remove(L, action_table);
        return result;
    };

    auto type_name = opt_string(L, action_table, "type");
    if (!type_name || !*type_name) {
        return finish(make_error<std::optional<core::Action>>(
            ErrorCode::script_error, "action table needs a 'type' string"));
    }
    const std::string& kind = **type_name;

    if (kind == "quit") {
        return finish(std::optional<core::Action>{core::action::Quit{}});
    }
    if (kind == "close_window") {
        return finish(std::optional<core::Action>{core::action::CloseWindow{}});
    }
    if (kind == "spawn") {
        auto command = opt_string(L, action_table, "command");
        if (!command || !*command) {
            return finish(make_error<std::optional<core::Action>>(
                ErrorCode::script_error, "spawn action needs a 'command'"));
        }
        return finish(std::optional<core::Action>{core::action::Spawn{**command}});
    }
    if (kind == "focus_or_spawn") {
        auto app_id = opt_string(L, action_table, "app_id");
        auto command = opt_string(L, action_table, "command");
        if (!app_id || !*app_id || !command || !*command) {
            return finish(make_error<std::optional<core::Action>>(
                ErrorCode::script_error, "focus_or_spawn action needs 'app_id' and 'command'"));
        }
        return finish(
            std::optional<core::Action>{core::action::FocusOrSpawn{**app_id, **command}});
    }
    if (kind == "move_to_zone") {
        auto zone = opt_string(L, action_table, "zone");
        if (!zone || !*zone) {
            return finish(make_error<std::optional<core::Action>>(
                ErrorCode::script_error, "move_to_zone action needs a 'zone'"));
        }
        return finish(std::optional<core::Action>{core::action::MoveToZone{**zone}});
    }
    if (kind == "tab") {
        auto index = opt_integer(L, action_table, "index");
        if (!index || !*index || **index < 1) {
            return finish(make_error<std::optional<core::Action>>(
                ErrorCode::script_error, "tab action needs an 'index' >= 1"));
        }
        return finish(std::optional<core::Action>{
            core::action::Tab{static_cast<uint32_t>(**index - 1)}});
    }
    if (kind == "vt_switch") {
        auto vt = opt_integer(L, action_table, "vt");
        if (!vt || !*vt || **vt < 1 || **vt > 63) {
            return finish(make_error<std::optional<core::Action>>(
                ErrorCode::script_error, "vt_switch action needs a 'vt' in 1-63"));
        }
        return finish(
            std::optional<core::Action>{core::action::VtSwitch{static_cast<uint32_t>(**vt)}});
    }
    return finish(make_error<std::optional<core::Action>>(ErrorCode::script_error,
                                                          "unknown action type '" + kind + "'"));
}

void push_window(lua_State* L, const core::WindowInfo& window) {
    lua_createtable(L, 0, 10);
    lua_pushinteger(L, window.id);
    lua_setfield(L, -2, "id");
    lua_pushstring(L, window.app_id.c_str());
    lua_setfield(L, -2, "app_id");
    lua_pushstring(L, window.title.c_str());
    lua_setfield(L, -2, "title");
    lua_pushboolean(L, window.xwayland ? 1 : 0);
    lua_setfield(L, -2, "xwayland");
    lua_pushinteger(L, window.geometry.x);
    lua_setfield(L, -2, "x");
    lua_pushinteger(L, window.geometry.y);
    lua_setfield(L, -2, "y");
    lua_pushinteger(L, window.geometry.width);
    lua_setfield(L, -2, "width");
    lua_pushinteger(L, window.geometry.height);
    lua_setfield(L, -2, "height");
    lua_pushstring(L, window.output.c_str());
    lua_setfield(L, -2, "output");
    lua_pushboolean(L, window.focused ? 1 : 0);
    lua_setfield(L, -2, "focused");
}

void push_output(lua_State* L, const core::OutputInfo& output) {
    lua_createtable(L, 0, 9);
    lua_pushinteger(L, output.id);
    lua_setfield(L, -2, "id");
    lua_pushstring(L, output.name.c_str());
    lua_setfield(L, -2, "name");
    lua_pushinteger(L, output.rect.x);
    lua_setfield(L, -2, "x");
    lua_pushinteger(L, output.rect.y);
    lua_setfield(L, -2, "y");
    lua_pushinteger(L, output.rect.width);
    lua_setfield(L, -2, "width");
    lua_pushinteger(L, output.rect.height);
    lua_setfield(L, -2, "height");
    lua_pushnumber(L, output.scale);
    lua_setfield(L, -2, "scale");
    lua_pushboolean(L, output.enabled ? 1 : 0);
    lua_setfield(L, -2, "enabled");
    lua_pushboolean(L, output.enabled ? 0 : 1);
    lua_setfield(L, -2, "disabled");
}

void push_outputs(lua_State* L, const std::vector<core::OutputInfo>& outputs) {
    lua_createtable(L, static_cast<int>(outputs.size()), 0);
    lua_Integer i = 1;
    for (const auto& output : outputs) {
        push_output(L, output);
        lua_rawseti(L, -2, i++);
    }
}

// -----------------------------------------------------------------------------
// Table-producing calls
// -----------------------------------------------------------------------------

auto map_key_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_loading(*state, "map_key"));
    if (!lua_istable(L, 1)) {
        return fail("scape.map_key expects a table");
    }

    auto mods_name = SCAPE_TRY(opt_string(L, 1, "mods"));
    uint32_t mods = SCAPE_TRY(parse_modifiers(mods_name.value_or("")));
    auto key_name = SCAPE_TRY(opt_string(L, 1, "key"));
    if (!key_name) {
        return fail("scape.map_key needs a 'key'");
    }
    uint32_t keysym = SCAPE_TRY(parse_key(*key_name, mods));
    bool consume = SCAPE_TRY(opt_bool(L, 1, "consume")).value_or(true);

    std::optional<core::Action> action;
    raw_field(L, 1, "callback");
    if (lua_isfunction(L, -1)) {
        action = core::action::Callback{luaL_ref(L, LUA_REGISTRYINDEX)};
    } else {
        const bool nil = lua_isnil(L, -1);
        lua_pop(L, 1);
        if (!nil) {
            return fail("field 'callback' must be a function");
        }
        action = SCAPE_TRY(parse_action(L, 1));
    }
    if (!action) {
        return fail("scape.map_key needs an 'action' or a 'callback'");
    }

    state->tables.bindings.push_back(core::Binding{
        .modifiers = mods, .keysym = keysym, .action = std::move(*action), .consume = consume});
    return 0;
}

auto add_window_rule_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_loading(*state, "add_window_rule"));
    if (!lua_istable(L, 1)) {
        return fail("scape.add_window_rule expects a table");
    }

    core::PlacementRule rule;
    rule.matcher.app_id = SCAPE_TRY(opt_string(L, 1, "app_id"));
    rule.matcher.title_contains = SCAPE_TRY(opt_string(L, 1, "title"));
    if (auto kind = SCAPE_TRY(opt_string(L, 1, "kind"))) {
        if (*kind == "wayland") {
            rule.matcher.kind = core::WindowKind::wayland;
        } else if (*kind == "xwayland") {
            rule.matcher.kind = core::WindowKind::xwayland;
        } else if (*kind != "any") {
            return fail("field 'kind' must be 'any', 'wayland' or 'xwayland'");
        }
    }

    auto& directive = rule.directive;
    directive.output = SCAPE_TRY(opt_string(L, 1, "output"));
    directive.zone = SCAPE_TRY(opt_string(L, 1, "zone"));
    auto x = SCAPE_TRY(opt_integer(L, 1, "x"));
    auto y = SCAPE_TRY(opt_integer(L, 1, "y"));
    if (x.has_value() != y.has_value()) {
        return fail("scape.add_window_rule needs both 'x' and 'y'");
    }
    if (x) {
        directive.position = core::Point{static_cast<double>(*x), static_cast<double>(*y)};
    }
    auto width = SCAPE_TRY(opt_integer(L, 1, "width"));
    auto height = SCAPE_TRY(opt_integer(L, 1, "height"));
    if (width.has_value() != height.has_value()) {
        return fail("scape.add_window_rule needs both 'width' and 'height'");
    }
    if (width) {
        if (*width <= 0 || *height <= 0) {
            return fail("window rule size must be positive");
        }
        directive.size = core::Size{static_cast<int32_t>(*width), static_cast<int32_t>(*height)};
    }
    directive.focus = SCAPE_TRY(opt_bool(L, 1, "focus"));
    directive.click_through = SCAPE_TRY(opt_bool(L, 1, "click_through"));

    state->tables.rules.push_back(std::move(rule));
    return 0;
}

auto set_zones_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_loading(*state, "set_zones"));
    if (!lua_istable(L, 1)) {
        return fail("scape.set_zones expects a list of zones");
    }

    std::vector<core::Zone> zones;
    const auto count = static_cast<lua_Integer>(lua_rawlen(L, 1));
    for (lua_Integer i = 1; i <= count; ++i) {
        lua_rawgeti(L, 1, i);
        const int entry = lua_gettop(L);
        if (!lua_istable(L, entry)) {
            lua_pop(L, 1);
            return fail("zone " + std::to_string(i) + " is not a table");
        }
        auto name = opt_string(L, entry, "name");
        auto x = opt_integer(L, entry, "x");
        auto y = opt_integer(L, entry, "y");
        auto w = opt_integer(L, entry, "width");
        auto h = opt_integer(L, entry, "height");
        auto is_default = opt_bool(L, entry, "default");
        lua_pop(L, 1);

        if (!name || !x || !y || !w || !h || !is_default) {
            return fail("zone " + std::to_string(i) + " has a field of the wrong type");
        }
        if (!*name || !*x || !*y || !*w || !*h) {
            return fail("zone " + std::to_string(i) + " needs name, x, y, width and height");
        }
        zones.push_back(core::Zone{
            .name = **name,
            .rect = {static_cast<int32_t>(**x), static_cast<int32_t>(**y),
                     static_cast<int32_t>(**w), static_cast<int32_t>(**h)},
            .is_default = is_default->value_or(false)});
    }

    state->tables.zones = std::move(zones);
    return 0;
}

auto register_hook(lua_State* L, std::vector<int>& hooks, const char* fn) -> Result<int> {
    if (!lua_isfunction(L, 1)) {
        return fail(std::string("scape.") + fn + " expects a function");
    }
    lua_pushvalue(L, 1);
    hooks.push_back(luaL_ref(L, LUA_REGISTRYINDEX));
    return 0;
}

auto on_startup_impl(lua_State* L) -> Result<int> {
    return register_hook(L, state_of(L)->startup_hooks, "on_startup");
}

auto on_window_map_impl(lua_State* L) -> Result<int> {
    return register_hook(L, state_of(L)->window_map_hooks, "on_window_map");
}

auto on_window_unmap_impl(lua_State* L) -> Result<int> {
    return register_hook(L, state_of(L)->window_unmap_hooks, "on_window_unmap");
}

auto on_connector_change_impl(lua_State* L) -> Result<int> {
    return register_hook(L, state_of(L)->output_change_hooks, "on_connector_change");
}

auto on_tick_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    if (lua_gettop(L) >= 2 && !lua_isnil(L, 2)) {
        int is_integer = 0;
        lua_Integer interval = lua_tointegerx(L, 2, &is_integer);
        if (is_integer == 0 || interval <= 0) {
            return fail("scape.on_tick interval must be a positive integer (ms)");
        }
        state->tables.tick_interval_ms = static_cast<uint32_t>(interval);
    }
    return register_hook(L, state->tick_hooks, "on_tick");
}

// -----------------------------------------------------------------------------
// Host calls
// -----------------------------------------------------------------------------

auto string_arg(lua_State* L, int index, const char* fn) -> Result<std::string> {
    if (lua_type(L, index) != LUA_TSTRING) {
        return make_error<std::string>(ErrorCode::script_error,
                                       std::string("scape.") + fn + ": argument " +
                                           std::to_string(index) + " must be a string");
    }
    return std::string(lua_tostring(L, index));
}

auto window_arg(lua_State* L, int index, const char* fn) -> Result<core::WindowId> {
    int is_integer = 0;
    lua_Integer id = lua_tointegerx(L, index, &is_integer);
    if (is_integer == 0 || id <= 0) {
        return make_error<core::WindowId>(ErrorCode::script_error,
                                          std::string("scape.") + fn + " expects a window id");
    }
    return static_cast<core::WindowId>(id);
}

auto spawn_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_running(*state, "spawn"));
    auto command = SCAPE_TRY(string_arg(L, 1, "spawn"));
    state->host->spawn(command);
    return 0;
}

auto focus_or_spawn_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_running(*state, "focus_or_spawn"));
    auto app_id = SCAPE_TRY(string_arg(L, 1, "focus_or_spawn"));
    auto command = SCAPE_TRY(string_arg(L, 2, "focus_or_spawn"));
    state->host->focus_or_spawn(app_id, command);
    return 0;
}

auto move_to_zone_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_running(*state, "move_to_zone"));
    auto zone = SCAPE_TRY(string_arg(L, 1, "move_to_zone"));
    lua_pushboolean(L, state->host->move_to_zone(zone) ? 1 : 0);
    return 1;
}

auto focus_window_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_running(*state, "focus_window"));
    auto id = SCAPE_TRY(window_arg(L, 1, "focus_window"));
    lua_pushboolean(L, state->host->focus_window(id) ? 1 : 0);
    return 1;
}

auto close_window_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_running(*state, "close_window"));
    auto id = SCAPE_TRY(window_arg(L, 1, "close_window"));
    lua_pushboolean(L, state->host->close_window(id) ? 1 : 0);
    return 1;
}

auto grab_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_running(*state, "grab"));
    auto id = SCAPE_TRY(window_arg(L, 1, "grab"));
    core::GrabKind kind = core::GrabKind::keyboard;
    if (!lua_isnoneornil(L, 2)) {
        auto name = SCAPE_TRY(string_arg(L, 2, "grab"));
        if (name == "pointer") {
            kind = core::GrabKind::pointer;
        } else if (name != "keyboard") {
            return fail("scape.grab: kind must be 'keyboard' or 'pointer'");
        }
    }
    lua_pushboolean(L, state->host->grab_input(id, kind) ? 1 : 0);
    return 1;
}

auto release_grab_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_running(*state, "release_grab"));
    lua_pushboolean(L, state->host->release_input() ? 1 : 0);
    return 1;
}

auto windows_impl(lua_State* L) -> Result<int> {
    auto windows = state_of(L)->host->window_infos();
    lua_createtable(L, static_cast<int>(windows.size()), 0);
    lua_Integer i = 1;
    for (const auto& window : windows) {
        push_window(L, window);
        lua_rawseti(L, -2, i++);
    }
    return 1;
}

auto outputs_impl(lua_State* L) -> Result<int> {
    push_outputs(L, state_of(L)->host->output_infos());
    return 1;
}

auto set_output_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_running(*state, "set_output"));
    auto name = SCAPE_TRY(string_arg(L, 1, "set_output"));
    if (!lua_istable(L, 2)) {
        return fail("scape.set_output expects a settings table");
    }
    core::OutputChange change;
    auto x = SCAPE_TRY(opt_number(L, 2, "x"));
    auto y = SCAPE_TRY(opt_number(L, 2, "y"));
    if (x.has_value() != y.has_value()) {
        return fail("scape.set_output needs both 'x' and 'y'");
    }
    if (x) {
        change.position = core::Point{*x, *y};
    }
    change.scale = SCAPE_TRY(opt_number(L, 2, "scale"));
    change.enabled = SCAPE_TRY(opt_bool(L, 2, "enabled"));
    lua_pushboolean(L, state->host->configure_output(name, change) ? 1 : 0);
    return 1;
}

auto quit_impl(lua_State* L) -> Result<int> {
    auto* state = state_of(L);
    SCAPE_TRY(require_running(*state, "quit"));
    state->host->quit();
    return 0;
}

auto log_impl(lua_State* L) -> Result<int> {
    auto message = SCAPE_TRY(string_arg(L, 1, "log"));
    SCAPE_LOG_INFO("[script] {}", message);
    return 0;
}

auto print_impl(lua_State* L) -> Result<int> {
    // __tostring may raise; build the line in a Lua buffer before any C++ object exists
    luaL_Buffer buffer;
    luaL_buffinit(L, &buffer);
    const int n = lua_gettop(L);
    for (int i = 1; i <= n; ++i) {
        if (i > 1) {
            luaL_addchar(&buffer, '\t');
        }
        luaL_tolstring(L, i, nullptr);
        luaL_addvalue(&buffer);
    }
    luaL_pushresult(&buffer);
    SCAPE_LOG_INFO("[script] {}", lua_tostring(L, -1));
    lua_pop(L, 1);
    return 0;
}

template <auto Impl>
auto lua_entry(lua_State* L) -> int {
    return guarded(L, Impl);
}

const luaL_Reg SCAPE_MODULE[] = {
    {"map_key", lua_entry<map_key_impl>},
    {"add_window_rule", lua_entry<add_window_rule_impl>},
    {"set_zones", lua_entry<set_zones_impl>},
    {"on_startup", lua_entry<on_startup_impl>},
    {"on_window_map", lua_entry<on_window_map_impl>},
    {"on_window_unmap", lua_entry<on_window_unmap_impl>},
    {"on_connector_change", lua_entry<on_connector_change_impl>},
    {"on_tick", lua_entry<on_tick_impl>},
    {"spawn", lua_entry<spawn_impl>},
    {"focus_or_spawn", lua_entry<focus_or_spawn_impl>},
    {"move_to_zone", lua_entry<move_to_zone_impl>},
    {"focus_window", lua_entry<focus_window_impl>},
    {"close_window", lua_entry<close_window_impl>},
    {"grab", lua_entry<grab_impl>},
    {"release_grab", lua_entry<release_grab_impl>},
    {"windows", lua_entry<windows_impl>},
    {"outputs", lua_entry<outputs_impl>},
    {"set_output", lua_entry<set_output_impl>},
    {"quit", lua_entry<quit_impl>},
    {"log", lua_entry<log_impl>},
    {nullptr, nullptr},
};

void open_sandbox(lua_State* L) {
    luaL_requiref(L, LUA_GNAME, luaopen_base, 1);
    luaL_requiref(L, LUA_STRLIBNAME, luaopen_string, 1);
    luaL_requiref(L, LUA_TABLIBNAME, luaopen_table, 1);
    luaL_requiref(L, LUA_MATHLIBNAME, luaopen_math, 1);
    luaL_requiref(L, LUA_UTF8LIBNAME, luaopen_utf8, 1);
    lua_pop(L, 5);

    for (const char* name : {"load", "loadfile", "dofile", "require"}) {
        lua_pushnil(L);
        lua_setglobal(L, name);
    }
    lua_pushcfunction(L, lua_entry<print_impl>);
    lua_setglobal(L, "print");

    lua_newtable(L);
    luaL_setfuncs(L, SCAPE_MODULE, 0);
    lua_setglobal(L, "scape");
}

auto run_hooks(State* state, const std::vector<int>& hooks, const char* name,
               const std::function<int(lua_State*)>& push_args) -> Result<void> {
    if (state == nullptr) {
        return {};
    }
    SCAPE_PROFILE_SCOPE("LuaHook");
    std::optional<Error> first_error;
    for (int ref : hooks) {
        lua_rawgeti(state->L, LUA_REGISTRYINDEX, ref);
        const int nargs = push_args ? push_args(state->L) : 0;
        auto result = protected_call(*state, nargs);
        if (!result) {
            SCAPE_LOG_DEBUG("Lua hook '{}' raised: {}", name, result.error().message);
            if (!first_error) {
                first_error = result.error();
            }
        }
    }
    if (first_error) {
        return nonstd::make_unexpected(std::move(*first_error));
    }
    return {};
}

} // namespace

auto parse_modifiers(std::string_view mods) -> Result<uint32_t> {
    uint32_t mask = 0;
    size_t start = 0;
    while (start <= mods.size()) {
        size_t end = mods.find('|', start);
        if (end == std::string_view::npos) {
            end = mods.size();
        }
        std::string_view token = mods.substr(start, end - start);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())) != 0) {
            token.remove_prefix(1);
        }
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())) != 0) {
            token.remove_suffix(1);
        }

        if (token == "shift") {
            mask |= core::modifier::SHIFT;
        } else if (token == "logo" || token == "super") {
            mask |= core::modifier::LOGO;
        } else if (token == "ctrl" || token == "control") {
            mask |= core::modifier::CTRL;
        } else if (token == "alt") {
            mask |= core::modifier::ALT;
        } else if (!token.empty()) {
            return make_error<uint32_t>(ErrorCode::script_error,
                                        "unknown modifier '" + std::string(token) + "'");
        }
        start = end + 1;
    }
    return mask;
}

auto parse_key(std::string_view key, uint32_t& modifiers) -> Result<uint32_t> {
    if (key.empty()) {
        return make_error<uint32_t>(ErrorCode::script_error, "empty key name");
    }
    std::string name(key);
    if (name.size() == 1 && std::isupper(static_cast<unsigned char>(name[0])) != 0) {
        modifiers |= core::modifier::SHIFT;
        name[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
    }

    xkb_keysym_t sym = xkb_keysym_from_name(name.c_str(), XKB_KEYSYM_NO_FLAGS);
    if (sym == XKB_KEY_NoSymbol) {
        sym = xkb_keysym_from_name(name.c_str(), XKB_KEYSYM_CASE_INSENSITIVE);
    }
    if (sym == XKB_KEY_NoSymbol) {
        return make_error<uint32_t>(ErrorCode::script_error, "unknown key '" + name + "'");
    }
    return xkb_keysym_to_lower(sym);
}

LuaPolicyEngine::LuaPolicyEngine(core::PolicyHost& host, LuaPolicyOptions options)
    : m_host(host), m_options(options) {}

LuaPolicyEngine::~LuaPolicyEngine() = default;

auto LuaPolicyEngine::load(std::string_view source, std::string_view chunk_name)
    -> Result<core::PolicyTables> {
    SCAPE_PROFILE_FUNCTION();
    auto fresh = std::make_unique<State>();
    fresh->L = luaL_newstate();
    if (fresh->L == nullptr) {
        return make_error<core::PolicyTables>(ErrorCode::script_error,
                                              "Failed to create Lua state");
    }
    fresh->host = &m_host;
    fresh->instruction_limit = m_options.instruction_limit;

    lua_State* L = fresh->L;
    lua_pushlightuserdata(L, fresh.get());
    lua_rawsetp(L, LUA_REGISTRYINDEX, &STATE_KEY);
    open_sandbox(L);
    lua_sethook(L, count_hook, LUA_MASKCOUNT, COUNT_HOOK_STRIDE);

    const std::string chunk = "=" + std::string(chunk_name);
    if (luaL_loadbufferx(L, source.data(), source.size(), chunk.c_str(), "t") != LUA_OK) {
        std::string message = lua_tostring(L, -1) != nullptr ? lua_tostring(L, -1) : "unknown";
        return make_error<core::PolicyTables>(ErrorCode::script_error,
                                              "Script syntax error: " + message);
    }

    fresh->loading = true;
    auto result = protected_call(*fresh, 0);
    fresh->loading = false;
    if (!result) {
        return make_error<core::PolicyTables>(ErrorCode::script_error,
                                              "Script failed: " + result.error().message);
    }

    core::PolicyTables tables = fresh->tables;
    m_state = std::move(fresh);
    return tables;
}

auto LuaPolicyEngine::on_startup() -> Result<void> {
    if (!m_state) {
        return {};
    }
    return run_hooks(m_state.get(), m_state->startup_hooks, "startup", {});
}

auto LuaPolicyEngine::on_window_map(const core::WindowInfo& window) -> Result<void> {
    if (!m_state) {
        return {};
    }
    return run_hooks(m_state.get(), m_state->window_map_hooks, "window_map",
                     [&window](lua_State* L) {
                         push_window(L, window);
                         return 1;
                     });
}

auto LuaPolicyEngine::on_window_unmap(const core::WindowInfo& window) -> Result<void> {
    if (!m_state) {
        return {};
    }
    return run_hooks(m_state.get(), m_state->window_unmap_hooks, "window_unmap",
                     [&window](lua_State* L) {
                         push_window(L, window);
                         return 1;
                     });
}

auto LuaPolicyEngine::on_output_change(const std::vector<core::OutputInfo>& outputs)
    -> Result<void> {
    if (!m_state) {
        return {};
    }
    return run_hooks(m_state.get(), m_state->output_change_hooks, "output_change",
                     [&outputs](lua_State* L) {
                         push_outputs(L, outputs);
                         return 1;
                     });
}

auto LuaPolicyEngine::on_tick() -> Result<void> {
    if (!m_state) {
        return {};
    }
    return run_hooks(m_state.get(), m_state->tick_hooks, "tick", {});
}

auto LuaPolicyEngine::invoke_callback(core::CallbackRef ref) -> Result<void> {
    if (!m_state) {
        return make_error<void>(ErrorCode::script_error, "No script loaded");
    }
    lua_State* L = m_state->L;
    if (lua_rawgeti(L, LUA_REGISTRYINDEX, ref) != LUA_TFUNCTION) {
        lua_pop(L, 1);
        return make_error<void>(ErrorCode::script_error,
                                "Callback " + std::to_string(ref) + " is not a function");
    }
    return protected_call(*m_state, 0);
}

} // namespace scape::script
