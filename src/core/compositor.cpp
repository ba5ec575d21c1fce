#include "compositor.hpp"

#include <algorithm>
#include <util/logging.hpp>
#include <util/profiling.hpp>
#include <util/serializer.hpp>

namespace scape::core {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

auto size_of(const Rect& rect) -> Size {
    return {rect.width, rect.height};
}

} // namespace

auto compositor_config_from(const Config& config) -> CompositorConfig {
    CompositorConfig out;
    out.input.focus_mode = config.input.focus_mode;
    out.input.raise_on_focus = config.input.raise_on_focus;
    out.backoff.initial = std::chrono::milliseconds{config.render.frame_retry_initial_ms};
    out.backoff.max = std::chrono::milliseconds{config.render.frame_retry_max_ms};
    out.max_clients = config.limits.max_clients;
    out.max_surfaces = config.limits.max_surfaces;
    out.screencast_policy = config.screencast.policy;
    out.screencast_interval = std::chrono::milliseconds{config.screencast.interval_ms};
    out.reload_debounce = std::chrono::milliseconds{config.policy.reload_debounce_ms};
    out.tick_interval = std::chrono::milliseconds{config.policy.tick_interval_ms};
    return out;
}

Compositor::Compositor(Collaborators collaborators, CompositorConfig config)
    : m_render(collaborators.render), m_sink(collaborators.sink),
      m_launcher(collaborators.launcher), m_session(collaborators.session),
      m_clock(std::move(collaborators.clock)), m_config(config),
      m_tree(m_outputs, m_seats, *this),
      m_router(m_outputs, m_tree, m_seats, m_sink, *this, config.input),
      m_screencast(config.screencast_policy, config.screencast_interval),
      m_tick_interval(config.tick_interval) {
    if (!m_clock) {
        m_clock = [] { return Clock::now(); };
    }
    m_seat = m_seats.add_seat("seat0");
}

Compositor::~Compositor() = default;

void Compositor::set_policy_engine(std::unique_ptr<PolicyEngine> engine) {
    m_engine = std::move(engine);
}

void Compositor::set_spawn_environment(std::map<std::string, std::string> env) {
    m_spawn_env = std::move(env);
}

void Compositor::set_quit_handler(std::function<void()> handler) {
    m_quit_handler = std::move(handler);
}

void Compositor::set_snapshot(LayoutSnapshot snapshot) {
    m_snapshot = std::move(snapshot);
    for (auto& seat : m_seats.seats()) {
        if (const auto* saved = m_snapshot.find_seat(seat.name)) {
            seat.pointer = {saved->pointer_x, saved->pointer_y};
        }
    }
}

auto Compositor::snapshot() const -> LayoutSnapshot {
    return capture_snapshot(m_outputs, m_seats);
}

void Compositor::report(const char* hook, const Result<void>& result) const {
    if (!result) {
        SCAPE_LOG_WARN("Policy hook '{}' failed: {}", hook, result.error().message);
    }
}

// =============================================================================
// Policy
// =============================================================================

auto Compositor::load_policy(const std::filesystem::path& path) -> Result<void> {
    m_script_path = path;
    if (!m_engine) {
        return make_error<void>(ErrorCode::script_error, "No policy engine installed");
    }
    auto bytes = SCAPE_TRY(util::read_file_binary(path));
    auto tables = SCAPE_TRY(m_engine->load(std::string_view(bytes.data(), bytes.size()),
                                           path.string()));
    apply_tables(std::move(tables));
    ++m_reload_count;
    SCAPE_LOG_INFO("Loaded policy script {}", path.string());
    return {};
}

void Compositor::apply_tables(PolicyTables tables) {
    SCAPE_LOG_DEBUG("Policy tables: {} binding(s), {} rule(s), {} zone(s)",
                    tables.bindings.size(), tables.rules.size(), tables.zones.size());
    m_router.set_bindings(BindingTable(tables.bindings));
    m_tree.set_placement_rules(std::move(tables.rules));
    m_tree.set_zones(std::move(tables.zones));

    m_tick_interval = tables.tick_interval_ms > 0
                          ? std::chrono::milliseconds{tables.tick_interval_ms}
                          : m_config.tick_interval;
    if (m_tick_interval.count() > 0) {
        m_next_policy_tick = now() + m_tick_interval;
    } else {
        m_next_policy_tick.reset();
    }
}

void Compositor::request_reload() {
    m_reload_due = now() + m_config.reload_debounce;
    SCAPE_LOG_DEBUG("Config reload scheduled in {} ms", m_config.reload_debounce.count());
}

void Compositor::reload_now() {
    if (m_composing) {
        m_reload_after_compose = true;
        return;
    }
    m_hooks.submit("reload", [this] {
        if (m_script_path.empty()) {
            SCAPE_LOG_WARN("Reload requested but no script is loaded");
            return;
        }
        auto result = load_policy(m_script_path);
        if (!result) {
            SCAPE_LOG_ERROR("Reload failed, keeping previous policy: {}", result.error().message);
        }
    });
}

void Compositor::startup() {
    m_hooks.submit("startup", [this] {
        if (m_engine) {
            report("startup", m_engine->on_startup());
        }
    });
}

void Compositor::notify_output_change() {
    m_hooks.submit("output_change", [this] {
        if (m_engine) {
            report("output_change", m_engine->on_output_change(output_infos()));
        }
    });
}

auto Compositor::submit_hook(std::string name, std::function<void()> work) -> bool {
    return m_hooks.submit(std::move(name), std::move(work));
}

void Compositor::run_binding(SeatId seat, const Binding& binding) {
    m_hooks.submit(action_name(binding.action),
                   [this, seat, action = binding.action] { run_action(seat, action); });
}

void Compositor::run_action(SeatId seat, const Action& action) {
    std::visit(Overloaded{
                   [](const action::None&) {},
                   [this](const action::Quit&) { quit(); },
                   [this](const action::VtSwitch& a) {
                       auto result = m_session.switch_vt(a.vt);
                       if (!result) {
                           SCAPE_LOG_WARN("VT switch to {} failed: {}", a.vt,
                                          result.error().message);
                       }
                   },
                   [this](const action::Spawn& a) { spawn(a.command); },
                   [this](const action::FocusOrSpawn& a) { focus_or_spawn(a.app_id, a.command); },
                   [this](const action::MoveToZone& a) { move_to_zone(a.zone); },
                   [this, seat](const action::Tab& a) {
                       const auto* output = pointer_output(seat);
                       if (output == nullptr) {
                           return;
                       }
                       std::vector<WindowId> candidates;
                       for (auto wid : m_tree.windows_on(output->id)) {
                           const auto* w = m_tree.find_window(wid);
                           if (w != nullptr && w->focusable) {
                               candidates.push_back(wid);
                           }
                       }
                       if (a.index < candidates.size()) {
                           focus_window(candidates[a.index]);
                       }
                   },
                   [this, seat](const action::CloseWindow&) {
                       if (auto focused = focused_window(seat)) {
                           close_window(*focused);
                       }
                   },
                   [this](const action::Callback& a) {
                       if (m_engine) {
                           report("callback", m_engine->invoke_callback(a.ref));
                       }
                   },
               },
               action);
}

// =============================================================================
// PolicyHost
// =============================================================================

void Compositor::spawn(const std::string& command) {
    auto result = m_launcher.spawn(command, m_spawn_env);
    if (!result) {
        SCAPE_LOG_ERROR("Failed to spawn '{}': {}", command, result.error().message);
        return;
    }
    SCAPE_LOG_INFO("Spawned '{}' (pid {})", command, *result);
}

void Compositor::focus_or_spawn(const std::string& app_id, const std::string& command) {
    if (auto window = find_window_by_app_id(app_id)) {
        focus_window(*window);
        return;
    }
    spawn(command);
}

auto Compositor::move_to_zone(const std::string& zone_name) -> bool {
    const auto* zone = m_tree.find_zone(zone_name);
    if (zone == nullptr) {
        SCAPE_LOG_WARN("move_to_zone: unknown zone '{}'", zone_name);
        return false;
    }

    std::optional<WindowId> target = focused_window(m_seat);
    if (!target) {
        if (const auto* output = pointer_output(m_seat)) {
            auto stack = m_tree.windows_on(output->id);
            if (!stack.empty()) {
                target = stack.front();
            }
        }
    }
    if (!target) {
        return false;
    }

    const Rect rect = zone->rect;
    m_tree.move(*target, {static_cast<double>(rect.x), static_cast<double>(rect.y)});
    m_tree.resize(*target, size_of(rect));
    m_sink.configure(*target, size_of(rect), focused_window(m_seat) == target);
    refresh_pointers();
    return true;
}

auto Compositor::focus_window(WindowId window) -> bool {
    if (!m_router.focus(m_seat, window)) {
        return false;
    }
    m_tree.restack(window, StackDirection::raise);
    refresh_pointers();
    return true;
}

auto Compositor::close_window(WindowId window) -> bool {
    const auto* w = m_tree.find_window(window);
    if (w == nullptr) {
        return false;
    }
    m_sink.close(window);
    return true;
}

auto Compositor::window_info(WindowId window) const -> std::optional<WindowInfo> {
    const auto* w = m_tree.find_window(window);
    if (w == nullptr) {
        return std::nullopt;
    }
    WindowInfo info;
    info.id = w->id;
    info.app_id = w->app_id;
    info.title = w->title;
    info.xwayland = w->xwayland;
    info.geometry = w->geometry;
    info.mapped = w->mapped;
    if (const auto* home = m_outputs.find(w->home)) {
        info.output = home->name;
    }
    info.focused = !m_seats.seats_focusing(window).empty();
    return info;
}

auto Compositor::window_infos() const -> std::vector<WindowInfo> {
    std::vector<WindowInfo> infos;
    const auto& order = m_tree.stacking_order();
    // Top-most first
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        if (auto info = window_info(*it)) {
            infos.push_back(std::move(*info));
        }
    }
    return infos;
}

auto Compositor::output_infos() const -> std::vector<OutputInfo> {
    std::vector<OutputInfo> infos;
    for (const auto& output : m_outputs.outputs()) {
        infos.push_back(OutputInfo{.id = output.id,
                                   .name = output.name,
                                   .rect = output.rect(),
                                   .scale = output.scale,
                                   .enabled = output.enabled});
    }
    return infos;
}

auto Compositor::grab_input(WindowId window, GrabKind kind) -> bool {
    auto grabbed = request_grab(m_seat, kind, window);
    if (!grabbed) {
        SCAPE_LOG_WARN("grab: {}", grabbed.error().message);
        return false;
    }
    return true;
}

auto Compositor::release_input() -> bool {
    return release_grab(m_seat);
}

auto Compositor::configure_output(const std::string& name, const OutputChange& change) -> bool {
    const auto* output = m_outputs.find_by_name(name);
    if (output == nullptr) {
        SCAPE_LOG_WARN("set_output: unknown output '{}'", name);
        return false;
    }
    return configure_output(output->id, change);
}

void Compositor::quit() {
    if (m_quit) {
        return;
    }
    SCAPE_LOG_INFO("Quit requested");
    m_quit = true;
    if (m_quit_handler) {
        m_quit_handler();
    }
}

// =============================================================================
// Outputs
// =============================================================================

auto Compositor::output_added(std::string name, OutputMode mode, bool hardware_sync)
    -> OutputId {
    std::optional<OutputPlacementHint> hint;
    if (const auto* saved = m_snapshot.find_output(name)) {
        hint = OutputPlacementHint{
            .position = {static_cast<double>(saved->x), static_cast<double>(saved->y)},
            .scale = saved->scale,
            .enabled = saved->enabled};
    }

    auto id = m_outputs.add(std::move(name), mode, hardware_sync, hint);
    m_schedulers.emplace(id, std::make_unique<FrameScheduler>(id, *this, hardware_sync,
                                                              m_config.backoff));
    const auto* output = m_outputs.find(id);
    SCAPE_LOG_INFO("Output {} '{}' added: {}x{}@{}mHz at {},{} scale {}", id, output->name,
                   mode.width, mode.height, mode.refresh_mhz, output->position.x,
                   output->position.y, output->scale);

    auto placed = m_tree.output_added(id);
    on_damage(id, Region(output->rect()));

    for (auto& seat : m_seats.seats()) {
        seat.pointer = m_outputs.clamp_to_layout(seat.pointer);
    }
    refresh_pointers();
    if (!placed.empty()) {
        SCAPE_LOG_DEBUG("Placed {} detached window(s) on output {}", placed.size(), id);
        for (auto wid : placed) {
            if (const auto* w = m_tree.find_window(wid)) {
                m_sink.configure(wid, size_of(w->geometry), focused_window(m_seat) == wid);
            }
        }
    }

    notify_output_change();
    return id;
}

void Compositor::output_removed(OutputId id) {
    const auto* output = m_outputs.find(id);
    if (output == nullptr) {
        return;
    }
    const Rect old_rect = output->rect();
    SCAPE_LOG_INFO("Output {} '{}' removed", id, output->name);

    m_outputs.remove(id);
    m_schedulers.erase(id);
    m_last_buffer.erase(id);
    m_screencast.output_removed(id);

    auto rehomed = m_tree.output_removed(id, old_rect);
    if (!rehomed.empty()) {
        SCAPE_LOG_INFO("Re-homed {} window(s) from removed output {}", rehomed.size(), id);
    }

    for (auto& seat : m_seats.seats()) {
        seat.pointer = m_outputs.clamp_to_layout(seat.pointer);
    }
    refresh_pointers();
    notify_output_change();
}

auto Compositor::configure_output(OutputId id, const OutputChange& change) -> bool {
    const auto* output = m_outputs.find(id);
    if (output == nullptr) {
        return false;
    }
    const Rect old_rect = output->rect();
    const bool was_enabled = output->enabled;
    const double old_scale = output->scale;
    const Point old_position = output->position;

    if (change.position) {
        m_outputs.set_position(id, *change.position);
    }
    if (change.scale && !m_outputs.set_scale(id, *change.scale)) {
        SCAPE_LOG_WARN("Ignoring invalid scale {} for output {}", *change.scale, id);
    }
    if (change.enabled) {
        m_outputs.set_enabled(id, *change.enabled);
    }

    output = m_outputs.find(id);
    if (output->enabled == was_enabled && output->scale == old_scale &&
        output->position == old_position) {
        return true;
    }

    if (was_enabled && !output->enabled) {
        m_tree.output_removed(id, old_rect);
    } else if (!was_enabled && output->enabled) {
        m_tree.output_added(id);
    } else {
        m_tree.layout_changed();
    }

    for (const auto& o : m_outputs.outputs()) {
        if (o.enabled) {
            on_damage(o.id, Region(o.rect()));
        }
    }
    for (auto& seat : m_seats.seats()) {
        seat.pointer = m_outputs.clamp_to_layout(seat.pointer);
    }
    refresh_pointers();
    notify_output_change();
    return true;
}

auto Compositor::scheduler(OutputId output) const -> const FrameScheduler* {
    auto it = m_schedulers.find(output);
    return it == m_schedulers.end() ? nullptr : it->second.get();
}

auto Compositor::scheduler_mut(OutputId output) -> FrameScheduler* {
    auto it = m_schedulers.find(output);
    return it == m_schedulers.end() ? nullptr : it->second.get();
}

void Compositor::sync_output_flags(OutputId id) {
    auto* output = m_outputs.find(id);
    const auto* sched = scheduler(id);
    if (output == nullptr || sched == nullptr) {
        return;
    }
    output->pending_frame = sched->state() == FrameState::frame_pending;
    output->degraded = sched->degraded();
}

void Compositor::on_damage(OutputId output, const Region& damage) {
    auto* sched = scheduler_mut(output);
    const auto* o = m_outputs.find(output);
    if (sched == nullptr || o == nullptr || !o->enabled) {
        return;
    }
    sched->add_damage(damage, now());
    sync_output_flags(output);
}

void Compositor::frame_done(OutputId id) {
    SCAPE_PROFILE_FUNCTION();
    auto* sched = scheduler_mut(id);
    if (sched == nullptr) {
        return;
    }
    const auto t = now();
    const bool was_pending = sched->state() == FrameState::frame_pending;
    sched->present_complete(t);

    if (was_pending && m_screencast.has_consumers(id)) {
        if (const auto* output = m_outputs.find(id)) {
            m_screencast.publish(id, m_last_buffer[id], {output->mode.width, output->mode.height},
                                 t);
        }
    }

    sched->frame_opportunity(t);
    sync_output_flags(id);
}

auto Compositor::submit_frame(OutputId output, const Region& damage) -> bool {
    SCAPE_PROFILE_SCOPE("ComposeOutput");
    std::vector<RenderItem> items;
    for (auto wid : m_tree.windows_on(output)) {
        const auto* window = m_tree.find_window(wid);
        if (window == nullptr) {
            continue;
        }
        auto push = [&](SurfaceId sid) {
            const auto* surface = m_tree.find_surface(sid);
            if (surface != nullptr && surface->buffer) {
                items.push_back(RenderItem{.surface = sid,
                                           .buffer = *surface->buffer,
                                           .rect = m_tree.surface_rect(sid)});
            }
        };
        for (auto it = window->popups.rbegin(); it != window->popups.rend(); ++it) {
            push(*it);
        }
        auto subsurfaces = m_tree.subsurfaces_of(wid);
        for (auto it = subsurfaces.rbegin(); it != subsurfaces.rend(); ++it) {
            push(*it);
        }
        push(window->surface);
    }

    m_composing = true;
    auto outcome = m_render.compose(output, items, damage);
    m_composing = false;

    const bool presented = outcome.result == ComposeResult::presented;
    if (presented) {
        m_tree.frame_composed(output);
        m_last_buffer[output] = outcome.buffer;
    }

    if (m_reload_after_compose) {
        m_reload_after_compose = false;
        reload_now();
    }
    return presented;
}

void Compositor::schedule_frame(OutputId output) {
    m_render.schedule_frame(output);
}

// =============================================================================
// Clients and surfaces
// =============================================================================

auto Compositor::client_connected(ClientId client) -> Result<void> {
    if (m_clients.size() >= m_config.max_clients) {
        SCAPE_LOG_WARN("Refusing client {}: {} clients connected", client, m_clients.size());
        return make_error<void>(ErrorCode::resource_exhausted, "Client limit reached");
    }
    m_clients.insert(client);
    return {};
}

void Compositor::client_disconnected(ClientId client) {
    for (auto sid : m_tree.surfaces_of(client)) {
        destroy_surface(sid);
    }
    m_clients.erase(client);
}

void Compositor::protocol_violation(ClientId client, const std::string& reason) {
    SCAPE_LOG_WARN("Client {} protocol violation: {}", client, reason);
    m_sink.disconnect(client, reason);
    client_disconnected(client);
}

auto Compositor::create_surface(ClientId client, SurfaceRole role, SurfaceId parent,
                                Point offset) -> Result<SurfaceId> {
    if (m_tree.surface_count() >= m_config.max_surfaces) {
        return make_error<SurfaceId>(ErrorCode::resource_exhausted, "Surface limit reached");
    }
    return m_tree.create_surface(client, role, parent, offset);
}

void Compositor::destroy_surface(SurfaceId surface) {
    std::optional<BufferToken> buffer;
    WindowId owner = INVALID_ID;
    if (const auto* s = m_tree.find_surface(surface)) {
        buffer = s->buffer;
        owner = s->window;
    }
    release_popup_grabs(surface, owner);
    std::optional<WindowInfo> info;
    if (auto wid = m_tree.window_for_surface(surface)) {
        const auto* window = m_tree.find_window(*wid);
        if (window != nullptr && window->surface == surface && window->mapped) {
            info = window_info(*wid);
        }
    }

    auto result = m_tree.destroy_surface(surface);
    if (buffer) {
        m_render.release_buffer(*buffer);
    }
    if (result) {
        after_unmap(*result);
    }
    refresh_pointers();

    if (info) {
        m_hooks.submit("window_unmap", [this, info = std::move(*info)] {
            if (m_engine) {
                report("window_unmap", m_engine->on_window_unmap(info));
            }
        });
    }
}

auto Compositor::commit(SurfaceId surface, std::optional<BufferHandle> buffer, Size size,
                        const Region& damage) -> Result<void> {
    const auto* current = m_tree.find_surface(surface);
    if (current == nullptr) {
        return make_error<void>(ErrorCode::surface_not_found,
                                "Commit on unknown surface " + std::to_string(surface));
    }
    const std::optional<BufferToken> previous = current->buffer;

    std::optional<BufferToken> token;
    if (buffer) {
        token = m_render.import_buffer(*buffer);
        if (!token) {
            const std::string reason =
                "Buffer on surface " + std::to_string(surface) + " cannot be imported";
            protocol_violation(current->client, reason);
            return make_error<void>(ErrorCode::protocol_violation, reason);
        }
    }

    auto committed = m_tree.commit(surface, token, size, damage);
    if (!committed) {
        if (token) {
            m_render.release_buffer(*token);
        }
        return committed;
    }
    if (previous) {
        m_render.release_buffer(*previous);
    }
    return {};
}

auto Compositor::create_window(SurfaceId surface, std::string app_id, std::string title,
                               bool xwayland) -> Result<WindowId> {
    auto window = m_tree.create_window(surface, std::move(app_id), std::move(title), xwayland);
    if (!window && window.error().code == ErrorCode::protocol_violation) {
        if (const auto* s = m_tree.find_surface(surface)) {
            protocol_violation(s->client, window.error().message);
        }
    }
    return window;
}

void Compositor::set_window_identity(WindowId window, std::string app_id, std::string title) {
    m_tree.set_window_identity(window, std::move(app_id), std::move(title));
}

auto Compositor::map_window(WindowId window, std::optional<OutputId> output_hint)
    -> Result<Placement> {
    const auto* seat = m_seats.find(m_seat);
    std::optional<Point> pointer;
    if (seat != nullptr) {
        pointer = seat->pointer;
    }

    const auto* before = m_tree.find_window(window);
    const bool was_mapped = before != nullptr && before->mapped;

    auto placement = SCAPE_TRY(m_tree.map(window, output_hint, pointer));
    if (was_mapped) {
        return placement;
    }

    SCAPE_LOG_DEBUG("Window {} mapped on output {} at {},{} {}x{}{}", window, placement.output,
                    placement.geometry.x, placement.geometry.y, placement.geometry.width,
                    placement.geometry.height, placement.detached ? " (detached)" : "");
    m_sink.configure(window, size_of(placement.geometry), false);
    if (placement.focus) {
        m_router.focus(m_seat, window);
    }
    refresh_pointers();

    m_hooks.submit("window_map", [this, window] {
        if (!m_engine) {
            return;
        }
        if (auto info = window_info(window); info && info->mapped) {
            report("window_map", m_engine->on_window_map(*info));
        }
    });
    return placement;
}

void Compositor::unmap_window(WindowId window) {
    auto info = window_info(window);
    auto result = m_tree.unmap(window);
    if (!result) {
        return;
    }
    after_unmap(*result);
    refresh_pointers();

    if (info) {
        info->mapped = false;
        m_hooks.submit("window_unmap", [this, info = std::move(*info)] {
            if (m_engine) {
                report("window_unmap", m_engine->on_window_unmap(info));
            }
        });
    }
}

void Compositor::after_unmap(const UnmapResult& result) {
    for (auto popup : result.detached_popups) {
        m_sink.popup_done(popup);
    }
    for (auto seat : result.lost_focus) {
        fallback_focus(seat);
    }
}

auto Compositor::pointer_output(SeatId seat_id) const -> const Output* {
    const auto* seat = m_seats.find(seat_id);
    if (seat != nullptr) {
        if (const auto* output = m_outputs.output_at(seat->pointer)) {
            return output;
        }
    }
    return m_outputs.first_enabled();
}

void Compositor::fallback_focus(SeatId seat) {
    if (const auto* output = pointer_output(seat)) {
        for (auto wid : m_tree.windows_on(output->id)) {
            const auto* w = m_tree.find_window(wid);
            if (w != nullptr && w->focusable && m_router.focus(seat, wid)) {
                return;
            }
        }
    }
    const auto& order = m_tree.stacking_order();
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const auto* w = m_tree.find_window(*it);
        if (w != nullptr && w->focusable && m_router.focus(seat, *it)) {
            return;
        }
    }
}

void Compositor::refresh_pointers() {
    for (const auto& seat : m_seats.seats()) {
        m_router.refresh_pointer(seat.id);
    }
}

auto Compositor::restack_window(WindowId window, StackDirection direction) -> bool {
    if (!m_tree.restack(window, direction)) {
        return false;
    }
    refresh_pointers();
    return true;
}

auto Compositor::move_window(WindowId window, Point position) -> bool {
    if (!m_tree.move(window, position)) {
        return false;
    }
    refresh_pointers();
    return true;
}

auto Compositor::set_surface_offset(SurfaceId surface, Point offset) -> bool {
    if (!m_tree.set_offset(surface, offset)) {
        return false;
    }
    refresh_pointers();
    return true;
}

auto Compositor::resize_window(WindowId window, Size size) -> bool {
    if (!m_tree.resize(window, size)) {
        return false;
    }
    m_sink.configure(window, size, focused_window(m_seat) == window);
    refresh_pointers();
    return true;
}

auto Compositor::request_grab(SeatId seat, GrabKind kind, WindowId window) -> Result<void> {
    return m_router.request_grab(seat, kind, window);
}

auto Compositor::release_grab(SeatId seat) -> bool {
    m_popup_grabs.erase(seat);
    return m_router.release_grab(seat);
}

auto Compositor::request_popup_grab(SeatId seat, SurfaceId popup) -> Result<void> {
    const auto* surface = m_tree.find_surface(popup);
    if (surface == nullptr || surface->role != SurfaceRole::popup) {
        return make_error<void>(ErrorCode::surface_not_found,
                                "Grab requested for unknown popup " + std::to_string(popup));
    }
    SCAPE_TRY(m_router.request_grab(seat, GrabKind::pointer, surface->window));
    m_popup_grabs[seat] = popup;
    return {};
}

void Compositor::release_popup_grabs(SurfaceId popup, WindowId owner) {
    for (auto it = m_popup_grabs.begin(); it != m_popup_grabs.end();) {
        if (it->second != popup) {
            ++it;
            continue;
        }
        const auto* seat = m_seats.find(it->first);
        // The owner may have unmapped already, or the seat moved on to another grab
        if (seat != nullptr && seat->grab && seat->grab->window == owner) {
            m_router.release_grab(it->first);
        }
        it = m_popup_grabs.erase(it);
    }
}

auto Compositor::focused_window(SeatId seat) const -> std::optional<WindowId> {
    const auto* s = m_seats.find(seat);
    return s == nullptr ? std::nullopt : s->focus;
}

auto Compositor::find_window_by_app_id(std::string_view app_id) const
    -> std::optional<WindowId> {
    const auto& order = m_tree.stacking_order();
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const auto* w = m_tree.find_window(*it);
        if (w != nullptr && w->mapped && w->app_id == app_id) {
            return *it;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Input
// =============================================================================

auto Compositor::key(SeatId seat, const KeyEvent& event) -> KeyDisposition {
    return m_router.handle_key(seat, event);
}

void Compositor::modifiers(SeatId seat, uint32_t mask) {
    m_router.handle_modifiers(seat, mask);
}

void Compositor::pointer_motion(SeatId seat, Point position, uint32_t time_ms) {
    m_router.pointer_motion(seat, position, time_ms);
}

void Compositor::pointer_motion_relative(SeatId seat, double dx, double dy, uint32_t time_ms) {
    m_router.pointer_motion_relative(seat, dx, dy, time_ms);
}

void Compositor::pointer_button(SeatId seat, uint32_t button, bool pressed, uint32_t time_ms) {
    m_router.pointer_button(seat, button, pressed, time_ms);
}

void Compositor::pointer_axis(SeatId seat, bool horizontal, double delta, uint32_t time_ms) {
    m_router.pointer_axis(seat, horizontal, delta, time_ms);
}

void Compositor::touch_down(SeatId seat, int32_t touch_id, Point position, uint32_t time_ms) {
    m_router.touch_down(seat, touch_id, position, time_ms);
}

void Compositor::touch_motion(SeatId seat, int32_t touch_id, Point position, uint32_t time_ms) {
    m_router.touch_motion(seat, touch_id, position, time_ms);
}

void Compositor::touch_up(SeatId seat, int32_t touch_id, uint32_t time_ms) {
    m_router.touch_up(seat, touch_id, time_ms);
}

// =============================================================================
// Timers
// =============================================================================

void Compositor::tick() {
    const auto t = now();

    if (m_reload_due && t >= *m_reload_due) {
        m_reload_due.reset();
        reload_now();
    }

    for (auto& [id, sched] : m_schedulers) {
        sched->tick(t);
        sync_output_flags(id);
    }

    if (m_next_policy_tick && t >= *m_next_policy_tick) {
        m_next_policy_tick = t + m_tick_interval;
        m_hooks.submit("tick", [this] {
            if (m_engine) {
                report("tick", m_engine->on_tick());
            }
        });
    }

    m_screencast.tick(t);
}

auto Compositor::next_deadline() const -> std::optional<Clock::time_point> {
    std::optional<Clock::time_point> earliest;
    auto consider = [&](std::optional<Clock::time_point> candidate) {
        if (candidate && (!earliest || *candidate < *earliest)) {
            earliest = candidate;
        }
    };
    consider(m_reload_due);
    consider(m_next_policy_tick);
    for (const auto& [id, sched] : m_schedulers) {
        consider(sched->retry_deadline());
    }
    consider(m_screencast.next_reoffer());
    return earliest;
}

} // namespace scape::core
