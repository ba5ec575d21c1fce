#include "surface_tree.hpp"

#include <algorithm>
#include <cmath>
#include <util/logging.hpp>

namespace scape::core {

namespace {

auto round_point(Point p) -> std::pair<int32_t, int32_t> {
    return {static_cast<int32_t>(std::lround(p.x)), static_cast<int32_t>(std::lround(p.y))};
}

} // namespace

SurfaceTree::SurfaceTree(OutputRegistry& outputs, SeatState& seats, DamageListener& listener)
    : m_outputs(outputs), m_seats(seats), m_listener(listener) {}

auto SurfaceTree::find_surface(SurfaceId id) const -> const Surface* {
    auto it = m_surfaces.find(id);
    return it == m_surfaces.end() ? nullptr : &it->second;
}

auto SurfaceTree::find_surface_mut(SurfaceId id) -> Surface* {
    auto it = m_surfaces.find(id);
    return it == m_surfaces.end() ? nullptr : &it->second;
}

auto SurfaceTree::find_window(WindowId id) const -> const Window* {
    auto it = m_windows.find(id);
    return it == m_windows.end() ? nullptr : &it->second;
}

auto SurfaceTree::find_window_mut(WindowId id) -> Window* {
    auto it = m_windows.find(id);
    return it == m_windows.end() ? nullptr : &it->second;
}

auto SurfaceTree::window_for_surface(SurfaceId id) const -> std::optional<WindowId> {
    const auto* surface = find_surface(id);
    if (surface == nullptr || surface->window == INVALID_ID) {
        return std::nullopt;
    }
    return surface->window;
}

auto SurfaceTree::surface_origin(SurfaceId id) const -> Point {
    const auto* surface = find_surface(id);
    if (surface == nullptr) {
        return {};
    }
    if (surface->role == SurfaceRole::toplevel && surface->window != INVALID_ID) {
        const auto* window = find_window(surface->window);
        if (window != nullptr && window->surface == id) {
            return {static_cast<double>(window->geometry.x),
                    static_cast<double>(window->geometry.y)};
        }
    }
    if (surface->parent != INVALID_ID) {
        Point base = surface_origin(surface->parent);
        return {base.x + surface->offset.x, base.y + surface->offset.y};
    }
    return surface->offset;
}

auto SurfaceTree::surface_rect(SurfaceId id) const -> Rect {
    const auto* surface = find_surface(id);
    if (surface == nullptr) {
        return {};
    }
    auto [x, y] = round_point(surface_origin(id));
    return {x, y, surface->size.width, surface->size.height};
}

auto SurfaceTree::surfaces_of(ClientId client) const -> std::vector<SurfaceId> {
    std::vector<SurfaceId> out;
    for (const auto& [id, surface] : m_surfaces) {
        if (surface.client == client) {
            out.push_back(id);
        }
    }
    return out;
}

auto SurfaceTree::subsurfaces_of(WindowId window) const -> std::vector<SurfaceId> {
    std::vector<SurfaceId> out;
    for (const auto& [id, surface] : m_surfaces) {
        if (surface.window == window && surface.role == SurfaceRole::subsurface) {
            out.push_back(id);
        }
    }
    return out;
}

auto SurfaceTree::create_surface(ClientId client, SurfaceRole role, SurfaceId parent,
                                 Point offset) -> SurfaceId {
    Surface surface;
    surface.id = m_next_surface++;
    surface.client = client;
    surface.role = role;
    surface.offset = offset;

    if (parent != INVALID_ID) {
        if (const auto* parent_surface = find_surface(parent)) {
            surface.parent = parent;
            surface.window = parent_surface->window;
        } else {
            SCAPE_LOG_WARN("Surface {} created with unknown parent {}", surface.id, parent);
        }
    }

    if (role == SurfaceRole::popup && surface.window != INVALID_ID) {
        if (auto* window = find_window_mut(surface.window)) {
            window->popups.push_back(surface.id);
        }
    }

    auto id = surface.id;
    m_surfaces.emplace(id, std::move(surface));
    return id;
}

void SurfaceTree::detach_children(SurfaceId parent) {
    for (auto& [id, surface] : m_surfaces) {
        if (surface.parent != parent) {
            continue;
        }
        if (auto* window = find_window_mut(surface.window)) {
            std::erase(window->popups, id);
        }
        surface.parent = INVALID_ID;
        surface.window = INVALID_ID;
        surface.pending_outputs.clear();
        surface.damage.clear();
    }
}

auto SurfaceTree::destroy_surface(SurfaceId id) -> std::optional<UnmapResult> {
    auto* surface = find_surface_mut(id);
    if (surface == nullptr) {
        return std::nullopt;
    }

    std::optional<UnmapResult> result;
    const WindowId window_id = surface->window;
    auto* window = find_window_mut(window_id);

    if (window != nullptr && window->surface == id) {
        result = unmap(window_id);
        for (auto& [sid, child] : m_surfaces) {
            if (child.window == window_id) {
                child.window = INVALID_ID;
            }
        }
        std::erase(m_order, window_id);
        m_windows.erase(window_id);
        rebuild_stacks();
    } else if (window != nullptr) {
        std::erase(window->popups, id);
        if (window->mapped && !window->detached) {
            damage_rect(surface_rect(id), window->outputs);
        }
    }

    detach_children(id);

    for (auto& seat : m_seats.seats()) {
        if (seat.pointer_surface == id) {
            seat.pointer_surface.reset();
            seat.pointer_window.reset();
        }
        std::erase_if(seat.touch_points,
                      [id](const auto& entry) { return entry.second.surface == id; });
    }

    m_surfaces.erase(id);
    return result;
}

auto SurfaceTree::commit(SurfaceId id, std::optional<BufferToken> buffer, Size size,
                         const Region& damage) -> Result<void> {
    auto* surface = find_surface_mut(id);
    if (surface == nullptr) {
        return make_error<void>(ErrorCode::surface_not_found,
                                "Commit on unknown surface " + std::to_string(id));
    }
    surface->buffer = buffer;
    surface->size = size;

    if (auto* window = find_window_mut(surface->window);
        window != nullptr && window->surface == id) {
        if (!window->mapped) {
            window->geometry.width = size.width;
            window->geometry.height = size.height;
        } else if (window->geometry.width != size.width ||
                   window->geometry.height != size.height) {
            resize(window->id, size);
        }
    }

    mark_damaged(id, damage);
    return {};
}

auto SurfaceTree::set_offset(SurfaceId id, Point offset) -> bool {
    auto* surface = find_surface_mut(id);
    if (surface == nullptr) {
        return false;
    }
    const auto* window = find_window(surface->window);
    const bool visible = window != nullptr && window->mapped && !window->detached;
    if (visible) {
        damage_rect(surface_rect(id), window->outputs);
    }
    surface->offset = offset;
    if (visible) {
        damage_rect(surface_rect(id), window->outputs);
    }
    return true;
}

auto SurfaceTree::create_window(SurfaceId surface_id, std::string app_id, std::string title,
                                bool xwayland) -> Result<WindowId> {
    auto* surface = find_surface_mut(surface_id);
    if (surface == nullptr) {
        return make_error<WindowId>(ErrorCode::surface_not_found,
                                    "Cannot create window on unknown surface " +
                                        std::to_string(surface_id));
    }
    if (surface->window != INVALID_ID) {
        return make_error<WindowId>(ErrorCode::protocol_violation,
                                    "Surface " + std::to_string(surface_id) +
                                        " already has a role");
    }

    Window window;
    window.id = m_next_window++;
    window.surface = surface_id;
    window.app_id = std::move(app_id);
    window.title = std::move(title);
    window.xwayland = xwayland;
    window.geometry = {0, 0, surface->size.width, surface->size.height};

    surface->role = SurfaceRole::toplevel;
    surface->window = window.id;

    auto id = window.id;
    m_windows.emplace(id, std::move(window));
    return id;
}

auto SurfaceTree::set_window_identity(WindowId id, std::string app_id, std::string title)
    -> bool {
    auto* window = find_window_mut(id);
    if (window == nullptr) {
        return false;
    }
    window->app_id = std::move(app_id);
    window->title = std::move(title);
    return true;
}

auto SurfaceTree::match_rule(const Window& window) const -> const PlacementRule* {
    for (const auto& rule : m_rules) {
        if (rule.matches(window.app_id, window.title, window.xwayland)) {
            return &rule;
        }
    }
    return nullptr;
}

auto SurfaceTree::resolve_target(const PlacementRule* rule, std::optional<OutputId> hint,
                                 std::optional<Point> pointer, bool& fell_back) const
    -> const Output* {
    if (rule != nullptr && rule->directive.output) {
        const auto* output = m_outputs.find_by_name(*rule->directive.output);
        if (output != nullptr && output->enabled) {
            return output;
        }
        SCAPE_LOG_WARN("Placement rule targets missing or disabled output '{}'; using first "
                       "enabled output",
                       *rule->directive.output);
        fell_back = true;
        return m_outputs.first_enabled();
    }
    if (hint) {
        const auto* output = m_outputs.find(*hint);
        if (output != nullptr && output->enabled) {
            return output;
        }
        SCAPE_LOG_WARN("Placement hint names missing or disabled output {}; using first enabled "
                       "output",
                       *hint);
        fell_back = true;
        return m_outputs.first_enabled();
    }
    if (pointer) {
        if (const auto* output = m_outputs.output_at(*pointer)) {
            return output;
        }
    }
    return m_outputs.first_enabled();
}

void SurfaceTree::place_on(Window& window, const Output& output, const PlacementRule* rule) {
    const Rect area = output.rect();
    Size size{window.geometry.width, window.geometry.height};
    if (const auto* surface = find_surface(window.surface); size.width <= 0 && surface) {
        size = surface->size;
    }

    window.home = output.id;

    if (rule != nullptr) {
        const auto& directive = rule->directive;
        if (directive.size) {
            size = *directive.size;
        }
        if (directive.zone) {
            if (const auto* zone = find_zone(*directive.zone)) {
                window.geometry = zone->rect;
                return;
            }
            SCAPE_LOG_WARN("Placement rule names unknown zone '{}'; centering window",
                           *directive.zone);
        } else if (directive.position) {
            auto [dx, dy] = round_point(*directive.position);
            window.geometry = {area.x + dx, area.y + dy, size.width, size.height};
            return;
        }
    }

    for (const auto& zone : m_zones) {
        if (zone.is_default && zone.rect.intersects(area)) {
            window.geometry = zone.rect;
            return;
        }
    }

    window.geometry = {area.x + (area.width - size.width) / 2,
                       area.y + (area.height - size.height) / 2, size.width, size.height};
}

void SurfaceTree::recompute_outputs(Window& window) {
    window.outputs.clear();
    if (!window.mapped || window.detached) {
        return;
    }

    const Output* first_hit = nullptr;
    for (const auto& output : m_outputs.outputs()) {
        if (output.enabled && output.rect().intersects(window.geometry)) {
            window.outputs.insert(output.id);
            if (first_hit == nullptr) {
                first_hit = &output;
            }
        }
    }

    const Point center = window.geometry.center();
    if (const auto* under_center = m_outputs.output_at(center)) {
        window.home = under_center->id;
    } else if (first_hit != nullptr && !window.outputs.contains(window.home)) {
        window.home = first_hit->id;
    } else if (const auto* home = m_outputs.find(window.home); home == nullptr || !home->enabled) {
        const auto* nearest = m_outputs.nearest_enabled(center);
        window.home = nearest != nullptr ? nearest->id : INVALID_ID;
    }

    if (window.outputs.empty() && window.home != INVALID_ID) {
        window.outputs.insert(window.home);
    }
}

void SurfaceTree::rebuild_stacks() {
    m_stacks.clear();
    for (const auto& output : m_outputs.outputs()) {
        auto& stack = m_stacks[output.id];
        for (auto wid : m_order) {
            const auto* window = find_window(wid);
            if (window != nullptr && window->outputs.contains(output.id)) {
                stack.push_back(wid);
            }
        }
    }
}

void SurfaceTree::damage_rect(const Rect& rect, const std::set<OutputId>& outputs) {
    if (rect.empty()) {
        return;
    }
    for (auto output_id : outputs) {
        const auto* output = m_outputs.find(output_id);
        if (output == nullptr || !output->enabled) {
            continue;
        }
        Rect clipped = rect.intersection(output->rect());
        if (clipped.empty()) {
            continue;
        }
        m_listener.on_damage(output_id, Region(clipped));
    }
}

void SurfaceTree::damage_surface_global(Surface& surface, const Region& global) {
    const auto* window = find_window(surface.window);
    if (window == nullptr) {
        return;
    }
    auto [ox, oy] = round_point(surface_origin(surface.id));
    for (auto output_id : window->outputs) {
        const auto* output = m_outputs.find(output_id);
        if (output == nullptr || !output->enabled) {
            continue;
        }
        Region clipped = global.clipped(output->rect());
        if (clipped.empty()) {
            continue;
        }
        surface.damage.add(clipped.translated(-ox, -oy));
        surface.pending_outputs.insert(output_id);
        m_listener.on_damage(output_id, clipped);
    }
}

auto SurfaceTree::mark_damaged(SurfaceId id, const Region& local_damage) -> bool {
    auto* surface = find_surface_mut(id);
    if (surface == nullptr || local_damage.empty()) {
        return false;
    }
    const auto* window = find_window(surface->window);
    if (window == nullptr || !window->mapped || window->detached) {
        return false;
    }
    auto [ox, oy] = round_point(surface_origin(id));
    damage_surface_global(*surface, local_damage.translated(ox, oy));
    return true;
}

auto SurfaceTree::map(WindowId id, std::optional<OutputId> output_hint,
                      std::optional<Point> pointer) -> Result<Placement> {
    auto* window = find_window_mut(id);
    if (window == nullptr) {
        return make_error<Placement>(ErrorCode::window_not_found,
                                     "Cannot map unknown window " + std::to_string(id));
    }
    if (window->mapped) {
        return Placement{.output = window->home,
                         .geometry = window->geometry,
                         .detached = window->detached,
                         .focus = false,
                         .fell_back = false};
    }

    const auto* rule = match_rule(*window);
    if (rule != nullptr && rule->directive.click_through) {
        window->click_through = *rule->directive.click_through;
    }

    Placement placement;
    placement.focus = window->focusable;
    if (rule != nullptr && rule->directive.focus) {
        placement.focus = *rule->directive.focus;
    }

    window->mapped = true;
    m_order.push_back(id);

    const auto* target = resolve_target(rule, output_hint, pointer, placement.fell_back);
    if (target == nullptr) {
        SCAPE_LOG_DEBUG("No enabled output; window {} mapped detached", id);
        window->detached = true;
        window->outputs.clear();
        placement.detached = true;
        placement.geometry = window->geometry;
        return placement;
    }

    window->detached = false;
    place_on(*window, *target, rule);
    recompute_outputs(*window);
    rebuild_stacks();

    placement.output = window->home;
    placement.geometry = window->geometry;
    damage_rect(window->geometry, window->outputs);
    return placement;
}

auto SurfaceTree::unmap(WindowId id) -> std::optional<UnmapResult> {
    auto* window = find_window_mut(id);
    if (window == nullptr || !window->mapped) {
        return std::nullopt;
    }

    UnmapResult result;
    result.vacated = window->geometry;
    const auto old_outputs = window->outputs;
    const bool was_visible = !window->detached;

    for (auto popup_id : window->popups) {
        if (auto* popup = find_surface_mut(popup_id)) {
            popup->window = INVALID_ID;
            popup->parent = INVALID_ID;
            popup->pending_outputs.clear();
            popup->damage.clear();
        }
    }
    result.detached_popups = std::move(window->popups);
    window->popups.clear();

    result.lost_focus = m_seats.forget_window(id);

    window->mapped = false;
    window->detached = false;
    window->outputs.clear();
    std::erase(m_order, id);
    rebuild_stacks();

    if (was_visible) {
        damage_rect(result.vacated, old_outputs);
    }
    return result;
}

auto SurfaceTree::restack(WindowId id, StackDirection direction) -> bool {
    auto* window = find_window_mut(id);
    if (window == nullptr || !window->mapped) {
        return false;
    }
    auto it = std::find(m_order.begin(), m_order.end(), id);
    if (it == m_order.end()) {
        return false;
    }
    const auto index = static_cast<size_t>(std::distance(m_order.begin(), it));

    auto shares_output = [&](WindowId other) {
        const auto* w = find_window(other);
        if (w == nullptr) {
            return false;
        }
        return std::any_of(w->outputs.begin(), w->outputs.end(),
                           [&](OutputId o) { return window->outputs.contains(o); });
    };

    switch (direction) {
    case StackDirection::raise:
        m_order.erase(it);
        m_order.push_back(id);
        break;
    case StackDirection::lower:
        m_order.erase(it);
        m_order.insert(m_order.begin(), id);
        break;
    case StackDirection::up: {
        size_t target = index + 1;
        while (target < m_order.size() && !shares_output(m_order[target])) {
            ++target;
        }
        if (target >= m_order.size()) {
            return false;
        }
        m_order.erase(m_order.begin() + static_cast<std::ptrdiff_t>(index));
        m_order.insert(m_order.begin() + static_cast<std::ptrdiff_t>(target), id);
        break;
    }
    case StackDirection::down: {
        size_t target = index;
        bool found = false;
        while (target > 0) {
            --target;
            if (shares_output(m_order[target])) {
                found = true;
                break;
            }
        }
        if (!found) {
            return false;
        }
        m_order.erase(m_order.begin() + static_cast<std::ptrdiff_t>(index));
        m_order.insert(m_order.begin() + static_cast<std::ptrdiff_t>(target), id);
        break;
    }
    }

    rebuild_stacks();
    if (!window->detached) {
        damage_rect(window->geometry, window->outputs);
    }
    return true;
}

auto SurfaceTree::move(WindowId id, Point position) -> bool {
    auto* window = find_window_mut(id);
    if (window == nullptr) {
        return false;
    }
    const Rect old_rect = window->geometry;
    const auto old_outputs = window->outputs;
    auto [x, y] = round_point(position);
    window->geometry.x = x;
    window->geometry.y = y;

    if (!window->mapped || window->detached) {
        return true;
    }
    recompute_outputs(*window);
    rebuild_stacks();
    damage_rect(old_rect, old_outputs);
    damage_rect(window->geometry, window->outputs);
    return true;
}

auto SurfaceTree::resize(WindowId id, Size size) -> bool {
    auto* window = find_window_mut(id);
    if (window == nullptr || size.width < 0 || size.height < 0) {
        return false;
    }
    const Rect old_rect = window->geometry;
    const auto old_outputs = window->outputs;
    window->geometry.width = size.width;
    window->geometry.height = size.height;

    if (!window->mapped || window->detached) {
        return true;
    }
    recompute_outputs(*window);
    rebuild_stacks();
    damage_rect(old_rect, old_outputs);
    damage_rect(window->geometry, window->outputs);
    return true;
}

auto SurfaceTree::set_click_through(WindowId id, bool click_through) -> bool {
    auto* window = find_window_mut(id);
    if (window == nullptr) {
        return false;
    }
    window->click_through = click_through;
    return true;
}

auto SurfaceTree::windows_on(OutputId output) const -> std::vector<WindowId> {
    auto it = m_stacks.find(output);
    if (it == m_stacks.end()) {
        return {};
    }
    return {it->second.rbegin(), it->second.rend()};
}

auto SurfaceTree::hit_test(Point point) const -> std::optional<HitResult> {
    const auto* output = m_outputs.output_at(point);
    if (output == nullptr) {
        return std::nullopt;
    }

    auto hit = [&](WindowId wid, SurfaceId sid) -> std::optional<HitResult> {
        if (!surface_rect(sid).contains(point)) {
            return std::nullopt;
        }
        Point origin = surface_origin(sid);
        return HitResult{.window = wid,
                         .surface = sid,
                         .local = {point.x - origin.x, point.y - origin.y}};
    };

    for (auto wid : windows_on(output->id)) {
        const auto* window = find_window(wid);
        if (window == nullptr || window->click_through) {
            continue;
        }
        for (auto it = window->popups.rbegin(); it != window->popups.rend(); ++it) {
            if (auto result = hit(wid, *it)) {
                return result;
            }
        }
        auto subsurfaces = subsurfaces_of(wid);
        for (auto it = subsurfaces.rbegin(); it != subsurfaces.rend(); ++it) {
            if (auto result = hit(wid, *it)) {
                return result;
            }
        }
        if (window->geometry.contains(point)) {
            return HitResult{.window = wid,
                             .surface = window->surface,
                             .local = {point.x - window->geometry.x,
                                       point.y - window->geometry.y}};
        }
    }
    return std::nullopt;
}

void SurfaceTree::set_placement_rules(std::vector<PlacementRule> rules) {
    m_rules = std::move(rules);
}

void SurfaceTree::set_zones(std::vector<Zone> zones) {
    m_zones = std::move(zones);
}

auto SurfaceTree::find_zone(std::string_view name) const -> const Zone* {
    auto it = std::find_if(m_zones.begin(), m_zones.end(),
                           [name](const Zone& z) { return z.name == name; });
    return it == m_zones.end() ? nullptr : &*it;
}

void SurfaceTree::frame_composed(OutputId output) {
    for (auto& [id, surface] : m_surfaces) {
        if (surface.pending_outputs.erase(output) > 0 && surface.pending_outputs.empty()) {
            surface.damage.clear();
        }
    }
}

auto SurfaceTree::output_added(OutputId id) -> std::vector<WindowId> {
    const auto* output = m_outputs.find(id);
    std::vector<WindowId> placed;
    if (output == nullptr || !output->enabled) {
        return placed;
    }

    for (auto wid : m_order) {
        auto* window = find_window_mut(wid);
        if (window == nullptr || !window->detached) {
            continue;
        }
        window->detached = false;
        place_on(*window, *output, match_rule(*window));
        placed.push_back(wid);
    }

    for (auto& [wid, window] : m_windows) {
        recompute_outputs(window);
    }
    rebuild_stacks();

    for (auto wid : placed) {
        const auto* window = find_window(wid);
        damage_rect(window->geometry, window->outputs);
    }
    return placed;
}

auto SurfaceTree::output_removed(OutputId id, Rect old_rect) -> std::vector<WindowId> {
    for (auto& [sid, surface] : m_surfaces) {
        // Nothing is left to compose this damage on
        if (surface.pending_outputs.erase(id) > 0 && surface.pending_outputs.empty()) {
            surface.damage.clear();
        }
    }

    std::vector<std::pair<WindowId, OutputId>> rehomed;
    for (auto wid : m_order) {
        auto& window = m_windows.at(wid);
        if (!window.mapped || window.detached || !window.outputs.contains(id)) {
            continue;
        }
        window.outputs.erase(id);
        if (!window.outputs.empty()) {
            if (window.home == id) {
                window.home = *window.outputs.begin();
            }
            continue;
        }

        const auto* dest = m_outputs.nearest_enabled(window.geometry.center(), id);
        if (dest == nullptr) {
            window.detached = true;
            window.home = INVALID_ID;
            continue;
        }

        const Rect area = dest->rect();
        const int32_t off_x = window.geometry.x - old_rect.x;
        const int32_t off_y = window.geometry.y - old_rect.y;
        const int32_t max_x = std::max(area.x, area.right() - window.geometry.width);
        const int32_t max_y = std::max(area.y, area.bottom() - window.geometry.height);
        window.geometry.x = std::clamp(area.x + off_x, area.x, max_x);
        window.geometry.y = std::clamp(area.y + off_y, area.y, max_y);
        window.home = dest->id;
        recompute_outputs(window);
        rehomed.emplace_back(wid, dest->id);
    }
    rebuild_stacks();

    std::vector<WindowId> out;
    out.reserve(rehomed.size());
    for (const auto& [wid, dest_id] : rehomed) {
        if (const auto* dest = m_outputs.find(dest_id)) {
            m_listener.on_damage(dest_id, Region(dest->rect()));
        }
        out.push_back(wid);
    }
    return out;
}

void SurfaceTree::layout_changed() {
    for (auto& [wid, window] : m_windows) {
        recompute_outputs(window);
    }
    rebuild_stacks();
}

} // namespace scape::core
