#include "input_router.hpp"

#include <util/logging.hpp>

namespace scape::core {

InputRouter::InputRouter(OutputRegistry& outputs, SurfaceTree& tree, SeatState& seats,
                         ClientSink& sink, BindingHandler& handler, RouterConfig config)
    : m_outputs(outputs), m_tree(tree), m_seats(seats), m_sink(sink), m_handler(handler),
      m_config(config) {}

void InputRouter::set_bindings(BindingTable bindings) {
    m_bindings = std::move(bindings);
}

auto InputRouter::state(SeatId seat_id) const -> RouterState {
    const auto* seat = m_seats.find(seat_id);
    if (seat == nullptr || !seat->grab) {
        return RouterState::idle;
    }
    return seat->grab->kind == GrabKind::pointer ? RouterState::pointer_grabbed
                                                 : RouterState::keyboard_grabbed;
}

auto InputRouter::keyboard_target(const Seat& seat) const -> std::optional<SurfaceId> {
    std::optional<WindowId> window;
    if (seat.grab && seat.grab->kind == GrabKind::keyboard) {
        window = seat.grab->window;
    } else {
        window = seat.focus;
    }
    if (!window) {
        return std::nullopt;
    }
    const auto* w = m_tree.find_window(*window);
    if (w == nullptr || !w->mapped) {
        return std::nullopt;
    }
    return w->surface;
}

auto InputRouter::forwarded_keys(const Seat& seat) const -> std::vector<uint32_t> {
    std::vector<uint32_t> keys;
    auto consumed = m_consumed.find(seat.id);
    for (auto key : seat.pressed_keys) {
        if (consumed == m_consumed.end() || !consumed->second.contains(key)) {
            keys.push_back(key);
        }
    }
    return keys;
}

auto InputRouter::handle_key(SeatId seat_id, const KeyEvent& event) -> KeyDisposition {
    auto* seat = m_seats.find(seat_id);
    if (seat == nullptr) {
        return KeyDisposition::dropped;
    }
    auto& consumed = m_consumed[seat_id];

    if (event.pressed) {
        seat->pressed_keys.insert(event.keycode);
        if (const auto* binding = m_bindings.find(seat->modifiers, event.keysym)) {
            SCAPE_LOG_DEBUG("Binding matched: mods={:#x} keysym={:#x} action={}",
                            seat->modifiers, event.keysym, action_name(binding->action));
            Binding matched = *binding;
            if (matched.consume) {
                consumed.insert(event.keycode);
                m_handler.run_binding(seat_id, matched);
                return KeyDisposition::consumed;
            }
            m_handler.run_binding(seat_id, matched);
            // The handler may have changed focus or destroyed the seat's target
            seat = m_seats.find(seat_id);
            if (seat == nullptr) {
                return KeyDisposition::dropped;
            }
        }
    } else {
        seat->pressed_keys.erase(event.keycode);
        if (consumed.erase(event.keycode) > 0) {
            return KeyDisposition::consumed;
        }
    }

    auto target = keyboard_target(*seat);
    if (!target) {
        return KeyDisposition::dropped;
    }
    m_sink.key(seat_id, *target, event.keycode, event.pressed, event.time_ms);
    return KeyDisposition::forwarded;
}

void InputRouter::handle_modifiers(SeatId seat_id, uint32_t mask) {
    auto* seat = m_seats.find(seat_id);
    if (seat == nullptr || seat->modifiers == mask) {
        return;
    }
    seat->modifiers = mask;
    if (auto target = keyboard_target(*seat)) {
        m_sink.modifiers(seat_id, *target, mask);
    }
}

void InputRouter::update_pointer_target(Seat& seat, const std::optional<HitResult>& hit,
                                        uint32_t time_ms) {
    std::optional<SurfaceId> next;
    if (hit) {
        next = hit->surface;
    }

    if (seat.pointer_surface != next) {
        if (seat.pointer_surface) {
            m_sink.pointer_leave(seat.id, *seat.pointer_surface);
        }
        seat.pointer_surface = next;
        seat.pointer_window.reset();
        if (hit) {
            seat.pointer_window = hit->window;
            m_sink.pointer_enter(seat.id, hit->surface, hit->local);
        }
        return;
    }
    if (hit) {
        m_sink.pointer_motion(seat.id, hit->surface, hit->local, time_ms);
    }
}

void InputRouter::deliver_grabbed_motion(Seat& seat, WindowId window_id, uint32_t time_ms) {
    const auto* window = m_tree.find_window(window_id);
    if (window == nullptr) {
        return;
    }
    Point origin = m_tree.surface_origin(window->surface);
    HitResult target{.window = window_id,
                     .surface = window->surface,
                     .local = {seat.pointer.x - origin.x, seat.pointer.y - origin.y}};
    update_pointer_target(seat, target, time_ms);
}

void InputRouter::pointer_motion(SeatId seat_id, Point position, uint32_t time_ms) {
    auto* seat = m_seats.find(seat_id);
    if (seat == nullptr) {
        return;
    }
    seat->pointer = m_outputs.clamp_to_layout(position);

    if (seat->grab && seat->grab->kind == GrabKind::pointer) {
        deliver_grabbed_motion(*seat, seat->grab->window, time_ms);
        return;
    }

    auto hit = m_tree.hit_test(seat->pointer);
    update_pointer_target(*seat, hit, time_ms);

    if (m_config.focus_mode == FocusMode::follows_pointer && hit && !seat->grab) {
        const auto* window = m_tree.find_window(hit->window);
        if (window != nullptr && window->focusable && seat->focus != hit->window) {
            focus(seat_id, hit->window);
        }
    }
}

void InputRouter::pointer_motion_relative(SeatId seat_id, double dx, double dy,
                                          uint32_t time_ms) {
    const auto* seat = m_seats.find(seat_id);
    if (seat == nullptr) {
        return;
    }
    pointer_motion(seat_id, {seat->pointer.x + dx, seat->pointer.y + dy}, time_ms);
}

void InputRouter::pointer_button(SeatId seat_id, uint32_t button, bool pressed,
                                 uint32_t time_ms) {
    auto* seat = m_seats.find(seat_id);
    if (seat == nullptr) {
        return;
    }
    if (pressed) {
        seat->pressed_buttons.insert(button);
    } else {
        seat->pressed_buttons.erase(button);
    }

    if (seat->grab && seat->grab->kind == GrabKind::pointer) {
        const auto* window = m_tree.find_window(seat->grab->window);
        if (window != nullptr) {
            m_sink.pointer_button(seat_id, window->surface, button, pressed, time_ms);
        }
        return;
    }

    if (pressed && !seat->grab && m_config.focus_mode == FocusMode::click &&
        seat->pointer_window) {
        const WindowId clicked = *seat->pointer_window;
        const auto* window = m_tree.find_window(clicked);
        if (window != nullptr && window->focusable) {
            focus(seat_id, clicked);
            if (m_config.raise_on_focus) {
                m_tree.restack(clicked, StackDirection::raise);
            }
        }
        seat = m_seats.find(seat_id);
    }

    if (seat != nullptr && seat->pointer_surface) {
        m_sink.pointer_button(seat_id, *seat->pointer_surface, button, pressed, time_ms);
    }
}

void InputRouter::pointer_axis(SeatId seat_id, bool horizontal, double delta, uint32_t time_ms) {
    const auto* seat = m_seats.find(seat_id);
    if (seat == nullptr) {
        return;
    }
    if (seat->grab && seat->grab->kind == GrabKind::pointer) {
        if (const auto* window = m_tree.find_window(seat->grab->window)) {
            m_sink.pointer_axis(seat_id, window->surface, horizontal, delta, time_ms);
        }
        return;
    }
    if (seat->pointer_surface) {
        m_sink.pointer_axis(seat_id, *seat->pointer_surface, horizontal, delta, time_ms);
    }
}

void InputRouter::touch_down(SeatId seat_id, int32_t touch_id, Point position,
                             uint32_t time_ms) {
    auto* seat = m_seats.find(seat_id);
    if (seat == nullptr) {
        return;
    }
    auto hit = m_tree.hit_test(m_outputs.clamp_to_layout(position));
    if (!hit) {
        return;
    }
    const auto* window = m_tree.find_window(hit->window);
    if (window != nullptr && window->focusable && !seat->grab) {
        focus(seat_id, hit->window);
        seat = m_seats.find(seat_id);
    }
    seat->touch_points[touch_id] =
        TouchTarget{.window = hit->window, .surface = hit->surface, .local = hit->local};
    m_sink.touch_down(seat_id, hit->surface, touch_id, hit->local, time_ms);
}

void InputRouter::touch_motion(SeatId seat_id, int32_t touch_id, Point position,
                               uint32_t time_ms) {
    auto* seat = m_seats.find(seat_id);
    if (seat == nullptr) {
        return;
    }
    auto it = seat->touch_points.find(touch_id);
    if (it == seat->touch_points.end()) {
        return;
    }
    Point origin = m_tree.surface_origin(it->second.surface);
    it->second.local = {position.x - origin.x, position.y - origin.y};
    m_sink.touch_motion(seat_id, it->second.surface, touch_id, it->second.local, time_ms);
}

void InputRouter::touch_up(SeatId seat_id, int32_t touch_id, uint32_t time_ms) {
    auto* seat = m_seats.find(seat_id);
    if (seat == nullptr) {
        return;
    }
    auto it = seat->touch_points.find(touch_id);
    if (it == seat->touch_points.end()) {
        return;
    }
    m_sink.touch_up(seat_id, it->second.surface, touch_id, time_ms);
    seat->touch_points.erase(it);
}

auto InputRouter::focus(SeatId seat_id, std::optional<WindowId> window_id) -> bool {
    auto* seat = m_seats.find(seat_id);
    if (seat == nullptr) {
        return false;
    }
    const Window* next = nullptr;
    if (window_id) {
        next = m_tree.find_window(*window_id);
        if (next == nullptr || !next->mapped || !next->focusable) {
            return false;
        }
    }
    if (seat->focus == window_id) {
        return true;
    }

    auto previous = m_seats.set_focus(seat_id, window_id);
    if (previous) {
        if (const auto* old = m_tree.find_window(*previous); old != nullptr && old->mapped) {
            m_sink.keyboard_leave(seat_id, old->surface);
            m_sink.configure(old->id, {old->geometry.width, old->geometry.height}, false);
        }
    }
    if (next != nullptr) {
        m_sink.keyboard_enter(seat_id, next->surface, forwarded_keys(*seat));
        m_sink.modifiers(seat_id, next->surface, seat->modifiers);
        m_sink.configure(next->id, {next->geometry.width, next->geometry.height}, true);
    }
    return true;
}

void InputRouter::refresh_pointer(SeatId seat_id) {
    auto* seat = m_seats.find(seat_id);
    if (seat == nullptr) {
        return;
    }
    if (seat->grab && seat->grab->kind == GrabKind::pointer) {
        return;
    }
    update_pointer_target(*seat, m_tree.hit_test(seat->pointer), 0);
}

auto InputRouter::request_grab(SeatId seat_id, GrabKind kind, WindowId window_id)
    -> Result<void> {
    const auto* window = m_tree.find_window(window_id);
    if (window == nullptr) {
        return make_error<void>(ErrorCode::window_not_found,
                                "Grab requested for unknown window " + std::to_string(window_id));
    }
    SCAPE_TRY(m_seats.request_grab(seat_id, kind, window_id, window->mapped));
    SCAPE_LOG_DEBUG("Seat {} {} grab taken by window {}", seat_id,
                    kind == GrabKind::keyboard ? "keyboard" : "pointer", window_id);
    return {};
}

auto InputRouter::release_grab(SeatId seat_id) -> bool {
    if (!m_seats.release_grab(seat_id)) {
        return false;
    }
    refresh_pointer(seat_id);
    return true;
}

} // namespace scape::core
