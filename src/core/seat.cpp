#include "seat.hpp"

#include <algorithm>

namespace scape::core {

auto SeatState::add_seat(std::string name) -> SeatId {
    Seat seat;
    seat.id = m_next_id++;
    seat.name = std::move(name);
    m_seats.push_back(std::move(seat));
    return m_seats.back().id;
}

auto SeatState::find(SeatId id) -> Seat* {
    auto it =
        std::find_if(m_seats.begin(), m_seats.end(), [id](const Seat& s) { return s.id == id; });
    return it == m_seats.end() ? nullptr : &*it;
}

auto SeatState::find(SeatId id) const -> const Seat* {
    auto it =
        std::find_if(m_seats.begin(), m_seats.end(), [id](const Seat& s) { return s.id == id; });
    return it == m_seats.end() ? nullptr : &*it;
}

auto SeatState::find_by_name(std::string_view name) const -> const Seat* {
    auto it = std::find_if(m_seats.begin(), m_seats.end(),
                           [name](const Seat& s) { return s.name == name; });
    return it == m_seats.end() ? nullptr : &*it;
}

auto SeatState::set_focus(SeatId seat_id, std::optional<WindowId> window)
    -> std::optional<WindowId> {
    auto* seat = find(seat_id);
    if (seat == nullptr) {
        return std::nullopt;
    }
    auto previous = seat->focus;
    if (previous == window) {
        return previous;
    }

    if (previous) {
        auto it = m_focus_index.find(*previous);
        if (it != m_focus_index.end()) {
            it->second.erase(seat_id);
            if (it->second.empty()) {
                m_focus_index.erase(it);
            }
        }
    }
    seat->focus = window;
    if (window) {
        m_focus_index[*window].insert(seat_id);
    }
    return previous;
}

auto SeatState::seats_focusing(WindowId window) const -> std::vector<SeatId> {
    auto it = m_focus_index.find(window);
    if (it == m_focus_index.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

auto SeatState::forget_window(WindowId window) -> std::vector<SeatId> {
    auto lost = seats_focusing(window);
    m_focus_index.erase(window);

    for (auto& seat : m_seats) {
        if (seat.focus == window) {
            seat.focus.reset();
        }
        if (seat.grab && seat.grab->window == window) {
            seat.grab.reset();
        }
        if (seat.pointer_window == window) {
            seat.pointer_window.reset();
            seat.pointer_surface.reset();
        }
        std::erase_if(seat.touch_points,
                      [window](const auto& entry) { return entry.second.window == window; });
    }
    return lost;
}

auto SeatState::request_grab(SeatId seat_id, GrabKind kind, WindowId window, bool window_mapped)
    -> Result<void> {
    auto* seat = find(seat_id);
    if (seat == nullptr) {
        return make_error<void>(ErrorCode::seat_not_found,
                                "Unknown seat id " + std::to_string(seat_id));
    }
    if (seat->grab) {
        return make_error<void>(ErrorCode::grab_conflict,
                                "Seat '" + seat->name + "' already holds a grab");
    }
    if (!window_mapped) {
        return make_error<void>(ErrorCode::grab_conflict,
                                "Window " + std::to_string(window) + " is not mapped");
    }
    seat->grab = Grab{.kind = kind, .window = window};
    return {};
}

auto SeatState::release_grab(SeatId seat_id) -> bool {
    auto* seat = find(seat_id);
    if (seat == nullptr || !seat->grab) {
        return false;
    }
    seat->grab.reset();
    return true;
}

} // namespace scape::core
