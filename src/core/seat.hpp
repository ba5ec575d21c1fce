#pragma once

#include "geometry.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <util/error.hpp>
#include <vector>

namespace scape::core {

/// @brief Modifier bits, laid out like wlr_keyboard_modifier.
namespace modifier {
inline constexpr uint32_t SHIFT = 1u << 0;
inline constexpr uint32_t CAPS = 1u << 1;
inline constexpr uint32_t CTRL = 1u << 2;
inline constexpr uint32_t ALT = 1u << 3;
inline constexpr uint32_t MOD2 = 1u << 4;
inline constexpr uint32_t MOD3 = 1u << 5;
inline constexpr uint32_t LOGO = 1u << 6;
inline constexpr uint32_t MOD5 = 1u << 7;
/// Lock-style modifiers never take part in binding matches.
inline constexpr uint32_t BINDING_MASK = SHIFT | CTRL | ALT | LOGO;
} // namespace modifier

enum class GrabKind : uint8_t {
    pointer,
    keyboard,
};

struct Grab {
    GrabKind kind;
    WindowId window;
};

/// @brief Surface a touch point was delivered to on touch-down.
struct TouchTarget {
    WindowId window = INVALID_ID;
    SurfaceId surface = INVALID_ID;
    Point local;
};

struct Seat {
    SeatId id = INVALID_ID;
    std::string name;
    std::optional<WindowId> focus;
    Point pointer;
    std::set<uint32_t> pressed_keys;
    std::set<uint32_t> pressed_buttons;
    uint32_t modifiers = 0;
    std::optional<Grab> grab;
    std::optional<WindowId> pointer_window;
    std::optional<SurfaceId> pointer_surface;
    std::map<int32_t, TouchTarget> touch_points;
};

/// @brief All seats plus the window -> seats focus index.
///
/// Windows are referenced by id only. Removing a window goes through forget_window() so that no
/// seat keeps focus, grab or pointer-enter state pointing at it.
class SeatState {
public:
    auto add_seat(std::string name) -> SeatId;

    [[nodiscard]] auto find(SeatId id) -> Seat*;
    [[nodiscard]] auto find(SeatId id) const -> const Seat*;
    [[nodiscard]] auto find_by_name(std::string_view name) const -> const Seat*;
    [[nodiscard]] auto seats() const -> const std::vector<Seat>& { return m_seats; }
    [[nodiscard]] auto seats() -> std::vector<Seat>& { return m_seats; }

    /// @brief Moves keyboard focus. Returns the previously focused window.
    auto set_focus(SeatId seat, std::optional<WindowId> window) -> std::optional<WindowId>;
    /// @brief Seats whose keyboard focus is @p window.
    [[nodiscard]] auto seats_focusing(WindowId window) const -> std::vector<SeatId>;

    /// @brief Clears focus, grab, pointer-enter and touch targets referencing @p window.
    /// @return Seats that lost keyboard focus.
    auto forget_window(WindowId window) -> std::vector<SeatId>;

    /// @brief Starts a grab. Fails unless the seat is idle and the window is mapped.
    [[nodiscard]] auto request_grab(SeatId seat, GrabKind kind, WindowId window,
                                    bool window_mapped) -> Result<void>;
    /// @brief Releases the seat's own grab. Returns false if it held none.
    auto release_grab(SeatId seat) -> bool;

private:
    std::vector<Seat> m_seats;
    std::map<WindowId, std::set<SeatId>> m_focus_index;
    SeatId m_next_id = 1;
};

} // namespace scape::core
