#pragma once

#include "interfaces.hpp"
#include "output_registry.hpp"
#include "policy.hpp"
#include "seat.hpp"
#include "surface_tree.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <util/config.hpp>
#include <util/error.hpp>

namespace scape::core {

enum class RouterState : uint8_t {
    idle,
    pointer_grabbed,
    keyboard_grabbed,
};

enum class KeyDisposition : uint8_t {
    consumed,
    forwarded,
    dropped,
};

struct KeyEvent {
    uint32_t keycode = 0;
    /// Keysym at shift level zero, so bindings match independent of modifier state.
    uint32_t keysym = 0;
    bool pressed = false;
    uint32_t time_ms = 0;
};

struct RouterConfig {
    FocusMode focus_mode = FocusMode::follows_pointer;
    bool raise_on_focus = false;
};

/// @brief Runs the action attached to a matched binding.
class BindingHandler {
public:
    virtual ~BindingHandler() = default;
    virtual void run_binding(SeatId seat, const Binding& binding) = 0;
};

/// @brief Turns raw input into seat transitions and client-targeted events.
class InputRouter {
public:
    InputRouter(OutputRegistry& outputs, SurfaceTree& tree, SeatState& seats, ClientSink& sink,
                BindingHandler& handler, RouterConfig config = {});

    /// @brief Replaces the whole binding table.
    void set_bindings(BindingTable bindings);
    [[nodiscard]] auto bindings() const -> const BindingTable& { return m_bindings; }
    void set_config(RouterConfig config) { m_config = config; }
    [[nodiscard]] auto config() const -> const RouterConfig& { return m_config; }

    [[nodiscard]] auto state(SeatId seat) const -> RouterState;

    auto handle_key(SeatId seat, const KeyEvent& event) -> KeyDisposition;
    void handle_modifiers(SeatId seat, uint32_t mask);

    void pointer_motion(SeatId seat, Point position, uint32_t time_ms);
    void pointer_motion_relative(SeatId seat, double dx, double dy, uint32_t time_ms);
    void pointer_button(SeatId seat, uint32_t button, bool pressed, uint32_t time_ms);
    void pointer_axis(SeatId seat, bool horizontal, double delta, uint32_t time_ms);

    void touch_down(SeatId seat, int32_t touch_id, Point position, uint32_t time_ms);
    void touch_motion(SeatId seat, int32_t touch_id, Point position, uint32_t time_ms);
    void touch_up(SeatId seat, int32_t touch_id, uint32_t time_ms);

    /// @brief Moves keyboard focus, emitting leave/enter once per actual change.
    /// @return False if the window cannot take focus.
    auto focus(SeatId seat, std::optional<WindowId> window) -> bool;
    /// @brief Re-evaluates which surface the pointer is over after a layout change.
    void refresh_pointer(SeatId seat);

    [[nodiscard]] auto request_grab(SeatId seat, GrabKind kind, WindowId window) -> Result<void>;
    auto release_grab(SeatId seat) -> bool;

private:
    void update_pointer_target(Seat& seat, const std::optional<HitResult>& hit, uint32_t time_ms);
    void deliver_grabbed_motion(Seat& seat, WindowId window, uint32_t time_ms);
    [[nodiscard]] auto keyboard_target(const Seat& seat) const -> std::optional<SurfaceId>;
    [[nodiscard]] auto forwarded_keys(const Seat& seat) const -> std::vector<uint32_t>;

    OutputRegistry& m_outputs;
    SurfaceTree& m_tree;
    SeatState& m_seats;
    ClientSink& m_sink;
    BindingHandler& m_handler;
    RouterConfig m_config;
    BindingTable m_bindings;
    /// Keycodes whose press was consumed by a binding, per seat.
    std::map<SeatId, std::set<uint32_t>> m_consumed;
};

} // namespace scape::core
