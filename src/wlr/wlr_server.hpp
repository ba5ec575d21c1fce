#pragma once

#include <core/interfaces.hpp>
#include <memory>
#include <optional>
#include <string>
#include <util/config.hpp>
#include <util/error.hpp>

struct wl_display;
struct wl_event_loop;

namespace scape::core {
class Compositor;
}

namespace scape::wlr {

struct ServerOptions {
    BackendKind backend = BackendKind::automatic;
    std::string keyboard_layout = "us";
    /// Outputs created on the headless backend.
    int headless_outputs = 1;
    bool xwayland = true;
};

/// @brief wlroots 0.18 glue: owns the display, backend, renderer and protocol globals, and
/// translates their events into calls on the core compositor.
///
/// Construction and attach() are split because the compositor takes this object as its render
/// backend, client sink and session control.
class WlrServer final : public core::ClientSink,
                        public core::RenderBackend,
                        public core::SessionControl {
public:
    WlrServer();
    ~WlrServer() override;

    WlrServer(const WlrServer&) = delete;
    WlrServer& operator=(const WlrServer&) = delete;
    WlrServer(WlrServer&&) = delete;
    WlrServer& operator=(WlrServer&&) = delete;

    /// @brief Creates the display, backend, renderer and protocol globals. No socket yet.
    [[nodiscard]] static auto create(const ServerOptions& options) -> ResultPtr<WlrServer>;

    /// @brief Routes backend and client events to @p compositor from now on.
    void attach(core::Compositor& compositor);
    /// @brief Binds the Wayland socket, starts the backend (outputs appear) and XWayland.
    [[nodiscard]] auto start() -> Result<void>;
    /// @brief Applies registry output state (position, scale, enabled) to wlroots.
    void sync_outputs();
    /// @brief Flushes pending client events. Call before blocking on the loop.
    void flush_clients();
    void stop();

    [[nodiscard]] auto display() const -> wl_display*;
    [[nodiscard]] auto event_loop() const -> wl_event_loop*;
    [[nodiscard]] auto wayland_display() const -> std::string;
    /// @brief X11 display name, or an empty string when XWayland is unavailable.
    [[nodiscard]] auto x11_display() const -> std::string;

    // ClientSink
    void pointer_enter(core::SeatId seat, core::SurfaceId surface, core::Point local) override;
    void pointer_leave(core::SeatId seat, core::SurfaceId surface) override;
    void pointer_motion(core::SeatId seat, core::SurfaceId surface, core::Point local,
                        uint32_t time_ms) override;
    void pointer_button(core::SeatId seat, core::SurfaceId surface, uint32_t button, bool pressed,
                        uint32_t time_ms) override;
    void pointer_axis(core::SeatId seat, core::SurfaceId surface, bool horizontal, double delta,
                      uint32_t time_ms) override;
    void keyboard_enter(core::SeatId seat, core::SurfaceId surface,
                        const std::vector<uint32_t>& pressed_keys) override;
    void keyboard_leave(core::SeatId seat, core::SurfaceId surface) override;
    void key(core::SeatId seat, core::SurfaceId surface, uint32_t keycode, bool pressed,
             uint32_t time_ms) override;
    void modifiers(core::SeatId seat, core::SurfaceId surface, uint32_t mask) override;
    void touch_down(core::SeatId seat, core::SurfaceId surface, int32_t touch_id,
                    core::Point local, uint32_t time_ms) override;
    void touch_motion(core::SeatId seat, core::SurfaceId surface, int32_t touch_id,
                      core::Point local, uint32_t time_ms) override;
    void touch_up(core::SeatId seat, core::SurfaceId surface, int32_t touch_id,
                  uint32_t time_ms) override;
    void configure(core::WindowId window, core::Size size, bool activated) override;
    void close(core::WindowId window) override;
    void popup_done(core::SurfaceId popup) override;
    void disconnect(core::ClientId client, const std::string& reason) override;

    // RenderBackend
    [[nodiscard]] auto import_buffer(core::BufferHandle handle)
        -> std::optional<core::BufferToken> override;
    void release_buffer(core::BufferToken token) override;
    auto compose(core::OutputId output, const std::vector<core::RenderItem>& items,
                 const core::Region& damage) -> core::ComposeOutcome override;
    void schedule_frame(core::OutputId output) override;

    // SessionControl
    [[nodiscard]] auto switch_vt(uint32_t vt) -> Result<void> override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace scape::wlr
