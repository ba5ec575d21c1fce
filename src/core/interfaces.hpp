#pragma once

#include "geometry.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <util/error.hpp>
#include <vector>

namespace scape::core {

/// @brief Protocol event delivery to clients. Implemented by the wlroots glue and by test fakes.
class ClientSink {
public:
    virtual ~ClientSink() = default;

    virtual void pointer_enter(SeatId seat, SurfaceId surface, Point local) = 0;
    virtual void pointer_leave(SeatId seat, SurfaceId surface) = 0;
    virtual void pointer_motion(SeatId seat, SurfaceId surface, Point local, uint32_t time_ms) = 0;
    virtual void pointer_button(SeatId seat, SurfaceId surface, uint32_t button, bool pressed,
                                uint32_t time_ms) = 0;
    virtual void pointer_axis(SeatId seat, SurfaceId surface, bool horizontal, double delta,
                              uint32_t time_ms) = 0;

    virtual void keyboard_enter(SeatId seat, SurfaceId surface,
                                const std::vector<uint32_t>& pressed_keys) = 0;
    virtual void keyboard_leave(SeatId seat, SurfaceId surface) = 0;
    virtual void key(SeatId seat, SurfaceId surface, uint32_t keycode, bool pressed,
                     uint32_t time_ms) = 0;
    virtual void modifiers(SeatId seat, SurfaceId surface, uint32_t mask) = 0;

    virtual void touch_down(SeatId seat, SurfaceId surface, int32_t touch_id, Point local,
                            uint32_t time_ms) = 0;
    virtual void touch_motion(SeatId seat, SurfaceId surface, int32_t touch_id, Point local,
                              uint32_t time_ms) = 0;
    virtual void touch_up(SeatId seat, SurfaceId surface, int32_t touch_id, uint32_t time_ms) = 0;

    virtual void configure(WindowId window, Size size, bool activated) = 0;
    virtual void close(WindowId window) = 0;
    virtual void popup_done(SurfaceId popup) = 0;
    virtual void disconnect(ClientId client, const std::string& reason) = 0;
};

/// @brief One surface to draw, in global coordinates.
struct RenderItem {
    SurfaceId surface = INVALID_ID;
    BufferToken buffer = 0;
    Rect rect;
};

enum class ComposeResult : uint8_t {
    presented,
    failed,
};

struct ComposeOutcome {
    ComposeResult result = ComposeResult::failed;
    /// Backend handle of the committed output buffer, for screencast consumers.
    uint64_t buffer = 0;
};

/// @brief GPU side of frame production.
class RenderBackend {
public:
    virtual ~RenderBackend() = default;

    /// @brief Makes a client buffer sampleable and keeps it alive until release_buffer().
    /// @return nullopt when the buffer cannot be used (bad format, destroyed, no texture).
    [[nodiscard]] virtual auto import_buffer(BufferHandle handle)
        -> std::optional<BufferToken> = 0;
    virtual void release_buffer(BufferToken token) = 0;

    /// @brief Draws @p items (top-to-bottom) limited to @p damage and commits the output.
    virtual auto compose(OutputId output, const std::vector<RenderItem>& items,
                         const Region& damage) -> ComposeOutcome = 0;
    /// @brief Requests a frame-done notification for @p output.
    virtual void schedule_frame(OutputId output) = 0;
};

/// @brief Starts client processes.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    /// @brief Runs @p command through the shell with @p env added to the environment.
    [[nodiscard]] virtual auto spawn(const std::string& command,
                                     const std::map<std::string, std::string>& env)
        -> Result<int> = 0;
};

/// @brief Session-level controls (VT switching).
class SessionControl {
public:
    virtual ~SessionControl() = default;
    [[nodiscard]] virtual auto switch_vt(uint32_t vt) -> Result<void> = 0;
};

} // namespace scape::core
