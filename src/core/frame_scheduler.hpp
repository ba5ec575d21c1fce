#pragma once

#include "geometry.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace scape::core {

using Clock = std::chrono::steady_clock;

enum class FrameState : uint8_t {
    idle,
    frame_requested,
    frame_pending,
};

[[nodiscard]] constexpr auto to_string(FrameState state) -> const char* {
    switch (state) {
    case FrameState::idle:
        return "idle";
    case FrameState::frame_requested:
        return "frame_requested";
    case FrameState::frame_pending:
        return "frame_pending";
    }
    return "unknown";
}

/// @brief Backend side of frame scheduling for one or more outputs.
class FrameTarget {
public:
    virtual ~FrameTarget() = default;
    /// @brief Composes and submits a frame. Returns false when the backend rejected it.
    virtual auto submit_frame(OutputId output, const Region& damage) -> bool = 0;
    /// @brief Asks the backend for the next frame opportunity (vblank / frame-done).
    virtual void schedule_frame(OutputId output) = 0;
};

struct BackoffPolicy {
    std::chrono::milliseconds initial{16};
    std::chrono::milliseconds max{2000};
};

/// @brief Per-output damage coalescing state machine.
///
/// At most one frame is in flight. Damage arriving while a frame is pending is accumulated and
/// produces exactly one follow-up frame on present completion. A rejected submit marks the
/// output degraded and retries at an exponentially growing deadline.
class FrameScheduler {
public:
    FrameScheduler(OutputId output, FrameTarget& target, bool hardware_sync,
                   BackoffPolicy backoff = {});

    void add_damage(const Region& damage, Clock::time_point now);
    /// @brief Backend frame opportunity. Submits when a frame is requested and not backing off.
    void frame_opportunity(Clock::time_point now);
    /// @brief The in-flight frame reached the screen.
    void present_complete(Clock::time_point now);
    /// @brief Fires an expired back-off retry.
    void tick(Clock::time_point now);

    [[nodiscard]] auto output() const -> OutputId { return m_output; }
    [[nodiscard]] auto state() const -> FrameState { return m_state; }
    [[nodiscard]] auto damage() const -> const Region& { return m_damage; }
    [[nodiscard]] auto degraded() const -> bool { return m_degraded; }
    [[nodiscard]] auto retry_deadline() const -> std::optional<Clock::time_point> {
        return m_retry_at;
    }
    [[nodiscard]] auto current_backoff() const -> std::chrono::milliseconds { return m_backoff; }
    [[nodiscard]] auto frames_submitted() const -> uint64_t { return m_frames_submitted; }
    [[nodiscard]] auto submit_failures() const -> uint64_t { return m_submit_failures; }

    void set_hardware_sync(bool hardware_sync) { m_hardware_sync = hardware_sync; }

private:
    void request_opportunity(Clock::time_point now);
    void submit(Clock::time_point now);

    OutputId m_output;
    FrameTarget& m_target;
    bool m_hardware_sync;
    BackoffPolicy m_policy;

    FrameState m_state = FrameState::idle;
    Region m_damage;
    bool m_degraded = false;
    std::chrono::milliseconds m_backoff;
    std::optional<Clock::time_point> m_retry_at;
    uint64_t m_frames_submitted = 0;
    uint64_t m_submit_failures = 0;
};

} // namespace scape::core
