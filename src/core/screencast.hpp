#pragma once

#include "frame_scheduler.hpp"
#include "geometry.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <util/config.hpp>

namespace scape::core {

using ConsumerId = uint32_t;

/// @brief Reference to a presented frame; the buffer stays owned by the rendering backend.
struct CastFrame {
    uint64_t frame_number = 0;
    uint64_t buffer = 0;
    Size size;
    Clock::time_point presented_at;
};

struct ConsumerStats {
    uint64_t delivered = 0;
    uint64_t dropped = 0;
};

/// @brief Latest-frame fan-out for screencast consumers.
///
/// Publishing never waits for consumers. A consumer that pulls slower than frames arrive only
/// sees the newest frame; skipped frames are counted as dropped for that consumer alone.
class ScreencastHub {
public:
    explicit ScreencastHub(ScreencastPolicy policy = ScreencastPolicy::best_effort,
                           std::chrono::milliseconds interval = std::chrono::milliseconds{100});

    auto subscribe(OutputId output) -> ConsumerId;
    auto unsubscribe(ConsumerId consumer) -> bool;
    /// @brief Drops subscriptions to a removed output.
    void output_removed(OutputId output);

    void publish(OutputId output, uint64_t buffer, Size size, Clock::time_point now);
    /// @brief Returns the newest frame not yet delivered to @p consumer.
    [[nodiscard]] auto pull(ConsumerId consumer) -> std::optional<CastFrame>;
    /// @brief Periodic policy: re-offers the latest frame once the interval passed without one.
    void tick(Clock::time_point now);
    /// @brief Earliest time tick() re-offers a frame; nullopt unless periodic with subscribers.
    [[nodiscard]] auto next_reoffer() const -> std::optional<Clock::time_point>;

    [[nodiscard]] auto stats(ConsumerId consumer) const -> std::optional<ConsumerStats>;
    [[nodiscard]] auto has_consumers(OutputId output) const -> bool;
    [[nodiscard]] auto policy() const -> ScreencastPolicy { return m_policy; }
    void set_policy(ScreencastPolicy policy, std::chrono::milliseconds interval);

private:
    struct Consumer {
        OutputId output = INVALID_ID;
        uint64_t last_delivered = 0;
        bool reoffer = false;
        ConsumerStats stats;
    };

    struct Latest {
        CastFrame frame;
        Clock::time_point offered_at;
    };

    ScreencastPolicy m_policy;
    std::chrono::milliseconds m_interval;
    std::map<ConsumerId, Consumer> m_consumers;
    std::map<OutputId, Latest> m_latest;
    ConsumerId m_next_id = 1;
};

} // namespace scape::core
