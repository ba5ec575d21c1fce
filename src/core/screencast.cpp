#include "screencast.hpp"

#include <util/logging.hpp>

namespace scape::core {

ScreencastHub::ScreencastHub(ScreencastPolicy policy, std::chrono::milliseconds interval)
    : m_policy(policy), m_interval(interval) {}

void ScreencastHub::set_policy(ScreencastPolicy policy, std::chrono::milliseconds interval) {
    m_policy = policy;
    m_interval = interval;
}

auto ScreencastHub::subscribe(OutputId output) -> ConsumerId {
    Consumer consumer;
    consumer.output = output;
    if (auto it = m_latest.find(output); it != m_latest.end()) {
        // Frames presented before subscribing are not counted as drops
        consumer.last_delivered = it->second.frame.frame_number - 1;
    }
    auto id = m_next_id++;
    m_consumers.emplace(id, consumer);
    SCAPE_LOG_DEBUG("Screencast consumer {} subscribed to output {}", id, output);
    return id;
}

auto ScreencastHub::unsubscribe(ConsumerId consumer) -> bool {
    return m_consumers.erase(consumer) > 0;
}

void ScreencastHub::output_removed(OutputId output) {
    std::erase_if(m_consumers, [output](const auto& entry) { return entry.second.output == output; });
    m_latest.erase(output);
}

void ScreencastHub::publish(OutputId output, uint64_t buffer, Size size, Clock::time_point now) {
    auto& latest = m_latest[output];
    latest.frame.frame_number += 1;
    latest.frame.buffer = buffer;
    latest.frame.size = size;
    latest.frame.presented_at = now;
    latest.offered_at = now;
}

auto ScreencastHub::pull(ConsumerId consumer_id) -> std::optional<CastFrame> {
    auto consumer_it = m_consumers.find(consumer_id);
    if (consumer_it == m_consumers.end()) {
        return std::nullopt;
    }
    auto& consumer = consumer_it->second;
    auto latest_it = m_latest.find(consumer.output);
    if (latest_it == m_latest.end()) {
        return std::nullopt;
    }
    const auto& frame = latest_it->second.frame;

    if (frame.frame_number > consumer.last_delivered) {
        consumer.stats.dropped += frame.frame_number - consumer.last_delivered - 1;
        consumer.stats.delivered += 1;
        consumer.last_delivered = frame.frame_number;
        consumer.reoffer = false;
        return frame;
    }
    if (consumer.reoffer) {
        consumer.reoffer = false;
        consumer.stats.delivered += 1;
        return frame;
    }
    return std::nullopt;
}

void ScreencastHub::tick(Clock::time_point now) {
    if (m_policy != ScreencastPolicy::periodic) {
        return;
    }
    for (auto& [output, latest] : m_latest) {
        if (now - latest.offered_at < m_interval) {
            continue;
        }
        latest.offered_at = now;
        for (auto& [id, consumer] : m_consumers) {
            if (consumer.output == output && consumer.last_delivered == latest.frame.frame_number) {
                consumer.reoffer = true;
            }
        }
    }
}

auto ScreencastHub::next_reoffer() const -> std::optional<Clock::time_point> {
    if (m_policy != ScreencastPolicy::periodic) {
        return std::nullopt;
    }
    std::optional<Clock::time_point> earliest;
    for (const auto& [output, latest] : m_latest) {
        if (!has_consumers(output)) {
            continue;
        }
        auto due = latest.offered_at + m_interval;
        if (!earliest || due < *earliest) {
            earliest = due;
        }
    }
    return earliest;
}

auto ScreencastHub::stats(ConsumerId consumer) const -> std::optional<ConsumerStats> {
    auto it = m_consumers.find(consumer);
    if (it == m_consumers.end()) {
        return std::nullopt;
    }
    return it->second.stats;
}

auto ScreencastHub::has_consumers(OutputId output) const -> bool {
    for (const auto& [id, consumer] : m_consumers) {
        if (consumer.output == output) {
            return true;
        }
    }
    return false;
}

} // namespace scape::core
