#include "frame_scheduler.hpp"

#include <algorithm>
#include <util/logging.hpp>
#include <util/profiling.hpp>

namespace scape::core {

FrameScheduler::FrameScheduler(OutputId output, FrameTarget& target, bool hardware_sync,
                               BackoffPolicy backoff)
    : m_output(output), m_target(target), m_hardware_sync(hardware_sync), m_policy(backoff),
      m_backoff(backoff.initial) {}

void FrameScheduler::add_damage(const Region& damage, Clock::time_point now) {
    if (damage.empty()) {
        return;
    }
    m_damage.add(damage);

    if (m_state != FrameState::idle) {
        // Pending: coalesced into the follow-up frame. Requested: already asked.
        return;
    }
    m_state = FrameState::frame_requested;
    request_opportunity(now);
}

void FrameScheduler::request_opportunity(Clock::time_point now) {
    if (m_retry_at) {
        return;
    }
    if (m_hardware_sync) {
        m_target.schedule_frame(m_output);
    } else {
        frame_opportunity(now);
    }
}

void FrameScheduler::frame_opportunity(Clock::time_point now) {
    if (m_state != FrameState::frame_requested) {
        return;
    }
    if (m_retry_at && now < *m_retry_at) {
        return;
    }
    submit(now);
}

void FrameScheduler::submit(Clock::time_point now) {
    SCAPE_PROFILE_FUNCTION();
    if (m_target.submit_frame(m_output, m_damage)) {
        ++m_frames_submitted;
        m_damage.clear();
        m_state = FrameState::frame_pending;
        m_retry_at.reset();
        if (m_degraded) {
            SCAPE_LOG_INFO("Output {} recovered after {} failed submits", m_output,
                           m_submit_failures);
        }
        m_degraded = false;
        m_backoff = m_policy.initial;
        return;
    }

    ++m_submit_failures;
    m_degraded = true;
    m_state = FrameState::frame_requested;
    m_retry_at = now + m_backoff;
    SCAPE_LOG_WARN("Frame submit failed on output {}; retrying in {} ms", m_output,
                   m_backoff.count());
    m_backoff = std::min(m_backoff * 2, m_policy.max);
}

void FrameScheduler::present_complete(Clock::time_point now) {
    if (m_state != FrameState::frame_pending) {
        return;
    }
    if (m_damage.empty()) {
        m_state = FrameState::idle;
        return;
    }
    m_state = FrameState::frame_requested;
    request_opportunity(now);
}

void FrameScheduler::tick(Clock::time_point now) {
    if (!m_retry_at || now < *m_retry_at || m_state != FrameState::frame_requested) {
        return;
    }
    submit(now);
}

} // namespace scape::core
