#include "hook_queue.hpp"

#include <util/logging.hpp>
#include <util/profiling.hpp>

namespace scape::core {

namespace {

/// Holds the running flag for the lifetime of one drain, including an exit by exception.
class RunningFlag {
public:
    explicit RunningFlag(bool& flag) : m_flag(flag) { m_flag = true; }
    ~RunningFlag() { m_flag = false; }

    RunningFlag(const RunningFlag&) = delete;
    RunningFlag& operator=(const RunningFlag&) = delete;

private:
    bool& m_flag;
};

} // namespace

auto HookQueue::submit(std::string name, Hook hook) -> bool {
    if (!hook) {
        return false;
    }
    m_pending.push_back(Entry{std::move(name), std::move(hook)});
    if (m_running) {
        SCAPE_LOG_TRACE("Hook '{}' deferred behind running hook", m_pending.back().name);
        return false;
    }
    drain();
    return true;
}

void HookQueue::drain() {
    RunningFlag running(m_running);
    while (!m_pending.empty()) {
        SCAPE_PROFILE_PLOT("Pending hooks", m_pending.size());
        Entry entry = std::move(m_pending.front());
        m_pending.pop_front();
        SCAPE_PROFILE_SCOPE("Hook");
        SCAPE_LOG_TRACE("Running hook '{}'", entry.name);
        entry.hook();
    }
}

} // namespace scape::core
