#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <string>

namespace scape::core {

/// @brief Serializes policy hook execution.
///
/// A hook submitted while another hook runs is queued and executed after the running one
/// returns, in submission order. Nothing is ever executed concurrently or recursively.
class HookQueue {
public:
    using Hook = std::function<void()>;

    /// @brief Runs @p hook now, or queues it when called from inside a running hook.
    /// @return True if the hook ran before this call returned.
    /// An exception from a hook propagates; hooks still queued behind it run on the next submit.
    auto submit(std::string name, Hook hook) -> bool;

    [[nodiscard]] auto running() const -> bool { return m_running; }
    [[nodiscard]] auto pending() const -> size_t { return m_pending.size(); }

private:
    struct Entry {
        std::string name;
        Hook hook;
    };

    void drain();

    std::deque<Entry> m_pending;
    bool m_running = false;
};

} // namespace scape::core
