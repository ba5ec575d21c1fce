#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <util/error.hpp>
#include <util/queues.hpp>
#include <util/unique_fd.hpp>
#include <vector>

struct wl_event_loop;
struct wl_event_source;

namespace scape::loop {

using Clock = std::chrono::steady_clock;

/// @brief Mailbox for one producer thread. Messages run on the loop thread in post order.
class Inbox {
public:
    using Message = std::function<void()>;

    Inbox(size_t capacity, int wake_fd);

    /// @brief Producer side. Returns false when the queue is full; the message is dropped.
    auto post(Message message) -> bool;
    /// @brief Loop side. Runs every queued message.
    auto drain() -> size_t;

private:
    util::SPSCQueue<Message> m_queue;
    int m_wake_fd;
};

/// @brief Single-threaded reactor over a borrowed `wl_event_loop`.
///
/// Every callback runs on the thread calling dispatch()/run(). Other threads reach the loop
/// only through an Inbox, which wakes it through a shared eventfd.
class EventLoop {
public:
    using Callback = std::function<void()>;
    using FdCallback = std::function<void(int fd, uint32_t mask)>;
    using DeadlineProvider = std::function<std::optional<Clock::time_point>()>;

    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    [[nodiscard]] static auto create(wl_event_loop* loop) -> ResultPtr<EventLoop>;

    /// @brief Invokes @p callback whenever @p fd becomes readable (or hangs up).
    [[nodiscard]] auto add_fd(int fd, FdCallback callback) -> Result<void>;
    /// @brief Stops watching @p fd. The fd itself stays open.
    void remove_fd(int fd);
    [[nodiscard]] auto add_signal(int signal_number, Callback callback) -> Result<void>;
    /// @brief Repeating timer.
    [[nodiscard]] auto add_timer(std::chrono::milliseconds interval, Callback callback)
        -> Result<void>;
    /// @brief Calls @p callback when @p path is written, replaced or created.
    ///
    /// The parent directory is watched so editors that save through rename keep working.
    [[nodiscard]] auto watch_file(const std::filesystem::path& path, Callback callback)
        -> Result<void>;
    [[nodiscard]] auto create_inbox(size_t capacity = 64) -> Inbox&;

    /// @brief The loop wakes no later than the provided deadline and calls @p on_deadline once
    /// it has passed.
    void set_deadline(DeadlineProvider provider, Callback on_deadline);
    /// @brief Runs before every blocking wait (flushing client buffers).
    void set_before_wait(Callback callback);

    /// @brief One iteration: waits at most @p max_wait, runs ready sources and due deadlines.
    [[nodiscard]] auto dispatch(std::chrono::milliseconds max_wait) -> Result<void>;
    /// @brief Dispatches until stop() is called.
    [[nodiscard]] auto run() -> Result<void>;
    void stop() { m_running = false; }
    [[nodiscard]] auto running() const -> bool { return m_running; }

private:
    struct FdSource;
    struct SignalSource;
    struct TimerSource;
    struct FileWatch {
        std::string filename;
        Callback callback;
    };

    explicit EventLoop(wl_event_loop* loop);

    [[nodiscard]] auto setup_wake_fd() -> Result<void>;
    [[nodiscard]] auto ensure_inotify() -> Result<void>;
    void handle_inotify();
    void drain_inboxes();
    void run_due_deadline();
    [[nodiscard]] auto wait_timeout(std::chrono::milliseconds max_wait) const -> int;

    wl_event_loop* m_loop = nullptr;
    util::UniqueFd m_wake_fd;
    util::UniqueFd m_inotify_fd;
    std::vector<std::unique_ptr<FdSource>> m_fd_sources;
    std::vector<std::unique_ptr<SignalSource>> m_signal_sources;
    std::vector<std::unique_ptr<TimerSource>> m_timer_sources;
    std::map<int, std::vector<FileWatch>> m_watches;
    std::vector<std::unique_ptr<Inbox>> m_inboxes;
    DeadlineProvider m_deadline;
    Callback m_on_deadline;
    Callback m_before_wait;
    bool m_running = false;
};

} // namespace scape::loop
