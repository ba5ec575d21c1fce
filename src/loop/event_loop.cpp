#include "event_loop.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstring>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <util/logging.hpp>
#include <util/profiling.hpp>

extern "C" {
#include <wayland-server-core.h>
}

namespace scape::loop {

struct EventLoop::FdSource {
    int fd = -1;
    FdCallback callback;
    wl_event_source* source = nullptr;
};

struct EventLoop::SignalSource {
    int signal_number = 0;
    Callback callback;
    wl_event_source* source = nullptr;
};

struct EventLoop::TimerSource {
    std::chrono::milliseconds interval{0};
    Callback callback;
    wl_event_source* source = nullptr;
};

namespace {

constexpr std::chrono::milliseconds RUN_MAX_WAIT{1000};

auto fd_trampoline(int fd, uint32_t mask, void* data) -> int {
    auto* source = static_cast<EventLoop::FdCallback*>(data);
    (*source)(fd, mask);
    return 0;
}

auto signal_trampoline(int /*signal_number*/, void* data) -> int {
    auto* callback = static_cast<EventLoop::Callback*>(data);
    (*callback)();
    return 0;
}

} // namespace

// =============================================================================
// Inbox
// =============================================================================

Inbox::Inbox(size_t capacity, int wake_fd) : m_queue(capacity), m_wake_fd(wake_fd) {}

auto Inbox::post(Message message) -> bool {
    if (!m_queue.try_push(std::move(message))) {
        return false;
    }
    uint64_t one = 1;
    // A failed write means the counter is already non-zero; the loop wakes either way
    if (write(m_wake_fd, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        SCAPE_LOG_WARN("Failed to wake event loop: {}", std::strerror(errno));
    }
    return true;
}

auto Inbox::drain() -> size_t {
    size_t count = 0;
    while (auto message = m_queue.try_pop()) {
        if (*message) {
            (*message)();
        }
        ++count;
    }
    return count;
}

// =============================================================================
// EventLoop
// =============================================================================

EventLoop::EventLoop(wl_event_loop* loop) : m_loop(loop) {}

EventLoop::~EventLoop() {
    // Sources reference the callbacks below; remove them before anything is freed
    for (auto& source : m_fd_sources) {
        if (source->source != nullptr) {
            wl_event_source_remove(source->source);
        }
    }
    for (auto& source : m_signal_sources) {
        if (source->source != nullptr) {
            wl_event_source_remove(source->source);
        }
    }
    for (auto& source : m_timer_sources) {
        if (source->source != nullptr) {
            wl_event_source_remove(source->source);
        }
    }
}

auto EventLoop::create(wl_event_loop* loop) -> ResultPtr<EventLoop> {
    if (loop == nullptr) {
        return make_result_ptr_error<EventLoop>(ErrorCode::backend_init_failed,
                                                "No wl_event_loop to drive");
    }
    auto event_loop = std::unique_ptr<EventLoop>(new EventLoop(loop));
    auto wake = event_loop->setup_wake_fd();
    if (!wake) {
        return make_result_ptr_error<EventLoop>(wake.error().code, wake.error().message);
    }
    return make_result_ptr(std::move(event_loop));
}

auto EventLoop::setup_wake_fd() -> Result<void> {
    int efd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (efd < 0) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                std::string("Failed to create eventfd: ") + std::strerror(errno));
    }
    m_wake_fd = util::UniqueFd(efd);

    return add_fd(m_wake_fd.get(), [this](int fd, uint32_t /*mask*/) {
        uint64_t value = 0;
        // eventfd guarantees 8-byte atomic read when readable
        if (read(fd, &value, sizeof(value)) < 0 && errno != EAGAIN) {
            SCAPE_LOG_WARN("Failed to read wake eventfd: {}", std::strerror(errno));
        }
        drain_inboxes();
    });
}

auto EventLoop::add_fd(int fd, FdCallback callback) -> Result<void> {
    auto source = std::make_unique<FdSource>();
    source->fd = fd;
    source->callback = std::move(callback);
    source->source = wl_event_loop_add_fd(m_loop, fd, WL_EVENT_READABLE, fd_trampoline,
                                          &source->callback);
    if (source->source == nullptr) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to add fd " + std::to_string(fd) + " to event loop");
    }
    m_fd_sources.push_back(std::move(source));
    return {};
}

void EventLoop::remove_fd(int fd) {
    auto it = std::find_if(m_fd_sources.begin(), m_fd_sources.end(),
                           [fd](const std::unique_ptr<FdSource>& s) { return s->fd == fd; });
    if (it == m_fd_sources.end()) {
        return;
    }
    wl_event_source_remove((*it)->source);
    m_fd_sources.erase(it);
}

auto EventLoop::add_signal(int signal_number, Callback callback) -> Result<void> {
    auto source = std::make_unique<SignalSource>();
    source->signal_number = signal_number;
    source->callback = std::move(callback);
    source->source =
        wl_event_loop_add_signal(m_loop, signal_number, signal_trampoline, &source->callback);
    if (source->source == nullptr) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                "Failed to add signal " + std::to_string(signal_number));
    }
    m_signal_sources.push_back(std::move(source));
    return {};
}

auto EventLoop::add_timer(std::chrono::milliseconds interval, Callback callback) -> Result<void> {
    if (interval.count() <= 0) {
        return make_error<void>(ErrorCode::invalid_config, "Timer interval must be positive");
    }
    auto source = std::make_unique<TimerSource>();
    source->interval = interval;
    source->callback = std::move(callback);
    source->source = wl_event_loop_add_timer(
        m_loop,
        [](void* data) -> int {
            auto* timer = static_cast<TimerSource*>(data);
            timer->callback();
            wl_event_source_timer_update(timer->source, static_cast<int>(timer->interval.count()));
            return 0;
        },
        source.get());
    if (source->source == nullptr) {
        return make_error<void>(ErrorCode::backend_init_failed, "Failed to add timer");
    }
    wl_event_source_timer_update(source->source, static_cast<int>(interval.count()));
    m_timer_sources.push_back(std::move(source));
    return {};
}

auto EventLoop::ensure_inotify() -> Result<void> {
    if (m_inotify_fd.valid()) {
        return {};
    }
    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        return make_error<void>(ErrorCode::backend_init_failed,
                                std::string("Failed to create inotify: ") + std::strerror(errno));
    }
    m_inotify_fd = util::UniqueFd(fd);
    return add_fd(m_inotify_fd.get(), [this](int /*fd*/, uint32_t /*mask*/) { handle_inotify(); });
}

auto EventLoop::watch_file(const std::filesystem::path& path, Callback callback) -> Result<void> {
    SCAPE_TRY(ensure_inotify());

    auto absolute = std::filesystem::absolute(path);
    auto directory = absolute.parent_path();
    int wd = inotify_add_watch(m_inotify_fd.get(), directory.c_str(),
                               IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE);
    if (wd < 0) {
        return make_error<void>(ErrorCode::file_not_found,
                                "Cannot watch " + directory.string() + ": " +
                                    std::strerror(errno));
    }
    m_watches[wd].push_back(FileWatch{absolute.filename().string(), std::move(callback)});
    SCAPE_LOG_DEBUG("Watching {} for changes", absolute.string());
    return {};
}

void EventLoop::handle_inotify() {
    alignas(inotify_event) std::array<char, 4096> buffer{};
    while (true) {
        ssize_t length = read(m_inotify_fd.get(), buffer.data(), buffer.size());
        if (length <= 0) {
            if (length < 0 && errno != EAGAIN && errno != EINTR) {
                SCAPE_LOG_WARN("inotify read failed: {}", std::strerror(errno));
            }
            return;
        }

        size_t offset = 0;
        while (offset + sizeof(inotify_event) <= static_cast<size_t>(length)) {
            const auto* event = reinterpret_cast<const inotify_event*>(buffer.data() + offset);
            offset += sizeof(inotify_event) + event->len;
            if (event->len == 0) {
                continue;
            }
            auto it = m_watches.find(event->wd);
            if (it == m_watches.end()) {
                continue;
            }
            const std::string_view name(event->name);
            for (const auto& watch : it->second) {
                if (watch.filename == name) {
                    watch.callback();
                }
            }
        }
    }
}

auto EventLoop::create_inbox(size_t capacity) -> Inbox& {
    m_inboxes.push_back(std::make_unique<Inbox>(capacity, m_wake_fd.get()));
    return *m_inboxes.back();
}

void EventLoop::drain_inboxes() {
    SCAPE_PROFILE_SCOPE("DrainInboxes");
    for (auto& inbox : m_inboxes) {
        inbox->drain();
    }
}

void EventLoop::set_deadline(DeadlineProvider provider, Callback on_deadline) {
    m_deadline = std::move(provider);
    m_on_deadline = std::move(on_deadline);
}

void EventLoop::set_before_wait(Callback callback) {
    m_before_wait = std::move(callback);
}

auto EventLoop::wait_timeout(std::chrono::milliseconds max_wait) const -> int {
    auto timeout = max_wait;
    if (m_deadline) {
        if (auto deadline = m_deadline()) {
            auto until =
                std::chrono::ceil<std::chrono::milliseconds>(*deadline - Clock::now());
            timeout = std::clamp(until, std::chrono::milliseconds{0}, max_wait);
        }
    }
    return static_cast<int>(std::min<int64_t>(timeout.count(), INT_MAX));
}

void EventLoop::run_due_deadline() {
    if (!m_deadline || !m_on_deadline) {
        return;
    }
    auto deadline = m_deadline();
    if (deadline && *deadline <= Clock::now()) {
        m_on_deadline();
    }
}

auto EventLoop::dispatch(std::chrono::milliseconds max_wait) -> Result<void> {
    SCAPE_PROFILE_FRAME("Loop");
    run_due_deadline();
    if (m_before_wait) {
        m_before_wait();
    }
    if (wl_event_loop_dispatch(m_loop, wait_timeout(max_wait)) < 0 && errno != EINTR) {
        return make_error<void>(ErrorCode::unknown_error,
                                std::string("Event loop dispatch failed: ") +
                                    std::strerror(errno));
    }
    wl_event_loop_dispatch_idle(m_loop);
    run_due_deadline();
    return {};
}

auto EventLoop::run() -> Result<void> {
    m_running = true;
    while (m_running) {
        auto result = dispatch(RUN_MAX_WAIT);
        if (!result) {
            m_running = false;
            return result;
        }
    }
    return {};
}

} // namespace scape::loop
