#pragma once

#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace scape::util {

/// @brief Owning file descriptor. -1 means empty.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : m_fd(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : m_fd(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    /// @brief Closes the current descriptor and takes @p fd.
    void reset(int fd = -1) {
        if (m_fd >= 0 && m_fd != fd) {
            ::close(m_fd);
        }
        m_fd = fd;
    }

    /// @brief Close-on-exec duplicate; empty if this is empty or the dup fails.
    [[nodiscard]] auto dup() const -> UniqueFd {
        if (m_fd < 0) {
            return UniqueFd{};
        }
        return UniqueFd{::fcntl(m_fd, F_DUPFD_CLOEXEC, 0)};
    }

    [[nodiscard]] auto get() const -> int { return m_fd; }
    [[nodiscard]] auto release() -> int { return std::exchange(m_fd, -1); }
    [[nodiscard]] auto valid() const -> bool { return m_fd >= 0; }
    explicit operator bool() const { return valid(); }

private:
    int m_fd = -1;
};

} // namespace scape::util
