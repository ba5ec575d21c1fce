#include "process_launcher.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>
#include <util/logging.hpp>

namespace scape::app {

auto ShellLauncher::spawn(const std::string& command,
                          const std::map<std::string, std::string>& env) -> Result<int> {
    if (command.empty()) {
        return make_error<int>(ErrorCode::invalid_data, "Empty command");
    }

    const pid_t child = fork();
    if (child < 0) {
        return make_error<int>(ErrorCode::resource_exhausted,
                               std::string("fork failed: ") + std::strerror(errno));
    }

    if (child == 0) {
        // Detach from the compositor's session and restore default signal state
        setsid();
        sigset_t mask;
        sigemptyset(&mask);
        sigprocmask(SIG_SETMASK, &mask, nullptr);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGCHLD, SIG_DFL);
        for (const auto& [key, value] : env) {
            setenv(key.c_str(), value.c_str(), 1);
        }
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    SCAPE_LOG_DEBUG("Spawned pid {}: {}", child, command);
    return static_cast<int>(child);
}

auto reap_children() -> int {
    int reaped = 0;
    while (true) {
        int status = 0;
        const pid_t pid = waitpid(-1, &status, WNOHANG);
        if (pid > 0) {
            ++reaped;
            if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
                SCAPE_LOG_DEBUG("Child {} exited with status {}", pid, WEXITSTATUS(status));
            }
            continue;
        }
        if (pid < 0 && errno == EINTR) {
            continue;
        }
        return reaped;
    }
}

} // namespace scape::app
